#pragma once

#include "io/io.hpp"
#include "nimage/error.hpp"
#include "nimage/image_reader.hpp"
#include "nimage/image_writer.hpp"
#include "util/flash_config.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace nimage {

using DeviceOpener = std::function<Result(const std::string& path, std::unique_ptr<IBlockDevice>& out)>;

// Opens path as a PartitionDevice.
Result OpenPartitionDevice(const std::string& path, std::unique_ptr<IBlockDevice>& out);

// Flashes a container according to a FlashConfig.
//
// Run() verifies the container strictly and checks that every target names a
// segment of the image before any device is opened, so a rejected image
// leaves the targets untouched (regular files are not even created).
// Targets sharing a device path share one handle.
class Flasher {
public:
    explicit Flasher(FlashConfig cfg, DeviceOpener opener = OpenPartitionDevice);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    std::expected<WriteReport, Error> Run(ImageReader& reader);

private:
    FlashConfig cfg_;
    DeviceOpener opener_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace nimage
