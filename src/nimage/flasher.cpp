#include "nimage/flasher.hpp"

#include "io/partition_device.hpp"
#include "util/logger.hpp"

#include <map>
#include <vector>

namespace nimage {

Result OpenPartitionDevice(const std::string& path, std::unique_ptr<IBlockDevice>& out) {
    auto dev = std::make_unique<PartitionDevice>();
    if (auto r = PartitionDevice::Open(path, *dev); !r.ok) {
        return r;
    }
    out = std::move(dev);
    return Result::Ok();
}

Flasher::Flasher(FlashConfig cfg, DeviceOpener opener)
    : cfg_(std::move(cfg)), opener_(std::move(opener)) {}

std::expected<WriteReport, Error> Flasher::Run(ImageReader& reader) {
    const VerifyReport verified = reader.Verify(VerifyMode::Strict);
    if (!verified.ok()) {
        LogError("image rejected, no device opened");
        return std::unexpected(verified.mismatches.front());
    }

    for (const auto& t : cfg_.targets) {
        if (!reader.FindSegment(t.key)) {
            return std::unexpected(UsageError(Errc::SegmentNotFound,
                "flash config names " + t.key.Label() + ", which the image does not contain"));
        }
    }

    std::map<std::string, std::unique_ptr<IBlockDevice>> devices;
    std::vector<WriteTarget> plan;
    plan.reserve(cfg_.targets.size());
    for (const auto& t : cfg_.targets) {
        auto& dev = devices[t.device];
        if (!dev) {
            if (auto r = opener_(t.device, dev); !r.ok || !dev) {
                Error e;
                e.kind = ErrorKind::Write;
                e.code = Errc::DeviceOpenFailed;
                e.msg = r.ok ? "no device for " + t.device : r.msg;
                return std::unexpected(std::move(e));
            }
            LogDebug("opened %s", t.device.c_str());
        }
        plan.push_back(WriteTarget{t.key, dev.get(), t.offset});
    }

    ImageWriter writer(cfg_.ToWriterOptions());
    writer.SetProgressSink(progress_sink_);
    return writer.Write(reader, plan);
}

} // namespace nimage
