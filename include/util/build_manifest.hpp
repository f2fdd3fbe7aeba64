#pragma once

#include "nimage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace nimage {

struct ManifestSegment {
    SegmentRole role = SegmentRole::Invalid;
    std::string file;  // resolved against the manifest's directory
    bool compress = false;
    std::uint64_t load_address = 0;
    std::uint64_t entry_point = 0;
};

// Input description for "mknimage create -m". Fields left out of the JSON stay
// unset so command-line flags can fill them.
struct BuildManifest {
    std::optional<std::string> name;
    std::optional<int> level;
    std::optional<std::size_t> block_size;
    std::optional<unsigned> workers;
    std::vector<ManifestSegment> segments;
};

class BuildManifestParser {
  public:
    // base_dir anchors relative "file" entries.
    std::expected<BuildManifest, std::string> Parse(const std::string& json_input,
                                                    const std::string& base_dir = ".") const;

    std::expected<BuildManifest, std::string> LoadFromFile(const std::string& path) const;
};

} // namespace nimage
