#include "util/build_manifest.hpp"

#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

#include <climits>
#include <fstream>
#include <sstream>

namespace nimage {

using json = nlohmann::json;
using namespace config::detail;

namespace {

std::expected<ManifestSegment, std::string> ParseSegment(const json& item,
                                                         std::size_t i,
                                                         const std::string& base_dir) {
    const std::string where = "segments[" + std::to_string(i) + "]";
    if (!item.is_object()) {
        return std::unexpected(where + " must be an object");
    }

    ManifestSegment s;
    std::string err;
    std::string role;
    if (!GetStringIfPresent(item, "role", role, err)) return std::unexpected(where + ": " + err);
    if (role.empty()) return std::unexpected(where + " missing role");
    if (!ParseSegmentRole(role, s.role)) {
        return std::unexpected(where + ": unknown role '" + role + "'");
    }

    std::string file;
    if (!GetStringIfPresent(item, "file", file, err)) return std::unexpected(where + ": " + err);
    if (file.empty()) return std::unexpected(where + " missing file");
    s.file = ResolveRelative(base_dir, file);

    if (!GetBoolIfPresent(item, "compress", s.compress, err) ||
        !GetAddressIfPresent(item, "load_address", s.load_address, err) ||
        !GetAddressIfPresent(item, "entry_point", s.entry_point, err)) {
        return std::unexpected(where + ": " + err);
    }
    return s;
}

} // namespace

std::expected<BuildManifest, std::string> BuildManifestParser::Parse(const std::string& json_input,
                                                                     const std::string& base_dir) const {
    if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::unexpected("Empty input");
    }

    json j;
    std::string err;
    if (!ParseJsonObject(json_input, j, err)) return std::unexpected(err);

    try {
        BuildManifest m;
        std::string name;
        std::uint64_t level = 0;
        std::uint64_t block_size = 0;
        std::uint64_t workers = 0;

        if (j.contains("name")) {
            if (!GetStringIfPresent(j, "name", name, err)) return std::unexpected(err);
            m.name = name;
        }
        if (j.contains("level")) {
            if (!GetU64IfPresent(j, "level", level, err)) return std::unexpected(err);
            if (level > 9) return std::unexpected("'level' must be 0..9");
            m.level = static_cast<int>(level);
        }
        if (j.contains("block_size")) {
            if (!GetU64IfPresent(j, "block_size", block_size, err)) return std::unexpected(err);
            m.block_size = static_cast<std::size_t>(block_size);
        }
        if (j.contains("workers")) {
            if (!GetU64IfPresent(j, "workers", workers, err)) return std::unexpected(err);
            if (workers > UINT_MAX) return std::unexpected("'workers' is out of range");
            m.workers = static_cast<unsigned>(workers);
        }

        if (j.contains("segments")) {
            const auto& arr = j["segments"];
            if (!arr.is_array()) {
                return std::unexpected("'segments' must be an array");
            }
            m.segments.reserve(arr.size());
            for (std::size_t i = 0; i < arr.size(); ++i) {
                auto seg = ParseSegment(arr[i], i, base_dir);
                if (!seg) return std::unexpected(seg.error());
                m.segments.push_back(std::move(*seg));
            }
        }
        return m;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<BuildManifest, std::string> BuildManifestParser::LoadFromFile(const std::string& path) const {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open build manifest: " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();

    auto m = Parse(ss.str(), DirName(path));
    if (!m) return std::unexpected(path + ": " + m.error());
    return m;
}

} // namespace nimage
