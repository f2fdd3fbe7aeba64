#pragma once

#include <string>
#include <string_view>

namespace nimage {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

// Directory part of a path, "." when there is none.
inline std::string DirName(std::string_view path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos) return ".";
    if (slash == 0) return "/";
    return std::string(path.substr(0, slash));
}

// Joins base and rel unless rel is already absolute.
inline std::string ResolveRelative(std::string_view base_dir, std::string_view rel) {
    if (rel.empty() || rel.front() == '/' || rel == "-") return std::string(rel);
    std::string out(base_dir);
    if (!out.empty() && out.back() != '/') out.push_back('/');
    out.append(rel);
    return out;
}

} // namespace nimage
