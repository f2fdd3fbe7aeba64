#include "util/config_json_utils.hpp"

#include <charconv>
#include <fstream>

namespace nimage::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = std::string("Syntax Error: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "JSON root must be an object";
        return false;
    }
    return true;
}

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<long long>());
        return true;
    }
    err = std::string("'") + key + "' must be a non-negative integer";
    return false;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetAddressIfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string())
        return GetU64IfPresent(j, key, out, err);

    const auto s = it->get<std::string>();
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        std::uint64_t v = 0;
        const auto [ptr, ec] = std::from_chars(s.data() + 2, s.data() + s.size(), v, 16);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            out = v;
            return true;
        }
    }
    err = std::string("'") + key + "' must be an integer or a 0x-prefixed hex string, got \"" + s + "\"";
    return false;
}

} // namespace nimage::config::detail
