#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace nimage::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);

// Field getters: out is left untouched when the key is absent. A key that is
// present with the wrong type (or a negative number) returns false with err set.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err);
// Accepts a non-negative integer or a "0x..." hex string.
bool GetAddressIfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err);

} // namespace nimage::config::detail
