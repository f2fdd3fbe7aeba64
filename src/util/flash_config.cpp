#include "util/flash_config.hpp"

#include "util/config_json_utils.hpp"

namespace nimage {

using json = nlohmann::json;
using namespace config::detail;

namespace {

Result FillFromJson(const json& j, FlashConfig& out) {
    std::string err;

    auto it = j.find("targets");
    if (it == j.end() || !it->is_array() || it->empty()) {
        return Result::Fail(-1, "flash config needs a non-empty 'targets' array");
    }

    for (std::size_t i = 0; i < it->size(); ++i) {
        const json& t = (*it)[i];
        const std::string where = "targets[" + std::to_string(i) + "]";
        if (!t.is_object()) {
            return Result::Fail(-1, where + " must be an object");
        }

        FlashTarget target;
        std::string role;
        std::uint64_t index = 0;
        if (!GetStringIfPresent(t, "role", role, err) ||
            !GetU64IfPresent(t, "index", index, err) ||
            !GetStringIfPresent(t, "device", target.device, err) ||
            !GetU64IfPresent(t, "offset", target.offset, err)) {
            return Result::Fail(-1, where + ": " + err);
        }
        if (!ParseSegmentRole(role, target.key.role)) {
            return Result::Fail(-1, where + ": unknown role '" + role + "'");
        }
        if (index != 0 && !IsRepeatableRole(target.key.role)) {
            return Result::Fail(-1, where + ": only 'other' segments take an index");
        }
        if (index > UINT32_MAX) {
            return Result::Fail(-1, where + ": index out of range");
        }
        target.key.ordinal = static_cast<std::uint32_t>(index);
        if (target.device.empty()) {
            return Result::Fail(-1, where + " missing device");
        }
        out.targets.push_back(std::move(target));
    }

    std::uint64_t attempts = out.max_attempts;
    std::uint64_t chunk = out.chunk_size;
    if (!GetU64IfPresent(j, "max_attempts", attempts, err) ||
        !GetU64IfPresent(j, "retry_backoff_ms", out.retry_backoff_ms, err) ||
        !GetBoolIfPresent(j, "verify_readback", out.verify_readback, err) ||
        !GetBoolIfPresent(j, "stop_on_failure", out.stop_on_failure, err) ||
        !GetU64IfPresent(j, "chunk_size", chunk, err)) {
        return Result::Fail(-1, err);
    }
    if (attempts == 0 || attempts > 100) {
        return Result::Fail(-1, "max_attempts must be 1..100");
    }
    if (chunk == 0 || chunk > 64ull * 1024 * 1024) {
        return Result::Fail(-1, "chunk_size must be 1..67108864");
    }
    out.max_attempts = static_cast<std::uint32_t>(attempts);
    out.chunk_size = static_cast<std::size_t>(chunk);

    return Result::Ok();
}

} // namespace

ImageWriter::Options FlashConfig::ToWriterOptions() const {
    ImageWriter::Options o;
    o.max_attempts = max_attempts;
    o.retry_backoff = std::chrono::milliseconds(retry_backoff_ms);
    o.verify_readback = verify_readback;
    o.stop_on_failure = stop_on_failure;
    o.chunk_size = chunk_size;
    return o;
}

Result FlashConfig::LoadFromFile(const std::string& path, FlashConfig& out) {
    out = FlashConfig{};

    json j;
    std::string err;
    if (!LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(-1, "flash config: " + err);
    }
    if (auto r = FillFromJson(j, out); !r.ok) {
        return Result::Fail(-1, path + ": " + r.msg);
    }
    return Result::Ok();
}

Result FlashConfig::Parse(const std::string& json_input, FlashConfig& out) {
    out = FlashConfig{};

    json j;
    std::string err;
    if (!ParseJsonObject(json_input, j, err)) {
        return Result::Fail(-1, err);
    }
    return FillFromJson(j, out);
}

} // namespace nimage
