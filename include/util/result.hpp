#pragma once
#include <string>
#include <utility>

namespace nimage {

// Outcome of a low-level I/O call. err carries errno when there is one, -1 otherwise.
struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace nimage
