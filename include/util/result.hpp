#pragma once
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace elemental {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Prefixes the message of a failed result, keeps ok results untouched.
    Result Context(const std::string& prefix) const {
        if (ok) return *this;
        return {.ok = false, .err = err, .msg = prefix + ": " + msg};
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result FromErrno(const std::string& what) {
        const int e = errno;
        return Fail(e, what + ": " + std::strerror(e));
    }
};

} // namespace elemental
