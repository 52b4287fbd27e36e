#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace codepush {

// Failure classes carried in Result::err. Positive errno values from system
// calls are passed through unchanged where they are available.
enum ErrorKind : int {
    kErrValidation = -1,
    kErrResolution = -2,
    kErrTransport  = -3,
    kErrRemote     = -4,
    kErrTimeout    = -5,
    kErrCancelled  = -6,
    kErrIo         = -7,
};

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Prefix "<context>: " onto a failure. Success passes through unchanged.
    Result Wrap(std::string_view context) const {
        if (ok) return *this;
        return Fail(err, std::string(context) + ": " + msg);
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace codepush
