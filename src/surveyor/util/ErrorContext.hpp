#pragma once

#include <string>
#include <functional>

namespace surveyor {

/**
 * @brief Error kinds surfaced by the discovery engine
 *
 * The engine never throws across its API. Fallible calls return bool or
 * std::optional and fill an optional ErrorInfo out-parameter.
 */
enum class ErrorKind
{
    None,
    Store,            // graph store unreachable or rejected a write
    DuplicateHandler, // (plugin, event type, name) already registered
    TraversalBound,   // alias cycle or hop limit exceeded
    SessionNotFound,  // unknown session id
    InvalidEvent,     // event without session/entity, or wrong asset type
    Configuration,    // setup failure (no primary database, bad config)
    Cancelled,        // session already cancelled, or dispatcher not running
    HandlerFailure    // handler threw, or failed without saying why
};

struct ErrorInfo
{
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string details;

    ErrorInfo() = default;
    ErrorInfo(ErrorKind k, std::string msg, std::string det = "")
        : kind(k), message(std::move(msg)), details(std::move(det))
    {
    }

    explicit operator bool() const { return kind != ErrorKind::None; }
};

const char* ErrorKindToString(ErrorKind kind);

// Fills *out when the caller asked for details; always returns false so call
// sites can `return Fail(err, ...)`.
inline bool Fail(ErrorInfo* out, ErrorKind kind, std::string message, std::string details = "")
{
    if (out)
        *out = ErrorInfo(kind, std::move(message), std::move(details));
    return false;
}

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * @brief Routes engine errors to whoever embeds the engine
 *
 * The application wires this to utils::ErrorReporter; tests leave it unset.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.SetCallback([](const ErrorInfo& err) { ... });
 *   ctx.Report({ErrorKind::Store, "write rejected", "FQDN:example.com"});
 */
class ErrorContext
{
public:
    ErrorContext() = default;
    ~ErrorContext() = default;

    void SetCallback(ErrorCallback callback) { callback_ = std::move(callback); }

    void Report(const ErrorInfo& info) const
    {
        if (callback_)
            callback_(info);
    }

    bool HasCallback() const { return static_cast<bool>(callback_); }

private:
    ErrorCallback callback_;
};

} // namespace surveyor
