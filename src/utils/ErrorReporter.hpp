#pragma once

#include "../surveyor/util/ErrorContext.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, engine start-up, snapshot output
    Configuration,  // TOML parsing, seeds, databases
    Store,          // graph store open/close/write failures
    Registry,       // plugin start, handler registration
    Dispatch,       // handler callbacks, alias traversal
    Session,        // session creation, cancellation, timeouts
    Unknown
};

enum class ErrorSeverity
{
    Warning, // the run continues with less coverage
    Error,   // an operation failed, the run continues
    Fatal    // the run stops
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string summary;
    std::string details;
    std::string timestamp;
};

// Per-severity totals since the last Reset()
struct ErrorTally
{
    std::size_t warnings = 0;
    std::size_t errors = 0;
    std::size_t fatals = 0;

    nlohmann::json ToJSON() const;
};

/**
 * @brief Process-wide sink for problems the operator should see after a run
 *
 * Every report is logged through plog right away and queued for the
 * end-of-run summary. Engine errors arrive as surveyor::ErrorInfo through the
 * engine's error callback.
 *
 * Usage:
 *   engine.SetErrorCallback([](const surveyor::ErrorInfo& e) {
 *       ErrorReporter::ReportEngineError(e, "Engine error");
 *   });
 *   ...
 *   for (const auto& r : ErrorReporter::GetPendingErrors()) { ... }
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                       const std::string& details = "");

    static void ReportFatal(ErrorCategory category, const std::string& summary, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& summary, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details = "");

    // Cancellation is expected during shutdown and is only a warning
    static void ReportEngineError(const surveyor::ErrorInfo& err, const std::string& summary);

    static ErrorCategory CategoryFor(surveyor::ErrorKind kind);

    /**
     * @brief Drain the queued reports, oldest first
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorTally Tally();
    static void Reset();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

private:
    static std::string Timestamp();

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_pending;
    static ErrorTally s_tally;
    static constexpr std::size_t kMaxPending = 200;
};

} // namespace utils
