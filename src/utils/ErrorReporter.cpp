#include "ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_pending;
ErrorTally ErrorReporter::s_tally;

nlohmann::json ErrorTally::ToJSON() const
{
    return { { "warnings", warnings }, { "errors", errors }, { "fatals", fatals } };
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                           const std::string& details)
{
    const std::string line =
        std::string("[") + CategoryToString(category) + "] " + summary + (details.empty() ? "" : " | " + details);

    switch (severity)
    {
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }

    ErrorReport report{ category, severity, summary, details, Timestamp() };

    std::lock_guard<std::mutex> lock(s_mutex);
    switch (severity)
    {
    case ErrorSeverity::Warning:
        ++s_tally.warnings;
        break;
    case ErrorSeverity::Error:
        ++s_tally.errors;
        break;
    case ErrorSeverity::Fatal:
        ++s_tally.fatals;
        break;
    }

    // A noisy source must not grow the queue without bound; the tally still counts
    s_pending.push_back(std::move(report));
    if (s_pending.size() > kMaxPending)
        s_pending.erase(s_pending.begin());
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Fatal, summary, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Error, summary, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, summary, details);
}

void ErrorReporter::ReportEngineError(const surveyor::ErrorInfo& err, const std::string& summary)
{
    std::string details = std::string(surveyor::ErrorKindToString(err.kind)) + ": " + err.message;
    if (!err.details.empty())
        details += " (" + err.details + ")";

    const ErrorSeverity severity =
        err.kind == surveyor::ErrorKind::Cancelled ? ErrorSeverity::Warning : ErrorSeverity::Error;
    Report(CategoryFor(err.kind), severity, summary, details);
}

ErrorCategory ErrorReporter::CategoryFor(surveyor::ErrorKind kind)
{
    switch (kind)
    {
    case surveyor::ErrorKind::Store:
        return ErrorCategory::Store;
    case surveyor::ErrorKind::DuplicateHandler:
        return ErrorCategory::Registry;
    case surveyor::ErrorKind::TraversalBound:
    case surveyor::ErrorKind::InvalidEvent:
    case surveyor::ErrorKind::HandlerFailure:
        return ErrorCategory::Dispatch;
    case surveyor::ErrorKind::SessionNotFound:
    case surveyor::ErrorKind::Cancelled:
        return ErrorCategory::Session;
    case surveyor::ErrorKind::Configuration:
        return ErrorCategory::Configuration;
    default:
        return ErrorCategory::Unknown;
    }
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> out;
    out.swap(s_pending);
    return out;
}

ErrorTally ErrorReporter::Tally()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_tally;
}

void ErrorReporter::Reset()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
    s_tally = ErrorTally{};
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Store:
        return "Store";
    case ErrorCategory::Registry:
        return "Registry";
    case ErrorCategory::Dispatch:
        return "Dispatch";
    case ErrorCategory::Session:
        return "Session";
    default:
        return "Unknown";
    }
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::Timestamp()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
