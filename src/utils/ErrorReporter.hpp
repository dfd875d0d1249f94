#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <mutex>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // TOML parsing, invalid config values
    Usage,          // bad command line
    Engine,         // errors raised by the pattern engine
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed
    Fatal    // Critical error, app should exit
};

struct ErrorReport
{
    ErrorCategory category;
    ErrorSeverity severity;
    std::string user_message;      // Short message printed for the user
    std::string technical_details; // Details for logs

    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter for the command line front end
 *
 * Logs every report through plog and keeps a bounded queue so the caller can
 * print a summary before exiting.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Engine, "Invalid step", ex.what());
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << report.user_message << "\n";
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
