#pragma once

#include <cstddef>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // level is a plog::Severity in [0, 6]; out of range values fall back to info.
    static bool Initialize(int level);

    // May be called again for the same instance: the level is updated and only
    // appenders not attached yet are added.
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static void SetDefaultLogLevel(plog::Severity level);
    static plog::Severity SeverityFromInt(int level);
    static bool PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static bool s_initialized;
    static plog::Severity s_default_level;
    struct AppenderEntry
    {
        std::string key;
        std::unique_ptr<plog::IAppender> appender;
    };

    static bool HasAppender(const std::string& key);

    // plog loggers are process-wide statics holding raw appender pointers, so
    // appenders live until exit.
    static std::vector<AppenderEntry> s_appenders;
};

} // namespace utils
