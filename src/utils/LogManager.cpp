#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<LogManager::AppenderEntry> LogManager::s_appenders;

bool LogManager::Initialize(int level)
{
    if (s_initialized)
        return true;

    s_default_level = SeverityFromInt(level);
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        plog::Severity level = config.level_override.value_or(s_default_level);

        auto* logger = plog::get<InstanceId>();
        if (logger)
            logger->setMaxSeverity(level);
        else
            logger = &plog::init<InstanceId>(level);

        const std::string prefix = std::to_string(InstanceId) + ":";

        const std::string file_key = prefix + "file:" + config.filepath;
        if (!config.filepath.empty() && !HasAppender(file_key) && PrepareLogDirectory(config.filepath))
        {
            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, config.backup_count);
            logger->addAppender(file_appender.get());
            s_appenders.push_back({ file_key, std::move(file_appender) });
        }

        const std::string console_key = prefix + "console";
        if (config.add_console_appender && !HasAppender(console_key))
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger->addAppender(console_appender.get());
            s_appenders.push_back({ console_key, std::move(console_appender) });
        }

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

bool LogManager::HasAppender(const std::string& key)
{
    for (const auto& entry : s_appenders)
    {
        if (entry.key == key)
            return true;
    }
    return false;
}

void LogManager::SetDefaultLogLevel(plog::Severity level)
{
    s_default_level = level;
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(level);
}

plog::Severity LogManager::SeverityFromInt(int level)
{
    if (level >= plog::none && level <= plog::verbose)
        return static_cast<plog::Severity>(level);
    return plog::info;
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    std::filesystem::path dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
