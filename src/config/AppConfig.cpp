#include "AppConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <utility>

namespace
{

void reportOutOfRange(const std::string& key, int64_t value)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Ignoring out of range value for '" + key + "'",
                                        "value " + std::to_string(value));
}

} // namespace

void AppConfig::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        deserialize(section, settings_);
    };

    config.registerTable("", std::move(cb), { "engine", "benchmark", "log" });
}

void AppConfig::deserialize(const toml::table& root, AppSettings& out)
{
    if (auto* e = root["engine"].as_table())
    {
        // Width is validated by the engine itself so the user sees its message.
        if (auto v = (*e)["width"].value<int>())
            out.width = *v;
        if (auto v = (*e)["step"].value<int>())
            out.step = *v;
    }

    if (auto* b = root["benchmark"].as_table())
    {
        if (auto v = (*b)["iterations"].value<int64_t>())
        {
            if (*v > 0 && *v <= 100'000'000)
                out.benchmark_iterations = static_cast<int>(*v);
            else
                reportOutOfRange("benchmark.iterations", *v);
        }
    }

    if (auto* l = root["log"].as_table())
    {
        if (auto v = (*l)["level"].value<int64_t>())
        {
            if (*v >= 0 && *v <= 6)
                out.log_level = static_cast<int>(*v);
            else
                reportOutOfRange("log.level", *v);
        }
        if (auto v = (*l)["console"].value<bool>())
            out.log_console = *v;
    }

    PLOG_DEBUG << "Config: width=" << out.width << " step=" << out.step
               << " iterations=" << out.benchmark_iterations << " log_level=" << out.log_level;
}
