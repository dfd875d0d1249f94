#pragma once

#include <cstdint>
#include <string>

#include <toml++/toml.h>

class ConfigManager;

struct AppSettings
{
    // [engine]
    int width = 32;
    int step = 3;

    // [benchmark]
    int benchmark_iterations = 1000;

    // [log]
    int log_level = 4; // plog::Severity, 0 (none) .. 6 (verbose); 4 is info
    bool log_console = false;
};

// Owns the [engine], [benchmark] and [log] sections of config.toml.
class AppConfig
{
public:
    AppSettings& settings() { return settings_; }
    const AppSettings& settings() const { return settings_; }

    void registerConfigHandler(ConfigManager& config);

    static void deserialize(const toml::table& root, AppSettings& out);

private:
    AppSettings settings_;
};
