#pragma once

#include <functional>
#include <memory>
#include <string_view>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads config.toml and hands each registered section to its owner.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file is not an error: every handler receives an empty section.
    bool load();
    bool loadFromString(std::string_view text);

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool parseAndDispatch(std::string_view text);
    void dispatch();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
