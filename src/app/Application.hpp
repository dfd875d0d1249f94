#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "CommandLine.hpp"
#include "../config/AppConfig.hpp"

namespace bitbrush
{
class PatternEngine;
}

class Application
{
public:
    Application(int argc, char** argv);
    // args excludes the program name; command output goes to out, messages for
    // the user to err.
    Application(std::vector<std::string> args, std::ostream& out, std::ostream& err);
    ~Application();

    int run();

private:
    bool initializeLogging();
    void initializeConfig();
    void applyLogSettings();
    bool createEngine();

    int execute();
    int runSequence();
    int runValueCommand();
    int runBenchmark();

    void reportPendingErrors();

    std::string program_name_;
    std::vector<std::string> args_;
    app::CommandLineOptions options_;
    AppConfig config_;
    std::unique_ptr<bitbrush::PatternEngine> engine_;
    std::ostream& out_;
    std::ostream& err_;
};
