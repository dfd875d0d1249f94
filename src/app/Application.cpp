#include "Application.hpp"

#include "Benchmark.hpp"
#include "SequenceRenderer.hpp"
#include "../config/ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "bitbrush/api/bitbrush.hpp"
#include "bitbrush/util/Profile.hpp"

#include <iostream>
#include <utility>

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : program_name_(argc > 0 ? argv[0] : "bitbrush-cli")
    , out_(std::cout)
    , err_(std::cerr)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::Application(std::vector<std::string> args, std::ostream& out, std::ostream& err)
    : program_name_("bitbrush-cli")
    , args_(std::move(args))
    , out_(out)
    , err_(err)
{
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    auto parsed = app::ParseCommandLine(args_);
    if (!parsed.options)
    {
        err_ << "ERROR: " << parsed.error << "\n";
        err_ << "Run '" << program_name_ << " --help' for usage.\n";
        return 1;
    }
    options_ = *parsed.options;

    if (options_.command == app::Command::Help)
    {
        app::PrintUsage(program_name_.c_str(), out_);
        return 0;
    }
    if (options_.command == app::Command::Version)
    {
        app::PrintVersion(out_);
        return 0;
    }

    // Logging comes up with defaults first so config problems reach the log.
    if (!initializeLogging())
    {
        reportPendingErrors();
        return 1;
    }
    initializeConfig();
    applyLogSettings();

    int rc = 1;
    if (createEngine())
        rc = execute();

    reportPendingErrors();
    return rc;
}

void Application::initializeConfig()
{
    // A broken file is reported by ConfigManager and leaves the defaults in place.
    ConfigManager manager(options_.config_path);
    config_.registerConfigHandler(manager);
    if (!manager.load())
        PLOG_WARNING << "Continuing with default settings: " << manager.lastError();

    auto& settings = config_.settings();
    if (options_.width)
        settings.width = *options_.width;
    if (options_.step)
        settings.step = *options_.step;
    if (options_.iterations)
        settings.benchmark_iterations = *options_.iterations;
}

bool Application::initializeLogging()
{
    int level = options_.verbose ? static_cast<int>(plog::debug) : config_.settings().log_level;

    if (!utils::LogManager::Initialize(level))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to initialize logging system");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = options_.log_file,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = options_.verbose });
}

void Application::applyLogSettings()
{
    const auto& settings = config_.settings();
    if (!options_.verbose)
        utils::LogManager::SetDefaultLogLevel(utils::LogManager::SeverityFromInt(settings.log_level));

    if (settings.log_console && !options_.verbose)
    {
        bool attached = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                               .filepath = options_.log_file,
                                                               .level_override = std::nullopt,
                                                               .max_file_size = 10 * 1024 * 1024,
                                                               .backup_count = 3,
                                                               .add_console_appender = true });
        if (!attached)
            PLOG_WARNING << "Console logging requested in config but could not be enabled";
    }
}

bool Application::createEngine()
{
    bitbrush::Logger log{};
    log.info = [](const std::string& m)
    {
        PLOG_INFO << m;
    };
    log.debug = [](const std::string& m)
    {
        PLOG_DEBUG << m;
    };
    log.warn = [](const std::string& m)
    {
        PLOG_WARNING << m;
    };
    log.error = [](const std::string& m)
    {
        PLOG_ERROR << m;
    };

#if BITBRUSH_PROFILING_LEVEL >= 1
    bitbrush::profiling::SetProfilingLogger(log);
#endif

    const auto& settings = config_.settings();
    try
    {
        engine_ = std::make_unique<bitbrush::PatternEngine>(
            bitbrush::EngineConfig{ .width = settings.width, .default_step = settings.step }, std::move(log));
        return true;
    }
    catch (const bitbrush::InvalidConfiguration& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Cannot create pattern engine",
                                          ex.what());
        return false;
    }
}

int Application::execute()
{
    try
    {
        switch (options_.command)
        {
        case app::Command::Sequence:
            return runSequence();
        case app::Command::Mirror:
        case app::Command::Count:
        case app::Command::Show:
            return runValueCommand();
        case app::Command::Benchmark:
            return runBenchmark();
        default:
            return 0;
        }
    }
    catch (const bitbrush::Error& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Engine, "Operation failed", ex.what());
        return 1;
    }
}

int Application::runSequence()
{
    auto kind = bitbrush::ParseSequenceKind(options_.sequence_name);
    if (!kind)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Usage, "Unknown sequence",
                                          "'" + options_.sequence_name + "'");
        return 1;
    }

    auto sequence = engine_->Generate(*kind, engine_->DefaultStep());
    PLOG_INFO << "Rendering " << bitbrush::ToString(*kind) << " (" << sequence.Size() << " rows, width "
              << engine_->Width() << ")";

    auto style = options_.blocks ? app::RowStyle::Blocks : app::RowStyle::Binary;
    app::RenderSequence(*engine_, sequence, style, out_);
    return 0;
}

int Application::runValueCommand()
{
    bitbrush::Pattern value = app::ParsePatternValue(options_.value_text, *engine_);
    if ((value & engine_->Mask()) != value)
    {
        PLOG_WARNING << "Value " << value << " has bits outside width " << engine_->Width() << ", masking";
    }

    auto style = options_.blocks ? app::RowStyle::Blocks : app::RowStyle::Binary;
    switch (options_.command)
    {
    case app::Command::Mirror:
        out_ << app::RenderRow(*engine_, value, style) << "\n"
             << app::RenderRow(*engine_, engine_->Mirror(value), style) << "\n";
        break;
    case app::Command::Count:
        out_ << engine_->CountOnes(value) << "\n";
        break;
    default:
        out_ << app::RenderRow(*engine_, value, style) << "\n";
        break;
    }
    return 0;
}

int Application::runBenchmark()
{
    const auto& settings = config_.settings();
    PLOG_INFO << "Benchmark: width " << engine_->Width() << ", " << settings.benchmark_iterations << " iterations";
    auto results = app::RunBenchmark(*engine_, engine_->DefaultStep(), settings.benchmark_iterations);
    app::PrintBenchmark(results, out_);
    return 0;
}

void Application::reportPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        err_ << utils::ErrorReporter::SeverityToString(report.severity) << ": " << report.user_message;
        if (!report.technical_details.empty())
            err_ << " (" << report.technical_details << ")";
        err_ << "\n";
    }
}
