#include "Benchmark.hpp"

#include "bitbrush/api/bitbrush.hpp"

#include <chrono>
#include <iomanip>
#include <ostream>

#include <plog/Log.h>

namespace app
{

namespace
{

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

std::vector<BenchmarkResult> RunBenchmark(const bitbrush::PatternEngine& engine, int step, int iterations)
{
    std::vector<BenchmarkResult> results;
    // Folded into the log so the consumption loops have an observable result.
    bitbrush::Pattern checksum = 0;

    for (bitbrush::SequenceKind kind : bitbrush::AllSequenceKinds())
    {
        BenchmarkResult result;
        result.name = bitbrush::ToString(kind);

        auto start = Clock::now();
        for (int i = 0; i < iterations; ++i)
        {
            for (bitbrush::Pattern value : engine.Generate(kind, step))
            {
                checksum ^= value;
                ++result.elements;
            }
        }
        result.milliseconds = ElapsedMs(start);
        results.push_back(result);
    }

    std::vector<bitbrush::Pattern> values;
    values.reserve(static_cast<std::size_t>(iterations));
    for (int i = 0; i < iterations; ++i)
        values.push_back(static_cast<bitbrush::Pattern>(i) & engine.Mask());

    BenchmarkResult mirror;
    mirror.name = "mirror";
    auto start = Clock::now();
    for (bitbrush::Pattern value : engine.MirrorAll(values))
        checksum ^= value;
    mirror.milliseconds = ElapsedMs(start);
    mirror.elements = values.size();
    results.push_back(mirror);

    PLOG_DEBUG << "Benchmark finished, checksum " << checksum;
    return results;
}

void PrintBenchmark(const std::vector<BenchmarkResult>& results, std::ostream& out)
{
    out << std::left << std::setw(16) << "operation" << std::right << std::setw(12) << "elements"
        << std::setw(14) << "time (ms)" << '\n';
    for (const auto& result : results)
    {
        out << std::left << std::setw(16) << result.name << std::right << std::setw(12) << result.elements
            << std::setw(14) << std::fixed << std::setprecision(3) << result.milliseconds << '\n';
    }
}

} // namespace app
