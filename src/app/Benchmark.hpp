#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace bitbrush
{
class PatternEngine;
}

namespace app
{

struct BenchmarkResult
{
    std::string name;
    double milliseconds = 0.0;
    std::size_t elements = 0; // patterns produced or mirrored in total
};

/**
 * @brief Time every generator and the batch mirror
 *
 * Each generator is fully consumed `iterations` times. The mirror entry runs
 * MirrorAll once over `iterations` consecutive values.
 */
std::vector<BenchmarkResult> RunBenchmark(const bitbrush::PatternEngine& engine, int step, int iterations);

void PrintBenchmark(const std::vector<BenchmarkResult>& results, std::ostream& out);

} // namespace app
