#pragma once

#include "Pattern.hpp"
#include "MirrorTable.hpp"
#include "PatternSequence.hpp"
#include "SequenceKind.hpp"
#include "../api/Logger.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bitbrush
{

struct EngineConfig
{
    int width = 32;
    int default_step = 3; // used by ToggleSparse() without an explicit step
};

/**
 * @brief Generates, inspects and mirrors bit patterns of a fixed width
 *
 * Width must be a positive multiple of 8 no larger than 64. The engine is
 * immutable after construction; every operation is const and generators
 * return independent sequences.
 *
 * Values passed to Mirror, MirrorAll, CountOnes and Visualize are masked to
 * the configured width before use.
 */
class PatternEngine
{
public:
    /// @throws InvalidConfiguration if width is not in {8, 16, ..., 64}
    explicit PatternEngine(int width);

    /// @throws InvalidConfiguration for a bad width. The default step is only
    /// checked when ToggleSparse() uses it.
    explicit PatternEngine(const EngineConfig& config, Logger logger = {});

    int Width() const { return width_; }
    Pattern Mask() const { return mask_; }
    int DefaultStep() const { return default_step_; }

    // Generators
    PatternSequence SweepOnes() const;
    PatternSequence SweepZeros() const;

    /// @throws InvalidArgument if step <= 0
    PatternSequence ToggleSparse(int step) const;
    /// @throws InvalidArgument if the configured default step is <= 0
    PatternSequence ToggleSparse() const { return ToggleSparse(default_step_); }

    PatternSequence ScanPatterns() const;
    PatternSequence ScanRings() const;

    /// Dispatch by kind; step is only read for SequenceKind::ToggleSparse.
    PatternSequence Generate(SequenceKind kind, int step) const;

    // Transform
    Pattern Mirror(Pattern value) const;
    std::vector<Pattern> MirrorAll(const std::vector<Pattern>& values) const;

    // Inspection
    int CountOnes(Pattern value) const;
    std::string Visualize(Pattern value) const;

    /// Inverse of Visualize; accepts 1..width characters of '0' and '1'.
    /// @throws InvalidArgument on empty, too long or non-binary text
    Pattern Parse(std::string_view text) const;

private:
    static void ValidateWidth(int width);

    int width_;
    Pattern mask_;
    int default_step_;
    MirrorTable mirror_table_;
    Logger log_;
};

} // namespace bitbrush
