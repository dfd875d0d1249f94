#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bitbrush
{

enum class SequenceKind
{
    SweepOnes,
    SweepZeros,
    ToggleSparse,
    Scan,
    ScanRings
};

// Command line name of a generator ("sweep-ones", "toggle-sparse", ...)
std::string ToString(SequenceKind kind);

std::optional<SequenceKind> ParseSequenceKind(std::string_view name);

const std::vector<SequenceKind>& AllSequenceKinds();

} // namespace bitbrush
