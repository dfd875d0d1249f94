#include "SequenceKind.hpp"

namespace bitbrush
{

std::string ToString(SequenceKind kind)
{
    switch (kind)
    {
    case SequenceKind::SweepOnes:
        return "sweep-ones";
    case SequenceKind::SweepZeros:
        return "sweep-zeros";
    case SequenceKind::ToggleSparse:
        return "toggle-sparse";
    case SequenceKind::Scan:
        return "scan";
    case SequenceKind::ScanRings:
        return "scan-rings";
    default:
        return "unknown";
    }
}

std::optional<SequenceKind> ParseSequenceKind(std::string_view name)
{
    for (SequenceKind kind : AllSequenceKinds())
    {
        if (ToString(kind) == name)
            return kind;
    }
    return std::nullopt;
}

const std::vector<SequenceKind>& AllSequenceKinds()
{
    static const std::vector<SequenceKind> kinds{ SequenceKind::SweepOnes, SequenceKind::SweepZeros,
                                                  SequenceKind::ToggleSparse, SequenceKind::Scan,
                                                  SequenceKind::ScanRings };
    return kinds;
}

} // namespace bitbrush
