#pragma once

#include "Logger.hpp"
#include "../pattern/Pattern.hpp"
#include "../pattern/PatternEngine.hpp"
#include "../pattern/PatternSequence.hpp"
#include "../pattern/SequenceKind.hpp"
#include "../util/Errors.hpp"

namespace bitbrush
{

inline constexpr const char* kVersion = "1.0.0";

} // namespace bitbrush
