#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

#include "bitbrush/pattern/Pattern.hpp"

namespace bitbrush
{
class PatternEngine;
class PatternSequence;
}

namespace app
{

enum class RowStyle
{
    Binary, // '1' / '0'
    Blocks  // '#' / '.'
};

// One row of the text image: the visualized pattern followed by its decimal value.
std::string RenderRow(const bitbrush::PatternEngine& engine, bitbrush::Pattern value, RowStyle style);

// Writes every element of the sequence as a row; returns the number of rows written.
std::size_t RenderSequence(const bitbrush::PatternEngine& engine, const bitbrush::PatternSequence& sequence,
                           RowStyle style, std::ostream& out);

} // namespace app
