#include "SequenceRenderer.hpp"

#include "bitbrush/pattern/PatternEngine.hpp"

#include <algorithm>
#include <ostream>

namespace app
{

std::string RenderRow(const bitbrush::PatternEngine& engine, bitbrush::Pattern value, RowStyle style)
{
    std::string row = engine.Visualize(value);
    if (style == RowStyle::Blocks)
    {
        std::replace(row.begin(), row.end(), '1', '#');
        std::replace(row.begin(), row.end(), '0', '.');
    }
    row += "  ";
    row += std::to_string(value & engine.Mask());
    return row;
}

std::size_t RenderSequence(const bitbrush::PatternEngine& engine, const bitbrush::PatternSequence& sequence,
                           RowStyle style, std::ostream& out)
{
    std::size_t rows = 0;
    for (bitbrush::Pattern value : sequence)
    {
        out << RenderRow(engine, value, style) << '\n';
        ++rows;
    }
    return rows;
}

} // namespace app
