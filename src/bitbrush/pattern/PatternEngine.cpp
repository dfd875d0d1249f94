#include "PatternEngine.hpp"
#include "../util/Errors.hpp"
#include "../util/Profile.hpp"

#include <bit>
#include <utility>

namespace bitbrush
{

void PatternEngine::ValidateWidth(int width)
{
    if (width <= 0)
        throw InvalidConfiguration("width must be positive, got " + std::to_string(width));
    if (width % kByteBits != 0)
        throw InvalidConfiguration("width must be a multiple of 8, got " + std::to_string(width));
    if (width > kMaxWidth)
        throw InvalidConfiguration("width must not exceed " + std::to_string(kMaxWidth) + ", got " +
                                   std::to_string(width));
}

PatternEngine::PatternEngine(int width)
    : PatternEngine(EngineConfig{ .width = width })
{
}

PatternEngine::PatternEngine(const EngineConfig& config, Logger logger)
    : width_(config.width)
    , mask_(0)
    , default_step_(config.default_step)
    , log_(std::move(logger))
{
    ValidateWidth(width_);
    mask_ = MaskForWidth(width_);

    if (log_.debug)
        log_.debug("PatternEngine ready: width=" + std::to_string(width_) + " bytes=" +
                   std::to_string(width_ / kByteBits) + " default_step=" + std::to_string(default_step_));
}

PatternSequence PatternEngine::SweepOnes() const
{
    return PatternSequence(PatternSequence::Rule::SingleOne, width_);
}

PatternSequence PatternEngine::SweepZeros() const
{
    return PatternSequence(PatternSequence::Rule::SingleZero, width_);
}

PatternSequence PatternEngine::ToggleSparse(int step) const
{
    if (step <= 0)
    {
        if (log_.warn)
            log_.warn("ToggleSparse rejected step " + std::to_string(step));
        throw InvalidArgument("step must be positive, got " + std::to_string(step));
    }
    return PatternSequence(PatternSequence::Rule::Stride, width_, step);
}

PatternSequence PatternEngine::ScanPatterns() const
{
    return PatternSequence(PatternSequence::Rule::CenterOut, width_);
}

PatternSequence PatternEngine::ScanRings() const
{
    return PatternSequence(PatternSequence::Rule::CenterRing, width_);
}

PatternSequence PatternEngine::Generate(SequenceKind kind, int step) const
{
    switch (kind)
    {
    case SequenceKind::SweepOnes:
        return SweepOnes();
    case SequenceKind::SweepZeros:
        return SweepZeros();
    case SequenceKind::ToggleSparse:
        return ToggleSparse(step);
    case SequenceKind::Scan:
        return ScanPatterns();
    case SequenceKind::ScanRings:
        return ScanRings();
    }
    throw InvalidArgument("unknown sequence kind");
}

Pattern PatternEngine::Mirror(Pattern value) const
{
    value &= mask_;

    // Byte i of the source lands, reversed, at byte (bytes - 1 - i) of the result.
    const int bytes = width_ / kByteBits;
    Pattern result = 0;
    for (int i = 0; i < bytes; ++i)
    {
        const auto byte = static_cast<std::uint8_t>((value >> (i * kByteBits)) & 0xFFu);
        const int shift = (bytes - 1 - i) * kByteBits;
        result |= static_cast<Pattern>(mirror_table_.Lookup(byte)) << shift;
    }
    return result;
}

std::vector<Pattern> PatternEngine::MirrorAll(const std::vector<Pattern>& values) const
{
    PROFILE_SCOPE_FUNCTION();
    std::vector<Pattern> mirrored;
    mirrored.reserve(values.size());
    for (Pattern value : values)
        mirrored.push_back(Mirror(value));
    return mirrored;
}

int PatternEngine::CountOnes(Pattern value) const
{
    return std::popcount(value & mask_);
}

std::string PatternEngine::Visualize(Pattern value) const
{
    value &= mask_;
    std::string text(static_cast<std::size_t>(width_), '0');
    for (int i = 0; i < width_; ++i)
    {
        if (value & Bit(i))
            text[static_cast<std::size_t>(width_ - 1 - i)] = '1';
    }
    return text;
}

Pattern PatternEngine::Parse(std::string_view text) const
{
    if (text.empty())
        throw InvalidArgument("binary text is empty");
    if (text.size() > static_cast<std::size_t>(width_))
        throw InvalidArgument("binary text has " + std::to_string(text.size()) + " digits, width is " +
                              std::to_string(width_));

    Pattern value = 0;
    for (char ch : text)
    {
        if (ch != '0' && ch != '1')
            throw InvalidArgument("binary text contains '" + std::string(1, ch) + "'");
        value = (value << 1) | static_cast<Pattern>(ch == '1');
    }
    return value;
}

} // namespace bitbrush
