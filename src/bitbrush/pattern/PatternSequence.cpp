#include "PatternSequence.hpp"

namespace bitbrush
{

PatternSequence::Iterator::Iterator(const PatternSequence* owner, std::size_t index)
    : owner_(owner)
    , index_(index)
{
    if (owner_ && index_ < owner_->count_)
        current_ = owner_->Produce(index_, 0);
}

PatternSequence::Iterator& PatternSequence::Iterator::operator++()
{
    ++index_;
    if (owner_ && index_ < owner_->count_)
        current_ = owner_->Produce(index_, current_);
    return *this;
}

PatternSequence::PatternSequence(Rule rule, int width, int step)
    : rule_(rule)
    , width_(width)
    , step_(step)
    , mask_(MaskForWidth(width))
    , count_(0)
{
    count_ = ComputeCount();
}

std::size_t PatternSequence::ComputeCount() const
{
    switch (rule_)
    {
    case Rule::SingleOne:
    case Rule::SingleZero:
        return static_cast<std::size_t>(width_);
    case Rule::Stride:
        return static_cast<std::size_t>((static_cast<long long>(width_) + step_ - 1) / step_);
    case Rule::CenterOut:
    case Rule::CenterRing:
    {
        // Radii run while either side of the center is still inside the width.
        const int center = width_ / 2;
        const int left_radii = center + 1;
        const int right_radii = width_ - center;
        return static_cast<std::size_t>(left_radii > right_radii ? left_radii : right_radii);
    }
    }
    return 0;
}

Pattern PatternSequence::Produce(std::size_t index, Pattern previous) const
{
    const int i = static_cast<int>(index);
    switch (rule_)
    {
    case Rule::SingleOne:
        return Bit(i);
    case Rule::SingleZero:
        return mask_ ^ Bit(i);
    case Rule::Stride:
        return previous | Bit(i * step_);
    case Rule::CenterOut:
    case Rule::CenterRing:
    {
        const int center = width_ / 2;
        Pattern ring = 0;
        if (center - i >= 0)
            ring |= Bit(center - i);
        if (center + i < width_)
            ring |= Bit(center + i);
        return rule_ == Rule::CenterOut ? (previous | ring) : ring;
    }
    }
    return 0;
}

std::vector<Pattern> PatternSequence::ToVector() const
{
    std::vector<Pattern> values;
    values.reserve(count_);
    for (Pattern p : *this)
        values.push_back(p);
    return values;
}

} // namespace bitbrush
