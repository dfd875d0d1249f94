#pragma once

#include "Pattern.hpp"

#include <cstddef>
#include <iterator>
#include <vector>

namespace bitbrush
{

/**
 * @brief Lazy, finite, restartable sequence of patterns
 *
 * A sequence only stores the rule that produces it and the engine geometry
 * (width, step). Every call to begin() returns an iterator with its own cursor,
 * so iterating twice restarts from the first element and two iterators never
 * interfere. The element count is known up front.
 *
 * Sequences are only created by PatternEngine, which validates width and step
 * before building one.
 */
class PatternSequence
{
public:
    enum class Rule
    {
        SingleOne,   // 1 << i
        SingleZero,  // mask ^ (1 << i)
        Stride,      // cumulative OR of bits 0, step, 2*step, ...
        CenterOut,   // cumulative OR of the rings around width / 2
        CenterRing   // the ring around width / 2 alone, one radius at a time
    };

    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Pattern;
        using difference_type = std::ptrdiff_t;
        using pointer = const Pattern*;
        using reference = const Pattern&;

        Iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        Iterator& operator++();
        Iterator operator++(int)
        {
            Iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const Iterator& other) const { return index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class PatternSequence;

        Iterator(const PatternSequence* owner, std::size_t index);

        const PatternSequence* owner_ = nullptr;
        std::size_t index_ = 0;
        Pattern current_ = 0;
    };

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, count_); }

    std::size_t Size() const { return count_; }

    std::vector<Pattern> ToVector() const;

private:
    friend class PatternEngine;

    // Width must be a valid engine width and step positive.
    PatternSequence(Rule rule, int width, int step = 1);

    // Pattern at position `index`, given the pattern produced at `index - 1`
    // (0 for the first element).
    Pattern Produce(std::size_t index, Pattern previous) const;

    std::size_t ComputeCount() const;

    Rule rule_;
    int width_;
    int step_;
    Pattern mask_;
    std::size_t count_;
};

} // namespace bitbrush
