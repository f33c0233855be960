/**
 ==============================================================================
 Copyright 2019, Jonathan Zrake

 Permission is hereby granted, free of charge, to any person obtaining a copy of
 this software and associated documentation files (the "Software"), to deal in
 the Software without restriction, including without limitation the rights to
 use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 of the Software, and to permit persons to whom the Software is furnished to do
 so, subject to the following conditions:

 The above copyright notice and this permission notice shall be included in all
 copies or substantial portions of the Software.

 THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 SOFTWARE.

 ==============================================================================
*/




#pragma once
#include <algorithm>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <vector>
#include "core_sequence.hpp"




//=============================================================================
namespace seq {




/**
 * @brief      An infinite sequence of values drawn uniformly, with
 *             replacement, from a materialized source. The random engine is
 *             carried by the position, so restarting the sequence replays the
 *             same draws. An empty source gives an empty sequence.
 *
 * @tparam     ValueType  The type of the source values
 */
template<typename ValueType>
struct rolled_sequence_t
{
    std::shared_ptr<const std::vector<ValueType>> source;
    unsigned seed;
};

template<typename ValueType>
struct is_infinite<rolled_sequence_t<ValueType>> : std::true_type
{
};

struct roll_position_t
{
    std::minstd_rand engine;
    std::size_t index;
};

namespace detail {

inline std::size_t draw(std::minstd_rand& engine, std::size_t size)
{
    return std::uniform_int_distribution<std::size_t>(0, size - 1)(engine);
}

inline unsigned random_seed()
{
    return std::random_device()();
}

} // namespace detail

template<typename ValueType>
std::optional<roll_position_t> start(rolled_sequence_t<ValueType> sequence)
{
    if (sequence.source->empty())
        return {};

    auto engine = std::minstd_rand(sequence.seed);
    auto index = detail::draw(engine, sequence.source->size());
    return roll_position_t{engine, index};
}

template<typename ValueType>
std::optional<roll_position_t> next(rolled_sequence_t<ValueType> sequence, roll_position_t position)
{
    position.index = detail::draw(position.engine, sequence.source->size());
    return position;
}

template<typename ValueType>
ValueType obtain(rolled_sequence_t<ValueType> sequence, roll_position_t position)
{
    return sequence.source->at(position.index);
}




//=============================================================================
template<typename SequenceType>
auto roll_seeded(SequenceType sequence, unsigned seed)
{
    using value_type = value_type_t<SequenceType>;
    return rolled_sequence_t<value_type>{detail::shared_values(sequence), seed};
}

template<typename SequenceType>
auto roll(SequenceType sequence)
{
    return roll_seeded(sequence, detail::random_seed());
}

template<typename SequenceType>
auto roll(SequenceType sequence, unsigned long count, unsigned seed=detail::random_seed())
{
    return take(roll_seeded(sequence, seed), count);
}

/**
 * @brief      Sample up to count values of a finite sequence without
 *             replacement, in random order.
 */
template<typename SequenceType>
auto pick(SequenceType sequence, unsigned long count, unsigned seed=detail::random_seed())
{
    using value_type = value_type_t<SequenceType>;

    auto source = detail::shared_values(sequence);
    auto indexes = std::vector<std::size_t>(source->size());
    auto engine = std::mt19937(seed);
    auto result = std::vector<value_type>();

    std::iota(indexes.begin(), indexes.end(), 0);
    std::shuffle(indexes.begin(), indexes.end(), engine);
    indexes.resize(std::min<std::size_t>(count, indexes.size()));

    for (auto i : indexes)
        result.push_back(source->at(i));

    return view(std::move(result));
}

template<typename SequenceType>
auto pick_all(SequenceType sequence, unsigned seed=detail::random_seed())
{
    auto source = detail::shared_values(sequence);
    return pick(share(source), source->size(), seed);
}

inline auto pick(unsigned long count) { return [count] (auto s) { return pick(s, count); }; }

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <set>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_random()
{
    auto digits = seq::range(10);

    auto picked = seq::to<std::vector>(pick(digits, 4, 7));
    require(picked.size() == 4);
    require(std::set(picked.begin(), picked.end()).size() == 4);
    require(std::all_of(picked.begin(), picked.end(), [] (long d) { return 0 <= d && d < 10; }));
    require((seq::to<std::vector>(pick(digits, 4, 7)) == picked));
    require(seq::to<std::vector>(pick(digits, 40, 7)).size() == 10);
    require(seq::to<std::vector>(digits | seq::pick(3)).size() == 3);

    auto shuffled = seq::to<std::vector>(seq::pick_all(digits, 1));
    std::sort(shuffled.begin(), shuffled.end());
    require((shuffled == seq::to<std::vector>(digits)));

    auto rolled = seq::to<std::vector>(roll(seq::from('H', 'T'), 50, 3));
    require(rolled.size() == 50);
    require(std::set(rolled.begin(), rolled.end()).size() == 2);
    require((seq::to<std::vector>(roll(seq::from('H', 'T'), 50, 3)) == rolled));

    auto stream = seq::roll_seeded(digits, 11);
    require(seq::is_infinite_v<decltype(stream)>);
    require((seq::to<std::vector>(take(stream, 20)) == seq::to<std::vector>(take(stream, 20))));
    require(seq::to<std::vector>(take(seq::roll(digits), 5)).size() == 5);

    require(empty(pick(seq::range(0), 3)));
    require(empty(seq::roll(seq::range(0))));
    require_throws(seq::pick_all(seq::generate()));
}

#endif // DO_UNIT_TESTS
