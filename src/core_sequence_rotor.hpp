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
#include <optional>
#include <stdexcept>
#include <vector>
#include "core_sequence.hpp"




//=============================================================================
namespace seq {




/**
 * @brief      One entry of a rotor pattern: a window of size values,
 *             followed by a gap. A positive gap skips that many values before
 *             the next window; a negative gap makes the next window overlap
 *             this one by that many values.
 */
struct window_t
{
    std::size_t size;
    long gap = 0;
};




/**
 * @brief      A sequence of windows (std::vector) cut from a source sequence,
 *             with sizes and gaps taken cyclically from a list of window_t.
 *             Windows are emitted only when full, unless partial is set, in
 *             which case the final, shorter window is also emitted.
 *
 * @tparam     SequenceType  The type of the source sequence
 */
template<typename SequenceType>
struct rotor_sequence_t
{
    SequenceType sequence;
    std::vector<window_t> windows;
    bool partial;
};

template<typename SequenceType>
struct is_infinite<rotor_sequence_t<SequenceType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType>
struct rotor_position_t
{
    std::vector<value_type_t<SequenceType>> buffer;
    std::optional<position_t<SequenceType>> upstream;
    std::size_t which;
};

namespace detail {

/**
 * Pull values into the buffer until it holds the size of the current window,
 * or the source is exhausted. The upstream cursor always refers to the next
 * value not yet pulled.
 */
template<typename SequenceType>
auto fill_window(const rotor_sequence_t<SequenceType>& sequence, rotor_position_t<SequenceType> position)
-> std::optional<rotor_position_t<SequenceType>>
{
    auto size = sequence.windows[position.which].size;

    while (position.buffer.size() < size && position.upstream.has_value())
    {
        position.buffer.push_back(obtain(sequence.sequence, position.upstream.value()));
        position.upstream = next(sequence.sequence, position.upstream.value());
    }

    if (position.buffer.size() == size && (size > 0 || position.upstream.has_value()))
        return position;

    if (sequence.partial && ! position.buffer.empty())
        return position;

    return {};
}

inline void validate_windows(const std::vector<window_t>& windows)
{
    if (windows.empty())
        throw std::invalid_argument("seq::rotor (the window list is empty)");

    for (auto w : windows)
        if (long(w.size) + w.gap < 1)
            throw std::invalid_argument("seq::rotor (a window of size + gap < 1 never advances)");
}

} // namespace detail

template<typename SequenceType>
auto start(rotor_sequence_t<SequenceType> sequence)
{
    return detail::fill_window(sequence, rotor_position_t<SequenceType>{{}, start(sequence.sequence), 0});
}

template<typename SequenceType>
auto next(rotor_sequence_t<SequenceType> sequence, rotor_position_t<SequenceType> position)
-> std::optional<rotor_position_t<SequenceType>>
{
    auto window = sequence.windows[position.which];
    auto step = std::size_t(long(window.size) + window.gap);

    if (step <= position.buffer.size())
    {
        position.buffer.erase(position.buffer.begin(), position.buffer.begin() + step);
    }
    else
    {
        for (auto n = position.buffer.size(); n < step && position.upstream.has_value(); ++n)
            position.upstream = next(sequence.sequence, position.upstream.value());

        position.buffer.clear();
    }
    position.which = (position.which + 1) % sequence.windows.size();

    if (! position.upstream.has_value() && position.buffer.empty())
        return {};

    return detail::fill_window(sequence, position);
}

template<typename SequenceType>
auto obtain(rotor_sequence_t<SequenceType> sequence, rotor_position_t<SequenceType> position)
{
    return position.buffer;
}




/**
 * @brief      Cut a sequence into consecutive windows.
 *
 * @param[in]  sequence      The source sequence
 * @param[in]  windows       The window sizes and gaps, used cyclically
 * @param[in]  partial       Whether to emit a final window that is not full
 *
 * @return     A lazy sequence of std::vector
 *
 * @note       Throws std::invalid_argument if the list is empty or if any
 *             window would never advance (size + gap < 1).
 */
template<typename SequenceType>
auto rotor(SequenceType sequence, std::vector<window_t> windows, bool partial=false)
{
    detail::validate_windows(windows);
    return rotor_sequence_t<SequenceType>{sequence, windows, partial};
}

template<typename SequenceType>
auto rotor(SequenceType sequence, std::size_t size, bool partial=false)
{
    return rotor(sequence, std::vector<window_t>{{size, 0}}, partial);
}

template<typename SequenceType>
auto batch(SequenceType sequence, std::size_t size)
{
    return rotor(sequence, size, true);
}

/**
 * @brief      Like batch, except that each chunk is a sequence viewing its
 *             values. The values are buffered, so the source is walked once.
 */
template<typename SequenceType>
auto chunk(SequenceType sequence, std::size_t size)
{
    return map(batch(sequence, size), [] (auto values) { return view(std::move(values)); });
}

inline auto rotor(std::vector<window_t> windows, bool partial=false)
{
    detail::validate_windows(windows);
    return [windows, partial] (auto s) { return rotor(s, windows, partial); };
}

inline auto batch(std::size_t size)
{
    return [size] (auto s) { return batch(s, size); };
}

inline auto chunk(std::size_t size)
{
    return [size] (auto s) { return chunk(s, size); };
}

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <string>
#include "core_sequence_unique.hpp"
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_rotor()
{
    using v = std::vector<char>;
    using w = std::vector<long>;
    auto letters = seq::view(std::string("abcdefgh"));

    require((seq::to<std::vector>(rotor(letters, 3)) == std::vector{v{'a', 'b', 'c'}, v{'d', 'e', 'f'}}));
    require((seq::to<std::vector>(rotor(letters, 3, true)) == std::vector{v{'a', 'b', 'c'}, v{'d', 'e', 'f'}, v{'g', 'h'}}));
    require((seq::to<std::vector>(letters | seq::batch(3)) == std::vector{v{'a', 'b', 'c'}, v{'d', 'e', 'f'}, v{'g', 'h'}}));

    // positive gaps skip values; negative gaps overlap windows
    require((seq::to<std::vector>(rotor(seq::range(10), {{2, 1}})) == std::vector{w{0, 1}, w{3, 4}, w{6, 7}}));
    require((seq::to<std::vector>(rotor(seq::range(5), {{3, -2}})) == std::vector{w{0, 1, 2}, w{1, 2, 3}, w{2, 3, 4}}));
    require((seq::to<std::vector>(rotor(seq::range(5), {{3, -2}}, true)) == std::vector{w{0, 1, 2}, w{1, 2, 3}, w{2, 3, 4}, w{3, 4}, w{4}}));
    require((seq::to<std::vector>(rotor(seq::range(8), {{1, 0}, {2, 0}})) == std::vector{w{0}, w{1, 2}, w{3}, w{4, 5}, w{6}}));
    require((seq::to<std::vector>(seq::range(7) | seq::rotor({{2, 2}}, true)) == std::vector{w{0, 1}, w{4, 5}}));

    require((seq::to<std::vector>(back(chunk(seq::range(6), 3))) == w{3, 4, 5}));
    require((seq::to<std::vector>(seq::map(seq::range(5) | seq::chunk(2), [] (auto c) { return seq::to<std::vector>(c); })) == std::vector{w{0, 1}, w{2, 3}, w{4}}));

    // a source with remembered state is walked once per pass
    auto distinct = seq::unique(seq::from(1, 2, 3, 4, 5, 6));
    require((seq::to<std::vector>(seq::batch(distinct, 2)) == std::vector{std::vector{1, 2}, std::vector{3, 4}, std::vector{5, 6}}));
    require(seq::to<std::vector>(seq::chunk(distinct, 2)).size() == 3);
    require((seq::to<std::vector>(back(seq::chunk(distinct, 2))) == std::vector{5, 6}));

    // an infinite source gives an infinite sequence of windows
    require((front(drop(rotor(seq::generate(), 4), 2)) == w{8, 9, 10, 11}));
    require(empty(rotor(seq::range(2), 3)));
    require(empty(rotor(seq::range(0), 3, true)));

    require_throws(rotor(letters, std::vector<seq::window_t>{}));
    require_throws(rotor(letters, {{1, -1}}));
    require_throws(rotor(letters, 0));
}

#endif // DO_UNIT_TESTS
