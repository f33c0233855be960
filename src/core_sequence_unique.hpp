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
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <type_traits>
#include <vector>
#include "core_sequence.hpp"




//=============================================================================
namespace seq {

namespace detail {

template<typename T, typename = void>
struct is_less_than_comparable : std::false_type {};

template<typename T>
struct is_less_than_comparable<T, std::void_t<decltype(std::declval<const T&>() < std::declval<const T&>())>> : std::true_type {};

/**
 * The set of keys seen so far. Under the default equality, keys having an
 * ordering are kept in a std::set; otherwise they are searched linearly with
 * the given equivalence.
 */
template<typename KeyType, typename EqualType>
class key_history_t
{
public:
    key_history_t(EqualType equal) : equal(equal) {}

    /**
     * Record a key, and return whether it was seen before.
     */
    bool insert(const KeyType& key)
    {
        if constexpr (ordered)
        {
            return ! seen.insert(key).second;
        }
        else
        {
            for (const auto& entry : seen)
                if (equal(entry, key))
                    return true;

            seen.push_back(key);
            return false;
        }
    }

private:
    static constexpr bool ordered = std::is_same_v<EqualType, std::equal_to<>> && is_less_than_comparable<KeyType>::value;
    using container_type = std::conditional_t<ordered, std::set<KeyType>, std::vector<KeyType>>;

    EqualType equal;
    container_type seen;
};

} // namespace detail




/**
 * @brief      A sequence that yields the values of its source whose key has
 *             not been seen before (or, if Repeated is true, whose key has
 *             been seen before). The key of a value is as(value);
 *             keys are compared with the equivalence with(a, b). The original
 *             values are passed through.
 *
 *             The history of keys is held by the position and shared by its
 *             copies. Iteration restarts with an empty history, but copies of
 *             a position must be advanced as a single cursor.
 *
 * @tparam     SequenceType  The type of the source sequence
 * @tparam     AsType        The type of the key function
 * @tparam     WithType      The type of the key equivalence
 * @tparam     Repeated      Whether to yield repeats rather than first-seen values
 */
template<typename SequenceType, typename AsType, typename WithType, bool Repeated>
struct dedup_sequence_t
{
    SequenceType sequence;
    AsType as;
    WithType with;
};

template<typename SequenceType, typename AsType, typename WithType, bool Repeated>
struct is_infinite<dedup_sequence_t<SequenceType, AsType, WithType, Repeated>> : is_infinite<SequenceType>
{
};

namespace detail {

template<typename SequenceType, typename AsType>
using key_type_t = std::decay_t<std::invoke_result_t<AsType, value_type_t<SequenceType>>>;

template<typename SequenceType, typename AsType, typename WithType>
struct dedup_position_t
{
    position_t<SequenceType> upstream;
    std::shared_ptr<key_history_t<key_type_t<SequenceType, AsType>, WithType>> history;
};

template<typename SequenceType, typename AsType, typename WithType, bool Repeated>
auto first_admitted(
    const dedup_sequence_t<SequenceType, AsType, WithType, Repeated>& sequence,
    std::optional<position_t<SequenceType>> p,
    std::shared_ptr<key_history_t<key_type_t<SequenceType, AsType>, WithType>> history)
-> std::optional<dedup_position_t<SequenceType, AsType, WithType>>
{
    while (p.has_value())
    {
        auto seen = history->insert(sequence.as(obtain(sequence.sequence, p.value())));

        if (seen == Repeated)
            return dedup_position_t<SequenceType, AsType, WithType>{p.value(), history};

        p = next(sequence.sequence, p.value());
    }
    return {};
}

} // namespace detail

template<typename SequenceType, typename AsType, typename WithType, bool Repeated>
auto start(dedup_sequence_t<SequenceType, AsType, WithType, Repeated> sequence)
{
    using history_type = detail::key_history_t<detail::key_type_t<SequenceType, AsType>, WithType>;
    return detail::first_admitted(sequence, start(sequence.sequence), std::make_shared<history_type>(sequence.with));
}

template<typename SequenceType, typename AsType, typename WithType, bool Repeated>
auto next(dedup_sequence_t<SequenceType, AsType, WithType, Repeated> sequence, detail::dedup_position_t<SequenceType, AsType, WithType> position)
{
    return detail::first_admitted(sequence, next(sequence.sequence, position.upstream), position.history);
}

template<typename SequenceType, typename AsType, typename WithType, bool Repeated>
auto obtain(dedup_sequence_t<SequenceType, AsType, WithType, Repeated> sequence, detail::dedup_position_t<SequenceType, AsType, WithType> position)
{
    return obtain(sequence.sequence, position.upstream);
}




/**
 * @brief      A sequence that drops the values of its source whose key is
 *             equivalent to the key of the value immediately before it. Only
 *             the previous key is remembered.
 */
template<typename SequenceType, typename AsType, typename WithType>
struct squished_sequence_t
{
    SequenceType sequence;
    AsType as;
    WithType with;
};

template<typename SequenceType, typename AsType, typename WithType>
struct is_infinite<squished_sequence_t<SequenceType, AsType, WithType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType, typename AsType, typename WithType>
auto start(squished_sequence_t<SequenceType, AsType, WithType> sequence)
-> std::optional<std::pair<position_t<SequenceType>, detail::key_type_t<SequenceType, AsType>>>
{
    if (auto p = start(sequence.sequence); p.has_value())
        return std::pair(p.value(), detail::key_type_t<SequenceType, AsType>(sequence.as(obtain(sequence.sequence, p.value()))));
    return {};
}

template<typename SequenceType, typename AsType, typename WithType>
auto next(squished_sequence_t<SequenceType, AsType, WithType> sequence, std::pair<position_t<SequenceType>, detail::key_type_t<SequenceType, AsType>> position)
-> std::optional<std::pair<position_t<SequenceType>, detail::key_type_t<SequenceType, AsType>>>
{
    auto p = next(sequence.sequence, position.first);

    while (p.has_value())
    {
        auto key = detail::key_type_t<SequenceType, AsType>(sequence.as(obtain(sequence.sequence, p.value())));

        if (! sequence.with(position.second, key))
            return std::pair(p.value(), key);

        position.second = key;
        p = next(sequence.sequence, p.value());
    }
    return {};
}

template<typename SequenceType, typename AsType, typename WithType>
auto obtain(squished_sequence_t<SequenceType, AsType, WithType> sequence, std::pair<position_t<SequenceType>, detail::key_type_t<SequenceType, AsType>> position)
{
    return obtain(sequence.sequence, position.first);
}




//=============================================================================
template<typename SequenceType, typename AsType = identity_t, typename WithType = std::equal_to<>>
auto unique(SequenceType sequence, AsType as = AsType(), WithType with = WithType())
{
    return dedup_sequence_t<SequenceType, AsType, WithType, false>{sequence, as, with};
}

template<typename SequenceType, typename AsType = identity_t, typename WithType = std::equal_to<>>
auto repeated(SequenceType sequence, AsType as = AsType(), WithType with = WithType())
{
    return dedup_sequence_t<SequenceType, AsType, WithType, true>{sequence, as, with};
}

template<typename SequenceType, typename AsType = identity_t, typename WithType = std::equal_to<>>
auto squish(SequenceType sequence, AsType as = AsType(), WithType with = WithType())
{
    return squished_sequence_t<SequenceType, AsType, WithType>{sequence, as, with};
}

inline auto unique()   { return [] (auto s) { return unique(s); }; }
inline auto repeated() { return [] (auto s) { return repeated(s); }; }
inline auto squish()   { return [] (auto s) { return squish(s); }; }

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <cctype>
#include <string>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_unique()
{
    using namespace std::string_literals;

    auto lower = [] (std::string s) { for (auto& c : s) c = char(std::tolower(static_cast<unsigned char>(c))); return s; };
    auto same_length = [] (const std::string& a, const std::string& b) { return a.size() == b.size(); };

    require((seq::to<std::vector>(seq::from(1, 2, 1, 3, 2, 4) | seq::unique()) == std::vector{1, 2, 3, 4}));
    require((seq::to<std::vector>(unique(seq::from("a"s, "A"s, "b"s, "B"s), lower)) == std::vector{"a"s, "b"s}));
    require((seq::to<std::vector>(unique(seq::from("ab"s, "cd"s, "e"s), seq::identity_t(), same_length)) == std::vector{"ab"s, "e"s}));
    require((seq::to<std::vector>(take(unique(seq::map(seq::generate(), [] (long i) { return i / 3; })), 4)) == std::vector{0l, 1l, 2l, 3l}));

    require((seq::to<std::vector>(seq::from('a', 'a', 'b', 'b', 'b', 'c', 'c') | seq::squish()) == std::vector{'a', 'b', 'c'}));
    require((seq::to<std::vector>(seq::from('a', 'b', 'b', 'c', 'c', 'b', 'a') | seq::squish()) == std::vector{'a', 'b', 'c', 'b', 'a'}));
    require((seq::to<std::vector>(squish(seq::from("x"s, "X"s, "y"s), lower)) == std::vector{"x"s, "y"s}));

    require((seq::to<std::vector>(seq::from(1, 2, 1, 1, 3, 2) | seq::repeated()) == std::vector{1, 1, 2}));
    require((seq::to<std::vector>(repeated(seq::from("a"s, "b"s, "A"s), lower)) == std::vector{"A"s}));
    require(empty(seq::range(5) | seq::repeated()));

    // a restarted sequence begins with an empty history
    auto distinct = unique(seq::from(3, 3, 4));
    require(seq::to<std::vector>(distinct) == seq::to<std::vector>(distinct));
}

#endif // DO_UNIT_TESTS
