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
#include <any>
#include <array>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>




//=============================================================================
namespace seq {

namespace detail {

template<typename... Ts, typename... Us, std::size_t... Is>
auto zip_tuple_impl(std::tuple<Ts...> t, std::tuple<Us...> u, std::index_sequence<Is...>)
{
    return std::tuple(std::pair(std::get<Is>(t), std::get<Is>(u))...);
}

template<typename... Ts, typename... Us>
auto zip_tuples(std::tuple<Ts...> t, std::tuple<Us...> u)
{
    return zip_tuple_impl(t, u, std::make_index_sequence<sizeof...(Ts)>());
}

template<typename FunctionType, typename... Ts>
auto map(const std::tuple<Ts...>& t, FunctionType fn)
{
    return std::apply([fn] (const auto&... ts) { return std::tuple(fn(ts)...); }, t);
}

template<typename... Ts>
auto values(const std::tuple<std::optional<Ts>...>& t)
{
    return std::apply([] (const auto&... os) { return std::tuple(os.value()...); }, t);
}

template<typename... Ts>
bool has_values(const std::tuple<std::optional<Ts>...>& t)
{
    auto impl = [] (const auto&... os) {
        return std::array<bool, sizeof...(Ts)>{os.has_value()...};
    };
    for (auto has_value : std::apply(impl, t))
        if (! has_value)
            return false;
    return true;
}

template<typename... Ts>
auto optional_tuple(const std::tuple<std::optional<Ts>...>& t)
{
    return has_values(t) ? std::make_optional(values(t)) : std::optional<std::tuple<Ts...>>{};
}

template<typename T>
std::optional<std::any> optional_any(const std::optional<T>& o)
{
    return o.has_value() ? o.value() : std::optional<std::any>{};
}

template<typename T, typename U>
std::optional<std::pair<std::optional<T>, std::optional<U>>> optional_pair_of_either(const std::optional<T>& t, const std::optional<U>& u)
{
    return t.has_value() || u.has_value()
    ? std::optional<std::pair<std::optional<T>, std::optional<U>>>{{t, u}}
    : std::optional<std::pair<std::optional<T>, std::optional<U>>>{};
}

/**
 * Invoke function(std::integral_constant<std::size_t, I>) for the single I in
 * Is equal to the run-time index.
 */
template<typename FunctionType, std::size_t... Is>
void visit_index(std::size_t index, FunctionType&& function, std::index_sequence<Is...>)
{
    ((Is == index ? function(std::integral_constant<std::size_t, Is>()) : void()), ...);
}

template<typename... Ts>
std::optional<std::size_t> first_engaged(const std::tuple<std::optional<Ts>...>& t, std::size_t from)
{
    if constexpr (sizeof...(Ts) == 0)
    {
        return {};
    }
    else
    {
        auto engaged = std::apply([] (const auto&... os) { return std::array<bool, sizeof...(Ts)>{os.has_value()...}; }, t);

        for (std::size_t n = 0; n < sizeof...(Ts); ++n)
            if (engaged[(from + n) % sizeof...(Ts)])
                return (from + n) % sizeof...(Ts);
        return {};
    }
}

} // namespace detail




//=============================================================================
template<typename SequenceType>
struct position
{
    using type = typename decltype(start(std::declval<SequenceType>()))::value_type;
};

template<typename SequenceType>
using position_t = typename position<SequenceType>::type;

template<typename SequenceType>
struct value_type
{
    using type = decltype(obtain(std::declval<SequenceType>(), std::declval<position_t<SequenceType>>()));
};

template<typename SequenceType>
using value_type_t = typename value_type<SequenceType>::type;




/**
 * @brief      Detects whether a type implements the sequence protocol, that is
 *             whether start(s) and obtain(s, p) are found for it. Values that
 *             are sequences are transparent to flattening operations.
 *
 * @tparam     T     The type to inspect
 */
template<typename T, typename = void>
struct is_sequence : std::false_type
{
};

template<typename T>
struct is_sequence<T, std::void_t<
    decltype(start(std::declval<T>()).value()),
    decltype(obtain(std::declval<T>(), start(std::declval<T>()).value()))>> : std::true_type
{
};

template<typename T>
inline constexpr bool is_sequence_v = is_sequence<T>::value;




/**
 * @brief      Records that a sequence type is provably infinite. Lazy adaptors
 *             inherit the property from their source; truncating adaptors end
 *             it. Operations that need the end of a sequence refuse to run on
 *             an infinite one.
 *
 * @tparam     SequenceType  The sequence type
 */
template<typename SequenceType>
struct is_infinite : std::false_type
{
};

template<typename SequenceType>
inline constexpr bool is_infinite_v = is_infinite<SequenceType>::value;

namespace detail {

template<typename SequenceType>
void require_finite(const char* operation)
{
    if constexpr (is_infinite_v<SequenceType>)
    {
        throw std::domain_error(std::string(operation) + " (the sequence is infinite)");
    }
}

} // namespace detail




//=============================================================================
struct identity_t
{
    template<typename T>
    T operator()(T value) const { return value; }
};




//=============================================================================
template<typename SequenceType>
struct iterator
{
    using sequence_type = SequenceType;
    using position_type = position_t<sequence_type>;
    using iterator_category = std::input_iterator_tag;
    using value_type        = value_type_t<SequenceType>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = value_type*;
    using reference         = value_type&;

    iterator& operator++() { position = next(sequence, position.value()); return *this; }
    bool operator!=(const iterator& other) const { return position.has_value() != other.position.has_value(); }
    bool operator==(const iterator& other) const { return position.has_value() == other.position.has_value(); }
    auto operator*() const { return obtain(sequence, position.value()); }
    sequence_type sequence;
    std::optional<position_type> position;
};

template<typename SequenceType>
auto begin(SequenceType sequence)
{
    return iterator<SequenceType>{sequence, start(sequence)};
}

template<typename SequenceType>
auto end(SequenceType sequence)
{
    return iterator<SequenceType>{sequence, {}};
}

template<typename SequenceType>
bool empty(const SequenceType& sequence)
{
    return ! start(sequence).has_value();
}




/**
 * @brief      An infinite sequence containing the values {f(x), f(f(x)), ...}
 *             for a function f: ValueType -> ValueType and an initial ValueType
 *             x.
 *
 * @tparam     ValueType     The type of the sequence values
 * @tparam     FunctionType  The type of the generating function
 */
template<typename ValueType, typename FunctionType>
struct generator_sequence_t
{
    ValueType start;
    FunctionType function;
};

template<typename ValueType, typename FunctionType>
struct is_infinite<generator_sequence_t<ValueType, FunctionType>> : std::true_type
{
};

template<typename ValueType, typename FunctionType>
std::optional<ValueType> start(generator_sequence_t<ValueType, FunctionType> sequence)
{
    return sequence.start;
}

template<typename ValueType, typename FunctionType>
std::optional<ValueType> next(generator_sequence_t<ValueType, FunctionType> sequence, ValueType position)
{
    return sequence.function(position);
}

template<typename ValueType, typename FunctionType>
ValueType obtain(generator_sequence_t<ValueType, FunctionType> sequence, ValueType position)
{
    return position;
}

template<typename StartType, typename FunctionType>
auto generate(StartType start, FunctionType function)
{
    using value_type = std::invoke_result_t<FunctionType, StartType>;
    return generator_sequence_t<value_type, FunctionType>{start, function};
}

inline auto generate(long start=0)
{
    return generate(start, [] (long i) { return i + 1; });
}




/**
 * @brief      A sequence containing the values {f(x)} for each x in a source
 *             sequence X, where f is a mapping to a value type, that may be
 *             different from that of X.
 *
 * @tparam     SequenceType  The type of the source sequence X
 * @tparam     FunctionType  The type of the mapping function f
 */
template<typename SequenceType, typename FunctionType>
struct mapped_sequence_t
{
    SequenceType sequence;
    FunctionType mapping;
};

template<typename SequenceType, typename FunctionType>
struct is_infinite<mapped_sequence_t<SequenceType, FunctionType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType, typename FunctionType>
auto start(mapped_sequence_t<SequenceType, FunctionType> sequence)
{
    return start(sequence.sequence);
}

template<typename SequenceType, typename FunctionType>
auto next(mapped_sequence_t<SequenceType, FunctionType> sequence, position_t<SequenceType> position)
{
    return next(sequence.sequence, position);
}

template<typename SequenceType, typename FunctionType>
auto obtain(mapped_sequence_t<SequenceType, FunctionType> sequence, position_t<SequenceType> position)
{
    return sequence.mapping(obtain(sequence.sequence, position));
}




/**
 * @brief      A sequence containing the values {f(x0, .., xn-1), f(xn, ..,
 *             x2n-1), ...} for a function f of n arguments. A trailing group
 *             of fewer than n values is dropped.
 *
 * @tparam     SequenceType  The type of the source sequence X
 * @tparam     FunctionType  The type of the mapping function f
 * @tparam     BatchSize     The number of source values per invocation of f
 */
template<typename SequenceType, typename FunctionType, std::size_t BatchSize>
struct batch_mapped_sequence_t
{
    SequenceType sequence;
    FunctionType mapping;
};

template<typename SequenceType, typename FunctionType, std::size_t BatchSize>
struct is_infinite<batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize>> : is_infinite<SequenceType>
{
};

namespace detail {

template<std::size_t BatchSize, typename SequenceType>
auto gather(const SequenceType& sequence, std::optional<position_t<SequenceType>> p)
-> std::optional<std::array<std::optional<position_t<SequenceType>>, BatchSize>>
{
    auto batch = std::array<std::optional<position_t<SequenceType>>, BatchSize>();

    for (std::size_t n = 0; n < BatchSize; ++n)
    {
        if (! p.has_value())
            return {};

        batch[n] = p;

        if (n + 1 < BatchSize)
            p = next(sequence, p.value());
    }
    return batch;
}

template<typename SequenceType, typename FunctionType, typename BatchType, std::size_t... Is>
auto obtain_batch(const SequenceType& sequence, const FunctionType& function, const BatchType& batch, std::index_sequence<Is...>)
{
    return function(obtain(sequence, std::get<Is>(batch).value())...);
}

} // namespace detail

template<typename SequenceType, typename FunctionType, std::size_t BatchSize>
auto start(batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize> sequence)
{
    return detail::gather<BatchSize>(sequence.sequence, start(sequence.sequence));
}

template<typename SequenceType, typename FunctionType, std::size_t BatchSize>
auto next(batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize> sequence, position_t<batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize>> position)
{
    return detail::gather<BatchSize>(sequence.sequence, next(sequence.sequence, position.back().value()));
}

template<typename SequenceType, typename FunctionType, std::size_t BatchSize>
auto obtain(batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize> sequence, position_t<batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize>> position)
{
    return detail::obtain_batch(sequence.sequence, sequence.mapping, position, std::make_index_sequence<BatchSize>());
}




/**
 * @brief      Map a function over a sequence. The batch size is the number of
 *             source values consumed by each invocation of the function, which
 *             must accept that many arguments.
 *
 * @param[in]  sequence      The source sequence
 * @param[in]  function      The mapping function
 *
 * @tparam     BatchSize     The number of arguments taken by the function
 * @tparam     SequenceType  The type of the source sequence
 * @tparam     FunctionType  The type of the function
 *
 * @return     A lazy sequence
 */
template<std::size_t BatchSize = 1, typename SequenceType, typename FunctionType>
auto map(SequenceType sequence, FunctionType function)
{
    static_assert(BatchSize > 0, "seq::map (batch size must be positive)");

    if constexpr (BatchSize == 1)
        return mapped_sequence_t<SequenceType, FunctionType>{sequence, function};
    else
        return batch_mapped_sequence_t<SequenceType, FunctionType, BatchSize>{sequence, function};
}




/**
 * @brief      A sequence containing those values of a source sequence X for
 *             which a predicate f evaluates to false.
 *
 * @tparam     SequenceType  The type of the source sequence X
 * @tparam     FunctionType  The type of the predicate function f
 */
template<typename SequenceType, typename FunctionType>
struct filtered_sequence_t
{
    SequenceType sequence;
    FunctionType predicate;
};

template<typename SequenceType, typename FunctionType>
struct is_infinite<filtered_sequence_t<SequenceType, FunctionType>> : is_infinite<SequenceType>
{
};

namespace detail {

template<typename SequenceType, typename FunctionType>
auto first_kept(const filtered_sequence_t<SequenceType, FunctionType>& sequence, std::optional<position_t<SequenceType>> p)
-> std::optional<position_t<SequenceType>>
{
    while (p.has_value() && sequence.predicate(obtain(sequence.sequence, p.value())))
        p = next(sequence.sequence, p.value());
    return p;
}

} // namespace detail

template<typename SequenceType, typename FunctionType>
auto start(filtered_sequence_t<SequenceType, FunctionType> sequence)
{
    return detail::first_kept(sequence, start(sequence.sequence));
}

template<typename SequenceType, typename FunctionType>
auto next(filtered_sequence_t<SequenceType, FunctionType> sequence, position_t<SequenceType> position)
{
    return detail::first_kept(sequence, next(sequence.sequence, position));
}

template<typename SequenceType, typename FunctionType>
auto obtain(filtered_sequence_t<SequenceType, FunctionType> sequence, position_t<SequenceType> position)
{
    return obtain(sequence.sequence, position);
}

template<typename SequenceType, typename FunctionType>
auto remove_if(SequenceType sequence, FunctionType predicate)
{
    return filtered_sequence_t<SequenceType, FunctionType>{sequence, predicate};
}

template<typename SequenceType, typename FunctionType>
auto keep_if(SequenceType sequence, FunctionType predicate)
{
    return remove_if(sequence, std::not_fn(predicate));
}




/**
 * @brief      A sequence containing those values of a source sequence X
 *             preceding the first element for which a predicate function f
 *             evaluates to false.
 *
 * @tparam     SequenceType  The type of the source sequence X
 * @tparam     FunctionType  The type of the predicate function f
 */
template<typename SequenceType, typename FunctionType>
struct truncated_sequence_t
{
    SequenceType sequence;
    FunctionType predicate;
};

template<typename SequenceType, typename FunctionType>
auto start(truncated_sequence_t<SequenceType, FunctionType> sequence)
-> std::optional<position_t<SequenceType>>
{
    if (auto p = start(sequence.sequence); p.has_value() && sequence.predicate(obtain(sequence.sequence, p.value())))
        return p;
    return {};
}

template<typename SequenceType, typename FunctionType>
auto next(truncated_sequence_t<SequenceType, FunctionType> sequence, position_t<SequenceType> position)
-> std::optional<position_t<SequenceType>>
{
    if (auto p = next(sequence.sequence, position); p.has_value() && sequence.predicate(obtain(sequence.sequence, p.value())))
        return p;
    return {};
}

template<typename SequenceType, typename FunctionType>
auto obtain(truncated_sequence_t<SequenceType, FunctionType> sequence, position_t<SequenceType> position)
{
    return obtain(sequence.sequence, position);
}

template<typename SequenceType, typename FunctionType>
auto take_while(SequenceType sequence, FunctionType predicate)
{
    return truncated_sequence_t<SequenceType, FunctionType>{sequence, predicate};
}




/**
 * @brief      A sequence of the first n values of a source sequence. The
 *             source is never advanced past its n-th value.
 *
 * @tparam     SequenceType  The type of the source sequence
 */
template<typename SequenceType>
struct taken_sequence_t
{
    SequenceType sequence;
    unsigned long count;
};

template<typename SequenceType>
auto start(taken_sequence_t<SequenceType> sequence)
-> std::optional<std::pair<position_t<SequenceType>, unsigned long>>
{
    if (sequence.count == 0)
        return {};
    if (auto p = start(sequence.sequence); p.has_value())
        return std::pair(p.value(), 1ul);
    return {};
}

template<typename SequenceType>
auto next(taken_sequence_t<SequenceType> sequence, std::pair<position_t<SequenceType>, unsigned long> position)
-> std::optional<std::pair<position_t<SequenceType>, unsigned long>>
{
    if (position.second >= sequence.count)
        return {};
    if (auto p = next(sequence.sequence, position.first); p.has_value())
        return std::pair(p.value(), position.second + 1);
    return {};
}

template<typename SequenceType>
auto obtain(taken_sequence_t<SequenceType> sequence, std::pair<position_t<SequenceType>, unsigned long> position)
{
    return obtain(sequence.sequence, position.first);
}

template<typename SequenceType>
auto take(SequenceType sequence, unsigned long count)
{
    return taken_sequence_t<SequenceType>{sequence, count};
}




/**
 * @brief      A sequence of the values of a source sequence after its first n.
 *             Dropping more values than the source holds gives an empty
 *             sequence.
 *
 * @tparam     SequenceType  The type of the source sequence
 */
template<typename SequenceType>
struct dropped_sequence_t
{
    SequenceType sequence;
    unsigned long count;
};

template<typename SequenceType>
struct is_infinite<dropped_sequence_t<SequenceType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType>
auto start(dropped_sequence_t<SequenceType> sequence)
{
    auto p = start(sequence.sequence);

    for (unsigned long n = 0; n < sequence.count && p.has_value(); ++n)
        p = next(sequence.sequence, p.value());

    return p;
}

template<typename SequenceType>
auto next(dropped_sequence_t<SequenceType> sequence, position_t<SequenceType> position)
{
    return next(sequence.sequence, position);
}

template<typename SequenceType>
auto obtain(dropped_sequence_t<SequenceType> sequence, position_t<SequenceType> position)
{
    return obtain(sequence.sequence, position);
}

template<typename SequenceType>
auto drop(SequenceType sequence, unsigned long count)
{
    return dropped_sequence_t<SequenceType>{sequence, count};
}




/**
 * @brief      A sequence that begins at a specified point in a source sequence.
 *
 * @tparam     SequenceType  The type of the source sequence
 */
template<typename SequenceType>
struct advanced_sequence_t
{
    SequenceType sequence;
    std::optional<position_t<SequenceType>> start;
};

template<typename SequenceType>
struct is_infinite<advanced_sequence_t<SequenceType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType>
auto start(advanced_sequence_t<SequenceType> sequence)
{
    return sequence.start;
}

template<typename SequenceType>
auto next(advanced_sequence_t<SequenceType> sequence, position_t<SequenceType> position)
{
    return next(sequence.sequence, position);
}

template<typename SequenceType>
auto obtain(advanced_sequence_t<SequenceType> sequence, position_t<SequenceType> position)
{
    return obtain(sequence.sequence, position);
}

template<typename SequenceType>
auto advance(SequenceType sequence, std::optional<position_t<SequenceType>> position)
{
    return advanced_sequence_t<SequenceType>{sequence, position};
}




/**
 * @brief      A sequence that replays a source sequence count times, or
 *             forever. The source is started again each time it runs out, so
 *             an empty source gives an empty sequence.
 *
 * @tparam     SequenceType  The type of the source sequence
 * @tparam     Forever       Whether the count is ignored
 */
template<typename SequenceType, bool Forever>
struct cycled_sequence_t
{
    SequenceType sequence;
    unsigned long count = 0;
};

template<typename PositionType>
struct cycled_position_t
{
    unsigned long pass;
    PositionType position;
};

template<typename SequenceType, bool Forever>
struct is_infinite<cycled_sequence_t<SequenceType, Forever>>
: std::bool_constant<Forever || is_infinite_v<SequenceType>>
{
};

template<typename SequenceType, bool Forever>
auto start(cycled_sequence_t<SequenceType, Forever> sequence)
-> std::optional<cycled_position_t<position_t<SequenceType>>>
{
    if (! Forever && sequence.count == 0)
        return {};

    if (auto p = start(sequence.sequence); p.has_value())
        return cycled_position_t<position_t<SequenceType>>{0, p.value()};

    return {};
}

template<typename SequenceType, bool Forever>
auto next(cycled_sequence_t<SequenceType, Forever> sequence, cycled_position_t<position_t<SequenceType>> position)
-> std::optional<cycled_position_t<position_t<SequenceType>>>
{
    if (auto q = next(sequence.sequence, position.position); q.has_value())
        return cycled_position_t<position_t<SequenceType>>{position.pass, q.value()};

    if (! Forever && position.pass + 1 == sequence.count)
        return {};

    if (auto p = start(sequence.sequence); p.has_value())
        return cycled_position_t<position_t<SequenceType>>{position.pass + 1, p.value()};

    return {};
}

template<typename SequenceType, bool Forever>
auto obtain(cycled_sequence_t<SequenceType, Forever> sequence, cycled_position_t<position_t<SequenceType>> position)
{
    return obtain(sequence.sequence, position.position);
}




/**
 * @brief      A sequence made by concatenating two source sequences A and B.
 *             The only requirement is that a common type exists for the value
 *             types of A and B.
 *
 * @tparam     SequenceType1  The type of the source sequence A
 * @tparam     SequenceType2  The type of the source sequence B
 */
template<typename SequenceType1, typename SequenceType2>
struct chained_sequence_t
{
    std::pair<SequenceType1, SequenceType2> sequences;
};

template<typename SequenceType1, typename SequenceType2>
struct is_infinite<chained_sequence_t<SequenceType1, SequenceType2>>
: std::bool_constant<is_infinite_v<SequenceType1> || is_infinite_v<SequenceType2>>
{
};

template<typename SequenceType1, typename SequenceType2>
auto start(chained_sequence_t<SequenceType1, SequenceType2> sequence)
{
    return detail::optional_pair_of_either(start(sequence.sequences.first), start(sequence.sequences.second));
}

template<typename SequenceType1, typename SequenceType2>
auto next(chained_sequence_t<SequenceType1, SequenceType2> sequence, position_t<chained_sequence_t<SequenceType1, SequenceType2>> position)
{
    return detail::optional_pair_of_either(
          position.first.has_value() ? next(sequence.sequences.first,  position.first .value()) : position.first,
        ! position.first.has_value() ? next(sequence.sequences.second, position.second.value()) : position.second);
}

template<typename SequenceType1, typename SequenceType2>
auto obtain(chained_sequence_t<SequenceType1, SequenceType2> sequence, position_t<chained_sequence_t<SequenceType1, SequenceType2>> position)
{
    using value_type = typename std::common_type<value_type_t<SequenceType1>, value_type_t<SequenceType2>>::type;

    return position.first.has_value()
    ? value_type(obtain(sequence.sequences.first,  position.first .value()))
    : value_type(obtain(sequence.sequences.second, position.second.value()));
}

template<typename SequenceType1, typename SequenceType2>
auto chain(SequenceType1 sequence1, SequenceType2 sequence2)
{
    return chained_sequence_t<SequenceType1, SequenceType2>{std::pair(sequence1, sequence2)};
}

template<typename SequenceType1, typename SequenceType2, typename... SequenceTypes>
auto chain(SequenceType1 sequence1, SequenceType2 sequence2, SequenceTypes... sequences)
{
    return chain(chain(sequence1, sequence2), sequences...);
}




/**
 * @brief      A sequence containing the tuples {{x, y, ...}} for values (x, y,
 *             ...) in the source sequences (X, Y, ...). The zipped sequence
 *             terminates when any of the source sequences terminates. Zipping
 *             no sequences gives an empty sequence.
 *
 * @tparam     SequenceTypes  The types of the source sequences X, Y, ...
 */
template<typename... SequenceTypes>
struct zipped_sequence_t
{
    std::tuple<SequenceTypes...> sequences;
};

template<typename... SequenceTypes>
struct is_infinite<zipped_sequence_t<SequenceTypes...>>
: std::bool_constant<(sizeof...(SequenceTypes) > 0) && (is_infinite_v<SequenceTypes> && ...)>
{
};

template<typename... SequenceTypes>
auto start(zipped_sequence_t<SequenceTypes...> sequence)
{
    if constexpr (sizeof...(SequenceTypes) == 0)
        return std::optional<std::tuple<>>{};
    else
        return detail::optional_tuple(detail::map(sequence.sequences, [] (auto s) { return start(s); }));
}

template<typename... SequenceTypes>
auto next(zipped_sequence_t<SequenceTypes...> sequence, position_t<zipped_sequence_t<SequenceTypes...>> positions)
{
    return detail::optional_tuple(detail::map(detail::zip_tuples(sequence.sequences, positions), [] (auto sq) {
        return next(std::get<0>(sq), std::get<1>(sq));
    }));
}

template<typename... SequenceTypes>
auto obtain(zipped_sequence_t<SequenceTypes...> sequence, position_t<zipped_sequence_t<SequenceTypes...>> positions)
{
    return detail::map(detail::zip_tuples(sequence.sequences, positions), [] (auto sq) {
        return obtain(std::get<0>(sq), std::get<1>(sq));
    });
}

template<typename SequenceType1, typename SequenceType2>
auto zip(SequenceType1 sequence1, SequenceType2 sequence2)
{
    return map(zipped_sequence_t<SequenceType1, SequenceType2>{{sequence1, sequence2}}, [] (auto t) {
        return std::pair(std::get<0>(t), std::get<1>(t));
    });
}

template<typename... SequenceTypes>
auto zip(SequenceTypes... sequences)
{
    return zipped_sequence_t<SequenceTypes...>{{sequences...}};
}




/**
 * @brief      A sequence that takes one value from each of the source sequences
 *             in turn, {x0, y0, z0, x1, y1, z1, ...}. Unlike zip, it continues
 *             until every source is exhausted, skipping the sources that have
 *             ended.
 *
 * @tparam     SequenceTypes  The types of the source sequences
 */
template<typename... SequenceTypes>
struct roundrobin_sequence_t
{
    std::tuple<SequenceTypes...> sequences;
};

template<typename... SequenceTypes>
struct roundrobin_position_t
{
    std::tuple<std::optional<position_t<SequenceTypes>>...> cursors;
    std::size_t current;
};

template<typename... SequenceTypes>
struct is_infinite<roundrobin_sequence_t<SequenceTypes...>> : std::bool_constant<(is_infinite_v<SequenceTypes> || ...)>
{
};

template<typename... SequenceTypes>
auto start(roundrobin_sequence_t<SequenceTypes...> sequence)
-> std::optional<roundrobin_position_t<SequenceTypes...>>
{
    auto cursors = std::apply([] (const auto&... s) { return std::tuple(start(s)...); }, sequence.sequences);

    if (auto current = detail::first_engaged(cursors, 0); current.has_value())
        return roundrobin_position_t<SequenceTypes...>{cursors, current.value()};
    return {};
}

template<typename... SequenceTypes>
auto next(roundrobin_sequence_t<SequenceTypes...> sequence, roundrobin_position_t<SequenceTypes...> position)
-> std::optional<roundrobin_position_t<SequenceTypes...>>
{
    detail::visit_index(position.current, [&] (auto I)
    {
        auto& cursor = std::get<decltype(I)::value>(position.cursors);
        cursor = next(std::get<decltype(I)::value>(sequence.sequences), cursor.value());
    }, std::index_sequence_for<SequenceTypes...>());

    if (auto current = detail::first_engaged(position.cursors, position.current + 1); current.has_value())
        return roundrobin_position_t<SequenceTypes...>{position.cursors, current.value()};
    return {};
}

template<typename... SequenceTypes>
auto obtain(roundrobin_sequence_t<SequenceTypes...> sequence, roundrobin_position_t<SequenceTypes...> position)
{
    using value_type = std::common_type_t<value_type_t<SequenceTypes>...>;
    auto result = std::optional<value_type>();

    detail::visit_index(position.current, [&] (auto I)
    {
        auto cursor = std::get<decltype(I)::value>(position.cursors).value();
        result = value_type(obtain(std::get<decltype(I)::value>(sequence.sequences), cursor));
    }, std::index_sequence_for<SequenceTypes...>());

    return result.value();
}

template<typename... SequenceTypes>
auto roundrobin(SequenceTypes... sequences)
{
    static_assert(sizeof...(SequenceTypes) > 0, "seq::roundrobin (needs at least one sequence)");
    return roundrobin_sequence_t<SequenceTypes...>{{sequences...}};
}




/**
 * @brief      A sequence made by flattening a sequence of sequences by one
 *             level. Empty inner sequences are skipped. Each inner sequence is
 *             obtained from the outer sequence once, and is shared by the
 *             positions that visit its values.
 *
 * @tparam     SequenceType  The type of the outer sequence.
 */
template<typename SequenceType>
struct flattened_sequence_t
{
    SequenceType sequence;
};

template<typename SequenceType>
struct flattened_position_t
{
    position_t<SequenceType> outer;
    std::shared_ptr<const value_type_t<SequenceType>> inner_sequence;
    position_t<value_type_t<SequenceType>> inner;
};

template<typename SequenceType>
struct is_infinite<flattened_sequence_t<SequenceType>>
: std::bool_constant<is_infinite_v<SequenceType> || is_infinite_v<value_type_t<SequenceType>>>
{
};

namespace detail {

template<typename SequenceType>
auto first_non_empty(const SequenceType& outer, std::optional<position_t<SequenceType>> p)
-> std::optional<flattened_position_t<SequenceType>>
{
    while (p.has_value())
    {
        auto inner_sequence = std::make_shared<const value_type_t<SequenceType>>(obtain(outer, p.value()));

        if (auto q = start(*inner_sequence); q.has_value())
            return flattened_position_t<SequenceType>{p.value(), inner_sequence, q.value()};

        p = next(outer, p.value());
    }
    return {};
}

} // namespace detail

template<typename SequenceType>
auto start(flattened_sequence_t<SequenceType> sequence)
{
    return detail::first_non_empty(sequence.sequence, start(sequence.sequence));
}

template<typename SequenceType>
auto next(flattened_sequence_t<SequenceType> sequence, flattened_position_t<SequenceType> position)
-> std::optional<flattened_position_t<SequenceType>>
{
    if (auto q = next(*position.inner_sequence, position.inner); q.has_value())
        return flattened_position_t<SequenceType>{position.outer, position.inner_sequence, q.value()};

    return detail::first_non_empty(sequence.sequence, next(sequence.sequence, position.outer));
}

template<typename SequenceType>
auto obtain(flattened_sequence_t<SequenceType> sequence, flattened_position_t<SequenceType> position)
{
    return obtain(*position.inner_sequence, position.inner);
}




/**
 * @brief      Flatten a sequence recursively: as long as the values are
 *             themselves sequences, they are inlined into the result. Values
 *             that are not sequences (including seq::item_t wrappers and
 *             standard containers held by value) are left as they are, so
 *             flattening a sequence of scalars gives the same sequence.
 *
 * @param[in]  sequence      The sequence to flatten
 *
 * @tparam     SequenceType  The type of the sequence
 *
 * @return     A lazy sequence whose value type is not a sequence
 */
template<typename SequenceType>
auto flat(SequenceType sequence)
{
    if constexpr (is_sequence_v<value_type_t<SequenceType>>)
        return flat(flattened_sequence_t<SequenceType>{std::move(sequence)});
    else
        return sequence;
}




/**
 * @brief      A sequence implementing a scan operation. Behaves like
 *             Haskell's scanl:
 *
 *             scan(A, b, f) = {b, f(b, a0), f(f(b, a0), a1), ...}
 *
 * @tparam     A     The type of sequence being scanned
 * @tparam     B     The type of the starting value (and return type of the
 *                   reducer)
 * @tparam     C     The type of the reducer function
 */
template<typename A, typename B, typename C>
struct scanned_sequence_t
{
    A sequence;
    B start;
    C reducer;
};

template<typename A, typename B, typename C>
struct is_infinite<scanned_sequence_t<A, B, C>> : is_infinite<A>
{
};

template<typename A, typename B, typename C>
auto start(scanned_sequence_t<A, B, C> sequence)
{
    return std::optional(std::pair(sequence.start, start(sequence.sequence)));
}

template<typename A, typename B, typename C>
auto next(scanned_sequence_t<A, B, C> sequence, position_t<scanned_sequence_t<A, B, C>> position)
-> std::optional<position_t<scanned_sequence_t<A, B, C>>>
{
    if (auto q = position.second; q.has_value())
    {
        auto b = obtain(sequence, position);
        auto a = obtain(sequence.sequence, q.value());
        return std::pair(sequence.reducer(b, a), next(sequence.sequence, q.value()));
    }
    return {};
}

template<typename A, typename B, typename C>
auto obtain(scanned_sequence_t<A, B, C> sequence, position_t<scanned_sequence_t<A, B, C>> position)
{
    return position.first;
}

template<typename A, typename B, typename C>
auto scan(A sequence, B start, C reducer)
{
    static_assert(std::is_same_v<std::invoke_result_t<C, B, value_type_t<A>>, B>,
        "The reducer of a scan operation over an event sequence [a] "
        "with start value type b must be (b, a) -> b");
    return scanned_sequence_t<A, B, C>{sequence, start, reducer};
}




/**
 * @brief      A triangular reduction: the sequence of partial left folds
 *             {a0, f(a0, a1), f(f(a0, a1), a2), ...}. It is empty if the
 *             source is.
 *
 * @tparam     SequenceType  The type of the source sequence
 * @tparam     FunctionType  The type of the reducer (a, a) -> a
 */
template<typename SequenceType, typename FunctionType>
struct produced_sequence_t
{
    SequenceType sequence;
    FunctionType reducer;
};

template<typename SequenceType, typename FunctionType>
struct is_infinite<produced_sequence_t<SequenceType, FunctionType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType, typename FunctionType>
auto start(produced_sequence_t<SequenceType, FunctionType> sequence)
-> std::optional<std::pair<value_type_t<SequenceType>, position_t<SequenceType>>>
{
    if (auto p = start(sequence.sequence); p.has_value())
        return std::pair(obtain(sequence.sequence, p.value()), p.value());
    return {};
}

template<typename SequenceType, typename FunctionType>
auto next(produced_sequence_t<SequenceType, FunctionType> sequence, std::pair<value_type_t<SequenceType>, position_t<SequenceType>> position)
-> std::optional<std::pair<value_type_t<SequenceType>, position_t<SequenceType>>>
{
    if (auto q = next(sequence.sequence, position.second); q.has_value())
        return std::pair(value_type_t<SequenceType>(sequence.reducer(position.first, obtain(sequence.sequence, q.value()))), q.value());
    return {};
}

template<typename SequenceType, typename FunctionType>
auto obtain(produced_sequence_t<SequenceType, FunctionType> sequence, std::pair<value_type_t<SequenceType>, position_t<SequenceType>> position)
{
    return position.first;
}

template<typename SequenceType, typename FunctionType>
auto produce(SequenceType sequence, FunctionType reducer)
{
    return produced_sequence_t<SequenceType, FunctionType>{sequence, reducer};
}




/**
 * @brief      A sequence that adapts any data structure implementing the
 *             sequence protocol to a proper sequence. This technique trivially
 *             wraps this foreign sequence's start, next, and obtain methods,
 *             such that the structure is effectively imported into the seq
 *             namespace. Doing this enables argument-dependent-lookup (ADL) to
 *             find the sequence operators without prefixing the seq namespace,
 *             most importantly the begin and end begin functions, making the
 *             foreign struct iterable via range-based for-loop.
 *
 * @tparam     SequenceType  The type of the data structure implementing the
 *                           sequence protocol
 */
template<typename SequenceType>
struct foreign_sequence_t
{
    SequenceType sequence;
};

template<typename SequenceType>
struct is_infinite<foreign_sequence_t<SequenceType>> : is_infinite<SequenceType>
{
};

template<typename SequenceType>
auto start(foreign_sequence_t<SequenceType> sequence)
{
    return start(sequence.sequence);
}

template<typename SequenceType>
auto next(foreign_sequence_t<SequenceType> sequence, position_t<SequenceType> position)
{
    return next(sequence.sequence, position);
}

template<typename SequenceType>
auto obtain(foreign_sequence_t<SequenceType> sequence, position_t<SequenceType> position)
{
    return obtain(sequence.sequence, position);
}

template<typename SequenceType>
auto adapt(SequenceType sequence)
{
    return foreign_sequence_t<SequenceType>{sequence};
}




//=============================================================================
template<typename ContainerType>
struct container_sequence_t
{
    std::shared_ptr<ContainerType> container;
};

template<typename ContainerType>
auto start(container_sequence_t<ContainerType> sequence)
{
    const auto& c = *sequence.container;
    return std::empty(c)
    ? std::optional<decltype(std::begin(c))>{}
    : std::optional<decltype(std::begin(c))>{std::begin(c)};
}

template<typename ContainerType>
auto next(container_sequence_t<ContainerType> sequence, position_t<container_sequence_t<ContainerType>> position)
{
    ++position;
    const auto& c = *sequence.container;
    return position == std::end(c)
    ? std::optional<position_t<container_sequence_t<ContainerType>>>{}
    : std::optional<position_t<container_sequence_t<ContainerType>>>{position};
}

template<typename ContainerType>
auto obtain(container_sequence_t<ContainerType> sequence, position_t<container_sequence_t<ContainerType>> position)
{
    return *position;
}

template<typename ContainerType>
auto view(ContainerType container)
{
    return container_sequence_t<ContainerType>{std::make_shared<ContainerType>(std::move(container))};
}

template<typename ContainerType>
auto share(std::shared_ptr<ContainerType> container)
{
    return container_sequence_t<ContainerType>{std::move(container)};
}




//=============================================================================
template<typename ValueType>
struct dynamic_sequence_t
{
    struct base
    {
        virtual ~base() {}
        virtual std::optional<std::any> next(std::any) const = 0;
        virtual std::optional<std::any> start() const = 0;
        virtual ValueType obtain(std::any) const = 0;
    };
    std::shared_ptr<base> impl;
};

template<typename ValueType>
auto start(dynamic_sequence_t<ValueType> sequence)
{
    return sequence.impl->start();
}

template<typename ValueType>
auto next(dynamic_sequence_t<ValueType> sequence, std::any position)
{
    return sequence.impl->next(position);
}

template<typename ValueType>
ValueType obtain(dynamic_sequence_t<ValueType> sequence, std::any position)
{
    return sequence.impl->obtain(position);
}

template<typename SequenceType>
auto to_dynamic(SequenceType sequence)
{
    using value_type = value_type_t<SequenceType>;
    using position_type = position_t<SequenceType>;

    struct dynamic_sequence_impl : dynamic_sequence_t<value_type>::base
    {
        dynamic_sequence_impl(SequenceType sequence) : sequence(sequence) {}
        std::optional<std::any> next(std::any position) const override { return detail::optional_any(seq::next(sequence, std::any_cast<position_type>(position))); }
        std::optional<std::any> start()                 const override { return detail::optional_any(seq::start(sequence)); }
        value_type obtain(std::any position)            const override { return seq::obtain(sequence, std::any_cast<position_type>(position)); }
        SequenceType sequence;
    };
    return dynamic_sequence_t<value_type>{std::make_shared<dynamic_sequence_impl>(sequence)};
}




//=============================================================================
template<typename SequenceType>
auto front(SequenceType sequence)
{
    return obtain(sequence, start(sequence).value());
}

template<typename SequenceType>
auto back(SequenceType sequence)
{
    detail::require_finite<SequenceType>("seq::back");

    auto position = start(sequence).value();

    while (true)
        if (auto p = next(sequence, position); ! p.has_value())
            break;
        else
            position = p.value();

    return obtain(sequence, position);
}

template<typename SequenceType>
auto enumerate(SequenceType sequence)
{
    return zip(generate(), sequence);
}

template<typename SequenceType>
auto head(SequenceType sequence, unsigned long count)
{
    return take(sequence, count);
}

template<typename SequenceType>
auto skip(SequenceType sequence, unsigned long count)
{
    return drop(sequence, count);
}

inline auto range(unsigned long count)
{
    return take(generate(0), count);
}

inline auto range(long start, long final)
{
    if (final < start)
        throw std::invalid_argument("seq::range (final must be >= start)");
    return take(generate(start), final - start);
}

template<typename... ValueType>
auto from(ValueType... values)
{
    return view(std::array{values...});
}

template<template<typename...> typename ContainerType, typename SequenceType>
auto to(SequenceType sequence)
{
    detail::require_finite<SequenceType>("seq::to");
    return ContainerType<value_type_t<SequenceType>>(begin(sequence), end(sequence));
}

template<typename ValueType>
auto always(ValueType value)
{
    return generate(value, [] (auto v) { return v; });
}

template<typename ValueType>
auto just(ValueType value)
{
    return take(always(value), 1);
}

template<typename SequenceType>
auto cycle(SequenceType sequence)
{
    return cycled_sequence_t<SequenceType, true>{sequence};
}

template<typename SequenceType>
auto repeat(SequenceType sequence, unsigned long count)
{
    return cycled_sequence_t<SequenceType, false>{sequence, count};
}

template<typename SequenceType, typename FunctionType>
auto flat_map(SequenceType sequence, FunctionType function)
{
    return flat(map(sequence, function));
}





/**
 * @brief      The pairs (i, a_i) of a sequence, where i is the zero-based
 *             index counted from the start of the sequence.
 */
template<typename SequenceType>
auto pairs(SequenceType sequence)
{
    return enumerate(sequence);
}

template<typename SequenceType>
auto keys(SequenceType sequence)
{
    return map(pairs(sequence), [] (auto iv) { return iv.first; });
}

template<typename SequenceType>
auto antipairs(SequenceType sequence)
{
    return map(pairs(sequence), [] (auto iv) { return std::pair(iv.second, iv.first); });
}

/**
 * @brief      Alternating index and value {0, a0, 1, a1, ...}, each held in a
 *             variant whose first alternative is the index.
 */
template<typename ValueType>
using key_or_value_t = std::variant<long, ValueType>;

template<typename SequenceType>
auto kv(SequenceType sequence)
{
    using value_type = key_or_value_t<value_type_t<SequenceType>>;

    return flat_map(pairs(sequence), [] (auto iv)
    {
        return from(
            value_type(std::in_place_index<0>, iv.first),
            value_type(std::in_place_index<1>, iv.second));
    });
}




/**
 * @brief      Return windowed pairs of the sequence A:
 *
 *             {(a0, a1), (a1, a2), ...}
 *
 * @param[in]  sequence      The source sequence A, having at least two values
 *
 * @tparam     SequenceType  The type of the source sequence A
 *
 * @return     A sequence of pairs
 */
template<typename SequenceType>
auto window(SequenceType sequence)
{
    auto p0 = start(sequence);
    auto p1 = p0.has_value() ? next(sequence, p0.value()) : p0;

    if (! p1.has_value())
        throw std::invalid_argument("seq::window (sequence has fewer than two values)");

    auto a0 = obtain(sequence, p0.value());
    auto a1 = obtain(sequence, p1.value());
    auto A2 = advance(sequence, next(sequence, p1.value()));

    return scan(A2, std::pair(a0, a1), [] (auto last_two, auto next_value)
    {
        return std::pair(last_two.second, next_value);
    });
}




namespace detail {

/**
 * Return the values of a finite sequence in a shared vector, reusing the
 * storage of a sequence that is already a vector view.
 */
template<typename SequenceType>
auto shared_values(SequenceType sequence)
{
    detail::require_finite<SequenceType>("seq::shared_values");
    return std::make_shared<const std::vector<value_type_t<SequenceType>>>(to<std::vector>(sequence));
}

template<typename ValueType>
auto shared_values(container_sequence_t<std::vector<ValueType>> sequence)
{
    return std::shared_ptr<const std::vector<ValueType>>(sequence.container);
}

} // namespace detail




//=============================================================================
template<typename SequenceType, typename OperatorType>
auto operator|(SequenceType&& sequence, OperatorType&& op)
{
    return std::forward<OperatorType>(op)(std::forward<SequenceType>(sequence));
}

template<typename T, typename F> auto scan(T b, F f) { return [=] (auto s) { return scan(s, b, f); }; }
template<std::size_t N = 1, typename F> auto map(F f) { return [f] (auto s) { return map<N>(s, f); }; }
template<typename F> auto take_while(F f)  { return [f] (auto s) { return take_while(s, f); }; }
template<typename F> auto remove_if (F f)  { return [f] (auto s) { return remove_if (s, f); }; }
template<typename F> auto keep_if   (F f)  { return [f] (auto s) { return keep_if   (s, f); }; }
template<typename F> auto flat_map  (F f)  { return [f] (auto s) { return flat_map  (s, f); }; }
template<typename F> auto produce   (F f)  { return [f] (auto s) { return produce   (s, f); }; }

inline auto flat  ()                { return [ ] (auto s) { return flat  (s); }; }
inline auto cycle ()                { return [ ] (auto s) { return cycle (s); }; }
inline auto window()                { return [ ] (auto s) { return window(s); }; }
inline auto pairs ()                { return [ ] (auto s) { return pairs (s); }; }
inline auto kv    ()                { return [ ] (auto s) { return kv    (s); }; }
inline auto take  (unsigned long c) { return [c] (auto s) { return take  (s, c); }; }
inline auto drop  (unsigned long c) { return [c] (auto s) { return drop  (s, c); }; }
inline auto head  (unsigned long c) { return [c] (auto s) { return take  (s, c); }; }
inline auto skip  (unsigned long c) { return [c] (auto s) { return drop  (s, c); }; }
inline auto repeat(unsigned long c) { return [c] (auto s) { return repeat(s, c); }; }

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <string>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence()
{
    require((seq::to<std::basic_string>(seq::view(std::string("tree"))) == std::string("tree")));
    require((seq::to<std::vector>(seq::from(1, 2, 3)) == std::vector{1, 2, 3}));
    require((seq::to<std::vector>(take(cycle(seq::from(1, 2)), 4)) == std::vector{1, 2, 1, 2}));
    require((seq::to<std::vector>(take(cycle(seq::range(3)), 7)) == std::vector<long>{0, 1, 2, 0, 1, 2, 0}));
    require(empty(cycle(seq::range(0))));
    require(empty(seq::repeat(seq::from(1), 0)));
    require((seq::to<std::vector>(seq::range(2) | seq::repeat(3)) == std::vector<long>{0, 1, 0, 1, 0, 1}));
    require((seq::to<std::vector>(seq::repeat(map(seq::from(1, 2), [] (int i) { return 2 * i; }), 2)) == std::vector{2, 4, 2, 4}));
    require((seq::to<std::vector>(take(seq::always('x'), 2)) == std::vector{'x', 'x'}));
    require((seq::to<std::vector>(seq::just(3)) == std::vector{3}));
    require((seq::to<std::vector>(flat(map(seq::range(4), [] (auto i) { return seq::range(i); }))) == std::vector<long>{0, 0, 1, 0, 1, 2}));
    require((seq::to<std::vector>(drop(seq::range(5, 10), 2)) == std::vector{7l, 8l, 9l}));
    require((seq::to<std::vector>(scan(seq::from(4, 2, 4), 64.0, std::divides<>())) == std::vector{64., 16., 8., 2.}));
    require((seq::to<std::vector>(window(seq::from(1, 2, 3, 4))) == std::vector{std::pair(1, 2), std::pair(2, 3), std::pair(3, 4)}));
    require_throws(window(seq::from(1)));

    // dropping past the end is empty rather than an error
    require(empty(drop(seq::range(3), 10)));
    require(empty(take(seq::generate(), 0)));
    require(seq::to<std::vector>(seq::range(0l, 3l)).size() == 3);
    require_throws(seq::range(0l, -1l));

    // take never advances the source beyond its last value
    auto pulls = std::make_shared<int>(0);
    auto counted = seq::generate(0l, [pulls] (long i) { ++*pulls; return i + 1; });
    require((seq::to<std::vector>(take(counted, 3)) == std::vector{0l, 1l, 2l}));
    require(*pulls == 2);

    // map with an explicit batch size pulls that many values per call
    auto sums = seq::map<2>(seq::from(1, 2, 3, 4, 5), [] (int a, int b) { return a + b; });
    require((seq::to<std::vector>(sums) == std::vector{3, 7}));
    require((seq::to<std::vector>(seq::range(9) | seq::map<3>([] (long a, long b, long c) { return a * b * c; })) == std::vector{0l, 60l, 336l}));
    require(empty(seq::map<4>(seq::from(1, 2, 3), [] (int, int, int, int) { return 0; })));

    // a throwing callback runs only when its value is pulled, and its
    // exception reaches the caller unchanged
    auto raises_range_error = [] (auto f)
    {
        try { f(); }
        catch (const std::range_error&) { return true; }
        catch (const std::exception&) { return false; }
        return false;
    };
    auto fragile = map(seq::range(5), [] (long i) { if (i == 3) throw std::range_error("three"); return i; });
    require(front(fragile) == 0);
    require((seq::to<std::vector>(take(fragile, 3)) == std::vector{0l, 1l, 2l}));
    require(raises_range_error([fragile] { seq::to<std::vector>(fragile); }));
    require(raises_range_error([fragile] { seq::to<std::vector>(fragile | seq::skip(2)); }));

    // map treats a nested sequence as a single value; flat inlines it
    auto nested = map(seq::range(3), [] (long i) { return seq::range(i + 1); });
    require(seq::to<std::vector>(nested).size() == 3);
    require((seq::to<std::vector>(flat(nested)) == std::vector<long>{0, 0, 1, 0, 1, 2}));
    require((seq::to<std::vector>(flat(seq::from(1, 2))) == std::vector{1, 2}));

    auto deep = map(seq::range(2), [] (long i) { return map(seq::range(2), [i] (long j) { return seq::from(i, j); }); });
    require((seq::to<std::vector>(flat(deep)) == std::vector<long>{0, 0, 0, 1, 1, 0, 1, 1}));
    require((seq::to<std::vector>(flat_map(seq::range(3), [] (long i) { return seq::range(i); })) == std::vector<long>{0, 0, 1}));

    // a standard container held by value is itemized, and is not inlined
    auto vectors = map(seq::range(2), [] (long i) { return std::vector<long>{i, i}; });
    require((seq::to<std::vector>(flat(vectors)) == std::vector<std::vector<long>>{{0, 0}, {1, 1}}));

    require((seq::to<std::vector>(zip(seq::from(1, 2, 3), seq::from(4, 5))) == std::vector{std::pair(1, 4), std::pair(2, 5)}));
    require(empty(seq::zip()));
    require((seq::to<std::vector>(seq::roundrobin(seq::from(1, 2, 3), seq::from(4, 5))) == std::vector{1, 4, 2, 5, 3}));
    require((seq::to<std::vector>(seq::roundrobin(seq::from(1), seq::range(0), seq::from(7l, 8l, 9l))) == std::vector<long>{1, 7, 8, 9}));
    require((seq::to<std::vector>(chain(seq::from(1, 2), seq::from(3), seq::from(4, 5))) == std::vector{1, 2, 3, 4, 5}));

    require((seq::to<std::vector>(seq::pairs(seq::from('a', 'b'))) == std::vector{std::pair(0l, 'a'), std::pair(1l, 'b')}));
    require((seq::to<std::vector>(seq::keys(seq::from('a', 'b', 'c'))) == std::vector{0l, 1l, 2l}));
    require((seq::to<std::vector>(seq::antipairs(seq::from('a'))) == std::vector{std::pair('a', 0l)}));

    auto kv = seq::to<std::vector>(seq::kv(seq::from(7, 8)));
    require(kv.size() == 4);
    require(std::get<0>(kv[0]) == 0 && std::get<1>(kv[1]) == 7);
    require(std::get<0>(kv[2]) == 1 && std::get<1>(kv[3]) == 8);

    require((seq::to<std::vector>(seq::produce(seq::from(1, 2, 3, 4), std::plus<>())) == std::vector{1, 3, 6, 10}));
    require(empty(seq::produce(seq::range(0), std::plus<>())));

    require(  seq::is_infinite_v<decltype(seq::generate())>);
    require(  seq::is_infinite_v<decltype(seq::cycle(seq::from(1)))>);
    require(! seq::is_infinite_v<decltype(seq::repeat(seq::from(1), 2))>);
    auto naturals = map(seq::generate(), [] (long i) { return i; });
    require(  seq::is_infinite_v<decltype(naturals)>);
    auto small = take_while(naturals, [] (long i) { return i < 4; }) | seq::skip(1);
    require(! seq::is_infinite_v<decltype(small)>);
    require((seq::to<std::vector>(small) == std::vector{1l, 2l, 3l}));
    require(! seq::is_infinite_v<decltype(seq::range(10))>);
    require(! seq::is_infinite_v<decltype(seq::zip())>);
    require(  seq::is_sequence_v<decltype(seq::range(10))>);
    require(! seq::is_sequence_v<int>);
    require(! seq::is_sequence_v<std::vector<int>>);

    auto dynamic = seq::to_dynamic(map(seq::range(3), [] (long i) { return double(i) / 2; }));
    require((seq::to<std::vector>(dynamic) == std::vector{0.0, 0.5, 1.0}));
    require((seq::to<std::vector>(seq::range(5) | seq::skip(1) | seq::head(2)) == std::vector{1l, 2l}));
}

#endif // DO_UNIT_TESTS
