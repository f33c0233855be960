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
#include <functional>
#include <map>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>
#include "core_sequence.hpp"




//=============================================================================
namespace seq {




//=============================================================================
enum class order { less = -1, same = 0, more = 1 };




/**
 * @brief      Generalized three-way comparison. Sequences are compared
 *             lexicographically, value by value; everything else is compared
 *             with operator<.
 */
template<typename T, typename U>
order cmp(const T& a, const U& b)
{
    if constexpr (is_sequence_v<T> && is_sequence_v<U>)
    {
        auto p = start(a);
        auto q = start(b);

        while (p.has_value() && q.has_value())
        {
            if (auto c = cmp(obtain(a, p.value()), obtain(b, q.value())); c != order::same)
                return c;

            p = next(a, p.value());
            q = next(b, q.value());
        }
        return p.has_value() ? order::more : q.has_value() ? order::less : order::same;
    }
    else
    {
        return a < b ? order::less : b < a ? order::more : order::same;
    }
}




/**
 * @brief      The identity element of a binary operator over T, where one is
 *             known. Specializations provide a static function value(op).
 *             Reducing an empty sequence gives the identity of the reducer, or
 *             is an error if the reducer has none.
 *
 * @tparam     OperatorType  The type of the binary operator
 * @tparam     T             The type of the values being reduced
 */
template<typename OperatorType, typename T, typename = void>
struct identity_element
{
};

template<typename U, typename T>
struct identity_element<std::plus<U>, T>
{
    static T value(const std::plus<U>&) { return T(); }
};

template<typename U, typename T>
struct identity_element<std::multiplies<U>, T, std::enable_if_t<std::is_arithmetic_v<T>>>
{
    static T value(const std::multiplies<U>&) { return T(1); }
};

template<typename U, typename T>
struct identity_element<std::logical_and<U>, T>
{
    static T value(const std::logical_and<U>&) { return T(true); }
};

template<typename U, typename T>
struct identity_element<std::logical_or<U>, T>
{
    static T value(const std::logical_or<U>&) { return T(false); }
};

template<typename U, typename T>
struct identity_element<std::bit_and<U>, T, std::enable_if_t<std::is_integral_v<T>>>
{
    static T value(const std::bit_and<U>&) { return T(~T(0)); }
};

template<typename U, typename T>
struct identity_element<std::bit_or<U>, T, std::enable_if_t<std::is_integral_v<T>>>
{
    static T value(const std::bit_or<U>&) { return T(0); }
};

template<typename U, typename T>
struct identity_element<std::bit_xor<U>, T, std::enable_if_t<std::is_integral_v<T>>>
{
    static T value(const std::bit_xor<U>&) { return T(0); }
};




/**
 * @brief      A binary operator decorated with an identity element.
 */
template<typename FunctionType, typename IdentityType>
struct identified_t
{
    template<typename A, typename B>
    auto operator()(A&& a, B&& b) const
    {
        return function(std::forward<A>(a), std::forward<B>(b));
    }
    FunctionType function;
    IdentityType identity;
};

template<typename FunctionType, typename IdentityType, typename T>
struct identity_element<identified_t<FunctionType, IdentityType>, T>
{
    static T value(const identified_t<FunctionType, IdentityType>& op) { return T(op.identity); }
};

template<typename FunctionType, typename IdentityType>
auto with_identity(FunctionType function, IdentityType identity)
{
    return identified_t<FunctionType, IdentityType>{function, identity};
}

template<typename OperatorType, typename T, typename = void>
struct has_identity : std::false_type {};

template<typename OperatorType, typename T>
struct has_identity<OperatorType, T, std::void_t<decltype(identity_element<OperatorType, T>::value(std::declval<const OperatorType&>()))>> : std::true_type {};




//=============================================================================
enum class flow { proceed, skip, stop, retry };

/**
 * @brief      The result of a reducer that steers the reduction. proceed
 *             accepts the value and moves on; skip discards this step; stop
 *             ends the reduction, with the value if one is given; retry
 *             applies the reducer again to the same element, after accepting
 *             the value if one is given.
 */
template<typename T>
struct step_t
{
    flow action;
    std::optional<T> value;
};

template<typename T> step_t<T> proceed(T value) { return {flow::proceed, std::move(value)}; }
template<typename T> step_t<T> stop(T value)    { return {flow::stop, std::move(value)}; }
template<typename T> step_t<T> retry(T value)   { return {flow::retry, std::move(value)}; }
template<typename T> step_t<T> skip()           { return {flow::skip, {}}; }
template<typename T> step_t<T> stop()           { return {flow::stop, {}}; }

namespace detail {

template<typename T> struct is_step : std::false_type {};
template<typename T> struct is_step<step_t<T>> : std::true_type {};

} // namespace detail




/**
 * @brief      Left-fold a sequence with a binary operator. A single value is
 *             returned without calling the operator. The reducer may return a
 *             value, or a step_t to control the loop.
 *
 * @param[in]  sequence      The sequence to reduce
 * @param[in]  reducer       The binary operator
 *
 * @return     The reduced value
 *
 * @note       Throws std::invalid_argument if the sequence is empty and the
 *             reducer has no identity element.
 */
template<typename SequenceType, typename FunctionType>
auto reduce(SequenceType sequence, FunctionType reducer)
{
    using value_type = value_type_t<SequenceType>;

    auto p = start(sequence);

    if (! p.has_value())
    {
        if constexpr (has_identity<FunctionType, value_type>::value)
            return identity_element<FunctionType, value_type>::value(reducer);
        else
            throw std::invalid_argument("seq::reduce (empty sequence and the operator has no identity)");
    }

    auto result = value_type(obtain(sequence, p.value()));
    p = next(sequence, p.value());

    while (p.has_value())
    {
        auto r = reducer(result, obtain(sequence, p.value()));

        if constexpr (detail::is_step<decltype(r)>::value)
        {
            if (r.value.has_value() && r.action != flow::skip)
                result = value_type(r.value.value());

            switch (r.action)
            {
                case flow::proceed: p = next(sequence, p.value()); break;
                case flow::skip:    p = next(sequence, p.value()); break;
                case flow::stop:    return result;
                case flow::retry:   break;
            }
        }
        else
        {
            result = value_type(r);
            p = next(sequence, p.value());
        }
    }
    return result;
}

template<typename SequenceType>
auto sum(SequenceType sequence)
{
    return reduce(sequence, std::plus<>());
}




//=============================================================================
template<typename SequenceType>
auto min(SequenceType sequence)
{
    auto result = std::optional<value_type_t<SequenceType>>();

    for (auto value : sequence)
        if (! result.has_value() || cmp(value, result.value()) == order::less)
            result = value;

    return result;
}

template<typename SequenceType>
auto max(SequenceType sequence)
{
    auto result = std::optional<value_type_t<SequenceType>>();

    for (auto value : sequence)
        if (! result.has_value() || cmp(value, result.value()) == order::more)
            result = value;

    return result;
}

template<typename SequenceType>
auto minmax(SequenceType sequence)
{
    using value_type = value_type_t<SequenceType>;
    auto result = std::optional<std::pair<value_type, value_type>>();

    for (auto value : sequence)
    {
        if (! result.has_value())
            result = std::pair(value, value);
        else if (cmp(value, result->first) == order::less)
            result->first = value;
        else if (cmp(value, result->second) == order::more)
            result->second = value;
    }
    return result;
}

template<typename SequenceType>
unsigned long elems(SequenceType sequence)
{
    detail::require_finite<SequenceType>("seq::elems");

    auto count = 0ul;

    for (auto p = start(sequence); p.has_value(); p = next(sequence, p.value()))
        ++count;

    return count;
}

template<typename SequenceType>
auto tail(SequenceType sequence, unsigned long count)
{
    detail::require_finite<SequenceType>("seq::tail");

    auto values = to<std::vector>(sequence);
    values.erase(values.begin(), values.end() - std::min<std::size_t>(count, values.size()));
    return view(std::move(values));
}

template<typename SequenceType>
auto reverse(SequenceType sequence)
{
    detail::require_finite<SequenceType>("seq::reverse");

    auto values = to<std::vector>(sequence);
    std::reverse(values.begin(), values.end());
    return view(std::move(values));
}




/**
 * @brief      Stable sort of a finite sequence. A binary by is the comparator,
 *             returning either bool (less than) or seq::order. A unary by
 *             extracts a key, which is computed once per value and compared
 *             with seq::cmp.
 *
 * @param[in]  sequence      The sequence to sort
 * @param[in]  by            The comparator or key extractor
 *
 * @return     A sequence viewing the sorted values
 */
template<typename SequenceType, typename ByType>
auto sort(SequenceType sequence, ByType by)
{
    detail::require_finite<SequenceType>("seq::sort");

    using value_type = value_type_t<SequenceType>;
    auto values = to<std::vector>(sequence);

    if constexpr (std::is_invocable_v<ByType, const value_type&, const value_type&>)
    {
        std::stable_sort(values.begin(), values.end(), [by] (const value_type& a, const value_type& b)
        {
            auto r = by(a, b);

            if constexpr (std::is_same_v<decltype(r), order>)
                return r == order::less;
            else
                return bool(r);
        });
        return view(std::move(values));
    }
    else
    {
        using key_type = std::decay_t<std::invoke_result_t<ByType, const value_type&>>;

        auto keys = std::vector<key_type>();
        auto indexes = std::vector<std::size_t>(values.size());
        auto result = std::vector<value_type>();

        keys.reserve(values.size());
        result.reserve(values.size());

        for (const auto& value : values)
            keys.push_back(by(value));

        std::iota(indexes.begin(), indexes.end(), 0);
        std::stable_sort(indexes.begin(), indexes.end(), [&keys] (std::size_t i, std::size_t j)
        {
            return cmp(keys[i], keys[j]) == order::less;
        });

        for (auto i : indexes)
            result.push_back(values[i]);

        return view(std::move(result));
    }
}

template<typename SequenceType>
auto sort(SequenceType sequence)
{
    return sort(sequence, [] (const auto& a, const auto& b) { return cmp(a, b); });
}




/**
 * @brief      Group the values of a finite sequence by key, consuming the
 *             sequence once. Values with the same key keep their order.
 *
 * @param[in]  sequence      The sequence to classify
 * @param[in]  mapper        Gives the key of a value
 * @param[in]  as            Transforms a value before it is stored
 *
 * @return     A std::map from keys to std::vector's of (transformed) values
 */
template<typename SequenceType, typename MapperType, typename AsType = identity_t, typename CompareType = std::less<>>
auto classify(SequenceType sequence, MapperType mapper, AsType as = AsType(), CompareType compare = CompareType())
{
    detail::require_finite<SequenceType>("seq::classify");

    using value_type = value_type_t<SequenceType>;
    using key_type = std::decay_t<std::invoke_result_t<MapperType, value_type>>;
    using mapped_type = std::decay_t<std::invoke_result_t<AsType, value_type>>;

    auto result = std::map<key_type, std::vector<mapped_type>, CompareType>(compare);

    for (auto value : sequence)
        result[mapper(value)].push_back(as(value));

    return result;
}

namespace detail {

template<typename T, typename = void>
struct element_type
{
    using type = typename T::value_type;
};

template<typename T>
struct element_type<T, std::enable_if_t<is_sequence_v<T>>>
{
    using type = value_type_t<T>;
};

} // namespace detail

/**
 * @brief      Like classify, except that the mapper gives any number of keys
 *             (a sequence or a container), and the value is added under each.
 */
template<typename SequenceType, typename MapperType, typename AsType = identity_t, typename CompareType = std::less<>>
auto categorize(SequenceType sequence, MapperType mapper, AsType as = AsType(), CompareType compare = CompareType())
{
    detail::require_finite<SequenceType>("seq::categorize");

    using value_type = value_type_t<SequenceType>;
    using keys_type = std::decay_t<std::invoke_result_t<MapperType, value_type>>;
    using key_type = std::decay_t<typename detail::element_type<keys_type>::type>;
    using mapped_type = std::decay_t<std::invoke_result_t<AsType, value_type>>;

    auto result = std::map<key_type, std::vector<mapped_type>, CompareType>(compare);

    for (auto value : sequence)
        for (auto key : mapper(value))
            result[key].push_back(as(value));

    return result;
}




//=============================================================================
template<typename F> auto reduce    (F f) { return [f] (auto s) { return reduce    (s, f); }; }
template<typename F> auto classify  (F f) { return [f] (auto s) { return classify  (s, f); }; }
template<typename F> auto categorize(F f) { return [f] (auto s) { return categorize(s, f); }; }

inline auto sort   ()                { return [ ] (auto s) { return sort   (s); }; }
inline auto reverse()                { return [ ] (auto s) { return reverse(s); }; }
inline auto elems  ()                { return [ ] (auto s) { return elems  (s); }; }
inline auto tail   (unsigned long c) { return [c] (auto s) { return tail   (s, c); }; }

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <string>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_reduce()
{
    using namespace std::string_literals;

    require(reduce(seq::from(2, 4, 6, 8), std::plus<>()) == 20);
    require(reduce(seq::from(7), [] (int, int) -> int { throw std::logic_error("not called"); }) == 7);
    require(reduce(seq::range(0), std::plus<>()) == 0);
    require(reduce(seq::range(0), std::multiplies<>()) == 1);
    require(reduce(seq::range(0), seq::with_identity([] (long a, long b) { return a > b ? a : b; }, -1)) == -1);
    require_throws(reduce(seq::range(0), [] (long a, long b) { return a - b; }));
    require(seq::sum(seq::range(5)) == 10);
    require((seq::from("a"s, "b"s, "c"s) | seq::reduce(std::plus<>())) == "abc");

    // reducers that steer the loop
    auto until_large = [] (long a, long b) { return a + b > 10 ? seq::stop<long>() : seq::proceed(a + b); };
    auto odd_only = [] (long a, long b) { return b % 2 == 0 ? seq::skip<long>() : seq::proceed(a + b); };
    auto flip_once = [] (long a, long b) { return a >= 0 && a + b > 100 ? seq::retry(-a) : seq::proceed(a + b); };
    require(reduce(seq::generate(), until_large) == 10);
    require(reduce(seq::range(1, 8), odd_only) == 16);
    require(reduce(seq::from(1l, 200l), flip_once) == 199);

    require(seq::cmp(1, 2) == seq::order::less);
    require(seq::cmp("b"s, "a"s) == seq::order::more);
    require(seq::cmp(seq::from(1, 2), seq::from(1, 2, 0)) == seq::order::less);
    require(seq::cmp(seq::from(1, 3), seq::from(1, 2, 0)) == seq::order::more);

    require(seq::min(seq::from(3, 1, 2)) == 1);
    require(seq::max(seq::from(3, 1, 2)) == 3);
    require(seq::minmax(seq::from(3, 1, 2)) == std::pair(1, 3));
    require(! seq::min(seq::range(0)).has_value());
    require(seq::elems(seq::range(7)) == 7);
    require_throws(seq::elems(seq::generate()));

    auto ten = seq::range(10);
    require((seq::to<std::vector>(tail(ten, 3)) == std::vector{7l, 8l, 9l}));
    require((seq::to<std::vector>(tail(ten, 30)) == seq::to<std::vector>(ten)));
    require((seq::to<std::vector>(ten | seq::reverse() | seq::reverse()) == seq::to<std::vector>(ten)));
    require((seq::to<std::vector>(seq::reverse(seq::from(1, 2, 3))) == std::vector{3, 2, 1}));
    require_throws(seq::tail(seq::generate(), 1));
    require_throws(seq::reverse(seq::cycle(seq::from(1))));

    // sorting is stable; a unary key is computed once per value
    auto calls = std::make_shared<int>(0);
    auto words = seq::from("pear"s, "fig"s, "apple"s, "kiwi"s);
    auto by_length = [calls] (const std::string& w) { ++*calls; return w.size(); };

    require((seq::to<std::vector>(seq::from(3, 1, 2) | seq::sort()) == std::vector{1, 2, 3}));
    require((seq::to<std::vector>(sort(words, by_length)) == std::vector{"fig"s, "pear"s, "kiwi"s, "apple"s}));
    require(*calls == 4);
    require((seq::to<std::vector>(sort(words, std::greater<>())) == std::vector{"pear"s, "kiwi"s, "fig"s, "apple"s}));
    require((seq::to<std::vector>(sort(words, [] (const auto& a, const auto& b) { return seq::cmp(b.size(), a.size()); })) == std::vector{"apple"s, "pear"s, "kiwi"s, "fig"s}));

    try {
        sort(words, [] (const std::string& w) { if (w == "fig") throw std::range_error(w); return w.size(); });
        require(false);
    }
    catch (const std::range_error& e)
    {
        require(std::string(e.what()) == "fig");
    }

    auto parity = classify(seq::range(7), [] (long i) { return i % 2 == 0 ? "even"s : "odd"s; });
    require(parity.size() == 2);
    require((parity["even"] == std::vector{0l, 2l, 4l, 6l}));
    require((parity["odd"] == std::vector{1l, 3l, 5l}));

    auto squares = classify(seq::range(4), [] (long i) { return i < 2; }, [] (long i) { return i * i; });
    require((squares[true] == std::vector{0l, 1l} && squares[false] == std::vector{4l, 9l}));

    auto divisors = categorize(seq::range(1, 7), [] (long i) { return seq::keep_if(seq::range(2, 4), [i] (long d) { return i % d == 0; }); });
    require((divisors[2] == std::vector{2l, 4l, 6l} && divisors[3] == std::vector{3l, 6l}));
    require(divisors.size() == 2);
}

#endif // DO_UNIT_TESTS
