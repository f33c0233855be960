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
#include <functional>
#include <optional>
#include <regex>
#include <stdexcept>
#include <typeinfo>
#include <utility>
#include <variant>
#include "core_sequence.hpp"
#include "core_sequence_item.hpp"




//=============================================================================
namespace seq {




//=============================================================================
template<typename T>
struct type_tag
{
    using type = T;
};

template<typename T>
constexpr type_tag<T> of_type()
{
    return {};
}

enum class projection { value, key, key_value, pair };




//=============================================================================
namespace detail {

template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>> : std::true_type {};

template<typename T> struct is_type_tag : std::false_type {};
template<typename T> struct is_type_tag<type_tag<T>> : std::true_type {};

/**
 * Whether a value holds the type T: the active alternative of a variant, the
 * held type of an std::any, otherwise the static type or one of its bases.
 */
template<typename T, typename ValueType>
bool holds_type(const ValueType& value)
{
    if constexpr (is_variant<ValueType>::value)
    {
        return std::visit([] (const auto& v) { return std::is_same_v<std::decay_t<decltype(v)>, T>; }, value);
    }
    else if constexpr (std::is_same_v<ValueType, std::any>)
    {
        return value.type() == typeid(T);
    }
    else
    {
        return std::is_same_v<ValueType, T> || std::is_base_of_v<T, ValueType>;
    }
}

} // namespace detail




/**
 * @brief      A smart-match test against values of type ValueType. A matcher
 *             holds exactly one of: a value compared for equality, a type
 *             test, a regular expression searched in the display form of the
 *             value, or a callable predicate.
 *
 * @tparam     ValueType  The type of the values being tested
 */
template<typename ValueType>
class matcher_t
{
public:

    //=========================================================================
    enum class kind_t { value, type, pattern, predicate };

    struct type_test_t
    {
        const std::type_info* type;
        bool (*test)(const ValueType&);
    };

    //=========================================================================
    static matcher_t equal_to(ValueType value)
    {
        return matcher_t(alternative_t(std::in_place_index<0>, std::move(value)));
    }

    template<typename T>
    static matcher_t of_type()
    {
        return matcher_t(alternative_t(std::in_place_index<1>, type_test_t{&typeid(T), &detail::holds_type<T, ValueType>}));
    }

    static matcher_t pattern(std::regex expression)
    {
        return matcher_t(alternative_t(std::in_place_index<2>, std::move(expression)));
    }

    static matcher_t predicate(std::function<bool(const ValueType&)> test)
    {
        if (! test)
            throw std::invalid_argument("seq::matcher_t (empty predicate)");
        return matcher_t(alternative_t(std::in_place_index<3>, std::move(test)));
    }

    kind_t kind() const
    {
        return kind_t(alternative.index());
    }

    bool operator()(const ValueType& value) const
    {
        switch (kind())
        {
            case kind_t::value:
                if constexpr (detail::is_equality_comparable<ValueType>::value)
                    return std::get<0>(alternative) == value;
                else
                    throw std::logic_error("seq::matcher_t (the value type has no equality)");
            case kind_t::type:
                return std::get<1>(alternative).test(value);
            case kind_t::pattern:
                if constexpr (detail::is_stringifiable_v<ValueType>)
                    return std::regex_search(detail::stringify(value), std::get<2>(alternative));
                else
                    throw std::logic_error("seq::matcher_t (the value type has no display form)");
            case kind_t::predicate:
                return std::get<3>(alternative)(value);
        }
        return false;
    }

private:
    using alternative_t = std::variant<ValueType, type_test_t, std::regex, std::function<bool(const ValueType&)>>;
    matcher_t(alternative_t alternative) : alternative(std::move(alternative)) {}
    alternative_t alternative;
};




/**
 * @brief      Resolve a test of any supported kind into a matcher, once, ahead
 *             of a search. The order of resolution is: an existing matcher, a
 *             type tag (seq::of_type<T>()), a std::regex, a callable returning
 *             bool, and finally a value converted to ValueType and compared
 *             for equality.
 *
 * @param[in]  test          The test
 *
 * @tparam     ValueType     The type of the values being tested
 * @tparam     MatcherType   The type of the test
 *
 * @return     A matcher_t<ValueType>
 */
template<typename ValueType, typename MatcherType>
matcher_t<ValueType> make_matcher(MatcherType test)
{
    if constexpr (std::is_same_v<MatcherType, matcher_t<ValueType>>)
    {
        return test;
    }
    else if constexpr (detail::is_type_tag<MatcherType>::value)
    {
        return matcher_t<ValueType>::template of_type<typename MatcherType::type>();
    }
    else if constexpr (std::is_same_v<MatcherType, std::regex>)
    {
        return matcher_t<ValueType>::pattern(test);
    }
    else if constexpr (std::is_invocable_r_v<bool, MatcherType, const ValueType&> && ! std::is_convertible_v<MatcherType, ValueType>)
    {
        return matcher_t<ValueType>::predicate(test);
    }
    else
    {
        static_assert(std::is_convertible_v<MatcherType, ValueType>, "seq::make_matcher (the test is not a matcher, type, pattern, predicate, or value)");
        return matcher_t<ValueType>::equal_to(ValueType(test));
    }
}




/**
 * @brief      Select the values of a sequence that smart-match a test. The
 *             projection picks what is yielded for each match: the value, its
 *             index, the flattened index and value, or an (index, value)
 *             pair. Indexes count from the start of the sequence.
 *
 * @param[in]  sequence      The sequence to search
 * @param[in]  test          A matcher, type tag, regex, predicate, or value
 *
 * @tparam     Projection    What is yielded for each match
 * @tparam     SequenceType  The type of the sequence
 * @tparam     MatcherType   The type of the test
 *
 * @return     A lazy sequence
 */
template<projection Projection = projection::value, typename SequenceType, typename MatcherType>
auto grep(SequenceType sequence, MatcherType test)
{
    using value_type = value_type_t<SequenceType>;

    auto matcher = make_matcher<value_type>(test);
    auto matches = keep_if(pairs(sequence), [matcher] (const auto& iv) { return matcher(iv.second); });

    if constexpr (Projection == projection::value)
    {
        return map(matches, [] (auto iv) { return iv.second; });
    }
    else if constexpr (Projection == projection::key)
    {
        return map(matches, [] (auto iv) { return iv.first; });
    }
    else if constexpr (Projection == projection::pair)
    {
        return matches;
    }
    else
    {
        return flat_map(matches, [] (auto iv)
        {
            return from(
                key_or_value_t<value_type>(std::in_place_index<0>, iv.first),
                key_or_value_t<value_type>(std::in_place_index<1>, iv.second));
        });
    }
}




/**
 * @brief      Return the first value of a sequence that smart-matches a test,
 *             or the last one if from_end is true, projected as for grep. The
 *             key_value projection gives a two-element sequence. Searching an
 *             infinite sequence from its end throws std::domain_error.
 *
 * @return     The projected match, or std::nullopt if there is none
 */
template<projection Projection = projection::value, typename SequenceType, typename MatcherType>
auto first(SequenceType sequence, MatcherType test, bool from_end=false)
{
    using value_type = value_type_t<SequenceType>;

    auto matches = grep<projection::pair>(sequence, test);
    auto found = std::optional<std::pair<long, value_type>>();

    if (from_end)
    {
        detail::require_finite<SequenceType>("seq::first");

        for (auto iv : matches)
            found = iv;
    }
    else if (auto p = start(matches); p.has_value())
    {
        found = obtain(matches, p.value());
    }

    if constexpr (Projection == projection::value)
    {
        return found.has_value() ? std::optional<value_type>(found->second) : std::nullopt;
    }
    else if constexpr (Projection == projection::key)
    {
        return found.has_value() ? std::optional<long>(found->first) : std::nullopt;
    }
    else if constexpr (Projection == projection::pair)
    {
        return found;
    }
    else
    {
        using kv_type = key_or_value_t<value_type>;
        using result_type = decltype(from(kv_type(), kv_type()));

        return found.has_value()
        ? std::optional<result_type>(from(
            kv_type(std::in_place_index<0>, found->first),
            kv_type(std::in_place_index<1>, found->second)))
        : std::nullopt;
    }
}




//=============================================================================
template<projection Projection = projection::value, typename MatcherType>
auto grep(MatcherType test)
{
    return [test] (auto s) { return grep<Projection>(s, test); };
}

template<projection Projection = projection::value, typename MatcherType>
auto first(MatcherType test)
{
    return [test] (auto s) { return first<Projection>(s, test); };
}

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <memory>
#include <string>
#include <vector>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_match()
{
    using namespace std::string_literals;
    using seq::projection;

    auto words = seq::from("apple"s, "banana"s, "cherry"s, "avocado"s);

    require((seq::to<std::vector>(grep(words, "banana")) == std::vector{"banana"s}));
    require((seq::to<std::vector>(grep(words, std::regex("^a"))) == std::vector{"apple"s, "avocado"s}));
    require((seq::to<std::vector>(grep(words, [] (const std::string& w) { return w.size() == 6; })) == std::vector{"banana"s, "cherry"s}));
    require((seq::to<std::vector>(seq::grep<projection::key>(words, std::regex("an"))) == std::vector{1l}));
    require((seq::to<std::vector>(seq::grep<projection::pair>(words, std::regex("e"))) == std::vector{std::pair(0l, "apple"s), std::pair(2l, "cherry"s)}));
    require(seq::to<std::vector>(seq::grep<projection::key_value>(words, "cherry")).size() == 2);
    require(empty(grep(words, "durian")));

    require(seq::first(words, std::regex("^a")) == "apple"s);
    require(seq::first(words, std::regex("^a"), true) == "avocado"s);
    require(seq::first<projection::key>(words, std::regex("^a"), true) == 3l);
    require(! seq::first(words, "durian").has_value());
    require(seq::first<projection::pair>(words, "cherry") == std::pair(2l, "cherry"s));
    require(join(seq::first<projection::key_value>(words, "cherry").value(), ",") == "2,cherry");

    // numbers are matched by value, by predicate, or by their display form
    require((seq::to<std::vector>(seq::range(30) | seq::grep(std::regex("^2"))) == std::vector{2l, 20l, 21l, 22l, 23l, 24l, 25l, 26l, 27l, 28l, 29l}));
    require(seq::first(seq::generate(), [] (long i) { return i * i > 50; }) == 8l);
    require((seq::generate() | seq::first(12l)) == 12l);
    require_throws(seq::first(seq::generate(), 12l, true));

    // type tests look into variants
    using value = std::variant<int, std::string>;
    auto mixed = seq::from(value(1), value("two"s), value(3));
    require((seq::to<std::vector>(seq::grep<projection::key>(mixed, seq::of_type<int>())) == std::vector{0l, 2l}));
    require(seq::first<projection::key>(mixed, seq::of_type<std::string>()) == 1l);
    require(seq::make_matcher<value>(seq::of_type<int>()).kind() == seq::matcher_t<value>::kind_t::type);
    require(seq::make_matcher<value>(value(1)).kind() == seq::matcher_t<value>::kind_t::value);
    require_throws(seq::matcher_t<int>::predicate(nullptr));

    // a throwing predicate is applied only as values are pulled
    auto calls = std::make_shared<int>(0);
    auto fussy = [calls] (long i) { ++*calls; if (i == 3) throw std::range_error("three"); return i % 2 == 0; };
    auto evens = grep(seq::range(5), fussy);
    require(*calls == 0);
    require(front(evens) == 0l);
    require(*calls == 1);
    require(seq::first(seq::range(5), fussy) == 0l);

    try {
        seq::to<std::vector>(evens);
        require(false);
    }
    catch (const std::range_error& e)
    {
        require(std::string(e.what()) == "three");
    }
}

#endif // DO_UNIT_TESTS
