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
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "core_sequence.hpp"




//=============================================================================
namespace seq {




/**
 * @brief      An opaque wrapper around a value. Flattening operations never
 *             descend into an item, even when the wrapped value is itself a
 *             sequence.
 *
 * @tparam     ValueType  The type of the wrapped value
 */
template<typename ValueType>
struct item_t
{
    ValueType value;
};

template<typename ValueType>
auto item(ValueType value)
{
    return item_t<ValueType>{std::move(value)};
}

template<typename ValueType>
bool operator==(const item_t<ValueType>& a, const item_t<ValueType>& b)
{
    return a.value == b.value;
}

template<typename ValueType>
bool operator!=(const item_t<ValueType>& a, const item_t<ValueType>& b)
{
    return ! (a == b);
}

template<typename ValueType>
bool operator<(const item_t<ValueType>& a, const item_t<ValueType>& b)
{
    return a.value < b.value;
}

/**
 * @brief      Make a container transparent: its elements become a sequence
 *             that flattening operations inline.
 */
template<typename ContainerType>
auto slip(ContainerType container)
{
    return view(std::move(container));
}




//=============================================================================
namespace detail {

template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>> : std::true_type {};

template<typename T, typename = void>
struct is_iterable : std::false_type {};

template<typename T>
struct is_iterable<T, std::void_t<decltype(std::declval<const T&>().begin()), decltype(std::declval<const T&>().end())>> : std::true_type {};

template<typename T> struct is_pair : std::false_type {};
template<typename T, typename U> struct is_pair<std::pair<T, U>> : std::true_type {};

template<typename T> struct is_item : std::false_type {};
template<typename T> struct is_item<item_t<T>> : std::true_type {};

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

template<typename T> struct is_variant : std::false_type {};
template<typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template<typename T>
inline constexpr bool is_stringifiable_v =
       is_sequence_v<T>
    || is_pair<T>::value
    || is_item<T>::value
    || is_optional<T>::value
    || is_variant<T>::value
    || is_streamable<T>::value
    || is_iterable<T>::value;

/**
 * Write the display form of a value: nested sequences and containers are
 * space-joined, a pair is written key<TAB>value, an empty optional is Nil.
 */
template<typename ValueType>
void write(std::ostream& os, const ValueType& value)
{
    if constexpr (std::is_convertible_v<ValueType, std::string>)
    {
        os << std::string(value);
    }
    else if constexpr (is_item<ValueType>::value)
    {
        write(os, value.value);
    }
    else if constexpr (is_pair<ValueType>::value)
    {
        write(os, value.first);
        os << '\t';
        write(os, value.second);
    }
    else if constexpr (is_optional<ValueType>::value)
    {
        if (value.has_value())
            write(os, value.value());
        else
            os << "Nil";
    }
    else if constexpr (is_variant<ValueType>::value)
    {
        std::visit([&os] (const auto& v) { write(os, v); }, value);
    }
    else if constexpr (is_sequence_v<ValueType>)
    {
        bool first = true;

        for (auto v : value)
        {
            if (! first)
                os << ' ';
            write(os, v);
            first = false;
        }
    }
    else if constexpr (is_streamable<ValueType>::value)
    {
        os << value;
    }
    else if constexpr (is_iterable<ValueType>::value)
    {
        bool first = true;

        for (const auto& v : value)
        {
            if (! first)
                os << ' ';
            write(os, v);
            first = false;
        }
    }
    else
    {
        static_assert(is_stringifiable_v<ValueType>, "seq::stringify (the value type has no display form)");
    }
}

template<typename ValueType>
std::string stringify(const ValueType& value)
{
    auto ss = std::ostringstream();
    write(ss, value);
    return ss.str();
}

} // namespace detail




template<typename ValueType>
std::ostream& operator<<(std::ostream& os, const item_t<ValueType>& item)
{
    detail::write(os, item.value);
    return os;
}




/**
 * @brief      Concatenate the display forms of the values of a finite
 *             sequence, separated by sep. Nested sequences are joined by
 *             single spaces in place; they are never flattened into the outer
 *             sequence.
 *
 * @param[in]  sequence      The sequence to join
 * @param[in]  separator     The separator placed between values
 *
 * @tparam     SequenceType  The type of the sequence
 *
 * @return     A string
 */
template<typename SequenceType, typename = std::enable_if_t<is_sequence_v<SequenceType>>>
std::string join(SequenceType sequence, const std::string& separator="")
{
    detail::require_finite<SequenceType>("seq::join");

    auto ss = std::ostringstream();
    bool first = true;

    for (auto value : sequence)
    {
        if (! first)
            ss << separator;
        detail::write(ss, value);
        first = false;
    }
    return ss.str();
}

inline auto join(const std::string& separator="")
{
    return [separator] (auto s) { return join(s, separator); };
}

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <vector>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_item()
{
    auto rows = map(seq::range(3), [] (long i) { return seq::range(i + 1); });

    require(join(seq::from(1, 2, 3), ",") == "1,2,3");
    require(join(rows, "|") == "0|0 1|0 1 2");
    require(join(seq::pairs(seq::from(std::string("a"), std::string("b"))), "\n") == "0\ta\n1\tb");
    require(join(seq::from(std::optional<int>(), std::optional<int>(4))) == "Nil4");
    require((seq::from(1, 2) | seq::join("-")) == "1-2");

    // an item is opaque to flattening, a slipped container is transparent
    auto items = map(seq::range(2), [] (long i) { return seq::item(seq::range(i + 2)); });
    require(seq::to<std::vector>(flat(items)).size() == 2);
    require(join(flat(items), ",") == "0 1,0 1 2");

    auto slipped = map(seq::range(2), [] (long i) { return seq::slip(std::vector<long>{i, i}); });
    require((seq::to<std::vector>(flat(slipped)) == std::vector<long>{0, 0, 1, 1}));

    require(seq::item(3) == seq::item(3));
    require(seq::item(3) != seq::item(4));
    require(seq::detail::stringify(seq::item(std::vector<int>{1, 2})) == "1 2");
}

#endif // DO_UNIT_TESTS
