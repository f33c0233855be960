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
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <vector>
#include "core_sequence.hpp"




//=============================================================================
namespace seq {




/**
 * @brief      The k-element subsets of a materialized sequence, for each k in
 *             [lo, hi], as std::vector's of values. Subsets of equal size are
 *             in lexicographic order of their index tuples; sizes are visited
 *             in increasing order. There is one subset of size zero, and none
 *             larger than the source.
 *
 * @tparam     ValueType  The type of the source values
 */
template<typename ValueType>
struct combinations_sequence_t
{
    std::shared_ptr<const std::vector<ValueType>> source;
    std::size_t lo;
    std::size_t hi;
};

namespace detail {

inline std::optional<std::vector<std::size_t>> first_combination(std::size_t n, std::size_t k, std::size_t hi)
{
    if (k > n || k > hi)
        return {};

    auto indexes = std::vector<std::size_t>(k);
    std::iota(indexes.begin(), indexes.end(), 0);
    return indexes;
}

} // namespace detail

template<typename ValueType>
auto start(combinations_sequence_t<ValueType> sequence)
{
    return detail::first_combination(sequence.source->size(), sequence.lo, sequence.hi);
}

template<typename ValueType>
auto next(combinations_sequence_t<ValueType> sequence, std::vector<std::size_t> indexes)
-> std::optional<std::vector<std::size_t>>
{
    auto n = sequence.source->size();
    auto k = indexes.size();

    for (std::size_t i = k; i-- > 0;)
    {
        if (indexes[i] < n - k + i)
        {
            ++indexes[i];

            for (std::size_t j = i + 1; j < k; ++j)
                indexes[j] = indexes[j - 1] + 1;

            return indexes;
        }
    }
    return detail::first_combination(n, k + 1, sequence.hi);
}

template<typename ValueType>
auto obtain(combinations_sequence_t<ValueType> sequence, std::vector<std::size_t> indexes)
{
    auto result = std::vector<ValueType>();
    result.reserve(indexes.size());

    for (auto i : indexes)
        result.push_back(sequence.source->at(i));

    return result;
}




/**
 * @brief      The orderings of a materialized sequence, in lexicographic order
 *             of their index permutations. Equal values are not merged. The
 *             empty sequence has one (empty) permutation.
 *
 * @tparam     ValueType  The type of the source values
 */
template<typename ValueType>
struct permutations_sequence_t
{
    std::shared_ptr<const std::vector<ValueType>> source;
};

template<typename ValueType>
auto start(permutations_sequence_t<ValueType> sequence)
{
    auto indexes = std::vector<std::size_t>(sequence.source->size());
    std::iota(indexes.begin(), indexes.end(), 0);
    return std::optional<std::vector<std::size_t>>(indexes);
}

template<typename ValueType>
auto next(permutations_sequence_t<ValueType> sequence, std::vector<std::size_t> indexes)
-> std::optional<std::vector<std::size_t>>
{
    if (std::next_permutation(indexes.begin(), indexes.end()))
        return indexes;
    return {};
}

template<typename ValueType>
auto obtain(permutations_sequence_t<ValueType> sequence, std::vector<std::size_t> indexes)
{
    return obtain(combinations_sequence_t<ValueType>{sequence.source, 0, 0}, indexes);
}




//=============================================================================
template<typename SequenceType>
auto combinations(SequenceType sequence, std::size_t lo, std::size_t hi)
{
    using value_type = value_type_t<SequenceType>;
    return combinations_sequence_t<value_type>{detail::shared_values(sequence), lo, hi};
}

template<typename SequenceType>
auto combinations(SequenceType sequence, std::size_t k)
{
    return combinations(sequence, k, k);
}

template<typename SequenceType>
auto combinations(SequenceType sequence)
{
    using value_type = value_type_t<SequenceType>;
    auto source = detail::shared_values(sequence);
    auto n = source->size();
    return combinations_sequence_t<value_type>{source, 0, n};
}

template<typename SequenceType>
auto permutations(SequenceType sequence)
{
    using value_type = value_type_t<SequenceType>;
    return permutations_sequence_t<value_type>{detail::shared_values(sequence)};
}

inline auto index_combinations(unsigned long n, unsigned long k)
{
    return combinations(range(n), k);
}

inline auto index_permutations(unsigned long n)
{
    return permutations(range(n));
}

inline auto permutations()
{
    return [] (auto s) { return permutations(s); };
}




/**
 * @brief      The number of k-subsets of n things.
 *
 * @note       Throws std::overflow_error if the result does not fit in an
 *             unsigned long.
 */
inline unsigned long binomial(unsigned long n, unsigned long k)
{
    if (k > n)
        return 0;

    k = std::min(k, n - k);

    auto result = 1ul;

    for (unsigned long i = 0; i < k; ++i)
    {
        auto g = std::gcd(result, i + 1);
        auto m = (n - i) / ((i + 1) / g);

        result /= g;

        if (result > std::numeric_limits<unsigned long>::max() / m)
            throw std::overflow_error("seq::binomial (result does not fit in unsigned long)");

        result *= m;
    }
    return result;
}

inline unsigned long factorial(unsigned long n)
{
    auto result = 1ul;

    for (unsigned long i = 2; i <= n; ++i)
    {
        if (result > std::numeric_limits<unsigned long>::max() / i)
            throw std::overflow_error("seq::factorial (result does not fit in unsigned long)");
        result *= i;
    }
    return result;
}

} // namespace seq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <set>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_sequence_combinatorics()
{
    using w = std::vector<long>;

    require((seq::to<std::vector>(seq::index_combinations(4, 2)) == std::vector{w{0, 1}, w{0, 2}, w{0, 3}, w{1, 2}, w{1, 3}, w{2, 3}}));
    require((seq::to<std::vector>(seq::index_combinations(3, 0)) == std::vector<w>{w{}}));
    require(empty(seq::index_combinations(2, 3)));
    require((seq::to<std::vector>(combinations(seq::from('a', 'b', 'c'), 1, 2)) == std::vector<std::vector<char>>{{'a'}, {'b'}, {'c'}, {'a', 'b'}, {'a', 'c'}, {'b', 'c'}}));
    require(seq::to<std::vector>(combinations(seq::range(4))).size() == 16);

    for (unsigned long n = 0; n < 7; ++n)
    {
        for (unsigned long k = 0; k <= n + 1; ++k)
        {
            auto all = seq::to<std::vector>(seq::index_combinations(n, k));
            auto increasing = std::all_of(all.begin(), all.end(), [] (auto c) { return std::adjacent_find(c.begin(), c.end(), std::greater_equal<>()) == c.end(); });
            require(all.size() == seq::binomial(n, k) && increasing);
        }
    }

    require((seq::to<std::vector>(seq::index_permutations(3)) == std::vector{w{0, 1, 2}, w{0, 2, 1}, w{1, 0, 2}, w{1, 2, 0}, w{2, 0, 1}, w{2, 1, 0}}));
    require((seq::to<std::vector>(seq::index_permutations(0)) == std::vector<w>{w{}}));
    require(seq::to<std::vector>(seq::from(1, 1, 2) | seq::permutations()).size() == 6);

    auto perms = seq::to<std::vector>(seq::index_permutations(5));
    require(perms.size() == seq::factorial(5) && std::set(perms.begin(), perms.end()).size() == 120);

    require(seq::binomial(52, 5) == 2598960);
    require(seq::binomial(3, 4) == 0);
    require(seq::factorial(20) == 2432902008176640000ul);
    require_throws(seq::factorial(21));
    require_throws(seq::binomial(200, 100));
}

#endif // DO_UNIT_TESTS
