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
#include <cstdio>
#include <string>
#include <tuple>




//=============================================================================
namespace util {




/**
 * @brief      Turn a function f(a, b, ...) of several variables into a
 *             function g(t) of a single tuple or pair t = (a, b, ...). This
 *             lets the values of zip(A, B) be mapped with a function of two
 *             arguments: zip(A, B) | seq::map(util::apply_to([] (auto a, auto
 *             b) { return a + b; })).
 *
 * @param[in]  function      The function f(a, b, ...)
 *
 * @tparam     FunctionType  The type of the function f
 *
 * @return     A function g(std::tuple(a, b, ...)) of a single tuple
 */
template<typename FunctionType>
auto apply_to(FunctionType function)
{
    return [function] (auto t) { return std::apply(function, t); };
}




/**
 * @brief      Wrapper for the snprintf function.
 *
 * @param[in]  format_string  The c-style format string to use
 * @param[in]  args           The arguments for the format string
 *
 * @tparam     Args           The argument types
 *
 * @return     A formatted std::string.
 *
 * @note       Results longer than 2047 characters are truncated.
 */
template<typename... Args>
std::string format(const char* format_string, Args... args)
{
    char result[2048];
    std::snprintf(result, 2048, format_string, args...);
    return result;
}

} // namespace util




//=============================================================================
#ifdef DO_UNIT_TESTS
#include "core_unit_test.hpp"




//=============================================================================
inline void test_util()
{
    require(util::format("%s-%03d", "n", 7) == "n-007");
    require(util::format("%06zu", std::size_t(12)) == "000012");
    require(util::apply_to([] (int a, int b) { return a * b; })(std::pair(3, 4)) == 12);
    require(util::apply_to([] (int a, int b, int c) { return a + b + c; })(std::tuple(1, 2, 3)) == 6);
}

#endif // DO_UNIT_TESTS
