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




#define DO_UNIT_TESTS
#include "core_sequence.hpp"
#include "core_sequence_combinatorics.hpp"
#include "core_sequence_item.hpp"
#include "core_sequence_match.hpp"
#include "core_sequence_random.hpp"
#include "core_sequence_reduce.hpp"
#include "core_sequence_rotor.hpp"
#include "core_sequence_unique.hpp"
#include "core_unit_test.hpp"
#include "core_util.hpp"




//=============================================================================
int test_core()
{
    test_sequence();
    test_sequence_combinatorics();
    test_sequence_item();
    test_sequence_match();
    test_sequence_random();
    test_sequence_reduce();
    test_sequence_rotor();
    test_sequence_unique();
    test_util();
    return 0;
}
