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




#include <iostream>
#include "app_config.hpp"
#include "core_sequence.hpp"
#include "core_sequence_combinatorics.hpp"
#include "core_sequence_item.hpp"
#include "core_sequence_match.hpp"
#include "core_sequence_random.hpp"
#include "core_sequence_reduce.hpp"
#include "core_sequence_rotor.hpp"
#include "core_sequence_unique.hpp"
#include "core_util.hpp"




//=============================================================================
int main(int argc, const char* argv[])
{
    auto cfg_template = lazyseq::config_template()
    .item("dice",                 8)   // number of dice to roll
    .item("faces",                6)   // number of faces on each die
    .item("target",              12)   // total the chosen dice must reach
    .item("choose",               3)   // how many dice to choose
    .item("seed",                 1);  // seed for the dice

    auto cfg    = cfg_template.create().update(lazyseq::argv_to_string_map(argc, argv));
    auto faces  = seq::range(1, cfg.get_int("faces") + 1);
    auto dice   = seq::roll(faces, cfg.get_int("dice"), unsigned(cfg.get_int("seed")));
    auto target = long(cfg.get_int("target"));




    //=========================================================================
    lazyseq::pretty_print(std::cout, "config", cfg);

    auto hits = seq::combinations(dice, cfg.get_int("choose"))
    | seq::grep([target] (const std::vector<long>& c) { return seq::sum(seq::view(c)) == target; })
    | seq::map([] (std::vector<long> c) { return seq::join(seq::sort(seq::view(c)), "+"); })
    | seq::unique()
    | seq::sort();

    std::cout << "dice:        " << seq::join(dice, " ") << '\n';
    std::cout << "distinct:    " << seq::join(seq::sort(seq::unique(dice)), " ") << '\n';
    std::cout << "runs:        " << seq::join(seq::squish(dice), " ") << '\n';
    std::cout << "hits:        " << seq::join(hits, " ") << '\n';




    //=========================================================================
    auto by_total = seq::combinations(dice, 2) | seq::classify([] (const std::vector<long>& c) { return c[0] + c[1]; });

    for (const auto& [total, pairs] : by_total)
    {
        std::cout << util::format("pairs to %2ld: %zu", total, pairs.size()) << '\n';
    }
    return 0;
}
