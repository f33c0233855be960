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




#include <algorithm>
#include <iostream>
#include "app_archive.hpp"
#include "app_config.hpp"
#include "app_hdf5.hpp"
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
static auto config_template()
{
    return lazyseq::config_template()
    .item("n",             6, "number of values to draw from")
    .item("k",             3, "size of the combinations")
    .item("window",        3, "rotor window size")
    .item("gap",          -1, "rotor gap (negative values overlap)")
    .item("seed",         42, "random seed for pick and roll")
    .item("output",       "", "HDF5 file to write the results to (empty for none)");
}




//=============================================================================
static void print_line(std::string name, std::string value)
{
    std::printf("%-16s %s\n", name.data(), value.data());
}

static int run_demo(int argc, const char* argv[])
{
    auto cfg    = config_template().create().update(lazyseq::argv_to_string_map(argc, argv));
    auto n      = cfg.get_int("n");
    auto k      = cfg.get_int("k");
    auto seed   = unsigned(cfg.get_int("seed"));
    auto output = cfg.get_string("output");

    if (n < 0 || k < 0 || cfg.get_int("window") < 0)
    {
        throw std::invalid_argument("lazyseq demo (n, k, and window must be non-negative)");
    }
    auto values  = seq::range(n);
    auto windows = std::vector<seq::window_t>{{std::size_t(cfg.get_int("window")), long(cfg.get_int("gap"))}};
    auto rolls   = seq::roll(values, 4 * n, seed);
    auto parity  = seq::classify(values, [] (long i) { return i % 2 ? std::string("odd") : std::string("even"); });

    lazyseq::pretty_print(std::cout, "config", cfg);

    print_line("values",       seq::join(values, " "));
    print_line("combinations", util::format("%lu of size %d", seq::binomial(n, k), k));
    print_line("",             seq::join(seq::combinations(values, k), ", "));
    print_line("permutations", util::format("%lu", seq::factorial(std::min(n, 5))));
    print_line("",             seq::join(seq::take(seq::index_permutations(std::min(n, 5)), 6), ", "));
    print_line("rotor",        seq::join(seq::rotor(values, windows, true), " | "));
    print_line("rolls",        seq::join(rolls));
    print_line("unique rolls", seq::join(seq::unique(rolls), " "));
    print_line("squished",     seq::join(seq::squish(rolls), " "));
    print_line("picked",       seq::join(seq::pick(values, std::size_t(k), seed), " "));
    print_line("sum",          util::format("%ld", seq::sum(values)));
    print_line("pair sums",    seq::join(seq::zip(values, seq::drop(values, 1)) | seq::map(util::apply_to(std::plus<>())), " "));
    print_line("roundrobin",   seq::join(seq::roundrobin(values, seq::map(values, std::negate<>())), " "));
    print_line("primes",       seq::join(values | seq::grep([] (long i) { return i > 1 && seq::empty(seq::grep(seq::range(2, i), [i] (long d) { return i % d == 0; })); }), " "));

    for (const auto& [key, members] : parity)
    {
        print_line(key, seq::join(seq::view(members), " "));
    }

    if (! output.empty())
    {
        auto file = h5::File(output, "w");
        auto root = h5::Group(file);

        auto config_group = root.require_group("config");

        for (const auto& item : cfg)
        {
            std::visit([&config_group, &item] (const auto& value) { h5::write(config_group, item.first, value); }, item.second);
        }
        lazyseq::archive::dump(root, "values", values);
        lazyseq::archive::dump(root, "combinations", seq::combinations(values, k));
        lazyseq::archive::dump(root, "windows", seq::rotor(values, windows, true));
        lazyseq::archive::dump(root, "rolls", rolls);
        lazyseq::archive::dump_classified(root, "parity", parity);

        std::printf("write %s\n", output.data());
    }
    return 0;
}




//=============================================================================
int test_app();
int test_core();




//=============================================================================
static int run_all_tests(int, const char*[])
{
    start_unit_tests();
    test_core();
    test_app();
    return report_test_results();
}




//=============================================================================
int main(int argc, const char* argv[])
{
    if (argc == 1)
    {
        std::printf("usage: lazyseq [test|demo] <key=val parameters>\n");
        return 0;
    }

    auto command = std::string(argv[1]);

    try {
        if (command == "test") return run_all_tests(argc - 1, argv + 1);
        if (command == "demo") return run_demo(argc - 1, argv + 1);
        std::printf("unknown command: %s\n", command.data());
    }
    catch (const std::exception& e)
    {
        std::printf("lazyseq %s: %s\n", command.data(), e.what());
    }
    return 1;
}
