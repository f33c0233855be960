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
#include <map>
#include <string>
#include <type_traits>
#include <vector>
#include "app_hdf5.hpp"
#include "core_sequence.hpp"
#include "core_sequence_item.hpp"
#include "core_util.hpp"




//=============================================================================
namespace lazyseq::archive {




/**
 * @brief      Materialize a finite sequence into an HDF5 group. When the
 *             values have a native HDF5 element type, they are written as one
 *             dataset. Otherwise (strings, windows, combinations) the name
 *             becomes a group holding one dataset per value, named by its
 *             zero-padded index, so that the stored order is the sequence
 *             order.
 *
 * @param[in]  group         The group to write into
 * @param[in]  name          The name of the dataset or group
 * @param[in]  sequence      The sequence to write
 *
 * @return     The number of values written
 */
template<typename SequenceType>
unsigned long dump(const h5::Group& group, std::string name, SequenceType sequence)
{
    seq::detail::require_finite<SequenceType>("lazyseq::archive::dump");

    using value_type = seq::value_type_t<SequenceType>;
    auto values = seq::to<std::vector>(sequence);

    if constexpr (std::is_arithmetic_v<value_type> && h5::hdf5_is_writable<value_type>::value)
    {
        h5::write(group, name, values);
    }
    else
    {
        auto subgroup = group.require_group(name);

        for (std::size_t n = 0; n < values.size(); ++n)
        {
            h5::write(subgroup, util::format("%06zu", n), values[n]);
        }
    }
    return values.size();
}




/**
 * @brief      Read back a sequence written by dump. The values are read
 *             eagerly and viewed as a sequence.
 *
 * @tparam     ValueType  The type of the stored values
 */
template<typename ValueType>
auto load(const h5::Group& group, std::string name)
{
    if (group.contains_dataset(name))
    {
        return seq::view(h5::read<std::vector<ValueType>>(group, name));
    }

    auto subgroup = group.open_group(name);
    auto values = std::vector<ValueType>();

    for (const auto& key : subgroup.names())
    {
        values.push_back(h5::read<ValueType>(subgroup, key));
    }
    return seq::view(std::move(values));
}




/**
 * @brief      Write a classification map as a group with one entry per key,
 *             named by the display form of the key.
 */
template<typename KeyType, typename ValueType, typename CompareType>
void dump_classified(const h5::Group& group, std::string name, const std::map<KeyType, std::vector<ValueType>, CompareType>& classes)
{
    auto subgroup = group.require_group(name);

    for (const auto& [key, values] : classes)
    {
        dump(subgroup, seq::detail::stringify(key), seq::view(values));
    }
}

} // namespace lazyseq::archive




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <cstdio>
#include "core_sequence_reduce.hpp"
#include "core_sequence_rotor.hpp"
#include "core_unit_test.hpp"




//=============================================================================
inline void test_archive()
{
    using namespace lazyseq;
    auto filename = std::string("lazyseq_test_archive.h5");

    {
        auto file = h5::File(filename, "w");
        auto root = h5::Group(file);

        require(archive::dump(root, "squares", seq::map(seq::range(5), [] (long i) { return i * i; })) == 5);
        require(archive::dump(root, "windows", seq::rotor(seq::range(7), 3, true)) == 3);
        require(archive::dump(root, "words", seq::from(std::string("x"), std::string(), std::string("yz"))) == 3);
        require(archive::dump(root, "nothing", seq::range(0)) == 0);
        archive::dump_classified(root, "parity", seq::classify(seq::range(5), [] (long i) { return i % 2; }));
        require_throws(archive::dump(root, "forever", seq::generate()));
    }
    {
        auto file = h5::File(filename, "r");
        auto root = h5::Group(file);

        require((seq::to<std::vector>(archive::load<long>(root, "squares")) == std::vector{0l, 1l, 4l, 9l, 16l}));
        require((seq::to<std::vector>(archive::load<std::vector<long>>(root, "windows")) == std::vector<std::vector<long>>{{0, 1, 2}, {3, 4, 5}, {6}}));
        require((seq::to<std::vector>(archive::load<std::string>(root, "words")) == std::vector<std::string>{"x", "", "yz"}));
        require(empty(archive::load<long>(root, "nothing")));
        require((root.open_group("parity").names() == std::vector<std::string>{"0", "1"}));
        require((seq::to<std::vector>(archive::load<long>(root.open_group("parity"), "1")) == std::vector{1l, 3l}));
        require_throws(archive::load<long>(root, "absent"));
    }
    std::remove(filename.data());
}

#endif // DO_UNIT_TESTS
