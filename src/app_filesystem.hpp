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
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core_sequence.hpp"
#include "core_sequence_match.hpp"




//=============================================================================
namespace lazyseq {




/**
 * @brief      The entries of a directory whose file names smart-match a test.
 *             The directory is opened when the sequence is started, and closed
 *             when the last position referring to it goes away. Positions
 *             share the open directory handle, so copies of a position must be
 *             advanced as one cursor; restarting opens the directory again.
 */
struct directory_sequence_t
{
    std::filesystem::path path;
    seq::matcher_t<std::string> test;
};

struct directory_position_t
{
    std::shared_ptr<std::filesystem::directory_iterator> cursor;
    std::filesystem::path entry;
};

namespace detail {

inline std::optional<directory_position_t> first_matching_entry(const directory_sequence_t& sequence, std::shared_ptr<std::filesystem::directory_iterator> cursor)
{
    for (auto& it = *cursor; it != std::filesystem::directory_iterator(); ++it)
    {
        if (sequence.test(it->path().filename().string()))
        {
            return directory_position_t{cursor, it->path()};
        }
    }
    return {};
}

} // namespace detail

inline std::optional<directory_position_t> start(directory_sequence_t sequence)
{
    return detail::first_matching_entry(sequence, std::make_shared<std::filesystem::directory_iterator>(sequence.path));
}

inline std::optional<directory_position_t> next(directory_sequence_t sequence, directory_position_t position)
{
    ++*position.cursor;
    return detail::first_matching_entry(sequence, position.cursor);
}

inline std::filesystem::path obtain(directory_sequence_t, directory_position_t position)
{
    return position.entry;
}




/**
 * @brief      A lazy listing of the entries of a directory, in the order the
 *             operating system reports them. The entries are full paths; the
 *             test is applied to the file name.
 *
 * @param[in]  path         The directory to list
 * @param[in]  test         A matcher, regex, predicate, or file name
 *
 * @tparam     MatcherType  The type of the test
 *
 * @return     A sequence of std::filesystem::path
 *
 * @note       Starting the sequence throws std::filesystem::filesystem_error
 *             if the directory cannot be opened.
 */
template<typename MatcherType>
auto dir(std::filesystem::path path, MatcherType test)
{
    return seq::adapt(directory_sequence_t{path, seq::make_matcher<std::string>(test)});
}

inline auto dir(std::filesystem::path path)
{
    return dir(path, [] (const std::string&) { return true; });
}

} // namespace lazyseq




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <fstream>
#include <regex>
#include <vector>
#include "core_sequence_reduce.hpp"
#include "core_unit_test.hpp"




//=============================================================================
inline void test_filesystem()
{
    namespace fs = std::filesystem;

    auto root = fs::temp_directory_path() / "lazyseq_test_dir";
    fs::remove_all(root);
    fs::create_directories(root / "sub");

    for (auto name : {"a.txt", "b.txt", "c.h5"})
        std::ofstream(root / name) << name;

    auto names = [] (auto paths)
    {
        return seq::to<std::vector>(seq::sort(seq::map(paths, [] (fs::path p) { return p.filename().string(); })));
    };

    require((names(lazyseq::dir(root)) == std::vector<std::string>{"a.txt", "b.txt", "c.h5", "sub"}));
    require((names(lazyseq::dir(root, std::regex("\\.txt$"))) == std::vector<std::string>{"a.txt", "b.txt"}));
    require((names(lazyseq::dir(root, "c.h5")) == std::vector<std::string>{"c.h5"}));
    require(seq::elems(lazyseq::dir(root, [] (const std::string& n) { return n.size() == 3; })) == 1);
    require(empty(lazyseq::dir(root / "sub")));

    // the listing is replayable and composes with the other operations
    auto listing = lazyseq::dir(root, std::regex("txt"));
    require(seq::elems(listing) == seq::elems(listing));
    require(seq::first(listing | seq::map([] (fs::path p) { return p.extension().string(); }), ".txt").has_value());

    require_throws(start(lazyseq::dir(root / "absent")));
    fs::remove_all(root);
}

#endif // DO_UNIT_TESTS
