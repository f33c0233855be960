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




#define SOL_PRINT_ERRORS 0
#define SOL_ALL_SAFETIES_ON 1
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>
#include <lua.hpp>
#include <sol/sol.hpp>
#include "app_archive.hpp"
#include "app_filesystem.hpp"
#include "app_hdf5.hpp"
#include "core_sequence.hpp"
#include "core_sequence_combinatorics.hpp"
#include "core_sequence_item.hpp"
#include "core_sequence_match.hpp"
#include "core_sequence_random.hpp"
#include "core_sequence_reduce.hpp"
#include "core_sequence_rotor.hpp"
#include "core_sequence_unique.hpp"




//=============================================================================
using lua_sequence = seq::dynamic_sequence_t<sol::object>;




//=============================================================================
namespace {

/**
 * @brief      Call a Lua function from a sequence operation. Errors raised by
 *             the function are rethrown as sol::error, so they unwind through
 *             the C++ frames of the sequence instead of jumping over them.
 */
template<typename... Args>
sol::object call(const sol::protected_function& f, Args&&... args)
{
    sol::protected_function_result result = f(std::forward<Args>(args)...);

    if (! result.valid())
    {
        sol::error error = result;
        throw error;
    }
    return result.get<sol::object>();
}

std::string lua_tostring(const sol::object& value)
{
    auto lua = sol::state_view(value.lua_state());
    sol::protected_function tostring = lua["tostring"];
    return call(tostring, value).as<std::string>();
}

struct lua_equal
{
    bool operator()(const sol::object& a, const sol::object& b) const
    {
        auto L = a.lua_state();
        a.push(L);
        b.push(L);
        auto result = lua_rawequal(L, -2, -1);
        lua_pop(L, 2);
        return result == 1;
    }
};

struct lua_less
{
    bool operator()(const sol::object& a, const sol::object& b) const
    {
        if (a.get_type() != b.get_type() || (a.get_type() != sol::type::number && a.get_type() != sol::type::string))
        {
            throw std::invalid_argument("seq (only numbers or strings of the same kind can be ordered)");
        }
        auto L = a.lua_state();
        a.push(L);
        b.push(L);
        auto result = lua_compare(L, -2, -1, LUA_OPLT);
        lua_pop(L, 2);
        return result == 1;
    }
};

/**
 * @brief      Turn a Lua smart-match test into a matcher. A function is a
 *             predicate (using Lua truthiness), a seq.regex is searched for
 *             in the tostring of each value, and anything else is compared
 *             for raw equality.
 */
seq::matcher_t<sol::object> lua_matcher(sol::object test)
{
    if (test.get_type() == sol::type::function)
    {
        auto f = test.as<sol::protected_function>();
        return seq::matcher_t<sol::object>::predicate([f] (const sol::object& v) { return call(f, v).as<bool>(); });
    }
    if (test.is<std::regex>())
    {
        auto expression = test.as<std::regex>();
        return seq::matcher_t<sol::object>::predicate([expression] (const sol::object& v) { return std::regex_search(lua_tostring(v), expression); });
    }
    return seq::matcher_t<sol::object>::predicate([test] (const sol::object& v) { return lua_equal()(test, v); });
}

seq::projection lua_projection(const std::string& name)
{
    if (name == "v")  return seq::projection::value;
    if (name == "k")  return seq::projection::key;
    if (name == "kv") return seq::projection::key_value;
    if (name == "p")  return seq::projection::pair;
    throw std::invalid_argument("seq.grep (projection must be one of v, k, kv, p)");
}

template<typename SequenceType>
lua_sequence objects(sol::this_state s, SequenceType sequence)
{
    return seq::to_dynamic(seq::map(sequence, [s] (auto value) { return sol::make_object(s, value); }));
}

template<typename SequenceType>
lua_sequence tables(sol::this_state s, SequenceType sequence)
{
    return seq::to_dynamic(seq::map(sequence, [s] (auto value) { return sol::make_object(s, sol::as_table(value)); }));
}

/**
 * @brief      Key-value items are handed to Lua as two-element arrays {k, v}.
 */
template<typename SequenceType>
lua_sequence key_value_tables(sol::this_state s, SequenceType sequence)
{
    return seq::to_dynamic(seq::map(sequence, [s] (auto kv)
    {
        return sol::make_object(s, sol::state_view(s).create_table_with(1, kv.first, 2, kv.second));
    }));
}

std::vector<sol::object> from_table(sol::table table)
{
    auto values = std::vector<sol::object>();

    for (std::size_t n = 1; n <= table.size(); ++n)
    {
        values.push_back(table[n]);
    }
    return values;
}

lua_sequence grep(sol::this_state s, lua_sequence sequence, sol::object test, std::string projection)
{
    auto matcher = lua_matcher(test);

    switch (lua_projection(projection))
    {
        case seq::projection::value:     return seq::to_dynamic(seq::grep<seq::projection::value>(sequence, matcher));
        case seq::projection::key:       return objects(s, seq::grep<seq::projection::key>(sequence, matcher));
        case seq::projection::key_value: return seq::to_dynamic(seq::map(seq::grep<seq::projection::key_value>(sequence, matcher), [s] (auto item)
        {
            return std::visit([s] (auto v) { return sol::make_object(s, v); }, item);
        }));
        case seq::projection::pair:      return key_value_tables(s, seq::grep<seq::projection::pair>(sequence, matcher));
    }
    return sequence;
}

sol::object first(sol::this_state s, lua_sequence sequence, sol::object test, bool from_end)
{
    auto found = seq::first(sequence, lua_matcher(test), from_end);
    return found.has_value() ? found.value() : sol::make_object(s, sol::lua_nil);
}

sol::table classify(sol::this_state s, lua_sequence sequence, sol::protected_function mapper)
{
    auto classes = seq::classify(sequence, [mapper] (sol::object v) { return call(mapper, v); }, seq::identity_t(), lua_less());
    auto result = sol::state_view(s).create_table();

    for (const auto& [key, values] : classes)
    {
        result[key] = sol::as_table(values);
    }
    return result;
}

unsigned long write_h5(lua_sequence sequence, std::string filename, std::string name)
{
    auto file = h5::File(filename, "w");
    auto root = h5::Group(file);
    auto values = seq::to<std::vector>(sequence);
    auto numeric = std::all_of(values.begin(), values.end(), [] (const sol::object& v) { return v.get_type() == sol::type::number; });

    if (numeric)
        return lazyseq::archive::dump(root, name, seq::map(seq::view(values), [] (const sol::object& v) { return v.as<double>(); }));
    else
        return lazyseq::archive::dump(root, name, seq::map(seq::view(values), lua_tostring));
}

} // anonymous namespace




//=============================================================================
sol::table open_seq_lib(sol::this_state s)
{
    auto lua      = sol::state_view(s);
    auto module   = lua.create_table();
    auto sequence = module.new_usertype<lua_sequence>("sequence", "", sol::no_constructor);

    sequence["map"]          = [] (lua_sequence c, sol::protected_function f) { return seq::to_dynamic(seq::map(c, [f] (sol::object v) { return call(f, v); })); };
    sequence["grep"]         = sol::overload(
        [s] (lua_sequence c, sol::object test) { return grep(s, c, test, "v"); },
        [s] (lua_sequence c, sol::object test, std::string projection) { return grep(s, c, test, projection); });
    sequence["first"]        = sol::overload(
        [s] (lua_sequence c, sol::object test) { return first(s, c, test, false); },
        [s] (lua_sequence c, sol::object test, bool from_end) { return first(s, c, test, from_end); });
    sequence["unique"]       = [] (lua_sequence c) { return seq::to_dynamic(seq::unique(c, seq::identity_t(), lua_equal())); };
    sequence["repeated"]     = [] (lua_sequence c) { return seq::to_dynamic(seq::repeated(c, seq::identity_t(), lua_equal())); };
    sequence["squish"]       = [] (lua_sequence c) { return seq::to_dynamic(seq::squish(c, seq::identity_t(), lua_equal())); };
    sequence["rotor"]        = sol::overload(
        [s] (lua_sequence c, std::size_t size) { return tables(s, seq::rotor(c, size)); },
        [s] (lua_sequence c, std::size_t size, long gap) { return tables(s, seq::rotor(c, {seq::window_t{size, gap}})); },
        [s] (lua_sequence c, std::size_t size, long gap, bool partial) { return tables(s, seq::rotor(c, {seq::window_t{size, gap}}, partial)); });
    sequence["batch"]        = [s] (lua_sequence c, std::size_t size) { return tables(s, seq::batch(c, size)); };
    sequence["combinations"] = sol::overload(
        [s] (lua_sequence c) { return tables(s, seq::combinations(c)); },
        [s] (lua_sequence c, std::size_t k) { return tables(s, seq::combinations(c, k)); },
        [s] (lua_sequence c, std::size_t lo, std::size_t hi) { return tables(s, seq::combinations(c, lo, hi)); });
    sequence["permutations"] = [s] (lua_sequence c) { return tables(s, seq::permutations(c)); };
    sequence["take"]         = [] (lua_sequence c, unsigned long n) { return seq::to_dynamic(seq::take(c, n)); };
    sequence["drop"]         = [] (lua_sequence c, unsigned long n) { return seq::to_dynamic(seq::drop(c, n)); };
    sequence["sort"]         = sol::overload(
        [] (lua_sequence c) { return seq::to_dynamic(seq::sort(c, lua_less())); },
        [] (lua_sequence c, sol::protected_function by) { return seq::to_dynamic(seq::sort(c, [by] (const sol::object& a, const sol::object& b) { return call(by, a, b).as<bool>(); })); });
    sequence["pick"]         = sol::overload(
        [] (lua_sequence c, unsigned long n) { return seq::to_dynamic(seq::pick(c, n)); },
        [] (lua_sequence c, unsigned long n, unsigned seed) { return seq::to_dynamic(seq::pick(c, n, seed)); });
    sequence["roll"]         = sol::overload(
        [] (lua_sequence c, unsigned long n) { return seq::to_dynamic(seq::roll(c, n)); },
        [] (lua_sequence c, unsigned long n, unsigned seed) { return seq::to_dynamic(seq::roll(c, n, seed)); });
    sequence["reduce"]       = sol::overload(
        [] (lua_sequence c, sol::protected_function f) { return seq::reduce(c, [f] (sol::object a, sol::object b) { return call(f, a, b); }); },
        [] (lua_sequence c, sol::protected_function f, sol::object identity) { return seq::reduce(c, seq::with_identity([f] (sol::object a, sol::object b) { return call(f, a, b); }, identity)); });
    sequence["classify"]     = [s] (lua_sequence c, sol::protected_function f) { return classify(s, c, f); };
    sequence["table"]        = [] (lua_sequence c) { return sol::as_table(seq::to<std::vector>(c)); };
    sequence["elems"]        = [] (lua_sequence c) { return seq::elems(c); };
    sequence["each"]         = [] (lua_sequence c, sol::protected_function f) { for (auto v : c) call(f, v); };
    sequence["join"]         = sol::overload(
        [] (lua_sequence c) { return seq::join(seq::map(c, lua_tostring)); },
        [] (lua_sequence c, std::string separator) { return seq::join(seq::map(c, lua_tostring), separator); });
    sequence["write_h5"]     = &write_h5;

    sequence[sol::meta_function::to_string] = [] (lua_sequence) { return std::string("<seq::sequence>"); };

    module["range"]      = sol::overload(
        [s] (long n) { return objects(s, seq::range(0l, n)); },
        [s] (long a, long b) { return objects(s, seq::range(a, b)); });
    module["from"]       = [] (sol::table t) { return seq::to_dynamic(seq::view(from_table(t))); };
    module["generate"]   = [] (sol::object initial, sol::protected_function f) { return seq::to_dynamic(seq::generate(initial, [f] (sol::object v) { return call(f, v); })); };
    module["zip"]        = [s] (lua_sequence a, lua_sequence b) { return key_value_tables(s, seq::zip(a, b)); };
    module["roundrobin"] = [] (lua_sequence a, lua_sequence b) { return seq::to_dynamic(seq::roundrobin(a, b)); };
    module["pairs"]      = [s] (lua_sequence c) { return key_value_tables(s, seq::pairs(c)); };
    module["regex"]      = [] (std::string pattern) { return std::regex(pattern); };
    module["type"]       = [] (std::string name)
    {
        return [name] (sol::object v) { return sol::type_name(v.lua_state(), v.get_type()) == name; };
    };
    module["dir"]        = sol::overload(
        [s] (std::string path) { return objects(s, seq::map(lazyseq::dir(path), [] (auto p) { return p.string(); })); },
        [s] (std::string path, std::string pattern) { return objects(s, seq::map(lazyseq::dir(path, std::regex(pattern)), [] (auto p) { return p.string(); })); });

    return module;
}
