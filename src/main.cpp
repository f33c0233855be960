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
#include <cstdio>
#include <lua.hpp>
#include <sol/sol.hpp>
#include "app_config.hpp"




//=============================================================================
sol::table open_seq_lib(sol::this_state s);




//=============================================================================
static auto config_template()
{
    return lazyseq::config_template()
    .item("seed",         42, "random seed exposed to the script as config.seed")
    .item("output",       "", "HDF5 file the script may write to (empty for none)");
}




//=============================================================================
int main(int argc, const char* argv[])
{
    if (argc < 2)
    {
        std::printf("usage: lazyseq-lua prog.lua <key=val parameters>\n");
        return 0;
    }

    try {
        auto cfg = config_template().create().update(lazyseq::argv_to_string_map(argc, argv));
        auto lua = sol::state();

        lua.open_libraries(sol::lib::base, sol::lib::math, sol::lib::package, sol::lib::string, sol::lib::table);
        lua.require("seq", sol::c_call<decltype(&open_seq_lib), &open_seq_lib>, false);

        auto config = lua.create_named_table("config");

        for (const auto& [key, value] : cfg)
        {
            std::visit([&config, &key = key] (const auto& v) { config[key] = v; }, value);
        }
        lua.script_file(argv[1]);
    }
    catch (const std::exception& e)
    {
        std::printf("lazyseq-lua: %s\n", e.what());
        return 1;
    }
    return 0;
}
