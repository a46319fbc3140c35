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
#include <iostream>
#include <lua.hpp>
#include <sol/sol.hpp>
#include "core_unit_test.hpp"




//=============================================================================
int test_app();
int test_core();
sol::table open_lst_lib(sol::this_state s);




//=============================================================================
sol::table open_fnl_lib(sol::this_state s)
{
    auto lua = sol::state_view(s);
    auto module = lua.create_table();

    module["unit_tests"] = [] ()
    {
        start_unit_tests();
        test_core();
        test_app();
        return report_test_results();
    };

    module["version"] = [] () { return FNL_VERSION; };
    return module;
}




//=============================================================================
int main(int argc, const char* argv[])
{
    if (argc != 2)
    {
        std::printf("usage: fnl prog.lua\n");
        return 0;
    }


    auto lua = sol::state();
    lua.open_libraries(sol::lib::base, sol::lib::math, sol::lib::package, sol::lib::string, sol::lib::table);
    lua.require("fnl", sol::c_call<decltype(&open_fnl_lib), &open_fnl_lib>, false);
    lua.require("lst", sol::c_call<decltype(&open_lst_lib), &open_lst_lib>, false);


    try {
        lua.script_file(argv[1]);
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        return 1;
    }
    return 0;
}
