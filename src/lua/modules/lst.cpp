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
#include <ostream>
#include <string>
#include <vector>
#include <lua.hpp>
#include <sol/sol.hpp>
#include "core_linked_list.hpp"
#include "core_maybe.hpp"




//=============================================================================
namespace lua_lst
{




/**
 * @brief      A Lua value held in a list or a maybe. Equality is Lua's ==
 *             (honouring __eq), and values are printed with Lua's tostring.
 */
struct value_t
{
    sol::object object;
};

inline bool operator==(const value_t& a, const value_t& b)
{
    auto L = a.object.lua_state();
    a.object.push(L);
    b.object.push(L);
    auto equal = lua_compare(L, -2, -1, LUA_OPEQ) == 1;
    lua_pop(L, 2);
    return equal;
}

inline std::ostream& operator<<(std::ostream& os, const value_t& v)
{
    auto lua = sol::state_view(v.object.lua_state());
    sol::function tostring = lua["tostring"];
    std::string string = tostring(v.object);
    return os << string;
}

using list_t  = list::singly_linked_t<value_t>;
using maybe_t = maybe::maybe_t<value_t>;

} // namespace lua_lst




//=============================================================================
sol::table open_lst_lib(sol::this_state s)
{
    using lua_lst::value_t;
    using lua_lst::list_t;
    using lua_lst::maybe_t;

    auto lua    = sol::state_view(s);
    auto module = lua.create_table();
    auto lst    = module.new_usertype<list_t>("list", sol::no_constructor);
    auto opt    = module.new_usertype<maybe_t>("maybe", sol::no_constructor);

    lst["head"]     = [] (const list_t& l) -> sol::object { return value(head(l)).object; };
    lst["tail"]     = [] (const list_t& l) -> list_t { return value(tail(l)); };
    lst["is_empty"] = [] (const list_t& l) { return is_empty(l); };
    lst["size"]     = [] (const list_t& l) { return size(l); };
    lst["add"]      = [] (const list_t& l, sol::object x) { return prepend(l, value_t{x}); };
    lst["append"]   = [] (const list_t& a, const list_t& b) { return append(a, b); };
    lst["reverse"]  = [] (const list_t& l) { return reverse(l); };

    lst["map"] = [] (const list_t& l, sol::function f)
    {
        return map(l, [f] (const value_t& x) { return value_t{f(x.object).get<sol::object>()}; });
    };
    lst["filter"] = [] (const list_t& l, sol::function p)
    {
        return filter(l, [p] (const value_t& x) { return p(x.object).get<bool>(); });
    };
    lst["flat_map"] = [] (const list_t& l, sol::function f)
    {
        return flat_map(l, [f] (const value_t& x) { return f(x.object).get<list_t>(); });
    };
    lst["foreach"] = [] (const list_t& l, sol::function f)
    {
        foreach(l, [f] (const value_t& x) { f(x.object); });
    };
    lst["sort"] = [] (const list_t& l, sol::function compare)
    {
        return sort(l, [compare] (const value_t& a, const value_t& b) { return compare(a.object, b.object).get<int>(); });
    };
    lst["zip_with"] = [] (const list_t& a, const list_t& b, sol::function f) -> list_t
    {
        return value(zip_with(a, b, [f] (const value_t& x, const value_t& y) { return value_t{f(x.object, y.object).get<sol::object>()}; }));
    };
    lst["fold"] = [] (const list_t& l, sol::object seed, sol::function op)
    {
        return fold(l, seed, [op] (sol::object acc, const value_t& x) { return op(acc, x.object).get<sol::object>(); });
    };

    lst[sol::meta_function::to_string]     = [] (const list_t& l) { return to_string(l); };
    lst[sol::meta_function::concatenation] = [] (const list_t& a, const list_t& b) { return append(a, b); };
    lst[sol::meta_function::length]        = [] (const list_t& l) { return size(l); };
    lst[sol::meta_function::equal_to]      = [] (const list_t& a, const list_t& b) { return a == b; };

    opt["has_value"] = [] (const maybe_t& m) { return has_value(m); };
    opt["get"]       = [] (const maybe_t& m) -> sol::object { return value(get(m)).object; };
    opt["map"]       = [] (const maybe_t& m, sol::function f)
    {
        return map(m, [f] (const value_t& x) { return value_t{f(x.object).get<sol::object>()}; });
    };
    opt["flat_map"]  = [] (const maybe_t& m, sol::function f)
    {
        return flat_map(m, [f] (const value_t& x) { return f(x.object).get<maybe_t>(); });
    };
    opt["filter"]    = [] (const maybe_t& m, sol::function p)
    {
        return filter(m, [p] (const value_t& x) { return p(x.object).get<bool>(); });
    };
    opt[sol::meta_function::to_string] = [] (const maybe_t& m) { return to_string(m); };
    opt[sol::meta_function::equal_to]  = [] (const maybe_t& a, const maybe_t& b) { return a == b; };

    module["empty"]   = [] () { return list_t(); };
    module["nothing"] = [] () { return maybe::nothing<value_t>(); };
    module["just"]    = [] (sol::object x) { return maybe::just(value_t{x}); };
    module["from"]    = [] (sol::table t)
    {
        auto values = std::vector<value_t>();

        for (std::size_t n = 1; n <= t.size(); ++n)
        {
            values.push_back(value_t{t.get<sol::object>(n)});
        }
        return list_t(values.begin(), values.end());
    };

    return module;
}
