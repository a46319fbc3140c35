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
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include "core_result.hpp"
#include "core_util.hpp"




//=============================================================================
namespace maybe {




/**
 * @brief      A container of at most one value: either nothing, or just(v).
 *
 * @tparam     T     The value type
 */
template<typename T>
struct maybe_t
{
    using value_type = T;
    std::optional<T> impl;
};




//=============================================================================
template<typename T>
auto just(T t)
{
    return maybe_t<T>{{std::move(t)}};
}

template<typename T>
auto nothing()
{
    return maybe_t<T>{{}};
}

template<typename T>
bool has_value(const maybe_t<T>& m)
{
    return m.impl.has_value();
}

template<typename T>
result::result_t<T> get(const maybe_t<T>& m)
{
    return has_value(m) ? result::ok(m.impl.value()) : result::fail<T>(result::error_t::empty_access);
}

template<typename T, typename U>
T value_or(const maybe_t<T>& m, U fallback)
{
    return m.impl.value_or(std::move(fallback));
}

template<typename T, typename NothingFunction, typename JustFunction>
auto match(const maybe_t<T>& m, NothingFunction on_nothing, JustFunction on_just)
-> std::common_type_t<std::invoke_result_t<NothingFunction>, std::invoke_result_t<JustFunction, const T&>>
{
    if (has_value(m))
    {
        return on_just(m.impl.value());
    }
    return on_nothing();
}

template<typename T, typename F>
auto map(const maybe_t<T>& m, F f)
{
    using value_type = std::decay_t<std::invoke_result_t<F, const T&>>;
    return has_value(m) ? just<value_type>(f(m.impl.value())) : nothing<value_type>();
}




/**
 * @brief      Apply a function returning a maybe_t to the value, if there is
 *             one. The function's result is returned as it is, so there is no
 *             maybe of a maybe.
 *
 * @param[in]  m     The maybe
 * @param      f     A function T -> maybe_t<U>
 *
 * @return     A maybe_t<U>
 */
template<typename T, typename F>
auto flat_map(const maybe_t<T>& m, F f)
{
    using maybe_type = std::decay_t<std::invoke_result_t<F, const T&>>;
    return has_value(m) ? f(m.impl.value()) : maybe_type{};
}

template<typename T, typename P>
auto filter(const maybe_t<T>& m, P predicate)
{
    return has_value(m) && predicate(m.impl.value()) ? m : nothing<T>();
}

template<typename T, typename U>
auto zip(const maybe_t<T>& o, const maybe_t<U>& p)
{
    return has_value(o) && has_value(p) ? just(std::pair(o.impl.value(), p.impl.value())) : nothing<std::pair<T, U>>();
}

template<typename T>
bool operator==(const maybe_t<T>& a, const maybe_t<T>& b)
{
    return a.impl == b.impl;
}

template<typename T>
bool operator!=(const maybe_t<T>& a, const maybe_t<T>& b)
{
    return ! operator==(a, b);
}

template<typename T>
std::string to_string(const maybe_t<T>& m)
{
    if (! has_value(m))
    {
        return "Nothing";
    }
    return "Just(" + util::display(m.impl.value()) + ")";
}

template<typename T>
std::ostream& operator<<(std::ostream& os, const maybe_t<T>& m)
{
    return os << to_string(m);
}

} // namespace maybe




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <functional>
#include <stdexcept>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_maybe()
{
    auto just3 = maybe::just(3);
    auto is_even = [] (int x) { return x % 2 == 0; };

    require(  has_value(maybe::just(12)));
    require(! has_value(maybe::nothing<int>()));
    require(value(get(just3)) == 3);
    require(error(get(maybe::nothing<int>())) == result::error_t::empty_access);
    require_throws_as(value(get(maybe::nothing<int>())), std::out_of_range);
    require(value_or(maybe::nothing<int>(), 4) == 4);
    require(value_or(just3, 4) == 3);

    require(map(just3, [] (int x) { return x * 2; }) == maybe::just(6));
    require(! has_value(map(maybe::nothing<double>(), std::negate<>())));
    require(map(just3, [] (int x) { return std::to_string(x); }) == maybe::just(std::string("3")));

    require(flat_map(just3, [is_even] (int x) { return maybe::just(is_even(x)); }) == maybe::just(false));
    require(flat_map(just3, [] (int) { return maybe::nothing<double>(); }) == maybe::nothing<double>());
    require(flat_map(maybe::nothing<int>(), [] (int x) { return maybe::just(x); }) == maybe::nothing<int>());

    require(filter(just3, is_even) == maybe::nothing<int>());
    require(filter(just3, [] (int x) { return x % 2 != 0; }) == just3);
    require(filter(maybe::nothing<int>(), [] (int) { return true; }) == maybe::nothing<int>());

    require(  has_value(zip(maybe::just(12), maybe::just(13.0))));
    require(! has_value(zip(maybe::just(12), maybe::nothing<double>())));
    require(! has_value(zip(maybe::nothing<int>(), maybe::just(13.0))));
    require(value(get(zip(maybe::just(12), maybe::just(13.0)))) == std::pair(12, 13.0));

    require(to_string(just3) == "Just(3)");
    require(to_string(maybe::just(true)) == "Just(true)");
    require(to_string(maybe::nothing<int>()) == "Nothing");
    require(match(just3, [] () { return 0; }, [] (int x) { return x + 1; }) == 4);
    require(match(maybe::nothing<int>(), [] () { return 0; }, [] (int x) { return x + 1; }) == 0);

    auto failing = [] (int) -> int { throw std::runtime_error("no"); };
    require_throws_as(map(just3, failing), std::runtime_error);
    require_throws_as(flat_map(just3, [failing] (int x) { return maybe::just(failing(x)); }), std::runtime_error);
    require_throws_as(filter(just3, [failing] (int x) { return failing(x) > 0; }), std::runtime_error);
    require(just3 == maybe::just(3));
    require(! has_value(map(maybe::nothing<int>(), failing)));
}

#endif // DO_UNIT_TESTS
