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
#include <cstdio>
#include <ios>
#include <sstream>
#include <string>
#include <tuple>




//=============================================================================
namespace util {




/**
 * @brief      Helper function to turn a function f(a, b, ...) of several
 *             variables into a function g(std::tuple(a, b, ...)) of a single
 *             tuple. This enables constructs like map(zip(a, b), apply_to([]
 *             (auto x, auto y) { return x + y; })), where zip turns a = F<T>
 *             and b = F<U> into F<std::pair<T, U>>.
 *
 * @param[in]  function      The function f(a, b, ...)
 *
 * @tparam     FunctionType  The type of the function f
 *
 * @return     A function g(std::tuple(a, b, ...)) of a single tuple
 */
template<typename FunctionType>
auto apply_to(FunctionType function)
{
    return [function] (auto t) { return std::apply(function, t); };
}




/**
 * @brief      Wrapper for the snprintf function.
 *
 * @param[in]  format_string  The c-style format string to use
 * @param[in]  args           The arguments for the format string
 *
 * @tparam     Args           The argument types
 *
 * @return     A formatted std::string.
 *
 * @note       This function is not meant to format long strings; the length of
 *             the result string is < 2048. Longer results are (safely)
 *             truncated.
 */
template<typename... Args>
std::string format(const char* format_string, Args... args)
{
    char result[2048];
    std::snprintf(result, 2048, format_string, args...);
    return result;
}




/**
 * @brief      Render a value the way it is shown inside a list or a maybe:
 *             with its stream insertion operator, booleans as true / false.
 *
 * @param[in]  value  The value to render
 *
 * @tparam     T      The value type; must have an operator<<
 *
 * @return     A string
 */
template<typename T>
std::string display(const T& value)
{
    auto stream = std::ostringstream();
    stream << std::boolalpha << value;
    return stream.str();
}

} // namespace util




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <functional>
#include <utility>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_util()
{
    require(util::format("%d-%s", 4, "Hello") == "4-Hello");
    require(util::format("[%5.2f]", 3.14159) == "[ 3.14]");
    require(util::display(12) == "12");
    require(util::display(false) == "false");
    require(util::display(std::string("Scala")) == "Scala");
    require(util::apply_to(std::plus<>())(std::pair(1, 2)) == 3);
    require(util::apply_to([] (int a, int b, int c) { return a * b * c; })(std::tuple(2, 3, 4)) == 24);
}

#endif // DO_UNIT_TESTS
