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
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>




//=============================================================================
namespace result {




//=============================================================================
enum class error_t
{
    empty_access,
    length_mismatch,
};




/**
 * @brief      Either a value of type T, or the reason no value could be
 *             produced. Operations on immutable sequences which have a
 *             precondition (non-emptiness, matching lengths) return one of
 *             these, so the caller has to look at the outcome before using
 *             the value.
 *
 * @tparam     T     The value type
 */
template<typename T>
struct result_t
{
    std::variant<T, error_t> impl;
};




//=============================================================================
inline const char* describe(error_t error)
{
    switch (error)
    {
        case error_t::empty_access:    return "empty access";
        case error_t::length_mismatch: return "length mismatch";
    }
    return "unknown error";
}

template<typename T>
auto ok(T value)
{
    return result_t<T>{std::variant<T, error_t>(std::in_place_index<0>, std::move(value))};
}

template<typename T>
auto fail(error_t error)
{
    return result_t<T>{std::variant<T, error_t>(std::in_place_index<1>, error)};
}

template<typename T>
bool has_value(const result_t<T>& r)
{
    return r.impl.index() == 0;
}




/**
 * @brief      Return the error held by a result. Throws std::logic_error if
 *             the result holds a value.
 */
template<typename T>
error_t error(const result_t<T>& r)
{
    if (has_value(r))
    {
        throw std::logic_error("result::error (result holds a value)");
    }
    return std::get<1>(r.impl);
}




/**
 * @brief      Return the value held by a result. A failed result is turned
 *             into an exception of the standard type matching its error:
 *             std::out_of_range for an empty access and std::length_error for
 *             a length mismatch.
 *
 * @param[in]  r     The result to unwrap
 *
 * @tparam     T     The value type
 *
 * @return     A reference to the value
 */
template<typename T>
const T& value(const result_t<T>& r)
{
    if (! has_value(r))
    {
        switch (std::get<1>(r.impl))
        {
            case error_t::empty_access:    throw std::out_of_range("result::value (empty access)");
            case error_t::length_mismatch: throw std::length_error("result::value (length mismatch)");
        }
    }
    return std::get<0>(r.impl);
}

template<typename T, typename U>
T value_or(const result_t<T>& r, U fallback)
{
    return has_value(r) ? std::get<0>(r.impl) : T(std::move(fallback));
}

template<typename T, typename FunctionType>
auto map(const result_t<T>& r, FunctionType f)
{
    using value_type = std::invoke_result_t<FunctionType, T>;
    return has_value(r) ? ok<value_type>(f(std::get<0>(r.impl))) : fail<value_type>(std::get<1>(r.impl));
}

template<typename T>
bool operator==(const result_t<T>& a, const result_t<T>& b)
{
    return a.impl == b.impl;
}

template<typename T>
bool operator!=(const result_t<T>& a, const result_t<T>& b)
{
    return ! operator==(a, b);
}

} // namespace result




//=============================================================================
#ifdef DO_UNIT_TESTS
#include "core_unit_test.hpp"




//=============================================================================
inline void test_result()
{
    auto a = result::ok(12);
    auto b = result::fail<int>(result::error_t::empty_access);
    auto c = result::fail<int>(result::error_t::length_mismatch);

    require(  has_value(a));
    require(! has_value(b));
    require(value(a) == 12);
    require(value_or(b, 13) == 13);
    require(error(b) == result::error_t::empty_access);
    require(error(c) == result::error_t::length_mismatch);
    require(value(map(a, [] (int x) { return x * 0.5; })) == 6.0);
    require(error(map(c, [] (int x) { return x * 0.5; })) == result::error_t::length_mismatch);
    require(a == result::ok(12));
    require(a != b);
    require(b != c);
    require(std::string(describe(result::error_t::length_mismatch)) == "length mismatch");
    require_throws_as(value(b), std::out_of_range);
    require_throws_as(value(c), std::length_error);
    require_throws_as(error(a), std::logic_error);
}

#endif // DO_UNIT_TESTS
