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
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "core_result.hpp"
#include "core_util.hpp"




//=============================================================================
namespace list
{




//=============================================================================
struct nil_t {};

template<typename ValueType>
struct singly_linked_t;

template<typename ValueType>
struct node_t
{
    ValueType first;
    std::shared_ptr<singly_linked_t<ValueType>> rest;
};




/**
 * @brief      An immutable singly linked list. A list is either empty (nil_t)
 *             or a node holding a value and a shared pointer to the rest of
 *             the list. Lists never change after construction, so tails are
 *             shared freely between lists.
 *
 * @tparam     ValueType  The value type of the list
 */
template<typename ValueType>
struct singly_linked_t
{
    using value_type = ValueType;
    using node_type  = node_t<ValueType>;
    using cell_type  = std::variant<nil_t, node_type>;

    singly_linked_t() {}
    singly_linked_t(const singly_linked_t& other) : cell(other.cell) {}
    singly_linked_t(singly_linked_t&& other) : cell(std::exchange(other.cell, nil_t())) {}
    singly_linked_t(ValueType first, std::shared_ptr<singly_linked_t> rest) : cell(node_type{std::move(first), std::move(rest)}) {}


    /**
     * @brief      Construct a linked list from a pair of iterators
     *
     * @param[in]  start     The begin iterator
     * @param[in]  last      The end iterator
     *
     * @tparam     Iterator  The iterator type
     */
    template<typename Iterator>
    singly_linked_t(Iterator start, Iterator last)
    {
        auto result = singly_linked_t();

        while (start != last)
        {
            result = prepend(result, ValueType(*start));
            ++start;
        }
        *this = reverse(result);
    }


    /**
     * @brief      Convert a list of values of a more specific type, one whose
     *             common type with ValueType is ValueType itself. This is what
     *             lets a list of a more specific type stand in wherever a list
     *             of a more general type is expected; O(N). Narrowing
     *             conversions (double to int, int to char) are not accepted.
     *
     * @param[in]  other      The list to convert
     *
     * @tparam     OtherType  The value type of the other list
     */
    template<
        typename OtherType,
        typename = std::enable_if_t<! std::is_same_v<OtherType, ValueType> && std::is_same_v<std::common_type_t<OtherType, ValueType>, ValueType>>>
    singly_linked_t(const singly_linked_t<OtherType>& other)
    {
        *this = map(other, [] (const OtherType& value) { return ValueType(value); });
    }


    /**
     * @brief      Destroy the linked list
     *
     * @note       This destructor makes sure not to overflow the stack by
     *             recursive calls to ~shared_ptr. See Sec. 8.1.4 of Functional
     *             Programming in C++ by Ivan Čukić.
     */
    ~singly_linked_t()
    {
        while (auto node = std::get_if<node_type>(&cell))
        {
            if (node->rest.use_count() != 1)
            {
                break;
            }
            auto rest = std::move(node->rest);
            cell = std::move(rest->cell);
        }
    }


    singly_linked_t& operator=(const singly_linked_t& other)
    {
        cell = other.cell;
        return *this;
    }


    singly_linked_t& operator=(singly_linked_t&& other)
    {
        cell = std::exchange(other.cell, nil_t());
        return *this;
    }


    cell_type cell;
};




//=============================================================================
namespace detail
{
    template<typename ValueType>
    const node_t<ValueType>* node_of(const singly_linked_t<ValueType>& list)
    {
        return std::get_if<node_t<ValueType>>(&list.cell);
    }


    /**
     * @brief      Builds a list front to back by writing into the empty cell at
     *             the end of the list under construction. The cells are not
     *             visible to anyone else until finish is called.
     *
     * @tparam     ValueType  The value type of the list
     */
    template<typename ValueType>
    class builder_t
    {
    public:
        builder_t() {}
        builder_t(const builder_t&) = delete;
        builder_t& operator=(const builder_t&) = delete;

        void push_back(ValueType value)
        {
            auto rest = std::make_shared<singly_linked_t<ValueType>>();
            auto next = rest.get();
            *last = singly_linked_t<ValueType>(std::move(value), std::move(rest));
            last = next;
        }

        singly_linked_t<ValueType> finish(singly_linked_t<ValueType> rest={})
        {
            *last = std::move(rest);
            last = &result;
            return std::exchange(result, singly_linked_t<ValueType>());
        }

    private:
        singly_linked_t<ValueType> result;
        singly_linked_t<ValueType>* last = &result;
    };
}




/**
 * @brief      Return a single linked list of a single value
 *
 * @param[in]  first      The value
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     A new linked list
 */
template<typename ValueType>
auto just(ValueType first)
{
    return singly_linked_t<ValueType>{first, std::make_shared<singly_linked_t<ValueType>>()};
}




/**
 * @brief      Return an empty list with the given value type
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     An empty linked list
 */
template<typename ValueType>
auto empty()
{
    return singly_linked_t<ValueType>{};
}




/**
 * @brief      Return true if this list is empty
 *
 * @param[in]  list       The list to check for emptiness
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     True or false
 */
template<typename ValueType>
bool empty(const singly_linked_t<ValueType>& list)
{
    return std::holds_alternative<nil_t>(list.cell);
}

template<typename ValueType>
bool is_empty(const singly_linked_t<ValueType>& list)
{
    return empty(list);
}




/**
 * @brief      Dispatch on the two shapes a list can have. Both handlers are
 *             required; the node handler receives the head value and the
 *             rest of the list.
 *
 * @param[in]  list          The list to inspect
 * @param      on_empty      Called with no arguments if the list is empty
 * @param      on_node       Called with (head, tail) otherwise
 *
 * @return     The common type of the two handlers' results
 */
template<typename ValueType, typename EmptyFunction, typename NodeFunction>
auto match(const singly_linked_t<ValueType>& list, EmptyFunction on_empty, NodeFunction on_node)
-> std::common_type_t<
    std::invoke_result_t<EmptyFunction>,
    std::invoke_result_t<NodeFunction, const ValueType&, const singly_linked_t<ValueType>&>>
{
    if (auto node = detail::node_of(list))
    {
        return on_node(node->first, *node->rest);
    }
    return on_empty();
}




/**
 * @brief      Return the number of elements in a list; O(N).
 *
 * @param[in]  list       The list
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     The length of the list
 */
template<typename ValueType>
std::size_t size(const singly_linked_t<ValueType>& list)
{
    auto count = std::size_t(0);

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        ++count;
    }
    return count;
}




/**
 * @brief      Return the value at the front of the list; O(1). The result
 *             holds error_t::empty_access if the list is empty.
 *
 * @param[in]  list       The list to get the head of
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     The value at the front, or an error
 */
template<typename ValueType>
result::result_t<ValueType> head(const singly_linked_t<ValueType>& list)
{
    if (auto node = detail::node_of(list))
    {
        return result::ok(node->first);
    }
    return result::fail<ValueType>(result::error_t::empty_access);
}




/**
 * @brief      Return the rest of the list, if this list is non-empty; O(1).
 *             The rest is shared with the given list, not copied.
 *
 * @param[in]  list       The list
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     The rest of the list, or error_t::empty_access
 */
template<typename ValueType>
result::result_t<singly_linked_t<ValueType>> tail(const singly_linked_t<ValueType>& list)
{
    if (auto node = detail::node_of(list))
    {
        return result::ok(*node->rest);
    }
    return result::fail<singly_linked_t<ValueType>>(result::error_t::empty_access);
}




/**
 * @brief      Return another list with the given value prepended; O(1).
 *
 * @param[in]  rest       The list to append to
 * @param[in]  first      The value to prepend
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     A new singly linked list
 */
template<typename ValueType>
auto prepend(const singly_linked_t<ValueType>& rest, ValueType first)
{
    return singly_linked_t<ValueType>{std::move(first), std::make_shared<singly_linked_t<ValueType>>(rest)};
}




/**
 * @brief      Return a list with the given element at the front. If the
 *             element type is more general than the list's value type, the
 *             result is a list of the more general type.
 *
 * @param[in]  list         The list to become the tail
 * @param[in]  element      The new head
 *
 * @return     A list of std::common_type_t<ValueType, ElementType>
 */
template<typename ValueType, typename ElementType>
auto add(const singly_linked_t<ValueType>& list, ElementType element)
{
    using value_type = std::common_type_t<ValueType, ElementType>;
    return prepend(singly_linked_t<value_type>(list), value_type(std::move(element)));
}




/**
 * @brief      Reverse this list; O(N).
 *
 * @param[in]  list       The list to reverse
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     A reversed version of the given list
 */
template<typename ValueType>
auto reverse(const singly_linked_t<ValueType>& list)
{
    auto result = empty<ValueType>();

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        result = prepend(result, node->first);
    }
    return result;
}




/**
 * @brief      Make a list from the given values, in order.
 *
 * @param[in]  args        The values
 *
 * @tparam     ValueTypes  The value types; the list holds their common type
 *
 * @return     A new linked list
 */
template<typename... ValueTypes>
auto from(ValueTypes... args)
{
    using value_type = std::common_type_t<ValueTypes...>;
    auto builder = detail::builder_t<value_type>();

    for (auto a : {value_type(args)...})
    {
        builder.push_back(a);
    }
    return builder.finish();
}




/**
 * @brief      Apply a function to every element, in order; O(N). The function
 *             is called exactly once per element.
 *
 * @param[in]  list          The list
 * @param      transformer   The function to apply
 *
 * @return     A list of the function's results
 */
template<typename ValueType, typename FunctionType>
auto map(const singly_linked_t<ValueType>& list, FunctionType transformer)
{
    using value_type = std::decay_t<std::invoke_result_t<FunctionType, const ValueType&>>;
    auto builder = detail::builder_t<value_type>();

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        builder.push_back(transformer(node->first));
    }
    return builder.finish();
}




/**
 * @brief      Keep those elements for which a predicate is true, preserving
 *             their order.
 *
 * @param[in]  list       The list
 * @param      predicate  The predicate function
 *
 * @return     A list, no longer than the original
 */
template<typename ValueType, typename PredicateType>
auto filter(const singly_linked_t<ValueType>& list, PredicateType predicate)
{
    auto builder = detail::builder_t<ValueType>();

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        if (predicate(node->first))
        {
            builder.push_back(node->first);
        }
    }
    return builder.finish();
}




/**
 * @brief      Concatenate two lists; O(N) in the length of the first. If the
 *             second list already has the common value type, it becomes the
 *             tail of the result without being copied.
 *
 * @param[in]  a          The first list to concatenate
 * @param[in]  b          The second list
 *
 * @tparam     ValueType  The value type of the first list
 * @tparam     OtherType  The value type of the second list
 *
 * @return     The elements of a, followed by the elements of b, in a list of
 *             std::common_type_t<ValueType, OtherType>
 */
template<typename ValueType, typename OtherType>
auto append(const singly_linked_t<ValueType>& a, const singly_linked_t<OtherType>& b)
{
    using value_type = std::common_type_t<ValueType, OtherType>;

    auto builder = detail::builder_t<value_type>();

    for (auto node = detail::node_of(a); node; node = detail::node_of(*node->rest))
    {
        builder.push_back(value_type(node->first));
    }
    return builder.finish(singly_linked_t<value_type>(b));
}

template<typename ValueType, typename OtherType>
auto operator+(const singly_linked_t<ValueType>& a, const singly_linked_t<OtherType>& b)
{
    return append(a, b);
}




/**
 * @brief      Concatenate, in order, the lists obtained by applying a
 *             list-valued function to each element.
 *
 * @param[in]  list          The list
 * @param      transformer   A function ValueType -> singly_linked_t<U>
 *
 * @return     A singly_linked_t<U>
 */
template<typename ValueType, typename FunctionType>
auto flat_map(const singly_linked_t<ValueType>& list, FunctionType transformer)
{
    using list_type  = std::decay_t<std::invoke_result_t<FunctionType, const ValueType&>>;
    using value_type = typename list_type::value_type;

    auto builder = detail::builder_t<value_type>();
    auto pending = list_type();

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        for (auto inner = detail::node_of(pending); inner; inner = detail::node_of(*inner->rest))
        {
            builder.push_back(inner->first);
        }
        pending = transformer(node->first);
    }
    return builder.finish(pending);
}




/**
 * @brief      Call a function on each element, head to tail, for its side
 *             effects.
 */
template<typename ValueType, typename FunctionType>
void foreach(const singly_linked_t<ValueType>& list, FunctionType action)
{
    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        action(node->first);
    }
}




/**
 * @brief      Left fold: op(...op(op(seed, x0), x1)..., xn). The operator is
 *             applied exactly size(list) times, head to tail.
 *
 * @param[in]  list          The list
 * @param[in]  seed          The starting value of the accumulator
 * @param      op            A function (accumulator, element) -> accumulator
 *
 * @return     The final accumulator
 */
template<typename ValueType, typename SeedType, typename OperatorType>
SeedType fold(const singly_linked_t<ValueType>& list, SeedType seed, OperatorType op)
{
    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        seed = op(std::move(seed), node->first);
    }
    return seed;
}




/**
 * @brief      Pair up the elements of two lists of equal length, combining
 *             each pair with a function. Lists of different lengths give
 *             error_t::length_mismatch and the function is never called.
 *
 * @param[in]  a          The first list
 * @param[in]  b          The second list
 * @param      combine    A function (ValueType, OtherType) -> C
 *
 * @return     A result holding a singly_linked_t<C>
 */
template<typename ValueType, typename OtherType, typename FunctionType>
auto zip_with(const singly_linked_t<ValueType>& a, const singly_linked_t<OtherType>& b, FunctionType combine)
{
    using value_type = std::decay_t<std::invoke_result_t<FunctionType, const ValueType&, const OtherType&>>;

    if (size(a) != size(b))
    {
        return result::fail<singly_linked_t<value_type>>(result::error_t::length_mismatch);
    }

    auto builder = detail::builder_t<value_type>();
    auto p = detail::node_of(a);
    auto q = detail::node_of(b);

    while (p && q)
    {
        builder.push_back(combine(p->first, q->first));
        p = detail::node_of(*p->rest);
        q = detail::node_of(*q->rest);
    }
    return result::ok(builder.finish());
}




//=============================================================================
namespace detail
{
    template<typename ValueType, typename ComparatorType>
    auto insert_sorted(const ValueType& value, const singly_linked_t<ValueType>& sorted, ComparatorType& compare)
    {
        auto builder = builder_t<ValueType>();
        auto rest = &sorted;

        while (auto node = node_of(*rest))
        {
            if (compare(value, node->first) <= 0)
            {
                break;
            }
            builder.push_back(node->first);
            rest = node->rest.get();
        }
        builder.push_back(value);
        return builder.finish(*rest);
    }
}




/**
 * @brief      Insertion sort; O(N^2). The tail is sorted first, and then the
 *             head is inserted in front of the first element it compares
 *             less than or equal to. Equal elements keep their order.
 *
 * @param[in]  list            The list
 * @param      compare         A function (a, b) -> int, negative if a comes
 *                             before b, zero if they are equivalent, positive
 *                             otherwise
 *
 * @tparam     ValueType       The value type of the list
 * @tparam     ComparatorType  The type of the comparator function
 *
 * @return     A sorted list
 */
template<typename ValueType, typename ComparatorType>
singly_linked_t<ValueType> sort(const singly_linked_t<ValueType>& list, ComparatorType&& compare)
{
    auto sorted = empty<ValueType>();
    auto reversed = reverse(list);

    for (auto node = detail::node_of(reversed); node; node = detail::node_of(*node->rest))
    {
        sorted = detail::insert_sorted(node->first, sorted, compare);
    }
    return sorted;
}

template<typename ValueType>
singly_linked_t<ValueType> sort(const singly_linked_t<ValueType>& list)
{
    return sort(list, [] (const ValueType& a, const ValueType& b) { return a < b ? -1 : (b < a ? 1 : 0); });
}




/**
 * @brief      Remove elements from the beginning of a list.
 *
 * @param[in]  list       The list to drop elements from
 * @param[in]  count      The number of elements to drop
 *
 * @tparam     ValueType  The value type of the list
 *
 * @return     A list, shortened from the front
 */
template<typename ValueType>
auto drop(singly_linked_t<ValueType> list, std::size_t count)
{
    while (count--)
    {
        auto node = detail::node_of(list);

        if (! node)
        {
            throw std::out_of_range("list::drop (cannot drop more elements than list size)");
        }
        list = singly_linked_t<ValueType>(*node->rest);
    }
    return list;
}




/**
 * @brief      Keep the first count elements of a list.
 *
 * @param[in]  list       The list
 * @param[in]  count      The number of elements to keep
 *
 * @return     A list of the given length
 */
template<typename ValueType>
auto take(const singly_linked_t<ValueType>& list, std::size_t count)
{
    auto builder = detail::builder_t<ValueType>();
    auto node = detail::node_of(list);

    while (count--)
    {
        if (! node)
        {
            throw std::out_of_range("list::take (cannot take more elements than list size)");
        }
        builder.push_back(node->first);
        node = detail::node_of(*node->rest);
    }
    return builder.finish();
}




//=============================================================================
template<typename ValueType>
std::vector<ValueType> to_vector(const singly_linked_t<ValueType>& list)
{
    auto result = std::vector<ValueType>();

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        result.push_back(node->first);
    }
    return result;
}




/**
 * @brief      Forward iterator over the values of a list. The end iterator has
 *             no position; advancing past the last node reaches it.
 */
template<typename ValueType>
struct iterator_t
{
    using iterator_category = std::forward_iterator_tag;
    using value_type        = ValueType;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const ValueType*;
    using reference         = const ValueType&;

    iterator_t& operator++()
    {
        auto rest = detail::node_of(*position)->rest.get();
        position = empty(*rest) ? nullptr : rest;
        return *this;
    }
    const ValueType& operator*() const { return detail::node_of(*position)->first; }
    const ValueType* operator->() const { return &detail::node_of(*position)->first; }
    bool operator==(const iterator_t& other) const { return position == other.position; }
    bool operator!=(const iterator_t& other) const { return position != other.position; }

    const singly_linked_t<ValueType>* position = nullptr;
};

template<typename ValueType>
auto begin(const singly_linked_t<ValueType>& list)
{
    return iterator_t<ValueType>{empty(list) ? nullptr : &list};
}

template<typename ValueType>
auto end(const singly_linked_t<ValueType>&)
{
    return iterator_t<ValueType>{};
}




/**
 * @brief      Determine whether two lists are equal: same length and equal
 *             elements in the same order.
 *
 * @param[in]  a          The first list
 * @param[in]  b          The second list
 *
 * @tparam     ValueType  The value type of the lists
 *
 * @return     True or false
 */
template<typename ValueType>
bool operator==(const singly_linked_t<ValueType>& a, const singly_linked_t<ValueType>& b)
{
    auto p = detail::node_of(a);
    auto q = detail::node_of(b);

    while (p && q)
    {
        if (! (p->first == q->first))
        {
            return false;
        }
        if (p->rest == q->rest)
        {
            return true;
        }
        p = detail::node_of(*p->rest);
        q = detail::node_of(*q->rest);
    }
    return ! p && ! q;
}

template<typename ValueType>
bool operator!=(const singly_linked_t<ValueType>& a, const singly_linked_t<ValueType>& b)
{
    return ! operator==(a, b);
}




/**
 * @brief      Render a list as "[e1 e2 e3]", using a function to turn each
 *             element into a string. The empty list is "[]".
 */
template<typename ValueType, typename RenderFunction>
std::string to_string(const singly_linked_t<ValueType>& list, RenderFunction render)
{
    auto stream = std::ostringstream();
    auto separator = "";

    stream << '[';

    for (auto node = detail::node_of(list); node; node = detail::node_of(*node->rest))
    {
        stream << separator << render(node->first);
        separator = " ";
    }
    stream << ']';
    return stream.str();
}

template<typename ValueType>
std::string to_string(const singly_linked_t<ValueType>& list)
{
    return to_string(list, [] (const ValueType& value) { return util::display(value); });
}

template<typename ValueType>
std::ostream& operator<<(std::ostream& os, const singly_linked_t<ValueType>& list)
{
    return os << to_string(list);
}

} // namespace list




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <algorithm>
#include <memory>
#include <numeric>
#include <string>
#include <vector>
#include "core_unit_test.hpp"




//=============================================================================
namespace list_test
{
    struct shape_t
    {
        virtual ~shape_t() {}
        virtual int sides() const = 0;
    };

    struct triangle_t : shape_t
    {
        int sides() const override { return 3; }
    };

    inline int ascending(int x, int y) { return x - y; }
    inline int descending(int x, int y) { return y - x; }
}




//=============================================================================
inline void test_linked_list()
{
    using list::singly_linked_t;
    using list_test::ascending;
    using list_test::descending;

    require(empty(list::empty<int>()));
    require(is_empty(list::empty<int>()));
    require(! empty(list::just(12)));
    require(value(head(list::just(12))) == 12);
    require(value(head(list::from(12, 13, 14))) == 12);
    require(value(head(prepend(list::just(12), 13))) == 13);
    require(size(list::from(12, 13, 14)) == 3);
    require(size(list::empty<int>()) == 0);

    require(error(head(list::empty<int>())) == result::error_t::empty_access);
    require(error(tail(list::empty<int>())) == result::error_t::empty_access);
    require(value(tail(list::from(1, 2, 3))) == list::from(2, 3));
    require(empty(value(tail(list::just(1)))));
    require_throws_as(value(head(list::empty<int>())), std::out_of_range);


    // add, display, equality
    auto abc = add(add(add(list::empty<int>(), 3), 2), 1);
    require(abc == list::from(1, 2, 3));
    require(abc != list::from(1, 2));
    require(abc != list::from(1, 2, 4));
    require(list::empty<int>() == list::empty<int>());
    require(to_string(abc) == "[1 2 3]");
    require(to_string(list::empty<int>()) == "[]");
    require(to_string(list::just(7)) == "[7]");
    require(to_string(list::from(std::string("Hello"), std::string("Scala"))) == "[Hello Scala]");
    require(to_string(list::from(true, false)) == "[true false]");
    require(to_string(list::from(list::from(1, 2), list::just(3))) == "[[1 2] [3]]");
    require(to_string(abc, [] (int x) { return std::to_string(x * 10); }) == "[10 20 30]");


    // add shares the receiver as the tail
    auto tail_of_abc = value(tail(add(abc, 0)));
    require(list::detail::node_of(tail_of_abc)->rest == list::detail::node_of(abc)->rest);


    // covariance
    auto more_general = add(abc, 0.5);
    require((std::is_same_v<decltype(more_general), singly_linked_t<double>>));
    require(more_general == list::from(0.5, 1.0, 2.0, 3.0));

    auto triangles = list::from(std::make_shared<list_test::triangle_t>(), std::make_shared<list_test::triangle_t>());
    auto shapes = singly_linked_t<std::shared_ptr<list_test::shape_t>>(triangles);
    require(fold(shapes, 0, [] (int n, auto s) { return n + s->sides(); }) == 6);
    require(size(append(triangles, shapes)) == 4);
    require((std::is_same_v<decltype(append(triangles, shapes)), decltype(shapes)>));

    auto widened = append(list::from(1.5), list::from(2));
    require((std::is_same_v<decltype(widened), singly_linked_t<double>>));
    require(to_string(widened) == "[1.5 2]");
    require(append(list::from(1.5, 2.7), list::from(3)) == list::from(1.5, 2.7, 3.0));
    require(list::from(1, 2) + list::from(0.25) == list::from(1.0, 2.0, 0.25));
    require((  std::is_convertible_v<singly_linked_t<int>, singly_linked_t<double>>));
    require((! std::is_convertible_v<singly_linked_t<double>, singly_linked_t<int>>));
    require((! std::is_convertible_v<singly_linked_t<int>, singly_linked_t<char>>));
    require((! std::is_constructible_v<singly_linked_t<int>, const singly_linked_t<double>&>));


    // map
    auto identity = [] (auto x) { return x; };
    auto f = [] (int x) { return x * 2; };
    auto g = [] (int x) { return x + 1; };
    require(map(list::from(1, 2, 3), f) == list::from(2, 4, 6));
    require(map(abc, identity) == abc);
    require(map(map(abc, f), g) == map(abc, [f, g] (int x) { return g(f(x)); }));
    require(empty(map(list::empty<int>(), f)));
    require(map(abc, [] (int x) { return std::to_string(x); }) == list::from(std::string("1"), std::string("2"), std::string("3")));

    auto calls = std::vector<int>();
    map(abc, [&calls] (int x) { calls.push_back(x); return x; });
    require((calls == std::vector<int>{1, 2, 3}));


    // filter
    require(filter(list::from(1, 2, 3, 4), [] (int x) { return x % 2 == 0; }) == list::from(2, 4));
    require(filter(list::from(1, 2, 3), [] (int x) { return x % 2 == 0; }) == list::just(2));
    require(filter(abc, [] (int) { return true; }) == abc);
    require(empty(filter(abc, [] (int) { return false; })));
    require(empty(filter(list::empty<int>(), [] (int) { return true; })));


    // append
    auto a = list::from(1, 2);
    auto b = list::from(3, 4, 5);
    auto c = list::from(6);
    require(append(a, b) == list::from(1, 2, 3, 4, 5));
    require(a + b == list::from(1, 2, 3, 4, 5));
    require(append(append(a, b), c) == append(a, append(b, c)));
    require(append(list::empty<int>(), a) == a);
    require(append(a, list::empty<int>()) == a);
    require(a == list::from(1, 2));
    require(append(list::from(1, 2), list::from(0.5)) == list::from(1.0, 2.0, 0.5));


    // flat_map
    require(flat_map(list::from(1, 2, 3), [] (int x) { return list::from(x, x + 1); }) == list::from(1, 2, 2, 3, 3, 4));
    require(flat_map(abc, [] (int x) { return list::just(x); }) == abc);
    require(empty(flat_map(list::empty<int>(), [] (int x) { return list::just(x); })));
    require(empty(flat_map(abc, [] (int) { return list::empty<int>(); })));
    require(flat_map(abc, [] (int x) { return x % 2 ? list::just(x) : list::empty<int>(); }) == list::from(1, 3));

    auto combinations = flat_map(abc, [] (int n)
    {
        return map(list::from(std::string("Hello"), std::string("Scala")), [n] (const std::string& s) { return std::to_string(n) + "-" + s; });
    });
    require(to_string(combinations) == "[1-Hello 1-Scala 2-Hello 2-Scala 3-Hello 3-Scala]");


    // foreach
    auto visited = std::vector<int>();
    foreach(abc, [&visited] (int x) { visited.push_back(x); });
    require((visited == std::vector<int>{1, 2, 3}));


    // fold
    require(fold(list::from(1, 2, 3), 0, [] (int s, int x) { return s + x; }) == 6);
    require(fold(list::from(1, 2, 3), 1, [] (int s, int x) { return s * x; }) == 6);
    require(fold(list::empty<int>(), 42, [] (int s, int x) { return s + x; }) == 42);
    require(fold(abc, std::string(), [] (std::string s, int x) { return s + std::to_string(x); }) == "123");
    require(fold(append(list::from(1), list::from(2, 3)), 0, [] (int s, int x) { return 10 * s + x; }) == 123);
    require(fold(list::from(1, 2, 3), 0, [] (int s, int x) { return 10 * s + x; }) == 123);


    // sort
    auto t1 = list::from(7, 1, 5, 6, 2, 3);
    require(sort(t1, ascending) == list::from(1, 2, 3, 5, 6, 7));
    require(sort(t1, descending) == list::from(7, 6, 5, 3, 2, 1));
    require(sort(abc, descending) == list::from(3, 2, 1));
    require(sort(list::just(3), ascending) == list::just(3));
    require(empty(sort(list::empty<int>(), ascending)));
    require(sort(t1) == list::from(1, 2, 3, 5, 6, 7));
    require(t1 == list::from(7, 1, 5, 6, 2, 3));

    auto unsorted = list::from(5, 3, 8, 3, 1, 9, 5, 0, 2, 3);
    auto sorted = sort(unsorted, ascending);
    auto expected = to_vector(unsorted);
    std::sort(expected.begin(), expected.end());
    require(size(sorted) == size(unsorted));
    require(to_vector(sorted) == expected);

    auto pairs = list::from(std::pair(2, 'a'), std::pair(1, 'b'), std::pair(2, 'c'), std::pair(1, 'd'));
    auto by_key = sort(pairs, [] (auto p, auto q) { return p.first - q.first; });
    require(map(by_key, [] (auto p) { return p.second; }) == list::from('b', 'd', 'a', 'c'));


    // zip_with
    auto strings = list::from(std::string("Hello"), std::string("Scala"));
    auto zipped = zip_with(list::from(4, 5), strings, [] (int n, const std::string& s) { return std::to_string(n) + "-" + s; });
    require(has_value(zipped));
    require(to_string(value(zipped)) == "[4-Hello 5-Scala]");
    require(value(zip_with(list::from(1, 2, 3), list::from(4, 5, 6), [] (int x, int y) { return x * y; })) == list::from(4, 10, 18));
    require(empty(value(zip_with(list::empty<int>(), list::empty<char>(), [] (int, char) { return 0; }))));

    auto zip_calls = 0;
    auto mismatch = zip_with(list::from(1, 2, 3), list::from(std::string("a"), std::string("b")), [&zip_calls] (int, std::string s) { ++zip_calls; return s; });
    require(! has_value(mismatch));
    require(error(mismatch) == result::error_t::length_mismatch);
    require(zip_calls == 0);
    require(error(zip_with(list::from(1), list::from(1, 2), std::plus<>())) == result::error_t::length_mismatch);
    require(error(zip_with(list::empty<int>(), list::from(1), std::plus<>())) == result::error_t::length_mismatch);


    // exceptions thrown by caller functions pass through, the receiver intact
    auto source = list::from(1, 2, 3, 4);
    auto throw_at_3 = [] (int x) { if (x == 3) throw std::runtime_error("three"); return x; };

    require_throws_as(map(source, throw_at_3), std::runtime_error);
    require(source == list::from(1, 2, 3, 4));
    require_throws_as(filter(source, [throw_at_3] (int x) { return throw_at_3(x) > 1; }), std::runtime_error);
    require(source == list::from(1, 2, 3, 4));
    require_throws_as(flat_map(source, [throw_at_3] (int x) { return list::just(throw_at_3(x)); }), std::runtime_error);
    require(source == list::from(1, 2, 3, 4));
    require_throws_as(fold(source, 0, [throw_at_3] (int s, int x) { return s + throw_at_3(x); }), std::runtime_error);
    require(source == list::from(1, 2, 3, 4));
    require_throws_as(foreach(source, [throw_at_3] (int x) { throw_at_3(x); }), std::runtime_error);
    require(source == list::from(1, 2, 3, 4));
    require_throws_as(sort(source, [] (int x, int y) -> int { if (x == 3 || y == 3) throw std::domain_error("compare"); return x - y; }), std::domain_error);
    require(source == list::from(1, 2, 3, 4));
    require_throws_as(zip_with(source, source, [throw_at_3] (int x, int y) { return throw_at_3(x) + y; }), std::runtime_error);
    require(source == list::from(1, 2, 3, 4));
    require(error(zip_with(list::from(1), list::empty<int>(), std::plus<>())) == result::error_t::length_mismatch);
    require_throws_as(value(mismatch), std::length_error);


    // match
    auto describe = [] (const singly_linked_t<int>& l)
    {
        return match(l,
            [] () { return std::string("empty"); },
            [] (int h, const singly_linked_t<int>& t) { return std::to_string(h) + " then " + to_string(t); });
    };
    require(describe(list::empty<int>()) == "empty");
    require(describe(abc) == "1 then [2 3]");


    // take, drop, reverse, iteration
    auto values = std::vector{1., 2., 3., 4., 5., 6.};
    auto A = singly_linked_t<double>(values.begin(), values.end());
    require(to_vector(A) == values);
    require(append(take(A, 3), drop(A, 3)) == A);
    require(value(head(drop(A, 2))) == 3.);
    require(empty(drop(A, 6)));
    require_throws_as(drop(A, 7), std::out_of_range);
    require_throws(take(A, 7));
    require(reverse(abc) == list::from(3, 2, 1));
    require(empty(reverse(list::empty<int>())));

    auto total = 0.0;
    for (auto x : A) total += x;
    require(total == 21.0);
    require(std::accumulate(begin(A), end(A), 0.0) == 21.0);
    require(begin(list::empty<int>()) == end(list::empty<int>()));


    // long lists do not exhaust the stack
    auto big = 200000;
    auto range = std::vector<int>(big);
    std::iota(range.begin(), range.end(), 0);

    auto L = singly_linked_t<int>(range.begin(), range.end());
    require(size(L) == std::size_t(big));
    require(value(head(reverse(L))) == big - 1);
    require(size(map(L, f)) == std::size_t(big));
    require(size(filter(L, [] (int x) { return x % 2 == 0; })) == std::size_t(big / 2));
    require(size(append(L, L)) == std::size_t(2 * big));
    require(fold(L, 0L, [] (long s, int x) { return s + x; }) == long(big) * (big - 1) / 2);
    require(L == map(L, identity));
    require(value(head(drop(L, big - 1))) + 1 == big);
}

#endif // DO_UNIT_TESTS
