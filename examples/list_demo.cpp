#include <cstdio>
#include <iostream>
#include <string>
#include "core_linked_list.hpp"
#include "core_util.hpp"




//=============================================================================
using int_list = list::singly_linked_t<int>;




//=============================================================================
std::string classify(const int_list& l)
{
    return match(l,
        [] () { return std::string("List is empty"); },
        [] (int h, const int_list& t)
        {
            if (! empty(t))
            {
                auto subhead = value(head(t));
                auto subtail = value(tail(t));

                if (subhead == 0)
                {
                    return std::string("Guard works");
                }
                return util::format("Head is %d, subhead is %d and tail is %s", h, subhead, to_string(subtail).data());
            }
            if (h == -1 || h == -2)
            {
                return std::string("Multi-pattern works");
            }
            return util::format("Head is %d and tail is %s", h, to_string(t).data());
        });
}




//=============================================================================
int main()
{
    auto integers = add(add(add(list::empty<int>(), 3), 2), 1);
    auto another  = list::from(4, 5);
    auto clone    = list::from(1, 2, 3);
    auto strings  = list::from(std::string("Hello"), std::string("Scala"));

    std::cout << integers << std::endl;
    std::cout << strings << std::endl;
    std::cout << map(integers, [] (int x) { return x * 2; }) << std::endl;
    std::cout << filter(integers, [] (int x) { return x % 2 == 0; }) << std::endl;
    std::cout << integers + another << std::endl;
    std::cout << flat_map(integers, [] (int x) { return list::from(x, x + 1); }) << std::endl;
    std::cout << std::boolalpha << (clone == integers) << std::endl;

    foreach(integers, [] (int x) { std::cout << x << std::endl; });
    std::cout << sort(integers, [] (int x, int y) { return y - x; }) << std::endl;

    auto zipped = zip_with(another, strings, [] (int n, const std::string& s) { return std::to_string(n) + "-" + s; });

    if (has_value(zipped))
    {
        std::cout << value(zipped) << std::endl;
    }

    auto mismatch = zip_with(integers, strings, [] (int n, const std::string& s) { return std::to_string(n) + "-" + s; });

    if (! has_value(mismatch))
    {
        std::printf("zip_with %s %s: %s\n", to_string(integers).data(), to_string(strings).data(), describe(error(mismatch)));
    }

    std::cout << fold(integers, 0, [] (int a, int x) { return a + x; }) << std::endl;




    //=========================================================================
    auto combinations = flat_map(integers, [strings] (int n)
    {
        return map(strings, [n] (const std::string& s) { return std::to_string(n) + "-" + s; });
    });
    std::cout << combinations << std::endl << std::endl;




    //=========================================================================
    std::cout << classify(list::empty<int>()) << std::endl;
    std::cout << classify(list::just(11)) << std::endl;
    std::cout << classify(list::from(22, 21)) << std::endl;
    std::cout << classify(list::from(44, 43, 42, 41)) << std::endl;
    std::cout << classify(list::just(-1)) << std::endl;
    std::cout << classify(list::from(22, 0)) << std::endl;

    return 0;
}
