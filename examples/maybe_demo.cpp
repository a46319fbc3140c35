#include <functional>
#include <iostream>
#include "core_maybe.hpp"
#include "core_util.hpp"




//=============================================================================
int main()
{
    auto just3 = maybe::just(3);

    std::cout << just3 << std::endl;
    std::cout << map(just3, [] (int x) { return x * 2; }) << std::endl;
    std::cout << flat_map(just3, [] (int x) { return maybe::just(x % 2 == 0); }) << std::endl;
    std::cout << filter(just3, [] (int x) { return x % 2 == 0; }) << std::endl;
    std::cout << filter(just3, [] (int x) { return x % 2 != 0; }) << std::endl;
    std::cout << map(zip(just3, maybe::just(4)), util::apply_to(std::plus<>())) << std::endl;
    std::cout << map(zip(just3, maybe::nothing<int>()), util::apply_to(std::plus<>())) << std::endl;

    return 0;
}
