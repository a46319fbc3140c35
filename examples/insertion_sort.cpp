#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>
#include "app_config.hpp"
#include "core_linked_list.hpp"
#include "core_util.hpp"




//=============================================================================
int main(int argc, const char* argv[])
{
    try {
        auto cfg_template = fnl::config_template()
        .item("count",            1000, "number of list elements")
        .item("seed",                1, "random number seed")
        .item("order",     "ascending", "sort order: [ascending|descending]");

        auto cfg   = cfg_template.create().update(fnl::argv_to_string_map(argc, argv));
        auto count = cfg.get_int("count");
        auto order = cfg.get_string("order");

        if (count < 0)
        {
            throw std::invalid_argument("insertion_sort (count must be non-negative)");
        }
        if (order != "ascending" && order != "descending")
        {
            throw std::invalid_argument("insertion_sort (order must be ascending or descending)");
        }
        fnl::pretty_print(std::cout, "config", cfg);




        //=====================================================================
        auto engine = std::mt19937(cfg.get_int("seed"));
        auto dist   = std::uniform_int_distribution<int>(0, count);
        auto values = std::vector<int>(count);

        std::generate(values.begin(), values.end(), [&] () { return dist(engine); });

        auto sign     = order == "ascending" ? 1 : -1;
        auto compare  = [sign] (int x, int y) { return sign * (x < y ? -1 : (y < x ? 1 : 0)); };
        auto unsorted = list::singly_linked_t<int>(values.begin(), values.end());




        //=====================================================================
        auto start  = std::chrono::high_resolution_clock::now();
        auto sorted = sort(unsorted, compare);
        auto finish = std::chrono::high_resolution_clock::now();

        std::sort(values.begin(), values.end(), [compare] (int x, int y) { return compare(x, y) < 0; });

        auto in_order = true;
        auto previous = begin(sorted);

        for (auto it = begin(sorted); it != end(sorted); ++it)
        {
            in_order = in_order && compare(*previous, *it) <= 0;
            previous = it;
        }

        std::printf("elements ....................... %zu\n", size(sorted));
        std::printf("in order ....................... %s\n", in_order ? "yes" : "no");
        std::printf("permutation of input ........... %s\n", to_vector(sorted) == values ? "yes" : "no");
        std::printf("seconds ........................ %lf\n", 1e-9 * std::chrono::duration_cast<std::chrono::nanoseconds>(finish - start).count());

        if (count <= 20)
        {
            std::cout << util::format("%s -> %s", to_string(unsorted).data(), to_string(sorted).data()) << std::endl;
        }
        return in_order && to_vector(sorted) == values ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        return 1;
    }
}
