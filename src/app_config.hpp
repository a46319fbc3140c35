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
#include <iomanip>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>




//=============================================================================
namespace fnl
{
    using config_parameter_t     = std::variant<int, double, std::string>;
    using config_parameter_map_t = std::map<std::string, config_parameter_t>;
    using config_string_map_t    = std::map<std::string, std::string>;

    //=========================================================================
    class config_t;
    class config_template_t;

    //=========================================================================
    inline auto argv_to_string_map(int argc, const char* argv[]);
    inline auto config_template();
    inline void pretty_print(std::ostream& os, std::string header, const config_t& parameters);
};




/**
 * @brief      A set of typed run parameters. The keys and the type of each
 *             value are fixed by the template the config was created from;
 *             setting an unknown key, or a value of the wrong type, throws
 *             std::invalid_argument.
 */
class fnl::config_t
{
public:

    //=========================================================================
    config_t() {}
    config_t(config_parameter_map_t parameters, config_string_map_t usage_desc)
    : parameters(parameters)
    , template_items(parameters)
    , usage_desc(usage_desc) {}

    auto get_int(std::string key) const
    {
        return get<int>(key);
    }

    auto get_string(std::string key) const
    {
        return get<std::string>(key);
    }

    const auto& help_at(std::string key) const
    {
        return usage_desc.at(key);
    }

    template<typename ValueType>
    ValueType get(std::string key) const
    {
        if (! template_items.count(key))
        {
            throw std::invalid_argument("fnl::config_t (no option '" + key + "')");
        }
        try {
            return std::get<ValueType>(parameters.at(key));
        }
        catch (const std::bad_variant_access&)
        {
            throw std::invalid_argument("fnl::config_t (wrong type for key '" + key + "')");
        }
    }

    template<typename Mapping>
    config_t& update(const Mapping& items)
    {
        for (const auto& item : items)
        {
            set(item.first, item.second);
        }
        return *this;
    }

    config_t& set(std::string key, std::string value)
    {
        if (! template_items.count(key))
        {
            throw std::invalid_argument("fnl::config_t (no option '" + key + "')");
        }
        auto parsed = config_parameter_t(value);

        try {
            switch (template_items.at(key).index())
            {
                case 0: parsed = std::stoi(value); break;
                case 1: parsed = std::stod(value); break;
            }
        }
        catch (const std::logic_error&)
        {
            throw std::invalid_argument("fnl::config_t (could not parse '" + value + "' for key '" + key + "')");
        }
        return set(key, parsed);
    }

    config_t& set(std::string key, config_parameter_t value)
    {
        if (! template_items.count(key))
        {
            throw std::invalid_argument("fnl::config_t (no option '" + key + "')");
        }
        if (value.index() != template_items.at(key).index())
        {
            throw std::invalid_argument("fnl::config_t (wrong data type for option '" + key + "')");
        }
        parameters[key] = value;

        return *this;
    }

    auto begin() const
    {
        return parameters.begin();
    }

    auto end() const
    {
        return parameters.end();
    }

private:
    //=========================================================================
    config_parameter_map_t parameters;
    config_parameter_map_t template_items;
    config_string_map_t usage_desc;
};




//=============================================================================
class fnl::config_template_t
{
public:

    //=========================================================================
    config_template_t() {}

    config_template_t& item(std::string key, config_parameter_t default_value, std::string usage="")
    {
        if (parameters.count(key))
        {
            throw std::invalid_argument("fnl::config_template_t::item (option '" + key + "' already exists)");
        }
        parameters[key] = default_value;
        usage_desc[key] = usage;
        return *this;
    }

    config_t create() const
    {
        return config_t(parameters, usage_desc);
    }

private:
    //=========================================================================
    config_parameter_map_t parameters;
    config_string_map_t usage_desc;
};




/**
 * @brief      Collect command line arguments of the form key=value. The
 *             program name is skipped; any other argument without an '='
 *             sign, or a key given twice, throws std::invalid_argument.
 */
auto fnl::argv_to_string_map(int argc, const char* argv[])
{
    config_string_map_t items;

    for (int n = 1; n < argc; ++n)
    {
        std::string arg = argv[n];
        std::string::size_type eq_index = arg.find('=');

        if (eq_index == std::string::npos)
        {
            throw std::invalid_argument("fnl::argv_to_string_map (expected key=value, got " + arg + ")");
        }

        std::string key = arg.substr(0, eq_index);
        std::string val = arg.substr(eq_index + 1);

        if (items.count(key))
        {
            throw std::invalid_argument("fnl::argv_to_string_map (duplicate parameter " + key + ")");
        }
        items[key] = val;
    }
    return items;
}

auto fnl::config_template()
{
    return config_template_t();
}

void fnl::pretty_print(std::ostream& os, std::string header, const config_t& parameters)
{
    using std::left;
    using std::setw;
    using std::setfill;

    os << std::string(52, '=') << "\n";
    os << header << ":\n\n";

    std::ios orig(nullptr);
    orig.copyfmt(os);

    for (const auto& [k, v] : parameters)
    {
        auto put_value = [&os] (auto v) { os << v; };

        os << '\t' << left << setw(24) << setfill('.') << k << ' ';
        os << setw(12) << setfill(' ');

        std::visit(put_value, v);

        os << parameters.help_at(k);
        os << '\n';
    }

    os << '\n';
    os.copyfmt(orig);
}




//=============================================================================
#ifdef DO_UNIT_TESTS
#include <sstream>
#include "core_unit_test.hpp"




//=============================================================================
inline void test_config()
{
    auto cfg = fnl::config_template()
    .item("count", 10, "number of elements")
    .item("ratio", 0.5, "a fraction")
    .item("order", "ascending", "sort order")
    .create();

    require(cfg.get_int("count") == 10);
    require(cfg.get<double>("ratio") == 0.5);
    require(cfg.get_string("order") == "ascending");
    require_throws(cfg.get_int("ratio"));
    require_throws(cfg.get_int("missing"));
    require_throws(fnl::config_template().item("a", 1).item("a", 2));

    const char* argv[] = {"prog", "count=25", "order=descending"};
    cfg.update(fnl::argv_to_string_map(3, argv));
    require(cfg.get_int("count") == 25);
    require(cfg.get_string("order") == "descending");
    require(cfg.get<double>("ratio") == 0.5);

    require_throws(cfg.set("count", std::string("many")));
    require_throws(cfg.set("count", fnl::config_parameter_t(2.5)));
    require_throws(cfg.set("colour", std::string("red")));

    const char* duplicate[] = {"prog", "count=1", "count=2"};
    const char* malformed[] = {"prog", "count"};
    require_throws(fnl::argv_to_string_map(3, duplicate));
    require_throws(fnl::argv_to_string_map(2, malformed));

    auto stream = std::ostringstream();
    fnl::pretty_print(stream, "config", cfg);
    require(stream.str().find("number of elements") != std::string::npos);
}

#endif // DO_UNIT_TESTS
