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
namespace lazyseq
{
    using config_parameter_t     = std::variant<int, double, std::string>;
    using config_parameter_map_t = std::map<std::string, config_parameter_t>;
    using config_string_map_t    = std::map<std::string, std::string>;

    //=========================================================================
    class config_t;
    class config_template_t;

    //=========================================================================
    inline config_string_map_t argv_to_string_map(int argc, const char* argv[]);
    inline config_template_t config_template();
    inline void pretty_print(std::ostream& os, std::string header, const config_t& parameters);
};




/**
 * @brief      A set of typed run-time options. Every option is declared by a
 *             config_template_t, which fixes its type (int, double, or string)
 *             and its default. Setting an undeclared option, or a value of the
 *             wrong type, throws std::invalid_argument.
 */
class lazyseq::config_t
{
public:

    //=========================================================================
    config_t() {}
    config_t(config_parameter_map_t parameters, config_string_map_t usage_desc)
    : parameters(parameters)
    , template_items(parameters)
    , usage_desc(usage_desc) {}

    int get_int(std::string key) const
    {
        return get<int>(key);
    }

    double get_double(std::string key) const
    {
        return get<double>(key);
    }

    std::string get_string(std::string key) const
    {
        return get<std::string>(key);
    }

    const config_parameter_t& at(std::string key) const
    {
        return parameters.at(require_option(key));
    }

    const std::string& help_at(std::string key) const
    {
        return usage_desc.at(require_option(key));
    }

    template<typename ValueType>
    ValueType get(std::string key) const
    {
        if (auto value = std::get_if<ValueType>(&at(key)))
        {
            return *value;
        }
        throw std::invalid_argument("lazyseq::config_t (wrong type for option " + key + ")");
    }

    template<typename Mapping>
    config_t& update(const Mapping& mapping)
    {
        for (const auto& item : mapping)
        {
            set(item.first, item.second);
        }
        return *this;
    }

    /**
     * @brief      Set an option from its string form, which is parsed as the
     *             type the option was declared with.
     */
    config_t& set(std::string key, std::string value)
    {
        auto parse_error = [&] (const char* expected)
        {
            return std::invalid_argument("lazyseq::config_t (option " + key + " expects " + expected + ", got '" + value + "')");
        };
        auto consumed = std::size_t(0);

        switch (template_items.at(require_option(key)).index())
        {
            case 0:
                try {
                    auto parsed = std::stoi(value, &consumed);
                    if (consumed != value.size()) throw parse_error("an int");
                    return set(key, config_parameter_t(parsed));
                }
                catch (const std::logic_error&) { throw parse_error("an int"); }
            case 1:
                try {
                    auto parsed = std::stod(value, &consumed);
                    if (consumed != value.size()) throw parse_error("a double");
                    return set(key, config_parameter_t(parsed));
                }
                catch (const std::logic_error&) { throw parse_error("a double"); }
            default:
                return set(key, config_parameter_t(value));
        }
    }

    config_t& set(std::string key, const char* value)
    {
        return set(key, std::string(value));
    }

    config_t& set(std::string key, config_parameter_t value)
    {
        if (value.index() != template_items.at(require_option(key)).index())
        {
            throw std::invalid_argument("lazyseq::config_t (wrong data type for option " + key + ")");
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
    const std::string& require_option(const std::string& key) const
    {
        if (! template_items.count(key))
        {
            throw std::invalid_argument("lazyseq::config_t (no option " + key + ")");
        }
        return key;
    }

    config_parameter_map_t parameters;
    config_parameter_map_t template_items;
    config_string_map_t usage_desc;
};




//=============================================================================
class lazyseq::config_template_t
{
public:

    //=========================================================================
    config_template_t() {}

    config_template_t& item(std::string key, config_parameter_t default_value, std::string usage="")
    {
        if (parameters.count(key))
        {
            throw std::invalid_argument("lazyseq::config_template_t::item (option " + key + " already exists)");
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




//=============================================================================
lazyseq::config_string_map_t lazyseq::argv_to_string_map(int argc, const char* argv[])
{
    auto items = config_string_map_t();

    for (int n = 0; n < argc; ++n)
    {
        auto arg = std::string(argv[n]);
        auto eq_index = arg.find('=');

        if (eq_index != std::string::npos)
        {
            auto key = arg.substr(0, eq_index);
            auto val = arg.substr(eq_index + 1);

            if (items.count(key))
            {
                throw std::invalid_argument("lazyseq::argv_to_string_map (duplicate parameter " + key + ")");
            }
            items[key] = val;
        }
    }
    return items;
}

lazyseq::config_template_t lazyseq::config_template()
{
    return config_template_t();
}

void lazyseq::pretty_print(std::ostream& os, std::string header, const config_t& parameters)
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
        os << '\t' << left << setw(24) << setfill('.') << k << ' ';
        os << setw(12) << setfill(' ');
        std::visit([&os] (const auto& value) { os << value; }, v);
        os << parameters.help_at(k) << '\n';
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
    auto cfg = lazyseq::config_template()
    .item("n",       5,         "length")
    .item("ratio",   0.5,       "a fraction")
    .item("output",  "out.h5",  "where to write")
    .create();

    const char* argv[] = {"demo", "n=12", "output=x.h5", "ignored"};
    cfg.update(lazyseq::argv_to_string_map(4, argv));

    require(cfg.get_int("n") == 12);
    require(cfg.get_double("ratio") == 0.5);
    require(cfg.get_string("output") == "x.h5");
    require(cfg.set("ratio", "0.25").get_double("ratio") == 0.25);
    require(cfg.set("output", "y.h5").get_string("output") == "y.h5");
    require(cfg.set("n", lazyseq::config_parameter_t(7)).get_int("n") == 7);

    require_throws(cfg.get_double("n"));
    require_throws(cfg.get_int("missing"));
    require_throws(cfg.set("missing", "1"));
    require_throws(cfg.set("n", "twelve"));
    require_throws(cfg.set("n", "12abc"));
    require_throws(cfg.set("n", lazyseq::config_parameter_t(1.5)));
    require_throws(lazyseq::config_template().item("n", 1).item("n", 2));

    const char* duplicated[] = {"n=1", "n=2"};
    require_throws(lazyseq::argv_to_string_map(2, duplicated));

    auto ss = std::stringstream();
    lazyseq::pretty_print(ss, "config", cfg);
    require(ss.str().find("y.h5") != std::string::npos);
    require(ss.str().find("a fraction") != std::string::npos);
}

#endif // DO_UNIT_TESTS
