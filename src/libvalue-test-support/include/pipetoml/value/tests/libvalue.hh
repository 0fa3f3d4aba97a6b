#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pipetoml/util/fmt.hh"
#include "pipetoml/util/signals.hh"
#include "pipetoml/util/terminal.hh"
#include "pipetoml/value/value.hh"
#include "pipetoml/value/to-toml.hh"

#include <initializer_list>
#include <utility>

namespace pipetoml {

class LibValueTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        setInterrupted(false);
        interruptCheck = nullptr;
    }

    toml_value convert(const Value & v)
    {
        return printRootAsTOML(settings, v);
    }

    std::string toText(const Value & v)
    {
        return toTOML(settings, v);
    }

    TOMLSettings settings;
};

static inline Value mkRecordValue(std::initializer_list<std::pair<std::string, Value>> fields)
{
    Record record;
    for (auto & [name, v] : fields)
        record.insert(name, v);
    return Value().mkRecord(std::move(record));
}

static inline Value mkListValue(std::initializer_list<Value> elems)
{
    return Value().mkList(ValueList(elems));
}

static inline Value mkIntValue(ValueInt n)
{
    return Value().mkInt(n);
}

static inline Value mkStringValue(std::string s)
{
    return Value().mkString(std::move(s));
}

/**
 * Compare two TOML trees, ignoring the order of keys in tables. The
 * serializer writes the plain values of a table before its subtables,
 * so reading a document back can reorder keys.
 */
static inline bool sameDocument(const toml_value & a, const toml_value & b)
{
    if (a.type() != b.type())
        return false;

    if (a.is_table()) {
        auto & ta = a.as_table();
        auto & tb = b.as_table();
        if (ta.size() != tb.size())
            return false;
        for (auto & [key, v] : ta) {
            auto i = tb.find(key);
            if (i == tb.end() || !sameDocument(v, i->second))
                return false;
        }
        return true;
    }

    if (a.is_array()) {
        auto & aa = a.as_array();
        auto & ab = b.as_array();
        if (aa.size() != ab.size())
            return false;
        for (size_t i = 0; i < aa.size(); ++i)
            if (!sameDocument(aa[i], ab[i]))
                return false;
        return true;
    }

    return a == b;
}

MATCHER(IsTable, "")
{
    return arg.is_table();
}

MATCHER(IsArray, "")
{
    return arg.is_array();
}

MATCHER_P(IsTOMLStringEq, s, fmt("The TOML string is equal to \"%1%\"", s))
{
    if (!arg.is_string()) {
        *result_listener << "Expected a string got " << arg.type();
        return false;
    }
    return arg.as_string().str == s;
}

MATCHER_P(IsTOMLIntEq, v, fmt("The TOML integer is equal to %1%", v))
{
    if (!arg.is_integer()) {
        return false;
    }
    return arg.as_integer() == v;
}

/**
 * Match an error whose message, with colours removed, contains `s`.
 */
MATCHER_P(HasMessage, s, fmt("The error message contains \"%1%\"", s))
{
    return filterANSIEscapes(arg.msg()).find(s) != std::string::npos;
}

} // namespace pipetoml
