#include "pipetoml/value/json-to-value.hh"

#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pipetoml {

/**
 * @return The position of the 1-based byte offset `byte` in `s`.
 */
static Pos posOfByte(std::string_view s, size_t byte, const Pos::Origin & origin)
{
    uint32_t line = 1;
    size_t lineStart = 0;
    for (size_t i = 0; i + 1 < byte && i < s.size(); ++i)
        if (s[i] == '\n') {
            line++;
            lineStart = i + 1;
        }
    return Pos(line, byte > lineStart ? byte - lineStart : 1, origin);
}

// for more information, refer to
// https://github.com/nlohmann/json/blob/master/include/nlohmann/detail/input/json_sax.hpp
class JSONSax : nlohmann::json_sax<json>
{
    class JSONState
    {
    protected:
        std::unique_ptr<JSONState> parent;
        Value v;
    public:
        virtual std::unique_ptr<JSONState> resolve()
        {
            throw std::logic_error("tried to close toplevel json parser state");
        }

        explicit JSONState(std::unique_ptr<JSONState> && p)
            : parent(std::move(p))
        {
        }

        JSONState() {}

        JSONState(JSONState & p) = delete;

        Value & value()
        {
            return v;
        }

        virtual ~JSONState() {}

        virtual void add() {}
    };

    class JSONRootState : public JSONState
    {
        Value & out;
    public:
        explicit JSONRootState(Value & out)
            : out(out)
        {
        }

        void add() override
        {
            out = std::move(v);
        }
    };

    class JSONObjectState : public JSONState
    {
        using JSONState::JSONState;
        Record record;
        std::string currentKey;

        std::unique_ptr<JSONState> resolve() override
        {
            parent->value().mkRecord(std::move(record));
            return std::move(parent);
        }

        void add() override
        {
            record.insert(std::move(currentKey), std::move(v));
            v = Value();
        }
    public:
        void key(string_t & name)
        {
            currentKey = name;
        }
    };

    class JSONListState : public JSONState
    {
        ValueList values;

        std::unique_ptr<JSONState> resolve() override
        {
            parent->value().mkList(std::move(values));
            return std::move(parent);
        }

        void add() override
        {
            values.push_back(std::move(v));
            v = Value();
        }
    public:
        JSONListState(std::unique_ptr<JSONState> && p, std::size_t reserve)
            : JSONState(std::move(p))
        {
            values.reserve(reserve);
        }
    };

    std::string_view input;
    const Pos::Origin & origin;
    std::unique_ptr<JSONState> rs;
    unsigned int depth = 0;
    const unsigned int maxDepth;

    void enterContainer()
    {
        if (depth >= maxDepth)
            throw StackOverflowError("JSON input is nested more than %1% levels deep", maxDepth);
        depth++;
    }

public:
    JSONSax(std::string_view input, const Pos::Origin & origin, Value & v, unsigned int maxDepth)
        : input(input)
        , origin(origin)
        , rs(new JSONRootState(v))
        , maxDepth(maxDepth) {};

    bool null()
    {
        rs->value().mkNothing();
        rs->add();
        return true;
    }

    bool boolean(bool val)
    {
        rs->value().mkBool(val);
        rs->add();
        return true;
    }

    bool number_integer(number_integer_t val)
    {
        rs->value().mkInt(val);
        rs->add();
        return true;
    }

    bool number_unsigned(number_unsigned_t val)
    {
        if (val > static_cast<number_unsigned_t>(std::numeric_limits<ValueInt>::max()))
            rs->value().mkFloat(static_cast<ValueFloat>(val));
        else
            rs->value().mkInt(static_cast<ValueInt>(val));
        rs->add();
        return true;
    }

    bool number_float(number_float_t val, const string_t & s)
    {
        rs->value().mkFloat(val);
        rs->add();
        return true;
    }

    bool string(string_t & val)
    {
        rs->value().mkString(val);
        rs->add();
        return true;
    }

    bool binary(binary_t &)
    {
        // Only produced by the binary formats, never by JSON text.
        unreachable();
    }

    bool start_object(std::size_t len)
    {
        enterContainer();
        rs = std::make_unique<JSONObjectState>(std::move(rs));
        return true;
    }

    bool key(string_t & name)
    {
        dynamic_cast<JSONObjectState *>(rs.get())->key(name);
        return true;
    }

    bool end_object()
    {
        depth--;
        rs = rs->resolve();
        rs->add();
        return true;
    }

    bool end_array()
    {
        return end_object();
    }

    bool start_array(size_t len)
    {
        enterContainer();
        rs = std::make_unique<JSONListState>(std::move(rs), len != std::numeric_limits<size_t>::max() ? len : 128);
        return true;
    }

    bool parse_error(std::size_t position, const std::string &, const nlohmann::detail::exception & ex)
    {
        auto e = JSONParseError("%s", Uncolored(std::string(ex.what())));
        e.atPos(std::make_shared<const Pos>(posOfByte(input, position, origin)));
        throw e;
    }
};

void parseJSON(std::string_view s, Value & v, Pos::Origin origin, unsigned int maxDepth)
{
    JSONSax parser(s, origin, v, maxDepth);
    bool res = json::sax_parse(s, &parser);
    if (!res)
        throw JSONParseError("Invalid JSON Value");
    v.pos = std::make_shared<const Pos>(1, 1, origin);
}

} // namespace pipetoml
