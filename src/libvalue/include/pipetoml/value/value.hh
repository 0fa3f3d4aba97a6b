#pragma once
///@file

#include "pipetoml/util/types.hh"
#include "pipetoml/util/position.hh"

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pipetoml {

/**
 * The kinds of values that can flow through a pipeline. Every kind
 * has exactly one payload alternative in `Value`.
 */
typedef enum {
    nNothing,
    nBool,
    nInt,
    nFloat,
    nString,
    nBinary,
    nDuration,
    nDate,
    nFilesize,
    nRange,
    nList,
    nRecord,
    nBlock,
    nError,
    nCellPath,
    nCustom,
} ValueType;

struct Value;

typedef int64_t ValueInt;
typedef double ValueFloat;

/**
 * A signed span of time, in nanoseconds.
 */
struct Duration
{
    int64_t nanoseconds;

    bool operator==(const Duration &) const = default;
};

/**
 * An instant in time together with the fixed UTC offset it is
 * displayed in.
 */
struct Date
{
    /**
     * Nanoseconds since the Unix epoch, UTC.
     */
    int64_t nanoseconds;

    /**
     * Offset east of UTC, in seconds.
     */
    int32_t offset = 0;

    bool operator==(const Date &) const = default;
};

/**
 * A size in bytes.
 */
struct FileSize
{
    int64_t bytes;

    bool operator==(const FileSize &) const = default;
};

struct Range
{
    ValueInt from;
    ValueInt step = 1;
    ValueInt to;
    bool inclusive = true;

    bool operator==(const Range &) const = default;
};

/**
 * A captured closure. Not data; only its identity is carried.
 */
struct Block
{
    uint64_t id;

    bool operator==(const Block &) const = default;
};

/**
 * A value standing for an earlier failure. Consumers that need the
 * value's data rethrow the wrapped exception.
 */
struct ErrorValue
{
    std::exception_ptr error;
};

/**
 * One step of a cell path: either a column name or a row index.
 */
typedef std::variant<std::string, uint64_t> PathMember;

struct CellPath
{
    std::vector<PathMember> members;

    bool operator==(const CellPath &) const = default;
};

typedef std::vector<Value> ValueList;

/**
 * An ordered mapping from unique column names to values. `cols` and
 * `vals` always have the same length.
 */
struct Record
{
    std::vector<std::string> cols;
    std::vector<Value> vals;

    /**
     * Set column `name` to `v`. An existing column keeps its place;
     * a new one is appended.
     */
    void insert(std::string name, Value v);

    /**
     * @return The value of column `name`, or nullptr.
     */
    const Value * get(std::string_view name) const;

    size_t size() const
    {
        return cols.size();
    }

    bool empty() const
    {
        return cols.empty();
    }
};

/**
 * Host-defined values must descend from CustomValueBase, so that
 * type-agnostic functions (e.g. showType) can be implemented.
 */
class CustomValueBase
{
public:
    /**
     * Return a simple string describing the type
     */
    virtual std::string showType() const = 0;

    /**
     * Return the short name of the type
     */
    virtual std::string typeOf() const = 0;

    virtual ~CustomValueBase() {};
};

struct Value
{
private:
    typedef std::variant<
        std::monostate,
        bool,
        ValueInt,
        ValueFloat,
        std::string,
        std::vector<uint8_t>,
        Duration,
        Date,
        FileSize,
        Range,
        ValueList,
        Record,
        Block,
        ErrorValue,
        CellPath,
        std::shared_ptr<const CustomValueBase>>
        Payload;

    Payload payload;

public:

    /**
     * Where the value was read from, if known. Used in error messages.
     */
    std::shared_ptr<const Pos> pos;

    /**
     * Returns the type of the value. A default-constructed value is
     * `nNothing`.
     */
    ValueType type() const;

    Value & mkNothing()
    {
        payload = std::monostate{};
        return *this;
    }

    Value & mkBool(bool b)
    {
        payload = b;
        return *this;
    }

    Value & mkInt(ValueInt n)
    {
        payload = n;
        return *this;
    }

    Value & mkFloat(ValueFloat n)
    {
        payload = n;
        return *this;
    }

    Value & mkString(std::string s)
    {
        payload = std::move(s);
        return *this;
    }

    Value & mkBinary(std::vector<uint8_t> bytes)
    {
        payload = std::move(bytes);
        return *this;
    }

    Value & mkDuration(int64_t nanoseconds)
    {
        payload = Duration{nanoseconds};
        return *this;
    }

    Value & mkDate(Date d)
    {
        payload = d;
        return *this;
    }

    Value & mkFilesize(int64_t bytes)
    {
        payload = FileSize{bytes};
        return *this;
    }

    Value & mkRange(Range r)
    {
        payload = r;
        return *this;
    }

    Value & mkList(ValueList elems)
    {
        payload = std::move(elems);
        return *this;
    }

    Value & mkRecord(Record r)
    {
        payload = std::move(r);
        return *this;
    }

    Value & mkBlock(uint64_t id)
    {
        payload = Block{id};
        return *this;
    }

    Value & mkError(std::exception_ptr e)
    {
        payload = ErrorValue{std::move(e)};
        return *this;
    }

    Value & mkCellPath(CellPath path)
    {
        payload = std::move(path);
        return *this;
    }

    Value & mkCustom(std::shared_ptr<const CustomValueBase> v)
    {
        payload = std::move(v);
        return *this;
    }

    Value & setPos(std::shared_ptr<const Pos> p)
    {
        pos = std::move(p);
        return *this;
    }

    bool boolean() const
    {
        return std::get<bool>(payload);
    }

    ValueInt integer() const
    {
        return std::get<ValueInt>(payload);
    }

    ValueFloat fpoint() const
    {
        return std::get<ValueFloat>(payload);
    }

    const std::string & string() const
    {
        return std::get<std::string>(payload);
    }

    const std::vector<uint8_t> & binary() const
    {
        return std::get<std::vector<uint8_t>>(payload);
    }

    Duration duration() const
    {
        return std::get<Duration>(payload);
    }

    Date date() const
    {
        return std::get<Date>(payload);
    }

    FileSize filesize() const
    {
        return std::get<FileSize>(payload);
    }

    const Range & range() const
    {
        return std::get<Range>(payload);
    }

    const ValueList & listItems() const
    {
        return std::get<ValueList>(payload);
    }

    const Record & record() const
    {
        return std::get<Record>(payload);
    }

    Block block() const
    {
        return std::get<Block>(payload);
    }

    std::exception_ptr error() const
    {
        return std::get<ErrorValue>(payload).error;
    }

    const CellPath & cellPath() const
    {
        return std::get<CellPath>(payload);
    }

    const CustomValueBase & custom() const
    {
        return *std::get<std::shared_ptr<const CustomValueBase>>(payload);
    }
};

std::string_view showType(ValueType type, bool withArticle = true);
std::string showType(const Value & v);

} // namespace pipetoml
