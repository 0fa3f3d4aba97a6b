#include "pipetoml/value/value.hh"
#include "pipetoml/util/error.hh"

namespace pipetoml {

ValueType Value::type() const
{
    return std::visit(
        overloaded{
            [](const std::monostate &) { return nNothing; },
            [](const bool &) { return nBool; },
            [](const ValueInt &) { return nInt; },
            [](const ValueFloat &) { return nFloat; },
            [](const std::string &) { return nString; },
            [](const std::vector<uint8_t> &) { return nBinary; },
            [](const Duration &) { return nDuration; },
            [](const Date &) { return nDate; },
            [](const FileSize &) { return nFilesize; },
            [](const Range &) { return nRange; },
            [](const ValueList &) { return nList; },
            [](const Record &) { return nRecord; },
            [](const Block &) { return nBlock; },
            [](const ErrorValue &) { return nError; },
            [](const CellPath &) { return nCellPath; },
            [](const std::shared_ptr<const CustomValueBase> &) { return nCustom; },
        },
        payload);
}

void Record::insert(std::string name, Value v)
{
    for (size_t i = 0; i < cols.size(); ++i)
        if (cols[i] == name) {
            vals[i] = std::move(v);
            return;
        }
    cols.push_back(std::move(name));
    vals.push_back(std::move(v));
}

const Value * Record::get(std::string_view name) const
{
    for (size_t i = 0; i < cols.size(); ++i)
        if (cols[i] == name)
            return &vals[i];
    return nullptr;
}

std::string_view showType(ValueType type, bool withArticle)
{
#define WA(a, w) withArticle ? a " " w : w
    switch (type) {
    case nNothing:
        return "nothing";
    case nBool:
        return WA("a", "Boolean");
    case nInt:
        return WA("an", "integer");
    case nFloat:
        return WA("a", "float");
    case nString:
        return WA("a", "string");
    case nBinary:
        return WA("a", "binary value");
    case nDuration:
        return WA("a", "duration");
    case nDate:
        return WA("a", "date");
    case nFilesize:
        return WA("a", "file size");
    case nRange:
        return WA("a", "range");
    case nList:
        return WA("a", "list");
    case nRecord:
        return WA("a", "record");
    case nBlock:
        return WA("a", "block");
    case nError:
        return WA("an", "error");
    case nCellPath:
        return WA("a", "cell path");
    case nCustom:
        return WA("a", "custom value");
    }
#undef WA
    unreachable();
}

std::string showType(const Value & v)
{
    if (v.type() == nCustom)
        return v.custom().showType();
    return std::string(showType(v.type()));
}

} // namespace pipetoml
