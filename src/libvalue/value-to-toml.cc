#include "pipetoml/value/value-to-toml.hh"
#include "pipetoml/util/signals.hh"

#include <chrono>
#include <limits>

namespace pipetoml {

TOMLSettings tomlSettings;

static GlobalConfig::Register rTOMLSettings(&tomlSettings);

static void checkDepth(const TOMLSettings & settings, const Value & v, unsigned int depth)
{
    if (depth >= settings.maxDepth) {
        auto e = StackOverflowError(
            "%1% is nested more than %2% levels deep", showType(v), settings.maxDepth.get());
        e.atPos(v.pos);
        throw e;
    }
}

static toml_value placeholder(const TOMLSettings & settings, const Value & v, const char * text)
{
    if (settings.strict) {
        auto e = UnsupportedValueError("cannot convert %1% to a TOML value in strict mode", showType(v));
        e.atPos(v.pos);
        throw e;
    }
    return toml_value(std::string(text));
}

toml_value printValueAsTOML(const TOMLSettings & settings, const Value & v, unsigned int depth)
{
    checkInterrupt();

    toml_value out;

    switch (v.type()) {
    case nBool:
        out = v.boolean();
        break;

    case nInt:
        out = v.integer();
        break;

    case nFloat:
        out = v.fpoint();
        break;

    case nString:
        out = v.string();
        break;

    case nFilesize:
        out = v.filesize().bytes;
        break;

    case nDuration:
        out = std::to_string(v.duration().nanoseconds);
        break;

    case nDate:
        out = showDate(v.date());
        break;

    case nBinary: {
        out = toml_value::array_type();
        for (auto byte : v.binary())
            out.push_back(toml_value(static_cast<toml::integer>(byte)));
        break;
    }

    case nCellPath: {
        out = toml_value::array_type();
        for (auto & member : v.cellPath().members)
            std::visit(
                overloaded{
                    [&](const std::string & name) { out.push_back(toml_value(name)); },
                    [&](const uint64_t & index) {
                        if (index > static_cast<uint64_t>(std::numeric_limits<toml::integer>::max())) {
                            auto e = ConversionError("cell path index %1% does not fit in a TOML integer", index);
                            e.atPos(v.pos);
                            throw e;
                        }
                        out.push_back(toml_value(static_cast<toml::integer>(index)));
                    },
                },
                member);
        break;
    }

    case nRecord:
        checkDepth(settings, v, depth);
        return recordToTOML(settings, v.record(), depth);

    case nList:
        checkDepth(settings, v, depth);
        return listToTOML(settings, v.listItems(), depth);

    case nRange:
        return placeholder(settings, v, "<Range>");

    case nBlock:
        return placeholder(settings, v, "<Block>");

    case nNothing:
        return placeholder(settings, v, "<Nothing>");

    case nCustom:
        return placeholder(settings, v, "<Custom Value>");

    case nError:
        if (auto e = v.error())
            std::rethrow_exception(e);
        throw ConversionError("error value does not hold an error");
    }

    return out;
}

toml_value recordToTOML(const TOMLSettings & settings, const Record & record, unsigned int depth)
{
    toml_value out = toml_value::table_type();
    for (size_t i = 0; i < record.size(); ++i)
        out[record.cols[i]] = printValueAsTOML(settings, record.vals[i], depth + 1);
    return out;
}

toml_value listToTOML(const TOMLSettings & settings, const ValueList & elems, unsigned int depth)
{
    toml_value out = toml_value::array_type();
    for (auto & elem : elems)
        out.push_back(printValueAsTOML(settings, elem, depth + 1));
    return unwrapSingleTable(std::move(out));
}

bool isSingleTableArray(const toml_value & v)
{
    return v.is_array() && v.as_array().size() == 1 && v.as_array().front().is_table();
}

toml_value unwrapSingleTable(toml_value v)
{
    if (isSingleTableArray(v))
        return std::move(v.as_array().front());
    return v;
}

std::string showDate(const Date & d)
{
    using namespace std::chrono;

    /* Whole seconds and a non-negative fraction. The offset is added
       to the seconds, where it cannot overflow. */
    int64_t secs = d.nanoseconds / 1000000000;
    int64_t frac = d.nanoseconds % 1000000000;
    if (frac < 0) {
        secs -= 1;
        frac += 1000000000;
    }

    auto local = sys_seconds(seconds(secs + d.offset));
    auto day = floor<days>(local);
    year_month_day ymd{day};
    hh_mm_ss hms{local - day};

    auto res =
        fmt("%04d-%02d-%02d %02d:%02d:%02d",
            static_cast<int>(ymd.year()),
            static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()),
            hms.hours().count(),
            hms.minutes().count(),
            hms.seconds().count());

    if (frac % 1000000 == 0) {
        if (frac != 0)
            res += fmt(".%03d", frac / 1000000);
    } else if (frac % 1000 == 0)
        res += fmt(".%06d", frac / 1000);
    else
        res += fmt(".%09d", frac);

    int64_t offset = d.offset;
    if (offset < 0)
        offset = -offset;
    res += fmt(" %c%02d:%02d", d.offset < 0 ? '-' : '+', offset / 3600, offset / 60 % 60);
    if (offset % 60)
        res += fmt(":%02d", offset % 60);

    return res;
}

} // namespace pipetoml
