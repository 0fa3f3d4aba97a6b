#include "pipetoml/value/to-toml.hh"
#include "pipetoml/util/logging.hh"

#include <sstream>

namespace pipetoml {

static ShapeError shapeError(const Value & v, const std::string & detail)
{
    auto e = ShapeError(
        "expected a record or a list of records with TOML-compatible structure, but got %1%%2%",
        showType(v),
        Uncolored(detail));
    e.atPos(v.pos);
    return e;
}

toml_value printRootAsTOML(const TOMLSettings & settings, const Value & root)
{
    switch (root.type()) {
    case nRecord:
        return printValueAsTOML(settings, root);

    case nList: {
        auto & elems = root.listItems();
        if (elems.empty())
            throw shapeError(root, " that is empty");
        for (size_t i = 0; i < elems.size(); ++i) {
            /* An error element is reported as itself, not as a
               shape mismatch. This rethrows it. */
            if (elems[i].type() == nError)
                printValueAsTOML(settings, elems[i]);
            if (elems[i].type() != nRecord)
                throw shapeError(root, fmt(" whose element %d is %s", i, showType(elems[i])));
        }
        debug("converting a list of %d records", elems.size());
        return printValueAsTOML(settings, root);
    }

    case nString:
        return parseEmbeddedTOML(root.string(), root.pos);

    case nError:
        return printValueAsTOML(settings, root);

    case nNothing:
    case nBool:
    case nInt:
    case nFloat:
    case nBinary:
    case nDuration:
    case nDate:
    case nFilesize:
    case nRange:
    case nBlock:
    case nCellPath:
    case nCustom:
        throw shapeError(root, "");
    }

    unreachable();
}

/**
 * An array of tables at the root is written under the empty key, as
 * `[[""]]` blocks. Turn such a document back into the array.
 */
static toml_value unwrapRootArray(toml_value doc)
{
    auto & table = doc.as_table();
    if (table.size() != 1)
        return doc;

    auto i = table.find("");
    if (i == table.end() || !i->second.is_array() || i->second.as_array().empty())
        return doc;

    for (auto & elem : i->second.as_array())
        if (!elem.is_table())
            return doc;

    return std::move(i->second);
}

toml_value parseEmbeddedTOML(const std::string & s, std::shared_ptr<const Pos> pos)
{
    std::istringstream tomlStream(s);

    try {
        return unwrapRootArray(
            toml::parse<toml::discard_comments, toml::ordered_map, std::vector>(tomlStream, "string"));
    } catch (toml::exception & e) {
        auto err = EmbeddedParseError("while parsing TOML: %s", Uncolored(std::string(e.what())));
        err.atPos(pos);
        throw err;
    }
}

std::string printDocumentAsTOML(const TOMLSettings & settings, const toml_value & doc)
{
    return toml::format(doc, settings.lineWidth.get(), settings.floatPrecision.get());
}

std::string toTOML(const TOMLSettings & settings, const Value & root)
{
    return printDocumentAsTOML(settings, printRootAsTOML(settings, root));
}

void toTOML(const TOMLSettings & settings, const Value & root, std::ostream & str)
{
    str << toTOML(settings, root);
}

} // namespace pipetoml
