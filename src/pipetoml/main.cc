#include "pipetoml/util/configuration.hh"
#include "pipetoml/util/file-descriptor.hh"
#include "pipetoml/util/logging.hh"
#include "pipetoml/util/signals.hh"
#include "pipetoml/util/strings.hh"
#include "pipetoml/value/json-to-value.hh"
#include "pipetoml/value/to-toml.hh"

#include <cstdlib>
#include <functional>
#include <iostream>

using namespace pipetoml;

static const char * usage = R"(Usage: pipetoml [OPTION]... < INPUT

Read a single value as JSON from standard input and write it to
standard output as a TOML document. The value must be an object, an
array of objects, or (with --raw) TOML text.

Options:
  --raw                  take standard input as a TOML string
  --strict               reject values that have no TOML counterpart
  --max-depth N          reject values nested more than N levels deep
  --option NAME VALUE    set the configuration setting NAME to VALUE
  -v, --verbose          increase the verbosity level
  --quiet                decrease the verbosity level
  --help                 show this help and exit
  --version              show the version and exit

Settings are also read from the PIPETOML_CONFIG environment variable,
one `name = value' per line.
)";

static std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

template<class N>
static N getIntArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    auto s = getArg(opt, i, end);
    if (auto n = string2Int<N>(s))
        return *n;
    throw UsageError("'%1%' requires an integer argument, got '%2%'", opt, s);
}

static int handleExceptions(const std::string & argv0, std::function<void()> fun)
{
    auto programName = baseNameOf(argv0);

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logger->logEI(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logger->logEI(e.info());
        return 1;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

int main(int argc, char ** argv)
{
    bool raw = false;

    return handleExceptions(argv[0], [&]() {
        installInterruptHandlers();

        if (auto config = getenv("PIPETOML_CONFIG"); config && *config)
            globalConfig.applyConfig(config, "PIPETOML_CONFIG");

        Strings args(argv + 1, argv + argc);
        for (auto arg = args.begin(); arg != args.end(); ++arg) {
            if (*arg == "--help") {
                std::cout << usage;
                throw Exit();
            } else if (*arg == "--version") {
                std::cout << fmt("pipetoml %1%", PIPETOML_VERSION) << std::endl;
                throw Exit();
            } else if (*arg == "--raw")
                raw = true;
            else if (*arg == "--strict")
                tomlSettings.strict.override(true);
            else if (*arg == "--max-depth")
                tomlSettings.maxDepth.override(getIntArg<unsigned int>(*arg, arg, args.end()));
            else if (*arg == "--verbose" || *arg == "-v")
                verbosity = verbosity < lvlDebug ? (Verbosity) (verbosity + 1) : lvlDebug;
            else if (*arg == "--quiet")
                verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
            else if (*arg == "--option") {
                auto name = getArg(*arg, arg, args.end());
                auto value = getArg(*arg, arg, args.end());
                globalConfig.set(name, value);
            } else
                throw UsageError("unrecognised option '%1%'", *arg);
        }

        globalConfig.warnUnknownSettings();

        auto source = std::make_shared<const std::string>(drainFD(getStandardInput()));
        Pos::Origin origin = Pos::Stdin{.source = source};

        Value root;
        if (raw)
            root.mkString(*source).setPos(std::make_shared<const Pos>(1, 1, origin));
        else
            parseJSON(*source, root, origin);

        debug("converting %s read from standard input", showType(root));

        writeFull(getStandardOutput(), toTOML(tomlSettings, root));
    });
}
