#include "pipetoml/util/configuration.hh"
#include "pipetoml/util/logging.hh"
#include "pipetoml/util/position.hh"

namespace pipetoml {

GlobalConfig globalConfig;

bool Config::setKnown(const std::string & name, const std::string & value)
{
    auto i = settings.find(name);
    if (i == settings.end())
        return false;
    i->second->set(value);
    return true;
}

bool Config::set(const std::string & name, const std::string & value)
{
    if (setKnown(name, value))
        return true;
    unknownSettings[name] = value;
    return false;
}

void Config::addSetting(AbstractSetting * setting)
{
    settings.emplace(setting->name, setting);

    auto i = unknownSettings.find(setting->name);
    if (i != unknownSettings.end()) {
        setting->set(i->second);
        unknownSettings.erase(i);
    }
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    unsigned int lineNo = 0;
    for (auto line : splitLines(contents)) {
        lineNo++;
        line = line.substr(0, line.find('#'));
        if (trim(line).empty())
            continue;

        auto eq = line.find('=');
        if (eq == line.npos)
            throw UsageError("%s:%d: expected 'name = value'", path, lineNo);

        auto name = trim(line.substr(0, eq));
        if (name.empty())
            throw UsageError("%s:%d: missing setting name", path, lineNo);

        set(name, trim(line.substr(eq + 1)));
    }
}

void Config::warnUnknownSettings()
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

bool GlobalConfig::setKnown(const std::string & name, const std::string & value)
{
    for (auto config : configRegistrations())
        if (config->setKnown(name, value))
            return true;
    return false;
}

} // namespace pipetoml
