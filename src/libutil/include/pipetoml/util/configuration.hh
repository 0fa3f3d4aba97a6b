#pragma once
///@file

#include "pipetoml/util/error.hh"
#include "pipetoml/util/strings.hh"
#include "pipetoml/util/types.hh"

#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace pipetoml {

class AbstractSetting;

/**
 * A set of named settings. Settings are members of a subclass and
 * register themselves on construction:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<bool> strict{this, false, "strict", "reject placeholder values"};
 *   };
 *
 * Values may be set by name before the setting that takes them
 * exists. They are kept and applied once it is added.
 */
class Config
{
    std::map<std::string, AbstractSetting *> settings;

protected:
    StringMap unknownSettings;

public:
    virtual ~Config() = default;

    /**
     * Set `name` if it is a setting of this config. Unlike `set()`,
     * an unknown name is not remembered.
     */
    virtual bool setKnown(const std::string & name, const std::string & value);

    /**
     * @return Whether `name` is a known setting. Otherwise the value is
     * remembered for `addSetting()` and `warnUnknownSettings()`.
     */
    bool set(const std::string & name, const std::string & value);

    void addSetting(AbstractSetting * setting);

    /**
     * Apply `name = value` lines. `#` starts a comment; blank lines are
     * ignored.
     *
     * @param path Where `contents` came from, for error messages.
     */
    void applyConfig(const std::string & contents, const std::string & path);

    /**
     * Warn about every value whose setting never turned up.
     */
    void warnUnknownSettings();
};

class AbstractSetting
{
public:
    const std::string name;
    const std::string description;

    /**
     * Whether the value was set explicitly, as opposed to being the
     * default.
     */
    bool overridden = false;

    /**
     * Parse `value` and make it the setting's value.
     */
    virtual void set(const std::string & value) = 0;

protected:
    AbstractSetting(const std::string & name, const std::string & description)
        : name(name)
        , description(description)
    {
    }

    virtual ~AbstractSetting() = default;
};

/**
 * A boolean or integer setting.
 */
template<typename T>
class Setting : public AbstractSetting
{
    static_assert(std::is_integral_v<T>, "settings are booleans or integers");

    T value;

public:
    Setting(Config * config, const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
    {
        config->addSetting(this);
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
    }

    void override(const T & v)
    {
        overridden = true;
        value = v;
    }

    void set(const std::string & str) override
    {
        override(parse(trim(str)));
    }

private:
    T parse(const std::string & str) const
    {
        if constexpr (std::is_same_v<T, bool>) {
            if (str == "true" || str == "yes" || str == "1")
                return true;
            if (str == "false" || str == "no" || str == "0")
                return false;
        } else if (auto n = string2Int<T>(str))
            return *n;
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
    }
};

/**
 * The settings of every `Config` that registered itself with
 * `GlobalConfig::Register`, addressed as one.
 */
struct GlobalConfig : Config
{
    static std::vector<Config *> & configRegistrations()
    {
        static std::vector<Config *> configs;
        return configs;
    }

    struct Register
    {
        Register(Config * config)
        {
            configRegistrations().push_back(config);
        }
    };

    bool setKnown(const std::string & name, const std::string & value) override;
};

extern GlobalConfig globalConfig;

} // namespace pipetoml
