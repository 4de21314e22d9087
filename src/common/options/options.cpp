#include "scribe/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace scribe::config
{
namespace
{
constexpr const char *kConfigDirectoryName = "scribe";

std::optional<bool> parseBool(const std::string &text)
{
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(const std::string &text)
{
    try
    {
        std::size_t consumed = 0;
        std::int64_t parsed = std::stoll(text, &consumed, 10);
        if (consumed == text.size())
            return parsed;
    }
    catch (const std::logic_error &)
    {
        // invalid_argument or out_of_range: not an integer
    }
    return std::nullopt;
}

nlohmann::json toJson(const OptionValue &value)
{
    auto kind = value.kind();
    if (!kind)
        return nullptr;
    switch (*kind)
    {
    case OptionKind::Boolean:
        return value.toBool();
    case OptionKind::Integer:
        return value.toInteger();
    case OptionKind::String:
        return value.toString();
    case OptionKind::StringList:
        return value.toStringList();
    }
    return nullptr;
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &json)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (json.is_boolean())
            return OptionValue(json.get<bool>());
        if (json.is_number_integer())
            return OptionValue(json.get<std::int64_t>() != 0);
        if (json.is_string())
            return OptionValue(parseBool(json.get<std::string>()).value_or(definition.defaultValue.toBool()));
        break;
    case OptionKind::Integer:
        if (json.is_number_integer())
            return OptionValue(json.get<std::int64_t>());
        if (json.is_number_float())
            return OptionValue(static_cast<std::int64_t>(json.get<double>()));
        if (json.is_string())
            return OptionValue(parseInteger(json.get<std::string>()).value_or(definition.defaultValue.toInteger()));
        break;
    case OptionKind::String:
        if (json.is_string())
            return OptionValue(json.get<std::string>());
        break;
    case OptionKind::StringList:
        if (json.is_array())
        {
            std::vector<std::string> items;
            for (const auto &item : json)
            {
                if (item.is_string())
                    items.push_back(item.get<std::string>());
            }
            return OptionValue(std::move(items));
        }
        if (json.is_string())
            return OptionValue(std::vector<std::string>{json.get<std::string>()});
        break;
    }
    return definition.defaultValue;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / kConfigDirectoryName;
    if (const char *home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / kConfigDirectoryName;
    return std::filesystem::path(".config") / kConfigDirectoryName;
}

} // namespace

OptionValue::OptionValue(bool value)
    : storage(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : storage(value)
{
}

OptionValue::OptionValue(int value)
    : storage(static_cast<std::int64_t>(value))
{
}

OptionValue::OptionValue(std::string value)
    : storage(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : storage(std::string(value ? value : ""))
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : storage(std::move(value))
{
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(storage);
}

std::optional<OptionKind> OptionValue::kind() const noexcept
{
    if (std::holds_alternative<bool>(storage))
        return OptionKind::Boolean;
    if (std::holds_alternative<std::int64_t>(storage))
        return OptionKind::Integer;
    if (std::holds_alternative<std::string>(storage))
        return OptionKind::String;
    if (std::holds_alternative<std::vector<std::string>>(storage))
        return OptionKind::StringList;
    return std::nullopt;
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *flag = std::get_if<bool>(&storage))
        return *flag;
    if (auto *number = std::get_if<std::int64_t>(&storage))
        return *number != 0;
    if (auto *text = std::get_if<std::string>(&storage))
        return parseBool(*text).value_or(fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *number = std::get_if<std::int64_t>(&storage))
        return *number;
    if (auto *flag = std::get_if<bool>(&storage))
        return *flag ? 1 : 0;
    if (auto *text = std::get_if<std::string>(&storage))
        return parseInteger(*text).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *text = std::get_if<std::string>(&storage))
        return *text;
    if (auto *flag = std::get_if<bool>(&storage))
        return *flag ? "true" : "false";
    if (auto *number = std::get_if<std::int64_t>(&storage))
        return std::to_string(*number);
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (auto *list = std::get_if<std::vector<std::string>>(&storage))
        return *list;
    if (auto *text = std::get_if<std::string>(&storage))
        return {*text};
    return {};
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    if (auto it = overrides.find(definition.key); it != overrides.end())
        it->second = normalize(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &entry : definitions)
        result.push_back(entry.second);
    std::sort(result.begin(), result.end(),
              [](const OptionDefinition &a, const OptionDefinition &b) { return a.key < b.key; });
    return result;
}

bool OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *def = definition(key);
    if (!def)
        return false;
    overrides[key] = normalize(*def, value);
    return true;
}

bool OptionRegistry::setFromString(const std::string &key, const std::string &text)
{
    const OptionDefinition *def = definition(key);
    if (!def)
        return false;
    switch (def->kind)
    {
    case OptionKind::Boolean:
    {
        auto parsed = parseBool(text);
        if (!parsed)
            return false;
        overrides[key] = OptionValue(*parsed);
        return true;
    }
    case OptionKind::Integer:
    {
        auto parsed = parseInteger(text);
        if (!parsed)
            return false;
        overrides[key] = normalize(*def, OptionValue(*parsed));
        return true;
    }
    case OptionKind::String:
        overrides[key] = OptionValue(text);
        return true;
    case OptionKind::StringList:
        overrides[key] = OptionValue(std::vector<std::string>{text});
        return true;
    }
    return false;
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

bool OptionRegistry::isOverridden(const std::string &key) const noexcept
{
    return overrides.find(key) != overrides.end();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    if (auto it = overrides.find(key); it != overrides.end())
        return it->second;
    if (const OptionDefinition *def = definition(key))
        return def->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

std::vector<std::string> OptionRegistry::getStringList(const std::string &key) const
{
    return get(key).toStringList();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &error)
    {
        std::cerr << id << ": ignoring " << filePath.string() << ": " << error.what() << '\n';
        return false;
    }

    if (!data.is_object())
        return false;

    for (const auto &[key, value] : data.items())
    {
        const OptionDefinition *def = definition(key);
        if (!def || value.is_null())
            continue;
        overrides[key] = normalize(*def, fromJson(*def, value));
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &entry : definitions)
        data[entry.first] = toJson(get(entry.first));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << '\n';
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

bool OptionRegistry::clearDefaults() const
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;
    return std::filesystem::remove(path, ec);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    return detectConfigRoot();
}

OptionValue OptionRegistry::normalize(const OptionDefinition &definition, const OptionValue &value) const
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    case OptionKind::Integer:
    {
        std::int64_t number = value.toInteger(definition.defaultValue.toInteger());
        if (definition.minimum)
            number = std::max(number, *definition.minimum);
        if (definition.maximum)
            number = std::min(number, *definition.maximum);
        return OptionValue(number);
    }
    case OptionKind::String:
        return OptionValue(value.toString(definition.defaultValue.toString()));
    case OptionKind::StringList:
        return OptionValue(value.toStringList());
    }
    return value;
}

} // namespace scribe::config
