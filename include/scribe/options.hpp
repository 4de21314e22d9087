#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace scribe::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
    StringList
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(int value);
    OptionValue(std::string value);
    OptionValue(const char *value);
    OptionValue(std::vector<std::string> value);

    bool isNull() const noexcept;
    std::optional<OptionKind> kind() const noexcept;

    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;
    std::vector<std::string> toStringList() const;

    bool operator==(const OptionValue &other) const noexcept { return storage == other.storage; }
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, std::string, std::vector<std::string>> storage;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
    // Integer options are clamped into [minimum, maximum] when set or loaded.
    std::optional<std::int64_t> minimum;
    std::optional<std::int64_t> maximum;
};

class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const;
    std::vector<OptionDefinition> listRegisteredOptions() const;

    // Returns false when the key is not registered.
    bool set(const std::string &key, const OptionValue &value);
    bool setFromString(const std::string &key, const std::string &text);
    void reset(const std::string &key);
    void resetToDefaults() noexcept;
    bool isOverridden(const std::string &key) const noexcept;

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    bool clearDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();

private:
    OptionValue normalize(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace scribe::config
