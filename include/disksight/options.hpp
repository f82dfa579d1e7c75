#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace disksight::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
    StringList
};

enum class OptionValueType
{
    None,
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
    OptionValue(std::string value);
    OptionValue(std::vector<std::string> value);

    OptionValueType type() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;
    std::vector<std::string> toStringList() const;

    bool operator==(const OptionValue &other) const noexcept;
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, std::string, std::vector<std::string>>;
    Storage value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
};

// Splits "a, b;c" into {"a", "b", "c"}; used for list values given on a command line.
std::vector<std::string> splitOptionList(std::string_view text);

// Renders a value the way the command-line tools print it.
std::string describeValue(const OptionDefinition &definition, const OptionValue &value);

// "sortBySize" -> "DISKSIGHT_SORT_BY_SIZE"
std::string environmentVariableName(std::string_view key);

class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, const OptionValue &value);
    bool setFromText(const std::string &key, const std::string &text);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool isOverridden(const std::string &key) const noexcept;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    void resetToDefaults() noexcept;

    bool loadFromFile(const std::filesystem::path &filePath, std::string *error = nullptr);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    bool clearDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    // Applies DISKSIGHT_<KEY> variables on top of the current values.
    // Returns the keys that were taken from the environment.
    std::vector<std::string> applyEnvironment();

    std::vector<OptionDefinition> listRegisteredOptions() const;
    const OptionDefinition *definition(const std::string &key) const;

    static std::filesystem::path configRoot();
    static std::vector<std::string> availableProfiles();

private:
    const OptionDefinition *findDefinition(const std::string &key) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace disksight::config
