#include "disksight/options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace disksight::config
{
namespace
{
constexpr std::string_view kSuiteDirectory = "disksight";
constexpr std::string_view kEnvironmentPrefix = "DISKSIGHT_";

std::string lowercase(std::string_view value)
{
    std::string lowered;
    lowered.reserve(value.size());
    for (char ch : value)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lowered;
}

std::string trim(std::string_view value)
{
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])))
        ++start;
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])))
        --end;
    return std::string(value.substr(start, end - start));
}

std::optional<bool> parseBool(std::string_view text)
{
    std::string lower = lowercase(trim(text));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(std::string_view text)
{
    std::string cleaned = trim(text);
    if (cleaned.empty())
        return std::nullopt;
    std::int64_t parsed = 0;
    const char *first = cleaned.data();
    const char *last = cleaned.data() + cleaned.size();
    if (*first == '+')
        ++first;
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last)
        return std::nullopt;
    return parsed;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.type())
    {
    case OptionValueType::Boolean:
        return value.toBool();
    case OptionValueType::Integer:
        return value.toInteger();
    case OptionValueType::String:
        return value.toString();
    case OptionValueType::StringList:
        return value.toStringList();
    case OptionValueType::None:
        break;
    }
    return nlohmann::json();
}

std::optional<OptionValue> fromJson(const OptionDefinition &definition, const nlohmann::json &jsonValue)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
        {
            if (auto parsed = parseBool(jsonValue.get<std::string>()))
                return OptionValue(*parsed);
        }
        break;
    case OptionKind::Integer:
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>());
        if (jsonValue.is_string())
        {
            if (auto parsed = parseInteger(jsonValue.get<std::string>()))
                return OptionValue(*parsed);
        }
        break;
    case OptionKind::String:
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        if (jsonValue.is_null())
            return OptionValue(std::string());
        break;
    case OptionKind::StringList:
        if (jsonValue.is_array())
        {
            std::vector<std::string> items;
            for (const auto &item : jsonValue)
            {
                if (item.is_string())
                    items.push_back(item.get<std::string>());
            }
            return OptionValue(std::move(items));
        }
        if (jsonValue.is_string())
            return OptionValue(splitOptionList(jsonValue.get<std::string>()));
        break;
    }
    return std::nullopt;
}

std::optional<OptionValue> fromText(const OptionDefinition &definition, const std::string &text)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (auto parsed = parseBool(text))
            return OptionValue(*parsed);
        return std::nullopt;
    case OptionKind::Integer:
        if (auto parsed = parseInteger(text))
            return OptionValue(*parsed);
        return std::nullopt;
    case OptionKind::String:
        return OptionValue(text);
    case OptionKind::StringList:
        return OptionValue(splitOptionList(text));
    }
    return std::nullopt;
}

// Coerces a stored value to the kind its definition declares.
OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    case OptionKind::Integer:
        return OptionValue(value.toInteger(definition.defaultValue.toInteger()));
    case OptionKind::String:
        return OptionValue(value.toString(definition.defaultValue.toString()));
    case OptionKind::StringList:
        return OptionValue(value.toStringList());
    }
    return value;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        std::filesystem::path path(xdg);
        if (!path.empty())
            return path / kSuiteDirectory;
    }
    if (const char *home = std::getenv("HOME"))
    {
        std::filesystem::path path(home);
        if (!path.empty())
            return path / ".config" / kSuiteDirectory;
    }
    return std::filesystem::path(".config") / kSuiteDirectory;
}

} // namespace

std::vector<std::string> splitOptionList(std::string_view text)
{
    std::string normalized(text);
    std::replace(normalized.begin(), normalized.end(), ';', ',');
    std::vector<std::string> result;
    std::stringstream in(normalized);
    std::string token;
    while (std::getline(in, token, ','))
    {
        std::string cleaned = trim(token);
        if (!cleaned.empty())
            result.push_back(std::move(cleaned));
    }
    return result;
}

std::string describeValue(const OptionDefinition &definition, const OptionValue &value)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return value.toBool() ? "true" : "false";
    case OptionKind::Integer:
        return std::to_string(value.toInteger());
    case OptionKind::String:
    {
        std::string text = value.toString();
        return text.empty() ? "\"\"" : text;
    }
    case OptionKind::StringList:
    {
        std::ostringstream out;
        out << '[';
        const auto items = value.toStringList();
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
                out << ", ";
            out << items[i];
        }
        out << ']';
        return out.str();
    }
    }
    return value.toString();
}

std::string environmentVariableName(std::string_view key)
{
    std::string name(kEnvironmentPrefix);
    for (std::size_t i = 0; i < key.size(); ++i)
    {
        unsigned char ch = static_cast<unsigned char>(key[i]);
        if (std::isupper(ch) && i > 0)
            name.push_back('_');
        name.push_back(std::isalnum(ch) ? static_cast<char>(std::toupper(ch)) : '_');
    }
    return name;
}

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : value(std::move(value))
{
}

OptionValueType OptionValue::type() const noexcept
{
    if (std::holds_alternative<bool>(value))
        return OptionValueType::Boolean;
    if (std::holds_alternative<std::int64_t>(value))
        return OptionValueType::Integer;
    if (std::holds_alternative<std::string>(value))
        return OptionValueType::String;
    if (std::holds_alternative<std::vector<std::string>>(value))
        return OptionValueType::StringList;
    return OptionValueType::None;
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr).value_or(fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *sptr = std::get_if<std::string>(&value))
        return *sptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? "true" : "false";
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return std::to_string(*iptr);
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (auto *lptr = std::get_if<std::vector<std::string>>(&value))
        return *lptr;
    if (auto *sptr = std::get_if<std::string>(&value))
        return splitOptionList(*sptr);
    return {};
}

bool OptionValue::operator==(const OptionValue &other) const noexcept
{
    return value == other.value;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = normalizeValue(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
        return;
    overrides[key] = normalizeValue(*definition, value);
}

bool OptionRegistry::setFromText(const std::string &key, const std::string &text)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
        return false;
    auto parsed = fromText(*definition, text);
    if (!parsed)
        return false;
    overrides[key] = *parsed;
    return true;
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto overrideIt = overrides.find(key);
    if (overrideIt != overrides.end())
        return overrideIt->second;
    if (const OptionDefinition *definition = findDefinition(key))
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::isOverridden(const std::string &key) const noexcept
{
    return overrides.find(key) != overrides.end();
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

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath, std::string *error)
{
    auto fail = [error](std::string message) {
        if (error)
            *error = std::move(message);
        return false;
    };

    std::ifstream in(filePath);
    if (!in)
        return fail("cannot open " + filePath.string());

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded())
        return fail("malformed JSON in " + filePath.string());
    if (!data.is_object())
        return fail("expected a JSON object in " + filePath.string());

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *definition = findDefinition(it.key());
        if (!definition)
            continue;
        auto parsed = fromJson(*definition, it.value());
        if (!parsed)
            return fail("option '" + it.key() + "' has the wrong type in " + filePath.string());
        overrides[it.key()] = *parsed;
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, definition] : definitions)
        data[key] = toJson(get(key));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
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

std::vector<std::string> OptionRegistry::applyEnvironment()
{
    std::vector<std::string> applied;
    for (const auto &[key, definition] : definitions)
    {
        const char *raw = std::getenv(environmentVariableName(key).c_str());
        if (!raw)
            continue;
        if (auto parsed = fromText(definition, raw))
        {
            overrides[key] = *parsed;
            applied.push_back(key);
        }
    }
    std::sort(applied.begin(), applied.end());
    return applied;
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
        result.push_back(definition);
    std::sort(result.begin(), result.end(), [](const OptionDefinition &a, const OptionDefinition &b) {
        return a.key < b.key;
    });
    return result;
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    return findDefinition(key);
}

std::filesystem::path OptionRegistry::configRoot()
{
    return detectConfigRoot();
}

std::vector<std::string> OptionRegistry::availableProfiles()
{
    std::vector<std::string> profiles;
    std::filesystem::path root = configRoot();
    std::error_code ec;
    std::filesystem::directory_iterator it(root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec)
        return profiles;

    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        std::error_code entryEc;
        if (!it->is_directory(entryEc))
            continue;
        if (std::filesystem::exists(it->path() / "defaults.json", entryEc))
            profiles.push_back(it->path().filename().string());
    }

    std::sort(profiles.begin(), profiles.end());
    return profiles;
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

} // namespace disksight::config
