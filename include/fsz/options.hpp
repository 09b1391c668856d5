#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fsz::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String
};

enum class OptionValueType
{
    None,
    Boolean,
    Integer,
    String
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);

    OptionValueType type() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const noexcept;
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, std::string>;
    Storage value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string description;
};

// Typed option store for one application. A value set through set(), a loaded
// file or the environment overrides the registered default.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    // Reads FSZ_<APP>_<KEY> for every registered option and stores the parsed
    // values as overrides. Returns the number of options taken from the environment.
    std::size_t applyEnvironment();
    std::string environmentName(const std::string &key) const;

    bool loadFromFile(const std::filesystem::path &filePath, std::string *error = nullptr);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    std::vector<OptionDefinition> listRegisteredOptions() const;

    static std::filesystem::path configRoot();

private:
    const OptionDefinition *findDefinition(const std::string &key) const;
    OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace fsz::config
