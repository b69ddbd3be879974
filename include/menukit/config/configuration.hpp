#pragma once

#include "menukit/utils/types.hpp"
#include "menukit/utils/error.hpp"
#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <variant>

namespace openflow::menukit {

/**
 * @brief Behaviour switches shared by every menu controller
 */
struct MenuConfig {
    Duration announce_clear_delay{1000};
    bool announce_item_count = true;
    bool announce_highlight = true;
    bool close_on_tab = true;
    std::string default_label = "Menu";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
};

/**
 * @brief Sectioned key/value configuration backed by JSON files
 *
 * The file is a single object of sections; each section is an object of
 * scalar values. Loaded values are layered over the defaults.
 *
 * {
 *   "menu": { "announce_clear_delay_ms": 750, "close_on_tab": true },
 *   "logging": { "level": "debug" }
 * }
 */
class Configuration {
public:
    using ConfigValue = std::variant<bool, int64_t, double, std::string>;
    using ConfigSection = std::unordered_map<std::string, ConfigValue>;
    using ConfigTree = std::unordered_map<std::string, ConfigSection>;

    Configuration();
    ~Configuration();

    static Result<Configuration> load(const std::string& filename);

    // File operations
    Result<void> loadFromFile(const std::string& filename);
    Result<void> saveToFile(const std::string& filename) const;
    Result<void> loadFromString(const std::string& config_data);
    std::string saveToString() const;

    // Value access
    template<typename T>
    T getValue(const std::string& section, const std::string& key, const T& default_value = T{}) const;

    template<typename T>
    void setValue(const std::string& section, const std::string& key, const T& value);

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // Section management
    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& values);
    void removeSection(const std::string& section);
    std::vector<std::string> getSectionNames() const;

    void setDefaults();

    // Typed accessors; the menu view rejects out-of-range or mistyped values
    Result<MenuConfig> getMenuConfig() const;
    LoggingConfig getLoggingConfig() const;

    void setMenuConfig(const MenuConfig& config);
    void setLoggingConfig(const LoggingConfig& config);

private:
    ConfigTree config_tree_;

    template<typename T>
    static bool convertValue(const ConfigValue& value, T& out);

    const ConfigValue* find(const std::string& section, const std::string& key) const;
};

// Template implementations
template<typename T>
bool Configuration::convertValue(const ConfigValue& value, T& out) {
    if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&value)) {
            out = *typed;
            return true;
        }
        return false;
    } else if constexpr (std::is_integral_v<T>) {
        if (const int64_t* typed = std::get_if<int64_t>(&value)) {
            out = static_cast<T>(*typed);
            return true;
        }
        return false;
    } else if constexpr (std::is_floating_point_v<T>) {
        if (const double* typed = std::get_if<double>(&value)) {
            out = static_cast<T>(*typed);
            return true;
        }
        if (const int64_t* typed = std::get_if<int64_t>(&value)) {
            out = static_cast<T>(*typed);
            return true;
        }
        return false;
    } else {
        static_assert(sizeof(T) == 0, "Unsupported configuration value type");
    }
}

template<typename T>
T Configuration::getValue(const std::string& section, const std::string& key, const T& default_value) const {
    const ConfigValue* value = find(section, key);
    if (!value) {
        return default_value;
    }

    T out{};
    return convertValue(*value, out) ? out : default_value;
}

template<typename T>
void Configuration::setValue(const std::string& section, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        config_tree_[section][key] = value;
    } else if constexpr (std::is_integral_v<T>) {
        config_tree_[section][key] = static_cast<int64_t>(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        config_tree_[section][key] = static_cast<double>(value);
    } else {
        config_tree_[section][key] = std::string(value);
    }
}

}  // namespace openflow::menukit
