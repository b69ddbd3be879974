#include "menukit/config/configuration.hpp"
#include "menukit/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <iterator>

namespace openflow::menukit {

using json = nlohmann::json;

namespace {

constexpr const char* kMenuSection = "menu";
constexpr const char* kLoggingSection = "logging";

}  // namespace

Configuration::Configuration() {
    setDefaults();
}

Configuration::~Configuration() = default;

Result<Configuration> Configuration::load(const std::string& filename) {
    Configuration config;
    RETURN_IF_ERROR(config.loadFromFile(filename));
    return config;
}

Result<void> Configuration::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        return unexpected(MAKE_ERROR(CONFIG_FILE_NOT_FOUND,
            "Configuration file not found: " + filename));
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(CONFIG_FILE_NOT_FOUND,
            "Cannot open configuration file: " + filename));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    RETURN_IF_ERROR(loadFromString(content));

    LOG_INFO("Loaded configuration from {}", filename);
    return {};
}

Result<void> Configuration::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return unexpected(MAKE_ERROR(CONFIG_WRITE_FAILED,
            "Cannot write configuration file: " + filename));
    }

    file << saveToString();
    if (!file) {
        return unexpected(MAKE_ERROR(CONFIG_WRITE_FAILED,
            "Failed writing configuration file: " + filename));
    }
    return {};
}

Result<void> Configuration::loadFromString(const std::string& config_data) {
    json root;
    try {
        root = json::parse(config_data);
    } catch (const json::parse_error& ex) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
            std::string("Invalid JSON: ") + ex.what()));
    }

    if (!root.is_object()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
            "Configuration root must be an object of sections"));
    }

    // Parse into a scratch tree so a bad file leaves the current values intact
    ConfigTree parsed;
    for (const auto& section_entry : root.items()) {
        const std::string& section_name = section_entry.key();
        const json& section = section_entry.value();
        if (!section.is_object()) {
            return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
                "Section '" + section_name + "' must be an object"));
        }

        ConfigSection& values = parsed[section_name];
        for (const auto& entry : section.items()) {
            const std::string& key = entry.key();
            const json& value = entry.value();
            if (value.is_boolean()) {
                values[key] = value.get<bool>();
            } else if (value.is_number_integer()) {
                values[key] = value.get<int64_t>();
            } else if (value.is_number_float()) {
                values[key] = value.get<double>();
            } else if (value.is_string()) {
                values[key] = value.get<std::string>();
            } else {
                return unexpected(MAKE_ERROR(CONFIG_INVALID_VALUE,
                    "Value '" + section_name + "." + key + "' must be a scalar"));
            }
        }
    }

    for (auto& section_entry : parsed) {
        ConfigSection& target = config_tree_[section_entry.first];
        for (auto& value_entry : section_entry.second) {
            target[value_entry.first] = std::move(value_entry.second);
        }
    }
    return {};
}

std::string Configuration::saveToString() const {
    json root = json::object();
    for (const auto& section_entry : config_tree_) {
        json section = json::object();
        for (const auto& value_entry : section_entry.second) {
            const std::string& key = value_entry.first;
            std::visit([&section, &key](const auto& v) { section[key] = v; }, value_entry.second);
        }
        root[section_entry.first] = std::move(section);
    }
    return root.dump(2);
}

bool Configuration::hasSection(const std::string& section) const {
    return config_tree_.find(section) != config_tree_.end();
}

bool Configuration::hasKey(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

Configuration::ConfigSection Configuration::getSection(const std::string& section) const {
    auto section_it = config_tree_.find(section);
    if (section_it != config_tree_.end()) {
        return section_it->second;
    }
    return ConfigSection{};
}

void Configuration::setSection(const std::string& section, const ConfigSection& values) {
    config_tree_[section] = values;
}

void Configuration::removeSection(const std::string& section) {
    config_tree_.erase(section);
}

std::vector<std::string> Configuration::getSectionNames() const {
    std::vector<std::string> names;
    names.reserve(config_tree_.size());
    for (const auto& pair : config_tree_) {
        names.push_back(pair.first);
    }
    return names;
}

void Configuration::setDefaults() {
    config_tree_.clear();
    setMenuConfig(MenuConfig{});
    setLoggingConfig(LoggingConfig{});
}

Result<MenuConfig> Configuration::getMenuConfig() const {
    MenuConfig config;

    auto read = [this](const char* key, auto& out) -> Result<void> {
        const ConfigValue* value = find(kMenuSection, key);
        if (!value) {
            return {};
        }
        if (!convertValue(*value, out)) {
            return unexpected(MAKE_ERROR(CONFIG_INVALID_VALUE,
                std::string("menu.") + key + " has the wrong type"));
        }
        return {};
    };

    int64_t delay_ms = config.announce_clear_delay.count();
    RETURN_IF_ERROR(read("announce_clear_delay_ms", delay_ms));
    if (delay_ms < 0) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_VALUE,
            "menu.announce_clear_delay_ms must not be negative"));
    }
    config.announce_clear_delay = Duration(delay_ms);

    RETURN_IF_ERROR(read("announce_item_count", config.announce_item_count));
    RETURN_IF_ERROR(read("announce_highlight", config.announce_highlight));
    RETURN_IF_ERROR(read("close_on_tab", config.close_on_tab));
    RETURN_IF_ERROR(read("default_label", config.default_label));

    if (config.default_label.empty()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_VALUE,
            "menu.default_label must not be empty"));
    }

    return config;
}

LoggingConfig Configuration::getLoggingConfig() const {
    LoggingConfig config;
    config.level = getValue<std::string>(kLoggingSection, "level", config.level);
    config.file = getValue<std::string>(kLoggingSection, "file", config.file);
    config.console = getValue<bool>(kLoggingSection, "console", config.console);
    return config;
}

void Configuration::setMenuConfig(const MenuConfig& config) {
    setValue<int64_t>(kMenuSection, "announce_clear_delay_ms", config.announce_clear_delay.count());
    setValue(kMenuSection, "announce_item_count", config.announce_item_count);
    setValue(kMenuSection, "announce_highlight", config.announce_highlight);
    setValue(kMenuSection, "close_on_tab", config.close_on_tab);
    setValue(kMenuSection, "default_label", config.default_label);
}

void Configuration::setLoggingConfig(const LoggingConfig& config) {
    setValue(kLoggingSection, "level", config.level);
    setValue(kLoggingSection, "file", config.file);
    setValue(kLoggingSection, "console", config.console);
}

const Configuration::ConfigValue* Configuration::find(const std::string& section,
                                                      const std::string& key) const {
    auto section_it = config_tree_.find(section);
    if (section_it == config_tree_.end()) {
        return nullptr;
    }
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return nullptr;
    }
    return &key_it->second;
}

}  // namespace openflow::menukit
