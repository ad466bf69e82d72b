#include "pointers/config.hpp"
#include <cctype>
#include <fstream>

namespace pointers {

namespace {

bool is_plain_identifier(const std::string& name) {
    if (name.empty()) return false;
    auto c0 = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(c0) || c0 == '_')) return false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || uc == '_')) return false;
    }
    return true;
}

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

} // namespace

std::optional<log_level> log_level_from_string(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return std::nullopt;
}

configuration configuration::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw config_error("pointers configuration must be a JSON object");
    }

    configuration config;
    try {
        config.path = json.value("path", config.path);
        config.table_source = json.value("table_source", config.table_source);
        config.pointer_source = json.value("pointer_source", config.pointer_source);
        config.trigger_function = json.value("trigger_function", config.trigger_function);
        config.trigger_prefix = json.value("trigger_prefix", config.trigger_prefix);
        config.delete_trigger_prefix = json.value("delete_trigger_prefix", config.delete_trigger_prefix);
        config.read_only = json.value("read_only", config.read_only);
        if (json.contains("log_level")) {
            auto name = json.at("log_level").get<std::string>();
            auto level = log_level_from_string(name);
            if (!level) {
                throw config_error("Unknown log_level '" + name + "'");
            }
            config.level = *level;
        }
    } catch (const nlohmann::json::exception& e) {
        throw config_error(std::string("Invalid pointers configuration: ") + e.what());
    }

    config.validate();
    return config;
}

configuration configuration::load(const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        throw config_error("Cannot open configuration file: " + file);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error("Cannot parse configuration file " + file + ": " + e.what());
    }
    return from_json(json);
}

nlohmann::json configuration::to_json() const {
    return nlohmann::json{
        {"path", path},
        {"table_source", table_source},
        {"pointer_source", pointer_source},
        {"trigger_function", trigger_function},
        {"trigger_prefix", trigger_prefix},
        {"delete_trigger_prefix", delete_trigger_prefix},
        {"read_only", read_only},
        {"log_level", log_level_name(level)}
    };
}

void configuration::validate() const {
    const std::pair<const char*, const std::string*> names[] = {
        {"table_source", &table_source},
        {"pointer_source", &pointer_source},
        {"trigger_function", &trigger_function},
        {"trigger_prefix", &trigger_prefix},
        {"delete_trigger_prefix", &delete_trigger_prefix},
    };
    for (const auto& [key, value] : names) {
        if (!is_plain_identifier(*value)) {
            throw config_error(std::string("Configuration value '") + key +
                               "' is not a plain SQL identifier: '" + *value + "'");
        }
    }
    if (table_source == pointer_source) {
        throw config_error("table_source and pointer_source must differ");
    }
    if (trigger_prefix == delete_trigger_prefix) {
        throw config_error("trigger_prefix and delete_trigger_prefix must differ");
    }
}

} // namespace pointers
