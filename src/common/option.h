#pragma once

#include <any>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace retrier {

// Options is a map of config items <config_name, config_value>
using Options = std::unordered_map<std::string, std::string>;

inline std::ostream& operator<<(std::ostream& os, const Options& options) {
    os << "{";
    for (auto it = options.begin(); it != options.end(); ++it) {
        if (it != options.begin()) {
            os << ", ";
        }
        os << it->first << ": " << it->second;
    }
    os << "}";
    return os;
}

inline std::string ToString(const Options& options) {
    std::ostringstream oss;
    oss << options;
    return oss.str();
}

// Option definition: config name, config value type, default value
enum ValueType : uint8_t { INT = 0, STRING = 1, BOOL = 2, DOUBLE = 3, INT64 = 4, UNKNOWN = 255 };

struct OptionDef {
    ValueType value_type;
    std::string default_value;
};

using OptionDefinition = std::unordered_map<std::string, OptionDef>;

inline OptionDefinition& GetOptionDefinitions() {
    static OptionDefinition defs;
    return defs;
}

inline std::mutex& GetOptionDefinitionsMutex() {
    static std::mutex m;
    return m;
}

struct RegisterOption {
    RegisterOption(const std::string& name, ValueType type, const std::string& default_value) {
        std::lock_guard<std::mutex> lock(GetOptionDefinitionsMutex());
        auto& defs = GetOptionDefinitions();

        auto it = defs.find(name);
        if (it == defs.end()) {
            defs.emplace(name, OptionDef{type, default_value});
            return;
        }

        const auto& old = it->second;
        if (old.value_type != type || old.default_value != default_value) {
            SPDLOG_ERROR(
                "Option {} already defined with different definition: "
                "old(type={}, default={}), new(type={}, default={})",
                name,
                static_cast<int>(old.value_type),
                old.default_value,
                static_cast<int>(type),
                default_value);
        }
    }
};

#define RETRIER_OPTION(name, type, default_value) \
    inline const std::string name = #name; \
    inline const ::retrier::RegisterOption option_reg_##name(name, type, default_value);

/********** Option definition: [Option Name, Option Type, Default Value] ***********/
RETRIER_OPTION(RETRIER_OPTIONS_LOAD_MODE, STRING, "ENV") // ENV, FILE
RETRIER_OPTION(RETRIER_OPTIONS_FILE_PATH, STRING, "") // Config file path

// Retry Options
RETRIER_OPTION(RETRIER_MAX_RETRIES, INT, "3") // negative retries forever
RETRIER_OPTION(RETRIER_BACKOFF_TYPE, STRING, "FIXED") // FIXED, EXPONENTIAL
RETRIER_OPTION(RETRIER_FIXED_BACKOFF_MS, INT64, "1000")
RETRIER_OPTION(RETRIER_EXPONENTIAL_INIT_DELAY_MS, INT64, "500")
RETRIER_OPTION(RETRIER_EXPONENTIAL_MAX_DELAY_MS, INT64, "30000") // 30s
RETRIER_OPTION(RETRIER_EXPONENTIAL_FACTOR, DOUBLE, "2.0")

// Log Options
RETRIER_OPTION(RETRIER_LOG_DIR, STRING, "/tmp/retrier")
RETRIER_OPTION(RETRIER_LOG_LEVEL, STRING, "INFO") // DEBUG, INFO, WARNING, ERROR
RETRIER_OPTION(RETRIER_LOG_TO_CONSOLE, BOOL, "false")
RETRIER_OPTION(RETRIER_LOG_TO_FILE, BOOL, "true")
RETRIER_OPTION(RETRIER_LOG_MAX_FILE_DAYS, INT, "5") // 5 days
/********** Option definition: [Option Name, Option Type, Default Value] ***********/

// Value Parser Utils, option values are always held as strings
inline int ParseInt(const std::string& value) {
    return std::stoi(value);
}

inline bool ParseBool(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" || value == "1") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE" || value == "0") {
        return false;
    }
    throw std::invalid_argument("Invalid value for bool: " + value);
}

inline double ParseDouble(const std::string& value) {
    return std::stod(value);
}

inline int64_t ParseLong(const std::string& value) {
    return std::stoll(value);
}

inline std::any ParseValue(ValueType type, const std::string& value) {
    switch (type) {
        case ValueType::INT:
            return ParseInt(value);
        case ValueType::STRING:
            return value;
        case ValueType::BOOL:
            return ParseBool(value);
        case ValueType::DOUBLE:
            return ParseDouble(value);
        case ValueType::INT64:
            return ParseLong(value);
        default:
            SPDLOG_ERROR("Invalid option type {} for value {}", static_cast<int>(type), value);
            throw std::invalid_argument("Invalid type for value: " + std::to_string(type));
    }
}

// Get & Put Option Value from Options
template <typename T>
T GetOptionValue(const Options& options, const std::string& name) {
    auto& defs = GetOptionDefinitions();
    auto def_iter = defs.find(name);
    if (def_iter == defs.end()) {
        SPDLOG_ERROR("Option definition for {} not found", name);
        return T{};
    }

    const auto& def = def_iter->second;

    auto opt_iter = options.find(name);
    if (opt_iter != options.end()) {
        return std::any_cast<T>(ParseValue(def.value_type, opt_iter->second));
    }

    if (def.default_value.empty()) {
        SPDLOG_ERROR("Option {} not set and no default value", name);
        return T{};
    }

    return std::any_cast<T>(ParseValue(def.value_type, def.default_value));
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value);

// Utils for config
std::string GetOptionFromEnv(const std::string& name);
void LoadOptions(Options& options);
void LoadOptionsFromEnv(Options& options);
void LoadOptionsFromFile(Options& options, std::string file_path = "");

} // namespace retrier
