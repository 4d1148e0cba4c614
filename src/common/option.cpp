#include "common/option.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace retrier {

void PutOptionValue(Options& options, const std::string& name, const std::string& value) {
    if (value.empty()) {
        SPDLOG_INFO("Option {} is empty! Skip it.", name);
        return;
    }
    if (options.find(name) != options.end()) {
        SPDLOG_WARN("Option {} exists! Update it to {}.", name, value);
    }
    options[name] = value;
}

std::string GetOptionFromEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    return env_value != nullptr ? std::string(env_value) : "";
}

void LoadOptions(Options& options) {
    std::string load_mode = GetOptionFromEnv(RETRIER_OPTIONS_LOAD_MODE);
    load_mode = load_mode.empty() ? GetOptionValue<std::string>(options, RETRIER_OPTIONS_LOAD_MODE) : load_mode;
    load_mode = ToUpper(load_mode);
    if (load_mode == "ENV") {
        LoadOptionsFromEnv(options);
    } else if (load_mode == "FILE") {
        LoadOptionsFromFile(options);
    } else {
        SPDLOG_ERROR("Invalid load mode: {}", load_mode);
        throw std::invalid_argument("Invalid options load mode: " + load_mode);
    }
}

void LoadOptionsFromEnv(Options& options) {
    std::lock_guard<std::mutex> lock(GetOptionDefinitionsMutex());
    const auto& defs = GetOptionDefinitions();

    for (const auto& [name, def] : defs) {
        const char* env_value = std::getenv(name.c_str());
        if (env_value != nullptr) {
            PutOptionValue(options, name, std::string(env_value));
        }
    }

    SPDLOG_INFO("Load options from ENV: {}", ToString(options));
}

constexpr const char* DEFAULT_RETRIER_CONFIG_FILE = "retrier.conf";

void LoadOptionsFromFile(Options& options, std::string file_path) {
    file_path = file_path.empty() ? GetOptionFromEnv(RETRIER_OPTIONS_FILE_PATH) : file_path;

    // Not in ENV, try the options themselves
    if (file_path.empty() && options.find(RETRIER_OPTIONS_FILE_PATH) != options.end()) {
        file_path = GetOptionValue<std::string>(options, RETRIER_OPTIONS_FILE_PATH);
    }

    file_path
        = file_path.empty() ? std::filesystem::current_path().string() + "/" + DEFAULT_RETRIER_CONFIG_FILE : file_path;

    std::ifstream config_file(file_path);
    if (!config_file.is_open()) {
        SPDLOG_WARN("Config file not found: {}. Skip load options from file.", file_path);
        return;
    }

    std::string line;
    int line_number = 0;

    while (std::getline(config_file, line)) {
        line_number++;
        line = TrimCopy(line);

        if (line.empty() || line[0] == COMMENT_PREFIX) {
            continue;
        }

        size_t const delimiter_pos = line.find(KEY_VALUE_DELIMITER);
        if (delimiter_pos == std::string::npos) {
            SPDLOG_WARN("Invalid config line {} in {}: {} (missing '=')", line_number, file_path, line);
            continue;
        }

        std::string key = TrimCopy(std::string_view(line).substr(0, delimiter_pos));
        std::string value = TrimCopy(std::string_view(line).substr(delimiter_pos + 1));

        bool known = false;
        {
            std::lock_guard<std::mutex> lock(GetOptionDefinitionsMutex());
            known = GetOptionDefinitions().count(key) > 0;
        }

        if (known) {
            PutOptionValue(options, key, value);
            SPDLOG_DEBUG("Loaded option from file: {} = {}", key, value);
        } else {
            SPDLOG_WARN("Unknown option in config file line {}: {} (skipping)", line_number, key);
        }
    }

    SPDLOG_INFO("Load options from file [{}]: {}", file_path, ToString(options));
}

} // namespace retrier
