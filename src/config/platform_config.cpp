// File: src/config/platform_config.cpp
//
// YAML Configuration Implementation for ModelStore platforms

#include "config/platform_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <vector>

namespace modelstore {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

std::optional<PlatformConfig> PlatformConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<PlatformConfig> PlatformConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    PlatformConfig config;
    std::string current_section;
    std::string current_key;
    std::string current_platform;
    int depth = 0;
    int sequence_depth = 0;
    bool failed = false;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem != nullptr) {
                std::cerr << ": " << parser.problem << " (line "
                          << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            // Sequences carry nothing we read; skip their contents
            case YAML_SEQUENCE_START_EVENT:
                sequence_depth++;
                break;

            case YAML_SEQUENCE_END_EVENT:
                sequence_depth--;
                if (sequence_depth == 0) {
                    current_key.clear();
                }
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                if (sequence_depth > 0) {
                    break;
                }
                if (depth == 2) {
                    // Value of a top-level key is a section
                    current_section = current_key;
                    current_key.clear();
                } else if (depth == 3 && current_section == "platforms") {
                    config.platforms[current_platform];
                }
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (sequence_depth > 0) {
                    break;
                }
                if (depth == 2) {
                    current_platform.clear();
                    current_key.clear();
                } else if (depth == 1) {
                    current_section.clear();
                    current_key.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                if (sequence_depth > 0) {
                    break;
                }
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    if (current_key.empty()) {
                        // Top-level key
                        current_key = value;
                    } else {
                        if (current_key == "default") {
                            config.default_platform = value;
                        }
                        current_key.clear();
                    }
                } else if (depth == 2 && current_section == "platforms") {
                    if (current_platform.empty()) {
                        // Platform name; its options follow as a mapping
                        current_platform = value;
                    } else if (value.empty()) {
                        // "name:" with no options
                        config.platforms[current_platform];
                        current_platform.clear();
                    } else {
                        std::cerr << "Platform '" << current_platform
                                  << "' must be a mapping of options" << std::endl;
                        failed = true;
                        done = true;
                    }
                } else if (depth == 3 && current_section == "platforms") {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        PlatformInfo& info = config.platforms[current_platform];
                        if (current_key == "class") info.backend_class = value;
                        else info.options[current_key] = value;
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (failed) {
        return std::nullopt;
    }

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool PlatformConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> PlatformConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (platforms.empty()) {
        errors.push_back("at least one platform must be configured");
    }

    for (const auto& [name, info] : platforms) {
        if (name.empty()) {
            errors.push_back("platform names must not be empty");
        }
        if (info.backend_class.empty()) {
            errors.push_back("platform '" + name + "' has no class");
        }
    }

    // The default must name a configured platform
    if (default_platform.empty()) {
        errors.push_back("no default platform");
    } else if (platforms.count(default_platform) == 0) {
        errors.push_back("default platform '" + default_platform + "' is not configured");
    }

    return errors;
}

const PlatformInfo* PlatformConfig::GetPlatformInfo(const std::string& name) const {
    auto it = platforms.find(name.empty() ? default_platform : name);
    return it == platforms.end() ? nullptr : &it->second;
}

PlatformConfig PlatformConfig::Default() {
    PlatformConfig config;
    config.default_platform = "local";
    config.platforms["local"] = PlatformInfo{"memory", {}};
    return config;
}

} // namespace modelstore
