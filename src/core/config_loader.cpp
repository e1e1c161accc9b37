#include "core/config_loader.h"

#include <fstream>
#include <nlohmann/json.hpp>

namespace mp3sanitize {

namespace {

void parseLoggingSection(const nlohmann::json& section, logging::LogConfig& out, bool verbose) {
    if (section.contains("level") && section["level"].is_string()) {
        const std::string level = section["level"].get<std::string>();
        if (logging::isValidLevelName(level)) {
            out.level = logging::stringToLevel(level);
        } else if (verbose) {
            LOG_WARN("Config: Unknown logging.level '{}', using '{}'", level,
                     logging::levelToString(out.level));
        }
    }
    if (section.contains("filePath") && section["filePath"].is_string()) {
        out.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize") && section["maxFileSize"].is_number_unsigned()) {
        out.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups") && section["maxBackups"].is_number_unsigned()) {
        out.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput") && section["consoleOutput"].is_boolean()) {
        out.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput") && section["coloredOutput"].is_boolean()) {
        out.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern") && section["pattern"].is_string()) {
        out.pattern = section["pattern"].get<std::string>();
    }
}

// "drop": ["riff", "id3"] or "drop": "riff,id3" / "none"
void parseDrop(const nlohmann::json& value, DropSet& out, bool verbose) {
    if (value.is_string()) {
        const std::string list = value.get<std::string>();
        if (auto parsed = parseDropList(list)) {
            out = *parsed;
        } else if (verbose) {
            LOG_WARN("Config: Invalid drop list '{}', using '{}'", list, dropSetToString(out));
        }
        return;
    }
    if (!value.is_array()) {
        if (verbose) {
            LOG_WARN("Config: drop must be an array of category names");
        }
        return;
    }

    DropSet drop = DropSet::none();
    for (const auto& item : value) {
        if (!item.is_string()) {
            continue;
        }
        const std::string name = item.get<std::string>();
        if (auto kind = mpeg::parseMetadataKind(name)) {
            drop.add(*kind);
        } else if (verbose) {
            LOG_WARN("Config: Ignoring unknown drop category '{}'", name);
        }
    }
    out = drop;
}

}  // namespace

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (!j.is_object()) {
            if (verbose) {
                LOG_ERROR("Config: {} must contain a JSON object", configPath.string());
            }
            return false;
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            parseLoggingSection(j["logging"], outConfig.logging, verbose);
        }
        if (j.contains("drop")) {
            parseDrop(j["drop"], outConfig.drop, verbose);
        }
        if (j.contains("mangle") && j["mangle"].is_boolean()) {
            outConfig.mangle = j["mangle"].get<bool>();
        }
        if (j.contains("skipInvalidData") && j["skipInvalidData"].is_boolean()) {
            outConfig.skipInvalidData = j["skipInvalidData"].get<bool>();
        }
        if (j.contains("outputSuffix") && j["outputSuffix"].is_string()) {
            std::string suffix = j["outputSuffix"].get<std::string>();
            // An empty suffix would make the default output path the input itself
            if (!suffix.empty() && suffix.find('/') == std::string::npos) {
                outConfig.outputSuffix = suffix;
            } else if (verbose) {
                LOG_WARN("Config: Invalid outputSuffix '{}', using '{}'", suffix,
                         outConfig.outputSuffix);
            }
        }
        if (j.contains("libraryPath") && j["libraryPath"].is_string()) {
            outConfig.libraryPath = j["libraryPath"].get<std::string>();
        }

        if (verbose) {
            LOG_DEBUG("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

}  // namespace mp3sanitize
