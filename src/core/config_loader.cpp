#include "core/config_loader.h"

#include "logging/logger.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace v2v_wrapper {

namespace {

bool parseEnvInt(const char* name, int& target, std::string& error) {
    if (const char* env = std::getenv(name)) {
        char* end = nullptr;
        long value = std::strtol(env, &end, 10);
        if (end && end != env && *end == '\0') {
            target = static_cast<int>(value);
            return true;
        }
        error = std::string("Environment variable ") + name + " is not an integer: " + env;
        return false;
    }
    return true;
}

void applyEnvString(const char* name, std::string& target) {
    if (const char* env = std::getenv(name)) {
        target = env;
    }
}

}  // namespace

bool loadWrapperConfig(const std::filesystem::path& configPath, WrapperConfig& outConfig,
                       bool verbose) {
    outConfig = WrapperConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_DEBUG("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("virtV2vPath")) {
            outConfig.virtV2vPath = j["virtV2vPath"].get<std::string>();
        }
        if (j.contains("logDir")) {
            outConfig.logDir = j["logDir"].get<std::string>();
        }
        if (j.contains("stateDir")) {
            outConfig.stateDir = j["stateDir"].get<std::string>();
        }
        if (j.contains("localOutputDir")) {
            outConfig.localOutputDir = j["localOutputDir"].get<std::string>();
        }
        if (j.contains("vddkLibDir")) {
            outConfig.vddkLibDir = j["vddkLibDir"].get<std::string>();
        }
        if (j.contains("serviceAccount")) {
            outConfig.serviceAccount = j["serviceAccount"].get<std::string>();
        }
        if (j.contains("rhvCaFile")) {
            outConfig.rhvCaFile = j["rhvCaFile"].get<std::string>();
        }
        if (j.contains("vdsmMountsDir")) {
            outConfig.vdsmMountsDir = j["vdsmMountsDir"].get<std::string>();
        }
        if (j.contains("persistIntervalMs")) {
            int interval = j["persistIntervalMs"].get<int>();
            if (interval > 0) {
                outConfig.persistIntervalMs = interval;
            } else if (verbose) {
                LOG_WARN("Config: persistIntervalMs must be positive, keeping {}",
                         outConfig.persistIntervalMs);
            }
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& logSection = j["logging"];
            try {
                if (logSection.contains("level")) {
                    outConfig.logging.level =
                        logging::stringToLevel(logSection["level"].get<std::string>());
                }
                if (logSection.contains("maxFileSize")) {
                    outConfig.logging.maxFileSize = logSection["maxFileSize"].get<size_t>();
                }
                if (logSection.contains("maxBackups")) {
                    outConfig.logging.maxBackups = logSection["maxBackups"].get<size_t>();
                }
                if (logSection.contains("pattern")) {
                    outConfig.logging.pattern = logSection["pattern"].get<std::string>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid logging settings, using defaults: {}", e.what());
                }
                outConfig.logging = WrapperConfig::LoggingConfig{};
            }
        }

        if (verbose) {
            LOG_DEBUG("Config: loaded {}", configPath.string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        return false;
    }
}

bool applyEnvOverrides(WrapperConfig& config, std::string& error) {
    applyEnvString("V2V_WRAPPER_VIRT_V2V", config.virtV2vPath);
    applyEnvString("V2V_WRAPPER_LOG_DIR", config.logDir);
    applyEnvString("V2V_WRAPPER_STATE_DIR", config.stateDir);
    applyEnvString("V2V_WRAPPER_LOCAL_OUTPUT_DIR", config.localOutputDir);
    applyEnvString("V2V_WRAPPER_VDDK_LIBDIR", config.vddkLibDir);
    applyEnvString("V2V_WRAPPER_SERVICE_ACCOUNT", config.serviceAccount);
    applyEnvString("V2V_WRAPPER_VDSM_MOUNTS_DIR", config.vdsmMountsDir);
    if (const char* level = std::getenv("V2V_WRAPPER_LOG_LEVEL")) {
        config.logging.level = logging::stringToLevel(level);
    }
    if (!parseEnvInt("V2V_WRAPPER_PERSIST_INTERVAL_MS", config.persistIntervalMs, error)) {
        return false;
    }
    if (config.persistIntervalMs <= 0) {
        error = "V2V_WRAPPER_PERSIST_INTERVAL_MS must be positive";
        return false;
    }
    return true;
}

}  // namespace v2v_wrapper
