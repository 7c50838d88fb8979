#include "settings.h"
#include "loguru.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <limits>
#include <sys/stat.h>

using json = nlohmann::json;

static std::string getSettingsDir() {
    // Respect XDG_CONFIG_HOME if set
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        return std::string(xdg_config) + "/s3scan";
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        return "";
    }
    return std::string(home) + "/.config/s3scan";
}

std::string settingsPath() {
    std::string dir = getSettingsDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/settings.json";
}

static bool createDirRecursive(const std::string& dir) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    size_t pos = dir.rfind('/');
    if (pos != std::string::npos && pos > 0) {
        if (!createDirRecursive(dir.substr(0, pos))) {
            return false;
        }
    }

    return mkdir(dir.c_str(), 0755) == 0;
}

// Positive integer setting that fits an int, falling back to the default
static int positiveValue(const json& j, const char* key, int fallback) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return fallback;
    }
    if (j[key].is_number_unsigned()) {
        uint64_t value = j[key].get<uint64_t>();
        if (value == 0 || value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            LOG_F(WARNING, "Ignoring out-of-range setting %s=%llu", key,
                  static_cast<unsigned long long>(value));
            return fallback;
        }
        return static_cast<int>(value);
    }
    int64_t value = j[key].get<int64_t>();
    if (value <= 0 || value > std::numeric_limits<int>::max()) {
        LOG_F(WARNING, "Ignoring out-of-range setting %s=%lld", key, static_cast<long long>(value));
        return fallback;
    }
    return static_cast<int>(value);
}

static AppSettings settingsFromJson(const json& j) {
    AppSettings settings;
    settings.endpoint_url = j.value("endpoint_url", "");
    settings.region = j.value("region", settings.region);
    settings.bucket = j.value("bucket", "");
    settings.page_size = positiveValue(j, "page_size", settings.page_size);
    settings.max_pages = positiveValue(j, "max_pages", settings.max_pages);
    settings.max_retries = positiveValue(j, "max_retries", settings.max_retries);
    settings.retry_backoff_ms = positiveValue(j, "retry_backoff_ms", settings.retry_backoff_ms);
    return settings;
}

static json settingsToJson(const AppSettings& settings) {
    return json{
        {"endpoint_url", settings.endpoint_url},
        {"region", settings.region},
        {"bucket", settings.bucket},
        {"page_size", settings.page_size},
        {"max_pages", settings.max_pages},
        {"max_retries", settings.max_retries},
        {"retry_backoff_ms", settings.retry_backoff_ms},
    };
}

AppSettings loadSettings() {
    std::string path = settingsPath();
    if (path.empty()) {
        LOG_F(INFO, "Cannot determine settings path (HOME not set)");
        return AppSettings();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_F(INFO, "No settings file found at %s", path.c_str());
        return AppSettings();
    }

    AppSettings settings;
    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            LOG_F(WARNING, "Settings file %s is not a JSON object", path.c_str());
            return AppSettings();
        }
        settings = settingsFromJson(j);
    } catch (const json::exception& e) {
        LOG_F(WARNING, "Failed to parse settings file %s: %s", path.c_str(), e.what());
        return AppSettings();
    }

    LOG_F(INFO, "Loaded settings: endpoint=%s bucket=%s pageSize=%d maxPages=%d maxRetries=%d",
          settings.endpoint_url.empty() ? "(aws)" : settings.endpoint_url.c_str(),
          settings.bucket.c_str(), settings.page_size, settings.max_pages, settings.max_retries);
    return settings;
}

bool saveSettings(const AppSettings& settings) {
    std::string dir = getSettingsDir();
    if (dir.empty()) {
        LOG_F(WARNING, "Cannot determine settings directory (HOME not set)");
        return false;
    }
    if (!createDirRecursive(dir)) {
        LOG_F(WARNING, "Failed to create settings directory: %s", dir.c_str());
        return false;
    }

    // Write beside the target and rename, so a crash never leaves half a file
    std::string path = settingsPath();
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            LOG_F(WARNING, "Failed to open settings file for writing: %s", tmpPath.c_str());
            return false;
        }
        file << settingsToJson(settings).dump(2) << std::endl;
        if (!file) {
            LOG_F(WARNING, "Failed to write settings file: %s", tmpPath.c_str());
            std::remove(tmpPath.c_str());
            return false;
        }
    }

    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        LOG_F(WARNING, "Failed to replace settings file %s: %s", path.c_str(), std::strerror(errno));
        std::remove(tmpPath.c_str());
        return false;
    }

    LOG_F(INFO, "Saved settings to %s", path.c_str());
    return true;
}
