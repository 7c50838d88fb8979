#pragma once

#include <string>

struct AppSettings {
    std::string endpoint_url;
    std::string region = "us-east-1";
    std::string bucket;
    int page_size = 1000;
    int max_pages = 10;
    int max_retries = 3;
    int retry_backoff_ms = 2000;
};

// Load settings from ~/.config/s3scan/settings.json
// Returns defaults if file missing or invalid
AppSettings loadSettings();

// Save settings to ~/.config/s3scan/settings.json
// Creates directory if needed, logs warning on failure.
// Credentials are never part of the settings.
bool saveSettings(const AppSettings& settings);

// Full path of the settings file, empty if HOME is not set
std::string settingsPath();
