#include "settings.h"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace {

// Points XDG_CONFIG_HOME at a fresh temporary directory for one test
class ScopedConfigHome {
public:
    ScopedConfigHome() {
        char tmpl[] = "/tmp/s3scan-settings-XXXXXX";
        const char* dir = mkdtemp(tmpl);
        REQUIRE(dir != nullptr);
        m_dir = dir;

        const char* previous = std::getenv("XDG_CONFIG_HOME");
        m_hadPrevious = previous != nullptr;
        if (previous) m_previous = previous;
        setenv("XDG_CONFIG_HOME", m_dir.c_str(), 1);
    }

    ~ScopedConfigHome() {
        std::remove((m_dir + "/s3scan/settings.json").c_str());
        rmdir((m_dir + "/s3scan").c_str());
        rmdir(m_dir.c_str());
        if (m_hadPrevious) {
            setenv("XDG_CONFIG_HOME", m_previous.c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
    }

    const std::string& dir() const { return m_dir; }

private:
    std::string m_dir;
    std::string m_previous;
    bool m_hadPrevious = false;
};

void writeSettingsFile(const std::string& contents) {
    std::string dir = settingsPath().substr(0, settingsPath().rfind('/'));
    mkdir(dir.c_str(), 0755);
    std::ofstream out(settingsPath());
    out << contents;
}

}  // namespace

TEST_CASE("Settings path follows XDG_CONFIG_HOME", "[settings]") {
    ScopedConfigHome home;
    CHECK(settingsPath() == home.dir() + "/s3scan/settings.json");
}

TEST_CASE("Missing settings file yields defaults", "[settings]") {
    ScopedConfigHome home;
    AppSettings settings = loadSettings();
    CHECK(settings.endpoint_url.empty());
    CHECK(settings.region == "us-east-1");
    CHECK(settings.bucket.empty());
    CHECK(settings.page_size == 1000);
    CHECK(settings.max_pages == 10);
    CHECK(settings.max_retries == 3);
    CHECK(settings.retry_backoff_ms == 2000);
}

TEST_CASE("Settings survive a save and load", "[settings]") {
    ScopedConfigHome home;

    AppSettings saved;
    saved.endpoint_url = "http://localhost:9000";
    saved.region = "eu-central-1";
    saved.bucket = "datasets";
    saved.page_size = 250;
    saved.max_pages = 20;
    saved.max_retries = 5;
    saved.retry_backoff_ms = 500;
    REQUIRE(saveSettings(saved));

    AppSettings loaded = loadSettings();
    CHECK(loaded.endpoint_url == "http://localhost:9000");
    CHECK(loaded.region == "eu-central-1");
    CHECK(loaded.bucket == "datasets");
    CHECK(loaded.page_size == 250);
    CHECK(loaded.max_pages == 20);
    CHECK(loaded.max_retries == 5);
    CHECK(loaded.retry_backoff_ms == 500);
}

TEST_CASE("Credentials are never written to the settings file", "[settings]") {
    ScopedConfigHome home;
    REQUIRE(saveSettings(AppSettings()));

    std::ifstream in(settingsPath());
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("secret") == std::string::npos);
    CHECK(contents.find("access_key") == std::string::npos);
}

TEST_CASE("Invalid settings fall back to defaults", "[settings]") {
    ScopedConfigHome home;

    SECTION("malformed JSON") {
        writeSettingsFile("{ \"bucket\": ");
        AppSettings settings = loadSettings();
        CHECK(settings.bucket.empty());
        CHECK(settings.page_size == 1000);
    }

    SECTION("not an object") {
        writeSettingsFile("[1, 2, 3]");
        CHECK(loadSettings().max_pages == 10);
    }

    SECTION("non-positive and mistyped numbers") {
        writeSettingsFile("{\"bucket\": \"b\", \"page_size\": 0, \"max_pages\": -3, \"max_retries\": \"many\"}");
        AppSettings settings = loadSettings();
        CHECK(settings.bucket == "b");
        CHECK(settings.page_size == 1000);
        CHECK(settings.max_pages == 10);
        CHECK(settings.max_retries == 3);
    }

    SECTION("numbers too large for an int") {
        writeSettingsFile("{\"page_size\": 5000000000, \"max_pages\": 2147483648,"
                          " \"max_retries\": -5000000000, \"retry_backoff_ms\": 18446744073709551615}");
        AppSettings settings = loadSettings();
        CHECK(settings.page_size == 1000);
        CHECK(settings.max_pages == 10);
        CHECK(settings.max_retries == 3);
        CHECK(settings.retry_backoff_ms == 2000);
    }

    SECTION("largest int is accepted") {
        writeSettingsFile("{\"retry_backoff_ms\": 2147483647}");
        CHECK(loadSettings().retry_backoff_ms == 2147483647);
    }

    SECTION("mistyped strings") {
        writeSettingsFile("{\"bucket\": 12}");
        AppSettings settings = loadSettings();
        CHECK(settings.bucket.empty());
    }
}
