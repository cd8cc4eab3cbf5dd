#include <lgctl/core/config.hpp>
#include <lgctl/core/installer.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/service.hpp>
#include <lgctl/core/ui_build.hpp>
#include <lgctl/state/store.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <sstream>

using namespace lgctl;
using lgctl::test::LogCapture;
using lgctl::test::TempDir;

TEST(ConfigTest, DottedKeyLookups) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({
        "log_level": "warn",
        "service": {"command": "lg-server", "args": ["--bind", "::"], "grace_seconds": 3},
        "ui": {"timeout": 60, "dev": true}
    })"));

    EXPECT_TRUE(config.loaded());
    EXPECT_EQ("lg-server", config.get_string("service.command", ""));
    EXPECT_EQ(3, config.get_int("service.grace_seconds", 10));
    EXPECT_TRUE(config.get_bool("ui.dev", false));
    EXPECT_EQ((std::vector<std::string>{"--bind", "::"}), config.get_string_array("service.args"));
    EXPECT_TRUE(config.has("ui.timeout"));
    EXPECT_FALSE(config.has("ui.missing"));
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({"ui": {"timeout": "soon"}})"));
    EXPECT_EQ(180, config.get_int("ui.timeout", 180));
    EXPECT_EQ("x", config.get_string("ui", "x"));
}

TEST(ConfigTest, InvalidJsonIsReported) {
    Config config;
    EXPECT_FALSE(config.load_string("{ not json"));
    EXPECT_FALSE(config.loaded());
    EXPECT_FALSE(config.last_error().empty());

    EXPECT_FALSE(config.load_string("[1, 2]"));
}

TEST(ConfigTest, MissingFileIsReported) {
    Config config;
    EXPECT_FALSE(config.load_file("/nonexistent/lgctl.json"));
    EXPECT_NE(std::string::npos, config.last_error().find("/nonexistent/lgctl.json"));
}

TEST(SettingsTest, ReadsEnvironment) {
    setenv("LGCTL_APP_PATH", "/srv/lg", 1);
    setenv("LGCTL_PORT", "9001", 1);
    setenv("LGCTL_DEV_MODE", "yes", 1);
    unsetenv("LGCTL_STATE_DB");

    Settings s = Settings::from_environment();
    EXPECT_EQ("/srv/lg", s.app_path);
    EXPECT_EQ(9001, s.port);
    EXPECT_TRUE(s.dev_mode);
    EXPECT_EQ("/srv/lg/lgctl.json", s.config_path());
    EXPECT_EQ("/srv/lg/state.db", s.state_db_path());

    unsetenv("LGCTL_APP_PATH");
    unsetenv("LGCTL_PORT");
    unsetenv("LGCTL_DEV_MODE");
}

TEST(SettingsTest, InvalidPortKeepsDefault) {
    LogCapture logs;
    setenv("LGCTL_PORT", "http", 1);
    Settings s = Settings::from_environment();
    unsetenv("LGCTL_PORT");

    EXPECT_EQ(8001, s.port);
    EXPECT_EQ(1u, logs.count(LogLevel::WARN, "LGCTL_PORT"));
}

TEST(SettingsTest, EntriesUseVariableNames) {
    Settings s;
    bool found = false;
    std::vector<std::pair<std::string, std::string> > entries = s.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].first == "LGCTL_APP_PATH") {
            EXPECT_EQ("/etc/lgctl", entries[i].second);
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(LogLevel::DEBUG, parse_log_level("DEBUG", LogLevel::INFO));
    EXPECT_EQ(LogLevel::WARN, parse_log_level(" warning ", LogLevel::INFO));
    EXPECT_EQ(LogLevel::ERROR, parse_log_level("error", LogLevel::INFO));
    EXPECT_EQ(LogLevel::INFO, parse_log_level("verbose", LogLevel::INFO));
}

TEST(ServiceOptionsTest, CommandAndArgsFromConfig) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({"service": {"command": "lg-server", "args": ["--port", "8001"]}})"));
    Settings settings;

    ServiceOptions options = ServiceOptions::from_config(config, settings);
    EXPECT_EQ((std::vector<std::string>{"lg-server", "--port", "8001"}), options.command);
    EXPECT_EQ(10, options.grace_seconds);
    EXPECT_EQ("/etc/lgctl", options.workdir);

    ProcessService service(options);
    StartupSession session;
    session.workers = 2;
    std::vector<std::string> argv = service.build_argv(session);
    ASSERT_EQ(5u, argv.size());
    EXPECT_EQ("--workers", argv[3]);
    EXPECT_EQ("2", argv[4]);
}

TEST(ServiceTest, ExitCodeOfServiceIsReturned) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({"service": {"command": "sh", "args": ["-c", "exit 7"]}})"));
    Settings settings;
    settings.app_path = "/";

    ProcessService service(ServiceOptions::from_config(config, settings));
    ShutdownSignal shutdown;
    EXPECT_EQ(7, service.run(StartupSession(), shutdown));
}

TEST(ServiceTest, ShutdownTerminatesService) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({"service": {"command": "sleep", "args": ["30"], "grace_seconds": 2}})"));
    Settings settings;
    settings.app_path = "/";

    ProcessService service(ServiceOptions::from_config(config, settings));
    ShutdownSignal shutdown;
    shutdown.request("");
    EXPECT_EQ(128 + SIGTERM, service.run(StartupSession(), shutdown));
}

TEST(UiBuildOptionsTest, DefaultsFollowAppPath) {
    Config config;
    Settings settings;
    settings.app_path = "/srv/lg";

    UiBuildOptions options = UiBuildOptions::from_config(config, settings);
    EXPECT_EQ("npm run build", options.command);
    EXPECT_EQ("/srv/lg/ui", options.directory);
    EXPECT_EQ("/srv/lg/static/ui", options.output_dir);
}

TEST(InstallerTest, WritesDefaultConfigAndSeedsStore) {
    TempDir tmp;
    ASSERT_FALSE(tmp.path().empty());

    Settings settings;
    settings.app_path = tmp.file("app");
    std::istringstream in("\n");
    std::ostringstream out;

    {
        Installer installer(settings, in, out, tmp.file("setup.lock"));
        ASSERT_TRUE(installer.acquired());
        EXPECT_EQ(0, installer());
    }

    EXPECT_TRUE(file_exists(join_path(settings.app_path, "lgctl.json")));

    SqliteStateStore store;
    ASSERT_TRUE(store.open(settings.state_db_path()));
    EXPECT_TRUE(store.devices().empty());
    EXPECT_TRUE(store.params().is_object());
}

TEST(InstallerTest, SecondInstallerCannotTakeLock) {
    TempDir tmp;
    Settings settings;
    settings.app_path = tmp.file("app");
    std::istringstream in;
    std::ostringstream out;

    Installer first(settings, in, out, tmp.file("setup.lock"));
    ASSERT_TRUE(first.acquired());

    LogCapture logs;
    Installer second(settings, in, out, tmp.file("setup.lock"));
    EXPECT_FALSE(second.acquired());
    EXPECT_EQ(1, second());
}

TEST(InstallerTest, LockIsReleasedButFileKept) {
    TempDir tmp;
    Settings settings;
    settings.app_path = tmp.file("app");
    std::istringstream in;
    std::ostringstream out;

    {
        Installer first(settings, in, out, tmp.file("setup.lock"));
        ASSERT_TRUE(first.acquired());
    }
    EXPECT_TRUE(file_exists(tmp.file("setup.lock")));

    Installer second(settings, in, out, tmp.file("setup.lock"));
    EXPECT_TRUE(second.acquired());

    // Anyone opening the path now contends for the same lock
    LogCapture logs;
    Installer third(settings, in, out, tmp.file("setup.lock"));
    EXPECT_FALSE(third.acquired());
}

TEST(InstallerTest, PromptAnswerOverridesAppPath) {
    TempDir tmp;
    Settings settings;
    settings.app_path = tmp.file("default");
    std::string chosen = tmp.file("chosen");
    std::istringstream in(chosen + "\n");
    std::ostringstream out;

    Installer installer(settings, in, out, tmp.file("setup.lock"));
    EXPECT_EQ(0, installer());
    EXPECT_TRUE(file_exists(join_path(chosen, "lgctl.json")));
    EXPECT_FALSE(file_exists(settings.app_path));
}
