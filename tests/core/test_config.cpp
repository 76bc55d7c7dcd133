// dotver_core configuration tests

#include <catch2/catch_test_macros.hpp>
#include <dotver/core/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace dotver_core;

namespace {

/// Temporary file removed on scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(m_path);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace

// =============================================================================
// ConfigLayer
// =============================================================================

TEST_CASE("ConfigLayer values", "[core][config]") {
    ConfigLayer layer("test");

    REQUIRE(layer.empty());
    layer.set("b.key", ConfigValue{true});
    layer.set("a.key", ConfigValue{std::int64_t(3)});

    REQUIRE(layer.size() == 2);
    REQUIRE(layer.contains("a.key"));
    REQUIRE(std::get<bool>(*layer.get("b.key")));
    REQUIRE(layer.keys() == std::vector<std::string>{"a.key", "b.key"});

    REQUIRE(layer.remove("a.key"));
    REQUIRE_FALSE(layer.remove("a.key"));
    REQUIRE_FALSE(layer.get("a.key").has_value());

    layer.clear();
    REQUIRE(layer.empty());
}

// =============================================================================
// ConfigManager
// =============================================================================

TEST_CASE("ConfigManager defaults", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.layer_count() == 4);
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
    REQUIRE(config.get_bool(config_keys::WARN_SINGLE_COMPONENT));

    Settings settings = config.build_settings();
    REQUIRE(settings.log_level == "info");
    REQUIRE(settings.log_console);
    REQUIRE_FALSE(settings.log_file);
    REQUIRE(settings.warn_single_component);
}

TEST_CASE("ConfigManager layer priority", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    config.set(config_keys::LOG_LEVEL, ConfigValue{std::string("debug")}, "user");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");

    REQUIRE(config.parse_args(std::vector<std::string>{"--log-level=warn"}).is_ok());
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "warn");

    REQUIRE(config.remove_layer("cmdline"));
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");
}

TEST_CASE("ConfigManager typed getters", "[core][config]") {
    ConfigManager config;
    config.set("n", ConfigValue{std::string("42")});
    config.set("f", ConfigValue{std::int64_t(2)});
    config.set("flag", ConfigValue{std::string("no")});
    config.set("junk", ConfigValue{std::string("maybe")});

    REQUIRE(config.get_int("n") == 42);
    REQUIRE(config.get_float("f") == 2.0);
    REQUIRE_FALSE(config.get_bool("flag", true));
    REQUIRE(config.get_bool("junk", true));
    REQUIRE(config.get_int("missing", 7) == 7);
    REQUIRE(config.get_string("f") == "2");
}

TEST_CASE("ConfigManager command line", "[core][config]") {
    ConfigManager config;

    auto result = config.parse_args(std::vector<std::string>{
        "1.2.3",
        "--log-level", "trace",
        "--version-warn_single_component=false",
        "v2.0.0",
        "--log-file",
    });
    REQUIRE(result.is_ok());

    REQUIRE(config.get_string("log.level") == "trace");
    REQUIRE_FALSE(config.get_bool(config_keys::WARN_SINGLE_COMPONENT, true));
    REQUIRE(config.get_bool(config_keys::LOG_FILE));

    SECTION("dashes after the section become underscores") {
        ConfigManager fresh;
        REQUIRE(fresh.parse_args(std::vector<std::string>{
            "--version-warn-single-component=false",
            "--log-directory=/tmp/dotver",
        }).is_ok());
        REQUIRE_FALSE(fresh.get_bool(config_keys::WARN_SINGLE_COMPONENT, true));
        REQUIRE(fresh.get_string(config_keys::LOG_DIRECTORY) == "/tmp/dotver");
        REQUIRE_FALSE(fresh.contains("version.warn.single.component"));
    }

    SECTION("dotted option names") {
        ConfigManager fresh;
        REQUIRE(fresh.parse_args(std::vector<std::string>{
            "--version.warn-single-component=false",
            "--log.level=debug",
        }).is_ok());
        REQUIRE_FALSE(fresh.get_bool(config_keys::WARN_SINGLE_COMPONENT, true));
        REQUIRE(fresh.get_string(config_keys::LOG_LEVEL) == "debug");
    }

    SECTION("empty option name") {
        auto bad = config.parse_args(std::vector<std::string>{"--=x"});
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ConfigManager environment", "[core][config]") {
    ::setenv("DOTVER_LOG_LEVEL", "error", 1);
    ::setenv("DOTVER_WARN_SINGLE_COMPONENT", "false", 1);

    ConfigManager config;
    config.setup_defaults();
    config.load_environment();

    Settings settings = config.build_settings();
    REQUIRE(settings.log_level == "error");
    REQUIRE_FALSE(settings.warn_single_component);

    ::unsetenv("DOTVER_LOG_LEVEL");
    ::unsetenv("DOTVER_WARN_SINGLE_COMPONENT");
}

TEST_CASE("ConfigManager JSON files", "[core][config]") {
    SECTION("nested objects flatten to dotted keys") {
        TempFile file("dotver_test_config.json", R"({
            "log": { "level": "debug", "file": true, "directory": "/tmp/dotver-logs" },
            "version": { "warn_single_component": false },
            "tags": ["a", "b"],
            "ratio": 0.5
        })");

        ConfigManager config;
        config.setup_defaults();
        REQUIRE(config.load_json(file.path()).is_ok());

        Settings settings = config.build_settings();
        REQUIRE(settings.log_level == "debug");
        REQUIRE(settings.log_file);
        REQUIRE(settings.log_directory == "/tmp/dotver-logs");
        REQUIRE_FALSE(settings.warn_single_component);

        auto tags = config.get("tags");
        REQUIRE(tags.has_value());
        REQUIRE(std::get<std::vector<std::string>>(*tags) == std::vector<std::string>{"a", "b"});
        REQUIRE(config.get_float("ratio") == 0.5);
    }

    SECTION("missing file") {
        ConfigManager config;
        auto result = config.load_json("/nonexistent/dotver.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<ConfigError>());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::FileNotFound);
    }

    SECTION("invalid JSON") {
        TempFile file("dotver_test_invalid.json", "{ \"log\": ");
        ConfigManager config;
        auto result = config.load_json(file.path());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("top level must be an object") {
        TempFile file("dotver_test_array.json", "[1, 2]");
        ConfigManager config;
        REQUIRE(config.load_json(file.path()).is_err());
    }

    SECTION("unsupported value leaves the layer untouched") {
        TempFile file("dotver_test_mixed.json", R"({ "log": { "level": "trace" }, "bad": [1, 2] })");
        ConfigManager config;
        config.setup_defaults();

        auto result = config.load_json(file.path());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::TypeMismatch);
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
    }

    SECTION("save and reload") {
        auto path = std::filesystem::temp_directory_path() / "dotver_test_saved.json";

        ConfigManager config;
        config.set(config_keys::LOG_LEVEL, ConfigValue{std::string("warn")}, "user");
        config.set(config_keys::WARN_SINGLE_COMPONENT, ConfigValue{false}, "user");
        REQUIRE(config.save_json(path, "user").is_ok());

        ConfigManager reloaded;
        REQUIRE(reloaded.load_json(path, "user").is_ok());
        REQUIRE(reloaded.get_string(config_keys::LOG_LEVEL) == "warn");
        REQUIRE_FALSE(reloaded.get_bool(config_keys::WARN_SINGLE_COMPONENT, true));

        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    SECTION("save unknown layer") {
        ConfigManager config;
        auto result = config.save_json(std::filesystem::temp_directory_path() / "x.json", "nope");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Settings derive logging config", "[core][config]") {
    Settings settings;
    settings.log_level = "warn";
    settings.log_file = true;
    settings.log_directory = "logs";

    LogConfig log = settings.log_config();
    REQUIRE(log.level == spdlog::level::warn);
    REQUIRE(log.file_enabled);
    REQUIRE(log.log_directory == "logs");

    SECTION("unknown level falls back during resolution") {
        ConfigManager config;
        config.setup_defaults();
        config.set(config_keys::LOG_LEVEL, ConfigValue{std::string("loud")}, "user");
        REQUIRE(config.build_settings().log_level == "info");
    }
}
