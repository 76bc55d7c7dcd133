/// @file config.hpp
/// @brief Configuration system for dotver
///
/// Provides layered configuration with:
/// - Default values
/// - Configuration file loading (JSON)
/// - Environment variables
/// - Command-line argument parsing

#pragma once

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dotver_core {

// =============================================================================
// Config Values
// =============================================================================

/// Configuration value variant
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// Well-known configuration keys
namespace config_keys {
    inline constexpr const char* LOG_LEVEL = "log.level";
    inline constexpr const char* LOG_CONSOLE = "log.console";
    inline constexpr const char* LOG_FILE = "log.file";
    inline constexpr const char* LOG_DIRECTORY = "log.directory";
    inline constexpr const char* WARN_SINGLE_COMPONENT = "version.warn_single_component";
} // namespace config_keys

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< User configuration file
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    /// Get all keys (sorted)
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Settings
// =============================================================================

/// Resolved settings consumed by the logging system and the parser
struct Settings {
    std::string log_level = "info";
    bool log_console = true;
    bool log_file = false;
    std::string log_directory = "logs";
    bool warn_single_component = true;

    /// Derive the logging configuration
    [[nodiscard]] LogConfig log_config() const;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);
    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;
    bool remove_layer(const std::string& name);
    [[nodiscard]] std::size_t layer_count() const;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value (from highest priority layer that contains it)
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in specific layer (created on demand)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a JSON file into a layer; nested objects flatten to dotted keys
    Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name = "user");

    /// Save a layer to a JSON file
    Result<void> save_json(const std::filesystem::path& path, const std::string& layer_name) const;

    /// Parse --key=value / --key value / --flag arguments
    ///
    /// Option names map to keys as --log-level -> log.level and
    /// --version-warn-single-component -> version.warn_single_component.
    Result<void> parse_args(int argc, char** argv);
    Result<void> parse_args(const std::vector<std::string>& args);

    /// Load DOTVER_* environment variables
    void load_environment();

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create the standard layers and fill the defaults layer
    void setup_defaults();

    /// Resolve the merged view into Settings
    [[nodiscard]] Settings build_settings() const;

private:
    /// Get layers sorted by priority (highest to lowest)
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers() const;

    /// Find or create a layer (caller holds m_mutex)
    ConfigLayer* ensure_layer_locked(const std::string& name, ConfigLayerPriority priority);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
};

} // namespace dotver_core
