/// @file config.cpp
/// @brief Configuration system implementation for dotver

#include <dotver/core/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <fstream>

namespace dotver_core {

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// Settings
// =============================================================================

LogConfig Settings::log_config() const {
    LogConfig config;
    config.console_enabled = log_console;
    config.file_enabled = log_file;
    config.log_directory = log_directory;
    config.level = parse_log_level(log_level).value_or(spdlog::level::info);
    return config;
}

// =============================================================================
// JSON Conversion
// =============================================================================

namespace {

/// Flatten a JSON object into dotted keys
Result<void> flatten_json(const nlohmann::json& node, const std::string& prefix,
                          const std::string& file, ConfigLayer& layer) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& value = it.value();

        if (value.is_object()) {
            auto nested = flatten_json(value, key, file, layer);
            if (!nested) {
                return nested;
            }
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return Err(ConfigError::type_mismatch(file, key));
                }
                items.push_back(item.get<std::string>());
            }
            layer.set(key, ConfigValue{std::move(items)});
        } else {
            return Err(ConfigError::type_mismatch(file, key));
        }
    }
    return Ok();
}

/// Insert a dotted key into a nested JSON object
void unflatten_into(nlohmann::json& root, const std::string& key, nlohmann::json value) {
    nlohmann::json* node = &root;
    std::size_t start = 0;
    for (std::size_t dot = key.find('.'); dot != std::string::npos; dot = key.find('.', start)) {
        node = &(*node)[key.substr(start, dot - start)];
        start = dot + 1;
    }
    (*node)[key.substr(start)] = std::move(value);
}

/// Infer a typed value from command-line or environment text
ConfigValue infer_value(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue{text == "true"};
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();

    std::int64_t int_val = 0;
    auto [int_end, int_ec] = std::from_chars(first, last, int_val);
    if (int_ec == std::errc{} && int_end == last) {
        return ConfigValue{int_val};
    }

    double float_val = 0.0;
    auto [float_end, float_ec] = std::from_chars(first, last, float_val);
    if (float_ec == std::errc{} && float_end == last) {
        return ConfigValue{float_val};
    }

    return ConfigValue{text};
}

/// Map an option name to its config key
///
/// Without a '.', the first '-' separates the section. Any other '-' becomes
/// '_', so --version-warn-single-component and
/// --version.warn-single-component both set version.warn_single_component.
std::string option_to_key(std::string name) {
    std::size_t rest = 0;
    if (name.find('.') == std::string::npos) {
        auto section_end = name.find('-');
        if (section_end == std::string::npos) {
            return name;
        }
        name[section_end] = '.';
        rest = section_end + 1;
    }
    std::replace(name.begin() + static_cast<std::ptrdiff_t>(rest), name.end(), '-', '_');
    return name;
}

} // anonymous namespace

// =============================================================================
// ConfigManager
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        if (*v == "true" || *v == "1" || *v == "yes") return true;
        if (*v == "false" || *v == "0" || *v == "no") return false;
        return default_value;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        std::int64_t parsed = 0;
        auto [end, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        if (ec == std::errc{} && end == v->data() + v->size()) {
            return parsed;
        }
        return default_value;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        double parsed = 0.0;
        auto [end, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        if (ec == std::errc{} && end == v->data() + v->size()) {
            return parsed;
        }
        return default_value;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_layer_locked(layer_name, ConfigLayerPriority::User)->set(key, std::move(value));
}

Result<void> ConfigManager::load_json(const std::filesystem::path& path, const std::string& layer_name) {
    std::ifstream file(path);
    if (!file) {
        return Err(ConfigError::file_not_found(path.string()));
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::parse_error& ex) {
        return Err(ConfigError::parse_failed(path.string(), ex.what()));
    }

    if (!root.is_object()) {
        return Err(ConfigError::parse_failed(path.string(), "top-level value is not an object"));
    }

    // Parse into a scratch layer so a bad file leaves the target untouched
    ConfigLayer scratch(layer_name);
    auto flattened = flatten_json(root, "", path.string(), scratch);
    if (!flattened) {
        return flattened;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = ensure_layer_locked(layer_name, ConfigLayerPriority::User);
    for (const auto& key : scratch.keys()) {
        layer->set(key, *scratch.get(key));
    }

    config_logger()->debug("Loaded {} config values from {} into layer '{}'",
                           scratch.size(), path.string(), layer_name);
    return Ok();
}

Result<void> ConfigManager::save_json(const std::filesystem::path& path, const std::string& layer_name) const {
    nlohmann::json root = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const ConfigLayer* layer = nullptr;
        for (const auto& candidate : m_layers) {
            if (candidate->name() == layer_name) {
                layer = candidate.get();
                break;
            }
        }
        if (!layer) {
            return Err(Error(ErrorCode::NotFound, "Layer not found: " + layer_name));
        }

        for (const auto& key : layer->keys()) {
            auto value = layer->get(key);
            try {
                std::visit([&root, &key](const auto& arg) {
                    unflatten_into(root, key, nlohmann::json(arg));
                }, *value);
            } catch (const nlohmann::json::type_error&) {
                // "a" and "a.b" cannot both be represented
                return Err(ConfigError::type_mismatch(path.string(), key));
            }
        }
    }

    std::ofstream file(path);
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to create file: " + path.string()));
    }
    file << root.dump(2) << "\n";

    return Ok();
}

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = ensure_layer_locked("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        // Positional arguments belong to the caller
        if (!arg.starts_with("--")) {
            continue;
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
            key = key_value;
            value = args[++i];
        } else {
            key = key_value;
            value = "true";
        }

        if (key.empty()) {
            return Err(Error(ErrorCode::InvalidArgument, "Empty option name in argument: " + arg));
        }

        layer->set(option_to_key(key), infer_value(value));
    }

    return Ok();
}

void ConfigManager::load_environment() {
    static const std::pair<const char*, const char*> env_mappings[] = {
        {"DOTVER_LOG_LEVEL", config_keys::LOG_LEVEL},
        {"DOTVER_LOG_CONSOLE", config_keys::LOG_CONSOLE},
        {"DOTVER_LOG_FILE", config_keys::LOG_FILE},
        {"DOTVER_LOG_DIRECTORY", config_keys::LOG_DIRECTORY},
        {"DOTVER_WARN_SINGLE_COMPONENT", config_keys::WARN_SINGLE_COMPONENT},
    };

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = ensure_layer_locked("environment", ConfigLayerPriority::Environment);

    for (const auto& [env_name, config_key] : env_mappings) {
        const char* value = std::getenv(env_name);
        if (value) {
            layer->set(config_key, ConfigValue{std::string(value)});
        }
    }
}

void ConfigManager::setup_defaults() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ensure_layer_locked("cmdline", ConfigLayerPriority::CommandLine);
        ensure_layer_locked("environment", ConfigLayerPriority::Environment);
        ensure_layer_locked("user", ConfigLayerPriority::User);
        ensure_layer_locked("defaults", ConfigLayerPriority::Default);
    }

    const Settings defaults;
    set(config_keys::LOG_LEVEL, ConfigValue{defaults.log_level}, "defaults");
    set(config_keys::LOG_CONSOLE, ConfigValue{defaults.log_console}, "defaults");
    set(config_keys::LOG_FILE, ConfigValue{defaults.log_file}, "defaults");
    set(config_keys::LOG_DIRECTORY, ConfigValue{defaults.log_directory}, "defaults");
    set(config_keys::WARN_SINGLE_COMPONENT, ConfigValue{defaults.warn_single_component}, "defaults");
}

Settings ConfigManager::build_settings() const {
    const Settings defaults;
    Settings settings;

    settings.log_level = get_string(config_keys::LOG_LEVEL, defaults.log_level);
    settings.log_console = get_bool(config_keys::LOG_CONSOLE, defaults.log_console);
    settings.log_file = get_bool(config_keys::LOG_FILE, defaults.log_file);
    settings.log_directory = get_string(config_keys::LOG_DIRECTORY, defaults.log_directory);
    settings.warn_single_component = get_bool(config_keys::WARN_SINGLE_COMPONENT,
                                              defaults.warn_single_component);

    if (!parse_log_level(settings.log_level)) {
        config_logger()->warn("Unknown log level '{}', using '{}'", settings.log_level, defaults.log_level);
        settings.log_level = defaults.log_level;
    }

    return settings;
}

std::vector<const ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<const ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Lower value = higher priority
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

ConfigLayer* ConfigManager::ensure_layer_locked(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

} // namespace dotver_core
