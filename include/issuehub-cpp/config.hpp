/// @file config.hpp
/// @brief Configuration loaded from YAML with environment overrides.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace issuehub_cpp {

/// A configuration value that an environment variable can override.
///
/// `get()` returns the environment value when the variable is set and
/// parses, the file (or default) value otherwise.
template <typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, std::string env_var = {})
        : value_{std::move(default_value)}, env_var_{std::move(env_var)} {}

    auto get() const -> T {
        if (!env_var_.empty()) {
            if (auto env = env_value()) return *env;
        }
        return value_;
    }

    void set(T value) { value_ = std::move(value); }
    auto env_var() const -> const std::string& { return env_var_; }

private:
    auto env_value() const -> std::optional<T>;

    T value_{};
    std::string env_var_;
};

template <>
auto ConfigValue<std::string>::env_value() const -> std::optional<std::string>;
template <>
auto ConfigValue<std::size_t>::env_value() const -> std::optional<std::size_t>;

/// All settings, grouped the way they appear under the `issuehub:` key.
///
/// @code
/// issuehub:
///   storage:
///     data_file: /var/lib/issuehub/issues.json
///   audit:
///     backend: git        # file | git | none
///     git_repo_dir: /var/lib/issuehub
///   broadcast:
///     mailbox_capacity: 256
///   logging:
///     level: debug
/// @endcode
struct Config {
    struct Storage {
        ConfigValue<std::string> data_file{"issues.json", "ISSUEHUB_DATA_FILE"};
    } storage;

    struct Audit {
        ConfigValue<std::string> backend{"file", "ISSUEHUB_AUDIT_BACKEND"};
        ConfigValue<std::string> file{"issues.audit.log", "ISSUEHUB_AUDIT_FILE"};
        ConfigValue<std::string> git_repo_dir{".", "ISSUEHUB_GIT_REPO_DIR"};
    } audit;

    struct Broadcast {
        ConfigValue<std::size_t> mailbox_capacity{1024, "ISSUEHUB_MAILBOX_CAPACITY"};
        // 0 uses the shared executor sized to the hardware.
        ConfigValue<std::size_t> delivery_threads{0, "ISSUEHUB_DELIVERY_THREADS"};
    } broadcast;

    struct Logging {
        ConfigValue<std::string> level{"info", "ISSUEHUB_LOG_LEVEL"};
    } logging;

    /// Problems with the effective values; empty when the config is usable.
    auto validate() const -> std::vector<std::string>;
};

/// Load a YAML file. A missing `issuehub:` key yields the defaults.
/// @throws Exception with ErrorKind::config_error on unreadable or malformed input.
auto load_config(const std::string& path) -> Config;

/// Load from YAML text.
/// @throws Exception with ErrorKind::config_error on malformed input.
auto load_config_from_string(std::string_view yaml) -> Config;

/// Validate `config` and apply its logging level.
/// @throws Exception with ErrorKind::config_error listing every problem.
void apply_config(const Config& config);

}  // namespace issuehub_cpp
