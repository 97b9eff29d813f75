#include <issuehub-cpp/config.hpp>
#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/logging.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <exception>

namespace issuehub_cpp {

// -- Environment overrides ----------------------------------------------------

template <>
auto ConfigValue<std::string>::env_value() const -> std::optional<std::string> {
    const auto* env = std::getenv(env_var_.c_str());
    if (!env) return std::nullopt;
    return std::string{env};
}

template <>
auto ConfigValue<std::size_t>::env_value() const -> std::optional<std::size_t> {
    const auto* env = std::getenv(env_var_.c_str());
    if (!env) return std::nullopt;
    try {
        return static_cast<std::size_t>(std::stoull(env));
    } catch (const std::exception& e) {
        logger()->warn("ignoring {}={}: {}", env_var_, env, e.what());
    }
    return std::nullopt;
}

// -- YAML ---------------------------------------------------------------------

namespace {

template <typename T>
void read_key(const YAML::Node& section, const char* key, ConfigValue<T>& value) {
    if (section[key]) value.set(section[key].template as<T>());
}

auto from_yaml(const YAML::Node& yaml) -> Config {
    auto config = Config{};
    const auto root = yaml["issuehub"];
    if (!root) return config;

    if (auto storage = root["storage"]) {
        read_key(storage, "data_file", config.storage.data_file);
    }
    if (auto audit = root["audit"]) {
        read_key(audit, "backend", config.audit.backend);
        read_key(audit, "file", config.audit.file);
        read_key(audit, "git_repo_dir", config.audit.git_repo_dir);
    }
    if (auto broadcast = root["broadcast"]) {
        read_key(broadcast, "mailbox_capacity", config.broadcast.mailbox_capacity);
        read_key(broadcast, "delivery_threads", config.broadcast.delivery_threads);
    }
    if (auto logging = root["logging"]) {
        read_key(logging, "level", config.logging.level);
    }
    return config;
}

}  // anonymous namespace

auto load_config(const std::string& path) -> Config {
    try {
        return from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw Exception{ErrorKind::config_error, path + ": " + e.what()};
    }
}

auto load_config_from_string(std::string_view yaml) -> Config {
    try {
        return from_yaml(YAML::Load(std::string{yaml}));
    } catch (const YAML::Exception& e) {
        throw Exception{ErrorKind::config_error, e.what()};
    }
}

// -- Validation ---------------------------------------------------------------

auto Config::validate() const -> std::vector<std::string> {
    auto errors = std::vector<std::string>{};

    if (storage.data_file.get().empty()) {
        errors.emplace_back("storage.data_file must not be empty");
    }

    const auto backend = audit.backend.get();
    if (backend != "file" && backend != "git" && backend != "none") {
        errors.push_back("audit.backend must be file, git or none (got '" + backend + "')");
    }
    if (backend == "file" && audit.file.get().empty()) {
        errors.emplace_back("audit.file must not be empty for the file backend");
    }
    if (backend == "git" && audit.git_repo_dir.get().empty()) {
        errors.emplace_back("audit.git_repo_dir must not be empty for the git backend");
    }

    if (broadcast.mailbox_capacity.get() == 0) {
        errors.emplace_back("broadcast.mailbox_capacity must be positive");
    }

    const auto level = logging.level.get();
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        errors.push_back("logging.level '" + level + "' is not a known level");
    }
    return errors;
}

void apply_config(const Config& config) {
    auto errors = config.validate();
    if (!errors.empty()) {
        auto message = std::string{"invalid configuration:"};
        for (const auto& e : errors) message += "\n  " + e;
        throw Exception{ErrorKind::config_error, std::move(message)};
    }
    configure_logging(config.logging.level.get());
}

}  // namespace issuehub_cpp
