#include <issuehub-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace issuehub_cpp {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto instance = [] {
        if (auto existing = spdlog::get("issuehub")) return existing;
        auto created = spdlog::stderr_color_mt("issuehub");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

auto configure_logging(std::string_view level) -> bool {
    auto parsed = spdlog::level::from_str(std::string{level});
    // from_str maps unknown names to off; only accept an explicit "off".
    if (parsed == spdlog::level::off && level != "off") return false;
    logger()->set_level(parsed);
    return true;
}

}  // namespace issuehub_cpp
