#include "cronlet/core/config.hpp"
#include "cronlet/core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace cronlet {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();

        if (config.retry_delay_ms <= 0) {
            LOG_WARN("Config: retry_delay_ms must be positive (got {}), using default",
                     config.retry_delay_ms);
            config.retry_delay_ms = default_config().retry_delay_ms;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("CRONLET_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CRONLET_RETRY_DELAY_MS")) {
        std::string_view text(val);
        int64_t delay = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), delay);
        if (ec == std::errc{} && ptr == text.data() + text.size() && delay > 0) {
            config.retry_delay_ms = delay;
        } else {
            LOG_WARN("Ignoring invalid CRONLET_RETRY_DELAY_MS '{}'", text);
        }
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

} // namespace cronlet
