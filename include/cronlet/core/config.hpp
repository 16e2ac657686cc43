#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cronlet {

using json = nlohmann::json;

/// One job entry of the `run` command: logs `message` on every firing.
struct JobConfig {
    std::string name;
    std::string schedule;
    std::string message;
    bool enabled = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(JobConfig, name, schedule, message, enabled)

struct Config {
    std::string log_level = "info";
    int64_t retry_delay_ms = 60 * 60 * 1000;  // re-check after an empty search horizon
    std::vector<JobConfig> jobs;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, retry_delay_ms, jobs)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

} // namespace cronlet
