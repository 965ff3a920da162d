#pragma once

#include <pinion/log.hpp>
#include <pinion/marker.hpp>
#include <pinion/result.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pinion {

// Layered configuration: global -> project -> command line.
// Unset fields never override; later layers win field by field.
struct Config {
    // [resolver]
    std::optional<int64_t> max_rounds;
    std::optional<bool> collect_hashes;
    // [index]
    std::optional<std::string> index_path;
    // [vcs]
    std::optional<std::string> checkout_dir;
    std::optional<int64_t> vcs_timeout;
    std::optional<bool> offline;
    // [cache]
    std::optional<std::string> cache_path;
    std::optional<bool> cache_enabled;
    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;
    // [environment]
    std::map<std::string, std::string> environment;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Apply other on top of this
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);

    size_t rounds() const { return static_cast<size_t>(max_rounds.value_or(20)); }
    bool hashes_enabled() const { return collect_hashes.value_or(true); }

    // MarkerEnvironment::defaults() overlaid with [environment]. Setting only
    // python_version derives python_full_version from it.
    MarkerEnvironment to_environment() const;
};

// ~/.pinion/config.toml
std::string global_config_path();

} // namespace pinion
