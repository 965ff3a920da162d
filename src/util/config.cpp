#include <pinion/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pinion {

namespace {

PinionError bad_key(const std::string& section, const std::string& key, const char* expected) {
    return PinionError{PinionError::Config,
        "[" + section + "] " + key + " must be " + expected};
}

// Reads an optional typed value; a present value of the wrong type is an error
template<typename T>
Status read_opt(const toml::table& tbl, const std::string& section, const char* key,
                const char* expected, std::optional<T>& out) {
    auto node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<T>();
    if (!v) return bad_key(section, key, expected);
    out = *v;
    return ok_status();
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto t = doc["resolver"].as_table()) {
        PINION_TRY(read_opt(*t, "resolver", "max_rounds", "an integer", cfg.max_rounds));
        PINION_TRY(read_opt(*t, "resolver", "collect_hashes", "a boolean", cfg.collect_hashes));
        if (cfg.max_rounds && *cfg.max_rounds < 1) {
            return bad_key("resolver", "max_rounds", "at least 1");
        }
    }

    if (auto t = doc["index"].as_table()) {
        PINION_TRY(read_opt(*t, "index", "path", "a string", cfg.index_path));
    }

    if (auto t = doc["vcs"].as_table()) {
        PINION_TRY(read_opt(*t, "vcs", "checkout_dir", "a string", cfg.checkout_dir));
        PINION_TRY(read_opt(*t, "vcs", "timeout", "an integer", cfg.vcs_timeout));
        PINION_TRY(read_opt(*t, "vcs", "offline", "a boolean", cfg.offline));
    }

    if (auto t = doc["cache"].as_table()) {
        PINION_TRY(read_opt(*t, "cache", "path", "a string", cfg.cache_path));
        PINION_TRY(read_opt(*t, "cache", "enabled", "a boolean", cfg.cache_enabled));
    }

    if (auto t = doc["log"].as_table()) {
        std::optional<std::string> level;
        PINION_TRY(read_opt(*t, "log", "level", "a string", level));
        if (level) {
            auto parsed = log::parse_level(*level);
            if (parsed.is_err()) return bad_key("log", "level", "trace, debug, info, warn or error");
            cfg.log_level = parsed.value();
        }
        PINION_TRY(read_opt(*t, "log", "color", "a boolean", cfg.log_color));
    }

    if (auto t = doc["environment"].as_table()) {
        for (const auto& [key, val] : *t) {
            std::string k(key);
            if (!is_marker_variable(k) || k == "extra") {
                return PinionError{PinionError::Config,
                    "[environment] " + k + " is not a marker variable"};
            }
            auto s = val.value<std::string>();
            if (!s) return bad_key("environment", k, "a string");
            cfg.environment[k] = *s;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinionError{PinionError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    auto take = [](auto& mine, const auto& theirs) {
        if (theirs) mine = theirs;
    };
    take(max_rounds, other.max_rounds);
    take(collect_hashes, other.collect_hashes);
    take(index_path, other.index_path);
    take(checkout_dir, other.checkout_dir);
    take(vcs_timeout, other.vcs_timeout);
    take(offline, other.offline);
    take(cache_path, other.cache_path);
    take(cache_enabled, other.cache_enabled);
    take(log_level, other.log_level);
    take(log_color, other.log_color);

    for (const auto& [k, v] : other.environment) {
        environment[k] = v;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

MarkerEnvironment Config::to_environment() const {
    MarkerEnvironment env = MarkerEnvironment::defaults();

    auto py = environment.find("python_version");
    auto full = environment.find("python_full_version");
    if (full != environment.end()) {
        env = MarkerEnvironment::for_python(full->second);
    } else if (py != environment.end()) {
        env = MarkerEnvironment::for_python(py->second);
    }

    for (const auto& [k, v] : environment) {
        env.set(k, v);
    }
    return env;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.pinion/config.toml";
}

} // namespace pinion
