#include <pinion/config.hpp>
#include <pinion/git.hpp>
#include <pinion/hash_cache.hpp>
#include <pinion/index.hpp>
#include <pinion/lockfile.hpp>
#include <pinion/log.hpp>
#include <pinion/manifest_codec.hpp>
#include <pinion/marker.hpp>
#include <pinion/pipfile.hpp>
#include <pinion/requirement.hpp>
#include <pinion/resolver.hpp>
#include <pinion/vcs.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace pinion;

namespace fs = std::filesystem;

namespace {

struct CliOptions {
    std::string command;
    std::vector<std::string> args;
    bool verbose = false;
    bool quiet = false;
    bool no_color = false;
    bool dev = false;
    std::string config_path;
    std::string pipfile = "Pipfile";
    std::optional<std::string> index_path;
    std::optional<int64_t> max_rounds;
    std::optional<std::string> python;
};

const char* USAGE =
    "Usage: pinion [options] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  parse <line>...               show the canonical forms of requirement lines\n"
    "  markers merge <a> <b>         combine two environment markers\n"
    "  resolve <line>... --index I   resolve requirement lines and print the pins\n"
    "  lock [--pipfile P] [--dev]    resolve a Pipfile and write Pipfile.lock\n"
    "\n"
    "Options:\n"
    "  --verbose, --quiet, --no-color\n"
    "  --config <file>      extra config layer\n"
    "  --index <file>       local index TOML\n"
    "  --max-rounds <n>     resolver round limit\n"
    "  --python <version>   target interpreter version\n";

int fail(const PinionError& e) {
    std::cerr << e.format() << "\n";
    return 1;
}

Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    auto need_value = [&](int& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= argc) {
            return PinionError{PinionError::InvalidArg, flag + " needs a value"};
        }
        return Result<std::string>::ok(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            opts.command = "help";
        } else if (a == "--verbose" || a == "-v") {
            opts.verbose = true;
        } else if (a == "--quiet" || a == "-q") {
            opts.quiet = true;
        } else if (a == "--no-color") {
            opts.no_color = true;
        } else if (a == "--dev") {
            opts.dev = true;
        } else if (a == "--config" || a == "--pipfile" || a == "--index" ||
                   a == "--max-rounds" || a == "--python") {
            auto v = need_value(i, a);
            if (v.is_err()) return std::move(v).error();
            std::string value = v.value();
            if (a == "--config") {
                opts.config_path = value;
            } else if (a == "--pipfile") {
                opts.pipfile = value;
            } else if (a == "--index") {
                opts.index_path = value;
            } else if (a == "--python") {
                opts.python = value;
            } else {
                char* end = nullptr;
                long long n = std::strtoll(value.c_str(), &end, 10);
                if (value.empty() || *end != '\0' || n < 1) {
                    return PinionError{PinionError::InvalidArg,
                        "--max-rounds expects a positive integer, got '" + value + "'"};
                }
                opts.max_rounds = static_cast<int64_t>(n);
            }
        } else if (a.size() > 1 && a[0] == '-' && a != "-e" && opts.command.empty()) {
            return PinionError{PinionError::InvalidArg, "unknown option '" + a + "'"};
        } else if (opts.command.empty()) {
            opts.command = a;
        } else {
            opts.args.push_back(a);
        }
    }
    return Result<CliOptions>::ok(std::move(opts));
}

Result<Config> load_config(const CliOptions& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto c = Config::load(global_path);
        if (c.is_err()) return std::move(c).error();
        global = std::move(c).value();
    }

    std::optional<Config> project;
    fs::path project_path = fs::path(opts.pipfile).parent_path() / "pinion.toml";
    if (!opts.config_path.empty()) project_path = opts.config_path;
    if (fs::exists(project_path, ec)) {
        auto c = Config::load(project_path.string());
        if (c.is_err()) return std::move(c).error();
        project = std::move(c).value();
    } else if (!opts.config_path.empty()) {
        return PinionError{PinionError::Config, "config file not found: " + opts.config_path};
    }

    Config cli;
    cli.max_rounds = opts.max_rounds;
    cli.index_path = opts.index_path;
    if (opts.python) cli.environment["python_version"] = *opts.python;
    if (opts.verbose) cli.log_level = log::Debug;
    if (opts.quiet) cli.log_level = log::Error;
    if (opts.no_color) cli.log_color = false;

    return Result<Config>::ok(Config::effective(global, project, cli));
}

// The resolver's collaborators, owned for the duration of one command
struct Session {
    Config config;
    StaticIndex index;
    HashCache cache;
    VcsGateway vcs;
    std::string checkout_root;

    std::unique_ptr<Resolver> resolver() {
        ResolveOptions options;
        options.collect_hashes = config.hashes_enabled();
        auto r = std::make_unique<Resolver>(index, config.to_environment(), options);
        if (cache.is_open()) r->set_hash_cache(&cache);
        r->set_vcs(&vcs, checkout_root);
        return r;
    }
};

Result<std::unique_ptr<Session>> open_session(const Config& config) {
    auto s = std::make_unique<Session>();
    s->config = config;

    if (!config.index_path) {
        return PinionError{PinionError::Config, "no package index configured",
            "pass --index <file> or set [index] path"};
    }
    auto index = StaticIndex::load(*config.index_path);
    if (index.is_err()) return std::move(index).error();
    s->index = std::move(index).value();
    log::debug("loaded %zu package(s) from %s", s->index.package_count(),
               config.index_path->c_str());

    if (config.cache_enabled.value_or(true)) {
        std::string path = config.cache_path.value_or(HashCache::default_cache_path());
        auto opened = s->cache.open(path);
        if (opened.is_err()) {
            log::warn("hash cache disabled: %s", opened.error().message.c_str());
        }
    }

    GitCli git;
    if (config.vcs_timeout) git.set_timeout(static_cast<int>(*config.vcs_timeout));
    git.set_offline(config.offline.value_or(false));
    s->vcs.register_backend(VcsKind::Git, std::make_unique<GitBackend>(git));

    auto configure = [&](std::unique_ptr<CommandBackend> backend) {
        if (config.vcs_timeout) backend->set_timeout(static_cast<int>(*config.vcs_timeout));
        backend->set_offline(config.offline.value_or(false));
        return backend;
    };
    s->vcs.register_backend(VcsKind::Hg, configure(std::make_unique<HgBackend>()));
    s->vcs.register_backend(VcsKind::Svn, configure(std::make_unique<SvnBackend>()));
    s->vcs.register_backend(VcsKind::Bzr, configure(std::make_unique<BzrBackend>()));

    const char* home = std::getenv("HOME");
    s->checkout_root = config.checkout_dir.value_or(
        std::string(home ? home : "/tmp") + "/.pinion/src");

    return Result<std::unique_ptr<Session>>::ok(std::move(s));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_parse(const CliOptions& opts) {
    if (opts.args.empty()) {
        std::cerr << "Usage: pinion parse <line>...\n";
        return 1;
    }
    for (const auto& line : opts.args) {
        auto req = Requirement::from_line(line);
        if (req.is_err()) return fail(req.error());
        const Requirement& r = req.value();

        toml::table manifest;
        insert_entry(manifest, r.name().empty() ? "<unnamed>" : r.name(), r.to_manifest());

        std::cout << "line:     " << r.to_line() << "\n";
        std::cout << "manifest: " << manifest << "\n";

        auto lock = r.to_lock_entry();
        if (lock.is_ok()) {
            toml::table locked;
            insert_entry(locked, r.name(), lock.value());
            std::cout << "lock:     " << locked << "\n";
        } else {
            std::cout << "lock:     (" << lock.error().message << ")\n";
        }
    }
    return 0;
}

int cmd_markers(const CliOptions& opts) {
    if (opts.args.size() != 3 || opts.args[0] != "merge") {
        std::cerr << "Usage: pinion markers merge <a> <b>\n";
        return 1;
    }
    auto a = Marker::parse(opts.args[1]);
    if (a.is_err()) return fail(a.error());
    auto b = Marker::parse(opts.args[2]);
    if (b.is_err()) return fail(b.error());

    auto merged = merge(a.value(), b.value());
    if (merged.is_err()) return fail(merged.error());
    if (merged.value()) {
        std::cout << merged.value()->to_string() << "\n";
    } else {
        std::cout << "(none)\n";
    }
    return 0;
}

int cmd_resolve(const CliOptions& opts, const Config& config) {
    if (opts.args.empty()) {
        std::cerr << "Usage: pinion resolve <line>... --index <file>\n";
        return 1;
    }
    auto session = open_session(config);
    if (session.is_err()) return fail(session.error());

    std::vector<RequirementInput> roots(opts.args.begin(), opts.args.end());
    auto resolved = session.value()->resolver()->resolve(roots, config.rounds());
    if (resolved.is_err()) return fail(resolved.error());

    for (const auto& [name, pkg] : resolved.value()) {
        (void)name;
        std::cout << pkg.requirement.to_line() << "\n";
    }
    return 0;
}

int cmd_lock(const CliOptions& opts, const Config& config) {
    auto pipfile = Pipfile::load(opts.pipfile);
    if (pipfile.is_err()) return fail(pipfile.error());

    Config effective = config;
    if (!pipfile.value().python_version.empty() &&
        !effective.environment.count("python_version")) {
        effective.environment["python_version"] = pipfile.value().python_version;
    }

    auto session = open_session(effective);
    if (session.is_err()) return fail(session.error());

    auto resolve_section = [&](bool dev) -> Result<ResolvedSet> {
        auto reqs = pipfile.value().requirements(dev);
        if (reqs.is_err()) return std::move(reqs).error();
        std::vector<RequirementInput> roots(reqs.value().begin(), reqs.value().end());
        return session.value()->resolver()->resolve(roots, effective.rounds());
    };

    auto def = resolve_section(false);
    if (def.is_err()) return fail(def.error());
    auto lock = LockFile::from_resolved(pipfile.value(), def.value());
    if (lock.is_err()) return fail(lock.error());

    if (opts.dev) {
        auto dev = resolve_section(true);
        if (dev.is_err()) return fail(dev.error());
        auto added = lock.value().add_resolved(dev.value(), true);
        if (added.is_err()) return fail(added.error());
    }

    std::string out_path = opts.pipfile + ".lock";
    auto saved = lock.value().save(out_path);
    if (saved.is_err()) return fail(saved.error());

    log::info("locked %zu package(s) into %s",
              lock.value().default_packages.size() + lock.value().develop.size(),
              out_path.c_str());
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << parsed.error().format() << "\n" << USAGE;
        return 1;
    }
    const CliOptions& opts = parsed.value();

    if (opts.command.empty() || opts.command == "help") {
        std::cout << USAGE;
        return opts.command.empty() ? 1 : 0;
    }

    // Config files and flags override PINION_LOG
    auto env_log = log::init_from_env();
    if (env_log.is_err()) log::warn("%s", env_log.error().message.c_str());

    auto config = load_config(opts);
    if (config.is_err()) return fail(config.error());
    const Config& cfg = config.value();

    if (cfg.log_level) log::set_level(*cfg.log_level);
    if (cfg.log_color) log::set_color_enabled(*cfg.log_color);

    if (opts.command == "parse") return cmd_parse(opts);
    if (opts.command == "markers") return cmd_markers(opts);
    if (opts.command == "resolve") return cmd_resolve(opts, cfg);
    if (opts.command == "lock") return cmd_lock(opts, cfg);

    std::cerr << "error: unknown command '" << opts.command << "'\n" << USAGE;
    return 1;
}
