#include <catch2/catch.hpp>
#include <pinion/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

using namespace pinion::log;

// Run fn with the log sink pointed at a temporary file and return what it wrote
static std::string capture(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_sink(tmp);
    fn();
    set_sink(nullptr);

    std::string output;
    std::rewind(tmp);
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) output.append(buf, n);
    std::fclose(tmp);
    return output;
}

// Restores the global level and color state on scope exit
struct LogState {
    Level level = get_level();
    bool color = is_color_enabled();
    ~LogState() {
        set_level(level);
        set_color_enabled(color);
        set_sink(nullptr);
    }
};

TEST_CASE("set_level / get_level", "[log]") {
    LogState restore;
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Warn);
    REQUIRE(enabled(Error));
    REQUIRE(enabled(Warn));
    REQUIRE_FALSE(enabled(Info));
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level", "[log]") {
    REQUIRE(parse_level("debug").value() == Debug);
    REQUIRE(parse_level("INFO").value() == Info);
    REQUIRE(parse_level("warning").value() == Warn);
    REQUIRE(parse_level("Warn").value() == Warn);
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("error").value() == Error);

    auto bad = parse_level("loud");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == pinion::PinionError::Config);
}

TEST_CASE("messages below the threshold are dropped", "[log]") {
    LogState restore;
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture([] {
        debug("resolver round %d", 1);
        info("locked %d packages", 3);
    });
    REQUIRE(output.empty());
}

TEST_CASE("messages at or above the threshold are written", "[log]") {
    LogState restore;
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture([] {
        warn("hash cache at %s is unusable", "/tmp/x.db");
        error("giving up");
    });
    REQUIRE(output == "warn: hash cache at /tmp/x.db is unusable\nerror: giving up\n");
}

TEST_CASE("colored output wraps the level name", "[log]") {
    LogState restore;
    set_level(Info);
    set_color_enabled(true);
    REQUIRE(is_color_enabled());

    auto output = capture([] { info("stable after %zu rounds", static_cast<size_t>(4)); });
    REQUIRE(output == "\033[32minfo\033[0m: stable after 4 rounds\n");
}

TEST_CASE("level and color from the environment", "[log]") {
    LogState restore;
    set_level(Info);
    set_color_enabled(true);

    SECTION("PINION_LOG sets the threshold") {
        setenv("PINION_LOG", "debug", 1);
        unsetenv("NO_COLOR");
        REQUIRE(init_from_env().is_ok());
        REQUIRE(get_level() == Debug);
        REQUIRE(is_color_enabled());
    }
    SECTION("an unknown level is an error") {
        setenv("PINION_LOG", "chatty", 1);
        auto st = init_from_env();
        REQUIRE(st.is_err());
        REQUIRE(st.error().message == "PINION_LOG: unknown log level 'chatty'");
        REQUIRE(get_level() == Info);
    }
    SECTION("NO_COLOR disables color") {
        unsetenv("PINION_LOG");
        setenv("NO_COLOR", "1", 1);
        REQUIRE(init_from_env().is_ok());
        REQUIRE_FALSE(is_color_enabled());
        REQUIRE(get_level() == Info);
    }

    unsetenv("PINION_LOG");
    unsetenv("NO_COLOR");
}
