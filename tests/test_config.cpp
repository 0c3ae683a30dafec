#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace hybridllm;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.primary == "anthropic");
    REQUIRE(cfg.order == std::vector<std::string>{"anthropic", "openai", "openrouter"});
    REQUIRE(cfg.max_retries == 2);
    REQUIRE(cfg.timeout_seconds == 120);
    REQUIRE(cfg.temperature == 0.7);
    REQUIRE(cfg.max_tokens == 1024);
    REQUIRE(cfg.api_key_for("anthropic").empty());
    REQUIRE(cfg.api_key_for("openai").empty());
    REQUIRE(cfg.api_key_for("openrouter").empty());
}

TEST_CASE("Config::default_params: carries generation defaults", "[config]") {
    Config cfg;
    cfg.max_tokens = 200;
    cfg.temperature = 0.2;
    cfg.timeout_seconds = 30;

    auto params = cfg.default_params();
    REQUIRE(params.max_tokens == 200u);
    REQUIRE(params.temperature == 0.2);
    REQUIRE(params.timeout_seconds == 30);
    REQUIRE_FALSE(params.model.has_value());
}

// ── Per-provider lookups ─────────────────────────────────────────

TEST_CASE("Config::api_key_for: returns correct key per provider", "[config]") {
    Config cfg;
    cfg.providers["anthropic"].api_key = "sk-ant-123";
    cfg.providers["openai"].api_key = "sk-oai-456";
    cfg.providers["openrouter"].api_key = "sk-or-789";

    REQUIRE(cfg.api_key_for("anthropic") == "sk-ant-123");
    REQUIRE(cfg.api_key_for("openai") == "sk-oai-456");
    REQUIRE(cfg.api_key_for("openrouter") == "sk-or-789");
}

TEST_CASE("Config::api_key_for: unknown provider returns empty", "[config]") {
    Config cfg;
    cfg.providers["anthropic"].api_key = "key";
    REQUIRE(cfg.api_key_for("unknown").empty());
    REQUIRE(cfg.api_key_for("").empty());
}

TEST_CASE("Config: base_url_for and model_for", "[config]") {
    Config cfg;
    cfg.providers["openai"].base_url = "http://local:8080/v1";
    cfg.providers["openai"].model = "gpt-4o";

    REQUIRE(cfg.base_url_for("openai") == "http://local:8080/v1");
    REQUIRE(cfg.model_for("openai") == "gpt-4o");
    REQUIRE(cfg.base_url_for("anthropic").empty());
    REQUIRE(cfg.model_for("unknown").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every field", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "primary": "openai",
        "order": ["openrouter", "openai"],
        "max_retries": 5,
        "timeout_seconds": 30,
        "temperature": 0.3,
        "max_tokens": 512,
        "providers": {
            "openai": { "api_key": "sk-oai", "model": "gpt-4o" },
            "openrouter": { "api_key": "sk-or", "base_url": "http://proxy/v1" }
        }
    })"));

    REQUIRE(cfg.primary == "openai");
    REQUIRE(cfg.order == std::vector<std::string>{"openrouter", "openai"});
    REQUIRE(cfg.max_retries == 5);
    REQUIRE(cfg.timeout_seconds == 30);
    REQUIRE(cfg.temperature == 0.3);
    REQUIRE(cfg.max_tokens == 512);
    REQUIRE(cfg.api_key_for("openai") == "sk-oai");
    REQUIRE(cfg.model_for("openai") == "gpt-4o");
    REQUIRE(cfg.base_url_for("openrouter") == "http://proxy/v1");
}

TEST_CASE("Config::from_json: missing fields fall back to defaults", "[config]") {
    auto cfg = Config::from_json({{"primary", "openrouter"}});

    REQUIRE(cfg.primary == "openrouter");
    REQUIRE(cfg.order.size() == 3);
    REQUIRE(cfg.max_retries == 2);
    REQUIRE(cfg.max_tokens == 1024);
    // Default provider entries are present but empty
    REQUIRE(cfg.providers.count("anthropic") == 1);
    REQUIRE(cfg.api_key_for("anthropic").empty());
}

TEST_CASE("Config::from_json: partial provider entry keeps other defaults", "[config]") {
    auto cfg = Config::from_json({{"providers", {{"anthropic", {{"api_key", "k"}}}}}});

    REQUIRE(cfg.api_key_for("anthropic") == "k");
    REQUIRE(cfg.base_url_for("anthropic").empty());
    REQUIRE(cfg.providers.count("openai") == 1);
}

TEST_CASE("Config::from_json: wrong types are ignored", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "primary": 42,
        "max_retries": -1,
        "timeout_seconds": 0,
        "max_tokens": "lots",
        "providers": { "openai": "not an object" }
    })"));

    REQUIRE(cfg.primary == "anthropic");
    REQUIRE(cfg.max_retries == 2);
    REQUIRE(cfg.timeout_seconds == 120);
    REQUIRE(cfg.max_tokens == 1024);
    REQUIRE(cfg.api_key_for("openai").empty());
}

TEST_CASE("Config::from_json: counts beyond 32 bits are ignored", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "max_retries": 4294967296,
        "max_tokens": 99999999999
    })"));

    REQUIRE(cfg.max_retries == 2);
    REQUIRE(cfg.max_tokens == 1024);
}

TEST_CASE("Config::from_json: zero max_tokens is ignored, zero retries kept", "[config]") {
    auto cfg = Config::from_json({{"max_retries", 0}, {"max_tokens", 0}});

    REQUIRE(cfg.max_retries == 0);
    REQUIRE(cfg.max_tokens == 1024);
}

TEST_CASE("Config::from_json: non-object document yields defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::array());
    REQUIRE(cfg.primary == "anthropic");
    REQUIRE(cfg.order.size() == 3);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "hybridllm_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("OPENAI_API_KEY");
        unsetenv("OPENROUTER_API_KEY");
        unsetenv("HYBRIDLLM_PRIMARY");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("OPENAI_API_KEY");
        unsetenv("OPENROUTER_API_KEY");
        unsetenv("HYBRIDLLM_PRIMARY");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.hybridllm/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.hybridllm");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "primary": "openai",
        "providers": {
            "anthropic": { "api_key": "sk-file-ant" },
            "openai": { "api_key": "sk-file-oai" }
        }
    })");

    auto cfg = Config::load();
    REQUIRE(cfg.primary == "openai");
    REQUIRE(cfg.api_key_for("anthropic") == "sk-file-ant");
    REQUIRE(cfg.api_key_for("openai") == "sk-file-oai");
    REQUIRE(cfg.api_key_for("openrouter").empty());
}

TEST_CASE("Config::load: missing file yields defaults", "[config]") {
    ConfigTestGuard g;

    auto cfg = Config::load();
    REQUIRE(cfg.primary == "anthropic");
    REQUIRE(cfg.api_key_for("anthropic").empty());
}

TEST_CASE("Config::load: malformed file is ignored", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not valid json");

    auto cfg = Config::load();
    REQUIRE(cfg.primary == "anthropic");
    REQUIRE(cfg.max_tokens == 1024);
}

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({
        "primary": "anthropic",
        "providers": { "anthropic": { "api_key": "sk-file-ant" } }
    })");

    setenv("ANTHROPIC_API_KEY", "sk-env-ant", 1);
    setenv("OPENROUTER_API_KEY", "sk-env-or", 1);
    setenv("HYBRIDLLM_PRIMARY", "openrouter", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.api_key_for("anthropic") == "sk-env-ant");
    REQUIRE(cfg.api_key_for("openrouter") == "sk-env-or");
    REQUIRE(cfg.primary == "openrouter");
}

TEST_CASE("Config::apply_env: empty primary override is ignored", "[config]") {
    ConfigTestGuard g;
    setenv("HYBRIDLLM_PRIMARY", "", 1);

    Config cfg;
    cfg.apply_env();
    REQUIRE(cfg.primary == "anthropic");
}
