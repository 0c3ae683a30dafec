#include <catch2/catch_test_macros.hpp>
#include "mock_http_client.hpp"
#include "mock_provider.hpp"
#include "registry.hpp"
#include "plugin.hpp"
#include "event_bus.hpp"
#include <algorithm>

using namespace hybridllm;
using Mode = ScriptedProvider::Mode;

// Plugin registrations use unique prefixed names so they never collide with
// the static ones from the provider .cpp files.

// ── PluginRegistry ───────────────────────────────────────────────

TEST_CASE("PluginRegistry: built-in providers are registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_provider("anthropic"));
    REQUIRE(reg.has_provider("openai"));
    REQUIRE(reg.has_provider("openrouter"));
}

TEST_CASE("PluginRegistry: provider_names returns sorted list", "[plugin]") {
    auto names = PluginRegistry::instance().provider_names();
    REQUIRE(std::is_sorted(names.begin(), names.end()));
}

TEST_CASE("PluginRegistry: register, create and unregister custom provider", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_provider("_test_prov", [](const std::string&, HttpClient&,
                                           const std::string&, const std::string&) {
        return std::make_unique<ScriptedProvider>("_test_prov", Mode::Reply, "ok");
    });
    REQUIRE(reg.has_provider("_test_prov"));

    MockHttpClient http;
    auto provider = reg.create_provider("_test_prov", "", http, "", "");
    REQUIRE(provider->provider_name() == "_test_prov");

    REQUIRE(reg.unregister_provider("_test_prov"));
    REQUIRE_FALSE(reg.has_provider("_test_prov"));
    REQUIRE_FALSE(reg.unregister_provider("_test_prov"));
}

TEST_CASE("PluginRegistry: factory returning null throws", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_provider("_test_null", [](const std::string&, HttpClient&,
                                           const std::string&, const std::string&) {
        return std::unique_ptr<Provider>();
    });

    MockHttpClient http;
    REQUIRE_THROWS_AS(reg.create_provider("_test_null", "k", http, "", ""),
                      std::runtime_error);
    reg.unregister_provider("_test_null");
}

TEST_CASE("PluginRegistry: unknown provider throws", "[plugin]") {
    MockHttpClient http;
    REQUIRE_THROWS_AS(
        PluginRegistry::instance().create_provider("_nonexistent_prov", "k", http, "", ""),
        std::invalid_argument);
}

// ── Config-driven construction ───────────────────────────────────

TEST_CASE("ProviderRegistry: providers without keys are unavailable", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.providers["openai"].api_key = "sk-oai";

    ProviderRegistry registry(cfg, http);

    REQUIRE(registry.handles().size() == 3);
    REQUIRE_FALSE(registry.find("anthropic")->available());
    REQUIRE(registry.find("anthropic")->reason == "no API key");
    REQUIRE(registry.find("openai")->available());
    REQUIRE_FALSE(registry.find("openrouter")->available());
}

TEST_CASE("ProviderRegistry: primary is attempted first", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.primary = "openrouter";
    cfg.order = {"anthropic", "openai", "openrouter"};

    ProviderRegistry registry(cfg, http);

    const auto& handles = registry.handles();
    REQUIRE(handles.size() == 3);
    REQUIRE(handles[0].name == "openrouter");
    REQUIRE(handles[1].name == "anthropic");
    REQUIRE(handles[2].name == "openai");
}

TEST_CASE("ProviderRegistry: primary missing from order is prepended", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.primary = "openai";
    cfg.order = {"anthropic", "anthropic"};

    ProviderRegistry registry(cfg, http);

    REQUIRE(registry.handles().size() == 2);
    REQUIRE(registry.handles()[0].name == "openai");
    REQUIRE(registry.handles()[1].name == "anthropic");
}

TEST_CASE("ProviderRegistry: unknown provider name becomes unavailable", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.order = {"anthropic", "_bogus"};
    cfg.providers["_bogus"].api_key = "k";

    ProviderRegistry registry(cfg, http);

    const auto* bogus = registry.find("_bogus");
    REQUIRE(bogus != nullptr);
    REQUIRE_FALSE(bogus->available());
    REQUIRE(bogus->reason == "Unknown provider: _bogus");
}

TEST_CASE("ProviderRegistry: throwing factory does not abort construction", "[registry]") {
    auto& plugins = PluginRegistry::instance();
    plugins.register_provider("_test_throws", [](const std::string&, HttpClient&,
                                                 const std::string&, const std::string&)
                                                  -> std::unique_ptr<Provider> {
        throw std::runtime_error("client init failed");
    });

    MockHttpClient http;
    Config cfg;
    cfg.primary = "_test_throws";
    cfg.order = {"_test_throws", "openai"};
    cfg.providers["_test_throws"].api_key = "k";
    cfg.providers["openai"].api_key = "sk-oai";

    ProviderRegistry registry(cfg, http);
    plugins.unregister_provider("_test_throws");

    REQUIRE(registry.primary() == "_test_throws");
    REQUIRE_FALSE(registry.find("_test_throws")->available());
    REQUIRE(registry.find("_test_throws")->reason == "client init failed");
    REQUIRE(registry.find("openai")->available());
}

TEST_CASE("ProviderRegistry: configured model and base URL reach the provider", "[registry]") {
    MockHttpClient http;
    http.next_response = {200, R"({"choices":[{"message":{"content":"ok"}}]})"};
    Config cfg;
    cfg.primary = "openai";
    cfg.order = {"openai"};
    cfg.providers["openai"] = {"sk-oai", "http://local:8080/v1", "gpt-4o"};

    ProviderRegistry registry(cfg, http);
    auto* provider = registry.find("openai")->provider.get();

    REQUIRE(provider->default_model() == "gpt-4o");
    provider->invoke({{Role::User, "hi"}}, {});
    REQUIRE(http.last_url == "http://local:8080/v1/chat/completions");
}

TEST_CASE("ProviderRegistry: empty primary throws", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.primary = "";
    REQUIRE_THROWS_AS(ProviderRegistry(cfg, http), std::invalid_argument);
}

TEST_CASE("ProviderRegistry: publishes one init event per provider", "[registry]") {
    MockHttpClient http;
    EventBus bus;
    std::vector<ProviderInitializedEvent> events;
    subscribe<ProviderInitializedEvent>(bus, [&](const ProviderInitializedEvent& ev) {
        events.push_back(ev);
    });

    Config cfg;
    cfg.providers["anthropic"].api_key = "sk-ant";
    ProviderRegistry registry(cfg, http, &bus);

    REQUIRE(events.size() == 3);
    REQUIRE(events[0].provider == "anthropic");
    REQUIRE(events[0].available);
    REQUIRE(events[1].provider == "openai");
    REQUIRE_FALSE(events[1].available);
    REQUIRE(events[1].reason == "no API key");
}

// ── Pre-built handles ────────────────────────────────────────────

TEST_CASE("ProviderRegistry: pre-built handles rotate primary to front", "[registry]") {
    std::vector<ProviderHandle> handles;
    handles.push_back(available(std::make_unique<ScriptedProvider>("a", Mode::Reply, "x")));
    handles.push_back(unavailable("b"));
    handles.push_back(available(std::make_unique<ScriptedProvider>("c", Mode::Reply, "y")));

    ProviderRegistry registry("c", std::move(handles), 3);

    REQUIRE(registry.primary() == "c");
    REQUIRE(registry.max_retries() == 3);
    REQUIRE(registry.handles()[0].name == "c");
    REQUIRE(registry.handles()[1].name == "a");
    REQUIRE(registry.handles()[2].name == "b");
    REQUIRE(registry.find("zzz") == nullptr);
}

TEST_CASE("ProviderRegistry: pre-built handle validation", "[registry]") {
    SECTION("empty") {
        REQUIRE_THROWS_AS(ProviderRegistry("a", {}), std::invalid_argument);
    }
    SECTION("duplicate name") {
        std::vector<ProviderHandle> handles;
        handles.push_back(unavailable("a"));
        handles.push_back(unavailable("a"));
        REQUIRE_THROWS_AS(ProviderRegistry("a", std::move(handles)), std::invalid_argument);
    }
    SECTION("primary not among handles") {
        std::vector<ProviderHandle> handles;
        handles.push_back(unavailable("a"));
        REQUIRE_THROWS_AS(ProviderRegistry("b", std::move(handles)), std::invalid_argument);
    }
}

// ── Status ───────────────────────────────────────────────────────

TEST_CASE("ProviderStatus: reports availability per provider", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.primary = "openai";
    cfg.max_retries = 4;
    cfg.providers["openai"].api_key = "sk-oai";

    ProviderRegistry registry(cfg, http);
    auto status = registry.status();

    REQUIRE(status.primary == "openai");
    REQUIRE(status.max_retries == 4);
    REQUIRE(status.available_count() == 1);
    REQUIRE(status.is_available("openai"));
    REQUIRE_FALSE(status.is_available("anthropic"));
    REQUIRE_FALSE(status.is_available("not-configured"));
    REQUIRE(status.providers[0].name == "openai");
    REQUIRE(status.providers[1].reason == "no API key");
}

TEST_CASE("ProviderStatus::to_json: flat availability map", "[registry]") {
    MockHttpClient http;
    Config cfg;
    cfg.providers["anthropic"].api_key = "sk-ant";

    auto j = ProviderRegistry(cfg, http).status().to_json();

    REQUIRE(j["anthropic_available"] == true);
    REQUIRE(j["openai_available"] == false);
    REQUIRE(j["openrouter_available"] == false);
    REQUIRE(j["primary_provider"] == "anthropic");
    REQUIRE(j["max_retries"] == 2);
}
