#include "config.hpp"
#include "provider.hpp"
#include "failover.hpp"
#include "event_bus.hpp"
#include "logger.hpp"
#include "http.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: hybridllm [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG      Send a single user message and print the reply\n"
              << "  -s, --system MSG       Prepend a system message\n"
              << "  --primary NAME         Provider to try first (anthropic, openai, openrouter)\n"
              << "  --order A,B,...        Failover order after the primary\n"
              << "  --model NAME           Model for every provider\n"
              << "  --max-tokens N         Maximum output tokens (default: 1024)\n"
              << "  --temperature T        Sampling temperature (default: 0.7)\n"
              << "  --timeout SECONDS      Per-attempt timeout (default: 120)\n"
              << "  --status               Print provider availability and exit\n"
              << "  -q, --quiet            Do not log failover progress\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY      API key for Anthropic\n"
              << "  OPENAI_API_KEY         API key for OpenAI\n"
              << "  OPENROUTER_API_KEY     API key for OpenRouter\n"
              << "  HYBRIDLLM_PRIMARY      Default primary provider\n";
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string system_prompt;
    std::string primary;
    std::string order;
    std::string model;
    std::string max_tokens;
    std::string temperature;
    std::string timeout;
    bool show_status = false;
    bool quiet = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--system") == 0) && i + 1 < argc) {
            system_prompt = argv[++i];
        } else if (std::strcmp(argv[i], "--primary") == 0 && i + 1 < argc) {
            primary = argv[++i];
        } else if (std::strcmp(argv[i], "--order") == 0 && i + 1 < argc) {
            order = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model = argv[++i];
        } else if (std::strcmp(argv[i], "--max-tokens") == 0 && i + 1 < argc) {
            max_tokens = argv[++i];
        } else if (std::strcmp(argv[i], "--temperature") == 0 && i + 1 < argc) {
            temperature = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout = argv[++i];
        } else if (std::strcmp(argv[i], "--status") == 0) {
            show_status = true;
        } else if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (message.empty() && !show_status) {
        print_usage();
        return 1;
    }

    hybridllm::http_init();
    auto config = hybridllm::Config::load();

    // Override config with CLI args
    if (!primary.empty()) config.primary = primary;
    if (!order.empty()) config.order = hybridllm::split_list(order, ',');
    if (!max_tokens.empty()) {
        auto n = hybridllm::parse_u32(max_tokens);
        if (!n || *n == 0) {
            std::cerr << "Invalid --max-tokens: " << max_tokens
                      << " (expected a positive integer)\n";
            hybridllm::http_cleanup();
            return 1;
        }
        config.max_tokens = *n;
    }
    if (!temperature.empty()) config.temperature = std::stod(temperature);
    if (!timeout.empty()) {
        auto n = hybridllm::parse_u32(timeout);
        if (!n || *n == 0) {
            std::cerr << "Invalid --timeout: " << timeout
                      << " (expected a positive number of seconds)\n";
            hybridllm::http_cleanup();
            return 1;
        }
        config.timeout_seconds = static_cast<long>(*n);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    hybridllm::http_set_abort_flag(&g_shutdown);

    hybridllm::EventBus bus;
    std::unique_ptr<hybridllm::StderrLogger> logger;
    if (!quiet) logger = std::make_unique<hybridllm::StderrLogger>(bus);

    hybridllm::PlatformHttpClient http_client;
    hybridllm::FailoverDispatcher dispatcher(config, http_client, &bus);

    if (show_status) {
        std::cout << dispatcher.status().to_json().dump(2) << "\n";
        hybridllm::http_cleanup();
        return 0;
    }

    std::vector<hybridllm::ChatMessage> messages;
    if (!system_prompt.empty()) {
        messages.push_back({hybridllm::Role::System, system_prompt});
    }
    messages.push_back({hybridllm::Role::User, message});

    auto params = config.default_params();
    if (!model.empty()) params.model = model;
    params.cancel = &g_shutdown;

    int rc = 0;
    try {
        auto result = dispatcher.call(messages, params);
        std::cout << "[" << result.provider << "] " << result.text << "\n";
    } catch (const hybridllm::AllProvidersFailed& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    hybridllm::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
