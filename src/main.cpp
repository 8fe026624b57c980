#include "core/prompt_firewall.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "policy/policy_engine.hpp"

#include <csignal>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace promptguard;

// Global instances for signal handling
std::shared_ptr<PromptFirewall> g_firewall;
std::shared_ptr<ConfigWatcher> g_config_watcher;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    if (g_config_watcher) {
        g_config_watcher->stop();
    }
    if (g_firewall) {
        g_firewall->get_audit_recorder()->shutdown();
    }
    std::_Exit(0);
}

namespace {

struct CliOptions {
    std::string config_path;
    bool batch = false;
    bool stats = false;
    std::optional<size_t> threats;
    std::vector<std::string> prompts;
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--batch] [--stats] [--threats N] [PROMPT ...]\n"
        "\n"
        "Checks each PROMPT (or each stdin line when none are given) and prints\n"
        "one decision JSON object per line.\n"
        "\n"
        "  --config FILE   TOML configuration (detector, scorer, audit, policies)\n"
        "  --batch         Check all prompts together and print a JSON array\n"
        "  --stats         Print statistics JSON after processing\n"
        "  --threats N     Print the N most recent high/critical audit records\n",
        argv0);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--batch") {
            opts.batch = true;
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--threats" && i + 1 < argc) {
            const auto n = utils::try_parse_int<size_t>(argv[++i]);
            if (!n) {
                std::cerr << std::format("Invalid --threats value: {}\n", argv[i]);
                return std::nullopt;
            }
            opts.threats = *n;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) opts.prompts.emplace_back(argv[i]);
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            opts.prompts.push_back(arg);
        }
    }
    return opts;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    FirewallConfig config;
    if (!opts->config_path.empty()) {
        auto loaded = ConfigLoader::load_from_file(opts->config_path);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        config = std::move(loaded.config);
        utils::log::info(std::format("Loaded configuration from {}", opts->config_path));
    }

    try {
        g_firewall = std::make_shared<PromptFirewall>(config);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to start firewall: {}", e.what()));
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Hot-reload of the policy rule set
    if (config.config_watcher.enabled && !opts->config_path.empty()) {
        g_config_watcher = std::make_shared<ConfigWatcher>(
            opts->config_path,
            std::chrono::seconds(config.config_watcher.poll_interval_seconds));

        std::weak_ptr<PromptFirewall> weak_fw = g_firewall;
        g_config_watcher->set_callback([weak_fw](const FirewallConfig& new_config) {
            auto fw = weak_fw.lock();
            if (!fw) return;
            const auto policies = new_config.has_policies
                ? new_config.policies : PolicyEngine::default_policies();
            auto result = fw->reload_policies(policies);
            if (result.is_error()) {
                throw std::runtime_error(result.error_message());
            }
        });
        g_config_watcher->start();
    }

    // ========================================================================
    // Prompts
    // ========================================================================

    std::vector<std::string> prompts = opts->prompts;
    const bool from_stdin = prompts.empty();

    if (opts->batch) {
        if (from_stdin) {
            for (std::string line; std::getline(std::cin, line);) {
                if (!line.empty()) prompts.push_back(std::move(line));
            }
        }
        const auto decisions = g_firewall->batch_check(prompts);
        std::string out = "[";
        for (size_t i = 0; i < decisions.size(); ++i) {
            if (i > 0) out += ',';
            out += decisions[i].to_json();
        }
        out += ']';
        std::cout << out << '\n';
    } else if (from_stdin) {
        for (std::string line; std::getline(std::cin, line);) {
            if (line.empty()) continue;
            std::cout << g_firewall->check(std::move(line)).to_json() << '\n' << std::flush;
        }
    } else {
        for (const auto& prompt : prompts) {
            std::cout << g_firewall->check(prompt).to_json() << '\n';
        }
    }

    if (opts->stats) {
        std::cout << g_firewall->get_stats().to_json() << '\n';
    }

    if (opts->threats) {
        const auto threats = g_firewall->get_recent_threats(*opts->threats);
        std::string out = "[";
        for (size_t i = 0; i < threats.size(); ++i) {
            if (i > 0) out += ',';
            out += threats[i].to_json();
        }
        out += ']';
        std::cout << out << '\n';
    }

    if (g_config_watcher) {
        g_config_watcher->stop();
    }
    g_firewall->flush_audit();
    g_firewall.reset();
    return 0;
}
