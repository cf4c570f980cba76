#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include "rebalancer/broker/alpaca_client.hpp"
#include "rebalancer/broker/credential_store.hpp"
#include "rebalancer/core/logger.hpp"
#include "rebalancer/funding/checkpoint_store.hpp"
#include "rebalancer/live/agent_config.hpp"
#include "rebalancer/live/rebalance_agent.hpp"

using namespace rebalancer;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop.store(true, std::memory_order_release);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--once]" << std::endl;
}

// Precondition and funding failures need an operator before the next run
int exit_code_for(const RebalanceError& error) {
    switch (error.code()) {
        case ErrorCode::PRECONDITION_VIOLATION:
        case ErrorCode::INSUFFICIENT_FUNDS:
            return 2;
        default:
            return 1;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "agent_config.json";
        bool once = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--once") {
                once = true;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        AgentConfig config;
        if (std::filesystem::exists(config_path)) {
            auto loaded = config.load_from_file(config_path);
            if (loaded.is_error()) {
                std::cerr << "Failed to load config: " << loaded.error()->what() << std::endl;
                return 1;
            }
        } else {
            std::cerr << "No config at " << config_path << ", using defaults" << std::endl;
        }

        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid config: " << valid.error()->what() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        Logger::register_component("Main");
        INFO("Logger initialized successfully");

        CredentialStore credentials(config.credentials_path);
        auto file_loaded = credentials.load_config();
        if (file_loaded.is_error()) {
            // Environment variables may still carry the keys
            WARN("Credential file not used: " << file_loaded.error()->what());
        }

        auto key_id = credentials.get_credential("alpaca", "api_key_id", "APCA_API_KEY_ID");
        if (key_id.is_error()) {
            FATAL("Failed to get Alpaca key id: " << key_id.error()->what());
            return 1;
        }
        auto secret = credentials.get_credential("alpaca", "api_secret_key", "APCA_API_SECRET_KEY");
        if (secret.is_error()) {
            FATAL("Failed to get Alpaca secret key: " << secret.error()->what());
            return 1;
        }
        config.broker.api_key_id = key_id.value();
        config.broker.api_secret_key = secret.value();

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        AlpacaClient broker(config.broker);
        CheckpointStore store(config.checkpoint_path);
        RebalanceAgent agent(config, broker, store);

        INFO("Starting rebalancing agent against " << config.broker.base_url
                                                   << (once ? " for one cycle" : ""));
        auto result = agent.run(g_stop, once);
        if (result.is_error()) {
            Logger::register_component("Main");
            FATAL("Agent stopped on error: " << result.error()->to_string());
            return exit_code_for(*result.error());
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
