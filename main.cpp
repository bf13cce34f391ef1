// Sync
#include "sync/Orchestrator.hpp"
#include "sync/StateStore.hpp"
#include "sync/errors.hpp"

// API
#include "api/Client.hpp"

// Auth
#include "auth/EnvTokenStore.hpp"
#include "auth/FallbackTokenStore.hpp"
#include "auth/FileTokenStore.hpp"
#include "auth/Manager.hpp"

// Misc
#include "config/Config.hpp"
#include "config/Environment.hpp"
#include "concurrency/CancelToken.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <csignal>
#include <cstdlib>
#include <string_view>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

#ifndef HISTSYNC_VERSION
#define HISTSYNC_VERSION "dev"
#endif

using namespace hs;
using namespace hs::logging;

namespace {

concurrency::CancelToken cancelToken;

void signalHandler(int) { cancelToken.cancel(); }

void printUsage() {
    fmt::print(R"(Usage: histsync <command>

Commands:
  sync      Sync Claude conversation history
  status    Show config, auth and sync status
  logout    Clear stored credentials
  version   Print version information
  help      Show this help message
)");
}

std::shared_ptr<auth::Manager> makeAuthManager(const config::Config& cfg) {
    auto store = std::make_shared<auth::FallbackTokenStore>(
        std::make_unique<auth::EnvTokenStore>(auth::EnvTokenStore::fromProcessEnvironment()),
        std::make_unique<auth::FileTokenStore>(cfg.token_path));
    return std::make_shared<auth::Manager>(std::move(store));
}

int runSync(const config::Config& cfg) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto authManager = makeAuthManager(cfg);

    api::Client client(cfg.api_endpoint, cfg.machine_id, cfg.http,
                       [&] { return authManager->validToken(); }, cancelToken);

    sync::Orchestrator orchestrator(cfg, client, client,
                                    [&] { (void)authManager->validToken(); }, cancelToken);

    try {
        (void)orchestrator.run();
    } catch (const sync::CredentialError& e) {
        LogRegistry::histsync()->error("[-] Not authenticated: {}", e.what());
        return EXIT_FAILURE;
    } catch (const sync::CancelledError&) {
        LogRegistry::histsync()->warn("[!] Sync interrupted");
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int runStatus(const config::Config& cfg) {
    fmt::print("Config:\n");
    fmt::print("  API Endpoint: {}\n", cfg.api_endpoint);
    fmt::print("  Machine ID:   {}\n", cfg.machine_id);
    fmt::print("  Data Dir:     {}\n", cfg.claude_data_dir.string());

    const auto authManager = makeAuthManager(cfg);

    fmt::print("\nAuth:\n");
    try {
        (void)authManager->validToken();
        fmt::print("  Status: authenticated ({})\n", authManager->store()->name());
    } catch (const sync::CredentialError& e) {
        fmt::print("  Status: not authenticated ({})\n", e.what());
    }

    try {
        const auto state = sync::StateStore(cfg.state_path).load();
        fmt::print("\nSync State:\n");
        fmt::print("  Last Sync:    {}\n", state.last_sync_at.empty() ? "never" : state.last_sync_at);
        fmt::print("  Sessions:     {}\n", state.sessions.size());
    } catch (const sync::StateError& e) {
        fmt::print("\nSync State: error loading ({})\n", e.what());
    }

    LogRegistry::config()->debug("[status] Effective config: {}", nlohmann::json(cfg).dump());
    return EXIT_SUCCESS;
}

int runLogout(const config::Config& cfg) {
    makeAuthManager(cfg)->logout();
    fmt::print("Successfully logged out.\n");
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return EXIT_FAILURE;
    }

    const std::string_view cmd = argv[1];

    if (cmd == "version") {
        fmt::print("histsync {}\n", HISTSYNC_VERSION);
        return EXIT_SUCCESS;
    }

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        printUsage();
        return EXIT_SUCCESS;
    }

    if (cmd != "sync" && cmd != "status" && cmd != "logout") {
        fmt::print(stderr, "Unknown command: {}\n", cmd);
        printUsage();
        return EXIT_FAILURE;
    }

    config::Config cfg;
    try {
        const auto env = config::Environment::capture();
        cfg = config::loadConfig(config::defaultConfigPath(env), env);
        LogRegistry::init(cfg.logging);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: loading config: {}\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        if (cmd == "sync") return runSync(cfg);
        if (cmd == "status") return runStatus(cfg);
        return runLogout(cfg);
    } catch (const std::exception& e) {
        LogRegistry::histsync()->error("[-] {} failed: {}", cmd, e.what());
        return EXIT_FAILURE;
    }
}
