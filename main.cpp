// Drive management
#include "drive/DriveManager.hpp"
#include "drive/EventFeed.hpp"

// Task engine
#include "concurrency/TaskManager.hpp"
#include "sync/TaskOperations.hpp"

// Database
#include "db/Janitor.hpp"
#include "db/MemoryStore.hpp"
#include "db/PgStore.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>

using namespace stratus::config;
using namespace stratus::concurrency;
using namespace stratus::drive;
using namespace stratus::db;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

std::filesystem::path configPath(const int argc, char** argv) {
    if (argc > 1) return argv[1];
    if (const char* env = std::getenv("STRATUS_CONFIG")) return env;
    return DEFAULT_CONFIG_PATH;
}

MetadataStorePtr openStore(const DatabaseConfig& cfg) {
    if (cfg.backend == "postgres") return PgStore::connect(cfg);
    if (cfg.backend == "memory") return std::make_shared<MemoryStore>();
    throw std::invalid_argument("Unknown database backend: " + cfg.backend);
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(configPath(argc, argv));
        stratus::log::Registry::init();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[-] Failed to load configuration: %s\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();
        stratus::log::Registry::stratus()->info("[*] Starting stratusd...");
        stratus::log::Registry::stratus()->debug("[*] Effective configuration:\n{}", dumpConfig(cfg));

        const auto store = openStore(cfg.database);
        stratus::log::Registry::stratus()->info("[✓] Metadata store ready ({})", cfg.database.backend);

        Janitor janitor(store, cfg.transfer.session_sweep_interval);
        janitor.start();

        const auto tasks = std::make_shared<TaskManager>(cfg.tasks, stratus::sync::makeOperationTable());
        const auto events = std::make_shared<EventFeed>();
        events->subscribe([](const Event& e) {
            if (e.kind == Event::Kind::TaskProgress) return;
            stratus::log::Registry::stratus()->debug("[Events] {}", nlohmann::json(e).dump());
        });

        DriveManager drives(cfg, store, tasks, events);
        drives.load();

        stratus::log::Registry::stratus()->info("[✓] stratusd started with {} drives", drives.listDrives().size());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            if (reopenLogs.exchange(false)) stratus::log::Registry::reopenMainLog();
        }

        stratus::log::Registry::stratus()->info("[!] Signal received. Shutting down gracefully...");

        drives.shutdown();
        tasks->stopAll(cfg.tasks.stop_grace_period);
        janitor.stop();

        stratus::log::Registry::stratus()->info("[✓] stratusd shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        stratus::log::Registry::stratus()->error("[-] stratusd failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
