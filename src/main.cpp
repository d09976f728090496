#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "flycache/cache/CacheConfig.hpp"
#include "flycache/cache/invalidation/CacheBroadcaster.hpp"
#include "flycache/cache/manager/CacheKeys.hpp"
#include "flycache/cache/manager/CacheManager.hpp"

using namespace flycache;

namespace {

std::atomic<bool> g_running{true};

struct UserProfile {
    uint64_t id = 0;
    std::string name;
    std::string email;
    std::string role;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(UserProfile, id, name, email, role)

struct FeatureFlag {
    std::string key;
    bool enabled = false;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FeatureFlag, key, enabled)

// Вместо WebSocket-хаба уведомления пишутся в журнал
class LogBroadcaster : public cache::CacheBroadcaster {
public:
    void broadcastInvalidation(const cache::InvalidatePayload& payload) override {
        spdlog::info("Broadcast: {}", payload.toJson().dump());
    }
};

void signalHandler(int) {
    g_running = false;
}

void initializeLogging() {
    try {
        std::filesystem::create_directories("logs");

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/flycache_demo.log", 1024 * 1024 * 10, 5);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("flycache_demo",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
        spdlog::info("=== flycache demo starting ===");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

cache::CacheConfig loadConfig(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            spdlog::info("Loading cache configuration from {}", argv[i + 1]);
            return cache::CacheConfig::loadFromFile(argv[i + 1]);
        }
    }
    spdlog::info("Loading cache configuration from environment");
    return cache::CacheConfig::fromEnvironment();
}

bool hasFlag(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

// Источник данных, который медленно отвечает на промах
UserProfile loadUserFromSource(uint64_t id) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return UserProfile{id, "user" + std::to_string(id), "user" + std::to_string(id) + "@example.com", "member"};
}

void registerWarmingTasks(cache::CacheManager& manager) {
    cache::WarmingTask flags;
    flags.name = "feature_flags";
    flags.cacheKey = cache::keys::FEATURE_FLAGS;
    flags.ttl = manager.ttlFor(cache::TtlDomain::Default);
    flags.loader = [](const cache::CancellationToken&) {
        std::vector<FeatureFlag> all{{"new_dashboard", true}, {"beta_api", false}};
        return cache::toBytes(nlohmann::json(all).dump());
    };
    manager.warmer().registerTask(std::move(flags));

    cache::WarmingTask users;
    users.name = "recent_active_users";
    users.cacheKey = "users:recent_active";
    users.ttl = manager.ttlFor(cache::TtlDomain::UserProfile);
    users.loader = [](const cache::CancellationToken& token) {
        std::vector<UserProfile> recent;
        for (uint64_t id = 1; id <= 5 && !token.isCancelled(); ++id) {
            recent.push_back(loadUserFromSource(id));
        }
        return cache::toBytes(nlohmann::json(recent).dump());
    };
    manager.warmer().registerTask(std::move(users));
}

void serveLookups(cache::CacheManager& manager) {
    const auto ttl = manager.ttlFor(cache::TtlDomain::UserProfile);
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&manager, ttl, i] {
            uint64_t id = static_cast<uint64_t>(i % 2) + 1;
            try {
                auto profile = manager.aside().cacheAside<UserProfile>(
                    cache::keys::user(id), ttl, [id] { return loadUserFromSource(id); });
                spdlog::debug("Lookup user {} -> {}", id, profile.email);
            } catch (const std::exception& e) {
                spdlog::error("Lookup user {} failed: {}", id, e.what());
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
}

void runServiceLoop(cache::CacheManager& manager, bool once) {
    spdlog::info("Starting service loop...");
    auto lastHealthCheck = std::chrono::steady_clock::now();

    while (g_running) {
        try {
            serveLookups(manager);

            auto now = std::chrono::steady_clock::now();
            if (once || now - lastHealthCheck > std::chrono::seconds(10)) {
                spdlog::info("Health: {}", manager.checkHealth().toJson().dump());
                spdlog::info("Metrics: {}", manager.backend()->snapshot().toJson().dump());
                manager.invalidation().publish(cache::InvalidationEvent::featureFlagsUpdated());
                lastHealthCheck = now;
            }
            if (once) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    spdlog::info("Service loop stopped");
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        initializeLogging();

        auto config = loadConfig(argc, argv);
        auto manager = cache::CacheManager::create(config);
        spdlog::info("Cache backend: {}, available={}", manager->backendName(), manager->isAvailable());

        registerWarmingTasks(*manager);
        auto results = manager->warmer().warm();
        for (const auto& result : results) {
            spdlog::info("Warming task '{}': success={}, latency={}ms{}", result.name, result.success,
                         result.latency.count(), result.error.empty() ? "" : ", error=" + result.error);
        }

        manager->invalidation().setBroadcaster(std::make_shared<LogBroadcaster>());

        runServiceLoop(*manager, hasFlag(argc, argv, "--once"));

        manager->close();
        spdlog::info("=== flycache demo shutdown complete ===");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get("flycache_demo")) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
