#include "flycache/util/Logging.hpp"
#include <mutex>
#include <iostream>
#include <spdlog/sinks/rotating_file_sink.h>

namespace flycache {
namespace util {

namespace {
constexpr size_t kMaxLogSize = 1024 * 1024 * 5;
constexpr size_t kMaxLogFiles = 3;
std::mutex registryMutex;
}

std::shared_ptr<spdlog::logger> componentLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    // Два потока могут одновременно не найти логгер, регистрация под мьютексом
    std::lock_guard<std::mutex> lock(registryMutex);
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    try {
        auto logger = spdlog::rotating_logger_mt(name, "logs/" + name + ".log",
                                                 kMaxLogSize, kMaxLogFiles);
        logger->set_level(spdlog::level::debug);
        return logger;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
    }
    return spdlog::default_logger();
}

} // namespace util
} // namespace flycache
