#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace stratus::concurrency;

AsyncService::AsyncService(std::string serviceName) : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    // Derived classes stop themselves first; this only reaps a thread that already exited.
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interruptFlag_.store(true, std::memory_order_release);
        wakeCv_.notify_all();
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::stratus()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::stratus()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::stratus()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(wakeMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    wakeCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    log::Registry::stratus()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::stratus()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
