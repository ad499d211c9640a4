#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace fileops::services;
using namespace fileops::log;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    // A previous run may have exited on its own; reap it before reusing worker_.
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::fileops()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    Registry::fileops()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning() && !worker_.joinable()) return;

    Registry::fileops()->debug("[{}] Stopping service...", serviceName_);
    handleInterrupt();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    Registry::fileops()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    Registry::fileops()->debug("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::handleInterrupt() {
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();
}

void AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
}
