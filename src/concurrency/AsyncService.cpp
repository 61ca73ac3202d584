#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ss::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();   // previous run finished on its own

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            ss::log::Registry::stitchsync()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    ss::log::Registry::stitchsync()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    interruptFlag_.store(true, std::memory_order_release);

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        ss::log::Registry::stitchsync()->debug("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
}

void AsyncService::restart() {
    ss::log::Registry::stitchsync()->debug("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
