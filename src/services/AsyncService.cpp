#include "services/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace fk::services;
using namespace fk::logging;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    AsyncService::stop(); // ensure cleanup
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous loop exited on its own

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::filekeeper()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    LogRegistry::filekeeper()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::filekeeper()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);

    // Only join if we’re not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    LogRegistry::filekeeper()->info("[{}] Service stopped.", serviceName_);
}
