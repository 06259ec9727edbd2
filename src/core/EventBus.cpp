#include "core/EventBus.h"

EventBus::EventBus(std::shared_ptr<Logger> logger)
    : logger(logger ? std::move(logger) : Logger::null()) {}

EventBus::~EventBus() {
    shutdown();
    {
        // 其他线程上的 shutdown() 可能还在 join, 等它结束再回收剩下的线程
        std::unique_lock<std::mutex> lock(lifecycleMtx);
        lifecycleCv.wait(lock, [this] { return shutdownDone; });
    }
    // 在处理函数里调用过 shutdown() 的通道, 分发线程留到这里回收
    joinLane(ui);
    joinLane(model);
    joinLane(api);
}

bool EventBus::publish(const Event& event) {
    return std::visit([this](const auto& e) { return publish(e); }, event);
}

void EventBus::clearHandlers() {
    ui.clear();
    model.clear();
    api.clear();
}

template <typename T>
void EventBus::runLane(Lane<T>& lane) {
    logger->debug(std::string("Event loop started: ") + lane.name);
    while (auto event = lane.receiver.recv()) {
        for (const auto& handler : lane.snapshot()) {
            try {
                (*handler)(*event);
            } catch (const std::exception& e) {
                logger->error(std::string("Error in ") + lane.name + " event handler: " + e.what());
            } catch (...) {
                logger->error(std::string("Unknown error in ") + lane.name + " event handler");
            }
        }
    }
    logger->debug(std::string("Event loop stopped: ") + lane.name);
}

template <typename T>
void EventBus::startLane(Lane<T>& lane) {
    lane.worker = std::thread([this, &lane]() { runLane(lane); });
}

template <typename T>
void EventBus::stopLane(Lane<T>& lane) {
    lane.receiver.close();
    // 处理函数里调用 shutdown() 时不能 join 自己, 留给析构函数
    if (lane.worker.joinable() && lane.worker.get_id() != std::this_thread::get_id()) {
        lane.worker.join();
    }
}

template <typename T>
void EventBus::joinLane(Lane<T>& lane) {
    if (!lane.worker.joinable()) return;
    if (lane.worker.get_id() == std::this_thread::get_id()) {
        // 总线在自己的分发线程上析构, 只能分离
        lane.worker.detach();
    } else {
        lane.worker.join();
    }
}

void EventBus::startEventDistribution() {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    if (running || stopped) return;
    running = true;

    startLane(ui);
    startLane(model);
    startLane(api);
    logger->info("Event distribution started");
}

bool EventBus::isRunning() const {
    std::lock_guard<std::mutex> lock(lifecycleMtx);
    return running;
}

void EventBus::shutdown() {
    {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        if (stopped) return;
        stopped = true;
        running = false;
    }

    stopLane(ui);
    stopLane(model);
    stopLane(api);
    logger->info("Event bus shut down");

    {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        shutdownDone = true;
    }
    lifecycleCv.notify_all();
}
