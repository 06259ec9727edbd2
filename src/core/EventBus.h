#pragma once
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/EventChannel.h"
#include "core/Events.h"
#include "utils/Logger.h"

/**
 * @brief 三通道事件总线 (UI / Model / API)
 *
 * - 每个通道一个无界队列和一个分发线程, 通道之间互不阻塞
 * - 同一通道内事件严格按发布顺序处理; 一个事件交给注册时刻的全部处理函数,
 *   按注册顺序依次执行, 全部返回后才取下一个事件
 * - 处理函数是引用计数的不可变闭包, 分发时在锁外调用, 处理函数里可以继续注册或发布
 * - startEventDistribution() 之前发布的事件留在队列里, 启动后补发
 */
class EventBus {
public:
    template <typename T>
    using Handler = std::function<void(const T&)>;

    explicit EventBus(std::shared_ptr<Logger> logger = nullptr);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    Sender<UiEvent> uiSender() const { return ui.sender; }
    Sender<ModelEvent> modelSender() const { return model.sender; }
    Sender<ApiEvent> apiSender() const { return api.sender; }

    /**
     * @return 通道已关闭 (shutdown 之后) 时返回 false
     */
    bool publish(const UiEvent& event) { return ui.sender.send(event); }
    bool publish(const ModelEvent& event) { return model.sender.send(event); }
    bool publish(const ApiEvent& event) { return api.sender.send(event); }
    bool publish(const Event& event);

    void registerUiHandler(Handler<UiEvent> handler) { ui.add(std::move(handler)); }
    void registerModelHandler(Handler<ModelEvent> handler) { model.add(std::move(handler)); }
    void registerApiHandler(Handler<ApiEvent> handler) { api.add(std::move(handler)); }

    size_t uiHandlerCount() const { return ui.count(); }
    size_t modelHandlerCount() const { return model.count(); }
    size_t apiHandlerCount() const { return api.count(); }

    void clearHandlers();

    /**
     * @brief 启动三个分发线程; 重复调用无效果
     */
    void startEventDistribution();

    bool isRunning() const;

    /**
     * @brief 关闭全部通道并等待分发线程退出; 之后 publish 返回 false
     *
     * 在某个通道的处理函数里调用时, 该通道的分发线程在当前事件处理完后退出,
     * 由析构函数回收。
     */
    void shutdown();

private:
    template <typename T>
    struct Lane {
        const char* name;
        Sender<T> sender;
        Receiver<T> receiver;
        std::vector<std::shared_ptr<const Handler<T>>> handlers;
        mutable std::mutex handlersMtx;
        std::thread worker;

        explicit Lane(const char* name) : name(name) {
            auto [tx, rx] = makeChannel<T>();
            sender = std::move(tx);
            receiver = std::move(rx);
        }

        void add(Handler<T> handler) {
            auto shared = std::make_shared<const Handler<T>>(std::move(handler));
            std::lock_guard<std::mutex> lock(handlersMtx);
            handlers.push_back(std::move(shared));
        }

        size_t count() const {
            std::lock_guard<std::mutex> lock(handlersMtx);
            return handlers.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(handlersMtx);
            handlers.clear();
        }

        std::vector<std::shared_ptr<const Handler<T>>> snapshot() const {
            std::lock_guard<std::mutex> lock(handlersMtx);
            return handlers;
        }
    };

    template <typename T>
    void runLane(Lane<T>& lane);

    template <typename T>
    void startLane(Lane<T>& lane);

    template <typename T>
    void stopLane(Lane<T>& lane);

    template <typename T>
    void joinLane(Lane<T>& lane);

    std::shared_ptr<Logger> logger;
    Lane<UiEvent> ui{"ui"};
    Lane<ModelEvent> model{"model"};
    Lane<ApiEvent> api{"api"};

    mutable std::mutex lifecycleMtx;
    std::condition_variable lifecycleCv;
    bool running = false;
    bool stopped = false;
    bool shutdownDone = false;
};
