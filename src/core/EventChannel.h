#pragma once
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace detail {

template <typename T>
struct ChannelState {
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<T> queue;
    bool receiverClosed = false;
    bool sendersGone = false;

    void disconnectSenders() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            sendersGone = true;
        }
        cv.notify_all();
    }
};

// 所有 Sender 副本共享同一个 token; 最后一个副本析构时通知接收端
template <typename T>
struct SenderToken {
    std::shared_ptr<ChannelState<T>> state;
    explicit SenderToken(std::shared_ptr<ChannelState<T>> s) : state(std::move(s)) {}
    ~SenderToken() { state->disconnectSenders(); }
    SenderToken(const SenderToken&) = delete;
    SenderToken& operator=(const SenderToken&) = delete;
};

} // namespace detail

template <typename T> class Sender;
template <typename T> class Receiver;
template <typename T> std::pair<Sender<T>, Receiver<T>> makeChannel();

/**
 * @brief 无界通道的发送端, 可拷贝, 线程安全
 */
template <typename T>
class Sender {
public:
    Sender() = default;

    /**
     * @return 接收端已关闭 (通道关闭) 时返回 false, 事件被丢弃
     */
    bool send(T value) const {
        if (!token) return false;
        auto& state = *token->state;
        {
            std::lock_guard<std::mutex> lock(state.mtx);
            if (state.receiverClosed) {
                return false;
            }
            state.queue.push_back(std::move(value));
        }
        state.cv.notify_one();
        return true;
    }

    bool isClosed() const {
        if (!token) return true;
        std::lock_guard<std::mutex> lock(token->state->mtx);
        return token->state->receiverClosed;
    }

private:
    friend std::pair<Sender<T>, Receiver<T>> makeChannel<T>();

    explicit Sender(std::shared_ptr<detail::SenderToken<T>> token) : token(std::move(token)) {}

    std::shared_ptr<detail::SenderToken<T>> token;
};

/**
 * @brief 无界通道的接收端, 只能移动; 析构即关闭通道
 */
template <typename T>
class Receiver {
public:
    Receiver() = default;
    ~Receiver() { close(); }

    Receiver(Receiver&& other) noexcept : state(std::move(other.state)) {}
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state = std::move(other.state);
        }
        return *this;
    }
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    /**
     * @brief 阻塞等待下一个事件
     * @return 通道已关闭, 或所有发送端都已析构且队列为空时返回 std::nullopt
     */
    std::optional<T> recv() {
        if (!state) return std::nullopt;
        std::unique_lock<std::mutex> lock(state->mtx);
        state->cv.wait(lock, [this] {
            return state->receiverClosed || state->sendersGone || !state->queue.empty();
        });
        if (state->receiverClosed || state->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state->queue.front());
        state->queue.pop_front();
        return value;
    }

    std::optional<T> tryRecv() {
        if (!state) return std::nullopt;
        std::lock_guard<std::mutex> lock(state->mtx);
        if (state->receiverClosed || state->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state->queue.front());
        state->queue.pop_front();
        return value;
    }

    /**
     * @brief 关闭通道: 唤醒阻塞中的 recv(), 之后 send() 返回 false; 未取走的事件被丢弃
     */
    void close() {
        if (!state) return;
        {
            std::lock_guard<std::mutex> lock(state->mtx);
            state->receiverClosed = true;
            state->queue.clear();
        }
        state->cv.notify_all();
    }

private:
    friend std::pair<Sender<T>, Receiver<T>> makeChannel<T>();

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state(std::move(state)) {}

    std::shared_ptr<detail::ChannelState<T>> state;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    auto token = std::make_shared<detail::SenderToken<T>>(state);
    return {Sender<T>(std::move(token)), Receiver<T>(std::move(state))};
}
