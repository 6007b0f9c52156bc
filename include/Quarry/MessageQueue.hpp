// include/Quarry/MessageQueue.hpp
#ifndef QUARRY_MESSAGE_QUEUE_HPP
#define QUARRY_MESSAGE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace Quarry {

    // Unbounded multi-producer, multi-consumer FIFO.
    template <typename T>
    class MessageQueue {
    public:
        void push(T message) {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_messages.push(std::move(message));
            }
            m_condition.notify_one();
        }

        // Blocks until a message is available
        T pop() {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this] { return !m_messages.empty(); });
            return take();
        }

        template <typename Rep, typename Period>
        std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_condition.wait_for(lock, timeout, [this] { return !m_messages.empty(); })) {
                return std::nullopt;
            }
            return take();
        }

        std::optional<T> tryPop() {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_messages.empty()) {
                return std::nullopt;
            }
            return take();
        }

        bool empty() const {
            std::unique_lock<std::mutex> lock(m_mutex);
            return m_messages.empty();
        }

    private:
        T take() {
            T message = std::move(m_messages.front());
            m_messages.pop();
            return message;
        }

        std::queue<T> m_messages;
        mutable std::mutex m_mutex;
        std::condition_variable m_condition;
    };

} // namespace Quarry

#endif // QUARRY_MESSAGE_QUEUE_HPP
