#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace Async
{
    namespace Detail
    {
        template <typename T>
        struct MailboxState
        {
            std::mutex mutex{};
            std::condition_variable available{};
            std::deque<T> messages{};
        };
    }

    /**
     * @brief Sending end of a mailbox. Copies may be handed to any number of threads.
     */
    template <typename T>
    class Sender
    {
      public:
        explicit Sender(std::shared_ptr<Detail::MailboxState<T>> state)
            : state_{std::move(state)}
        {}

        /**
         * @brief Enqueues a message. Never blocks on the receiver, the queue is unbounded.
         */
        void send(T message) const
        {
            {
                std::scoped_lock lock{state_->mutex};
                state_->messages.push_back(std::move(message));
            }
            state_->available.notify_one();
        }

      private:
        std::shared_ptr<Detail::MailboxState<T>> state_;
    };

    /**
     * @brief Receiving end of a mailbox. Meant to be used by one consumer.
     */
    template <typename T>
    class Receiver
    {
      public:
        explicit Receiver(std::shared_ptr<Detail::MailboxState<T>> state)
            : state_{std::move(state)}
        {}

        std::optional<T> tryReceive() const
        {
            std::scoped_lock lock{state_->mutex};
            return popFront();
        }

        /**
         * @brief Waits at most timeout for a message.
         *
         * @return std::nullopt if nothing arrived in time.
         */
        template <typename Rep, typename Period>
        std::optional<T> receiveFor(std::chrono::duration<Rep, Period> const& timeout) const
        {
            std::unique_lock lock{state_->mutex};
            state_->available.wait_for(lock, timeout, [this]() {
                return !state_->messages.empty();
            });
            return popFront();
        }

        /**
         * @brief Takes everything that is currently queued, oldest first.
         */
        std::vector<T> drain() const
        {
            std::vector<T> result;
            std::scoped_lock lock{state_->mutex};
            result.reserve(state_->messages.size());
            for (auto& message : state_->messages)
                result.push_back(std::move(message));
            state_->messages.clear();
            return result;
        }

        bool empty() const
        {
            std::scoped_lock lock{state_->mutex};
            return state_->messages.empty();
        }

      private:
        // Requires the mutex to be held.
        std::optional<T> popFront() const
        {
            if (state_->messages.empty())
                return std::nullopt;
            std::optional<T> message{std::move(state_->messages.front())};
            state_->messages.pop_front();
            return message;
        }

      private:
        std::shared_ptr<Detail::MailboxState<T>> state_;
    };

    template <typename T>
    std::pair<Sender<T>, Receiver<T>> makeMailbox()
    {
        auto state = std::make_shared<Detail::MailboxState<T>>();
        return {Sender<T>{state}, Receiver<T>{state}};
    }
}
