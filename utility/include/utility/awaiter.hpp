#pragma once

#include <atomic>
#include <chrono>
#include <future>

namespace Utility
{
    /**
     * @brief Becomes ready once arrive() has been called maxCount times. Mostly useful in tests to wait for
     * something that happens on another thread.
     */
    class Awaiter
    {
      public:
        explicit Awaiter(int maxCount = 1)
            : maxCount_{maxCount}
            , future_{promise_.get_future().share()}
        {}

        bool waitFor(std::chrono::milliseconds const& duration = std::chrono::seconds{1}) const
        {
            return future_.wait_for(duration) == std::future_status::ready;
        }

        void wait() const
        {
            future_.wait();
        }

        void arrive()
        {
            if (++counter_ == maxCount_)
                promise_.set_value();
        }

        int arrivals() const
        {
            return counter_.load();
        }

      private:
        const int maxCount_;
        std::atomic_int counter_{0};
        std::promise<void> promise_{};
        std::shared_future<void> future_;
    };
}
