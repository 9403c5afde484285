#pragma once

#include <atomic>
#include <memory>

namespace Async
{
    /**
     * @brief A shared flag to cooperatively stop work running elsewhere.
     * Copies refer to the same flag.
     */
    class CancellationToken
    {
      public:
        CancellationToken()
            : cancelled_{std::make_shared<std::atomic_bool>(false)}
        {}

        void cancel()
        {
            cancelled_->store(true);
        }

        bool isCancelled() const
        {
            return cancelled_->load();
        }

        /**
         * @brief Returns true if both tokens refer to the same flag.
         */
        bool sharesStateWith(CancellationToken const& other) const
        {
            return cancelled_ == other.cancelled_;
        }

      private:
        std::shared_ptr<std::atomic_bool> cancelled_;
    };
}
