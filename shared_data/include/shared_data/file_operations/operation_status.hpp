#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace SharedData
{
    namespace OperationStatuses
    {
        struct Pending
        {};
        struct Running
        {};
        struct Paused
        {};
        struct Completed
        {};
        struct Failed
        {
            std::string reason;
        };
        struct Cancelled
        {};
    }

    /**
     * @brief Lifecycle of an operation:
     * Pending -> Running -> {Completed, Failed, Cancelled}, with Running <-> Paused in between.
     */
    class OperationStatus
    {
      public:
        using Pending = OperationStatuses::Pending;
        using Running = OperationStatuses::Running;
        using Paused = OperationStatuses::Paused;
        using Completed = OperationStatuses::Completed;
        using Failed = OperationStatuses::Failed;
        using Cancelled = OperationStatuses::Cancelled;
        using Variant = std::variant<Pending, Running, Paused, Completed, Failed, Cancelled>;

        OperationStatus() = default;
        template <typename T>
        requires std::is_constructible_v<Variant, T>
        OperationStatus(T&& state)
            : state_{std::forward<T>(state)}
        {}

        template <typename T>
        bool is() const
        {
            return std::holds_alternative<T>(state_);
        }

        /**
         * @brief Pending, Running or Paused.
         */
        bool isActive() const
        {
            return is<Pending>() || is<Running>() || is<Paused>();
        }

        /**
         * @brief Completed, Failed or Cancelled. No transition leaves these.
         */
        bool isFinished() const
        {
            return !isActive();
        }

        std::string statusName() const;

        /**
         * @brief The failure reason if the status is Failed.
         */
        std::string const* failureReason() const
        {
            if (auto const* failed = std::get_if<Failed>(&state_))
                return &failed->reason;
            return nullptr;
        }

        Variant const& state() const
        {
            return state_;
        }

      private:
        Variant state_{Pending{}};
    };
}
