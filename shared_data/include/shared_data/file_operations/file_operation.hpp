#pragma once

#include <ids/ids.hpp>
#include <shared_data/file_operations/error_action.hpp>
#include <shared_data/file_operations/operation_error.hpp>
#include <shared_data/file_operations/operation_progress.hpp>
#include <shared_data/file_operations/operation_status.hpp>
#include <shared_data/file_operations/operation_type.hpp>
#include <shared_data/time_point.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief State of one queued, running or finished operation.
     */
    struct FileOperation
    {
        Ids::OperationId id;
        OperationType type;
        std::vector<std::filesystem::path> sources{};
        /// Absent for Delete.
        std::optional<std::filesystem::path> destination{std::nullopt};
        OperationProgress progress{};
        OperationStatus status{};
        std::optional<TimePoint> startedAt{std::nullopt};
        std::optional<TimePoint> completedAt{std::nullopt};
        std::optional<OperationError> currentError{std::nullopt};
        ErrorHandlingState errorState{};

        /**
         * @brief Pending -> Running. Records the start time.
         *
         * @return false if the operation was not pending.
         */
        bool start();

        /**
         * @brief Running -> Paused.
         */
        bool pause();

        /**
         * @brief Paused -> Running.
         */
        bool resume();

        /**
         * @brief Moves an active operation into its terminal state and records the completion time.
         * All of these return false and change nothing if the operation is already finished.
         */
        bool complete();
        bool fail(std::string reason);
        bool cancel();

        /**
         * @brief Time between start and completion, or until now while still running.
         */
        std::chrono::duration<double> elapsed() const;

      private:
        template <typename State>
        bool finish(State&& state)
        {
            if (status.isFinished())
                return false;
            status = std::forward<State>(state);
            completedAt = Clock::now();
            return true;
        }
    };

    void to_json(nlohmann::json& j, FileOperation const& operation);
}
