#pragma once

#include <engine/conflict_resolver.hpp>
#include <engine/execution.hpp>
#include <engine/file_system.hpp>
#include <engine/operation_manager.hpp>
#include <persistence/engine_options.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace Engine
{
    /**
     * @brief Runs every dispatched operation on a thread of its own.
     * Workers report through the ticket only, they never touch the manager.
     */
    class OperationDispatcher
    {
      public:
        constexpr static std::chrono::milliseconds decisionPollInterval{50};

        explicit OperationDispatcher(
            Persistence::EngineOptions options = Persistence::EngineOptions::defaults(),
            std::shared_ptr<IFileSystem> fileSystem = std::make_shared<LocalFileSystem>(),
            std::shared_ptr<ConflictResolver> conflictResolver = {});
        ~OperationDispatcher();
        OperationDispatcher(OperationDispatcher const&) = delete;
        OperationDispatcher& operator=(OperationDispatcher const&) = delete;
        OperationDispatcher(OperationDispatcher&&) = delete;
        OperationDispatcher& operator=(OperationDispatcher&&) = delete;

        /**
         * @brief Starts a worker for the ticket. Workers that have finished in the meantime are joined first.
         */
        void dispatch(OperationTicket ticket);

        /**
         * @brief Starts a worker for a queued operation of the manager.
         *
         * @return false if the manager does not know the operation.
         */
        bool dispatch(OperationManager const& manager, Ids::OperationId id);

        /**
         * @brief Blocks until every worker dispatched so far has finished.
         */
        void waitForAll();

        /**
         * @brief Joins the workers that are done without waiting for the others.
         *
         * @return The number of joined workers.
         */
        std::size_t reapFinished();

        std::size_t workerCount() const;

      private:
        struct Worker
        {
            std::thread thread;
            std::shared_ptr<std::atomic_bool> done;
        };

        std::size_t reapFinishedLocked();

        void run(OperationTicket const& ticket);

        /**
         * @brief Answers an error hook call of a worker. In interactive mode the error is published and the worker
         * waits for the user, the cancellation token or the timeout, whatever comes first.
         */
        SharedData::ErrorAction decide(OperationTicket const& ticket, SharedData::OperationError const& error) const;

        SharedData::ErrorAction fallbackAction() const;

      private:
        Persistence::EngineOptions options_;
        std::shared_ptr<IFileSystem> fileSystem_;
        std::shared_ptr<ConflictResolver> conflictResolver_;
        mutable std::mutex workersGuard_{};
        std::vector<Worker> workers_{};
    };
}
