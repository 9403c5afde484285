#pragma once

#include <async/cancellation_token.hpp>
#include <async/mailbox.hpp>
#include <engine/undo_log.hpp>
#include <ids/ids.hpp>
#include <persistence/engine_options.hpp>
#include <shared_data/file_operations/error_action.hpp>
#include <shared_data/file_operations/file_operation.hpp>
#include <shared_data/file_operations/progress_update.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Engine
{
    /**
     * @brief Everything a worker needs to execute one queued operation.
     */
    struct OperationTicket
    {
        Ids::OperationId id;
        SharedData::OperationType type;
        std::vector<std::filesystem::path> sources;
        std::optional<std::filesystem::path> destination;
        Async::Sender<SharedData::ProgressUpdate> progress;
        Async::CancellationToken cancellationToken;
        Async::Receiver<SharedData::ErrorResponse> errorResponses;
    };

    /**
     * @brief Owns all operation records, their cancellation tokens and the undo history.
     * Not thread safe, the host serializes calls. Workers only talk to it through the progress mailbox.
     */
    class OperationManager
    {
      public:
        explicit OperationManager(Persistence::EngineOptions options = Persistence::EngineOptions::defaults());
        ~OperationManager() = default;
        OperationManager(OperationManager const&) = delete;
        OperationManager& operator=(OperationManager const&) = delete;
        OperationManager(OperationManager&&) = default;
        OperationManager& operator=(OperationManager&&) = default;

        /**
         * @brief Queues operations. Nothing touches the file system until a worker runs the ticket.
         *
         * @return The id of the new pending operation.
         */
        Ids::OperationId copy(std::vector<std::filesystem::path> sources, std::filesystem::path destination);
        Ids::OperationId moveFiles(std::vector<std::filesystem::path> sources, std::filesystem::path destination);
        Ids::OperationId deleteFiles(std::vector<std::filesystem::path> sources);

        /**
         * @brief Hands out what a worker needs for an operation.
         *
         * @return std::nullopt if the operation is unknown or already pruned.
         */
        std::optional<OperationTicket> ticket(Ids::OperationId id) const;

        /**
         * @brief Sender for progress events of any operation of this manager.
         */
        Async::Sender<SharedData::ProgressUpdate> progressSender() const;

        /**
         * @brief Requests cancellation and marks the record cancelled. Does nothing for finished operations.
         */
        void cancel(Ids::OperationId id);

        /**
         * @brief Removes the current error of an operation.
         */
        void clearError(Ids::OperationId id);

        /**
         * @brief Applies a user decision about the current error and forwards it to the waiting worker.
         * Cancelling an operation that waits on an unrecoverable error fails it instead.
         */
        void handleErrorResponse(Ids::OperationId id, SharedData::ErrorAction action);

        /**
         * @brief Applies all progress events that are queued right now. Never blocks.
         *
         * @return The number of events applied.
         */
        std::size_t processUpdates();

        /**
         * @brief Applies a single progress event to its record. Events for unknown operations are dropped.
         */
        void applyUpdate(SharedData::ProgressUpdate const& update);

        /**
         * @brief Removes finished operations that completed more than maxAge ago.
         *
         * @return The number of removed operations.
         */
        std::size_t cleanupCompleted(std::chrono::milliseconds maxAge);
        std::size_t cleanupCompleted();

        /// Ordered by id.
        std::vector<SharedData::FileOperation> operations() const;
        SharedData::FileOperation const* operation(Ids::OperationId id) const;
        std::vector<SharedData::FileOperation> activeOperations() const;
        bool hasActiveOperations() const;
        std::size_t activeCount() const;
        bool isPausedForError(Ids::OperationId id) const;
        std::optional<Async::CancellationToken> cancellationToken(Ids::OperationId id) const;

        /**
         * @brief Read only view of all operations and the undo state for observers.
         */
        nlohmann::json snapshot() const;

        void pushUndoable(SharedData::UndoableOperation operation);
        bool canUndo() const;
        bool canRedo() const;
        std::optional<std::string> undoDescription() const;
        std::optional<std::string> redoDescription() const;
        std::expected<SharedData::UndoableOperation, SharedData::UndoError> undo();
        std::expected<SharedData::UndoableOperation, SharedData::UndoError> redo();
        void clearHistory();
        std::deque<SharedData::UndoableOperation> const& undoStack() const;
        std::deque<SharedData::UndoableOperation> const& redoStack() const;

        Persistence::EngineOptions const& options() const
        {
            return options_;
        }

      private:
        struct Entry
        {
            SharedData::FileOperation record;
            Async::CancellationToken cancellationToken;
            Async::Sender<SharedData::ErrorResponse> responseSender;
            Async::Receiver<SharedData::ErrorResponse> responseReceiver;
        };

        OperationManager(
            Persistence::EngineOptions options,
            std::pair<Async::Sender<SharedData::ProgressUpdate>, Async::Receiver<SharedData::ProgressUpdate>> mailbox);

        Ids::OperationId enqueue(
            SharedData::OperationType type,
            std::vector<std::filesystem::path> sources,
            std::optional<std::filesystem::path> destination);

        SharedData::FileOperation* find(Ids::OperationId id);

      private:
        Persistence::EngineOptions options_;
        Ids::OperationIdAllocator idAllocator_{};
        std::map<Ids::OperationId, Entry> entries_{};
        Async::Sender<SharedData::ProgressUpdate> progressSender_;
        Async::Receiver<SharedData::ProgressUpdate> progressReceiver_;
        UndoLog undoLog_;
    };
}
