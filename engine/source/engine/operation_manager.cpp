#include <engine/operation_manager.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/format_bytes.hpp>
#include <utility/overloaded.hpp>

namespace Engine
{
    namespace Updates = SharedData::ProgressUpdates;

    namespace
    {
        /**
         * The worker went on without an answer from the user, so the pending prompt is obsolete.
         */
        void dropUnansweredError(SharedData::FileOperation& record)
        {
            if (!record.errorState.isPausedForError)
                return;
            Log::info("Operation {}: continued without a decision about the pending error.", record.id.value());
            record.currentError = std::nullopt;
            record.errorState.isPausedForError = false;
            record.resume();
        }
    }

    OperationManager::OperationManager(Persistence::EngineOptions options)
        : OperationManager{std::move(options), Async::makeMailbox<SharedData::ProgressUpdate>()}
    {}

    OperationManager::OperationManager(
        Persistence::EngineOptions options,
        std::pair<Async::Sender<SharedData::ProgressUpdate>, Async::Receiver<SharedData::ProgressUpdate>> mailbox)
        : options_{[&options]() {
            options.useDefaultsFrom(Persistence::EngineOptions::defaults());
            return std::move(options);
        }()}
        , progressSender_{std::move(mailbox.first)}
        , progressReceiver_{std::move(mailbox.second)}
        , undoLog_{options_.maxUndoHistory.value()}
    {}

    Ids::OperationId OperationManager::enqueue(
        SharedData::OperationType type,
        std::vector<std::filesystem::path> sources,
        std::optional<std::filesystem::path> destination)
    {
        const auto id = idAllocator_.next();
        auto [responseSender, responseReceiver] = Async::makeMailbox<SharedData::ErrorResponse>();

        Log::info(
            "Queued operation {}: {} {} item(s){}.",
            id.value(),
            Utility::enumToString(type),
            sources.size(),
            destination ? " to '" + destination->string() + "'" : std::string{});

        entries_.emplace(
            id,
            Entry{
                .record =
                    SharedData::FileOperation{
                        .id = id,
                        .type = type,
                        .sources = std::move(sources),
                        .destination = std::move(destination),
                    },
                .cancellationToken = Async::CancellationToken{},
                .responseSender = std::move(responseSender),
                .responseReceiver = std::move(responseReceiver),
            });
        return id;
    }

    Ids::OperationId OperationManager::copy(std::vector<std::filesystem::path> sources, std::filesystem::path destination)
    {
        return enqueue(SharedData::OperationType::Copy, std::move(sources), std::move(destination));
    }

    Ids::OperationId
    OperationManager::moveFiles(std::vector<std::filesystem::path> sources, std::filesystem::path destination)
    {
        return enqueue(SharedData::OperationType::Move, std::move(sources), std::move(destination));
    }

    Ids::OperationId OperationManager::deleteFiles(std::vector<std::filesystem::path> sources)
    {
        return enqueue(SharedData::OperationType::Delete, std::move(sources), std::nullopt);
    }

    std::optional<OperationTicket> OperationManager::ticket(Ids::OperationId id) const
    {
        const auto iter = entries_.find(id);
        if (iter == entries_.end())
            return std::nullopt;

        auto const& entry = iter->second;
        return OperationTicket{
            .id = id,
            .type = entry.record.type,
            .sources = entry.record.sources,
            .destination = entry.record.destination,
            .progress = progressSender_,
            .cancellationToken = entry.cancellationToken,
            .errorResponses = entry.responseReceiver,
        };
    }

    Async::Sender<SharedData::ProgressUpdate> OperationManager::progressSender() const
    {
        return progressSender_;
    }

    SharedData::FileOperation* OperationManager::find(Ids::OperationId id)
    {
        const auto iter = entries_.find(id);
        if (iter == entries_.end())
            return nullptr;
        return &iter->second.record;
    }

    void OperationManager::cancel(Ids::OperationId id)
    {
        const auto iter = entries_.find(id);
        if (iter == entries_.end())
            return;

        iter->second.cancellationToken.cancel();
        if (iter->second.record.cancel())
            Log::info("Cancelled operation {}.", id.value());
    }

    void OperationManager::clearError(Ids::OperationId id)
    {
        if (auto* record = find(id))
        {
            record->currentError = std::nullopt;
            record->errorState.isPausedForError = false;
        }
    }

    void OperationManager::handleErrorResponse(Ids::OperationId id, SharedData::ErrorAction action)
    {
        const auto iter = entries_.find(id);
        if (iter == entries_.end())
        {
            Log::warn("Error response for unknown operation {}.", id.value());
            return;
        }

        auto& entry = iter->second;
        auto& record = entry.record;
        if (!record.errorState.isPausedForError)
        {
            Log::warn(
                "Operation {}: ignoring {} response, no error is pending.", id.value(), Utility::enumToString(action));
            return;
        }
        Log::info("Operation {}: user chose {}.", id.value(), Utility::enumToString(action));

        entry.responseSender.send(SharedData::ErrorResponse{.operationId = id, .action = action});
        record.errorState.lastResponse = action;

        switch (action)
        {
            case SharedData::ErrorAction::Skip:
            case SharedData::ErrorAction::Retry:
            {
                clearError(id);
                record.resume();
                break;
            }
            case SharedData::ErrorAction::Cancel:
            {
                if (record.currentError && !record.currentError->isRecoverable)
                {
                    entry.cancellationToken.cancel();
                    record.errorState.isPausedForError = false;
                    if (record.fail(record.currentError->userMessage()))
                        Log::info("Operation {} failed: {}", id.value(), record.currentError->userMessage());
                    break;
                }
                record.errorState.isPausedForError = false;
                cancel(id);
                break;
            }
        }
    }

    std::size_t OperationManager::processUpdates()
    {
        const auto updates = progressReceiver_.drain();
        for (auto const& update : updates)
            applyUpdate(update);
        return updates.size();
    }

    void OperationManager::applyUpdate(SharedData::ProgressUpdate const& update)
    {
        auto* record = find(SharedData::operationIdOf(update));
        if (record == nullptr)
            return;

        std::visit(
            Utility::overloaded{
                [record](Updates::Started const&) {
                    record->start();
                },
                [record](Updates::TotalsCalculated const& totals) {
                    record->progress.totalFiles = totals.totalFiles;
                    record->progress.totalBytes = totals.totalBytes;
                },
                [record](Updates::FileStarted const& started) {
                    record->progress.currentFile = started.file;
                },
                [record](Updates::BytesTransferred const& transferred) {
                    auto& progress = record->progress;
                    progress.transferredBytes += transferred.bytes;
                    // Retried files report their bytes again.
                    if (progress.totalBytes > 0 && progress.transferredBytes > progress.totalBytes)
                        progress.transferredBytes = progress.totalBytes;
                    progress.updateSpeed(progress.transferredBytes, record->elapsed());
                },
                [record](Updates::FileCompleted const&) {
                    auto& progress = record->progress;
                    if (progress.totalFiles == 0 || progress.completedFiles < progress.totalFiles)
                        ++progress.completedFiles;
                    progress.currentFile = std::nullopt;
                },
                [record](Updates::FileSkipped const& skipped) {
                    dropUnansweredError(*record);
                    record->errorState.skippedFiles.push_back(skipped.file);
                    record->progress.currentFile = std::nullopt;
                },
                [record](Updates::Error const& error) {
                    record->currentError = error.error;
                    record->errorState.isPausedForError = true;
                    record->pause();
                },
                [this, record](Updates::Completed const& completed) {
                    if (!record->complete())
                        return;
                    record->currentError = std::nullopt;
                    record->errorState.isPausedForError = false;
                    Log::info(
                        "Operation {} completed, {} transferred, {} file(s) skipped.",
                        record->id.value(),
                        Utility::formatBytes(record->progress.transferredBytes),
                        record->errorState.skippedCount());
                    if (completed.undoable && options_.recordUndoHistory.value())
                        undoLog_.push(*completed.undoable);
                },
                [record](Updates::Cancelled const&) {
                    if (record->cancel())
                        record->errorState.isPausedForError = false;
                },
                [record](Updates::Failed const& failed) {
                    if (record->fail(failed.reason))
                        Log::error("Operation {} failed: {}", record->id.value(), failed.reason);
                },
            },
            update);
    }

    std::size_t OperationManager::cleanupCompleted(std::chrono::milliseconds maxAge)
    {
        const auto now = SharedData::Clock::now();
        return std::erase_if(entries_, [now, maxAge](auto const& item) {
            auto const& record = item.second.record;
            return record.status.isFinished() && record.completedAt && now - *record.completedAt >= maxAge;
        });
    }

    std::size_t OperationManager::cleanupCompleted()
    {
        return cleanupCompleted(options_.completedRetention.value());
    }

    std::vector<SharedData::FileOperation> OperationManager::operations() const
    {
        std::vector<SharedData::FileOperation> result;
        result.reserve(entries_.size());
        for (auto const& [id, entry] : entries_)
            result.push_back(entry.record);
        return result;
    }

    SharedData::FileOperation const* OperationManager::operation(Ids::OperationId id) const
    {
        const auto iter = entries_.find(id);
        if (iter == entries_.end())
            return nullptr;
        return &iter->second.record;
    }

    std::vector<SharedData::FileOperation> OperationManager::activeOperations() const
    {
        std::vector<SharedData::FileOperation> result;
        for (auto const& [id, entry] : entries_)
        {
            if (entry.record.status.isActive())
                result.push_back(entry.record);
        }
        return result;
    }

    bool OperationManager::hasActiveOperations() const
    {
        return activeCount() > 0;
    }

    std::size_t OperationManager::activeCount() const
    {
        std::size_t count = 0;
        for (auto const& [id, entry] : entries_)
        {
            if (entry.record.status.isActive())
                ++count;
        }
        return count;
    }

    bool OperationManager::isPausedForError(Ids::OperationId id) const
    {
        auto const* record = operation(id);
        return record != nullptr && record->errorState.isPausedForError;
    }

    std::optional<Async::CancellationToken> OperationManager::cancellationToken(Ids::OperationId id) const
    {
        const auto iter = entries_.find(id);
        if (iter == entries_.end())
            return std::nullopt;
        return iter->second.cancellationToken;
    }

    nlohmann::json OperationManager::snapshot() const
    {
        auto operationList = nlohmann::json::array();
        for (auto const& [id, entry] : entries_)
            operationList.push_back(entry.record);

        const auto descriptionJson = [](std::optional<std::string> const& description) -> nlohmann::json {
            if (!description)
                return nullptr;
            return *description;
        };

        return nlohmann::json{
            {"operations", operationList},
            {"activeCount", activeCount()},
            {"canUndo", canUndo()},
            {"canRedo", canRedo()},
            {"undoDescription", descriptionJson(undoDescription())},
            {"redoDescription", descriptionJson(redoDescription())},
        };
    }

    void OperationManager::pushUndoable(SharedData::UndoableOperation operation)
    {
        undoLog_.push(std::move(operation));
    }

    bool OperationManager::canUndo() const
    {
        return undoLog_.canUndo();
    }

    bool OperationManager::canRedo() const
    {
        return undoLog_.canRedo();
    }

    std::optional<std::string> OperationManager::undoDescription() const
    {
        return undoLog_.undoDescription();
    }

    std::optional<std::string> OperationManager::redoDescription() const
    {
        return undoLog_.redoDescription();
    }

    std::expected<SharedData::UndoableOperation, SharedData::UndoError> OperationManager::undo()
    {
        return undoLog_.undo();
    }

    std::expected<SharedData::UndoableOperation, SharedData::UndoError> OperationManager::redo()
    {
        return undoLog_.redo();
    }

    void OperationManager::clearHistory()
    {
        undoLog_.clear();
    }

    std::deque<SharedData::UndoableOperation> const& OperationManager::undoStack() const
    {
        return undoLog_.undoStack();
    }

    std::deque<SharedData::UndoableOperation> const& OperationManager::redoStack() const
    {
        return undoLog_.redoStack();
    }
}
