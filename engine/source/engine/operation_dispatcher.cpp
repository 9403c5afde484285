#include <engine/operation_dispatcher.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <algorithm>

namespace Engine
{
    namespace Updates = SharedData::ProgressUpdates;

    OperationDispatcher::OperationDispatcher(
        Persistence::EngineOptions options,
        std::shared_ptr<IFileSystem> fileSystem,
        std::shared_ptr<ConflictResolver> conflictResolver)
        : options_{std::move(options)}
        , fileSystem_{fileSystem ? std::move(fileSystem) : std::make_shared<LocalFileSystem>()}
        , conflictResolver_{std::move(conflictResolver)}
    {
        options_.useDefaultsFrom(Persistence::EngineOptions::defaults());
    }

    OperationDispatcher::~OperationDispatcher()
    {
        waitForAll();
    }

    void OperationDispatcher::dispatch(OperationTicket ticket)
    {
        Log::debug("Dispatching operation {}.", ticket.id.value());
        std::scoped_lock lock{workersGuard_};
        reapFinishedLocked();

        auto done = std::make_shared<std::atomic_bool>(false);
        workers_.push_back(Worker{
            .thread = std::thread{[this, done, ticket = std::move(ticket)]() {
                run(ticket);
                done->store(true);
            }},
            .done = done,
        });
    }

    bool OperationDispatcher::dispatch(OperationManager const& manager, Ids::OperationId id)
    {
        auto ticket = manager.ticket(id);
        if (!ticket)
        {
            Log::warn("Cannot dispatch unknown operation {}.", id.value());
            return false;
        }
        dispatch(std::move(*ticket));
        return true;
    }

    void OperationDispatcher::waitForAll()
    {
        std::vector<Worker> workers;
        {
            std::scoped_lock lock{workersGuard_};
            workers.swap(workers_);
        }
        for (auto& worker : workers)
        {
            if (worker.thread.joinable())
                worker.thread.join();
        }
    }

    std::size_t OperationDispatcher::reapFinished()
    {
        std::scoped_lock lock{workersGuard_};
        return reapFinishedLocked();
    }

    std::size_t OperationDispatcher::reapFinishedLocked()
    {
        std::size_t joined = 0;
        for (auto& worker : workers_)
        {
            if (worker.done->load() && worker.thread.joinable())
            {
                worker.thread.join();
                ++joined;
            }
        }
        std::erase_if(workers_, [](Worker const& worker) {
            return !worker.thread.joinable();
        });
        return joined;
    }

    std::size_t OperationDispatcher::workerCount() const
    {
        std::scoped_lock lock{workersGuard_};
        return workers_.size();
    }

    SharedData::ErrorAction OperationDispatcher::fallbackAction() const
    {
        const auto action = options_.defaultErrorAction.value();
        // Retrying without anyone looking at the cause would never end.
        if (action == SharedData::ErrorAction::Retry)
            return SharedData::ErrorAction::Skip;
        return action;
    }

    SharedData::ErrorAction
    OperationDispatcher::decide(OperationTicket const& ticket, SharedData::OperationError const& error) const
    {
        if (!options_.interactiveErrors.value())
        {
            const auto action = fallbackAction();
            Log::warn(
                "Operation {}: {}. Continuing with {}.",
                ticket.id.value(),
                error.userMessage(),
                Utility::enumToString(action));
            return action;
        }

        // Answers given while no error was pending must not decide this one.
        ticket.errorResponses.drain();
        ticket.progress.send(Updates::Error{.operationId = ticket.id, .error = error});

        const auto deadline = std::chrono::steady_clock::now() + options_.errorResponseTimeout.value();
        while (true)
        {
            if (ticket.cancellationToken.isCancelled())
                return SharedData::ErrorAction::Cancel;

            const auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= std::chrono::steady_clock::duration::zero())
            {
                const auto action = fallbackAction();
                Log::warn(
                    "Operation {}: no decision about '{}' in time, continuing with {}.",
                    ticket.id.value(),
                    error.filePath.string(),
                    Utility::enumToString(action));
                return action;
            }

            const auto wait = std::min<std::chrono::steady_clock::duration>(remaining, decisionPollInterval);
            if (auto response = ticket.errorResponses.receiveFor(wait))
                return response->action;
        }
    }

    void OperationDispatcher::run(OperationTicket const& ticket)
    {
        try
        {
            if (ticket.type == SharedData::OperationType::Copy)
            {
                if (const auto totals = calculateTotalSize(ticket.sources, *fileSystem_))
                {
                    ticket.progress.send(Updates::TotalsCalculated{
                        .operationId = ticket.id,
                        .totalFiles = totals->files,
                        .totalBytes = totals->bytes,
                    });
                }
                else
                {
                    Log::warn(
                        "Operation {}: cannot compute totals: {}", ticket.id.value(), totals.error().toString());
                }
            }
            else
            {
                // Moves and deletes progress by top level entry.
                ticket.progress.send(Updates::TotalsCalculated{
                    .operationId = ticket.id,
                    .totalFiles = ticket.sources.size(),
                    .totalBytes = 0,
                });
            }

            const ExecutionOptions executionOptions{
                .fileSystem = fileSystem_,
                .onError =
                    [this, &ticket](SharedData::OperationError const& error) {
                        return decide(ticket, error);
                    },
                .conflictResolver = conflictResolver_,
                .chunkSize = options_.chunkSize.value(),
            };

            const auto result = [&]() {
                switch (ticket.type)
                {
                    case SharedData::OperationType::Move:
                        return executeMove(
                            ticket.sources,
                            ticket.destination.value_or(std::filesystem::path{}),
                            ticket.progress,
                            ticket.cancellationToken,
                            ticket.id,
                            executionOptions);
                    case SharedData::OperationType::Delete:
                        return executeDelete(
                            ticket.sources, ticket.progress, ticket.cancellationToken, ticket.id, executionOptions);
                    case SharedData::OperationType::Copy:
                    default:
                        return executeCopy(
                            ticket.sources,
                            ticket.destination.value_or(std::filesystem::path{}),
                            ticket.progress,
                            ticket.cancellationToken,
                            ticket.id,
                            executionOptions);
                }
            }();

            if (!result)
            {
                ticket.progress.send(Updates::Error{.operationId = ticket.id, .error = result.error()});
                ticket.progress.send(Updates::Failed{.operationId = ticket.id, .reason = result.error().userMessage()});
            }
        }
        catch (std::exception const& exc)
        {
            Log::error("Operation {}: worker failed: {}", ticket.id.value(), exc.what());
            ticket.progress.send(Updates::Failed{.operationId = ticket.id, .reason = exc.what()});
        }
    }
}
