#include <engine/execution.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <span>
#include <string>
#include <utility>

namespace Engine
{
    namespace
    {
        using SharedData::OperationError;
        namespace Updates = SharedData::ProgressUpdates;

        enum class StepOutcome
        {
            Done,
            Skipped,
            Cancelled
        };
        using Step = std::expected<StepOutcome, OperationError>;

        std::unexpected<OperationError> failure(std::filesystem::path const& path, std::error_code const& ec)
        {
            return std::unexpected(OperationError::fromErrorCode(path, ec));
        }

        std::string displayName(std::filesystem::path const& path)
        {
            auto name = path.filename().string();
            if (name.empty())
                return path.string();
            return name;
        }

        IFileSystem& fileSystemOf(ExecutionOptions const& options)
        {
            static LocalFileSystem localFileSystem{};
            if (options.fileSystem)
                return *options.fileSystem;
            return localFileSystem;
        }

        /**
         * Does the work of one routine invocation. Holds the per call state that the free functions share.
         */
        class Executor
        {
          public:
            Executor(
                Ids::OperationId id,
                ProgressSender const& progress,
                Async::CancellationToken const& cancellationToken,
                ExecutionOptions const& options)
                : id_{id}
                , progress_{progress}
                , cancellationToken_{cancellationToken}
                , fileSystem_{fileSystemOf(options)}
                , onError_{options.onError ? &options.onError : nullptr}
                , conflictResolver_{options.conflictResolver.get()}
                , chunkSize_{std::max<std::size_t>(options.chunkSize, 1)}
                , reportFiles_{true}
            {}

            std::expected<ExecutionSummary, OperationError>
            copy(std::vector<std::filesystem::path> const& sources, std::filesystem::path const& destination)
            {
                return placeAll(sources, destination, [this](auto const& source, auto const& target) {
                    return copyEntry(source, target);
                });
            }

            std::expected<ExecutionSummary, OperationError>
            move(std::vector<std::filesystem::path> const& sources, std::filesystem::path const& destination)
            {
                isMove_ = true;
                return placeAll(sources, destination, [this](auto const& source, auto const& target) {
                    emitFileStarted(source);
                    auto step = handled(source, [&]() {
                        return moveEntry(source, target);
                    });
                    if (step && *step == StepOutcome::Done)
                        emitFileCompleted();
                    return step;
                });
            }

            std::expected<ExecutionSummary, OperationError> remove(std::vector<std::filesystem::path> const& sources)
            {
                emit(Updates::Started{.operationId = id_});

                ExecutionSummary summary{};
                for (auto const& source : sources)
                {
                    if (cancellationToken_.isCancelled())
                        return finishCancelled(std::move(summary));

                    emitFileStarted(source);
                    auto step = handled(source, [&]() -> Step {
                        const auto ec = fileSystem_.isDirectory(source) ? fileSystem_.removeAll(source)
                                                                        : fileSystem_.removeFile(source);
                        if (ec)
                            return failure(source, ec);
                        return StepOutcome::Done;
                    });
                    if (!step)
                        return std::unexpected(std::move(step).error());
                    if (*step == StepOutcome::Cancelled)
                        return finishCancelled(std::move(summary));
                    if (*step == StepOutcome::Done)
                    {
                        emitFileCompleted();
                        summary.sources.push_back(source);
                    }
                }

                summary.skipped = skipped_;
                emit(Updates::Completed{.operationId = id_});
                return summary;
            }

          private:
            // Moves through the fallback path do not report files of their own, the move around them does.
            static Executor silentCopyOf(Executor const& other)
            {
                Executor silent{other};
                silent.onError_ = nullptr;
                silent.conflictResolver_ = nullptr;
                silent.reportFiles_ = false;
                silent.skipped_.clear();
                return silent;
            }

            template <typename Event>
            void emit(Event&& event) const
            {
                progress_.send(SharedData::ProgressUpdate{std::forward<Event>(event)});
            }

            void emitFileStarted(std::filesystem::path const& source) const
            {
                if (reportFiles_)
                    emit(Updates::FileStarted{.operationId = id_, .file = displayName(source)});
            }

            void emitFileCompleted() const
            {
                if (reportFiles_)
                    emit(Updates::FileCompleted{.operationId = id_});
            }

            ExecutionSummary finishCancelled(ExecutionSummary summary) const
            {
                Log::info("Operation {} was cancelled.", id_.value());
                summary.cancelled = true;
                summary.skipped = skipped_;
                emit(Updates::Cancelled{.operationId = id_});
                return summary;
            }

            /**
             * Runs attempt until it succeeds, or until the error handler decides to skip or cancel.
             * Without an error handler the first error is returned.
             */
            template <typename Attempt>
            Step handled(std::filesystem::path const& subject, Attempt&& attempt)
            {
                while (true)
                {
                    Step result = attempt();
                    if (result)
                        return result;

                    Log::error("Operation {}: {}", id_.value(), result.error().toString());
                    if (onError_ == nullptr)
                        return result;

                    switch ((*onError_)(result.error()))
                    {
                        case SharedData::ErrorAction::Retry:
                        {
                            if (cancellationToken_.isCancelled())
                                return StepOutcome::Cancelled;
                            Log::info("Operation {}: retrying '{}'.", id_.value(), subject.string());
                            continue;
                        }
                        case SharedData::ErrorAction::Skip:
                        {
                            Log::info("Operation {}: skipping '{}'.", id_.value(), subject.string());
                            skipped_.push_back(subject);
                            emit(Updates::FileSkipped{.operationId = id_, .file = subject.string()});
                            return StepOutcome::Skipped;
                        }
                        case SharedData::ErrorAction::Cancel:
                            return StepOutcome::Cancelled;
                    }
                    return result;
                }
            }

            template <typename PlaceOne>
            std::expected<ExecutionSummary, OperationError> placeAll(
                std::vector<std::filesystem::path> const& sources,
                std::filesystem::path const& destination,
                PlaceOne&& placeOne)
            {
                emit(Updates::Started{.operationId = id_});

                ExecutionSummary summary{};
                for (auto const& source : sources)
                {
                    if (cancellationToken_.isCancelled())
                        return finishCancelled(std::move(summary));

                    auto target = destination / source.filename();
                    auto prepared = prepareDestination(source, target);
                    if (!prepared)
                        return std::unexpected(std::move(prepared).error());
                    if (*prepared == StepOutcome::Cancelled)
                        return finishCancelled(std::move(summary));
                    if (*prepared == StepOutcome::Skipped)
                        continue;

                    auto step = placeOne(source, target);
                    if (!step)
                        return std::unexpected(std::move(step).error());
                    if (*step == StepOutcome::Cancelled)
                        return finishCancelled(std::move(summary));
                    if (*step == StepOutcome::Done)
                    {
                        summary.sources.push_back(source);
                        summary.destinations.push_back(target);
                    }
                }

                summary.skipped = skipped_;
                emit(Updates::Completed{.operationId = id_, .undoable = undoableOf(summary)});
                return summary;
            }

            std::optional<SharedData::UndoableOperation> undoableOf(ExecutionSummary const& summary) const
            {
                if (summary.destinations.empty())
                    return std::nullopt;
                if (isMove_)
                    return SharedData::UndoableOperation::move(id_, summary.sources, summary.destinations);
                return SharedData::UndoableOperation::copy(id_, summary.destinations);
            }

            /**
             * Asks the conflict resolver about an existing target. Keep both redirects target.
             * Without a resolver only a copy onto its own source is redirected, the same way.
             */
            Step prepareDestination(std::filesystem::path const& source, std::filesystem::path& target)
            {
                const bool ontoItself = source.lexically_normal() == target.lexically_normal();
                if (conflictResolver_ == nullptr)
                {
                    // Writing the target would truncate the source before it is read.
                    if (ontoItself && !isMove_)
                    {
                        target = makeUniquePath(target, fileSystem_);
                        Log::warn(
                            "Operation {}: '{}' is its own destination, copying to '{}'.",
                            id_.value(),
                            source.string(),
                            target.string());
                    }
                    return StepOutcome::Done;
                }
                if (!fileSystem_.exists(target))
                    return StepOutcome::Done;

                auto resolution = conflictResolver_->resolve(makeConflictInfo(source, target, fileSystem_));
                if (resolution == SharedData::ConflictResolution::Replace && ontoItself)
                {
                    Log::warn("Operation {}: '{}' cannot replace itself, keeping both.", id_.value(), source.string());
                    resolution = SharedData::ConflictResolution::KeepBoth;
                }

                switch (resolution)
                {
                    case SharedData::ConflictResolution::Skip:
                    {
                        skipped_.push_back(source);
                        emit(Updates::FileSkipped{.operationId = id_, .file = source.string()});
                        return StepOutcome::Skipped;
                    }
                    case SharedData::ConflictResolution::Replace:
                    {
                        return handled(target, [&]() -> Step {
                            if (const auto ec = fileSystem_.removeAll(target))
                                return failure(target, ec);
                            return StepOutcome::Done;
                        });
                    }
                    case SharedData::ConflictResolution::KeepBoth:
                    {
                        target = makeUniquePath(target, fileSystem_);
                        return StepOutcome::Done;
                    }
                    case SharedData::ConflictResolution::Cancel:
                        return StepOutcome::Cancelled;
                }
                return StepOutcome::Done;
            }

            Step copyEntry(std::filesystem::path const& source, std::filesystem::path const& target)
            {
                if (cancellationToken_.isCancelled())
                    return StepOutcome::Cancelled;

                if (!fileSystem_.isDirectory(source))
                {
                    emitFileStarted(source);
                    auto step = handled(source, [&]() {
                        return copyFileContents(source, target);
                    });
                    if (step && *step == StepOutcome::Done)
                        emitFileCompleted();
                    return step;
                }

                // Listing before creating the target keeps a copy into the source itself finite.
                std::vector<std::filesystem::path> children;
                auto prepared = handled(source, [&]() -> Step {
                    auto listed = fileSystem_.listDirectory(source);
                    if (!listed)
                        return failure(source, listed.error());
                    if (const auto ec = fileSystem_.createDirectories(target))
                        return failure(target, ec);
                    children = std::move(*listed);
                    return StepOutcome::Done;
                });
                if (!prepared || *prepared != StepOutcome::Done)
                    return prepared;

                for (auto const& child : children)
                {
                    auto step = copyEntry(child, target / child.filename());
                    if (!step || *step == StepOutcome::Cancelled)
                        return step;
                }
                return StepOutcome::Done;
            }

            /**
             * Streams one file in chunks. A failed or cancelled copy removes what it wrote.
             */
            Step copyFileContents(std::filesystem::path const& source, std::filesystem::path const& target)
            {
                auto reader = fileSystem_.openForReading(source);
                if (!reader)
                    return failure(source, reader.error());
                auto writer = fileSystem_.openForWriting(target);
                if (!writer)
                    return failure(target, writer.error());

                const auto discard = [&]() {
                    writer->reset();
                    if (const auto ec = fileSystem_.removeFile(target))
                        Log::warn("Could not remove partial file '{}': {}", target.string(), ec.message());
                };

                std::vector<char> buffer(chunkSize_);
                while (true)
                {
                    if (cancellationToken_.isCancelled())
                    {
                        discard();
                        return StepOutcome::Cancelled;
                    }

                    const auto amount = (*reader)->read(buffer);
                    if (!amount)
                    {
                        discard();
                        return failure(source, amount.error());
                    }
                    if (*amount == 0)
                        break;

                    if (const auto ec = (*writer)->write(std::span<char const>{buffer.data(), *amount}))
                    {
                        discard();
                        return failure(target, ec);
                    }
                    emit(Updates::BytesTransferred{.operationId = id_, .bytes = *amount});
                }

                if (const auto ec = (*writer)->close())
                {
                    discard();
                    return failure(target, ec);
                }
                return StepOutcome::Done;
            }

            /**
             * Renames, or copies and removes the source when the rename crosses file systems.
             * The source stays in place unless the copy succeeded completely.
             */
            Step moveEntry(std::filesystem::path const& source, std::filesystem::path const& target)
            {
                const auto renameError = fileSystem_.rename(source, target);
                if (!renameError)
                    return StepOutcome::Done;
                if (renameError != std::errc::cross_device_link)
                    return failure(source, renameError);

                Log::debug(
                    "Operation {}: '{}' and '{}' are on different file systems, copying instead.",
                    id_.value(),
                    source.string(),
                    target.string());

                const bool targetExisted = fileSystem_.exists(target);
                auto fallback = silentCopyOf(*this);
                auto copied = fallback.copyEntry(source, target);
                if (!copied || *copied != StepOutcome::Done)
                {
                    if (!targetExisted)
                    {
                        if (const auto ec = fileSystem_.removeAll(target))
                            Log::warn("Could not remove partial copy '{}': {}", target.string(), ec.message());
                    }
                    return copied;
                }

                const auto removeError =
                    fileSystem_.isDirectory(source) ? fileSystem_.removeAll(source) : fileSystem_.removeFile(source);
                if (removeError)
                    return failure(source, removeError);
                return StepOutcome::Done;
            }

          private:
            Ids::OperationId id_;
            ProgressSender const& progress_;
            Async::CancellationToken const& cancellationToken_;
            IFileSystem& fileSystem_;
            ErrorHandler const* onError_;
            ConflictResolver* conflictResolver_;
            std::size_t chunkSize_;
            bool reportFiles_;
            bool isMove_{false};
            std::vector<std::filesystem::path> skipped_{};
        };

        std::expected<void, OperationError>
        accumulateSize(std::filesystem::path const& path, IFileSystem const& fileSystem, TotalSize& total)
        {
            if (fileSystem.isDirectory(path))
            {
                auto children = fileSystem.listDirectory(path);
                if (!children)
                    return failure(path, children.error());
                for (auto const& child : *children)
                {
                    if (auto result = accumulateSize(child, fileSystem, total); !result)
                        return result;
                }
                return {};
            }

            const auto size = fileSystem.fileSize(path);
            if (!size)
                return failure(path, size.error());
            ++total.files;
            total.bytes += *size;
            return {};
        }
    }

    std::expected<ExecutionSummary, SharedData::OperationError> executeCopy(
        std::vector<std::filesystem::path> const& sources,
        std::filesystem::path const& destination,
        ProgressSender const& progress,
        Async::CancellationToken const& cancellationToken,
        Ids::OperationId id,
        ExecutionOptions const& options)
    {
        Executor executor{id, progress, cancellationToken, options};
        return executor.copy(sources, destination);
    }

    std::expected<ExecutionSummary, SharedData::OperationError> executeMove(
        std::vector<std::filesystem::path> const& sources,
        std::filesystem::path const& destination,
        ProgressSender const& progress,
        Async::CancellationToken const& cancellationToken,
        Ids::OperationId id,
        ExecutionOptions const& options)
    {
        Executor executor{id, progress, cancellationToken, options};
        return executor.move(sources, destination);
    }

    std::expected<ExecutionSummary, SharedData::OperationError> executeDelete(
        std::vector<std::filesystem::path> const& sources,
        ProgressSender const& progress,
        Async::CancellationToken const& cancellationToken,
        Ids::OperationId id,
        ExecutionOptions const& options)
    {
        Executor executor{id, progress, cancellationToken, options};
        return executor.remove(sources);
    }

    std::expected<TotalSize, SharedData::OperationError>
    calculateTotalSize(std::vector<std::filesystem::path> const& sources, IFileSystem const& fileSystem)
    {
        TotalSize total{};
        for (auto const& source : sources)
        {
            if (!fileSystem.exists(source))
                continue;
            if (auto result = accumulateSize(source, fileSystem, total); !result)
                return std::unexpected(std::move(result).error());
        }
        return total;
    }
}
