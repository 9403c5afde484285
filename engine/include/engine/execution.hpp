#pragma once

#include <async/cancellation_token.hpp>
#include <async/mailbox.hpp>
#include <engine/conflict_resolver.hpp>
#include <engine/file_system.hpp>
#include <ids/ids.hpp>
#include <shared_data/file_operations/error_action.hpp>
#include <shared_data/file_operations/operation_error.hpp>
#include <shared_data/file_operations/progress_update.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace Engine
{
    using ProgressSender = Async::Sender<SharedData::ProgressUpdate>;

    /**
     * @brief Decides how to go on after a failed file system step. Called on the executing thread.
     */
    using ErrorHandler = std::function<SharedData::ErrorAction(SharedData::OperationError const&)>;

    constexpr std::size_t defaultChunkSize = 64 * 1024;

    struct ExecutionOptions
    {
        std::shared_ptr<IFileSystem> fileSystem{std::make_shared<LocalFileSystem>()};

        /// Without a handler the first error ends the routine and is returned.
        ErrorHandler onError{};

        /// Without a resolver existing destinations are overwritten.
        std::shared_ptr<ConflictResolver> conflictResolver{};

        std::size_t chunkSize{defaultChunkSize};
    };

    struct ExecutionSummary
    {
        /// Top level sources that were handled completely, in order.
        std::vector<std::filesystem::path> sources{};
        /// Where sources[i] ended up. Empty for deletes.
        std::vector<std::filesystem::path> destinations{};
        std::vector<std::filesystem::path> skipped{};
        bool cancelled{false};
    };

    struct TotalSize
    {
        std::uint64_t files{0};
        std::uint64_t bytes{0};
    };

    /**
     * @brief Copies every source into the destination directory.
     * Emits Started first and either Completed or Cancelled last, unless an error ends the routine.
     */
    std::expected<ExecutionSummary, SharedData::OperationError> executeCopy(
        std::vector<std::filesystem::path> const& sources,
        std::filesystem::path const& destination,
        ProgressSender const& progress,
        Async::CancellationToken const& cancellationToken,
        Ids::OperationId id,
        ExecutionOptions const& options = {});

    /**
     * @brief Moves every source into the destination directory. Renames where possible and falls back to copy and
     * remove across file systems.
     */
    std::expected<ExecutionSummary, SharedData::OperationError> executeMove(
        std::vector<std::filesystem::path> const& sources,
        std::filesystem::path const& destination,
        ProgressSender const& progress,
        Async::CancellationToken const& cancellationToken,
        Ids::OperationId id,
        ExecutionOptions const& options = {});

    /**
     * @brief Permanently removes every source, directories recursively.
     */
    std::expected<ExecutionSummary, SharedData::OperationError> executeDelete(
        std::vector<std::filesystem::path> const& sources,
        ProgressSender const& progress,
        Async::CancellationToken const& cancellationToken,
        Ids::OperationId id,
        ExecutionOptions const& options = {});

    /**
     * @brief Counts the regular files and their bytes below sources. Sources that do not exist are ignored.
     */
    std::expected<TotalSize, SharedData::OperationError>
    calculateTotalSize(std::vector<std::filesystem::path> const& sources, IFileSystem const& fileSystem);
}
