#pragma once

#include <ids/ids.hpp>
#include <shared_data/file_operations/operation_error.hpp>
#include <shared_data/file_operations/undoable_operation.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace SharedData
{
    /**
     * @brief Events a worker sends to the owner of the operation records.
     * Every event names the operation it belongs to.
     */
    namespace ProgressUpdates
    {
        struct Started
        {
            Ids::OperationId operationId;
        };
        /// Sizes computed before any byte is moved.
        struct TotalsCalculated
        {
            Ids::OperationId operationId;
            std::uint64_t totalFiles;
            std::uint64_t totalBytes;
        };
        struct FileStarted
        {
            Ids::OperationId operationId;
            std::string file;
        };
        struct BytesTransferred
        {
            Ids::OperationId operationId;
            std::uint64_t bytes;
        };
        struct FileCompleted
        {
            Ids::OperationId operationId;
        };
        /// A file was left out after an error or a conflict.
        struct FileSkipped
        {
            Ids::OperationId operationId;
            std::string file;
        };
        struct Error
        {
            Ids::OperationId operationId;
            OperationError error;
        };
        struct Completed
        {
            Ids::OperationId operationId;
            /// How to reverse the operation, if anything was placed that can be reverted.
            std::optional<UndoableOperation> undoable{std::nullopt};
        };
        struct Cancelled
        {
            Ids::OperationId operationId;
        };
        struct Failed
        {
            Ids::OperationId operationId;
            std::string reason;
        };
    }

    using ProgressUpdate = std::variant<
        ProgressUpdates::Started,
        ProgressUpdates::TotalsCalculated,
        ProgressUpdates::FileStarted,
        ProgressUpdates::BytesTransferred,
        ProgressUpdates::FileCompleted,
        ProgressUpdates::FileSkipped,
        ProgressUpdates::Error,
        ProgressUpdates::Completed,
        ProgressUpdates::Cancelled,
        ProgressUpdates::Failed>;

    inline Ids::OperationId operationIdOf(ProgressUpdate const& update)
    {
        return std::visit(
            [](auto const& event) {
                return event.operationId;
            },
            update);
    }
}
