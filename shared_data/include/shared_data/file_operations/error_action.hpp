#pragma once

#include <ids/ids.hpp>
#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(ErrorAction, Skip, Retry, Cancel)

    /**
     * @brief A user decision about the error an operation is waiting on.
     */
    struct ErrorResponse
    {
        Ids::OperationId operationId;
        ErrorAction action;
    };

    /**
     * @brief Error bookkeeping of one operation.
     */
    struct ErrorHandlingState
    {
        bool isPausedForError{false};
        std::optional<ErrorAction> lastResponse{std::nullopt};
        std::vector<std::string> skippedFiles{};

        std::size_t skippedCount() const
        {
            return skippedFiles.size();
        }
    };
}
