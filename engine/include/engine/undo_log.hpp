#pragma once

#include <shared_data/file_operations/undo_error.hpp>
#include <shared_data/file_operations/undoable_operation.hpp>

#include <cstddef>
#include <deque>
#include <expected>
#include <optional>
#include <string>

namespace Engine
{
    /**
     * @brief Bounded undo and redo history of finished operations.
     * Reversals act on the local file system directly.
     */
    class UndoLog
    {
      public:
        constexpr static std::size_t defaultMaxHistory = 50;

        explicit UndoLog(std::size_t maxHistory = defaultMaxHistory);

        /**
         * @brief Records a new action. Clears the redo history and drops the oldest entries beyond the bound.
         */
        void push(SharedData::UndoableOperation operation);

        bool canUndo() const;
        bool canRedo() const;
        std::optional<std::string> undoDescription() const;
        std::optional<std::string> redoDescription() const;

        /**
         * @brief Reverses the most recent operation and makes it redoable.
         * The entry is consumed even if the reversal fails.
         */
        std::expected<SharedData::UndoableOperation, SharedData::UndoError> undo();

        /**
         * @brief Applies the most recently undone operation again.
         * The entry is consumed even if this fails. Copies can never be redone.
         */
        std::expected<SharedData::UndoableOperation, SharedData::UndoError> redo();

        void clear();

        /// Oldest first.
        std::deque<SharedData::UndoableOperation> const& undoStack() const;
        std::deque<SharedData::UndoableOperation> const& redoStack() const;

        std::size_t maxHistory() const
        {
            return maxHistory_;
        }

      private:
        std::size_t maxHistory_;
        std::deque<SharedData::UndoableOperation> undoStack_{};
        std::deque<SharedData::UndoableOperation> redoStack_{};
    };
}
