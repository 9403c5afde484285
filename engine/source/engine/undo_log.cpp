#include <engine/undo_log.hpp>
#include <log/log.hpp>
#include <utility/overloaded.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace Engine
{
    namespace
    {
        using SharedData::UndoError;
        using SharedData::UndoErrorType;
        using Paths = std::vector<std::filesystem::path>;
        using Result = std::expected<void, UndoError>;

        std::unexpected<UndoError> fileSystemError(std::string detail)
        {
            return std::unexpected(UndoError{.type = UndoErrorType::FileSystemError, .detail = std::move(detail)});
        }

        std::unexpected<UndoError> notReversible(std::string detail)
        {
            return std::unexpected(UndoError{.type = UndoErrorType::OperationNotReversible, .detail = std::move(detail)});
        }

        bool exists(std::filesystem::path const& path)
        {
            std::error_code ec;
            return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
        }

        Result createParent(std::filesystem::path const& path, std::string_view what)
        {
            const auto parent = path.parent_path();
            if (parent.empty())
                return {};

            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
                return fileSystemError(fmt::format("Failed to create {} '{}': {}", what, parent.string(), ec.message()));
            return {};
        }

        struct Relocation
        {
            std::string_view parentKind;
            // Formatted with the source path.
            std::string_view missingMessage;
            // Formatted with source path, target path and the error.
            std::string_view failureMessage;
        };

        /**
         * Renames each from[i] to to[i]. Stops at the first entry that cannot be moved.
         */
        Result relocateAll(Paths const& from, Paths const& to, Relocation const& relocation)
        {
            const auto count = std::min(from.size(), to.size());
            for (std::size_t i = 0; i < count; ++i)
            {
                if (!exists(from[i]))
                    return notReversible(fmt::format(fmt::runtime(relocation.missingMessage), from[i].string()));

                if (auto parent = createParent(to[i], relocation.parentKind); !parent)
                    return parent;

                std::error_code ec;
                std::filesystem::rename(from[i], to[i], ec);
                if (ec)
                {
                    return fileSystemError(fmt::format(
                        fmt::runtime(relocation.failureMessage), from[i].string(), to[i].string(), ec.message()));
                }
            }
            return {};
        }

        Result removeCopies(Paths const& copiedPaths)
        {
            for (auto const& path : copiedPaths)
            {
                if (!exists(path))
                    continue;

                std::error_code ec;
                const bool isDirectory = std::filesystem::is_directory(std::filesystem::symlink_status(path, ec));
                if (isDirectory)
                    std::filesystem::remove_all(path, ec);
                else
                    std::filesystem::remove(path, ec);

                if (ec)
                {
                    return fileSystemError(fmt::format(
                        "Failed to remove copied {} '{}': {}", isDirectory ? "directory" : "file", path.string(), ec.message()));
                }
            }
            return {};
        }

        Result reverse(SharedData::UndoableOperation const& operation)
        {
            return std::visit(
                Utility::overloaded{
                    [](SharedData::UndoableOperation::CopyAction const& copy) {
                        return removeCopies(copy.copiedPaths);
                    },
                    [](SharedData::UndoableOperation::MoveAction const& move) {
                        return relocateAll(
                            move.newPaths,
                            move.originalPaths,
                            {
                                .parentKind = "parent directory",
                                .missingMessage = "File '{}' no longer exists",
                                .failureMessage = "Failed to move '{}' back to '{}': {}",
                            });
                    },
                    [](SharedData::UndoableOperation::RenameAction const& rename) {
                        return relocateAll(
                            {rename.newPath},
                            {rename.originalPath},
                            {
                                .parentKind = "parent directory",
                                .missingMessage = "File '{}' no longer exists",
                                .failureMessage = "Failed to rename '{}' back to '{}': {}",
                            });
                    },
                    [](SharedData::UndoableOperation::DeleteAction const& remove) {
                        return relocateAll(
                            remove.trashPaths,
                            remove.originalPaths,
                            {
                                .parentKind = "parent directory",
                                .missingMessage = "File '{}' no longer exists in trash",
                                .failureMessage = "Failed to restore '{}' from trash to '{}': {}",
                            });
                    },
                },
                operation.action);
        }

        Result reapply(SharedData::UndoableOperation const& operation)
        {
            return std::visit(
                Utility::overloaded{
                    [](SharedData::UndoableOperation::CopyAction const&) -> Result {
                        // The copy sources are not recorded.
                        return notReversible("Copy operations cannot be redone after undo");
                    },
                    [](SharedData::UndoableOperation::MoveAction const& move) {
                        return relocateAll(
                            move.originalPaths,
                            move.newPaths,
                            {
                                .parentKind = "parent directory",
                                .missingMessage = "File '{}' no longer exists",
                                .failureMessage = "Failed to move '{}' to '{}': {}",
                            });
                    },
                    [](SharedData::UndoableOperation::RenameAction const& rename) {
                        return relocateAll(
                            {rename.originalPath},
                            {rename.newPath},
                            {
                                .parentKind = "parent directory",
                                .missingMessage = "File '{}' no longer exists",
                                .failureMessage = "Failed to rename '{}' to '{}': {}",
                            });
                    },
                    [](SharedData::UndoableOperation::DeleteAction const& remove) {
                        return relocateAll(
                            remove.originalPaths,
                            remove.trashPaths,
                            {
                                .parentKind = "trash directory",
                                .missingMessage = "File '{}' no longer exists",
                                .failureMessage = "Failed to move '{}' to trash at '{}': {}",
                            });
                    },
                },
                operation.action);
        }
    }

    UndoLog::UndoLog(std::size_t maxHistory)
        : maxHistory_{maxHistory}
    {}

    void UndoLog::push(SharedData::UndoableOperation operation)
    {
        redoStack_.clear();
        undoStack_.push_back(std::move(operation));
        while (undoStack_.size() > maxHistory_)
            undoStack_.pop_front();
    }

    bool UndoLog::canUndo() const
    {
        return !undoStack_.empty();
    }

    bool UndoLog::canRedo() const
    {
        return !redoStack_.empty();
    }

    std::optional<std::string> UndoLog::undoDescription() const
    {
        if (undoStack_.empty())
            return std::nullopt;
        return undoStack_.back().description();
    }

    std::optional<std::string> UndoLog::redoDescription() const
    {
        if (redoStack_.empty())
            return std::nullopt;
        return redoStack_.back().description();
    }

    std::expected<SharedData::UndoableOperation, SharedData::UndoError> UndoLog::undo()
    {
        if (undoStack_.empty())
            return std::unexpected(UndoError{.type = UndoErrorType::NothingToUndo});

        auto operation = std::move(undoStack_.back());
        undoStack_.pop_back();

        if (auto result = reverse(operation); !result)
        {
            Log::error("Undo of '{}' failed: {}", operation.description(), result.error().toString());
            return std::unexpected(std::move(result).error());
        }

        Log::info("Undid '{}'.", operation.description());
        redoStack_.push_back(operation);
        return operation;
    }

    std::expected<SharedData::UndoableOperation, SharedData::UndoError> UndoLog::redo()
    {
        if (redoStack_.empty())
            return std::unexpected(UndoError{.type = UndoErrorType::NothingToRedo});

        auto operation = std::move(redoStack_.back());
        redoStack_.pop_back();

        if (auto result = reapply(operation); !result)
        {
            Log::error("Redo of '{}' failed: {}", operation.description(), result.error().toString());
            return std::unexpected(std::move(result).error());
        }

        Log::info("Redid '{}'.", operation.description());
        undoStack_.push_back(operation);
        while (undoStack_.size() > maxHistory_)
            undoStack_.pop_front();
        return operation;
    }

    void UndoLog::clear()
    {
        undoStack_.clear();
        redoStack_.clear();
    }

    std::deque<SharedData::UndoableOperation> const& UndoLog::undoStack() const
    {
        return undoStack_;
    }

    std::deque<SharedData::UndoableOperation> const& UndoLog::redoStack() const
    {
        return redoStack_;
    }
}
