#pragma once

#include <ids/ids.hpp>
#include <shared_data/time_point.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace SharedData
{
    namespace UndoActions
    {
        /// Only the copies are known, not where they came from.
        struct CopyAction
        {
            std::vector<std::filesystem::path> copiedPaths;
        };
        /// originalPaths[i] was moved to newPaths[i].
        struct MoveAction
        {
            std::vector<std::filesystem::path> originalPaths;
            std::vector<std::filesystem::path> newPaths;
        };
        struct RenameAction
        {
            std::filesystem::path originalPath;
            std::filesystem::path newPath;
        };
        /// originalPaths[i] was moved to trashPaths[i].
        struct DeleteAction
        {
            std::vector<std::filesystem::path> originalPaths;
            std::vector<std::filesystem::path> trashPaths;
        };
    }

    /**
     * @brief The data needed to reverse one successfully finished operation.
     */
    struct UndoableOperation
    {
        using CopyAction = UndoActions::CopyAction;
        using MoveAction = UndoActions::MoveAction;
        using RenameAction = UndoActions::RenameAction;
        using DeleteAction = UndoActions::DeleteAction;
        using Action = std::variant<CopyAction, MoveAction, RenameAction, DeleteAction>;

        Ids::OperationId operationId;
        Action action;
        TimePoint timestamp{Clock::now()};

        static UndoableOperation copy(Ids::OperationId id, std::vector<std::filesystem::path> copiedPaths);
        static UndoableOperation
        move(Ids::OperationId id, std::vector<std::filesystem::path> originalPaths, std::vector<std::filesystem::path> newPaths);
        static UndoableOperation
        rename(Ids::OperationId id, std::filesystem::path originalPath, std::filesystem::path newPath);
        static UndoableOperation remove(
            Ids::OperationId id,
            std::vector<std::filesystem::path> originalPaths,
            std::vector<std::filesystem::path> trashPaths);

        /**
         * @brief Short text for menus, e.g. 'Copy "a.txt"' or 'Delete 3 items'.
         */
        std::string description() const;

        template <typename T>
        bool is() const
        {
            return std::holds_alternative<T>(action);
        }
    };

    void to_json(nlohmann::json& j, UndoableOperation const& operation);
}
