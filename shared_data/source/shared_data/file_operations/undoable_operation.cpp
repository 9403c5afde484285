#include <shared_data/file_operations/undoable_operation.hpp>
#include <shared_data/shared_data.hpp>
#include <utility/overloaded.hpp>

#include <fmt/format.h>

#include <string_view>

namespace SharedData
{
    namespace
    {
        std::string describeBatch(std::string_view verb, std::vector<std::filesystem::path> const& paths)
        {
            if (paths.size() == 1)
                return fmt::format("{} \"{}\"", verb, paths.front().filename().string());
            return fmt::format("{} {} items", verb, paths.size());
        }

        nlohmann::json pathsToJson(std::vector<std::filesystem::path> const& paths)
        {
            auto result = nlohmann::json::array();
            for (auto const& path : paths)
                result.push_back(pathToJson(path));
            return result;
        }
    }

    UndoableOperation UndoableOperation::copy(Ids::OperationId id, std::vector<std::filesystem::path> copiedPaths)
    {
        return UndoableOperation{
            .operationId = id,
            .action = CopyAction{.copiedPaths = std::move(copiedPaths)},
        };
    }

    UndoableOperation UndoableOperation::move(
        Ids::OperationId id,
        std::vector<std::filesystem::path> originalPaths,
        std::vector<std::filesystem::path> newPaths)
    {
        return UndoableOperation{
            .operationId = id,
            .action = MoveAction{.originalPaths = std::move(originalPaths), .newPaths = std::move(newPaths)},
        };
    }

    UndoableOperation
    UndoableOperation::rename(Ids::OperationId id, std::filesystem::path originalPath, std::filesystem::path newPath)
    {
        return UndoableOperation{
            .operationId = id,
            .action = RenameAction{.originalPath = std::move(originalPath), .newPath = std::move(newPath)},
        };
    }

    UndoableOperation UndoableOperation::remove(
        Ids::OperationId id,
        std::vector<std::filesystem::path> originalPaths,
        std::vector<std::filesystem::path> trashPaths)
    {
        return UndoableOperation{
            .operationId = id,
            .action = DeleteAction{.originalPaths = std::move(originalPaths), .trashPaths = std::move(trashPaths)},
        };
    }

    std::string UndoableOperation::description() const
    {
        return std::visit(
            Utility::overloaded{
                [](CopyAction const& copy) {
                    return describeBatch("Copy", copy.copiedPaths);
                },
                [](MoveAction const& move) {
                    return describeBatch("Move", move.originalPaths);
                },
                [](RenameAction const& rename) {
                    return fmt::format(
                        "Rename \"{}\" to \"{}\"",
                        rename.originalPath.filename().string(),
                        rename.newPath.filename().string());
                },
                [](DeleteAction const& remove) {
                    return describeBatch("Delete", remove.originalPaths);
                },
            },
            action);
    }

    void to_json(nlohmann::json& j, UndoableOperation const& operation)
    {
        j = nlohmann::json{
            {"operationId", operation.operationId},
            {"description", operation.description()},
            {"timestamp", operation.timestamp},
        };
        std::visit(
            Utility::overloaded{
                [&j](CopyAction const& copy) {
                    j["type"] = "Copy";
                    j["copiedPaths"] = pathsToJson(copy.copiedPaths);
                },
                [&j](MoveAction const& move) {
                    j["type"] = "Move";
                    j["originalPaths"] = pathsToJson(move.originalPaths);
                    j["newPaths"] = pathsToJson(move.newPaths);
                },
                [&j](RenameAction const& rename) {
                    j["type"] = "Rename";
                    j["originalPath"] = pathToJson(rename.originalPath);
                    j["newPath"] = pathToJson(rename.newPath);
                },
                [&j](DeleteAction const& remove) {
                    j["type"] = "Delete";
                    j["originalPaths"] = pathsToJson(remove.originalPaths);
                    j["trashPaths"] = pathsToJson(remove.trashPaths);
                },
            },
            operation.action);
    }
}
