#include <shared_data/file_operations/file_operation.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    bool FileOperation::start()
    {
        if (!status.is<OperationStatus::Pending>())
            return false;
        status = OperationStatus::Running{};
        startedAt = Clock::now();
        return true;
    }

    bool FileOperation::pause()
    {
        if (!status.is<OperationStatus::Running>())
            return false;
        status = OperationStatus::Paused{};
        return true;
    }

    bool FileOperation::resume()
    {
        if (!status.is<OperationStatus::Paused>())
            return false;
        status = OperationStatus::Running{};
        return true;
    }

    bool FileOperation::complete()
    {
        return finish(OperationStatus::Completed{});
    }

    bool FileOperation::fail(std::string reason)
    {
        return finish(OperationStatus::Failed{.reason = std::move(reason)});
    }

    bool FileOperation::cancel()
    {
        return finish(OperationStatus::Cancelled{});
    }

    std::chrono::duration<double> FileOperation::elapsed() const
    {
        if (!startedAt)
            return std::chrono::duration<double>{0};
        const auto end = completedAt.value_or(Clock::now());
        if (end < *startedAt)
            return std::chrono::duration<double>{0};
        return end - *startedAt;
    }

    void to_json(nlohmann::json& j, FileOperation const& operation)
    {
        auto sources = nlohmann::json::array();
        for (auto const& source : operation.sources)
            sources.push_back(pathToJson(source));

        j = nlohmann::json{
            {"id", operation.id},
            {"type", Utility::enumToString(operation.type)},
            {"sources", sources},
            {"destination", pathToJson(operation.destination)},
            {"progress", operation.progress},
            {"status", operation.status.statusName()},
            {"startedAt", timePointToJson(operation.startedAt)},
            {"completedAt", timePointToJson(operation.completedAt)},
            {"skippedFiles", operation.errorState.skippedFiles},
            {"isPausedForError", operation.errorState.isPausedForError},
        };
        if (auto const* reason = operation.status.failureReason())
            j["failureReason"] = *reason;
        if (operation.currentError)
            j["currentError"] = *operation.currentError;
    }
}
