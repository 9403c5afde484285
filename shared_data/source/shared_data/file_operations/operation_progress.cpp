#include <shared_data/file_operations/operation_progress.hpp>

#include <algorithm>

namespace SharedData
{
    double OperationProgress::percentage() const
    {
        double ratio = 0.0;
        if (totalBytes == 0)
        {
            if (totalFiles == 0)
                return 100.0;
            ratio = static_cast<double>(completedFiles) / static_cast<double>(totalFiles);
        }
        else
        {
            ratio = static_cast<double>(transferredBytes) / static_cast<double>(totalBytes);
        }
        return std::clamp(ratio * 100.0, 0.0, 100.0);
    }

    void OperationProgress::updateSpeed(std::uint64_t bytesTransferred, std::chrono::duration<double> elapsed)
    {
        if (elapsed.count() <= 0.0)
            return;

        speedBytesPerSecond = static_cast<std::uint64_t>(static_cast<double>(bytesTransferred) / elapsed.count());

        const auto remainingBytes = totalBytes > transferredBytes ? totalBytes - transferredBytes : 0;
        if (speedBytesPerSecond > 0)
            estimatedRemaining = std::chrono::seconds{remainingBytes / speedBytesPerSecond};
    }

    void to_json(nlohmann::json& j, OperationProgress const& progress)
    {
        j = nlohmann::json{
            {"totalBytes", progress.totalBytes},
            {"transferredBytes", progress.transferredBytes},
            {"totalFiles", progress.totalFiles},
            {"completedFiles", progress.completedFiles},
            {"speedBytesPerSecond", progress.speedBytesPerSecond},
            {"estimatedRemainingSeconds", progress.estimatedRemaining.count()},
            {"percentage", progress.percentage()},
        };
        if (progress.currentFile)
            j["currentFile"] = *progress.currentFile;
    }
}
