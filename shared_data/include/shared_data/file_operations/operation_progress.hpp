#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace SharedData
{
    struct OperationProgress
    {
        std::uint64_t totalBytes{0};
        std::uint64_t transferredBytes{0};
        std::uint64_t totalFiles{0};
        std::uint64_t completedFiles{0};
        std::optional<std::string> currentFile{std::nullopt};
        std::uint64_t speedBytesPerSecond{0};
        std::chrono::seconds estimatedRemaining{0};

        /**
         * @brief Completion in percent, always within [0, 100].
         * Uses bytes when a byte total is known, the file count otherwise.
         * An operation without any files or bytes is complete.
         */
        double percentage() const;

        /**
         * @brief Recomputes speed and remaining time.
         *
         * @param bytesTransferred Bytes moved since the operation started.
         * @param elapsed Time since the operation started. Nothing changes if it is zero.
         */
        void updateSpeed(std::uint64_t bytesTransferred, std::chrono::duration<double> elapsed);
    };

    void to_json(nlohmann::json& j, OperationProgress const& progress);
}
