#pragma once

#include <engine/file_system.hpp>
#include <shared_data/file_operations/conflict.hpp>

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>

namespace Engine
{
    /**
     * @brief Decides what happens to destinations that already exist.
     * Asks a prompt per conflict until the prompt answers with applyToAll, that answer is then reused for the rest
     * of the batch.
     */
    class ConflictResolver
    {
      public:
        using Prompt = std::function<SharedData::ConflictDecision(SharedData::ConflictInfo const&)>;

        explicit ConflictResolver(Prompt prompt);

        /**
         * @brief Resolves one conflict. May be called from worker threads, the prompt is called without holding
         * any lock.
         */
        SharedData::ConflictResolution resolve(SharedData::ConflictInfo const& info);

        /**
         * @brief Forgets a remembered apply-to-all answer.
         */
        void reset();

        std::optional<SharedData::ConflictResolution> rememberedResolution() const;

      private:
        Prompt prompt_;
        mutable std::mutex mutex_{};
        std::optional<SharedData::ConflictResolution> remembered_{std::nullopt};
    };

    /**
     * @brief Produces "name (n).ext" next to path, with the lowest n that is not taken.
     */
    std::filesystem::path makeUniquePath(std::filesystem::path const& path, IFileSystem const& fileSystem);

    SharedData::ConflictInfo makeConflictInfo(
        std::filesystem::path const& source,
        std::filesystem::path const& destination,
        IFileSystem const& fileSystem);
}
