#include <engine/conflict_resolver.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

namespace Engine
{
    ConflictResolver::ConflictResolver(Prompt prompt)
        : prompt_{std::move(prompt)}
    {}

    SharedData::ConflictResolution ConflictResolver::resolve(SharedData::ConflictInfo const& info)
    {
        {
            std::scoped_lock lock{mutex_};
            if (remembered_)
                return *remembered_;
        }

        const auto decision = prompt_(info);
        Log::debug(
            "Conflict at '{}' resolved as {}{}.",
            info.destination.string(),
            Utility::enumToString(decision.resolution),
            decision.applyToAll ? " for all remaining conflicts" : "");

        if (decision.applyToAll && decision.resolution != SharedData::ConflictResolution::Cancel)
        {
            std::scoped_lock lock{mutex_};
            remembered_ = decision.resolution;
        }
        return decision.resolution;
    }

    void ConflictResolver::reset()
    {
        std::scoped_lock lock{mutex_};
        remembered_ = std::nullopt;
    }

    std::optional<SharedData::ConflictResolution> ConflictResolver::rememberedResolution() const
    {
        std::scoped_lock lock{mutex_};
        return remembered_;
    }

    std::filesystem::path makeUniquePath(std::filesystem::path const& path, IFileSystem const& fileSystem)
    {
        const auto parent = path.parent_path();
        const auto stem = path.stem().string();
        const auto extension = path.extension().string();

        for (unsigned int counter = 1;; ++counter)
        {
            auto candidate = parent / fmt::format("{} ({}){}", stem, counter, extension);
            if (!fileSystem.exists(candidate))
                return candidate;
        }
    }

    SharedData::ConflictInfo makeConflictInfo(
        std::filesystem::path const& source,
        std::filesystem::path const& destination,
        IFileSystem const& fileSystem)
    {
        const auto sizeOf = [&fileSystem](std::filesystem::path const& path) -> std::uint64_t {
            if (fileSystem.isDirectory(path))
                return 0;
            return fileSystem.fileSize(path).value_or(0);
        };

        return SharedData::ConflictInfo{
            .source = source,
            .destination = destination,
            .sourceSize = sizeOf(source),
            .destinationSize = sizeOf(destination),
            .sourceModified = fileSystem.lastWriteTime(source),
            .destinationModified = fileSystem.lastWriteTime(destination),
        };
    }
}
