#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/time_point.hpp>
#include <utility/describe.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(ConflictResolution, Skip, Replace, KeepBoth, Cancel)

    struct ConflictDecision
    {
        ConflictResolution resolution{ConflictResolution::Skip};
        /// Answer every further conflict of the same batch the same way.
        bool applyToAll{false};
    };

    /**
     * @brief Describes a destination that already exists when a copy or move wants to write it.
     */
    struct ConflictInfo
    {
        std::filesystem::path source{};
        std::filesystem::path destination{};
        std::uint64_t sourceSize{0};
        std::uint64_t destinationSize{0};
        std::optional<TimePoint> sourceModified{std::nullopt};
        std::optional<TimePoint> destinationModified{std::nullopt};
    };
}
