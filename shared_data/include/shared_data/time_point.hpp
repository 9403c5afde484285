#pragma once

#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/chrono.h>

#include <chrono>
#include <optional>

namespace SharedData
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    inline void to_json(nlohmann::json& j, TimePoint const& tp)
    {
        j = fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::time_point_cast<std::chrono::seconds>(tp));
    }

    inline nlohmann::json timePointToJson(std::optional<TimePoint> const& tp)
    {
        if (!tp)
            return nullptr;
        nlohmann::json j;
        SharedData::to_json(j, *tp);
        return j;
    }
}

// Inject into STD for ADL:
namespace std::chrono
{
    inline void to_json(nlohmann::json& j, time_point<system_clock> const& tp)
    {
        SharedData::to_json(j, tp);
    }
}
