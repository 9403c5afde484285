#pragma once

#include <utility/algorithm/case_convert.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <spdlog/common.h>

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    BOOST_DEFINE_ENUM_CLASS(Level, Trace, Debug, Info, Warning, Error, Critical, Off)

    namespace Detail
    {
        constexpr std::array<std::pair<Level, spdlog::level::level_enum>, 7> spdlogLevels{{
            {Level::Trace, spdlog::level::trace},
            {Level::Debug, spdlog::level::debug},
            {Level::Info, spdlog::level::info},
            {Level::Warning, spdlog::level::warn},
            {Level::Error, spdlog::level::err},
            {Level::Critical, spdlog::level::critical},
            {Level::Off, spdlog::level::off},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        for (auto const& [ours, theirs] : Detail::spdlogLevels)
        {
            if (ours == level)
                return theirs;
        }
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        for (auto const& [ours, theirs] : Detail::spdlogLevels)
        {
            if (theirs == level)
                return ours;
        }
        return Level::Info;
    }

    /**
     * @brief Parses a level name case insensitively. Besides the full names spdlog's short forms "warn" and "err"
     * are understood.
     *
     * @return std::nullopt for an unknown name.
     */
    inline std::optional<Level> tryLevelFromString(std::string_view name)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(name);
        if (lowered == "off")
            return Level::Off;

        // spdlog maps every name it does not know to off.
        const auto parsed = spdlog::level::from_str(lowered);
        if (parsed == spdlog::level::off)
            return std::nullopt;
        return fromSpdlogLevel(parsed);
    }

    inline Level levelFromString(std::string_view name)
    {
        if (const auto level = tryLevelFromString(name))
            return *level;
        throw std::invalid_argument("Unknown log level: " + std::string{name});
    }

    inline std::string levelToString(Level level)
    {
        return Utility::Algorithm::toLowerCase(Utility::enumToString(level));
    }
}
