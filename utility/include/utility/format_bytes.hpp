#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>

namespace Utility
{
    enum class OrderOfMagnitude
    {
        None = 0,
        Kilo,
        Mega,
        Giga,
        Tera
    };

    inline OrderOfMagnitude determineOrderOfMagnitude(std::uint64_t value)
    {
        if (value < 1024ull)
            return OrderOfMagnitude::None;
        else if (value < 1024ull * 1024)
            return OrderOfMagnitude::Kilo;
        else if (value < 1024ull * 1024 * 1024)
            return OrderOfMagnitude::Mega;
        else if (value < 1024ull * 1024 * 1024 * 1024)
            return OrderOfMagnitude::Giga;
        else
            return OrderOfMagnitude::Tera;
    }

    inline std::string formatBytes(std::uint64_t value, OrderOfMagnitude magnitude)
    {
        switch (magnitude)
        {
            case OrderOfMagnitude::None:
                return fmt::format("{} B", value);
            case OrderOfMagnitude::Kilo:
                return fmt::format("{:.2f} KB", value / 1024.0);
            case OrderOfMagnitude::Mega:
                return fmt::format("{:.2f} MB", value / (1024.0 * 1024.0));
            case OrderOfMagnitude::Giga:
                return fmt::format("{:.2f} GB", value / (1024.0 * 1024.0 * 1024.0));
            case OrderOfMagnitude::Tera:
                return fmt::format("{:.2f} TB", value / (1024.0 * 1024.0 * 1024.0 * 1024.0));
        }
        return std::string{};
    }

    inline std::string formatBytes(std::uint64_t value)
    {
        return formatBytes(value, determineOrderOfMagnitude(value));
    }
}
