#pragma once

#include <nlohmann/json.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace SharedData
{
    template <typename EnumT, typename EnumDescription = boost::describe::describe_enumerators<EnumT>>
    void to_json(nlohmann::json& j, EnumT const& e)
    {
        j = Utility::enumToString<EnumT>(e);
    }
    template <typename EnumT, typename EnumDescription = boost::describe::describe_enumerators<EnumT>>
    void from_json(nlohmann::json const& j, EnumT& e)
    {
        e = Utility::enumFromString<EnumT>(j.template get<std::string>());
    }

    inline nlohmann::json pathToJson(std::filesystem::path const& path)
    {
        return path.generic_string();
    }

    inline nlohmann::json pathToJson(std::optional<std::filesystem::path> const& path)
    {
        if (!path)
            return nullptr;
        return path->generic_string();
    }
}
