#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <type_traits>

namespace Persistence::Detail
{
    template <typename T>
    struct FromJsonOptional
    {
        static void fromJson(nlohmann::json const& json, T& value, char const* name)
        {
            if (auto it = json.find(name); it != json.end() && !it->is_null())
                value = it->template get<typename T::value_type>();
            else
                value = std::nullopt;
        }
    };

    template <typename T>
    struct ToJsonOptional
    {
        static void toJson(nlohmann::json& json, T const& value, char const* name)
        {
            if (value)
                json[name] = *value;
        }
    };
}

#define TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    ::Persistence::Detail::ToJsonOptional<std::decay_t<decltype(CLASS.MEMBER)>>::toJson(JSON, CLASS.MEMBER, JSON_NAME)

#define TO_JSON_OPTIONAL(JSON, CLASS, MEMBER) TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)

#define FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    ::Persistence::Detail::FromJsonOptional<std::decay_t<decltype(CLASS.MEMBER)>>::fromJson( \
        JSON, CLASS.MEMBER, JSON_NAME)

#define FROM_JSON_OPTIONAL(JSON, CLASS, MEMBER) FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)
