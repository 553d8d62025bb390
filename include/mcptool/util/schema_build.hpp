#pragma once
#include "mcptool/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mcptool::util::schema_build
{

/// String names of an enum's variants, in declaration order.
///
/// Specialize for every enum used as a tool argument:
///   template <> struct EnumNames<Action> {
///       static const std::vector<std::pair<Action, const char*>>& values();
///   };
template <typename E>
struct EnumNames;

template <typename T>
struct is_optional : std::false_type
{
};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type
{
};

template <typename T>
struct is_vector : std::false_type
{
};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type
{
};

/// JSON Schema fragment describing a C++ argument type.
///   std::string          -> {"type":"string"}
///   bool                 -> {"type":"boolean"}
///   integral             -> {"type":"integer"}
///   floating point       -> {"type":"number"}
///   enum with EnumNames  -> {"type":"string","enum":[...]}
///   std::vector<T>       -> {"type":"array","items":...}
///   Json                 -> {} (any value)
///   std::optional<T>     -> fragment of T
template <typename T>
Json type_fragment()
{
    if constexpr (is_optional<T>::value)
        return type_fragment<typename T::value_type>();
    else if constexpr (std::is_same_v<T, Json>)
        return Json::object();
    else if constexpr (std::is_same_v<T, std::string>)
        return Json{{"type", "string"}};
    else if constexpr (std::is_same_v<T, bool>)
        return Json{{"type", "boolean"}};
    else if constexpr (std::is_enum_v<T>)
    {
        Json names = Json::array();
        for (const auto& v : EnumNames<T>::values())
            names.push_back(v.second);
        return Json{{"type", "string"}, {"enum", names}};
    }
    else if constexpr (std::is_integral_v<T>)
        return Json{{"type", "integer"}};
    else if constexpr (std::is_floating_point_v<T>)
        return Json{{"type", "number"}};
    else if constexpr (is_vector<T>::value)
        return Json{{"type", "array"}, {"items", type_fragment<typename T::value_type>()}};
    else
        static_assert(sizeof(T) == 0, "no JSON Schema mapping for this argument type");
}

/// A field is required unless it is declared std::optional.
template <typename T>
constexpr bool is_required()
{
    return !is_optional<T>::value;
}

/// Assemble {"type":"object","properties":...,"required":[...]}.
inline Json object_schema(Json properties, const std::vector<std::string>& required)
{
    return Json{
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", required},
    };
}

} // namespace mcptool::util::schema_build
