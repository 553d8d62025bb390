#pragma once
#include "mcptool/content.hpp"
#include "mcptool/exceptions.hpp"
#include "mcptool/types.hpp"
#include "mcptool/util/schema_build.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace mcptool::tools
{

/// One member of a tool's argument struct, as seen by the schema builder and
/// the argument parser.
///
/// An argument struct lists its members once through a static fields() that
/// returns a tuple of Field; both the tools/list inputSchema and the
/// tools/call parser are derived from that list:
///
///   struct EchoProperties {
///       std::string message;
///       static auto fields() {
///           return std::make_tuple(
///               field("message", &EchoProperties::message, "The message to echo"));
///       }
///   };
///
/// Members declared std::optional are optional; everything else is required.
template <typename Owner, typename T>
struct Field
{
    const char* name;
    T Owner::*member;
    const char* description;
    std::optional<Json> default_value;
    std::optional<Json> schema_override;

    Field& with_default(Json value)
    {
        default_value = std::move(value);
        return *this;
    }

    /// Replace the type fragment derived from T, e.g. to narrow an untyped Json member.
    Field& with_schema(Json fragment)
    {
        schema_override = std::move(fragment);
        return *this;
    }
};

template <typename Owner, typename T>
Field<Owner, T> field(const char* name, T Owner::*member, const char* description = nullptr)
{
    return Field<Owner, T>{name, member, description, std::nullopt, std::nullopt};
}

namespace detail
{

inline ArgumentParseError type_mismatch(const std::string& name, const char* expected,
                                        const Json& value)
{
    return ArgumentParseError(std::string("invalid type: ") + value.type_name() + ", expected " +
                              expected + " for field `" + name + "`");
}

template <typename T>
T read_value(const Json& value, const std::string& name)
{
    namespace sb = util::schema_build;
    if constexpr (std::is_same_v<T, Json>)
    {
        return value;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        if (!value.is_string())
            throw type_mismatch(name, "a string", value);
        return value.get<std::string>();
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        if (!value.is_boolean())
            throw type_mismatch(name, "a boolean", value);
        return value.get<bool>();
    }
    else if constexpr (std::is_enum_v<T>)
    {
        if (!value.is_string())
            throw type_mismatch(name, "a string", value);
        const auto& text = value.get_ref<const std::string&>();
        std::string expected;
        for (const auto& variant : sb::EnumNames<T>::values())
        {
            if (text == variant.second)
                return variant.first;
            if (!expected.empty())
                expected += ", ";
            expected += std::string("`") + variant.second + "`";
        }
        throw ArgumentParseError("unknown variant `" + text + "` for field `" + name +
                                 "`, expected one of " + expected);
    }
    else if constexpr (std::is_integral_v<T>)
    {
        if constexpr (std::is_unsigned_v<T>)
        {
            const bool non_negative =
                value.is_number_unsigned() ||
                (value.is_number_integer() && value.get<std::int64_t>() >= 0);
            if (!non_negative)
                throw type_mismatch(name, "a non-negative integer", value);
        }
        else if (!value.is_number_integer())
        {
            throw type_mismatch(name, "an integer", value);
        }
        return value.get<T>();
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        if (!value.is_number())
            throw type_mismatch(name, "a number", value);
        return value.get<T>();
    }
    else if constexpr (sb::is_vector<T>::value)
    {
        if (!value.is_array())
            throw type_mismatch(name, "an array", value);
        T out;
        out.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
            out.push_back(read_value<typename T::value_type>(
                value[i], name + "[" + std::to_string(i) + "]"));
        return out;
    }
    else
    {
        static_assert(sizeof(T) == 0, "no JSON reader for this argument type");
    }
}

template <typename Owner, typename T>
void read_field(const Json& arguments, Owner& out, const Field<Owner, T>& f)
{
    auto it = arguments.find(f.name);
    if constexpr (util::schema_build::is_optional<T>::value)
    {
        if (it == arguments.end() || it->is_null())
            out.*(f.member) = std::nullopt;
        else
            out.*(f.member) = read_value<typename T::value_type>(*it, f.name);
    }
    else
    {
        if (it == arguments.end())
            throw ArgumentParseError(std::string("missing field `") + f.name + "`");
        out.*(f.member) = read_value<T>(*it, f.name);
    }
}

template <typename Owner, typename T>
void describe_field(const Field<Owner, T>& f, Json& properties, std::vector<std::string>& required)
{
    Json fragment =
        f.schema_override ? *f.schema_override : util::schema_build::type_fragment<T>();
    if (f.description)
        fragment["description"] = f.description;
    if (f.default_value)
        fragment["default"] = *f.default_value;
    properties[f.name] = std::move(fragment);
    if constexpr (util::schema_build::is_required<T>())
        required.emplace_back(f.name);
}

} // namespace detail

/// inputSchema derived from Properties::fields().
template <typename Properties>
Json input_schema()
{
    Json properties = Json::object();
    std::vector<std::string> required;
    std::apply([&](const auto&... f) { (detail::describe_field(f, properties, required), ...); },
               Properties::fields());
    return util::schema_build::object_schema(std::move(properties), required);
}

/// Deserialize an untyped arguments object into Properties.
/// A null (absent) arguments value is read as an empty object.
/// Unknown members are ignored.
template <typename Properties>
Properties parse_arguments(const Json& arguments)
{
    static const Json kEmpty = Json::object();
    const Json& args = arguments.is_null() ? kEmpty : arguments;
    if (!args.is_object())
        throw ArgumentParseError(std::string("invalid type: ") + args.type_name() +
                                 ", expected an object");

    Properties props{};
    std::apply([&](const auto&... f) { (detail::read_field(args, props, f), ...); },
               Properties::fields());
    return props;
}

} // namespace mcptool::tools
