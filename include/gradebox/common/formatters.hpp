#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <string.h>

namespace gradebox {

// See: https://www.boost.org/doc/libs/1_81_0/libs/describe/doc/html/describe.html#example_printing_enums_ct
template <typename Enum>
    requires(std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value)
constexpr std::optional<const char*> enum_to_string(Enum enumerator) {
    std::optional<const char*> res;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>([&](auto descriptor) {
        if (enumerator == descriptor.value) {
            res = descriptor.name;
        }
    });

    return res;
}

template <typename Enum>
concept DescribedEnum = std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value;

} // namespace gradebox

/// Any enum registered with ``BOOST_DESCRIBE_ENUM`` formats as its enumerator name
template <::gradebox::DescribedEnum Enum>
struct fmt::formatter<Enum> : fmt::formatter<std::string_view>
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        auto res = ::gradebox::enum_to_string(from);

        if (res) {
            return fmt::formatter<std::string_view>::format(*res, ctx);
        }

        return fmt::format_to(ctx.out(), "<unknown ({})>", static_cast<std::underlying_type_t<Enum>>(from));
    }
};

/// Output formatter for make_error_code
template <>
struct fmt::formatter<std::error_code> : fmt::formatter<std::string>
{
    auto format(const std::error_code& from, fmt::format_context& ctx) const {
        const char* name = ::strerrorname_np(from.value());

        return fmt::format_to(ctx.out(), "{} : {}", name == nullptr ? "?" : name, from.message());
    }
};

template <typename T>
struct fmt::formatter<std::optional<T>> : fmt::formatter<std::string>
{
    auto format(const std::optional<T>& from, fmt::format_context& ctx) const {
        if (!from) {
            return fmt::formatter<std::string>::format("nullopt", ctx);
        }

        return fmt::formatter<std::string>::format(fmt::format("Optional({})", *from), ctx);
    }
};
