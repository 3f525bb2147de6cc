#pragma once

#include <reflect>

#include <array>
#include <concepts>
#include <format>
#include <optional>
#include <ranges>
#include <string_view>
#include <tuple>

namespace reglink::log::format
{
    namespace detail
    {
        // clang-format off
        template<typename T>
        consteval auto namespace_name() noexcept -> std::string_view
        {
            using type_name_info = reflect::detail::type_name_info<std::remove_pointer_t<std::remove_cvref_t<T>>>;
            constexpr std::string_view function_name{
                reflect::detail::function_name<std::remove_pointer_t<std::remove_cvref_t<T>>>()
            };
            constexpr std::string_view qualified_type_name{
                function_name.substr(type_name_info::begin, function_name.find(type_name_info::end) - type_name_info::begin)
            };
            constexpr std::string_view tmp_type_name{
                qualified_type_name.substr(0, qualified_type_name.find_first_of("<", 1))
            };
            return tmp_type_name.substr(0, tmp_type_name.find_last_of("::") + 1);
        }
        // clang-format on

        template<typename T>
        consteval auto is_std_type() -> bool
        {
            return namespace_name<T>().starts_with("std::");
        }

        template<typename T>
        concept ScopedEnum = std::is_scoped_enum_v<std::remove_cvref_t<T>>;

        // plain aggregates of the project (change records, slots) print as
        // "[ Type: { a: 1, b: 2 } ]"
        template<typename T>
        concept Reflectable = std::is_class_v<std::remove_cvref_t<T>> &&
                              std::is_aggregate_v<std::remove_cvref_t<T>> &&
                              !is_std_type<std::remove_cvref_t<T>>();

        template<Reflectable T>
        consteval auto member_names()
        {
            return []<size_t... Is>(std::index_sequence<Is...>) {
                return std::array<std::string_view, sizeof...(Is)>{ reflect::member_name<Is, T>()... };
            }(std::make_index_sequence<reflect::size<T>()>{});
        }

        template<Reflectable T>
        consteval auto class_format_size() -> size_t
        {
            constexpr auto names{ member_names<T>() };
            auto size{ 0uz };
            size += 2;                              // "[ "
            size += reflect::type_name<T>().size(); // "<class>"
            size += 5;                              // ": {{ "

            for (auto i{ 0uz }; i < names.size(); ++i) {
                size += names[i].size(); // "<member>"
                size += 4;               // ": {}"
                if (i < names.size() - 1) {
                    size += 2; // ", "
                }
            }

            size += 5; // " }} ]"
            return size;
        }

        template<Reflectable T>
        consteval auto class_format()
        {
            constexpr auto names{ member_names<T>() };
            std::array<char, class_format_size<T>()> fmt{};

            auto iter{ fmt.begin() };
            auto append = [&](std::string_view s) {
                for (char c : s) {
                    *iter++ = c;
                }
            };

            append("[ ");
            append(reflect::type_name<T>());
            append(": {{ ");

            for (auto i{ 0uz }; i < names.size(); ++i) {
                append(names[i]);
                append(": {}");
                if (i < names.size() - 1) {
                    append(", ");
                }
            }

            append(" }} ]");
            return reflect::fixed_string<char, fmt.size()>(fmt.data());
        }
    }
}

template<reglink::log::format::detail::Reflectable T>
struct std::formatter<T>
{
    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }
        return it;
    }

    template<typename Ctx>
    auto format(const T& t, Ctx& ctx) const -> Ctx::iterator
    {
        auto check_arg = []<typename Field>(Field&& field) -> decltype(auto) {
            if constexpr (!std::formattable<std::remove_cvref_t<Field>, char>) {
                return "-";
            }
            else {
                return std::forward<Field>(field);
            }
        };

        auto args = [&]<size_t... Is>(std::index_sequence<Is...>) {
            return std::make_tuple(check_arg(reflect::get<Is>(t))...);
        }(std::make_index_sequence<reflect::size<T>()>{});

        static constexpr auto fmt{ reglink::log::format::detail::class_format<T>() };
        return std::apply([&ctx](const auto&... args) { return std::format_to(ctx.out(), fmt, args...); }, args);
    }
};

template<reglink::log::format::detail::ScopedEnum T>
struct std::formatter<T>
{
    bool verbose{ false };

    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it == ctx.end()) {
            return it;
        }

        if (*it == 'v') {
            verbose = true;
            ++it;
        }

        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }

        return it;
    }

    template<typename Ctx>
    auto format(T t, Ctx& ctx) const -> Ctx::iterator
    {
        if (verbose) {
            return std::format_to(ctx.out(), "{}:{}", reflect::type_name(t), reflect::enum_name(t));
        }
        return std::format_to(ctx.out(), "{}", reflect::enum_name(t));
    }
};

// unreachable register reads print as "unknown"
template<std::formattable<char> T>
struct std::formatter<std::optional<T>> : std::formatter<T>
{
    using Base = std::formatter<T>;

    template<typename Ctx>
    auto format(const std::optional<T>& t, Ctx& ctx) const -> Ctx::iterator
    {
        if (!t) {
            return std::ranges::copy(std::string_view{ "unknown" }, ctx.out()).out;
        }
        return Base::format(*t, ctx);
    }
};
