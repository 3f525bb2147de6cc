#pragma once

#include <expected>
#include <system_error>

namespace reglink
{
    template<typename T>
    using Result = std::expected<T, std::error_code>;

    inline auto success() -> Result<void> { return {}; }

    enum class Errc
    {
        OutOfRange = 1,
        WrongSpaceType,
        NotWritable,
        NotFound,
        ParseError,
        IOError,
        InvalidConfig,
        NotConnected,
        Timeout,
        InvalidArgument
    };

    auto reglink_category() noexcept -> const std::error_category&;
    auto make_error_code(Errc e) noexcept -> std::error_code;

    inline auto fail(Errc e) -> std::unexpected<std::error_code> { return std::unexpected(make_error_code(e)); }
} // namespace reglink

namespace std
{
    template<>
    struct is_error_code_enum<reglink::Errc> : true_type
    {
    };
}
