#pragma once

#include <open62541/types.h>

#include <cstdint>
#include <system_error>
#include <utility>

namespace reglink::drivers
{
    // the status codes the gateway produces itself; servers may answer with any other
    enum class UaStatus : uint32_t
    {
        Good = 0x00000000,
        Uncertain = 0x40000000,
        Bad = 0x80000000,

        BadUnexpectedError = 0x80010000,
        BadInternalError = 0x80020000,
        BadCommunicationError = 0x80050000,
        BadTimeout = 0x800A0000,
        BadServerNotConnected = 0x800D0000,
        BadNodeIdUnknown = 0x80340000,
        BadNotReadable = 0x803A0000,
        BadNotWritable = 0x803B0000,
        BadOutOfRange = 0x803C0000,
        BadTypeMismatch = 0x80740000,
        BadConnectionClosed = 0x80AE0000,
        BadNotConnected = 0x808A0000,
    };

    constexpr auto getStatus(UA_StatusCode status) -> UaStatus { return static_cast<UaStatus>(status); }

    constexpr auto isGood(UaStatus code) -> bool { return (std::to_underlying(code) & 0xC0000000) == 0; }
    constexpr auto isUncertain(UaStatus code) -> bool { return (std::to_underlying(code) & 0xC0000000) == 0x40000000; }
    constexpr auto isBad(UaStatus code) -> bool { return (std::to_underlying(code) & 0xC0000000) == 0x80000000; }

    auto ua_category() noexcept -> const std::error_category&;
    auto make_error_code(UaStatus e) noexcept -> std::error_code;
} // namespace reglink::drivers

namespace std
{
    template<>
    struct is_error_code_enum<reglink::drivers::UaStatus> : true_type
    {
    };
}
