#include "reglink/drivers/UaStatus.hpp"

#include <open62541/util.h>

#include <string>

namespace
{
    class UaStatusCategory : public std::error_category
    {
      public:
        const char* name() const noexcept override { return "UaStatus"; }

        // the stack knows the name of every code, including the ones not listed in UaStatus
        std::string message(int ev) const override { return UA_StatusCode_name(static_cast<UA_StatusCode>(ev)); }
    };
}

namespace reglink::drivers
{
    auto ua_category() noexcept -> const std::error_category&
    {
        static UaStatusCategory instance;
        return instance;
    }

    auto make_error_code(UaStatus e) noexcept -> std::error_code
    {
        return std::error_code(static_cast<int>(std::to_underlying(e)), ua_category());
    }
} // namespace reglink::drivers
