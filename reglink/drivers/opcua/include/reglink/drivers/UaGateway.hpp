#pragma once

#include "reglink/drivers/UaStatus.hpp"
#include "reglink/gateway/Gateway.hpp"

#include <open62541/client.h>
#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace reglink::drivers
{
    // "coil[3]", "hr[5]": the string id of a register node, always in namespace 1
    auto nodeName(RegisterSpace space, uint16_t address) -> std::string;

    inline constexpr uint16_t NODE_NAMESPACE{ 1 };

    /**
     * OPC UA client side of the gateway. Each call is one Read or Write
     * service request covering all requested registers.
     */
    class UaGateway : public reglink::IGateway
    {
      public:
        explicit UaGateway(std::string endpointUrl);
        ~UaGateway() override;

        // clang-format off
        auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        auto disconnect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;

        auto getValues(RegisterSpace space,
                       uint16_t address,
                       uint16_t count,
                       std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<std::vector<uint16_t>>> override;
        auto setValues(RegisterSpace space,
                       uint16_t address,
                       std::vector<uint16_t> values,
                       std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        // clang-format on

        inline auto isConnected() const -> bool { return m_connected; }

      private:
        auto handleChannelState(UA_SecureChannelState state) -> void;
        auto applyTimeout(std::chrono::milliseconds timeout) -> void;
        auto ensureConnected() -> Result<void>;

        std::string m_endpointUrl;
        std::atomic<bool> m_connected{ false };
        UA_UInt32 m_defaultTimeout{ 0 };

        struct UA_ClientDeleter
        {
            inline void operator()(UA_Client* client) { UA_Client_delete(client); }
        };
        std::unique_ptr<UA_Client, UA_ClientDeleter> m_client;

        std::recursive_mutex m_mutex;
    };

} // namespace reglink::drivers
