#pragma once

#include "reglink/Result.hpp"
#include "reglink/gateway/LocalGateway.hpp"

#include <open62541/server.h>
#include <open62541/server_config_default.h>

#include <memory>
#include <thread>
#include <vector>

namespace reglink::drivers
{
    /**
     * Publishes every slot of a LocalGateway as an OPC UA variable node
     * ns=1;s=<space>[<address>]. Values are served straight from the bank on
     * each request; discrete inputs and input registers are read-only.
     */
    class UaGatewayServer
    {
      public:
        UaGatewayServer(LocalGateway& gateway, uint16_t port);
        ~UaGatewayServer();

        UaGatewayServer(const UaGatewayServer&) = delete;
        UaGatewayServer& operator=(const UaGatewayServer&) = delete;

        auto start() -> Result<void>;
        auto stop() -> void;

        inline auto isRunning() const -> bool { return m_worker.joinable(); }

      private:
        struct NodeBinding
        {
            UaGatewayServer* self;
            RegisterSpace space;
            uint16_t address;
        };

        auto addNodes() -> Result<void>;
        auto worker(std::stop_token token) -> void;

        static UA_StatusCode readCallback(UA_Server* server,
                                          const UA_NodeId* sessionId,
                                          void* sessionContext,
                                          const UA_NodeId* nodeId,
                                          void* nodeContext,
                                          UA_Boolean includeSourceTimeStamp,
                                          const UA_NumericRange* range,
                                          UA_DataValue* value);
        static UA_StatusCode writeCallback(UA_Server* server,
                                           const UA_NodeId* sessionId,
                                           void* sessionContext,
                                           const UA_NodeId* nodeId,
                                           void* nodeContext,
                                           const UA_NumericRange* range,
                                           const UA_DataValue* value);

        LocalGateway& m_gateway;
        uint16_t m_port;
        std::vector<NodeBinding> m_bindings;

        struct UA_ServerDeleter
        {
            inline void operator()(UA_Server* server) { UA_Server_delete(server); }
        };
        std::unique_ptr<UA_Server, UA_ServerDeleter> m_server;

        std::jthread m_worker;
    };
} // namespace reglink::drivers
