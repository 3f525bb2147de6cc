#include "reglink/drivers/UaGatewayServer.hpp"
#include "reglink/drivers/UaGateway.hpp"
#include "reglink/drivers/UaStatus.hpp"
#include "reglink/log/Logger.hpp"

namespace reglink::drivers
{
    UaGatewayServer::UaGatewayServer(LocalGateway& gateway, uint16_t port)
      : m_gateway(gateway)
      , m_port(port)
    {
    }

    UaGatewayServer::~UaGatewayServer()
    {
        stop();
    }

    auto UaGatewayServer::start() -> Result<void>
    {
        if (isRunning()) {
            return success();
        }

        m_server.reset(UA_Server_new());
        if (!m_server) {
            return std::unexpected(make_error_code(UaStatus::BadInternalError));
        }

        auto status{ getStatus(UA_ServerConfig_setMinimal(UA_Server_getConfig(m_server.get()), m_port, nullptr)) };
        if (isBad(status)) {
            m_server.reset();
            return std::unexpected(make_error_code(status));
        }

        if (auto res = addNodes(); !res) {
            m_server.reset();
            return res;
        }

        status = getStatus(UA_Server_run_startup(m_server.get()));
        if (isBad(status)) {
            m_server.reset();
            return std::unexpected(make_error_code(status));
        }

        m_worker = std::jthread([this](std::stop_token token) { worker(token); });
        log::info("gateway server listening on port {} ({} nodes)", m_port, m_bindings.size());
        return success();
    }

    auto UaGatewayServer::stop() -> void
    {
        if (m_worker.joinable()) {
            m_worker.request_stop();
            m_worker.join();
        }
        if (m_server) {
            UA_Server_run_shutdown(m_server.get());
            m_server.reset();
        }
        m_bindings.clear();
    }

    auto UaGatewayServer::addNodes() -> Result<void>
    {
        auto layout{ m_gateway.layout() };

        // node contexts point into m_bindings, so it must never reallocate after this
        auto total{ 0uz };
        for (auto space : ALL_SPACES) {
            total += layout.sizes[index(space)];
        }
        m_bindings.clear();
        m_bindings.reserve(total);

        for (auto space : ALL_SPACES) {
            const auto* type{ isBitSpace(space) ? &UA_TYPES[UA_TYPES_BOOLEAN] : &UA_TYPES[UA_TYPES_UINT16] };

            for (uint16_t address{ 0 }; address < layout.sizes[index(space)]; ++address) {
                auto& binding{ m_bindings.emplace_back(NodeBinding{ this, space, address }) };
                auto name{ nodeName(space, address) };

                UA_VariableAttributes attr = UA_VariableAttributes_default;
                attr.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), name.data());
                attr.dataType = type->typeId;
                attr.valueRank = UA_VALUERANK_SCALAR;
                attr.accessLevel = UA_ACCESSLEVELMASK_READ;
                if (isRemotelyWritable(space)) {
                    attr.accessLevel |= UA_ACCESSLEVELMASK_WRITE;
                }

                UA_DataSource source;
                source.read = &UaGatewayServer::readCallback;
                source.write = &UaGatewayServer::writeCallback;

                auto status{ getStatus(
                  UA_Server_addDataSourceVariableNode(m_server.get(),
                                                      UA_NODEID_STRING(NODE_NAMESPACE, name.data()),
                                                      UA_NODEID_NUMERIC(0, UA_NS0ID_OBJECTSFOLDER),
                                                      UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES),
                                                      UA_QUALIFIEDNAME(NODE_NAMESPACE, name.data()),
                                                      UA_NODEID_NUMERIC(0, UA_NS0ID_BASEDATAVARIABLETYPE),
                                                      attr,
                                                      source,
                                                      &binding,
                                                      nullptr)) };
                if (isBad(status)) {
                    log::error("gateway server: cannot add node {}: {}", name, UA_StatusCode_name(std::to_underlying(status)));
                    return std::unexpected(make_error_code(status));
                }
            }
        }
        return success();
    }

    auto UaGatewayServer::worker(std::stop_token token) -> void
    {
        while (!token.stop_requested()) {
            UA_Server_run_iterate(m_server.get(), true);
        }
    }

    UA_StatusCode UaGatewayServer::readCallback(UA_Server*,
                                                const UA_NodeId*,
                                                void*,
                                                const UA_NodeId*,
                                                void* nodeContext,
                                                UA_Boolean,
                                                const UA_NumericRange*,
                                                UA_DataValue* value)
    {
        const auto* binding{ static_cast<const NodeBinding*>(nodeContext) };
        auto values{ binding->self->m_gateway.getValuesSync(binding->space, binding->address, 1) };
        if (!values || values->empty()) {
            return UA_STATUSCODE_BADOUTOFRANGE;
        }

        if (isBitSpace(binding->space)) {
            UA_Boolean bit{ values->front() != 0 };
            UA_Variant_setScalarCopy(&value->value, &bit, &UA_TYPES[UA_TYPES_BOOLEAN]);
        }
        else {
            UA_UInt16 reg{ values->front() };
            UA_Variant_setScalarCopy(&value->value, &reg, &UA_TYPES[UA_TYPES_UINT16]);
        }
        value->hasValue = true;
        return UA_STATUSCODE_GOOD;
    }

    UA_StatusCode UaGatewayServer::writeCallback(UA_Server*,
                                                 const UA_NodeId*,
                                                 void*,
                                                 const UA_NodeId*,
                                                 void* nodeContext,
                                                 const UA_NumericRange*,
                                                 const UA_DataValue* value)
    {
        const auto* binding{ static_cast<const NodeBinding*>(nodeContext) };
        if (!value || !value->hasValue) {
            return UA_STATUSCODE_BADTYPEMISMATCH;
        }

        uint16_t raw{};
        if (isBitSpace(binding->space) && UA_Variant_hasScalarType(&value->value, &UA_TYPES[UA_TYPES_BOOLEAN])) {
            raw = *static_cast<const UA_Boolean*>(value->value.data) ? 1 : 0;
        }
        else if (!isBitSpace(binding->space) &&
                 UA_Variant_hasScalarType(&value->value, &UA_TYPES[UA_TYPES_UINT16])) {
            raw = *static_cast<const UA_UInt16*>(value->value.data);
        }
        else {
            return UA_STATUSCODE_BADTYPEMISMATCH;
        }

        auto res{ binding->self->m_gateway.setValuesSync(binding->space, binding->address, std::span(&raw, 1)) };
        if (!res) {
            return res.error() == make_error_code(Errc::NotWritable) ? UA_STATUSCODE_BADNOTWRITABLE
                                                                     : UA_STATUSCODE_BADOUTOFRANGE;
        }
        log::debug("remote write {}[{}] = {}", shortName(binding->space), binding->address, raw);
        return UA_STATUSCODE_GOOD;
    }
} // namespace reglink::drivers
