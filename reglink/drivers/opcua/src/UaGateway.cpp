#include "reglink/drivers/UaGateway.hpp"
#include "reglink/log/Logger.hpp"

#include <format>

namespace reglink::drivers
{
    namespace
    {
        auto dataType(RegisterSpace space) -> const UA_DataType*
        {
            return isBitSpace(space) ? &UA_TYPES[UA_TYPES_BOOLEAN] : &UA_TYPES[UA_TYPES_UINT16];
        }

        auto toRegister(const UA_Variant& variant) -> Result<uint16_t>
        {
            if (UA_Variant_hasScalarType(&variant, &UA_TYPES[UA_TYPES_BOOLEAN])) {
                return *static_cast<const UA_Boolean*>(variant.data) ? 1 : 0;
            }
            if (UA_Variant_hasScalarType(&variant, &UA_TYPES[UA_TYPES_UINT16])) {
                return *static_cast<const UA_UInt16*>(variant.data);
            }
            return std::unexpected(make_error_code(UaStatus::BadTypeMismatch));
        }
    }

    auto nodeName(RegisterSpace space, uint16_t address) -> std::string
    {
        return std::format("{}[{}]", shortName(space), address);
    }

    UaGateway::UaGateway(std::string endpointUrl)
      : m_endpointUrl(std::move(endpointUrl))
    {
        m_client.reset(UA_Client_new());
        UA_ClientConfig* config{ UA_Client_getConfig(m_client.get()) };
        UA_ClientConfig_setDefault(config);
        m_defaultTimeout = config->timeout;
        config->clientContext = this;
        config->stateCallback = [](UA_Client* client,
                                   UA_SecureChannelState channelState,
                                   UA_SessionState,
                                   UA_StatusCode) -> void {
            auto* self{ reinterpret_cast<UaGateway*>(UA_Client_getConfig(client)->clientContext) };
            self->handleChannelState(channelState);
        };
    }

    UaGateway::~UaGateway()
    {
        if (m_client) {
            UA_Client_disconnect(m_client.get());
        }
    }

    auto UaGateway::connect(std::chrono::milliseconds timeout) -> coro::Task<Result<void>>
    {
        if (!m_client) {
            co_return std::unexpected(make_error_code(UaStatus::Bad));
        }

        UA_StatusCode status;
        {
            std::lock_guard lock(m_mutex);
            applyTimeout(timeout);
            status = UA_Client_connect(m_client.get(), m_endpointUrl.c_str());
        }

        auto uaStatus{ getStatus(status) };
        if (isBad(uaStatus)) {
            log::debug("connect {} failed: {}", m_endpointUrl, UA_StatusCode_name(status));
            co_return std::unexpected(make_error_code(uaStatus));
        }

        m_connected = true;
        co_return success();
    }

    auto UaGateway::disconnect(std::chrono::milliseconds) -> coro::Task<Result<void>>
    {
        if (m_client) {
            std::lock_guard lock(m_mutex);
            UA_Client_disconnect(m_client.get());
        }
        m_connected = false;
        co_return success();
    }

    auto UaGateway::getValues(RegisterSpace space,
                              uint16_t address,
                              uint16_t count,
                              std::chrono::milliseconds timeout) -> coro::Task<Result<std::vector<uint16_t>>>
    {
        // TODO: switch to UA_Client_sendAsyncReadRequest once the runtime owns an event loop for the client
        std::lock_guard lock(m_mutex);
        applyTimeout(timeout);
        if (auto res = ensureConnected(); !res) {
            co_return std::unexpected(res.error());
        }
        if (count == 0) {
            co_return std::vector<uint16_t>{};
        }

        UA_ReadRequest request;
        UA_ReadRequest_init(&request);
        request.nodesToRead =
          static_cast<UA_ReadValueId*>(UA_Array_new(count, &UA_TYPES[UA_TYPES_READVALUEID]));
        request.nodesToReadSize = count;
        for (auto i{ 0uz }; i < count; ++i) {
            auto name{ nodeName(space, static_cast<uint16_t>(address + i)) };
            request.nodesToRead[i].nodeId = UA_NODEID_STRING_ALLOC(NODE_NAMESPACE, name.c_str());
            request.nodesToRead[i].attributeId = UA_ATTRIBUTEID_VALUE;
        }

        UA_ReadResponse response{ UA_Client_Service_read(m_client.get(), request) };
        UA_ReadRequest_clear(&request);

        auto status{ getStatus(response.responseHeader.serviceResult) };
        if (isBad(status)) {
            UA_ReadResponse_clear(&response);
            co_return std::unexpected(make_error_code(status));
        }
        if (response.resultsSize != count) {
            UA_ReadResponse_clear(&response);
            co_return std::unexpected(make_error_code(UaStatus::BadUnexpectedError));
        }

        std::vector<uint16_t> values;
        values.reserve(count);
        for (auto i{ 0uz }; i < response.resultsSize; ++i) {
            const auto& result{ response.results[i] };
            auto itemStatus{ getStatus(result.hasStatus ? result.status : UA_STATUSCODE_GOOD) };
            if (isBad(itemStatus) || !result.hasValue) {
                UA_ReadResponse_clear(&response);
                co_return std::unexpected(
                  make_error_code(isBad(itemStatus) ? itemStatus : UaStatus::BadNotReadable));
            }

            auto value{ toRegister(result.value) };
            if (!value) {
                UA_ReadResponse_clear(&response);
                co_return std::unexpected(value.error());
            }
            values.push_back(*value);
        }

        UA_ReadResponse_clear(&response);
        co_return values;
    }

    auto UaGateway::setValues(RegisterSpace space,
                              uint16_t address,
                              std::vector<uint16_t> values,
                              std::chrono::milliseconds timeout) -> coro::Task<Result<void>>
    {
        std::lock_guard lock(m_mutex);
        applyTimeout(timeout);
        if (auto res = ensureConnected(); !res) {
            co_return std::unexpected(res.error());
        }
        if (values.empty()) {
            co_return success();
        }

        UA_WriteRequest request;
        UA_WriteRequest_init(&request);
        request.nodesToWrite =
          static_cast<UA_WriteValue*>(UA_Array_new(values.size(), &UA_TYPES[UA_TYPES_WRITEVALUE]));
        request.nodesToWriteSize = values.size();
        for (auto i{ 0uz }; i < values.size(); ++i) {
            auto& node{ request.nodesToWrite[i] };
            auto name{ nodeName(space, static_cast<uint16_t>(address + i)) };
            node.nodeId = UA_NODEID_STRING_ALLOC(NODE_NAMESPACE, name.c_str());
            node.attributeId = UA_ATTRIBUTEID_VALUE;
            node.value.hasValue = true;

            if (isBitSpace(space)) {
                UA_Boolean bit{ values[i] != 0 };
                UA_Variant_setScalarCopy(&node.value.value, &bit, dataType(space));
            }
            else {
                UA_UInt16 reg{ values[i] };
                UA_Variant_setScalarCopy(&node.value.value, &reg, dataType(space));
            }
        }

        UA_WriteResponse response{ UA_Client_Service_write(m_client.get(), request) };
        UA_WriteRequest_clear(&request);

        auto status{ getStatus(response.responseHeader.serviceResult) };
        for (auto i{ 0uz }; !isBad(status) && i < response.resultsSize; ++i) {
            status = getStatus(response.results[i]);
        }
        UA_WriteResponse_clear(&response);

        if (isBad(status)) {
            co_return std::unexpected(make_error_code(status));
        }
        co_return success();
    }

    auto UaGateway::ensureConnected() -> Result<void>
    {
        if (!m_client) {
            return std::unexpected(make_error_code(UaStatus::BadNotConnected));
        }
        if (m_connected) {
            return success();
        }

        // one reconnect attempt per call so a restarted server is picked up again
        auto status{ getStatus(UA_Client_connect(m_client.get(), m_endpointUrl.c_str())) };
        if (isBad(status)) {
            return std::unexpected(make_error_code(UaStatus::BadServerNotConnected));
        }
        m_connected = true;
        return success();
    }

    auto UaGateway::applyTimeout(std::chrono::milliseconds timeout) -> void
    {
        UA_Client_getConfig(m_client.get())->timeout =
          timeout == NO_TIMEOUT ? m_defaultTimeout : static_cast<UA_UInt32>(timeout.count());
    }

    auto UaGateway::handleChannelState(UA_SecureChannelState state) -> void
    {
        switch (state) {
            case UA_SECURECHANNELSTATE_CLOSED:
                m_connected = false;
                break;
            case UA_SECURECHANNELSTATE_OPEN:
                m_connected = true;
                break;
            default:
                break;
        }
    }
} // namespace reglink::drivers
