#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "api/controllers/cors_helper.hpp"
#include "core/orchestrator.hpp"
#include "services/status_event_service.hpp"
#include <chrono>
#include <string>

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Status Controller
 * Read-only views of the extender: overall status, attached clients, the
 * status event stream and the most recent scan
 */
class StatusController : public oatpp::web::server::api::ApiController,
                         public CorsHelper<StatusController> {
private:
  std::chrono::steady_clock::time_point m_startTime;
  std::shared_ptr<extender::core::ExtenderOrchestrator> m_orchestrator;

  static constexpr int DEFAULT_EVENT_LIMIT = 100;
  static constexpr int MAX_EVENT_LIMIT = 1000;

  std::shared_ptr<OutgoingResponse> unavailable() {
    auto dto = CommandResultDto::createShared();
    dto->status = "error";
    dto->reason = "HardwareUnavailable";
    dto->message = "Extender not available";
    return createDtoResponseWithCors(Status::CODE_503, dto, this);
  }

  static int64_t parseNumber(const oatpp::String& value, int64_t fallback) {
    if (!value) {
      return fallback;
    }
    try {
      return std::stoll(value->c_str());
    } catch (const std::exception&) {
      return fallback;
    }
  }

public:
  StatusController(const std::shared_ptr<ObjectMapper>& objectMapper,
                   std::shared_ptr<extender::core::ExtenderOrchestrator> orchestrator)
    : oatpp::web::server::api::ApiController(objectMapper)
    , m_startTime(std::chrono::steady_clock::now())
    , m_orchestrator(orchestrator) {}

  static std::shared_ptr<StatusController> createShared(
    const std::shared_ptr<ObjectMapper>& objectMapper,
    std::shared_ptr<extender::core::ExtenderOrchestrator> orchestrator
  ) {
    return std::make_shared<StatusController>(objectMapper, orchestrator);
  }

  // GET /api/status
  ENDPOINT_INFO(getStatus) {
    info->summary = "Get extender status";
    info->description = "Returns the goal, overall state and the state of every component";
    info->addResponse<Object<ExtenderStatusDto>>(Status::CODE_200, "application/json");
    info->addTag("Status");
  }
  ENDPOINT("GET", "/api/status", getStatus) {
    if (!m_orchestrator) {
      return unavailable();
    }

    auto status = m_orchestrator->status();
    auto connection = m_orchestrator->connection_state();
    auto radio = m_orchestrator->radio();

    auto dto = ExtenderStatusDto::createShared();
    dto->goal = status.value("goal", "").c_str();
    dto->state = status.value("state", "").c_str();
    dto->reason = status.value("reason", "None").c_str();
    dto->interfaceName = status.value("interface", "").c_str();
    dto->radioPresent = status.value("radio_present", false);
    dto->concurrentCapable = radio ? radio->supports_concurrent : false;
    dto->mode = status.value("mode", "").c_str();
    dto->apInterface = status.value("ap_interface", "").c_str();

    dto->connection = connection.name().c_str();
    dto->reconnectAttempt = connection.attempt;
    if (status["upstream_profile"].is_object()) {
      dto->upstreamSsid = status["upstream_profile"].value("ssid", "").c_str();
    }

    dto->apState = m_orchestrator->ap_state().name().c_str();
    const auto& apProfile = status["access_point"]["profile"];
    dto->apSsid = apProfile.value("ssid", "").c_str();
    dto->apChannel = apProfile.value("channel", 0);

    dto->bridge = extender::core::bridge_state_to_string(m_orchestrator->bridge_state()).c_str();
    dto->clientCount = static_cast<v_int32>(status["clients"].size());
    if (status["operation_in_flight"].is_string()) {
      dto->operationInFlight = status["operation_in_flight"].get<std::string>().c_str();
    }
    dto->lastEventSequence = status.value("last_event_sequence", static_cast<int64_t>(0));

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - m_startTime);
    dto->uptime = uptime.count();

    return createDtoResponseWithCors(Status::CODE_200, dto, this);
  }

  // GET /api/clients
  ENDPOINT_INFO(getClients) {
    info->summary = "List access point clients";
    info->description = "Stations associated with the extender's access point, with leases where granted";
    info->addResponse<Object<ClientListDto>>(Status::CODE_200, "application/json");
    info->addTag("Status");
  }
  ENDPOINT("GET", "/api/clients", getClients) {
    if (!m_orchestrator) {
      return unavailable();
    }

    auto dto = ClientListDto::createShared();
    dto->clients = oatpp::Vector<oatpp::Object<ClientDto>>::createShared();

    auto clients = m_orchestrator->clients();
    for (const auto& client : clients) {
      auto clientDto = ClientDto::createShared();
      clientDto->mac = client.mac.c_str();
      if (client.ip) {
        clientDto->ip = client.ip->c_str();
      }
      clientDto->hostname = client.hostname.c_str();
      if (client.signal_dbm) {
        clientDto->signalDbm = *client.signal_dbm;
      }
      clientDto->associatedAt = client.associated_at_ms;
      clientDto->leaseOverdue = client.lease_overdue;
      dto->clients->push_back(clientDto);
    }
    dto->total = static_cast<v_int32>(clients.size());

    return createDtoResponseWithCors(Status::CODE_200, dto, this);
  }

  // GET /api/events?since=N&limit=M
  ENDPOINT_INFO(getEvents) {
    info->summary = "Read the status event stream";
    info->description = "Returns events with a sequence greater than 'since', oldest first";
    info->addResponse<Object<StatusEventListDto>>(Status::CODE_200, "application/json");
    info->addTag("Status");
    info->queryParams.add<Int64>("since").description = "Last sequence already seen";
    info->queryParams.add<Int32>("limit").description = "Maximum number of events to return";
  }
  ENDPOINT("GET", "/api/events", getEvents,
           REQUEST(std::shared_ptr<IncomingRequest>, request)) {
    if (!m_orchestrator) {
      return unavailable();
    }

    auto queryParams = request->getQueryParameters();
    int64_t since = parseNumber(queryParams.get("since"), 0);
    int64_t limit = parseNumber(queryParams.get("limit"), DEFAULT_EVENT_LIMIT);
    if (since < 0) {
      since = 0;
    }
    if (limit <= 0 || limit > MAX_EVENT_LIMIT) {
      limit = DEFAULT_EVENT_LIMIT;
    }

    auto service = m_orchestrator->status_events();
    auto dto = StatusEventListDto::createShared();
    dto->events = oatpp::Vector<oatpp::Object<StatusEventDto>>::createShared();

    for (const auto& event : service->events_since(static_cast<uint64_t>(since), static_cast<size_t>(limit))) {
      auto eventDto = StatusEventDto::createShared();
      eventDto->sequence = static_cast<v_int64>(event.sequence);
      eventDto->timestamp = event.timestamp_ms;
      eventDto->type = event.type.c_str();
      eventDto->reason = extender::core::reason_to_string(event.reason).c_str();
      eventDto->details = event.details.dump().c_str();
      dto->events->push_back(eventDto);
    }
    dto->lastSequence = static_cast<v_int64>(service->last_sequence());

    return createDtoResponseWithCors(Status::CODE_200, dto, this);
  }

  // GET /api/scan
  ENDPOINT_INFO(getScanResults) {
    info->summary = "Get the most recent scan results";
    info->description = "Networks found by the last completed scan; POST /api/scan starts a new one";
    info->addResponse<Object<NetworkListDto>>(Status::CODE_200, "application/json");
    info->addTag("Status");
  }
  ENDPOINT("GET", "/api/scan", getScanResults) {
    if (!m_orchestrator) {
      return unavailable();
    }

    auto dto = NetworkListDto::createShared();
    dto->networks = oatpp::Vector<oatpp::Object<NetworkDto>>::createShared();

    auto networks = m_orchestrator->last_scan();
    for (const auto& network : networks) {
      auto networkDto = NetworkDto::createShared();
      networkDto->bssid = network.bssid.c_str();
      networkDto->ssid = network.ssid.c_str();
      networkDto->frequency = network.frequency_mhz;
      networkDto->channel = network.channel;
      networkDto->signalDbm = network.signal_dbm;
      networkDto->security = extender::core::security_to_string(network.security).c_str();
      networkDto->associated = network.associated;
      dto->networks->push_back(networkDto);
    }
    dto->total = static_cast<v_int32>(networks.size());

    return createDtoResponseWithCors(Status::CODE_200, dto, this);
  }

  // OPTIONS handler for CORS
  ENDPOINT("OPTIONS", "/api/*", statusOptions) {
    return createPreflightResponse(this);
  }
};

#include OATPP_CODEGEN_END(ApiController)
