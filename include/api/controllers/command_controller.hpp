#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "api/controllers/cors_helper.hpp"
#include "core/orchestrator.hpp"
#include "core/types.hpp"
#include <string>

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Command Controller
 * Operator commands. Each one is validated and queued; the outcome of the
 * work itself shows up in the status event stream.
 */
class CommandController : public oatpp::web::server::api::ApiController,
                          public CorsHelper<CommandController> {
private:
  std::shared_ptr<extender::core::ExtenderOrchestrator> m_orchestrator;

  std::shared_ptr<OutgoingResponse> respond(const extender::core::Outcome& outcome, const std::string& accepted) {
    auto dto = CommandResultDto::createShared();
    dto->status = outcome.ok ? "accepted" : "error";
    dto->reason = extender::core::reason_to_string(outcome.reason).c_str();
    dto->message = outcome.ok ? accepted.c_str() : outcome.message.c_str();

    if (!outcome.ok) {
      printf("[API] Command rejected: %s (%s)\n",
             outcome.message.c_str(), extender::core::reason_to_string(outcome.reason).c_str());
      fflush(stdout);
    }
    return createDtoResponseWithCors(statusForOutcome(outcome), dto, this);
  }

  std::shared_ptr<OutgoingResponse> badRequest(const std::string& message) {
    return respond(extender::core::Outcome::failure(extender::core::ReasonCode::CONFIGURATION_INVALID, message), "");
  }

  std::shared_ptr<OutgoingResponse> unavailable() {
    return respond(extender::core::Outcome::failure(extender::core::ReasonCode::HARDWARE_UNAVAILABLE,
                                                    "Extender not available"), "");
  }

public:
  CommandController(const std::shared_ptr<ObjectMapper>& objectMapper,
                    std::shared_ptr<extender::core::ExtenderOrchestrator> orchestrator)
    : oatpp::web::server::api::ApiController(objectMapper)
    , m_orchestrator(orchestrator) {}

  static std::shared_ptr<CommandController> createShared(
    const std::shared_ptr<ObjectMapper>& objectMapper,
    std::shared_ptr<extender::core::ExtenderOrchestrator> orchestrator
  ) {
    return std::make_shared<CommandController>(objectMapper, orchestrator);
  }

  // PUT /api/goal
  ENDPOINT_INFO(setGoal) {
    info->summary = "Set the extender goal";
    info->description = "\"extending\" brings up station, access point and bridge; \"stopped\" tears everything down";
    info->addConsumes<Object<GoalRequestDto>>("application/json");
    info->addResponse<Object<CommandResultDto>>(Status::CODE_202, "application/json");
    info->addResponse<Object<CommandResultDto>>(Status::CODE_400, "application/json");
    info->addTag("Commands");
  }
  ENDPOINT("PUT", "/api/goal", setGoal,
           BODY_DTO(Object<GoalRequestDto>, body)) {
    printf("[API] PUT /api/goal - request received\n");
    fflush(stdout);

    if (!m_orchestrator) {
      return unavailable();
    }
    if (!body || !body->goal) {
      return badRequest("goal is required");
    }

    auto goal = extender::core::goal_from_string(body->goal->c_str());
    if (!goal) {
      return badRequest("unknown goal '" + std::string(body->goal->c_str()) + "'");
    }

    return respond(m_orchestrator->set_goal(*goal), "goal set to " + extender::core::goal_to_string(*goal));
  }

  // POST /api/scan
  ENDPOINT_INFO(requestScan) {
    info->summary = "Scan for upstream networks";
    info->description = "Results arrive as a ScanCompleted event and through GET /api/scan";
    info->addResponse<Object<CommandResultDto>>(Status::CODE_202, "application/json");
    info->addTag("Commands");
  }
  ENDPOINT("POST", "/api/scan", requestScan) {
    if (!m_orchestrator) {
      return unavailable();
    }
    return respond(m_orchestrator->request_scan(), "scan requested");
  }

  // POST /api/upstream
  ENDPOINT_INFO(connectUpstream) {
    info->summary = "Connect to an upstream network";
    info->description = "Replaces the upstream profile; an existing link is torn down first";
    info->addConsumes<Object<UpstreamProfileDto>>("application/json");
    info->addResponse<Object<CommandResultDto>>(Status::CODE_202, "application/json");
    info->addResponse<Object<CommandResultDto>>(Status::CODE_400, "application/json");
    info->addTag("Commands");
  }
  ENDPOINT("POST", "/api/upstream", connectUpstream,
           BODY_DTO(Object<UpstreamProfileDto>, body)) {
    printf("[API] POST /api/upstream - request received\n");
    fflush(stdout);

    if (!m_orchestrator) {
      return unavailable();
    }
    if (!body || !body->ssid) {
      return badRequest("ssid is required");
    }

    extender::core::UpstreamProfile profile;
    profile.ssid = body->ssid->c_str();
    if (body->security) {
      auto security = extender::core::security_from_string(body->security->c_str());
      if (!security) {
        return badRequest("unknown security '" + std::string(body->security->c_str()) + "'");
      }
      profile.security = *security;
    }
    if (body->password) {
      profile.passphrase = body->password->c_str();
    }
    if (body->channel) {
      profile.channel = static_cast<int>(*body->channel);
    }

    return respond(m_orchestrator->connect_upstream(profile), "connecting to " + profile.ssid);
  }

  // PUT /api/ap
  ENDPOINT_INFO(changeAccessPoint) {
    info->summary = "Change the access point profile";
    info->description = "A running access point is restarted with the new profile";
    info->addConsumes<Object<APProfileDto>>("application/json");
    info->addResponse<Object<CommandResultDto>>(Status::CODE_202, "application/json");
    info->addResponse<Object<CommandResultDto>>(Status::CODE_400, "application/json");
    info->addTag("Commands");
  }
  ENDPOINT("PUT", "/api/ap", changeAccessPoint,
           BODY_DTO(Object<APProfileDto>, body)) {
    printf("[API] PUT /api/ap - request received\n");
    fflush(stdout);

    if (!m_orchestrator) {
      return unavailable();
    }
    if (!body || !body->ssid) {
      return badRequest("ssid is required");
    }

    // Unset fields keep their current values
    extender::core::APProfilePatch patch;
    patch.ssid = std::string(body->ssid->c_str());
    if (body->security) {
      auto security = extender::core::security_from_string(body->security->c_str());
      if (!security) {
        return badRequest("unknown security '" + std::string(body->security->c_str()) + "'");
      }
      patch.security = *security;
    }
    if (body->password) {
      patch.passphrase = std::string(body->password->c_str());
    }
    if (body->channel) {
      patch.channel = static_cast<int>(*body->channel);
    }
    if (body->gateway) {
      patch.gateway = std::string(body->gateway->c_str());
    }
    if (body->prefixLength) {
      patch.prefix_length = static_cast<int>(*body->prefixLength);
    }
    if (body->dhcpRangeStart) {
      patch.dhcp_range_start = std::string(body->dhcpRangeStart->c_str());
    }
    if (body->dhcpRangeEnd) {
      patch.dhcp_range_end = std::string(body->dhcpRangeEnd->c_str());
    }
    if (body->leaseTime) {
      patch.lease_time = std::string(body->leaseTime->c_str());
    }

    return respond(m_orchestrator->change_ap_profile(patch), "access point profile updated");
  }

  // POST /api/retry
  ENDPOINT_INFO(manualRetry) {
    info->summary = "Retry after a terminal failure";
    info->description = "Clears the latched failure, re-probes the radio and reconciles again";
    info->addResponse<Object<CommandResultDto>>(Status::CODE_202, "application/json");
    info->addTag("Commands");
  }
  ENDPOINT("POST", "/api/retry", manualRetry) {
    printf("[API] POST /api/retry - request received\n");
    fflush(stdout);

    if (!m_orchestrator) {
      return unavailable();
    }
    return respond(m_orchestrator->manual_retry(), "retry requested");
  }
};

#include OATPP_CODEGEN_END(ApiController)
