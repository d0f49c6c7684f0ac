#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "core/errors.hpp"

#include <string>

/**
 * CORS Helper Mixin
 * Add this as a template base class to any controller that needs CORS support
 */
template<typename T>
class CorsHelper {
protected:
  // Helper to add CORS headers to any response
  template<class DtoType>
  std::shared_ptr<typename T::OutgoingResponse> createDtoResponseWithCors(
      const typename T::Status& status,
      const DtoType& dto,
      T* controller)
  {
    auto response = controller->createDtoResponse(status, dto);
    response->putHeader("Access-Control-Allow-Origin", "*");
    response->putHeader("Access-Control-Allow-Methods", "GET, POST, PUT, OPTIONS");
    response->putHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
    response->putHeader("Connection", "close");
    return response;
  }

  // Preflight response shared by every controller
  std::shared_ptr<typename T::OutgoingResponse> createPreflightResponse(T* controller) {
    auto response = controller->createResponse(T::Status::CODE_204, "");
    response->putHeader("Access-Control-Allow-Origin", "*");
    response->putHeader("Access-Control-Allow-Methods", "GET, POST, PUT, OPTIONS");
    response->putHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
    response->putHeader("Access-Control-Max-Age", "86400");
    response->putHeader("Connection", "close");
    return response;
  }
};

/**
 * Maps an orchestrator command outcome onto an HTTP status code
 */
inline oatpp::web::protocol::http::Status statusForOutcome(const extender::core::Outcome& outcome) {
  using Status = oatpp::web::protocol::http::Status;
  if (outcome.ok) {
    return Status::CODE_202;
  }
  switch (outcome.reason) {
  case extender::core::ReasonCode::CONFIGURATION_INVALID:
    return Status::CODE_400;
  case extender::core::ReasonCode::INCOMPATIBLE_MODE:
    return Status::CODE_409;
  default:
    return Status::CODE_503;
  }
}
