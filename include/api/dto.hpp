#pragma once

#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/Types.hpp"

#include OATPP_CODEGEN_BEGIN(DTO)

class CommandResultDto : public oatpp::DTO {
  DTO_INIT(CommandResultDto, DTO)

  DTO_FIELD_INFO(status) {
    info->required = true;
  }
  DTO_FIELD(String, status);  // "accepted" or "error"

  DTO_FIELD(String, reason);
  DTO_FIELD(String, message);
};

class ExtenderStatusDto : public oatpp::DTO {
  DTO_INIT(ExtenderStatusDto, DTO)

  DTO_FIELD_INFO(goal) {
    info->required = true;
  }
  DTO_FIELD(String, goal);

  DTO_FIELD_INFO(state) {
    info->required = true;
  }
  DTO_FIELD(String, state);

  DTO_FIELD(String, reason);
  DTO_FIELD(String, interfaceName);
  DTO_FIELD(Boolean, radioPresent);
  DTO_FIELD(Boolean, concurrentCapable);
  DTO_FIELD(String, mode);
  DTO_FIELD(String, apInterface);

  // Upstream link
  DTO_FIELD(String, connection);
  DTO_FIELD(Int32, reconnectAttempt);
  DTO_FIELD(String, upstreamSsid);

  // Access point
  DTO_FIELD(String, apState);
  DTO_FIELD(String, apSsid);
  DTO_FIELD(Int32, apChannel);

  DTO_FIELD(String, bridge);
  DTO_FIELD(Int32, clientCount);
  DTO_FIELD(String, operationInFlight);
  DTO_FIELD(Int64, lastEventSequence);
  DTO_FIELD(Int64, uptime);
};

class ClientDto : public oatpp::DTO {
  DTO_INIT(ClientDto, DTO)

  DTO_FIELD(String, mac);
  DTO_FIELD(String, ip);
  DTO_FIELD(String, hostname);
  DTO_FIELD(Int32, signalDbm);
  DTO_FIELD(Int64, associatedAt);
  DTO_FIELD(Boolean, leaseOverdue);
};

class ClientListDto : public oatpp::DTO {
  DTO_INIT(ClientListDto, DTO)

  DTO_FIELD(Vector<Object<ClientDto>>, clients);
  DTO_FIELD(Int32, total);
};

class NetworkDto : public oatpp::DTO {
  DTO_INIT(NetworkDto, DTO)

  DTO_FIELD(String, bssid);
  DTO_FIELD(String, ssid);
  DTO_FIELD(Int32, frequency);
  DTO_FIELD(Int32, channel);
  DTO_FIELD(Float64, signalDbm);
  DTO_FIELD(String, security);
  DTO_FIELD(Boolean, associated);
};

class NetworkListDto : public oatpp::DTO {
  DTO_INIT(NetworkListDto, DTO)

  DTO_FIELD(Vector<Object<NetworkDto>>, networks);
  DTO_FIELD(Int32, total);
};

class StatusEventDto : public oatpp::DTO {
  DTO_INIT(StatusEventDto, DTO)

  DTO_FIELD(Int64, sequence);
  DTO_FIELD(Int64, timestamp);
  DTO_FIELD(String, type);
  DTO_FIELD(String, reason);
  DTO_FIELD(String, details);  // JSON text
};

class StatusEventListDto : public oatpp::DTO {
  DTO_INIT(StatusEventListDto, DTO)

  DTO_FIELD(Vector<Object<StatusEventDto>>, events);
  DTO_FIELD(Int64, lastSequence);
};

// Command DTOs
class GoalRequestDto : public oatpp::DTO {
  DTO_INIT(GoalRequestDto, DTO)

  DTO_FIELD_INFO(goal) {
    info->required = true;
    info->description = "\"extending\" or \"stopped\"";
  }
  DTO_FIELD(String, goal);
};

class UpstreamProfileDto : public oatpp::DTO {
  DTO_INIT(UpstreamProfileDto, DTO)

  DTO_FIELD_INFO(ssid) {
    info->required = true;
  }
  DTO_FIELD(String, ssid);

  DTO_FIELD(String, security);  // open, wpa-psk, wpa2-psk
  DTO_FIELD(String, password);
  DTO_FIELD(Int32, channel);
};

class APProfileDto : public oatpp::DTO {
  DTO_INIT(APProfileDto, DTO)

  DTO_FIELD_INFO(ssid) {
    info->required = true;
  }
  DTO_FIELD(String, ssid);

  DTO_FIELD(String, security);
  DTO_FIELD(String, password);
  DTO_FIELD(Int32, channel);
  DTO_FIELD(String, gateway);
  DTO_FIELD(Int32, prefixLength);
  DTO_FIELD(String, dhcpRangeStart);
  DTO_FIELD(String, dhcpRangeEnd);
  DTO_FIELD(String, leaseTime);
};

#include OATPP_CODEGEN_END(DTO)
