#include "core/errors.hpp"

namespace extender
{
    namespace core
    {

        namespace
        {
            std::string join_violations(const std::vector<std::string> &violations)
            {
                std::string message = "Invalid configuration";
                for (const auto &violation : violations)
                {
                    message += "\n  - " + violation;
                }
                return message;
            }
        }

        std::string reason_to_string(ReasonCode reason)
        {
            switch (reason)
            {
            case ReasonCode::NONE:
                return "None";
            case ReasonCode::HARDWARE_UNAVAILABLE:
                return "HardwareUnavailable";
            case ReasonCode::NO_SUCH_INTERFACE:
                return "NoSuchInterface";
            case ReasonCode::UNSUPPORTED_HARDWARE:
                return "UnsupportedHardware";
            case ReasonCode::INCOMPATIBLE_MODE:
                return "IncompatibleMode";
            case ReasonCode::MODE_TRANSITION_FAILED:
                return "ModeTransitionFailed";
            case ReasonCode::UPSTREAM_UNRECOVERABLE:
                return "UpstreamUnrecoverable";
            case ReasonCode::NO_UPSTREAM_PROFILE:
                return "NoUpstreamProfile";
            case ReasonCode::ASSOCIATION_FAILED:
                return "AssociationFailed";
            case ReasonCode::ADDRESS_ACQUISITION_FAILED:
                return "AddressAcquisitionFailed";
            case ReasonCode::AP_START_FAILED:
                return "APStartFailed";
            case ReasonCode::DHCP_START_FAILED:
                return "DhcpStartFailed";
            case ReasonCode::AP_PROCESS_EXITED:
                return "APProcessExited";
            case ReasonCode::BRIDGE_ACTIVATION_FAILED:
                return "BridgeActivationFailed";
            case ReasonCode::CONFIGURATION_INVALID:
                return "ConfigurationInvalid";
            case ReasonCode::TIMEOUT:
                return "Timeout";
            case ReasonCode::COMMAND_FAILED:
                return "CommandFailed";
            case ReasonCode::OPERATOR_REQUEST:
                return "OperatorRequest";
            }
            return "Unknown";
        }

        std::optional<ReasonCode> reason_from_string(const std::string &value)
        {
            for (int i = static_cast<int>(ReasonCode::NONE); i <= static_cast<int>(ReasonCode::OPERATOR_REQUEST); ++i)
            {
                auto reason = static_cast<ReasonCode>(i);
                if (reason_to_string(reason) == value)
                {
                    return reason;
                }
            }
            return std::nullopt;
        }

        ConfigError::ConfigError(std::vector<std::string> violations)
            : ExtenderError(ReasonCode::CONFIGURATION_INVALID, join_violations(violations)),
              violations_(std::move(violations))
        {
        }

    } // namespace core
} // namespace extender
