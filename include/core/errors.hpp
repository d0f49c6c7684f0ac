#ifndef EXTENDER_CORE_ERRORS_HPP
#define EXTENDER_CORE_ERRORS_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <optional>

namespace extender
{
    namespace core
    {

        /**
         * Stable, enumerable reason codes attached to failures and status events.
         * The string form is part of the external status format; do not rename.
         */
        enum class ReasonCode
        {
            NONE = 0,
            HARDWARE_UNAVAILABLE,
            NO_SUCH_INTERFACE,
            UNSUPPORTED_HARDWARE,
            INCOMPATIBLE_MODE,
            MODE_TRANSITION_FAILED,
            UPSTREAM_UNRECOVERABLE,
            NO_UPSTREAM_PROFILE,
            ASSOCIATION_FAILED,
            ADDRESS_ACQUISITION_FAILED,
            AP_START_FAILED,
            DHCP_START_FAILED,
            AP_PROCESS_EXITED,
            BRIDGE_ACTIVATION_FAILED,
            CONFIGURATION_INVALID,
            TIMEOUT,
            COMMAND_FAILED,
            OPERATOR_REQUEST
        };

        std::string reason_to_string(ReasonCode reason);
        std::optional<ReasonCode> reason_from_string(const std::string &value);

        /**
         * Result of an operation on a component.
         */
        struct Outcome
        {
            bool ok = true;
            ReasonCode reason = ReasonCode::NONE;
            std::string message;

            static Outcome success() { return Outcome{}; }
            static Outcome failure(ReasonCode reason, const std::string &message)
            {
                return Outcome{false, reason, message};
            }

            explicit operator bool() const { return ok; }
        };

        /**
         * Thrown by constructors and queries that cannot produce a value
         */
        class ExtenderError : public std::runtime_error
        {
        public:
            ExtenderError(ReasonCode reason, const std::string &message)
                : std::runtime_error(message), reason_(reason)
            {
            }

            ReasonCode reason() const { return reason_; }

        private:
            ReasonCode reason_;
        };

        /**
         * Configuration rejected; carries every violation found, not just the first
         */
        class ConfigError : public ExtenderError
        {
        public:
            explicit ConfigError(std::vector<std::string> violations);

            const std::vector<std::string> &violations() const { return violations_; }

        private:
            std::vector<std::string> violations_;
        };

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_ERRORS_HPP
