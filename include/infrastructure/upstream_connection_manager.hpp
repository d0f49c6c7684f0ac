#ifndef EXTENDER_INFRASTRUCTURE_UPSTREAM_CONNECTION_MANAGER_HPP
#define EXTENDER_INFRASTRUCTURE_UPSTREAM_CONNECTION_MANAGER_HPP

#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <optional>
#include <chrono>
#include <sys/types.h>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "infrastructure/reconnect_policy.hpp"
#include "infrastructure/scan_results.hpp"

namespace extender
{
    namespace core
    {
        class Logger;
        class TimeSource;
    }
}

namespace extender
{
    namespace infrastructure
    {
        class CommandRunner;
        class ProcessLauncher;

        struct UpstreamSettings
        {
            std::string interface_name;
            std::string runtime_dir;
            std::chrono::milliseconds command_timeout{10000};
            std::chrono::milliseconds association_timeout{20000};
            std::chrono::milliseconds dhcp_client_timeout{30000};
            std::chrono::milliseconds process_stop_timeout{3000};
            std::chrono::milliseconds scan_timeout{15000};
        };

        /**
         * Upstream Connection Manager
         * Station half of the extender: scanning, association through
         * wpa_supplicant, address acquisition through dhclient, and the
         * reconnect backoff policy.
         */
        class UpstreamConnectionManager
        {
        public:
            using StateListener = std::function<void(const core::ConnectionState &state, core::ReasonCode reason)>;

            UpstreamConnectionManager(std::shared_ptr<CommandRunner> runner,
                                      std::shared_ptr<ProcessLauncher> launcher,
                                      std::shared_ptr<core::TimeSource> clock,
                                      const UpstreamSettings &settings,
                                      const ReconnectPolicy &policy);
            ~UpstreamConnectionManager();

            // Throws core::ExtenderError(COMMAND_FAILED) if the scan command fails
            ScanSequence scan();

            core::Outcome connect(const core::UpstreamProfile &profile);
            core::Outcome reconnect();
            core::Outcome disconnect();

            core::ConnectionState current_state() const;
            std::optional<core::UpstreamProfile> profile() const;

            bool reconnect_due(std::chrono::steady_clock::time_point now) const;
            void reset_reconnect();

            void set_auto_reconnect(bool enabled);
            bool auto_reconnect() const;

            // dBm of the current association, nullopt when not associated
            std::optional<int> sample_signal();

            void set_interface(const std::string &interface_name);
            std::string interface_name() const;

            void set_state_listener(StateListener listener);

            static std::optional<int> parse_link_signal(const std::string &output);

        private:
            core::Outcome fail_attempt(uint64_t generation, core::ReasonCode reason, const std::string &message);
            void on_supplicant_line(uint64_t generation, const std::string &line);
            void on_supplicant_exit(uint64_t generation, int status);
            bool handle_link_lost_locked();
            void publish(const core::ConnectionState &state, core::ReasonCode reason);

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<core::TimeSource> clock_;
            UpstreamSettings settings_;
            ReconnectPolicy policy_;
            std::shared_ptr<core::Logger> logger_;

            core::ConnectionState state_;
            std::optional<core::UpstreamProfile> profile_;
            std::optional<std::chrono::steady_clock::time_point> next_attempt_at_;
            bool auto_reconnect_ = false;

            // Current wpa_supplicant; generation_ invalidates callbacks from older ones
            pid_t supplicant_pid_ = -1;
            uint64_t generation_ = 0;
            bool associated_ = false;
            bool auth_failed_ = false;
            bool supplicant_exited_ = false;

            StateListener listener_;
            mutable std::mutex mutex_;
            std::condition_variable cv_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_UPSTREAM_CONNECTION_MANAGER_HPP
