#ifndef EXTENDER_INFRASTRUCTURE_ACCESS_POINT_COORDINATOR_HPP
#define EXTENDER_INFRASTRUCTURE_ACCESS_POINT_COORDINATOR_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <optional>
#include <chrono>
#include <filesystem>
#include <sys/types.h>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "infrastructure/client_table.hpp"

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

        struct AccessPointSettings
        {
            std::string runtime_dir;
            std::string bridge_name;
            std::chrono::milliseconds command_timeout{10000};
            std::chrono::milliseconds hostapd_ready_timeout{10000};
            std::chrono::milliseconds dhcp_ready_timeout{5000};
            std::chrono::milliseconds process_stop_timeout{3000};
            std::chrono::milliseconds lease_wait{60000};
        };

        /**
         * Access Point Coordinator
         * Runs hostapd and dnsmasq as one unit with two legs. Start is atomic:
         * if either leg fails to come up both are torn down and the state is
         * left STOPPED. Client events from both output streams feed the
         * client table.
         */
        class AccessPointCoordinator
        {
        public:
            using StateListener = std::function<void(const core::APState &state)>;
            using ClientListener = std::function<void(const ClientTable::Update &update)>;

            AccessPointCoordinator(std::shared_ptr<CommandRunner> runner,
                                   std::shared_ptr<ProcessLauncher> launcher,
                                   std::shared_ptr<core::TimeSource> clock,
                                   const AccessPointSettings &settings);
            ~AccessPointCoordinator();

            core::Outcome start(const core::APProfile &profile, const std::string &interface_name);
            core::Outcome stop();

            core::APState current_state() const;
            std::vector<core::ClientRecord> clients() const;
            std::optional<core::APProfile> profile() const;
            std::string interface_name() const;

            // Observational: per-station signal from `iw dev <ap> station dump`
            void refresh_station_signals();
            void expire_clients();

            void set_state_listener(StateListener listener);
            void set_client_listener(ClientListener listener);

            static std::map<std::string, int> parse_station_dump(const std::string &output);

        private:
            enum class Leg
            {
                HOSTAPD,
                DNSMASQ
            };

            core::Outcome abort_start(uint64_t generation, core::ReasonCode reason, const std::string &message);
            bool wait_for_leg(uint64_t generation, Leg leg, std::chrono::milliseconds timeout, std::string &cause);
            void on_hostapd_line(uint64_t generation, const std::string &line);
            void on_dnsmasq_line(uint64_t generation, const std::string &line);
            void on_leg_exit(uint64_t generation, Leg leg, int status);

            void teardown(pid_t hostapd_pid, pid_t dnsmasq_pid, const std::string &interface_name);
            bool run_step(const std::vector<std::string> &argv, std::string &cause);
            void publish_state(const core::APState &state);
            void publish_clients(const std::vector<ClientTable::Update> &updates);

            std::filesystem::path hostapd_conf_path(const std::string &interface_name) const;
            std::filesystem::path dnsmasq_conf_path(const std::string &interface_name) const;

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<ProcessLauncher> launcher_;
            std::shared_ptr<core::TimeSource> clock_;
            AccessPointSettings settings_;
            std::shared_ptr<core::Logger> logger_;

            core::APState state_;
            std::optional<core::APProfile> profile_;
            std::string interface_;
            ClientTable clients_;
            std::chrono::seconds lease_duration_{43200};

            pid_t hostapd_pid_ = -1;
            pid_t dnsmasq_pid_ = -1;
            uint64_t generation_ = 0;
            bool hostapd_ready_ = false;
            bool hostapd_exited_ = false;
            bool dnsmasq_ready_ = false;
            bool dnsmasq_exited_ = false;

            StateListener state_listener_;
            ClientListener client_listener_;
            mutable std::mutex mutex_;
            std::condition_variable cv_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_ACCESS_POINT_COORDINATOR_HPP
