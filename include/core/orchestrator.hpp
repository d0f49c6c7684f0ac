#ifndef EXTENDER_CORE_ORCHESTRATOR_HPP
#define EXTENDER_CORE_ORCHESTRATOR_HPP

#include <memory>
#include <string>
#include <thread>
#include <atomic>
#include <vector>
#include <mutex>
#include <optional>
#include <chrono>
#include <condition_variable>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/reconciler.hpp"
#include "core/extender_event.hpp"
#include "core/event_queue.hpp"

// Forward declarations
namespace extender
{
    namespace core
    {
        class ExtenderConfig;
        class Logger;
        class TimeSource;
        class TaskExecutor;
    }
    namespace services
    {
        class StatusEventService;
    }
    namespace infrastructure
    {
        class CommandRunner;
        class ProcessLauncher;
        class RadioCapabilityProbe;
        class InterfaceModeController;
        class UpstreamConnectionManager;
        class AccessPointCoordinator;
        class BridgeCoordinator;
        class ReconnectPolicy;
    }
}

namespace extender
{
    namespace core
    {

        /**
         * Collaborators the orchestrator runs against. Anything left null is
         * replaced by the production implementation.
         */
        struct OrchestratorDependencies
        {
            std::shared_ptr<infrastructure::CommandRunner> command_runner;
            std::shared_ptr<infrastructure::ProcessLauncher> process_launcher;
            std::shared_ptr<TimeSource> clock;
            std::shared_ptr<TaskExecutor> executor;
            std::shared_ptr<services::StatusEventService> status_events;
        };

        /**
         * Extender Orchestrator
         * Owns the goal and reconciles it against the live state of the radio,
         * the upstream link, the access point and the bridge. The loop thread
         * is the only writer of cross-component decisions; long-running work
         * goes to the executor one operation at a time and comes back as an
         * OPERATION_COMPLETED event.
         */
        class ExtenderOrchestrator
        {
        public:
            ExtenderOrchestrator(std::shared_ptr<ExtenderConfig> config, OrchestratorDependencies dependencies = {});
            ~ExtenderOrchestrator();

            ExtenderOrchestrator(const ExtenderOrchestrator &) = delete;
            ExtenderOrchestrator &operator=(const ExtenderOrchestrator &) = delete;

            // Probe the radio and build the components. Radio faults do not fail
            // initialization; they surface as Degraded once a goal is set.
            bool initialize();

            // Lifecycle of the loop and observer threads
            bool start(std::optional<ExtenderGoal> initial_goal = std::nullopt);
            void stop(std::chrono::milliseconds convergence_timeout = std::chrono::seconds(30));
            bool is_running() const { return running_; }

            // Commands
            Outcome set_goal(ExtenderGoal goal);
            Outcome request_scan();
            Outcome connect_upstream(const UpstreamProfile &profile);
            Outcome change_ap_profile(const APProfile &profile);
            Outcome change_ap_profile(const APProfilePatch &patch);
            Outcome manual_retry();

            // Queries
            nlohmann::json status() const;
            OverallState overall_state() const;
            ExtenderGoal goal() const;
            std::optional<ReasonCode> terminal_reason() const;
            std::optional<RadioIdentity> radio() const;
            std::vector<ClientRecord> clients() const;
            std::vector<DiscoveredNetwork> last_scan() const;
            APProfile ap_profile() const;
            ConnectionState connection_state() const;
            APState ap_state() const;
            BridgeState bridge_state() const;
            std::optional<Action> operation_in_flight() const;

            std::shared_ptr<services::StatusEventService> status_events() const { return status_events_; }

            // One pass of the loop: handle every queued event, then reconcile.
            // The loop thread calls these; tests drive them directly.
            size_t process_pending();
            void tick();
            void sample_signals();

        private:
            struct DispatchContext;

            void run_loop();
            void run_observer();

            void handle_event(const ExtenderEvent &event);
            void handle_completion(const OperationResult &result);
            void tick_locked();
            void reconcile_locked();
            bool dispatch_locked(Action action);
            OperationResult execute(Action action, const DispatchContext &context);

            Snapshot snapshot_locked() const;
            void refresh_mode_locked();
            void publish_overall_locked(OverallState state, ReasonCode reason);
            void latch_terminal_locked(ReasonCode reason);
            void on_ap_state_locked(const APState &state);
            void reset_ap_restarts_locked();
            void wire_controller_locked();
            std::string ap_interface_name_locked() const;
            void log_status();

            bool enqueue(ExtenderEvent event);

            // Configuration and logging
            std::shared_ptr<ExtenderConfig> config_;
            std::shared_ptr<Logger> logger_;

            // Collaborators
            std::shared_ptr<infrastructure::CommandRunner> runner_;
            std::shared_ptr<infrastructure::ProcessLauncher> launcher_;
            std::shared_ptr<TimeSource> clock_;
            std::shared_ptr<TaskExecutor> executor_;
            std::shared_ptr<services::StatusEventService> status_events_;

            // Components
            std::shared_ptr<infrastructure::RadioCapabilityProbe> probe_;
            std::shared_ptr<infrastructure::InterfaceModeController> controller_;
            std::shared_ptr<infrastructure::UpstreamConnectionManager> upstream_;
            std::shared_ptr<infrastructure::AccessPointCoordinator> access_point_;
            std::shared_ptr<infrastructure::BridgeCoordinator> bridge_;

            EventQueue queue_;

            // Loop state, guarded by mutex_
            mutable std::mutex mutex_;
            std::condition_variable state_cv_;
            std::string interface_name_;
            std::optional<RadioIdentity> radio_;
            bool radio_present_ = false;
            bool interface_seen_ = false;
            std::optional<ReasonCode> radio_fault_;
            InterfaceMode mode_ = InterfaceMode::DOWN;
            bool ap_interface_present_ = false;

            ExtenderGoal goal_ = ExtenderGoal::STOPPED;
            uint64_t epoch_ = 0;
            OverallState overall_ = OverallState::STOPPED;
            std::optional<ReasonCode> terminal_;
            bool extending_reached_ = false;

            std::optional<UpstreamProfile> upstream_profile_;
            APProfile ap_profile_;

            std::optional<Action> in_flight_;
            Action blocked_action_ = Action::NONE;
            int mode_failures_ = 0;
            int ap_start_failures_ = 0;
            bool upstream_restart_pending_ = false;
            bool ap_restart_pending_ = false;
            bool scan_pending_ = false;
            bool reprobe_pending_ = false;
            bool bridge_reported_active_ = false;

            // Crash restarts of a running AP, paced by ap_restart_policy_
            std::unique_ptr<infrastructure::ReconnectPolicy> ap_restart_policy_;
            int ap_crash_restarts_ = 0;
            std::optional<std::chrono::steady_clock::time_point> ap_restart_at_;
            std::optional<std::chrono::steady_clock::time_point> ap_running_since_;
            std::vector<DiscoveredNetwork> last_scan_;

            // Threading
            bool initialized_ = false;
            std::atomic<bool> running_{false};
            std::unique_ptr<std::thread> loop_thread_;
            std::unique_ptr<std::thread> observer_thread_;
            std::mutex observer_mutex_;
            std::condition_variable observer_cv_;

            std::chrono::steady_clock::time_point start_time_;
        };

    } // namespace core
} // namespace extender

#endif // EXTENDER_CORE_ORCHESTRATOR_HPP
