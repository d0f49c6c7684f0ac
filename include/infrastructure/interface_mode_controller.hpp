#ifndef EXTENDER_INFRASTRUCTURE_INTERFACE_MODE_CONTROLLER_HPP
#define EXTENDER_INFRASTRUCTURE_INTERFACE_MODE_CONTROLLER_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <chrono>
#include "core/types.hpp"
#include "core/errors.hpp"

namespace extender
{
    namespace core
    {
        class Logger;
    }
}

namespace extender
{
    namespace infrastructure
    {
        class CommandRunner;
        class RadioCapabilityProbe;

        /**
         * Interface Mode Controller
         * Owns the operational mode of the physical interface and, on concurrent
         * hardware, the virtual AP sub-interface next to it. Every transition is
         * verified through the probe and rolled back when verification fails.
         * All operations are serialized; only one transition can be in flight.
         */
        class InterfaceModeController
        {
        public:
            using ModeListener = std::function<void(core::InterfaceMode mode, bool ap_interface_present)>;

            InterfaceModeController(std::shared_ptr<CommandRunner> runner,
                                    std::shared_ptr<RadioCapabilityProbe> probe,
                                    const core::RadioIdentity &identity,
                                    std::chrono::milliseconds command_timeout,
                                    std::chrono::milliseconds verify_timeout);

            core::Outcome request_mode(core::InterfaceMode target);

            // Only permitted while the radio is in station mode
            core::Outcome attach_ap_interface();
            core::Outcome detach_ap_interface();

            core::InterfaceMode current_mode() const;
            bool ap_interface_present() const;
            std::string ap_interface_name() const;
            core::RadioIdentity identity() const;

            // Adopt a fresh probe result and re-read the live mode
            void reset(const core::RadioIdentity &identity);

            void set_mode_listener(ModeListener listener);

            static std::string derive_ap_mac(const std::string &mac_address);
            static std::string make_ap_interface_name(const std::string &interface_name);

        private:
            bool apply_locked(core::InterfaceMode from, core::InterfaceMode target, std::string &cause);
            bool apply_hard_locked(core::InterfaceMode target, std::string &cause);
            core::Outcome attach_locked();
            bool detach_locked(std::string &cause);
            bool run_step(const std::vector<std::string> &argv, std::string &cause);
            bool verify_mode(core::InterfaceMode target, std::string &cause);
            bool wait_for_interface(const std::string &name);
            void notify();

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<RadioCapabilityProbe> probe_;
            core::RadioIdentity identity_;
            std::string ap_interface_;
            std::chrono::milliseconds command_timeout_;
            std::chrono::milliseconds verify_timeout_;
            std::shared_ptr<core::Logger> logger_;

            core::InterfaceMode current_mode_ = core::InterfaceMode::DOWN;
            bool ap_interface_present_ = false;
            ModeListener listener_;
            mutable std::mutex mutex_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_INTERFACE_MODE_CONTROLLER_HPP
