#ifndef EXTENDER_INFRASTRUCTURE_CLIENT_TABLE_HPP
#define EXTENDER_INFRASTRUCTURE_CLIENT_TABLE_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include "core/types.hpp"

namespace extender
{
    namespace infrastructure
    {

        /**
         * Associated stations merged by MAC address from hostapd and dnsmasq
         * events. An association without a lease is kept with an unknown IP;
         * once the lease wait elapses it is flagged overdue, never dropped.
         *
         * Not synchronized; the owner serializes access.
         */
        class ClientTable
        {
        public:
            using Clock = std::chrono::steady_clock;

            enum class Change
            {
                NONE,
                JOINED,
                UPDATED,
                LEFT
            };

            struct Update
            {
                Change change = Change::NONE;
                core::ClientRecord record;
            };

            explicit ClientTable(std::chrono::milliseconds lease_wait);

            Update on_associated(const std::string &mac, Clock::time_point now);

            // Creates the record if the lease arrives before the association event.
            // lease_duration of seconds::max() never expires.
            Update on_lease(const std::string &mac, const std::string &ip, const std::string &hostname,
                            Clock::time_point now, std::chrono::seconds lease_duration);

            Update on_released(const std::string &mac);
            Update on_disassociated(const std::string &mac);

            // Returns true when the stored value changed
            bool on_signal(const std::string &mac, int signal_dbm);

            // Lease expiry and lease-wait bookkeeping
            std::vector<Update> expire(Clock::time_point now);

            // Drops every record, one LEFT update per client
            std::vector<Update> clear();

            std::vector<core::ClientRecord> snapshot() const;
            std::optional<core::ClientRecord> find(const std::string &mac) const;
            size_t size() const { return entries_.size(); }

            static std::string normalize_mac(const std::string &mac);

        private:
            struct Entry
            {
                core::ClientRecord record;
                Clock::time_point associated_at;
                std::optional<Clock::time_point> lease_expires;
            };

            Entry &get_or_create(const std::string &key, Clock::time_point now, bool &created);

            std::chrono::milliseconds lease_wait_;
            std::map<std::string, Entry> entries_;
        };

    } // namespace infrastructure
} // namespace extender

#endif // EXTENDER_INFRASTRUCTURE_CLIENT_TABLE_HPP
