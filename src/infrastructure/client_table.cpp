#include "infrastructure/client_table.hpp"

#include <cctype>

namespace extender
{
    namespace infrastructure
    {

        ClientTable::ClientTable(std::chrono::milliseconds lease_wait)
            : lease_wait_(lease_wait)
        {
        }

        std::string ClientTable::normalize_mac(const std::string &mac)
        {
            std::string normalized = mac;
            for (auto &c : normalized)
            {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return normalized;
        }

        ClientTable::Entry &ClientTable::get_or_create(const std::string &key, Clock::time_point now, bool &created)
        {
            auto it = entries_.find(key);
            if (it != entries_.end())
            {
                created = false;
                return it->second;
            }

            Entry entry;
            entry.record.mac = key;
            entry.record.associated_at_ms = core::system_now_ms();
            entry.associated_at = now;
            created = true;
            return entries_.emplace(key, entry).first->second;
        }

        ClientTable::Update ClientTable::on_associated(const std::string &mac, Clock::time_point now)
        {
            bool created = false;
            auto &entry = get_or_create(normalize_mac(mac), now, created);
            if (created)
            {
                return {Change::JOINED, entry.record};
            }

            // Re-association of a known station restarts its lease wait
            entry.associated_at = now;
            return {Change::NONE, entry.record};
        }

        ClientTable::Update ClientTable::on_lease(const std::string &mac, const std::string &ip,
                                                  const std::string &hostname, Clock::time_point now,
                                                  std::chrono::seconds lease_duration)
        {
            bool created = false;
            auto &entry = get_or_create(normalize_mac(mac), now, created);

            bool changed = !entry.record.ip || *entry.record.ip != ip || entry.record.lease_overdue;
            entry.record.ip = ip;
            entry.record.lease_overdue = false;
            if (!hostname.empty() && hostname != "*" && hostname != entry.record.hostname)
            {
                entry.record.hostname = hostname;
                changed = true;
            }

            if (lease_duration == std::chrono::seconds::max())
            {
                entry.lease_expires.reset();
            }
            else
            {
                entry.lease_expires = now + lease_duration;
            }

            if (created)
            {
                return {Change::JOINED, entry.record};
            }
            return {changed ? Change::UPDATED : Change::NONE, entry.record};
        }

        ClientTable::Update ClientTable::on_released(const std::string &mac)
        {
            auto it = entries_.find(normalize_mac(mac));
            if (it == entries_.end() || !it->second.record.ip)
            {
                return {};
            }

            it->second.record.ip.reset();
            it->second.lease_expires.reset();
            return {Change::UPDATED, it->second.record};
        }

        ClientTable::Update ClientTable::on_disassociated(const std::string &mac)
        {
            auto it = entries_.find(normalize_mac(mac));
            if (it == entries_.end())
            {
                return {};
            }

            Update update{Change::LEFT, it->second.record};
            entries_.erase(it);
            return update;
        }

        bool ClientTable::on_signal(const std::string &mac, int signal_dbm)
        {
            auto it = entries_.find(normalize_mac(mac));
            if (it == entries_.end() || it->second.record.signal_dbm == signal_dbm)
            {
                return false;
            }
            it->second.record.signal_dbm = signal_dbm;
            return true;
        }

        std::vector<ClientTable::Update> ClientTable::expire(Clock::time_point now)
        {
            std::vector<Update> updates;
            for (auto &[key, entry] : entries_)
            {
                bool changed = false;

                if (entry.record.ip && entry.lease_expires && now >= *entry.lease_expires)
                {
                    entry.record.ip.reset();
                    entry.lease_expires.reset();
                    changed = true;
                }

                if (!entry.record.ip && !entry.record.lease_overdue && now - entry.associated_at >= lease_wait_)
                {
                    entry.record.lease_overdue = true;
                    changed = true;
                }

                if (changed)
                {
                    updates.push_back({Change::UPDATED, entry.record});
                }
            }
            return updates;
        }

        std::vector<ClientTable::Update> ClientTable::clear()
        {
            std::vector<Update> updates;
            for (const auto &[key, entry] : entries_)
            {
                updates.push_back({Change::LEFT, entry.record});
            }
            entries_.clear();
            return updates;
        }

        std::vector<core::ClientRecord> ClientTable::snapshot() const
        {
            std::vector<core::ClientRecord> records;
            records.reserve(entries_.size());
            for (const auto &[key, entry] : entries_)
            {
                records.push_back(entry.record);
            }
            return records;
        }

        std::optional<core::ClientRecord> ClientTable::find(const std::string &mac) const
        {
            auto it = entries_.find(normalize_mac(mac));
            if (it == entries_.end())
            {
                return std::nullopt;
            }
            return it->second.record;
        }

    } // namespace infrastructure
} // namespace extender
