#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace hive {

// Lowercase hex SHA-256 of `data`
std::string sha256_hex(const std::string& data);

struct audit_entry {
    size_t index;
    std::string agent_id;
    std::string record;       // Canonical ballot text
    std::string prev_hash;
    std::string hash;         // sha256(prev_hash || record)
    int64_t timestamp;
};

// Append-only hash chain of cast ballots for one session.
// Tamper-evident against modification of stored entries only.
class audit_trail {
public:
    static const std::string genesis_hash;   // 64 zeros

    // Extend the chain, returns the new head hash
    std::string append(const std::string& agent_id, const std::string& record, int64_t timestamp);

    // Recompute every link from genesis
    bool verify() const;

    // Latest entry for an agent, nullptr when none
    const audit_entry* latest_for(const std::string& agent_id) const;

    const std::string& head() const;
    size_t size() const { return entries_.size(); }

    const std::vector<audit_entry>& entries() const { return entries_; }
    std::vector<audit_entry>& entries() { return entries_; }

private:
    std::vector<audit_entry> entries_;
};

} // namespace hive
