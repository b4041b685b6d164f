#include "audit.h"
#include "failure.h"

#include <openssl/evp.h>

#include <memory>

namespace hive {

const std::string audit_trail::genesis_hash(64, '0');

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw error(ERROR_TYPE_UNKNOWN, "EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw error(ERROR_TYPE_UNKNOWN, "SHA-256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

std::string audit_trail::append(const std::string& agent_id, const std::string& record, int64_t timestamp) {
    audit_entry entry;
    entry.index = entries_.size();
    entry.agent_id = agent_id;
    entry.record = record;
    entry.prev_hash = head();
    entry.hash = sha256_hex(entry.prev_hash + record);
    entry.timestamp = timestamp;
    entries_.push_back(entry);
    return entries_.back().hash;
}

bool audit_trail::verify() const {
    std::string prev = genesis_hash;
    for (size_t i = 0; i < entries_.size(); i++) {
        const auto& e = entries_[i];
        if (e.index != i || e.prev_hash != prev) {
            return false;
        }
        if (sha256_hex(prev + e.record) != e.hash) {
            return false;
        }
        prev = e.hash;
    }
    return true;
}

const audit_entry* audit_trail::latest_for(const std::string& agent_id) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->agent_id == agent_id) {
            return &*it;
        }
    }
    return nullptr;
}

const std::string& audit_trail::head() const {
    return entries_.empty() ? genesis_hash : entries_.back().hash;
}

} // namespace hive
