#include "transport.h"
#include <sstream>

namespace hive {

const char* exchange_kind_to_string(exchange_kind kind) {
    switch (kind) {
        case EXCHANGE_KIND_DIRECT: return "direct";
        case EXCHANGE_KIND_FANOUT: return "fanout";
        case EXCHANGE_KIND_TOPIC: return "topic";
        default: return "unknown";
    }
}

static std::vector<std::string> split_words(const std::string& key) {
    std::vector<std::string> words;
    std::stringstream ss(key);
    std::string word;
    while (std::getline(ss, word, '.')) {
        words.push_back(word);
    }
    if (!key.empty() && key.back() == '.') {
        words.emplace_back();
    }
    return words;
}

static bool match_words(const std::vector<std::string>& p, size_t pi,
                        const std::vector<std::string>& k, size_t ki) {
    if (pi == p.size()) {
        return ki == k.size();
    }
    if (p[pi] == "#") {
        // '#' swallows zero or more words
        for (size_t skip = ki; skip <= k.size(); skip++) {
            if (match_words(p, pi + 1, k, skip)) {
                return true;
            }
        }
        return false;
    }
    if (ki == k.size()) {
        return false;
    }
    if (p[pi] == "*" || p[pi] == k[ki]) {
        return match_words(p, pi + 1, k, ki + 1);
    }
    return false;
}

bool topic_matches(const std::string& pattern, const std::string& routing_key) {
    return match_words(split_words(pattern), 0, split_words(routing_key), 0);
}

} // namespace hive
