#include "tally.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace hive {

static const double k_epsilon = 1e-9;

const char* voting_algorithm_to_string(voting_algorithm algorithm) {
    switch (algorithm) {
        case VOTING_ALGORITHM_SIMPLE_MAJORITY: return "simple_majority";
        case VOTING_ALGORITHM_CONFIDENCE_WEIGHTED: return "confidence_weighted";
        case VOTING_ALGORITHM_QUADRATIC: return "quadratic";
        case VOTING_ALGORITHM_CONSENSUS: return "consensus";
        case VOTING_ALGORITHM_RANKED_CHOICE: return "ranked_choice";
        default: return "unknown";
    }
}

bool voting_algorithm_from_string(const std::string& str, voting_algorithm& out) {
    static const std::pair<const char*, voting_algorithm> names[] = {
        {"simple_majority", VOTING_ALGORITHM_SIMPLE_MAJORITY},
        {"confidence_weighted", VOTING_ALGORITHM_CONFIDENCE_WEIGHTED},
        {"quadratic", VOTING_ALGORITHM_QUADRATIC},
        {"consensus", VOTING_ALGORITHM_CONSENSUS},
        {"ranked_choice", VOTING_ALGORITHM_RANKED_CHOICE},
    };
    for (const auto& [name, algorithm] : names) {
        if (str == name) {
            out = algorithm;
            return true;
        }
    }
    return false;
}

// vote_record

std::string vote_record::first_choice() const {
    if (!choice.empty()) {
        return choice;
    }
    return rankings.empty() ? std::string() : rankings.front();
}

std::vector<std::string> vote_record::ballot() const {
    if (!rankings.empty()) {
        return rankings;
    }
    if (!choice.empty()) {
        return {choice};
    }
    return {};
}

std::string vote_record::canonical() const {
    json j;
    j["agentId"] = agent_id;
    j["choice"] = choice;
    j["rankings"] = rankings;
    json alloc = json::object();
    for (const auto& [option, tokens] : allocation) {
        alloc[option] = tokens;
    }
    j["allocation"] = alloc;
    if (confidence) {
        j["confidence"] = *confidence;
    } else {
        j["confidence"] = nullptr;
    }
    j["agentLevel"] = agent_level;
    j["timestamp"] = timestamp;
    j["seq"] = seq;
    return j.dump();
}

vote_record vote_record::from_payload(const vote_payload& vote) {
    vote_record r;
    r.agent_id = vote.agent_id;
    r.choice = vote.choice;
    r.rankings = vote.rankings;
    r.allocation = vote.allocation;
    r.confidence = vote.confidence;
    r.agent_level = vote.agent_level;
    return r;
}

// quorum

json quorum_report::to_json() const {
    json j;
    j["met"] = met;
    j["participants"] = participants;
    j["requiredParticipants"] = required_participants;
    j["meanConfidence"] = mean_confidence;
    j["experts"] = experts;
    j["failures"] = failures;
    return j;
}

quorum_report check_quorum(const std::vector<vote_record>& votes, int total_agents, const quorum_config& quorum) {
    quorum_report report;
    report.participants = static_cast<int>(votes.size());
    report.required_participants = quorum.min_participation * std::max(total_agents, 0);

    double confidence_sum = 0.0;
    for (const auto& v : votes) {
        confidence_sum += v.effective_confidence();
        if (v.agent_level >= quorum.expert_level) {
            report.experts++;
        }
    }
    report.mean_confidence = votes.empty() ? 0.0 : confidence_sum / votes.size();

    if (total_agents <= 0 && quorum.min_participation > 0.0) {
        report.failures.push_back("total agent count unknown");
    } else if (report.participants + k_epsilon < report.required_participants) {
        report.failures.push_back("participation " + std::to_string(report.participants) +
                                  " below required " + std::to_string(report.required_participants));
    }
    if (report.mean_confidence + k_epsilon < quorum.min_confidence) {
        report.failures.push_back("mean confidence " + std::to_string(report.mean_confidence) +
                                  " below " + std::to_string(quorum.min_confidence));
    }
    if (report.experts < quorum.min_experts) {
        report.failures.push_back("experts " + std::to_string(report.experts) +
                                  " below " + std::to_string(quorum.min_experts));
    }

    report.met = report.failures.empty();
    return report;
}

// helpers

// Options in first-seen ballot order, then declared options nobody chose.
// pick_max keeps the earliest of equal tallies.
static std::vector<std::string> candidate_order(const std::vector<std::string>& options,
                                                const std::vector<std::string>& seen) {
    std::vector<std::string> order;
    for (const auto& name : seen) {
        if (std::find(order.begin(), order.end(), name) == order.end()) {
            order.push_back(name);
        }
    }
    for (const auto& name : options) {
        if (std::find(order.begin(), order.end(), name) == order.end()) {
            order.push_back(name);
        }
    }
    return order;
}

static std::string pick_max(const std::vector<std::string>& order, const std::map<std::string, double>& tally) {
    std::string best;
    double best_value = -std::numeric_limits<double>::infinity();
    for (const auto& name : order) {
        auto it = tally.find(name);
        if (it == tally.end()) continue;
        if (it->second > best_value + k_epsilon) {
            best = name;
            best_value = it->second;
        }
    }
    return best;
}

static void finish(tally_result& result, const std::vector<std::string>& order) {
    double total = 0.0;
    for (const auto& [name, value] : result.tally) {
        total += value;
    }
    if (total <= 0.0) {
        return;
    }
    result.winner = pick_max(order, result.tally);
    result.winner_share = result.tally[result.winner] / total;
}

// Counts one unit (or weight) per ballot for its single choice
class choice_counting : public tally_algorithm {
protected:
    tally_result count(const std::vector<vote_record>& votes, const tally_context& ctx, bool weighted) const {
        tally_result result;
        std::vector<std::string> seen;
        for (const auto& name : ctx.options) {
            result.tally[name] = 0.0;
        }
        for (const auto& v : votes) {
            const std::string c = v.first_choice();
            if (c.empty()) continue;
            result.tally[c] += weighted ? v.effective_confidence() : 1.0;
            seen.push_back(c);
            result.counted++;
        }
        finish(result, candidate_order(ctx.options, seen));
        return result;
    }
};

class simple_majority_tally : public choice_counting {
public:
    voting_algorithm kind() const override { return VOTING_ALGORITHM_SIMPLE_MAJORITY; }

    tally_result tally(const std::vector<vote_record>& votes, const tally_context& ctx) const override {
        return count(votes, ctx, false);
    }
};

class confidence_weighted_tally : public choice_counting {
public:
    voting_algorithm kind() const override { return VOTING_ALGORITHM_CONFIDENCE_WEIGHTED; }

    tally_result tally(const std::vector<vote_record>& votes, const tally_context& ctx) const override {
        return count(votes, ctx, true);
    }
};

class consensus_tally : public choice_counting {
public:
    voting_algorithm kind() const override { return VOTING_ALGORITHM_CONSENSUS; }

    tally_result tally(const std::vector<vote_record>& votes, const tally_context& ctx) const override {
        tally_result result = count(votes, ctx, false);
        result.consensus_reached = !result.winner.empty() &&
                                   result.winner_share + k_epsilon >= ctx.consensus_threshold;
        return result;
    }
};

// Weight per option = sum over agents of sqrt(tokens)
class quadratic_tally : public tally_algorithm {
public:
    voting_algorithm kind() const override { return VOTING_ALGORITHM_QUADRATIC; }

    tally_result tally(const std::vector<vote_record>& votes, const tally_context& ctx) const override {
        tally_result result;
        std::vector<std::string> seen;
        for (const auto& name : ctx.options) {
            result.tally[name] = 0.0;
        }
        for (const auto& v : votes) {
            bool contributed = false;
            if (!v.allocation.empty()) {
                for (const auto& [option, tokens] : v.allocation) {
                    if (tokens <= 0.0) continue;
                    result.tally[option] += std::sqrt(tokens);
                    seen.push_back(option);
                    contributed = true;
                }
            } else if (!v.first_choice().empty()) {
                // a plain choice spends the whole budget on one option
                result.tally[v.first_choice()] += std::sqrt(static_cast<double>(std::max(ctx.tokens_per_agent, 0)));
                seen.push_back(v.first_choice());
                contributed = true;
            }
            if (contributed) {
                result.counted++;
            }
        }
        finish(result, candidate_order(ctx.options, seen));
        return result;
    }
};

// Instant runoff
class ranked_choice_tally : public tally_algorithm {
public:
    voting_algorithm kind() const override { return VOTING_ALGORITHM_RANKED_CHOICE; }

    tally_result tally(const std::vector<vote_record>& votes, const tally_context& ctx) const override {
        tally_result result;

        std::vector<std::string> seen;
        for (const auto& v : votes) {
            for (const auto& pref : v.ballot()) {
                seen.push_back(pref);
            }
        }
        std::vector<std::string> remaining = candidate_order(ctx.options, seen);

        for (int round = 1; !remaining.empty(); round++) {
            tally_round r;
            r.round = round;

            std::map<std::string, std::vector<const vote_record*>> supporters;
            for (const auto& name : remaining) {
                r.tally[name] = 0.0;
            }
            for (const auto& v : votes) {
                for (const auto& pref : v.ballot()) {
                    if (std::find(remaining.begin(), remaining.end(), pref) != remaining.end()) {
                        r.tally[pref] += 1.0;
                        supporters[pref].push_back(&v);
                        r.active_ballots++;
                        break;
                    }
                }
            }

            if (round == 1) {
                for (const auto& v : votes) {
                    if (!v.ballot().empty()) result.counted++;
                }
            }

            if (r.active_ballots == 0) {
                result.tally = r.tally;
                result.rounds.push_back(r);
                break;
            }

            const std::string leader = pick_max(remaining, r.tally);
            if (r.tally[leader] * 2 > r.active_ballots || remaining.size() == 1) {
                result.winner = leader;
                result.winner_share = r.tally[leader] / r.active_ballots;
                result.tally = r.tally;
                result.rounds.push_back(r);
                break;
            }

            // options nobody ranks first go out together
            for (const auto& name : remaining) {
                if (r.tally[name] == 0.0) {
                    r.eliminated.push_back(name);
                }
            }

            if (r.eliminated.empty()) {
                double lowest = std::numeric_limits<double>::infinity();
                for (const auto& name : remaining) {
                    lowest = std::min(lowest, r.tally[name]);
                }
                std::vector<std::string> tied;
                for (const auto& name : remaining) {
                    if (r.tally[name] == lowest) {
                        tied.push_back(name);
                    }
                }
                r.eliminated.push_back(pick_loser(tied, supporters, ctx, r.tie_break));
                if (!r.tie_break.empty()) {
                    result.tie_break = r.tie_break;
                }
            }

            for (const auto& name : r.eliminated) {
                remaining.erase(std::find(remaining.begin(), remaining.end(), name));
            }
            result.tally = r.tally;
            result.rounds.push_back(r);
        }

        return result;
    }

private:
    using supporter_map = std::map<std::string, std::vector<const vote_record*>>;

    template<typename Key>
    static std::vector<std::string> keep_lowest(const std::vector<std::string>& names, Key key) {
        std::vector<std::string> kept;
        double lowest = std::numeric_limits<double>::infinity();
        for (const auto& name : names) {
            const double k = key(name);
            if (k < lowest - k_epsilon) {
                lowest = k;
                kept.clear();
            }
            if (std::fabs(k - lowest) <= k_epsilon) {
                kept.push_back(name);
            }
        }
        return kept;
    }

    static std::string pick_loser(const std::vector<std::string>& tied, const supporter_map& supporters,
                                  const tally_context& ctx, std::string& method) {
        if (tied.size() == 1) {
            return tied.front();
        }

        auto of = [&supporters](const std::string& name) -> const std::vector<const vote_record*>& {
            static const std::vector<const vote_record*> none;
            auto it = supporters.find(name);
            return it == supporters.end() ? none : it->second;
        };

        auto candidates = keep_lowest(tied, [&](const std::string& name) {
            double sum = 0.0;
            for (const auto* v : of(name)) sum += v->effective_confidence();
            return sum;
        });
        if (candidates.size() == 1) {
            method = "confidence";
            return candidates.front();
        }

        candidates = keep_lowest(candidates, [&](const std::string& name) {
            double sum = 0.0;
            for (const auto* v : of(name)) sum += v->agent_level;
            return sum;
        });
        if (candidates.size() == 1) {
            method = "agent_level";
            return candidates.front();
        }

        // the option whose earliest supporter arrived last goes out
        auto earliest = [&](const std::string& name) {
            std::pair<int64_t, uint64_t> first = {std::numeric_limits<int64_t>::max(),
                                                  std::numeric_limits<uint64_t>::max()};
            for (const auto* v : of(name)) {
                first = std::min(first, std::make_pair(v->timestamp, v->seq));
            }
            return first;
        };
        std::vector<std::string> latest;
        std::pair<int64_t, uint64_t> latest_key = {std::numeric_limits<int64_t>::min(), 0};
        for (const auto& name : candidates) {
            const auto key = earliest(name);
            if (latest.empty() || key > latest_key) {
                latest_key = key;
                latest.clear();
            }
            if (key == latest_key) {
                latest.push_back(name);
            }
        }
        if (latest.size() == 1) {
            method = "submission_time";
            return latest.front();
        }

        method = "random";
        std::uniform_int_distribution<size_t> pick(0, latest.size() - 1);
        if (ctx.rng) {
            return latest[pick(*ctx.rng)];
        }
        std::mt19937 rng{std::random_device{}()};
        return latest[pick(rng)];
    }
};

std::unique_ptr<tally_algorithm> make_tally_algorithm(voting_algorithm algorithm) {
    switch (algorithm) {
        case VOTING_ALGORITHM_SIMPLE_MAJORITY: return std::make_unique<simple_majority_tally>();
        case VOTING_ALGORITHM_CONFIDENCE_WEIGHTED: return std::make_unique<confidence_weighted_tally>();
        case VOTING_ALGORITHM_QUADRATIC: return std::make_unique<quadratic_tally>();
        case VOTING_ALGORITHM_CONSENSUS: return std::make_unique<consensus_tally>();
        case VOTING_ALGORITHM_RANKED_CHOICE: return std::make_unique<ranked_choice_tally>();
    }
    return nullptr;
}

} // namespace hive
