#pragma once

#include "message.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <random>

namespace hive {

enum voting_algorithm {
    VOTING_ALGORITHM_SIMPLE_MAJORITY,
    VOTING_ALGORITHM_CONFIDENCE_WEIGHTED,
    VOTING_ALGORITHM_QUADRATIC,
    VOTING_ALGORITHM_CONSENSUS,
    VOTING_ALGORITHM_RANKED_CHOICE
};

// "simple_majority", "confidence_weighted", "quadratic", "consensus", "ranked_choice"
const char* voting_algorithm_to_string(voting_algorithm algorithm);

// Returns false for unknown names
bool voting_algorithm_from_string(const std::string& str, voting_algorithm& out);

// One live ballot in a session
struct vote_record {
    std::string agent_id;
    std::string choice;
    std::vector<std::string> rankings;
    std::map<std::string, double> allocation;
    std::optional<double> confidence;
    int agent_level = 0;
    int64_t timestamp = 0;
    uint64_t seq = 0;            // Cast order within the session
    std::string signature;       // SHA-256 of the canonical ballot

    // Confidence used for weighting, 1.0 when absent
    double effective_confidence() const { return confidence.value_or(1.0); }

    // Single choice, or first ranked preference
    std::string first_choice() const;

    // Full ranking; a single choice is a one-element ranking
    std::vector<std::string> ballot() const;

    // Stable JSON text hashed into the audit chain
    std::string canonical() const;

    static vote_record from_payload(const vote_payload& vote);
};

// Quorum requirements, all must hold for a successful close
struct quorum_config {
    double min_participation = 0.5;   // Fraction of total_agents
    double min_confidence = 0.0;      // Mean confidence
    int min_experts = 0;
    int expert_level = 4;             // agent_level counted as expert
};

struct quorum_report {
    bool met = false;
    int participants = 0;
    double required_participants = 0.0;
    double mean_confidence = 0.0;
    int experts = 0;
    std::vector<std::string> failures;  // Human readable, one per unmet tier

    json to_json() const;
};

quorum_report check_quorum(const std::vector<vote_record>& votes, int total_agents, const quorum_config& quorum);

// One instant-runoff round
struct tally_round {
    int round = 0;
    std::map<std::string, double> tally;
    int active_ballots = 0;
    std::vector<std::string> eliminated;
    std::string tie_break;   // "", "confidence", "agent_level", "submission_time", "random"
};

struct tally_result {
    std::string winner;                     // Empty when no ballots counted
    std::map<std::string, double> tally;
    double winner_share = 0.0;
    int counted = 0;                        // Ballots that contributed
    bool consensus_reached = false;         // Consensus threshold only
    std::vector<tally_round> rounds;        // Ranked choice only
    std::string tie_break;                  // Last tie-break applied by ranked choice
};

struct tally_context {
    std::vector<std::string> options;       // Declared order, used for ties
    double consensus_threshold = 0.75;
    int tokens_per_agent = 100;
    std::mt19937* rng = nullptr;            // Last-resort ranked choice tie-break
};

// Pluggable counting strategy
class tally_algorithm {
public:
    virtual ~tally_algorithm() = default;

    virtual voting_algorithm kind() const = 0;

    virtual tally_result tally(const std::vector<vote_record>& votes, const tally_context& ctx) const = 0;
};

std::unique_ptr<tally_algorithm> make_tally_algorithm(voting_algorithm algorithm);

} // namespace hive
