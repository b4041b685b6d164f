#pragma once

#include "tally.h"
#include "audit.h"
#include "message.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>

namespace hive {

enum session_status {
    SESSION_STATUS_OPEN,
    SESSION_STATUS_CLOSED
};

const char* session_status_to_string(session_status status);

enum vote_status {
    VOTE_STATUS_SUCCESS,
    VOTE_STATUS_QUORUM_NOT_MET
};

// "SUCCESS" / "QUORUM_NOT_MET"
const char* vote_status_to_string(vote_status status);

struct voting_config {
    std::string topic;
    std::string question;
    std::vector<std::string> options;          // >= 2, unique
    voting_algorithm algorithm = VOTING_ALGORITHM_SIMPLE_MAJORITY;
    quorum_config quorum;
    int total_agents = 0;
    int64_t duration_ms = 300000;              // Deadline relative to creation
    double consensus_threshold = 0.75;
    int tokens_per_agent = 100;                // Quadratic budget
    std::string initiated_by;
};

struct voting_result {
    std::string session_id;
    vote_status status = VOTE_STATUS_QUORUM_NOT_MET;
    voting_algorithm algorithm = VOTING_ALGORITHM_SIMPLE_MAJORITY;
    std::string winner;
    std::map<std::string, double> tally;
    double winner_share = 0.0;
    int total_votes = 0;

    // Consensus threshold only: "CONSENSUS_ACHIEVED" or "NO_CONSENSUS"
    std::string consensus;
    bool consensus_reached = false;

    std::vector<tally_round> rounds;
    std::string tie_break;

    quorum_report quorum;
    std::string audit_hash;
    std::string close_reason;                  // "closed" or "deadline"
    int64_t closed_at = 0;

    json to_json() const;
};

struct voting_session {
    std::string id;
    voting_config config;
    session_status status = SESSION_STATUS_OPEN;
    int64_t created_at = 0;
    int64_t deadline = 0;                      // Absolute, ms
    std::vector<vote_record> votes;            // One live record per agent
    audit_trail audit;
    std::optional<voting_result> result;
    uint64_t next_seq = 0;
};

struct voting_callbacks {
    std::function<void(const voting_session&)> on_initiated;
    std::function<void(const std::string& session_id, const vote_record&)> on_vote_cast;
    std::function<void(const voting_result&)> on_closed;      // SUCCESS
    std::function<void(const voting_result&)> on_failed;      // QUORUM_NOT_MET
};

// Session lifecycle, tallying and audit for collective decisions
class voting_engine {
public:
    using broadcaster = std::function<void(const brainstorm_payload&)>;
    using result_publisher = std::function<void(const result_payload&)>;

    explicit voting_engine(const std::string& agent_id);
    ~voting_engine();

    voting_engine(const voting_engine&) = delete;
    voting_engine& operator=(const voting_engine&) = delete;

    // Opens and announces a session, throws validation_error on bad config
    std::string initiate_vote(const voting_config& config);

    // Upsert the agent's ballot; throws session_error for unknown, closed or
    // expired sessions and validation_error for bad ballots
    void cast_vote(const std::string& session_id, const vote_payload& vote);

    // Check quorum then tally. Repeat calls return the stored result.
    voting_result close_voting(const std::string& session_id);

    // nullopt while the session is open
    std::optional<voting_result> get_session_results(const std::string& session_id) const;

    std::vector<std::string> get_active_sessions() const;

    bool has_session(const std::string& session_id) const;

    // Snapshot of a session, throws session_error when unknown
    voting_session get_session(const std::string& session_id) const;

    // Recompute the hash chain and match it against the live ballots
    bool verify_integrity(const std::string& session_id) const;

    // Close every open session past its deadline, returns how many
    int close_expired();

    // Periodic close_expired on a background thread
    void start_ticker(int64_t interval_ms = 1000);
    void stop_ticker();

    void set_broadcaster(broadcaster fn);
    void set_result_publisher(result_publisher fn);
    void set_callbacks(voting_callbacks callbacks);

    // Seeds the last-resort ranked choice tie-break
    void set_random_seed(uint32_t seed);

    // Millisecond clock used for timestamps and deadlines
    void set_clock(std::function<int64_t()> clock);

    // Direct access to stored state, for audit tooling
    void with_session(const std::string& session_id, const std::function<void(voting_session&)>& fn);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace hive
