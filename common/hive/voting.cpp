#include "voting.h"
#include "failure.h"
#include "log.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>
#include <set>
#include <thread>

namespace hive {

const char* session_status_to_string(session_status status) {
    switch (status) {
        case SESSION_STATUS_OPEN: return "open";
        case SESSION_STATUS_CLOSED: return "closed";
        default: return "unknown";
    }
}

const char* vote_status_to_string(vote_status status) {
    switch (status) {
        case VOTE_STATUS_SUCCESS: return "SUCCESS";
        case VOTE_STATUS_QUORUM_NOT_MET: return "QUORUM_NOT_MET";
        default: return "UNKNOWN";
    }
}

json voting_result::to_json() const {
    json j;
    j["sessionId"] = session_id;
    j["status"] = vote_status_to_string(status);
    j["algorithm"] = voting_algorithm_to_string(algorithm);
    j["winner"] = winner;
    json t = json::object();
    for (const auto& [option, value] : tally) {
        t[option] = value;
    }
    j["tally"] = t;
    j["winnerShare"] = winner_share;
    j["totalVotes"] = total_votes;
    if (!consensus.empty()) {
        j["consensus"] = consensus;
        j["consensusReached"] = consensus_reached;
    }
    if (!rounds.empty()) {
        json rs = json::array();
        for (const auto& r : rounds) {
            json jr;
            jr["round"] = r.round;
            json rt = json::object();
            for (const auto& [option, value] : r.tally) {
                rt[option] = value;
            }
            jr["tally"] = rt;
            jr["activeBallots"] = r.active_ballots;
            jr["eliminated"] = r.eliminated;
            if (!r.tie_break.empty()) {
                jr["tieBreak"] = r.tie_break;
            }
            rs.push_back(jr);
        }
        j["rounds"] = rs;
        j["tieBreak"] = tie_break;
    }
    j["quorum"] = quorum.to_json();
    j["auditHash"] = audit_hash;
    j["closeReason"] = close_reason;
    j["closedAt"] = closed_at;
    return j;
}

struct voting_engine::impl {
    std::string agent_id;
    std::map<std::string, voting_session> sessions;
    mutable std::mutex mutex;

    broadcaster broadcast;
    result_publisher publish_result;
    voting_callbacks callbacks;

    std::mt19937 rng{std::random_device{}()};
    std::function<int64_t()> clock = get_timestamp_ms;

    std::thread ticker;
    std::atomic<bool> ticking{false};
    std::mutex ticker_mutex;
    std::condition_variable ticker_cv;

    explicit impl(const std::string& id) : agent_id(id) {}

    voting_session& find(const std::string& session_id) {
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            throw session_error(ERROR_TYPE_SESSION_NOT_FOUND, "voting session not found: " + session_id);
        }
        return it->second;
    }

    const voting_session& find(const std::string& session_id) const {
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            throw session_error(ERROR_TYPE_SESSION_NOT_FOUND, "voting session not found: " + session_id);
        }
        return it->second;
    }

    // Caller holds the mutex
    voting_result close_locked(voting_session& session, const std::string& reason) {
        voting_result result;
        result.session_id = session.id;
        result.algorithm = session.config.algorithm;
        result.total_votes = static_cast<int>(session.votes.size());
        result.quorum = check_quorum(session.votes, session.config.total_agents, session.config.quorum);
        result.audit_hash = session.audit.head();
        result.close_reason = reason;
        result.closed_at = clock();

        if (result.quorum.met) {
            tally_context ctx;
            ctx.options = session.config.options;
            ctx.consensus_threshold = session.config.consensus_threshold;
            ctx.tokens_per_agent = session.config.tokens_per_agent;
            ctx.rng = &rng;

            auto algorithm = make_tally_algorithm(session.config.algorithm);
            tally_result t = algorithm->tally(session.votes, ctx);

            result.status = VOTE_STATUS_SUCCESS;
            result.winner = t.winner;
            result.tally = t.tally;
            result.winner_share = t.winner_share;
            result.rounds = t.rounds;
            result.tie_break = t.tie_break;
            if (session.config.algorithm == VOTING_ALGORITHM_CONSENSUS) {
                result.consensus_reached = t.consensus_reached;
                result.consensus = t.consensus_reached ? "CONSENSUS_ACHIEVED" : "NO_CONSENSUS";
            }
        } else {
            result.status = VOTE_STATUS_QUORUM_NOT_MET;
        }

        session.status = SESSION_STATUS_CLOSED;
        session.result = result;
        return result;
    }

    // Observer and transport failures are logged, never propagated
    template<typename F>
    void guarded(const char* what, const std::string& session_id, F&& fn) {
        try {
            fn();
        } catch (const std::exception & e) {
            LOG_WRN("voting: %s failed for session %s: %s\n", what, session_id.c_str(), e.what());
        }
    }

    // Runs observers and the result publisher without the mutex held
    void after_close(const voting_result& result) {
        if (result.status == VOTE_STATUS_SUCCESS) {
            LOG_INF("voting: session %s closed (%s), winner '%s' share %.2f\n",
                    result.session_id.c_str(), result.close_reason.c_str(),
                    result.winner.c_str(), result.winner_share);
            if (callbacks.on_closed) {
                guarded("on_closed observer", result.session_id, [&]() { callbacks.on_closed(result); });
            }
        } else {
            std::string reasons;
            for (const auto& f : result.quorum.failures) {
                reasons += (reasons.empty() ? "" : "; ") + f;
            }
            LOG_WRN("voting: session %s closed without quorum: %s\n",
                    result.session_id.c_str(), reasons.c_str());
            if (callbacks.on_failed) {
                guarded("on_failed observer", result.session_id, [&]() { callbacks.on_failed(result); });
            }
        }

        if (!publish_result) {
            return;
        }
        result_payload payload;
        payload.kind = "voting_results";
        payload.session_id = result.session_id;
        payload.status = vote_status_to_string(result.status);
        payload.output = result.winner;
        payload.processed_by = agent_id;
        payload.completed_at = result.closed_at;
        payload.data = result.to_json();
        guarded("result publication", result.session_id, [&]() { publish_result(payload); });
    }

    void validate_ballot(const voting_session& session, const vote_payload& vote) const {
        const auto& options = session.config.options;
        auto declared = [&options](const std::string& name) {
            return std::find(options.begin(), options.end(), name) != options.end();
        };

        if (vote.agent_id.empty()) {
            throw validation_error("vote without agent id");
        }
        if (!is_valid_utf8(vote.agent_id)) {
            throw validation_error("vote agent id is not valid UTF-8");
        }
        if (vote.choice.empty() && vote.rankings.empty() && vote.allocation.empty()) {
            throw validation_error("vote from " + vote.agent_id + " has no choice, rankings or allocation");
        }
        if (!vote.choice.empty() && !declared(vote.choice)) {
            throw validation_error("unknown option '" + vote.choice + "'");
        }

        std::set<std::string> ranked;
        for (const auto& name : vote.rankings) {
            if (!declared(name)) {
                throw validation_error("unknown option '" + name + "' in rankings");
            }
            if (!ranked.insert(name).second) {
                throw validation_error("option '" + name + "' ranked twice");
            }
        }

        double spent = 0.0;
        for (const auto& [name, tokens] : vote.allocation) {
            if (!declared(name)) {
                throw validation_error("unknown option '" + name + "' in allocation");
            }
            if (tokens < 0.0) {
                throw validation_error("negative allocation for '" + name + "'");
            }
            spent += tokens;
        }
        if (session.config.algorithm == VOTING_ALGORITHM_QUADRATIC &&
            spent > static_cast<double>(session.config.tokens_per_agent)) {
            throw validation_error("allocation of " + std::to_string(spent) + " tokens exceeds budget of " +
                                   std::to_string(session.config.tokens_per_agent));
        }

        if (vote.confidence && (*vote.confidence < 0.0 || *vote.confidence > 1.0)) {
            throw validation_error("confidence must be within [0, 1]");
        }
    }
};

voting_engine::voting_engine(const std::string& agent_id)
    : pimpl(std::make_unique<impl>(agent_id)) {}

voting_engine::~voting_engine() {
    stop_ticker();
}

std::string voting_engine::initiate_vote(const voting_config& config) {
    if (config.topic.empty()) {
        throw validation_error("voting session needs a topic");
    }
    if (config.options.size() < 2) {
        throw validation_error("voting session needs at least 2 options");
    }
    if (!is_valid_utf8(config.topic) || !is_valid_utf8(config.question) || !is_valid_utf8(config.initiated_by)) {
        throw validation_error("voting session text is not valid UTF-8");
    }
    std::set<std::string> unique;
    for (const auto& option : config.options) {
        if (option.empty()) {
            throw validation_error("empty option name");
        }
        if (!is_valid_utf8(option)) {
            throw validation_error("option name is not valid UTF-8");
        }
        if (!unique.insert(option).second) {
            throw validation_error("duplicate option '" + option + "'");
        }
    }
    if (!make_tally_algorithm(config.algorithm)) {
        throw validation_error("unknown voting algorithm");
    }
    if (config.consensus_threshold <= 0.0 || config.consensus_threshold > 1.0) {
        throw validation_error("consensus threshold must be within (0, 1]");
    }
    if (config.algorithm == VOTING_ALGORITHM_QUADRATIC && config.tokens_per_agent <= 0) {
        throw validation_error("quadratic voting needs a positive token budget");
    }
    if (config.total_agents < 0) {
        throw validation_error("total agents must not be negative");
    }

    voting_session session;
    session.id = generate_uuid();
    session.config = config;
    if (session.config.initiated_by.empty()) {
        session.config.initiated_by = pimpl->agent_id;
    }
    if (session.config.duration_ms <= 0) {
        session.config.duration_ms = voting_config().duration_ms;
    }

    brainstorm_payload announcement;
    voting_session snapshot;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        session.created_at = pimpl->clock();
        session.deadline = session.created_at + session.config.duration_ms;
        snapshot = session;
        pimpl->sessions.emplace(session.id, std::move(session));
    }

    LOG_INF("voting: session %s opened on '%s' (%s, %zu options, %d agents)\n",
            snapshot.id.c_str(), snapshot.config.topic.c_str(),
            voting_algorithm_to_string(snapshot.config.algorithm),
            snapshot.config.options.size(), snapshot.config.total_agents);

    if (pimpl->callbacks.on_initiated) {
        pimpl->guarded("on_initiated observer", snapshot.id, [&]() { pimpl->callbacks.on_initiated(snapshot); });
    }

    if (pimpl->broadcast) {
        announcement.kind = "voting_session";
        announcement.session_id = snapshot.id;
        announcement.topic = snapshot.config.topic;
        announcement.question = snapshot.config.question.empty() ? snapshot.config.topic : snapshot.config.question;
        announcement.initiated_by = snapshot.config.initiated_by;
        announcement.options = snapshot.config.options;
        announcement.algorithm = voting_algorithm_to_string(snapshot.config.algorithm);
        announcement.deadline = snapshot.deadline;
        announcement.tokens_per_agent = snapshot.config.tokens_per_agent;
        pimpl->guarded("announcement", snapshot.id, [&]() { pimpl->broadcast(announcement); });
    }

    return snapshot.id;
}

void voting_engine::cast_vote(const std::string& session_id, const vote_payload& vote) {
    std::optional<voting_result> expired;
    vote_record record;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto& session = pimpl->find(session_id);

        if (session.status == SESSION_STATUS_CLOSED) {
            throw session_error(ERROR_TYPE_SESSION_CLOSED, "voting session closed: " + session_id);
        }

        const int64_t now = pimpl->clock();
        if (now > session.deadline) {
            expired = pimpl->close_locked(session, "deadline");
        } else {
            pimpl->validate_ballot(session, vote);

            record = vote_record::from_payload(vote);
            record.timestamp = now;
            record.seq = session.next_seq++;
            const std::string canonical = record.canonical();
            record.signature = sha256_hex(canonical);

            auto& votes = session.votes;
            votes.erase(std::remove_if(votes.begin(), votes.end(),
                [&record](const vote_record& v) { return v.agent_id == record.agent_id; }), votes.end());
            votes.push_back(record);

            session.audit.append(record.agent_id, canonical, now);
        }
    }

    if (expired) {
        pimpl->after_close(*expired);
        throw session_error(ERROR_TYPE_SESSION_CLOSED, "voting deadline passed for session " + session_id);
    }

    LOG_DBG("voting: %s cast in session %s\n", record.agent_id.c_str(), session_id.c_str());
    if (pimpl->callbacks.on_vote_cast) {
        pimpl->guarded("on_vote_cast observer", session_id, [&]() { pimpl->callbacks.on_vote_cast(session_id, record); });
    }
}

voting_result voting_engine::close_voting(const std::string& session_id) {
    voting_result result;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto& session = pimpl->find(session_id);
        if (session.status == SESSION_STATUS_CLOSED) {
            return *session.result;
        }
        result = pimpl->close_locked(session, "closed");
    }
    pimpl->after_close(result);
    return result;
}

std::optional<voting_result> voting_engine::get_session_results(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->find(session_id).result;
}

std::vector<std::string> voting_engine::get_active_sessions() const {
    std::vector<std::pair<int64_t, std::string>> open;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (const auto& [id, session] : pimpl->sessions) {
            if (session.status == SESSION_STATUS_OPEN) {
                open.emplace_back(session.created_at, id);
            }
        }
    }
    std::sort(open.begin(), open.end());

    std::vector<std::string> ids;
    for (const auto& [created, id] : open) {
        ids.push_back(id);
    }
    return ids;
}

bool voting_engine::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->sessions.find(session_id) != pimpl->sessions.end();
}

voting_session voting_engine::get_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->find(session_id);
}

bool voting_engine::verify_integrity(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    const auto& session = pimpl->find(session_id);

    if (!session.audit.verify()) {
        LOG_WRN("voting: audit chain of %s is broken\n", session_id.c_str());
        return false;
    }

    // every live ballot must be the latest chained entry of its agent
    std::set<std::string> agents;
    for (const auto& v : session.votes) {
        const std::string canonical = v.canonical();
        const audit_entry* entry = session.audit.latest_for(v.agent_id);
        if (!entry || entry->record != canonical || v.signature != sha256_hex(canonical)) {
            LOG_WRN("voting: ballot of %s in %s does not match the audit trail\n",
                    v.agent_id.c_str(), session_id.c_str());
            return false;
        }
        agents.insert(v.agent_id);
    }
    for (const auto& e : session.audit.entries()) {
        if (agents.find(e.agent_id) == agents.end()) {
            LOG_WRN("voting: ballot of %s missing from %s\n", e.agent_id.c_str(), session_id.c_str());
            return false;
        }
    }

    if (session.result && session.result->audit_hash != session.audit.head()) {
        return false;
    }
    return true;
}

int voting_engine::close_expired() {
    std::vector<voting_result> closed;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        const int64_t now = pimpl->clock();
        for (auto& [id, session] : pimpl->sessions) {
            if (session.status == SESSION_STATUS_OPEN && now > session.deadline) {
                closed.push_back(pimpl->close_locked(session, "deadline"));
            }
        }
    }
    for (const auto& result : closed) {
        pimpl->after_close(result);
    }
    return static_cast<int>(closed.size());
}

void voting_engine::start_ticker(int64_t interval_ms) {
    if (pimpl->ticking.exchange(true)) {
        return;
    }
    pimpl->ticker = std::thread([this, interval_ms]() {
        std::unique_lock<std::mutex> lock(pimpl->ticker_mutex);
        while (pimpl->ticking) {
            pimpl->ticker_cv.wait_for(lock, std::chrono::milliseconds(interval_ms));
            if (!pimpl->ticking) {
                break;
            }
            lock.unlock();
            const int n = close_expired();
            if (n > 0) {
                LOG_DBG("voting: ticker closed %d expired session(s)\n", n);
            }
            lock.lock();
        }
    });
}

void voting_engine::stop_ticker() {
    {
        std::lock_guard<std::mutex> lock(pimpl->ticker_mutex);
        pimpl->ticking = false;
    }
    pimpl->ticker_cv.notify_all();
    if (pimpl->ticker.joinable()) {
        pimpl->ticker.join();
    }
}

void voting_engine::set_broadcaster(broadcaster fn) {
    pimpl->broadcast = std::move(fn);
}

void voting_engine::set_result_publisher(result_publisher fn) {
    pimpl->publish_result = std::move(fn);
}

void voting_engine::set_callbacks(voting_callbacks callbacks) {
    pimpl->callbacks = std::move(callbacks);
}

void voting_engine::set_random_seed(uint32_t seed) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->rng.seed(seed);
}

void voting_engine::set_clock(std::function<int64_t()> clock) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->clock = std::move(clock);
}

void voting_engine::with_session(const std::string& session_id, const std::function<void(voting_session&)>& fn) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    fn(pimpl->find(session_id));
}

} // namespace hive
