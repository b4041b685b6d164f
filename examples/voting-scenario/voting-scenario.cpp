// In-process fleet scenario
// A team leader distributes tasks to three workers over an in-memory broker,
// then runs a ranked-choice vote among them and checks its audit trail

#include "../../common/log.h"
#include "../../common/hive/memory_broker.h"
#include "../../common/hive/connection.h"
#include "../../common/hive/client.h"
#include "../../common/hive/orchestrator.h"
#include "../../common/hive/voting.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace hive;

struct fleet_member {
    connection_manager conn;
    hive_client client;
    task_orchestrator orch;

    fleet_member(memory_broker& broker, const std::string& id, agent_role role)
        : conn(broker.factory(), broker_config()), client(conn, id), orch(client, role) {}
};

static int pump(hive_client& client) {
    int n = 0;
    while (client.poll(10)) {
        n++;
    }
    return n;
}

int main(int argc, char ** argv) {
    if (argc > 1 && std::string(argv[1]) == "-v") {
        common_log_set_verbosity_thold(1);
    }

    std::cout << "=== Fleet Voting Scenario ===\n\n";

    memory_broker broker;
    auto engine = std::make_shared<voting_engine>("leader-1");

    std::cout << "1. Connecting agents...\n";
    fleet_member leader(broker, "leader-1", AGENT_ROLE_TEAM_LEADER);
    std::vector<std::unique_ptr<fleet_member>> workers;
    const std::vector<std::vector<std::string>> preferences = {
        {"rust", "cpp", "go"},
        {"cpp", "go", "rust"},
        {"go", "cpp", "rust"},
    };
    for (size_t i = 0; i < preferences.size(); i++) {
        workers.push_back(std::make_unique<fleet_member>(broker, "worker-" + std::to_string(i + 1), AGENT_ROLE_WORKER));
    }

    try {
        leader.conn.connect();
        for (auto& w : workers) {
            w->conn.connect();
        }
    } catch (const connection_error & e) {
        std::cerr << "   connect failed: " << e.what() << "\n";
        return 1;
    }

    leader.orch.attach_voting(engine);
    leader.orch.start();
    for (size_t i = 0; i < workers.size(); i++) {
        auto& w = workers[i];
        const auto ranking = preferences[i];
        w->orch.set_task_executor([name = w->client.agent_id()](const task_payload& task, const std::vector<result_payload>&) {
            return name + " finished '" + task.title + "'";
        });
        w->orch.set_vote_responder([ranking](const brainstorm_payload&) -> std::optional<vote_payload> {
            vote_payload v;
            v.rankings = ranking;
            v.confidence = 0.7;
            return v;
        });
        w->orch.start();
    }
    std::cout << "   ✓ 1 leader, " << workers.size() << " workers\n\n";

    std::cout << "2. Distributing tasks...\n";
    for (const char* title : {"Profile the parser", "Shrink the binary", "Audit dependencies", "Write release notes"}) {
        task_payload task;
        task.title = title;
        task.priority = "normal";
        std::cout << "   assigned " << leader.orch.assign_task(task).substr(0, 8) << " " << title << "\n";
    }

    // competing consumers share the work queue
    int delivered = 0;
    for (int round = 0; round < 4; round++) {
        for (auto& w : workers) {
            delivered += w->client.poll(10) ? 1 : 0;
        }
    }
    pump(leader.client);
    std::cout << "   ✓ " << delivered << " deliveries, leader received "
              << leader.orch.get_stats().total_results << " results\n\n";

    std::cout << "3. Ranked-choice vote...\n";
    voting_config config;
    config.topic = "Implementation language";
    config.question = "Which language should the next service use?";
    config.options = {"rust", "cpp", "go"};
    config.algorithm = VOTING_ALGORITHM_RANKED_CHOICE;
    config.total_agents = static_cast<int>(workers.size());
    const std::string sid = leader.orch.initiate_vote(config);

    for (auto& w : workers) {
        pump(w->client);
    }
    pump(leader.client);

    const voting_result result = engine->close_voting(sid);
    std::cout << "   status: " << vote_status_to_string(result.status) << "\n";
    std::cout << "   winner: " << result.winner << " (share " << result.winner_share << ")\n";
    for (const auto& round : result.rounds) {
        std::cout << "   round " << round.round << ":";
        for (const auto& [option, count] : round.tally) {
            std::cout << " " << option << "=" << count;
        }
        if (!round.eliminated.empty()) {
            std::cout << " | eliminated " << round.eliminated.front();
            if (!round.tie_break.empty()) {
                std::cout << " by " << round.tie_break;
            }
        }
        std::cout << "\n";
    }
    std::cout << "   audit head: " << result.audit_hash.substr(0, 16) << "...\n";
    std::cout << "   integrity: " << (engine->verify_integrity(sid) ? "verified" : "BROKEN") << "\n\n";

    pump(leader.client);

    std::cout << "4. Shutting down...\n";
    for (auto& w : workers) {
        w->orch.shutdown();
    }
    pump(leader.client);
    for (const auto& [id, status] : leader.orch.get_known_agents()) {
        std::cout << "   " << id << ": " << status.event << "\n";
    }
    leader.orch.shutdown();

    std::cout << "\n=== Scenario completed ===\n";
    return 0;
}
