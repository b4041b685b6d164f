// Test suite for the hive messaging substrate: envelopes, routing, delivery
// retry, reconnect backoff and broker topology

#include "../common/hive/message.h"
#include "../common/hive/router.h"
#include "../common/hive/delivery.h"
#include "../common/hive/failure.h"
#include "../common/hive/connection.h"
#include "../common/hive/topology.h"
#include "../common/hive/client.h"
#include "../common/hive/memory_broker.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace hive;

// Test helpers
#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << msg << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
        return false; \
    } \
} while(0)

#define RUN_TEST(test_func) do { \
    std::cout << "Running " << #test_func << "..." << std::endl; \
    if (test_func()) { \
        std::cout << "  PASS" << std::endl; \
        passed++; \
    } else { \
        std::cout << "  FAIL" << std::endl; \
        failed++; \
    } \
    total++; \
} while(0)

// Records settlement calls
class mock_controls : public delivery_controls {
public:
    int acks = 0;
    int nacks = 0;
    int requeues = 0;
    int rejects = 0;
    redelivery_info carried;

    void ack() override { acks++; }
    void nack(bool requeue) override { nacks++; if (requeue) requeues++; }
    void reject() override { rejects++; }
    void requeue(const redelivery_info& info) override { carried = info; nack(true); }
};

// Records connection events
class recording_listener : public connection_listener {
public:
    int connected = 0;
    int disconnected = 0;
    int errors = 0;
    int max_reconnect = 0;
    int max_reconnect_attempts = 0;

    void on_connected() override { connected++; }
    void on_disconnected(const std::string&) override { disconnected++; }
    void on_error(const error&) override { errors++; }
    void on_max_reconnect(int attempts) override { max_reconnect++; max_reconnect_attempts = attempts; }
};

// One agent wired to an in-process broker
struct test_agent {
    connection_manager conn;
    hive_client client;

    test_agent(memory_broker& broker, const std::string& id)
        : conn(broker.factory(), broker_config()), client(conn, id) {
        conn.set_sleep_function([](int64_t) {});
        conn.connect();
    }
};

static task_payload make_task(const std::string& title) {
    task_payload task;
    task.title = title;
    task.description = "Description of " + title;
    task.assigned_by = "leader-1";
    task.assigned_at = 1700000000000;
    return task;
}

template<typename F>
static bool throws_validation(F&& fn) {
    try {
        fn();
    } catch (const validation_error&) {
        return true;
    }
    return false;
}

// Test 1: UUID generation
static bool test_uuid_generation() {
    std::string a = generate_uuid();
    std::string b = generate_uuid();

    TEST_ASSERT(a.length() == 36, "UUID should be 36 characters");
    TEST_ASSERT(a[14] == '4', "UUID should be version 4");
    TEST_ASSERT(a != b, "UUIDs should be unique");

    return true;
}

// Test 2: Envelope round trip for every payload kind
static bool test_envelope_round_trip() {
    task_payload task = make_task("Analyze logs");
    task.priority = "high";
    task.requires_collaboration = true;
    task.collaboration_question = "Which subsystem first?";
    task.required_agents = {"a", "b"};
    task.retry_count = 2;
    task.context = json{{"region", "eu"}, {"shards", 4}};

    brainstorm_payload brainstorm;
    brainstorm.session_id = generate_uuid();
    brainstorm.topic = "Release date";
    brainstorm.question = "When do we ship?";
    brainstorm.initiated_by = "leader-1";
    brainstorm.kind = "voting_session";
    brainstorm.options = {"monday", "friday"};
    brainstorm.algorithm = "ranked_choice";
    brainstorm.deadline = 1700000300000;
    brainstorm.tokens_per_agent = 100;

    result_payload result;
    result.task_id = generate_uuid();
    result.status = "completed";
    result.output = "done";
    result.processed_by = "worker-1";
    result.completed_at = 1700000001000;
    result.duration_ms = 42;

    status_payload status;
    status.agent_id = "worker-1";
    status.agent_type = "worker";
    status.event = "connected";
    status.data = json{{"name", "Worker One"}};

    vote_payload vote;
    vote.session_id = brainstorm.session_id;
    vote.agent_id = "worker-2";
    vote.rankings = {"friday", "monday"};
    vote.allocation = {{"friday", 64.0}, {"monday", 36.0}};
    vote.confidence = 0.75;
    vote.agent_level = 5;

    std::vector<envelope> envelopes = {
        envelope::make("leader-1", task),
        envelope::make("leader-1", brainstorm),
        envelope::make("worker-1", result),
        envelope::make("worker-1", status),
        envelope::make("worker-2", vote),
    };

    for (const auto& env : envelopes) {
        envelope parsed = envelope::parse(env.serialize());
        TEST_ASSERT(parsed == env, std::string("Round trip should preserve ") + envelope_type_to_string(env.type()));
    }

    // absent confidence stays absent
    vote.confidence.reset();
    envelope no_conf = envelope::make("worker-2", vote);
    TEST_ASSERT(!std::get<vote_payload>(envelope::parse(no_conf.serialize()).payload).confidence.has_value(),
                "Absent confidence should stay absent");

    return true;
}

// Test 3: Wire format field names
static bool test_envelope_wire_format() {
    envelope env = envelope::make("leader-1", make_task("Wire"));
    json j = json::parse(env.serialize());

    TEST_ASSERT(j["type"] == "task", "Type should be 'task'");
    TEST_ASSERT(j["from"] == "leader-1", "Sender should be in 'from'");
    TEST_ASSERT(j.contains("task"), "Task body should be under 'task'");
    TEST_ASSERT(j["task"]["assignedBy"] == "leader-1", "Task fields should be camelCase");

    brainstorm_payload b;
    b.session_id = "s1";
    b.topic = "t";
    b.question = "q";
    b.initiated_by = "leader-1";
    json jb = json::parse(envelope::make("leader-1", b).serialize());
    TEST_ASSERT(jb.contains("message"), "Brainstorm body should be under 'message'");
    TEST_ASSERT(jb["message"]["sessionId"] == "s1", "Brainstorm sessionId should be camelCase");

    return true;
}

// Test 4: Validation failures
static bool test_envelope_validation() {
    TEST_ASSERT(throws_validation([] { envelope::parse("{not json"); }), "Malformed JSON should fail");
    TEST_ASSERT(throws_validation([] { envelope::parse("[1,2,3]"); }), "Non-object should fail");
    TEST_ASSERT(throws_validation([] {
        envelope::parse(R"({"id":"1","type":"gossip","from":"a","timestamp":1})");
    }), "Unknown type should fail");
    TEST_ASSERT(throws_validation([] {
        envelope::parse(R"({"id":"1","type":"task","from":"a","timestamp":1})");
    }), "Missing body should fail");
    TEST_ASSERT(throws_validation([] {
        envelope::parse(R"({"id":"1","type":"task","from":"a","timestamp":1,"task":{"description":"x"}})");
    }), "Task without title should fail");
    TEST_ASSERT(throws_validation([] {
        envelope::parse(R"({"id":"1","type":"result","from":"a","timestamp":1,"result":{"status":"ok"}})");
    }), "Result without taskId or sessionId should fail");
    TEST_ASSERT(throws_validation([] {
        envelope::parse(R"({"id":"1","type":"task","from":"a","timestamp":1,"task":{"title":5}})");
    }), "Wrongly typed field should fail");

    envelope env = envelope::make("", make_task("No sender"));
    TEST_ASSERT(throws_validation([&] { env.validate(); }), "Envelope without sender should fail");

    return true;
}

// Test 5: Router dispatch by type
static bool test_router_dispatch() {
    message_router router;
    std::string seen_title;
    router.on_task([&](const envelope&, const task_payload& task, delivery_controls& c) {
        seen_title = task.title;
        c.ack();
    });

    TEST_ASSERT(router.has_handler(ENVELOPE_TYPE_TASK), "Task handler should be registered");
    TEST_ASSERT(!router.has_handler(ENVELOPE_TYPE_STATUS), "Status handler should not be registered");

    mock_controls controls;
    router.route(envelope::make("leader-1", make_task("Routed")), controls);
    TEST_ASSERT(seen_title == "Routed", "Task handler should receive payload");
    TEST_ASSERT(controls.acks == 1, "Handler should ack");

    status_payload s;
    s.agent_id = "a";
    s.event = "connected";
    TEST_ASSERT(throws_validation([&] { router.route(envelope::make("a", s), controls); }),
                "Unregistered type should be an error");

    router.remove(ENVELOPE_TYPE_TASK);
    TEST_ASSERT(!router.has_handler(ENVELOPE_TYPE_TASK), "Removed handler should be gone");

    return true;
}

// Test 6: Transient handler failure recovers within the retry budget
static bool test_delivery_retry_then_success() {
    delivery_controller controller("worker-1");
    envelope env = envelope::make("leader-1", make_task("Flaky"));
    const std::string body = env.serialize();

    int attempts = 0;
    auto handler = [&](const envelope&, delivery_controls&) {
        if (++attempts < 3) {
            throw std::runtime_error("transient failure");
        }
    };

    mock_controls controls;
    TEST_ASSERT(controller.process(env.id, body, controls, handler) == DELIVERY_REQUEUED, "Attempt 1 should requeue");
    TEST_ASSERT(controls.carried.failures == 1, "Redelivery record should count 1 failure");
    TEST_ASSERT(controls.carried.message_id == env.id, "Redelivery record keyed by envelope id");
    TEST_ASSERT(controls.carried.history.size() == 1, "One failure recorded");

    TEST_ASSERT(controller.process(env.id, body, controls.carried, controls, handler) == DELIVERY_REQUEUED,
                "Attempt 2 should requeue");
    TEST_ASSERT(controls.carried.failures == 2, "Redelivery record should count 2 failures");
    TEST_ASSERT(controller.process(env.id, body, controls.carried, controls, handler) == DELIVERY_ACKED,
                "Attempt 3 should ack");

    TEST_ASSERT(controls.acks == 1, "Exactly one ack");
    TEST_ASSERT(controls.nacks == 2 && controls.requeues == 2, "Exactly two nack(requeue=true)");
    TEST_ASSERT(controls.rejects == 0, "No reject");
    TEST_ASSERT(controller.dead_letters().size() == 0, "Nothing dead-lettered");

    // the record survives the trip through a broker header
    redelivery_info decoded = redelivery_info::from_header(controls.carried.to_header());
    TEST_ASSERT(decoded.failures == 2 && decoded.history.size() == 2, "Header keeps count and history");
    TEST_ASSERT(decoded.history[1].attempt == 2 && decoded.history[1].error_message == "transient failure",
                "Header keeps each failure");
    TEST_ASSERT(throws_validation([] { redelivery_info::from_header("{not json"); }),
                "Malformed header is a validation error");

    return true;
}

// Test 7: Poison message ends in dead-letter with full history
static bool test_delivery_dead_letter() {
    delivery_controller controller("worker-1");
    envelope env = envelope::make("leader-1", make_task("Poison"));
    const std::string body = env.serialize();

    auto handler = [](const envelope&, delivery_controls&) {
        throw std::runtime_error("always broken");
    };

    mock_controls controls;
    for (int i = 0; i < 3; i++) {
        TEST_ASSERT(controller.process(env.id, body, controls.carried, controls, handler) == DELIVERY_REQUEUED,
                    "First three attempts should requeue");
    }
    TEST_ASSERT(controller.process(env.id, body, controls.carried, controls, handler) == DELIVERY_REJECTED,
                "Fourth attempt should reject");

    TEST_ASSERT(controls.nacks == 3, "Three nacks");
    TEST_ASSERT(controls.rejects == 1, "One reject");
    TEST_ASSERT(controls.acks == 0, "No ack");

    auto letter = controller.dead_letters().get_message(env.id);
    TEST_ASSERT(letter.has_value(), "Message should be dead-lettered by original id");
    TEST_ASSERT(letter->error == ERROR_TYPE_RETRY_EXHAUSTED, "Error should be retry exhausted");
    TEST_ASSERT(letter->error_message == "always broken", "Original error should be preserved");
    TEST_ASSERT(letter->history.size() == 4, "History should hold every attempt");
    TEST_ASSERT(letter->history.front().attempt == 1 && letter->history.back().attempt == 4,
                "History should be ordered by attempt");
    TEST_ASSERT(letter->payload == body, "Payload should be kept");

    return true;
}

// Test 8: Malformed input is rejected without retry
static bool test_delivery_malformed() {
    delivery_controller controller("worker-1");
    bool called = false;
    auto handler = [&](const envelope&, delivery_controls&) { called = true; };

    mock_controls controls;
    TEST_ASSERT(controller.process("broker-msg-1", "{\"id\": ", controls, handler) == DELIVERY_REJECTED,
                "Malformed body should be rejected");
    TEST_ASSERT(!called, "Handler should not run");
    TEST_ASSERT(controls.rejects == 1 && controls.nacks == 0, "Reject once, never requeue");

    auto letter = controller.dead_letters().get_message("broker-msg-1");
    TEST_ASSERT(letter.has_value() && letter->error == ERROR_TYPE_VALIDATION, "Dead letter should carry validation error");
    TEST_ASSERT(controller.get_stats().malformed == 1, "Malformed counter");

    // handler-raised validation errors are terminal too
    envelope env = envelope::make("leader-1", make_task("Invalid downstream"));
    mock_controls c2;
    controller.process(env.id, env.serialize(), c2, [](const envelope&, delivery_controls&) {
        throw validation_error("bad context");
    });
    TEST_ASSERT(c2.rejects == 1 && c2.nacks == 0, "Validation error from handler should not retry");

    return true;
}

// Test 9: Dead letter store
static bool test_dead_letter_queue() {
    dead_letter_queue dlq(2);

    failure_record rec;
    rec.agent_id = "worker-1";
    rec.error = ERROR_TYPE_HANDLER;
    rec.error_message = "boom";
    rec.timestamp = 1;
    rec.attempt = 1;

    for (const char* id : {"m1", "m2", "m3"}) {
        rec.message_id = id;
        dlq.add_message(id, "{}", rec, {rec});
    }

    TEST_ASSERT(dlq.size() == 2, "Store should be bounded");
    TEST_ASSERT(!dlq.contains("m1"), "Oldest should be evicted");
    TEST_ASSERT(dlq.contains("m3"), "Newest should be kept");
    TEST_ASSERT(dlq.get_messages(10).front().message_id == "m2", "Listing is oldest first");
    TEST_ASSERT(dlq.remove_message("m2"), "Remove should succeed");
    TEST_ASSERT(!dlq.remove_message("m2"), "Second remove should fail");
    dlq.clear();
    TEST_ASSERT(dlq.size() == 0, "Clear should empty the store");

    failure_record parsed = failure_record::from_json(rec.to_json());
    TEST_ASSERT(parsed.error == ERROR_TYPE_HANDLER && parsed.error_message == "boom", "Failure record JSON round trip");

    return true;
}

// Test 10: Backoff schedule
static bool test_backoff_schedule() {
    failure_policy policy = failure_policy::default_policy();
    const int64_t expected[] = {1000, 2000, 4000, 8000, 16000, 30000, 30000, 30000, 30000, 30000};
    for (int n = 0; n < 10; n++) {
        TEST_ASSERT(policy.backoff_delay_ms(n) == expected[n], "Backoff should be min(1000*2^n, 30000)");
    }
    TEST_ASSERT(policy.max_reconnect_attempts == 10, "Reconnect cap should be 10");
    TEST_ASSERT(policy.max_retries == 3, "Default max retries should be 3");

    return true;
}

// Test 11: Reconnect gives up after 10 attempts
static bool test_reconnect_max_attempts() {
    memory_broker broker;
    connection_manager conn(broker.factory(), broker_config());
    recording_listener listener;
    conn.add_listener(&listener);

    std::vector<int64_t> sleeps;
    conn.set_sleep_function([&](int64_t ms) { sleeps.push_back(ms); });

    conn.connect();
    TEST_ASSERT(conn.is_healthy(), "Should be healthy after connect");
    TEST_ASSERT(listener.connected == 1, "Connected should fire once");

    broker.set_reachable(false);
    broker.sever_connections();
    TEST_ASSERT(!conn.is_healthy(), "Should be unhealthy after sever");

    TEST_ASSERT(!conn.on_channel_lost("connection reset"), "Reconnect should fail");
    TEST_ASSERT(sleeps.size() == 10, "Ten attempts should be made");
    for (int n = 0; n < 10; n++) {
        TEST_ASSERT(sleeps[n] == failure_policy::default_policy().backoff_delay_ms(n), "Delays should follow backoff");
    }
    TEST_ASSERT(listener.max_reconnect == 1, "Max reconnect should fire once");
    TEST_ASSERT(listener.max_reconnect_attempts == 10, "Max reconnect should report 10 attempts");
    TEST_ASSERT(conn.reconnect_exhausted(), "Budget should be exhausted");

    // no more automatic attempts
    TEST_ASSERT(!conn.reconnect(), "Exhausted manager should not retry");
    TEST_ASSERT(sleeps.size() == 10, "No further sleeps");
    TEST_ASSERT(listener.max_reconnect == 2, "Signal repeats on every refused reconnect");

    bool threw = false;
    try {
        conn.with_channel([](broker_channel&) {});
    } catch (const max_reconnect_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Channel use after exhaustion should raise max_reconnect_error");

    conn.remove_listener(&listener);
    return true;
}

// Test 12: Reconnect succeeds once the broker returns
static bool test_reconnect_recovers() {
    memory_broker broker;
    connection_manager conn(broker.factory(), broker_config());
    recording_listener listener;
    conn.add_listener(&listener);

    int sleeps = 0;
    conn.set_sleep_function([&](int64_t) {
        if (++sleeps == 3) {
            broker.set_reachable(true);
        }
    });

    conn.connect();
    broker.set_reachable(false);
    broker.sever_connections();

    TEST_ASSERT(conn.on_channel_lost("heartbeat missed"), "Reconnect should succeed");
    TEST_ASSERT(sleeps == 3, "Third attempt should succeed");
    TEST_ASSERT(conn.is_healthy(), "Should be healthy again");
    TEST_ASSERT(conn.reconnect_attempts() == 0, "Attempt counter resets on success");
    TEST_ASSERT(listener.connected == 2, "Connected fires for connect and reconnect");
    TEST_ASSERT(listener.errors >= 3, "Each failure should be reported");

    conn.remove_listener(&listener);
    return true;
}

// Test 13: Connect failure, auto-reconnect off, idempotent close
static bool test_connection_lifecycle() {
    memory_broker broker;
    broker.set_reachable(false);

    connection_manager conn(broker.factory(), broker_config(), failure_policy::default_policy(), false);
    bool threw = false;
    try {
        conn.connect();
    } catch (const connection_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Unreachable broker should raise connection_error");
    TEST_ASSERT(!conn.is_healthy(), "Should not be healthy");

    broker.set_reachable(true);
    conn.connect();
    TEST_ASSERT(conn.is_healthy(), "Should connect once reachable");
    TEST_ASSERT(broker.open_channel_count() == 1, "One channel open");

    broker.sever_connections();
    TEST_ASSERT(!conn.on_channel_lost("gone"), "Without auto-reconnect the loss is final");
    TEST_ASSERT(conn.reconnect_attempts() == 0, "No reconnect attempts");

    conn.close();
    conn.close();
    TEST_ASSERT(!conn.is_healthy(), "Closed manager is not healthy");
    TEST_ASSERT(broker.open_channel_count() == 0, "No channel left open");

    return true;
}

// Test 14: Topology declarations are idempotent
static bool test_topology_idempotent() {
    memory_broker broker;
    auto ch = broker.open(broker_config());
    topology_builder topology("worker-1");

    topology.declare_shared(*ch);
    topology.declare_brainstorm_inbox(*ch);
    topology.declare_status_subscription(*ch, "agent.status.#");
    topology.declare_all(*ch);
    topology.declare_all(*ch);

    TEST_ASSERT(broker.has_queue("agent.tasks"), "Work queue declared");
    TEST_ASSERT(broker.has_queue("agent.results"), "Results queue declared");
    TEST_ASSERT(broker.has_exchange("agent.brainstorm"), "Fanout exchange declared");
    TEST_ASSERT(broker.has_exchange("agent.status"), "Topic exchange declared");
    TEST_ASSERT(broker.has_queue("brainstorm.worker-1"), "Inbox declared");
    TEST_ASSERT(broker.has_queue("status.worker-1"), "Status queue declared");

    queue_options different = topology.task_queue_options();
    different.max_length = 5;
    bool threw = false;
    try {
        ch->declare_queue("agent.tasks", different);
    } catch (const channel_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Redeclaring with different properties should fail");

    ch->close();
    TEST_ASSERT(!broker.has_queue("brainstorm.worker-1"), "Exclusive inbox goes with its channel");
    TEST_ASSERT(broker.has_queue("agent.tasks"), "Durable queue survives");

    return true;
}

// Test 15: Topic pattern matching
static bool test_topic_matching() {
    TEST_ASSERT(topic_matches("agent.status.#", "agent.status.connected"), "# matches one word");
    TEST_ASSERT(topic_matches("agent.status.#", "agent.status.task.completed"), "# matches many words");
    TEST_ASSERT(topic_matches("agent.status.#", "agent.status"), "# matches zero words");
    TEST_ASSERT(topic_matches("agent.status.task.*", "agent.status.task.failed"), "* matches one word");
    TEST_ASSERT(!topic_matches("agent.status.task.*", "agent.status.task"), "* needs a word");
    TEST_ASSERT(!topic_matches("agent.status.task.*", "agent.status.task.a.b"), "* matches only one word");
    TEST_ASSERT(topic_matches("#", "anything.at.all"), "# alone matches everything");
    TEST_ASSERT(!topic_matches("agent.result", "agent.status"), "Literal mismatch");

    return true;
}

// Test 16: Broadcast reaches every agent, senders ignore their own
static bool test_broadcast_fanout() {
    memory_broker broker;
    test_agent a(broker, "agent-a");
    test_agent b(broker, "agent-b");
    test_agent c(broker, "agent-c");

    int a_seen = 0, b_seen = 0, c_seen = 0;
    a.client.listen_brainstorm([&](const envelope&, delivery_controls&) { a_seen++; });
    b.client.listen_brainstorm([&](const envelope&, delivery_controls&) { b_seen++; });
    c.client.listen_brainstorm([&](const envelope&, delivery_controls&) { c_seen++; });

    brainstorm_payload msg;
    msg.session_id = generate_uuid();
    msg.topic = "Caching";
    msg.question = "Where should we cache?";
    msg.initiated_by = "agent-a";
    a.client.broadcast_brainstorm(msg);

    TEST_ASSERT(a.client.poll(50), "Sender also receives the copy");
    TEST_ASSERT(b.client.poll(50), "Agent b should receive");
    TEST_ASSERT(c.client.poll(50), "Agent c should receive");

    TEST_ASSERT(a_seen == 0, "Sender should ignore its own broadcast");
    TEST_ASSERT(a.client.get_stats().own_ignored == 1, "Own message counted as ignored");
    TEST_ASSERT(b_seen == 1 && c_seen == 1, "Every other agent handles it once");
    TEST_ASSERT(broker.unacked_count() == 0, "Everything acked");

    return true;
}

// Test 17: Status routing by topic pattern
static bool test_status_topic_routing() {
    memory_broker broker;
    test_agent monitor(broker, "monitor-1");
    test_agent worker(broker, "worker-1");

    std::vector<std::string> events;
    monitor.client.subscribe_status([&](const envelope& env, delivery_controls&) {
        events.push_back(std::get<status_payload>(env.payload).event);
    }, "agent.status.task.*");

    status_payload s;
    s.agent_id = "worker-1";
    s.agent_type = "worker";

    s.event = "task.completed";
    worker.client.publish_status(s, "agent.status.task.completed");
    s.event = "connected";
    worker.client.publish_status(s, "agent.status.connected");

    TEST_ASSERT(monitor.client.poll(50), "Task event should be routed");
    TEST_ASSERT(!monitor.client.poll(20), "Connected event should not match the pattern");
    TEST_ASSERT(events.size() == 1 && events[0] == "task.completed", "Only the matching event is seen");

    return true;
}

// Test 18: Competing consumers each get distinct tasks
static bool test_competing_consumers() {
    memory_broker broker;
    test_agent leader(broker, "leader-1");
    test_agent w1(broker, "worker-1");
    test_agent w2(broker, "worker-2");

    std::vector<std::string> seen;
    auto handler = [&](const envelope& env, delivery_controls&) { seen.push_back(env.id); };
    w1.client.consume_tasks(handler);
    w2.client.consume_tasks(handler);

    std::vector<std::string> ids;
    for (int i = 0; i < 4; i++) {
        ids.push_back(leader.client.publish_task(make_task("Task " + std::to_string(i))));
    }
    TEST_ASSERT(broker.queue_depth("agent.tasks") == 4, "Four tasks queued");

    int delivered = 0;
    for (int i = 0; i < 4; i++) {
        if (w1.client.poll(10)) delivered++;
        if (w2.client.poll(10)) delivered++;
    }

    TEST_ASSERT(delivered == 4, "Each task delivered exactly once");
    TEST_ASSERT(seen.size() == 4, "Handlers saw four tasks");
    for (const auto& id : ids) {
        TEST_ASSERT(std::count(seen.begin(), seen.end(), id) == 1, "No task delivered twice");
    }
    TEST_ASSERT(broker.queue_depth("agent.tasks") == 0, "Queue drained");

    return true;
}

// Test 19: Failed task is redelivered by the broker then acked
static bool test_task_redelivery_through_broker() {
    memory_broker broker;
    test_agent leader(broker, "leader-1");
    test_agent worker(broker, "worker-1");

    int attempts = 0;
    std::vector<delivery_outcome> outcomes;
    worker.client.set_outcome_listener([&](const std::string&, delivery_outcome o) { outcomes.push_back(o); });
    worker.client.consume_tasks([&](const envelope&, delivery_controls&) {
        if (++attempts < 3) {
            throw std::runtime_error("not yet");
        }
    });

    leader.client.publish_task(make_task("Eventually"));

    for (int i = 0; i < 3; i++) {
        TEST_ASSERT(worker.client.poll(50), "Delivery expected");
    }

    TEST_ASSERT(attempts == 3, "Three attempts");
    TEST_ASSERT(outcomes.size() == 3, "Three outcomes");
    TEST_ASSERT(outcomes[0] == DELIVERY_REQUEUED && outcomes[1] == DELIVERY_REQUEUED, "Two requeues");
    TEST_ASSERT(outcomes[2] == DELIVERY_ACKED, "Final ack");
    TEST_ASSERT(broker.queue_depth("agent.tasks") == 0, "Queue empty");
    TEST_ASSERT(worker.client.controller().dead_letters().size() == 0, "No dead letters");
    TEST_ASSERT(!worker.client.poll(10), "Nothing left to deliver");

    return true;
}

// Test 20: Retry budget is shared by competing consumers
static bool test_retry_budget_across_consumers() {
    memory_broker broker;
    test_agent leader(broker, "leader-1");
    test_agent a(broker, "worker-a");
    test_agent b(broker, "worker-b");

    int calls = 0;
    int requeued = 0;
    int rejected = 0;
    auto handler = [&](const envelope&, delivery_controls&) {
        calls++;
        throw std::runtime_error("poison");
    };
    auto count = [&](const std::string&, delivery_outcome o) {
        if (o == DELIVERY_REQUEUED) requeued++;
        if (o == DELIVERY_REJECTED) rejected++;
    };
    a.client.consume_tasks(handler);
    b.client.consume_tasks(handler);
    a.client.set_outcome_listener(count);
    b.client.set_outcome_listener(count);

    const std::string id = leader.client.publish_task(make_task("Poison"));

    for (int i = 0; i < 4; i++) {
        hive_client& next = (i % 2 == 0) ? a.client : b.client;
        TEST_ASSERT(next.poll(50), "Each attempt reaches the next consumer");
    }
    TEST_ASSERT(!a.client.poll(10) && !b.client.poll(10), "No fifth attempt");

    TEST_ASSERT(calls == 4, "Handler ran max_retries + 1 times across the fleet");
    TEST_ASSERT(requeued == 3 && rejected == 1, "Three requeues then one reject");
    TEST_ASSERT(broker.queue_depth("agent.tasks") == 0 && broker.unacked_count() == 0, "Nothing left in flight");

    auto letter = b.client.controller().dead_letters().get_message(id);
    TEST_ASSERT(letter.has_value(), "Last consumer dead-letters the task");
    TEST_ASSERT(letter->error == ERROR_TYPE_RETRY_EXHAUSTED, "Retry exhausted");
    TEST_ASSERT(letter->history.size() == 4, "History spans both consumers");
    TEST_ASSERT(letter->history[0].agent_id == "worker-a" && letter->history[1].agent_id == "worker-b",
                "History records which agent failed");
    TEST_ASSERT(a.client.controller().dead_letters().size() == 0, "First consumer holds no letter");

    return true;
}

// Test 21: Consumers come back after a reconnect
static bool test_reconnect_restores_consumers() {
    memory_broker broker;
    test_agent leader(broker, "leader-1");
    test_agent worker(broker, "worker-1");

    int handled = 0;
    worker.client.consume_tasks([&](const envelope&, delivery_controls&) { handled++; });
    worker.client.listen_brainstorm([&](const envelope&, delivery_controls&) { handled++; });

    broker.sever_connections();
    TEST_ASSERT(!worker.client.poll(10), "Poll on a dead channel reconnects instead of delivering");
    TEST_ASSERT(worker.conn.is_healthy(), "Worker reconnected");
    TEST_ASSERT(broker.has_queue("brainstorm.worker-1"), "Inbox redeclared");

    if (!leader.conn.is_healthy()) {
        TEST_ASSERT(leader.conn.on_channel_lost("severed"), "Leader reconnects");
    }
    leader.client.publish_task(make_task("After reconnect"));

    brainstorm_payload msg;
    msg.session_id = generate_uuid();
    msg.topic = "t";
    msg.question = "q";
    msg.initiated_by = "leader-1";
    leader.client.broadcast_brainstorm(msg);

    TEST_ASSERT(worker.client.poll(50), "Task consumer restored");
    TEST_ASSERT(worker.client.poll(50), "Brainstorm consumer restored");
    TEST_ASSERT(handled == 2, "Both handlers ran");

    return true;
}

// Test 22: Queue limits of the in-process broker
static bool test_queue_limits() {
    memory_broker broker;
    auto ch = broker.open(broker_config());

    queue_options bounded;
    bounded.max_length = 2;
    ch->declare_queue("bounded", bounded);

    outbound_message msg;
    for (int i = 0; i < 3; i++) {
        msg.body = "m" + std::to_string(i);
        ch->publish("", "bounded", msg);
    }
    TEST_ASSERT(broker.queue_depth("bounded") == 2, "Max length drops the head");
    TEST_ASSERT(broker.dropped_count() == 1, "One message dropped");

    ch->consume("bounded", false);
    delivery d;
    TEST_ASSERT(ch->next_delivery(d, 10), "Delivery expected");
    TEST_ASSERT(d.body == "m1", "Oldest surviving message first");
    ch->nack(d, true);
    TEST_ASSERT(ch->next_delivery(d, 10), "Requeued message comes back");
    TEST_ASSERT(d.body == "m1" && d.redelivered, "Requeued message is flagged redelivered");
    ch->reject(d);
    TEST_ASSERT(broker.dropped_count() == 2, "Rejected message dropped");

    return true;
}

// Test 23: Error type conversion
static bool test_error_type_conversion() {
    TEST_ASSERT(std::string(error_type_to_string(ERROR_TYPE_CONNECTION)) == "connection", "Connection");
    TEST_ASSERT(std::string(error_type_to_string(ERROR_TYPE_VALIDATION)) == "validation", "Validation");
    TEST_ASSERT(std::string(error_type_to_string(ERROR_TYPE_RETRY_EXHAUSTED)) == "retry_exhausted", "Retry exhausted");
    TEST_ASSERT(std::string(delivery_outcome_to_string(DELIVERY_REQUEUED)) == "requeued", "Outcome");

    channel_error e("lost");
    TEST_ASSERT(e.type() == ERROR_TYPE_CHANNEL, "channel_error carries its type");

    return true;
}

int main() {
    std::cout << "=== Hive Messaging Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Envelope and routing
    RUN_TEST(test_uuid_generation);
    RUN_TEST(test_envelope_round_trip);
    RUN_TEST(test_envelope_wire_format);
    RUN_TEST(test_envelope_validation);
    RUN_TEST(test_router_dispatch);

    // Delivery and dead-letter
    RUN_TEST(test_delivery_retry_then_success);
    RUN_TEST(test_delivery_dead_letter);
    RUN_TEST(test_delivery_malformed);
    RUN_TEST(test_dead_letter_queue);

    // Connection
    RUN_TEST(test_backoff_schedule);
    RUN_TEST(test_reconnect_max_attempts);
    RUN_TEST(test_reconnect_recovers);
    RUN_TEST(test_connection_lifecycle);

    // Topology and broker
    RUN_TEST(test_topology_idempotent);
    RUN_TEST(test_topic_matching);
    RUN_TEST(test_broadcast_fanout);
    RUN_TEST(test_status_topic_routing);
    RUN_TEST(test_competing_consumers);
    RUN_TEST(test_task_redelivery_through_broker);
    RUN_TEST(test_retry_budget_across_consumers);
    RUN_TEST(test_reconnect_restores_consumers);
    RUN_TEST(test_queue_limits);

    RUN_TEST(test_error_type_conversion);

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << std::endl << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << std::endl << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}
