#include "params.h"
#include "message.h"
#include "log.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace hive {

static bool parse_bool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

static int64_t parse_int64(const std::string& name, const std::string& value,
                           int64_t min = std::numeric_limits<int64_t>::min(),
                           int64_t max = std::numeric_limits<int64_t>::max()) {
    int64_t v = 0;
    try {
        size_t pos = 0;
        v = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error &) {
        throw validation_error("invalid value for " + name + ": '" + value + "'");
    }
    if (v < min || v > max) {
        throw validation_error("value for " + name + " out of range: '" + value + "'");
    }
    return v;
}

static int32_t parse_int(const std::string& name, const std::string& value) {
    return static_cast<int32_t>(parse_int64(name, value,
                                            std::numeric_limits<int32_t>::min(),
                                            std::numeric_limits<int32_t>::max()));
}

void hive_params_from_env(hive_params& params) {
    auto env = [](const char* name) -> const char* {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    };

    if (const char* v = env("RABBITMQ_URL"))       params.url = v;
    if (const char* v = env("HEARTBEAT_INTERVAL")) params.heartbeat_s = parse_int("HEARTBEAT_INTERVAL", v);
    if (const char* v = env("AUTO_RECONNECT"))     params.auto_reconnect = parse_bool(v);
    if (const char* v = env("PREFETCH_COUNT"))     params.prefetch_count = parse_int("PREFETCH_COUNT", v);
    if (const char* v = env("AGENT_ID"))           params.agent_id = v;
    if (const char* v = env("AGENT_NAME"))         params.agent_name = v;
    if (const char* v = env("AGENT_TYPE"))         params.role = v;
    if (const char* v = env("MAX_RETRIES"))        params.max_retries = parse_int("MAX_RETRIES", v);
    if (const char* v = env("LOG_VERBOSITY"))      params.verbosity = parse_int("LOG_VERBOSITY", v);
}

void hive_print_usage(const char* prog, const hive_params& params) {
    printf("usage: %s [options]\n\n", prog);
    printf("options:\n");
    printf("  -h, --help              show this help and exit\n");
    printf("  --url URL               broker url (default: %s, env RABBITMQ_URL)\n", params.url.c_str());
    printf("  --role ROLE             worker, team-leader, collaborator, coordinator, monitor (default: %s)\n", params.role.c_str());
    printf("  --agent-id ID           agent id (default: generated, env AGENT_ID)\n");
    printf("  --name NAME             agent display name (env AGENT_NAME)\n");
    printf("  --prefetch N            max unacknowledged deliveries (default: %d)\n", params.prefetch_count);
    printf("  --heartbeat N           heartbeat interval in seconds (default: %d)\n", params.heartbeat_s);
    printf("  --no-reconnect          disable automatic reconnect\n");
    printf("  --max-retries N         task redeliveries before dead-letter (default: %d)\n", params.max_retries);
    printf("  --collab-timeout MS     brainstorm response wait (default: %lld)\n", (long long) params.collaboration_timeout_ms);
    printf("  -v, --verbose           increase log verbosity\n");
    printf("  --log-file FILE         mirror log output to FILE\n");
    printf("\n");
}

bool hive_params_parse(int argc, char** argv, hive_params& params) {
    auto next = [&](int& i, const char* flag) -> std::string {
        if (i + 1 >= argc) {
            throw validation_error(std::string("missing value for ") + flag);
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; i++) {
            const char* arg = argv[i];
            if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
                hive_print_usage(argv[0], params);
                return false;
            } else if (strcmp(arg, "--url") == 0) {
                params.url = next(i, arg);
            } else if (strcmp(arg, "--role") == 0) {
                params.role = next(i, arg);
            } else if (strcmp(arg, "--agent-id") == 0) {
                params.agent_id = next(i, arg);
            } else if (strcmp(arg, "--name") == 0) {
                params.agent_name = next(i, arg);
            } else if (strcmp(arg, "--prefetch") == 0) {
                params.prefetch_count = parse_int(arg, next(i, arg));
            } else if (strcmp(arg, "--heartbeat") == 0) {
                params.heartbeat_s = parse_int(arg, next(i, arg));
            } else if (strcmp(arg, "--no-reconnect") == 0) {
                params.auto_reconnect = false;
            } else if (strcmp(arg, "--max-retries") == 0) {
                params.max_retries = parse_int(arg, next(i, arg));
            } else if (strcmp(arg, "--collab-timeout") == 0) {
                params.collaboration_timeout_ms = parse_int64(arg, next(i, arg), 0);
            } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
                params.verbosity++;
            } else if (strcmp(arg, "--log-file") == 0) {
                params.log_file = next(i, arg);
            } else {
                throw validation_error(std::string("unknown argument: ") + arg);
            }
        }
    } catch (const validation_error & e) {
        LOG_ERR("%s\n", e.what());
        hive_print_usage(argv[0], params);
        return false;
    }

    if (params.prefetch_count < 0 || params.heartbeat_s < 0 || params.max_retries < 0) {
        LOG_ERR("prefetch, heartbeat and max-retries must not be negative\n");
        return false;
    }
    return true;
}

void hive_params_finalize(hive_params& params) {
    if (params.agent_id.empty()) {
        params.agent_id = params.role + "-" + generate_uuid().substr(0, 8);
    }
    if (params.agent_name.empty()) {
        params.agent_name = params.agent_id;
    }
}

broker_config hive_params_to_broker_config(const hive_params& params) {
    broker_config config;
    config.url = params.url;
    config.heartbeat_s = params.heartbeat_s;
    config.prefetch_count = params.prefetch_count;
    return config;
}

failure_policy hive_params_to_failure_policy(const hive_params& params) {
    failure_policy policy = failure_policy::default_policy();
    policy.max_retries = params.max_retries;
    return policy;
}

} // namespace hive
