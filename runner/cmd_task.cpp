#include "cmd_task.h"
#include "runner_utils.h"

#include "hive/swarm.h"

#include <iomanip>
#include <iostream>

using namespace hive;

static void print_usage() {
    std::cerr << "usage: hive_cli task create <description> [--role <keyword>] [--blocked-by <id,id>]\n"
                 "       hive_cli task list [--status <status>] [--agent <id>]\n"
                 "       hive_cli task show <id>\n"
                 "       hive_cli task results <root-id>\n"
                 "       hive_cli task <cancel|pause|resume|retry> <id>\n"
                 "       hive_cli task flag <id> <tag>\n"
                 "       hive_cli task cancel-all\n"
                 "       hive_cli task clear [--force]\n"
                 "       (every form accepts --config <path>)\n";
}

static void print_task_line(const Task& t) {
    std::cout << std::left << std::setw(38) << t.id << std::setw(11) << task_status_name(t.status)
              << std::setw(14) << t.agent_id.value_or("-") << t.description.substr(0, 60) << "\n";
}

static void print_task_detail(const Task& t) {
    std::cout << "id:          " << t.id << "\n"
              << "status:      " << task_status_name(t.status) << "\n"
              << "description: " << t.description << "\n"
              << "agent:       " << t.agent_id.value_or("-") << "\n"
              << "role:        " << t.required_role.value_or("-") << "\n"
              << "created:     " << format_time(t.created_at) << "\n"
              << "retries:     " << t.retry_count << "\n";
    if (!t.blocked_by.empty()) {
        std::cout << "blocked by: ";
        for (const auto& b : t.blocked_by) std::cout << " " << b;
        std::cout << "\n";
    }
    if (!t.evolution_flags.empty()) {
        std::cout << "flags:      ";
        for (const auto& f : t.evolution_flags) std::cout << " " << f;
        std::cout << "\n";
    }
    for (const auto& r : t.reviews) {
        std::cout << "review:      " << r.reviewer << " scored " << r.score << ": " << r.comment << "\n";
    }
    if (t.result) std::cout << "result:\n" << *t.result << "\n";
}

int cmd_task(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 2;
    }
    const std::string sub = argv[2];
    auto cfg = load_config_or_report(argc, argv, 3);
    if (!cfg) return 2;
    Swarm swarm(*cfg);
    WorkQueue& q = swarm.queue();

    const auto args = positional_args(argc, argv, 3, {"--config", "--role", "--blocked-by", "--status", "--agent"});

    try {
        if (sub == "create") {
            if (args.empty()) {
                print_usage();
                return 2;
            }
            std::vector<std::string> blocked;
            if (auto b = arg_value(argc, argv, 3, "--blocked-by")) blocked = split_csv(*b);
            std::optional<std::string> role = arg_value(argc, argv, 3, "--role");
            Task t = q.create(args[0], blocked, role);
            std::cout << t.id << "\n";
            return 0;
        }
        if (sub == "list") {
            std::optional<TaskStatus> status;
            if (auto s = arg_value(argc, argv, 3, "--status")) {
                status = parse_task_status(*s);
                if (!status) {
                    std::cerr << "[ERROR] unknown status '" << *s << "'\n";
                    return 2;
                }
            }
            auto agent = arg_value(argc, argv, 3, "--agent");
            for (const auto& t : agent ? q.list_by_agent(*agent) : q.list()) {
                if (status && t.status != *status) continue;
                print_task_line(t);
            }
            return 0;
        }
        if (sub == "cancel-all") {
            std::cout << "cancelled " << q.cancel_all() << " task(s)\n";
            return 0;
        }
        if (sub == "clear") {
            int n = q.clear(has_flag(argc, argv, 3, "--force"));
            if (n < 0) {
                std::cerr << "[ERROR] tasks are claimed or in review; pass --force to clear anyway\n";
                return 1;
            }
            std::cout << "removed " << n << " task(s)\n";
            return 0;
        }

        if (args.empty()) {
            print_usage();
            return 2;
        }
        const std::string& id = args[0];
        if (sub == "show") {
            auto t = q.get(id);
            if (!t) {
                std::cerr << "[ERROR] no task " << id << "\n";
                return 1;
            }
            print_task_detail(*t);
            return 0;
        }
        if (sub == "results") {
            if (!q.get(id)) {
                std::cerr << "[ERROR] no task " << id << "\n";
                return 1;
            }
            std::cout << q.collect_results(id) << "\n";
            return 0;
        }
        if (sub == "flag") {
            if (args.size() < 2) {
                print_usage();
                return 2;
            }
            return q.flag(id, args[1]) ? 0 : 1;
        }

        bool ok = false;
        if (sub == "cancel") ok = q.cancel(id);
        else if (sub == "pause") ok = q.pause(id);
        else if (sub == "resume") ok = q.resume(id);
        else if (sub == "retry") ok = q.retry(id);
        else {
            print_usage();
            return 2;
        }
        if (!ok) {
            std::cerr << "[ERROR] " << sub << " not applicable to task " << id << "\n";
            return 1;
        }
        std::cout << sub << ": " << id << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
