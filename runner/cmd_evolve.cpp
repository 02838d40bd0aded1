#include "cmd_evolve.h"
#include "runner_utils.h"

#include "hive/audit_log.h"
#include "hive/swarm.h"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>

using namespace hive;

static void print_usage() {
    std::cerr << "usage: hive_cli evolve status\n"
                 "       hive_cli evolve pending\n"
                 "       hive_cli evolve apply-swap <agent>\n"
                 "       hive_cli evolve discard-swap <agent>\n"
                 "       hive_cli evolve vote <agent> <voter> <yes|no>\n"
                 "       hive_cli evolve clear-overrides <agent>\n"
                 "       hive_cli evolve log [n]\n"
                 "       (every form accepts --config <path>)\n";
}

static void print_status(Swarm& swarm) {
    std::vector<std::string> ids = swarm.config().worker_ids();
    for (const auto& a : swarm.scores().agents()) {
        if (std::find(ids.begin(), ids.end(), a) == ids.end()) ids.push_back(a);
    }
    std::cout << std::left << std::setw(16) << "agent" << std::setw(11) << "composite" << std::setw(10) << "status"
              << std::setw(11) << "trend" << "remediation\n";
    for (const auto& id : ids) {
        const auto entry = swarm.scores().get_all(id);
        std::string marker = swarm.evolution().marker_state(id);
        std::cout << std::left << std::setw(16) << id << std::setw(11) << std::fixed << std::setprecision(2)
                  << entry.composite << std::setw(10) << threshold_name(ScoreAggregator::classify(entry.composite))
                  << std::setw(11) << trend_name(swarm.scores().trend(id)) << (marker.empty() ? "-" : marker) << "\n";
    }
}

static void print_pending(Swarm& swarm) {
    bool any = false;
    for (const auto& id : swarm.config().worker_ids()) {
        if (auto s = swarm.evolution().pending_swap(id)) {
            any = true;
            std::cout << "swap  " << id << ": " << (s->old_model.empty() ? "?" : s->old_model) << " -> "
                      << s->new_model << " (" << s->reason << ")\n";
        }
    }
    for (const auto& v : swarm.evolution().pending_votes()) {
        any = true;
        std::cout << "vote  " << v.agent_id << ": " << v.proposal << " [for " << v.votes_for.size()
                  << ", against " << v.votes_against.size() << "]\n";
    }
    if (!any) std::cout << "nothing pending\n";
}

int cmd_evolve(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 2;
    }
    const std::string sub = argv[2];
    auto cfg = load_config_or_report(argc, argv, 3);
    if (!cfg) return 2;
    Swarm swarm(*cfg);
    EvolutionEngine& evo = swarm.evolution();
    const auto args = positional_args(argc, argv, 3, {"--config"});

    try {
        if (sub == "status") {
            print_status(swarm);
            return 0;
        }
        if (sub == "pending") {
            print_pending(swarm);
            return 0;
        }
        if (sub == "log") {
            size_t n = 20;
            if (!args.empty()) n = static_cast<size_t>(std::max(1, std::atoi(args[0].c_str())));
            AuditLog log(swarm.paths().evolution_log());
            for (const auto& line : log.tail(n)) std::cout << line << "\n";
            return 0;
        }

        if (args.empty()) {
            print_usage();
            return 2;
        }
        const std::string& agent = args[0];
        if (sub == "apply-swap") {
            std::string err = evo.apply_model_swap(agent);
            if (!err.empty()) {
                std::cerr << "[ERROR] " << err << "\n";
                return 1;
            }
            std::cout << agent << " now uses " << evo.current_model(agent) << "\n";
            return 0;
        }
        if (sub == "discard-swap") {
            if (!evo.discard_model_swap(agent)) {
                std::cerr << "[ERROR] no pending model swap for " << agent << "\n";
                return 1;
            }
            std::cout << "discarded swap for " << agent << "\n";
            return 0;
        }
        if (sub == "clear-overrides") {
            std::cout << (evo.clear_overrides(agent) ? "cleared" : "no overrides for") << " " << agent << "\n";
            return 0;
        }
        if (sub == "vote") {
            if (args.size() < 3 || (args[2] != "yes" && args[2] != "no")) {
                print_usage();
                return 2;
            }
            VoteOutcome out = evo.cast_vote(agent, args[1], args[2] == "yes");
            std::cout << vote_status_name(out.status) << " (for " << out.votes_for << ", against "
                      << out.votes_against << ", quorum " << out.quorum << ")\n";
            switch (out.status) {
                case VoteStatus::NO_PENDING_VOTE:
                case VoteStatus::ALREADY_VOTED:
                case VoteStatus::NOT_A_TEAMMATE:
                    return 1;
                default:
                    return 0;
            }
        }
        print_usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

int cmd_send(int argc, char** argv) {
    auto args = positional_args(argc, argv, 2, {"--config", "--from"});
    if (args.size() < 2) {
        std::cerr << "usage: hive_cli send <to> <message> [--from <id>] [--config <path>]\n";
        return 2;
    }
    auto cfg = load_config_or_report(argc, argv, 2);
    if (!cfg) return 2;
    Swarm swarm(*cfg);
    const std::string from = arg_value(argc, argv, 2, "--from").value_or("operator");
    std::string err = swarm.mailbox().send(args[0], args[1], kMsgText, from);
    if (!err.empty()) {
        std::cerr << "[ERROR] " << err << "\n";
        return 1;
    }
    return 0;
}
