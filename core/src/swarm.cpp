#include "hive/swarm.h"

namespace hive {

static LeaseSettings lease_from(const QueueSettings& q) {
    LeaseSettings l;
    l.claim_timeout_ms = static_cast<int64_t>(q.lease_timeout_sec) * 1000;
    l.review_timeout_ms = static_cast<int64_t>(q.review_timeout_sec) * 1000;
    return l;
}

Swarm::Swarm(SwarmConfig config, Clock clock)
    : config_(std::move(config)),
      paths_(config_.state_dir),
      clock_(std::move(clock)),
      queue_(paths_.tasks(), lease_from(config_.queue), clock_),
      mailbox_(paths_.mailboxes(), clock_),
      scores_(paths_.reputation_cache(), paths_.score_log(), clock_),
      chat_(make_chat(config_.chat)),
      evolution_(config_, queue_, scores_, chat_.get(), clock_),
      scheduler_(scores_, evolution_),
      executor_(std::make_unique<CommandExecutor>(paths_.overrides())) {
    if (chat_) reviewer_ = std::make_unique<ChatReviewer>(*chat_);
    else reviewer_ = std::make_unique<HeuristicReviewer>();
}

WorkerServices Swarm::services() {
    return WorkerServices{queue_, mailbox_, scheduler_, *executor_, *reviewer_, paths_.heartbeats(), clock_};
}

RuntimeDeps Swarm::runtime_deps() {
    RuntimeDeps d;
    d.queue = &queue_;
    d.mailbox = &mailbox_;
    d.services.emplace(services());
    d.heartbeat_dir = paths_.heartbeats();
    d.clock = clock_;
    return d;
}

} // namespace hive
