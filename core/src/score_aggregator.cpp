#include "hive/score_aggregator.h"
#include "hive/file_lock.h"
#include "hive/json_util.h"
#include "hive/log.h"

#include <algorithm>
#include <cmath>

namespace hive {

static const char* kComponent = "score";

const char* dimension_name(Dimension d) {
    switch (d) {
        case Dimension::TASK_COMPLETION:  return "task_completion";
        case Dimension::OUTPUT_QUALITY:   return "output_quality";
        case Dimension::IMPROVEMENT_RATE: return "improvement_rate";
        case Dimension::CONSISTENCY:      return "consistency";
        case Dimension::REVIEW_ACCURACY:  return "review_accuracy";
    }
    return "task_completion";
}

std::optional<Dimension> parse_dimension(const std::string& s) {
    for (Dimension d : kAllDimensions) {
        if (s == dimension_name(d)) return d;
    }
    return std::nullopt;
}

const char* threshold_name(ThresholdStatus s) {
    switch (s) {
        case ThresholdStatus::HEALTHY: return "healthy";
        case ThresholdStatus::WATCH:   return "watch";
        case ThresholdStatus::WARNING: return "warning";
        case ThresholdStatus::EVOLVE:  return "evolve";
    }
    return "watch";
}

const char* trend_name(Trend t) {
    switch (t) {
        case Trend::IMPROVING: return "improving";
        case Trend::STABLE:    return "stable";
        case Trend::DECLINING: return "declining";
    }
    return "stable";
}

static double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

ReputationEntry ScoreAggregator::default_entry() {
    ReputationEntry e;
    e.dims.fill(kDefaultScore);
    e.composite = kDefaultScore;
    return e;
}

double ScoreAggregator::composite_of(const std::array<double, kDimensionCount>& dims) {
    double sum = 0.0;
    for (Dimension d : kAllDimensions) {
        sum += dims[static_cast<size_t>(d)] * dimension_weight(d);
    }
    return round2(sum);
}

ThresholdStatus ScoreAggregator::classify(double composite) {
    if (composite >= 80.0) return ThresholdStatus::HEALTHY;
    if (composite >= 60.0) return ThresholdStatus::WATCH;
    if (composite >= 40.0) return ThresholdStatus::WARNING;
    return ThresholdStatus::EVOLVE;
}

Trend ScoreAggregator::classify_trend(const std::vector<double>& composites) {
    if (composites.size() < 4) return Trend::STABLE;
    const size_t start = composites.size() > kTrendWindow ? composites.size() - kTrendWindow : 0;
    std::vector<double> recent(composites.begin() + static_cast<std::ptrdiff_t>(start), composites.end());
    const size_t mid = recent.size() / 2;

    double first = 0.0, second = 0.0;
    for (size_t i = 0; i < mid; i++) first += recent[i];
    for (size_t i = mid; i < recent.size(); i++) second += recent[i];
    first /= static_cast<double>(mid);
    second /= static_cast<double>(recent.size() - mid);

    const double diff = second - first;
    if (diff > kTrendDelta) return Trend::IMPROVING;
    if (diff < -kTrendDelta) return Trend::DECLINING;
    return Trend::STABLE;
}

static ReputationEntry entry_from_json(json_object* o) {
    ReputationEntry e = ScoreAggregator::default_entry();
    json_object* dims = json::member(o, "dimensions");
    for (Dimension d : kAllDimensions) {
        e.dims[static_cast<size_t>(d)] = json::get_double(dims, dimension_name(d), ScoreAggregator::kDefaultScore);
    }
    e.composite = json::get_double(o, "composite", ScoreAggregator::composite_of(e.dims));
    e.updated_at = json::get_int(o, "updated_at");

    json_object* hist = json::member(o, "history");
    if (hist && json_object_is_type(hist, json_type_array)) {
        const size_t n = json_object_array_length(hist);
        for (size_t i = 0; i < n; i++) {
            json_object* h = json_object_array_get_idx(hist, i);
            if (!json::is_object(h)) continue;
            e.history.push_back(CompositePoint{json::get_double(h, "composite"), json::get_int(h, "ts")});
        }
    }
    return e;
}

static json_object* entry_to_json(const ReputationEntry& e) {
    json_object* o = json_object_new_object();
    json_object* dims = json_object_new_object();
    for (Dimension d : kAllDimensions) {
        json::put_double(dims, dimension_name(d), e.get(d));
    }
    json_object_object_add(o, "dimensions", dims);
    json::put_double(o, "composite", e.composite);

    json_object* hist = json_object_new_array();
    for (const auto& h : e.history) {
        json_object* ho = json_object_new_object();
        json::put_double(ho, "composite", h.composite);
        json::put_int(ho, "ts", h.ts);
        json_object_array_add(hist, ho);
    }
    json_object_object_add(o, "history", hist);
    json::put_int(o, "updated_at", e.updated_at);
    return o;
}

// Cache readers rely on write-then-rename and skip the lock.
static json::Doc read_cache(const std::filesystem::path& path) {
    bool missing = false;
    json::Doc d = json::load_file(path, &missing);
    if (!missing && (!d || !json::is_object(d.root))) {
        log_warn(kComponent, "reputation cache " + path.string() + " unreadable, using defaults");
    }
    if (!d || !json::is_object(d.root)) return json::new_object();
    return d;
}

ScoreAggregator::ScoreAggregator(std::filesystem::path cache_path, std::filesystem::path audit_path,
                                 Clock clock)
    : cache_path_(std::move(cache_path)), audit_(std::move(audit_path)), clock_(std::move(clock)) {}

double ScoreAggregator::update(const std::string& agent_id, Dimension dim, double signal,
                               const std::string& reason) {
    signal = std::clamp(signal, 0.0, 100.0);
    const int64_t now = clock_();

    auto lock_path = cache_path_;
    lock_path += ".lock";
    ScopedFileLock lock(lock_path, kComponent);

    json::Doc cache = read_cache(cache_path_);
    json_object* existing = json::member(cache.root, agent_id.c_str());
    ReputationEntry e = existing ? entry_from_json(existing) : default_entry();

    const double old_value = e.get(dim);
    const double new_value = round2(kAlpha * signal + (1.0 - kAlpha) * old_value);
    e.dims[static_cast<size_t>(dim)] = new_value;
    e.composite = composite_of(e.dims);
    e.history.push_back(CompositePoint{e.composite, now});
    if (e.history.size() > kHistoryCap) {
        e.history.erase(e.history.begin(), e.history.end() - static_cast<std::ptrdiff_t>(kHistoryCap));
    }
    e.updated_at = now;

    json_object_object_add(cache.root, agent_id.c_str(), entry_to_json(e));
    std::string err = json::write_atomic(cache_path_, json::dump(cache.root, true) + "\n");
    if (!err.empty()) {
        log_error(kComponent, "cannot persist reputation for " + agent_id + ": " + err);
    }

    json::Doc line = json::new_object();
    json::put_int(line.root, "ts", now);
    json::put_string(line.root, "agent_id", agent_id);
    json::put_string(line.root, "dimension", dimension_name(dim));
    json::put_double(line.root, "signal", signal);
    json::put_double(line.root, "old", old_value);
    json::put_double(line.root, "new", new_value);
    json::put_double(line.root, "composite", e.composite);
    if (!reason.empty()) json::put_string(line.root, "reason", reason);
    std::string aerr = audit_.append_json_line(json::dump(line.root));
    if (!aerr.empty()) log_warn(kComponent, "score audit append failed: " + aerr);

    return new_value;
}

bool ScoreAggregator::update(const std::string& agent_id, const std::string& dim_name, double signal,
                             const std::string& reason) {
    auto dim = parse_dimension(dim_name);
    if (!dim) {
        log_warn(kComponent, "ignoring update for unknown dimension '" + dim_name + "'");
        return false;
    }
    update(agent_id, *dim, signal, reason);
    return true;
}

ReputationEntry ScoreAggregator::get_all(const std::string& agent_id) const {
    json::Doc cache = read_cache(cache_path_);
    json_object* o = json::member(cache.root, agent_id.c_str());
    return o ? entry_from_json(o) : default_entry();
}

double ScoreAggregator::get(const std::string& agent_id) const {
    return get_all(agent_id).composite;
}

Trend ScoreAggregator::trend(const std::string& agent_id) const {
    std::vector<double> composites;
    for (const auto& h : get_all(agent_id).history) composites.push_back(h.composite);
    return classify_trend(composites);
}

ThresholdStatus ScoreAggregator::threshold_status(const std::string& agent_id) const {
    return classify(get(agent_id));
}

std::vector<std::string> ScoreAggregator::agents() const {
    std::vector<std::string> out;
    json::Doc cache = read_cache(cache_path_);
    json_object_iter it;
    json_object_object_foreachC(cache.root, it) {
        out.emplace_back(it.key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace hive
