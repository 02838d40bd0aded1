#pragma once

#include "hive/audit_log.h"
#include "hive/ids.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hive {

enum class Dimension {
    TASK_COMPLETION,
    OUTPUT_QUALITY,
    IMPROVEMENT_RATE,
    CONSISTENCY,
    REVIEW_ACCURACY,
};

inline constexpr size_t kDimensionCount = 5;
inline constexpr std::array<Dimension, kDimensionCount> kAllDimensions{
    Dimension::TASK_COMPLETION, Dimension::OUTPUT_QUALITY, Dimension::IMPROVEMENT_RATE,
    Dimension::CONSISTENCY, Dimension::REVIEW_ACCURACY,
};

const char* dimension_name(Dimension d);
std::optional<Dimension> parse_dimension(const std::string& s);

// Composite weights; they sum to 1.0.
constexpr double dimension_weight(Dimension d) {
    switch (d) {
        case Dimension::TASK_COMPLETION:  return 0.25;
        case Dimension::OUTPUT_QUALITY:   return 0.30;
        case Dimension::IMPROVEMENT_RATE: return 0.25;
        case Dimension::CONSISTENCY:      return 0.10;
        case Dimension::REVIEW_ACCURACY:  return 0.10;
    }
    return 0.0;
}

enum class ThresholdStatus { HEALTHY, WATCH, WARNING, EVOLVE };
enum class Trend { IMPROVING, STABLE, DECLINING };

const char* threshold_name(ThresholdStatus s);
const char* trend_name(Trend t);

struct CompositePoint {
    double composite{0.0};
    int64_t ts{0};
};

struct ReputationEntry {
    std::array<double, kDimensionCount> dims{};
    double composite{0.0};
    std::vector<CompositePoint> history;  // oldest first, capped
    int64_t updated_at{0};

    double get(Dimension d) const { return dims[static_cast<size_t>(d)]; }
};

// ScoreAggregator: per-worker EMA reputation.
//
// The cache is one JSON document (worker id -> entry), rewritten whole under
// `<cache>.lock`; concurrent updates to the same worker serialize and the
// last write wins. Every update also appends a line to the score audit log.
class ScoreAggregator {
public:
    static constexpr double kAlpha = 0.3;
    static constexpr double kDefaultScore = 70.0;
    static constexpr size_t kHistoryCap = 50;
    static constexpr size_t kTrendWindow = 10;
    static constexpr double kTrendDelta = 3.0;

    ScoreAggregator(std::filesystem::path cache_path, std::filesystem::path audit_path,
                    Clock clock = system_clock_ms());

    // EMA update with signal clamped to [0,100]. Returns the new dimension value.
    double update(const std::string& agent_id, Dimension dim, double signal,
                  const std::string& reason = "");

    // Same, by dimension name. Unknown names are ignored with a warning.
    bool update(const std::string& agent_id, const std::string& dim_name, double signal,
                const std::string& reason = "");

    // Composite; kDefaultScore for a worker never scored.
    double get(const std::string& agent_id) const;
    ReputationEntry get_all(const std::string& agent_id) const;
    Trend trend(const std::string& agent_id) const;
    ThresholdStatus threshold_status(const std::string& agent_id) const;
    std::vector<std::string> agents() const;

    static ReputationEntry default_entry();
    static double composite_of(const std::array<double, kDimensionCount>& dims);
    static ThresholdStatus classify(double composite);
    static Trend classify_trend(const std::vector<double>& composites);

private:
    std::filesystem::path cache_path_;
    AuditLog audit_;
    Clock clock_;
};

} // namespace hive
