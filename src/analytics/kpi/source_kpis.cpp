/// @file source_kpis.cpp
/// @brief Source-based KPI accumulators

#include "analytics/kpi/source_kpis.h"

namespace runlens::analytics {

absl::StatusOr<nlohmann::json> SourceTestStatsAccumulator::Finalize() {
    return analyzer_.TestStats(repository_id_);
}

absl::StatusOr<nlohmann::json> SourceLibraryAccumulator::Finalize() {
    return analyzer_.LibraryDistribution(repository_id_);
}

}  // namespace runlens::analytics
