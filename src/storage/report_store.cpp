/// @file report_store.cpp
/// @brief Run filter matching shared by report stores

#include "storage/report_store.h"

namespace runlens::storage {

bool RunFilter::Matches(const RunRecord& run) const {
    if (!run.finished_at) {
        return false;
    }
    if (repository_id && run.repository_id != *repository_id) {
        return false;
    }
    if (finished_from && *run.finished_at < *finished_from) {
        return false;
    }
    if (finished_to && *run.finished_at > *finished_to) {
        return false;
    }
    return true;
}

}  // namespace runlens::storage
