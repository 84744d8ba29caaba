/// @file job_store.cpp
/// @brief Analysis job state machine implementation

#include "storage/job_store.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace runlens::storage {

AnalysisJob JobStore::Create(AnalysisJob job, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    job.id = next_id_++;
    job.status = JobStatus::kPending;
    job.progress = 0;
    job.reports_analyzed = 0;
    job.error_message.reset();
    job.results = nlohmann::json::object();
    job.created_at = now;
    job.started_at.reset();
    job.completed_at.reset();
    jobs_[job.id] = job;
    return job;
}

absl::StatusOr<AnalysisJob> JobStore::Get(JobId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return absl::NotFoundError(absl::StrCat("Analysis job ", id, " not found"));
    }
    return it->second;
}

std::vector<AnalysisJob> JobStore::List(std::optional<RepositoryId> repository_id) const {
    std::vector<AnalysisJob> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            if (repository_id && job.repository_id != repository_id) {
                continue;
            }
            out.push_back(job);
        }
    }
    std::sort(out.begin(), out.end(), [](const AnalysisJob& a, const AnalysisJob& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id > b.id;
    });
    return out;
}

absl::StatusOr<AnalysisJob*> JobStore::FindActive(JobId id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return absl::NotFoundError(absl::StrCat("Analysis job ", id, " not found"));
    }
    if (it->second.IsTerminal()) {
        return MakeError(ErrorCode::kIllegalTransition,
                         absl::StrCat("Analysis job ", id, " is already ",
                                      JobStatusToString(it->second.status)));
    }
    return &it->second;
}

absl::Status JobStore::MarkRunning(JobId id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = FindActive(id);
    if (!job.ok()) {
        return job.status();
    }
    if ((*job)->status != JobStatus::kPending) {
        return MakeError(ErrorCode::kIllegalTransition,
                         absl::StrCat("Analysis job ", id, " is already running"));
    }
    (*job)->status = JobStatus::kRunning;
    (*job)->started_at = now;
    return absl::OkStatus();
}

absl::Status JobStore::UpdateProgress(JobId id, int progress, int64_t reports_analyzed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = FindActive(id);
    if (!job.ok()) {
        return job.status();
    }
    if ((*job)->status != JobStatus::kRunning) {
        return MakeError(ErrorCode::kIllegalTransition,
                         absl::StrCat("Analysis job ", id, " is not running"));
    }
    (*job)->progress = std::clamp(std::max((*job)->progress, progress), 0, 100);
    (*job)->reports_analyzed = std::max((*job)->reports_analyzed, reports_analyzed);
    return absl::OkStatus();
}

absl::Status JobStore::Complete(JobId id, nlohmann::json results, int64_t reports_analyzed,
                                Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = FindActive(id);
    if (!job.ok()) {
        return job.status();
    }
    if ((*job)->status != JobStatus::kRunning) {
        return MakeError(ErrorCode::kIllegalTransition,
                         absl::StrCat("Analysis job ", id, " was never started"));
    }
    (*job)->status = JobStatus::kCompleted;
    (*job)->progress = 100;
    (*job)->reports_analyzed = reports_analyzed;
    (*job)->results = std::move(results);
    (*job)->completed_at = now;
    return absl::OkStatus();
}

absl::Status JobStore::Fail(JobId id, std::string message, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = FindActive(id);
    if (!job.ok()) {
        return job.status();
    }
    (*job)->status = JobStatus::kError;
    (*job)->error_message = std::move(message);
    (*job)->completed_at = now;
    return absl::OkStatus();
}

size_t JobStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

}  // namespace runlens::storage
