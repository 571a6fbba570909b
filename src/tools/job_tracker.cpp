#include <beacon/core/timestamp.h>
#include <beacon/tools/job_tracker.h>

#include <spdlog/spdlog.h>

namespace beacon::tools {

const char* jobStateToString(JobState state) noexcept {
    switch (state) {
        case JobState::Accepted:
            return "accepted";
        case JobState::Running:
            return "running";
        case JobState::Completed:
            return "completed";
    }
    return "accepted";
}

json JobRecord::toJson() const {
    json j{{"job_id", id},
           {"label", label},
           {"state", jobStateToString(state)},
           {"duration_ms", durationMs},
           {"accepted_at", acceptedAt}};
    if (!startedAt.empty())
        j["started_at"] = startedAt;
    if (!completedAt.empty())
        j["completed_at"] = completedAt;
    return j;
}

std::string JobTracker::create(std::string label, int64_t durationMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord rec;
    rec.id = "job-" + std::to_string(nextId_++);
    rec.label = std::move(label);
    rec.durationMs = durationMs;
    rec.acceptedAt = Timestamp::nowString();
    auto id = rec.id;
    jobs_.emplace(id, std::move(rec));
    spdlog::debug("[JobTracker] Accepted {} ({}ms)", id, durationMs);
    return id;
}

bool JobTracker::markRunning(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(std::string(id));
    if (it == jobs_.end() || it->second.state != JobState::Accepted) {
        return false;
    }
    it->second.state = JobState::Running;
    it->second.startedAt = Timestamp::nowString();
    return true;
}

bool JobTracker::markCompleted(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(std::string(id));
    if (it == jobs_.end() || it->second.state == JobState::Completed) {
        return false;
    }
    it->second.state = JobState::Completed;
    it->second.completedAt = Timestamp::nowString();
    spdlog::debug("[JobTracker] Completed {}", it->first);
    return true;
}

std::optional<JobRecord> JobTracker::get(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = jobs_.find(std::string(id)); it != jobs_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t JobTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

} // namespace beacon::tools
