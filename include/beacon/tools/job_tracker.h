#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace beacon::tools {

using json = nlohmann::json;

enum class JobState { Accepted, Running, Completed };

const char* jobStateToString(JobState state) noexcept;

struct JobRecord {
    std::string id;
    std::string label;
    JobState state = JobState::Accepted;
    int64_t durationMs = 0;
    std::string acceptedAt;
    std::string startedAt;
    std::string completedAt;

    json toJson() const;
};

// In-memory record of long-running jobs started through beacon_start_job
class JobTracker {
public:
    std::string create(std::string label, int64_t durationMs);

    // State only moves forward; returns false for unknown ids or backward moves
    bool markRunning(std::string_view id);
    bool markCompleted(std::string_view id);

    std::optional<JobRecord> get(std::string_view id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobRecord> jobs_;
    uint64_t nextId_{1};
};

} // namespace beacon::tools
