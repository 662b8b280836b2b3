#pragma once

/// @file job_scheduler.hpp
/// @brief EngineJobScheduler: runs model builds on a kcenon thread_system pool.

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "sfe/foundation/engine_result.hpp"

namespace sfe::foundation {

/// Worker pool for the rating replay and strength fit of one model build.
///
/// A scheduled job stays tracked until wait() collects it. Exceptions
/// thrown by a job are reported by wait() as JobFailed.
///
/// @code
///   EngineJobScheduler scheduler(2);
///   auto id = scheduler.schedule([&] { table = replayRatings(matches); });
///   if (id) {
///       auto done = scheduler.wait(id.value());
///   }
/// @endcode
class EngineJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// A worker count of 0 is raised to 1.
    explicit EngineJobScheduler(std::size_t workers = std::thread::hardware_concurrency());

    /// Stops the pool after running jobs finish.
    ~EngineJobScheduler();

    EngineJobScheduler(const EngineJobScheduler&) = delete;
    EngineJobScheduler& operator=(const EngineJobScheduler&) = delete;

    /// @return The new job's id, or JobScheduleFailed if the pool refused it.
    EngineResult<JobId> schedule(JobFunc job);

    /// Block until @p id has run, then forget it.
    /// @return JobNotFound for an unknown or already collected id, JobFailed
    ///         when the job threw.
    EngineResult<void> wait(JobId id);

    /// Jobs scheduled but not yet collected by wait().
    [[nodiscard]] std::size_t trackedJobs() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sfe::foundation
