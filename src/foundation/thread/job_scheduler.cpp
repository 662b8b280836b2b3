/// @file job_scheduler.cpp
/// @brief EngineJobScheduler over kcenon::thread::thread_pool.

#include "sfe/foundation/job_scheduler.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <atomic>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sfe::foundation {

namespace kt = kcenon::thread;

struct EngineJobScheduler::Impl {
    std::shared_ptr<kt::thread_pool> pool;
    std::atomic<JobId> lastId{0};

    mutable std::mutex mutex;
    std::map<JobId, std::shared_future<void>> pending;

    std::shared_future<void> take(JobId id) {
        std::lock_guard lock(mutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            return {};
        }
        auto future = std::move(it->second);
        pending.erase(it);
        return future;
    }
};

EngineJobScheduler::EngineJobScheduler(std::size_t workers)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kt::thread_pool>("sfe_model_build");

    std::vector<std::unique_ptr<kt::thread_worker>> threads(workers == 0 ? 1 : workers);
    for (auto& worker : threads) {
        worker = std::make_unique<kt::thread_worker>();
    }
    impl_->pool->enqueue_batch(std::move(threads));
    impl_->pool->start();
}

EngineJobScheduler::~EngineJobScheduler() {
    impl_->pool->stop(false);
}

EngineResult<EngineJobScheduler::JobId> EngineJobScheduler::schedule(JobFunc job) {
    const JobId id = impl_->lastId.fetch_add(1, std::memory_order_relaxed) + 1;
    auto done = std::make_shared<std::promise<void>>();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->pending.emplace(id, done->get_future().share());
    }

    auto work = kt::job_builder()
        .name("sfe_build_" + std::to_string(id))
        .work([fn = std::move(job), done]() -> kcenon::common::VoidResult {
            try {
                fn();
                done->set_value();
            } catch (...) {
                done->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    if (impl_->pool->enqueue(std::move(work)).is_err()) {
        (void)impl_->take(id);
        return EngineResult<JobId>::err(
            EngineError(ErrorCode::JobScheduleFailed, "thread pool rejected job"));
    }
    return EngineResult<JobId>::ok(id);
}

EngineResult<void> EngineJobScheduler::wait(JobId id) {
    auto future = impl_->take(id);
    if (!future.valid()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::JobNotFound, "no tracked job " + std::to_string(id)));
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return EngineResult<void>::err(EngineError(ErrorCode::JobFailed, e.what()));
    } catch (...) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::JobFailed, "job threw a non-standard exception"));
    }
    return EngineResult<void>::ok();
}

std::size_t EngineJobScheduler::trackedJobs() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->pending.size();
}

}  // namespace sfe::foundation
