#include "dispatch.hpp"
#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>

namespace lifeplan {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string next_run_id() {
    static std::atomic<unsigned long> counter{0};
    return "req-" + std::to_string(++counter);
}

double elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

Response handle_request(const Request& request, const TaxTables& tables) {
    Logger& logger = Logger::get_instance();
    RunContext ctx(next_run_id(), "");
    const auto start = std::chrono::steady_clock::now();

    try {
        return std::visit(overloaded{
            [&](const GenerateRequest& r) -> Response {
                ctx.operation = "generate";
                logger.log_run_start(ctx, r.profile.id, projection_years(r.profile));
                Trajectory trajectory = generate_trajectory(r.profile, r.config, tables);
                logger.log_projection_complete(ctx, trajectory, elapsed_ms_since(start));
                return TrajectoryResponse{std::move(trajectory)};
            },
            [&](const GenerateQuickRequest& r) -> Response {
                ctx.operation = "generate_quick";
                logger.log_run_start(ctx, r.profile.id, r.years);
                Trajectory trajectory = generate_quick_trajectory(r.profile, r.years, r.config, tables);
                logger.log_projection_complete(ctx, trajectory, elapsed_ms_since(start));
                return TrajectoryResponse{std::move(trajectory)};
            },
            [&](const CompareRequest& r) -> Response {
                ctx.operation = "compare";
                logger.log_run_start(ctx, r.baseline.profile_id, static_cast<int>(r.baseline.years.size()));
                if (r.baseline.years.size() != r.alternate.years.size()) {
                    logger.log_warning(ctx, "Trajectories differ in length; comparing overlapping years only");
                }
                Comparison comparison = compare_trajectories(r.baseline, r.alternate, r.changes, r.name);
                logger.log_comparison_complete(ctx, comparison, elapsed_ms_since(start));
                return ComparisonResponse{std::move(comparison)};
            }
        }, request);
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        return ErrorResponse{e.what()};
    }
}

// ============================================================================
// ProjectionWorker
// ============================================================================

ProjectionWorker::ProjectionWorker(const TaxTables& tables)
    : tables_(tables),
      thread_(&ProjectionWorker::run, this) {}

ProjectionWorker::~ProjectionWorker() {
    shutdown();
}

std::future<Response> ProjectionWorker::submit(Request request) {
    std::promise<Response> promise;
    std::future<Response> future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("ProjectionWorker has been shut down");
        }
        queue_.emplace_back(std::move(request), std::move(promise));
    }
    cond_var_.notify_one();
    return future;
}

void ProjectionWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cond_var_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ProjectionWorker::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ProjectionWorker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ProjectionWorker::run() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_var_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // Stopping and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // Non-std exceptions reach the caller through the future
        try {
            job.second.set_value(handle_request(job.first, tables_));
        } catch (...) {
            job.second.set_exception(std::current_exception());
        }
    }
}

} // namespace lifeplan
