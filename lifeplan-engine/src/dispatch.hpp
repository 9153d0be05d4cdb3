#ifndef LIFEPLAN_DISPATCH_HPP
#define LIFEPLAN_DISPATCH_HPP

#include "comparison.hpp"
#include "profile.hpp"
#include "projection.hpp"
#include "tax_tables.hpp"
#include "trajectory.hpp"
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace lifeplan {

struct GenerateRequest {
    Profile profile;
    ProjectionConfig config;
};

struct GenerateQuickRequest {
    Profile profile;
    int years = DEFAULT_QUICK_YEARS;
    ProjectionConfig config;
};

struct CompareRequest {
    Trajectory baseline;
    Trajectory alternate;
    std::vector<Change> changes;
    std::string name = "Comparison";
};

using Request = std::variant<GenerateRequest, GenerateQuickRequest, CompareRequest>;

struct TrajectoryResponse {
    Trajectory trajectory;
};

struct ComparisonResponse {
    Comparison comparison;
};

struct ErrorResponse {
    std::string message;
};

using Response = std::variant<TrajectoryResponse, ComparisonResponse, ErrorResponse>;

// Run one request to completion; every std::exception becomes an ErrorResponse
Response handle_request(const Request& request, const TaxTables& tables = TaxTables::builtin());

// Background thread serving requests in FIFO order
//
// Each submitted request gets its own future. Shutdown (explicit or from the
// destructor) stops accepting work, finishes everything already queued, then
// joins the thread. There is no cancellation and no de-duplication.
class ProjectionWorker {
public:
    explicit ProjectionWorker(const TaxTables& tables = TaxTables::builtin());
    ~ProjectionWorker();

    ProjectionWorker(const ProjectionWorker&) = delete;
    ProjectionWorker& operator=(const ProjectionWorker&) = delete;

    // Throws std::logic_error after shutdown
    std::future<Response> submit(Request request);

    void shutdown();

    bool is_running() const;
    size_t pending() const;

private:
    using Job = std::pair<Request, std::promise<Response>>;

    const TaxTables& tables_;
    std::deque<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cond_var_;
    bool stopping_ = false;
    std::thread thread_;

    void run();
};

} // namespace lifeplan

#endif // LIFEPLAN_DISPATCH_HPP
