#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "dispatch.hpp"
#include "logger.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace lifeplan;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

Profile make_saver(const std::string& id, int life_expectancy = 40) {
    Profile profile;
    profile.id = id;
    profile.name = id;
    profile.as_of = YearMonth(2024, 1);
    profile.assumptions.current_age = 30;
    profile.assumptions.life_expectancy = life_expectancy;

    Income salary;
    salary.id = "salary";
    salary.name = "Salary";
    salary.amount = 7000000;
    profile.incomes.push_back(salary);

    Asset savings;
    savings.id = "savings";
    savings.name = "Savings";
    savings.monthly_contribution = 50000;
    profile.assets.push_back(savings);
    return profile;
}

void silence_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

// ============================================================================
// handle_request
// ============================================================================

TEST_CASE("handle_request generates a trajectory", "[dispatch]") {
    silence_logger();

    const Response response = handle_request(GenerateRequest{make_saver("p1"), ProjectionConfig()});
    REQUIRE(std::holds_alternative<TrajectoryResponse>(response));

    const Trajectory& trajectory = std::get<TrajectoryResponse>(response).trajectory;
    REQUIRE(trajectory.profile_id == "p1");
    REQUIRE(trajectory.years.size() == 10);
}

TEST_CASE("handle_request quick projection", "[dispatch]") {
    silence_logger();

    GenerateQuickRequest request;
    request.profile = make_saver("p1");
    request.years = 4;

    const Response response = handle_request(request);
    REQUIRE(std::holds_alternative<TrajectoryResponse>(response));
    REQUIRE(std::get<TrajectoryResponse>(response).trajectory.years.size() == 4);
}

TEST_CASE("handle_request compares trajectories", "[dispatch]") {
    silence_logger();

    CompareRequest request;
    request.baseline = generate_trajectory(make_saver("base"));
    request.alternate = generate_trajectory(make_saver("alt", 35));
    request.name = "Shorter horizon";

    const Response response = handle_request(request);
    REQUIRE(std::holds_alternative<ComparisonResponse>(response));

    const Comparison& comparison = std::get<ComparisonResponse>(response).comparison;
    REQUIRE(comparison.name == "Shorter horizon");
    REQUIRE(comparison.deltas.size() == 5);
}

TEST_CASE("handle_request turns failures into ErrorResponse", "[dispatch]") {
    silence_logger();

    SECTION("Invalid profile") {
        Profile profile = make_saver("bad");
        profile.assets[0].balance = -1;
        const Response response = handle_request(GenerateRequest{profile, ProjectionConfig()});
        REQUIRE(std::holds_alternative<ErrorResponse>(response));
        REQUIRE_THAT(std::get<ErrorResponse>(response).message, ContainsSubstring("balance"));
    }

    SECTION("Unknown state") {
        Profile profile = make_saver("bad");
        profile.assumptions.state = "ZZ";
        const Response response = handle_request(GenerateRequest{profile, ProjectionConfig()});
        REQUIRE(std::holds_alternative<ErrorResponse>(response));
        REQUIRE_THAT(std::get<ErrorResponse>(response).message, ContainsSubstring("ZZ"));
    }

    SECTION("Non-positive quick years") {
        GenerateQuickRequest request;
        request.profile = make_saver("p1");
        request.years = 0;
        REQUIRE(std::holds_alternative<ErrorResponse>(handle_request(request)));
    }

    SECTION("Mismatched comparison start") {
        Profile older = make_saver("older", 41);
        older.assumptions.current_age = 31;

        CompareRequest request;
        request.baseline = generate_trajectory(make_saver("base"));
        request.alternate = generate_trajectory(older);
        REQUIRE(std::holds_alternative<ErrorResponse>(handle_request(request)));
    }
}

// ============================================================================
// ProjectionWorker
// ============================================================================

TEST_CASE("ProjectionWorker answers every request", "[dispatch][worker]") {
    silence_logger();

    ProjectionWorker worker;
    REQUIRE(worker.is_running());

    std::vector<std::future<Response>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(worker.submit(GenerateRequest{make_saver("p" + std::to_string(i)), ProjectionConfig()}));
    }

    for (int i = 0; i < 8; ++i) {
        const Response response = futures[static_cast<size_t>(i)].get();
        REQUIRE(std::holds_alternative<TrajectoryResponse>(response));
        REQUIRE(std::get<TrajectoryResponse>(response).trajectory.profile_id == "p" + std::to_string(i));
    }
    REQUIRE(worker.pending() == 0);
}

TEST_CASE("ProjectionWorker reports errors through the future", "[dispatch][worker]") {
    silence_logger();

    ProjectionWorker worker;
    Profile profile = make_saver("bad");
    profile.assumptions.life_expectancy = 20;

    auto future = worker.submit(GenerateRequest{profile, ProjectionConfig()});
    const Response response = future.get();
    REQUIRE(std::holds_alternative<ErrorResponse>(response));
    REQUIRE_THAT(std::get<ErrorResponse>(response).message, ContainsSubstring("life_expectancy"));
}

TEST_CASE("ProjectionWorker drains queued work on shutdown", "[dispatch][worker]") {
    silence_logger();

    ProjectionWorker worker;
    std::vector<std::future<Response>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(worker.submit(GenerateRequest{make_saver("p" + std::to_string(i), 90), ProjectionConfig()}));
    }

    worker.shutdown();
    REQUIRE_FALSE(worker.is_running());
    REQUIRE(worker.pending() == 0);

    for (auto& future : futures) {
        REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        REQUIRE(std::holds_alternative<TrajectoryResponse>(future.get()));
    }

    REQUIRE_THROWS_AS(worker.submit(GenerateRequest{make_saver("late"), ProjectionConfig()}), std::logic_error);

    // Second shutdown is a no-op
    REQUIRE_NOTHROW(worker.shutdown());
}
