#include "sqlsense/completion/completion_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>

using namespace sqlsense::completion;

TEST_CASE("completion telemetry accumulates counters")
{
    CompletionTelemetry telemetry;
    telemetry.record_request(true);
    telemetry.record_request(false);
    telemetry.record_suggestion(true);
    telemetry.record_suggestion(false);
    telemetry.record_ranking(10U, 3U);
    telemetry.record_ranking(4U, 0U);
    telemetry.record_duration(250U);
    telemetry.record_duration(100U);

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.requests == 2U);
    CHECK(snapshot.smart_requests == 1U);
    CHECK(snapshot.dumb_requests == 1U);
    CHECK(snapshot.suggestions_dispatched == 2U);
    CHECK(snapshot.unrecognized_suggestions == 1U);
    CHECK(snapshot.candidates_considered == 14U);
    CHECK(snapshot.completions_emitted == 3U);
    CHECK(snapshot.total_duration_ns == 350U);
    CHECK(snapshot.last_duration_ns == 100U);

    telemetry.reset();
    const auto cleared = telemetry.snapshot();
    CHECK(cleared.requests == 0U);
    CHECK(cleared.candidates_considered == 0U);
    CHECK(cleared.last_duration_ns == 0U);
}

TEST_CASE("completion telemetry registry aggregates samplers")
{
    CompletionTelemetry first;
    CompletionTelemetry second;
    first.record_request(true);
    first.record_duration(40U);
    second.record_request(false);
    second.record_request(true);
    second.record_duration(90U);

    CompletionTelemetryRegistry registry;
    registry.register_sampler("first", [&first] { return first.snapshot(); });
    registry.register_sampler("second", [&second] { return second.snapshot(); });
    registry.register_sampler("empty", {});

    const auto total = registry.aggregate();
    CHECK(total.requests == 3U);
    CHECK(total.smart_requests == 2U);
    CHECK(total.dumb_requests == 1U);
    CHECK(total.total_duration_ns == 130U);
    CHECK(total.last_duration_ns == 90U);

    std::map<std::string, std::uint64_t> visited;
    registry.visit([&](const std::string& identifier, const CompletionTelemetrySnapshot& snapshot) {
        visited.emplace(identifier, snapshot.requests);
    });
    CHECK(visited == std::map<std::string, std::uint64_t>{{"first", 1U}, {"second", 2U}});

    registry.unregister_sampler("first");
    CHECK(registry.aggregate().requests == 2U);
}
