#include <catch2/catch_test_macros.hpp>

#include "status_tracker.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace {

json snapshot(const std::string& type, int sequence, const std::string& phase) {
    return {{"type", type}, {"state", {{"sequence", sequence}, {"phase", phase}}}};
}

} // namespace

TEST_CASE("StatusTracker", "[client]") {
    StatusTracker tracker;

    SECTION("StartsUnknown") {
        REQUIRE_FALSE(tracker.sequence());
        REQUIRE(tracker.phase() == "unknown");
    }

    SECTION("AcceptsNewerSnapshots") {
        REQUIRE(tracker.observe(snapshot("event", 1, "recording")));
        REQUIRE(tracker.observe(snapshot("event", 2, "transcribing")));
        REQUIRE(tracker.sequence() == 2u);
        REQUIRE(tracker.phase() == "transcribing");
    }

    SECTION("StalePollDoesNotRollBack") {
        REQUIRE(tracker.observe(snapshot("event", 5, "idle")));
        REQUIRE_FALSE(tracker.observe(snapshot("response", 4, "transcribing")));
        REQUIRE_FALSE(tracker.observe(snapshot("response", 5, "idle")));
        REQUIRE(tracker.phase() == "idle");
        REQUIRE(tracker.accepted() == 1);
        REQUIRE(tracker.ignored() == 2);
    }

    SECTION("MissedEventsRecoveredByPoll") {
        REQUIRE(tracker.observe(snapshot("event", 1, "recording")));
        // Events 2 and 3 were dropped; the poll reports the latest state
        REQUIRE(tracker.observe(snapshot("response", 3, "idle")));
        REQUIRE(tracker.phase() == "idle");
    }

    SECTION("MalformedMessagesIgnored") {
        REQUIRE_FALSE(tracker.observe(json::array()));
        REQUIRE_FALSE(tracker.observe({{"type", "event"}}));
        REQUIRE_FALSE(tracker.observe({{"state", {{"sequence", "7"}}}}));
        REQUIRE_FALSE(tracker.observe({{"state", {{"sequence", -1}}}}));
        REQUIRE_FALSE(tracker.sequence());
    }

    SECTION("ResetAcceptsLowerSequence") {
        REQUIRE(tracker.observe(snapshot("event", 40, "idle")));
        tracker.reset();
        REQUIRE(tracker.observe(snapshot("response", 0, "idle")));
        REQUIRE(tracker.sequence() == 0u);
    }
}
