#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

#include "flowgate/audit/audit.hpp"

using namespace flowgate;
using namespace flowgate::audit;

namespace {

auto sample_record() -> SinkAuditRecord {
    return SinkAuditRecord{
        .execution_id = "exec-000001",
        .call_id = "call-000003",
        .tool = "send_email",
        .decision = decision::Decision::deny(decision::DenyReason::ConfidentialityForbidden,
                                             "carries pii", "body"),
        .side_effect_class = policy::SideEffectClass::ExternalWrite,
        .redaction_applied = false,
        .argument_confidentiality = {{"body", {"pii"}}, {"to", {}}},
        .policy_name = "assistant",
        .evaluated_at = 1234,
        .witness = std::nullopt,
    };
}

} // anonymous namespace

TEST_CASE("Audit record JSON", "[audit]") {
    SECTION("Sink call") {
        json j = sample_record();
        CHECK(j["execution_id"] == "exec-000001");
        CHECK(j["call_id"] == "call-000003");
        CHECK(j["decision"]["verdict"] == "Deny");
        CHECK(j["decision"]["reason"] == "ConfidentialityForbidden");
        CHECK(j["decision"]["argument"] == "body");
        CHECK(j["side_effect_class"] == "ExternalWrite");
        CHECK(j["redaction_applied"] == false);
        CHECK(j["call_path"] == "Planner");
        CHECK(j["argument_confidentiality"]["body"] == json::array({"pii"}));
        CHECK(j["argument_confidentiality"]["to"].empty());
        CHECK(j["evaluated_at"] == 1234);
        CHECK_FALSE(j.contains("witness"));
    }

    SECTION("Optional fields are omitted, not null") {
        auto record = sample_record();
        record.side_effect_class.reset();
        record.redaction_applied.reset();
        record.decision = decision::Decision::allow();
        json j = record;
        CHECK_FALSE(j.contains("side_effect_class"));
        CHECK_FALSE(j.contains("redaction_applied"));
        CHECK(j["decision"] == json{{"verdict", "Allow"}});
    }

    SECTION("Witness is embedded as is") {
        auto record = sample_record();
        record.witness = json{{"roots", json::array()}, {"max_depth", 4}, {"truncated", false}};
        json j = record;
        CHECK(j["witness"]["max_depth"] == 4);
    }
}

TEST_CASE("Transport guard", "[audit]") {
    auto record = sample_record();
    record.decision = decision::Decision::allow();

    SECTION("Denied calls never reach the transport") {
        record.redaction_applied = true;
        record.decision = decision::Decision::deny(decision::DenyReason::PolicyDefault);
        CHECK(transport_guard(record) == TransportOutcome::Blocked);
    }

    SECTION("Sink calls need redaction") {
        CHECK(transport_guard(record) == TransportOutcome::Blocked);
        record.redaction_applied.reset();
        CHECK(transport_guard(record) == TransportOutcome::Blocked);
        record.redaction_applied = true;
        CHECK(transport_guard(record) == TransportOutcome::Passed);
    }

    SECTION("Other calls pass on their decision") {
        record.side_effect_class = policy::SideEffectClass::ExternalRead;
        CHECK(transport_guard(record) == TransportOutcome::Passed);
        record.side_effect_class.reset();
        record.decision = decision::Decision{.verdict = decision::Verdict::RequireDraft};
        CHECK(transport_guard(record) == TransportOutcome::Passed);
    }

    CHECK(transport_outcome_to_string(TransportOutcome::Blocked) == "Blocked");
}

TEST_CASE("CollectingAuditSink", "[audit]") {
    CollectingAuditSink sink;

    SECTION("Keeps arrival order") {
        auto first = sample_record();
        auto second = sample_record();
        second.call_id = "call-000004";
        sink.record(first);
        sink.record(second);

        auto records = sink.records();
        REQUIRE(records.size() == 2);
        CHECK(records[0].call_id == "call-000003");
        CHECK(records[1].call_id == "call-000004");

        sink.clear();
        CHECK(sink.records().empty());
    }

    SECTION("Concurrent writers") {
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&sink] {
                for (int i = 0; i < 50; ++i) sink.record(sample_record());
            });
        }
        for (auto& w : writers) w.join();
        CHECK(sink.records().size() == 200);
    }
}

TEST_CASE("LogAuditSink accepts records", "[audit]") {
    LogAuditSink sink;
    CHECK_NOTHROW(sink.record(sample_record()));
}
