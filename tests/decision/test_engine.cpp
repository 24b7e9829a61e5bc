#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <set>
#include <stdexcept>

#include "flowgate/decision/engine.hpp"
#include "flowgate/labels/verifier.hpp"
#include "flowgate/policy/loader.hpp"

using namespace flowgate;
using namespace flowgate::decision;
using flowgate::labels::ConfidentialityLabel;
using flowgate::labels::IntegrityLabel;
using flowgate::labels::Label;

namespace {

const char* kAssistantPolicy = R"({
  "schema_version": 1,
  "policy_name": "assistant",
  "default_action": "Deny",
  "strict_mode": true,
  "budgets": {
    "max_values": 1000,
    "max_parents_per_value": 16,
    "max_closure_steps": 100,
    "max_witness_depth": 8
  },
  "tools": [
    {
      "tool": "get_weather",
      "side_effect_class": "ExternalRead",
      "default_decision": "Allow"
    },
    {
      "tool": "send_payment",
      "side_effect_class": "ExternalWrite",
      "required_authority": ["payments:send"],
      "required_capability": "PaymentsCap",
      "arg_rules": [
        {"arg": "recipient", "requires_integrity": "Verified(AllowlistedPayee)"},
        {"arg": "memo", "forbids_confidentiality": ["pii", "secret"]}
      ],
      "context_rules": {"deny_if_pc_integrity_contains": ["Untrusted"]},
      "default_decision": "RequireConfirmation"
    },
    {
      "tool": "post_draft",
      "side_effect_class": "ExternalWrite",
      "arg_rules": [{"arg": "body", "forbids_confidentiality": ["secret"]}],
      "default_decision": "RequireDraft"
    },
    {
      "tool": "broken",
      "side_effect_class": "ExternalRead",
      "arg_rules": [{"arg": "x", "requires_integrity": "Verified(no closing"}],
      "default_decision": "Allow"
    }
  ]
})";

auto compile(const std::string& text) -> std::shared_ptr<const policy::RuleTable> {
    auto outcome = policy::parse_policy(text);
    REQUIRE(outcome.has_value());
    auto table = policy::RuleTable::compile(outcome->policy);
    REQUIRE(table.has_value());
    return std::make_shared<const policy::RuleTable>(std::move(*table));
}

auto with_policy_edit(const std::function<void(json&)>& edit)
    -> std::shared_ptr<const policy::RuleTable> {
    auto j = json::parse(kAssistantPolicy);
    edit(j);
    return compile(j.dump());
}

auto plain(IntegrityLabel integrity, std::set<std::string> tags = {}) -> Label {
    return Label{.integrity = std::move(integrity),
                 .confidentiality = ConfidentialityLabel(std::move(tags))};
}

class ThrowingSink final : public audit::AuditSink {
public:
    void record(const audit::SinkAuditRecord&) override {
        throw std::runtime_error("sink unavailable");
    }
};

/// Shared setup: a verifier for payees, a store with one payment token and
/// a graph with a verified recipient, a trusted memo and an untrusted page.
struct EngineFixture {
    ManualClock clock{1000};
    labels::VerifierRegistry verifiers;
    authority::AuthorityStore store{clock};
    graph::ValueGraph graph{graph::GraphBudgets{}};
    TokenId payment_token;

    static constexpr ValueId kRecipient = 1;
    static constexpr ValueId kMemo = 2;
    static constexpr ValueId kWebPage = 3;
    static constexpr ValueId kContactCard = 4;

    EngineFixture() {
        REQUIRE(verifiers.register_verifier("AllowlistedPayee", [](std::string_view c) {
            return c == "acct-42";
        }));
        auto payee = verifiers.verify("AllowlistedPayee", "acct-42");
        REQUIRE(payee.has_value());

        payment_token = mint({"payments:send", "email:send"}, "PaymentsCap", "agent", 2000);

        REQUIRE(graph.insert(kRecipient, plain(*payee), {}, "verify_payee"));
        REQUIRE(graph.insert(kMemo, plain(IntegrityLabel::trusted()), {}, "user_input"));
        REQUIRE(graph.insert(kWebPage, plain(IntegrityLabel::untrusted(), {"web"}), {}, "fetch"));
        REQUIRE(graph.insert(kContactCard, plain(IntegrityLabel::trusted(), {"pii"}), {},
                             "read_contacts"));
    }

    auto mint(authority::Scope scope, std::string capability = "PaymentsCap",
              std::string subject = "agent", std::optional<Timestamp> expires_at = std::nullopt)
        -> TokenId {
        auto token = store.mint(authority::MintRequest{
            .issuer_trust = authority::IssuerTrust::HostTrusted,
            .subject = std::move(subject),
            .capability = std::move(capability),
            .scope = std::move(scope),
            .expires_at = expires_at,
        });
        REQUIRE(token.has_value());
        return token->id;
    }

    /// Requests from a host that redacts sink payloads before dispatch.
    auto request(std::string tool, std::map<std::string, ValueId> args) const -> CallRequest {
        return CallRequest{
            .execution_id = "exec-000001",
            .call_id = "call-000001",
            .tool = std::move(tool),
            .arguments = std::move(args),
            .pc_context = {},
            .held_tokens = {payment_token},
            .redaction_applied = true,
        };
    }

    auto payment() const -> CallRequest {
        return request("send_payment", {{"recipient", kRecipient}, {"memo", kMemo}});
    }
};

} // anonymous namespace

TEST_CASE_METHOD(EngineFixture, "Read-only tools are allowed on untrusted data",
                 "[decision][engine]") {
    PolicyEngine engine(compile(kAssistantPolicy), store);

    auto result = engine.evaluate(graph, request("get_weather", {{"city", kWebPage}}));
    CHECK(result.decision.is_allow());
    CHECK_FALSE(result.witness.has_value());
    CHECK(result.audit.side_effect_class == policy::SideEffectClass::ExternalRead);
    CHECK_FALSE(result.audit.redaction_applied.has_value());
    CHECK(result.audit.argument_confidentiality.at("city") == std::vector<std::string>{"web"});
}

TEST_CASE_METHOD(EngineFixture, "A fully satisfied sink call reaches its default",
                 "[decision][engine]") {
    PolicyEngine engine(compile(kAssistantPolicy), store);

    auto result = engine.evaluate(graph, payment());
    CHECK(result.decision.verdict == Verdict::RequireConfirmation);
    CHECK_FALSE(result.decision.reason.has_value());
    // RequireConfirmation is not an Allow, so it comes with a witness.
    REQUIRE(result.witness.has_value());
    CHECK(result.witness->roots.size() == 2);
    CHECK(result.audit.redaction_applied == std::optional<bool>(true));
    CHECK(result.audit.call_path == LlmCallPath::Planner);

    SECTION("Draft-only tools") {
        auto draft = engine.evaluate(graph, request("post_draft", {{"body", kMemo}}));
        CHECK(draft.decision.verdict == Verdict::RequireDraft);
    }
}

TEST_CASE_METHOD(EngineFixture, "Integrity requirements follow the whole closure",
                 "[decision][engine]") {
    PolicyEngine engine(compile(kAssistantPolicy), store);

    SECTION("Recipient derived partly from a web page") {
        REQUIRE(graph.insert(5, plain(IntegrityLabel::trusted()), {kRecipient, kWebPage},
                             "extract_recipient"));
        auto call = payment();
        call.arguments["recipient"] = 5;

        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::IntegrityRequirementNotMet);
        CHECK(result.decision.argument == std::optional<std::string>("recipient"));
        REQUIRE(result.witness.has_value());
        REQUIRE(result.witness->roots.size() == 1);
        CHECK(result.witness->roots[0].argument == "recipient");
        CHECK(result.witness->roots[0].node.parents.size() == 2);
    }

    SECTION("Trusted is not Verified") {
        auto call = payment();
        call.arguments["recipient"] = kMemo;
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::IntegrityRequirementNotMet);
    }

    SECTION("A different verification tag does not match") {
        REQUIRE(verifiers.register_verifier("KnownContact", [](std::string_view) { return true; }));
        auto contact = verifiers.verify("KnownContact", "bob");
        REQUIRE(contact.has_value());
        REQUIRE(graph.insert(5, plain(*contact), {}));

        auto call = payment();
        call.arguments["recipient"] = 5;
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::IntegrityRequirementNotMet);
    }
}

TEST_CASE_METHOD(EngineFixture, "Control context is checked first in strict mode",
                 "[decision][engine]") {
    auto call = payment();
    call.pc_context = {IntegrityLabel::trusted(), IntegrityLabel::untrusted()};
    call.held_tokens.clear();

    SECTION("Strict mode denies before authority") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::UntrustedControlContext);
        CHECK_FALSE(result.decision.argument.has_value());
    }

    SECTION("Context rules are ignored outside strict mode") {
        PolicyEngine engine(with_policy_edit([](json& j) { j["strict_mode"] = false; }), store);
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::MissingAuthority);
    }

    SECTION("A trusted context passes") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto clean = payment();
        clean.pc_context = {IntegrityLabel::trusted()};
        CHECK(engine.evaluate(graph, clean).decision.verdict == Verdict::RequireConfirmation);
    }
}

TEST_CASE_METHOD(EngineFixture, "Authority must be held and valid", "[decision][engine]") {
    PolicyEngine engine(compile(kAssistantPolicy), store);

    SECTION("No tokens") {
        auto call = payment();
        call.held_tokens.clear();
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::MissingAuthority);
        CHECK(result.decision.detail.find("payments:send") != std::string::npos);
    }

    SECTION("Revoked token") {
        REQUIRE(store.revoke(payment_token));
        auto result = engine.evaluate(graph, payment());
        CHECK(result.decision.reason == DenyReason::MissingAuthority);
        REQUIRE(result.stripped_tokens.size() == 1);
        CHECK(result.stripped_tokens[0].status == authority::TokenStatus::Revoked);
    }

    SECTION("Expired token, inclusive at the boundary") {
        clock.set(1999);
        CHECK(engine.evaluate(graph, payment()).decision.verdict == Verdict::RequireConfirmation);
        clock.set(2000);
        CHECK(engine.evaluate(graph, payment()).decision.reason == DenyReason::MissingAuthority);
    }

    SECTION("Delegated token covering the scope") {
        auto child = store.delegate(authority::DelegationRequest{
            .parent_id = payment_token, .scope = {"payments:send"}, .expires_at = 1500});
        REQUIRE(child.has_value());
        auto call = payment();
        call.held_tokens = {child->id};
        CHECK(engine.evaluate(graph, call).decision.verdict == Verdict::RequireConfirmation);

        SECTION("Revoking the parent cuts the child") {
            REQUIRE(store.revoke(payment_token));
            CHECK(engine.evaluate(graph, call).decision.reason == DenyReason::MissingAuthority);
        }
    }

    SECTION("Scope split across tokens is covered by their union") {
        auto a = mint({"payments:send"});
        auto with_two = with_policy_edit([](json& j) {
            j["tools"][1]["required_authority"] = json::array({"payments:send", "ledger:write"});
        });
        auto b = mint({"ledger:write"});

        PolicyEngine two(with_two, store);
        auto call = payment();
        call.held_tokens = {a};
        CHECK(two.evaluate(graph, call).decision.reason == DenyReason::MissingAuthority);
        call.held_tokens = {a, b};
        CHECK(two.evaluate(graph, call).decision.verdict == Verdict::RequireConfirmation);
    }
}

TEST_CASE_METHOD(EngineFixture, "Authority is matched on capability and subject",
                 "[decision][engine]") {
    SECTION("A token for the right resource but another capability") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto call = payment();
        call.held_tokens = {mint({"payments:send"}, "EmailCap")};
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::MissingAuthority);
        CHECK(result.decision.detail.find("PaymentsCap") != std::string::npos);
    }

    SECTION("Capability matches only on the tokens that carry it") {
        auto with_two = with_policy_edit([](json& j) {
            j["tools"][1]["required_authority"] = json::array({"payments:send", "ledger:write"});
        });
        PolicyEngine engine(with_two, store);
        auto call = payment();
        call.held_tokens = {mint({"payments:send"}), mint({"ledger:write"}, "LedgerCap")};
        CHECK(engine.evaluate(graph, call).decision.reason == DenyReason::MissingAuthority);
    }

    SECTION("A required subject") {
        PolicyEngine engine(with_policy_edit([](json& j) {
            j["tools"][1]["required_subject"] = "treasurer";
        }), store);

        CHECK(engine.evaluate(graph, payment()).decision.reason == DenyReason::MissingAuthority);

        auto call = payment();
        call.held_tokens = {mint({"payments:send"}, "PaymentsCap", "treasurer")};
        CHECK(engine.evaluate(graph, call).decision.verdict == Verdict::RequireConfirmation);
    }

    SECTION("Capability without resources still needs a matching token") {
        PolicyEngine engine(with_policy_edit([](json& j) {
            j["tools"][0]["required_capability"] = "WeatherCap";
        }), store);
        auto call = request("get_weather", {{"city", kWebPage}});
        CHECK(engine.evaluate(graph, call).decision.reason == DenyReason::MissingAuthority);

        call.held_tokens.push_back(mint({"weather:read"}, "WeatherCap"));
        CHECK(engine.evaluate(graph, call).decision.is_allow());
    }

    SECTION("Delegated tokens keep the parent's capability") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto email_root = mint({"payments:send", "email:send"}, "EmailCap", "agent", 1800);
        auto child = store.delegate(authority::DelegationRequest{
            .parent_id = email_root, .scope = {"payments:send"}, .expires_at = 1500});
        REQUIRE(child.has_value());
        CHECK(child->capability == "EmailCap");

        auto call = payment();
        call.held_tokens = {child->id};
        CHECK(engine.evaluate(graph, call).decision.reason == DenyReason::MissingAuthority);
    }
}

TEST_CASE_METHOD(EngineFixture, "Sink calls must be redacted before dispatch",
                 "[decision][engine]") {
    PolicyEngine engine(compile(kAssistantPolicy), store);

    SECTION("Unredacted sink call") {
        auto call = payment();
        call.redaction_applied = false;
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::RedactionNotApplied);
        CHECK(result.audit.redaction_applied == std::optional<bool>(false));
        CHECK(audit::transport_guard(result.audit) == audit::TransportOutcome::Blocked);
    }

    SECTION("Unreported redaction counts as not applied") {
        auto call = request("post_draft", {{"body", kMemo}});
        call.redaction_applied.reset();
        call.call_path = LlmCallPath::Quarantined;
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::RedactionNotApplied);
        CHECK(result.decision.detail.find("Quarantined") != std::string::npos);
        CHECK(result.audit.call_path == LlmCallPath::Quarantined);
    }

    SECTION("Earlier denials keep their own reason") {
        auto call = payment();
        call.redaction_applied = false;
        call.held_tokens.clear();
        CHECK(engine.evaluate(graph, call).decision.reason == DenyReason::MissingAuthority);
    }

    SECTION("A Deny default keeps its own reason") {
        PolicyEngine denying(with_policy_edit([](json& j) {
            j["tools"][2]["default_decision"] = "Deny";
        }), store);
        auto call = request("post_draft", {{"body", kMemo}});
        call.redaction_applied = false;
        CHECK(denying.evaluate(graph, call).decision.reason == DenyReason::PolicyDefault);
    }

    SECTION("Read tools need no redaction") {
        auto call = request("get_weather", {{"city", kWebPage}});
        call.redaction_applied = false;
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.is_allow());
        CHECK(audit::transport_guard(result.audit) == audit::TransportOutcome::Passed);
    }

    SECTION("Redacted sink call passes the transport guard") {
        auto result = engine.evaluate(graph, payment());
        CHECK(result.decision.verdict == Verdict::RequireConfirmation);
        CHECK(audit::transport_guard(result.audit) == audit::TransportOutcome::Passed);
    }
}

TEST_CASE_METHOD(EngineFixture, "Forbidden confidentiality tags block sinks",
                 "[decision][engine]") {
    PolicyEngine engine(compile(kAssistantPolicy), store);

    REQUIRE(graph.insert(5, plain(IntegrityLabel::trusted()), {kMemo, kContactCard}, "compose"));
    auto call = payment();
    call.arguments["memo"] = 5;

    auto result = engine.evaluate(graph, call);
    CHECK(result.decision.reason == DenyReason::ConfidentialityForbidden);
    CHECK(result.decision.argument == std::optional<std::string>("memo"));
    CHECK(result.decision.detail.find("pii") != std::string::npos);
    CHECK(result.audit.argument_confidentiality.at("memo") == std::vector<std::string>{"pii"});
}

TEST_CASE_METHOD(EngineFixture, "Closure failures fail closed", "[decision][engine]") {
    SECTION("Closure budget") {
        PolicyEngine engine(with_policy_edit([](json& j) {
            j["budgets"]["max_closure_steps"] = 3;
        }), store);

        ValueId previous = kRecipient;
        for (ValueId id = 5; id < 10; ++id) {
            auto verified = verifiers.verify("AllowlistedPayee", "acct-42");
            REQUIRE(graph.insert(id, plain(*verified), {previous}));
            previous = id;
        }
        auto call = payment();
        call.arguments["recipient"] = previous;

        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::BudgetExceeded);
        CHECK(result.decision.argument == std::optional<std::string>("recipient"));
        CHECK(result.audit.argument_confidentiality.at("recipient") ==
              std::vector<std::string>{"*"});
    }

    SECTION("Unknown value in a constrained argument") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto call = payment();
        call.arguments["recipient"] = 999;
        auto result = engine.evaluate(graph, call);
        CHECK(result.decision.reason == DenyReason::UnknownValue);
    }

    SECTION("Unknown value in an unconstrained argument") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto result = engine.evaluate(graph, request("get_weather", {{"city", 999}}));
        CHECK(result.decision.reason == DenyReason::UnknownValue);
        REQUIRE(result.witness.has_value());
        CHECK(result.witness->roots[0].node.missing);
    }

    SECTION("Rule names an argument the call does not carry") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto result = engine.evaluate(graph, request("send_payment", {{"recipient", kRecipient}}));
        CHECK(result.decision.reason == DenyReason::MalformedRule);
        CHECK(result.decision.argument == std::optional<std::string>("memo"));
    }
}

TEST_CASE_METHOD(EngineFixture, "Tools without a usable rule", "[decision][engine]") {
    SECTION("Malformed rule") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto result = engine.evaluate(graph, request("broken", {{"x", kMemo}}));
        CHECK(result.decision.reason == DenyReason::MalformedRule);
        CHECK(result.audit.side_effect_class == policy::SideEffectClass::ExternalRead);
    }

    SECTION("Unlisted tool under a Deny default") {
        PolicyEngine engine(compile(kAssistantPolicy), store);
        auto result = engine.evaluate(graph, request("delete_everything", {}));
        CHECK(result.decision.reason == DenyReason::PolicyDefault);
        CHECK_FALSE(result.audit.side_effect_class.has_value());
    }

    SECTION("Unlisted tool under an Allow default") {
        PolicyEngine engine(with_policy_edit([](json& j) { j["default_action"] = "Allow"; }),
                            store);
        CHECK(engine.evaluate(graph, request("ping", {{"host", kWebPage}})).decision.is_allow());
    }

    SECTION("Tool default of Deny") {
        PolicyEngine engine(with_policy_edit([](json& j) {
            j["tools"][0]["default_decision"] = "Deny";
        }), store);
        auto result = engine.evaluate(graph, request("get_weather", {}));
        CHECK(result.decision.reason == DenyReason::PolicyDefault);
    }
}

TEST_CASE_METHOD(EngineFixture, "Audit records and witnesses", "[decision][engine]") {
    audit::CollectingAuditSink sink;

    SECTION("Every evaluation is recorded") {
        PolicyEngine engine(compile(kAssistantPolicy), store, EngineOptions{}, &sink);
        auto call = payment();
        call.redaction_applied = true;
        (void)engine.evaluate(graph, call);
        (void)engine.evaluate(graph, request("get_weather", {{"city", kWebPage}}));

        auto records = sink.records();
        REQUIRE(records.size() == 2);
        CHECK(records[0].tool == "send_payment");
        CHECK(records[0].redaction_applied == std::optional<bool>(true));
        CHECK(records[0].policy_name == "assistant");
        CHECK(records[0].evaluated_at == 1000);
        CHECK(records[0].witness.has_value());
        CHECK(records[1].decision.is_allow());
        CHECK_FALSE(records[1].witness.has_value());
    }

    SECTION("Witness on allow") {
        PolicyEngine engine(compile(kAssistantPolicy), store,
                            EngineOptions{.witness_on_allow = true}, &sink);
        auto result = engine.evaluate(graph, request("get_weather", {{"city", kWebPage}}));
        CHECK(result.decision.is_allow());
        REQUIRE(result.witness.has_value());
        CHECK(result.witness->roots[0].node.id == kWebPage);
    }

    SECTION("Witness kept out of the audit record") {
        PolicyEngine engine(compile(kAssistantPolicy), store,
                            EngineOptions{.include_witness_in_audit = false}, &sink);
        auto call = payment();
        call.held_tokens.clear();
        auto result = engine.evaluate(graph, call);
        CHECK(result.witness.has_value());
        CHECK_FALSE(result.audit.witness.has_value());
    }

    SECTION("A failing sink does not change the decision") {
        ThrowingSink broken;
        PolicyEngine engine(compile(kAssistantPolicy), store, EngineOptions{}, &broken);
        auto result = engine.evaluate(graph, payment());
        CHECK(result.decision.verdict == Verdict::RequireConfirmation);
    }
}
