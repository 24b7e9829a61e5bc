#include "flowgate/cli/scenario.hpp"

#include <algorithm>
#include <set>

#include "flowgate/authority/snapshot.hpp"
#include "flowgate/core/logger.hpp"

namespace flowgate::cli {

namespace {

auto scope_from(const json& j) -> authority::Scope {
    return j.get<authority::Scope>();
}

auto optional_time(const json& s, const char* key) -> std::optional<Timestamp> {
    auto it = s.find(key);
    if (it == s.end() || it->is_null()) return std::nullopt;
    return it->get<Timestamp>();
}

auto plain_integrity(std::string_view text) -> std::optional<labels::IntegrityLabel> {
    if (text == "Untrusted") return labels::IntegrityLabel::untrusted();
    if (text == "Trusted") return labels::IntegrityLabel::trusted();
    return std::nullopt;
}

auto invalid_step(std::string message) -> VoidResult {
    return std::unexpected(make_error(ErrorCode::InvalidArgument, std::move(message)));
}

} // anonymous namespace

ScenarioRunner::ScenarioRunner(std::shared_ptr<const policy::RuleTable> rules,
                               ScenarioOptions options)
    : rules_(std::move(rules))
    , options_(std::move(options))
    , store_(std::make_unique<authority::AuthorityStore>(clock_))
{
    rebuild_engine();
}

ScenarioRunner::~ScenarioRunner() = default;

void ScenarioRunner::rebuild_engine() {
    engine_ = std::make_unique<decision::PolicyEngine>(rules_, *store_, options_.engine,
                                                       options_.sink);
}

auto ScenarioRunner::run(const json& scenario) -> Result<std::vector<json>> {
    std::vector<json> out;

    try {
        clock_.set(scenario.value("start_time", Timestamp{0}));

        if (auto it = scenario.find("verifiers"); it != scenario.end()) {
            for (const auto& [tag, accepted] : it->items()) {
                auto allowed = accepted.get<std::vector<std::string>>();
                auto registered = verifiers_.register_verifier(
                    tag, [allowed](std::string_view candidate) {
                        return std::ranges::find(allowed, candidate) != allowed.end();
                    });
                if (!registered) return std::unexpected(registered.error());
            }
        }

        execution_ = std::make_unique<runtime::Execution>(
            scenario.value("execution_id", std::string("exec-000001")), *engine_);

        const auto& steps = scenario.at("steps");
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (auto result = step(steps[i], out); !result) {
                return std::unexpected(
                    result.error().wrap("Scenario step " + std::to_string(i) + " failed"));
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Malformed scenario", e.what()));
    }

    return out;
}

auto ScenarioRunner::step(const json& s, std::vector<json>& out) -> VoidResult {
    auto op = s.at("op").get<std::string>();

    if (op == "advance") {
        clock_.advance(s.at("seconds").get<Timestamp>());
        return {};
    }
    if (op == "mint") return do_mint(s, out);
    if (op == "delegate") return do_delegate(s, out);
    if (op == "revoke") return do_revoke(s, out);
    if (op == "grant") {
        auto exec = require_execution();
        if (!exec) return std::unexpected(exec.error());
        (*exec)->grant(resolve_token(s.at("token").get<std::string>()));
        return {};
    }
    if (op == "value") return do_value(s, out);
    if (op == "call") return do_call(s, out);
    if (op == "suspend") return do_suspend(out);
    if (op == "resume") return do_resume(out);

    return invalid_step("Unknown scenario op `" + op + "`");
}

auto ScenarioRunner::resolve_token(const std::string& ref) const -> TokenId {
    if (auto it = aliases_.find(ref); it != aliases_.end()) return it->second;
    return ref;
}

auto ScenarioRunner::require_execution() -> Result<runtime::Execution*> {
    if (!execution_) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Execution is suspended"));
    }
    return execution_.get();
}

auto ScenarioRunner::do_mint(const json& s, std::vector<json>& out) -> VoidResult {
    authority::MintRequest request;
    request.subject = s.at("subject").get<std::string>();
    request.capability = s.at("capability").get<std::string>();
    request.scope = scope_from(s.at("scope"));
    request.issuer = s.value("issuer", std::string("host"));
    request.expires_at = optional_time(s, "expires_at");

    // Scenario documents are written by the host, so their mints are
    // host-trusted unless a step says otherwise.
    auto trust_text = s.value("issuer_trust", std::string("HostTrusted"));
    auto trust = authority::parse_issuer_trust(trust_text);
    if (!trust) return invalid_step("Unknown issuer_trust `" + trust_text + "`");
    request.issuer_trust = *trust;

    auto token = store_->mint(request);
    if (!token) return std::unexpected(token.error());

    if (auto alias = s.value("as", std::string{}); !alias.empty()) {
        aliases_[alias] = token->id;
    }
    out.push_back(json{{"event", "mint"}, {"token", *token}});
    return {};
}

auto ScenarioRunner::do_delegate(const json& s, std::vector<json>& out) -> VoidResult {
    authority::DelegationRequest request;
    request.parent_id = resolve_token(s.at("parent").get<std::string>());
    request.delegated_by = s.value("by", std::string{});
    if (auto it = s.find("subject"); it != s.end() && !it->is_null()) {
        request.subject = it->get<std::string>();
    }
    request.scope = scope_from(s.at("scope"));
    request.expires_at = optional_time(s, "expires_at");

    auto token = store_->delegate(request);
    if (!token) {
        out.push_back(json{
            {"event", "delegate"},
            {"parent", request.parent_id},
            {"error", std::string(authority::delegation_error_to_string(token.error()))},
        });
        return {};
    }

    if (auto alias = s.value("as", std::string{}); !alias.empty()) {
        aliases_[alias] = token->id;
    }
    out.push_back(json{{"event", "delegate"}, {"token", *token}});
    return {};
}

auto ScenarioRunner::do_revoke(const json& s, std::vector<json>& out) -> VoidResult {
    auto id = resolve_token(s.at("token").get<std::string>());
    auto result = store_->revoke(id);
    if (!result) return result;
    out.push_back(json{{"event", "revoke"}, {"token", id}});
    return {};
}

auto ScenarioRunner::do_value(const json& s, std::vector<json>& out) -> VoidResult {
    auto exec = require_execution();
    if (!exec) return std::unexpected(exec.error());

    RecordedValue value{
        .id = s.at("id").get<ValueId>(),
        .label = {},
        .parents = s.value("parents", std::vector<ValueId>{}),
        .operation = s.value("operation", std::string{}),
    };

    if (auto it = s.find("verify"); it != s.end()) {
        auto tag = it->at("tag").get<std::string>();
        auto candidate = it->at("candidate").get<std::string>();
        if (auto verified = verifiers_.verify(tag, candidate)) {
            value.label.integrity = *verified;
        } else {
            out.push_back(json{{"event", "verify"}, {"value", value.id}, {"tag", tag},
                               {"accepted", false}});
        }
    } else {
        auto text = s.value("integrity", std::string("Untrusted"));
        auto integrity = plain_integrity(text);
        if (!integrity) {
            return invalid_step("Value integrity must be Untrusted or Trusted, got `" + text +
                                "`; use `verify` for verified values");
        }
        value.label.integrity = *integrity;
    }
    value.label.confidentiality = labels::ConfidentialityLabel(
        s.value("confidentiality", std::set<std::string>{}));

    auto inserted = (*exec)->record_value(value.id, value.label, value.parents, value.operation);
    if (!inserted) {
        out.push_back(json{
            {"event", "value"},
            {"value", value.id},
            {"error", std::string(error_code_to_string(inserted.error().code()))},
            {"detail", inserted.error().what()},
        });
        return {};
    }
    values_.push_back(std::move(value));
    return {};
}

auto ScenarioRunner::do_call(const json& s, std::vector<json>& out) -> VoidResult {
    auto exec = require_execution();
    if (!exec) return std::unexpected(exec.error());

    std::vector<labels::IntegrityLabel> pc_context;
    for (const auto& text : s.value("pc_context", std::vector<std::string>{})) {
        auto label = plain_integrity(text);
        if (!label) return invalid_step("PC context entries must be Untrusted or Trusted");
        pc_context.push_back(*label);
    }

    std::optional<bool> redaction;
    if (auto it = s.find("redaction_applied"); it != s.end() && !it->is_null()) {
        redaction = it->get<bool>();
    }

    auto path_text = s.value("call_path", std::string("Planner"));
    auto call_path = decision::parse_llm_call_path(path_text);
    if (!call_path) return invalid_step("Unknown call_path `" + path_text + "`");

    auto evaluation = (*exec)->evaluate(
        s.at("tool").get<std::string>(),
        s.value("arguments", std::map<std::string, ValueId>{}),
        std::move(pc_context), redaction, *call_path);

    json line = evaluation.audit;
    line["transport"] = std::string(audit::transport_outcome_to_string(
        audit::transport_guard(evaluation.audit)));
    out.push_back(std::move(line));
    return {};
}

auto ScenarioRunner::do_suspend(std::vector<json>& out) -> VoidResult {
    auto exec = require_execution();
    if (!exec) return std::unexpected(exec.error());

    auto snapshot = (*exec)->suspend();
    out.push_back(json{{"event", "suspend"}, {"snapshot", snapshot}});
    execution_.reset();
    suspended_ = std::move(snapshot);
    return {};
}

auto ScenarioRunner::do_resume(std::vector<json>& out) -> VoidResult {
    if (!suspended_) {
        return invalid_step("Nothing to resume");
    }

    // Authority state crosses the boundary in its serialised form.
    auto table = store_->serialize();
    Result<std::unique_ptr<authority::AuthorityStore>> restored =
        std::unexpected(make_error(ErrorCode::InternalError, "not restored"));
    if (options_.snapshot_dir) {
        auto path = *options_.snapshot_dir / (suspended_->execution_id + ".authority.json");
        if (auto written = authority::write_snapshot(*store_, path); !written) {
            return written;
        }
        restored = authority::read_snapshot(path, clock_, options_.verify_digest);
    } else {
        restored = authority::AuthorityStore::restore(table, clock_);
    }
    if (!restored) return std::unexpected(restored.error());
    if ((*restored)->serialize() != table) {
        return std::unexpected(make_error(
            ErrorCode::InternalError, "Restored authority table differs from the original"));
    }

    engine_.reset();
    store_ = std::move(*restored);
    rebuild_engine();

    execution_ = runtime::Execution::resume(*suspended_, *engine_);
    suspended_.reset();

    for (const auto& value : values_) {
        auto replayed = execution_->record_value(value.id, value.label, value.parents,
                                                 value.operation);
        if (!replayed) return replayed;
    }

    json stripped = json::array();
    for (const auto& s : execution_->stripped_on_resume()) {
        stripped.push_back(json{
            {"id", s.id},
            {"status", std::string(authority::token_status_to_string(s.status))},
        });
    }
    out.push_back(json{
        {"event", "resume"},
        {"execution_id", execution_->id()},
        {"kept", execution_->held_tokens()},
        {"stripped", std::move(stripped)},
    });
    return {};
}

} // namespace flowgate::cli
