#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "flowgate/audit/audit.hpp"
#include "flowgate/authority/authority_store.hpp"
#include "flowgate/core/clock.hpp"
#include "flowgate/core/error.hpp"
#include "flowgate/decision/engine.hpp"
#include "flowgate/labels/verifier.hpp"
#include "flowgate/policy/rule_table.hpp"
#include "flowgate/runtime/execution.hpp"

namespace flowgate::cli {

struct ScenarioOptions {
    decision::EngineOptions engine;
    audit::AuditSink* sink = nullptr;
    /// When set, suspend/resume goes through a snapshot file in this
    /// directory instead of an in-memory round trip.
    std::optional<std::filesystem::path> snapshot_dir;
    bool verify_digest = true;
};

/// Replays a scenario document against one policy.
///
/// A scenario is `{"execution_id", "start_time", "verifiers", "steps"}`.
/// `verifiers` maps a tag to the candidate strings its verifier accepts.
/// Each step is an object with an `op`:
///
///   advance  {seconds}                 move the manual clock forward
///   mint     {as?, subject, capability, scope, issuer?, issuer_trust?,
///             expires_at?}             issuer_trust defaults to HostTrusted
///   delegate {as?, parent, scope, subject?, by?, expires_at?}
///   revoke   {token}
///   grant    {token}                   add a token to the execution
///   value    {id, integrity? | verify{tag, candidate}, confidentiality?,
///             parents?, operation?}
///   call     {tool, arguments, pc_context?, redaction_applied?, call_path?}
///   suspend  {}                        snapshot execution, drop its graph
///   resume   {}                        restore authority, revalidate tokens,
///                                      replay recorded values
///
/// Token references accept an `as` alias or a literal token ID. Each call
/// produces its audit record, plus the transport guard outcome, as one
/// output line; token and lifecycle steps produce event lines.
class ScenarioRunner {
public:
    ScenarioRunner(std::shared_ptr<const policy::RuleTable> rules, ScenarioOptions options);
    ~ScenarioRunner();

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    /// Runs every step in order. Malformed steps and failed mints abort the
    /// run with an error; policy outcomes never do.
    auto run(const json& scenario) -> Result<std::vector<json>>;

private:
    struct RecordedValue {
        ValueId id;
        labels::Label label;
        std::vector<ValueId> parents;
        std::string operation;
    };

    auto step(const json& s, std::vector<json>& out) -> VoidResult;
    auto do_mint(const json& s, std::vector<json>& out) -> VoidResult;
    auto do_delegate(const json& s, std::vector<json>& out) -> VoidResult;
    auto do_revoke(const json& s, std::vector<json>& out) -> VoidResult;
    auto do_value(const json& s, std::vector<json>& out) -> VoidResult;
    auto do_call(const json& s, std::vector<json>& out) -> VoidResult;
    auto do_suspend(std::vector<json>& out) -> VoidResult;
    auto do_resume(std::vector<json>& out) -> VoidResult;

    auto resolve_token(const std::string& ref) const -> TokenId;
    auto require_execution() -> Result<runtime::Execution*>;
    void rebuild_engine();

    std::shared_ptr<const policy::RuleTable> rules_;
    ScenarioOptions options_;

    ManualClock clock_;
    labels::VerifierRegistry verifiers_;
    std::unique_ptr<authority::AuthorityStore> store_;
    std::unique_ptr<decision::PolicyEngine> engine_;
    std::unique_ptr<runtime::Execution> execution_;
    std::optional<runtime::ExecutionSnapshot> suspended_;

    std::map<std::string, TokenId> aliases_;
    std::vector<RecordedValue> values_;
};

} // namespace flowgate::cli
