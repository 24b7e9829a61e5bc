#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "flowgate/core/error.hpp"
#include "flowgate/policy/policy.hpp"

namespace flowgate::policy {

/// Evidence for one explicit schema transform.
struct MigrationStepRecord {
    std::uint64_t from_schema_version = 0;
    std::uint64_t to_schema_version = 0;
    std::string transform_name;
    std::string input_hash;
    std::string output_hash;
};

/// What the loader did to get from the document on disk to the canonical
/// definition. Hashes are SHA-256 over canonicalised JSON (sorted keys,
/// compact separators).
struct MigrationAuditRecord {
    std::uint64_t source_schema_version = kCanonicalSchemaVersion;
    std::uint64_t target_schema_version = kCanonicalSchemaVersion;
    std::string source_document_hash;
    std::string target_document_hash;
    std::vector<MigrationStepRecord> migration_steps;

    [[nodiscard]] auto was_migrated() const noexcept -> bool { return !migration_steps.empty(); }
};

void to_json(json& j, const MigrationStepRecord& r);
void to_json(json& j, const MigrationAuditRecord& r);

struct PolicyLoadOutcome {
    PolicyDefinition policy;
    MigrationAuditRecord migration_audit;
};

inline constexpr std::string_view kMigrationV0ToV1 = "policy_schema_v0_to_v1";

/// Parses a JSON policy document. Schema 1 is taken as is; schema 0 is
/// migrated. Unknown fields at any level are rejected.
///
/// Errors: SerializationError for malformed JSON, missing or unknown
/// fields and bad enum values; UnsupportedSchemaVersion for any schema
/// other than 0 or 1.
auto parse_policy(std::string_view text) -> Result<PolicyLoadOutcome>;

/// Parses the same document written as YAML. Quoted scalars stay strings;
/// plain scalars read as booleans, integers or null where they spell one.
/// Validation and migration are those of parse_policy().
auto parse_policy_yaml(std::string_view text) -> Result<PolicyLoadOutcome>;

/// Reads and parses a policy file, as YAML for a `.yaml` or `.yml`
/// extension and as JSON otherwise. IoError if it cannot be read.
auto load_policy(const std::filesystem::path& path) -> Result<PolicyLoadOutcome>;

/// SHA-256 of the canonical JSON form of a definition.
[[nodiscard]] auto policy_hash(const PolicyDefinition& policy) -> std::string;

} // namespace flowgate::policy
