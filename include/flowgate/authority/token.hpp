#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "flowgate/core/types.hpp"

namespace flowgate::authority {

using Scope = std::set<std::string>;

/// Half-open validity window [not_before, expires_at). No expiry means the
/// token never expires on its own.
struct ValidityWindow {
    Timestamp not_before = 0;
    std::optional<Timestamp> expires_at;

    [[nodiscard]] auto is_expired_at(Timestamp t) const noexcept -> bool {
        return expires_at.has_value() && t >= *expires_at;
    }

    [[nodiscard]] auto is_before_start(Timestamp t) const noexcept -> bool {
        return t < not_before;
    }

    /// True when `inner` starts no earlier and expires strictly earlier than
    /// this window. An open-ended `inner` is never strictly contained.
    [[nodiscard]] auto strictly_contains(const ValidityWindow& inner) const noexcept -> bool;

    auto operator==(const ValidityWindow&) const -> bool = default;
};

/// Revocable, delegatable capability grant.
///
/// A token grants `capability` on each resource in `scope` to `subject`.
/// Delegated tokens inherit the capability of their parent.
struct AuthorityToken {
    TokenId id;
    std::string issuer;   // who minted or delegated it
    std::string subject;  // principal it grants authority to
    std::string capability;
    Scope scope;
    ValidityWindow validity;
    std::optional<TokenId> parent_id;
    bool revoked = false;  // own flag only; ancestry is checked at validation

    /// True when this token's subject, capability and scope all match.
    [[nodiscard]] auto grants(std::string_view who, std::string_view cap,
                              std::string_view resource) const -> bool;

    auto operator==(const AuthorityToken&) const -> bool = default;
};

void to_json(json& j, const AuthorityToken& t);
void from_json(const json& j, AuthorityToken& t);

enum class TokenStatus {
    Valid,
    Revoked,      // the token or one of its ancestors is revoked
    Expired,      // at or after the token's own expiry
    NotYetValid,  // before the token's own start
    Unknown,      // no such token
};

auto token_status_to_string(TokenStatus status) -> std::string_view;

enum class DelegationError {
    UnknownParent,
    ParentRevoked,
    ParentExpired,
    ScopeNotNarrowed,
    LifetimeNotNarrowed,
    InvalidWindow,
};

auto delegation_error_to_string(DelegationError error) -> std::string_view;

/// Whether the party asking to mint is the host itself. Only HostTrusted
/// issuers may mint root tokens.
enum class IssuerTrust {
    Untrusted,
    HostTrusted,
};

auto issuer_trust_to_string(IssuerTrust trust) -> std::string_view;
auto parse_issuer_trust(std::string_view text) -> std::optional<IssuerTrust>;

/// Root token request. The mint time is the store clock's now().
struct MintRequest {
    std::string issuer = "host";
    IssuerTrust issuer_trust = IssuerTrust::Untrusted;
    std::string subject;
    std::string capability;
    Scope scope;
    std::optional<Timestamp> expires_at;
};

/// Delegation of an existing token. The child starts at the store clock's
/// now(); subject defaults to the parent's subject and the capability is
/// always the parent's.
struct DelegationRequest {
    TokenId parent_id;
    std::string delegated_by;
    std::optional<std::string> subject;
    Scope scope;
    std::optional<Timestamp> expires_at;
};

} // namespace flowgate::authority
