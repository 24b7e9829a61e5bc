#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flowgate/authority/token.hpp"
#include "flowgate/core/clock.hpp"
#include "flowgate/core/error.hpp"

namespace flowgate::authority {

using TokenMap = std::map<TokenId, AuthorityToken, std::less<>>;

/// Immutable point-in-time view of the token table.
///
/// Evaluations validate against one TokenTable for their whole duration, so a
/// concurrent revoke is observed either entirely or not at all.
class TokenTable {
public:
    TokenTable();
    explicit TokenTable(std::shared_ptr<const TokenMap> tokens);

    [[nodiscard]] auto find(std::string_view id) const -> const AuthorityToken*;

    /// Walks the delegation chain to the root. Revoked if the token or any
    /// ancestor is revoked; otherwise checks only the token's own window,
    /// since delegation already confined it to every ancestor's window.
    [[nodiscard]] auto status(std::string_view id, Timestamp at) const -> TokenStatus;

    [[nodiscard]] auto lineage_revoked(const AuthorityToken& token) const -> bool;

    [[nodiscard]] auto tokens() const noexcept -> const TokenMap& { return *tokens_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return tokens_->size(); }

private:
    std::shared_ptr<const TokenMap> tokens_;
};

struct StrippedToken {
    TokenId id;
    TokenStatus status;
};

/// Held tokens split into those still Valid and those stripped.
struct TokenValidation {
    std::vector<AuthorityToken> effective;
    std::vector<StrippedToken> stripped;
};

/// Validates a held-token list against one table at one instant. Order of
/// `effective` follows the input; duplicates are collapsed.
[[nodiscard]] auto validate_held_tokens(const TokenTable& table,
                                        const std::vector<TokenId>& held,
                                        Timestamp at) -> TokenValidation;

/// Owns every minted token, its delegation lineage and revocation state.
///
/// Tokens are never deleted. Writers are serialised; each write publishes a
/// fresh immutable table, readers take snapshots without blocking writers
/// for longer than a pointer copy.
class AuthorityStore {
public:
    explicit AuthorityStore(const Clock& clock);

    AuthorityStore(const AuthorityStore&) = delete;
    AuthorityStore& operator=(const AuthorityStore&) = delete;

    /// Mints a root token starting at clock().now(). Fails with
    /// InvalidArgument for an empty subject, issuer, capability, scope or
    /// scope resource, or an expiry not after the mint time; then with
    /// Forbidden unless the issuer is HostTrusted.
    auto mint(const MintRequest& request) -> Result<AuthorityToken>;

    /// Derives a child token. Checks, in order: UnknownParent, ParentRevoked,
    /// ParentExpired, ScopeNotNarrowed, LifetimeNotNarrowed, InvalidWindow.
    /// The child must expire strictly before its parent and inherits the
    /// parent's capability.
    auto delegate(const DelegationRequest& request)
        -> std::expected<AuthorityToken, DelegationError>;

    /// Marks a token revoked. Idempotent. Descendants become Revoked through
    /// lineage at validation time. NotFound for an unknown ID.
    auto revoke(std::string_view id) -> VoidResult;

    [[nodiscard]] auto validate(std::string_view id, Timestamp at) const -> TokenStatus;

    /// Re-checks held tokens after state was reconstructed from a snapshot.
    /// Anything not Valid at `at` is stripped, even if it was valid when the
    /// snapshot was taken.
    [[nodiscard]] auto revalidate_on_restore(const std::vector<TokenId>& held,
                                             Timestamp at) const -> TokenValidation;

    [[nodiscard]] auto snapshot() const -> TokenTable;
    [[nodiscard]] auto find(std::string_view id) const -> std::optional<AuthorityToken>;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto clock() const noexcept -> const Clock& { return clock_; }

    /// Canonical compact JSON of the whole token table. Restoring and
    /// serialising again yields the same bytes.
    [[nodiscard]] auto serialize() const -> std::string;

    static auto restore(std::string_view data, const Clock& clock)
        -> Result<std::unique_ptr<AuthorityStore>>;

    static constexpr std::string_view kFormat = "flowgate.authority";
    static constexpr int kFormatVersion = 1;

private:
    auto allocate_id() -> TokenId;

    const Clock& clock_;
    mutable std::mutex mutex_;
    std::shared_ptr<const TokenMap> tokens_;
    std::uint64_t next_serial_ = 1;
};

} // namespace flowgate::authority
