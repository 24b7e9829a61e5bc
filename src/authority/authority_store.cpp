#include "flowgate/authority/authority_store.hpp"

#include <algorithm>
#include <unordered_set>

#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

namespace flowgate::authority {

namespace {

auto is_strict_subset(const Scope& child, const Scope& parent) -> bool {
    return child.size() < parent.size() &&
           std::includes(parent.begin(), parent.end(), child.begin(), child.end());
}

auto blank(std::string_view s) -> bool {
    return utils::trim(s).empty();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// TokenTable
// ---------------------------------------------------------------------------

TokenTable::TokenTable()
    : tokens_(std::make_shared<const TokenMap>())
{
}

TokenTable::TokenTable(std::shared_ptr<const TokenMap> tokens)
    : tokens_(std::move(tokens))
{
}

auto TokenTable::find(std::string_view id) const -> const AuthorityToken* {
    auto it = tokens_->find(id);
    if (it == tokens_->end()) return nullptr;
    return &it->second;
}

auto TokenTable::lineage_revoked(const AuthorityToken& token) const -> bool {
    const AuthorityToken* current = &token;
    // Lineage is acyclic by construction; the bound only matters for a
    // corrupted table, which is treated as revoked.
    for (std::size_t hops = 0; hops <= tokens_->size(); ++hops) {
        if (current->revoked) return true;
        if (!current->parent_id) return false;
        current = find(*current->parent_id);
        if (!current) return true;
    }
    LOG_ERROR("Delegation chain of {} does not terminate", token.id);
    return true;
}

auto TokenTable::status(std::string_view id, Timestamp at) const -> TokenStatus {
    const auto* token = find(id);
    if (!token) return TokenStatus::Unknown;
    if (lineage_revoked(*token)) return TokenStatus::Revoked;
    if (token->validity.is_expired_at(at)) return TokenStatus::Expired;
    if (token->validity.is_before_start(at)) return TokenStatus::NotYetValid;
    return TokenStatus::Valid;
}

auto validate_held_tokens(const TokenTable& table, const std::vector<TokenId>& held,
                          Timestamp at) -> TokenValidation {
    TokenValidation result;
    std::unordered_set<std::string_view> seen;
    for (const auto& id : held) {
        if (!seen.insert(id).second) continue;
        auto status = table.status(id, at);
        if (status == TokenStatus::Valid) {
            result.effective.push_back(*table.find(id));
        } else {
            result.stripped.push_back(StrippedToken{.id = id, .status = status});
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// AuthorityStore
// ---------------------------------------------------------------------------

AuthorityStore::AuthorityStore(const Clock& clock)
    : clock_(clock)
    , tokens_(std::make_shared<const TokenMap>())
{
}

auto AuthorityStore::allocate_id() -> TokenId {
    auto id = utils::sequence_id("tok", next_serial_++);
    while (tokens_->contains(id)) {
        id = utils::sequence_id("tok", next_serial_++);
    }
    return id;
}

auto AuthorityStore::mint(const MintRequest& request) -> Result<AuthorityToken> {
    auto now = clock_.now();

    if (blank(request.subject) || blank(request.issuer) || blank(request.capability)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Token subject, issuer and capability must be non-empty"));
    }
    if (request.scope.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Token scope must be non-empty"));
    }
    if (std::ranges::any_of(request.scope, [](const auto& r) { return blank(r); })) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Scope resources must be non-empty"));
    }
    if (request.expires_at && *request.expires_at <= now) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Token expiry must be after its mint time",
            std::to_string(*request.expires_at) + " <= " + std::to_string(now)));
    }
    if (request.issuer_trust != IssuerTrust::HostTrusted) {
        LOG_WARN("Refused mint from untrusted issuer '{}'", request.issuer);
        return std::unexpected(make_error(
            ErrorCode::Forbidden, "Only host-trusted issuers may mint tokens", request.issuer));
    }

    std::lock_guard lock(mutex_);
    AuthorityToken token{
        .id = allocate_id(),
        .issuer = request.issuer,
        .subject = request.subject,
        .capability = request.capability,
        .scope = request.scope,
        .validity = ValidityWindow{.not_before = now, .expires_at = request.expires_at},
        .parent_id = std::nullopt,
        .revoked = false,
    };

    auto next = std::make_shared<TokenMap>(*tokens_);
    next->emplace(token.id, token);
    tokens_ = std::move(next);

    LOG_INFO("Minted token {} for '{}' ({}, {} scope resources)", token.id, token.subject,
             token.capability, token.scope.size());
    return token;
}

auto AuthorityStore::delegate(const DelegationRequest& request)
    -> std::expected<AuthorityToken, DelegationError> {
    auto now = clock_.now();

    std::lock_guard lock(mutex_);
    TokenTable table(tokens_);

    auto reject = [&](DelegationError error) -> std::expected<AuthorityToken, DelegationError> {
        LOG_WARN("Delegation from {} rejected: {}", request.parent_id,
                 delegation_error_to_string(error));
        return std::unexpected(error);
    };

    const auto* parent = table.find(request.parent_id);
    if (!parent) return reject(DelegationError::UnknownParent);

    // Parent validity first: a dead parent is refused before the request's
    // own scope or lifetime is looked at.
    if (table.lineage_revoked(*parent)) return reject(DelegationError::ParentRevoked);
    if (parent->validity.is_expired_at(now)) return reject(DelegationError::ParentExpired);

    if (request.scope.empty() || !is_strict_subset(request.scope, parent->scope)) {
        return reject(DelegationError::ScopeNotNarrowed);
    }

    ValidityWindow window{.not_before = now, .expires_at = request.expires_at};
    // The child must expire strictly before the parent; an open-ended parent
    // still requires the child to carry an expiry.
    if (!parent->validity.strictly_contains(window)) {
        return reject(DelegationError::LifetimeNotNarrowed);
    }
    if (window.expires_at && *window.expires_at <= now) {
        return reject(DelegationError::InvalidWindow);
    }

    AuthorityToken child{
        .id = allocate_id(),
        .issuer = blank(request.delegated_by) ? parent->subject : request.delegated_by,
        .subject = (request.subject && !blank(*request.subject)) ? *request.subject
                                                                 : parent->subject,
        .capability = parent->capability,
        .scope = request.scope,
        .validity = window,
        .parent_id = parent->id,
        .revoked = false,
    };

    auto next = std::make_shared<TokenMap>(*tokens_);
    next->emplace(child.id, child);
    tokens_ = std::move(next);

    LOG_INFO("Delegated token {} from {} ({} of {} scope resources)", child.id,
             request.parent_id, child.scope.size(), parent->scope.size());
    return child;
}

auto AuthorityStore::revoke(std::string_view id) -> VoidResult {
    std::lock_guard lock(mutex_);

    auto it = tokens_->find(id);
    if (it == tokens_->end()) {
        return std::unexpected(make_error(
            ErrorCode::NotFound, "Unknown token", std::string(id)));
    }
    if (it->second.revoked) {
        LOG_DEBUG("Token {} already revoked", id);
        return {};
    }

    // Build the post-revoke table off to the side and publish it with one
    // pointer swap: readers see either the old table or the new one.
    auto next = std::make_shared<TokenMap>(*tokens_);
    next->find(id)->second.revoked = true;
    tokens_ = std::move(next);

    LOG_INFO("Revoked token {}", id);
    return {};
}

auto AuthorityStore::validate(std::string_view id, Timestamp at) const -> TokenStatus {
    return snapshot().status(id, at);
}

auto AuthorityStore::revalidate_on_restore(const std::vector<TokenId>& held,
                                           Timestamp at) const -> TokenValidation {
    auto result = validate_held_tokens(snapshot(), held, at);
    for (const auto& stripped : result.stripped) {
        LOG_INFO("Restore stripped token {} ({})", stripped.id,
                 token_status_to_string(stripped.status));
    }
    return result;
}

auto AuthorityStore::snapshot() const -> TokenTable {
    std::lock_guard lock(mutex_);
    return TokenTable(tokens_);
}

auto AuthorityStore::find(std::string_view id) const -> std::optional<AuthorityToken> {
    auto table = snapshot();
    const auto* token = table.find(id);
    if (!token) return std::nullopt;
    return *token;
}

auto AuthorityStore::size() const -> std::size_t {
    return snapshot().size();
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

auto AuthorityStore::serialize() const -> std::string {
    std::shared_ptr<const TokenMap> tokens;
    std::uint64_t next_serial = 0;
    {
        std::lock_guard lock(mutex_);
        tokens = tokens_;
        next_serial = next_serial_;
    }

    json list = json::array();
    for (const auto& [_, token] : *tokens) {
        list.push_back(token);
    }

    json j = {
        {"format", std::string(kFormat)},
        {"version", kFormatVersion},
        {"next_serial", next_serial},
        {"tokens", std::move(list)},
    };
    return j.dump();
}

auto AuthorityStore::restore(std::string_view data, const Clock& clock)
    -> Result<std::unique_ptr<AuthorityStore>> {
    TokenMap tokens;
    std::uint64_t next_serial = 1;

    try {
        auto j = json::parse(data);
        if (j.at("format").get<std::string>() != kFormat) {
            return std::unexpected(make_error(
                ErrorCode::SerializationError, "Not an authority table"));
        }
        if (j.at("version").get<int>() != kFormatVersion) {
            return std::unexpected(make_error(
                ErrorCode::UnsupportedSchemaVersion, "Unsupported authority table version",
                j.at("version").dump()));
        }
        next_serial = j.at("next_serial").get<std::uint64_t>();
        for (const auto& entry : j.at("tokens")) {
            auto token = entry.get<AuthorityToken>();
            auto id = token.id;
            if (!tokens.emplace(id, std::move(token)).second) {
                return std::unexpected(make_error(
                    ErrorCode::SerializationError, "Duplicate token in table", id));
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Failed to parse authority table", e.what()));
    }

    // Every parent must be present and every chain must reach a root.
    for (const auto& [id, token] : tokens) {
        const AuthorityToken* current = &token;
        std::size_t hops = 0;
        while (current->parent_id) {
            auto it = tokens.find(*current->parent_id);
            if (it == tokens.end()) {
                return std::unexpected(make_error(
                    ErrorCode::SerializationError, "Token references unknown parent", id));
            }
            if (++hops > tokens.size()) {
                return std::unexpected(make_error(
                    ErrorCode::SerializationError, "Delegation cycle in table", id));
            }
            current = &it->second;
        }
    }

    auto store = std::make_unique<AuthorityStore>(clock);
    store->tokens_ = std::make_shared<const TokenMap>(std::move(tokens));
    store->next_serial_ = next_serial;
    LOG_INFO("Restored authority table with {} tokens", store->tokens_->size());
    return store;
}

} // namespace flowgate::authority
