#include "flowgate/authority/token.hpp"

namespace flowgate::authority {

auto ValidityWindow::strictly_contains(const ValidityWindow& inner) const noexcept -> bool {
    if (inner.not_before < not_before) return false;
    if (!inner.expires_at.has_value()) return false;
    return !expires_at.has_value() || *inner.expires_at < *expires_at;
}

auto AuthorityToken::grants(std::string_view who, std::string_view cap,
                            std::string_view resource) const -> bool {
    return subject == who && capability == cap && scope.contains(std::string(resource));
}

void to_json(json& j, const AuthorityToken& t) {
    j = json{
        {"id", t.id},
        {"issuer", t.issuer},
        {"subject", t.subject},
        {"capability", t.capability},
        {"scope", t.scope},
        {"not_before", t.validity.not_before},
        {"expires_at", t.validity.expires_at ? json(*t.validity.expires_at) : json(nullptr)},
        {"parent_id", t.parent_id ? json(*t.parent_id) : json(nullptr)},
        {"revoked", t.revoked},
    };
}

void from_json(const json& j, AuthorityToken& t) {
    t.id = j.at("id").get<std::string>();
    t.issuer = j.at("issuer").get<std::string>();
    t.subject = j.at("subject").get<std::string>();
    t.capability = j.at("capability").get<std::string>();
    t.scope = j.at("scope").get<Scope>();
    t.validity.not_before = j.at("not_before").get<Timestamp>();
    const auto& expires = j.at("expires_at");
    t.validity.expires_at = expires.is_null()
        ? std::nullopt : std::optional<Timestamp>(expires.get<Timestamp>());
    const auto& parent = j.at("parent_id");
    t.parent_id = parent.is_null()
        ? std::nullopt : std::optional<TokenId>(parent.get<std::string>());
    t.revoked = j.at("revoked").get<bool>();
}

auto token_status_to_string(TokenStatus status) -> std::string_view {
    switch (status) {
        case TokenStatus::Valid: return "valid";
        case TokenStatus::Revoked: return "revoked";
        case TokenStatus::Expired: return "expired";
        case TokenStatus::NotYetValid: return "not_yet_valid";
        case TokenStatus::Unknown: return "unknown";
    }
    return "unknown";
}

auto issuer_trust_to_string(IssuerTrust trust) -> std::string_view {
    switch (trust) {
        case IssuerTrust::Untrusted: return "Untrusted";
        case IssuerTrust::HostTrusted: return "HostTrusted";
    }
    return "Untrusted";
}

auto parse_issuer_trust(std::string_view text) -> std::optional<IssuerTrust> {
    if (text == "HostTrusted") return IssuerTrust::HostTrusted;
    if (text == "Untrusted") return IssuerTrust::Untrusted;
    return std::nullopt;
}

auto delegation_error_to_string(DelegationError error) -> std::string_view {
    switch (error) {
        case DelegationError::UnknownParent: return "unknown_parent";
        case DelegationError::ParentRevoked: return "parent_revoked";
        case DelegationError::ParentExpired: return "parent_expired";
        case DelegationError::ScopeNotNarrowed: return "scope_not_narrowed";
        case DelegationError::LifetimeNotNarrowed: return "lifetime_not_narrowed";
        case DelegationError::InvalidWindow: return "invalid_window";
    }
    return "unknown";
}

} // namespace flowgate::authority
