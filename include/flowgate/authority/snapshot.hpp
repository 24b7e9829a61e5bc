#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "flowgate/authority/authority_store.hpp"
#include "flowgate/core/clock.hpp"
#include "flowgate/core/error.hpp"

namespace flowgate::authority {

/// Serialised token table plus the SHA-256 of its bytes.
struct AuthoritySnapshot {
    std::string table;
    std::string digest;
};

[[nodiscard]] auto make_snapshot(const AuthorityStore& store) -> AuthoritySnapshot;

/// Writes `{"digest": ..., "table": ...}` to `path` through a temp file and
/// a rename, so a crash never leaves a half-written snapshot behind.
auto write_snapshot(const AuthorityStore& store, const std::filesystem::path& path)
    -> VoidResult;

/// Reads a snapshot written by write_snapshot(). With `verify_digest` the
/// table bytes are hashed and compared before anything is restored.
auto read_snapshot(const std::filesystem::path& path, const Clock& clock,
                   bool verify_digest = true) -> Result<std::unique_ptr<AuthorityStore>>;

} // namespace flowgate::authority
