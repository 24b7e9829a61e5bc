#include "flowgate/authority/snapshot.hpp"

#include <fstream>
#include <stdexcept>

#include "flowgate/core/logger.hpp"
#include "flowgate/core/utils.hpp"

namespace flowgate::authority {

auto make_snapshot(const AuthorityStore& store) -> AuthoritySnapshot {
    AuthoritySnapshot snap;
    snap.table = store.serialize();
    snap.digest = utils::sha256(snap.table);
    return snap;
}

auto write_snapshot(const AuthorityStore& store, const std::filesystem::path& path)
    -> VoidResult {
    auto snap = make_snapshot(store);
    auto tmp_path = std::filesystem::path(path.string() + ".tmp");

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        json j = {{"digest", snap.digest}, {"table", snap.table}};
        std::ofstream out(tmp_path);
        if (!out.is_open()) {
            return std::unexpected(make_error(
                ErrorCode::IoError,
                "Failed to open temp file for snapshot",
                tmp_path.string()));
        }
        out << j.dump(2);
        out.close();
        if (out.fail()) {
            throw std::runtime_error("write to " + tmp_path.string() + " failed");
        }

        std::filesystem::rename(tmp_path, path);
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to write snapshot file",
            e.what()));
    }

    LOG_INFO("Wrote authority snapshot {} ({} tokens, digest {})", path.string(),
             store.size(), snap.digest.substr(0, 12));
    return {};
}

auto read_snapshot(const std::filesystem::path& path, const Clock& clock,
                   bool verify_digest) -> Result<std::unique_ptr<AuthorityStore>> {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed to open snapshot file", path.string()));
    }

    AuthoritySnapshot snap;
    try {
        auto j = json::parse(in);
        snap.digest = j.at("digest").get<std::string>();
        snap.table = j.at("table").get<std::string>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Malformed snapshot file", e.what()));
    }

    if (verify_digest) {
        auto actual = utils::sha256(snap.table);
        if (actual != snap.digest) {
            LOG_ERROR("Snapshot {} digest mismatch: recorded {}, computed {}",
                      path.string(), snap.digest, actual);
            return std::unexpected(make_error(
                ErrorCode::DigestMismatch, "Snapshot digest does not match its table",
                path.string()));
        }
    }

    return AuthorityStore::restore(snap.table, clock);
}

} // namespace flowgate::authority
