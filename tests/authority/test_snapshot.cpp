#include <catch2/catch_test_macros.hpp>

#include "flowgate/authority/snapshot.hpp"
#include "flowgate/core/utils.hpp"

#include <filesystem>
#include <fstream>

using namespace flowgate;
using namespace flowgate::authority;

TEST_CASE("Authority snapshot files", "[authority][snapshot]") {
    auto tmp_dir = std::filesystem::temp_directory_path() / "flowgate_test_snapshot";
    std::filesystem::remove_all(tmp_dir);
    auto path = tmp_dir / "exec-000001.authority.json";

    ManualClock clock(50);
    AuthorityStore store(clock);
    auto root = store.mint(MintRequest{
        .issuer_trust = IssuerTrust::HostTrusted,
        .subject = "agent",
        .capability = "FilesCap",
        .scope = {"a", "b"},
        .expires_at = 500,
    });
    REQUIRE(root.has_value());
    auto child = store.delegate(DelegationRequest{
        .parent_id = root->id, .scope = {"a"}, .expires_at = 400});
    REQUIRE(child.has_value());
    REQUIRE(store.revoke(root->id));

    SECTION("Digest covers the serialised table") {
        auto snap = make_snapshot(store);
        CHECK(snap.table == store.serialize());
        CHECK(snap.digest == utils::sha256(snap.table));
    }

    SECTION("Write then read restores the same table") {
        REQUIRE(write_snapshot(store, path));
        CHECK(std::filesystem::exists(path));
        CHECK_FALSE(std::filesystem::exists(tmp_dir / "exec-000001.authority.json.tmp"));

        auto restored = read_snapshot(path, clock);
        REQUIRE(restored.has_value());
        CHECK((*restored)->serialize() == store.serialize());
        CHECK((*restored)->validate(child->id, 60) == TokenStatus::Revoked);
    }

    SECTION("Tampered table is rejected") {
        REQUIRE(write_snapshot(store, path));

        json j;
        {
            std::ifstream in(path);
            j = json::parse(in);
        }
        auto table = json::parse(j["table"].get<std::string>());
        for (auto& token : table["tokens"]) token["revoked"] = false;
        j["table"] = table.dump();
        {
            std::ofstream out(path);
            out << j.dump();
        }

        auto restored = read_snapshot(path, clock);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().code() == ErrorCode::DigestMismatch);

        // Without verification the tampered table loads as written.
        auto unchecked = read_snapshot(path, clock, false);
        REQUIRE(unchecked.has_value());
        CHECK((*unchecked)->validate(child->id, 60) == TokenStatus::Valid);
    }

    SECTION("Missing file") {
        auto restored = read_snapshot(tmp_dir / "absent.json", clock);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().code() == ErrorCode::IoError);
    }

    SECTION("Malformed file") {
        std::filesystem::create_directories(tmp_dir);
        {
            std::ofstream out(path);
            out << "{\"digest\": 1}";
        }
        auto restored = read_snapshot(path, clock);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().code() == ErrorCode::SerializationError);
    }

    std::filesystem::remove_all(tmp_dir);
}
