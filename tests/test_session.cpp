#include <geomatch/session/session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

using geomatch::Role;
using geomatch::session::ColumnKind;
using geomatch::session::Session;
using geomatch::session::SessionConfig;
namespace fetch = geomatch::fetch;
namespace match = geomatch::match;

namespace {

constexpr const char* kFound = R"({
  "status": "OK",
  "results": [{
    "formatted_address": "12 Main St, Springfield, IL 62701, USA",
    "geometry": {"location": {"lat": 39.7817, "lng": -89.6501}}
  }]
})";

auto data_path(const char* name) -> std::filesystem::path {
    return std::filesystem::path(GEOMATCH_SOURCE_DIR) / "tests" / "data" / name;
}

auto scratch_dir(const char* name) -> std::filesystem::path {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

auto make_config(const std::filesystem::path& output_dir,
                 std::shared_ptr<std::atomic<int>> calls = nullptr) -> SessionConfig {
    SessionConfig config;
    config.api_key = "test-key";
    config.endpoint = "https://geo.example/json";
    config.output_dir = output_dir;
    config.fetch.rate_limit = 1000.0;
    config.fetch.max_concurrency = 4;
    config.http = [calls](const std::string&) -> std::expected<fetch::HttpResponse, std::string> {
        if (calls) {
            ++*calls;
        }
        return fetch::HttpResponse{.status = 200, .body = kFound};
    };
    return config;
}

auto load_both(Session& session) {
    REQUIRE(session.add_file(data_path("stores.csv")) == 0);
    REQUIRE(session.add_file(data_path("branches.psv")) == 1);
}

}  // namespace

TEST_CASE("Session loads files in order", "[session]") {
    Session session(make_config(scratch_dir("geomatch_session_load")));
    load_both(session);
    REQUIRE(session.size() == 2);

    auto headers = session.columns(0);
    REQUIRE(headers.has_value());
    REQUIRE(headers->size() == 5);
    REQUIRE(headers->front() == "id");

    REQUIRE_FALSE(session.columns(2).has_value());
    REQUIRE_FALSE(session.table(2).has_value());
    REQUIRE_FALSE(session.add_file(data_path("missing.csv")).has_value());
    REQUIRE(session.size() == 2);
}

TEST_CASE("Session validates role assignments", "[session]") {
    Session session(make_config(scratch_dir("geomatch_session_roles")));
    load_both(session);

    SECTION("known role and column") {
        REQUIRE(session.set_role(1, "ID", "manager"));
        const auto* table = *session.table(1);
        REQUIRE(table->role(Role::Id) == 6);
    }

    SECTION("unknown role") {
        auto result = session.set_role(0, "country", "City");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("unknown role") != std::string::npos);
    }

    SECTION("unknown column leaves the binding alone") {
        REQUIRE_FALSE(session.set_role(0, "city", "Town"));
        REQUIRE((*session.table(0))->role(Role::City) == 2);
    }

    SECTION("out of range table") {
        REQUIRE_FALSE(session.set_role(5, "city", "City"));
    }

    SECTION("lat and lng promote text columns") {
        geomatch::Table table;
        REQUIRE(table.add_column("y", geomatch::Column<std::string>{"40.0"}));
        REQUIRE(table.add_column("x", geomatch::Column<std::string>{"-75.0"}));
        const auto index = session.add_table(std::move(table));
        REQUIRE(session.set_role(index, "lat", "y"));
        REQUIRE(session.set_role(index, "LNG", "x"));
        const auto* promoted = *session.table(index);
        REQUIRE(promoted->has_coordinates());
        REQUIRE(promoted->width() == 0);
        REQUIRE(promoted->point(0).lat == 40.0);
    }
}

TEST_CASE("Session validates merge settings", "[session]") {
    Session session(make_config(scratch_dir("geomatch_session_settings")));

    SECTION("method") {
        REQUIRE(session.set_mode("Outer"));
        REQUIRE(session.config().merge.mode == match::JoinMode::Outer);
        REQUIRE_FALSE(session.set_mode("sideways"));
        REQUIRE(session.config().merge.mode == match::JoinMode::Outer);
    }

    SECTION("radius") {
        REQUIRE(session.set_radius("0.5"));
        REQUIRE(session.config().merge.radius == 0.5);
        REQUIRE_FALSE(session.set_radius("abc"));
        REQUIRE_FALSE(session.set_radius("-1"));
        REQUIRE_FALSE(session.set_radius("0"));
        REQUIRE_FALSE(session.set_radius("1.5mi"));
        REQUIRE_FALSE(session.set_radius("inf"));
        REQUIRE(session.config().merge.radius == 0.5);
    }

    SECTION("exclusive") {
        REQUIRE(session.config().merge.exclusive);
        REQUIRE(session.set_exclusive("FALSE"));
        REQUIRE_FALSE(session.config().merge.exclusive);
        REQUIRE(session.set_exclusive("True"));
        REQUIRE(session.config().merge.exclusive);
        REQUIRE_FALSE(session.set_exclusive("yes"));
        REQUIRE(session.config().merge.exclusive);
    }
}

TEST_CASE("Session readiness covers every table", "[session]") {
    Session session(make_config(scratch_dir("geomatch_session_ready")));
    REQUIRE_FALSE(session.ready_to_fetch());
    REQUIRE_FALSE(session.ready_to_match());

    load_both(session);
    REQUIRE(session.ready_to_fetch());
    REQUIRE_FALSE(session.ready_to_match());

    auto matched = session.match();
    REQUIRE_FALSE(matched.has_value());
    REQUIRE(matched.error().find("table 1") != std::string::npos);
}

TEST_CASE("Session fetches then matches", "[session]") {
    auto dir = scratch_dir("geomatch_session_run");
    auto calls = std::make_shared<std::atomic<int>>(0);
    Session session(make_config(dir, calls));
    load_both(session);

    auto fetched = session.fetch();
    REQUIRE(fetched.has_value());
    REQUIRE(fetched->size() == 2);
    // Branch A3 has a blank street and is never requested.
    REQUIRE(calls->load() == 5);
    REQUIRE((*fetched)[0].path == dir / "stores_coords.csv");
    REQUIRE((*fetched)[1].path == dir / "branches_coords.csv");
    REQUIRE((*fetched)[1].report.no_address == 1);
    REQUIRE(std::filesystem::exists(dir / "stores_coords.csv"));
    REQUIRE(std::filesystem::exists(dir / "branches_coords.csv"));
    REQUIRE(session.ready_to_match());

    REQUIRE(session.add_column(0, ColumnKind::Output, "id"));
    REQUIRE(session.add_column(1, ColumnKind::Output, "ID"));
    REQUIRE(session.add_column(1, ColumnKind::Compare, "manager"));
    REQUIRE_FALSE(session.add_column(1, ColumnKind::Output, "nope"));
    REQUIRE(session.set_prefix(0, "store"));
    REQUIRE(session.set_prefix(1, "branch"));

    auto matched = session.match();
    REQUIRE(matched.has_value());
    REQUIRE(matched->path == dir / "matches.csv");
    REQUIRE(matched->rows == 3);
    REQUIRE(matched->folds.size() == 2);
    REQUIRE(matched->folds[1].matched == 2);
    REQUIRE(matched->folds[1].dropped == 1);

    std::ifstream input(matched->path);
    std::string header;
    REQUIRE(std::getline(input, header));
    REQUIRE(header == "store_id|branch_ID|distance");
}

TEST_CASE("Session fetch needs address roles everywhere", "[session]") {
    auto calls = std::make_shared<std::atomic<int>>(0);
    Session session(make_config(scratch_dir("geomatch_session_unready"), calls));
    load_both(session);
    REQUIRE(session.add_file(data_path("no_roles.csv")) == 2);

    auto fetched = session.fetch();
    REQUIRE_FALSE(fetched.has_value());
    REQUIRE(fetched.error().find("table 2") != std::string::npos);
    REQUIRE(calls->load() == 0);
}

TEST_CASE("Session describes its configuration", "[session]") {
    Session session(make_config(scratch_dir("geomatch_session_describe")));
    load_both(session);
    REQUIRE(session.add_column(0, ColumnKind::Output, "City"));

    const auto text = session.describe();
    REQUIRE(text.find("[0]") != std::string::npos);
    REQUIRE(text.find("[1]") != std::string::npos);
    REQUIRE(text.find("City") != std::string::npos);
    REQUIRE(text.find("radius: 0.25") != std::string::npos);
    REQUIRE(text.find("method: left") != std::string::npos);
    REQUIRE(text.find("exclusive: true") != std::string::npos);
}
