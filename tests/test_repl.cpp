#include <geomatch/repl/repl.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using geomatch::Role;
using geomatch::repl::execute_line;
using geomatch::repl::LineResult;
using geomatch::repl::split_words;
using geomatch::session::Session;
using geomatch::session::SessionConfig;

namespace {

auto data_path(const char* name) -> std::filesystem::path {
    return std::filesystem::path(GEOMATCH_SOURCE_DIR) / "tests" / "data" / name;
}

auto make_session() -> Session {
    SessionConfig config;
    config.api_key = "test-key";
    config.output_dir = std::filesystem::temp_directory_path();
    config.http = [](const std::string&) -> std::expected<geomatch::fetch::HttpResponse, std::string> {
        return std::unexpected("offline");
    };
    Session session(std::move(config));
    REQUIRE(session.add_file(data_path("stores.csv")));
    REQUIRE(session.add_file(data_path("branches.psv")));
    return session;
}

}  // namespace

TEST_CASE("REPL splits words on any whitespace", "[repl]") {
    REQUIRE(split_words("  set 0\tcity   City ") ==
            std::vector<std::string>{"set", "0", "city", "City"});
    REQUIRE(split_words("").empty());
    REQUIRE(split_words(" \t ").empty());
}

TEST_CASE("REPL control commands", "[repl]") {
    auto session = make_session();
    REQUIRE(execute_line(session, "") == LineResult::Ok);
    REQUIRE(execute_line(session, "help") == LineResult::Ok);
    REQUIRE(execute_line(session, "config") == LineResult::Ok);
    REQUIRE(execute_line(session, "quit") == LineResult::Quit);
    REQUIRE(execute_line(session, "exit") == LineResult::Quit);
    REQUIRE(execute_line(session, "frobnicate") == LineResult::Error);
}

TEST_CASE("REPL list checks its index", "[repl]") {
    auto session = make_session();
    REQUIRE(execute_line(session, "list 0") == LineResult::Ok);
    REQUIRE(execute_line(session, "list 7") == LineResult::Error);
    REQUIRE(execute_line(session, "list zero") == LineResult::Error);
    REQUIRE(execute_line(session, "list") == LineResult::Error);
}

TEST_CASE("REPL set rejoins column names with spaces", "[repl]") {
    auto session = make_session();
    const auto& branches = session.tables()[1];

    SECTION("multi-word column") {
        REQUIRE(execute_line(session, "set 1 addr2 Address 2") == LineResult::Ok);
        REQUIRE(branches.role(Role::AddressLine2) == 2);
    }

    SECTION("missing arguments") {
        REQUIRE(execute_line(session, "set 1 city") == LineResult::Error);
    }

    SECTION("bad column keeps the old binding") {
        REQUIRE(execute_line(session, "set 1 city Town") == LineResult::Error);
        REQUIRE(branches.role(Role::City) == 3);
    }

    SECTION("lat and lng") {
        REQUIRE(execute_line(session, "set 1 lat manager") == LineResult::Ok);
        REQUIRE(branches.has_axis(geomatch::Axis::Latitude));
        REQUIRE_FALSE(branches.find("manager").has_value());
    }
}

TEST_CASE("REPL add and prefix", "[repl]") {
    auto session = make_session();
    const auto& stores = session.tables()[0];

    REQUIRE(execute_line(session, "add 0 output id") == LineResult::Ok);
    REQUIRE(execute_line(session, "add 0 compare Address") == LineResult::Ok);
    REQUIRE(execute_line(session, "add 0 sideways id") == LineResult::Error);
    REQUIRE(execute_line(session, "add 0 output nope") == LineResult::Error);
    REQUIRE(stores.output_columns().size() == 1);
    REQUIRE(stores.compare_columns().size() == 1);

    REQUIRE(execute_line(session, "prefix 0 main store") == LineResult::Ok);
    REQUIRE(stores.prefix() == "main store");
    REQUIRE(execute_line(session, "prefix 0") == LineResult::Error);
}

TEST_CASE("REPL merge settings", "[repl]") {
    auto session = make_session();
    const auto& merge = session.config().merge;

    REQUIRE(execute_line(session, "method inner") == LineResult::Ok);
    REQUIRE(merge.mode == geomatch::match::JoinMode::Inner);
    REQUIRE(execute_line(session, "method") == LineResult::Error);

    REQUIRE(execute_line(session, "radius 1.5") == LineResult::Ok);
    REQUIRE(merge.radius == 1.5);
    REQUIRE(execute_line(session, "radius far") == LineResult::Error);
    REQUIRE(merge.radius == 1.5);

    REQUIRE(execute_line(session, "exclusive FALSE") == LineResult::Ok);
    REQUIRE_FALSE(merge.exclusive);
    REQUIRE(execute_line(session, "exclusive maybe") == LineResult::Error);
}

TEST_CASE("REPL match requires coordinates on every table", "[repl]") {
    auto session = make_session();
    REQUIRE(execute_line(session, "match") == LineResult::Error);
}

TEST_CASE("REPL fetch survives a dead transport", "[repl]") {
    auto session = make_session();
    REQUIRE(execute_line(session, "fetch") == LineResult::Ok);
    REQUIRE(session.ready_to_match());
    REQUIRE_FALSE(session.tables()[0].point(0).resolved());
}
