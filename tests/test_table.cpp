#include <geomatch/core/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

using geomatch::Axis;
using geomatch::Column;
using geomatch::GeoPoint;
using geomatch::Role;
using geomatch::Table;

namespace {

auto make_addresses() -> Table {
    Table table;
    REQUIRE(table.add_column("id", Column<std::string>{"1", "2", "3"}));
    REQUIRE(table.add_column("street", Column<std::string>{"12 Main St", "  ", "9 Elm Rd"}));
    REQUIRE(table.add_column("unit", Column<std::string>{"Apt 2", "", ""}));
    REQUIRE(table.add_column("town", Column<std::string>{"Springfield", "Chatham", "Chatham"}));
    REQUIRE(table.add_column("st", Column<std::string>{"IL", "IL", "IL"}));
    REQUIRE(table.add_column("zip", Column<std::string>{"62701", "62629", "62629"}));
    return table;
}

}  // namespace

TEST_CASE("Column basic operations", "[core][column]") {
    Column<int> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("bounds-checked access throws past the end") {
        REQUIRE_THROWS_AS(col.at(5), std::out_of_range);
    }

    SECTION("push_back appends") {
        col.push_back(6);
        REQUIRE(col == Column<int>{1, 2, 3, 4, 5, 6});
    }
}

TEST_CASE("Table rejects columns of the wrong length", "[core][table]") {
    Table table;
    REQUIRE(table.add_column("a", Column<std::string>{"x", "y"}));
    auto bad = table.add_column("b", Column<std::string>{"x"});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(table.width() == 1);
    REQUIRE(table.rows() == 2);
}

TEST_CASE("Table lookup finds the first column with a name", "[core][table]") {
    Table table;
    REQUIRE(table.add_column("dup", Column<std::string>{"first"}));
    REQUIRE(table.add_column("dup", Column<std::string>{"second"}));
    auto index = table.find("dup");
    REQUIRE(index.has_value());
    REQUIRE(*index == 0);
    REQUIRE_FALSE(table.find("missing").has_value());
}

TEST_CASE("Role bindings require an existing column", "[core][table]") {
    auto table = make_addresses();
    REQUIRE(table.bind_role(Role::AddressLine1, "street"));
    auto bad = table.bind_role(Role::City, "nope");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error() == "no column named 'nope'");
    REQUIRE_FALSE(table.role(Role::City).has_value());
    REQUIRE(table.role(Role::AddressLine1) == 1);
}

TEST_CASE("Formatted address joins bound parts", "[core][table]") {
    auto table = make_addresses();

    SECTION("not fetchable without the required roles") {
        REQUIRE(table.bind_role(Role::AddressLine1, "street"));
        REQUIRE_FALSE(table.ready_to_fetch());
        REQUIRE_FALSE(table.formatted_address(0).has_value());
    }

    SECTION("required parts only") {
        REQUIRE(table.bind_role(Role::AddressLine1, "street"));
        REQUIRE(table.bind_role(Role::City, "town"));
        REQUIRE(table.bind_role(Role::State, "st"));
        REQUIRE(table.ready_to_fetch());
        REQUIRE(table.formatted_address(0) == "12 Main St Springfield IL");
    }

    SECTION("line 2 goes after line 1, postal code last") {
        REQUIRE(table.bind_role(Role::AddressLine1, "street"));
        REQUIRE(table.bind_role(Role::AddressLine2, "unit"));
        REQUIRE(table.bind_role(Role::City, "town"));
        REQUIRE(table.bind_role(Role::State, "st"));
        REQUIRE(table.bind_role(Role::PostalCode, "zip"));
        REQUIRE(table.formatted_address(0) == "12 Main St Apt 2 Springfield IL 62701");
    }

    SECTION("blank required part yields no address") {
        REQUIRE(table.bind_role(Role::AddressLine1, "street"));
        REQUIRE(table.bind_role(Role::City, "town"));
        REQUIRE(table.bind_role(Role::State, "st"));
        REQUIRE_FALSE(table.formatted_address(1).has_value());
        REQUIRE(table.formatted_address(2).has_value());
    }
}

TEST_CASE("Coordinates stay in lockstep with rows", "[core][table]") {
    auto table = make_addresses();
    REQUIRE_FALSE(table.has_coordinates());
    REQUIRE_FALSE(table.point(0).resolved());

    auto bad = table.set_coordinates(Column<double>{1.0, 2.0}, Column<double>{1.0, 2.0});
    REQUIRE_FALSE(bad.has_value());

    REQUIRE(table.set_coordinates(Column<double>{1.0, 2.0, 3.0}, Column<double>{4.0, 5.0, 6.0}));
    REQUIRE(table.has_coordinates());
    REQUIRE(table.ready_to_match());

    table.retain_rows({true, false, true});
    REQUIRE(table.rows() == 2);
    REQUIRE(table.cell(0, 1) == "3");
    REQUIRE(table.point(1).lat == 3.0);
    REQUIRE(table.point(1).lng == 6.0);

    REQUIRE_THROWS_AS(table.retain_rows({true}), std::invalid_argument);

    table.retain_rows({false, false});
    REQUIRE(table.rows() == 0);
    REQUIRE(table.has_coordinates());
}

TEST_CASE("Promoting a column to an axis removes it", "[core][table]") {
    Table table;
    REQUIRE(table.add_column("name", Column<std::string>{"a", "b"}));
    REQUIRE(table.add_column("y", Column<std::string>{"39.5", "north"}));
    REQUIRE(table.add_column("x", Column<std::string>{" -89.25 ", "-89.5"}));
    REQUIRE(table.add_output_column("name"));
    REQUIRE(table.add_compare_column("x"));

    REQUIRE(table.promote_to_axis(Axis::Latitude, "y"));
    REQUIRE(table.has_axis(Axis::Latitude));
    REQUIRE_FALSE(table.has_coordinates());
    REQUIRE(table.width() == 2);
    REQUIRE_FALSE(table.find("y").has_value());
    REQUIRE(table.find("x") == 1);
    REQUIRE(table.compare_columns().front() == 1);

    REQUIRE(table.promote_to_axis(Axis::Longitude, "x"));
    REQUIRE(table.has_coordinates());
    REQUIRE(table.compare_columns().empty());
    REQUIRE(table.point(0).lat == 39.5);
    REQUIRE(table.point(0).lng == -89.25);
    REQUIRE(std::isnan(table.point(1).lat));
    REQUIRE(table.output_headers() == std::vector<std::string>{"name"});
}

TEST_CASE("Removing a column fixes every later reference", "[core][table]") {
    auto table = make_addresses();
    REQUIRE(table.bind_role(Role::Id, "id"));
    REQUIRE(table.bind_role(Role::City, "town"));
    REQUIRE(table.add_output_column("zip"));

    table.remove_column(0);
    REQUIRE_FALSE(table.role(Role::Id).has_value());
    REQUIRE(table.role(Role::City) == 2);
    REQUIRE(table.output_columns().front() == 4);
    REQUIRE(table.column(4).name == "zip");
    REQUIRE_THROWS_AS(table.remove_column(10), std::out_of_range);
}

TEST_CASE("Output headers carry the prefix", "[core][table]") {
    auto table = make_addresses();
    REQUIRE(table.add_output_column("id"));
    REQUIRE(table.add_output_column("town"));
    REQUIRE(table.output_headers() == std::vector<std::string>{"id", "town"});

    table.set_prefix("left");
    REQUIRE(table.output_headers() == std::vector<std::string>{"left_id", "left_town"});
    REQUIRE(table.output_row(2) == std::vector<std::string>{"3", "Chatham"});

    auto bad = table.add_output_column("nope");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(table.output_columns().size() == 2);
}

TEST_CASE("Appending rows fills coordinates", "[core][table]") {
    auto table = Table::with_capacity(2, 4);
    REQUIRE(table.rows() == 0);
    REQUIRE(table.has_coordinates());

    REQUIRE(table.append_row({"a", "b"}, GeoPoint{.lat = 1.0, .lng = 2.0}));
    REQUIRE(table.append_row({"c", ""}, GeoPoint{}));
    REQUIRE_FALSE(table.append_row({"too few"}, GeoPoint{}).has_value());

    REQUIRE(table.rows() == 2);
    REQUIRE(table.cell(0, 1) == "c");
    REQUIRE(table.point(0).lat == 1.0);
    REQUIRE_FALSE(table.point(1).resolved());
}

TEST_CASE("parse_coordinate accepts padded numbers only", "[core][table]") {
    REQUIRE(geomatch::parse_coordinate("  12.5 ") == 12.5);
    REQUIRE(geomatch::parse_coordinate("-0.25") == -0.25);
    REQUIRE(std::isnan(geomatch::parse_coordinate("")));
    REQUIRE(std::isnan(geomatch::parse_coordinate("12.5 N")));
    REQUIRE(std::isnan(geomatch::parse_coordinate("n/a")));
}

TEST_CASE("parse_coordinate rejects infinities", "[core][table]") {
    REQUIRE(std::isnan(geomatch::parse_coordinate("inf")));
    REQUIRE(std::isnan(geomatch::parse_coordinate(" -Infinity ")));
    REQUIRE(std::isnan(geomatch::parse_coordinate("1e999")));
}
