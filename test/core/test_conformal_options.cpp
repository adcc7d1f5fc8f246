#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <libanoconf/core/conformal_options.hpp>
#include <nlohmann/json.hpp>
#include <limits>

using namespace libanoconf;
using namespace libanoconf::core;
using json = nlohmann::json;

TEST_CASE("ConformalOptions: Defaults", "[options]") {
	ConformalOptions opts;
	REQUIRE(opts.smoothing == true);
	REQUIRE(opts.random_seed == 0);
	REQUIRE(opts.unknown_category == "error");
	REQUIRE(opts.significance_grid_size == 99);
	REQUIRE_NOTHROW(opts.Validate());
	REQUIRE_FALSE(opts.PoolUnknownCategories());
}

TEST_CASE("ConformalOptions: Convenience constructors", "[options]") {
	ConformalOptions cls = ConformalOptions::Classification(false, 42);
	REQUIRE(cls.smoothing == false);
	REQUIRE(cls.random_seed == 42);

	ConformalOptions reg = ConformalOptions::Regression(9);
	REQUIRE(reg.significance_grid_size == 9);
}

TEST_CASE("ConformalOptions: Validation", "[options][validation]") {
	ConformalOptions opts;

	opts.unknown_category = "ignore";
	REQUIRE_THROWS_AS(opts.Validate(), std::invalid_argument);

	opts.unknown_category = "pooled";
	REQUIRE_NOTHROW(opts.Validate());
	REQUIRE(opts.PoolUnknownCategories());

	opts.significance_grid_size = 0;
	REQUIRE_THROWS_AS(opts.Validate(), std::invalid_argument);

	SECTION("Grid size is bounded") {
		opts.significance_grid_size = ConformalOptions::kMaxSignificanceGridSize;
		REQUIRE_NOTHROW(opts.Validate());
		REQUIRE(opts.DefaultSignificanceGrid().size() == ConformalOptions::kMaxSignificanceGridSize);

		opts.significance_grid_size = ConformalOptions::kMaxSignificanceGridSize + 1;
		REQUIRE_THROWS_AS(opts.Validate(), std::invalid_argument);

		opts.significance_grid_size = std::numeric_limits<size_t>::max();
		REQUIRE_THROWS_AS(opts.Validate(), std::invalid_argument);
		REQUIRE_THROWS_AS(
		    ConformalOptions::FromJson(json::parse(R"({"significance_grid_size": 18446744073709551615})")),
		    std::invalid_argument);
	}
}

TEST_CASE("ConformalOptions: Default significance grid", "[options][grid]") {
	SECTION("99 levels are 0.01 ... 0.99") {
		std::vector<double> grid = ConformalOptions().DefaultSignificanceGrid();
		REQUIRE(grid.size() == 99);
		REQUIRE_THAT(grid.front(), Catch::Matchers::WithinAbs(0.01, 1e-12));
		REQUIRE_THAT(grid[49], Catch::Matchers::WithinAbs(0.50, 1e-12));
		REQUIRE_THAT(grid.back(), Catch::Matchers::WithinAbs(0.99, 1e-12));
	}

	SECTION("Custom grid size") {
		std::vector<double> grid = ConformalOptions::Regression(3).DefaultSignificanceGrid();
		REQUIRE(grid.size() == 3);
		REQUIRE_THAT(grid[0], Catch::Matchers::WithinAbs(0.25, 1e-12));
		REQUIRE_THAT(grid[1], Catch::Matchers::WithinAbs(0.50, 1e-12));
		REQUIRE_THAT(grid[2], Catch::Matchers::WithinAbs(0.75, 1e-12));
	}
}

TEST_CASE("ConformalOptions: FromJson", "[options][json]") {
	SECTION("Full object") {
		json j = json::parse(R"({
			"smoothing": false,
			"random_seed": 1234,
			"unknown_category": "pooled",
			"significance_grid_size": 19
		})");

		ConformalOptions opts = ConformalOptions::FromJson(j);
		REQUIRE(opts.smoothing == false);
		REQUIRE(opts.random_seed == 1234);
		REQUIRE(opts.unknown_category == "pooled");
		REQUIRE(opts.significance_grid_size == 19);
	}

	SECTION("Missing keys keep defaults") {
		ConformalOptions opts = ConformalOptions::FromJson(json::parse(R"({"smoothing": false})"));
		REQUIRE(opts.smoothing == false);
		REQUIRE(opts.unknown_category == "error");
		REQUIRE(opts.significance_grid_size == 99);
	}

	SECTION("Null gives defaults") {
		ConformalOptions opts = ConformalOptions::FromJson(json());
		REQUIRE(opts.smoothing == true);
	}

	SECTION("Round trip through ToJson") {
		ConformalOptions opts = ConformalOptions::Classification(false, 7);
		opts.unknown_category = "pooled";
		ConformalOptions parsed = ConformalOptions::FromJson(opts.ToJson());
		REQUIRE(parsed.smoothing == opts.smoothing);
		REQUIRE(parsed.random_seed == opts.random_seed);
		REQUIRE(parsed.unknown_category == opts.unknown_category);
		REQUIRE(parsed.significance_grid_size == opts.significance_grid_size);
	}
}

TEST_CASE("ConformalOptions: FromJson rejects bad input", "[options][json][validation]") {
	SECTION("Unknown key lists the valid ones") {
		REQUIRE_THROWS_WITH(ConformalOptions::FromJson(json::parse(R"({"smooth": true})")),
		                    Catch::Matchers::ContainsSubstring("Unknown option: 'smooth'") &&
		                        Catch::Matchers::ContainsSubstring("significance_grid_size"));
	}

	SECTION("Wrong value types") {
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse(R"({"smoothing": "yes"})")),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse(R"({"random_seed": -3})")),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse(R"({"unknown_category": 1})")),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse(R"({"significance_grid_size": 2.5})")),
		                  std::invalid_argument);
	}

	SECTION("Invalid values fail validation") {
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse(R"({"unknown_category": "drop"})")),
		                  std::invalid_argument);
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse(R"({"significance_grid_size": 0})")),
		                  std::invalid_argument);
	}

	SECTION("Non-object input") {
		REQUIRE_THROWS_AS(ConformalOptions::FromJson(json::parse("[1, 2]")), std::invalid_argument);
	}
}
