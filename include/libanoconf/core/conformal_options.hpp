#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <stdexcept>
#include <vector>

namespace libanoconf {
namespace core {

/**
 * Configuration options for conformal predictors
 *
 * This structure configures both the conformal classifier and the
 * conformal regressor. All options have defaults matching the usual
 * ICP setup and can be overridden directly or parsed from JSON.
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validation method to check for invalid values
 * - Unknown JSON keys are rejected so typos do not pass silently
 */
struct ConformalOptions {
	// ========================================================================
	// Classification
	// ========================================================================

	/// Randomized tie-breaking of p-values (exact validity)
	/// - true: p += n_eq * U / (n_cal + 1), U ~ Uniform[0, 1)
	/// - false: p += n_eq / (n_cal + 1) (conservative)
	/// Default: true
	bool smoothing = true;

	/// Seed for the predictor-owned random engine
	/// - 0: seed from std::random_device
	/// Default: 0
	uint64_t random_seed = 0;

	// ========================================================================
	// Conditional (Mondrian) calibration
	// ========================================================================

	/// Policy for test examples whose category has no calibration scores
	/// - "error": throw std::out_of_range
	/// - "pooled": use the scores of the whole calibration set
	/// Default: "error"
	std::string unknown_category = "error";

	// ========================================================================
	// Regression
	// ========================================================================

	/// Number of levels in the default significance grid k / (n + 1)
	/// Range: 1 to kMaxSignificanceGridSize
	/// Default: 99 (0.01, 0.02, ..., 0.99)
	size_t significance_grid_size = 99;

	static constexpr size_t kMaxSignificanceGridSize = 10000;

	// ========================================================================
	// Constructors
	// ========================================================================

	ConformalOptions() = default;

	/// Convenience constructor for classification
	static ConformalOptions Classification(bool smoothing_ = true, uint64_t seed_ = 0) {
		ConformalOptions opts;
		opts.smoothing = smoothing_;
		opts.random_seed = seed_;
		return opts;
	}

	/// Convenience constructor for regression
	static ConformalOptions Regression(size_t grid_size_ = 99) {
		ConformalOptions opts;
		opts.significance_grid_size = grid_size_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (unknown_category != "error" && unknown_category != "pooled") {
			throw std::invalid_argument("unknown_category must be 'error' or 'pooled' (got '" + unknown_category +
			                            "')");
		}

		if (significance_grid_size == 0) {
			throw std::invalid_argument("significance_grid_size must be positive");
		}

		if (significance_grid_size > kMaxSignificanceGridSize) {
			throw std::invalid_argument("significance_grid_size must be at most " +
			                            std::to_string(kMaxSignificanceGridSize) + " (got " +
			                            std::to_string(significance_grid_size) + ")");
		}
	}

	bool PoolUnknownCategories() const {
		return unknown_category == "pooled";
	}

	/// Significance levels 1/(n+1), ..., n/(n+1) for n = significance_grid_size
	std::vector<double> DefaultSignificanceGrid() const {
		std::vector<double> grid;
		grid.reserve(significance_grid_size);
		const double denom = static_cast<double>(significance_grid_size + 1);
		for (size_t k = 1; k <= significance_grid_size; k++) {
			grid.push_back(static_cast<double>(k) / denom);
		}
		return grid;
	}

	// ========================================================================
	// JSON
	// ========================================================================

	/**
	 * Parse options from a JSON object
	 *
	 * Missing keys keep their defaults. The parsed options are validated.
	 *
	 * @param j JSON object, e.g. {"smoothing": false, "unknown_category": "pooled"}
	 * @return Parsed options
	 * @throws std::invalid_argument on unknown keys, wrong value types, or invalid values
	 */
	static ConformalOptions FromJson(const nlohmann::json &j) {
		ConformalOptions opts;

		if (j.is_null()) {
			return opts;
		}
		if (!j.is_object()) {
			throw std::invalid_argument("Conformal options must be a JSON object");
		}

		for (auto it = j.begin(); it != j.end(); ++it) {
			const std::string &key = it.key();
			const nlohmann::json &val = it.value();

			if (key == "smoothing") {
				if (!val.is_boolean()) {
					throw std::invalid_argument("Option 'smoothing' must be a boolean");
				}
				opts.smoothing = val.get<bool>();
			} else if (key == "random_seed") {
				if (!val.is_number_unsigned()) {
					throw std::invalid_argument("Option 'random_seed' must be a non-negative integer");
				}
				opts.random_seed = val.get<uint64_t>();
			} else if (key == "unknown_category") {
				if (!val.is_string()) {
					throw std::invalid_argument("Option 'unknown_category' must be a string");
				}
				opts.unknown_category = val.get<std::string>();
			} else if (key == "significance_grid_size") {
				if (!val.is_number_unsigned()) {
					throw std::invalid_argument("Option 'significance_grid_size' must be a non-negative integer");
				}
				opts.significance_grid_size = val.get<size_t>();
			} else {
				throw std::invalid_argument("Unknown option: '" + key +
				                            "'. Valid options are: smoothing, random_seed, unknown_category, "
				                            "significance_grid_size");
			}
		}

		opts.Validate();
		return opts;
	}

	nlohmann::json ToJson() const {
		return nlohmann::json {{"smoothing", smoothing},
		                       {"random_seed", random_seed},
		                       {"unknown_category", unknown_category},
		                       {"significance_grid_size", significance_grid_size}};
	}
};

} // namespace core
} // namespace libanoconf
