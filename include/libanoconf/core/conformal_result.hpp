#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace libanoconf {
namespace core {

/// p-values, rows = test examples, columns = classes in ascending order
using PValueMatrix = Eigen::MatrixXd;

/// Prediction sets, entry (j, c) is true when class c is not rejected for example j
using PredictionSetMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * Conformal prediction intervals
 *
 * Bounds for every test example at one or more significance levels.
 * Column k of lower/upper corresponds to significance_levels[k], so
 * a single level is the [n_examples, 2] case and the default grid of
 * 99 levels is the [n_examples, 2, 99] case.
 */
struct ConformalIntervals {
	/// Lower bounds (n_examples × n_levels)
	Eigen::MatrixXd lower;

	/// Upper bounds (n_examples × n_levels)
	Eigen::MatrixXd upper;

	/// Significance level of each column
	std::vector<double> significance_levels;

	ConformalIntervals() = default;

	/// Allocate NaN-filled bounds
	ConformalIntervals(size_t n_examples, std::vector<double> levels)
	    : significance_levels(std::move(levels)) {
		const auto rows = static_cast<Eigen::Index>(n_examples);
		const auto cols = static_cast<Eigen::Index>(significance_levels.size());
		lower = Eigen::MatrixXd::Constant(rows, cols, std::numeric_limits<double>::quiet_NaN());
		upper = Eigen::MatrixXd::Constant(rows, cols, std::numeric_limits<double>::quiet_NaN());
	}

	size_t n_examples() const {
		return static_cast<size_t>(lower.rows());
	}

	size_t n_levels() const {
		return significance_levels.size();
	}

	/// (lower, upper) of example i at level index k
	std::pair<double, double> Interval(size_t i, size_t k = 0) const {
		if (i >= n_examples() || k >= n_levels()) {
			throw std::out_of_range("Interval index out of range");
		}
		const auto row = static_cast<Eigen::Index>(i);
		const auto col = static_cast<Eigen::Index>(k);
		return {lower(row, col), upper(row, col)};
	}

	/// Widths upper - lower
	Eigen::MatrixXd Widths() const {
		return upper - lower;
	}

	/// True when shapes agree with each other and with the level list
	bool is_consistent() const {
		return lower.rows() == upper.rows() && lower.cols() == upper.cols() &&
		       static_cast<size_t>(lower.cols()) == significance_levels.size();
	}
};

/**
 * Point summary of a conformal classification
 *
 * For each example: the class with the largest p-value, its
 * credibility (that p-value) and confidence (1 - second largest p-value).
 */
struct LabelPrediction {
	Eigen::VectorXd labels;
	Eigen::VectorXd credibility;
	Eigen::VectorXd confidence;
};

} // namespace core
} // namespace libanoconf
