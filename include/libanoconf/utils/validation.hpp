#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace libanoconf {
namespace utils {

/**
 * @brief Input validation shared by the conformal predictors
 *
 * All checks throw std::invalid_argument with a message naming the
 * operation that received the bad input.
 */
class ValidationUtils {
public:
	/**
	 * @brief Validate that a significance level lies in the open interval (0, 1)
	 *
	 * @param significance Significance level (maximum error rate)
	 * @throws std::invalid_argument if not finite or outside (0, 1)
	 */
	static void ValidateSignificance(double significance) {
		if (!std::isfinite(significance) || significance <= 0.0 || significance >= 1.0) {
			throw std::invalid_argument("significance must be in (0, 1) (got " + std::to_string(significance) + ")");
		}
	}

	static void ValidateSignificances(const std::vector<double> &significances) {
		if (significances.empty()) {
			throw std::invalid_argument("At least one significance level is required");
		}
		for (double s : significances) {
			ValidateSignificance(s);
		}
	}

	/**
	 * @brief Validate that inputs and labels describe the same examples
	 *
	 * @param x Inputs (n × p)
	 * @param y Labels (length n)
	 * @param operation_name Name of operation for error message
	 */
	static void ValidateExamples(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                             const std::string &operation_name) {
		if (x.rows() != y.size()) {
			throw std::invalid_argument(operation_name + ": row count mismatch (x has " + std::to_string(x.rows()) +
			                            " rows, y has " + std::to_string(y.size()) + " labels)");
		}
		if (x.rows() == 0) {
			throw std::invalid_argument(operation_name + ": no examples provided");
		}
	}

	/**
	 * @brief Validate the number of input columns
	 *
	 * @param expected_cols Columns of the stored calibration inputs
	 * @param actual_cols Columns of the supplied inputs
	 * @param operation_name Name of operation for error message
	 */
	static void ValidateColumnCount(Eigen::Index expected_cols, Eigen::Index actual_cols,
	                                const std::string &operation_name) {
		if (expected_cols != actual_cols) {
			throw std::invalid_argument(operation_name + ": dimension mismatch (expected " +
			                            std::to_string(expected_cols) + " input columns, got " +
			                            std::to_string(actual_cols) + ")");
		}
	}

	static bool HasNonFiniteValues(const Eigen::VectorXd &values) {
		return !values.allFinite();
	}
};

} // namespace utils
} // namespace libanoconf
