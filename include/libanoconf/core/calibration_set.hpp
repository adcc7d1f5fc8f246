#pragma once

#include "libanoconf/utils/validation.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace libanoconf {
namespace core {

/**
 * Calibration examples accumulated by a conformal predictor
 *
 * Inputs are stored row-wise (one example per row) next to their labels.
 * The set is replaced wholesale by a plain calibration and grows by
 * appending on an incremental one; it never shrinks.
 */
class CalibrationSet {
public:
	CalibrationSet() = default;

	/// Replace the stored examples with (x, y)
	void Replace(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) {
		utils::ValidationUtils::ValidateExamples(x, y, "calibrate");
		x_ = x;
		y_ = y;
	}

	/**
	 * Append (x, y) below the stored examples
	 *
	 * Falls back to Replace() when nothing is stored yet.
	 *
	 * @throws std::invalid_argument if x has a different number of columns
	 */
	void Append(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) {
		if (empty()) {
			Replace(x, y);
			return;
		}
		utils::ValidationUtils::ValidateExamples(x, y, "incremental calibrate");
		utils::ValidationUtils::ValidateColumnCount(x_.cols(), x.cols(), "incremental calibrate");

		const Eigen::Index old_rows = x_.rows();
		Eigen::MatrixXd stacked_x(old_rows + x.rows(), x_.cols());
		stacked_x << x_, x;
		Eigen::VectorXd stacked_y(old_rows + y.size());
		stacked_y << y_, y;

		x_.swap(stacked_x);
		y_.swap(stacked_y);
	}

	/// Rows of x whose mask entry is set, in original order
	Eigen::MatrixXd SelectRows(const std::vector<bool> &mask) const {
		Eigen::MatrixXd out(CountSelected(mask), x_.cols());
		Eigen::Index next = 0;
		for (Eigen::Index i = 0; i < x_.rows(); i++) {
			if (mask[static_cast<size_t>(i)]) {
				out.row(next++) = x_.row(i);
			}
		}
		return out;
	}

	/// Labels whose mask entry is set, in original order
	Eigen::VectorXd SelectLabels(const std::vector<bool> &mask) const {
		Eigen::VectorXd out(CountSelected(mask));
		Eigen::Index next = 0;
		for (Eigen::Index i = 0; i < y_.size(); i++) {
			if (mask[static_cast<size_t>(i)]) {
				out(next++) = y_(i);
			}
		}
		return out;
	}

	const Eigen::MatrixXd &x() const {
		return x_;
	}

	const Eigen::VectorXd &y() const {
		return y_;
	}

	size_t size() const {
		return static_cast<size_t>(y_.size());
	}

	Eigen::Index n_features() const {
		return x_.cols();
	}

	bool empty() const {
		return y_.size() == 0;
	}

private:
	static Eigen::Index CountSelected(const std::vector<bool> &mask) {
		Eigen::Index n = 0;
		for (bool selected : mask) {
			if (selected) {
				n++;
			}
		}
		return n;
	}

	Eigen::MatrixXd x_;
	Eigen::VectorXd y_;
};

} // namespace core
} // namespace libanoconf
