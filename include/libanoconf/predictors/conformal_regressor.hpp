#pragma once

#include "libanoconf/predictors/base_conformal_predictor.hpp"
#include "libanoconf/core/conformal_result.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace libanoconf {
namespace predictors {

/**
 * Inductive conformal regressor
 *
 * Test examples are grouped by category, computed with the label
 * unknown (the condition function receives std::nullopt). Each group is
 * handed, together with the descending calibration scores of its
 * category, to IRegressionNonconformity::PredictIntervals(), and the
 * bounds are scattered back into the original test order.
 *
 * The interval formula itself belongs to the nonconformity function.
 */
template <typename TNonconformity = nonconformity::IRegressionNonconformity>
class ConformalRegressor : public BaseConformalPredictor<TNonconformity> {
	static_assert(std::is_base_of<nonconformity::IRegressionNonconformity, TNonconformity>::value,
	              "TNonconformity must implement IRegressionNonconformity");

	using Base = BaseConformalPredictor<TNonconformity>;

public:
	explicit ConformalRegressor(typename Base::NonconformityPtr nc_function,
	                            core::ConditionFunction condition = nullptr,
	                            core::ConformalOptions options = core::ConformalOptions::Regression())
	    : Base(std::move(nc_function), std::move(condition), std::move(options)) {
	}

	/**
	 * Intervals on the default significance grid (0.01, 0.02, ..., 0.99
	 * unless ConformalOptions::significance_grid_size says otherwise)
	 */
	core::ConformalIntervals Predict(const Eigen::MatrixXd &x) const {
		return Predict(x, this->options().DefaultSignificanceGrid());
	}

	/**
	 * Intervals at one significance level
	 *
	 * @param x Test inputs (m × p)
	 * @param significance Significance level in (0, 1)
	 * @return Intervals with a single column
	 */
	core::ConformalIntervals Predict(const Eigen::MatrixXd &x, double significance) const {
		return Predict(x, std::vector<double> {significance});
	}

	/**
	 * Intervals at several significance levels
	 *
	 * @param x Test inputs (m × p)
	 * @param significances Levels, each in (0, 1); column k of the result
	 *                      corresponds to significances[k]
	 * @throws std::logic_error if not fitted and calibrated
	 * @throws std::invalid_argument on bad significance levels or input width
	 * @throws std::out_of_range for an unknown category under the "error" policy
	 */
	core::ConformalIntervals Predict(const Eigen::MatrixXd &x, const std::vector<double> &significances) const {
		this->RequireCalibrated("predict");
		utils::ValidationUtils::ValidateSignificances(significances);
		this->ValidateTestInputs(x, "predict");

		core::ConformalIntervals prediction(static_cast<size_t>(x.rows()), significances);

		std::map<core::Category, std::vector<Eigen::Index>> groups;
		for (Eigen::Index i = 0; i < x.rows(); i++) {
			groups[this->CategoryOf(x.row(i), std::nullopt)].push_back(i);
		}

		for (const auto &group : groups) {
			const core::Category category = group.first;
			const std::vector<Eigen::Index> &rows = group.second;

			if (!this->GetCalibrationScores().Contains(category) && this->options().PoolUnknownCategories()) {
				ANOCONF_WARN("Category " << category << " not seen during calibration, " << rows.size()
				                         << " test examples use pooled calibration scores");
			}
			const Eigen::VectorXd &cal_scores = this->ScoresFor(category);

			Eigen::MatrixXd x_group(static_cast<Eigen::Index>(rows.size()), x.cols());
			for (size_t r = 0; r < rows.size(); r++) {
				x_group.row(static_cast<Eigen::Index>(r)) = x.row(rows[r]);
			}

			const core::ConformalIntervals group_intervals =
			    this->nc_function().PredictIntervals(x_group, cal_scores, significances);
			CheckGroupShape(group_intervals, x_group.rows(), significances.size());

			for (size_t r = 0; r < rows.size(); r++) {
				const auto src = static_cast<Eigen::Index>(r);
				prediction.lower.row(rows[r]) = group_intervals.lower.row(src);
				prediction.upper.row(rows[r]) = group_intervals.upper.row(src);
			}
		}

		return prediction;
	}

private:
	void CheckGroupShape(const core::ConformalIntervals &intervals, Eigen::Index expected_rows,
	                     size_t expected_levels) const {
		const auto expected_cols = static_cast<Eigen::Index>(expected_levels);
		if (intervals.lower.rows() != expected_rows || intervals.upper.rows() != expected_rows ||
		    intervals.lower.cols() != expected_cols || intervals.upper.cols() != expected_cols) {
			throw std::runtime_error(this->nc_function().GetName() + " returned intervals of shape " +
			                         std::to_string(intervals.lower.rows()) + "x" +
			                         std::to_string(intervals.lower.cols()) + ", expected " +
			                         std::to_string(expected_rows) + "x" + std::to_string(expected_cols));
		}
	}
};

} // namespace predictors
} // namespace libanoconf
