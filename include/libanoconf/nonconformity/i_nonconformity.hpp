#pragma once

#include "libanoconf/core/conformal_result.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace libanoconf {
namespace nonconformity {

/**
 * INonconformityFunction: Abstract interface for nonconformity scorers
 *
 * A nonconformity function wraps an underlying point predictor and
 * measures how unusual an (input, label) pair is relative to it. The
 * conformal predictors only ever talk to the scorer through this
 * interface; training the wrapped model and the score formula are the
 * scorer's business.
 *
 * Contract:
 * - Fit() trains the wrapped predictor
 * - CalcNc() returns one score per row of x, higher = more atypical
 * - Clone() returns an independent copy, fitted state included
 */
class INonconformityFunction {
public:
	virtual ~INonconformityFunction() = default;

	/**
	 * Train the underlying point predictor
	 *
	 * @param x Training inputs (n × p, one example per row)
	 * @param y Training labels (length n)
	 */
	virtual void Fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) = 0;

	/**
	 * Compute nonconformity scores
	 *
	 * @param x Inputs (n × p)
	 * @param y Labels (length n); for classification test examples every
	 *          entry holds the candidate class being scored
	 * @return Scores (length n)
	 */
	virtual Eigen::VectorXd CalcNc(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) const = 0;

	virtual std::unique_ptr<INonconformityFunction> Clone() const = 0;

	/// Human-readable name used in log messages
	virtual std::string GetName() const {
		return "nonconformity";
	}
};

/**
 * IRegressionNonconformity: nonconformity scorer that can also invert
 * calibration scores into prediction intervals
 *
 * PredictIntervals() owns the bound formula, e.g. taking the
 * calibration score at the rank implied by the significance level and
 * widening the point prediction by it.
 */
class IRegressionNonconformity : public INonconformityFunction {
public:
	/**
	 * Build prediction intervals for test inputs of a single category
	 *
	 * @param x Test inputs (m × p)
	 * @param cal_scores Calibration scores of the category, sorted descending
	 * @param significances Significance levels, each in (0, 1)
	 * @return Intervals with m rows and one column per significance level
	 */
	virtual core::ConformalIntervals PredictIntervals(const Eigen::MatrixXd &x, const Eigen::VectorXd &cal_scores,
	                                                  const std::vector<double> &significances) const = 0;
};

} // namespace nonconformity
} // namespace libanoconf
