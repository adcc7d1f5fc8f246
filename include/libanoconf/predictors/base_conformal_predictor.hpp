#pragma once

#include "libanoconf/core/calibration_scores.hpp"
#include "libanoconf/core/calibration_set.hpp"
#include "libanoconf/core/category.hpp"
#include "libanoconf/core/conformal_options.hpp"
#include "libanoconf/nonconformity/i_nonconformity.hpp"
#include "libanoconf/utils/tracing.hpp"
#include "libanoconf/utils/validation.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace libanoconf {
namespace predictors {

/**
 * Base inductive conformal predictor
 *
 * Owns the fit/calibrate lifecycle shared by the classifier and the
 * regressor:
 * 1. Fit() trains the wrapped nonconformity function
 * 2. Calibrate() stores calibration examples (replacing them, or
 *    appending to them when increment is set), assigns every example a
 *    category through the condition function, and rebuilds the table of
 *    descending calibration scores per category. A Calibrate() that throws
 *    leaves the predictor as it was.
 * 3. Derived classes turn test scores into p-values or intervals
 *
 * Without a condition function all examples share kDefaultCategory and
 * calibration is plain (non-Mondrian) ICP.
 *
 * The nonconformity function is shared with the caller; the calibration
 * set and score table are owned by the predictor and only mutated by
 * Calibrate(). Instances are not thread-safe.
 *
 * @tparam TNonconformity Nonconformity interface the predictor needs
 */
template <typename TNonconformity>
class BaseConformalPredictor {
	static_assert(std::is_base_of<nonconformity::INonconformityFunction, TNonconformity>::value,
	              "TNonconformity must implement INonconformityFunction");

public:
	using NonconformityPtr = std::shared_ptr<TNonconformity>;

	/// Current configuration, see GetParams()
	struct Params {
		NonconformityPtr nc_function;
		core::ConditionFunction condition;
		bool conditional = false;
	};

	/**
	 * @param nc_function Nonconformity function (shared, must not be null)
	 * @param condition Condition function; empty for non-conditional ICP
	 * @param options Conformal options (validated here)
	 */
	explicit BaseConformalPredictor(NonconformityPtr nc_function, core::ConditionFunction condition = nullptr,
	                                core::ConformalOptions options = core::ConformalOptions())
	    : nc_function_(std::move(nc_function)), options_(std::move(options)) {
		if (!nc_function_) {
			throw std::invalid_argument("nc_function must not be null");
		}
		options_.Validate();

		if (condition) {
			condition_ = std::move(condition);
			conditional_ = true;
		} else {
			condition_ = core::DefaultCondition();
			conditional_ = false;
		}
	}

	virtual ~BaseConformalPredictor() = default;

	/**
	 * Fit the underlying nonconformity function
	 *
	 * @param x Training inputs (n × p)
	 * @param y Training labels (length n)
	 */
	void Fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) {
		utils::ValidationUtils::ValidateExamples(x, y, "fit");
		ANOCONF_DEBUG("Fitting " << nc_function_->GetName() << " on " << x.rows() << " examples");
		nc_function_->Fit(x, y);
		is_fitted_ = true;
	}

	/**
	 * Calibrate the predictor on (x, y)
	 *
	 * @param x Calibration inputs (n × p)
	 * @param y Calibration labels (length n)
	 * @param increment If true, (x, y) are added to the previously stored
	 *                  calibration examples and the predictor is
	 *                  recalibrated on old and new examples together
	 *
	 * @throws std::logic_error if Fit() has not been called
	 * @throws std::invalid_argument on mismatched shapes
	 * @throws std::runtime_error if the nonconformity function misbehaves
	 */
	void Calibrate(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, bool increment = false) {
		RequireFitted("calibrate");
		utils::ValidationUtils::ValidateExamples(x, y, "calibrate");
		const bool append = increment && !calibration_set_.empty();
		if (append) {
			utils::ValidationUtils::ValidateColumnCount(calibration_set_.n_features(), x.cols(),
			                                            "incremental calibrate");
		}

		ANOCONF_TIMING_START();

		// Everything is built aside and committed only once scoring succeeded
		StageCalibration(y, increment);

		core::CalibrationSet merged = calibration_set_;
		if (append) {
			merged.Append(x, y);
		} else {
			merged.Replace(x, y);
		}

		core::CalibrationScores scores = conditional_ ? ScoreByCategory(merged) : ScoreUnconditional(merged);

		calibration_set_ = std::move(merged);
		cal_scores_ = std::move(scores);
		CommitCalibration();
		is_calibrated_ = true;

		ANOCONF_DEBUG("Calibrated on " << calibration_set_.size() << " examples (" << (append ? "incremental" : "full")
		                               << "), " << cal_scores_.n_categories() << " categories");
		ANOCONF_TIMING_END("Calibrate");
	}

	/**
	 * Current configuration
	 *
	 * @param deep If true, the nonconformity function is cloned
	 */
	Params GetParams(bool deep = false) const {
		Params params;
		params.nc_function = deep ? CloneNonconformity() : nc_function_;
		params.condition = condition_;
		params.conditional = conditional_;
		return params;
	}

	bool IsFitted() const {
		return is_fitted_;
	}

	bool IsCalibrated() const {
		return is_calibrated_;
	}

	bool IsConditional() const {
		return conditional_;
	}

	const core::CalibrationSet &GetCalibrationSet() const {
		return calibration_set_;
	}

	const core::CalibrationScores &GetCalibrationScores() const {
		return cal_scores_;
	}

	/// Categories of the last calibration, ascending
	std::vector<core::Category> GetCategories() const {
		return cal_scores_.Categories();
	}

	const core::ConformalOptions &GetOptions() const {
		return options_;
	}

protected:
	/**
	 * Prepare derived state for a calibration, before scores are computed
	 *
	 * Staged state must not be visible until CommitCalibration(); a
	 * calibration that throws afterwards never commits.
	 */
	virtual void StageCalibration(const Eigen::VectorXd &y, bool increment) {
	}

	/// Publish the state prepared by StageCalibration()
	virtual void CommitCalibration() {
	}

	void RequireFitted(const std::string &operation) const {
		if (!is_fitted_) {
			throw std::logic_error("Cannot " + operation + ": conformal predictor is not fitted (call Fit first)");
		}
	}

	void RequireCalibrated(const std::string &operation) const {
		RequireFitted(operation);
		if (!is_calibrated_) {
			throw std::logic_error("Cannot " + operation +
			                       ": conformal predictor is not calibrated (call Calibrate first)");
		}
	}

	/// Reject test inputs whose width differs from the calibration inputs
	void ValidateTestInputs(const Eigen::MatrixXd &x, const std::string &operation) const {
		utils::ValidationUtils::ValidateColumnCount(calibration_set_.n_features(), x.cols(), operation);
	}

	core::Category CategoryOf(const Eigen::RowVectorXd &x_row, std::optional<double> label) const {
		if (!conditional_) {
			return core::kDefaultCategory;
		}
		return condition_(x_row, label);
	}

	/**
	 * Calibration scores for a test example's category
	 *
	 * Unknown categories either throw or fall back to the pooled scores,
	 * depending on ConformalOptions::unknown_category.
	 */
	const Eigen::VectorXd &ScoresFor(core::Category category) const {
		const Eigen::VectorXd *scores = cal_scores_.Find(category);
		if (scores != nullptr) {
			return *scores;
		}
		if (options_.PoolUnknownCategories()) {
			ANOCONF_DEBUG("Category " << category << " not seen during calibration, using pooled scores");
			return cal_scores_.Pooled();
		}
		throw std::out_of_range("No calibration scores for category " + std::to_string(category) +
		                        " (category not seen during calibration)");
	}

	/// Scores from the nonconformity function, checked for length and finiteness
	Eigen::VectorXd CheckedNc(const Eigen::MatrixXd &x, const Eigen::VectorXd &y) const {
		Eigen::VectorXd scores = nc_function_->CalcNc(x, y);
		if (scores.size() != x.rows()) {
			throw std::runtime_error(nc_function_->GetName() + " returned " + std::to_string(scores.size()) +
			                         " scores for " + std::to_string(x.rows()) + " examples");
		}
		if (utils::ValidationUtils::HasNonFiniteValues(scores)) {
			throw std::runtime_error(nc_function_->GetName() + " returned non-finite nonconformity scores");
		}
		return scores;
	}

	const TNonconformity &nc_function() const {
		return *nc_function_;
	}

	const core::ConformalOptions &options() const {
		return options_;
	}

private:
	core::CalibrationScores ScoreUnconditional(const core::CalibrationSet &cal_set) const {
		core::CalibrationScores scores;
		scores.Insert(core::kDefaultCategory, CheckedNc(cal_set.x(), cal_set.y()));
		return scores;
	}

	core::CalibrationScores ScoreByCategory(const core::CalibrationSet &cal_set) const {
		const Eigen::MatrixXd &cal_x = cal_set.x();
		const Eigen::VectorXd &cal_y = cal_set.y();
		const size_t n = cal_set.size();

		std::vector<core::Category> category_map(n);
		std::set<core::Category> categories;
		for (size_t i = 0; i < n; i++) {
			const auto row = static_cast<Eigen::Index>(i);
			category_map[i] = condition_(cal_x.row(row), cal_y(row));
			categories.insert(category_map[i]);
		}

		core::CalibrationScores scores;
		for (core::Category category : categories) {
			std::vector<bool> mask(n);
			for (size_t i = 0; i < n; i++) {
				mask[i] = category_map[i] == category;
			}
			scores.Insert(category,
			              CheckedNc(cal_set.SelectRows(mask), cal_set.SelectLabels(mask)));
			ANOCONF_TRACE("Category " << category << ": " << scores.Find(category)->size() << " calibration scores");
		}
		return scores;
	}

	std::shared_ptr<TNonconformity> CloneNonconformity() const {
		std::unique_ptr<nonconformity::INonconformityFunction> clone = nc_function_->Clone();
		auto *typed = dynamic_cast<TNonconformity *>(clone.get());
		if (typed == nullptr) {
			throw std::runtime_error(nc_function_->GetName() + "::Clone() returned an incompatible type");
		}
		clone.release();
		return std::shared_ptr<TNonconformity>(typed);
	}

	NonconformityPtr nc_function_;
	core::ConditionFunction condition_;
	bool conditional_ = false;
	core::ConformalOptions options_;

	core::CalibrationSet calibration_set_;
	core::CalibrationScores cal_scores_;
	bool is_fitted_ = false;
	bool is_calibrated_ = false;
};

} // namespace predictors
} // namespace libanoconf
