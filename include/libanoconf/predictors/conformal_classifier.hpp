#pragma once

#include "libanoconf/predictors/base_conformal_predictor.hpp"
#include "libanoconf/core/conformal_result.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <random>
#include <vector>

namespace libanoconf {
namespace predictors {

/// Random engine used for smoothed p-values
using RandomEngine = std::mt19937_64;

/**
 * Inductive conformal classifier
 *
 * For every test example and every class seen during calibration, the
 * example is scored as if it carried that class and the score is ranked
 * among the calibration scores of its category:
 *
 *   p = n_gt / (n_cal + 1) + n_eq * U / (n_cal + 1)   (smoothing)
 *   p = n_gt / (n_cal + 1) + n_eq / (n_cal + 1)       (no smoothing)
 *
 * where n_gt counts calibration scores strictly greater than the test
 * score, n_eq counts equal scores plus the test example itself, and U is
 * drawn from Uniform[0, 1) independently for every (example, class)
 * pair on every call. The prediction set at significance level alpha
 * holds the classes with p > alpha and may be empty.
 *
 * Smoothed p-values draw from the classifier's own engine (seeded from
 * ConformalOptions::random_seed) unless an engine is passed in.
 *
 * Example:
 * ```cpp
 * ConformalClassifier<> icp(std::make_shared<MyProbabilityNc>(), nullptr,
 *                           ConformalOptions::Classification(false));
 * icp.Fit(x_train, y_train);
 * icp.Calibrate(x_cal, y_cal);
 * auto sets = icp.PredictSets(x_test, 0.1);
 * ```
 */
template <typename TNonconformity = nonconformity::INonconformityFunction>
class ConformalClassifier : public BaseConformalPredictor<TNonconformity> {
	using Base = BaseConformalPredictor<TNonconformity>;

public:
	explicit ConformalClassifier(typename Base::NonconformityPtr nc_function,
	                             core::ConditionFunction condition = nullptr,
	                             core::ConformalOptions options = core::ConformalOptions::Classification())
	    : Base(std::move(nc_function), std::move(condition), std::move(options)) {
		const uint64_t seed = this->options().random_seed;
		if (seed == 0) {
			std::random_device rd;
			engine_.seed((static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));
		} else {
			engine_.seed(seed);
		}
	}

	/// Classes seen during calibration, ascending; columns of every prediction
	const Eigen::VectorXd &GetClasses() const {
		return classes_;
	}

	bool smoothing() const {
		return this->options().smoothing;
	}

	/**
	 * p-value of every (test example, class) pair
	 *
	 * @param x Test inputs (m × p)
	 * @return m × n_classes matrix, columns in GetClasses() order
	 * @throws std::logic_error if not fitted and calibrated
	 */
	core::PValueMatrix PredictPValues(const Eigen::MatrixXd &x) {
		return PredictPValues(x, engine_);
	}

	/// Same as PredictPValues(x), drawing smoothing noise from rng
	core::PValueMatrix PredictPValues(const Eigen::MatrixXd &x, RandomEngine &rng) const {
		this->RequireCalibrated("predict");
		this->ValidateTestInputs(x, "predict");

		const Eigen::Index n_test = x.rows();
		const Eigen::Index n_classes = classes_.size();
		core::PValueMatrix p = core::PValueMatrix::Zero(n_test, n_classes);
		std::uniform_real_distribution<double> uniform(0.0, 1.0);

		for (Eigen::Index i = 0; i < n_classes; i++) {
			const double c = classes_(i);
			const Eigen::VectorXd test_class = Eigen::VectorXd::Constant(n_test, c);
			const Eigen::VectorXd test_nc = this->CheckedNc(x, test_class);

			for (Eigen::Index j = 0; j < n_test; j++) {
				const Eigen::VectorXd &cal_scores = this->ScoresFor(this->CategoryOf(x.row(j), c));
				const core::RankCounts counts = core::CalibrationScores::Rank(cal_scores, test_nc(j));
				const double denom = static_cast<double>(counts.n_cal + 1);

				double p_value = static_cast<double>(counts.n_gt) / denom;
				if (smoothing()) {
					p_value += static_cast<double>(counts.n_eq) * uniform(rng) / denom;
				} else {
					p_value += static_cast<double>(counts.n_eq) / denom;
				}
				p(j, i) = p_value;
			}
		}

		return p;
	}

	/**
	 * Prediction sets at a significance level
	 *
	 * @param x Test inputs (m × p)
	 * @param significance Significance level in (0, 1)
	 * @return m × n_classes matrix, true where p-value > significance
	 * @throws std::invalid_argument if significance is outside (0, 1)
	 */
	core::PredictionSetMatrix PredictSets(const Eigen::MatrixXd &x, double significance) {
		return PredictSets(x, significance, engine_);
	}

	core::PredictionSetMatrix PredictSets(const Eigen::MatrixXd &x, double significance, RandomEngine &rng) const {
		utils::ValidationUtils::ValidateSignificance(significance);
		return (PredictPValues(x, rng).array() > significance).matrix();
	}

	/// p-values (no significance level given)
	core::PValueMatrix Predict(const Eigen::MatrixXd &x) {
		return PredictPValues(x);
	}

	/// Prediction sets at a significance level
	core::PredictionSetMatrix Predict(const Eigen::MatrixXd &x, double significance) {
		return PredictSets(x, significance);
	}

	/**
	 * Single-label summary of each test example
	 *
	 * The predicted label is the class with the largest p-value (the
	 * smallest class on ties); credibility is that p-value and
	 * confidence is one minus the second largest p-value.
	 */
	core::LabelPrediction PredictLabels(const Eigen::MatrixXd &x) {
		return PredictLabels(x, engine_);
	}

	core::LabelPrediction PredictLabels(const Eigen::MatrixXd &x, RandomEngine &rng) const {
		const core::PValueMatrix p = PredictPValues(x, rng);
		const Eigen::Index n_test = p.rows();

		core::LabelPrediction result;
		result.labels.resize(n_test);
		result.credibility.resize(n_test);
		result.confidence.resize(n_test);

		for (Eigen::Index j = 0; j < n_test; j++) {
			Eigen::Index best = 0;
			const double best_p = p.row(j).maxCoeff(&best);

			double second_p = 0.0;
			for (Eigen::Index i = 0; i < p.cols(); i++) {
				if (i != best) {
					second_p = std::max(second_p, p(j, i));
				}
			}

			result.labels(j) = classes_(best);
			result.credibility(j) = best_p;
			result.confidence(j) = 1.0 - second_p;
		}
		return result;
	}

protected:
	void StageCalibration(const Eigen::VectorXd &y, bool increment) override {
		pending_classes_ = MergeClasses(y, increment);
	}

	void CommitCalibration() override {
		classes_.swap(pending_classes_);
		pending_classes_.resize(0);
		ANOCONF_DEBUG("Class registry holds " << classes_.size() << " classes");
	}

private:
	Eigen::VectorXd MergeClasses(const Eigen::VectorXd &y, bool increment) const {
		std::vector<double> merged(y.data(), y.data() + y.size());
		if (increment && classes_.size() > 0) {
			merged.insert(merged.end(), classes_.data(), classes_.data() + classes_.size());
		}
		std::sort(merged.begin(), merged.end());
		merged.erase(std::unique(merged.begin(), merged.end()), merged.end());

		return Eigen::Map<const Eigen::VectorXd>(merged.data(), static_cast<Eigen::Index>(merged.size()));
	}

	Eigen::VectorXd classes_;
	Eigen::VectorXd pending_classes_;
	RandomEngine engine_;
};

} // namespace predictors
} // namespace libanoconf
