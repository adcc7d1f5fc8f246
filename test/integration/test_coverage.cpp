#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libanoconf/predictors/conformal_classifier.hpp>
#include <libanoconf/predictors/conformal_regressor.hpp>
#include "../support/test_nonconformity.hpp"
#include <Eigen/Dense>
#include <memory>
#include <random>

using namespace libanoconf;
using namespace libanoconf::core;
using namespace libanoconf::predictors;
using libanoconf::testing::DistanceNc;
using libanoconf::testing::LinearAbsErrorNc;

namespace {

struct Dataset {
	Eigen::MatrixXd x;
	Eigen::VectorXd y;
};

// y = 2 x + 1 + N(0, 1), x ~ U(-5, 5)
Dataset MakeRegressionData(Eigen::Index n, std::mt19937_64 &rng) {
	std::uniform_real_distribution<double> input(-5.0, 5.0);
	std::normal_distribution<double> noise(0.0, 1.0);
	Dataset data {Eigen::MatrixXd(n, 1), Eigen::VectorXd(n)};
	for (Eigen::Index i = 0; i < n; i++) {
		data.x(i, 0) = input(rng);
		data.y(i) = 2.0 * data.x(i, 0) + 1.0 + noise(rng);
	}
	return data;
}

// Label in {0, 1, 2}, first input = label + N(0, 0.8)
Dataset MakeClassificationData(Eigen::Index n, std::mt19937_64 &rng) {
	std::uniform_int_distribution<int> label(0, 2);
	std::normal_distribution<double> noise(0.0, 0.8);
	Dataset data {Eigen::MatrixXd(n, 1), Eigen::VectorXd(n)};
	for (Eigen::Index i = 0; i < n; i++) {
		data.y(i) = static_cast<double>(label(rng));
		data.x(i, 0) = data.y(i) + noise(rng);
	}
	return data;
}

// Fraction of test examples whose true label is in the prediction set
double SetCoverage(const PredictionSetMatrix &sets, const Eigen::VectorXd &classes, const Eigen::VectorXd &y) {
	Eigen::Index covered = 0;
	for (Eigen::Index j = 0; j < y.size(); j++) {
		for (Eigen::Index c = 0; c < classes.size(); c++) {
			if (classes(c) == y(j) && sets(j, c)) {
				covered++;
			}
		}
	}
	return static_cast<double>(covered) / static_cast<double>(y.size());
}

} // namespace

TEST_CASE("Integration: Regression interval coverage", "[integration][coverage]") {
	std::mt19937_64 rng(20240611);
	Dataset train = MakeRegressionData(300, rng);
	Dataset cal = MakeRegressionData(2000, rng);
	Dataset test = MakeRegressionData(5000, rng);

	ConformalRegressor<> icp(std::make_shared<LinearAbsErrorNc>());
	icp.Fit(train.x, train.y);
	icp.Calibrate(cal.x, cal.y);

	const std::vector<double> levels {0.05, 0.1, 0.2};
	ConformalIntervals intervals = icp.Predict(test.x, levels);

	for (size_t k = 0; k < levels.size(); k++) {
		const auto col = static_cast<Eigen::Index>(k);
		Eigen::Index covered = 0;
		for (Eigen::Index j = 0; j < test.y.size(); j++) {
			if (intervals.lower(j, col) <= test.y(j) && test.y(j) <= intervals.upper(j, col)) {
				covered++;
			}
		}
		const double coverage = static_cast<double>(covered) / static_cast<double>(test.y.size());
		INFO("significance " << levels[k] << ", coverage " << coverage);
		REQUIRE(coverage >= 1.0 - levels[k] - 0.025);
		REQUIRE(coverage <= 1.0 - levels[k] + 0.025);
	}
}

TEST_CASE("Integration: Classification set coverage", "[integration][coverage]") {
	std::mt19937_64 rng(7);
	Dataset train = MakeClassificationData(100, rng);
	Dataset cal = MakeClassificationData(2000, rng);
	Dataset test = MakeClassificationData(5000, rng);
	const double significance = 0.1;

	SECTION("Non-smoothed p-values are conservative") {
		ConformalClassifier<> icp(std::make_shared<DistanceNc>(), nullptr, ConformalOptions::Classification(false));
		icp.Fit(train.x, train.y);
		icp.Calibrate(cal.x, cal.y);

		const double coverage = SetCoverage(icp.PredictSets(test.x, significance), icp.GetClasses(), test.y);
		INFO("coverage " << coverage);
		REQUIRE(coverage >= 1.0 - significance - 0.025);
	}

	SECTION("Smoothed p-values are close to exact") {
		ConformalClassifier<> icp(std::make_shared<DistanceNc>(), nullptr,
		                          ConformalOptions::Classification(true, 12345));
		icp.Fit(train.x, train.y);
		icp.Calibrate(cal.x, cal.y);

		const double coverage = SetCoverage(icp.PredictSets(test.x, significance), icp.GetClasses(), test.y);
		INFO("coverage " << coverage);
		REQUIRE_THAT(coverage, Catch::Matchers::WithinAbs(1.0 - significance, 0.03));
	}

	SECTION("Label-conditional coverage holds for every class") {
		ConditionFunction by_label = [](const Eigen::RowVectorXd &, std::optional<double> label) {
			return static_cast<Category>(label.value_or(-1.0));
		};
		ConformalClassifier<> icp(std::make_shared<DistanceNc>(), by_label, ConformalOptions::Classification(false));
		icp.Fit(train.x, train.y);
		icp.Calibrate(cal.x, cal.y);
		REQUIRE(icp.GetCategories() == std::vector<Category>{0, 1, 2});

		const PredictionSetMatrix sets = icp.PredictSets(test.x, significance);
		for (Eigen::Index c = 0; c < icp.GetClasses().size(); c++) {
			Eigen::Index members = 0;
			Eigen::Index covered = 0;
			for (Eigen::Index j = 0; j < test.y.size(); j++) {
				if (test.y(j) == icp.GetClasses()(c)) {
					members++;
					if (sets(j, c)) {
						covered++;
					}
				}
			}
			REQUIRE(members > 0);
			const double coverage = static_cast<double>(covered) / static_cast<double>(members);
			INFO("class " << c << ", coverage " << coverage);
			REQUIRE(coverage >= 1.0 - significance - 0.05);
		}
	}
}
