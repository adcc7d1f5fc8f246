#pragma once

#include "libanoconf/core/category.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace libanoconf {
namespace core {

/**
 * Rank of a test nonconformity score among calibration scores
 *
 * n_eq counts the calibration scores equal to the test score plus one
 * for the test example itself.
 */
struct RankCounts {
	size_t n_cal = 0;
	size_t n_gt = 0;
	size_t n_eq = 1;
};

/**
 * Calibration scores table: category -> nonconformity scores sorted descending
 *
 * The table is rebuilt as a whole on every calibration; a predictor
 * builds a fresh table and swaps it in. Next to the per-category
 * vectors it keeps the pooled scores of all categories, used when a
 * test example falls in a category never seen during calibration.
 *
 * Invariant: the per-category vectors partition the calibration set,
 * so their sizes sum to the calibration-set size.
 */
class CalibrationScores {
public:
	CalibrationScores() = default;

	/**
	 * Store the scores of one category, sorted descending
	 *
	 * Inserting a category twice replaces its previous scores.
	 */
	void Insert(Category category, Eigen::VectorXd scores) {
		SortDescending(scores);
		by_category_[category] = std::move(scores);
		pooled_valid_ = false;
	}

	/// Scores of a category, or nullptr if the category has none
	const Eigen::VectorXd *Find(Category category) const {
		auto it = by_category_.find(category);
		if (it == by_category_.end()) {
			return nullptr;
		}
		return &it->second;
	}

	bool Contains(Category category) const {
		return by_category_.count(category) > 0;
	}

	/// Scores of all categories together, sorted descending
	const Eigen::VectorXd &Pooled() const {
		if (!pooled_valid_) {
			Eigen::VectorXd all(static_cast<Eigen::Index>(TotalSize()));
			Eigen::Index offset = 0;
			for (const auto &entry : by_category_) {
				all.segment(offset, entry.second.size()) = entry.second;
				offset += entry.second.size();
			}
			SortDescending(all);
			pooled_ = std::move(all);
			pooled_valid_ = true;
		}
		return pooled_;
	}

	/// Categories in ascending order
	std::vector<Category> Categories() const {
		std::vector<Category> out;
		out.reserve(by_category_.size());
		for (const auto &entry : by_category_) {
			out.push_back(entry.first);
		}
		return out;
	}

	/// Sum of per-category sizes
	size_t TotalSize() const {
		size_t total = 0;
		for (const auto &entry : by_category_) {
			total += static_cast<size_t>(entry.second.size());
		}
		return total;
	}

	size_t n_categories() const {
		return by_category_.size();
	}

	bool empty() const {
		return by_category_.empty();
	}

	const std::map<Category, Eigen::VectorXd> &by_category() const {
		return by_category_;
	}

	/**
	 * Count calibration scores strictly greater than and equal to nc
	 *
	 * Binary search on a descending vector: the leftmost position not
	 * greater than nc gives n_gt, the first position strictly below nc
	 * closes the run of ties.
	 *
	 * @param sorted_desc Calibration scores sorted descending
	 * @param nc Test nonconformity score
	 */
	static RankCounts Rank(const Eigen::VectorXd &sorted_desc, double nc) {
		const double *first = sorted_desc.data();
		const double *last = first + sorted_desc.size();

		const double *left = std::lower_bound(first, last, nc, std::greater<double>());
		const double *right = std::upper_bound(left, last, nc, std::greater<double>());

		RankCounts counts;
		counts.n_cal = static_cast<size_t>(sorted_desc.size());
		counts.n_gt = static_cast<size_t>(left - first);
		counts.n_eq = static_cast<size_t>(right - left) + 1;
		return counts;
	}

private:
	static void SortDescending(Eigen::VectorXd &v) {
		std::sort(v.data(), v.data() + v.size(), std::greater<double>());
	}

	std::map<Category, Eigen::VectorXd> by_category_;
	mutable Eigen::VectorXd pooled_;
	mutable bool pooled_valid_ = false;
};

} // namespace core
} // namespace libanoconf
