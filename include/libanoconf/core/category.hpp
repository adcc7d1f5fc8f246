#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <functional>
#include <optional>

namespace libanoconf {
namespace core {

/// Category id produced by a condition function (Mondrian taxonomy)
using Category = int64_t;

/// Category used when no condition function is supplied
constexpr Category kDefaultCategory = 0;

/**
 * Condition function: maps one example to its category
 *
 * @param x_row Input row of the example
 * @param label Label of the example, or std::nullopt when it is unknown
 *              (regression test examples)
 * @return Category id
 */
using ConditionFunction = std::function<Category(const Eigen::RowVectorXd &x_row, std::optional<double> label)>;

/// Condition that puts every example in kDefaultCategory
inline ConditionFunction DefaultCondition() {
	return [](const Eigen::RowVectorXd &, std::optional<double>) { return kDefaultCategory; };
}

} // namespace core
} // namespace libanoconf
