// include/fomc_ngin/statistics/winsorizer.hpp
#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <optional>
#include <vector>
#include "fomc_ngin/core/error.hpp"

namespace fomc_ngin {
namespace statistics {

/**
 * @brief Column with explicit missing values
 */
using NullableColumn = std::vector<std::optional<double>>;

/**
 * @brief Symmetric cap [-sigma * stdev, +sigma * stdev] fitted on one column
 */
struct WinsorBounds {
    double sigma{0.0};
    double stddev{0.0};
    double lower{0.0};
    double upper{0.0};
    size_t observations{0};
    bool active{false};  // false when sigma == 0 or the column has no values
};

/**
 * @brief Population standard deviation (ddof = 0) of the non-null values
 * @return 0.0 for a column without values
 */
double population_stddev(const NullableColumn& column);

/**
 * @brief Collect the non-null values of a column into an Eigen vector
 */
Eigen::VectorXd observed_values(const NullableColumn& column);

/**
 * @brief Fit bounds once on the full column
 * @return INVALID_ARGUMENT for a negative or non-finite sigma
 */
Result<WinsorBounds> fit_winsor_bounds(const NullableColumn& column, double sigma);

/**
 * @brief Clamp every non-null value to previously fitted bounds
 *
 * Re-applying the same bounds leaves the column unchanged.
 */
NullableColumn apply_winsor_bounds(const NullableColumn& column, const WinsorBounds& bounds);

/**
 * @brief fit_winsor_bounds followed by apply_winsor_bounds
 */
Result<NullableColumn> winsorize(const NullableColumn& column, double sigma);

}  // namespace statistics
}  // namespace fomc_ngin
