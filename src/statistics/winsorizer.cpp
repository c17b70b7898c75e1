// src/statistics/winsorizer.cpp

#include "fomc_ngin/statistics/winsorizer.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace fomc_ngin {
namespace statistics {

Eigen::VectorXd observed_values(const NullableColumn& column) {
    Eigen::Index count = 0;
    for (const auto& v : column) {
        if (v && std::isfinite(*v))
            ++count;
    }

    Eigen::VectorXd values(count);
    Eigen::Index i = 0;
    for (const auto& v : column) {
        if (v && std::isfinite(*v))
            values(i++) = *v;
    }
    return values;
}

double population_stddev(const NullableColumn& column) {
    Eigen::VectorXd values = observed_values(column);
    if (values.size() == 0) {
        return 0.0;
    }
    Eigen::VectorXd centered = values.array() - values.mean();
    return std::sqrt(centered.squaredNorm() / static_cast<double>(values.size()));
}

Result<WinsorBounds> fit_winsor_bounds(const NullableColumn& column, double sigma) {
    if (!std::isfinite(sigma) || sigma < 0.0) {
        return make_error<WinsorBounds>(ErrorCode::INVALID_ARGUMENT,
                                        "Winsor sigma must be finite and >= 0, got " +
                                            std::to_string(sigma),
                                        "Winsorizer");
    }

    WinsorBounds bounds;
    bounds.sigma = sigma;
    bounds.observations = static_cast<size_t>(observed_values(column).size());
    if (sigma == 0.0 || bounds.observations == 0) {
        return bounds;
    }

    bounds.stddev = population_stddev(column);
    bounds.upper = sigma * bounds.stddev;
    bounds.lower = -bounds.upper;
    bounds.active = true;
    return bounds;
}

NullableColumn apply_winsor_bounds(const NullableColumn& column, const WinsorBounds& bounds) {
    if (!bounds.active) {
        return column;
    }
    NullableColumn capped;
    capped.reserve(column.size());
    for (const auto& v : column) {
        if (v && std::isfinite(*v)) {
            capped.emplace_back(std::clamp(*v, bounds.lower, bounds.upper));
        } else {
            capped.push_back(v);
        }
    }
    return capped;
}

Result<NullableColumn> winsorize(const NullableColumn& column, double sigma) {
    auto bounds = fit_winsor_bounds(column, sigma);
    if (bounds.is_error()) {
        return forward_error<NullableColumn>(bounds, "Winsorizer");
    }
    return apply_winsor_bounds(column, bounds.value());
}

}  // namespace statistics
}  // namespace fomc_ngin
