#include "misc.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <Eigen/Dense>
using Eigen::Ref;
using Eigen::VectorXd;

namespace stat::misc {

double pearson_correlation(const Ref<const VectorXd>& x, const Ref<const VectorXd>& y) {
  if (x.size() != y.size()) {
    throw std::invalid_argument("pearson_correlation: vectors differ in length");
  }
  if (x.size() < 2) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  VectorXd xc = x.array() - x.mean();
  VectorXd yc = y.array() - y.mean();
  double sxx = xc.squaredNorm();
  double syy = yc.squaredNorm();
  if (sxx == 0 || syy == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  double r = xc.dot(yc) / std::sqrt(sxx * syy);
  // guard against rounding just outside [-1, 1]
  return std::max(-1.0, std::min(1.0, r));
}

}
