#ifndef ASEMETA_STAT_MISC_H
#define ASEMETA_STAT_MISC_H

#include <Eigen/Dense>

namespace stat::misc {

  // Pearson correlation of x and y, NaN with fewer than two observations or
  // when either vector is constant.
  double pearson_correlation(const Eigen::Ref<const Eigen::VectorXd>& x,
                             const Eigen::Ref<const Eigen::VectorXd>& y);

};

#endif
