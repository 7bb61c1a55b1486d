#ifndef ASEMETA_STAT_TESTS_H
#define ASEMETA_STAT_TESTS_H

#include <limits>
#include <vector>

#include <boost/math/distributions.hpp>

namespace stat::tests {
  struct test_result_t {
    double pval;
    double log10p;

    bool operator==(const test_result_t& other) const {
      return this->pval == other.pval && this->log10p == other.log10p;
    }

    bool operator!=(const test_result_t& other) const {
      return !this->operator==(other);
    }
  };

  const double MIN_Z = boost::math::quantile(boost::math::normal(), std::numeric_limits<double>::min());

  const test_result_t TEST_FAILED {-1, -1};

  // Computes log10 of the CDF (lower tail) of a standard normal distribution
  double log10p_normal(const double& stat, const bool& two_sided);

  // 1 df chi-square statistic with upper tail probability 10^log10p
  double get_chisq_stat_from_logp(const double& log10p);

  test_result_t normal(const double& stat, const bool& two_sided);

  // exact two-sided binomial test of k successes in n trials
  test_result_t binomial_two_sided(const int& k, const int& n, const double& prob = 0.5);

  // |z| of a two-sided test with p-value 10^log10p
  double abs_z_from_log10p_two_sided(const double& log10p);

  // signed weighted Stouffer's Z of two-sided p-values: sum(w*s*|z|) / sqrt(sum(w^2))
  double stouffers_z(const std::vector<double>& log10_pvals,
                     const std::vector<double>& weights,
                     const std::vector<double>& signs);
}

#endif
