#include "tests.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>
using std::max;
using std::min;
using std::vector;

#include <boost/math/distributions.hpp>
#include <boost/math/special_functions/erf.hpp>
#include <boost/math/special_functions/gamma.hpp>
using boost::math::cdf;
using boost::math::complement;

namespace stat::tests {

// log Phi(stat) without underflow; the asymptotic expansion is used once
// erfc itself underflows
double log10p_normal(const double& stat, const bool& two_sided) {
  double logp = 0;
  if (stat < -37) {
    double x2 = stat*stat;
    logp = -x2/2 - log(-stat) - 0.5*log(2*M_PI) + log1p(-1/x2 + 3/(x2*x2));
  } else if (stat < -1) {
    logp = log(boost::math::erfc(-stat*M_SQRT1_2)/2);
  } else {
    logp = log1p(-boost::math::erfc(stat*M_SQRT1_2)/2);
  }

  if (two_sided) {
    return logp / log(10) + log10(2);
  } else {
    return logp / log(10);
  }
}

double get_chisq_stat_from_logp(const double& log10p) {
  if (log10p < log10(std::numeric_limits<double>::min())) {
    double val = -log10p * log(100) + log(2/M_PI);
    return val - log(val);
  } else {
    return boost::math::quantile(
      boost::math::complement(
        boost::math::chi_squared(1),
        pow(10, log10p)
      )
    );
  }
}

test_result_t normal(const double& stat, const bool& two_sided) {
  if (std::isnan(stat)) {
    return TEST_FAILED;
  }
  if (stat <= MIN_Z) {
    return test_result_t {
      std::numeric_limits<double>::min(),
      log10p_normal(stat, two_sided)
    };
  } else if (-stat <= MIN_Z) {
    return test_result_t {
      1-std::numeric_limits<double>::min(),
      log10p_normal(stat, two_sided)
    };
  } else {
    double pval = cdf(boost::math::normal(), stat);
    test_result_t result {pval, log10(pval)};
    if (two_sided) {
      result.pval = min(1.0, 2*result.pval);
      result.log10p = min(0.0, result.log10p + log10(2));
    }
    return result;
  }
}

// log of P(X <= m) for X ~ Binomial(n, prob), summed on the log scale
double log_binomial_lower_tail(const int& m, const int& n, const double& prob) {
  double log_max = -std::numeric_limits<double>::infinity();
  vector<double> log_terms;
  for (int j = 0; j <= m; ++j) {
    double lt = boost::math::lgamma(n + 1.0)
                - boost::math::lgamma(j + 1.0)
                - boost::math::lgamma(n - j + 1.0)
                + j*log(prob) + (n - j)*log1p(-prob);
    log_terms.push_back(lt);
    log_max = max(log_max, lt);
  }
  double s = 0;
  for (const double& lt : log_terms) {
    s += exp(lt - log_max);
  }
  return log_max + log(s);
}

test_result_t binomial_two_sided(const int& k, const int& n, const double& prob) {
  if (n < 0 || k < 0 || k > n) {
    throw std::invalid_argument("invalid binomial test: " + std::to_string(k) + " of " + std::to_string(n));
  }
  if (n == 0) {
    return test_result_t {1, 0};
  }

  boost::math::binomial_distribution<double> binom(n, prob);
  double expected = n*prob;
  double pval;
  if (k <= expected) {
    pval = 2*cdf(binom, k);
  } else {
    pval = 2*cdf(complement(binom, k - 1));
  }

  if (pval >= 1) {
    return test_result_t {1, 0};
  } else if (pval >= std::numeric_limits<double>::min()) {
    return test_result_t {pval, log10(pval)};
  }

  // the distribution is symmetric for the default prob of 0.5, which is the
  // only case where the tail can underflow in practice
  int m = k <= expected ? k : n - k;
  double log10p = (log_binomial_lower_tail(m, n, min(prob, 1 - prob)) + log(2)) / log(10);
  return test_result_t {std::numeric_limits<double>::min(), log10p};
}

double abs_z_from_log10p_two_sided(const double& log10p) {
  if (log10p >= 0) {
    return 0;
  } else if (log10p < log10(std::numeric_limits<double>::min())) {
    return sqrt(get_chisq_stat_from_logp(log10p));
  } else {
    return boost::math::quantile(complement(boost::math::normal(), pow(10, log10p)/2));
  }
}

double stouffers_z(const vector<double>& log10_pvals,
                   const vector<double>& weights,
                   const vector<double>& signs) {
  if (log10_pvals.size() != weights.size() || log10_pvals.size() != signs.size()) {
    throw std::invalid_argument("stouffers_z: p-values, weights and signs differ in length");
  }
  if (log10_pvals.size() == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  double numer = 0;
  double denom = 0;
  for (size_t i = 0; i < log10_pvals.size(); ++i) {
    numer += signs[i] * weights[i] * abs_z_from_log10p_two_sided(log10_pvals[i]);
    denom += weights[i] * weights[i];
  }
  return numer / sqrt(denom);
}

}
