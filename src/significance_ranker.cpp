#include "significance_ranker.hpp"

#include <cmath>
#include <limits>

#include "ase_exception.hpp"
#include "util.hpp"

double correction_cutoff(const correction_method_e& method,
                         const size_t& rank,
                         const size_t& n_tests,
                         const double& significance) {
  switch (method) {
    case NONE:
      return std::numeric_limits<double>::infinity();
    case NOMINAL:
      return significance;
    case BONFERRONI:
      return significance / n_tests;
    case HOLM:
      return significance / (n_tests - rank);
    case BH:
      return ((rank + 1.0) / n_tests) * significance;
  }
  throw AseException("multiple testing method " + std::to_string((int)method) + " is not supported");
}

SignificanceRanker::SignificanceRanker(correction_method_e method,
                                       size_t n_tests,
                                       double significance)
  : method(method)
  , n_tests(n_tests)
  , significance(significance)
  , last_abs_z(std::numeric_limits<double>::infinity())
  , rank(0)
  , is_stopped(false) {
  // fail on an invalid method before any row is written
  correction_cutoff(method, 0, n_tests > 0 ? n_tests : 1, significance);
}

bool SignificanceRanker::accept(const double& meta_zscore, const double& meta_pvalue) {
  if (this->is_stopped) {
    return false;
  }

  double abs_z = std::abs(meta_zscore);
  if (std::isnan(abs_z) || std::isnan(meta_pvalue) || meta_pvalue < 0) {
    throw AseException("undefined meta-analysis result in ranked ASE results");
  }
  if (abs_z > this->last_abs_z) {
    throw AseException("ASE results not sorted");
  }
  this->last_abs_z = abs_z;

  if (this->rank >= this->n_tests) {
    throw AseException(
      "more variants ranked than the " + std::to_string(this->n_tests) + " tests declared for "
      + util::correction_method_to_string(this->method) + " correction"
    );
  }

  if (meta_pvalue > correction_cutoff(this->method, this->rank, this->n_tests, this->significance)) {
    this->is_stopped = true;
    return false;
  }
  ++this->rank;
  return true;
}
