#ifndef ASEMETA_SIGNIFICANCE_RANKER_H
#define ASEMETA_SIGNIFICANCE_RANKER_H

#include <cstddef>

#include "enums.hpp"

const double DEFAULT_SIGNIFICANCE = 0.05;

// p-value cutoff of the variant at 0-based rank among n_tests variants
double correction_cutoff(const correction_method_e& method,
                         const size_t& rank,
                         const size_t& n_tests,
                         const double& significance);

/**
 * Walks variants sorted by descending |Z| and decides which prefix is
 * significant under a multiple testing correction.
 *
 * The scan stops at the first variant whose p-value exceeds its cutoff, for
 * HOLM and BH too even though their cutoffs grow with rank. A variant with a
 * larger |Z| than its predecessor raises an AseException.
 */
class SignificanceRanker {
 public:
  SignificanceRanker(correction_method_e method,
                     size_t n_tests,
                     double significance = DEFAULT_SIGNIFICANCE);

  // true if the variant is retained; false from the first failure onwards
  bool accept(const double& meta_zscore, const double& meta_pvalue);

  bool stopped() const { return this->is_stopped; }

  size_t get_n_accepted() const { return this->rank; }

  correction_method_e get_method() const { return this->method; }

 private:
  correction_method_e method;
  size_t n_tests;
  double significance;
  double last_abs_z;
  size_t rank;
  bool is_stopped;
};

#endif
