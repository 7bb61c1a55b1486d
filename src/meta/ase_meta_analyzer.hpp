#ifndef ASEMETA_ASE_META_ANALYZER_H
#define ASEMETA_ASE_META_ANALYZER_H

#include <vector>
using namespace std;

#include "../variant_key.hpp"

struct ase_meta_result_t {
  double count_pearson_r;
  double meta_zscore;
  double meta_pvalue;
  double meta_log10p;
};

/**
 * Combines per-sample allelic imbalance evidence of one variant.
 *
 * Each sample is tested with an exact two-sided binomial test of its ref
 * count against ref + alt reads (p = 0.5). The p-value is converted to a Z
 * score that is positive when the ref allele is over-represented. Sample Z
 * scores are combined with Stouffer's method and the meta p-value is the
 * two-sided normal p-value of the combined Z.
 *
 * The result depends only on the multiset of observations: callers pass
 * observations in canonical order so floating point sums are reproducible.
 */
class AseMetaAnalyzer {
 public:
  AseMetaAnalyzer();
  AseMetaAnalyzer(bool weight_by_depth);

  ase_meta_result_t meta_analyze(const vector<sample_observation_t>& observations) const;

  // signed per-sample Z score
  double sample_zscore(const int& ref_count, const int& alt_count) const;

 private:
  bool weight_by_depth;
};

#endif
