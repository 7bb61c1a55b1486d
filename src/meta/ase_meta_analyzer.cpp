#include "ase_meta_analyzer.hpp"

#include <cmath>

#include <Eigen/Dense>
using Eigen::VectorXd;

#include "../ase_exception.hpp"
#include "../stat/misc.hpp"
#include "../stat/tests.hpp"

AseMetaAnalyzer::AseMetaAnalyzer()
  : weight_by_depth(false) { }

AseMetaAnalyzer::AseMetaAnalyzer(bool weight_by_depth)
  : weight_by_depth(weight_by_depth) { }

double AseMetaAnalyzer::sample_zscore(const int& ref_count, const int& alt_count) const {
  if (ref_count == alt_count) {
    return 0;
  }
  stat::tests::test_result_t res = stat::tests::binomial_two_sided(ref_count, ref_count + alt_count);
  double abs_z = stat::tests::abs_z_from_log10p_two_sided(res.log10p);
  return ref_count > alt_count ? abs_z : -abs_z;
}

ase_meta_result_t AseMetaAnalyzer::meta_analyze(const vector<sample_observation_t>& observations) const {
  size_t n = observations.size();
  VectorXd ref_counts(n);
  VectorXd alt_counts(n);
  vector<double> log10_pvals;
  vector<double> weights;
  vector<double> signs;
  for (size_t i = 0; i < n; ++i) {
    const sample_observation_t& obs = observations[i];
    ref_counts(i) = obs.ref_count;
    alt_counts(i) = obs.alt_count;

    int total = obs.ref_count + obs.alt_count;
    stat::tests::test_result_t res = stat::tests::binomial_two_sided(obs.ref_count, total);
    log10_pvals.push_back(res.log10p);
    weights.push_back(this->weight_by_depth ? sqrt((double)total) : 1.0);
    if (obs.ref_count > obs.alt_count) {
      signs.push_back(1.0);
    } else if (obs.ref_count < obs.alt_count) {
      signs.push_back(-1.0);
    } else {
      signs.push_back(0.0);
    }
  }

  ase_meta_result_t result;
  result.count_pearson_r = stat::misc::pearson_correlation(ref_counts, alt_counts);
  double total_weight = 0;
  for (const double& w : weights) {
    total_weight += w;
  }
  // no reads to weigh: report no imbalance
  if (n == 0 || total_weight == 0) {
    result.meta_zscore = 0;
    result.meta_pvalue = 1;
    result.meta_log10p = 0;
    return result;
  }

  result.meta_zscore = stat::tests::stouffers_z(log10_pvals, weights, signs);
  stat::tests::test_result_t meta = stat::tests::normal(-std::abs(result.meta_zscore), true);
  if (meta == stat::tests::TEST_FAILED) {
    throw AseException("meta-analysis failed: undefined meta Z-score");
  }
  result.meta_pvalue = meta.pval;
  result.meta_log10p = meta.log10p;
  return result;
}
