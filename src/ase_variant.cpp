#include "ase_variant.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "ase_exception.hpp"
#include "util.hpp"

AseVariant::AseVariant(const VariantKey& key)
  : key(key)
  , id("")
  , stats_calculated(false)
  , count_pearson_r(0)
  , meta_zscore(0)
  , meta_pvalue(1) { }

void AseVariant::add_observation(const sample_observation_t& observation, const string& variant_id) {
  std::lock_guard<std::mutex> lock(this->mtx);
  if (this->stats_calculated) {
    throw AseException("observation added to finalized variant " + this->key.to_string());
  }
  this->observations.push_back(observation);
  if (this->id == "" && !util::is_missing(variant_id)) {
    this->id = variant_id;
  }
}

void AseVariant::calculate_statistics(const AseMetaAnalyzer& meta) {
  std::lock_guard<std::mutex> lock(this->mtx);
  if (this->stats_calculated) {
    throw AseException("statistics already calculated for " + this->key.to_string());
  }

  std::stable_sort(
    this->observations.begin(),
    this->observations.end(),
    [](const sample_observation_t& a, const sample_observation_t& b) {
      return std::tie(a.sample_id, a.ref_count, a.alt_count)
             < std::tie(b.sample_id, b.ref_count, b.alt_count);
    }
  );

  ase_meta_result_t result = meta.meta_analyze(this->observations);
  this->count_pearson_r = result.count_pearson_r;
  this->meta_zscore = result.meta_zscore;
  this->meta_pvalue = result.meta_pvalue;
  this->stats_calculated = true;
}

string AseVariant::get_id() const {
  std::lock_guard<std::mutex> lock(this->mtx);
  return this->id;
}

int AseVariant::get_sample_count() const {
  std::lock_guard<std::mutex> lock(this->mtx);
  return this->observations.size();
}

void AseVariant::check_statistics_calculated() const {
  if (!this->stats_calculated) {
    throw AseException("statistics not calculated for " + this->key.to_string());
  }
}

double AseVariant::get_meta_zscore() const {
  this->check_statistics_calculated();
  return this->meta_zscore;
}

double AseVariant::get_meta_pvalue() const {
  this->check_statistics_calculated();
  return this->meta_pvalue;
}

double AseVariant::get_count_pearson_r() const {
  this->check_statistics_calculated();
  return this->count_pearson_r;
}

bool more_significant(const AseVariant& a, const AseVariant& b) {
  double abs_za = std::abs(a.get_meta_zscore());
  double abs_zb = std::abs(b.get_meta_zscore());
  // undefined scores rank last
  if (std::isnan(abs_za) || std::isnan(abs_zb)) {
    if (std::isnan(abs_za) != std::isnan(abs_zb)) {
      return std::isnan(abs_zb);
    }
    return a.get_key() < b.get_key();
  }
  if (abs_za != abs_zb) {
    return abs_za > abs_zb;
  }
  return a.get_key() < b.get_key();
}
