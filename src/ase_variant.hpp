#ifndef ASEMETA_ASE_VARIANT_H
#define ASEMETA_ASE_VARIANT_H

#include <mutex>
#include <string>
#include <vector>
using namespace std;

#include "meta/ase_meta_analyzer.hpp"
#include "variant_key.hpp"

/**
 * Per-variant accumulator of sample observations.
 *
 * Observations may be appended concurrently from several ingestion workers.
 * After ingestion, calculate_statistics is called exactly once from a single
 * thread; it sorts the observations into canonical order (sample id, then
 * counts) and fixes the derived statistics. Derived statistics are not
 * available before that call.
 */
class AseVariant {
 public:
  AseVariant(const VariantKey& key);

  void add_observation(const sample_observation_t& observation, const string& variant_id = "");

  void calculate_statistics(const AseMetaAnalyzer& meta);

  bool statistics_calculated() const { return this->stats_calculated; }

  const VariantKey& get_key() const { return this->key; }
  const string& get_chr() const { return this->key.chr; }
  int get_pos() const { return this->key.pos; }
  const string& get_ref() const { return this->key.ref; }
  const string& get_alt() const { return this->key.alt; }

  // empty when no input record carried an identifier
  string get_id() const;

  int get_sample_count() const;

  // only safe once ingestion has finished
  const vector<sample_observation_t>& get_observations() const { return this->observations; }

  double get_meta_zscore() const;
  double get_meta_pvalue() const;
  double get_count_pearson_r() const;

 private:
  void check_statistics_calculated() const;

  const VariantKey key;
  string id;
  vector<sample_observation_t> observations;
  mutable std::mutex mtx;

  bool stats_calculated;
  double count_pearson_r;
  double meta_zscore;
  double meta_pvalue;
};

// true if a ranks before b: larger |Z| first, ties by variant key
bool more_significant(const AseVariant& a, const AseVariant& b);

#endif
