#ifndef ASEMETA_ASE_RESULTS_H
#define ASEMETA_ASE_RESULTS_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
using namespace std;

#include "ase_variant.hpp"
#include "variant_key.hpp"

/**
 * Variant keyed collection of AseVariant aggregates shared by all ingestion
 * workers.
 *
 * The key space is split over a fixed number of shards, each guarded by its
 * own mutex, so get_or_create is atomic per key: workers racing on an unseen
 * key all receive the same aggregate. Appends are synchronized by the
 * aggregate itself.
 *
 * size, variants and remove_where must not run concurrently with ingestion.
 */
class AseResults {
 public:
  AseResults();

  shared_ptr<AseVariant> get_or_create(const VariantKey& key);

  void add_observation(const VariantKey& key,
                       const string& variant_id,
                       const sample_observation_t& observation);

  size_t size() const;

  // deletes every variant for which remove returns true, returns the number removed
  size_t remove_where(const std::function<bool(const AseVariant&)>& remove);

  vector<shared_ptr<AseVariant> > variants() const;

  bool encountered_base_quality() const { return this->base_quality_seen.load(); }

  static constexpr size_t N_SHARDS = 64;

 private:
  typedef unordered_map<VariantKey, shared_ptr<AseVariant>, VariantKeyHash> shard_map_t;

  struct shard_t {
    mutable std::mutex mtx;
    shard_map_t variants;
  };

  shard_t& get_shard(const VariantKey& key);

  VariantKeyHash hasher;
  vector<shard_t> shards;
  std::atomic<bool> base_quality_seen;
};

#endif
