#include "ase_results.hpp"

AseResults::AseResults()
  : shards(N_SHARDS)
  , base_quality_seen(false) { }

AseResults::shard_t& AseResults::get_shard(const VariantKey& key) {
  return this->shards[this->hasher(key) % N_SHARDS];
}

shared_ptr<AseVariant> AseResults::get_or_create(const VariantKey& key) {
  shard_t& shard = this->get_shard(key);
  std::lock_guard<std::mutex> lock(shard.mtx);
  auto it = shard.variants.find(key);
  if (it != shard.variants.end()) {
    return it->second;
  }
  shared_ptr<AseVariant> variant = make_shared<AseVariant>(key);
  shard.variants.emplace(key, variant);
  return variant;
}

void AseResults::add_observation(const VariantKey& key,
                                 const string& variant_id,
                                 const sample_observation_t& observation) {
  this->get_or_create(key)->add_observation(observation, variant_id);
  if (observation.has_base_quality()) {
    this->base_quality_seen.store(true);
  }
}

size_t AseResults::size() const {
  size_t n = 0;
  for (const shard_t& shard : this->shards) {
    std::lock_guard<std::mutex> lock(shard.mtx);
    n += shard.variants.size();
  }
  return n;
}

size_t AseResults::remove_where(const std::function<bool(const AseVariant&)>& remove) {
  size_t removed = 0;
  for (shard_t& shard : this->shards) {
    std::lock_guard<std::mutex> lock(shard.mtx);
    for (auto it = shard.variants.begin(); it != shard.variants.end(); ) {
      if (remove(*it->second)) {
        it = shard.variants.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  return removed;
}

vector<shared_ptr<AseVariant> > AseResults::variants() const {
  vector<shared_ptr<AseVariant> > all;
  all.reserve(this->size());
  for (const shard_t& shard : this->shards) {
    std::lock_guard<std::mutex> lock(shard.mtx);
    for (const auto& entry : shard.variants) {
      all.push_back(entry.second);
    }
  }
  return all;
}
