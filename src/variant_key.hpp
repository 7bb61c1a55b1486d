#ifndef ASEMETA_VARIANT_KEY_H
#define ASEMETA_VARIANT_KEY_H

#include <cmath>
#include <limits>
#include <string>
#include <tuple>

#include <boost/functional/hash.hpp>

/**
 * Identity of a variant: two records describe the same variant iff
 * chromosome, position and both alleles match.
 */
struct VariantKey {
  std::string chr;
  int pos;
  std::string ref;
  std::string alt;

  bool operator==(const VariantKey& other) const {
    return this->pos == other.pos
           && this->chr == other.chr
           && this->ref == other.ref
           && this->alt == other.alt;
  }

  bool operator!=(const VariantKey& other) const {
    return !this->operator==(other);
  }

  bool operator<(const VariantKey& other) const {
    return std::tie(this->chr, this->pos, this->ref, this->alt)
           < std::tie(other.chr, other.pos, other.ref, other.alt);
  }

  std::string to_string() const {
    return this->chr + ":" + std::to_string(this->pos) + ":" + this->ref + ":" + this->alt;
  }
};

struct VariantKeyHash {
  size_t operator()(const VariantKey& key) const {
    size_t seed = 0;
    boost::hash_combine(seed, key.chr);
    boost::hash_combine(seed, key.pos);
    boost::hash_combine(seed, key.ref);
    boost::hash_combine(seed, key.alt);
    return seed;
  }
};

const double BASE_QUALITY_NA = std::numeric_limits<double>::quiet_NaN();

// One sample's read counts at one variant.
struct sample_observation_t {
  std::string sample_id;
  int ref_count;
  int alt_count;
  double ref_mean_base_quality;
  double alt_mean_base_quality;

  bool has_base_quality() const {
    return !std::isnan(this->ref_mean_base_quality) || !std::isnan(this->alt_mean_base_quality);
  }
};

#endif
