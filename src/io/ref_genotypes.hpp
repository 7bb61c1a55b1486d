/* ref_genotypes.hpp
 *
 * Reference genotype panel loaded from a VCF or BCF file with HTSlib.
 *
 * Only biallelic records are kept. For every variant the panel stores which
 * samples are heterozygous, which is all ingestion needs to decide whether
 * a sample's read counts at a variant are informative for ASE.
 *
 * The panel is read-only after load and can be queried from several
 * ingestion workers at once.
 */

#ifndef ASEMETA_REF_GENOTYPES_H
#define ASEMETA_REF_GENOTYPES_H

#include <string>
#include <unordered_map>
#include <vector>
using namespace std;

#include "../variant_key.hpp"

class RefGenotypes {
 public:
  RefGenotypes();

  void load(const string& filepath);

  bool loaded() const { return this->is_loaded; }

  bool has_sample(const string& sample) const;

  // true if sample is heterozygous for the two alleles of key, in either order
  bool is_heterozygous(const VariantKey& key, const string& sample) const;

  size_t n_variants() const { return this->het_samples.size(); }

  size_t n_samples() const { return this->sample_idx.size(); }

 private:
  string filepath;
  bool is_loaded;
  unordered_map<string, int> sample_idx;
  unordered_map<VariantKey, vector<bool>, VariantKeyHash> het_samples;
};

#endif
