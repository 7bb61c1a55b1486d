#include "ref_genotypes.hpp"

#include <cstdlib>
#include <stdexcept>

#include <htslib/hts.h>
#include <htslib/hts_log.h>
#include <htslib/vcf.h>

#include "../logging.hpp"

RefGenotypes::RefGenotypes()
  : filepath("")
  , is_loaded(false) { }

void RefGenotypes::load(const string& filepath) {
  hts_set_log_level(HTS_LOG_OFF);
  this->sample_idx.clear();
  this->het_samples.clear();
  this->is_loaded = false;

  htsFile* fp = hts_open(filepath.c_str(), "r");
  if (fp == NULL) {
    throw runtime_error("failed to open reference genotypes " + filepath);
  }
  bcf_hdr_t* hdr = bcf_hdr_read(fp);
  if (hdr == NULL) {
    hts_close(fp);
    throw runtime_error("failed to read VCF header from " + filepath);
  }

  int nsamples = bcf_hdr_nsamples(hdr);
  for (int i = 0; i < nsamples; ++i) {
    this->sample_idx[hdr->samples[i]] = i;
  }

  bcf1_t* rec = bcf_init();
  int32_t* gt = NULL;
  int gt_arr_size = 0;
  int skipped_multiallelic = 0;
  int ret;
  while ((ret = bcf_read(fp, hdr, rec)) == 0) {
    bcf_unpack(rec, BCF_UN_STR);
    if (rec->n_allele != 2) {
      ++skipped_multiallelic;
      continue;
    }

    int ngt = bcf_get_genotypes(hdr, rec, &gt, &gt_arr_size);
    if (ngt <= 0 || nsamples == 0) {
      continue;
    }
    int ploidy = ngt / nsamples;

    vector<bool> hets(nsamples, false);
    for (int s = 0; s < nsamples && ploidy >= 2; ++s) {
      int32_t* sample_gt = gt + s*ploidy;
      if (bcf_gt_is_missing(sample_gt[0])
          || sample_gt[1] == bcf_int32_vector_end
          || bcf_gt_is_missing(sample_gt[1])) {
        continue;
      }
      hets[s] = bcf_gt_allele(sample_gt[0]) != bcf_gt_allele(sample_gt[1]);
    }

    VariantKey key {
      bcf_hdr_id2name(hdr, rec->rid),
      (int)rec->pos + 1,
      rec->d.allele[0],
      rec->d.allele[1]
    };
    this->het_samples[key] = hets;
  }

  free(gt);
  bcf_destroy(rec);
  bcf_hdr_destroy(hdr);
  hts_close(fp);

  if (ret < -1) {
    throw runtime_error("error reading reference genotypes from " + filepath);
  }
  if (skipped_multiallelic > 0) {
    log_debug("skipped " + to_string(skipped_multiallelic) + " multiallelic reference variants");
  }
  this->filepath = filepath;
  this->is_loaded = true;
}

bool RefGenotypes::has_sample(const string& sample) const {
  return this->sample_idx.count(sample) > 0;
}

bool RefGenotypes::is_heterozygous(const VariantKey& key, const string& sample) const {
  auto sample_it = this->sample_idx.find(sample);
  if (sample_it == this->sample_idx.end()) {
    return false;
  }

  auto it = this->het_samples.find(key);
  if (it == this->het_samples.end()) {
    VariantKey swapped {key.chr, key.pos, key.alt, key.ref};
    it = this->het_samples.find(swapped);
    if (it == this->het_samples.end()) {
      return false;
    }
  }
  return it->second[sample_it->second];
}
