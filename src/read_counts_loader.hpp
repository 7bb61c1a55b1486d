#ifndef ASEMETA_READ_COUNTS_LOADER_H
#define ASEMETA_READ_COUNTS_LOADER_H

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
using namespace std;

#include "ase_results.hpp"
#include "io/ase_count_reader.hpp"
#include "io/ref_genotypes.hpp"
#include "sample_map.hpp"

/**
 * Loads ASE count files into an AseResults store with a pool of
 * min(#files, threads) OpenMP workers. Each worker takes the next file from
 * the shared queue, reads all its records and appends the observations that
 * pass the read depth filters and, when a reference panel is set, come from
 * samples heterozygous for the variant.
 *
 * An error in any worker stops the remaining workers from taking new files;
 * load() rethrows the first error after all workers finished.
 */
class ReadCountsLoader {
 public:
  ReadCountsLoader(const vector<string>& input_files,
                   AseResults& results,
                   int threads,
                   int min_total_reads,
                   int min_allele_reads);

  // study sample ids are mapped to reference sample ids before lookup
  void set_sample_map(const SampleMap* sample_map);

  void set_ref_genotypes(const RefGenotypes* ref_genotypes);

  void load();

  int get_n_workers() const;
  int get_n_files_loaded() const { return this->files_loaded.load(); }
  int get_n_samples() const { return this->samples_found.load(); }
  long get_n_observations() const { return this->observations_added.load(); }
  long get_n_filtered() const { return this->observations_filtered.load(); }

  static const int PROGRESS_INTERVAL = 100;

 private:
  void load_file(const string& filepath);

  // false if the record's sample should be skipped
  bool resolve_sample(const string& study_sample, string& sample);

  void count_sample(const string& sample);

  const vector<string> input_files;
  AseResults& results;
  int threads;
  int min_total_reads;
  int min_allele_reads;
  const SampleMap* sample_map;
  const RefGenotypes* ref_genotypes;

  std::atomic<int> files_loaded;
  std::atomic<int> samples_found;
  std::atomic<long> observations_added;
  std::atomic<long> observations_filtered;

  std::mutex samples_mtx;
  unordered_set<string> samples;
  unordered_set<string> skipped_samples;
};

#endif
