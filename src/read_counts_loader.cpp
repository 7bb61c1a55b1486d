#include "read_counts_loader.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <omp.h>

#include "logging.hpp"

ReadCountsLoader::ReadCountsLoader(const vector<string>& input_files,
                                   AseResults& results,
                                   int threads,
                                   int min_total_reads,
                                   int min_allele_reads)
  : input_files(input_files)
  , results(results)
  , threads(threads)
  , min_total_reads(min_total_reads)
  , min_allele_reads(min_allele_reads)
  , sample_map(nullptr)
  , ref_genotypes(nullptr)
  , files_loaded(0)
  , samples_found(0)
  , observations_added(0)
  , observations_filtered(0) { }

void ReadCountsLoader::set_sample_map(const SampleMap* sample_map) {
  this->sample_map = sample_map;
}

void ReadCountsLoader::set_ref_genotypes(const RefGenotypes* ref_genotypes) {
  this->ref_genotypes = ref_genotypes;
}

int ReadCountsLoader::get_n_workers() const {
  return std::max(1, std::min((int)this->input_files.size(), this->threads));
}

void ReadCountsLoader::load() {
  int n_files = this->input_files.size();
  int n_workers = this->get_n_workers();
  log_debug("loading " + to_string(n_files) + " files with " + to_string(n_workers) + " workers");

  std::atomic<bool> failed(false);
  string first_error = "";

  #pragma omp parallel for schedule(dynamic, 1) num_threads(n_workers)
  for (int i = 0; i < n_files; ++i) {
    if (failed.load()) {
      continue;
    }

    bool file_ok = true;
    try {
      this->load_file(this->input_files[i]);
    } catch (const std::exception& e) {
      file_ok = false;
      #pragma omp critical(read_counts_loader_error)
      {
        if (!failed.load()) {
          first_error = "while loading " + this->input_files[i] + ": " + e.what();
          failed.store(true);
        }
      }
    }

    if (file_ok) {
      int loaded = ++this->files_loaded;
      if (loaded % PROGRESS_INTERVAL == 0) {
        log_info("Loaded " + format_count(loaded) + " out of " + format_count(n_files) + " files");
      }
    }
  }

  if (failed.load()) {
    throw runtime_error(first_error);
  }
}

void ReadCountsLoader::load_file(const string& filepath) {
  log_debug("thread " + to_string(omp_get_thread_num()) + " loading " + filepath);

  AseCountReader reader(filepath);
  ase_count_record_t rec;
  string sample;
  while (!reader.eof()) {
    rec = reader.readrec();

    if (!this->resolve_sample(rec.observation.sample_id, sample)) {
      continue;
    }
    this->count_sample(sample);

    int ref_count = rec.observation.ref_count;
    int alt_count = rec.observation.alt_count;
    if (ref_count + alt_count < this->min_total_reads
        || std::min(ref_count, alt_count) < this->min_allele_reads) {
      ++this->observations_filtered;
      continue;
    }

    if (this->ref_genotypes != nullptr && !this->ref_genotypes->is_heterozygous(rec.key, sample)) {
      ++this->observations_filtered;
      continue;
    }

    rec.observation.sample_id = sample;
    this->results.add_observation(rec.key, rec.snp_id, rec.observation);
    ++this->observations_added;
  }
}

bool ReadCountsLoader::resolve_sample(const string& study_sample, string& sample) {
  string reason = "";
  if (this->sample_map != nullptr) {
    if (this->sample_map->contains(study_sample)) {
      sample = this->sample_map->get_ref_sample(study_sample);
    } else {
      reason = "has no entry in the sample mapping";
    }
  } else {
    sample = study_sample;
  }

  if (reason == "" && this->ref_genotypes != nullptr && !this->ref_genotypes->has_sample(sample)) {
    reason = "is not in the reference genotypes";
  }
  if (reason == "") {
    return true;
  }

  std::lock_guard<std::mutex> lock(this->samples_mtx);
  if (this->skipped_samples.insert(study_sample).second) {
    log_warning("skipping sample " + study_sample + ": sample " + reason);
  }
  return false;
}

void ReadCountsLoader::count_sample(const string& sample) {
  std::lock_guard<std::mutex> lock(this->samples_mtx);
  if (this->samples.insert(sample).second) {
    ++this->samples_found;
  }
}
