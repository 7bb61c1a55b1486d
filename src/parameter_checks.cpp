#include "parameter_checks.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>

#include "util.hpp"

namespace parameter_checks {
  void check_file_exists(string filename) {
    if (!util::file_exists(filename)) {
      log_error(filename + " does not exist", 1);
    }
  }

  void check_input_files(vector<string> input_files) {
    if (input_files.size() == 0) {
      log_error("no input files: set --input or --input-list", 1);
    }
    for (const string& file : input_files) {
      check_file_exists(file);
    }
  }

  void check_threads(int threads) {
    if (threads < 1) {
      log_error("--threads must be >= 1", 1);
    }
  }

  void check_min_samples(int min_samples) {
    if (min_samples < 1) {
      log_error("--min-samples must be >= 1", 1);
    }
  }

  void check_read_filters(int min_total_reads, int min_allele_reads) {
    if (min_total_reads < 0) {
      log_error("--min-total-reads must be >= 0", 1);
    }
    if (min_allele_reads < 0) {
      log_error("--min-allele-reads must be >= 0", 1);
    }
  }

  correction_method_e check_correction_method(string method) {
    boost::algorithm::to_lower(method);
    if (method == "none") {
      return NONE;
    } else if (method == "nominal") {
      return NOMINAL;
    } else if (method == "bonferroni") {
      return BONFERRONI;
    } else if (method == "holm") {
      return HOLM;
    } else if (method == "bh") {
      return BH;
    } else {
      log_error("correction must be one of none, nominal, bonferroni, holm or bh, found: " + method, 1);
    }
    return NONE;
  }

  vector<correction_method_e> check_correction_methods(const vector<string>& methods) {
    // the uncorrected table is always written first
    vector<correction_method_e> corrections = {NONE};
    for (const string& method : methods) {
      correction_method_e correction = check_correction_method(method);
      if (std::find(corrections.begin(), corrections.end(), correction) == corrections.end()) {
        corrections.push_back(correction);
      }
    }
    return corrections;
  }

  void check_sample_map(const string& sample_map_file, const string& ref_vcf_file) {
    if (sample_map_file != "" && ref_vcf_file == "") {
      log_error("--sample-map requires --ref-vcf to be set", 1);
    }
    if (sample_map_file != "") {
      check_file_exists(sample_map_file);
    }
  }
}
