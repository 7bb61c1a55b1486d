#ifndef ASEMETA_PARAMETER_CHECKS_H
#define ASEMETA_PARAMETER_CHECKS_H

#include <string>
#include <vector>
using namespace std;

#include "enums.hpp"
#include "logging.hpp"

namespace parameter_checks {

  void check_file_exists(string filename);

  void check_input_files(vector<string> input_files);

  void check_threads(int threads);

  void check_min_samples(int min_samples);

  void check_read_filters(int min_total_reads, int min_allele_reads);

  correction_method_e check_correction_method(string method);

  vector<correction_method_e> check_correction_methods(const vector<string>& methods);

  void check_sample_map(const string& sample_map_file, const string& ref_vcf_file);
}

#endif
