#ifndef ASEMETA_RUN_ASE_H
#define ASEMETA_RUN_ASE_H

#include <memory>
#include <string>
#include <vector>
using namespace std;

#include "ase_variant.hpp"
#include "enums.hpp"
#include "gene_interval_index.hpp"

// name of the result table for a correction method: ase.txt or ase_<method>.txt
string ase_results_filename(const correction_method_e& method);

/**
 * Writes the variants retained under method to filepath and returns how many
 * were written. variants must be finalized and sorted with more_significant.
 * When index is null the Genes column is left out.
 */
size_t write_ranked_results(const string& filepath,
                            const vector<shared_ptr<AseVariant> >& variants,
                            const GeneIntervalIndex* index,
                            const correction_method_e& method,
                            const bool& write_base_quality);

void run_ase(const vector<string>& input_files,
             const string& out_dir,
             const int& threads,
             const int& min_samples,
             const int& min_total_reads,
             const int& min_allele_reads,
             const bool& weighted,
             const string& gtf_file,
             const vector<string>& gtf_features,
             const string& ref_vcf_file,
             const string& sample_map_file,
             const vector<correction_method_e>& corrections);

#endif
