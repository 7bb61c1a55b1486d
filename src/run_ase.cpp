#include "run_ase.hpp"

#include <algorithm>
#include <unordered_set>

#include <boost/filesystem.hpp>

#include "ase_results.hpp"
#include "io/ase_writer.hpp"
#include "io/gtf_reader.hpp"
#include "io/ref_genotypes.hpp"
#include "logging.hpp"
#include "meta/ase_meta_analyzer.hpp"
#include "read_counts_loader.hpp"
#include "sample_map.hpp"
#include "significance_ranker.hpp"
#include "util.hpp"

string ase_results_filename(const correction_method_e& method) {
  if (method == NONE) {
    return "ase.txt";
  }
  return "ase_" + util::correction_method_to_string(method) + ".txt";
}

size_t write_ranked_results(const string& filepath,
                            const vector<shared_ptr<AseVariant> >& variants,
                            const GeneIntervalIndex* index,
                            const correction_method_e& method,
                            const bool& write_base_quality) {
  AseWriter out(filepath, index != nullptr, write_base_quality);
  out.writeheader();

  SignificanceRanker ranker(method, variants.size());
  for (const shared_ptr<AseVariant>& variant : variants) {
    if (!ranker.accept(variant->get_meta_zscore(), variant->get_meta_pvalue())) {
      break;
    }
    string genes = "";
    if (index != nullptr) {
      genes = index->get_genes_field(variant->get_chr(), variant->get_pos());
    }
    out.writerec(*variant, genes);
  }

  out.commit();
  return ranker.get_n_accepted();
}

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
             const vector<correction_method_e>& corrections) {
  RefGenotypes ref_genotypes;
  SampleMap sample_map;
  if (ref_vcf_file != "") {
    ref_genotypes.load(ref_vcf_file);
    log_info("Loading reference data complete: " + format_count(ref_genotypes.n_variants())
             + " variants, " + format_count(ref_genotypes.n_samples()) + " samples");

    if (sample_map_file != "") {
      sample_map.load(sample_map_file);
      log_info("Found " + format_count(sample_map.size()) + " sample mappings");
    }
  }

  AseResults results;
  ReadCountsLoader loader(input_files, results, threads, min_total_reads, min_allele_reads);
  if (ref_genotypes.loaded()) {
    loader.set_ref_genotypes(&ref_genotypes);
  }
  if (sample_map.loaded()) {
    loader.set_sample_map(&sample_map);
  }
  loader.load();

  log_info("Loading files complete. Detected " + format_count(loader.get_n_samples()) + " samples.");
  log_debug(format_count(loader.get_n_observations()) + " observations added, "
            + format_count(loader.get_n_filtered()) + " filtered");

  size_t removed = results.remove_where([&min_samples](const AseVariant& v) {
    return v.get_sample_count() < min_samples;
  });
  log_debug("removed " + format_count(removed) + " variants observed in fewer than "
            + to_string(min_samples) + " samples");

  AseMetaAnalyzer meta(weighted);
  vector<shared_ptr<AseVariant> > variants = results.variants();
  for (shared_ptr<AseVariant>& variant : variants) {
    variant->calculate_statistics(meta);
  }
  std::stable_sort(variants.begin(), variants.end(),
    [](const shared_ptr<AseVariant>& a, const shared_ptr<AseVariant>& b) {
      return more_significant(*a, *b);
    }
  );
  log_info("Performed " + format_count(variants.size()) + " tests");

  unique_ptr<GeneIntervalIndex> index;
  if (gtf_file != "") {
    log_info("Started loading GTF file.");
    GtfReader gtf_reader(gtf_file);
    if (gtf_features.size() > 0) {
      gtf_reader.set_feature_types(unordered_set<string>(gtf_features.begin(), gtf_features.end()));
    }
    index = make_unique<GeneIntervalIndex>(gtf_reader.read_index());
    log_info("Loaded " + format_count(index->size()) + " annotations from GTF file.");
  }

  bool write_base_quality = results.encountered_base_quality();
  for (const correction_method_e& method : corrections) {
    string filepath = (boost::filesystem::path(out_dir) / ase_results_filename(method)).string();
    size_t written = write_ranked_results(filepath, variants, index.get(), method, write_base_quality);

    if (method == NONE) {
      log_info("Completed writing all " + format_count(written) + " ASE variants");
    } else {
      log_info("Completed writing " + format_count(written) + " "
               + util::correction_method_to_string(method) + " significant ASE variants");
    }
  }

  log_info("Program completed");
}
