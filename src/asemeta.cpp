#include <exception>
#include <iostream>
#include <string>
#include <vector>
using namespace std;

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <htslib/hts_log.h>

#include "enums.hpp"
#include "logging.hpp"
#include "parameter_checks.hpp"
namespace pc = parameter_checks;
#include "run_ase.hpp"
#include "util.hpp"

const string LOG_FILE_NAME = "asemeta.log";

void log_options_in_effect(int argc, char* argv[]) {
  string opt_fmt = " ";
  for (int i = 1; i < argc; ++i) {
    string option = argv[i];
    if (opt_fmt != " " && option[0] == '-') {
      opt_fmt += "\n  " + option;
    } else {
      opt_fmt += " " + option;
    }
  }
  log_info("Options in effect:\n" + opt_fmt + "\n");
}

void log_program_info(int argc, char* argv[]) {
  log_info("asemeta " VERSION_NUMBER "\n");
  log_options_in_effect(argc, argv);
}

int main(int argc, char *argv[]) {
  // supress htslib logging
  hts_set_log_level(HTS_LOG_OFF);

  po::options_description opts(R""""(asemeta )"""" VERSION_NUMBER R""""(: allele-specific expression meta-analysis
Distributed under the MIT License.

Usage: asemeta [OPTIONS]

Options (* Mandatory))"""");

  opts.add_options()
    ("input", po::value<vector<string> >()->value_name("FILE1 FILE2 ...")->multitoken(),
      "ASE count files (plain, gzipped or bgzipped).")
    ("input-list", po::value<string>()->value_name("FILE"),
      "File listing ASE count files, one per line.")
    ("out", po::value<string>()->value_name("DIR"),
      "Output folder, created if missing. (*)")
    ("threads", po::value<int>()->value_name("INT")->default_value(1),
      "Number of threads used to load input files.")
    ("min-samples", po::value<int>()->value_name("INT")->default_value(1),
      "Minimum number of samples with reads for a variant to be tested.")
    ("min-total-reads", po::value<int>()->value_name("INT")->default_value(10),
      "Minimum ref + alt reads of a sample at a variant.")
    ("min-allele-reads", po::value<int>()->value_name("INT")->default_value(0),
      "Minimum reads of both the ref and the alt allele of a sample at a variant.")
    ("weighted", "Weight samples by the square root of their read depth.")
    ("gtf", po::value<string>()->value_name("FILE"),
      "GTF file used to annotate variants with overlapping genes.")
    ("gtf-features", po::value<vector<string> >()->value_name("TYPE1 TYPE2 ...")->multitoken(),
      "Only use GTF features of these types (e.g. gene exon).")
    ("ref-vcf", po::value<string>()->value_name("FILE"),
      "VCF/BCF reference genotypes: only use samples heterozygous for a variant.")
    ("sample-map", po::value<string>()->value_name("FILE"),
      "Two column file mapping reference sample ids to study sample ids. Requires --ref-vcf.")
    ("correction", po::value<vector<string> >()
                     ->value_name("METHOD1 METHOD2 ...")
                     ->multitoken()
                     ->default_value(vector<string>{"bonferroni", "holm", "bh"}, "bonferroni holm bh"),
      "Multiple testing corrections to write results for, any of nominal, bonferroni, holm, bh. "
      "Uncorrected results are always written.")
    ("log-level", po::value<string>()->value_name("LEVEL"), "Set logging level.")
    ("help,h", "Print this message and exit.")
    ("version,v", "Print version.");

  if (argc < 2) {
    cerr << opts << endl;
    return 1;
  }

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, opts), vm);
    po::notify(vm);
  } catch (boost::program_options::error& e) {
    cerr << "error: " << e.what() << endl;
    return 1;
  }

  if (vm.count("help")) {
    cerr << opts << endl;
    return 1;
  }
  if (vm.count("version")) {
    cout << VERSION_NUMBER << endl;
    return 0;
  }
  if (!vm.count("out")) {
    cerr << "error: the option '--out' is required but missing" << endl;
    return 1;
  }

  string out_dir = vm["out"].as<string>();
  boost::system::error_code ec;
  boost::filesystem::create_directories(out_dir, ec);
  if (ec) {
    cerr << "error: failed to create output folder " << out_dir << ": " << ec.message() << endl;
    return 1;
  }
  string log_file = (boost::filesystem::path(out_dir) / LOG_FILE_NAME).string();

  if (vm.count("log-level") && vm["log-level"].as<string>() == "debug") {
    init_logging("debug", log_file);
  } else if (vm.count("log-level") && vm["log-level"].as<string>() != "info") {
    cerr << "error: unrecognized --log-level: " + vm["log-level"].as<string>()
         << endl;
    return 1;
  } else {
    init_logging("info", log_file);
  }

  log_program_info(argc, argv);

  try {
    vector<string> input_files;
    if (vm.count("input")) {
      input_files = vm["input"].as<vector<string> >();
    }
    if (vm.count("input-list")) {
      pc::check_file_exists(vm["input-list"].as<string>());
      vector<string> listed = util::read_file_list(vm["input-list"].as<string>());
      input_files.insert(input_files.end(), listed.begin(), listed.end());
    }
    pc::check_input_files(input_files);

    int threads = vm["threads"].as<int>();
    int min_samples = vm["min-samples"].as<int>();
    int min_total_reads = vm["min-total-reads"].as<int>();
    int min_allele_reads = vm["min-allele-reads"].as<int>();
    pc::check_threads(threads);
    pc::check_min_samples(min_samples);
    pc::check_read_filters(min_total_reads, min_allele_reads);

    bool weighted = false;
    if (vm.count("weighted") > 0) {
      weighted = true;
    }

    string gtf_file = "";
    if (vm.count("gtf") > 0) {
      gtf_file = vm["gtf"].as<string>();
      pc::check_file_exists(gtf_file);
    }
    vector<string> gtf_features;
    if (vm.count("gtf-features") > 0) {
      if (gtf_file == "") {
        log_error("--gtf-features requires --gtf to be set", 1);
      }
      gtf_features = vm["gtf-features"].as<vector<string> >();
    }

    string ref_vcf_file = "";
    if (vm.count("ref-vcf") > 0) {
      ref_vcf_file = vm["ref-vcf"].as<string>();
      pc::check_file_exists(ref_vcf_file);
    }
    string sample_map_file = "";
    if (vm.count("sample-map") > 0) {
      sample_map_file = vm["sample-map"].as<string>();
    }
    pc::check_sample_map(sample_map_file, ref_vcf_file);

    vector<correction_method_e> corrections = pc::check_correction_methods(
      vm["correction"].as<vector<string> >()
    );

    log_info("Processing " + format_count(input_files.size()) + " input files with "
             + to_string(threads) + " threads");

    run_ase(
      input_files,
      out_dir,
      threads,
      min_samples,
      min_total_reads,
      min_allele_reads,
      weighted,
      gtf_file,
      gtf_features,
      ref_vcf_file,
      sample_map_file,
      corrections
    );
  } catch (const std::exception& e) {
    log_error(e.what(), 1);
  }

  return 0;
}
