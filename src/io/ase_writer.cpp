#include "ase_writer.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

#include "../logging.hpp"
#include "../util.hpp"

AseWriter::AseWriter(const string& filepath, bool write_genes, bool write_base_quality)
  : filepath(filepath)
  , tmp_filepath(filepath + ".tmp")
  , write_genes(write_genes)
  , write_base_quality(write_base_quality)
  , bgzf(nullptr)
  , committed(false) {
  string mode = boost::algorithm::ends_with(filepath, ".gz") ? "w" : "wu";
  this->bgzf = bgzf_open(this->tmp_filepath.c_str(), mode.c_str());
  if (this->bgzf == NULL) {
    throw runtime_error("unable to create output file at " + this->tmp_filepath);
  }
}

AseWriter::~AseWriter() {
  if (!this->committed) {
    this->discard();
  }
}

void AseWriter::discard() {
  if (this->bgzf != nullptr) {
    bgzf_close(this->bgzf);
    this->bgzf = nullptr;
  }
  boost::system::error_code ec;
  boost::filesystem::remove(this->tmp_filepath, ec);
  if (ec) {
    log_warning("could not remove incomplete output " + this->tmp_filepath + ": " + ec.message());
  }
}

void AseWriter::write(const string& s) {
  if (this->bgzf == nullptr) {
    throw runtime_error("writing to closed file " + this->filepath);
  }
  ssize_t written = bgzf_write(this->bgzf, s.c_str(), s.size());
  if (written < 0 || (size_t)written != s.size()) {
    throw runtime_error("failed to write to " + this->tmp_filepath);
  }
}

void AseWriter::writeheader() {
  string header = "Meta_P\tMeta_Z\tChr\tPos\tSnpId\tSample_Count\tRef_Allele\tAlt_Allele\tCount_Pearson_R";
  if (this->write_genes) {
    header += "\tGenes";
  }
  header += "\tRef_Counts\tAlt_Counts\tSampleIds";
  if (this->write_base_quality) {
    header += "\tRef_MeanBaseQuality\tAlt_MeanBaseQuality\tRef_MeanBaseQualities\tAlt_MeanBaseQualities";
  }
  this->write(header + "\n");
}

void AseWriter::writerec(const AseVariant& variant, const string& genes) {
  this->write(AseWriter::format_record(variant, genes, this->write_genes, this->write_base_quality));
}

namespace {
  // comma separated qualities and their mean over the samples that have one
  pair<string, string> format_base_qualities(const vector<double>& qualities) {
    string list = "";
    double sum = 0;
    int n = 0;
    for (size_t i = 0; i < qualities.size(); ++i) {
      if (i > 0) {
        list += ",";
      }
      list += util::format_double(qualities[i]);
      if (!std::isnan(qualities[i])) {
        sum += qualities[i];
        ++n;
      }
    }
    string mean = util::format_double(n > 0 ? sum / n : BASE_QUALITY_NA);
    return make_pair(mean, list);
  }
}

string AseWriter::format_record(const AseVariant& variant,
                                const string& genes,
                                bool write_genes,
                                bool write_base_quality) {
  const vector<sample_observation_t>& observations = variant.get_observations();
  string id = variant.get_id();

  string line =
    util::format_double(variant.get_meta_pvalue()) + "\t"
    + util::format_double(variant.get_meta_zscore()) + "\t"
    + variant.get_chr() + "\t"
    + to_string(variant.get_pos()) + "\t"
    + (id == "" ? "." : id) + "\t"
    + to_string(observations.size()) + "\t"
    + variant.get_ref() + "\t"
    + variant.get_alt() + "\t"
    + util::format_double(variant.get_count_pearson_r());
  if (write_genes) {
    line += "\t" + genes;
  }

  string ref_counts = "";
  string alt_counts = "";
  string sample_ids = "";
  vector<double> ref_qualities;
  vector<double> alt_qualities;
  for (size_t i = 0; i < observations.size(); ++i) {
    if (i > 0) {
      ref_counts += ",";
      alt_counts += ",";
      sample_ids += ",";
    }
    ref_counts += to_string(observations[i].ref_count);
    alt_counts += to_string(observations[i].alt_count);
    sample_ids += observations[i].sample_id;
    ref_qualities.push_back(observations[i].ref_mean_base_quality);
    alt_qualities.push_back(observations[i].alt_mean_base_quality);
  }
  line += "\t" + ref_counts + "\t" + alt_counts + "\t" + sample_ids;

  if (write_base_quality) {
    pair<string, string> ref_bq = format_base_qualities(ref_qualities);
    pair<string, string> alt_bq = format_base_qualities(alt_qualities);
    line += "\t" + ref_bq.first + "\t" + alt_bq.first + "\t" + ref_bq.second + "\t" + alt_bq.second;
  }
  return line + "\n";
}

void AseWriter::commit() {
  if (this->committed) {
    return;
  }
  int ret = bgzf_close(this->bgzf);
  this->bgzf = nullptr;
  if (ret != 0) {
    this->discard();
    throw runtime_error("failed to close " + this->tmp_filepath);
  }

  boost::system::error_code ec;
  boost::filesystem::rename(this->tmp_filepath, this->filepath, ec);
  if (ec) {
    this->discard();
    throw runtime_error("failed to move " + this->tmp_filepath + " to " + this->filepath + ": " + ec.message());
  }
  this->committed = true;
}
