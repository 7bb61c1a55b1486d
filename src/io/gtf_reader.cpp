#include "gtf_reader.hpp"

#include <stdexcept>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "../logging.hpp"

GtfReader::GtfReader(const string& gtf_file)
  : gtf_file(gtf_file) { }

void GtfReader::set_feature_types(const unordered_set<string>& feature_types) {
  this->feature_types = feature_types;
}

string GtfReader::get_attribute(const string& attributes, const string& key) {
  vector<string> fields;
  boost::algorithm::split(fields, attributes, boost::algorithm::is_any_of(";"));
  for (string field : fields) {
    boost::algorithm::trim(field);
    size_t sep = field.find_first_of(" \t");
    if (sep == string::npos || field.substr(0, sep) != key) {
      continue;
    }
    string value = field.substr(sep + 1);
    boost::algorithm::trim(value);
    boost::algorithm::trim_if(value, boost::algorithm::is_any_of("\""));
    return value;
  }
  return "";
}

GeneIntervalIndex GtfReader::read_index() {
  BgzReader reader(this->gtf_file);
  GeneIntervalIndex index;
  string line;
  vector<string> fields;
  int skipped = 0;
  while (!reader.eof()) {
    line = reader.readline();
    if (line == "" || line[0] == '#') {
      continue;
    }

    boost::algorithm::split(fields, line, boost::algorithm::is_any_of("\t"));
    if (fields.size() != 9) {
      throw runtime_error(
        "expected 9 columns in " + this->gtf_file + " line "
        + to_string(reader.get_lines_read()) + " but found " + to_string(fields.size())
      );
    }
    if (!this->feature_types.empty() && this->feature_types.count(fields[2]) == 0) {
      continue;
    }

    gene_interval_t gene;
    gene.chr = fields[0];
    try {
      gene.start = boost::lexical_cast<int>(fields[3]);
      gene.end = boost::lexical_cast<int>(fields[4]);
    } catch (const boost::bad_lexical_cast& e) {
      throw runtime_error(
        "invalid coordinates in " + this->gtf_file + " line " + to_string(reader.get_lines_read())
      );
    }
    gene.gene_id = GtfReader::get_attribute(fields[8], "gene_id");
    if (gene.gene_id == "") {
      ++skipped;
      continue;
    }
    index.add(gene);
  }

  if (skipped > 0) {
    log_warning("skipped " + format_count(skipped) + " GTF features without a gene_id");
  }
  index.build();
  return index;
}
