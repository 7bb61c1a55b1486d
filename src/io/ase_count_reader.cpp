#include "ase_count_reader.hpp"

#include <stdexcept>
#include <vector>

#include <boost/lexical_cast.hpp>

#include "../util.hpp"

AseCountReader::AseCountReader(string filepath)
  : BgzReader(filepath)
  , next_line("")
  , next_line_number(0) {
  this->advance();
}

// moves to the next data line, skipping blank lines, comments and the
// column names
void AseCountReader::advance() {
  this->next_line = "";
  while (this->next_line == "" && !BgzReader::eof()) {
    string line = this->readline();
    if (line == "" || line[0] == '#' || line.substr(0, line.find_first_of("\t ")) == "Chr") {
      continue;
    }
    this->next_line = line;
    this->next_line_number = this->get_lines_read();
  }
}

bool AseCountReader::eof() {
  return this->next_line == "";
}

ase_count_record_t AseCountReader::readrec() {
  if (this->eof()) {
    throw out_of_range("read past end of file " + this->get_filepath());
  }

  string line = this->next_line;
  int line_number = this->next_line_number;
  this->advance();

  return AseCountReader::parse_line(line, this->get_filepath(), line_number);
}

namespace {
  int parse_count(const string& field, const string& name, const string& where) {
    int count;
    try {
      count = boost::lexical_cast<int>(field);
    } catch (const boost::bad_lexical_cast& e) {
      throw runtime_error("invalid " + name + " '" + field + "' " + where);
    }
    if (count < 0) {
      throw runtime_error("negative " + name + " '" + field + "' " + where);
    }
    return count;
  }

  double parse_quality(const string& field, const string& name, const string& where) {
    if (util::is_missing(field)) {
      return BASE_QUALITY_NA;
    }
    try {
      return boost::lexical_cast<double>(field);
    } catch (const boost::bad_lexical_cast& e) {
      throw runtime_error("invalid " + name + " '" + field + "' " + where);
    }
  }
}

ase_count_record_t AseCountReader::parse_line(const string& line,
                                              const string& filepath,
                                              const int& line_number) {
  string where = "in " + filepath + " line " + to_string(line_number);
  vector<string> fields = util::str_split(line, "\t ");
  if (fields.size() != 8 && fields.size() != 10) {
    throw runtime_error(
      "expected 8 or 10 columns but found " + to_string(fields.size()) + " " + where
    );
  }

  ase_count_record_t rec;
  rec.key.chr = fields[0];
  try {
    rec.key.pos = boost::lexical_cast<int>(fields[1]);
  } catch (const boost::bad_lexical_cast& e) {
    throw runtime_error("invalid position '" + fields[1] + "' " + where);
  }
  if (rec.key.pos < 1) {
    throw runtime_error("position must be >= 1 " + where);
  }
  rec.snp_id = util::is_missing(fields[2]) ? "" : fields[2];
  rec.key.ref = fields[3];
  rec.key.alt = fields[4];

  rec.observation.sample_id = fields[5];
  rec.observation.ref_count = parse_count(fields[6], "ref count", where);
  rec.observation.alt_count = parse_count(fields[7], "alt count", where);
  if (fields.size() == 10) {
    rec.observation.ref_mean_base_quality = parse_quality(fields[8], "ref base quality", where);
    rec.observation.alt_mean_base_quality = parse_quality(fields[9], "alt base quality", where);
  } else {
    rec.observation.ref_mean_base_quality = BASE_QUALITY_NA;
    rec.observation.alt_mean_base_quality = BASE_QUALITY_NA;
  }
  return rec;
}
