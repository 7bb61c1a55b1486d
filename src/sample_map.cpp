#include "sample_map.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
using std::string;
using std::unordered_map;
using std::vector;

#include <boost/algorithm/string.hpp>

#include "io/bgz_reader.hpp"

SampleMap::SampleMap()
 : filepath("")
 , is_loaded(false) { }

void SampleMap::load(const string& filepath) {
  this->study_to_ref.clear();
  this->is_loaded = false;

  BgzReader reader(filepath);
  string line;
  vector<string> split;
  while (!reader.eof()) {
    line = reader.readline();
    boost::algorithm::split(split, line, boost::algorithm::is_any_of("\t"));
    if (split.size() != 2) {
      throw std::runtime_error(
        "detected " + std::to_string(split.size()) + " columns instead of 2 in "
        + filepath + " for this line: " + line
      );
    }
    this->study_to_ref[split[1]] = split[0];
  }
  this->filepath = filepath;
  this->is_loaded = true;
}

void SampleMap::clear() {
  this->study_to_ref.clear();
  this->filepath = "";
  this->is_loaded = false;
}

bool SampleMap::loaded() const {
  return this->is_loaded;
}

bool SampleMap::contains(const string& study_sample) const {
  return this->study_to_ref.count(study_sample) > 0;
}

const string& SampleMap::get_ref_sample(const string& study_sample) const {
  auto it = this->study_to_ref.find(study_sample);
  if (it == this->study_to_ref.end()) {
    throw std::out_of_range("no reference sample mapped to " + study_sample);
  }
  return it->second;
}
