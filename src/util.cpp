#include "util.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
using namespace std;

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "io/bgz_reader.hpp"

namespace util {
  vector<string> str_split(const string& str, const string& delimiters) {
    vector<string> split;
    size_t beg = 0;
    size_t end = str.find_first_of(delimiters, beg);
    while (end != string::npos) {
      if (end > beg) {
        split.push_back(str.substr(beg, end - beg));
      }
      beg = end + 1;
      end = str.find_first_of(delimiters, beg);
    }
    if (beg < str.size()) {
      split.push_back(str.substr(beg));
    }
    return split;
  }

  bool file_exists(string filename) {
    if (FILE *file = fopen(filename.c_str(), "r")) {
      fclose(file);
      return true;
    } else {
      return false;
    }
  }

  bool is_missing(const string& field) {
    return field == "" || field == "." || field == "NA";
  }

  string format_double(double d) {
    if (std::isnan(d)) {
      return "NA";
    }
    // shortest %g rendering that parses back to the same double
    string out;
    for (int precision = 1; precision <= 17; ++precision) {
      out = (boost::format("%." + to_string(precision) + "g") % d).str();
      if (strtod(out.c_str(), nullptr) == d) {
        break;
      }
    }
    return out;
  }

  string correction_method_to_string(const correction_method_e& method) {
    switch (method) {
      case NONE:
        return "none";
      case NOMINAL:
        return "nominal";
      case BONFERRONI:
        return "bonferroni";
      case HOLM:
        return "holm";
      case BH:
        return "bh";
    }
    return "unknown";
  }

  vector<string> read_file_list(const string& list_file) {
    vector<string> files;
    BgzReader reader(list_file);
    string line;
    while (!reader.eof()) {
      line = reader.readline();
      boost::algorithm::trim(line);
      if (line != "" && line[0] != '#') {
        files.push_back(line);
      }
    }
    return files;
  }
}
