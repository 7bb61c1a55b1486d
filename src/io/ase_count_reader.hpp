/* ase_count_reader.hpp
 *
 * Read a raw, gzipped, or bgzipped ASE count file using HTSlib. Skips lines
 * starting with # and the line with column names.
 *
 * Columns (tab or space separated):
 *   Chr Pos SnpId Ref Alt SampleId RefCount AltCount [RefMeanBaseQuality AltMeanBaseQuality]
 *
 * SnpId and the base quality columns may be . or NA when missing.
 *
 * Example:
 *   AseCountReader reader("sample1.ase.txt.gz");
 *   while (!reader.eof()) {
 *      ase_count_record_t rec = reader.readrec();
 *   }
 */

#ifndef ASEMETA_ASE_COUNT_READER_H
#define ASEMETA_ASE_COUNT_READER_H

#include <string>
using namespace std;

#include "bgz_reader.hpp"
#include "../variant_key.hpp"

typedef struct {
  VariantKey key;
  string snp_id;
  sample_observation_t observation;
} ase_count_record_t;

class AseCountReader : public BgzReader {
 public:
  AseCountReader(string filepath);

  ~AseCountReader(){};

  ase_count_record_t readrec();

  bool eof();

  // parse one data line; line_number is used in error messages only
  static ase_count_record_t parse_line(const string& line,
                                       const string& filepath,
                                       const int& line_number);

 private:
  void advance();

  string next_line;
  int next_line_number;
};

#endif
