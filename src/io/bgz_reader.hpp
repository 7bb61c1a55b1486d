/* bgz_reader.hpp
 *
 * HTSlib wrapper to read plain, gzipped or bgzipped text files line by line.
 *
 * Example:
 *   BgzReader reader("counts.txt.gz");
 *   while (!reader.eof()) {
 *      string line = reader.readline();
 *   }
 *
 * A BgzReader owns its BGZF handle and is not copyable. Each ingestion
 * worker opens its own reader.
 */

#ifndef ASEMETA_BGZ_READER_H
#define ASEMETA_BGZ_READER_H

#include <htslib/bgzf.h>
#include <htslib/kstring.h>
#include <string>

using namespace std;

class BgzReader {
 public:
  BgzReader(string filepath);
  BgzReader(const BgzReader& other) = delete;
  BgzReader& operator=(const BgzReader& other) = delete;
  ~BgzReader();

  string readline();
  bool eof() const { return this->at_eof; }
  string get_filepath() const { return this->filepath; }
  int get_lines_read() const { return this->lines_read; }

 private:
  void check_eof();
  void fail(const string& msg, int ret);

  string filepath;
  BGZF* bgzf;
  kstring_t buffer;
  bool at_eof;
  int lines_read;
};

#endif
