#include "bgz_reader.hpp"

#include <stdexcept>

#include <htslib/hts_log.h>

/*
 * bgzf_open transparently reads uncompressed, gzip and bgzip input, so the
 * same reader serves count files, sample mappings, file lists and GTFs.
 *
 * int bgzf_getline(BGZF *fp, int delim, kstring_t *str)
 *      Reads a line into str without the delimiter. Returns the length of
 *      the line, -1 at end of file and <= -2 on error.
 *
 * int bgzf_peek(BGZF *fp)
 *      Returns the next byte without consuming it, -1 at end of file.
 */
BgzReader::BgzReader(string filepath)
  : filepath(filepath)
  , bgzf(nullptr)
  , buffer()
  , at_eof(true)
  , lines_read(0) {
  hts_set_log_level(HTS_LOG_OFF);
  this->bgzf = bgzf_open(filepath.c_str(), "r");
  if (this->bgzf == nullptr) {
    throw runtime_error("failed to open " + filepath);
  }
  this->check_eof();
}

BgzReader::~BgzReader() {
  ks_free(&this->buffer);
  bgzf_close(this->bgzf);
}

void BgzReader::fail(const string& msg, int ret) {
  throw runtime_error(msg + " (code " + to_string(ret) + ") in " + this->filepath
                      + " after line " + to_string(this->lines_read));
}

// the line without its terminating newline (and carriage return)
string BgzReader::readline() {
  if (this->at_eof) {
    throw out_of_range("read past end of file " + this->filepath);
  }

  int ret = bgzf_getline(this->bgzf, '\n', &this->buffer);
  if (ret < -1) {
    this->fail("bgzf_getline failed", ret);
  }
  ++this->lines_read;

  size_t len = ret == -1 ? 0 : this->buffer.l;
  if (len > 0 && this->buffer.s[len - 1] == '\r') {
    --len;
  }
  string line(len > 0 ? this->buffer.s : "", len);
  this->check_eof();
  return line;
}

void BgzReader::check_eof() {
  int c = bgzf_peek(this->bgzf);
  if (c < -1) {
    this->fail("bgzf_peek failed", c);
  }
  this->at_eof = c == -1;
}
