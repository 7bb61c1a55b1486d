/* gtf_reader.hpp
 *
 * Reads a raw, gzipped or bgzipped GTF file into a GeneIntervalIndex. Every
 * feature line contributes its interval under the value of its gene_id
 * attribute, so a gene is typically present many times (gene, transcripts,
 * exons); the annotation join deduplicates ids.
 *
 * Example:
 *   GtfReader reader("gencode.v19.annotation.gtf.gz");
 *   GeneIntervalIndex index = reader.read_index();
 */

#ifndef ASEMETA_GTF_READER_H
#define ASEMETA_GTF_READER_H

#include <string>
#include <unordered_set>
using namespace std;

#include "bgz_reader.hpp"
#include "../gene_interval_index.hpp"

class GtfReader {
 public:
  GtfReader(const string& gtf_file);

  // restrict to features of these types (e.g. gene, exon); empty keeps all
  void set_feature_types(const unordered_set<string>& feature_types);

  GeneIntervalIndex read_index();

  // value of attribute key in a GTF attribute column, "" if absent
  static string get_attribute(const string& attributes, const string& key);

 private:
  string gtf_file;
  unordered_set<string> feature_types;
};

#endif
