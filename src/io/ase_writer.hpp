/* ase_writer.hpp
 *
 * Writes ranked ASE result tables as tab separated text (bgzipped when the
 * path ends in .gz).
 *
 * Rows are written to <filepath>.tmp. commit() closes the file and renames it
 * to filepath; a writer destroyed without commit removes the temporary file,
 * so an interrupted table never appears complete.
 *
 * Example:
 *   AseWriter writer("out/ase_bh.txt", true, false);
 *   writer.writeheader();
 *   writer.writerec(variant, "ENSG00000175756");
 *   writer.commit();
 */

#ifndef ASEMETA_ASE_WRITER_H
#define ASEMETA_ASE_WRITER_H

#include <string>
using namespace std;

#include <htslib/bgzf.h>

#include "../ase_variant.hpp"

class AseWriter {
 public:
  AseWriter(const string& filepath, bool write_genes, bool write_base_quality);
  AseWriter(const AseWriter& other) = delete;
  AseWriter& operator=(const AseWriter& other) = delete;
  ~AseWriter();

  void writeheader();

  // genes is ignored when the writer was created without the Genes column
  void writerec(const AseVariant& variant, const string& genes);

  void commit();

  string get_filepath() const { return this->filepath; }

  static string format_record(const AseVariant& variant,
                              const string& genes,
                              bool write_genes,
                              bool write_base_quality);

 private:
  void write(const string& s);
  void discard();

  string filepath;
  string tmp_filepath;
  bool write_genes;
  bool write_base_quality;
  BGZF* bgzf;
  bool committed;
};

#endif
