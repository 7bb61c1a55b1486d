#ifndef ASEMETA_SAMPLE_MAP_H
#define ASEMETA_SAMPLE_MAP_H

#include <string>
#include <unordered_map>

/**
 * Maps study sample ids to the sample ids used in the reference genotype
 * panel.
 *
 * The mapping file has two tab separated columns per line:
 *   REFERENCE_SAMPLE_ID  STUDY_SAMPLE_ID
 * Any line with a different number of columns is an error.
 */
class SampleMap {
 public:
  SampleMap();

  void load(const std::string& filepath);

  void clear();

  bool loaded() const;

  bool contains(const std::string& study_sample) const;

  // throws out_of_range if study_sample has no mapping
  const std::string& get_ref_sample(const std::string& study_sample) const;

  size_t size() const { return this->study_to_ref.size(); }

 private:
  std::string filepath;
  bool is_loaded;
  std::unordered_map<std::string, std::string> study_to_ref;
};

#endif
