#ifndef ASEMETA_ENUMS_H
#define ASEMETA_ENUMS_H

// multiple testing correction applied when writing ranked ASE results
enum correction_method_e {
  NONE,
  NOMINAL,
  BONFERRONI,
  HOLM,
  BH
};

#endif
