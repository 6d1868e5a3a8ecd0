// Copyright 2026 Global Phasing Ltd.
//
// Miller arrays from the reflection loops (_refln, _diffrn_refln, ...)
// of a CIF block.

#ifndef CIFMILL_REFLCIF_HPP_
#define CIFMILL_REFLCIF_HPP_

#include <map>
#include <string>
#include <vector>
#include "miller.hpp"  // for ArrayCollection
#include "symcif.hpp"  // for CrystalSymmetry, Logger

namespace cifmill {

/// How columns of a reflection loop are grouped into arrays.
enum class LabelStrategy {
  // columns visited in sorted order; substrings such as _sigma, PHWT, HL_
  // and phase_ attach a column to an array built earlier
  Heuristic,
  // value/sigma pairs, map coefficients and HL quadruplets are matched first,
  // the remaining columns become separate arrays
  Pattern
};

/// Where the data come from; passed to each array's ArrayInfo.
struct Provenance {
  std::string source;
  std::string source_type = "cif";
  std::vector<std::string> labels;
  // symmetry from another source; its known items take precedence
  CrystalSymmetry symmetry_from_file;
};

/// A reflection loop column as read, for inspection.
struct RawColumn {
  std::string name;  // tag without the _refln. or _refln_ prefix
  bool numeric = false;
  std::vector<double> values;        // if numeric, with NaN for ? and .
  std::vector<std::string> strings;  // if not numeric
};

struct RawLoop {
  std::vector<Miller> indices;
  std::vector<RawColumn> columns;
};

struct ReflectionData {
  std::string name;
  CrystalSymmetry symmetry;
  ArrayCollection arrays;
  std::vector<RawLoop> raw_loops;

  const RawColumn* find_raw(const std::string& name) const {
    for (const RawLoop& rl : raw_loops)
      for (const RawColumn& col : rl.columns)
        if (col.name == name)
          return &col;
    return nullptr;
  }
};

/// Wavelengths from _diffrn_radiation_wavelength.id and .wavelength,
/// keyed by the id. Values that are not numbers are skipped.
CIFMILL_DLL std::map<int, double> read_wavelengths(const cif::Block& block);

/// Throws NoReflectionDataError if no array could be made.
/// Size mismatches of paired columns are passed to the logger as warnings.
CIFMILL_DLL ReflectionData build_arrays(const cif::Block& block,
                                        const Provenance& provenance,
                                        const std::map<int, double>& wavelengths,
                                        LabelStrategy strategy,
                                        const Logger& logger);

inline ReflectionData build_arrays(const cif::Block& block,
                                   LabelStrategy strategy=LabelStrategy::Heuristic) {
  return build_arrays(block, Provenance(), read_wavelengths(block), strategy,
                      Logger{});
}

} // namespace cifmill
#endif
