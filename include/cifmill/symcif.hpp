// Copyright 2026 Global Phasing Ltd.
//
// Space group and unit cell from a CIF block.

#ifndef CIFMILL_SYMCIF_HPP_
#define CIFMILL_SYMCIF_HPP_

#include <gemmi/cifdoc.hpp>  // for Block
#include <gemmi/logger.hpp>  // for Logger
#include "crystal.hpp"       // for CrystalSymmetry

namespace cifmill {

namespace cif = gemmi::cif;
using gemmi::Logger;

/// Space group is taken from (in this order): symmetry operators,
/// Hall symbol, H-M symbol, IT number. The first source that gives
/// a group wins; bad Hall, H-M or number fall through to the next one.
/// If only some cell parameters are given, the others are inferred
/// from the crystal system. A cell that doesn't fit the group is tried
/// against the primitive setting of the group before failing.
/// With strict=true both the space group and the cell are required.
CIFMILL_DLL CrystalSymmetry build_symmetry(const cif::Block& block, bool strict,
                                           const Logger& logger);

inline CrystalSymmetry build_symmetry(const cif::Block& block, bool strict) {
  return build_symmetry(block, strict, Logger{});
}

} // namespace cifmill
#endif
