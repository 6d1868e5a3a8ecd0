// Copyright 2026 Global Phasing Ltd.
//
// Atomic structure (scatterers) from the _atom_site loops of a CIF block.

#ifndef CIFMILL_STRUCTURE_HPP_
#define CIFMILL_STRUCTURE_HPP_

#include <cmath>   // for NAN
#include <string>
#include <vector>
#include <gemmi/math.hpp>      // for SMat33
#include <gemmi/unitcell.hpp>  // for Fractional
#include "symcif.hpp"          // for CrystalSymmetry, Logger

namespace cifmill {

using gemmi::Fractional;
using gemmi::SMat33;

enum class AdpType : unsigned char { None, Iso, Aniso };

struct Scatterer {
  std::string label;           // empty if not given
  std::string scattering_type; // empty if not given
  Fractional fract;
  AdpType adp_type = AdpType::None;
  double u_iso = NAN;          // set for AdpType::Iso
  SMat33<double> u_cif = {0, 0, 0, 0, 0, 0};  // set for AdpType::Aniso
  SMat33<double> u_star = {0, 0, 0, 0, 0, 0}; // u_cif in reciprocal basis
  double occupancy = NAN;      // NaN means "not specified"

  bool has_occupancy() const { return !std::isnan(occupancy); }
};

struct Structure {
  std::string name;
  CrystalSymmetry symmetry;
  double wavelength = NAN;
  bool from_cartesian = false;  // coordinates were converted from Cartn_*
  std::vector<Scatterer> scatterers;

  const Scatterer* find_scatterer(const std::string& label) const {
    for (const Scatterer& sc : scatterers)
      if (sc.label == label)
        return &sc;
    return nullptr;
  }
};

/// U_cif -> U* (U*_ij = U_ij a*_i a*_j).
inline SMat33<double> u_cif_as_u_star(const UnitCell& cell,
                                      const SMat33<double>& u) {
  return {u.u11 * cell.ar * cell.ar,
          u.u22 * cell.br * cell.br,
          u.u33 * cell.cr * cell.cr,
          u.u12 * cell.ar * cell.br,
          u.u13 * cell.ar * cell.cr,
          u.u23 * cell.br * cell.cr};
}

/// Requires both the space group and the unit cell (symmetry is read
/// in strict mode). Fractional coordinates are preferred over Cartesian.
/// Anisotropic ADPs (from the _atom_site_aniso loop, matched by label)
/// take precedence over isotropic U and B.
CIFMILL_DLL Structure build_structure(const cif::Block& block,
                                      const Logger& logger);

inline Structure build_structure(const cif::Block& block) {
  return build_structure(block, Logger{});
}

} // namespace cifmill
#endif
