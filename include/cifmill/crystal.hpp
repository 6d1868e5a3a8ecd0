// Copyright 2026 Global Phasing Ltd.
//
// CrystalSymmetry: space group and unit cell, each of which may be unknown.

#ifndef CIFMILL_CRYSTAL_HPP_
#define CIFMILL_CRYSTAL_HPP_

#include <string>
#include <utility>  // for pair
#include <vector>
#include <gemmi/symmetry.hpp>  // for GroupOps, SpaceGroup, Op
#include <gemmi/unitcell.hpp>  // for UnitCell
#include "fail.hpp"            // for CIFMILL_DLL

namespace cifmill {

using gemmi::GroupOps;
using gemmi::Op;
using gemmi::SpaceGroup;
using gemmi::UnitCell;

struct CrystalSymmetry {
  // all operators of the group; empty sym_ops means the group is unknown
  GroupOps ops;
  // tabulated space group equal to ops, or nullptr if it's not in the table
  const SpaceGroup* spacegroup = nullptr;
  UnitCell cell;
  bool has_cell = false;
  // operators as listed in the file, with their (positive) identifiers
  std::vector<std::pair<int, Op>> symop_ids;

  bool has_group() const { return !ops.sym_ops.empty(); }
  bool empty() const { return !has_group() && !has_cell; }

  void set_group(const GroupOps& gops, const SpaceGroup* sg) {
    ops = gops;
    spacegroup = sg;
    symop_ids.clear();
  }
  void set_cell(const UnitCell& uc) {
    cell = uc;
    has_cell = true;
  }

  /// Operator with the given identifier (as in site symmetry 2_555),
  /// or nullptr.
  const Op* find_symop(int id) const {
    for (const auto& p : symop_ids)
      if (p.first == id)
        return &p.second;
    return nullptr;
  }

  /// The space group name if tabulated, otherwise the operator list.
  CIFMILL_DLL std::string group_str() const;
  CIFMILL_DLL std::string cell_str() const;

  /// With force=true known items of other replace ours,
  /// otherwise only our unknown items are taken from other.
  CIFMILL_DLL void join(const CrystalSymmetry& other, bool force);
};

/// All elements of the group generated by the operators
/// (with the identity added and translations wrapped into [0,1)).
/// Throws InvalidValueError if the operators don't generate
/// a crystallographic group.
CIFMILL_DLL GroupOps close_group(const std::vector<Op>& generators);

/// Checks lengths, angles and the positivity of the metric tensor.
CIFMILL_DLL bool is_valid_cell(double a, double b, double c,
                               double alpha, double beta, double gamma);

/// True if each rotation R of the group leaves the metric tensor G
/// unchanged (R^T G R = G), within 1% in lengths and 1 degree in angles.
CIFMILL_DLL bool is_compatible_cell(const GroupOps& ops, const UnitCell& cell);

/// Group transformed to its primitive setting (no centring vectors).
CIFMILL_DLL GroupOps primitive_setting(const GroupOps& ops);

/// Fills NaN parameters using the constraints of the crystal system.
/// Returns false if some parameter can't be determined.
CIFMILL_DLL bool infer_cell_parameters(const SpaceGroup& sg, double (&par)[6]);

} // namespace cifmill
#endif
