// Copyright 2026 Global Phasing Ltd.

#include <cifmill/symcif.hpp>
#include <cifmill/tags.hpp>    // for find_item
#include <cifmill/values.hpp>  // for parse_int, parse_float
#include <gemmi/util.hpp>      // for in_vector

namespace cifmill {

namespace {

const char* const cell_tags[6] = {
  "_cell_length_a", "_cell_length_b", "_cell_length_c",
  "_cell_angle_alpha", "_cell_angle_beta", "_cell_angle_gamma"
};

// value of a single-valued item, or nullptr if absent or null
const std::string* single_value(cif::Column& col) {
  if (!col || col.length() == 0 || cif::is_null(col[0]))
    return nullptr;
  return &col[0];
}

bool read_symops(cif::Block& block, CrystalSymmetry& cs) {
  std::string xyz_tag;
  cif::Column xyz = find_item(block, "_space_group_symop_operation_xyz", xyz_tag);
  if (!xyz || all_null(xyz))
    return false;
  std::vector<Op> ops;
  ops.reserve(xyz.length());
  for (const std::string& item : xyz) {
    std::string triplet = cif::as_string(item);
    try {
      ops.push_back(gemmi::parse_triplet(triplet));
    } catch (std::runtime_error& e) {
      fail<ParseError>("Error interpreting symmetry operator in ", xyz_tag,
                       ": ", triplet, " (", e.what(), ')');
    }
  }

  std::vector<int> ids;
  std::string id_tag;
  cif::Column id_col = find_item(block, "_space_group_symop_id", id_tag);
  if (id_col) {
    if (id_col.length() != xyz.length())
      fail<InvalidIdentifierError>("Number of symmetry operator identifiers (",
                                   id_tag, ") differs from number of operators");
    for (const std::string& item : id_col) {
      int n = 0;
      if (!parse_int(item, n) || n <= 0)
        fail<InvalidIdentifierError>("Invalid symmetry operator id in ",
                                     id_tag, ": ", item);
      if (gemmi::in_vector(n, ids))
        fail<InvalidIdentifierError>("Duplicate symmetry operator id in ",
                                     id_tag, ": ", item);
      ids.push_back(n);
    }
  } else {
    for (size_t i = 0; i != ops.size(); ++i)
      ids.push_back(int(i) + 1);
  }

  GroupOps gops = close_group(ops);
  cs.set_group(gops, gemmi::find_spacegroup_by_ops(gops));
  for (size_t i = 0; i != ops.size(); ++i)
    cs.symop_ids.emplace_back(ids[i], ops[i]);
  return true;
}

bool read_hall(cif::Block& block, CrystalSymmetry& cs, const Logger& logger) {
  std::string tag;
  cif::Column col = find_item(block, "_space_group_name_Hall", tag);
  const std::string* value = single_value(col);
  if (!value)
    return false;
  std::string hall = cif::as_string(*value);
  try {
    GroupOps gops = gemmi::symops_from_hall(hall.c_str());
    cs.set_group(gops, gemmi::find_spacegroup_by_ops(gops));
  } catch (std::runtime_error& e) {
    logger.debug("Hall symbol in ", tag, " not used: ", hall, " (", e.what(), ')');
    return false;
  }
  return true;
}

bool read_hm(cif::Block& block, CrystalSymmetry& cs, const Logger& logger) {
  std::string tag;
  cif::Column col = find_item(block, "_space_group_name_H-M_alt", tag);
  const std::string* value = single_value(col);
  if (!value)
    return false;
  std::string hm = cif::as_string(*value);
  const SpaceGroup* sg = gemmi::find_spacegroup_by_name(hm);
  if (!sg) {
    logger.debug("H-M symbol in ", tag, " not recognized: ", hm);
    return false;
  }
  cs.set_group(sg->operations(), sg);
  return true;
}

bool read_it_number(cif::Block& block, CrystalSymmetry& cs,
                    const Logger& logger) {
  std::string tag;
  cif::Column col = find_item(block, "_space_group_IT_number", tag);
  const std::string* value = single_value(col);
  if (!value)
    return false;
  int n = 0;
  const SpaceGroup* sg = nullptr;
  if (parse_int(*value, n) && n >= 1 && n <= 230)
    sg = gemmi::find_spacegroup_by_number(n);
  if (!sg) {
    logger.debug("Space group number in ", tag, " not used: ", *value);
    return false;
  }
  cs.set_group(sg->operations(), sg);
  return true;
}

void read_cell(cif::Block& block, bool strict, CrystalSymmetry& cs) {
  std::string tags[6];
  std::string values[6];
  bool present[6] = {false, false, false, false, false, false};
  int n_present = 0;
  for (int i = 0; i < 6; ++i) {
    cif::Column col = find_item(block, cell_tags[i], tags[i]);
    if (!col)
      continue;
    if (col.get_loop())
      fail<MalformedCellParameterError>("Data item ", tags[i],
                                        " cannot be declared in a looped list");
    values[i] = col[0];
    // ? for an angle means the default value
    if (i >= 3 && values[i] == "?")
      values[i] = "90";
    present[i] = true;
    ++n_present;
  }

  if (n_present == 0) {
    if (strict)
      fail<IncompleteCellError>("Unit cell parameters not found in block ",
                                block.name);
    return;
  }

  double par[6];
  for (int i = 0; i < 6; ++i) {
    par[i] = NAN;
    if (present[i]) {
      par[i] = parse_float(values[i]);
      if (std::isnan(par[i]))
        fail<InvalidCellError>("Invalid unit cell parameter ", tags[i], ": ",
                               values[i]);
    }
  }
  if (n_present < 6) {
    if (!cs.has_group())
      fail<IncompleteCellError>("Not all unit cell parameters are given"
                                " in block ", block.name);
    if (!cs.spacegroup || !infer_cell_parameters(*cs.spacegroup, par))
      fail<IncompleteCellError>("Missing unit cell parameters in block ",
                                block.name, " cannot be inferred from space"
                                " group ", cs.group_str());
  }
  if (!is_valid_cell(par[0], par[1], par[2], par[3], par[4], par[5])) {
    std::string msg = "Invalid unit cell parameters are given:";
    for (int i = 0; i < 6; ++i)
      msg += " " + (present[i] ? values[i] : std::string("(inferred)"));
    fail<InvalidCellError>(msg);
  }
  UnitCell cell;
  cell.set(par[0], par[1], par[2], par[3], par[4], par[5]);
  cs.set_cell(cell);
}

} // anonymous namespace

CrystalSymmetry build_symmetry(const cif::Block& block_, bool strict,
                               const Logger& logger) {
  cif::Block& block = const_cast<cif::Block&>(block_);
  CrystalSymmetry cs;
  if (!read_symops(block, cs) &&
      !read_hall(block, cs, logger) &&
      !read_hm(block, cs, logger) &&
      !read_it_number(block, cs, logger) &&
      strict)
    fail<MissingSymmetryError>("No symmetry instructions could be extracted"
                               " from block ", block.name);

  read_cell(block, strict, cs);

  if (cs.has_group() && cs.has_cell && !is_compatible_cell(cs.ops, cs.cell)) {
    GroupOps prim = primitive_setting(cs.ops);
    if (!is_compatible_cell(prim, cs.cell))
      fail<IncompatibleSymmetryError>(
          "Space group is incompatible with unit cell parameters:\n"
          "  Space group: ", cs.group_str(), "\n  Unit cell: ", cs.cell_str());
    logger.note("Space group ", cs.group_str(),
                " changed to primitive setting to fit unit cell ", cs.cell_str());
    cs.set_group(prim, gemmi::find_spacegroup_by_ops(prim));
  }
  return cs;
}

} // namespace cifmill
