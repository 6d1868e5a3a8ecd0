// Copyright 2026 Global Phasing Ltd.

#include <cifmill/crystal.hpp>
#include <algorithm>  // for find
#include <cmath>      // for isnan, fabs, acos, sqrt
#include <cstdio>     // for snprintf
#include <cstring>    // for strchr
#include <gemmi/math.hpp>  // for Mat33, deg
#include <gemmi/util.hpp>  // for join_str

namespace cifmill {

std::string CrystalSymmetry::group_str() const {
  if (spacegroup)
    return spacegroup->xhm();
  if (!has_group())
    return "unknown";
  return "(" + gemmi::join_str(ops.all_ops_sorted(), "; ",
                               [](const Op& op) { return op.triplet(); }) + ")";
}

std::string CrystalSymmetry::cell_str() const {
  if (!has_cell)
    return "unknown";
  char buf[128];
  std::snprintf(buf, sizeof(buf), "(%g, %g, %g, %g, %g, %g)",
                cell.a, cell.b, cell.c, cell.alpha, cell.beta, cell.gamma);
  return buf;
}

void CrystalSymmetry::join(const CrystalSymmetry& other, bool force) {
  if (other.has_group() && (force || !has_group())) {
    ops = other.ops;
    spacegroup = other.spacegroup;
    symop_ids = other.symop_ids;
  }
  if (other.has_cell && (force || !has_cell))
    set_cell(other.cell);
}

GroupOps close_group(const std::vector<Op>& generators) {
  // the largest crystallographic groups (e.g. F m -3 m) have 192 elements
  const size_t max_size = 192;
  std::vector<Op> elements(1, Op::identity());
  auto add = [&](const Op& op) {
    if (std::find(elements.begin(), elements.end(), op) == elements.end())
      elements.push_back(op);
  };
  const int den3 = Op::DEN * Op::DEN * Op::DEN;
  for (Op op : generators) {
    int det = op.det_rot();
    if (det != den3 && det != -den3)
      fail<InvalidValueError>("Not a crystallographic symmetry operator: ",
                              op.triplet());
    add(op.wrap());
  }
  for (size_t i = 0; i < elements.size(); ++i)
    for (size_t j = 0; j <= i; ++j) {
      add(elements[i] * elements[j]);
      add(elements[j] * elements[i]);
      if (elements.size() > max_size)
        fail<InvalidValueError>("Symmetry operators do not generate a space"
                                " group (more than ", std::to_string(max_size),
                                " elements)");
    }
  return gemmi::split_centering_vectors(elements);
}

bool is_valid_cell(double a, double b, double c,
                   double alpha, double beta, double gamma) {
  for (double x : {a, b, c, alpha, beta, gamma})
    if (std::isnan(x))
      return false;
  if (a <= 0 || b <= 0 || c <= 0)
    return false;
  for (double angle : {alpha, beta, gamma})
    if (angle <= 0 || angle >= 180)
      return false;
  double ca = std::cos(gemmi::rad(alpha));
  double cb = std::cos(gemmi::rad(beta));
  double cg = std::cos(gemmi::rad(gamma));
  // determinant of the metric tensor divided by (abc)^2
  double d = 1 - ca * ca - cb * cb - cg * cg + 2 * ca * cb * cg;
  return d > 1e-12;
}

namespace {

gemmi::Mat33 metric_tensor(const UnitCell& cell) {
  double ca = std::cos(gemmi::rad(cell.alpha));
  double cb = std::cos(gemmi::rad(cell.beta));
  double cg = std::cos(gemmi::rad(cell.gamma));
  return gemmi::Mat33(cell.a * cell.a, cell.a * cell.b * cg, cell.a * cell.c * cb,
                      cell.a * cell.b * cg, cell.b * cell.b, cell.b * cell.c * ca,
                      cell.a * cell.c * cb, cell.b * cell.c * ca, cell.c * cell.c);
}

// a, b, c, alpha, beta, gamma from a metric tensor
void metric_to_parameters(const gemmi::Mat33& g, double (&par)[6]) {
  for (int i = 0; i < 3; ++i)
    par[i] = std::sqrt(g[i][i]);
  auto angle = [&](int i, int j) -> double {
    double cos_angle = g[i][j] / (par[i] * par[j]);
    return gemmi::deg(std::acos(std::max(-1.0, std::min(1.0, cos_angle))));
  };
  par[3] = angle(1, 2);
  par[4] = angle(0, 2);
  par[5] = angle(0, 1);
}

} // anonymous namespace

bool is_compatible_cell(const GroupOps& ops, const UnitCell& cell) {
  const double relative_length_tolerance = 0.01;
  const double absolute_angle_tolerance = 1.0;  // degrees
  gemmi::Mat33 g = metric_tensor(cell);
  double ref[6];
  metric_to_parameters(g, ref);
  for (const Op& op : ops.sym_ops) {
    double mult = 1.0 / Op::DEN;
    gemmi::Mat33 r(mult * op.rot[0][0], mult * op.rot[0][1], mult * op.rot[0][2],
                   mult * op.rot[1][0], mult * op.rot[1][1], mult * op.rot[1][2],
                   mult * op.rot[2][0], mult * op.rot[2][1], mult * op.rot[2][2]);
    double par[6];
    metric_to_parameters(r.transpose().multiply(g).multiply(r), par);
    for (int i = 0; i < 3; ++i)
      if (std::fabs(par[i] - ref[i]) > relative_length_tolerance * ref[i])
        return false;
    for (int i = 3; i < 6; ++i)
      if (std::fabs(par[i] - ref[i]) > absolute_angle_tolerance)
        return false;
  }
  return true;
}

GroupOps primitive_setting(const GroupOps& ops) {
  GroupOps prim = ops;
  char c = ops.find_centering();
  if (c != 'P' && c != '\0' && std::strchr("ABCIFRH", c))
    prim.change_basis_forward(Op{gemmi::centred_to_primitive(c), {0, 0, 0}});
  return prim;
}

bool infer_cell_parameters(const SpaceGroup& sg, double (&par)[6]) {
  auto first_known = [&](int start, int end) -> double {
    for (int i = start; i < end; ++i)
      if (!std::isnan(par[i]))
        return par[i];
    return NAN;
  };
  auto fill = [&](int i, double value) {
    if (std::isnan(par[i]))
      par[i] = value;
  };
  auto fill_lengths = [&](int end) {
    double len = first_known(0, end);
    for (int i = 0; i < end; ++i)
      fill(i, len);
  };
  auto fill_angles = [&](double alpha, double beta, double gamma) {
    fill(3, alpha);
    fill(4, beta);
    fill(5, gamma);
  };
  switch (sg.crystal_system()) {
    case gemmi::CrystalSystem::Cubic:
      fill_lengths(3);
      fill_angles(90, 90, 90);
      break;
    case gemmi::CrystalSystem::Tetragonal:
      fill_lengths(2);
      fill_angles(90, 90, 90);
      break;
    case gemmi::CrystalSystem::Trigonal:
      if (sg.ext == 'R') {  // rhombohedral axes
        fill_lengths(3);
        double angle = first_known(3, 6);
        fill_angles(angle, angle, angle);
        break;
      }
      fill_lengths(2);
      fill_angles(90, 90, 120);
      break;
    case gemmi::CrystalSystem::Hexagonal:
      fill_lengths(2);
      fill_angles(90, 90, 120);
      break;
    case gemmi::CrystalSystem::Orthorhombic:
      fill_angles(90, 90, 90);
      break;
    case gemmi::CrystalSystem::Monoclinic:
      switch (sg.monoclinic_unique_axis()) {
        case 'a': fill(4, 90); fill(5, 90); break;
        case 'b': fill(3, 90); fill(5, 90); break;
        case 'c': fill(3, 90); fill(4, 90); break;
      }
      break;
    case gemmi::CrystalSystem::Triclinic:
      break;
  }
  for (double x : par)
    if (std::isnan(x))
      return false;
  return true;
}

} // namespace cifmill
