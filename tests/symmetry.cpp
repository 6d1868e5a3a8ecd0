#include "doctest.h"

#include <cmath>
#include <string>
#include <vector>
#include <gemmi/cif.hpp>  // for read_string
#include <cifmill/symcif.hpp>
#include <cifmill/tags.hpp>

namespace cif = gemmi::cif;
using cifmill::build_symmetry;
using cifmill::CrystalSymmetry;

static const char* p21c_cell = "_cell_length_a 5 _cell_length_b 6"
                               " _cell_length_c 7 _cell_angle_alpha 90"
                               " _cell_angle_beta 100 _cell_angle_gamma 90\n";

static CrystalSymmetry symmetry_from(const std::string& text, bool strict=true) {
  cif::Document doc = cif::read_string(text);
  return build_symmetry(doc.blocks.at(0), strict);
}

TEST_CASE("tag aliases") {
  const cifmill::TagAlias* alias =
    cifmill::find_tag_alias("_space_group_symop_operation_xyz");
  REQUIRE(alias != nullptr);
  CHECK_EQ(std::string(alias->synonyms[0]), "_symmetry_equiv_pos_as_xyz");
  CHECK(cifmill::find_tag_alias("_no_such_tag") == nullptr);

  cif::Document doc = cif::read_string("data_a _symmetry_Int_Tables_number 14");
  std::string found;
  cif::Column col = cifmill::find_item(doc.blocks[0], "_space_group_IT_number",
                                       found);
  REQUIRE(col);
  CHECK_EQ(found, "_symmetry_Int_Tables_number");
  CHECK_EQ(col[0], "14");
}

TEST_CASE("space group from operators, Hall, H-M and number") {
  std::string data = "data_x\n";
  data += p21c_cell;
  CrystalSymmetry from_ops = symmetry_from(data +
      "loop_ _space_group_symop_operation_xyz\n"
      "x,y,z -x,y+1/2,-z+1/2 -x,-y,-z x,-y+1/2,z+1/2\n");
  CrystalSymmetry from_hall = symmetry_from(data +
      "_space_group_name_Hall '-P 2ybc'\n");
  CrystalSymmetry from_hm = symmetry_from(data +
      "_symmetry_space_group_name_H-M 'P 1 21/c 1'\n");
  CrystalSymmetry from_number = symmetry_from(data +
      "_space_group_IT_number 14\n");
  std::vector<gemmi::Op> expected = from_number.ops.all_ops_sorted();
  CHECK_EQ(expected.size(), 4);
  CHECK(from_ops.ops.all_ops_sorted() == expected);
  CHECK(from_hall.ops.all_ops_sorted() == expected);
  CHECK(from_hm.ops.all_ops_sorted() == expected);
  REQUIRE(from_ops.spacegroup != nullptr);
  CHECK_EQ(from_ops.spacegroup->number, 14);
}

TEST_CASE("centred group from operators") {
  CrystalSymmetry cs = symmetry_from(
      "data_c2c\n"
      "_cell_length_a 10 _cell_length_b 8 _cell_length_c 12\n"
      "_cell_angle_alpha 90 _cell_angle_beta 105 _cell_angle_gamma 90\n"
      "loop_ _symmetry_equiv_pos_as_xyz\n"
      "x,y,z -x,y,-z+1/2 -x,-y,-z x,-y,z+1/2\n"
      "x+1/2,y+1/2,z -x+1/2,y+1/2,-z+1/2 -x+1/2,-y+1/2,-z x+1/2,-y+1/2,z+1/2\n");
  CHECK_EQ(cs.ops.cen_ops.size(), 2);
  CHECK_EQ(cs.ops.sym_ops.size(), 4);
  REQUIRE(cs.spacegroup != nullptr);
  CHECK_EQ(cs.spacegroup->number, 15);
}

TEST_CASE("two operators and a cubic cell") {
  CrystalSymmetry cs = symmetry_from(
      "data_a\n"
      "loop_ _symmetry_equiv_pos_as_xyz x,y,z -x,-y,-z\n"
      "_cell_length_a 10 _cell_length_b 10 _cell_length_c 10\n"
      "_cell_angle_alpha 90 _cell_angle_beta 90 _cell_angle_gamma 90\n");
  CHECK_EQ(cs.ops.order(), 2);
  CHECK(cs.has_cell);
  CHECK_EQ(cs.cell.a, 10.0);
  CHECK_EQ(cs.cell.gamma, 90.0);
}

TEST_CASE("symmetry operator identifiers") {
  std::string data = "data_ids\n";
  data += p21c_cell;
  CrystalSymmetry cs = symmetry_from(data +
      "loop_ _space_group_symop.id _space_group_symop.operation_xyz\n"
      "1 x,y,z 2 -x,y+1/2,-z+1/2 3 -x,-y,-z 4 x,-y+1/2,z+1/2\n");
  const gemmi::Op* op = cs.find_symop(3);
  REQUIRE(op != nullptr);
  CHECK_EQ(op->triplet(), "-x,-y,-z");
  CHECK(cs.find_symop(5) == nullptr);

  CHECK_THROWS_AS(symmetry_from(data +
      "loop_ _space_group_symop_id _space_group_symop_operation_xyz\n"
      "1 x,y,z 1 -x,-y,-z\n"), cifmill::InvalidIdentifierError);
  CHECK_THROWS_AS(symmetry_from(data +
      "loop_ _space_group_symop_id _space_group_symop_operation_xyz\n"
      "0 x,y,z 1 -x,-y,-z\n"), cifmill::InvalidIdentifierError);
}

TEST_CASE("malformed operator") {
  std::string data = "data_bad\n";
  data += p21c_cell;
  try {
    symmetry_from(data + "loop_ _symmetry_equiv_pos_as_xyz x,y,z x,y,q\n");
    FAIL("no exception");
  } catch (cifmill::ParseError& e) {
    std::string msg = e.what();
    CHECK(msg.find("_symmetry_equiv_pos_as_xyz") != std::string::npos);
    CHECK(msg.find("x,y,q") != std::string::npos);
    CHECK(e.kind() == cifmill::ErrorKind::Parse);
  }
}

TEST_CASE("missing symmetry") {
  const char* text = "data_b\n"
                     "_cell_length_a ? _cell_length_b ? _cell_length_c ?\n";
  CHECK_THROWS_AS(symmetry_from(text, true), cifmill::MissingSymmetryError);
  CHECK_THROWS_AS(symmetry_from(text, true), cifmill::MissingDataError);
  CHECK_THROWS_AS(symmetry_from("data_c\n_space_group_IT_number 19\n", true),
                  cifmill::IncompleteCellError);
  CrystalSymmetry cs = symmetry_from("data_d\n_space_group_IT_number 19\n", false);
  CHECK(cs.has_group());
  CHECK(!cs.has_cell);
  CHECK(symmetry_from("data_e\n_entry.id e\n", false).empty());
}

TEST_CASE("looped cell parameters") {
  CHECK_THROWS_AS(symmetry_from(
      "data_l\n"
      "loop_ _cell_length_a _cell_length_b _cell_length_c\n"
      "10 10 10 20 20 20\n", false),
      cifmill::MalformedCellParameterError);
}

TEST_CASE("unknown angle means 90 degrees") {
  CrystalSymmetry cs = symmetry_from(
      "data_q\n_space_group_IT_number 1\n"
      "_cell_length_a 5 _cell_length_b 6 _cell_length_c 7\n"
      "_cell_angle_alpha ? _cell_angle_beta 100 _cell_angle_gamma 95\n");
  CHECK_EQ(cs.cell.alpha, 90.0);
  CHECK_EQ(cs.cell.beta, 100.0);
}

TEST_CASE("invalid cell values") {
  const char* base = "data_v\n_space_group_IT_number 1\n"
                     "_cell_angle_alpha 90 _cell_angle_beta 90"
                     " _cell_angle_gamma 90 _cell_length_b 6 _cell_length_c 7\n";
  try {
    symmetry_from(std::string(base) + "_cell_length_a abc\n");
    FAIL("no exception");
  } catch (cifmill::InvalidCellError& e) {
    std::string msg = e.what();
    CHECK(msg.find("_cell_length_a") != std::string::npos);
    CHECK(msg.find("abc") != std::string::npos);
  }
  CHECK_THROWS_AS(symmetry_from(std::string(base) + "_cell_length_a -5\n"),
                  cifmill::InvalidCellError);
  // su in brackets and quotes are accepted
  CrystalSymmetry cs = symmetry_from(std::string(base) + "_cell_length_a '5.02(3)'\n");
  CHECK_EQ(cs.cell.a, doctest::Approx(5.02));
}

TEST_CASE("cell parameters inferred from space group") {
  struct Case {
    const char* hm;
    double given[6];
  } cases[] = {
    {"P 1 2 1", {5, 6, 7, NAN, 110, NAN}},
    {"P 1 1 2", {5, 6, 7, NAN, NAN, 110}},
    {"P 21 21 21", {5, 6, 7, NAN, NAN, NAN}},
    {"P 41", {5, NAN, 7, NAN, NAN, NAN}},
    {"P 31", {5, NAN, 7, NAN, NAN, NAN}},
    {"R 3:R", {5, NAN, NAN, 75, NAN, NAN}},
    {"R 3:H", {5, NAN, 12, NAN, NAN, NAN}},
    {"P 63", {5, NAN, 7, NAN, NAN, NAN}},
    {"I 21 3", {9, NAN, NAN, NAN, NAN, NAN}},
  };
  for (const Case& c : cases) {
    const gemmi::SpaceGroup* sg = gemmi::find_spacegroup_by_name(c.hm);
    REQUIRE(sg != nullptr);
    double par[6];
    for (int i = 0; i < 6; ++i)
      par[i] = c.given[i];
    REQUIRE(cifmill::infer_cell_parameters(*sg, par));
    gemmi::UnitCell cell;
    cell.set(par[0], par[1], par[2], par[3], par[4], par[5]);
    CHECK_MESSAGE(cifmill::is_compatible_cell(sg->operations(), cell), c.hm);
  }
  double partial[6] = {5, NAN, NAN, NAN, NAN, NAN};
  CHECK(!cifmill::infer_cell_parameters(*gemmi::find_spacegroup_by_number(19),
                                        partial));

  CrystalSymmetry cs = symmetry_from("data_t\n_space_group_IT_number 75\n"
                                     "_cell_length_a 50 _cell_length_c 80\n");
  CHECK_EQ(cs.cell.b, 50.0);
  CHECK_EQ(cs.cell.gamma, 90.0);
}

TEST_CASE("space group incompatible with cell") {
  try {
    symmetry_from("data_i\n_space_group_IT_number 75\n"
                  "_cell_length_a 10 _cell_length_b 12 _cell_length_c 14\n"
                  "_cell_angle_alpha 90 _cell_angle_beta 90 _cell_angle_gamma 90\n");
    FAIL("no exception");
  } catch (cifmill::IncompatibleSymmetryError& e) {
    std::string msg = e.what();
    CHECK(msg.find("P 4") != std::string::npos);
    CHECK(msg.find("Unit cell") != std::string::npos);
  }
}

TEST_CASE("next source used when Hall symbol is bad") {
  std::vector<std::string> messages;
  gemmi::Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  logger.threshold = 8;
  cif::Document doc = cif::read_string(std::string("data_h\n") +
      "_space_group.name_Hall 'Q 9z'\n"
      "_space_group.name_H-M_alt 'P 1 21/c 1'\n" + p21c_cell);
  CrystalSymmetry cs = build_symmetry(doc.blocks[0], true, logger);
  REQUIRE(cs.spacegroup != nullptr);
  CHECK_EQ(cs.spacegroup->number, 14);
  CHECK_EQ(cs.ops.order(), 4);
  REQUIRE(!messages.empty());
  CHECK(messages[0].find("Q 9z") != std::string::npos);

  // bad H-M symbol too, the number is used
  cs = symmetry_from(std::string("data_n\n") +
      "_space_group.name_Hall 'Q 9z'\n"
      "_space_group.name_H-M_alt 'X 99'\n"
      "_space_group.IT_number 14\n" + p21c_cell);
  REQUIRE(cs.spacegroup != nullptr);
  CHECK_EQ(cs.spacegroup->number, 14);
}

TEST_CASE("centred group with cell of primitive setting") {
  // C 1 2 1 with a=10 b=8 c=12, cell given for the primitive lattice
  std::vector<std::string> messages;
  gemmi::Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  logger.threshold = 5;
  cif::Document doc = cif::read_string(
      "data_c2\n_space_group_IT_number 5\n"
      "_cell_length_a 6.40312 _cell_length_b 6.40312 _cell_length_c 12\n"
      "_cell_angle_alpha 78.34 _cell_angle_beta 78.34"
      " _cell_angle_gamma 77.3196\n");
  CrystalSymmetry cs;
  CHECK_NOTHROW(cs = build_symmetry(doc.blocks[0], true, logger));
  CHECK(cs.has_group());
  CHECK(cs.has_cell);
  // centring vectors are gone
  CHECK_EQ(cs.ops.cen_ops.size(), 1);
  CHECK_EQ(cs.ops.sym_ops.size(), 2);
  CHECK(cifmill::is_compatible_cell(cs.ops, cs.cell));
  REQUIRE(messages.size() == 1);
  CHECK(messages[0].find("primitive setting") != std::string::npos);
}

TEST_CASE("join symmetry") {
  CrystalSymmetry a = symmetry_from("data_a\n_space_group_IT_number 19\n", false);
  CrystalSymmetry b = symmetry_from("data_b\n_space_group_IT_number 1\n"
      "_cell_length_a 5 _cell_length_b 6 _cell_length_c 7\n"
      "_cell_angle_alpha 90 _cell_angle_beta 90 _cell_angle_gamma 90\n");
  CrystalSymmetry c = a;
  c.join(b, false);
  CHECK_EQ(c.spacegroup->number, 19);
  CHECK(c.has_cell);
  c.join(b, true);
  CHECK_EQ(c.spacegroup->number, 1);
}
