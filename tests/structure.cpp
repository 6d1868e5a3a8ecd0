#include "doctest.h"

#include <cmath>
#include <string>
#include <gemmi/cif.hpp>   // for read_string
#include <gemmi/math.hpp>  // for u_to_b
#include <cifmill/structure.hpp>

namespace cif = gemmi::cif;
using cifmill::AdpType;
using cifmill::Scatterer;
using cifmill::Structure;

static const char* cubic10 =
  "data_s\n"
  "_space_group_IT_number 1\n"
  "_cell_length_a 10 _cell_length_b 10 _cell_length_c 10\n"
  "_cell_angle_alpha 90 _cell_angle_beta 90 _cell_angle_gamma 90\n";

static Structure structure_from(const std::string& text) {
  cif::Document doc = cif::read_string(text);
  return cifmill::build_structure(doc.blocks.at(0));
}

TEST_CASE("anisotropic ADPs for some atoms") {
  Structure st = structure_from(std::string(cubic10) +
    "_diffrn_radiation_wavelength 0.71073\n"
    "loop_\n"
    "_atom_site_label _atom_site_type_symbol\n"
    "_atom_site_fract_x _atom_site_fract_y _atom_site_fract_z\n"
    "_atom_site_U_iso_or_equiv _atom_site_occupancy\n"
    "C1 C 0.1 0.2 0.3 0.02 1\n"
    "O1 O0+ 0.4 0.5 0.6 0.03 1\n"
    "N1 N 0.7 0.8 0.9 0.04 0.5\n"
    "S1 S 0.15 0.25 0.35 ? ?\n"
    "loop_\n"
    "_atom_site_aniso_label\n"
    "_atom_site_aniso_U_11 _atom_site_aniso_U_22 _atom_site_aniso_U_33\n"
    "_atom_site_aniso_U_12 _atom_site_aniso_U_13 _atom_site_aniso_U_23\n"
    "C1 0.01 0.02 0.03 0 0 0\n"
    "O1 0.02 0.02 0.02 0.001 0 0\n");
  REQUIRE(st.scatterers.size() == 4);
  CHECK_EQ(st.wavelength, doctest::Approx(0.71073));
  CHECK(!st.from_cartesian);

  const Scatterer* c1 = st.find_scatterer("C1");
  REQUIRE(c1 != nullptr);
  CHECK(c1->adp_type == AdpType::Aniso);
  CHECK_EQ(c1->u_cif.u33, doctest::Approx(0.03));
  CHECK_EQ(c1->u_star.u11, doctest::Approx(0.01 / 100));
  CHECK_EQ(c1->fract.y, doctest::Approx(0.2));

  const Scatterer* o1 = st.find_scatterer("O1");
  REQUIRE(o1 != nullptr);
  CHECK(o1->adp_type == AdpType::Aniso);
  CHECK_EQ(o1->scattering_type, "O");
  CHECK_EQ(o1->u_cif.u12, doctest::Approx(0.001));

  const Scatterer* n1 = st.find_scatterer("N1");
  REQUIRE(n1 != nullptr);
  CHECK(n1->adp_type == AdpType::Iso);
  CHECK_EQ(n1->u_iso, doctest::Approx(0.04));
  CHECK_EQ(n1->occupancy, 0.5);

  const Scatterer* s1 = st.find_scatterer("S1");
  REQUIRE(s1 != nullptr);
  CHECK(s1->adp_type == AdpType::None);
  CHECK(std::isnan(s1->u_iso));
  CHECK(!s1->has_occupancy());
}

TEST_CASE("isotropic B and anisotropic B") {
  Structure st = structure_from(std::string(cubic10) +
    "loop_\n"
    "_atom_site.label _atom_site.fract_x _atom_site.fract_y _atom_site.fract_z\n"
    "_atom_site.B_iso_or_equiv\n"
    "Fe1 0 0 0 3.0\n"
    "Fe2 0.5 0.5 0.5 4.0\n"
    "loop_\n"
    "_atom_site_aniso.label\n"
    "_atom_site_aniso.B_11 _atom_site_aniso.B_22 _atom_site_aniso.B_33\n"
    "_atom_site_aniso.B_12 _atom_site_aniso.B_13 _atom_site_aniso.B_23\n"
    "Fe2 2 3 4 0 0 0\n");
  REQUIRE(st.scatterers.size() == 2);
  CHECK(st.scatterers[0].adp_type == AdpType::Iso);
  CHECK_EQ(st.scatterers[0].u_iso, doctest::Approx(3.0 / gemmi::u_to_b()));
  CHECK(st.scatterers[1].adp_type == AdpType::Aniso);
  CHECK_EQ(st.scatterers[1].u_cif.u22, doctest::Approx(3.0 / gemmi::u_to_b()));
}

TEST_CASE("Cartesian coordinates") {
  Structure st = structure_from(std::string(cubic10) +
    "loop_\n"
    "_atom_site_label _atom_site_Cartn_x _atom_site_Cartn_y _atom_site_Cartn_z\n"
    "A 1 2 3\n"
    "B 5 5 5\n");
  CHECK(st.from_cartesian);
  REQUIRE(st.scatterers.size() == 2);
  CHECK_EQ(st.scatterers[0].fract.x, doctest::Approx(0.1));
  CHECK_EQ(st.scatterers[0].fract.z, doctest::Approx(0.3));
  CHECK_EQ(st.scatterers[1].fract.y, doctest::Approx(0.5));
  CHECK(st.scatterers[1].adp_type == AdpType::None);
}

TEST_CASE("errors in atom sites") {
  CHECK_THROWS_AS(structure_from(std::string(cubic10) +
      "loop_ _atom_site_label _atom_site_type_symbol C1 C O1 O\n"),
      cifmill::NoCoordinatesError);
  CHECK_THROWS_AS(structure_from(std::string(cubic10) +
      "loop_ _atom_site_label _atom_site_fract_x _atom_site_fract_y"
      " _atom_site_fract_z C1 0.1 ? 0.3\n"),
      cifmill::NoCoordinatesError);
  CHECK_THROWS_AS(structure_from(
      "data_n\nloop_ _atom_site_label _atom_site_fract_x _atom_site_fract_y"
      " _atom_site_fract_z C1 0.1 0.2 0.3\n"),
      cifmill::MissingSymmetryError);
  CHECK_THROWS_AS(structure_from(std::string(cubic10) +
      "loop_ _atom_site_label _atom_site_fract_x _atom_site_fract_y"
      " _atom_site_fract_z C1 0.1 0.2 0.3\n"
      "loop_ _atom_site_aniso_label _atom_site_aniso_U_11 _atom_site_aniso_U_22"
      " _atom_site_aniso_U_33 _atom_site_aniso_U_12 _atom_site_aniso_U_13\n"
      "C1 0.01 0.02 0.03 0 0\n"),
      cifmill::IncompleteADPError);
  try {
    structure_from(std::string(cubic10) +
      "loop_ _atom_site_label _atom_site_fract_x _atom_site_fract_y"
      " _atom_site_fract_z _atom_site_U_iso_or_equiv\n"
      "C1 0.1 0.2 0.3 0.0x1\n");
    FAIL("no exception");
  } catch (cifmill::InvalidValueError& e) {
    std::string msg = e.what();
    CHECK(msg.find("_atom_site_U_iso_or_equiv") != std::string::npos);
    CHECK(msg.find("0.0x1") != std::string::npos);
  }
}
