#include "doctest.h"

#include <string>
#include <vector>
#include <cifmill/labels.hpp>

using cifmill::LabelPair;
using cifmill::ObservationType;

TEST_CASE("guess_observation_type") {
  CHECK(cifmill::guess_observation_type("_refln.F_squared_meas") ==
        ObservationType::Intensity);
  CHECK(cifmill::guess_observation_type("_refln_F_squared_calc") ==
        ObservationType::Intensity);
  CHECK(cifmill::guess_observation_type("_refln.I(-)") ==
        ObservationType::Intensity);
  CHECK(cifmill::guess_observation_type("_refln.F_meas_au") ==
        ObservationType::Amplitude);
  CHECK(cifmill::guess_observation_type("_refln.FP") ==
        ObservationType::Amplitude);
  CHECK(cifmill::guess_observation_type("_refln.FWT") ==
        ObservationType::Unknown);
  CHECK(cifmill::guess_observation_type("_refln.phase_calc") ==
        ObservationType::Unknown);
}

TEST_CASE("match_sigma_pairs") {
  std::vector<std::string> labels = {
    "_refln.F_meas_au", "_refln.F_meas_sigma_au",
    "_refln.F_squared_meas", "_refln.F_squared_calc", "_refln.F_squared_sigma",
    "_refln.I(+)", "_refln.SIGI(+)", "_refln.status"
  };
  std::vector<LabelPair> pairs = cifmill::match_sigma_pairs(labels);
  REQUIRE(pairs.size() == 4);
  CHECK_EQ(pairs[0].first, "_refln.I(+)");
  CHECK_EQ(pairs[0].second, "_refln.SIGI(+)");
  CHECK(pairs[0].type == ObservationType::Intensity);
  CHECK_EQ(pairs[1].first, "_refln.F_meas_au");
  CHECK_EQ(pairs[1].second, "_refln.F_meas_sigma_au");
  CHECK(pairs[1].type == ObservationType::Amplitude);
  // one sigma column shared by _meas and _calc
  CHECK_EQ(pairs[2].first, "_refln.F_squared_meas");
  CHECK_EQ(pairs[2].second, "_refln.F_squared_sigma");
  CHECK_EQ(pairs[3].first, "_refln.F_squared_calc");
  CHECK_EQ(pairs[3].second, "_refln.F_squared_sigma");
  CHECK(labels == std::vector<std::string>{"_refln.status"});
}

TEST_CASE("match_map_coefficients") {
  std::vector<std::string> labels = {
    "_refln.FC", "_refln.PHIC", "_refln.FC_ALL", "_refln.PHIC_ALL",
    "_refln.FWT", "_refln.PHWT", "_refln.DELFWT", "_refln.PHDELWT",
    "_refln.F_calc_au", "_refln.phase_calc", "_refln.FOM"
  };
  std::vector<LabelPair> pairs = cifmill::match_map_coefficients(labels);
  REQUIRE(pairs.size() == 5);
  CHECK_EQ(pairs[0].first, "_refln.FWT");
  CHECK_EQ(pairs[0].second, "_refln.PHWT");
  CHECK_EQ(pairs[1].first, "_refln.FC");
  CHECK_EQ(pairs[1].second, "_refln.PHIC");
  CHECK_EQ(pairs[2].first, "_refln.FC_ALL");
  CHECK_EQ(pairs[2].second, "_refln.PHIC_ALL");
  CHECK_EQ(pairs[3].first, "_refln.DELFWT");
  CHECK_EQ(pairs[3].second, "_refln.PHDELWT");
  CHECK_EQ(pairs[4].first, "_refln.F_calc_au");
  CHECK_EQ(pairs[4].second, "_refln.phase_calc");
  CHECK(labels == std::vector<std::string>{"_refln.FOM"});
}

TEST_CASE("match_hl_quadruplets") {
  std::vector<std::string> labels = {
    "_refln.HLBM", "_refln.HLAM", "_refln.HLDM", "_refln.HLCM",
    "_refln.HLanomA", "_refln.HLanomB", "_refln.HLanomC", "_refln.HLanomD",
    "_refln.HLCX", "_refln.FP"
  };
  auto quads = cifmill::match_hl_quadruplets(labels);
  REQUIRE(quads.size() == 2);
  CHECK_EQ(quads[0][0], "_refln.HLAM");
  CHECK_EQ(quads[0][1], "_refln.HLBM");
  CHECK_EQ(quads[0][2], "_refln.HLCM");
  CHECK_EQ(quads[0][3], "_refln.HLDM");
  CHECK_EQ(quads[1][0], "_refln.HLanomA");
  CHECK_EQ(quads[1][3], "_refln.HLanomD");
  CHECK(labels == std::vector<std::string>{"_refln.HLCX", "_refln.FP"});
}
