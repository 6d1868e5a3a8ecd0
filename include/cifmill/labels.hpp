// Copyright 2026 Global Phasing Ltd.
//
// Grouping of reflection column labels by their shape:
// value/sigma pairs, amplitude/phase pairs (map coefficients)
// and Hendrickson-Lattman quadruplets.

#ifndef CIFMILL_LABELS_HPP_
#define CIFMILL_LABELS_HPP_

#include <array>
#include <string>
#include <vector>
#include "miller.hpp"  // for ObservationType

namespace cifmill {

struct LabelPair {
  std::string first;   // value or amplitude
  std::string second;  // sigma or phase
  ObservationType type;
};

/// Observation type from the label prefix (_refln.F_meas -> Amplitude, etc).
CIFMILL_DLL ObservationType guess_observation_type(const std::string& label);

/// Rules, in this order:
///  1. <stem>.SIG<tail> pairs with <stem>.<tail>  (F(+) and SIGF(+))
///  2. <stem>_sigma<tail> pairs with <stem><tail>
///  3. <stem>_meas<tail> and <stem>_calc<tail> pair with <stem>_sigma<tail>;
///     one sigma column may serve both.
/// Paired labels are removed from remaining.
CIFMILL_DLL std::vector<LabelPair>
match_sigma_pairs(std::vector<std::string>& remaining);

/// Rules, in this order (phase label -> amplitude label):
///  1. <head>PH<x><tail> -> <head with PH->F><x><tail>, x != I  (PHWT -> FWT)
///  2. <head>PHI<tail> -> <head with PHI->F><tail>  (PHIC -> FC)
///  3. <head>PH<x>...WT -> <head><x>...FWT  (PHDELWT -> DELFWT)
///  4. <head>.phase_<tail> -> any label containing <head>.F_<tail>
/// Paired labels are removed from remaining.
CIFMILL_DLL std::vector<LabelPair>
match_map_coefficients(std::vector<std::string>& remaining);

/// Labels <head>HL<infix>{A,B,C,D}<suffix> (letters in any case) that share
/// infix and suffix. Only complete groups of four are used; they are
/// returned in the order A, B, C, D and removed from remaining.
CIFMILL_DLL std::vector<std::array<std::string, 4>>
match_hl_quadruplets(std::vector<std::string>& remaining);

} // namespace cifmill
#endif
