// Copyright 2026 Global Phasing Ltd.
//
// Heuristic grouping of reflection columns: columns are visited in sorted
// order and a sigma, phase, B-part or HL column is attached to the array
// made from a column visited earlier.

#include <algorithm>  // for sort
#include <cifmill/util.hpp>  // for contains, replace_all, rstrip_suffix
#include "refln_impl.h"

namespace cifmill {
namespace impl {

namespace {

std::string key_suffix_for(const IdCombo& ids, std::vector<std::string>& labels) {
  std::string suffix;
  if (ids.wavelength_id != NullInt) {
    suffix += "_" + std::to_string(ids.wavelength_id);
    labels.insert(labels.begin(), "wavelength_id=" + std::to_string(ids.wavelength_id));
  }
  if (ids.crystal_id != NullInt) {
    suffix += "_" + std::to_string(ids.crystal_id);
    labels.insert(labels.begin(), "crystal_id=" + std::to_string(ids.crystal_id));
  }
  if (ids.scale_group != NullInt) {
    suffix += "_" + std::to_string(ids.scale_group);
    labels.insert(labels.begin(), "scale_group_code=" + std::to_string(ids.scale_group));
  }
  return suffix;
}

void set_observation_type(MillerArray& array, const std::string& key,
                          const std::string& key_suffix) {
  if (!array.is_numeric())
    return;
  std::string stem = key;
  for (const std::string& s : {key_suffix, std::string("_au"), std::string("_meas"),
                               std::string("_calc"), std::string("_plus"),
                               std::string("_minus")})
    stem = rstrip_suffix(stem, s);
  using gemmi::ends_with;
  if (ends_with(stem, "F_squared") || ends_with(stem, "intensity") ||
      ends_with(stem, ".I") || ends_with(stem, "_I"))
    array.observation_type = ObservationType::Intensity;
  else if (ends_with(stem, "F"))
    array.observation_type = ObservationType::Amplitude;
}

void set_complex(MillerArray& array, const std::vector<double>& a_part,
                 const std::vector<double>& b_part) {
  array.complexes.resize(a_part.size());
  for (size_t i = 0; i != a_part.size(); ++i)
    array.complexes[i] = std::complex<double>(a_part[i], b_part[i]);
  array.ints.clear();
  array.reals.clear();
  array.strings.clear();
  array.kind = DataKind::Complex;
}

// Adds an array made from one column (or from several related columns)
// for one combination of ids.
void add_array(const ReflnLoop& rl, int col, const IdCombo& ids,
               const BuildContext& ctx, ArrayCollection& arrays) {
  const std::string& label = rl.tag(col);
  std::vector<std::string> labels(1, label);
  std::string key_suffix = key_suffix_for(ids, labels);
  double wavelength = ctx.wavelength(ids.wavelength_id);
  std::string key = label + key_suffix;
  if (arrays.contains(key))
    return;
  MillerArray array;
  if (!make_array(rl, col, ids, false, array))
    return;

  if (contains(key, "_sigma")) {
    std::string value_label;
    for (const char* suffix : {"", "_meas", "_calc"}) {
      std::string candidate = replace_all(label, "_sigma", suffix);
      if (rl.find_column(candidate) >= 0) {
        value_label = candidate;
        break;
      }
    }
    if (!value_label.empty()) {
      key = value_label + key_suffix;
      MillerArray* value = arrays.find(key);
      if (value && !value->has_sigmas()) {
        if (!check_sizes(value->size(), array.size(), key, label, ctx.logger))
          return;
        value->sigmas = array.real_data(label);
        value->info.labels.push_back(label);
        value->info.wavelength = wavelength;
        return;
      }
    }
  } else if (contains(key, "PHWT")) {
    std::string fwt_label = replace_all(label, "PHWT", "FWT");
    if (rl.find_column(fwt_label) < 0)
      return;
    if (MillerArray* fwt = arrays.find(fwt_label + key_suffix)) {
      if (!check_sizes(fwt->size(), array.size(), fwt_label, label, ctx.logger))
        return;
      fwt->phase_transfer(array.real_data(label));
      fwt->info.labels.push_back(label);
      return;
    }
  } else if (contains(key, "HL_") && key.find("HL_") + 3 < key.size()) {
    std::string hl_key = key.substr(key.find("HL_"), 4);
    key = replace_all(key, hl_key, "HL_A");
    if (arrays.contains(key))
      return;
    std::string hl_labels[4];
    int hl_cols[4];
    bool complete = true;
    for (int i = 0; i < 4; ++i) {
      hl_labels[i] = replace_all(label, hl_key, std::string("HL_") + "ABCD"[i]);
      hl_cols[i] = rl.find_column(hl_labels[i]);
      if (hl_cols[i] < 0)
        complete = false;
    }
    if (complete) {
      std::vector<size_t> rows = select_rows(rl, hl_cols[0], ids, false);
      if (rows.empty())
        return;
      std::vector<double> hl_values[4];
      for (int i = 0; i < 4; ++i)
        hl_values[i] = column_values(rl, hl_cols[i], rows);
      array = MillerArray();
      array.kind = DataKind::HendricksonLattman;
      for (size_t i = 0; i != rows.size(); ++i) {
        array.indices.push_back(rl.indices[rows[i]]);
        array.hl.push_back({{hl_values[0][i], hl_values[1][i],
                             hl_values[2][i], hl_values[3][i]}});
      }
      array.anomalous = has_friedel_mates(array.indices);
      labels.pop_back();
      labels.insert(labels.end(), hl_labels, hl_labels + 4);
    }
  } else if (contains(key, ".B_") || contains(key, "_B_")) {
    const char* b = contains(key, ".B_") ? ".B_" : "_B_";
    const char* a = contains(key, ".B_") ? ".A_" : "_A_";
    std::string a_label = replace_all(label, b, a);
    if (rl.find_column(a_label) >= 0) {
      std::string a_key = replace_all(key, b, a);
      if (MillerArray* a_array = arrays.find(a_key)) {
        if (!check_sizes(a_array->size(), array.size(), a_key, label, ctx.logger))
          return;
        set_complex(*a_array, a_array->real_data(a_label), array.real_data(label));
        a_array->info.labels.push_back(label);
        return;
      }
    }
  } else if (contains(key, "phase_") && !contains(key, "_meas") &&
             ctx.symmetry.has_group()) {
    std::string amp_label = replace_all(label, "phase_", "F_");
    if (rl.find_column(amp_label) < 0)
      amp_label += "_au";
    int amp_col = rl.find_column(amp_label);
    if (amp_col >= 0) {
      key = amp_label + key_suffix;
      std::vector<double> phases = array.real_data(label);
      if (MillerArray* amp = arrays.find(key)) {
        if (!check_sizes(amp->size(), phases.size(), key, label, ctx.logger))
          return;
        amp->phase_transfer(phases);
        amp->info.labels.push_back(label);
        return;
      }
      // the amplitude column comes later in the sorted order
      if (!make_array(rl, amp_col, ids, false, array))
        return;
      if (!check_sizes(array.size(), phases.size(), key, label, ctx.logger))
        return;
      array.phase_transfer(phases);
      labels.back() = amp_label;
      labels.push_back(label);
    }
  }

  labels.insert(labels.begin(), ctx.provenance.labels.begin(),
                ctx.provenance.labels.end());
  set_observation_type(array, key, key_suffix);
  if (array.is_amplitude())
    array.promote_to_real();
  array.info.source = ctx.provenance.source;
  array.info.source_type = ctx.provenance.source_type;
  array.info.labels = std::move(labels);
  // only amplitudes get the wavelength here; intensities get it together
  // with sigmas
  if (array.is_amplitude())
    array.info.wavelength = wavelength;
  arrays.add(key, std::move(array));
}

} // anonymous namespace

void add_heuristic_arrays(const ReflnLoop& rl, const BuildContext& ctx,
                          ArrayCollection& arrays) {
  std::vector<int> columns(rl.loop->width());
  for (size_t i = 0; i != columns.size(); ++i)
    columns[i] = (int) i;
  std::sort(columns.begin(), columns.end(), [&](int a, int b) {
      return rl.tag(a) < rl.tag(b);
  });
  std::vector<IdCombo> combos = rl.id_combos();
  for (int col : columns) {
    if (is_index_tag(rl.tag(col)))
      continue;
    // id columns are read once, for all ids
    if (is_id_tag(rl.tag(col))) {
      add_array(rl, col, IdCombo(), ctx, arrays);
      continue;
    }
    for (const IdCombo& ids : combos)
      add_array(rl, col, ids, ctx, arrays);
  }
}

} // namespace impl
} // namespace cifmill
