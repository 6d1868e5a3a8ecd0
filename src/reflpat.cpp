// Copyright 2026 Global Phasing Ltd.

#include <cifmill/labels.hpp>
#include "refln_impl.h"

namespace cifmill {
namespace impl {

namespace {

struct PatternGroups {
  std::vector<LabelPair> sigma_pairs;
  std::vector<LabelPair> map_coefficients;
  std::vector<std::array<std::string, 4>> hl_quads;
  std::vector<std::string> remaining;
};

PatternGroups match_labels(const ReflnLoop& rl) {
  PatternGroups groups;
  for (const std::string& tag : rl.loop->tags)
    if (!is_index_tag(tag) && !is_id_tag(tag))
      groups.remaining.push_back(tag);
  groups.sigma_pairs = match_sigma_pairs(groups.remaining);
  groups.map_coefficients = match_map_coefficients(groups.remaining);
  groups.hl_quads = match_hl_quadruplets(groups.remaining);
  return groups;
}

// Labels that tell apart data from different wavelengths, crystals
// or scale groups of one loop.
std::vector<std::string> id_labels(const ReflnLoop& rl, const IdCombo& ids) {
  std::vector<std::string> labels;
  if (rl.wavelength_ids.size() > 1)
    labels.push_back("wavelength_id=" + std::to_string(ids.wavelength_id));
  if (rl.crystal_ids.size() > 1)
    labels.push_back("crys_id=" + std::to_string(ids.crystal_id));
  if (rl.scale_groups.size() > 1)
    labels.push_back("scale_group=" + std::to_string(ids.scale_group));
  return labels;
}

class PatternBuilder {
public:
  PatternBuilder(const ReflnLoop& rl, const IdCombo& ids,
                 const BuildContext& ctx, ArrayCollection& arrays)
    : rl_(rl), ids_(ids), ctx_(ctx), arrays_(arrays),
      suffix_(id_labels(rl, ids)) {}

  void add_single(const std::string& label) {
    MillerArray array;
    if (make(label, array))
      store(std::move(array), {label});
  }

  void add_sigma_pair(const LabelPair& pair) {
    MillerArray array, sigmas;
    if (!make(pair.first, array))
      return;
    if (!make(pair.second, sigmas) ||
        !check_sizes(array.size(), sigmas.size(), pair.first, pair.second,
                     ctx_.logger)) {
      store(std::move(array), {pair.first});
      add_single(pair.second);
      return;
    }
    array.sigmas = sigmas.real_data(pair.second);
    if (pair.type != ObservationType::Unknown) {
      array.observation_type = pair.type;
      array.promote_to_real();
    }
    store(std::move(array), {pair.first, pair.second});
  }

  void add_map_coefficients(const LabelPair& pair) {
    MillerArray array, phases;
    if (!make(pair.first, array) || !make(pair.second, phases))
      return;
    if (!check_sizes(array.size(), phases.size(), pair.first, pair.second,
                     ctx_.logger))
      return;
    array.phase_transfer(phases.real_data(pair.second));
    store(std::move(array), {pair.first, pair.second});
  }

  void add_hl(const std::array<std::string, 4>& labels) {
    int cols[4];
    for (int i = 0; i < 4; ++i)
      cols[i] = rl_.find_column(labels[i]);
    std::vector<size_t> rows = select_rows(rl_, cols[0], ids_, true);
    if (rows.empty())
      return;
    std::vector<double> values[4];
    for (int i = 0; i < 4; ++i)
      values[i] = column_values(rl_, cols[i], rows);
    MillerArray array;
    array.kind = DataKind::HendricksonLattman;
    for (size_t i = 0; i != rows.size(); ++i) {
      array.indices.push_back(rl_.indices[rows[i]]);
      array.hl.push_back({{values[0][i], values[1][i], values[2][i], values[3][i]}});
    }
    array.anomalous = has_friedel_mates(array.indices);
    store(std::move(array), std::vector<std::string>(labels.begin(), labels.end()));
  }

private:
  const ReflnLoop& rl_;
  IdCombo ids_;
  const BuildContext& ctx_;
  ArrayCollection& arrays_;
  std::vector<std::string> suffix_;

  bool make(const std::string& label, MillerArray& array) const {
    return make_array(rl_, rl_.find_column(label), ids_, true, array);
  }

  void store(MillerArray&& array, std::vector<std::string> labels) {
    labels.insert(labels.end(), suffix_.begin(), suffix_.end());
    array.info.source = ctx_.provenance.source;
    array.info.source_type = ctx_.provenance.source_type;
    array.info.labels = std::move(labels);
    array.info.wavelength = ctx_.wavelength(ids_.wavelength_id);
    std::string key = array.info.label_string();
    arrays_.add(key, std::move(array));
  }
};

} // anonymous namespace

void add_pattern_arrays(const ReflnLoop& rl, const BuildContext& ctx,
                        ArrayCollection& arrays) {
  PatternGroups groups = match_labels(rl);
  for (const IdCombo& ids : rl.id_combos()) {
    PatternBuilder builder(rl, ids, ctx, arrays);
    for (const LabelPair& pair : groups.sigma_pairs)
      builder.add_sigma_pair(pair);
    for (const LabelPair& pair : groups.map_coefficients)
      builder.add_map_coefficients(pair);
    for (const std::array<std::string, 4>& quad : groups.hl_quads)
      builder.add_hl(quad);
    for (const std::string& tag : rl.loop->tags)
      if (gemmi::in_vector(tag, groups.remaining))
        builder.add_single(tag);
  }
}

} // namespace impl
} // namespace cifmill
