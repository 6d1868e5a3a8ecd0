// Copyright 2026 Global Phasing Ltd.

#include <cifmill/labels.hpp>
#include <algorithm>  // for find, remove
#include <cctype>     // for toupper
#include <cstring>    // for strchr
#include <gemmi/util.hpp>  // for starts_with, ends_with, in_vector
#include <cifmill/util.hpp>  // for replace_all

namespace cifmill {

namespace {

bool remove_label(std::vector<std::string>& labels, const std::string& label) {
  auto it = std::find(labels.begin(), labels.end(), label);
  if (it == labels.end())
    return false;
  labels.erase(it);
  return true;
}

// label split around the last occurrence of marker
struct Split {
  std::string label;
  std::string stem;
  std::string tail;
};

std::vector<Split> split_at_last(const std::vector<std::string>& labels,
                                 const std::string& marker) {
  std::vector<Split> result;
  for (const std::string& label : labels) {
    size_t pos = label.rfind(marker);
    if (pos != std::string::npos)
      result.push_back({label, label.substr(0, pos),
                        label.substr(pos + marker.size())});
  }
  return result;
}

// Pairs first=derived(second) for each label (in the order of labels).
template<typename Derive>
void pair_by_rule(const std::vector<std::string>& labels,
                  const std::vector<Split>& candidates, Derive derive,
                  bool substring, std::vector<std::string>& remaining,
                  std::vector<LabelPair>& pairs) {
  for (const std::string& label : labels)
    for (const Split& m : candidates) {
      std::string first = derive(m);
      bool ok = substring ? label.find(first) != std::string::npos
                          : label == first;
      if (ok && gemmi::in_vector(label, remaining) &&
          gemmi::in_vector(m.label, remaining) && label != m.label) {
        pairs.push_back({label, m.label, guess_observation_type(label)});
        remove_label(remaining, label);
        remove_label(remaining, m.label);
      }
    }
}

} // anonymous namespace

ObservationType guess_observation_type(const std::string& label) {
  static const struct {
    const char* prefix;
    ObservationType type;
  } table[] = {
    {"_refln.F_squared", ObservationType::Intensity},
    {"_refln_F_squared", ObservationType::Intensity},
    {"_refln.intensity", ObservationType::Intensity},
    {"_refln.I(+)", ObservationType::Intensity},
    {"_refln.I(-)", ObservationType::Intensity},
    {"_refln.F_calc", ObservationType::Amplitude},
    {"_refln.F_meas", ObservationType::Amplitude},
    {"_refln.FP", ObservationType::Amplitude},
    {"_refln.F-obs", ObservationType::Amplitude},
    {"_refln.Fobs", ObservationType::Amplitude},
    {"_refln.F-calc", ObservationType::Amplitude},
    {"_refln.Fcalc", ObservationType::Amplitude},
  };
  for (const auto& entry : table)
    if (gemmi::starts_with(label, entry.prefix))
      return entry.type;
  return ObservationType::Unknown;
}

std::vector<LabelPair> match_sigma_pairs(std::vector<std::string>& remaining) {
  std::vector<LabelPair> pairs;
  const std::vector<std::string> labels = remaining;

  // 1. _refln.SIGF(+) -> _refln.F(+)
  std::vector<Split> sig = split_at_last(remaining, ".SIG");
  pair_by_rule(labels, sig, [](const Split& m) { return m.stem + "." + m.tail; },
               false, remaining, pairs);

  // 2. _refln.F_meas_sigma_au -> _refln.F_meas_au
  std::vector<Split> sigma = split_at_last(remaining, "_sigma");
  pair_by_rule(labels, sigma, [](const Split& m) { return m.stem + m.tail; },
               false, remaining, pairs);

  // 3. _refln.F_squared_meas, _refln.F_squared_calc -> _refln.F_squared_sigma
  std::vector<Split> values = split_at_last(remaining, "_meas");
  for (const Split& m : split_at_last(remaining, "_calc"))
    values.push_back(m);
  std::vector<Split> sigmas = split_at_last(remaining, "_sigma");
  for (const Split& v : values)
    for (const Split& s : sigmas)
      if (v.stem == s.stem && v.tail == s.tail &&
          gemmi::in_vector(v.label, remaining)) {
        pairs.push_back({v.label, s.label, guess_observation_type(v.label)});
        remove_label(remaining, v.label);
        remove_label(remaining, s.label);
      }
  return pairs;
}

std::vector<LabelPair>
match_map_coefficients(std::vector<std::string>& remaining) {
  std::vector<LabelPair> pairs;
  const std::vector<std::string> labels = remaining;

  // 1. PH followed by anything but I: _refln.PHWT -> _refln.FWT
  std::vector<Split> ph;
  for (const std::string& label : remaining)
    for (size_t pos = label.rfind("PH"); pos != std::string::npos;
         pos = pos == 0 ? std::string::npos : label.rfind("PH", pos - 1))
      if (pos + 2 < label.size() && label[pos + 2] != 'I') {
        ph.push_back({label, label.substr(0, pos + 2), label.substr(pos + 2)});
        break;
      }
  pair_by_rule(labels, ph,
               [](const Split& m) { return replace_all(m.stem, "PH", "F") + m.tail; },
               false, remaining, pairs);

  // 2. _refln.PHIC -> _refln.FC, _refln.PHIC_ALL -> _refln.FC_ALL
  std::vector<Split> phi;
  for (const std::string& label : remaining) {
    size_t pos = label.rfind("PHI");
    if (pos != std::string::npos)
      phi.push_back({label, label.substr(0, pos + 3), label.substr(pos + 3)});
  }
  pair_by_rule(labels, phi,
               [](const Split& m) { return replace_all(m.stem, "PHI", "F") + m.tail; },
               false, remaining, pairs);

  // 3. _refln.PHDELWT -> _refln.DELFWT
  std::vector<Split> phdel;
  for (const std::string& label : remaining) {
    if (!gemmi::ends_with(label, "WT"))
      continue;
    for (size_t pos = label.rfind("PH"); pos != std::string::npos;
         pos = pos == 0 ? std::string::npos : label.rfind("PH", pos - 1))
      if (pos + 5 <= label.size() && label[pos + 2] != 'I') {
        phdel.push_back({label, label.substr(0, pos), label.substr(pos + 2)});
        break;
      }
  }
  pair_by_rule(labels, phdel,
               [](const Split& m) { return m.stem + replace_all(m.tail, "WT", "FWT"); },
               false, remaining, pairs);

  // 4. _refln.phase_calc -> _refln.F_calc, also _refln.F_calc_au
  std::vector<Split> phase = split_at_last(remaining, ".phase_");
  pair_by_rule(labels, phase,
               [](const Split& m) { return m.stem + ".F_" + m.tail; },
               true, remaining, pairs);
  return pairs;
}

std::vector<std::array<std::string, 4>>
match_hl_quadruplets(std::vector<std::string>& remaining) {
  struct HLMatch {
    std::string label;
    int letter;  // 0-3 for A-D
  };
  struct HLGroup {
    std::string infix;
    std::string suffix;
    std::vector<HLMatch> members;
  };
  std::vector<HLGroup> groups;
  for (const std::string& label : remaining) {
    size_t hl = label.rfind("HL");
    if (hl == std::string::npos)
      continue;
    size_t pos = std::string::npos;
    for (size_t i = label.size(); i-- > hl + 2; )
      if (std::strchr("abcdABCD", label[i])) {
        pos = i;
        break;
      }
    if (pos == std::string::npos)
      continue;
    std::string infix = label.substr(hl + 2, pos - hl - 2);
    std::string suffix = label.substr(pos + 1);
    int letter = std::toupper(label[pos]) - 'A';
    auto g = std::find_if(groups.begin(), groups.end(), [&](const HLGroup& x) {
        return x.infix == infix && x.suffix == suffix;
    });
    if (g == groups.end()) {
      groups.push_back({infix, suffix, {}});
      g = groups.end() - 1;
    }
    g->members.push_back({label, letter});
  }

  std::vector<std::array<std::string, 4>> quads;
  for (const HLGroup& g : groups) {
    if (g.members.size() != 4)
      continue;
    std::array<std::string, 4> quad;
    for (const HLMatch& m : g.members)
      quad[m.letter] = m.label;
    if (std::find(quad.begin(), quad.end(), std::string()) != quad.end())
      continue;
    for (const std::string& label : quad)
      remove_label(remaining, label);
    quads.push_back(quad);
  }
  return quads;
}

} // namespace cifmill
