// Copyright 2026 Global Phasing Ltd.

#include <cifmill/miller.hpp>
#include <set>
#include <gemmi/math.hpp>      // for rad
#include <cifmill/util.hpp>    // for contains, replace_all
#include <cifmill/values.hpp>  // for float_or_nan

namespace cifmill {

std::vector<double> MillerArray::real_data(const std::string& tag) const {
  switch (kind) {
    case DataKind::Integer:
      return std::vector<double>(ints.begin(), ints.end());
    case DataKind::Real:
      return reals;
    case DataKind::String: {
      std::vector<double> result;
      result.reserve(strings.size());
      for (const std::string& s : strings)
        result.push_back(float_or_nan(s, tag));
      return result;
    }
    default:
      fail<InvalidValueError>("Data of ", tag, " are not real numbers");
  }
}

void MillerArray::phase_transfer(const std::vector<double>& phases_deg) {
  std::vector<double> amplitudes = real_data(info.label_string());
  complexes.resize(amplitudes.size());
  for (size_t i = 0; i != amplitudes.size(); ++i) {
    double amp = std::fabs(amplitudes[i]);
    if (std::isnan(amp) || std::isnan(phases_deg[i]))
      complexes[i] = std::complex<double>(NAN, NAN);
    else
      complexes[i] = std::polar(amp, gemmi::rad(phases_deg[i]));
  }
  ints.clear();
  reals.clear();
  strings.clear();
  kind = DataKind::Complex;
}

bool has_friedel_mates(const std::vector<Miller>& indices) {
  std::set<Miller> seen(indices.begin(), indices.end());
  for (const Miller& hkl : indices)
    if ((hkl[0] != 0 || hkl[1] != 0 || hkl[2] != 0) &&
        seen.count(Miller{{-hkl[0], -hkl[1], -hkl[2]}}) != 0)
      return true;
  return false;
}

namespace {

template<typename T>
void append(std::vector<T>& dst, const std::vector<T>& src) {
  dst.insert(dst.end(), src.begin(), src.end());
}

// returns false if the data types can't be joined
bool append_array(MillerArray& dst, MillerArray& src) {
  if (dst.kind != src.kind) {
    if (!dst.is_numeric() || !src.is_numeric())
      return false;
    dst.promote_to_real();
    src.promote_to_real();
  }
  append(dst.indices, src.indices);
  append(dst.ints, src.ints);
  append(dst.reals, src.reals);
  append(dst.complexes, src.complexes);
  append(dst.hl, src.hl);
  append(dst.strings, src.strings);
  if (dst.has_sigmas() && src.has_sigmas())
    append(dst.sigmas, src.sigmas);
  else
    dst.sigmas.clear();
  return true;
}

} // anonymous namespace

void merge_anomalous_pairs(ArrayCollection& arrays, bool bare_signs,
                           const Logger& logger) {
  using gemmi::ends_with;
  for (const std::string& key : arrays.keys()) {
    bool minus_like = ends_with(key, "_minus") || contains(key, "_minus_") ||
                      (bare_signs && contains(key, "-"));
    bool plus_like = ends_with(key, "_plus") || contains(key, "_plus_") ||
                     (bare_signs && contains(key, "+"));
    if (!minus_like && !plus_like)
      continue;
    std::string plus_key, minus_key;
    if (contains(key, "_minus")) {
      minus_key = key;
      plus_key = replace_all(key, "_minus", "_plus");
    } else if (bare_signs && contains(key, "-")) {
      minus_key = key;
      plus_key = replace_all(key, "-", "+");
    } else if (contains(key, "_plus")) {
      plus_key = key;
      minus_key = replace_all(key, "_plus", "_minus");
    } else {
      plus_key = key;
      minus_key = replace_all(key, "+", "-");
    }
    const MillerArray* plus = arrays.find(plus_key);
    const MillerArray* minus = arrays.find(minus_key);
    if (!plus || !minus)
      continue;

    MillerArray merged = *plus;
    MillerArray minus_part = *minus;
    for (Miller& hkl : minus_part.indices)
      for (int& n : hkl)
        n = -n;
    if (!append_array(merged, minus_part)) {
      logger.level<3>("Warning: Miller arrays '", plus_key, "' and '",
                      minus_key, "' have different data types, not merged");
      continue;
    }
    merged.anomalous = true;
    merged.observation_type = plus->observation_type;
    merged.info = minus_part.info;
    merged.info.labels = plus->info.labels;
    for (const std::string& label : minus_part.info.labels)
      if (!gemmi::in_vector(label, merged.info.labels))
        merged.info.labels.push_back(label);
    arrays.erase(plus_key);
    arrays.erase(minus_key);
    arrays.add(key, std::move(merged));
  }
}

} // namespace cifmill
