// Copyright 2026 Global Phasing Ltd.
//
// MillerArray - reflection indices with one data column (and sigmas),
// and ArrayCollection - insertion-ordered, keyed set of such arrays.

#ifndef CIFMILL_MILLER_HPP_
#define CIFMILL_MILLER_HPP_

#include <array>
#include <cmath>    // for NAN
#include <complex>
#include <string>
#include <utility>  // for pair, move
#include <vector>
#include <gemmi/logger.hpp>    // for Logger
#include <gemmi/unitcell.hpp>  // for Miller
#include <gemmi/util.hpp>      // for join_str
#include "fail.hpp"

namespace cifmill {

using gemmi::Logger;
using gemmi::Miller;

enum class ObservationType : unsigned char { Unknown, Amplitude, Intensity };

enum class DataKind : unsigned char {
  Integer, Real, Complex, HendricksonLattman, String
};

/// Hendrickson-Lattman coefficients A, B, C, D.
using HLCoeffs = std::array<double, 4>;

struct ArrayInfo {
  std::string source;
  std::string source_type;
  std::vector<std::string> labels;
  double wavelength = NAN;

  std::string label_string() const { return gemmi::join_str(labels, ','); }
  bool has_wavelength() const { return !std::isnan(wavelength); }
};

struct MillerArray {
  std::vector<Miller> indices;
  DataKind kind = DataKind::Real;
  // only the vector corresponding to kind is used
  std::vector<int> ints;
  std::vector<double> reals;
  std::vector<std::complex<double>> complexes;
  std::vector<HLCoeffs> hl;
  std::vector<std::string> strings;
  std::vector<double> sigmas;  // empty if there are no sigmas
  ObservationType observation_type = ObservationType::Unknown;
  bool anomalous = false;
  ArrayInfo info;

  size_t size() const { return indices.size(); }
  bool has_sigmas() const { return !sigmas.empty(); }
  bool is_numeric() const {
    return kind == DataKind::Integer || kind == DataKind::Real;
  }
  bool is_amplitude() const {
    return observation_type == ObservationType::Amplitude;
  }
  bool is_intensity() const {
    return observation_type == ObservationType::Intensity;
  }

  size_t data_size() const {
    switch (kind) {
      case DataKind::Integer: return ints.size();
      case DataKind::Real: return reals.size();
      case DataKind::Complex: return complexes.size();
      case DataKind::HendricksonLattman: return hl.size();
      case DataKind::String: return strings.size();
    }
    return 0;
  }

  void promote_to_real() {
    if (kind != DataKind::Integer)
      return;
    reals.assign(ints.begin(), ints.end());
    ints.clear();
    kind = DataKind::Real;
  }

  /// Data as real numbers. Strings are parsed; a value that is not
  /// a number throws InvalidValueError naming the tag and the value.
  CIFMILL_DLL std::vector<double> real_data(const std::string& tag) const;

  /// Amplitudes (absolute values of the data) with phases in degrees
  /// become complex data.
  CIFMILL_DLL void phase_transfer(const std::vector<double>& phases_deg);
};

/// True if the list contains both (h,k,l) and (-h,-k,-l) for some hkl != 000.
CIFMILL_DLL bool has_friedel_mates(const std::vector<Miller>& indices);

class ArrayCollection {
public:
  using value_type = std::pair<std::string, MillerArray>;

  MillerArray* find(const std::string& key) {
    for (value_type& item : items_)
      if (item.first == key)
        return &item.second;
    return nullptr;
  }
  const MillerArray* find(const std::string& key) const {
    return const_cast<ArrayCollection*>(this)->find(key);
  }
  bool contains(const std::string& key) const { return find(key) != nullptr; }

  /// Adds the array unless the key is already used; the array stored
  /// first under a key is kept. Returns the array stored under the key.
  MillerArray& add(const std::string& key, MillerArray&& array) {
    if (MillerArray* old = find(key))
      return *old;
    items_.emplace_back(key, std::move(array));
    return items_.back().second;
  }
  bool erase(const std::string& key) {
    for (auto it = items_.begin(); it != items_.end(); ++it)
      if (it->first == key) {
        items_.erase(it);
        return true;
      }
    return false;
  }
  std::vector<std::string> keys() const {
    std::vector<std::string> result;
    for (const value_type& item : items_)
      result.push_back(item.first);
    return result;
  }

  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  std::vector<value_type>::iterator begin() { return items_.begin(); }
  std::vector<value_type>::iterator end() { return items_.end(); }
  std::vector<value_type>::const_iterator begin() const { return items_.begin(); }
  std::vector<value_type>::const_iterator end() const { return items_.end(); }

private:
  std::vector<value_type> items_;
};

/// Joins arrays with keys that differ only by _plus/_minus
/// (and, if bare_signs is set, by +/-) into anomalous arrays.
/// Indices of the minus array are negated. Running it again is a no-op.
CIFMILL_DLL void merge_anomalous_pairs(ArrayCollection& arrays, bool bare_signs,
                                       const Logger& logger);

} // namespace cifmill
#endif
