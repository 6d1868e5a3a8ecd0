// Copyright 2026 Global Phasing Ltd.
//
// Internal helpers shared by the two reflection label strategies.

#ifndef CIFMILL_REFLN_IMPL_H_
#define CIFMILL_REFLN_IMPL_H_

#include <map>
#include <string>
#include <vector>
#include <cifmill/reflcif.hpp>
#include <cifmill/values.hpp>  // for NullInt

namespace cifmill {
namespace impl {

// wavelength id, crystal id and scale group code of one data subset;
// NullInt means "not used for selection"
struct IdCombo {
  int wavelength_id = NullInt;
  int crystal_id = NullInt;
  int scale_group = NullInt;
};

// A loop with Miller indices and its id columns.
struct ReflnLoop {
  const cif::Loop* loop = nullptr;
  std::vector<Miller> indices;
  // per-row ids; filled only if the column has more than one distinct value
  std::vector<int> wavelength_rows;
  std::vector<int> crystal_rows;
  std::vector<int> scale_group_rows;
  // distinct values; a single wavelength id is kept (no rows are selected
  // by it, but it determines the wavelength)
  std::vector<int> wavelength_ids{NullInt};
  std::vector<int> crystal_ids{NullInt};
  std::vector<int> scale_groups{NullInt};

  size_t length() const { return indices.size(); }
  const std::string& tag(int col) const { return loop->tags[col]; }
  const std::string& val(size_t row, int col) const { return loop->val(row, col); }
  int find_column(const std::string& tag) const { return loop->find_tag(tag); }

  std::vector<IdCombo> id_combos() const {
    std::vector<IdCombo> combos;
    for (int w : wavelength_ids)
      for (int c : crystal_ids)
        for (int s : scale_groups) {
          IdCombo ids;
          ids.wavelength_id = w;
          ids.crystal_id = c;
          ids.scale_group = s;
          combos.push_back(ids);
        }
    return combos;
  }

  bool row_selected(size_t row, const IdCombo& ids) const {
    return (wavelength_rows.empty() || ids.wavelength_id == NullInt ||
            wavelength_rows[row] == ids.wavelength_id) &&
           (crystal_rows.empty() || ids.crystal_id == NullInt ||
            crystal_rows[row] == ids.crystal_id) &&
           (scale_group_rows.empty() || ids.scale_group == NullInt ||
            scale_group_rows[row] == ids.scale_group);
  }
};

inline bool is_id_tag(const std::string& tag) {
  return gemmi::ends_with(tag, "wavelength_id") ||
         gemmi::ends_with(tag, "crystal_id") ||
         gemmi::ends_with(tag, "scale_group_code");
}

inline bool is_index_tag(const std::string& tag) {
  return tag.find("index_") != std::string::npos;
}

struct BuildContext {
  const Provenance& provenance;
  const std::map<int, double>& wavelengths;
  const CrystalSymmetry& symmetry;
  const Logger& logger;

  double wavelength(int id) const {
    auto it = wavelengths.find(id);
    return it != wavelengths.end() ? it->second : NAN;
  }
};

/// Throws MissingIndicesError or InvalidIndexError.
std::vector<ReflnLoop> find_refln_loops(const cif::Block& block);

/// Rows that have a value (if keep_unknown is set, ? counts as a value)
/// and match the ids.
std::vector<size_t> select_rows(const ReflnLoop& rl, int col, const IdCombo& ids,
                                bool keep_unknown);

/// Makes an array from one column: integers if all selected values are
/// integers, otherwise real numbers, otherwise strings (from all rows).
/// Returns false if no rows are selected.
bool make_array(const ReflnLoop& rl, int col, const IdCombo& ids,
                bool keep_unknown, MillerArray& array);

/// Values of the selected rows as numbers; throws InvalidValueError.
std::vector<double> column_values(const ReflnLoop& rl, int col,
                                  const std::vector<size_t>& rows);

/// Returns false (and logs a warning) if the sizes differ.
bool check_sizes(size_t size1, size_t size2, const std::string& label1,
                 const std::string& label2, const Logger& logger);

RawLoop make_raw_loop(const ReflnLoop& rl);

void add_heuristic_arrays(const ReflnLoop& rl, const BuildContext& ctx,
                          ArrayCollection& arrays);

void add_pattern_arrays(const ReflnLoop& rl, const BuildContext& ctx,
                        ArrayCollection& arrays);

} // namespace impl
} // namespace cifmill
#endif
