// Copyright 2026 Global Phasing Ltd.

#include <cifmill/reflcif.hpp>
#include <set>
#include <gemmi/util.hpp>   // for starts_with
#include "refln_impl.h"

namespace cifmill {

namespace impl {

namespace {

void read_id_columns(ReflnLoop& rl) {
  const cif::Loop& loop = *rl.loop;
  for (size_t col = 0; col != loop.width(); ++col) {
    const std::string& tag = loop.tags[col];
    if (!is_id_tag(tag))
      continue;
    std::vector<int> values(rl.length(), NullInt);
    std::set<int> distinct;
    for (size_t row = 0; row != rl.length(); ++row) {
      const std::string& v = loop.val(row, col);
      if (cif::is_null(v))
        continue;
      if (!parse_int(v, values[row]))
        fail<InvalidValueError>("Invalid integer value for ", tag, ": ", v);
      distinct.insert(values[row]);
    }
    if (distinct.empty())
      continue;
    std::vector<int> ids(distinct.begin(), distinct.end());
    bool is_wavelength = gemmi::ends_with(tag, "wavelength_id");
    if (is_wavelength)
      rl.wavelength_ids = ids;
    if (ids.size() == 1)
      continue;
    if (is_wavelength) {
      rl.wavelength_rows = std::move(values);
    } else if (gemmi::ends_with(tag, "crystal_id")) {
      rl.crystal_rows = std::move(values);
      rl.crystal_ids = ids;
    } else {
      rl.scale_group_rows = std::move(values);
      rl.scale_groups = ids;
    }
  }
}

std::string raw_column_name(const std::string& tag) {
  for (const char* prefix : {"_refln.", "_refln_"})
    if (gemmi::starts_with(tag, prefix))
      return tag.substr(7);
  return tag;
}

} // anonymous namespace

std::vector<ReflnLoop> find_refln_loops(const cif::Block& block) {
  std::vector<ReflnLoop> loops;
  for (const cif::Item& item : block.items) {
    if (item.type != cif::ItemType::Loop)
      continue;
    const cif::Loop& loop = item.loop;
    for (const std::string& tag : loop.tags) {
      size_t pos = tag.find("index_h");
      if (pos == std::string::npos)
        continue;
      int cols[3];
      std::string hkl_tags[3];
      for (int i = 0; i < 3; ++i) {
        hkl_tags[i] = tag;
        hkl_tags[i][pos + 6] = "hkl"[i];
        cols[i] = loop.find_tag(hkl_tags[i]);
        if (cols[i] < 0)
          fail<MissingIndicesError>("Miller indices missing from block ",
                                    block.name, " (", hkl_tags[i], ')');
      }
      ReflnLoop rl;
      rl.loop = &loop;
      rl.indices.resize(loop.length());
      for (size_t row = 0; row != loop.length(); ++row)
        for (int i = 0; i < 3; ++i) {
          const std::string& v = loop.val(row, cols[i]);
          if (!parse_int(v, rl.indices[row][i]))
            fail<InvalidIndexError>("Invalid item for Miller index ", "HKL"[i],
                                    " in ", hkl_tags[i], ": ", v);
        }
      read_id_columns(rl);
      loops.push_back(std::move(rl));
      break;
    }
  }
  return loops;
}

std::vector<size_t> select_rows(const ReflnLoop& rl, int col, const IdCombo& ids,
                                bool keep_unknown) {
  std::vector<size_t> rows;
  for (size_t row = 0; row != rl.length(); ++row) {
    const std::string& v = rl.val(row, col);
    if (v == "." || (v == "?" && !keep_unknown))
      continue;
    if (rl.row_selected(row, ids))
      rows.push_back(row);
  }
  return rows;
}

bool make_array(const ReflnLoop& rl, int col, const IdCombo& ids,
                bool keep_unknown, MillerArray& array) {
  array = MillerArray();
  std::vector<size_t> rows = select_rows(rl, col, ids, keep_unknown);
  bool ok = true;
  array.ints.reserve(rows.size());
  for (size_t row : rows) {
    int n;
    if (!parse_int(rl.val(row, col), n)) {
      ok = false;
      break;
    }
    array.ints.push_back(n);
  }
  if (ok) {
    array.kind = DataKind::Integer;
  } else {
    array.ints.clear();
    ok = true;
    array.reals.reserve(rows.size());
    for (size_t row : rows) {
      const std::string& v = rl.val(row, col);
      double d = parse_float(v);
      if (std::isnan(d) && v != "?") {
        ok = false;
        break;
      }
      array.reals.push_back(d);
    }
    if (ok) {
      array.kind = DataKind::Real;
    } else {
      // text data: all rows are kept, including placeholders
      array.reals.clear();
      array.kind = DataKind::String;
      rows.resize(rl.length());
      for (size_t row = 0; row != rl.length(); ++row) {
        const std::string& v = rl.val(row, col);
        rows[row] = row;
        array.strings.push_back(cif::is_null(v) ? v : cif::as_string(v));
      }
    }
  }
  if (rows.empty())
    return false;
  array.indices.reserve(rows.size());
  for (size_t row : rows)
    array.indices.push_back(rl.indices[row]);
  array.anomalous = has_friedel_mates(array.indices);
  return true;
}

std::vector<double> column_values(const ReflnLoop& rl, int col,
                                  const std::vector<size_t>& rows) {
  std::vector<double> result;
  result.reserve(rows.size());
  for (size_t row : rows)
    result.push_back(float_or_nan(rl.val(row, col), rl.tag(col)));
  return result;
}

bool check_sizes(size_t size1, size_t size2, const std::string& label1,
                 const std::string& label2, const Logger& logger) {
  if (size1 == size2)
    return true;
  logger.level<3>("Warning: Miller arrays '", label1, "' and '", label2,
                  "' are of different sizes");
  return false;
}

RawLoop make_raw_loop(const ReflnLoop& rl) {
  RawLoop raw;
  raw.indices = rl.indices;
  for (size_t col = 0; col != rl.loop->width(); ++col) {
    const std::string& tag = rl.tag(col);
    if (is_index_tag(tag) || is_id_tag(tag))
      continue;
    RawColumn rc;
    rc.name = raw_column_name(tag);
    rc.numeric = true;
    rc.values.reserve(rl.length());
    for (size_t row = 0; row != rl.length(); ++row) {
      const std::string& v = rl.val(row, col);
      double d = parse_float(v);
      if (std::isnan(d) && !cif::is_null(v)) {
        rc.numeric = false;
        break;
      }
      rc.values.push_back(d);
    }
    if (!rc.numeric) {
      rc.values.clear();
      rc.strings.reserve(rl.length());
      for (size_t row = 0; row != rl.length(); ++row) {
        const std::string& v = rl.val(row, col);
        rc.strings.push_back(cif::is_null(v) ? v : cif::as_string(v));
      }
    }
    raw.columns.push_back(std::move(rc));
  }
  return raw;
}

} // namespace impl

std::map<int, double> read_wavelengths(const cif::Block& block_) {
  cif::Block& block = const_cast<cif::Block&>(block_);
  std::map<int, double> result;
  cif::Column ids = block.find_values("_diffrn_radiation_wavelength.id");
  cif::Column values = block.find_values("_diffrn_radiation_wavelength.wavelength");
  if (!ids && !values) {
    ids = block.find_values("_diffrn_radiation_wavelength_id");
    values = block.find_values("_diffrn_radiation_wavelength");
  }
  if (!ids || !values || ids.length() != values.length())
    return result;
  for (int i = 0; i != ids.length(); ++i) {
    int id;
    double wavelength = parse_float(values[i]);
    if (parse_int(ids[i], id) && !std::isnan(wavelength))
      result.emplace(id, wavelength);
  }
  return result;
}

ReflectionData build_arrays(const cif::Block& block,
                            const Provenance& provenance,
                            const std::map<int, double>& wavelengths,
                            LabelStrategy strategy,
                            const Logger& logger) {
  ReflectionData data;
  data.name = block.name;
  data.symmetry = build_symmetry(block, false, logger);
  data.symmetry.join(provenance.symmetry_from_file, true);
  impl::BuildContext ctx{provenance, wavelengths, data.symmetry, logger};
  for (const impl::ReflnLoop& rl : impl::find_refln_loops(block)) {
    if (strategy == LabelStrategy::Pattern)
      impl::add_pattern_arrays(rl, ctx, data.arrays);
    else
      impl::add_heuristic_arrays(rl, ctx, data.arrays);
    data.raw_loops.push_back(impl::make_raw_loop(rl));
  }
  merge_anomalous_pairs(data.arrays, strategy == LabelStrategy::Pattern, logger);
  if (data.arrays.empty())
    fail<NoReflectionDataError>("No reflection data present in block ",
                                block.name);
  logger.mesg(std::to_string(data.arrays.size()), " Miller arrays from block ",
              block.name);
  return data;
}

} // namespace cifmill
