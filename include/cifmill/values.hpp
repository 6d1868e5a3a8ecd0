// Copyright 2026 Global Phasing Ltd.
//
// Conversion of CIF values to numbers. A numeric value may be quoted and
// may have a standard uncertainty in brackets: 1.234(5), "0.5".
// The placeholders ? and . mean "not given", never zero.

#ifndef CIFMILL_VALUES_HPP_
#define CIFMILL_VALUES_HPP_

#include <cmath>    // for NAN, isnan
#include <climits>  // for INT_MIN
#include <string>
#include <vector>
#include <gemmi/cifdoc.hpp>  // for Column, is_null, as_string
#include "fail.hpp"

namespace cifmill {

namespace cif = gemmi::cif;

/// Marks an integer that is not given (? or .).
constexpr int NullInt = INT_MIN;

/// Returns NaN if the value can't be parsed (including ? and .).
CIFMILL_DLL double parse_float(const std::string& value);

/// Returns false if the value is not an integer; ? and . are not integers.
CIFMILL_DLL bool parse_int(const std::string& value, int& result);

/// Parses a numeric value of the given tag; ? and . give NaN,
/// anything else that is not a number throws InvalidValueError.
CIFMILL_DLL double float_or_nan(const std::string& value,
                                const std::string& tag);

/// All values of a column as numbers, with ? and . as NaN.
/// Throws InvalidValueError naming the tag and the bad literal.
/// An empty vector is returned if the column is absent or if
/// all its values are placeholders.
CIFMILL_DLL std::vector<double> column_as_doubles(const cif::Column& col);

/// All values of a column as integers, with ? and . as NullInt.
/// Empty if the column is absent or has only placeholders.
CIFMILL_DLL std::vector<int> column_as_ints(const cif::Column& col);

inline std::string column_tag(const cif::Column& col) {
  if (const std::string* tag = col.get_tag())
    return *tag;
  return std::string();
}

inline bool all_null(const cif::Column& col) {
  for (const std::string& v : col)
    if (!cif::is_null(v))
      return false;
  return true;
}

} // namespace cifmill
#endif
