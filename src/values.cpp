// Copyright 2026 Global Phasing Ltd.

#include <cifmill/values.hpp>
#include <gemmi/numb.hpp>   // for as_number
#include <gemmi/atox.hpp>   // for string_to_int

namespace cifmill {

double parse_float(const std::string& value) {
  if (cif::is_null(value))
    return NAN;
  return cif::as_number(cif::as_string(value));
}

bool parse_int(const std::string& value, int& result) {
  if (cif::is_null(value))
    return false;
  try {
    result = gemmi::string_to_int(cif::as_string(value), true);
  } catch (std::invalid_argument&) {
    return false;
  }
  return true;
}

double float_or_nan(const std::string& value, const std::string& tag) {
  if (cif::is_null(value))
    return NAN;
  double d = cif::as_number(cif::as_string(value));
  if (std::isnan(d))
    fail<InvalidValueError>("Invalid floating-point value for ", tag, ": ", value);
  return d;
}

std::vector<double> column_as_doubles(const cif::Column& col) {
  std::vector<double> result;
  if (!col || all_null(col))
    return result;
  std::string tag = column_tag(col);
  result.reserve(col.length());
  for (const std::string& v : col)
    result.push_back(float_or_nan(v, tag));
  return result;
}

std::vector<int> column_as_ints(const cif::Column& col) {
  std::vector<int> result;
  if (!col || all_null(col))
    return result;
  result.reserve(col.length());
  for (const std::string& v : col) {
    int n = NullInt;
    if (!cif::is_null(v) && !parse_int(v, n))
      fail<InvalidValueError>("Invalid integer value for ", column_tag(col),
                              ": ", v);
    result.push_back(n);
  }
  return result;
}

} // namespace cifmill
