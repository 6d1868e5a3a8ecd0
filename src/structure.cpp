// Copyright 2026 Global Phasing Ltd.

#include <cifmill/structure.hpp>
#include <initializer_list>
#include <cifmill/tags.hpp>    // for find_item
#include <cifmill/values.hpp>  // for column_as_doubles, float_or_nan

namespace cifmill {

namespace {

const char* const u_aniso_tags[6] = {
  "_atom_site_aniso_U_11", "_atom_site_aniso_U_22", "_atom_site_aniso_U_33",
  "_atom_site_aniso_U_12", "_atom_site_aniso_U_13", "_atom_site_aniso_U_23"
};
const char* const b_aniso_tags[6] = {
  "_atom_site_aniso_B_11", "_atom_site_aniso_B_22", "_atom_site_aniso_B_33",
  "_atom_site_aniso_B_12", "_atom_site_aniso_B_13", "_atom_site_aniso_B_23"
};

struct AnisoEntry {
  std::string label;
  SMat33<double> u;
};

// values of the first of the tags that is present and not all-null
std::vector<double> doubles_from_first(cif::Block& block,
                                       std::initializer_list<const char*> tags) {
  for (const char* tag : tags) {
    std::vector<double> v = column_as_doubles(find_item(block, tag));
    if (!v.empty())
      return v;
  }
  return {};
}

void check_length(size_t length, size_t expected, const char* tag) {
  if (length != 0 && length != expected)
    fail<InvalidValueError>("Number of values in ", tag, " (",
                            std::to_string(length), ") differs from the number"
                            " of atoms (", std::to_string(expected), ')');
}

std::string strip_zero_charge(std::string type) {
  for (const char* suffix : {"0+", "0-"})
    for (size_t pos; (pos = type.find(suffix)) != std::string::npos; )
      type.erase(pos, 2);
  return type;
}

std::vector<AnisoEntry> read_aniso(cif::Block& block) {
  std::vector<AnisoEntry> result;
  cif::Column u_cols[6], b_cols[6];
  int n_u = 0, n_b = 0;
  for (int i = 0; i < 6; ++i) {
    u_cols[i] = find_item(block, u_aniso_tags[i]);
    b_cols[i] = find_item(block, b_aniso_tags[i]);
    n_u += bool(u_cols[i]);
    n_b += bool(b_cols[i]);
  }
  const cif::Column* cols;
  double mult = 1.0;
  if (n_u == 6) {
    cols = u_cols;
  } else if (n_b == 6) {
    cols = b_cols;
    mult = 1.0 / gemmi::u_to_b();
  } else if (n_u + n_b == 0) {
    return result;
  } else {
    const char* const* tags = n_u >= n_b ? u_aniso_tags : b_aniso_tags;
    const cif::Column* given = n_u >= n_b ? u_cols : b_cols;
    std::string missing;
    for (int i = 0; i < 6; ++i)
      if (!given[i])
        missing += std::string(missing.empty() ? "" : ", ") + tags[i];
    fail<IncompleteADPError>("Some ADP items are missing in block ",
                             block.name, ": ", missing);
  }

  std::string label_tag;
  cif::Column labels = find_item(block, "_atom_site_aniso_label", label_tag);
  if (!labels)
    fail<IncompleteADPError>("ADPs given without _atom_site_aniso_label in"
                             " block ", block.name);
  for (int i = 0; i < 6; ++i)
    if (cols[i].length() != labels.length())
      fail<IncompleteADPError>("Length of ", column_tag(cols[i]),
                               " differs from length of ", label_tag);
  for (int row = 0; row < labels.length(); ++row) {
    bool all_unknown = true;
    for (int i = 0; i < 6; ++i)
      if (!cif::is_null(cols[i].at(row)))
        all_unknown = false;
    if (all_unknown)
      continue;
    double v[6];
    for (int i = 0; i < 6; ++i) {
      v[i] = float_or_nan(cols[i].at(row), column_tag(cols[i]));
      if (std::isnan(v[i]))
        fail<IncompleteADPError>("Incomplete ADPs for atom ", labels.str(row),
                                 ": ", column_tag(cols[i]), " is not given");
    }
    SMat33<double> u{v[0], v[1], v[2], v[3], v[4], v[5]};
    result.push_back({labels.str(row), u.scaled(mult)});
  }
  return result;
}

} // anonymous namespace

Structure build_structure(const cif::Block& block_, const Logger& logger) {
  cif::Block& block = const_cast<cif::Block&>(block_);
  Structure st;
  st.name = block.name;
  st.symmetry = build_symmetry(block, true, logger);
  const UnitCell& cell = st.symmetry.cell;

  // coordinates
  static const char* const fract_tags[3] = {
    "_atom_site_fract_x", "_atom_site_fract_y", "_atom_site_fract_z"
  };
  static const char* const cartn_tags[3] = {
    "_atom_site_Cartn_x", "_atom_site_Cartn_y", "_atom_site_Cartn_z"
  };
  std::vector<double> xyz[3];
  int n_axes = 0;
  for (int i = 0; i < 3; ++i) {
    xyz[i] = column_as_doubles(find_item(block, fract_tags[i]));
    n_axes += !xyz[i].empty();
  }
  if (n_axes == 0) {
    for (int i = 0; i < 3; ++i) {
      xyz[i] = column_as_doubles(find_item(block, cartn_tags[i]));
      n_axes += !xyz[i].empty();
    }
    st.from_cartesian = true;
  }
  if (n_axes != 3)
    fail<NoCoordinatesError>("No atomic coordinates could be found in block ",
                             block.name);
  size_t n_atoms = xyz[0].size();
  if (xyz[1].size() != n_atoms || xyz[2].size() != n_atoms)
    fail<NoCoordinatesError>("Coordinate columns in block ", block.name,
                             " have different lengths");

  cif::Column labels = find_item(block, "_atom_site_label");
  cif::Column types = find_item(block, "_atom_site_type_symbol");
  check_length(labels.length(), n_atoms, "_atom_site_label");
  check_length(types.length(), n_atoms, "_atom_site_type_symbol");
  std::vector<double> u_iso = doubles_from_first(block,
      {"_atom_site_U_iso_or_equiv", "_atom_site_U_equiv_geom_mean"});
  std::vector<double> b_iso = doubles_from_first(block,
      {"_atom_site_B_iso_or_equiv", "_atom_site_B_equiv_geom_mean"});
  std::vector<double> occupancy =
      column_as_doubles(find_item(block, "_atom_site_occupancy"));
  check_length(u_iso.size(), n_atoms, "_atom_site_U_iso_or_equiv");
  check_length(b_iso.size(), n_atoms, "_atom_site_B_iso_or_equiv");
  check_length(occupancy.size(), n_atoms, "_atom_site_occupancy");
  std::vector<AnisoEntry> aniso = read_aniso(block);

  st.scatterers.reserve(n_atoms);
  for (size_t i = 0; i != n_atoms; ++i) {
    Scatterer sc;
    if (labels)
      sc.label = labels.str(i);
    if (types)
      sc.scattering_type = strip_zero_charge(types.str(i));
    gemmi::Vec3 v(xyz[0][i], xyz[1][i], xyz[2][i]);
    if (std::isnan(v.x) || std::isnan(v.y) || std::isnan(v.z))
      fail<NoCoordinatesError>("No coordinates given for atom ",
                               sc.label.empty() ? std::to_string(i + 1) : sc.label,
                               " in block ", block.name);
    sc.fract = st.from_cartesian ? cell.fractionalize(gemmi::Position(v))
                                 : Fractional(v);
    if (!occupancy.empty())
      sc.occupancy = occupancy[i];

    const AnisoEntry* entry = nullptr;
    if (!sc.label.empty())
      for (const AnisoEntry& a : aniso)
        if (a.label == sc.label) {
          entry = &a;
          break;
        }
    if (entry) {
      sc.adp_type = AdpType::Aniso;
      sc.u_cif = entry->u;
      sc.u_star = u_cif_as_u_star(cell, entry->u);
    } else if (!u_iso.empty() && !std::isnan(u_iso[i])) {
      sc.adp_type = AdpType::Iso;
      sc.u_iso = u_iso[i];
    } else if (!b_iso.empty() && !std::isnan(b_iso[i])) {
      sc.adp_type = AdpType::Iso;
      sc.u_iso = b_iso[i] / gemmi::u_to_b();
    }
    st.scatterers.push_back(sc);
  }

  std::string wavelength_tag;
  cif::Column wavelength = find_item(block, "_diffrn_radiation_wavelength",
                                     wavelength_tag);
  if (wavelength && wavelength.length() > 0)
    st.wavelength = float_or_nan(wavelength[0], wavelength_tag);
  return st;
}

} // namespace cifmill
