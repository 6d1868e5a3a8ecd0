// Copyright 2026 Global Phasing Ltd.

#include <cifmill/tags.hpp>
#include <cstring>  // for strcmp

namespace cifmill {

namespace {

// Canonical tag and its older spellings (DDL1 core, mmCIF/DDL2, DDLm).
const TagAlias alias_table[] = {
  {"_space_group_symop_operation_xyz",
   {"_symmetry_equiv_pos_as_xyz", "_space_group_symop.operation_xyz",
    "_symmetry_equiv.pos_as_xyz", nullptr}},
  {"_space_group_symop_id",
   {"_symmetry_equiv_pos_site_id", "_space_group_symop.id",
    "_symmetry_equiv.id", nullptr}},
  {"_space_group_name_Hall",
   {"_symmetry_space_group_name_Hall", "_space_group.name_Hall",
    "_symmetry.space_group_name_Hall", nullptr}},
  {"_space_group_name_H-M_alt",
   {"_symmetry_space_group_name_H-M", "_space_group.name_H-M_alt",
    "_symmetry.space_group_name_H-M", nullptr}},
  {"_space_group_IT_number",
   {"_symmetry_Int_Tables_number", "_symmetry.Int_Tables_number",
    "_space_group.IT_number", nullptr}},
  {"_cell_length_a", {"_cell.length_a", nullptr}},
  {"_cell_length_b", {"_cell.length_b", nullptr}},
  {"_cell_length_c", {"_cell.length_c", nullptr}},
  {"_cell_angle_alpha", {"_cell.angle_alpha", nullptr}},
  {"_cell_angle_beta", {"_cell.angle_beta", nullptr}},
  {"_cell_angle_gamma", {"_cell.angle_gamma", nullptr}},
  {"_diffrn_radiation_wavelength",
   {"_diffrn_radiation_wavelength.wavelength", nullptr}},
  {"_atom_site_label", {"_atom_site.label", nullptr}},
  {"_atom_site_type_symbol", {"_atom_site.type_symbol", nullptr}},
  {"_atom_site_fract_x", {"_atom_site.fract_x", nullptr}},
  {"_atom_site_fract_y", {"_atom_site.fract_y", nullptr}},
  {"_atom_site_fract_z", {"_atom_site.fract_z", nullptr}},
  {"_atom_site_Cartn_x", {"_atom_site.Cartn_x", nullptr}},
  {"_atom_site_Cartn_y", {"_atom_site.Cartn_y", nullptr}},
  {"_atom_site_Cartn_z", {"_atom_site.Cartn_z", nullptr}},
  {"_atom_site_U_iso_or_equiv", {"_atom_site.U_iso_or_equiv", nullptr}},
  {"_atom_site_U_equiv_geom_mean", {"_atom_site.U_equiv_geom_mean", nullptr}},
  {"_atom_site_B_iso_or_equiv", {"_atom_site.B_iso_or_equiv", nullptr}},
  {"_atom_site_B_equiv_geom_mean", {"_atom_site.B_equiv_geom_mean", nullptr}},
  {"_atom_site_occupancy", {"_atom_site.occupancy", nullptr}},
  {"_atom_site_aniso_label", {"_atom_site_aniso.label", nullptr}},
  {"_atom_site_aniso_U_11", {"_atom_site_aniso.U_11", nullptr}},
  {"_atom_site_aniso_U_22", {"_atom_site_aniso.U_22", nullptr}},
  {"_atom_site_aniso_U_33", {"_atom_site_aniso.U_33", nullptr}},
  {"_atom_site_aniso_U_12", {"_atom_site_aniso.U_12", nullptr}},
  {"_atom_site_aniso_U_13", {"_atom_site_aniso.U_13", nullptr}},
  {"_atom_site_aniso_U_23", {"_atom_site_aniso.U_23", nullptr}},
  {"_atom_site_aniso_B_11", {"_atom_site_aniso.B_11", nullptr}},
  {"_atom_site_aniso_B_22", {"_atom_site_aniso.B_22", nullptr}},
  {"_atom_site_aniso_B_33", {"_atom_site_aniso.B_33", nullptr}},
  {"_atom_site_aniso_B_12", {"_atom_site_aniso.B_12", nullptr}},
  {"_atom_site_aniso_B_13", {"_atom_site_aniso.B_13", nullptr}},
  {"_atom_site_aniso_B_23", {"_atom_site_aniso.B_23", nullptr}},
};

} // anonymous namespace

const TagAlias* find_tag_alias(const std::string& canonical) {
  for (const TagAlias& alias : alias_table)
    if (canonical == alias.canonical)
      return &alias;
  return nullptr;
}

cif::Column find_item(cif::Block& block, const std::string& canonical,
                      std::string& found_tag) {
  cif::Column col = block.find_values(canonical);
  if (col) {
    found_tag = canonical;
    return col;
  }
  if (const TagAlias* alias = find_tag_alias(canonical))
    for (const char* const* syn = alias->synonyms; *syn != nullptr; ++syn) {
      col = block.find_values(*syn);
      if (col) {
        found_tag = *syn;
        return col;
      }
    }
  found_tag.clear();
  return cif::Column();
}

cif::Column find_item(cif::Block& block, const std::string& canonical) {
  std::string unused;
  return find_item(block, canonical, unused);
}

} // namespace cifmill
