// Copyright 2026 Global Phasing Ltd.

#include <cstdio>
#include <initializer_list>
#include <cifmill/reflcif.hpp>    // for build_arrays, read_wavelengths
#include <cifmill/structure.hpp>  // for build_structure
#include <gemmi/read_cif.hpp>     // for read_cif_gz
#include <gemmi/util.hpp>         // for istarts_with

#include "options.h"

namespace cif = gemmi::cif;
using std::printf;

namespace {

const char* kind_str(cifmill::DataKind kind) {
  switch (kind) {
    case cifmill::DataKind::Integer: return "int";
    case cifmill::DataKind::Real: return "real";
    case cifmill::DataKind::Complex: return "complex";
    case cifmill::DataKind::HendricksonLattman: return "HL";
    case cifmill::DataKind::String: return "string";
  }
  return "?";
}

const char* obs_str(cifmill::ObservationType t) {
  switch (t) {
    case cifmill::ObservationType::Amplitude: return " amplitude";
    case cifmill::ObservationType::Intensity: return " intensity";
    case cifmill::ObservationType::Unknown: return "";
  }
  return "";
}

void print_symmetry(const cifmill::CrystalSymmetry& cs) {
  printf("  space group: %s\n", cs.group_str().c_str());
  if (cs.has_group())
    printf("  operations: %zu x %zu\n", cs.ops.cen_ops.size(),
           cs.ops.sym_ops.size());
  printf("  unit cell: %s\n", cs.cell_str().c_str());
}

void print_atoms(const cifmill::Structure& st) {
  printf("  %zu atoms%s\n", st.scatterers.size(),
         st.from_cartesian ? " (from Cartesian coordinates)" : "");
  for (const cifmill::Scatterer& sc : st.scatterers) {
    printf("    %-6s %-4s %8.5f %8.5f %8.5f", sc.label.c_str(),
           sc.scattering_type.c_str(), sc.fract.x, sc.fract.y, sc.fract.z);
    if (sc.has_occupancy())
      printf("  occ=%g", sc.occupancy);
    if (sc.adp_type == cifmill::AdpType::Iso)
      printf("  Uiso=%g", sc.u_iso);
    else if (sc.adp_type == cifmill::AdpType::Aniso)
      printf("  Uaniso=(%g %g %g %g %g %g)", sc.u_cif.u11, sc.u_cif.u22,
             sc.u_cif.u33, sc.u_cif.u12, sc.u_cif.u13, sc.u_cif.u23);
    printf("\n");
  }
}

void print_arrays(const cifmill::ReflectionData& rd) {
  printf("  %zu Miller arrays\n", rd.arrays.size());
  for (const auto& item : rd.arrays) {
    const cifmill::MillerArray& array = item.second;
    printf("    %s: %zu %s%s%s%s", item.first.c_str(), array.size(),
           kind_str(array.kind), obs_str(array.observation_type),
           array.has_sigmas() ? " with sigmas" : "",
           array.anomalous ? " anomalous" : "");
    if (array.info.has_wavelength())
      printf(" wavelength=%g", array.info.wavelength);
    printf("\n      labels: %s\n", array.info.label_string().c_str());
  }
}

void print_raw(const cifmill::ReflectionData& rd) {
  for (const cifmill::RawLoop& rl : rd.raw_loops) {
    printf("  loop with %zu reflections\n", rl.indices.size());
    for (const cifmill::RawColumn& col : rl.columns)
      printf("    %-24s %s\n", col.name.c_str(),
             col.numeric ? "numeric" : "text");
  }
}

// true if any tag in the block starts with one of the (lowercase) prefixes
bool has_tags(const cif::Block& block, std::initializer_list<const char*> prefixes) {
  auto matches = [&](const std::string& tag) {
    for (const char* prefix : prefixes)
      if (gemmi::istarts_with(tag, prefix))
        return true;
    return false;
  };
  for (const cif::Item& item : block.items) {
    if (item.type == cif::ItemType::Pair && matches(item.pair[0]))
      return true;
    if (item.type == cif::ItemType::Loop)
      for (const std::string& tag : item.loop.tags)
        if (matches(tag))
          return true;
  }
  return false;
}

void process_block(const cif::Block& block, const OptParser& p,
                   const gemmi::Logger& logger) {
  bool all = p.print_all();
  bool strict = p.options[Strict];
  printf("block %s\n", block.name.c_str());
  if (all || p.options[Symmetry])
    print_symmetry(cifmill::build_symmetry(block, strict, logger));
  if (p.options[Atoms] ||
      (all && has_tags(block, {"_atom_site_fract_", "_atom_site.fract_",
                               "_atom_site_cartn_", "_atom_site.cartn_"})))
    print_atoms(cifmill::build_structure(block, logger));
  if (p.options[Refln] || p.options[Raw] ||
      (all && has_tags(block, {"_refln", "_diffrn_refln"}))) {
    cifmill::ReflectionData rd = cifmill::build_arrays(
        block, cifmill::Provenance(), cifmill::read_wavelengths(block),
        p.label_strategy(), logger);
    if (all || p.options[Refln])
      print_arrays(rd);
    if (all || p.options[Raw])
      print_raw(rd);
  }
}

} // anonymous namespace

int main(int argc, char **argv) {
  OptParser p;
  p.parse_or_exit(argc, argv);
  gemmi::Logger logger;
  logger.callback = gemmi::Logger::to_stderr;
  if (p.options[Verbose])
    logger.threshold = 8;
  try {
    for (int i = 0; i < p.nonOptionsCount(); ++i) {
      const char* path = p.nonOption(i);
      if (p.options[Verbose])
        std::fprintf(stderr, "Reading %s ...\n", path);
      cif::Document doc = gemmi::read_cif_gz(path);
      for (const cif::Block& block : doc.blocks) {
        if (p.use_block(block.name))
          process_block(block, p, logger);
      }
    }
  } catch (cifmill::CifBuildError& e) {
    std::fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  } catch (std::runtime_error& e) {
    std::fprintf(stderr, "ERROR: %s\n", e.what());
    return 2;
  }
  return 0;
}
