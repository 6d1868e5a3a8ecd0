// Copyright 2026 Global Phasing Ltd.

#include "options.h"
#include <cstdio>   // for fprintf
#include <cstdlib>  // for exit
#include <cstring>  // for strcmp
#include <cifmill/version.hpp>  // for CIFMILL_VERSION
#include <gemmi/version.hpp>    // for GEMMI_VERSION

using std::fprintf;

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] FILE[...]"
    "\nBuilds crystal symmetry, atoms and Miller arrays from CIF files."
    "\nWithout --symmetry, --atoms, --refln and --raw all of them are printed."
    "\n\nOptions:"},
  { Help, 0, "h", "help", Arg::None, "  -h, --help  \tPrint usage and exit." },
  { Version, 0, "V", "version", Arg::None,
    "  -V, --version  \tPrint versions of cifmill and gemmi and exit." },
  { Verbose, 0, "v", "verbose", Arg::None,
    "  -v, --verbose  \tReport skipped space group sources and more." },
  { BlockName, 0, "b", "block", Arg::Required,
    "  -b, --block=NAME  \tUse only the block with this name." },
  { Strict, 0, "", "strict", Arg::None,
    "  --strict  \tFail if the space group or unit cell is missing." },
  { Style, 0, "", "style", Arg::LabelStyle,
    "  --style=heuristic|pattern  \tHow reflection columns are grouped"
    " (default: heuristic)." },
  { Symmetry, 0, "", "symmetry", Arg::None,
    "  --symmetry  \tPrint space group and unit cell." },
  { Atoms, 0, "", "atoms", Arg::None,
    "  --atoms  \tPrint atoms from the _atom_site loop." },
  { Refln, 0, "", "refln", Arg::None,
    "  --refln  \tPrint Miller arrays." },
  { Raw, 0, "", "raw", Arg::None,
    "  --raw  \tPrint columns of the reflection loops as read." },
  { 0, 0, 0, 0, 0, 0 }
};

option::ArgStatus Arg::Required(const option::Option& option, bool msg) {
  if (option.arg != nullptr)
    return option::ARG_OK;
  if (msg)
    fprintf(stderr, "Option '%s' requires an argument\n", option.name);
  return option::ARG_ILLEGAL;
}

option::ArgStatus Arg::LabelStyle(const option::Option& option, bool msg) {
  if (Required(option, msg) == option::ARG_ILLEGAL)
    return option::ARG_ILLEGAL;
  if (std::strcmp(option.arg, "heuristic") == 0 ||
      std::strcmp(option.arg, "pattern") == 0)
    return option::ARG_OK;
  if (msg)
    fprintf(stderr, "Invalid label style: %s\nAllowed: heuristic pattern\n",
            option.arg);
  return option::ARG_ILLEGAL;
}

// fwrite wrapped to avoid -Wignored-attributes
static
size_t write_func(const void *ptr, size_t size, size_t nmemb, FILE *stream) {
  return fwrite(ptr, size, nmemb, stream);
}

void OptParser::parse_or_exit(int argc, char** argv) {
  if (argc < 1)
    std::exit(2);
  option::Stats stats(/*reordering*/true, Usage, argc-1, argv+1);
  options.resize(stats.options_max);
  buffer.resize(stats.buffer_max);
  parse(Usage, argc-1, argv+1, options.data(), buffer.data());
  if (error())
    std::exit(2);
  if (options[Help]) {
    option::printUsage(write_func, stdout, Usage);
    std::exit(0);
  }
  if (options[Version]) {
    std::printf(EXE_NAME " " CIFMILL_VERSION " (gemmi " GEMMI_VERSION ")\n");
    std::exit(0);
  }
  if (options[NoOp]) {
    fprintf(stderr, "Invalid option.\n");
    option::printUsage(write_func, stderr, Usage);
    std::exit(2);
  }
  if (nonOptionsCount() == 0) {
    fprintf(stderr, "No input files. Nothing to do.\n"
                    "Try '" EXE_NAME " --help' for more information.\n");
    std::exit(2);
  }
}

cifmill::LabelStrategy OptParser::label_strategy() const {
  if (options[Style] && std::strcmp(options[Style].arg, "pattern") == 0)
    return cifmill::LabelStrategy::Pattern;
  return cifmill::LabelStrategy::Heuristic;
}
