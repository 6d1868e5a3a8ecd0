// Copyright 2026 Global Phasing Ltd.

// Command-line options of cifmill, parsed with The Lean Mean C++ Option Parser.

#pragma once

#include <vector>
#include <string>
#include <optionparser.h>
#include <cifmill/reflcif.hpp>  // for LabelStrategy

#define EXE_NAME "cifmill"

enum OptionIndex {
  NoOp=0, Help, Version, Verbose, BlockName, Strict, Style,
  Symmetry, Atoms, Refln, Raw
};

extern const option::Descriptor Usage[];

struct Arg: public option::Arg {
  static option::ArgStatus Required(const option::Option& option, bool msg);
  // --style=heuristic|pattern
  static option::ArgStatus LabelStyle(const option::Option& option, bool msg);
};

struct OptParser : option::Parser {
  std::vector<option::Option> options;
  std::vector<option::Option> buffer;

  // exits on --help, --version, a parse error or missing input files
  void parse_or_exit(int argc, char** argv);

  cifmill::LabelStrategy label_strategy() const;
  // true if no output section was selected
  bool print_all() const {
    return !options[Symmetry] && !options[Atoms] && !options[Refln] &&
           !options[Raw];
  }
  bool use_block(const std::string& name) const {
    return !options[BlockName] || name == options[BlockName].arg;
  }
};
