// Copyright 2026 Global Phasing Ltd.
//
// Historical synonyms of CIF tags and lookup of a tag (or its synonym)
// in a block.

#ifndef CIFMILL_TAGS_HPP_
#define CIFMILL_TAGS_HPP_

#include <string>
#include <gemmi/cifdoc.hpp>  // for Block, Column
#include "fail.hpp"          // for CIFMILL_DLL

namespace cifmill {

namespace cif = gemmi::cif;

struct TagAlias {
  const char* canonical;
  // synonyms in the order of preference, terminated by nullptr
  const char* synonyms[5];
};

/// Returns the entry for a canonical tag, or nullptr if the tag has
/// no known synonyms.
CIFMILL_DLL const TagAlias* find_tag_alias(const std::string& canonical);

/// Value stored under a canonical tag, or (if the tag is absent) under
/// the first of its synonyms that is present. Returns a null Column
/// if nothing matches.
CIFMILL_DLL cif::Column find_item(cif::Block& block,
                                  const std::string& canonical);

/// Like find_item(), but also returns the tag that was found.
CIFMILL_DLL cif::Column find_item(cif::Block& block,
                                  const std::string& canonical,
                                  std::string& found_tag);

} // namespace cifmill
#endif
