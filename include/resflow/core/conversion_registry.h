#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "resflow/core/entities.h"

namespace resflow {

// Recipe and chain definitions, keyed by id.
//
// Registration only checks the id. A chain that names an unregistered recipe
// is accepted and fails when execution reaches that step.
class ConversionRegistry {
 public:
  // Returns false for an empty id; otherwise inserts or overwrites.
  bool register_recipe(const ConversionRecipe& recipe);
  bool register_chain(const ConversionChain& chain);

  const ConversionRecipe* find_recipe(const std::string& id) const;
  const ConversionChain* find_chain(const std::string& id) const;

  const std::unordered_map<std::string, ConversionRecipe>& recipes() const { return recipes_; }
  const std::unordered_map<std::string, ConversionChain>& chains() const { return chains_; }

  // Sorted, for deterministic iteration in tools.
  std::vector<std::string> recipe_ids() const;
  std::vector<std::string> chain_ids() const;

  void clear();

 private:
  std::unordered_map<std::string, ConversionRecipe> recipes_;
  std::unordered_map<std::string, ConversionChain> chains_;
};

} // namespace resflow
