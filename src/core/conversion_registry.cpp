#include "resflow/core/conversion_registry.h"

#include <algorithm>

namespace resflow {
namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& m) {
  std::vector<std::string> out;
  out.reserve(m.size());
  for (const auto& [id, _] : m) out.push_back(id);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

bool ConversionRegistry::register_recipe(const ConversionRecipe& recipe) {
  if (recipe.id.empty()) return false;
  recipes_[recipe.id] = recipe;
  return true;
}

bool ConversionRegistry::register_chain(const ConversionChain& chain) {
  if (chain.id.empty()) return false;
  chains_[chain.id] = chain;
  return true;
}

const ConversionRecipe* ConversionRegistry::find_recipe(const std::string& id) const {
  auto it = recipes_.find(id);
  return it == recipes_.end() ? nullptr : &it->second;
}

const ConversionChain* ConversionRegistry::find_chain(const std::string& id) const {
  auto it = chains_.find(id);
  return it == chains_.end() ? nullptr : &it->second;
}

std::vector<std::string> ConversionRegistry::recipe_ids() const { return sorted_keys(recipes_); }

std::vector<std::string> ConversionRegistry::chain_ids() const { return sorted_keys(chains_); }

void ConversionRegistry::clear() {
  recipes_.clear();
  chains_.clear();
}

} // namespace resflow
