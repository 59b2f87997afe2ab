#include "resflow/core/content_validation.h"

#include <algorithm>
#include <cmath>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "engine_internal.h"

namespace resflow {

using engine_internal::join;

namespace {

void push_issue(std::vector<ContentIssue>& out, ContentIssueSeverity sev, std::string code, std::string msg,
                std::string subject_kind, std::string subject_id) {
  ContentIssue is;
  is.severity = sev;
  is.code = std::move(code);
  is.message = std::move(msg);
  is.subject_kind = std::move(subject_kind);
  is.subject_id = std::move(subject_id);
  out.push_back(std::move(is));
}

void push_error(std::vector<ContentIssue>& out, std::string code, std::string msg, std::string subject_kind,
                std::string subject_id) {
  push_issue(out, ContentIssueSeverity::Error, std::move(code), std::move(msg), std::move(subject_kind),
             std::move(subject_id));
}

void push_warning(std::vector<ContentIssue>& out, std::string code, std::string msg, std::string subject_kind,
                  std::string subject_id) {
  push_issue(out, ContentIssueSeverity::Warning, std::move(code), std::move(msg), std::move(subject_kind),
             std::move(subject_id));
}

bool is_non_negative(double v) { return v >= 0.0 && std::isfinite(v); }
bool is_positive(double v) { return v > 0.0 && std::isfinite(v); }

void check_amounts(std::vector<ContentIssue>& issues, const std::vector<ResourceAmount>& amounts,
                   const std::string& recipe_key, const char* what) {
  for (const auto& a : amounts) {
    if (a.type.empty()) {
      push_error(issues, "recipe.empty_resource_type", join("Recipe '", recipe_key, "' has an ", what,
                                                            " with an empty resource type"),
                 "recipe", recipe_key);
    }
    if (!is_positive(a.amount)) {
      push_error(issues, "recipe.invalid_amount",
                 join("Recipe '", recipe_key, "' has invalid ", what, " amount for '", a.type, "': ", a.amount),
                 "recipe", recipe_key);
    }
  }
}

void validate_definitions(std::vector<ContentIssue>& issues,
                          const std::unordered_map<std::string, ConversionRecipe>& recipes,
                          const std::unordered_map<std::string, ConversionChain>& chains) {
  // --- Recipes ---
  for (const auto& [key, r] : recipes) {
    if (key.empty()) push_error(issues, "recipe.empty_key", "Recipe map contains an empty key", "recipe", key);
    if (r.id.empty())
      push_error(issues, "recipe.empty_id", join("Recipe '", key, "' has an empty id field"), "recipe", key);
    if (!r.id.empty() && !key.empty() && r.id != key)
      push_error(issues, "recipe.key_id_mismatch", join("Recipe key/id mismatch: key '", key, "' != id '", r.id, "'"),
                 "recipe", key);

    check_amounts(issues, r.inputs, key, "input");
    check_amounts(issues, r.outputs, key, "output");
    if (r.outputs.empty())
      push_warning(issues, "recipe.no_outputs", join("Recipe '", key, "' produces nothing"), "recipe", key);

    if (!is_non_negative(r.processing_time_ms))
      push_error(issues, "recipe.invalid_processing_time",
                 join("Recipe '", key, "' has invalid processing_time_ms: ", r.processing_time_ms), "recipe", key);
    if (!is_non_negative(r.base_efficiency))
      push_error(issues, "recipe.invalid_base_efficiency",
                 join("Recipe '", key, "' has invalid base_efficiency: ", r.base_efficiency), "recipe", key);
    if (r.required_level < 0)
      push_error(issues, "recipe.invalid_required_level",
                 join("Recipe '", key, "' has negative required_level: ", r.required_level), "recipe", key);
    if (!is_non_negative(r.energy_cost))
      push_error(issues, "recipe.invalid_energy_cost",
                 join("Recipe '", key, "' has invalid energy_cost: ", r.energy_cost), "recipe", key);
  }

  // --- Chains ---
  for (const auto& [key, c] : chains) {
    if (key.empty()) push_error(issues, "chain.empty_key", "Chain map contains an empty key", "chain", key);
    if (c.id.empty())
      push_error(issues, "chain.empty_id", join("Chain '", key, "' has an empty id field"), "chain", key);
    if (!c.id.empty() && !key.empty() && c.id != key)
      push_error(issues, "chain.key_id_mismatch", join("Chain key/id mismatch: key '", key, "' != id '", c.id, "'"),
                 "chain", key);
    if (c.steps.empty()) push_error(issues, "chain.no_steps", join("Chain '", key, "' has no steps"), "chain", key);

    for (std::size_t i = 0; i < c.steps.size(); ++i) {
      if (recipes.find(c.steps[i]) == recipes.end()) {
        push_error(issues, "chain.unknown_recipe",
                   join("Chain '", key, "' step ", i, " references unknown recipe '", c.steps[i], "'"), "chain", key);
      }
    }
  }
}

void sort_issues(std::vector<ContentIssue>& issues) {
  std::stable_sort(issues.begin(), issues.end(), [](const ContentIssue& a, const ContentIssue& b) {
    return std::tie(a.subject_kind, a.subject_id, a.code, a.message) <
           std::tie(b.subject_kind, b.subject_id, b.code, b.message);
  });
}

std::vector<std::string> error_messages(const std::vector<ContentIssue>& issues) {
  std::vector<std::string> out;
  for (const auto& is : issues) {
    if (is.severity == ContentIssueSeverity::Error) out.push_back(is.message);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

std::vector<ContentIssue> validate_conversion_content_detailed(const ConversionContent& content) {
  std::vector<ContentIssue> issues;
  validate_definitions(issues, content.recipes, content.chains);

  // --- Converter nodes ---
  std::unordered_set<std::string> seen;
  std::unordered_set<std::string> supported;
  for (const auto& n : content.nodes) {
    const std::string& id = n.id;
    if (id.empty()) push_error(issues, "node.empty_id", "Converter node has an empty id", "node", id);
    if (!id.empty() && !seen.insert(id).second)
      push_error(issues, "node.duplicate_id", join("Duplicate converter node id '", id, "'"), "node", id);

    if (n.type == NodeType::Converter && n.configuration.max_concurrent_processes <= 0)
      push_error(issues, "node.invalid_capacity",
                 join("Converter node '", id, "' has invalid max_concurrent_processes: ",
                      n.configuration.max_concurrent_processes),
                 "node", id);
    if (!is_non_negative(n.efficiency))
      push_error(issues, "node.invalid_efficiency", join("Converter node '", id, "' has invalid efficiency: ",
                                                         n.efficiency),
                 "node", id);

    if (n.type != NodeType::Converter && !n.supported_recipe_ids.empty())
      push_warning(issues, "node.recipes_on_non_converter",
                   join("Node '", id, "' lists recipes but is a ", node_type_to_string(n.type), " node"), "node", id);

    for (const auto& rid : n.supported_recipe_ids) {
      if (content.recipes.find(rid) == content.recipes.end()) {
        push_error(issues, "node.unknown_recipe",
                   join("Converter node '", id, "' supports unknown recipe '", rid, "'"), "node", id);
      } else if (n.type == NodeType::Converter) {
        supported.insert(rid);
      }
    }
    for (const auto& [rid, mod] : n.configuration.efficiency_modifiers) {
      if (!is_non_negative(mod))
        push_error(issues, "node.invalid_modifier",
                   join("Converter node '", id, "' has invalid efficiency modifier for '", rid, "': ", mod), "node",
                   id);
      if (std::find(n.supported_recipe_ids.begin(), n.supported_recipe_ids.end(), rid) ==
          n.supported_recipe_ids.end())
        push_warning(issues, "node.unused_modifier",
                     join("Converter node '", id, "' has a modifier for unsupported recipe '", rid, "'"), "node", id);
    }
    for (const auto& [type, amount] : n.resources) {
      if (!is_non_negative(amount))
        push_error(issues, "node.invalid_resource",
                   join("Converter node '", id, "' has invalid amount of '", type, "': ", amount), "node", id);
    }
    for (const auto& [type, cap] : n.storage_capacity) {
      if (!is_non_negative(cap))
        push_error(issues, "node.invalid_storage_capacity",
                   join("Converter node '", id, "' has invalid storage capacity for '", type, "': ", cap), "node", id);
    }
  }

  if (!content.nodes.empty()) {
    for (const auto& [rid, _] : content.recipes) {
      if (!supported.count(rid))
        push_warning(issues, "recipe.unsupported", join("Recipe '", rid, "' is not supported by any converter node"),
                     "recipe", rid);
    }
  }

  sort_issues(issues);
  return issues;
}

std::vector<std::string> validate_conversion_content(const ConversionContent& content) {
  return error_messages(validate_conversion_content_detailed(content));
}

std::vector<std::string> validate_conversion_registry(const ConversionRegistry& registry) {
  std::vector<ContentIssue> issues;
  validate_definitions(issues, registry.recipes(), registry.chains());
  return error_messages(issues);
}

} // namespace resflow
