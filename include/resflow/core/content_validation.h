#pragma once

#include <string>
#include <vector>

#include "resflow/core/conversion_content.h"
#include "resflow/core/conversion_registry.h"

namespace resflow {

enum class ContentIssueSeverity { Error, Warning };

struct ContentIssue {
  ContentIssueSeverity severity{ContentIssueSeverity::Error};

  // Stable machine-readable code ("recipe.invalid_amount", ...).
  std::string code;
  std::string message;

  // "recipe", "chain" or "node".
  std::string subject_kind;
  std::string subject_id;
};

// Full report, errors and warnings, sorted by subject then code.
//
// Warnings cover content that is legal but probably unintended, e.g. a recipe
// no converter node supports.
std::vector<ContentIssue> validate_conversion_content_detailed(const ConversionContent& content);

// Error messages only, sorted. Empty => valid.
//
// Registration does not cross-check definitions (a chain may name a recipe
// that is registered later); these checks do.
std::vector<std::string> validate_conversion_content(const ConversionContent& content);

// Same checks for definitions already registered (no node checks).
std::vector<std::string> validate_conversion_registry(const ConversionRegistry& registry);

} // namespace resflow
