#include <algorithm>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "resflow/core/content_validation.h"
#include "resflow/core/conversion_content.h"
#include "resflow/core/conversion_registry.h"
#include "test.h"

#define RF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

using resflow_test::make_converter;
using resflow_test::make_recipe;

namespace {

bool has_error_containing(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

bool has_issue(const std::vector<resflow::ContentIssue>& issues, const std::string& code,
               resflow::ContentIssueSeverity sev) {
  return std::any_of(issues.begin(), issues.end(),
                     [&](const resflow::ContentIssue& is) { return is.code == code && is.severity == sev; });
}

resflow::ConversionContent valid_content() {
  resflow::ConversionContent c;
  c.recipes["smelt"] = make_recipe("smelt", {{"ore", 10}}, {{"metal", 5}});
  c.recipes["press"] = make_recipe("press", {{"metal", 5}}, {{"plate", 1}});
  c.chains["plates"] = {"plates", "Plates", {"smelt", "press"}};
  c.nodes.push_back(make_converter("s1", {"smelt"}));
  c.nodes.push_back(make_converter("p1", {"press"}));
  return c;
}

} // namespace

int test_content_validation() {
  {
    const auto c = valid_content();
    RF_ASSERT(resflow::validate_conversion_content(c).empty());
    RF_ASSERT(resflow::validate_conversion_content_detailed(c).empty());
  }

  // Recipe errors.
  {
    auto c = valid_content();
    c.recipes["smelt"].inputs[0].amount = 0;
    c.recipes["press"].processing_time_ms = -1;
    c.recipes["bad"] = make_recipe("other", {{"", 1}}, {{"x", 1}});
    c.recipes["bad"].base_efficiency = std::numeric_limits<double>::quiet_NaN();
    const auto errors = resflow::validate_conversion_content(c);
    RF_ASSERT(has_error_containing(errors, "Recipe 'smelt' has invalid input amount for 'ore'"));
    RF_ASSERT(has_error_containing(errors, "invalid processing_time_ms"));
    RF_ASSERT(has_error_containing(errors, "key 'bad' != id 'other'"));
    RF_ASSERT(has_error_containing(errors, "empty resource type"));
    RF_ASSERT(has_error_containing(errors, "invalid base_efficiency"));
    RF_ASSERT(std::is_sorted(errors.begin(), errors.end()));
  }

  // Chain errors.
  {
    auto c = valid_content();
    c.chains["plates"].steps.push_back("weld");
    c.chains["empty"] = {"empty", "Empty", {}};
    const auto errors = resflow::validate_conversion_content(c);
    RF_ASSERT(has_error_containing(errors, "Chain 'plates' step 2 references unknown recipe 'weld'"));
    RF_ASSERT(has_error_containing(errors, "Chain 'empty' has no steps"));
  }

  // Node errors and warnings.
  {
    auto c = valid_content();
    c.nodes.push_back(make_converter("s1", {"smelt"}));
    c.nodes.push_back(make_converter("z", {"ghost"}, 0));
    auto depot = make_converter("depot", {"press"});
    depot.type = resflow::NodeType::Storage;
    c.nodes.push_back(depot);
    c.nodes[1].configuration.efficiency_modifiers["smelt"] = 1.2;
    c.nodes[1].storage_capacity["metal"] = -5;

    const auto issues = resflow::validate_conversion_content_detailed(c);
    using Sev = resflow::ContentIssueSeverity;
    RF_ASSERT(has_issue(issues, "node.duplicate_id", Sev::Error));
    RF_ASSERT(has_issue(issues, "node.unknown_recipe", Sev::Error));
    RF_ASSERT(has_issue(issues, "node.invalid_capacity", Sev::Error));
    RF_ASSERT(has_issue(issues, "node.invalid_storage_capacity", Sev::Error));
    RF_ASSERT(has_issue(issues, "node.recipes_on_non_converter", Sev::Warning));
    RF_ASSERT(has_issue(issues, "node.unused_modifier", Sev::Warning));

    // Warnings do not appear in the error list.
    const auto errors = resflow::validate_conversion_content(c);
    RF_ASSERT(!has_error_containing(errors, "modifier for unsupported recipe"));
    RF_ASSERT(has_error_containing(errors, "Duplicate converter node id 's1'"));
  }

  // Recipes no converter supports are a warning.
  {
    auto c = valid_content();
    c.recipes["orphan"] = make_recipe("orphan", {}, {{"x", 1}});
    const auto issues = resflow::validate_conversion_content_detailed(c);
    RF_ASSERT(has_issue(issues, "recipe.unsupported", resflow::ContentIssueSeverity::Warning));
    RF_ASSERT(resflow::validate_conversion_content(c).empty());
  }

  // Registry-level checks.
  {
    resflow::ConversionRegistry reg;
    reg.register_recipe(make_recipe("smelt", {{"ore", 10}}, {{"metal", 5}}));
    reg.register_chain({"line", "Line", {"smelt", "press"}});
    const auto errors = resflow::validate_conversion_registry(reg);
    RF_ASSERT(errors.size() == 1);
    RF_ASSERT(has_error_containing(errors, "unknown recipe 'press'"));

    reg.register_recipe(make_recipe("press", {{"metal", 5}}, {{"plate", 1}}));
    RF_ASSERT(resflow::validate_conversion_registry(reg).empty());
  }

  return 0;
}
