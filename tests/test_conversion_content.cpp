#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

#include "resflow/core/content_validation.h"
#include "resflow/core/conversion_content.h"

#define RF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_conversion_content() {
  // Both amount styles, seconds fallback, node options.
  {
    const std::string text = R"({
      "recipes": {
        "smelt": {
          "name": "Smelt",
          "inputs": {"ore": 10, "coal": 2},
          "outputs": [{"type": "metal", "amount": 5}],
          "processing_time_s": 2.5,
          "base_efficiency": 1.2,
          "required_level": 3,
          "energy_cost": 4
        },
        "press": {"inputs": {"metal": 5}, "outputs": {"plate": 1}, "processing_time_ms": 800}
      },
      "chains": {
        "plates": {"name": "Plates", "steps": ["smelt", "press"]}
      },
      "nodes": [
        {"id": "s1", "name": "Smelter", "recipes": ["smelt"], "max_concurrent_processes": 2,
         "efficiency": 0.9, "efficiency_modifiers": {"smelt": 1.5},
         "resources": {"ore": 40}, "storage_capacity": {"metal": 50}},
        {"id": "p1", "supported_recipe_ids": ["press"]},
        {"id": "d1", "type": "storage"}
      ]
    })";

    const auto content = resflow::parse_conversion_content(text);
    RF_ASSERT(content.recipes.size() == 2);

    const auto& smelt = content.recipes.at("smelt");
    RF_ASSERT(smelt.id == "smelt");
    RF_ASSERT(smelt.name == "Smelt");
    RF_ASSERT(smelt.inputs.size() == 2);
    // Object-style amounts are sorted by type.
    RF_ASSERT(smelt.inputs[0].type == "coal");
    RF_ASSERT(smelt.inputs[1].type == "ore");
    RF_ASSERT(smelt.inputs[1].amount == 10.0);
    RF_ASSERT(smelt.outputs.size() == 1);
    RF_ASSERT(smelt.outputs[0].type == "metal");
    RF_ASSERT(smelt.processing_time_ms == 2500.0);
    RF_ASSERT(smelt.base_efficiency == 1.2);
    RF_ASSERT(smelt.required_level == 3);
    RF_ASSERT(smelt.energy_cost == 4.0);

    const auto& press = content.recipes.at("press");
    RF_ASSERT(press.name == "press");
    RF_ASSERT(press.processing_time_ms == 800.0);
    RF_ASSERT(press.base_efficiency == 1.0);

    const auto& chain = content.chains.at("plates");
    RF_ASSERT(chain.id == "plates");
    RF_ASSERT(chain.steps.size() == 2);
    RF_ASSERT(chain.steps[1] == "press");

    // File order preserved.
    RF_ASSERT(content.nodes.size() == 3);
    RF_ASSERT(content.nodes[0].id == "s1");
    RF_ASSERT(content.nodes[1].id == "p1");
    RF_ASSERT(content.nodes[2].id == "d1");

    const auto& s1 = content.nodes[0];
    RF_ASSERT(s1.type == resflow::NodeType::Converter);
    RF_ASSERT(s1.configuration.max_concurrent_processes == 2);
    RF_ASSERT(s1.efficiency == 0.9);
    RF_ASSERT(s1.configuration.efficiency_modifiers.at("smelt") == 1.5);
    RF_ASSERT(s1.resources.at("ore") == 40.0);
    RF_ASSERT(s1.storage_capacity.at("metal") == 50.0);

    RF_ASSERT(content.nodes[1].name == "p1");
    RF_ASSERT(content.nodes[1].supported_recipe_ids.size() == 1);
    RF_ASSERT(content.nodes[1].configuration.max_concurrent_processes == 1);
    RF_ASSERT(content.nodes[2].type == resflow::NodeType::Storage);
  }

  // Shipped example content loads and validates.
  {
    const auto content = resflow::load_conversion_content_from_file("data/content/example_economy.json");
    RF_ASSERT(content.recipes.count("ore_to_metal") == 1);
    RF_ASSERT(content.chains.count("basic_manufacturing") == 1);
    RF_ASSERT(!content.nodes.empty());
    RF_ASSERT(resflow::validate_conversion_content(content).empty());
  }

  // A non-numeric or missing amount is rejected in both amount styles.
  {
    const char* bad[] = {
        R"({"recipes": {"r": {"inputs": {"ore": "ten"}}}})",
        R"({"recipes": {"r": {"inputs": [{"type": "ore", "amount": "ten"}]}}})",
        R"({"recipes": {"r": {"outputs": [{"type": "metal"}]}}})",
    };
    for (const char* text : bad) {
      bool threw = false;
      try {
        (void)resflow::parse_conversion_content(text);
      } catch (const std::runtime_error& e) {
        threw = true;
        RF_ASSERT(std::string(e.what()).find("is not a number") != std::string::npos);
        RF_ASSERT(std::string(e.what()).find("recipe 'r'") != std::string::npos);
      }
      RF_ASSERT(threw);
    }
  }

  // Enum labels.
  RF_ASSERT(resflow::parse_node_type("Producer") == resflow::NodeType::Producer);
  RF_ASSERT(resflow::parse_node_type("CONSUMER") == resflow::NodeType::Consumer);
  RF_ASSERT(resflow::parse_node_type("something") == resflow::NodeType::Converter);
  RF_ASSERT(std::string(resflow::node_type_to_string(resflow::NodeType::Storage)) == "storage");
  RF_ASSERT(std::string(resflow::process_status_to_string(resflow::ProcessStatus::InProgress)) == "IN_PROGRESS");
  RF_ASSERT(std::string(resflow::process_status_to_string(resflow::ProcessStatus::Failed)) == "FAILED");

  return 0;
}
