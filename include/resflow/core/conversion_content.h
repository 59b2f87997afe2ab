#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "resflow/core/entities.h"

namespace resflow {

// A content bundle: recipe and chain definitions plus the converter nodes of a
// scenario.
//
// JSON layout:
//   {
//     "recipes": { "<id>": { "name", "inputs": {"<type>": amount, ...},
//                            "outputs": {...}, "processing_time_ms",
//                            "base_efficiency", "required_level", "energy_cost" } },
//     "chains":  { "<id>": { "name", "steps": ["<recipe id>", ...] } },
//     "nodes":   [ { "id", "name", "type", "recipes": [...],
//                    "max_concurrent_processes", "efficiency",
//                    "efficiency_modifiers": {...}, "resources": {...},
//                    "storage_capacity": {...} } ]
//   }
//
// Resource lists may also be written as arrays of {"type", "amount"} objects.
struct ConversionContent {
  std::unordered_map<std::string, ConversionRecipe> recipes;
  std::unordered_map<std::string, ConversionChain> chains;

  // File order is preserved (it is the converter selection order).
  std::vector<ConverterNode> nodes;
};

// Throws std::runtime_error on malformed JSON or wrong value types.
ConversionContent parse_conversion_content(const std::string& json_text);
ConversionContent load_conversion_content_from_file(const std::string& path);

NodeType parse_node_type(const std::string& s);
const char* node_type_to_string(NodeType t);
const char* process_status_to_string(ProcessStatus s);

} // namespace resflow
