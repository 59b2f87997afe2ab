#include "resflow/core/conversion_content.h"

#include <algorithm>
#include <stdexcept>

#include "resflow/util/file_io.h"
#include "resflow/util/json.h"
#include "resflow/util/strings.h"

namespace resflow {
namespace {

const json::Value* find_key(const json::Object& o, const std::string& k) {
  auto it = o.find(k);
  return it == o.end() ? nullptr : &it->second;
}

// Accepts {"ore": 10, ...} or [{"type": "ore", "amount": 10}, ...].
std::vector<ResourceAmount> parse_amounts(const json::Value& v, const std::string& where) {
  std::vector<ResourceAmount> out;
  if (const auto* obj = v.as_object()) {
    for (const auto& [type, amount] : *obj) {
      if (!amount.is_number()) throw std::runtime_error(where + ": amount for '" + type + "' is not a number");
      out.push_back({type, amount.number_value()});
    }
    // Object iteration order is unspecified: sort by type.
    std::sort(out.begin(), out.end(),
              [](const ResourceAmount& a, const ResourceAmount& b) { return a.type < b.type; });
    return out;
  }
  if (const auto* arr = v.as_array()) {
    for (const auto& e : *arr) {
      const auto& eo = e.object();
      ResourceAmount ra;
      ra.type = eo.count("type") ? eo.at("type").string_value() : std::string();
      const auto* a = find_key(eo, "amount");
      if (!a || !a->is_number()) throw std::runtime_error(where + ": amount for '" + ra.type + "' is not a number");
      ra.amount = a->number_value();
      out.push_back(std::move(ra));
    }
    return out;
  }
  throw std::runtime_error(where + ": expected an object or array of resource amounts");
}

std::unordered_map<std::string, double> parse_amount_map(const json::Value& v) {
  std::unordered_map<std::string, double> out;
  for (const auto& [k, amount] : v.object()) out[k] = amount.number_value(0.0);
  return out;
}

std::vector<std::string> parse_string_list(const json::Value& v) {
  std::vector<std::string> out;
  for (const auto& e : v.array()) out.push_back(e.string_value());
  return out;
}

ConversionRecipe parse_recipe(const std::string& rid, const json::Object& rj) {
  ConversionRecipe r;
  r.id = rid;
  r.name = find_key(rj, "name") ? find_key(rj, "name")->string_value(rid) : rid;
  if (const auto* v = find_key(rj, "inputs")) r.inputs = parse_amounts(*v, "recipe '" + rid + "' inputs");
  if (const auto* v = find_key(rj, "outputs")) r.outputs = parse_amounts(*v, "recipe '" + rid + "' outputs");

  if (const auto* v = find_key(rj, "processing_time_ms")) r.processing_time_ms = v->number_value(0.0);
  // Convenience: seconds.
  if (const auto* v = find_key(rj, "processing_time_s")) {
    if (r.processing_time_ms <= 0.0) r.processing_time_ms = v->number_value(0.0) * 1000.0;
  }
  if (const auto* v = find_key(rj, "base_efficiency")) r.base_efficiency = v->number_value(1.0);
  if (const auto* v = find_key(rj, "required_level")) r.required_level = static_cast<int>(v->int_value(0));
  if (const auto* v = find_key(rj, "energy_cost")) r.energy_cost = v->number_value(0.0);
  return r;
}

ConverterNode parse_node(const json::Object& nj) {
  ConverterNode n;
  n.id = find_key(nj, "id") ? find_key(nj, "id")->string_value() : std::string();
  n.name = find_key(nj, "name") ? find_key(nj, "name")->string_value(n.id) : n.id;
  n.type = parse_node_type(find_key(nj, "type") ? find_key(nj, "type")->string_value("converter") : "converter");

  if (const auto* v = find_key(nj, "recipes")) n.supported_recipe_ids = parse_string_list(*v);
  if (const auto* v = find_key(nj, "supported_recipe_ids")) {
    if (n.supported_recipe_ids.empty()) n.supported_recipe_ids = parse_string_list(*v);
  }
  if (const auto* v = find_key(nj, "max_concurrent_processes")) {
    n.configuration.max_concurrent_processes = static_cast<int>(v->int_value(1));
  }
  if (const auto* v = find_key(nj, "efficiency_modifiers")) {
    n.configuration.efficiency_modifiers = parse_amount_map(*v);
  }
  if (const auto* v = find_key(nj, "efficiency")) n.efficiency = v->number_value(1.0);
  if (const auto* v = find_key(nj, "resources")) n.resources = parse_amount_map(*v);
  if (const auto* v = find_key(nj, "storage_capacity")) n.storage_capacity = parse_amount_map(*v);
  return n;
}

} // namespace

NodeType parse_node_type(const std::string& s) {
  const std::string t = to_lower(s);
  if (t == "producer") return NodeType::Producer;
  if (t == "consumer") return NodeType::Consumer;
  if (t == "storage") return NodeType::Storage;
  return NodeType::Converter;
}

const char* node_type_to_string(NodeType t) {
  switch (t) {
    case NodeType::Producer: return "producer";
    case NodeType::Consumer: return "consumer";
    case NodeType::Storage: return "storage";
    case NodeType::Converter: return "converter";
  }
  return "converter";
}

const char* process_status_to_string(ProcessStatus s) {
  switch (s) {
    case ProcessStatus::Pending: return "PENDING";
    case ProcessStatus::InProgress: return "IN_PROGRESS";
    case ProcessStatus::Paused: return "PAUSED";
    case ProcessStatus::Completed: return "COMPLETED";
    case ProcessStatus::Failed: return "FAILED";
  }
  return "PENDING";
}

ConversionContent parse_conversion_content(const std::string& json_text) {
  const auto root = json::parse(json_text).object();

  ConversionContent content;

  // --- Recipes ---
  if (auto itr = root.find("recipes"); itr != root.end()) {
    for (const auto& [rid, v] : itr->second.object()) {
      content.recipes[rid] = parse_recipe(rid, v.object());
    }
  }

  // --- Chains ---
  if (auto itc = root.find("chains"); itc != root.end()) {
    for (const auto& [cid, v] : itc->second.object()) {
      const auto& cj = v.object();
      ConversionChain c;
      c.id = cid;
      c.name = find_key(cj, "name") ? find_key(cj, "name")->string_value(cid) : cid;
      if (const auto* s = find_key(cj, "steps")) c.steps = parse_string_list(*s);
      content.chains[cid] = std::move(c);
    }
  }

  // --- Converter nodes ---
  if (auto itn = root.find("nodes"); itn != root.end()) {
    for (const auto& v : itn->second.array()) content.nodes.push_back(parse_node(v.object()));
  }

  return content;
}

ConversionContent load_conversion_content_from_file(const std::string& path) {
  return parse_conversion_content(read_text_file(path));
}

} // namespace resflow
