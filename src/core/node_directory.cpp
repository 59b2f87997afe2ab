#include "resflow/core/node_directory.h"

#include <cstddef>

#include "resflow/util/strings.h"

namespace resflow {

bool InMemoryNodeDirectory::register_node(ConverterNode node, std::string* error) {
  if (node.id.empty()) {
    if (error) *error = "Node id is empty";
    return false;
  }
  if (index_.count(node.id)) {
    if (error) *error = "Node '" + node.id + "' is already registered";
    return false;
  }
  index_[node.id] = nodes_.size();
  nodes_.push_back(std::move(node));
  return true;
}

bool InMemoryNodeDirectory::unregister_node(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;

  nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(it->second));
  index_.clear();
  for (std::size_t i = 0; i < nodes_.size(); ++i) index_[nodes_[i].id] = i;
  return true;
}

bool InMemoryNodeDirectory::set_resource(const std::string& node_id, const std::string& type, double amount) {
  ConverterNode* n = find(node_id);
  if (!n) return false;
  n->resources[type] = amount;
  return true;
}

double InMemoryNodeDirectory::resource_amount(const std::string& node_id, const std::string& type) const {
  const ConverterNode* n = find(node_id);
  if (!n) return 0.0;
  auto it = n->resources.find(type);
  return it == n->resources.end() ? 0.0 : it->second;
}

std::vector<ConverterNode> InMemoryNodeDirectory::get_nodes() const { return nodes_; }

std::optional<ConverterNode> InMemoryNodeDirectory::get_node(const std::string& id) const {
  const ConverterNode* n = find(id);
  if (!n) return std::nullopt;
  return *n;
}

DirectoryResult<bool> InMemoryNodeDirectory::check_resources_available(const std::string& converter_id,
                                                                       const std::vector<ResourceAmount>& inputs) {
  const ConverterNode* n = find(converter_id);
  if (!n) {
    return DirectoryResult<bool>::failure(FlowErrorKind::ConverterNotFoundOrInvalid,
                                          "Node '" + converter_id + "' not found");
  }
  for (const auto& in : inputs) {
    auto it = n->resources.find(in.type);
    const double have = it == n->resources.end() ? 0.0 : it->second;
    if (have < in.amount) return DirectoryResult<bool>::success(false);
  }
  return DirectoryResult<bool>::success(true);
}

DirectoryResult<bool> InMemoryNodeDirectory::consume_resources(const std::string& converter_id,
                                                               const std::vector<ResourceAmount>& inputs) {
  ConverterNode* n = find(converter_id);
  if (!n) {
    return DirectoryResult<bool>::failure(FlowErrorKind::ConverterNotFoundOrInvalid,
                                          "Node '" + converter_id + "' not found");
  }

  // Sum per type first so a recipe listing the same resource twice is checked
  // against the combined amount.
  std::unordered_map<std::string, double> need;
  for (const auto& in : inputs) need[in.type] += in.amount;

  for (const auto& [type, amount] : need) {
    auto it = n->resources.find(type);
    const double have = it == n->resources.end() ? 0.0 : it->second;
    if (have < amount) return DirectoryResult<bool>::success(false);
  }
  for (const auto& [type, amount] : need) n->resources[type] -= amount;
  return DirectoryResult<bool>::success(true);
}

DirectoryStatus InMemoryNodeDirectory::add_resources(const std::string& converter_id,
                                                     const std::vector<ResourceAmount>& outputs) {
  ConverterNode* n = find(converter_id);
  if (!n) {
    return DirectoryStatus::failure(FlowErrorKind::ConverterNotFoundOrInvalid, "Node '" + converter_id + "' not found");
  }
  for (const auto& o : outputs) n->resources[o.type] += o.amount;
  return DirectoryStatus::success();
}

DirectoryResult<bool> InMemoryNodeDirectory::transfer_resources(const std::string& from_id, const std::string& to_id,
                                                                const std::vector<ResourceAmount>& amounts) {
  if (!find(from_id)) {
    return DirectoryResult<bool>::failure(FlowErrorKind::TransferFailure, "Source node '" + from_id + "' not found");
  }
  ConverterNode* to = find(to_id);
  if (!to) {
    return DirectoryResult<bool>::failure(FlowErrorKind::TransferFailure, "Target node '" + to_id + "' not found");
  }

  std::unordered_map<std::string, double> incoming;
  for (const auto& a : amounts) incoming[a.type] += a.amount;

  for (const auto& [type, amount] : incoming) {
    auto cap = to->storage_capacity.find(type);
    if (cap == to->storage_capacity.end()) continue;
    auto have = to->resources.find(type);
    const double current = have == to->resources.end() ? 0.0 : have->second;
    if (current + amount > cap->second) return DirectoryResult<bool>::success(false);
  }
  for (const auto& [type, amount] : incoming) to->resources[type] += amount;
  return DirectoryResult<bool>::success(true);
}

DirectoryStatus InMemoryNodeDirectory::update_node_data(const std::string& node_id, const ConverterNodePatch& patch) {
  ConverterNode* n = find(node_id);
  if (!n) {
    return DirectoryStatus::failure(FlowErrorKind::NodeUpdateFailure, "Node '" + node_id + "' not found");
  }

  if (patch.active_process_ids) {
    const auto count = static_cast<long long>(patch.active_process_ids->size());
    if (count > static_cast<long long>(n->configuration.max_concurrent_processes)) {
      return DirectoryStatus::failure(FlowErrorKind::NodeUpdateFailure,
                                      "Node '" + node_id + "' would exceed max_concurrent_processes (" +
                                          std::to_string(count) + " > " +
                                          std::to_string(n->configuration.max_concurrent_processes) + ")");
    }
  }
  if (patch.efficiency && !(*patch.efficiency >= 0.0)) {
    return DirectoryStatus::failure(FlowErrorKind::NodeUpdateFailure,
                                    "Node '" + node_id + "' efficiency must be >= 0 (got " +
                                        format_fixed(*patch.efficiency) + ")");
  }

  if (patch.active_process_ids) {
    n->active_process_ids = *patch.active_process_ids;
    n->status = n->active_process_ids.empty() ? ConverterStatus::Idle : ConverterStatus::Active;
  }
  if (patch.efficiency) n->efficiency = *patch.efficiency;
  if (patch.status) n->status = *patch.status;
  return DirectoryStatus::success();
}

ConverterNode* InMemoryNodeDirectory::find(const std::string& id) {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &nodes_[it->second];
}

const ConverterNode* InMemoryNodeDirectory::find(const std::string& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &nodes_[it->second];
}

} // namespace resflow
