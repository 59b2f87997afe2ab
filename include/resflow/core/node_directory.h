#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "resflow/core/entities.h"
#include "resflow/core/flow_errors.h"

namespace resflow {

// Result of a directory call that carries no value.
struct DirectoryStatus {
  bool ok{true};
  FlowErrorKind error_kind{FlowErrorKind::None};
  std::string error;

  static DirectoryStatus success() { return {}; }
  static DirectoryStatus failure(FlowErrorKind kind, std::string msg) {
    DirectoryStatus s;
    s.ok = false;
    s.error_kind = kind;
    s.error = std::move(msg);
    return s;
  }
};

// Result of a directory call that answers a question.
//
// ok == false means the call itself failed (unknown node, service error);
// ok == true with value == false is a normal "no" (not enough resources,
// transfer refused).
template <typename T>
struct DirectoryResult {
  bool ok{false};
  T value{};
  FlowErrorKind error_kind{FlowErrorKind::None};
  std::string error;

  static DirectoryResult success(T v) {
    DirectoryResult r;
    r.ok = true;
    r.value = std::move(v);
    return r;
  }
  static DirectoryResult failure(FlowErrorKind kind, std::string msg) {
    DirectoryResult r;
    r.ok = false;
    r.error_kind = kind;
    r.error = std::move(msg);
    return r;
  }
};

// Converter node lookup and resource mutation primitives, owned by the flow
// topology service.
//
// The engine never keeps its own copy of a node: every read returns a
// snapshot, and the engine re-fetches before each mutation. Calls complete
// before returning.
class ConverterNodeDirectory {
 public:
  virtual ~ConverterNodeDirectory() = default;

  // All nodes in a stable order (converter selection picks the first match).
  virtual std::vector<ConverterNode> get_nodes() const = 0;
  virtual std::optional<ConverterNode> get_node(const std::string& id) const = 0;

  virtual DirectoryResult<bool> check_resources_available(const std::string& converter_id,
                                                          const std::vector<ResourceAmount>& inputs) = 0;

  // Must be all-or-nothing: either every input is debited or none is.
  virtual DirectoryResult<bool> consume_resources(const std::string& converter_id,
                                                  const std::vector<ResourceAmount>& inputs) = 0;

  virtual DirectoryStatus add_resources(const std::string& converter_id,
                                        const std::vector<ResourceAmount>& outputs) = 0;

  // Hand freshly produced amounts from one node directly to another.
  virtual DirectoryResult<bool> transfer_resources(const std::string& from_id, const std::string& to_id,
                                                   const std::vector<ResourceAmount>& amounts) = 0;

  virtual DirectoryStatus update_node_data(const std::string& node_id, const ConverterNodePatch& patch) = 0;
};

// In-process directory backed by a node table.
//
// Serves as the flow topology service for tests, the CLI and hosts that do not
// run a separate service. All primitives are virtual so hosts and tests can
// intercept individual calls.
class InMemoryNodeDirectory : public ConverterNodeDirectory {
 public:
  // Rejects nodes with an empty or duplicate id.
  bool register_node(ConverterNode node, std::string* error = nullptr);
  bool unregister_node(const std::string& id);

  // Overwrites one resource amount (scenario setup / host-side production).
  bool set_resource(const std::string& node_id, const std::string& type, double amount);
  // 0.0 when the node or resource is unknown.
  double resource_amount(const std::string& node_id, const std::string& type) const;

  std::size_t node_count() const { return nodes_.size(); }

  std::vector<ConverterNode> get_nodes() const override;
  std::optional<ConverterNode> get_node(const std::string& id) const override;

  DirectoryResult<bool> check_resources_available(const std::string& converter_id,
                                                  const std::vector<ResourceAmount>& inputs) override;
  DirectoryResult<bool> consume_resources(const std::string& converter_id,
                                          const std::vector<ResourceAmount>& inputs) override;
  DirectoryStatus add_resources(const std::string& converter_id,
                                const std::vector<ResourceAmount>& outputs) override;

  // The source pool is not debited: the amounts are outputs that never entered
  // it. Refuses (ok, value=false) when the target's storage_capacity would be
  // exceeded for any resource.
  DirectoryResult<bool> transfer_resources(const std::string& from_id, const std::string& to_id,
                                           const std::vector<ResourceAmount>& amounts) override;

  // Rejects patches that list more active processes than the node allows.
  DirectoryStatus update_node_data(const std::string& node_id, const ConverterNodePatch& patch) override;

 private:
  ConverterNode* find(const std::string& id);
  const ConverterNode* find(const std::string& id) const;

  // Registration order is the selection order.
  std::vector<ConverterNode> nodes_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace resflow
