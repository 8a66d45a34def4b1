#pragma once

#include "lowir/common/HostTensor.hpp"
#include "lowir/compiler/graph/Node.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"

namespace lowir::compiler {

// A traced computation graph. Nodes are stored in trace order, which is a
// topological order: arguments may only reference earlier nodes.
class Graph {
public:
  using KwArguments = memory::vector<std::pair<memory::string, Argument>>;

  memory::NodeId placeholder(memory::string name, NodeMeta meta);

  memory::NodeId getAttr(memory::string target, NodeMeta meta);

  memory::NodeId call(OpOverload target, memory::vector<Argument> args,
                      NodeMeta meta = {}, KwArguments kwargs = {});

  memory::NodeId output(memory::vector<Argument> results);

  void setDirectLowering(memory::NodeId node, LoweringFn fn);

  void setAttribute(memory::string name, HostTensor value);
  const HostTensor *attribute(memory::string_view name) const;

  const Node &operator[](memory::NodeId id) const;
  const Node &node(memory::NodeId id) const { return (*this)[id]; }
  memory::span<const Node> nodes() const { return m_nodes; }
  std::size_t size() const { return m_nodes.size(); }

  bool hasOutput() const { return static_cast<bool>(m_output); }
  memory::NodeId outputNode() const { return m_output; }

private:
  memory::NodeId append(Node node);
  memory::string uniqueName(memory::string_view base);

  memory::vector<Node> m_nodes;
  memory::hash_map<memory::string, std::size_t> m_nameCounts;
  memory::hash_map<memory::string, HostTensor> m_attributes;
  memory::NodeId m_output{};
};

} // namespace lowir::compiler
