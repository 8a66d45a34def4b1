#include "lowir/compiler/graph/Graph.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/precondition.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace lowir::compiler {

memory::string Graph::uniqueName(memory::string_view base) {
  memory::string candidate(base);
  for (char &c : candidate) {
    if (c == '.' || c == ':') {
      c = '_';
    }
  }
  auto [it, inserted] = m_nameCounts.try_emplace(candidate, 0);
  if (inserted) {
    return candidate;
  }
  memory::string name;
  do {
    name = fmt::format("{}_{}", candidate, ++it->second);
  } while (m_nameCounts.contains(name));
  m_nameCounts.emplace(name, 0);
  return name;
}

memory::NodeId Graph::append(Node node) {
  diag::precondition(!m_output, "graph already has an output node");
  const memory::NodeId id{m_nodes.size()};
  node.id = id;

  auto link = [&](memory::NodeId producer) {
    diag::precondition(*producer < *id,
                       "node {} references {} which is not an earlier node",
                       node.name, producer);
    auto &users = m_nodes[*producer].users;
    if (std::find(users.begin(), users.end(), id) == users.end()) {
      users.push_back(id);
    }
  };
  for (const auto &arg : node.args) {
    arg.forEachNode(link);
  }
  for (const auto &[key, arg] : node.kwargs) {
    arg.forEachNode(link);
  }

  m_nodes.push_back(std::move(node));
  return id;
}

memory::NodeId Graph::placeholder(memory::string name, NodeMeta meta) {
  diag::precondition(!m_nameCounts.contains(name),
                     "duplicate placeholder name {}", name);
  m_nameCounts.emplace(name, 0);
  Node node{};
  node.kind = NodeKind::Placeholder;
  node.name = std::move(name);
  node.meta = std::move(meta);
  return append(std::move(node));
}

memory::NodeId Graph::getAttr(memory::string target, NodeMeta meta) {
  Node node{};
  node.kind = NodeKind::GetAttr;
  node.name = uniqueName(target);
  node.attrTarget = std::move(target);
  node.meta = std::move(meta);
  return append(std::move(node));
}

memory::NodeId Graph::call(OpOverload target, memory::vector<Argument> args,
                           NodeMeta meta, KwArguments kwargs) {
  Node node{};
  node.kind = NodeKind::CallFunction;
  node.name = uniqueName(target.name);
  node.target = std::move(target);
  node.args = std::move(args);
  node.kwargs = std::move(kwargs);
  node.meta = std::move(meta);
  return append(std::move(node));
}

memory::NodeId Graph::output(memory::vector<Argument> results) {
  Node node{};
  node.kind = NodeKind::Output;
  node.name = "output";
  node.args.push_back(Argument{std::move(results)});
  memory::NodeId id = append(std::move(node));
  m_output = id;
  return id;
}

void Graph::setDirectLowering(memory::NodeId node, LoweringFn fn) {
  if (!node || *node >= m_nodes.size()) {
    diag::invalid_argument(fmt::format("unknown node {}", node));
  }
  m_nodes[*node].directLowering = std::move(fn);
}

void Graph::setAttribute(memory::string name, HostTensor value) {
  m_attributes.insert_or_assign(std::move(name), std::move(value));
}

const HostTensor *Graph::attribute(memory::string_view name) const {
  auto it = m_attributes.find(memory::string(name));
  if (it == m_attributes.end()) {
    return nullptr;
  }
  return &it->second;
}

const Node &Graph::operator[](memory::NodeId id) const {
  if (!id || *id >= m_nodes.size()) {
    diag::invalid_argument(fmt::format("unknown node {}", id));
  }
  return m_nodes[*id];
}

} // namespace lowir::compiler
