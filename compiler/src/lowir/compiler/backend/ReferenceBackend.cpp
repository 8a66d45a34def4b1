#include "lowir/compiler/backend/ReferenceBackend.hpp"
#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/diag/logging.hpp"
#include <fmt/format.h>
#include <iterator>

namespace lowir::compiler {

namespace {

class CodeWriter {
public:
  template <typename... Args>
  void line(std::size_t indent, fmt::format_string<Args...> fmt,
            Args &&...args) {
    m_code.append(indent * 4, ' ');
    fmt::format_to(std::back_inserter(m_code), fmt,
                   std::forward<Args>(args)...);
    m_code.push_back('\n');
    ++m_lines;
  }

  // 1-based number of the line written next.
  std::size_t nextLine() const { return m_lines + 1; }

  memory::string take() { return std::move(m_code); }

private:
  memory::string m_code;
  std::size_t m_lines = 0;
};

memory::string join(memory::span<const memory::string> parts) {
  memory::string out;
  for (const auto &p : parts) {
    if (!out.empty()) {
      out += ", ";
    }
    out += p;
  }
  return out;
}

// Right hand side computing the buffer.
memory::string buffer_expr(const IRGraph &ir, IRNodeId buffer) {
  const IRNode &node = ir[buffer];
  switch (node.tag()) {
  case IRNodeKind::ComputedBuffer:
    return ir.render(node.computed().data);
  case IRNodeKind::ExternKernel: {
    const ExternKernel &k = node.externKernel();
    memory::vector<memory::string> args;
    for (IRNodeId in : k.inputs) {
      args.push_back(ir.render(in));
    }
    args.insert(args.end(), k.constantArgs.begin(), k.constantArgs.end());
    return fmt::format("{}({})", k.kernel.dottedName(), join(args));
  }
  case IRNodeKind::MultiOutput: {
    const MultiOutput &m = node.multiOutput();
    memory::string out = ir[m.kernel].bufferName();
    for (std::size_t i : m.indices) {
      out += fmt::format("[{}]", i);
    }
    return out;
  }
  default:
    return node.bufferName();
  }
}

} // namespace

Schedule ReferenceScheduling::schedule(const GraphLowering &graph) {
  Schedule schedule;
  for (IRNodeId buffer : graph.ir().buffers()) {
    schedule.groups.push_back(KernelGroup{.buffers = {buffer}});
  }
  return schedule;
}

GeneratedCode ReferenceWrapperCodegen::generate(const GraphLowering &graph,
                                                const Schedule &schedule) {
  const IRGraph &ir = graph.ir();
  CodeWriter w;
  memory::vector<LineMapEntry> linemap;

  memory::vector<memory::string> inputNames;
  for (const auto &input : graph.graphInputs()) {
    inputNames.push_back(input.name);
  }

  if (m_cppWrapper) {
    w.line(0, "std::vector<at::Tensor> call(std::vector<at::Tensor> args) {{");
    for (std::size_t i = 0; i < inputNames.size(); ++i) {
      w.line(1, "auto {} = args[{}];", inputNames[i], i);
    }
  } else {
    w.line(0, "def call(args):");
    if (!inputNames.empty()) {
      w.line(1, "{}, = args", join(inputNames));
    }
  }

  for (const KernelGroup &group : schedule.groups) {
    for (IRNodeId buffer : group.buffers) {
      const IRNode &node = ir[buffer];
      const Layout &layout = node.layout();
      const memory::string &name = node.bufferName();
      const memory::string expr = buffer_expr(ir, buffer);
      if (node.origin) {
        linemap.push_back(
            LineMapEntry{.line = w.nextLine(), .node = *node.origin});
      }
      if (layout.kind == LayoutKind::Mutation) {
        const memory::string target = ir[layout.target].bufferName();
        if (m_cppWrapper) {
          w.line(1, "{}.copy_({});", target, expr);
        } else {
          w.line(1, "{}.copy_({})", target, expr);
        }
        continue;
      }
      if (layout.kind == LayoutKind::MultiOutput) {
        if (m_cppWrapper) {
          w.line(1, "auto {} = {};", name, expr);
        } else {
          w.line(1, "{} = {}", name, expr);
        }
        continue;
      }
      if (m_cppWrapper) {
        w.line(1, "auto {} = empty_strided({}, {}, {}, {}); // {}", name,
               ir.renderSizes(layout.sizes), ir.renderSizes(layout.strides),
               layout.device, layout.dtype, expr);
      } else {
        w.line(1, "{} = empty_strided({}, {}, device='{}', dtype={})", name,
               ir.renderSizes(layout.sizes), ir.renderSizes(layout.strides),
               layout.device, layout.dtype);
        w.line(1, "{}.copy_({})", name, expr);
      }
    }
  }

  const auto outputs = graph.getOutputNames();
  if (m_cppWrapper) {
    w.line(1, "return {{{}}};", join(outputs));
    w.line(0, "}}");
  } else {
    w.line(1, "return ({}{})", join(outputs), outputs.size() == 1 ? "," : "");
  }
  LOWIR_DEBUG("generated {} lines of wrapper code", w.nextLine() - 1);
  return GeneratedCode{.code = w.take(), .linemap = std::move(linemap)};
}

} // namespace lowir::compiler
