#pragma once

#include <memory>
#include <string>
#include <vector>

#include "arbor/config.hpp"
#include "arbor/exec/interpreter.hpp"
#include "arbor/exec/plan_compiler.hpp"

namespace arbor {
namespace exec {

// ============================================================================
// Linker: binds an optimized graph to an execution strategy
// ============================================================================

class Linker {
  public:
    virtual ~Linker() = default;

    virtual ExecutionMode mode() const = 0;

    // Inputs in graph input order; returns the graph outputs.
    virtual std::vector<Tensor>
    run(const std::vector<Tensor> &inputs,
        const profile::NodeCallback *callback) const = 0;
};

class InterpretedLinker : public Linker {
  public:
    explicit InterpretedLinker(const graph::Graph &graph);

    ExecutionMode mode() const override { return ExecutionMode::Interpreted; }

    std::vector<Tensor> run(const std::vector<Tensor> &inputs,
                            const profile::NodeCallback *callback) const override;

  private:
    Interpreter interpreter_;
};

class CompiledLinker : public Linker {
  public:
    explicit CompiledLinker(const graph::Graph &graph);

    ExecutionMode mode() const override { return ExecutionMode::Compiled; }

    std::vector<Tensor> run(const std::vector<Tensor> &inputs,
                            const profile::NodeCallback *callback) const override;

    const CompiledPlan &plan() const { return *plan_; }

  private:
    std::shared_ptr<const CompiledPlan> plan_;
};

// Runs the interpreter (without in-place writes) and the compiled plan,
// then compares every node output both produced, in schedule order.
// Returns the compiled results.
class VerifyLinker : public Linker {
  public:
    VerifyLinker(const graph::Graph &graph, double rtol, double atol);

    // Checks an already compiled plan against the interpretation of
    // `graph`; the plan must take the same number of inputs.
    VerifyLinker(const graph::Graph &graph,
                 std::shared_ptr<const CompiledPlan> plan, double rtol,
                 double atol);

    ExecutionMode mode() const override { return ExecutionMode::Verify; }

    std::vector<Tensor> run(const std::vector<Tensor> &inputs,
                            const profile::NodeCallback *callback) const override;

  private:
    Interpreter reference_;
    std::shared_ptr<const CompiledPlan> plan_;
    double rtol_;
    double atol_;
};

std::unique_ptr<Linker> make_linker(const graph::Graph &graph,
                                    const CompileConfig &config);

// First element where `a` and `b` differ, as "element i: x vs y", or an
// empty string when they agree. Floats compare with rtol/atol and NaN
// equal to NaN; other dtypes compare exactly.
std::string first_difference(const Tensor &a, const Tensor &b, double rtol,
                             double atol);

} // namespace exec
} // namespace arbor
