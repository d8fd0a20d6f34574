#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "arbor/dtype.hpp"
#include "op_traits.hpp"

namespace arbor {
namespace graph {

// ============================================================================
// Fused elementwise program
// ============================================================================

// Operand of a composite instruction: one of the node's inputs or the
// result of an earlier instruction.
struct CompositeArg {
    enum class Kind : uint8_t { Input, Register };
    Kind kind = Kind::Input;
    int index = 0;

    static CompositeArg input(int i) { return {Kind::Input, i}; }
    static CompositeArg reg(int i) { return {Kind::Register, i}; }

    bool operator==(const CompositeArg &o) const {
        return kind == o.kind && index == o.index;
    }
};

// Instruction i writes register i. The last register is the output.
struct CompositeInstr {
    OpKind op{};
    std::vector<CompositeArg> args;

    bool operator==(const CompositeInstr &o) const {
        return op == o.op && args == o.args;
    }
};

// All inputs, registers and the output share `dtype`.
struct CompositeProgram {
    size_t n_inputs = 0;
    DType dtype = DType::Float64;
    std::vector<CompositeInstr> instrs;

    bool operator==(const CompositeProgram &o) const {
        return n_inputs == o.n_inputs && dtype == o.dtype &&
               instrs == o.instrs;
    }

    uint64_t hash() const;

    // e.g. "composite{r0=mul(i0,i1); r1=add(r0,i2)}"
    std::string str() const;

    // Throws RuntimeError if an arg refers to a later register or a
    // missing input, or if an op is not fusable.
    void validate() const;
};

} // namespace graph
} // namespace arbor
