#include "arbor/graph/composite.hpp"
#include "arbor/error.hpp"

#include <sstream>

namespace arbor {
namespace graph {

uint64_t CompositeProgram::hash() const {
    uint64_t h = 14695981039346656037ULL;
    auto mix = [&h](uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            h ^= (v & 0xFF);
            h *= 1099511628211ULL;
            v >>= 8;
        }
    };
    mix(n_inputs);
    mix(static_cast<uint64_t>(dtype));
    for (const auto &instr : instrs) {
        mix(static_cast<uint64_t>(instr.op));
        mix(instr.args.size());
        for (const auto &a : instr.args) {
            mix(static_cast<uint64_t>(a.kind));
            mix(static_cast<uint64_t>(a.index));
        }
    }
    return h;
}

std::string CompositeProgram::str() const {
    std::ostringstream oss;
    oss << "composite{";
    for (size_t r = 0; r < instrs.size(); ++r) {
        if (r > 0)
            oss << "; ";
        oss << "r" << r << "=" << op_name(instrs[r].op) << "(";
        for (size_t a = 0; a < instrs[r].args.size(); ++a) {
            const auto &arg = instrs[r].args[a];
            oss << (a ? "," : "")
                << (arg.kind == CompositeArg::Kind::Input ? "i" : "r")
                << arg.index;
        }
        oss << ")";
    }
    oss << "}";
    return oss.str();
}

void CompositeProgram::validate() const {
    if (instrs.empty())
        throw RuntimeError::internal("composite program has no instructions");
    for (size_t r = 0; r < instrs.size(); ++r) {
        const auto &instr = instrs[r];
        if (!is_fusable_op(instr.op))
            throw RuntimeError::internal(std::string("composite op '") +
                                         op_name(instr.op) +
                                         "' is not fusable");
        size_t arity = is_unary_op(instr.op) ? 1 : 2;
        if (instr.args.size() != arity)
            throw RuntimeError::internal(std::string("composite op '") +
                                         op_name(instr.op) + "' expects " +
                                         std::to_string(arity) + " args");
        for (const auto &a : instr.args) {
            bool ok = a.index >= 0 &&
                      (a.kind == CompositeArg::Kind::Input
                           ? static_cast<size_t>(a.index) < n_inputs
                           : static_cast<size_t>(a.index) < r);
            if (!ok)
                throw RuntimeError::internal("composite instruction " +
                                             std::to_string(r) +
                                             " has an invalid operand");
        }
    }
}

} // namespace graph
} // namespace arbor
