#pragma once

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace arbor {

// ============================================================================
// Base Arbor Exception
// ============================================================================

class ArborError : public std::exception {
  public:
    explicit ArborError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

namespace detail {

template <typename Container>
std::string join_ints(const Container &values) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto &v : values) {
        if (!first)
            oss << ", ";
        oss << v;
        first = false;
    }
    oss << "]";
    return oss.str();
}

} // namespace detail

// ============================================================================
// Graph construction: dtype/rank mismatch against an op signature
// ============================================================================

class TypeShapeError : public ArborError {
  public:
    explicit TypeShapeError(const std::string &message)
        : ArborError("TypeShapeError: " + message) {}

    static TypeShapeError dtype_mismatch(const std::string &op,
                                         size_t input_index,
                                         const std::string &expected,
                                         const std::string &got) {
        return TypeShapeError(op + ": input " + std::to_string(input_index) +
                              " expected dtype " + expected + " but got " +
                              got);
    }

    static TypeShapeError rank_mismatch(const std::string &op,
                                        size_t input_index,
                                        const std::string &expected,
                                        size_t got) {
        return TypeShapeError(op + ": input " + std::to_string(input_index) +
                              " expected rank " + expected + " but got " +
                              std::to_string(got));
    }

    static TypeShapeError invalid_axis(const std::string &op, int axis,
                                       size_t ndim) {
        return TypeShapeError(op + ": axis " + std::to_string(axis) +
                              " out of bounds for rank " +
                              std::to_string(ndim));
    }
};

// ============================================================================
// Runtime shape errors (concrete shapes only known at invocation)
// ============================================================================

class ShapeError : public ArborError {
  public:
    explicit ShapeError(const std::string &message)
        : ArborError("ShapeError: " + message) {}

    template <typename Container>
    static ShapeError mismatch(const Container &expected,
                               const Container &got) {
        return ShapeError("expected shape " + detail::join_ints(expected) +
                          " but got " + detail::join_ints(got));
    }

    template <typename Container>
    static ShapeError broadcast_incompatible(const Container &a,
                                             const Container &b) {
        return ShapeError("shapes " + detail::join_ints(a) + " and " +
                          detail::join_ints(b) + " are not broadcastable");
    }

    static ShapeError invalid_reshape(size_t from_size, size_t to_size) {
        return ShapeError("cannot reshape array of size " +
                          std::to_string(from_size) + " into size " +
                          std::to_string(to_size));
    }
};

// ============================================================================
// Optimizer pass preconditions
// ============================================================================

class OptimizationPreconditionError : public ArborError {
  public:
    explicit OptimizationPreconditionError(const std::string &message)
        : ArborError("OptimizationPreconditionError: " + message) {}

    static OptimizationPreconditionError
    must_run_before(const std::string &pass, const std::string &other) {
        return OptimizationPreconditionError(
            "pass '" + pass + "' must run before '" + other +
            "', but '" + other + "' has already been applied");
    }

    static OptimizationPreconditionError
    invalid_graph(const std::string &pass, const std::string &details) {
        return OptimizationPreconditionError("pass '" + pass +
                                             "' received an invalid graph: " +
                                             details);
    }
};

// ============================================================================
// Scan declaration errors
// ============================================================================

class ScanSignatureError : public ArborError {
  public:
    explicit ScanSignatureError(const std::string &message)
        : ArborError("ScanSignatureError: " + message) {}

    static ScanSignatureError return_count(const std::string &scan,
                                           size_t expected, size_t got) {
        return ScanSignatureError("scan '" + scan + "': step function returned " +
                                  std::to_string(got) +
                                  " outputs but " + std::to_string(expected) +
                                  " were declared");
    }

    static ScanSignatureError until_not_last(const std::string &scan,
                                             size_t position) {
        return ScanSignatureError(
            "scan '" + scan + "': termination predicate at return position " +
            std::to_string(position) + " must be the last returned item");
    }

    static ScanSignatureError invalid_tap(const std::string &scan,
                                          const std::string &what, int tap) {
        return ScanSignatureError("scan '" + scan + "': " + what +
                                  " has invalid tap " + std::to_string(tap));
    }
};

class TapWindowError : public ArborError {
  public:
    explicit TapWindowError(const std::string &message)
        : ArborError("TapWindowError: " + message) {}

    static TapWindowError too_short(const std::string &scan, size_t output,
                                    const std::vector<int> &taps,
                                    size_t required, size_t got) {
        return TapWindowError(
            "scan '" + scan + "': output " + std::to_string(output) +
            " declares taps " + detail::join_ints(taps) + " requiring " +
            std::to_string(required) + " initial entries, but the buffer has " +
            std::to_string(got));
    }
};

// ============================================================================
// Cross-mode verification
// ============================================================================

class DivergentExecutionError : public ArborError {
  public:
    explicit DivergentExecutionError(const std::string &message)
        : ArborError("DivergentExecutionError: " + message) {}

    static DivergentExecutionError at(uint64_t node_id, const std::string &op,
                                      const std::string &variable,
                                      const std::string &details) {
        return DivergentExecutionError(
            "first divergence at node " + std::to_string(node_id) + " (" + op +
            ") output '" + variable + "': " + details);
    }
};

// ============================================================================
// Graph boundary errors
// ============================================================================

class MissingInputError : public ArborError {
  public:
    explicit MissingInputError(const std::string &message)
        : ArborError("MissingInputError: " + message) {}

    static MissingInputError undeclared(const std::string &name) {
        return MissingInputError("input variable '" + name +
                                 "' is needed to compute the outputs but was "
                                 "not declared as a function input");
    }
};

// ============================================================================
// Value-related errors
// ============================================================================

class ValueError : public ArborError {
  public:
    explicit ValueError(const std::string &message)
        : ArborError("ValueError: " + message) {}

    static ValueError unknown_option(const std::string &key) {
        return ValueError("unknown configuration option '" + key + "'");
    }

    static ValueError invalid_option(const std::string &key,
                                     const std::string &value) {
        return ValueError("invalid value '" + value + "' for option '" + key +
                          "'");
    }
};

class IndexError : public ArborError {
  public:
    explicit IndexError(const std::string &message)
        : ArborError("IndexError: " + message) {}

    static IndexError out_of_bounds(int64_t index, size_t size, int axis) {
        std::ostringstream oss;
        oss << "index " << index << " out of bounds for axis " << axis
            << " with size " << size;
        return IndexError(oss.str());
    }
};

// ============================================================================
// Runtime/internal errors
// ============================================================================

class RuntimeError : public ArborError {
  public:
    explicit RuntimeError(const std::string &message)
        : ArborError("RuntimeError: " + message) {}

    static RuntimeError not_implemented(const std::string &feature) {
        return RuntimeError(feature + " is not yet implemented");
    }

    static RuntimeError internal(const std::string &details) {
        return RuntimeError("internal error: " + details);
    }
};

} // namespace arbor
