#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "arbor/scan/scan_info.hpp"
#include "arbor/tensor.hpp"

namespace arbor {
namespace exec {

// Evaluates a scan's inner graph once: inner inputs in, inner outputs out.
using InnerFn = std::function<std::vector<Tensor>(const std::vector<Tensor> &)>;

// ============================================================================
// Loop driver for scan nodes
// ============================================================================
//
// Shared by every execution mode; only the inner evaluation differs
// (recursive interpretation or a precompiled plan).
class ScanRunner {
  public:
    ScanRunner(std::shared_ptr<const graph::ScanInfo> info, InnerFn inner);

    // Outer inputs in ScanInfo order; returns the node's outputs
    // (histories, then final shared values).
    std::vector<Tensor> run(const std::vector<Tensor> &outer) const;

    const graph::ScanInfo &info() const { return *info_; }

  private:
    std::shared_ptr<const graph::ScanInfo> info_;
    InnerFn inner_;

    size_t resolve_steps(const std::vector<Tensor> &seqs,
                         const std::vector<Tensor> &outer) const;
};

} // namespace exec
} // namespace arbor
