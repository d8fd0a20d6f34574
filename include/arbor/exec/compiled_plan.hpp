#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "arbor/exec/fused_kernel.hpp"
#include "arbor/exec/scan_runner.hpp"
#include "arbor/graph/graph.hpp"
#include "arbor/storage.hpp"

namespace arbor {
namespace exec {

// ============================================================================
// PlanStep: variant of typed step structs
// ============================================================================

struct StepBase {
    graph::NodePtr node;
    std::vector<int> input_slots;
    std::vector<int> output_slots;
    std::vector<int> release_slots; // Slots dead once this step has run
};

// Reference kernel for one node
struct KernelStep : StepBase {};

// Composite node run as a tiled loop over typed function pointers
struct FusedStep : StepBase {
    std::shared_ptr<const FusedKernel> kernel;
    int destroyed_input = -1; // Input whose buffer may receive the result
};

// Loop node with a precompiled inner plan
struct ScanStep : StepBase {
    std::shared_ptr<const ScanRunner> runner;
};

// deep_copy into a fresh buffer
struct CopyStep : StepBase {};

using PlanStep = std::variant<KernelStep, FusedStep, ScanStep, CopyStep>;

// Visitor to access common StepBase fields from any variant alternative
inline const StepBase &step_base(const PlanStep &step) {
    return std::visit(
        [](const auto &s) -> const StepBase & {
            return static_cast<const StepBase &>(s);
        },
        step);
}

inline StepBase &step_base(PlanStep &step) {
    return std::visit(
        [](auto &s) -> StepBase & { return static_cast<StepBase &>(s); }, step);
}

// ============================================================================
// Buffer and arena types
// ============================================================================

struct BufferSlot {
    enum class Source : uint8_t { Input, Constant, Shared, Computed };

    Source source = Source::Computed;
    graph::TensorType type;
    graph::Variable variable;

    int first_use = -1; // Step index that produces this
    int last_use = -1;  // Last step that reads this

    int input_index = -1;     // Position among the graph inputs
    bool is_output = false;
};

// Dead buffers of one invocation, reused best-fit by byte size.
class BufferArena {
  public:
    // Smallest pooled storage of at least `bytes`, or a fresh one.
    std::shared_ptr<Storage> acquire(size_t bytes);

    // Pools `storage` when nothing else references it.
    void release(std::shared_ptr<Storage> storage);

    size_t pooled() const { return free_.size(); }
    size_t reused() const { return reused_; }

  private:
    std::multimap<size_t, std::shared_ptr<Storage>> free_;
    size_t reused_ = 0;
};

struct CompiledPlan {
    graph::GraphSignature signature;
    std::vector<PlanStep> steps;
    std::vector<BufferSlot> buffer_slots;
    std::vector<int> input_slots;  // Slot indices of the graph inputs
    std::vector<int> output_slots; // Slot indices of the graph outputs
    std::vector<int> leaf_slots;   // Constants and shared values

    // Peak number of computed slots alive at once
    size_t peak_live_slots = 0;

    std::string str() const;

    // Arena pool for buffer reuse across executions
    mutable std::mutex arena_mutex_;
    mutable std::vector<std::unique_ptr<BufferArena>> free_arenas_;

    std::unique_ptr<BufferArena> acquire_arena() const {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        if (free_arenas_.empty())
            return std::make_unique<BufferArena>();
        auto arena = std::move(free_arenas_.back());
        free_arenas_.pop_back();
        return arena;
    }

    void release_arena(std::unique_ptr<BufferArena> arena) const {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        static constexpr size_t MAX_FREE_ARENAS = 4;
        if (free_arenas_.size() < MAX_FREE_ARENAS)
            free_arenas_.push_back(std::move(arena));
    }
};

} // namespace exec
} // namespace arbor
