#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace arbor {
namespace profile {

// One executed node (or fused step) of a compiled function invocation.
struct NodeEvent {
    uint64_t node_id = 0;
    std::string op_name;
    std::string node_name;
    std::chrono::nanoseconds duration{0};
    size_t output_bytes = 0;
    bool inplace = false; // Output reused a destroyed input's buffer
};

using NodeCallback = std::function<void(const NodeEvent &)>;

// Process-wide aggregation of node events, disabled by default.
class Profiler {
  public:
    static Profiler &instance();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    void clear();

    void record(const NodeEvent &event);

    std::vector<NodeEvent> events() const;

    // Per-op totals followed by the event count and total time.
    std::string dump() const;

  private:
    Profiler() = default;
    std::atomic<bool> enabled_{false};
    mutable std::mutex mutex_;
    std::vector<NodeEvent> events_;
};

inline void enable() { Profiler::instance().enable(); }
inline void disable() { Profiler::instance().disable(); }
inline void clear() { Profiler::instance().clear(); }
inline std::string dump() { return Profiler::instance().dump(); }
inline bool is_enabled() { return Profiler::instance().is_enabled(); }

// Times one node execution. stop() forwards the event to `callback` and
// the Profiler; a node that throws is never reported.
class NodeTimer {
  public:
    NodeTimer(NodeEvent event, const NodeCallback *callback);

    NodeEvent &event() { return event_; }

    void stop();

  private:
    NodeEvent event_;
    const NodeCallback *callback_;
    bool active_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace profile
} // namespace arbor
