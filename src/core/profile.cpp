#include "arbor/profile.hpp"

#include <iomanip>
#include <map>
#include <sstream>

namespace arbor {
namespace profile {

Profiler &Profiler::instance() {
    static Profiler profiler;
    return profiler;
}

void Profiler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

void Profiler::record(const NodeEvent &event) {
    if (!enabled_)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<NodeEvent> Profiler::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::string Profiler::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    struct OpTotals {
        size_t calls = 0;
        std::chrono::nanoseconds time{0};
        size_t bytes = 0;
        size_t inplace = 0;
    };
    std::map<std::string, OpTotals> per_op;
    std::chrono::nanoseconds total_time{0};
    for (const auto &e : events_) {
        auto &t = per_op[e.op_name];
        t.calls++;
        t.time += e.duration;
        t.bytes += e.output_bytes;
        if (e.inplace)
            t.inplace++;
        total_time += e.duration;
    }

    std::ostringstream oss;
    oss << "=== Arbor Profile (" << events_.size() << " node events) ===\n";
    oss << std::left << std::setw(20) << "Op" << std::setw(10) << "Calls"
        << std::setw(15) << "Time(us)" << std::setw(15) << "Output(KB)"
        << "Inplace\n";
    oss << std::string(70, '-') << "\n";
    for (const auto &[name, t] : per_op) {
        oss << std::left << std::setw(20) << name << std::setw(10) << t.calls
            << std::setw(15) << std::fixed << std::setprecision(2)
            << t.time.count() / 1000.0 << std::setw(15) << std::fixed
            << std::setprecision(2) << t.bytes / 1024.0 << t.inplace << "\n";
    }
    oss << std::string(70, '-') << "\n";
    oss << "Total time: " << (total_time.count() / 1000.0) << " us\n";
    return oss.str();
}

NodeTimer::NodeTimer(NodeEvent event, const NodeCallback *callback)
    : event_(std::move(event)), callback_(callback),
      active_((callback && *callback) || Profiler::instance().is_enabled()) {
    if (active_)
        start_ = std::chrono::steady_clock::now();
}

void NodeTimer::stop() {
    if (!active_)
        return;
    active_ = false;
    event_.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
    Profiler::instance().record(event_);
    if (callback_ && *callback_)
        (*callback_)(event_);
}

} // namespace profile
} // namespace arbor
