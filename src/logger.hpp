#pragma once
#include "event_bus.hpp"
#include <cstdint>
#include <iostream>
#include <mutex>

namespace hybridllm {

// Renders registry and failover events as "[component] ..." log lines.
// Attaches to the bus on construction and detaches on destruction.
// Events may arrive from several threads (call_async); each line is
// written whole.
class StderrLogger {
public:
    explicit StderrLogger(EventBus& bus, std::ostream& out = std::cerr);
    ~StderrLogger();

    StderrLogger(const StderrLogger&) = delete;
    StderrLogger& operator=(const StderrLogger&) = delete;

    // Formats a single event; empty for tags the logger does not know.
    static std::string format(const Event& event);

private:
    EventBus& bus_;
    std::ostream& out_;
    std::mutex out_mutex_;
    uint64_t subscription_;
};

} // namespace hybridllm
