#ifndef LAPBENCH_WORKLOAD_HPP
#define LAPBENCH_WORKLOAD_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lapbench {

/**
 * @brief Kinds of measured work the CLI can time.
 *
 * - Spin : dependent FMA chain, `work` iterations per lap (pure compute)
 * - Chase: one pass of dependent loads over `work` cache-line nodes
 * - Sleep: sleep_for(`work` microseconds), mostly scheduler latency
 */
enum class WorkloadKind { Spin, Chase, Sleep };

const char* workload_name(WorkloadKind kind);

// Throws std::invalid_argument for unknown names.
WorkloadKind parse_workload_kind(const std::string& name);

/**
 * @brief One unit of measured work, with its own private state.
 *
 * Each worker thread owns one Workload so nothing is shared while timing.
 */
class Workload {
public:
    Workload(WorkloadKind kind, int work, std::uint32_t seed);

    // Run one lap's worth of work.
    void run();

    WorkloadKind kind() const { return kind_; }
    int work() const { return work_; }

    // Value derived from the work done so far (keeps results observable).
    double checksum() const { return acc_ + static_cast<double>(cursor_); }

private:
    // 64B node: one node per cache line.
    struct alignas(64) Node {
        std::uint32_t next;
        std::uint32_t pad[15];
    };

    WorkloadKind kind_;
    int work_;
    double acc_ = 1.0;
    std::uint32_t cursor_ = 0;
    std::vector<Node> nodes_;
};

} // namespace lapbench

#endif // LAPBENCH_WORKLOAD_HPP
