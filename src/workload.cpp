#include "lapbench/workload.hpp"
#include "lapbench/barrier.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <stdexcept>
#include <thread>

namespace lapbench {

const char* workload_name(WorkloadKind kind) {
    switch (kind) {
        case WorkloadKind::Spin:  return "spin";
        case WorkloadKind::Chase: return "chase";
        case WorkloadKind::Sleep: return "sleep";
    }
    return "unknown";
}

WorkloadKind parse_workload_kind(const std::string& name) {
    if (name == "spin")  return WorkloadKind::Spin;
    if (name == "chase") return WorkloadKind::Chase;
    if (name == "sleep") return WorkloadKind::Sleep;
    throw std::invalid_argument("unsupported workload '" + name + "' (allowed: spin, chase, sleep)");
}

Workload::Workload(WorkloadKind kind, int work, std::uint32_t seed)
    : kind_(kind), work_(work) {
    if (work_ < 1) throw std::invalid_argument("workload amount must be >= 1");
    if (kind_ != WorkloadKind::Chase) return;

    // Single random cycle: every node is visited once per pass, in an order
    // the hardware prefetcher cannot follow.
    const std::size_t n = static_cast<std::size_t>(work_);
    nodes_.assign(n, Node{0, {0}});

    std::vector<std::uint32_t> idx(n);
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(n); ++i) idx[i] = i;

    std::mt19937 rng(seed);
    std::shuffle(idx.begin(), idx.end(), rng);

    for (std::size_t i = 0; i + 1 < n; ++i) {
        nodes_[idx[i]].next = idx[i + 1];
    }
    nodes_[idx[n - 1]].next = idx[0];
    cursor_ = idx[0];
}

void Workload::run() {
    switch (kind_) {
        case WorkloadKind::Spin: {
            const double alpha = 1.0000000001;
            const double beta = 0.0000000001;
            double x = acc_;
            for (int k = 0; k < work_; ++k) {
                x = std::fma(x, alpha, beta);
            }
            acc_ = x;
            keep_result(acc_);
            break;
        }
        case WorkloadKind::Chase: {
            std::uint32_t cur = cursor_;
            for (int k = 0; k < work_; ++k) {
                cur = nodes_[cur].next;
            }
            cursor_ = cur;
            keep_result(cursor_);
            break;
        }
        case WorkloadKind::Sleep:
            std::this_thread::sleep_for(std::chrono::microseconds(work_));
            break;
    }
}

} // namespace lapbench
