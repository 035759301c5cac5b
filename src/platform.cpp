#include "lapbench/platform.hpp"
#include "lapbench/lap_timer.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/utsname.h>
#endif

namespace lapbench {

ClockProbe probe_clock(const Clock& clock, int reads) {
    LapTimer timer(reads, clock);
    while (timer.next()) {
    }

    std::vector<Duration> laps = timer.laps();
    std::sort(laps.begin(), laps.end());

    ClockProbe probe;
    probe.reads = reads;
    probe.read_cost_ns = laps[laps.size() / 2].count();

    const auto nonzero = std::upper_bound(laps.begin(), laps.end(), Duration{0});
    if (nonzero != laps.end()) probe.granularity_ns = nonzero->count();
    return probe;
}

Platform collect_platform(const Clock& clock) {
    Platform p;

#if defined(__unix__) || defined(__APPLE__)
    struct utsname u {};
    if (uname(&u) == 0) {
        p.os = std::string(u.sysname) + " " + u.release;
        p.arch = u.machine;
    }
#elif defined(_WIN32)
    p.os = "Windows";
#endif
    if (p.os.empty()) p.os = "unknown";

    p.hardware_threads = std::max(1u, std::thread::hardware_concurrency());

#if defined(__VERSION__)
    p.compiler = __VERSION__;
#elif defined(_MSC_FULL_VER)
    p.compiler = "MSVC " + std::to_string(_MSC_FULL_VER);
#else
    p.compiler = "unknown";
#endif

#if defined(_MSVC_LANG)
    p.cpp_standard = _MSVC_LANG;
#else
    p.cpp_standard = __cplusplus;
#endif

    p.steady_clock = std::chrono::steady_clock::is_steady;
    p.clock = probe_clock(clock);
    return p;
}

} // namespace lapbench
