#ifndef CYCLESTATS_HPP
#define CYCLESTATS_HPP

#include <cstdint>
#include <limits>

// Execution time of a periodic service, in microseconds
struct CycleStats {
    uint64_t count = 0;
    uint64_t min_us = std::numeric_limits<uint64_t>::max();
    uint64_t max_us = 0;
    uint64_t total_us = 0;

    void update(uint64_t exec_us);
    void reset();

    double averageUs() const;
    uint64_t jitterUs() const;
};

#endif // CYCLESTATS_HPP
