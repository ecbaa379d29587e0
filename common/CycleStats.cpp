#include "CycleStats.hpp"

#include <algorithm>

void CycleStats::update(uint64_t exec_us) {
    min_us = std::min(min_us, exec_us);
    max_us = std::max(max_us, exec_us);
    total_us += exec_us;
    count++;
}

void CycleStats::reset() {
    *this = CycleStats{};
}

double CycleStats::averageUs() const {
    return count == 0 ? 0.0 : static_cast<double>(total_us) / count;
}

uint64_t CycleStats::jitterUs() const {
    return count == 0 ? 0 : max_us - min_us;
}
