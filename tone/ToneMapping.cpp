#include "ToneMapping.hpp"

#include <algorithm>
#include <iostream>

SensorReading clampReading(int32_t raw) {
    return std::clamp(raw, kAdcMin, kAdcMax);
}

float normalize(int32_t raw, const Calibration& cal) {
    if (cal.raw_max <= cal.raw_min) {
        std::cerr << "Warning: empty calibration span [" << cal.raw_min << ", "
                  << cal.raw_max << "]\n";
        return 0.0f;
    }
    if (raw < cal.raw_min) {
        raw = cal.raw_min;
    } else if (raw > cal.raw_max) {
        raw = cal.raw_max;
    }
    return static_cast<float>(raw - cal.raw_min) / static_cast<float>(cal.raw_max - cal.raw_min);
}

float estimateLux(float norm) {
    return norm * kLuxAtFullScale;
}

ToneMapping::ToneMapping(const Calibration& cal) : cal_(cal) {
    cal_.raw_min = clampReading(cal_.raw_min);
    cal_.raw_max = clampReading(cal_.raw_max);
    if (cal_.raw_max <= cal_.raw_min) {
        std::cerr << "Warning: invalid calibration [" << cal.raw_min << ", " << cal.raw_max
                  << "], using full ADC range.\n";
        cal_ = Calibration{kAdcMin, kAdcMax};
    }
}

int ToneMapping::noteIndex(SensorReading reading) const {
    if (reading <= cal_.raw_min) return 0;
    if (reading >= cal_.raw_max) return kScaleSize - 1;

    // kScaleSize equal steps over [raw_min, raw_max]
    int64_t span = static_cast<int64_t>(cal_.raw_max) - cal_.raw_min + 1;
    int64_t offset = static_cast<int64_t>(reading) - cal_.raw_min;
    return static_cast<int>(offset * kScaleSize / span);
}

int ToneMapping::mapToTone(SensorReading reading) const {
    return kScale[noteIndex(reading)];
}
