#ifndef SENSORDATA_HPP
#define SENSORDATA_HPP

#include <cstdint>

// One light sample on the 12-bit scale, always in [kAdcMin, kAdcMax]
using SensorReading = int32_t;

struct BuzzerState {
    bool active = false;
    int frequency_hz = 0;
    float duty = 0.0f;
};

struct Calibration {
    int32_t raw_min;    // dark
    int32_t raw_max;    // bright
};

struct Note {
    int frequency_hz;   // 0 is a rest
    int duration_ms;
};

#endif // SENSORDATA_HPP
