#ifndef TONEMAPPING_HPP
#define TONEMAPPING_HPP

#include "../common/Config.hpp"
#include "../common/SensorData.hpp"

constexpr Calibration kDefaultCalibration{kCalibratedDark, kCalibratedBright};

// Clamp a raw sample into [kAdcMin, kAdcMax]
SensorReading clampReading(int32_t raw);

// Position of raw inside the calibrated span, in [0.0, 1.0]
float normalize(int32_t raw, const Calibration& cal = kDefaultCalibration);

float estimateLux(float norm);

// Stepped light-to-note mapping over the calibrated span. Readings at or below
// raw_min give the lowest note, at or above raw_max the highest.
class ToneMapping {
public:
    explicit ToneMapping(const Calibration& cal = kDefaultCalibration);

    int mapToTone(SensorReading reading) const;
    int noteIndex(SensorReading reading) const;

    int lowest() const { return kScale[0]; }
    int highest() const { return kScale[kScaleSize - 1]; }

    const Calibration& calibration() const { return cal_; }

private:
    Calibration cal_;
};

#endif // TONEMAPPING_HPP
