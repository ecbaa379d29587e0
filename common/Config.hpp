#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>

// Analog input scale (12-bit)
constexpr int32_t kAdcMin = 0;
constexpr int32_t kAdcMax = 4095;

// ADS1115 wiring
constexpr const char* kI2cDevice = "/dev/i2c-1";
constexpr int kAds1115Address    = 0x48;
constexpr int kLightChannel      = 0;       // A0
constexpr float kAdsFullScaleV   = 4.096f;
constexpr int32_t kAdsMaxCode    = 32767;

// Divider supply rail
constexpr float kSupplyV = 3.3f;

// Calibrated photoresistor bounds on the 12-bit scale.
// Dark: 600 on the 16-bit scale. Bright: the divider at the supply rail.
constexpr int32_t kCalibratedDark   = 600 >> 4;
constexpr int32_t kCalibratedBright =
    static_cast<int32_t>(kSupplyV / kAdsFullScaleV * kAdsMaxCode) >> 3;

// Buzzer on hardware PWM channel 0
constexpr unsigned kBuzzerGpio = 18;        // BCM numbering, physical pin 12
constexpr float kDefaultDuty   = 0.5f;

// pigpio hardware PWM duty range
constexpr unsigned kPwmDutyRange = 1000000;

// Loop cadence
constexpr int kSamplePeriodMs    = 50;
constexpr int kStatusEveryCycles = 20;      // one status line per second

// Playback defaults
constexpr int kDefaultToneMs = 250;
constexpr int kDefaultGapMs  = 50;

// Note frequencies (Hz)
constexpr int kNoteC4 = 262;
constexpr int kNoteD4 = 294;
constexpr int kNoteE4 = 330;
constexpr int kNoteF4 = 349;
constexpr int kNoteG4 = 392;
constexpr int kNoteA4 = 440;
constexpr int kNoteB4 = 494;
constexpr int kNoteC5 = 523;

constexpr int kScale[] = {
    kNoteC4, kNoteD4, kNoteE4, kNoteF4, kNoteG4, kNoteA4, kNoteB4, kNoteC5
};
constexpr int kScaleSize = sizeof(kScale) / sizeof(kScale[0]);

// Lux estimate at full brightness
constexpr float kLuxAtFullScale = 1000.0f;

#endif // CONFIG_HPP
