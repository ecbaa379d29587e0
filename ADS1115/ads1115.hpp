#ifndef ADS1115_HPP
#define ADS1115_HPP

#include <cstdint>
#include "../sensors/AnalogInput.hpp"

bool initADS1115(const char* device, int address);
void closeADS1115();

// Single-shot conversion on a single-ended channel (0-3)
bool readADS1115Raw(int channel, int16_t& raw);

float convertToVoltage(int16_t raw, float fullScale);

// Signed 16-bit conversion to the 12-bit light scale
int32_t scaleTo12Bit(int16_t raw);

class Ads1115Input : public AnalogInput {
public:
    explicit Ads1115Input(int channel) : channel_(channel) {}

    bool read(int32_t& raw) override;

private:
    int channel_;
};

#endif // ADS1115_HPP
