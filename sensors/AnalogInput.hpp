#ifndef ANALOGINPUT_HPP
#define ANALOGINPUT_HPP

#include <cstdint>

class AnalogInput {
public:
    virtual ~AnalogInput() = default;

    // Reads one raw sample on the 12-bit scale. Returns false on a failed read.
    virtual bool read(int32_t& raw) = 0;
};

#endif // ANALOGINPUT_HPP
