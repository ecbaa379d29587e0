#include "ads1115.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <sys/syslog.h>
#include <unistd.h>

#define REG_CONVERSION 0x00
#define REG_CONFIG     0x01

#define CFG_OS_SINGLE  0x8000
#define CFG_PGA_4_096V 0x0200
#define CFG_MODE_SINGLE 0x0100
#define CFG_DR_128SPS  0x0080
#define CFG_COMP_OFF   0x0003

#define CONVERSION_POLL_US 1000
#define CONVERSION_POLL_MAX 20

static int i2c_fd = -1;

static bool writeRegister(uint8_t reg, uint16_t value) {
    uint8_t buf[3] = {reg, static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)};
    return write(i2c_fd, buf, sizeof(buf)) == static_cast<ssize_t>(sizeof(buf));
}

static bool readRegister(uint8_t reg, uint16_t& value) {
    if (write(i2c_fd, &reg, 1) != 1) {
        return false;
    }
    uint8_t buf[2] = {0};
    if (read(i2c_fd, buf, sizeof(buf)) != static_cast<ssize_t>(sizeof(buf))) {
        return false;
    }
    value = static_cast<uint16_t>((buf[0] << 8) | buf[1]);
    return true;
}

bool initADS1115(const char* device, int address) {
    i2c_fd = open(device, O_RDWR);
    if (i2c_fd < 0) {
        syslog(LOG_ERR, "Failed to open %s: %s", device, strerror(errno));
        return false;
    }

    if (ioctl(i2c_fd, I2C_SLAVE, address) < 0) {
        syslog(LOG_ERR, "Failed to select ADS1115 at 0x%02x: %s", address, strerror(errno));
        closeADS1115();
        return false;
    }

    // Probe: the config register must answer
    uint16_t config = 0;
    if (!readRegister(REG_CONFIG, config)) {
        syslog(LOG_ERR, "ADS1115 at 0x%02x not responding", address);
        closeADS1115();
        return false;
    }

    std::cout << "[ADS1115] Opened " << device << " @ 0x" << std::hex << address << std::dec << "\n";
    return true;
}

void closeADS1115() {
    if (i2c_fd >= 0) {
        close(i2c_fd);
        i2c_fd = -1;
    }
}

bool readADS1115Raw(int channel, int16_t& raw) {
    if (i2c_fd < 0 || channel < 0 || channel > 3) {
        return false;
    }

    uint16_t mux = static_cast<uint16_t>((0x4 + channel) << 12);
    uint16_t config = CFG_OS_SINGLE | mux | CFG_PGA_4_096V | CFG_MODE_SINGLE |
                      CFG_DR_128SPS | CFG_COMP_OFF;
    if (!writeRegister(REG_CONFIG, config)) {
        return false;
    }

    // OS bit reads back as 1 once the conversion is complete
    for (int i = 0; i < CONVERSION_POLL_MAX; ++i) {
        usleep(CONVERSION_POLL_US);
        uint16_t status = 0;
        if (!readRegister(REG_CONFIG, status)) {
            return false;
        }
        if (status & CFG_OS_SINGLE) {
            uint16_t value = 0;
            if (!readRegister(REG_CONVERSION, value)) {
                return false;
            }
            raw = static_cast<int16_t>(value);
            return true;
        }
    }
    return false;
}

float convertToVoltage(int16_t raw, float fullScale) {
    return raw * fullScale / 32768.0f;
}

int32_t scaleTo12Bit(int16_t raw) {
    if (raw < 0) {
        return 0;
    }
    return raw >> 3;
}

bool Ads1115Input::read(int32_t& raw) {
    int16_t conversion = 0;
    if (!readADS1115Raw(channel_, conversion)) {
        return false;
    }
    raw = scaleTo12Bit(conversion);
    return true;
}
