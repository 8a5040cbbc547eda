#ifndef I2C_BUS_HPP
#define I2C_BUS_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/errors.hpp>

// Register-level access to an I2C master bus. Every transaction is bounded by
// the implementation's bus timeout; nothing blocks indefinitely.
class I2cBus {
public:
    virtual ~I2cBus() = default;

    // Write one byte to a device register
    virtual BusStatus writeRegister(uint8_t addr7, uint8_t reg, uint8_t value) = 0;

    // Write the register pointer, repeated start, read len bytes
    virtual BusStatus readRegisters(uint8_t addr7, uint8_t reg, uint8_t* out, std::size_t len) = 0;

    // Suspend the calling task
    virtual void delayMs(uint32_t ms) = 0;
};

#endif // I2C_BUS_HPP
