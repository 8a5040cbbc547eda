#ifndef ESP_I2C_BUS_HPP
#define ESP_I2C_BUS_HPP

#include <cstdint>
#include <driver/i2c.h>
#include <driver/gpio.h>
#include <main/hardware/i2c_bus.hpp>

// I2cBus on the ESP-IDF legacy I2C master driver.
// Static memory only; command links are built in a fixed buffer.
class EspI2cBus : public I2cBus {
public:
	EspI2cBus(i2c_port_t port,
	          gpio_num_t sda,
	          gpio_num_t scl,
	          uint32_t i2c_clk_hz,
	          uint32_t timeout_ms);

	// Install the driver (idempotent)
	bool init();

	BusStatus writeRegister(uint8_t addr7, uint8_t reg, uint8_t value) override;
	BusStatus readRegisters(uint8_t addr7, uint8_t reg, uint8_t* out, std::size_t len) override;
	void delayMs(uint32_t ms) override;

private:
	static BusStatus fromEspErr(esp_err_t err);

	i2c_port_t port;
	gpio_num_t sda;
	gpio_num_t scl;
	uint32_t i2c_clk_hz;
	uint32_t timeout_ms;
	bool i2c_ready;
};

#endif // ESP_I2C_BUS_HPP
