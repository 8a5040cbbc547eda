#include <main/hardware/esp_i2c_bus.hpp>
#include <main/utils/logger.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static const char* TAG = "I2C_BUS";

EspI2cBus::EspI2cBus(i2c_port_t port_in,
                     gpio_num_t sda_in,
                     gpio_num_t scl_in,
                     uint32_t i2c_clk_hz_in,
                     uint32_t timeout_ms_in)
	: port(port_in),
	  sda(sda_in),
	  scl(scl_in),
	  i2c_clk_hz(i2c_clk_hz_in),
	  timeout_ms(timeout_ms_in),
	  i2c_ready(false) {}

bool EspI2cBus::init() {
	if (i2c_ready) return true;
	i2c_config_t cfg{};
	cfg.mode = I2C_MODE_MASTER;
	cfg.sda_io_num = sda;
	cfg.sda_pullup_en = GPIO_PULLUP_ENABLE;
	cfg.scl_io_num = scl;
	cfg.scl_pullup_en = GPIO_PULLUP_ENABLE;
	cfg.master.clk_speed = i2c_clk_hz;
#if ESP_IDF_VERSION >= ESP_IDF_VERSION_VAL(5, 0, 0)
	cfg.clk_flags = 0;
#endif
	esp_err_t err = i2c_param_config(port, &cfg);
	if (err != ESP_OK) {
		LOG_ERROR(TAG, "i2c_param_config failed: %d", err);
		return false;
	}
	err = i2c_driver_install(port, I2C_MODE_MASTER, 0, 0, 0);
	if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
		LOG_ERROR(TAG, "i2c_driver_install failed: %d", err);
		return false;
	}
	i2c_ready = true;
	LOG_INFO(TAG, "I2C%d ready (sda=%d scl=%d %lu Hz)", static_cast<int>(port), static_cast<int>(sda),
	         static_cast<int>(scl), static_cast<unsigned long>(i2c_clk_hz));
	return true;
}

BusStatus EspI2cBus::fromEspErr(esp_err_t err) {
	switch (err) {
		case ESP_OK:          return BusStatus::OK;
		case ESP_FAIL:        return BusStatus::NACK; // no ACK from slave
		case ESP_ERR_TIMEOUT: return BusStatus::TIMEOUT;
		default:              return BusStatus::ERROR;
	}
}

BusStatus EspI2cBus::writeRegister(uint8_t addr7, uint8_t reg, uint8_t value) {
	if (!i2c_ready) return BusStatus::ERROR;
	// Use a static buffer for the I2C command link to avoid heap allocation.
	static uint8_t link_buffer[I2C_LINK_RECOMMENDED_SIZE(3)];
	i2c_cmd_handle_t cmd = i2c_cmd_link_create_static(link_buffer, sizeof(link_buffer));
	if (cmd == nullptr) return BusStatus::ERROR;
	const uint8_t buf[2] = { reg, value };
	esp_err_t err = i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_WRITE), true);
	err |= i2c_master_write(cmd, buf, sizeof(buf), true);
	err |= i2c_master_stop(cmd);
	if (err == ESP_OK) {
		err = i2c_master_cmd_begin(port, cmd, pdMS_TO_TICKS(timeout_ms));
	}
	i2c_cmd_link_delete_static(cmd);
	if (err != ESP_OK) {
		LOG_DEBUG(TAG, "I2C write 0x%02X reg 0x%02X failed: %d", addr7, reg, err);
	}
	return fromEspErr(err);
}

BusStatus EspI2cBus::readRegisters(uint8_t addr7, uint8_t reg, uint8_t* out, std::size_t len) {
	if (!i2c_ready || out == nullptr || len == 0) return BusStatus::ERROR;
	static uint8_t link_buffer[I2C_LINK_RECOMMENDED_SIZE(6)];
	i2c_cmd_handle_t cmd = i2c_cmd_link_create_static(link_buffer, sizeof(link_buffer));
	if (cmd == nullptr) return BusStatus::ERROR;
	esp_err_t err = i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_WRITE), true);
	err |= i2c_master_write_byte(cmd, reg, true);
	// Repeated start, then read with NACK on the final byte
	err |= i2c_master_start(cmd);
	err |= i2c_master_write_byte(cmd, static_cast<uint8_t>((addr7 << 1) | I2C_MASTER_READ), true);
	err |= i2c_master_read(cmd, out, len, I2C_MASTER_LAST_NACK);
	err |= i2c_master_stop(cmd);
	if (err == ESP_OK) {
		err = i2c_master_cmd_begin(port, cmd, pdMS_TO_TICKS(timeout_ms));
	}
	i2c_cmd_link_delete_static(cmd);
	if (err != ESP_OK) {
		LOG_DEBUG(TAG, "I2C read 0x%02X reg 0x%02X len %u failed: %d", addr7, reg,
		          static_cast<unsigned>(len), err);
	}
	return fromEspErr(err);
}

void EspI2cBus::delayMs(uint32_t ms) {
	vTaskDelay(pdMS_TO_TICKS(ms));
}
