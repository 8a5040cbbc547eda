#ifndef BME280_SENSOR_HPP
#define BME280_SENSOR_HPP

#include <cstdint>
#include <main/config/config.hpp>
#include <main/hardware/i2c_bus.hpp>
#include <main/hardware/bme280_compensation.hpp>
#include <main/models/errors.hpp>
#include <main/models/measurement.hpp>

enum class SensorVariant : uint8_t {
    NONE = 0,
    BME280, // temperature, pressure, humidity
    BMP280  // temperature, pressure
};

// Driver for Bosch BME280 / BMP280 in forced mode (1x oversampling, filter off).
// Sole owner of the sensor bus traffic; call from one task only.
class Bme280Sensor {
public:
    explicit Bme280Sensor(I2cBus& bus,
                          uint8_t primary_addr = Config::Hardware::Sensor::primary_addr,
                          uint8_t secondary_addr = Config::Hardware::Sensor::secondary_addr);

    // Probe both addresses, reset, load calibration and configure.
    // NOT_FOUND if no supported chip answers.
    SensorError init();

    // Trigger one conversion and compensate it. sequence and ts_ms are left
    // for the caller to fill.
    SensorError readMeasurement(Measurement& out);

    bool isInitialized() const { return initialized; }
    SensorVariant variant() const { return chip_variant; }
    uint8_t address() const { return addr; }
    bool hasHumidity() const { return chip_variant == SensorVariant::BME280; }
    // Topic suffix: "bme280", "bmp280" or "none"
    const char* sensorTypeName() const;
    const CalibrationProfile& calibration() const { return cal; }

private:
    SensorError probe();
    SensorError resetAndWait();
    SensorError loadCalibration();
    SensorError configure();
    SensorError triggerAndWait();
    static SensorError fromBus(BusStatus status);

    I2cBus& bus;
    uint8_t candidates[2];
    uint8_t addr;
    SensorVariant chip_variant;
    CalibrationProfile cal;
    bool initialized;
};

#endif // BME280_SENSOR_HPP
