#include <main/hardware/bme280_sensor.hpp>
#include "fakes.hpp"
#include "sensor_fixtures.hpp"
#include "test_support.hpp"

static const uint8_t ADDR_PRIMARY = 0x76;
static const uint8_t ADDR_SECONDARY = 0x77;

static void test_not_found_when_bus_is_empty()
{
    FakeI2cBus bus;
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::NOT_FOUND);
    EXPECT_FALSE(sensor.isInitialized());
    EXPECT_TRUE(sensor.variant() == SensorVariant::NONE);
}

static void test_unknown_chip_id_is_not_found()
{
    FakeI2cBus bus;
    bus.attach(ADDR_PRIMARY, 0x55);
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::NOT_FOUND);
}

static void test_read_before_init()
{
    FakeI2cBus bus;
    Bme280Sensor sensor(bus);
    Measurement m{};
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::CALIBRATION_MISSING);
    EXPECT_EQ_INT(bus.writes, 0);
}

static void test_bme280_at_secondary_address()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_SECONDARY, 0x60);
    Fixture::setRaw(bus, ADDR_SECONDARY, Fixture::INDOOR_ADC_P, Fixture::INDOOR_ADC_T, Fixture::INDOOR_ADC_H);
    Bme280Sensor sensor(bus);

    EXPECT_TRUE(sensor.init() == SensorError::OK);
    EXPECT_TRUE(sensor.variant() == SensorVariant::BME280);
    EXPECT_EQ_INT(sensor.address(), ADDR_SECONDARY);
    EXPECT_TRUE(sensor.hasHumidity());
    EXPECT_STREQ(sensor.sensorTypeName(), "bme280");
    EXPECT_EQ_INT(bus.resets, 1);
    EXPECT_EQ_INT(sensor.calibration().dig_T1, Fixture::T1);

    // Configured for x1 oversampling, filter off, sleep
    EXPECT_EQ_INT(bus.reg(ADDR_SECONDARY, 0xF2), 0x01);
    EXPECT_EQ_INT(bus.reg(ADDR_SECONDARY, 0xF5), 0x00);
    EXPECT_EQ_INT(bus.reg(ADDR_SECONDARY, 0xF4), 0x24);

    Measurement m{};
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::OK);
    EXPECT_EQ_INT(bus.forced_triggers, 1);
    EXPECT_NEAR(m.temperature_c, 23.5, 0.01);
    EXPECT_NEAR(m.pressure_hpa, 1013.8, 0.1);
    EXPECT_TRUE(m.has_humidity);
    EXPECT_NEAR(m.humidity_pct, 68.2, 0.1);
}

static void test_bmp280_has_no_humidity()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x58);
    Fixture::setRaw(bus, ADDR_PRIMARY, Fixture::DATASHEET_ADC_P, Fixture::DATASHEET_ADC_T, 0);
    Bme280Sensor sensor(bus);

    EXPECT_TRUE(sensor.init() == SensorError::OK);
    EXPECT_TRUE(sensor.variant() == SensorVariant::BMP280);
    EXPECT_FALSE(sensor.hasHumidity());
    EXPECT_FALSE(sensor.calibration().has_humidity);
    EXPECT_STREQ(sensor.sensorTypeName(), "bmp280");
    // ctrl_hum is never touched on a BMP280
    EXPECT_EQ_INT(bus.reg(ADDR_PRIMARY, 0xF2), 0x00);

    Measurement m{};
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::OK);
    EXPECT_NEAR(m.temperature_c, 25.08, 0.01);
    EXPECT_NEAR(m.pressure_hpa, 1006.53, 0.01);
    EXPECT_FALSE(m.has_humidity);
}

static void test_primary_address_wins()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x58);
    Fixture::installChip(bus, ADDR_SECONDARY, 0x60);
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::OK);
    EXPECT_EQ_INT(sensor.address(), ADDR_PRIMARY);
    EXPECT_TRUE(sensor.variant() == SensorVariant::BMP280);
}

static void test_sentinel_values_are_invalid()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x60);
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::OK);

    Measurement m{};
    Fixture::setRaw(bus, ADDR_PRIMARY, Fixture::INDOOR_ADC_P, 0x80000, Fixture::INDOOR_ADC_H);
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::INVALID_READING);
    Fixture::setRaw(bus, ADDR_PRIMARY, 0x80000, Fixture::INDOOR_ADC_T, Fixture::INDOOR_ADC_H);
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::INVALID_READING);
    Fixture::setRaw(bus, ADDR_PRIMARY, Fixture::INDOOR_ADC_P, Fixture::INDOOR_ADC_T, 0x8000);
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::INVALID_READING);
}

static void test_out_of_range_results_are_invalid()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x60);
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::OK);

    Measurement m{};
    // About -44 degC
    Fixture::setRaw(bus, ADDR_PRIMARY, Fixture::INDOOR_ADC_P, 300000, Fixture::INDOOR_ADC_H);
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::INVALID_READING);
    // About 181 hPa
    Fixture::setRaw(bus, ADDR_PRIMARY, 900000, Fixture::INDOOR_ADC_T, Fixture::INDOOR_ADC_H);
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::INVALID_READING);
}

static void test_conversion_timeout()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x60);
    Fixture::setRaw(bus, ADDR_PRIMARY, Fixture::INDOOR_ADC_P, Fixture::INDOOR_ADC_T, Fixture::INDOOR_ADC_H);
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::OK);

    bus.stuck_measuring = true;
    const uint32_t delayed_before = bus.delayed_ms;
    Measurement m{};
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::COMMUNICATION_TIMEOUT);
    // Bounded wait
    EXPECT_TRUE(bus.delayed_ms - delayed_before <= 200);

    bus.stuck_measuring = false;
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::OK);
}

static void test_bus_timeout_during_calibration()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x60);
    bus.fail_reg = 0x88;
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::COMMUNICATION_TIMEOUT);
    EXPECT_FALSE(sensor.isInitialized());
}

static void test_bus_timeout_during_burst_read()
{
    FakeI2cBus bus;
    Fixture::installChip(bus, ADDR_PRIMARY, 0x60);
    Bme280Sensor sensor(bus);
    EXPECT_TRUE(sensor.init() == SensorError::OK);
    bus.fail_reg = 0xF7;
    Measurement m{};
    EXPECT_TRUE(sensor.readMeasurement(m) == SensorError::COMMUNICATION_TIMEOUT);
}

int main()
{
    test_not_found_when_bus_is_empty();
    test_unknown_chip_id_is_not_found();
    test_read_before_init();
    test_bme280_at_secondary_address();
    test_bmp280_has_no_humidity();
    test_primary_address_wins();
    test_sentinel_values_are_invalid();
    test_out_of_range_results_are_invalid();
    test_conversion_timeout();
    test_bus_timeout_during_calibration();
    test_bus_timeout_during_burst_read();
    return testResult("bme280_sensor");
}
