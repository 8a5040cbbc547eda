#include <main/hardware/bme280_sensor.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "BME280";

// Registers
static constexpr uint8_t REG_CALIB_00   = 0x88; // dig_T1 LSB .. dig_H1 (0xA1)
static constexpr uint8_t REG_CHIP_ID    = 0xD0;
static constexpr uint8_t REG_RESET      = 0xE0;
static constexpr uint8_t REG_CALIB_26   = 0xE1; // dig_H2 LSB .. dig_H6
static constexpr uint8_t REG_CTRL_HUM   = 0xF2;
static constexpr uint8_t REG_STATUS     = 0xF3;
static constexpr uint8_t REG_CTRL_MEAS  = 0xF4;
static constexpr uint8_t REG_CONFIG     = 0xF5;
static constexpr uint8_t REG_DATA_START = 0xF7; // press_msb

// Chip identities
static constexpr uint8_t CHIP_ID_BME280 = 0x60;
static constexpr uint8_t CHIP_ID_BMP280 = 0x58;

static constexpr uint8_t RESET_COMMAND  = 0xB6;

// Status bits
static constexpr uint8_t STATUS_MEASURING = 0x08;
static constexpr uint8_t STATUS_IM_UPDATE = 0x01;

// ctrl_hum: osrs_h = x1
static constexpr uint8_t CTRL_HUM_X1 = 0x01;
// ctrl_meas: osrs_t = x1 [7:5], osrs_p = x1 [4:2], mode [1:0]
static constexpr uint8_t CTRL_MEAS_SLEEP  = 0x24;
static constexpr uint8_t CTRL_MEAS_FORCED = 0x25;
// config: t_sb = 0.5 ms, filter off, no 3-wire SPI
static constexpr uint8_t CONFIG_DEFAULT = 0x00;

// Sentinels the chip reports when a channel holds no conversion result
static constexpr int32_t RAW_SKIPPED_20BIT = 0x80000;
static constexpr int32_t RAW_SKIPPED_16BIT = 0x8000;

// Bounded waits (1x oversampling conversion is ~10 ms)
static constexpr uint32_t POLL_INTERVAL_MS = 2;
static constexpr int MEASURE_POLL_ATTEMPTS = 50;
static constexpr int RESET_POLL_ATTEMPTS = 10;

// Physical validity window
static constexpr int32_t TEMP_MIN_CENTI = -4000;
static constexpr int32_t TEMP_MAX_CENTI = 8500;
static constexpr float PRESSURE_MIN_HPA = 300.0f;
static constexpr float PRESSURE_MAX_HPA = 1100.0f;

Bme280Sensor::Bme280Sensor(I2cBus& bus_in, uint8_t primary_addr, uint8_t secondary_addr)
    : bus(bus_in),
      candidates{primary_addr, secondary_addr},
      addr(0),
      chip_variant(SensorVariant::NONE),
      cal{},
      initialized(false) {}

const char* Bme280Sensor::sensorTypeName() const {
    switch (chip_variant) {
        case SensorVariant::BME280: return "bme280";
        case SensorVariant::BMP280: return "bmp280";
        default:                    return "none";
    }
}

SensorError Bme280Sensor::fromBus(BusStatus status) {
    return (status == BusStatus::OK) ? SensorError::OK : SensorError::COMMUNICATION_TIMEOUT;
}

SensorError Bme280Sensor::probe() {
    for (uint8_t candidate : candidates) {
        uint8_t id = 0;
        BusStatus st = bus.readRegisters(candidate, REG_CHIP_ID, &id, 1);
        if (st != BusStatus::OK) {
            LOG_DEBUG(TAG, "No answer at 0x%02X (%s)", candidate, toString(st));
            continue;
        }
        if (id == CHIP_ID_BME280) {
            chip_variant = SensorVariant::BME280;
        } else if (id == CHIP_ID_BMP280) {
            chip_variant = SensorVariant::BMP280;
        } else {
            LOG_WARN(TAG, "Unknown chip id 0x%02X at 0x%02X", id, candidate);
            continue;
        }
        addr = candidate;
        LOG_INFO(TAG, "Found %s (id 0x%02X) at 0x%02X", sensorTypeName(), id, addr);
        return SensorError::OK;
    }
    return SensorError::NOT_FOUND;
}

SensorError Bme280Sensor::resetAndWait() {
    SensorError err = fromBus(bus.writeRegister(addr, REG_RESET, RESET_COMMAND));
    if (err != SensorError::OK) {
        return err;
    }
    for (int i = 0; i < RESET_POLL_ATTEMPTS; ++i) {
        bus.delayMs(POLL_INTERVAL_MS);
        uint8_t status = 0;
        err = fromBus(bus.readRegisters(addr, REG_STATUS, &status, 1));
        if (err != SensorError::OK) {
            return err;
        }
        if ((status & STATUS_IM_UPDATE) == 0) {
            return SensorError::OK;
        }
    }
    LOG_WARN(TAG, "%s", "NVM copy did not finish after reset");
    return SensorError::COMMUNICATION_TIMEOUT;
}

SensorError Bme280Sensor::loadCalibration() {
    CalibrationProfile loaded{};
    uint8_t tp_block[Bme280Compensation::TP_BLOCK_LEN];
    SensorError err = fromBus(bus.readRegisters(addr, REG_CALIB_00, tp_block, sizeof(tp_block)));
    if (err != SensorError::OK) {
        return err;
    }
    Bme280Compensation::parseTemperaturePressure(tp_block, loaded);

    if (chip_variant == SensorVariant::BME280) {
        uint8_t h_block[Bme280Compensation::H_BLOCK_LEN];
        err = fromBus(bus.readRegisters(addr, REG_CALIB_26, h_block, sizeof(h_block)));
        if (err != SensorError::OK) {
            return err;
        }
        Bme280Compensation::parseHumidity(h_block, loaded);
    } else {
        loaded.dig_H1 = 0;
    }
    cal = loaded;
    LOG_DEBUG(TAG, "Calibration T1=%u T2=%d T3=%d P1=%u", cal.dig_T1, cal.dig_T2, cal.dig_T3, cal.dig_P1);
    return SensorError::OK;
}

SensorError Bme280Sensor::configure() {
    // ctrl_hum only takes effect after a write to ctrl_meas
    if (chip_variant == SensorVariant::BME280) {
        SensorError err = fromBus(bus.writeRegister(addr, REG_CTRL_HUM, CTRL_HUM_X1));
        if (err != SensorError::OK) {
            return err;
        }
    }
    SensorError err = fromBus(bus.writeRegister(addr, REG_CONFIG, CONFIG_DEFAULT));
    if (err != SensorError::OK) {
        return err;
    }
    return fromBus(bus.writeRegister(addr, REG_CTRL_MEAS, CTRL_MEAS_SLEEP));
}

SensorError Bme280Sensor::init() {
    initialized = false;
    chip_variant = SensorVariant::NONE;
    SensorError err = probe();
    if (err != SensorError::OK) {
        LOG_ERROR(TAG, "No BME280/BMP280 at 0x%02X or 0x%02X", candidates[0], candidates[1]);
        return err;
    }
    err = resetAndWait();
    if (err == SensorError::OK) {
        err = loadCalibration();
    }
    if (err == SensorError::OK) {
        err = configure();
    }
    if (err != SensorError::OK) {
        LOG_ERROR(TAG, "Init failed: %s", toString(err));
        return err;
    }
    initialized = true;
    return SensorError::OK;
}

SensorError Bme280Sensor::triggerAndWait() {
    SensorError err = fromBus(bus.writeRegister(addr, REG_CTRL_MEAS, CTRL_MEAS_FORCED));
    if (err != SensorError::OK) {
        return err;
    }
    for (int i = 0; i < MEASURE_POLL_ATTEMPTS; ++i) {
        bus.delayMs(POLL_INTERVAL_MS);
        uint8_t status = 0;
        err = fromBus(bus.readRegisters(addr, REG_STATUS, &status, 1));
        if (err != SensorError::OK) {
            return err;
        }
        if ((status & STATUS_MEASURING) == 0) {
            return SensorError::OK;
        }
    }
    LOG_WARN(TAG, "%s", "Conversion did not complete in time");
    return SensorError::COMMUNICATION_TIMEOUT;
}

SensorError Bme280Sensor::readMeasurement(Measurement& out) {
    if (!initialized) {
        return SensorError::CALIBRATION_MISSING;
    }
    SensorError err = triggerAndWait();
    if (err != SensorError::OK) {
        return err;
    }

    // press[3] temp[3] hum[2]
    uint8_t data[8] = {0};
    const std::size_t len = hasHumidity() ? 8 : 6;
    err = fromBus(bus.readRegisters(addr, REG_DATA_START, data, len));
    if (err != SensorError::OK) {
        return err;
    }
    const int32_t adc_P = Bme280Compensation::raw20(&data[0]);
    const int32_t adc_T = Bme280Compensation::raw20(&data[3]);
    const int32_t adc_H = hasHumidity() ? Bme280Compensation::raw16(&data[6]) : 0;

    if (adc_T == RAW_SKIPPED_20BIT || adc_P == RAW_SKIPPED_20BIT ||
        (hasHumidity() && adc_H == RAW_SKIPPED_16BIT)) {
        LOG_WARN(TAG, "%s", "No new data (sentinel raw value)");
        return SensorError::INVALID_READING;
    }

    int32_t t_fine = 0;
    const int32_t temp_centi = Bme280Compensation::compensateTemperature(adc_T, cal, t_fine);
    if (temp_centi < TEMP_MIN_CENTI || temp_centi > TEMP_MAX_CENTI) {
        LOG_WARN(TAG, "Temperature out of range: %ld cC", static_cast<long>(temp_centi));
        return SensorError::INVALID_READING;
    }

    const uint32_t press_q24_8 = Bme280Compensation::compensatePressure(adc_P, t_fine, cal);
    const float pressure_hpa = static_cast<float>(press_q24_8) / 25600.0f;
    if (press_q24_8 == 0 || pressure_hpa < PRESSURE_MIN_HPA || pressure_hpa > PRESSURE_MAX_HPA) {
        LOG_WARN(TAG, "Pressure out of range: %.2f hPa", static_cast<double>(pressure_hpa));
        return SensorError::INVALID_READING;
    }

    out.temperature_c = static_cast<float>(temp_centi) / 100.0f;
    out.pressure_hpa = pressure_hpa;
    out.has_humidity = hasHumidity();
    out.humidity_pct = 0.0f;
    if (out.has_humidity) {
        const uint32_t hum_q22_10 = Bme280Compensation::compensateHumidity(adc_H, t_fine, cal);
        out.humidity_pct = static_cast<float>(hum_q22_10) / 1024.0f;
    }
    return SensorError::OK;
}
