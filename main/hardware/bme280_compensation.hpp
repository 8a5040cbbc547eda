#ifndef BME280_COMPENSATION_HPP
#define BME280_COMPENSATION_HPP

#include <cstdint>

// Factory trimming coefficients. Loaded once, never modified afterwards.
struct CalibrationProfile {
    // Temperature
    uint16_t dig_T1;
    int16_t  dig_T2;
    int16_t  dig_T3;

    // Pressure
    uint16_t dig_P1;
    int16_t  dig_P2;
    int16_t  dig_P3;
    int16_t  dig_P4;
    int16_t  dig_P5;
    int16_t  dig_P6;
    int16_t  dig_P7;
    int16_t  dig_P8;
    int16_t  dig_P9;

    // Humidity (BME280 only)
    uint8_t  dig_H1;
    int16_t  dig_H2;
    uint8_t  dig_H3;
    int16_t  dig_H4;
    int16_t  dig_H5;
    int8_t   dig_H6;

    bool     has_humidity;
};

// Bosch BME280/BMP280 integer compensation. Operation order matches the
// datasheet reference code; changing it changes rounding.
namespace Bme280Compensation {
    // Sizes of the two calibration blocks
    static constexpr int TP_BLOCK_LEN = 26; // 0x88..0xA1 (0xA1 holds dig_H1)
    static constexpr int H_BLOCK_LEN  = 7;  // 0xE1..0xE7

    // Parse the 0x88..0xA1 block. dig_H1 is taken from its last byte.
    void parseTemperaturePressure(const uint8_t* block, CalibrationProfile& out);

    // Parse the 0xE1..0xE7 block (12-bit signed dig_H4/dig_H5 share 0xE5)
    void parseHumidity(const uint8_t* block, CalibrationProfile& out);

    // Returns temperature in 0.01 degC; writes the fine temperature used by
    // the pressure and humidity steps.
    int32_t compensateTemperature(int32_t adc_T, const CalibrationProfile& cal, int32_t& t_fine);

    // Returns pressure in Pa as Q24.8 (value / 256 = Pa), 0 if the divisor is 0
    uint32_t compensatePressure(int32_t adc_P, int32_t t_fine, const CalibrationProfile& cal);

    // Returns relative humidity as Q22.10 (value / 1024 = %RH), clamped to 0..100 %
    uint32_t compensateHumidity(int32_t adc_H, int32_t t_fine, const CalibrationProfile& cal);

    // Raw field assembly from the burst read registers
    int32_t raw20(const uint8_t* msb_lsb_xlsb);
    int32_t raw16(const uint8_t* msb_lsb);
}

#endif // BME280_COMPENSATION_HPP
