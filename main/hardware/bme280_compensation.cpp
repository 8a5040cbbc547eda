#include <main/hardware/bme280_compensation.hpp>

namespace {
    static uint16_t u16le(const uint8_t* p) {
        return static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8 | p[0]);
    }

    static int16_t s16le(const uint8_t* p) {
        return static_cast<int16_t>(u16le(p));
    }
}

namespace Bme280Compensation {
    void parseTemperaturePressure(const uint8_t* block, CalibrationProfile& out) {
        out.dig_T1 = u16le(&block[0]);
        out.dig_T2 = s16le(&block[2]);
        out.dig_T3 = s16le(&block[4]);

        out.dig_P1 = u16le(&block[6]);
        out.dig_P2 = s16le(&block[8]);
        out.dig_P3 = s16le(&block[10]);
        out.dig_P4 = s16le(&block[12]);
        out.dig_P5 = s16le(&block[14]);
        out.dig_P6 = s16le(&block[16]);
        out.dig_P7 = s16le(&block[18]);
        out.dig_P8 = s16le(&block[20]);
        out.dig_P9 = s16le(&block[22]);

        // block[24] (0xA0) is reserved
        out.dig_H1 = block[25];
    }

    void parseHumidity(const uint8_t* block, CalibrationProfile& out) {
        out.dig_H2 = s16le(&block[0]);
        out.dig_H3 = block[2];
        // 0xE4 holds H4[11:4], 0xE5[3:0] H4[3:0]; 0xE6 holds H5[11:4], 0xE5[7:4] H5[3:0]
        int16_t h4_msb = static_cast<int16_t>(static_cast<int16_t>(static_cast<int8_t>(block[3])) * 16);
        int16_t h4_lsb = static_cast<int16_t>(block[4] & 0x0F);
        out.dig_H4 = static_cast<int16_t>(h4_msb | h4_lsb);
        int16_t h5_msb = static_cast<int16_t>(static_cast<int16_t>(static_cast<int8_t>(block[5])) * 16);
        int16_t h5_lsb = static_cast<int16_t>(block[4] >> 4);
        out.dig_H5 = static_cast<int16_t>(h5_msb | h5_lsb);
        out.dig_H6 = static_cast<int8_t>(block[6]);
        out.has_humidity = true;
    }

    // Shifts of possibly negative values are written as multiplications
    int32_t compensateTemperature(int32_t adc_T, const CalibrationProfile& cal, int32_t& t_fine) {
        int32_t var1 = ((((adc_T >> 3) - (static_cast<int32_t>(cal.dig_T1) << 1))) *
                        static_cast<int32_t>(cal.dig_T2)) >> 11;
        int32_t var2 = (((((adc_T >> 4) - static_cast<int32_t>(cal.dig_T1)) *
                          ((adc_T >> 4) - static_cast<int32_t>(cal.dig_T1))) >> 12) *
                        static_cast<int32_t>(cal.dig_T3)) >> 14;
        t_fine = var1 + var2;
        return (t_fine * 5 + 128) >> 8;
    }

    uint32_t compensatePressure(int32_t adc_P, int32_t t_fine, const CalibrationProfile& cal) {
        int64_t var1 = static_cast<int64_t>(t_fine) - 128000;
        int64_t var2 = var1 * var1 * static_cast<int64_t>(cal.dig_P6);
        var2 = var2 + ((var1 * static_cast<int64_t>(cal.dig_P5)) * (static_cast<int64_t>(1) << 17));
        var2 = var2 + (static_cast<int64_t>(cal.dig_P4) * (static_cast<int64_t>(1) << 35));
        var1 = ((var1 * var1 * static_cast<int64_t>(cal.dig_P3)) >> 8) +
               ((var1 * static_cast<int64_t>(cal.dig_P2)) * (static_cast<int64_t>(1) << 12));
        var1 = ((static_cast<int64_t>(1) << 47) + var1) * static_cast<int64_t>(cal.dig_P1) >> 33;
        if (var1 == 0) {
            return 0; // avoid division by zero
        }
        int64_t p = 1048576 - adc_P;
        p = (((p * (static_cast<int64_t>(1) << 31)) - var2) * 3125) / var1;
        var1 = (static_cast<int64_t>(cal.dig_P9) * (p >> 13) * (p >> 13)) >> 25;
        var2 = (static_cast<int64_t>(cal.dig_P8) * p) >> 19;
        p = ((p + var1 + var2) >> 8) + (static_cast<int64_t>(cal.dig_P7) * 16);
        return static_cast<uint32_t>(p);
    }

    uint32_t compensateHumidity(int32_t adc_H, int32_t t_fine, const CalibrationProfile& cal) {
        int32_t v_x1_u32r = t_fine - static_cast<int32_t>(76800);
        v_x1_u32r = (((((adc_H << 14) - (static_cast<int32_t>(cal.dig_H4) * (static_cast<int32_t>(1) << 20)) -
                        (static_cast<int32_t>(cal.dig_H5) * v_x1_u32r)) + static_cast<int32_t>(16384)) >> 15) *
                     (((((((v_x1_u32r * static_cast<int32_t>(cal.dig_H6)) >> 10) *
                          (((v_x1_u32r * static_cast<int32_t>(cal.dig_H3)) >> 11) + static_cast<int32_t>(32768))) >> 10) +
                        static_cast<int32_t>(2097152)) * static_cast<int32_t>(cal.dig_H2) + 8192) >> 14));
        v_x1_u32r = (v_x1_u32r - (((((v_x1_u32r >> 15) * (v_x1_u32r >> 15)) >> 7) *
                                   static_cast<int32_t>(cal.dig_H1)) >> 4));
        v_x1_u32r = (v_x1_u32r < 0 ? 0 : v_x1_u32r);
        v_x1_u32r = (v_x1_u32r > 419430400 ? 419430400 : v_x1_u32r);
        return static_cast<uint32_t>(v_x1_u32r >> 12);
    }

    int32_t raw20(const uint8_t* b) {
        return (static_cast<int32_t>(b[0]) << 12) | (static_cast<int32_t>(b[1]) << 4) |
               (static_cast<int32_t>(b[2]) >> 4);
    }

    int32_t raw16(const uint8_t* b) {
        return (static_cast<int32_t>(b[0]) << 8) | static_cast<int32_t>(b[1]);
    }
}
