// Hand-written stand-ins for the hardware seams
#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include <main/hardware/i2c_bus.hpp>
#include <main/network/transport.hpp>
#include <main/network/wifi_radio.hpp>
#include <main/utils/lock.hpp>
#include <main/utils/system_info.hpp>

// Register file for up to two devices. Reads past 0xFF wrap.
class FakeI2cBus : public I2cBus
{
public:
    static constexpr uint8_t REG_STATUS = 0xF3;
    static constexpr uint8_t REG_RESET = 0xE0;

    FakeI2cBus() { std::memset(devices, 0, sizeof(devices)); }

    void attach(uint8_t addr7, uint8_t chip_id)
    {
        Device& d = slot(addr7);
        d.present = true;
        d.addr = addr7;
        d.regs[0xD0] = chip_id;
    }

    void setRegisters(uint8_t addr7, uint8_t reg, const uint8_t* data, std::size_t len)
    {
        Device& d = slot(addr7);
        for (std::size_t i = 0; i < len; ++i)
        {
            d.regs[static_cast<uint8_t>(reg + i)] = data[i];
        }
    }

    uint8_t reg(uint8_t addr7, uint8_t r) { return slot(addr7).regs[r]; }

    BusStatus writeRegister(uint8_t addr7, uint8_t r, uint8_t value) override
    {
        ++writes;
        Device* d = find(addr7);
        if (d == nullptr)
        {
            return BusStatus::NACK;
        }
        if (r == fail_reg)
        {
            return BusStatus::TIMEOUT;
        }
        if (r == REG_RESET)
        {
            ++resets;
            return BusStatus::OK;
        }
        d->regs[r] = value;
        if (r == 0xF4 && (value & 0x03) == 0x01)
        {
            ++forced_triggers;
            d->regs[REG_STATUS] = 0x08;
            busy_countdown = busy_polls;
        }
        return BusStatus::OK;
    }

    BusStatus readRegisters(uint8_t addr7, uint8_t r, uint8_t* out, std::size_t len) override
    {
        ++reads;
        Device* d = find(addr7);
        if (d == nullptr)
        {
            return BusStatus::NACK;
        }
        if (r == fail_reg)
        {
            return BusStatus::TIMEOUT;
        }
        if (r == REG_STATUS && len == 1)
        {
            if (busy_countdown > 0)
            {
                --busy_countdown;
                out[0] = 0x08;
                return BusStatus::OK;
            }
            if (stuck_measuring)
            {
                out[0] = 0x08;
                return BusStatus::OK;
            }
            d->regs[REG_STATUS] = 0x00;
        }
        for (std::size_t i = 0; i < len; ++i)
        {
            out[i] = d->regs[static_cast<uint8_t>(r + i)];
        }
        return BusStatus::OK;
    }

    void delayMs(uint32_t ms) override { delayed_ms += ms; }

    // Register that answers with TIMEOUT, -1 for none
    int fail_reg = -1;
    // Status polls reporting "measuring" after each forced trigger
    int busy_polls = 2;
    bool stuck_measuring = false;

    int writes = 0;
    int reads = 0;
    int resets = 0;
    int forced_triggers = 0;
    uint32_t delayed_ms = 0;

private:
    struct Device
    {
        bool present;
        uint8_t addr;
        uint8_t regs[256];
    };

    Device& slot(uint8_t addr7)
    {
        for (Device& d : devices)
        {
            if (d.addr == addr7)
            {
                return d;
            }
        }
        for (Device& d : devices)
        {
            if (d.addr == 0)
            {
                d.addr = addr7;
                return d;
            }
        }
        return devices[1];
    }

    Device* find(uint8_t addr7)
    {
        for (Device& d : devices)
        {
            if (d.present && d.addr == addr7)
            {
                return &d;
            }
        }
        return nullptr;
    }

    Device devices[2];
    int busy_countdown = 0;
};

// Scriptable station radio
class FakeRadio : public WifiRadio
{
public:
    bool beginAssociation(const char* ssid, const char* password) override
    {
        ++association_requests;
        std::snprintf(last_ssid, sizeof(last_ssid), "%s", ssid);
        (void)password;
        if (!accept_requests)
        {
            return false;
        }
        status = AssociationStatus::PENDING;
        leased = false;
        return true;
    }

    AssociationStatus associationStatus() override { return status; }

    bool requestLease() override
    {
        ++lease_requests;
        return true;
    }

    bool leasedAddress(char* out, std::size_t len) override
    {
        if (!leased)
        {
            return false;
        }
        std::snprintf(out, len, "%s", address);
        return true;
    }

    int8_t rssi() override { return signal; }

    void disconnect() override
    {
        ++disconnects;
        status = AssociationStatus::IDLE;
        leased = false;
    }

    // Test controls
    void associate() { status = AssociationStatus::ASSOCIATED; }
    void reject() { status = AssociationStatus::FAILED; }
    void lease(const char* ip)
    {
        std::snprintf(address, sizeof(address), "%s", ip);
        leased = true;
    }
    void dropLink()
    {
        status = AssociationStatus::IDLE;
        leased = false;
    }

    AssociationStatus status = AssociationStatus::IDLE;
    bool leased = false;
    bool accept_requests = true;
    char address[16] = {0};
    char last_ssid[40] = {0};
    int8_t signal = -42;
    int association_requests = 0;
    int lease_requests = 0;
    int disconnects = 0;
};

// Records every frame written; serves a scripted CONNACK
class FakeTransport : public Transport
{
public:
    TransportStatus connect(const char* host, uint16_t port, uint32_t timeout_ms) override
    {
        ++connects;
        std::snprintf(last_host, sizeof(last_host), "%s", host);
        last_port = port;
        last_connect_timeout_ms = timeout_ms;
        if (connect_status == TransportStatus::OK)
        {
            open = true;
        }
        return connect_status;
    }

    TransportStatus write(const uint8_t* data, std::size_t len, uint32_t timeout_ms) override
    {
        (void)timeout_ms;
        ++write_calls;
        if (!open)
        {
            return TransportStatus::CLOSED;
        }
        if (fail_write_call > 0 && write_calls == fail_write_call)
        {
            return TransportStatus::ERROR;
        }
        frames.push_back(std::vector<uint8_t>(data, data + len));
        return TransportStatus::OK;
    }

    TransportStatus read(uint8_t* out, std::size_t len, uint32_t timeout_ms) override
    {
        last_read_timeout_ms = timeout_ms;
        if (!open)
        {
            return TransportStatus::CLOSED;
        }
        if (read_status != TransportStatus::OK)
        {
            return read_status;
        }
        if (len > sizeof(connack))
        {
            return TransportStatus::ERROR;
        }
        std::memcpy(out, connack, len);
        return TransportStatus::OK;
    }

    void close() override
    {
        ++closes;
        open = false;
    }

    void reset()
    {
        frames.clear();
        connects = closes = write_calls = 0;
        fail_write_call = 0;
    }

    TransportStatus connect_status = TransportStatus::OK;
    TransportStatus read_status = TransportStatus::OK;
    uint8_t connack[4] = {0x20, 0x02, 0x00, 0x00};
    // 1-based write call that fails, 0 for none
    int fail_write_call = 0;

    bool open = false;
    int connects = 0;
    int closes = 0;
    int write_calls = 0;
    char last_host[64] = {0};
    uint16_t last_port = 0;
    uint32_t last_connect_timeout_ms = 0;
    uint32_t last_read_timeout_ms = 0;
    std::vector<std::vector<uint8_t>> frames;
};

// Broker that never answers: connect blocks for the full timeout
class StallingTransport : public Transport
{
public:
    TransportStatus connect(const char* host, uint16_t port, uint32_t timeout_ms) override
    {
        (void)host;
        (void)port;
        ++connects;
        connect_started = std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return TransportStatus::TIMEOUT;
    }

    TransportStatus write(const uint8_t*, std::size_t, uint32_t) override { return TransportStatus::CLOSED; }
    TransportStatus read(uint8_t*, std::size_t, uint32_t) override { return TransportStatus::CLOSED; }
    void close() override { ++closes; }

    int connects = 0;
    int closes = 0;
    std::chrono::steady_clock::time_point connect_started;
};

// std::mutex behind the Lock seam
class HostLock : public Lock
{
public:
    void lock() override
    {
        m.lock();
        ++acquisitions;
    }
    void unlock() override { m.unlock(); }

    int acquisitions = 0;

private:
    std::mutex m;
};

class FakeSystemInfo : public Clock, public SystemInfo
{
public:
    uint32_t nowMs() override { return now_ms; }
    uint32_t uptimeSeconds() override { return now_ms / 1000; }
    uint32_t freeHeapBytes() override { return free_heap; }

    uint32_t now_ms = 0;
    uint32_t free_heap = 45000;
};

#endif // TEST_FAKES_HPP
