#pragma once

#include <device/transport.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hidraw {

constexpr uint16_t LOGITECH_VENDOR_ID = 0x046D;

// Product ids we rank when several Logitech nodes are present
constexpr uint16_t BOLT_RECEIVER_PID = 0xC548;
constexpr uint16_t UNIFYING_RECEIVER_PID = 0xC52B;
constexpr uint16_t MX_MASTER_USB_PID = 0xB034;

// Paired-device slot a receiver uses for the first device
constexpr uint8_t BOLT_DEVICE_INDEX = 0x02;
constexpr uint8_t UNIFYING_DEVICE_INDEX = 0x01;

// Bus ids from HID_ID in uevent
constexpr uint16_t BUS_USB = 0x0003;
constexpr uint16_t BUS_BLUETOOTH = 0x0005;

struct DeviceInfo {
    std::string path;         // /dev/hidrawN
    uint16_t bus = 0;
    uint16_t vendor = 0;
    uint16_t product = 0;
    std::string name;
    bool hidpp_interface = false;  // input2
    juhradial::ConnectionType connection = juhradial::ConnectionType::Unknown;
};

// Parses a sysfs uevent blob (HID_ID, HID_NAME, HID_PHYS)
std::optional<DeviceInfo> parse_uevent(const std::string& uevent);

// All Logitech hidraw nodes
std::vector<DeviceInfo> enumerate();

// Bolt over Unifying over direct USB over anything else, input2 preferred within a rank
std::optional<DeviceInfo> find_device();

// Device index to address on this node. receiver_index < 0 picks the usual slot.
uint8_t device_index_for(juhradial::ConnectionType connection, int receiver_index);

// RAII hidraw node. Move-only.
class Connection : public juhradial::Transport {
public:
    Connection() = default;
    Connection(DeviceInfo info, uint8_t device_index);
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open() override;
    bool is_open() const override { return fd_ >= 0; }
    void close() override;

    bool write(std::span<const uint8_t> report) override;
    std::optional<std::vector<uint8_t>> read(int timeout_ms) override;

    int fd() const override { return fd_; }
    std::string path() const override { return info_.path; }
    juhradial::ConnectionType connection() const override { return info_.connection; }
    uint8_t device_index() const override { return device_index_; }

    const DeviceInfo& info() const { return info_; }

private:
    int fd_ = -1;
    DeviceInfo info_;
    uint8_t device_index_ = 0xFF;
};

} // namespace hidraw
