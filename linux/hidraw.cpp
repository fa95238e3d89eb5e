#include "hidraw.hpp"

#include <protocol/packets.hpp>

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace hidraw {

using juhradial::ConnectionType;

std::optional<DeviceInfo> parse_uevent(const std::string& uevent) {
    DeviceInfo info;
    bool have_id = false;

    std::istringstream lines(uevent);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("HID_ID=", 0) == 0) {
            unsigned bus = 0, vendor = 0, product = 0;
            if (std::sscanf(line.c_str() + 7, "%x:%x:%x", &bus, &vendor, &product) == 3) {
                info.bus = static_cast<uint16_t>(bus);
                info.vendor = static_cast<uint16_t>(vendor);
                info.product = static_cast<uint16_t>(product);
                have_id = true;
            }
        } else if (line.rfind("HID_NAME=", 0) == 0) {
            info.name = line.substr(9);
        } else if (line.rfind("HID_PHYS=", 0) == 0) {
            info.hidpp_interface = line.find("input2") != std::string::npos;
        }
    }

    if (!have_id) {
        return std::nullopt;
    }

    switch (info.product) {
        case BOLT_RECEIVER_PID: info.connection = ConnectionType::Bolt; break;
        case UNIFYING_RECEIVER_PID: info.connection = ConnectionType::Unifying; break;
        default:
            if (info.bus == BUS_BLUETOOTH) {
                info.connection = ConnectionType::Bluetooth;
            } else if (info.bus == BUS_USB) {
                info.connection = ConnectionType::Usb;
            }
            break;
    }
    return info;
}

static std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return "";
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<DeviceInfo> enumerate() {
    std::vector<DeviceInfo> devices;

    DIR* dir = opendir("/sys/class/hidraw");
    if (!dir) {
        std::cerr << "hidraw: cannot open /sys/class/hidraw: " << strerror(errno) << std::endl;
        return devices;
    }

    while (dirent* entry = readdir(dir)) {
        if (strncmp(entry->d_name, "hidraw", 6) != 0) continue;

        std::string uevent = read_file(std::string("/sys/class/hidraw/") + entry->d_name + "/device/uevent");
        auto info = parse_uevent(uevent);
        if (!info || info->vendor != LOGITECH_VENDOR_ID) continue;

        info->path = std::string("/dev/") + entry->d_name;
        devices.push_back(*info);
    }
    closedir(dir);

    std::sort(devices.begin(), devices.end(),
              [](const DeviceInfo& a, const DeviceInfo& b) { return a.path < b.path; });
    return devices;
}

static int rank(const DeviceInfo& info) {
    switch (info.product) {
        case BOLT_RECEIVER_PID: return 3;
        case UNIFYING_RECEIVER_PID: return 2;
        case MX_MASTER_USB_PID: return 1;
    }
    return 0;
}

std::optional<DeviceInfo> find_device() {
    auto devices = enumerate();
    if (devices.empty()) {
        return std::nullopt;
    }

    const DeviceInfo* best = nullptr;
    for (const auto& device : devices) {
        if (!best || rank(device) > rank(*best) ||
            (rank(device) == rank(*best) && device.hidpp_interface && !best->hidpp_interface)) {
            best = &device;
        }
    }

    std::cout << "hidraw: selected " << best->path << " (" << juhradial::packets::to_hex(best->vendor) << ":"
              << juhradial::packets::to_hex(best->product) << ", " << juhradial::to_string(best->connection)
              << ")" << std::endl;
    return *best;
}

uint8_t device_index_for(ConnectionType connection, int receiver_index) {
    if (!juhradial::is_receiver(connection)) {
        return juhradial::packets::DIRECT_DEVICE_INDEX;
    }
    if (receiver_index >= 1 && receiver_index <= 6) {
        return static_cast<uint8_t>(receiver_index);
    }
    return connection == ConnectionType::Bolt ? BOLT_DEVICE_INDEX : UNIFYING_DEVICE_INDEX;
}

Connection::Connection(DeviceInfo info, uint8_t device_index)
    : info_(std::move(info)), device_index_(device_index) {}

Connection::Connection(Connection&& other) noexcept
    : fd_(other.fd_), info_(std::move(other.info_)), device_index_(other.device_index_) {
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        info_ = std::move(other.info_);
        device_index_ = other.device_index_;
        other.fd_ = -1;
    }
    return *this;
}

Connection::~Connection() {
    close();
}

bool Connection::open() {
    if (is_open()) return true;

    fd_ = ::open(info_.path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        std::cerr << "hidraw: open " << info_.path << " failed: " << strerror(errno) << std::endl;
        return false;
    }

    std::cout << "hidraw: opened " << info_.path << std::endl;
    return true;
}

void Connection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Connection::write(std::span<const uint8_t> report) {
    if (!is_open()) return false;

    ssize_t written = ::write(fd_, report.data(), report.size());
    if (written < 0) {
        std::cerr << "hidraw: write failed: " << strerror(errno) << std::endl;
        return false;
    }
    return static_cast<size_t>(written) == report.size();
}

std::optional<std::vector<uint8_t>> Connection::read(int timeout_ms) {
    if (!is_open()) return std::nullopt;

    pollfd pfd = {};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return std::vector<uint8_t>{};
        return std::nullopt;
    }
    if (ret == 0) {
        return std::vector<uint8_t>{};
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        std::cerr << "hidraw: " << info_.path << " went away" << std::endl;
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(64);
    ssize_t n = ::read(fd_, buffer.data(), buffer.size());
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return std::vector<uint8_t>{};
        std::cerr << "hidraw: read failed: " << strerror(errno) << std::endl;
        return std::nullopt;
    }
    if (n == 0) {
        return std::nullopt;
    }

    buffer.resize(static_cast<size_t>(n));
    return buffer;
}

} // namespace hidraw
