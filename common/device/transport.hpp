#pragma once

#include "../types/enums.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace juhradial {

// Byte pipe to one HID++ endpoint. One report per read/write.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool open() = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;

    virtual bool write(std::span<const uint8_t> report) = 0;

    // nullopt when the transport is gone, empty vector on timeout
    virtual std::optional<std::vector<uint8_t>> read(int timeout_ms) = 0;

    // For poll(), -1 if not backed by a descriptor
    virtual int fd() const { return -1; }

    virtual std::string path() const = 0;
    virtual ConnectionType connection() const = 0;
    virtual uint8_t device_index() const = 0;
};

} // namespace juhradial
