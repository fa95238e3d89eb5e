#pragma once

#include "../types/enums.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace juhradial::flow {

struct TrustEntry {
    std::string token;
    std::string hostname;
    int64_t paired_at = 0;  // unix seconds

    // Last known endpoint, reachable without running discovery
    std::string address;
    uint16_t port = 0;
    int host_slot = -1;
};

// Persistent own identity, per-peer session tokens and last known endpoints.
// Shared with the sync server thread, every member locks.
class TrustStore {
public:
    explicit TrustStore(std::string path);

    // Missing file is not an error. Creates our own peer id on first use.
    bool load();
    bool save() const;

    std::string self_id() const;

    void add(const std::string& peer_id, TrustEntry entry);
    bool remove(const std::string& peer_id);

    // Records where a trusted peer was last seen. True if anything changed.
    bool update_location(const std::string& peer_id, const std::string& address, uint16_t port, int host_slot);

    bool is_trusted(const std::string& peer_id) const;
    std::optional<std::string> token_for(const std::string& peer_id) const;

    // Constant-time token check for an authenticated request
    bool verify(const std::string& peer_id, const std::string& token) const;

    std::map<std::string, TrustEntry> entries() const;
    const std::string& path() const { return path_; }

    // Parse/serialize without touching disk
    bool from_json(const std::string& text);
    std::string to_json() const;

private:
    bool ensure_self_id();

    std::string path_;
    mutable std::mutex mutex_;
    std::string self_id_;
    std::map<std::string, TrustEntry> entries_;
};

} // namespace juhradial::flow
