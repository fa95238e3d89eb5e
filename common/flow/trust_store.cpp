#include "trust_store.hpp"
#include "../protocol/crypto.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace juhradial::flow {

TrustStore::TrustStore(std::string path) : path_(std::move(path)) {}

bool TrustStore::ensure_self_id() {
    if (!self_id_.empty()) {
        return true;
    }
    auto id = crypto::random_token(8);
    if (!id) {
        std::cerr << "flow: cannot create peer id: " << to_string(id.error) << std::endl;
        return false;
    }
    self_id_ = id.value;
    return true;
}

bool TrustStore::from_json(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            return false;
        }

        std::map<std::string, TrustEntry> parsed;
        if (doc.contains("peers") && doc["peers"].is_object()) {
            for (const auto& [peer_id, value] : doc["peers"].items()) {
                if (!value.is_object() || !value.contains("token") || !value["token"].is_string()) {
                    continue;
                }
                TrustEntry entry;
                entry.token = value["token"].get<std::string>();
                entry.hostname = value.value("hostname", std::string{});
                entry.paired_at = value.value("paired_at", int64_t{0});
                entry.address = value.value("address", std::string{});
                entry.port = value.value("port", uint16_t{0});
                entry.host_slot = value.value("host_slot", -1);
                parsed.emplace(peer_id, std::move(entry));
            }
        }

        self_id_ = doc.value("self_id", std::string{});
        entries_ = std::move(parsed);
    } catch (const json::exception& e) {
        std::cerr << "flow: invalid trust store: " << e.what() << std::endl;
        return false;
    }

    return ensure_self_id();
}

std::string TrustStore::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json doc;
    doc["self_id"] = self_id_;
    doc["peers"] = json::object();
    for (const auto& [peer_id, entry] : entries_) {
        doc["peers"][peer_id] = {
            {"token", entry.token},
            {"hostname", entry.hostname},
            {"paired_at", entry.paired_at},
            {"address", entry.address},
            {"port", entry.port},
            {"host_slot", entry.host_slot},
        };
    }
    return doc.dump(2);
}

bool TrustStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!ensure_self_id()) return false;
        }
        std::cout << "flow: no trust store at " << path_ << ", starting fresh" << std::endl;
        return save();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!from_json(buffer.str())) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        return ensure_self_id();
    }
    return true;
}

bool TrustStore::save() const {
    std::error_code ec;
    auto dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "flow: cannot create " << dir << ": " << ec.message() << std::endl;
            return false;
        }
    }

    // Tokens are secrets, write then rename with owner-only permissions
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "flow: cannot write " << tmp << std::endl;
            return false;
        }
        file << to_json();
        if (!file.good()) {
            return false;
        }
    }

    std::filesystem::permissions(tmp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::cerr << "flow: cannot replace " << path_ << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string TrustStore::self_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return self_id_;
}

void TrustStore::add(const std::string& peer_id, TrustEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[peer_id] = std::move(entry);
}

bool TrustStore::update_location(const std::string& peer_id, const std::string& address, uint16_t port,
                                 int host_slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer_id);
    if (it == entries_.end() || address.empty()) {
        return false;
    }

    TrustEntry& entry = it->second;
    if (entry.address == address && entry.port == port && entry.host_slot == host_slot) {
        return false;
    }
    entry.address = address;
    entry.port = port;
    entry.host_slot = host_slot;
    return true;
}

bool TrustStore::remove(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(peer_id) != 0;
}

bool TrustStore::is_trusted(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(peer_id) != 0;
}

std::optional<std::string> TrustStore::token_for(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.token;
}

bool TrustStore::verify(const std::string& peer_id, const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer_id);
    if (it == entries_.end() || token.empty()) {
        return false;
    }
    return crypto::constant_time_equals(it->second.token, token);
}

std::map<std::string, TrustEntry> TrustStore::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

} // namespace juhradial::flow
