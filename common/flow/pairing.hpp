#pragma once

#include "peer_directory.hpp"
#include "trust_store.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace juhradial::flow {

constexpr size_t PAIRING_CODE_DIGITS = 6;

// Puts every trusted peer into the directory as paired, at its last known endpoint.
// Hand-offs and incoming messages then work while discovery is off. Returns the count.
size_t restore_paired(PeerDirectory& directory, const TrustStore& trust, Clock::time_point now);

// Six digits from the OpenSSL CSPRNG
Result<std::string> secure_code();

// Issues and checks single-use pairing codes, drives the peer's pairing state
class PairingAuthority {
public:
    using CodeGenerator = std::function<Result<std::string>()>;

    PairingAuthority(PeerDirectory& directory, std::chrono::milliseconds ttl,
                     CodeGenerator generate = secure_code);

    // Peer must be known and not paired. Replaces any earlier code for it.
    Result<PairingCode> issue_code(const std::string& peer_id, Clock::time_point now);

    // Session token on success, InvalidPairing when rejected.
    // Every call consumes the outstanding code, right or wrong.
    Result<std::string> verify(const std::string& peer_id, const std::string& code, Clock::time_point now);

    // Drops expired codes and sends their peers back to unpaired
    std::vector<std::string> expire(Clock::time_point now);

    bool pending(const std::string& peer_id) const { return codes_.count(peer_id) != 0; }
    void set_ttl(std::chrono::milliseconds ttl) { ttl_ = ttl; }

private:
    void reject(const std::string& peer_id);

    PeerDirectory& directory_;
    std::chrono::milliseconds ttl_;
    CodeGenerator generate_;
    std::map<std::string, PairingCode> codes_;
};

} // namespace juhradial::flow
