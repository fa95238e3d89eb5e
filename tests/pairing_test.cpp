#include <gtest/gtest.h>

#include <flow/pairing.hpp>

using namespace juhradial;
using namespace juhradial::flow;
using namespace std::chrono_literals;

class PairingTest : public ::testing::Test {
protected:
    PairingTest() : authority(directory, 120s, [this]() { return next_code(); }) {
        directory.upsert(Sighting{"peer-p", "10.0.0.7", 24801, 1, "desk"}, t0);
    }

    Result<std::string> next_code() {
        ++generated;
        if (random_fails) return fail<std::string>(Error::RandomSourceFailed);
        return {code, Error::None};
    }

    PairingState state_of(const std::string& id) const { return directory.find(id)->pairing_state; }

    PeerDirectory directory{nullptr, 30s};
    std::string code = "482913";
    bool random_fails = false;
    int generated = 0;
    PairingAuthority authority;
    Clock::time_point t0 = Clock::time_point{} + 1h;
};

TEST_F(PairingTest, CodeIsSingleUse) {
    auto issued = authority.issue_code("peer-p", t0);
    ASSERT_TRUE(issued);
    EXPECT_EQ(issued.value.value, "482913");
    EXPECT_EQ(issued.value.expires_at, t0 + 120s);
    EXPECT_EQ(state_of("peer-p"), PairingState::Pairing);

    auto token = authority.verify("peer-p", "482913", t0 + 10s);
    ASSERT_TRUE(token);
    EXPECT_EQ(token.value.size(), 64u);
    EXPECT_EQ(state_of("peer-p"), PairingState::Paired);

    auto again = authority.verify("peer-p", "482913", t0 + 11s);
    EXPECT_EQ(again.error, Error::InvalidPairing);
    // Replay never revokes an established pairing
    EXPECT_EQ(state_of("peer-p"), PairingState::Paired);
}

TEST_F(PairingTest, WrongCodeConsumesTheAttempt) {
    ASSERT_TRUE(authority.issue_code("peer-p", t0));

    EXPECT_EQ(authority.verify("peer-p", "000000", t0 + 1s).error, Error::InvalidPairing);
    EXPECT_EQ(state_of("peer-p"), PairingState::Unpaired);

    // The right code is now useless too
    EXPECT_EQ(authority.verify("peer-p", "482913", t0 + 2s).error, Error::InvalidPairing);
    EXPECT_FALSE(authority.pending("peer-p"));
}

TEST_F(PairingTest, ExpiredCodeIsRejected) {
    ASSERT_TRUE(authority.issue_code("peer-p", t0));

    EXPECT_EQ(authority.verify("peer-p", "482913", t0 + 120s).error, Error::InvalidPairing);
    EXPECT_EQ(state_of("peer-p"), PairingState::Unpaired);
}

TEST_F(PairingTest, ExpireSweepsOutstandingCodes) {
    ASSERT_TRUE(authority.issue_code("peer-p", t0));

    EXPECT_TRUE(authority.expire(t0 + 60s).empty());
    EXPECT_TRUE(authority.pending("peer-p"));

    EXPECT_EQ(authority.expire(t0 + 121s), (std::vector<std::string>{"peer-p"}));
    EXPECT_FALSE(authority.pending("peer-p"));
    EXPECT_EQ(state_of("peer-p"), PairingState::Unpaired);
}

TEST_F(PairingTest, ReissueReplacesEarlierCode) {
    ASSERT_TRUE(authority.issue_code("peer-p", t0));
    code = "111111";
    ASSERT_TRUE(authority.issue_code("peer-p", t0 + 5s));
    EXPECT_EQ(state_of("peer-p"), PairingState::Pairing);

    EXPECT_TRUE(authority.verify("peer-p", "111111", t0 + 6s));
}

TEST_F(PairingTest, EveryIssueDrawsFreshRandomness) {
    ASSERT_TRUE(authority.issue_code("peer-p", t0));
    ASSERT_TRUE(authority.issue_code("peer-p", t0 + 1s));
    EXPECT_EQ(generated, 2);
}

TEST_F(PairingTest, UnknownPeer) {
    EXPECT_EQ(authority.issue_code("ghost", t0).error, Error::UnknownPeer);
    EXPECT_EQ(authority.verify("ghost", "482913", t0).error, Error::InvalidPairing);
}

TEST_F(PairingTest, PairedPeerGetsNoNewCode) {
    ASSERT_TRUE(authority.issue_code("peer-p", t0));
    ASSERT_TRUE(authority.verify("peer-p", "482913", t0 + 1s));

    EXPECT_EQ(authority.issue_code("peer-p", t0 + 2s).error, Error::InvalidPairing);
}

TEST_F(PairingTest, RandomFailureLeavesPeerUnpaired) {
    random_fails = true;

    EXPECT_EQ(authority.issue_code("peer-p", t0).error, Error::RandomSourceFailed);
    EXPECT_EQ(state_of("peer-p"), PairingState::Unpaired);
    EXPECT_FALSE(authority.pending("peer-p"));
}

TEST(SecureCodeTest, SixDigits) {
    auto code = secure_code();
    ASSERT_TRUE(code);
    EXPECT_EQ(code.value.size(), PAIRING_CODE_DIGITS);
    EXPECT_EQ(code.value.find_first_not_of("0123456789"), std::string::npos);
}

TEST_F(PairingTest, TrustedPeersAreRestoredAsPaired) {
    TrustStore trust("/unused");
    trust.add("peer-q", {"tok-q", "laptop", 0, "10.0.0.8", 24802, 2});
    trust.add("peer-r", {"tok-r", "", 0});

    EXPECT_EQ(restore_paired(directory, trust, t0), 2u);

    auto laptop = directory.find("peer-q");
    ASSERT_TRUE(laptop);
    EXPECT_EQ(laptop->pairing_state, PairingState::Paired);
    EXPECT_EQ(laptop->address, "10.0.0.8");
    EXPECT_EQ(laptop->port, 24802);
    EXPECT_EQ(directory.find_by_slot(2)->peer_id, "peer-q");

    // Known but never located, still allowed to talk to us
    EXPECT_EQ(state_of("peer-r"), PairingState::Paired);
    EXPECT_EQ(state_of("peer-p"), PairingState::Unpaired);

    // Restored peers outlive the sweep
    EXPECT_EQ(directory.sweep(t0 + 1h), (std::vector<std::string>{"peer-p"}));
    EXPECT_TRUE(directory.find("peer-q"));
}
