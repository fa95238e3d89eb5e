#include <gtest/gtest.h>

#include <flow/orchestrator.hpp>
#include <flow/pairing.hpp>

#include <algorithm>
#include <set>

using namespace juhradial;
using namespace juhradial::flow;
using namespace std::chrono_literals;

namespace {

class FakeClipboard : public Clipboard {
public:
    std::optional<std::string> read() override {
        ++reads;
        return text;
    }
    bool write(const std::string& value) override {
        ++writes;
        if (read_only) return false;
        text = value;
        return true;
    }

    std::optional<std::string> text;
    bool read_only = false;
    int reads = 0;
    int writes = 0;
};

class FakeSender : public PeerSender {
public:
    struct Sent {
        std::string peer_id;
        SyncMessage message;
    };

    Error send(const PeerRecord& peer, const SyncMessage& message) override {
        sent.push_back({peer.peer_id, message});
        return unreachable.count(peer.peer_id) ? Error::IoError : Error::None;
    }

    std::vector<Sent> sent;
    std::set<std::string> unreachable;
};

std::string text_of(const SyncMessage& message) {
    return std::string(message.payload.begin(), message.payload.end());
}

SyncMessage from(const std::string& origin, SyncType type, const std::string& text, uint64_t epoch,
                 uint64_t sequence) {
    SyncMessage message;
    message.type = type;
    message.origin = origin;
    message.epoch = epoch;
    message.sequence = sequence;
    message.payload.assign(text.begin(), text.end());
    return message;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() {
        trusted = {"laptop", "desk"};
        directory.upsert(Sighting{"laptop", "10.0.0.2", 24801, 1, "laptop"}, t0);
        directory.upsert(Sighting{"desk", "10.0.0.3", 24801, 2, "desk"}, t0);
        directory.upsert(Sighting{"stranger", "10.0.0.4", 24801, 0, "stranger"}, t0);
        orchestrator.on_focus_changed([this](const Focus& focus) { changes.push_back(focus); });
    }

    std::set<std::string> trusted;
    PeerDirectory directory{nullptr, 30s, [this](const std::string& id) { return trusted.count(id) != 0; }};
    FakeClipboard clipboard;
    FakeSender sender;
    Orchestrator orchestrator{"self", 100, directory, clipboard, sender, 64};
    std::vector<Focus> changes;
    Clock::time_point t0 = Clock::time_point{} + 1h;
};

TEST_F(OrchestratorTest, StartsUnownedAndDisarmed) {
    EXPECT_EQ(orchestrator.focus(), Focus::unowned());
    EXPECT_FALSE(orchestrator.forwarding());

    clipboard.text = "ignored";
    EXPECT_EQ(orchestrator.poll_clipboard(), 0u);
    EXPECT_TRUE(sender.sent.empty());
}

TEST_F(OrchestratorTest, ClaimLocalArmsForwarding) {
    clipboard.text = "before";
    orchestrator.claim_local();

    EXPECT_EQ(orchestrator.focus(), Focus::local());
    EXPECT_TRUE(orchestrator.forwarding());
    ASSERT_EQ(changes.size(), 1u);

    // Contents present at claim time are not re-sent
    EXPECT_EQ(orchestrator.poll_clipboard(), 0u);

    clipboard.text = "after";
    EXPECT_EQ(orchestrator.poll_clipboard(), 2u);
    ASSERT_EQ(sender.sent.size(), 2u);
    for (const auto& sent : sender.sent) {
        EXPECT_NE(sent.peer_id, "stranger");
        EXPECT_EQ(sent.message.type, SyncType::Clipboard);
        EXPECT_EQ(sent.message.origin, "self");
        EXPECT_EQ(sent.message.epoch, 100u);
        EXPECT_EQ(text_of(sent.message), "after");
    }

    // Unchanged contents are sent once
    EXPECT_EQ(orchestrator.poll_clipboard(), 0u);
    EXPECT_EQ(sender.sent.size(), 2u);
}

TEST_F(OrchestratorTest, SequenceNumbersIncrease) {
    orchestrator.claim_local();
    clipboard.text = "one";
    orchestrator.poll_clipboard();
    clipboard.text = "two";
    orchestrator.poll_clipboard();

    ASSERT_EQ(sender.sent.size(), 4u);
    EXPECT_LT(sender.sent[0].message.sequence, sender.sent[2].message.sequence);
}

TEST_F(OrchestratorTest, UnreachablePeerIsNotCounted) {
    orchestrator.claim_local();
    sender.unreachable.insert("desk");
    clipboard.text = "hello";

    EXPECT_EQ(orchestrator.poll_clipboard(), 1u);
}

TEST_F(OrchestratorTest, OversizedClipboardIsNotForwarded) {
    orchestrator.claim_local();
    clipboard.text = std::string(65, 'x');

    EXPECT_EQ(orchestrator.poll_clipboard(), 0u);
    EXPECT_TRUE(sender.sent.empty());
}

TEST_F(OrchestratorTest, HandOffPushesClipboardThenFocus) {
    orchestrator.claim_local();
    clipboard.text = "carry me";

    EXPECT_EQ(orchestrator.hand_off("laptop", 1), Error::None);

    ASSERT_EQ(sender.sent.size(), 2u);
    EXPECT_EQ(sender.sent[0].message.type, SyncType::Clipboard);
    EXPECT_EQ(text_of(sender.sent[0].message), "carry me");
    EXPECT_EQ(sender.sent[1].message.type, SyncType::FocusHandoff);
    EXPECT_EQ(text_of(sender.sent[1].message), "1");

    EXPECT_EQ(orchestrator.focus(), Focus::remote("laptop"));
    EXPECT_FALSE(orchestrator.forwarding());

    // Disarmed after hand-off
    clipboard.text = "later";
    EXPECT_EQ(orchestrator.poll_clipboard(), 0u);
}

TEST_F(OrchestratorTest, HandOffWithoutFocusSendsOnlyFocus) {
    EXPECT_EQ(orchestrator.hand_off("desk"), Error::None);
    ASSERT_EQ(sender.sent.size(), 1u);
    EXPECT_EQ(sender.sent[0].message.type, SyncType::FocusHandoff);
    EXPECT_TRUE(sender.sent[0].message.payload.empty());
}

TEST_F(OrchestratorTest, FocusFollowsDeviceEvenIfDeliveryFails) {
    orchestrator.claim_local();
    sender.unreachable.insert("laptop");

    EXPECT_EQ(orchestrator.hand_off("laptop"), Error::IoError);
    EXPECT_EQ(orchestrator.focus(), Focus::remote("laptop"));
}

TEST_F(OrchestratorTest, HandOffRequiresPairedPeer) {
    EXPECT_EQ(orchestrator.hand_off("stranger"), Error::UntrustedOrigin);
    EXPECT_EQ(orchestrator.hand_off("ghost"), Error::UnknownPeer);
    EXPECT_TRUE(sender.sent.empty());
    EXPECT_EQ(orchestrator.focus(), Focus::unowned());
}

TEST_F(OrchestratorTest, HandOffToSlot) {
    orchestrator.claim_local();

    EXPECT_EQ(orchestrator.hand_off_to_slot(2), Error::None);
    EXPECT_EQ(orchestrator.focus(), Focus::remote("desk"));
}

TEST_F(OrchestratorTest, SlotWithoutPairedPeerLeavesFocusUnowned) {
    orchestrator.claim_local();

    // Slot 0 belongs to an unpaired peer
    EXPECT_EQ(orchestrator.hand_off_to_slot(0), Error::NotFound);
    EXPECT_EQ(orchestrator.focus(), Focus::unowned());
    EXPECT_TRUE(sender.sent.empty());

    orchestrator.claim_local();
    EXPECT_EQ(orchestrator.hand_off_to_slot(-1), Error::NotFound);
    EXPECT_EQ(orchestrator.focus(), Focus::unowned());
}

TEST_F(OrchestratorTest, IncomingFocusHandOffMakesUsLocal) {
    orchestrator.hand_off("laptop");
    clipboard.text = "from laptop";

    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::FocusHandoff, "0", 5, 1)), Error::None);
    EXPECT_EQ(orchestrator.focus(), Focus::local());
    EXPECT_TRUE(orchestrator.forwarding());

    // Whatever was on the clipboard at hand-off is not echoed back
    EXPECT_EQ(orchestrator.poll_clipboard(), 0u);
}

TEST_F(OrchestratorTest, RemoteClipboardIsAppliedWhileRemote) {
    orchestrator.hand_off("laptop");

    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::Clipboard, "copied", 5, 1)), Error::None);
    EXPECT_EQ(clipboard.text, std::optional<std::string>("copied"));
}

TEST_F(OrchestratorTest, RemoteClipboardIsIgnoredWhileLocal) {
    clipboard.text = "mine";
    orchestrator.claim_local();

    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::Clipboard, "theirs", 5, 1)), Error::None);
    EXPECT_EQ(clipboard.text, std::optional<std::string>("mine"));
    EXPECT_EQ(clipboard.writes, 0);
}

TEST_F(OrchestratorTest, ReplayIsAppliedOnce) {
    auto message = from("laptop", SyncType::Clipboard, "once", 5, 3);

    EXPECT_EQ(orchestrator.receive(message), Error::None);
    clipboard.text = "changed locally";
    EXPECT_EQ(orchestrator.receive(message), Error::None);

    EXPECT_EQ(clipboard.writes, 1);
    EXPECT_EQ(clipboard.text, std::optional<std::string>("changed locally"));

    // Older sequence from the same run is stale as well
    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::Clipboard, "old", 5, 2)), Error::None);
    EXPECT_EQ(clipboard.writes, 1);
}

TEST_F(OrchestratorTest, NewEpochResetsSequenceTracking) {
    orchestrator.receive(from("laptop", SyncType::Clipboard, "first run", 5, 40));

    // Sender restarted, counting from 1 again
    orchestrator.receive(from("laptop", SyncType::Clipboard, "second run", 6, 1));
    EXPECT_EQ(clipboard.text, std::optional<std::string>("second run"));

    // Late message from the previous run
    orchestrator.receive(from("laptop", SyncType::Clipboard, "stale", 5, 41));
    EXPECT_EQ(clipboard.text, std::optional<std::string>("second run"));
}

TEST_F(OrchestratorTest, SequencesAreTrackedPerOrigin) {
    orchestrator.receive(from("laptop", SyncType::Clipboard, "a", 5, 9));
    orchestrator.receive(from("desk", SyncType::Clipboard, "b", 5, 1));

    EXPECT_EQ(clipboard.text, std::optional<std::string>("b"));
    EXPECT_EQ(clipboard.writes, 2);
}

TEST_F(OrchestratorTest, ClipboardWriteFailureIsReported) {
    clipboard.read_only = true;
    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::Clipboard, "x", 5, 1)), Error::IoError);
}

TEST_F(OrchestratorTest, FailedClipboardWriteCanBeRetried) {
    auto message = from("laptop", SyncType::Clipboard, "retry me", 5, 1);

    clipboard.read_only = true;
    EXPECT_EQ(orchestrator.receive(message), Error::IoError);

    // Same sequence again once the clipboard works
    clipboard.read_only = false;
    EXPECT_EQ(orchestrator.receive(message), Error::None);
    EXPECT_EQ(clipboard.text, std::optional<std::string>("retry me"));
    EXPECT_EQ(clipboard.writes, 2);

    // Now it is a replay
    EXPECT_EQ(orchestrator.receive(message), Error::None);
    EXPECT_EQ(clipboard.writes, 2);
}

TEST_F(OrchestratorTest, MessagesFromUnpairedOriginsAreRejected) {
    orchestrator.hand_off("laptop");

    EXPECT_EQ(orchestrator.receive(from("stranger", SyncType::Clipboard, "x", 5, 1)), Error::UntrustedOrigin);
    EXPECT_EQ(orchestrator.receive(from("ghost", SyncType::FocusHandoff, "", 5, 1)), Error::UntrustedOrigin);

    EXPECT_EQ(clipboard.writes, 0);
    EXPECT_EQ(orchestrator.focus(), Focus::remote("laptop"));
}

TEST_F(OrchestratorTest, SweptPeerIsRejected) {
    orchestrator.hand_off("desk");

    // Unpaired laptop ages out of the directory, paired desk stays
    ASSERT_TRUE(directory.transition("laptop", PairingState::Unpaired));
    auto removed = directory.sweep(t0 + 31s);
    EXPECT_EQ(std::count(removed.begin(), removed.end(), "laptop"), 1);
    ASSERT_FALSE(directory.find("laptop"));

    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::FocusHandoff, "", 5, 1)), Error::UntrustedOrigin);
    EXPECT_EQ(orchestrator.receive(from("laptop", SyncType::Clipboard, "late", 5, 2)), Error::UntrustedOrigin);
    EXPECT_EQ(orchestrator.focus(), Focus::remote("desk"));
    EXPECT_EQ(clipboard.writes, 0);

    EXPECT_EQ(orchestrator.receive(from("desk", SyncType::Clipboard, "still paired", 5, 1)), Error::None);
    EXPECT_EQ(clipboard.text, std::optional<std::string>("still paired"));
}

TEST_F(OrchestratorTest, FocusCallbackFiresOnChangeOnly) {
    orchestrator.claim_local();
    orchestrator.claim_local();
    orchestrator.hand_off("laptop");

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0], Focus::local());
    EXPECT_EQ(changes[1], Focus::remote("laptop"));
}

TEST(OrchestratorRestartTest, HandOffWorksFromTrustStoreAlone) {
    TrustStore trust("/unused");
    trust.add("desk", {"tok", "desk", 0, "10.0.0.3", 24801, 2});

    // No discovery consumer, no sightings
    PeerDirectory directory{nullptr, 30s};
    restore_paired(directory, trust, Clock::time_point{} + 1h);

    FakeClipboard clipboard;
    FakeSender sender;
    Orchestrator orchestrator{"self", 100, directory, clipboard, sender, 64};

    EXPECT_EQ(orchestrator.hand_off_to_slot(2), Error::None);
    ASSERT_EQ(sender.sent.size(), 1u);
    EXPECT_EQ(sender.sent[0].peer_id, "desk");
    EXPECT_EQ(orchestrator.focus(), Focus::remote("desk"));

    EXPECT_EQ(orchestrator.receive(from("desk", SyncType::FocusHandoff, "", 7, 1)), Error::None);
    EXPECT_EQ(orchestrator.focus(), Focus::local());
}

TEST(FocusTest, Describe) {
    EXPECT_EQ(describe(Focus::unowned()), "unowned");
    EXPECT_EQ(describe(Focus::local()), "local");
    EXPECT_EQ(describe(Focus::remote("desk")), "remote:desk");
}
