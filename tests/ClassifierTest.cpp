#include <gtest/gtest.h>

#include "chat/Classifier.h"

using namespace quichat::chat;

namespace {

const Identity me("inst-ME", "alice");
const Identity other("inst-OTHER", "bob");
const Identity namesake("inst-NAMESAKE", "alice");

} // namespace

TEST(Classifier, ChatCarriesText) {
    auto c = classify(make_chat(other, "hello", Timestamp{}), me);
    EXPECT_EQ(c.kind, ControlKind::Chat);
    EXPECT_EQ(c.payload, "hello");
    EXPECT_FALSE(c.is_local);
}

TEST(Classifier, ControlKindsCarryProbeId) {
    EXPECT_EQ(classify(make_presence(other, Timestamp{}), me).kind, ControlKind::Presence);

    auto probe = classify(make_probe(other, "ab12cd34", Timestamp{}), me);
    EXPECT_EQ(probe.kind, ControlKind::Probe);
    EXPECT_EQ(probe.payload, "ab12cd34");

    auto reply = classify(make_probe_reply(other, "ab12cd34", Timestamp{}), me);
    EXPECT_EQ(reply.kind, ControlKind::ProbeReply);
    EXPECT_EQ(reply.payload, "ab12cd34");
}

TEST(Classifier, LocalOriginFollowsInstanceNotNick) {
    EXPECT_TRUE(classify(make_probe(me, "1", Timestamp{}), me).is_local);
    EXPECT_FALSE(classify(make_probe(namesake, "1", Timestamp{}), me).is_local);
}

TEST(Classifier, EnvelopeWithoutSenderIsNeverLocal) {
    Envelope e = make_presence(me, Timestamp{});
    e.sender.clear();
    EXPECT_FALSE(classify(e, me).is_local);
    EXPECT_FALSE(classify(e, Identity("", "alice")).is_local);
}

TEST(Classifier, LegacyTextPrefixes) {
    EXPECT_EQ(classify_legacy_text("__JOIN__").first, Envelope::Kind::Join);
    EXPECT_EQ(classify_legacy_text("__JOIN__x").first, Envelope::Kind::Chat);

    auto ping = classify_legacy_text("__PING__deadbeef");
    EXPECT_EQ(ping.first, Envelope::Kind::Ping);
    EXPECT_EQ(ping.second, "deadbeef");

    auto pong = classify_legacy_text("__PONG__deadbeef");
    EXPECT_EQ(pong.first, Envelope::Kind::Pong);
    EXPECT_EQ(pong.second, "deadbeef");

    EXPECT_EQ(classify_legacy_text("hello __PING__").first, Envelope::Kind::Chat);
    EXPECT_EQ(classify_legacy_text("").first, Envelope::Kind::Chat);
}
