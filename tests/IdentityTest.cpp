#include <gtest/gtest.h>

#include "chat/IDGenerator.hpp"
#include "chat/Identity.h"

#include <set>

using namespace quichat::chat;

TEST(Identity, SanitizesNick) {
    EXPECT_EQ(Identity::sanitize_nick("  alice \t"), "alice");
    EXPECT_EQ(Identity::sanitize_nick(""), "anon");
    EXPECT_EQ(Identity::sanitize_nick("   "), "anon");
    EXPECT_EQ(Identity::sanitize_nick(std::string(40, 'x')).size(), Identity::kMaxNickLen);
}

TEST(Identity, InstanceIdIsIndependentOfNick) {
    IDGenerator idgen;
    Identity a(idgen, "alice");
    Identity b(idgen, "alice");
    EXPECT_EQ(a.nick(), b.nick());
    EXPECT_NE(a.instance_id(), b.instance_id());
    EXPECT_TRUE(a.is_self(a.instance_id()));
    EXPECT_FALSE(a.is_self(b.instance_id()));
    EXPECT_FALSE(a.is_self("alice"));
    EXPECT_FALSE(a.is_self(""));
}

TEST(IDGenerator, UlidShape) {
    IDGenerator idgen;
    const std::string id = idgen.instanceID();
    ASSERT_EQ(id.rfind("inst-", 0), 0u);
    const std::string ulid = id.substr(5);
    ASSERT_EQ(ulid.size(), 26u);
    EXPECT_EQ(ulid.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ"), std::string::npos);
    EXPECT_LE(ulid[0], '7');  // 128 bits leave only 3 bits for the first char

    EXPECT_EQ(idgen.peerID().rfind("peer-", 0), 0u);
}

TEST(IDGenerator, UlidsAreUniqueAndOrderedWithinABurst) {
    IDGenerator idgen;
    std::string prev;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = idgen.peerID();
        EXPECT_TRUE(seen.insert(id).second);
        if (!prev.empty()) EXPECT_LT(prev, id);
        prev = std::move(id);
    }
}

TEST(IDGenerator, ProbeIdsAreHex) {
    IDGenerator idgen;
    std::set<std::string> seen;
    for (int i = 0; i < 256; ++i) {
        std::string id = idgen.probeID();
        ASSERT_EQ(id.size(), 16u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 256u);
}
