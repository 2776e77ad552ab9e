#include <gtest/gtest.h>
#include <ssh/connection_id.hpp>

TEST(ConnectionId, KnownDigests) {
    EXPECT_EQ(connection_id("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(connection_id("root@example.com"), "04edfc0ef6c6cf6d6b88fbc69f9f9071");
}

TEST(ConnectionId, PureFunction) {
    EXPECT_EQ(connection_id("admin@192.0.2.10:2200"), connection_id("admin@192.0.2.10:2200"));
}

TEST(ConnectionId, LowercaseHex32) {
    std::string id = connection_id("deploy@db.internal:2222");
    EXPECT_EQ(id.size(), CONNECTION_ID_LEN);
    EXPECT_TRUE(is_connection_id(id));
}

TEST(ConnectionId, NoNormalization) {
    // Same endpoint, different spellings: separate sessions
    EXPECT_NE(connection_id("root@h"), connection_id("root@h:22"));
    EXPECT_NE(connection_id("root@H"), connection_id("root@h"));
}

TEST(ConnectionId, EmptyInput) {
    EXPECT_EQ(connection_id(""), "");
}

TEST(ConnectionId, Recognizer) {
    EXPECT_FALSE(is_connection_id(""));
    EXPECT_FALSE(is_connection_id("900150983CD24FB0D6963F7D28E17F72"));
    EXPECT_FALSE(is_connection_id("900150983cd24fb0d6963f7d28e17f7"));
    EXPECT_FALSE(is_connection_id("z00150983cd24fb0d6963f7d28e17f72"));
}
