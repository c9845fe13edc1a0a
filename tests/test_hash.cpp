#include <string>

#include <sarcx/hash.hpp>

#include <gtest/gtest.h>

// Hash is usable at compile time
static_assert(sarcx::hashName("") == 0);
static_assert(sarcx::hashName("A") == 0x41);
static_assert(sarcx::hashName("AB") == 0x41 * 0x65 + 0x42);

// Test golden values
TEST(HashTest, GoldenValues) {
  EXPECT_EQ(sarcx::hashName("a.txt"), 0x5C897AA7u);
  EXPECT_EQ(sarcx::hashName("b.bin"), 0x62BA7D65u);
  EXPECT_EQ(sarcx::hashName("Model/DgnMrgPrt_Dungeon119.sbfres"), 0xDFD106FAu);
  EXPECT_EQ(sarcx::hashName("Actor/Pack/Enemy_Lizalfos.sbactorpack"), 0x9FCB1FFAu);
}

// Test determinism
TEST(HashTest, Deterministic) {
  std::string name = "Map/CDungeon/Dungeon119/Dungeon119_Static.smubin";
  EXPECT_EQ(sarcx::hashName(name), sarcx::hashName(name));
  EXPECT_EQ(sarcx::hashName(name), sarcx::hashName(std::string(name)));
}

// Test empty name
TEST(HashTest, EmptyName) {
  EXPECT_EQ(sarcx::hashName(""), 0u);
}

// Test that bytes above 0x7F are not sign-extended
TEST(HashTest, HighBytesAreUnsigned) {
  EXPECT_EQ(sarcx::hashName("\xFF"), 0xFFu);
  EXPECT_EQ(sarcx::hashName("\x80\x01"), 0x80u * 0x65u + 0x01u);
}

// Test a custom multiplier
TEST(HashTest, CustomMultiplier) {
  EXPECT_EQ(sarcx::hashName("ab", 0x1F), 0x61u * 0x1Fu + 0x62u);
  EXPECT_NE(sarcx::hashName("a.txt", 0x1F), sarcx::hashName("a.txt"));
}

// Test that distinct names may collide
TEST(HashTest, Collision) {
  EXPECT_EQ(sarcx::hashName("itpdcnfu.bin"), 0x802EBBF8u);
  EXPECT_EQ(sarcx::hashName("ntrintqi.bin"), 0x802EBBF8u);
}
