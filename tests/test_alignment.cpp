#include <cstring>
#include <string>
#include <vector>

#include <sarcx/alignment.hpp>
#include <sarcx/endian.hpp>

#include <gtest/gtest.h>

namespace {

// Header of a new-style binary file (BNTX, BFRES, ...) declaring 1 << exponent alignment
std::vector<uint8_t> makeBinaryFile(sarcx::Endian endian, uint8_t exponent, size_t size = 0x40) {
  std::vector<uint8_t> data(size, 0);
  std::memcpy(data.data(), "BNTX", 4);
  sarcx::store16(data.data() + 0x0C, 0xFEFF, endian);
  data[0x0E] = exponent;
  sarcx::store32(data.data() + 0x1C, static_cast<uint32_t>(size), endian);
  return data;
}

// Wii U BFLIM texture whose footer declares the given alignment
std::vector<uint8_t> makeCafeBflim(uint16_t alignment, size_t size = 0x60) {
  std::vector<uint8_t> data(size, 0);
  std::memcpy(data.data() + size - 0x28, "FLIM", 4);
  sarcx::store16(data.data() + size - 0x08, alignment, sarcx::Endian::Big);
  return data;
}

} // namespace

// Test the built-in extension table for both byte orders
TEST(AlignmentPolicyTest, DefaultTable) {
  struct Row {
    const char *extension;
    uint32_t big;
    uint32_t little;
  };
  const Row table[] = {
      {"ksky", 0x8, 0x8},          {"bksky", 0x8, 0x8},        {"baglmf", 0x80, 0x80},
      {"sharc", 0x1000, 0x1000},   {"sharcb", 0x1000, 0x1000}, {"gtx", 0x2000, 0x2000},
      {"bffnt", 0x2000, 0x1000},
  };

  for (const auto &row : table) {
    EXPECT_EQ(sarcx::AlignmentPolicy::defaultRequirement(row.extension, sarcx::Endian::Big),
              row.big)
        << row.extension;
    EXPECT_EQ(sarcx::AlignmentPolicy::defaultRequirement(row.extension, sarcx::Endian::Little),
              row.little)
        << row.extension;
  }

  EXPECT_FALSE(sarcx::AlignmentPolicy::defaultRequirement("txt", sarcx::Endian::Big));
  EXPECT_FALSE(sarcx::AlignmentPolicy::defaultRequirement("", sarcx::Endian::Little));
  EXPECT_FALSE(sarcx::AlignmentPolicy::defaultRequirement("KSKY", sarcx::Endian::Little));
}

// Test the resolved alignment for names using the table
TEST(AlignmentPolicyTest, RequiredAlignmentFromExtension) {
  sarcx::AlignmentPolicy little(sarcx::Endian::Little);
  sarcx::AlignmentPolicy big(sarcx::Endian::Big);
  std::vector<uint8_t> data = {1, 2, 3, 4};

  EXPECT_EQ(little.requiredAlignment("Env/sky.ksky", data), 8u);
  EXPECT_EQ(little.requiredAlignment("Layout/blyt.baglmf", data), 0x80u);
  EXPECT_EQ(little.requiredAlignment("Shader/shader.sharcb", data), 0x1000u);
  EXPECT_EQ(little.requiredAlignment("tex.gtx", data), 0x2000u);
  EXPECT_EQ(little.requiredAlignment("Font/Main.bffnt", data), 0x1000u);
  EXPECT_EQ(big.requiredAlignment("Font/Main.bffnt", data), 0x2000u);
}

// Test the fallback when no rule matches
TEST(AlignmentPolicyTest, DefaultMinimum) {
  sarcx::AlignmentPolicy policy;
  std::vector<uint8_t> data = {'h', 'i'};

  EXPECT_EQ(policy.requiredAlignment("a.txt", data), 4u);
  EXPECT_EQ(policy.requiredAlignment("noextension", data), 4u);
  EXPECT_EQ(policy.requiredAlignment("dir.with.dots/file", data), 4u);
  EXPECT_EQ(policy.requiredAlignment("empty.bin", {}), 4u);
}

// Test extension extraction
TEST(AlignmentPolicyTest, ExtensionOf) {
  EXPECT_EQ(sarcx::AlignmentPolicy::extensionOf("a.txt"), "txt");
  EXPECT_EQ(sarcx::AlignmentPolicy::extensionOf("Model/Link.Tex2.sbfres"), "sbfres");
  EXPECT_EQ(sarcx::AlignmentPolicy::extensionOf("noextension"), "");
  EXPECT_EQ(sarcx::AlignmentPolicy::extensionOf("trailing."), "");
  EXPECT_EQ(sarcx::AlignmentPolicy::extensionOf(".hidden"), "hidden");
}

// Test caller overrides
TEST(AlignmentPolicyTest, AddRequirement) {
  sarcx::AlignmentPolicy policy;
  sarcx::Error error;
  std::vector<uint8_t> data = {0};

  ASSERT_TRUE(policy.addRequirement("bgparamlist", 0x40, &error)) << error.message;
  EXPECT_EQ(policy.requiredAlignment("Actor/Link.bgparamlist", data), 0x40u);

  // Overrides replace built-in entries
  ASSERT_TRUE(policy.addRequirement("gtx", 0x100, &error)) << error.message;
  EXPECT_EQ(policy.requiredAlignment("tex.gtx", data), 0x100u);

  // An alignment of 1 drops the requirement
  ASSERT_TRUE(policy.addRequirement("ksky", 1, &error)) << error.message;
  EXPECT_EQ(policy.requiredAlignment("sky.ksky", data), 4u);
}

// Test invalid alignment values
TEST(AlignmentPolicyTest, InvalidAlignment) {
  sarcx::AlignmentPolicy policy;
  sarcx::Error error;

  EXPECT_FALSE(policy.addRequirement("bin", 0, &error));
  EXPECT_EQ(error.code, sarcx::ErrorCode::InvalidAlignment);

  EXPECT_FALSE(policy.addRequirement("bin", 12, &error));
  EXPECT_EQ(error.code, sarcx::ErrorCode::InvalidAlignment);

  EXPECT_FALSE(policy.setMinAlignment(0, &error));
  EXPECT_EQ(error.code, sarcx::ErrorCode::InvalidAlignment);

  EXPECT_FALSE(policy.setMinAlignment(6, &error));
  EXPECT_EQ(policy.minAlignment(), 4u);
}

// Test changing the minimum alignment
TEST(AlignmentPolicyTest, MinAlignment) {
  sarcx::AlignmentPolicy policy;
  std::vector<uint8_t> data = {0};

  ASSERT_TRUE(policy.setMinAlignment(0x20));
  EXPECT_EQ(policy.requiredAlignment("a.txt", data), 0x20u);

  // Combined with table entries
  EXPECT_EQ(policy.requiredAlignment("sky.ksky", data), 0x20u);
  EXPECT_EQ(policy.requiredAlignment("tex.gtx", data), 0x2000u);

  ASSERT_TRUE(policy.setMinAlignment(1));
  EXPECT_EQ(policy.requiredAlignment("a.txt", data), 1u);
}

// Test SARC detection
TEST(AlignmentPolicyTest, IsSarc) {
  std::vector<uint8_t> sarc(0x20, 0);
  std::memcpy(sarc.data(), "SARC", 4);
  EXPECT_TRUE(sarcx::AlignmentPolicy::isSarc(sarc));

  std::vector<uint8_t> yaz0(0x40, 0);
  std::memcpy(yaz0.data(), "Yaz0", 4);
  std::memcpy(yaz0.data() + 0x11, "SARC", 4);
  EXPECT_TRUE(sarcx::AlignmentPolicy::isSarc(yaz0));

  // Yaz0 holding something else
  std::memcpy(yaz0.data() + 0x11, "BNTX", 4);
  EXPECT_FALSE(sarcx::AlignmentPolicy::isSarc(yaz0));

  // Too short
  std::vector<uint8_t> shortSarc(0x1F, 0);
  std::memcpy(shortSarc.data(), "SARC", 4);
  EXPECT_FALSE(sarcx::AlignmentPolicy::isSarc(shortSarc));
}

// Test alignment sniffed from new-style binary file headers
TEST(AlignmentPolicyTest, NewBinaryFile) {
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForNewBinaryFile(
                makeBinaryFile(sarcx::Endian::Big, 12)),
            0x1000u);
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForNewBinaryFile(
                makeBinaryFile(sarcx::Endian::Little, 13)),
            0x2000u);

  // File size field must match the data length
  auto mismatched = makeBinaryFile(sarcx::Endian::Little, 12);
  mismatched.push_back(0);
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForNewBinaryFile(mismatched), 1u);

  // No byte-order mark
  std::vector<uint8_t> plain(0x40, 0);
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForNewBinaryFile(plain), 1u);

  // Too short to have the header
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForNewBinaryFile(
                makeBinaryFile(sarcx::Endian::Big, 12, 0x20)),
            1u);

  // Exponent out of range is ignored
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForNewBinaryFile(
                makeBinaryFile(sarcx::Endian::Big, 40)),
            1u);
}

// Test alignment sniffed from Wii U BFLIM footers
TEST(AlignmentPolicyTest, CafeBflim) {
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForCafeBflim(makeCafeBflim(0x200)), 0x200u);

  // Not a power of two
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForCafeBflim(makeCafeBflim(0x300)), 1u);

  // Too short
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForCafeBflim(std::vector<uint8_t>(0x28, 0)), 1u);

  // Missing FLIM footer
  EXPECT_EQ(sarcx::AlignmentPolicy::alignmentForCafeBflim(std::vector<uint8_t>(0x60, 0)), 1u);
}

// Test that content sniffing combines with the extension rules
TEST(AlignmentPolicyTest, ContentSniffing) {
  sarcx::AlignmentPolicy little(sarcx::Endian::Little);
  sarcx::AlignmentPolicy big(sarcx::Endian::Big);

  auto bntx = makeBinaryFile(sarcx::Endian::Little, 12);
  EXPECT_EQ(little.requiredAlignment("Model/Link.Tex.bntx", bntx), 0x1000u);

  // BFLIM footers only matter for big-endian archives
  auto bflim = makeCafeBflim(0x200);
  EXPECT_EQ(big.requiredAlignment("Layout/timg/Icon.bflim", bflim), 0x200u);
  EXPECT_EQ(little.requiredAlignment("Layout/timg/Icon.bflim", bflim), 4u);
}

// Test that resource factory extensions skip sniffing unless in legacy mode
TEST(AlignmentPolicyTest, ResourceFactoryExtensions) {
  EXPECT_TRUE(sarcx::AlignmentPolicy::isResourceFactoryExtension("bfres"));
  EXPECT_TRUE(sarcx::AlignmentPolicy::isResourceFactoryExtension("bgparamlist"));
  EXPECT_TRUE(sarcx::AlignmentPolicy::isResourceFactoryExtension("sarc"));
  EXPECT_FALSE(sarcx::AlignmentPolicy::isResourceFactoryExtension("bntx"));
  EXPECT_FALSE(sarcx::AlignmentPolicy::isResourceFactoryExtension(""));

  sarcx::AlignmentPolicy policy(sarcx::Endian::Little);
  auto bfres = makeBinaryFile(sarcx::Endian::Little, 12);
  EXPECT_EQ(policy.requiredAlignment("Model/Link.bfres", bfres), 4u);

  policy.setLegacyMode(true);
  EXPECT_TRUE(policy.legacyMode());
  EXPECT_EQ(policy.requiredAlignment("Model/Link.bfres", bfres), 0x1000u);
}

// Test nested archives in legacy mode
TEST(AlignmentPolicyTest, LegacyNestedSarc) {
  std::vector<uint8_t> sarc(0x40, 0);
  std::memcpy(sarc.data(), "SARC", 4);

  sarcx::AlignmentPolicy policy;
  EXPECT_EQ(policy.requiredAlignment("Pack/Inner.pack", sarc), 4u);

  policy.setLegacyMode(true);
  EXPECT_EQ(policy.requiredAlignment("Pack/Inner.pack", sarc), 0x2000u);
}

// Test that every result is a non-zero power of two
TEST(AlignmentPolicyTest, AlwaysPowerOfTwo) {
  const char *names[] = {"a.txt",  "b.bin",      "sky.ksky", "f.bffnt", "t.gtx",
                         "s.sharc", "m.bfres",   "x",        "",        "l.bflim"};
  std::vector<std::vector<uint8_t>> contents = {
      {},
      {1, 2, 3},
      makeBinaryFile(sarcx::Endian::Big, 0),
      makeBinaryFile(sarcx::Endian::Little, 31),
      makeCafeBflim(0x80),
      makeCafeBflim(0),
  };

  for (auto endian : {sarcx::Endian::Big, sarcx::Endian::Little}) {
    for (bool legacy : {false, true}) {
      sarcx::AlignmentPolicy policy(endian);
      policy.setLegacyMode(legacy);
      for (const char *name : names) {
        for (const auto &data : contents) {
          uint32_t alignment = policy.requiredAlignment(name, data);
          EXPECT_TRUE(sarcx::isValidAlignment(alignment)) << name << " -> " << alignment;
          EXPECT_GE(alignment, policy.minAlignment());
        }
      }
    }
  }
}
