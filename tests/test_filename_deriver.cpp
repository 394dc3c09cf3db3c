#include <gtest/gtest.h>

#include "core/naming/FilenameDeriver.hpp"

using namespace certgen;

TEST(SanitizePart, TrimsAndJoinsWhitespace) {
  EXPECT_EQ(sanitize_part("  Mary   Ann \t"), "Mary_Ann");
  EXPECT_EQ(sanitize_part("a\nb"), "a_b");
}

TEST(SanitizePart, DropsPunctuationAndNonAscii) {
  EXPECT_EQ(sanitize_part("O'Brien-Smith"), "OBrienSmith");
  EXPECT_EQ(sanitize_part("CERT-001"), "CERT001");
  EXPECT_EQ(sanitize_part("Jos\xC3\xA9"), "Jos");
  EXPECT_EQ(sanitize_part("../../etc"), "etc");
}

TEST(SanitizePart, EmptyAndBlank) {
  EXPECT_EQ(sanitize_part(""), "");
  EXPECT_EQ(sanitize_part("   "), "");
  EXPECT_EQ(sanitize_part("!!!"), "");
}

TEST(SanitizePart, Idempotent) {
  for (const std::string s : {"  Mary   Ann ", "A-b c_d", "x\x01y z", "__a__", "Jos\xC3\xA9 Luis"}) {
    const std::string once = sanitize_part(s);
    EXPECT_EQ(sanitize_part(once), once) << s;
  }
}

TEST(FilenameDeriver, WithoutMiddleName) {
  FilenameDeriver d;
  auto key = d.derive("CERT001", "Jane", "", "Doe");
  ASSERT_TRUE(key.ok());
  EXPECT_EQ(key.value(), "certificates/CERT001_Jane_Doe.docx");
}

TEST(FilenameDeriver, WithMiddleName) {
  FilenameDeriver d;
  auto key = d.derive(" 2024 07 ", "Mary Ann", "Q.", "van der Berg");
  ASSERT_TRUE(key.ok());
  EXPECT_EQ(key.value(), "certificates/2024_07_Mary_Ann_Q_van_der_Berg.docx");
}

TEST(FilenameDeriver, MiddleThatSanitizesAwayIsSkipped) {
  FilenameDeriver d;
  auto key = d.derive("C1", "A", " - ", "B");
  ASSERT_TRUE(key.ok());
  EXPECT_EQ(key.value(), "certificates/C1_A_B.docx");
}

TEST(FilenameDeriver, RequiresIdentity) {
  FilenameDeriver d;
  for (auto args : {std::make_tuple("", "A", "B"),
                    std::make_tuple("C1", "  ", "B"),
                    std::make_tuple("C1", "A", "%%")}) {
    auto key = d.derive(std::get<0>(args), std::get<1>(args), "", std::get<2>(args));
    ASSERT_FALSE(key.ok());
    EXPECT_EQ(key.error().code, ErrorCode::InvalidIdentity);
  }
}

TEST(ReplaceExtension, SwapsOrAppends) {
  EXPECT_EQ(replace_extension("certificates/C1_A_B.docx", "pdf"), "certificates/C1_A_B.pdf");
  EXPECT_EQ(replace_extension("certificates/C1_A_B", "pdf"), "certificates/C1_A_B.pdf");
  EXPECT_EQ(replace_extension("dir.v2/name", "pdf"), "dir.v2/name.pdf");
}
