/*
TGTelex — C ABI tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "tgtelex.h"

namespace {

class CApi : public ::testing::Test {
protected:
  void SetUp() override {
    handle = tgtelex_create();
    ASSERT_NE(handle, nullptr);
  }
  void TearDown() override { tgtelex_destroy(handle); }

  // Apply every returned edit to a UTF-8 string, as a host would.
  std::string typeKeys(const char* keys) {
    std::string screen;
    for (const char* p = keys; *p; ++p) {
      tgtelex_Edit e{};
      EXPECT_EQ(tgtelex_onKey(handle, static_cast<unsigned char>(*p), 0, &e), 1);
      for (int i = 0; i < e.backspace; ++i) {
        // Drop one UTF-8 encoded code point.
        while (!screen.empty() && (static_cast<unsigned char>(screen.back()) & 0xC0) == 0x80) {
          screen.pop_back();
        }
        if (!screen.empty()) screen.pop_back();
      }
      screen += e.textUtf8;
      if (e.passKey) screen.push_back(*p);
    }
    return screen;
  }

  tgtelex_handle_t handle = nullptr;
};

TEST(CApiNull, NullHandleIsRejected) {
  tgtelex_Edit e{};
  tgtelex_Correction c{};
  EXPECT_EQ(tgtelex_onKey(nullptr, 'a', 0, &e), 0);
  EXPECT_EQ(tgtelex_cancel(nullptr, &e), 0);
  EXPECT_EQ(tgtelex_setAutocorrectMode(nullptr, 1), 0);
  EXPECT_EQ(tgtelex_getAutocorrectMode(nullptr), -1);
  EXPECT_EQ(tgtelex_tryCorrect(nullptr, "teh", &c), 0);
  EXPECT_EQ(tgtelex_setEnabled(nullptr, 1), 0);
  EXPECT_EQ(tgtelex_setModernTone(nullptr, 1), 0);
  EXPECT_EQ(tgtelex_setAutoRestore(nullptr, 1), 0);
  EXPECT_EQ(tgtelex_loadSettings(nullptr, "x.yaml"), 0);
  EXPECT_STREQ(tgtelex_getLastError(nullptr), "invalid handle");
  tgtelex_destroy(nullptr);
}

TEST(CApiNull, AbiVersion) {
  EXPECT_EQ(tgtelex_getABIVersion(), TGTELEX_ABI_VERSION);
}

TEST_F(CApi, OnKeyProducesEdits) {
  tgtelex_Edit e{};
  ASSERT_EQ(tgtelex_onKey(handle, 'm', 0, &e), 1);
  EXPECT_EQ(e.action, TGTELEX_ACTION_SEND);
  EXPECT_STREQ(e.textUtf8, "m");
  EXPECT_EQ(e.textLength, 1);

  ASSERT_EQ(tgtelex_onKey(handle, 'a', 0, &e), 1);
  ASSERT_EQ(tgtelex_onKey(handle, 's', 0, &e), 1);
  EXPECT_EQ(e.backspace, 1);
  EXPECT_STREQ(e.textUtf8, "\xC3\xA1");  // á
  EXPECT_EQ(e.textLength, 1);
  EXPECT_EQ(e.passKey, 0);
}

TEST_F(CApi, NullOutputSetsError) {
  EXPECT_EQ(tgtelex_onKey(handle, 'a', 0, nullptr), 0);
  EXPECT_STRNE(tgtelex_getLastError(handle), "");
  EXPECT_EQ(tgtelex_cancel(handle, nullptr), 0);
  EXPECT_EQ(tgtelex_tryCorrect(handle, nullptr, nullptr), 0);

  tgtelex_Edit e{};
  ASSERT_EQ(tgtelex_onKey(handle, 'a', 0, &e), 1);
  EXPECT_STREQ(tgtelex_getLastError(handle), "");
}

TEST_F(CApi, TypingThroughTheAbi) {
  EXPECT_EQ(typeKeys("Vieetj text "), "Vi\xE1\xBB\x87t text ");  // Việt
}

TEST_F(CApi, RestoreAndCancel) {
  typeKeys("mas");
  tgtelex_Edit e{};
  ASSERT_EQ(tgtelex_cancel(handle, &e), 1);
  EXPECT_EQ(e.action, TGTELEX_ACTION_RESTORE);
  EXPECT_EQ(e.backspace, 2);
  EXPECT_STREQ(e.textUtf8, "mas");

  ASSERT_EQ(tgtelex_cancel(handle, &e), 1);
  EXPECT_EQ(e.action, TGTELEX_ACTION_NONE);
}

TEST_F(CApi, BoundaryHint) {
  typeKeys("text");
  tgtelex_Edit e{};
  ASSERT_EQ(tgtelex_onKey(handle, 0, 1, &e), 1);
  EXPECT_EQ(e.action, TGTELEX_ACTION_RESTORE);
  EXPECT_STREQ(e.textUtf8, "text");
  EXPECT_EQ(e.passKey, 1);
}

TEST_F(CApi, AutocorrectMode) {
  EXPECT_EQ(tgtelex_getAutocorrectMode(handle), TGTELEX_AUTOCORRECT_OFF);
  tgtelex_Correction c{};
  EXPECT_EQ(tgtelex_tryCorrect(handle, "teh", &c), 0);

  ASSERT_EQ(tgtelex_setAutocorrectMode(handle, TGTELEX_AUTOCORRECT_ENGLISH), 1);
  EXPECT_EQ(tgtelex_getAutocorrectMode(handle), TGTELEX_AUTOCORRECT_ENGLISH);
  ASSERT_EQ(tgtelex_tryCorrect(handle, "Teh", &c), 1);
  EXPECT_STREQ(c.originalUtf8, "Teh");
  EXPECT_STREQ(c.correctedUtf8, "The");
  EXPECT_EQ(c.backspaceCount, 3);
  EXPECT_EQ(typeKeys("teh "), "the ");

  ASSERT_EQ(tgtelex_setAutocorrectMode(handle, 42), 1);
  EXPECT_EQ(tgtelex_getAutocorrectMode(handle), TGTELEX_AUTOCORRECT_OFF);
}

TEST_F(CApi, Toggles) {
  ASSERT_EQ(tgtelex_setModernTone(handle, 1), 1);
  EXPECT_EQ(typeKeys("hoaf "), "ho\xC3\xA0 ");  // hoà
  ASSERT_EQ(tgtelex_setModernTone(handle, 0), 1);

  ASSERT_EQ(tgtelex_setAutoRestore(handle, 0), 1);
  EXPECT_EQ(typeKeys("text "), "t\xE1\xBA\xBDt ");  // tẽt
  ASSERT_EQ(tgtelex_setAutoRestore(handle, 1), 1);

  ASSERT_EQ(tgtelex_setEnabled(handle, 0), 1);
  EXPECT_EQ(typeKeys("mas "), "mas ");
}

TEST_F(CApi, LoadSettings) {
  const std::string path = ::testing::TempDir() + "tgtelex_capi.yaml";
  {
    std::ofstream f(path, std::ios::binary);
    f << "autocorrect: vietnamese\ntoneStyle: modern\n";
  }
  ASSERT_EQ(tgtelex_loadSettings(handle, path.c_str()), 1) << tgtelex_getLastError(handle);
  EXPECT_EQ(tgtelex_getAutocorrectMode(handle), TGTELEX_AUTOCORRECT_VIETNAMESE);
  EXPECT_EQ(typeKeys("hoaf "), "ho\xC3\xA0 ");
  std::remove(path.c_str());
}

TEST_F(CApi, LoadSettingsFailureKeepsState) {
  ASSERT_EQ(tgtelex_setAutocorrectMode(handle, TGTELEX_AUTOCORRECT_ALL), 1);
  EXPECT_EQ(tgtelex_loadSettings(handle, "/nonexistent/tgtelex.yaml"), 0);
  EXPECT_NE(std::string(tgtelex_getLastError(handle)).find("Could not open file"),
            std::string::npos);
  EXPECT_EQ(tgtelex_getAutocorrectMode(handle), TGTELEX_AUTOCORRECT_ALL);

  EXPECT_EQ(tgtelex_loadSettings(handle, ""), 0);
}

}  // namespace
