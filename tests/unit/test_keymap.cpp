/**
 * @file test_keymap.cpp
 * @brief Unit tests for the host scancode to keypad mapping.
 */

#include <gtest/gtest.h>
#include <gr8/keymap.h>

using namespace gr8;

// ─────────────────────────────────────────────────────────────────────────────
// Scancode names
// ─────────────────────────────────────────────────────────────────────────────

TEST(ScancodeTest, LettersAndDigits) {
    EXPECT_EQ(scancode::from_name("a"), scancode::kA);
    EXPECT_EQ(scancode::from_name("Z"), scancode::kZ);
    EXPECT_EQ(scancode::from_name("1"), scancode::k1);
    EXPECT_EQ(scancode::from_name("0"), scancode::k0);
    EXPECT_EQ(scancode::from_name("q"), uint16_t{20});
}

TEST(ScancodeTest, Escape) {
    EXPECT_EQ(scancode::from_name("escape"), scancode::kEscape);
    EXPECT_EQ(scancode::from_name("esc"), scancode::kEscape);
}

TEST(ScancodeTest, UnknownNames) {
    EXPECT_FALSE(scancode::from_name("").has_value());
    EXPECT_FALSE(scancode::from_name("f1").has_value());
    EXPECT_FALSE(scancode::from_name("-").has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Default layout
// ─────────────────────────────────────────────────────────────────────────────

TEST(KeyMapTest, EmptyMapHasOnlyQuitKey) {
    KeyMap map;
    EXPECT_EQ(map.binding_count(), 0u);
    EXPECT_TRUE(map.is_quit(scancode::kEscape));
    EXPECT_FALSE(map.lookup(scancode::kA).has_value());
}

TEST(KeyMapTest, DefaultLayout) {
    const KeyMap map = KeyMap::defaults();
    EXPECT_EQ(map.binding_count(), 16u);

    struct Expect { const char* name; uint8_t key; };
    const Expect rows[] = {
        {"1", 0x1}, {"2", 0x2}, {"3", 0x3}, {"4", 0xC},
        {"q", 0x4}, {"w", 0x5}, {"e", 0x6}, {"r", 0xD},
        {"a", 0x7}, {"s", 0x8}, {"d", 0x9}, {"f", 0xE},
        {"z", 0xA}, {"x", 0x0}, {"c", 0xB}, {"v", 0xF},
    };
    for (const auto& row : rows) {
        const auto code = scancode::from_name(row.name);
        ASSERT_TRUE(code.has_value()) << row.name;
        EXPECT_EQ(map.lookup(*code), row.key) << row.name;
    }
}

TEST(KeyMapTest, EveryKeypadKeyReachable) {
    const KeyMap map = KeyMap::defaults();
    bool seen[16] = {};
    for (uint16_t code = 0; code < KeyMap::kScancodeCount; ++code) {
        if (auto key = map.lookup(code)) {
            seen[*key] = true;
        }
    }
    for (int k = 0; k < 16; ++k) {
        EXPECT_TRUE(seen[k]) << "key " << k;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Rebinding
// ─────────────────────────────────────────────────────────────────────────────

TEST(KeyMapTest, BindReplacesPreviousBinding) {
    KeyMap map = KeyMap::defaults();
    map.bind(scancode::kA, 0xF);
    EXPECT_EQ(map.lookup(scancode::kA), uint8_t{0xF});
    EXPECT_EQ(map.binding_count(), 16u);
}

TEST(KeyMapTest, BindRejectsOutOfRangeKey) {
    KeyMap map;
    EXPECT_ANY_THROW(map.bind(scancode::kA, 16));
    EXPECT_ANY_THROW(map.bind(KeyMap::kScancodeCount, 1));
}

TEST(KeyMapTest, BindNamed) {
    KeyMap map;
    ASSERT_TRUE(map.bind_named("m", 0x3).has_value());
    EXPECT_EQ(map.lookup(*scancode::from_name("m")), uint8_t{0x3});

    auto bad_name = map.bind_named("f13", 0x3);
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_EQ(bad_name.error().code(), ErrorCode::InvalidArgument);

    auto bad_key = map.bind_named("m", 0x10);
    ASSERT_FALSE(bad_key.has_value());
    EXPECT_EQ(bad_key.error().code(), ErrorCode::InvalidArgument);
}

TEST(KeyMapTest, Unbind) {
    KeyMap map = KeyMap::defaults();
    map.unbind(scancode::kA);
    EXPECT_FALSE(map.lookup(scancode::kA).has_value());
    EXPECT_EQ(map.binding_count(), 15u);

    map.unbind(9999);
    EXPECT_EQ(map.binding_count(), 15u);
}

TEST(KeyMapTest, UnbindKeyRemovesAllAliases) {
    KeyMap map = KeyMap::defaults();
    map.bind(scancode::kZ, 0x5);
    map.unbind_key(0x5);
    EXPECT_FALSE(map.lookup(scancode::kZ).has_value());
    EXPECT_FALSE(map.lookup(*scancode::from_name("w")).has_value());
    EXPECT_EQ(map.binding_count(), 14u);
}

TEST(KeyMapTest, LookupOutOfRangeScancode) {
    const KeyMap map = KeyMap::defaults();
    EXPECT_FALSE(map.lookup(KeyMap::kScancodeCount).has_value());
    EXPECT_FALSE(map.lookup(0xFFFF).has_value());
}

TEST(KeyMapTest, QuitScancode) {
    KeyMap map;
    map.set_quit_scancode(scancode::k0);
    EXPECT_EQ(map.quit_scancode(), scancode::k0);
    EXPECT_TRUE(map.is_quit(scancode::k0));
    EXPECT_FALSE(map.is_quit(scancode::kEscape));
}
