#include <gtest/gtest.h>
#include <picker/input_decoder.hpp>
#include <vector>

static std::optional<Action> decode(std::vector<unsigned char> bytes) {
    return decode_input(bytes.data(), bytes.size());
}

static ActionType type_of(std::vector<unsigned char> bytes) {
    auto a = decode(std::move(bytes));
    EXPECT_TRUE(a.has_value());
    return a ? a->type : ActionType::Cancel;
}

TEST(InputDecoder, CancelKeys) {
    EXPECT_EQ(type_of({3}), ActionType::Cancel);
    EXPECT_EQ(type_of({27}), ActionType::Cancel);
}

TEST(InputDecoder, ConfirmKeys) {
    EXPECT_EQ(type_of({10}), ActionType::Confirm);
    EXPECT_EQ(type_of({13}), ActionType::Confirm);
}

TEST(InputDecoder, EditingKeys) {
    EXPECT_EQ(type_of({127}), ActionType::Backspace);
    EXPECT_EQ(type_of({0}), ActionType::ToggleMark);
}

TEST(InputDecoder, PrintableCharacters) {
    auto a = decode({'q'});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, ActionType::CharTyped);
    EXPECT_EQ(a->ch, 'q');

    EXPECT_EQ(decode({' '})->ch, ' ');
    EXPECT_EQ(decode({'~'})->ch, '~');
}

TEST(InputDecoder, OtherControlBytesIgnored) {
    EXPECT_FALSE(decode({1}).has_value());
    EXPECT_FALSE(decode({9}).has_value());
    EXPECT_FALSE(decode({8}).has_value());
    EXPECT_FALSE(decode({200}).has_value());
}

TEST(InputDecoder, ArrowKeys) {
    EXPECT_EQ(type_of({27, '[', 'A'}), ActionType::MoveUp);
    EXPECT_EQ(type_of({27, '[', 'B'}), ActionType::MoveDown);
}

TEST(InputDecoder, UnknownEscapeSequencesIgnored) {
    EXPECT_FALSE(decode({27, '[', 'C'}).has_value());     // right
    EXPECT_FALSE(decode({27, '[', 'D'}).has_value());     // left
    EXPECT_FALSE(decode({27, '[', 'H'}).has_value());     // home
    EXPECT_FALSE(decode({27, 'O', 'P'}).has_value());     // F1
    EXPECT_FALSE(decode({27, '['}).has_value());
}

TEST(InputDecoder, MultiByteNonEscapeReadsIgnored) {
    EXPECT_FALSE(decode({'a', 'b'}).has_value());
    EXPECT_FALSE(decode({'a', 'b', 'c'}).has_value());
}

TEST(InputDecoder, EmptyRead) {
    EXPECT_FALSE(decode({}).has_value());
    EXPECT_FALSE(decode_input(nullptr, 0).has_value());
}
