#include <gtest/gtest.h>
#include <records/record_source.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

TEST(RecordSource, ParsesTypedScalars) {
    auto r = parse_json_records(R"([{"s": "42", "n": 42, "f": 1.5, "b": true, "z": null}])");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);
    const Record& rec = r.value[0];
    EXPECT_EQ(rec.find("s")->kind(), Value::Kind::Text);
    EXPECT_EQ(rec.find("n")->kind(), Value::Kind::Number);
    EXPECT_DOUBLE_EQ(rec.find("n")->as_number(), 42.0);
    EXPECT_DOUBLE_EQ(rec.find("f")->as_number(), 1.5);
    EXPECT_EQ(rec.find("b")->kind(), Value::Kind::Bool);
    EXPECT_TRUE(rec.find("b")->as_bool());
    EXPECT_TRUE(rec.find("z")->is_null());
}

TEST(RecordSource, ParsesNestedValues) {
    auto r = parse_json_records(R"([{"tags": ["x", 1], "meta": {"a": {"b": false}}}])");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(to_json(r.value[0]), R"({"meta":{"a":{"b":false}},"tags":["x",1]})");
}

TEST(RecordSource, ParsesCompactJson) {
    auto r = parse_json_records(R"([{"name":"Alpha","id":1},{"name":"Beta","id":2}])");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[1].find("name")->as_text(), "Beta");
}

TEST(RecordSource, ParsesMultilineJson) {
    std::string input =
        "[\n"
        "  {\n"
        "    \"name\": \"Alpha\",\n"
        "    \"id\": 1\n"
        "  }\n"
        "]\n";
    auto r = parse_json_records(input);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.size(), 1u);
}

TEST(RecordSource, RejectsNonArray) {
    auto r = parse_records(R"({"name": "x"})", false);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("error parsing JSON"), std::string::npos);
}

TEST(RecordSource, RejectsNonObjectElement) {
    auto r = parse_records(R"([{"a": 1}, 2])", false);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("element 1"), std::string::npos);
}

TEST(RecordSource, RejectsMalformedJson) {
    auto r = parse_records(R"([{"a": 1})", false);
    EXPECT_TRUE(r.is_err());
}

TEST(RecordSource, DecodesSurrogatePairEscape) {
    auto r = parse_json_records(R"([{"e": "\ud83d\ude00", "a": "caf\u00e9"}])");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value[0].find("e")->as_text(), "\xF0\x9F\x98\x80");
    EXPECT_EQ(r.value[0].find("a")->as_text(), "caf\xC3\xA9");
}

TEST(RecordSource, RejectsTrailingComma) {
    EXPECT_TRUE(parse_records(R"([{"a": 1,}])", false).is_err());
    EXPECT_TRUE(parse_records(R"([{"a": 1},])", false).is_err());
}

TEST(RecordSource, RejectsYamlBlockSequence) {
    auto r = parse_records("- name: x\n  id: yes\n", false);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("error parsing JSON"), std::string::npos);
}

TEST(RecordSource, RejectsBareWords) {
    EXPECT_TRUE(parse_records("[{name: x}]", false).is_err());
    EXPECT_TRUE(parse_records(R"([{"name": x}])", false).is_err());
}

TEST(RecordSource, RejectsOutOfRangeNumber) {
    EXPECT_TRUE(parse_records(R"([{"n": 1e400}])", false).is_err());
}

TEST(RecordSource, IntegerLiteralsBecomeNumbers) {
    auto r = parse_json_records(R"([{"i": -7, "u": 18446744073709551615}])");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_DOUBLE_EQ(r.value[0].find("i")->as_number(), -7.0);
    EXPECT_EQ(r.value[0].find("u")->kind(), Value::Kind::Number);
}

TEST(RecordSource, EmptyArrayIsAnError) {
    auto r = parse_records("[]", false);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "no objects found in input");
}

// ── Line mode ───────────────────────────────────────────────

TEST(RecordSource, LineModeWrapsEachLine) {
    auto r = parse_records("first\r\nsecond\n\nlast", true);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 4u);
    EXPECT_EQ(r.value[0].find("line")->as_text(), "first");
    EXPECT_EQ(r.value[1].find("line")->as_text(), "second");
    EXPECT_EQ(r.value[2].find("line")->as_text(), "");
    EXPECT_EQ(r.value[3].find("line")->as_text(), "last");
}

TEST(RecordSource, LineModeTrailingNewlineAddsNothing) {
    auto r = parse_records("a\nb\n", true);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 2u);
}

TEST(RecordSource, LineModeEmptyInput) {
    auto r = parse_records("", true);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "no objects found in input");
}

// ── Attributes ──────────────────────────────────────────────

TEST(RecordSource, AllAttributesSortedUnion) {
    auto r = parse_json_records(R"([{"b": 1, "a": 2}, {"c": 3, "a": 4}])");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(all_attributes(r.value), (std::vector<std::string>{"a", "b", "c"}));
}

// ── Input selection ─────────────────────────────────────────

class ReadInputTest : public ::testing::Test {
protected:
    fs::path test_file;

    void SetUp() override {
        test_file = fs::temp_directory_path() / "jpick_read_input_test.json";
        std::ofstream(test_file) << "[{\"a\": 1}]";
    }

    void TearDown() override {
        fs::remove(test_file);
    }
};

TEST_F(ReadInputTest, ReadsFile) {
    std::istringstream in;
    auto r = read_input(test_file.string(), false, in);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "[{\"a\": 1}]");
}

TEST_F(ReadInputTest, ReadsPipedStream) {
    std::istringstream in("one\ntwo\n");
    auto r = read_input("", true, in);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "one\ntwo\n");
}

TEST_F(ReadInputTest, BothSourcesIsAnError) {
    std::istringstream in("x");
    auto r = read_input(test_file.string(), true, in);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "cannot use both stdin and filename input");
}

TEST_F(ReadInputTest, NoSourceIsAnError) {
    std::istringstream in;
    auto r = read_input("", false, in);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "no input provided");
}

TEST_F(ReadInputTest, MissingFile) {
    std::istringstream in;
    auto r = read_input((fs::temp_directory_path() / "jpick_does_not_exist.json").string(), false, in);
    EXPECT_TRUE(r.is_err());
}
