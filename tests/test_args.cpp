#include <gtest/gtest.h>
#include <cli/args.hpp>
#include <records/record_source.hpp>

TEST(Args, ParsesFlags) {
    auto o = parse_args({"data.json", "-d", "name", "-d", "id", "-o", "id", "-s", "|", "-t", "-T"});
    EXPECT_EQ(o.filename, "data.json");
    EXPECT_EQ(o.display_attrs, (std::vector<std::string>{"name", "id"}));
    EXPECT_EQ(o.output_attr, "id");
    ASSERT_TRUE(o.separator.has_value());
    EXPECT_EQ(*o.separator, "|");
    EXPECT_TRUE(o.truncate);
    EXPECT_TRUE(o.table_mode);
    EXPECT_FALSE(o.line_mode);
}

TEST(Args, TrailingValueFlagIgnored) {
    auto o = parse_args({"-d"});
    EXPECT_TRUE(o.display_attrs.empty());
}

TEST(Args, UnknownDashArgumentsIgnored) {
    auto o = parse_args({"-x", "--weird", "file.json"});
    EXPECT_EQ(o.filename, "file.json");
}

TEST(Args, HelpAndVersion) {
    EXPECT_TRUE(parse_args({"-h"}).help);
    EXPECT_TRUE(parse_args({"--help"}).help);
    EXPECT_TRUE(parse_args({"--version"}).version);
}

// ── Validation ──────────────────────────────────────────────

TEST(Args, AllAttrsConflictsWithDisplay) {
    auto r = validate_options(parse_args({"-a", "-d", "x"}));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "cannot use both -a and -d");
}

TEST(Args, LineModeConflicts) {
    EXPECT_EQ(validate_options(parse_args({"-l", "-d", "x"})).error, "cannot use -d in line mode");
    EXPECT_EQ(validate_options(parse_args({"-l", "-a"})).error, "cannot use -a in line mode");
    EXPECT_EQ(validate_options(parse_args({"-l", "-o", "x"})).error, "cannot use -o in line mode");
    EXPECT_EQ(validate_options(parse_args({"-l", "-s", ","})).error, "cannot use -s in line mode");
    EXPECT_EQ(validate_options(parse_args({"-l", "-t"})).error, "cannot use -t in line mode");
    EXPECT_EQ(validate_options(parse_args({"-l", "-T"})).error, "cannot use -T in line mode");
    EXPECT_TRUE(validate_options(parse_args({"-l"})).is_ok());
}

// ── Session plan ────────────────────────────────────────────

TEST(Args, LineModePlan) {
    auto records = parse_records("a\nb\n", true).value;
    PickerSettings settings;
    settings.truncate = true;
    SessionPlan plan = build_plan(parse_args({"-l"}), settings, records);
    EXPECT_EQ(plan.spec.fields, (std::vector<std::string>{"line"}));
    EXPECT_EQ(plan.output_attr, "line");
    EXPECT_FALSE(plan.spec.truncate);
}

TEST(Args, AllAttrsPlan) {
    auto records = parse_records(R"([{"b": 1}, {"a": 2}])", false).value;
    SessionPlan plan = build_plan(parse_args({"-a"}), PickerSettings{}, records);
    EXPECT_EQ(plan.spec.fields, (std::vector<std::string>{"a", "b"}));
}

TEST(Args, SettingsFillUnsetFlags) {
    auto records = parse_records(R"([{"a": 1}])", false).value;
    PickerSettings settings;
    settings.separator = " / ";
    settings.table_mode = true;

    SessionPlan plan = build_plan(parse_args({"-d", "a"}), settings, records);
    EXPECT_EQ(plan.spec.separator, " / ");
    EXPECT_TRUE(plan.spec.table_mode);

    plan = build_plan(parse_args({"-d", "a", "-s", ","}), settings, records);
    EXPECT_EQ(plan.spec.separator, ",");
}
