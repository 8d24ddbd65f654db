#include <gtest/gtest.h>
#include "../shared/cpp/filebatch_core/include/batch.hpp"
#include "../shared/cpp/filebatch_core/include/command.hpp"
#include "../shared/cpp/filebatch_core/include/errors.hpp"
#include <limits>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

TEST(Command, NamesRoundTripForAllSix) {
    for (Command c : all_commands()) {
        auto parsed = parse_command(command_name(c));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, c);
    }
    EXPECT_FALSE(parse_command("delete").has_value());
    EXPECT_FALSE(parse_command("COPY").has_value());
}

TEST(Command, ExecuteUnboundCommandThrows) {
    CommandSet set;
    EXPECT_FALSE(set.bound(Command::Zip));
    EXPECT_THROW(set.execute(Command::Zip, json::object(), json::object()), std::runtime_error);
}

TEST(ParseBatch, KeepsSubmissionOrder) {
    auto commands = ordered_json::parse(R"({
        "zip": {"items": [{"source": "a"}]},
        "del": {"items": [{"source": "b"}]},
        "copy": {"items": []}
    })");
    auto batch = parse_batch(commands);
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(batch[0].name, "zip");
    EXPECT_EQ(batch[1].name, "del");
    EXPECT_EQ(batch[2].name, "copy");
}

TEST(ParseBatch, MissingItemsAndOptionsDefaultToEmpty) {
    auto batch = parse_batch(ordered_json::parse(R"({"copy": {}, "move": null})"));
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_TRUE(batch[0].items.is_array());
    EXPECT_TRUE(batch[0].items.empty());
    EXPECT_TRUE(batch[0].options.is_object());
    EXPECT_TRUE(batch[1].items.empty());
}

TEST(ParseBatch, UnknownCommandsAreNotValidated) {
    auto batch = parse_batch(ordered_json::parse(R"({"chmod": 42, "copy": {"items": [1]}})"));
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].name, "chmod");
}

TEST(ParseBatch, RejectsMalformedEntries) {
    EXPECT_THROW(parse_batch(ordered_json::parse(R"([1, 2])")), BatchConfigError);
    EXPECT_THROW(parse_batch(ordered_json::parse(R"({"copy": "a"})")), BatchConfigError);
    EXPECT_THROW(parse_batch(ordered_json::parse(R"({"copy": {"items": {"a": 1}}})")), BatchConfigError);
    EXPECT_THROW(parse_batch(ordered_json::parse(R"({"copy": {"items": [], "options": [1]}})")), BatchConfigError);
}

TEST(MergeOptions, CommandOptionsWinKeyByKey) {
    json global = {{"parallel", 4}, {"cache", true}, {"context", "/tmp"}};
    json local = {{"cache", false}, {"extra", "x"}};
    json merged = merge_options(global, local);
    EXPECT_EQ(merged["parallel"], 4);
    EXPECT_EQ(merged["cache"], false);
    EXPECT_EQ(merged["context"], "/tmp");
    EXPECT_EQ(merged["extra"], "x");
}

TEST(MergeOptions, IsShallow) {
    json global = {{"nested", {{"a", 1}, {"b", 2}}}};
    json local = {{"nested", {{"a", 3}}}};
    json merged = merge_options(global, local);
    EXPECT_EQ(merged["nested"], json({{"a", 3}}));
}

TEST(ResolveWorkers, FalsyMeansSequential) {
    EXPECT_EQ(resolve_workers(json::object()), 0u);
    EXPECT_EQ(resolve_workers({{"parallel", 0}}), 0u);
    EXPECT_EQ(resolve_workers({{"parallel", false}}), 0u);
    EXPECT_EQ(resolve_workers({{"parallel", nullptr}}), 0u);
    EXPECT_EQ(resolve_workers({{"parallel", 3}}), 3u);
    EXPECT_GE(resolve_workers({{"parallel", true}}), 1u);
}

TEST(ResolveWorkers, RejectsNegativeAndNonNumeric) {
    EXPECT_THROW(resolve_workers({{"parallel", -1}}), BatchConfigError);
    EXPECT_THROW(resolve_workers({{"parallel", "4"}}), BatchConfigError);
    EXPECT_THROW(resolve_workers({{"parallel", 1.5}}), BatchConfigError);
}

TEST(ResolveWorkers, ClampsCountsAboveUnsignedRange) {
    const unsigned max = std::numeric_limits<unsigned>::max();
    EXPECT_EQ(resolve_workers(json::parse(R"({"parallel": 4294967296})")), max);
    EXPECT_EQ(resolve_workers({{"parallel", 4294967296LL}}), max);
    EXPECT_EQ(resolve_workers(json::parse(R"({"parallel": 18446744073709551615})")), max);
    EXPECT_EQ(resolve_workers(json::parse(R"({"parallel": 4294967295})")), max);
}

TEST(OptionFlag, DefaultsAndValidation) {
    EXPECT_TRUE(option_flag(json::object(), "cache", true));
    EXPECT_FALSE(option_flag({{"cache", false}}, "cache", true));
    EXPECT_THROW(option_flag({{"cache", "no"}}, "cache", true), BatchConfigError);
}
