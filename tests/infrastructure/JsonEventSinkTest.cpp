#include "infrastructure/JsonEventSink.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace amm::domain;
using amm::infrastructure::JsonEventSink;

TEST(JsonEventSink, EncodesAssetRegistered) {
    auto obj = JsonEventSink::to_json(AssetRegistered{{1}, Asset("X")});

    EXPECT_EQ(obj["event"].get<std::string>(), "asset_registered");
    EXPECT_EQ(obj["sequence_number"].get<uint64_t>(), 1u);
    EXPECT_EQ(obj["asset"].get<std::string>(), "X");
}

TEST(JsonEventSink, EncodesPairCreatedWithCanonicalSides) {
    auto obj = JsonEventSink::to_json(PairCreated{
        {2}, PairKey::of(Asset("Y"), Asset("X")), Account("alice"), Amount(1000), Amount(2000)});

    EXPECT_EQ(obj["event"].get<std::string>(), "pair_created");
    EXPECT_EQ(obj["asset_low"].get<std::string>(), "X");
    EXPECT_EQ(obj["asset_high"].get<std::string>(), "Y");
    EXPECT_EQ(obj["creator"].get<std::string>(), "alice");
    EXPECT_EQ(obj["reserve_low"].get<std::string>(), "1000");
    EXPECT_EQ(obj["reserve_high"].get<std::string>(), "2000");
}

TEST(JsonEventSink, EncodesLargeAmountsAsStrings) {
    auto max = Amount::from_string(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935");
    auto obj = JsonEventSink::to_json(SwapExecuted{
        {9}, PairKey::of(Asset("X"), Asset("Y")), Account("bob"),
        Amount::zero(), max, Amount(7), Amount::zero()});

    EXPECT_EQ(obj["event"].get<std::string>(), "swap_executed");
    EXPECT_EQ(obj["caller"].get<std::string>(), "bob");
    EXPECT_EQ(obj["amount_high_in"].get<std::string>(), max.to_string());
    EXPECT_EQ(obj["amount_low_out"].get<std::string>(), "7");
    EXPECT_EQ(obj["amount_low_in"].get<std::string>(), "0");
}

TEST(JsonEventSink, WritesOneObjectPerLine) {
    std::ostringstream out;
    JsonEventSink sink(out);

    sink.asset_registered(AssetRegistered{{1}, Asset("X")});
    sink.asset_registered(AssetRegistered{{2}, Asset("Y")});

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(json::parse(line));
    }

    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["asset"].get<std::string>(), "X");
    EXPECT_EQ(parsed[1]["sequence_number"].get<uint64_t>(), 2u);
}
