#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "ProcessingOptions.h"

using namespace PureVision;
using json = nlohmann::json;

namespace {

std::string writeTemp(const std::string& name, const std::string& text) {
    const std::string path = testing::TempDir() + name;
    std::ofstream o(path);
    o << text;
    return path;
}

} // namespace

TEST(ProcessingOptions, DefaultsAreValid) {
    const ProcessingOptions o;
    EXPECT_EQ(o.tolerance, 20);
    EXPECT_EQ(o.smoothness, 30);
    EXPECT_EQ(toHexString(o.targetColor), "#ffffff");
    EXPECT_EQ(o.brushSize, 20);
    EXPECT_TRUE(o.autoDetect);
    EXPECT_NO_THROW(o.validate());
}

TEST(ProcessingOptions, ValidateRejectsOutOfDomainValues) {
    ProcessingOptions o;
    o.tolerance = -1;
    EXPECT_THROW(o.validate(), std::invalid_argument);

    o = ProcessingOptions();
    o.smoothness = -3;
    EXPECT_THROW(o.validate(), std::invalid_argument);

    o = ProcessingOptions();
    o.brushSize = 0;
    EXPECT_THROW(o.validate(), std::invalid_argument);
}

TEST(ProcessingOptions, ZeroSmoothnessAndLargeToleranceAreAccepted) {
    ProcessingOptions o;
    o.smoothness = 0;
    o.tolerance = 1000;
    EXPECT_NO_THROW(o.validate());
}

TEST(ProcessingOptions, JsonUsesHexColor) {
    ProcessingOptions o;
    o.targetColor = {1, 2, 255};
    o.autoDetect = false;
    const json j = o;
    EXPECT_EQ(j.at("targetColor").get<std::string>(), "#0102ff");
    EXPECT_FALSE(j.at("autoDetect").get<bool>());
    EXPECT_EQ(j.at("tolerance").get<int>(), 20);
}

TEST(ProcessingOptions, KeyParametersSnapshot) {
    ProcessingOptions o;
    o.targetColor = {9, 8, 7};
    o.tolerance = 3;
    o.smoothness = 4;
    const KeyParameters p = o.keyParameters();
    o.tolerance = 99;
    EXPECT_EQ(p.tolerance, 3);
    EXPECT_EQ(p.smoothness, 4);
    EXPECT_EQ(p.targetColor.r, 9);
}

TEST(LoadOptionsFile, MissingKeysKeepDefaults) {
    const std::string path = writeTemp("pv_partial.json", R"({"tolerance": 55, "targetColor": "#102030"})");
    const ProcessingOptions o = loadOptionsFile(path);
    EXPECT_EQ(o.tolerance, 55);
    EXPECT_EQ(o.smoothness, 30);
    EXPECT_EQ(o.targetColor.r, 0x10);
    EXPECT_EQ(o.targetColor.g, 0x20);
    EXPECT_EQ(o.targetColor.b, 0x30);
    EXPECT_TRUE(o.autoDetect);
    std::remove(path.c_str());
}

TEST(LoadOptionsFile, RejectsBadFiles) {
    EXPECT_THROW(loadOptionsFile(testing::TempDir() + "pv_does_not_exist.json"), std::invalid_argument);

    const std::string syntax = writeTemp("pv_syntax.json", "{ tolerance: ");
    EXPECT_THROW(loadOptionsFile(syntax), std::invalid_argument);

    const std::string color = writeTemp("pv_color.json", R"({"targetColor": "white"})");
    EXPECT_THROW(loadOptionsFile(color), std::invalid_argument);

    const std::string negative = writeTemp("pv_negative.json", R"({"tolerance": -4})");
    EXPECT_THROW(loadOptionsFile(negative), std::invalid_argument);

    const std::string type = writeTemp("pv_type.json", R"({"smoothness": "soft"})");
    EXPECT_THROW(loadOptionsFile(type), std::invalid_argument);

    for (const auto& p : {syntax, color, negative, type}) std::remove(p.c_str());
}
