// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h" //The class under test.

#include <gtest/gtest.h>

#include "utils/Coord_t.h"
#include "utils/exceptions.h"

// NOLINTBEGIN(*-magic-numbers)
namespace kerf
{

/*
 * A test fixture with an empty settings object to test with.
 */
class SettingsTest : public testing::Test
{
public:
    Settings settings;
};

TEST_F(SettingsTest, AddSettingString)
{
    const std::string setting_value("pi-nas");
    settings.add("test_setting", setting_value);
    EXPECT_EQ(setting_value, settings.get<std::string>("test_setting"));
}

TEST_F(SettingsTest, AddSettingDouble)
{
    settings.add("test_setting", "1234567.890");
    EXPECT_DOUBLE_EQ(double(1234567.89), settings.get<double>("test_setting"));
}

TEST_F(SettingsTest, AddSettingSizeT)
{
    settings.add("test_setting", "4");
    EXPECT_EQ(size_t(4), settings.get<size_t>("test_setting"));

    settings.add("test_setting", "-1");
    EXPECT_THROW(settings.get<size_t>("test_setting"), exceptions::SettingsException);

    settings.add("test_setting", "3.0");
    EXPECT_EQ(size_t(3), settings.get<size_t>("test_setting"));

    settings.add("test_setting", "2.6");
    EXPECT_THROW(settings.get<size_t>("test_setting"), exceptions::SettingsException);
}

TEST_F(SettingsTest, AddSettingBool)
{
    settings.add("test_setting", "true");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "yes");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "0");
    EXPECT_EQ(false, settings.get<bool>("test_setting")) << "0 should cast to false.";

    settings.add("test_setting", "False");
    EXPECT_EQ(false, settings.get<bool>("test_setting"));
}

TEST_F(SettingsTest, AddSettingCoordT)
{
    settings.add("test_setting", "26.11");
    EXPECT_EQ(coord_t(26110), settings.get<coord_t>("test_setting")) << "Lengths are entered in millimetres, but are converted to micrometres.";

    settings.add("test_setting", "0.01");
    EXPECT_EQ(coord_t(10), settings.get<coord_t>("test_setting"));
}

TEST_F(SettingsTest, AddSettingVector)
{
    settings.add("test_setting", "[28.5, 70.5,130.5]");
    const std::vector<coord_t> holes = settings.get<std::vector<coord_t>>("test_setting");
    const std::vector<coord_t> ground_truth = { 28500, 70500, 130500 };
    EXPECT_EQ(ground_truth, holes);

    settings.add("test_setting", "");
    EXPECT_TRUE(settings.get<std::vector<coord_t>>("test_setting").empty());
}

TEST_F(SettingsTest, RejectsMalformedNumbers)
{
    settings.add("test_setting", "three");
    EXPECT_THROW(settings.get<double>("test_setting"), exceptions::SettingsException);

    settings.add("test_setting", "3mm");
    EXPECT_THROW(settings.get<coord_t>("test_setting"), exceptions::SettingsException);
}

TEST_F(SettingsTest, MissingSettingThrows)
{
    EXPECT_THROW(settings.get<std::string>("finger_width"), exceptions::SettingsException);
    try
    {
        settings.get<coord_t>("finger_width");
    }
    catch (const exceptions::SettingsException& e)
    {
        EXPECT_EQ(std::string(e.what()), "Setting 'finger_width': no value given");
    }
}

TEST_F(SettingsTest, OverwriteSetting)
{
    settings.add("test_setting", "P");
    settings.add("test_setting", "NP");
    ASSERT_NE(settings.get<std::string>("test_setting"), std::string("P")) << "When overriding a setting, the value must be changed.";
    ASSERT_EQ(settings.get<std::string>("test_setting"), std::string("NP"));
}

TEST_F(SettingsTest, Inheritance)
{
    const std::string value = "12.0";
    Settings parent;
    parent.add("test_setting", value);
    parent.add("other_setting", "3.0");
    settings.setParent(&parent);

    EXPECT_EQ(value, settings.get<std::string>("test_setting"));
    EXPECT_FALSE(settings.has("test_setting"));

    const std::string override_value = "10.0";
    settings.add("test_setting", override_value);
    EXPECT_EQ(override_value, settings.get<std::string>("test_setting")) << "The new value overrides the one from the parent.";
    EXPECT_EQ(parent.get<std::string>("test_setting"), value) << "The parent keeps its own value.";

    const std::vector<std::string> keys{ "other_setting", "test_setting" };
    EXPECT_EQ(settings.getKeys(), keys) << "Keys are listed once, even when both containers have them.";
    EXPECT_EQ(settings.getAllSettingsString(), " -s other_setting=\"3.0\" -s test_setting=\"10.0\"");
}

} // namespace kerf
// NOLINTEND(*-magic-numbers)
