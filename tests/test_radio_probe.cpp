#include <gtest/gtest.h>

#include "infrastructure/radio_probe.hpp"
#include "core/errors.hpp"
#include "support/fake_system.hpp"

using namespace extender;
using namespace extender::testing;
using infrastructure::RadioCapabilityProbe;
using namespace std::chrono_literals;

class RadioProbeTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        radio = std::make_shared<FakeRadio>(sysfs.path());
        probe = std::make_unique<RadioCapabilityProbe>(radio, sysfs.path().string(), 1000ms);
    }

    core::ReasonCode probe_failure(const std::string &name)
    {
        try
        {
            probe->probe(name);
        }
        catch (const core::ExtenderError &e)
        {
            return e.reason();
        }
        return core::ReasonCode::NONE;
    }

    TempDir sysfs;
    std::shared_ptr<FakeRadio> radio;
    std::unique_ptr<RadioCapabilityProbe> probe;
};

TEST_F(RadioProbeTest, DescribesConcurrentRadio)
{
    radio->add_wireless_interface("wlan0", "b8:27:eb:12:34:56", "phy0");

    auto identity = probe->probe("wlan0");

    EXPECT_EQ(identity.interface_name, "wlan0");
    EXPECT_EQ(identity.mac_address, "b8:27:eb:12:34:56");
    EXPECT_EQ(identity.phy, "phy0");
    EXPECT_EQ(identity.driver, "unknown");
    EXPECT_TRUE(identity.supports(core::InterfaceMode::STATION));
    EXPECT_TRUE(identity.supports(core::InterfaceMode::ACCESS_POINT));
    EXPECT_TRUE(identity.supports_concurrent);
    EXPECT_TRUE(radio->ran("iw phy phy0 info"));
}

TEST_F(RadioProbeTest, SingleChannelExclusiveRadioIsNotConcurrent)
{
    radio->add_wireless_interface("wlan0");
    radio->set_concurrent(false);

    auto identity = probe->probe("wlan0");

    EXPECT_FALSE(identity.supports_concurrent);
}

TEST_F(RadioProbeTest, MissingInterface)
{
    EXPECT_EQ(probe_failure("wlan9"), core::ReasonCode::NO_SUCH_INTERFACE);
    EXPECT_EQ(probe_failure(""), core::ReasonCode::NO_SUCH_INTERFACE);
}

TEST_F(RadioProbeTest, WiredInterfaceIsUnsupported)
{
    radio->add_plain_interface("eth0");

    EXPECT_EQ(probe_failure("eth0"), core::ReasonCode::UNSUPPORTED_HARDWARE);
}

TEST_F(RadioProbeTest, RadioWithoutApModeIsUnsupported)
{
    radio->add_wireless_interface("wlan0");
    radio->respond("iw phy phy0 info",
                   "Wiphy phy0\n"
                   "\tSupported interface modes:\n"
                   "\t\t * IBSS\n"
                   "\t\t * managed\n"
                   "\t\t * monitor\n");

    EXPECT_EQ(probe_failure("wlan0"), core::ReasonCode::UNSUPPORTED_HARDWARE);
}

TEST_F(RadioProbeTest, FailingIwIsUnsupported)
{
    radio->add_wireless_interface("wlan0");
    radio->fail("iw phy");

    EXPECT_EQ(probe_failure("wlan0"), core::ReasonCode::UNSUPPORTED_HARDWARE);
}

TEST_F(RadioProbeTest, CurrentModeFollowsFlagsAndType)
{
    radio->add_wireless_interface("wlan0");

    EXPECT_EQ(probe->current_mode("wlan0"), core::InterfaceMode::DOWN);

    radio->force_type("wlan0", "managed", true);
    EXPECT_EQ(probe->current_mode("wlan0"), core::InterfaceMode::STATION);

    radio->force_type("wlan0", "AP", true);
    EXPECT_EQ(probe->current_mode("wlan0"), core::InterfaceMode::ACCESS_POINT);

    EXPECT_FALSE(probe->current_mode("wlan9").has_value());
}

TEST_F(RadioProbeTest, FindsOnlySuitableInterfacesInOrder)
{
    radio->add_wireless_interface("wlan1", "b8:27:eb:00:00:01");
    radio->add_wireless_interface("wlan0", "b8:27:eb:00:00:00");
    radio->add_plain_interface("eth0");

    auto interfaces = probe->find_suitable_interfaces();

    ASSERT_EQ(interfaces.size(), 2u);
    EXPECT_EQ(interfaces[0], "wlan0");
    EXPECT_EQ(interfaces[1], "wlan1");
}

TEST(PhyInfoParserTest, SharedGroupWithRoomForTwo)
{
    auto capabilities = RadioCapabilityProbe::parse_phy_info(
        "\tSupported interface modes:\n"
        "\t\t * managed\n"
        "\t\t * AP\n"
        "\tvalid interface combinations:\n"
        "\t\t * #{ managed, AP } <= 2,\n"
        "\t\t   total <= 2, #channels <= 1\n");

    EXPECT_TRUE(capabilities.concurrent);
    EXPECT_EQ(capabilities.modes.size(), 2u);
}

TEST(PhyInfoParserTest, NoCombinationsMeansNoConcurrency)
{
    auto capabilities = RadioCapabilityProbe::parse_phy_info(
        "\tSupported interface modes:\n"
        "\t\t * managed\n"
        "\t\t * AP\n"
        "\tBand 1:\n");

    EXPECT_FALSE(capabilities.concurrent);
}

TEST(PhyInfoParserTest, InterfaceType)
{
    EXPECT_EQ(RadioCapabilityProbe::parse_interface_type("Interface wlan0\n\ttype managed\n"),
              core::InterfaceMode::STATION);
    EXPECT_EQ(RadioCapabilityProbe::parse_interface_type("\ttype AP\n"), core::InterfaceMode::ACCESS_POINT);
    EXPECT_FALSE(RadioCapabilityProbe::parse_interface_type("\ttype monitor\n").has_value());
}
