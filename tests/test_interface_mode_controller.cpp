#include <gtest/gtest.h>

#include "infrastructure/interface_mode_controller.hpp"
#include "infrastructure/radio_probe.hpp"
#include "support/fake_system.hpp"

using namespace extender;
using namespace extender::testing;
using infrastructure::InterfaceModeController;
using infrastructure::RadioCapabilityProbe;
using namespace std::chrono_literals;

class InterfaceModeControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        radio = std::make_shared<FakeRadio>(sysfs.path());
        radio->add_wireless_interface("wlan0", "b8:27:eb:12:34:56");
        probe = std::make_shared<RadioCapabilityProbe>(radio, sysfs.path().string(), 1000ms);
    }

    std::unique_ptr<InterfaceModeController> make_controller()
    {
        auto controller = std::make_unique<InterfaceModeController>(radio, probe, probe->probe("wlan0"),
                                                                    1000ms, 50ms);
        controller->set_mode_listener([this](core::InterfaceMode mode, bool present)
                                      { reports.push_back({mode, present}); });
        return controller;
    }

    TempDir sysfs;
    std::shared_ptr<FakeRadio> radio;
    std::shared_ptr<RadioCapabilityProbe> probe;
    std::vector<std::pair<core::InterfaceMode, bool>> reports;
};

TEST_F(InterfaceModeControllerTest, StartsFromObservedMode)
{
    radio->force_type("wlan0", "managed", true);

    auto controller = make_controller();

    EXPECT_EQ(controller->current_mode(), core::InterfaceMode::STATION);
    EXPECT_FALSE(controller->ap_interface_present());
    EXPECT_EQ(controller->ap_interface_name(), "wlan0_ap0");
}

TEST_F(InterfaceModeControllerTest, DownToStation)
{
    auto controller = make_controller();

    auto outcome = controller->request_mode(core::InterfaceMode::STATION);

    ASSERT_TRUE(outcome) << outcome.message;
    EXPECT_EQ(controller->current_mode(), core::InterfaceMode::STATION);
    EXPECT_TRUE(radio->ran("iw dev wlan0 set type managed"));
    EXPECT_TRUE(radio->is_up("wlan0"));
    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.back().first, core::InterfaceMode::STATION);
}

TEST_F(InterfaceModeControllerTest, RequestingCurrentModeIsANoOp)
{
    radio->force_type("wlan0", "managed", true);
    auto controller = make_controller();
    radio->clear_commands();

    EXPECT_TRUE(controller->request_mode(core::InterfaceMode::STATION));
    EXPECT_TRUE(radio->commands().empty());
}

TEST_F(InterfaceModeControllerTest, ConcurrentRadioSwitchesWithoutTakingLinkDown)
{
    radio->force_type("wlan0", "managed", true);
    auto controller = make_controller();
    radio->clear_commands();

    ASSERT_TRUE(controller->request_mode(core::InterfaceMode::ACCESS_POINT));

    EXPECT_EQ(controller->current_mode(), core::InterfaceMode::ACCESS_POINT);
    EXPECT_FALSE(radio->ran("ip link set dev wlan0 down"));
    EXPECT_TRUE(radio->ran("iw dev wlan0 set type __ap"));
}

TEST_F(InterfaceModeControllerTest, FailedTransitionRollsBack)
{
    radio->force_type("wlan0", "managed", true);
    auto controller = make_controller();
    radio->fail("iw dev wlan0 set type __ap", "command failed: Device or resource busy (-16)");

    auto outcome = controller->request_mode(core::InterfaceMode::ACCESS_POINT);

    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.reason, core::ReasonCode::MODE_TRANSITION_FAILED);
    EXPECT_NE(outcome.message.find("Device or resource busy"), std::string::npos);
    EXPECT_EQ(controller->current_mode(), core::InterfaceMode::STATION);
    EXPECT_TRUE(radio->is_up("wlan0"));
    EXPECT_EQ(probe->current_mode("wlan0"), core::InterfaceMode::STATION);
}

TEST_F(InterfaceModeControllerTest, RollbackToStationReattachesApInterface)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->request_mode(core::InterfaceMode::STATION));
    ASSERT_TRUE(controller->attach_ap_interface());
    radio->fail("iw dev wlan0 set type __ap", "command failed: Device or resource busy (-16)");

    auto outcome = controller->request_mode(core::InterfaceMode::ACCESS_POINT);

    EXPECT_EQ(outcome.reason, core::ReasonCode::MODE_TRANSITION_FAILED);
    EXPECT_EQ(controller->current_mode(), core::InterfaceMode::STATION);
    EXPECT_EQ(radio->count("iw dev wlan0 interface add wlan0_ap0"), 2u);
    EXPECT_TRUE(radio->exists("wlan0_ap0"));
    EXPECT_TRUE(controller->ap_interface_present());
    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.back(), std::make_pair(core::InterfaceMode::STATION, true));
}

TEST_F(InterfaceModeControllerTest, UnverifiedTransitionFails)
{
    radio->force_type("wlan0", "managed", true);
    auto controller = make_controller();
    radio->respond("iw dev wlan0 info", "Interface wlan0\n\ttype managed\n");

    auto outcome = controller->request_mode(core::InterfaceMode::ACCESS_POINT);

    EXPECT_EQ(outcome.reason, core::ReasonCode::MODE_TRANSITION_FAILED);
    EXPECT_NE(outcome.message.find("verification timed out"), std::string::npos);
    EXPECT_EQ(controller->current_mode(), core::InterfaceMode::STATION);
}

TEST_F(InterfaceModeControllerTest, UnsupportedModeIsIncompatible)
{
    radio->respond("iw phy phy0 info",
                   "\tSupported interface modes:\n\t\t * managed\n\t\t * AP\n");
    auto identity = probe->probe("wlan0");
    identity.supported_modes.erase(core::InterfaceMode::ACCESS_POINT);
    InterfaceModeController controller(radio, probe, identity, 1000ms, 50ms);

    auto outcome = controller.request_mode(core::InterfaceMode::ACCESS_POINT);

    EXPECT_EQ(outcome.reason, core::ReasonCode::INCOMPATIBLE_MODE);
}

TEST_F(InterfaceModeControllerTest, AttachAndDetachApInterface)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->request_mode(core::InterfaceMode::STATION));

    ASSERT_TRUE(controller->attach_ap_interface());

    EXPECT_TRUE(controller->ap_interface_present());
    EXPECT_TRUE(radio->exists("wlan0_ap0"));
    EXPECT_TRUE(radio->ran("iw dev wlan0 interface add wlan0_ap0 type __ap"));
    EXPECT_TRUE(radio->ran("ip link set dev wlan0_ap0 address ba:27:eb:12:34:56"));
    EXPECT_TRUE(reports.back().second);

    ASSERT_TRUE(controller->detach_ap_interface());
    EXPECT_FALSE(controller->ap_interface_present());
    EXPECT_FALSE(radio->exists("wlan0_ap0"));
}

TEST_F(InterfaceModeControllerTest, AttachRequiresStationMode)
{
    auto controller = make_controller();

    auto outcome = controller->attach_ap_interface();

    EXPECT_EQ(outcome.reason, core::ReasonCode::INCOMPATIBLE_MODE);
    EXPECT_FALSE(radio->ran("iw dev wlan0 interface add"));
}

TEST_F(InterfaceModeControllerTest, AttachRefusedOnExclusiveRadio)
{
    radio->set_concurrent(false);
    auto controller = make_controller();
    ASSERT_TRUE(controller->request_mode(core::InterfaceMode::STATION));

    auto outcome = controller->attach_ap_interface();

    EXPECT_EQ(outcome.reason, core::ReasonCode::INCOMPATIBLE_MODE);
}

TEST_F(InterfaceModeControllerTest, PartialAttachIsCleanedUp)
{
    auto controller = make_controller();
    ASSERT_TRUE(controller->request_mode(core::InterfaceMode::STATION));
    radio->fail("ip link set dev wlan0_ap0 address");

    auto outcome = controller->attach_ap_interface();

    EXPECT_EQ(outcome.reason, core::ReasonCode::MODE_TRANSITION_FAILED);
    EXPECT_FALSE(controller->ap_interface_present());
    EXPECT_FALSE(radio->exists("wlan0_ap0"));
}

TEST_F(InterfaceModeControllerTest, LeftoverSubInterfaceIsAdoptedAndRemovedBeforeApMode)
{
    radio->force_type("wlan0", "managed", true);
    radio->run({"iw", "dev", "wlan0", "interface", "add", "wlan0_ap0", "type", "__ap"}, 1000ms);

    auto controller = make_controller();
    EXPECT_TRUE(controller->ap_interface_present());

    ASSERT_TRUE(controller->request_mode(core::InterfaceMode::ACCESS_POINT));
    EXPECT_FALSE(radio->exists("wlan0_ap0"));
    EXPECT_FALSE(controller->ap_interface_present());
}

TEST(InterfaceModeControllerNamingTest, DerivedMacIsLocallyAdministered)
{
    EXPECT_EQ(InterfaceModeController::derive_ap_mac("b8:27:eb:12:34:56"), "ba:27:eb:12:34:56");
    EXPECT_EQ(InterfaceModeController::derive_ap_mac("02:00:00:00:00:10"), "02:00:00:00:00:11");
    EXPECT_EQ(InterfaceModeController::derive_ap_mac("not-a-mac"), "");
}

TEST(InterfaceModeControllerNamingTest, SubInterfaceNameFitsIfnamsiz)
{
    EXPECT_EQ(InterfaceModeController::make_ap_interface_name("wlan0"), "wlan0_ap0");
    auto name = InterfaceModeController::make_ap_interface_name("wlx00c0ca123456");
    EXPECT_EQ(name.size(), 15u);
    EXPECT_EQ(name, "wlx00c0ca12_ap0");
}
