#include <gtest/gtest.h>

#include "infrastructure/upstream_connection_manager.hpp"
#include "core/errors.hpp"
#include "support/fake_system.hpp"

using namespace extender;
using namespace extender::testing;
using infrastructure::ReconnectPolicy;
using infrastructure::UpstreamConnectionManager;
using infrastructure::UpstreamSettings;
using namespace std::chrono_literals;

class UpstreamConnectionManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        radio = std::make_shared<FakeRadio>(dir / "sys");
        radio->add_wireless_interface("wlan0");
        launcher = std::make_shared<FakeProcessLauncher>();
        clock = std::make_shared<FakeClock>();

        profile.ssid = "HomeNetwork";
        profile.security = core::SecurityType::WPA2_PSK;
        profile.passphrase = "correct horse";
    }

    std::unique_ptr<UpstreamConnectionManager> make_manager(int max_attempts = 3)
    {
        UpstreamSettings settings;
        settings.interface_name = "wlan0";
        settings.runtime_dir = (dir / "run").string();
        settings.association_timeout = 50ms;
        settings.dhcp_client_timeout = 100ms;
        auto manager = std::make_unique<UpstreamConnectionManager>(
            radio, launcher, clock, settings, ReconnectPolicy(1000ms, 8000ms, max_attempts));
        manager->set_state_listener([this](const core::ConnectionState &state, core::ReasonCode reason)
                                    { transitions.push_back({state, reason}); });
        return manager;
    }

    TempDir dir;
    std::shared_ptr<FakeRadio> radio;
    std::shared_ptr<FakeProcessLauncher> launcher;
    std::shared_ptr<FakeClock> clock;
    core::UpstreamProfile profile;
    std::vector<std::pair<core::ConnectionState, core::ReasonCode>> transitions;
};

TEST_F(UpstreamConnectionManagerTest, ConnectsThroughSupplicantAndDhclient)
{
    launcher->script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();

    auto outcome = manager->connect(profile);

    ASSERT_TRUE(outcome) << outcome.message;
    EXPECT_EQ(manager->current_state().kind, core::ConnectionStateKind::CONNECTED);
    EXPECT_EQ(manager->current_state().attempt, 0);
    EXPECT_TRUE(radio->ran("dhclient -1 -v wlan0"));

    auto argv = launcher->last_argv("wpa_supplicant");
    ASSERT_EQ(argv.size(), 7u);
    EXPECT_EQ(argv[2], "wlan0");
    auto conf = read_file(argv[4]);
    EXPECT_NE(conf.find("key_mgmt=WPA-PSK"), std::string::npos);
    EXPECT_EQ(conf.find("correct horse"), std::string::npos);

    ASSERT_GE(transitions.size(), 2u);
    EXPECT_EQ(transitions.front().first.kind, core::ConnectionStateKind::ASSOCIATING);
    EXPECT_EQ(transitions.back().first.kind, core::ConnectionStateKind::CONNECTED);
}

TEST_F(UpstreamConnectionManagerTest, WrongKeyFailsWithoutAutoReconnect)
{
    launcher->script("wpa_supplicant", supplicant_wrong_key());
    auto manager = make_manager();

    auto outcome = manager->connect(profile);

    EXPECT_EQ(outcome.reason, core::ReasonCode::ASSOCIATION_FAILED);
    EXPECT_EQ(manager->current_state().kind, core::ConnectionStateKind::DISCONNECTED);
    EXPECT_FALSE(launcher->alive("wpa_supplicant"));
    EXPECT_FALSE(radio->ran("dhclient -1"));
}

TEST_F(UpstreamConnectionManagerTest, AssociationTimeout)
{
    launcher->script("wpa_supplicant", std::vector<std::string>{"Successfully initialized wpa_supplicant"});
    auto manager = make_manager();

    auto outcome = manager->connect(profile);

    EXPECT_EQ(outcome.reason, core::ReasonCode::ASSOCIATION_FAILED);
    EXPECT_NE(outcome.message.find("no association"), std::string::npos);
}

TEST_F(UpstreamConnectionManagerTest, SupplicantThatCannotStart)
{
    FakeProcessLauncher::Script script;
    script.fail_spawn = true;
    launcher->script("wpa_supplicant", script);
    auto manager = make_manager();

    EXPECT_EQ(manager->connect(profile).reason, core::ReasonCode::ASSOCIATION_FAILED);
}

TEST_F(UpstreamConnectionManagerTest, AddressAcquisitionFailures)
{
    launcher->default_script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();

    radio->fail("dhclient -1", "", 1);
    EXPECT_EQ(manager->connect(profile).reason, core::ReasonCode::ADDRESS_ACQUISITION_FAILED);

    radio->set_upstream_address(false);
    auto outcome = manager->connect(profile);
    EXPECT_EQ(outcome.reason, core::ReasonCode::ADDRESS_ACQUISITION_FAILED);
    EXPECT_NE(outcome.message.find("no IPv4 address"), std::string::npos);
}

TEST_F(UpstreamConnectionManagerTest, FailuresBackOffExponentially)
{
    launcher->default_script("wpa_supplicant", supplicant_wrong_key());
    auto manager = make_manager(3);
    manager->set_auto_reconnect(true);

    manager->connect(profile);
    auto state = manager->current_state();
    EXPECT_EQ(state.kind, core::ConnectionStateKind::RECONNECTING);
    EXPECT_EQ(state.attempt, 1);
    EXPECT_EQ(state.backoff, 1000ms);

    EXPECT_FALSE(manager->reconnect_due(clock->now()));
    clock->advance(999ms);
    EXPECT_FALSE(manager->reconnect_due(clock->now()));
    clock->advance(1ms);
    EXPECT_TRUE(manager->reconnect_due(clock->now()));

    manager->reconnect();
    EXPECT_EQ(manager->current_state().attempt, 2);
    EXPECT_EQ(manager->current_state().backoff, 2000ms);
}

TEST_F(UpstreamConnectionManagerTest, ExhaustedRetriesAreUnrecoverable)
{
    launcher->default_script("wpa_supplicant", supplicant_wrong_key());
    auto manager = make_manager(2);
    manager->set_auto_reconnect(true);

    manager->connect(profile);
    manager->reconnect();
    auto outcome = manager->reconnect();

    EXPECT_EQ(outcome.reason, core::ReasonCode::UPSTREAM_UNRECOVERABLE);
    auto state = manager->current_state();
    EXPECT_TRUE(state.unrecoverable);
    EXPECT_EQ(state.kind, core::ConnectionStateKind::DISCONNECTED);
    EXPECT_FALSE(manager->reconnect_due(clock->now() + 1h));
    EXPECT_EQ(transitions.back().second, core::ReasonCode::UPSTREAM_UNRECOVERABLE);

    manager->reset_reconnect();
    EXPECT_FALSE(manager->current_state().unrecoverable);
    EXPECT_EQ(manager->current_state().attempt, 0);
}

TEST_F(UpstreamConnectionManagerTest, SuccessResetsAttemptCounter)
{
    launcher->script("wpa_supplicant", supplicant_wrong_key());
    launcher->script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();
    manager->set_auto_reconnect(true);

    manager->connect(profile);
    ASSERT_EQ(manager->current_state().attempt, 1);

    ASSERT_TRUE(manager->reconnect());
    EXPECT_EQ(manager->current_state().attempt, 0);
    EXPECT_EQ(manager->current_state().backoff, 0ms);
}

TEST_F(UpstreamConnectionManagerTest, LinkLossSchedulesReconnect)
{
    launcher->script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();
    manager->set_auto_reconnect(true);
    ASSERT_TRUE(manager->connect(profile));

    launcher->emit("wpa_supplicant", "wlan0: CTRL-EVENT-DISCONNECTED bssid=aa:bb:cc:dd:ee:ff reason=4");

    auto state = manager->current_state();
    EXPECT_EQ(state.kind, core::ConnectionStateKind::RECONNECTING);
    EXPECT_EQ(state.attempt, 1);
    EXPECT_EQ(transitions.back().second, core::ReasonCode::ASSOCIATION_FAILED);
}

TEST_F(UpstreamConnectionManagerTest, SupplicantExitWithoutAutoReconnectDisconnects)
{
    launcher->script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(profile));

    launcher->exit("wpa_supplicant");

    EXPECT_EQ(manager->current_state().kind, core::ConnectionStateKind::DISCONNECTED);
}

TEST_F(UpstreamConnectionManagerTest, DisconnectStopsSupplicantAndReleasesLease)
{
    launcher->script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(profile));

    ASSERT_TRUE(manager->disconnect());

    EXPECT_FALSE(launcher->alive("wpa_supplicant"));
    EXPECT_TRUE(radio->ran("dhclient -r wlan0"));
    EXPECT_TRUE(radio->ran("ip addr flush dev wlan0"));
    EXPECT_EQ(manager->current_state().kind, core::ConnectionStateKind::DISCONNECTED);
    EXPECT_EQ(transitions.back().second, core::ReasonCode::OPERATOR_REQUEST);
}

TEST_F(UpstreamConnectionManagerTest, ReconnectWithoutProfile)
{
    auto manager = make_manager();

    EXPECT_EQ(manager->reconnect().reason, core::ReasonCode::NO_UPSTREAM_PROFILE);
}

TEST_F(UpstreamConnectionManagerTest, ScanReturnsToDisconnected)
{
    radio->respond("iw dev wlan0 scan",
                   "BSS aa:bb:cc:dd:ee:01(on wlan0)\n"
                   "\tfreq: 2437\n"
                   "\tsignal: -55.00 dBm\n"
                   "\tSSID: HomeNetwork\n"
                   "\tRSN:\t * Version: 1\n");
    auto manager = make_manager();

    auto networks = manager->scan().collect();

    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].ssid, "HomeNetwork");
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0].first.kind, core::ConnectionStateKind::SCANNING);
    EXPECT_EQ(transitions[1].first.kind, core::ConnectionStateKind::DISCONNECTED);
}

TEST_F(UpstreamConnectionManagerTest, FailedScanThrows)
{
    radio->fail("iw dev wlan0 scan", "command failed: Device or resource busy (-16)");
    auto manager = make_manager();

    try
    {
        manager->scan();
        FAIL() << "expected ExtenderError";
    }
    catch (const core::ExtenderError &e)
    {
        EXPECT_EQ(e.reason(), core::ReasonCode::COMMAND_FAILED);
    }
    EXPECT_EQ(manager->current_state().kind, core::ConnectionStateKind::DISCONNECTED);
}

TEST_F(UpstreamConnectionManagerTest, SignalOnlyWhileConnected)
{
    radio->respond("iw dev wlan0 link", "Connected to aa:bb:cc:dd:ee:ff (on wlan0)\n\tSSID: HomeNetwork\n\tsignal: -52 dBm\n");
    launcher->script("wpa_supplicant", supplicant_connected());
    auto manager = make_manager();

    EXPECT_FALSE(manager->sample_signal().has_value());

    ASSERT_TRUE(manager->connect(profile));
    EXPECT_EQ(manager->sample_signal(), -52);
}

TEST(LinkSignalParserTest, NotConnected)
{
    EXPECT_FALSE(UpstreamConnectionManager::parse_link_signal("Not connected.\n").has_value());
    EXPECT_EQ(UpstreamConnectionManager::parse_link_signal("\tsignal: -67 dBm\n"), -67);
}
