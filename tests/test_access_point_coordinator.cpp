#include <gtest/gtest.h>

#include "infrastructure/access_point_coordinator.hpp"
#include "support/fake_system.hpp"

using namespace extender;
using namespace extender::testing;
using infrastructure::AccessPointCoordinator;
using infrastructure::AccessPointSettings;
using infrastructure::ClientTable;
using namespace std::chrono_literals;

class AccessPointCoordinatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        radio = std::make_shared<FakeRadio>(dir / "sys");
        radio->add_wireless_interface("wlan0_ap0", "ba:27:eb:12:34:56");
        launcher = std::make_shared<FakeProcessLauncher>();
        clock = std::make_shared<FakeClock>();

        profile.ssid = "Extender";
        profile.security = core::SecurityType::WPA2_PSK;
        profile.passphrase = "battery staple";
        profile.channel = 6;

        AccessPointSettings settings;
        settings.runtime_dir = (dir / "run").string();
        settings.bridge_name = "br-ext";
        settings.hostapd_ready_timeout = 50ms;
        settings.dhcp_ready_timeout = 50ms;
        settings.lease_wait = 30s;
        coordinator = std::make_unique<AccessPointCoordinator>(radio, launcher, clock, settings);
        coordinator->set_state_listener([this](const core::APState &state)
                                        { states.push_back(state); });
        coordinator->set_client_listener([this](const ClientTable::Update &update)
                                         { client_updates.push_back(update); });
    }

    void script_healthy_start()
    {
        launcher->script("hostapd", hostapd_enabled());
        launcher->script("dnsmasq", dnsmasq_ready());
    }

    TempDir dir;
    std::shared_ptr<FakeRadio> radio;
    std::shared_ptr<FakeProcessLauncher> launcher;
    std::shared_ptr<FakeClock> clock;
    core::APProfile profile;
    std::unique_ptr<AccessPointCoordinator> coordinator;
    std::vector<core::APState> states;
    std::vector<ClientTable::Update> client_updates;
};

TEST_F(AccessPointCoordinatorTest, StartsBothLegs)
{
    script_healthy_start();

    auto outcome = coordinator->start(profile, "wlan0_ap0");

    ASSERT_TRUE(outcome) << outcome.message;
    EXPECT_EQ(coordinator->current_state().kind, core::APStateKind::RUNNING);
    EXPECT_TRUE(launcher->alive("hostapd"));
    EXPECT_TRUE(launcher->alive("dnsmasq"));
    EXPECT_TRUE(radio->ran("ip addr add 192.168.4.1/24 dev wlan0_ap0"));

    auto hostapd_argv = launcher->last_argv("hostapd");
    ASSERT_EQ(hostapd_argv.size(), 2u);
    auto conf = read_file(hostapd_argv[1]);
    EXPECT_NE(conf.find("interface=wlan0_ap0"), std::string::npos);
    EXPECT_NE(conf.find("ssid=Extender"), std::string::npos);

    auto dnsmasq_argv = launcher->last_argv("dnsmasq");
    EXPECT_EQ(dnsmasq_argv[1], "--keep-in-foreground");

    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[0].kind, core::APStateKind::STARTING);
    EXPECT_EQ(states[1].kind, core::APStateKind::RUNNING);
    EXPECT_EQ(coordinator->interface_name(), "wlan0_ap0");
    ASSERT_TRUE(coordinator->profile().has_value());
}

TEST_F(AccessPointCoordinatorTest, HostapdThatNeverComesUp)
{
    launcher->script("hostapd", std::vector<std::string>{"Configuration file: /tmp/x"});

    auto outcome = coordinator->start(profile, "wlan0_ap0");

    EXPECT_EQ(outcome.reason, core::ReasonCode::AP_START_FAILED);
    EXPECT_EQ(coordinator->current_state(), (core::APState{core::APStateKind::STOPPED, core::ReasonCode::AP_START_FAILED}));
    EXPECT_FALSE(launcher->alive("hostapd"));
    EXPECT_EQ(launcher->spawn_count("dnsmasq"), 0u);
}

TEST_F(AccessPointCoordinatorTest, DnsmasqFailureTearsDownHostapd)
{
    launcher->script("hostapd", hostapd_enabled());
    FakeProcessLauncher::Script dnsmasq;
    dnsmasq.lines = {"dnsmasq: failed to create listening socket for port 53: Address already in use"};
    dnsmasq.exit_status = 2 << 8;
    launcher->script("dnsmasq", dnsmasq);

    auto outcome = coordinator->start(profile, "wlan0_ap0");

    EXPECT_EQ(outcome.reason, core::ReasonCode::DHCP_START_FAILED);
    EXPECT_NE(outcome.message.find("dnsmasq exited"), std::string::npos);
    EXPECT_FALSE(launcher->alive("hostapd"));
    EXPECT_EQ(coordinator->current_state().kind, core::APStateKind::STOPPED);
    EXPECT_EQ(states.back().reason, core::ReasonCode::DHCP_START_FAILED);
}

TEST_F(AccessPointCoordinatorTest, HostapdDyingWhileDnsmasqStartsFailsTheStart)
{
    script_healthy_start();
    launcher->before_spawn("dnsmasq", [this]
                           { launcher->exit("hostapd"); });

    auto outcome = coordinator->start(profile, "wlan0_ap0");

    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.reason, core::ReasonCode::AP_START_FAILED);
    EXPECT_NE(outcome.message.find("hostapd exited"), std::string::npos);
    EXPECT_EQ(coordinator->current_state().kind, core::APStateKind::STOPPED);
    EXPECT_FALSE(launcher->alive("dnsmasq"));
    for (const auto &state : states)
    {
        EXPECT_NE(state.kind, core::APStateKind::RUNNING);
    }
}

TEST_F(AccessPointCoordinatorTest, AddressingFailureSpawnsNothing)
{
    radio->fail("ip addr add", "RTNETLINK answers: Permission denied");

    auto outcome = coordinator->start(profile, "wlan0_ap0");

    EXPECT_EQ(outcome.reason, core::ReasonCode::AP_START_FAILED);
    EXPECT_EQ(launcher->spawn_count("hostapd"), 0u);
}

TEST_F(AccessPointCoordinatorTest, ProcessExitWhileRunningIsReported)
{
    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));

    launcher->exit("hostapd");

    auto state = coordinator->current_state();
    EXPECT_EQ(state.kind, core::APStateKind::FAILED);
    EXPECT_EQ(state.reason, core::ReasonCode::AP_PROCESS_EXITED);
    EXPECT_EQ(states.back().kind, core::APStateKind::FAILED);
}

TEST_F(AccessPointCoordinatorTest, TracksClientsFromBothStreams)
{
    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));

    launcher->emit("hostapd", "wlan0_ap0: AP-STA-CONNECTED aa:bb:cc:00:11:22");
    launcher->emit("dnsmasq", "dnsmasq-dhcp[812]: DHCPACK(wlan0_ap0) 192.168.4.10 aa:bb:cc:00:11:22 phone");

    auto clients = coordinator->clients();
    ASSERT_EQ(clients.size(), 1u);
    EXPECT_EQ(clients[0].mac, "AA:BB:CC:00:11:22");
    EXPECT_EQ(clients[0].ip, std::optional<std::string>("192.168.4.10"));
    EXPECT_EQ(clients[0].hostname, "phone");

    ASSERT_EQ(client_updates.size(), 2u);
    EXPECT_EQ(client_updates[0].change, ClientTable::Change::JOINED);
    EXPECT_EQ(client_updates[1].change, ClientTable::Change::UPDATED);

    launcher->emit("hostapd", "wlan0_ap0: AP-STA-DISCONNECTED aa:bb:cc:00:11:22");
    EXPECT_TRUE(coordinator->clients().empty());
    EXPECT_EQ(client_updates.back().change, ClientTable::Change::LEFT);
}

TEST_F(AccessPointCoordinatorTest, ReleaseAndLeaseWait)
{
    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));
    launcher->emit("hostapd", "wlan0_ap0: AP-STA-CONNECTED aa:bb:cc:00:11:22");
    launcher->emit("dnsmasq", "dnsmasq-dhcp[812]: DHCPACK(br-ext) 192.168.4.10 aa:bb:cc:00:11:22");

    launcher->emit("dnsmasq", "dnsmasq-dhcp[812]: DHCPRELEASE(br-ext) 192.168.4.10 aa:bb:cc:00:11:22");
    EXPECT_FALSE(coordinator->clients()[0].ip.has_value());

    clock->advance(31s);
    coordinator->expire_clients();
    EXPECT_TRUE(coordinator->clients()[0].lease_overdue);
}

TEST_F(AccessPointCoordinatorTest, StopClearsClientsAndLegs)
{
    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));
    launcher->emit("hostapd", "wlan0_ap0: AP-STA-CONNECTED aa:bb:cc:00:11:22");
    client_updates.clear();

    ASSERT_TRUE(coordinator->stop());

    EXPECT_FALSE(launcher->alive("hostapd"));
    EXPECT_FALSE(launcher->alive("dnsmasq"));
    EXPECT_EQ(coordinator->current_state().kind, core::APStateKind::STOPPED);
    EXPECT_TRUE(coordinator->clients().empty());
    ASSERT_EQ(client_updates.size(), 1u);
    EXPECT_EQ(client_updates[0].change, ClientTable::Change::LEFT);
    EXPECT_FALSE(std::filesystem::exists(dir / "run" / "hostapd-wlan0_ap0.conf"));
}

TEST_F(AccessPointCoordinatorTest, RestartsAfterStop)
{
    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));
    ASSERT_TRUE(coordinator->stop());

    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));
    EXPECT_EQ(launcher->spawn_count("hostapd"), 2u);
    EXPECT_EQ(coordinator->current_state().kind, core::APStateKind::RUNNING);
}

TEST_F(AccessPointCoordinatorTest, StationSignals)
{
    script_healthy_start();
    ASSERT_TRUE(coordinator->start(profile, "wlan0_ap0"));
    launcher->emit("hostapd", "wlan0_ap0: AP-STA-CONNECTED aa:bb:cc:00:11:22");
    radio->respond("iw dev wlan0_ap0 station dump",
                   "Station aa:bb:cc:00:11:22 (on wlan0_ap0)\n"
                   "\tinactive time:\t310 ms\n"
                   "\tsignal:  \t-61 [-61] dBm\n");

    coordinator->refresh_station_signals();

    EXPECT_EQ(coordinator->clients()[0].signal_dbm, std::optional<int>(-61));
}

TEST(StationDumpParserTest, MultipleStations)
{
    auto signals = AccessPointCoordinator::parse_station_dump(
        "Station aa:bb:cc:00:11:22 (on wlan0_ap0)\n"
        "\tsignal:  \t-61 [-61] dBm\n"
        "Station aa:bb:cc:00:11:33 (on wlan0_ap0)\n"
        "\tsignal avg:\t-70 dBm\n"
        "\tsignal:  \t-72 dBm\n");

    ASSERT_EQ(signals.size(), 2u);
    EXPECT_EQ(signals["AA:BB:CC:00:11:22"], -61);
    EXPECT_EQ(signals["AA:BB:CC:00:11:33"], -72);
}
