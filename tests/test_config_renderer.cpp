#include <gtest/gtest.h>

#include <sys/stat.h>

#include "infrastructure/config_renderer.hpp"
#include "support/fake_system.hpp"

using namespace extender;
using namespace extender::infrastructure;
using extender::testing::TempDir;
using extender::testing::read_file;

namespace
{
    core::APProfile sample_ap()
    {
        core::APProfile profile;
        profile.ssid = "Extender";
        profile.security = core::SecurityType::WPA2_PSK;
        profile.passphrase = "battery staple";
        profile.channel = 11;
        profile.dhcp_range_start = "192.168.4.2";
        profile.dhcp_range_end = "192.168.4.20";
        return profile;
    }
}

TEST(ConfigRendererTest, DerivesIeeeReferencePsk)
{
    // IEEE 802.11i-2004 Annex H.4 test vector
    EXPECT_EQ(derive_wpa_psk("password", "IEEE"),
              "f42c6fc52df0ebef9ebb4b90b38a5f902e83fe1b135a70e23aed762e9710a12e");
}

TEST(ConfigRendererTest, SupplicantConfNeverContainsPlaintextPassphrase)
{
    core::UpstreamProfile profile;
    profile.ssid = "Home";
    profile.security = core::SecurityType::WPA2_PSK;
    profile.passphrase = "correct horse";
    profile.channel = 6;

    auto conf = render_wpa_supplicant_conf(profile, "/run/wifi-extender/wpa");

    EXPECT_EQ(conf.find("correct horse"), std::string::npos);
    EXPECT_NE(conf.find("ssid=486f6d65\n"), std::string::npos);
    EXPECT_NE(conf.find("key_mgmt=WPA-PSK"), std::string::npos);
    EXPECT_NE(conf.find("proto=RSN"), std::string::npos);
    EXPECT_NE(conf.find("psk=" + derive_wpa_psk("correct horse", "Home")), std::string::npos);
    EXPECT_NE(conf.find("scan_freq=2437"), std::string::npos);
}

TEST(ConfigRendererTest, OpenUpstreamUsesNoKeyManagement)
{
    core::UpstreamProfile profile;
    profile.ssid = "Cafe";
    profile.security = core::SecurityType::OPEN;

    auto conf = render_wpa_supplicant_conf(profile, "/tmp/ctrl");

    EXPECT_NE(conf.find("key_mgmt=NONE"), std::string::npos);
    EXPECT_EQ(conf.find("psk="), std::string::npos);
    EXPECT_EQ(conf.find("scan_freq"), std::string::npos);
}

TEST(ConfigRendererTest, HostapdConfForWpa2)
{
    auto conf = render_hostapd_conf(sample_ap(), "wlan0_ap0", "/run/wifi-extender/hostapd");

    EXPECT_NE(conf.find("interface=wlan0_ap0\n"), std::string::npos);
    EXPECT_NE(conf.find("driver=nl80211\n"), std::string::npos);
    EXPECT_NE(conf.find("ssid=Extender\n"), std::string::npos);
    EXPECT_NE(conf.find("channel=11\n"), std::string::npos);
    EXPECT_NE(conf.find("wpa=2\n"), std::string::npos);
    EXPECT_NE(conf.find("rsn_pairwise=CCMP\n"), std::string::npos);
    EXPECT_NE(conf.find("wpa_passphrase=battery staple\n"), std::string::npos);
}

TEST(ConfigRendererTest, HostapdConfForOpenNetwork)
{
    auto profile = sample_ap();
    profile.security = core::SecurityType::OPEN;

    auto conf = render_hostapd_conf(profile, "wlan0_ap0", "/tmp/ctrl");

    EXPECT_EQ(conf.find("wpa="), std::string::npos);
    EXPECT_EQ(conf.find("wpa_passphrase"), std::string::npos);
}

TEST(ConfigRendererTest, DnsmasqServesApAndBridge)
{
    auto conf = render_dnsmasq_conf(sample_ap(), "wlan0_ap0", "br-ext", "/run/wifi-extender/leases");

    EXPECT_NE(conf.find("interface=wlan0_ap0\n"), std::string::npos);
    EXPECT_NE(conf.find("interface=br-ext\n"), std::string::npos);
    EXPECT_NE(conf.find("bind-dynamic\n"), std::string::npos);
    EXPECT_NE(conf.find("dhcp-range=192.168.4.2,192.168.4.20,255.255.255.0,12h\n"), std::string::npos);
    EXPECT_NE(conf.find("dhcp-option=option:router,192.168.4.1\n"), std::string::npos);
    EXPECT_NE(conf.find("dhcp-leasefile=/run/wifi-extender/leases\n"), std::string::npos);
}

TEST(ConfigRendererTest, PrivateFilesAreOwnerOnly)
{
    TempDir dir;
    auto path = dir / "nested" / "hostapd.conf";
    std::string error;

    ASSERT_TRUE(write_private_file(path, "ssid=x\n", error)) << error;

    struct stat info{};
    ASSERT_EQ(stat(path.c_str(), &info), 0);
    EXPECT_EQ(info.st_mode & 0777, 0600u);
    EXPECT_EQ(read_file(path), "ssid=x\n");
}

TEST(ConfigRendererTest, WriteFailureIsReported)
{
    TempDir dir;
    extender::testing::write_file(dir / "blocker", "");
    std::string error;

    EXPECT_FALSE(write_private_file(dir / "blocker" / "conf", "x", error));
    EXPECT_FALSE(error.empty());
}
