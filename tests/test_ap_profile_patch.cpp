#include <gtest/gtest.h>

#include "core/types.hpp"
#include "core/config.hpp"

using namespace extender::core;

namespace
{
    APProfile current_profile()
    {
        APProfile profile;
        profile.ssid = "Extender";
        profile.security = SecurityType::WPA_PSK;
        profile.passphrase = "battery staple";
        profile.channel = 11;
        profile.gateway = "10.8.0.1";
        profile.lease_time = "2h";
        return profile;
    }
}

TEST(APProfilePatchTest, SsidOnlyKeepsSecurityAndPassphrase)
{
    APProfilePatch patch;
    patch.ssid = "Extender-2";

    auto merged = patch.apply_to(current_profile());

    EXPECT_EQ(merged.ssid, "Extender-2");
    EXPECT_EQ(merged.security, SecurityType::WPA_PSK);
    EXPECT_EQ(merged.passphrase, "battery staple");
    EXPECT_EQ(merged.channel, 11);
    EXPECT_EQ(merged.gateway, "10.8.0.1");
    EXPECT_EQ(merged.lease_time, "2h");
    EXPECT_TRUE(validate_ap_profile(merged).empty());
}

TEST(APProfilePatchTest, SetFieldsOverrideCurrentValues)
{
    APProfilePatch patch;
    patch.security = SecurityType::WPA2_PSK;
    patch.passphrase = "new passphrase";
    patch.channel = 1;
    patch.dhcp_range_start = "10.8.0.50";
    patch.dhcp_range_end = "10.8.0.60";

    auto merged = patch.apply_to(current_profile());

    EXPECT_EQ(merged.ssid, "Extender");
    EXPECT_EQ(merged.security, SecurityType::WPA2_PSK);
    EXPECT_EQ(merged.passphrase, "new passphrase");
    EXPECT_EQ(merged.channel, 1);
    EXPECT_EQ(merged.dhcp_range_start, "10.8.0.50");
    EXPECT_EQ(merged.dhcp_range_end, "10.8.0.60");
}

TEST(APProfilePatchTest, SwitchingToOpenDropsThePassphrase)
{
    APProfilePatch patch;
    patch.security = SecurityType::OPEN;

    auto merged = patch.apply_to(current_profile());

    EXPECT_EQ(merged.security, SecurityType::OPEN);
    EXPECT_TRUE(merged.passphrase.empty());
}

TEST(APProfilePatchTest, SecuringAnOpenNetworkNeedsAPassphrase)
{
    APProfile open = current_profile();
    open.security = SecurityType::OPEN;
    open.passphrase.clear();

    APProfilePatch patch;
    patch.security = SecurityType::WPA2_PSK;

    EXPECT_FALSE(validate_ap_profile(patch.apply_to(open)).empty());
}
