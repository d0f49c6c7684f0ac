#include <gtest/gtest.h>

#include <algorithm>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "support/fake_system.hpp"

using namespace extender::core;
using extender::testing::TempDir;
using extender::testing::write_file;

namespace
{
    nlohmann::json minimal_document()
    {
        return nlohmann::json{
            {"interface", "wlan0"},
            {"upstream", {{"ssid", "HomeNetwork"}, {"security", "wpa2-psk"}, {"password", "correct horse"}}},
            {"ap", {{"ssid", "Extender"}, {"password", "battery staple"}}}};
    }

    bool mentions(const std::vector<std::string> &violations, const std::string &needle)
    {
        return std::any_of(violations.begin(), violations.end(),
                           [&needle](const std::string &v)
                           { return v.find(needle) != std::string::npos; });
    }

    std::vector<std::string> violations_of(const nlohmann::json &document)
    {
        try
        {
            ExtenderConfig::from_json(document);
        }
        catch (const ConfigError &e)
        {
            return e.violations();
        }
        return {};
    }
}

TEST(ConfigTest, MinimalDocumentUsesDefaults)
{
    auto config = ExtenderConfig::from_json(minimal_document());

    EXPECT_EQ(config->interface_name, "wlan0");
    ASSERT_TRUE(config->upstream.has_value());
    EXPECT_EQ(config->upstream->ssid, "HomeNetwork");
    EXPECT_EQ(config->access_point.channel, 6);
    EXPECT_EQ(config->access_point.gateway, "192.168.4.1");
    EXPECT_EQ(config->reconnect.max_attempts, 8);
    EXPECT_EQ(config->bridge.name, "br-ext");
    EXPECT_EQ(config->api.port, 8089);
    EXPECT_EQ(config->logging.format, "text");
}

TEST(ConfigTest, UpstreamIsOptional)
{
    auto document = minimal_document();
    document.erase("upstream");

    auto config = ExtenderConfig::from_json(document);

    EXPECT_FALSE(config->upstream.has_value());
}

TEST(ConfigTest, ReportsEveryViolationAtOnce)
{
    auto document = minimal_document();
    document["ap"]["password"] = "short";
    document["ap"]["channel"] = 15;
    document["reconnect"] = {{"max_attempts", 0}};
    document["logging"] = {{"log_level", "LOUD"}};

    auto violations = violations_of(document);

    EXPECT_GE(violations.size(), 4u);
    EXPECT_TRUE(mentions(violations, "ap.password"));
    EXPECT_TRUE(mentions(violations, "ap.channel"));
    EXPECT_TRUE(mentions(violations, "reconnect.max_attempts"));
    EXPECT_TRUE(mentions(violations, "logging.log_level"));
}

TEST(ConfigTest, RejectsUnknownKeysAndWrongTypes)
{
    auto document = minimal_document();
    document["ap"]["colour"] = "blue";
    document["api"] = {{"port", "eighty"}};
    document["extras"] = true;

    auto violations = violations_of(document);

    EXPECT_TRUE(mentions(violations, "ap.colour: unknown key"));
    EXPECT_TRUE(mentions(violations, "api.port: expected integer"));
    EXPECT_TRUE(mentions(violations, "extras: unknown key"));
}

TEST(ConfigTest, ApRestartBackoffIsValidated)
{
    auto document = minimal_document();
    document["supervision"] = {{"ap_restart_base_delay_ms", 5000},
                               {"ap_restart_max_delay_ms", 1000},
                               {"ap_restart_max_attempts", 0},
                               {"ap_stable_after_ms", 0}};

    auto violations = violations_of(document);

    EXPECT_TRUE(mentions(violations, "supervision.ap_restart_max_delay_ms"));
    EXPECT_TRUE(mentions(violations, "supervision.ap_restart_max_attempts"));
    EXPECT_TRUE(mentions(violations, "supervision.ap_stable_after_ms"));
}

TEST(ConfigTest, MissingApSectionIsRejected)
{
    auto document = minimal_document();
    document.erase("ap");

    EXPECT_TRUE(mentions(violations_of(document), "ap: required section missing"));
}

TEST(ConfigTest, DefaultConfigNeedsAnApPassphrase)
{
    auto config = ExtenderConfig::create_default();

    EXPECT_TRUE(mentions(config->validate(), "ap.password"));

    config->access_point.password = "battery staple";
    EXPECT_TRUE(config->validate().empty());
}

TEST(ConfigTest, DhcpRangeMustSitInsideGatewaySubnet)
{
    auto document = minimal_document();
    document["ap"]["dhcp_range_start"] = "10.0.0.2";

    EXPECT_TRUE(mentions(violations_of(document), "dhcp range: must lie inside the gateway subnet"));

    document = minimal_document();
    document["ap"]["dhcp_range_start"] = "192.168.4.1";
    EXPECT_TRUE(mentions(violations_of(document), "must not contain the gateway address"));
}

TEST(ConfigTest, HardwareModeMustMatchBand)
{
    auto document = minimal_document();
    document["ap"]["channel"] = 36;

    EXPECT_TRUE(mentions(violations_of(document), "hw_mode"));

    document["ap"]["hw_mode"] = "a";
    EXPECT_NO_THROW(ExtenderConfig::from_json(document));
}

TEST(ConfigTest, OpenNetworksNeedNoPassphrase)
{
    auto document = minimal_document();
    document["upstream"] = {{"ssid", "CafeGuest"}, {"security", "open"}};

    auto config = ExtenderConfig::from_json(document);

    EXPECT_EQ(config->upstream->to_profile().security, SecurityType::OPEN);
}

TEST(ConfigTest, WepIsRefused)
{
    UpstreamProfile profile;
    profile.ssid = "Legacy";
    profile.security = SecurityType::WEP;
    profile.passphrase = "0123456789";

    EXPECT_TRUE(mentions(validate_upstream_profile(profile), "WEP is not supported"));
}

TEST(ConfigTest, SsidLengthLimits)
{
    APProfile profile;
    profile.ssid = std::string(33, 'x');
    profile.security = SecurityType::OPEN;

    EXPECT_TRUE(mentions(validate_ap_profile(profile), "ssid: must be 1-32 bytes"));

    profile.ssid = std::string(32, 'x');
    EXPECT_TRUE(validate_ap_profile(profile).empty());
}

TEST(ConfigTest, FileRoundTrip)
{
    TempDir dir;
    auto original = ExtenderConfig::from_json(minimal_document());
    original->access_point.channel = 11;
    original->api.token = "s3cret";
    auto path = (dir / "config.json").string();

    original->save_to_file(path);
    auto loaded = ExtenderConfig::from_file(path);

    EXPECT_EQ(loaded->access_point.channel, 11);
    EXPECT_EQ(loaded->api.token, "s3cret");
    EXPECT_EQ(loaded->upstream->password, "correct horse");
}

TEST(ConfigTest, MissingAndMalformedFiles)
{
    TempDir dir;
    EXPECT_THROW(ExtenderConfig::from_file((dir / "absent.json").string()), ConfigError);

    write_file(dir / "broken.json", "{ \"ap\": ");
    try
    {
        ExtenderConfig::from_file((dir / "broken.json").string());
        FAIL() << "expected ConfigError";
    }
    catch (const ConfigError &e)
    {
        EXPECT_TRUE(mentions(e.violations(), "invalid JSON"));
        EXPECT_EQ(e.reason(), ReasonCode::CONFIGURATION_INVALID);
    }
}

TEST(ConfigTest, LeaseDurationParsing)
{
    EXPECT_EQ(parse_lease_duration("12h"), std::chrono::seconds(43200));
    EXPECT_EQ(parse_lease_duration("45m"), std::chrono::seconds(2700));
    EXPECT_EQ(parse_lease_duration("3600"), std::chrono::seconds(3600));
    EXPECT_EQ(parse_lease_duration("infinite"), std::chrono::seconds::max());
    EXPECT_FALSE(parse_lease_duration("1m").has_value());
    EXPECT_FALSE(parse_lease_duration("12x").has_value());
    EXPECT_FALSE(parse_lease_duration("").has_value());
}

TEST(ConfigTest, Ipv4Helpers)
{
    EXPECT_EQ(prefix_to_netmask(24), "255.255.255.0");
    EXPECT_EQ(prefix_to_netmask(30), "255.255.255.252");
    EXPECT_EQ(format_ipv4(*parse_ipv4("10.1.2.3")), "10.1.2.3");
    EXPECT_FALSE(parse_ipv4("300.1.1.1").has_value());
}
