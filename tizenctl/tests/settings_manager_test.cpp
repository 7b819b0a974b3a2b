#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "core/settings_manager.hpp"

namespace {

std::string tempConfigPath(const std::string& name) {
    return ::testing::TempDir() + "tizenctl_" + std::to_string(getpid()) + "/" + name;
}

}

TEST(SettingsManagerTest, DefaultsWithoutFile) {
    SettingsManager settings(tempConfigPath("missing.toml"));
    settings.parseFile();

    EXPECT_EQ(settings.getHost(), "");
    EXPECT_EQ(settings.getPort(), tv::PLAIN_CONTROL_PORT);
    EXPECT_EQ(settings.getMethod(), tv::TransportMethod::Websocket);
    EXPECT_EQ(settings.getTimeout(), 5);
    EXPECT_TRUE(settings.getDiscoverySubnets().empty());
}

TEST(SettingsManagerTest, RoundTripsFieldsAndCredentials) {
    std::string path = tempConfigPath("roundtrip.toml");

    {
        SettingsManager settings(path);
        settings.setHost("192.168.1.20");
        settings.setPort(8001);
        settings.setMethod(tv::TransportMethod::Websocket);
        settings.setName("living-room");
        settings.setTimeout(0);
        settings.setDiscoverySubnets({"192.168.1.0/24", "10.0.0.0/24"});

        tv::PairingCredential current;
        current.token = "12345678";
        current.paired = true;
        settings.getTokenStore().put("192.168.1.20", current);

        tv::PairingCredential other;
        other.token = "999";
        other.paired = true;
        settings.getTokenStore().put("192.168.1.21", other);

        ASSERT_EQ(settings.writeFile(), 0);
    }

    SettingsManager loaded(path);
    loaded.parseFile();

    EXPECT_EQ(loaded.getHost(), "192.168.1.20");
    EXPECT_EQ(loaded.getPort(), 8001);
    EXPECT_EQ(loaded.getName(), "living-room");
    EXPECT_EQ(loaded.getTimeout(), 0);
    EXPECT_EQ(loaded.getDiscoverySubnets(), (std::vector<std::string>{"192.168.1.0/24", "10.0.0.0/24"}));

    tv::PairingCredential current = loaded.getTokenStore().get("192.168.1.20");
    EXPECT_TRUE(current.paired);
    EXPECT_EQ(current.token.value_or(""), "12345678");

    tv::PairingCredential other = loaded.getTokenStore().get("192.168.1.21");
    EXPECT_TRUE(other.paired);
    EXPECT_EQ(other.token.value_or(""), "999");

    tv::Endpoint endpoint = loaded.getEndpoint();
    EXPECT_EQ(endpoint.host, "192.168.1.20");
    EXPECT_EQ(endpoint.displayName, "Samsung TV (192.168.1.20)");

    std::remove(path.c_str());
}

TEST(SettingsManagerTest, ReadsLegacyMethodAndSurvivesBadToml) {
    std::string path = tempConfigPath("legacy.toml");
    SettingsManager writer(path);
    ASSERT_TRUE(writer.ensureConfigDir());

    {
        std::ofstream file(path);
        file << "host = \"10.0.0.9\"\nport = 55000\nmethod = \"legacy\"\n";
    }
    SettingsManager legacy(path);
    legacy.parseFile();
    EXPECT_EQ(legacy.getMethod(), tv::TransportMethod::Legacy);
    EXPECT_EQ(legacy.getPort(), 55000);

    {
        std::ofstream file(path, std::ios::trunc);
        file << "host = [unterminated\n";
    }
    SettingsManager broken(path);
    broken.parseFile();
    EXPECT_EQ(broken.getHost(), "");

    std::remove(path.c_str());
}
