#include <gtest/gtest.h>
#include "../src/core/ConfigFile.h"
#include <filesystem>
#include <fstream>

namespace bacnet_scan {

TEST(ConfigFileTest, CamelCaseKeysMapOntoConfig) {
    Config cfg;
    apply_config_json(R"({
        "localName": "plant-scanner", "localInstanceId": 4194000, "localNetwork": 12,
        "localAddress": "192.168.1.12/24:47809", "vendorIdentifier": 260,
        "foreignRegistration": "10.0.0.2", "timeToLive": 120,
        "configuredBbmdList": ["10.0.0.2"], "knownSubnets": ["10.0.0.0/24", "10.0.1.0/24"],
        "lowLimit": 10, "highLimit": 20000, "fullStepSize": 25, "emptyStepSize": 2500,
        "probeBbmds": false, "requestTimeoutMs": 800, "discoveryTimeoutMs": 3000,
        "synthesizedPrefix": 16, "disablePhases": ["routers"], "recording": "site.json",
        "snapshotDir": "/var/lib/bacnet", "storeLimit": 5, "usePrior": false, "pretty": true,
        "diffWorkers": 4, "logLevel": "debug"
    })", cfg);
    EXPECT_EQ(cfg.local_name, "plant-scanner");
    EXPECT_EQ(cfg.local_instance_id, 4194000);
    EXPECT_EQ(cfg.local_network, 12);
    EXPECT_EQ(cfg.local_address, "192.168.1.12/24:47809");
    EXPECT_EQ(cfg.vendor_identifier, 260);
    EXPECT_EQ(cfg.foreign_registration, "10.0.0.2");
    EXPECT_EQ(cfg.time_to_live, 120);
    EXPECT_EQ(cfg.known_subnets.size(), 2u);
    EXPECT_EQ(cfg.low_limit, 10);
    EXPECT_EQ(cfg.high_limit, 20000);
    EXPECT_EQ(cfg.full_step_size, 25);
    EXPECT_EQ(cfg.empty_step_size, 2500);
    EXPECT_FALSE(cfg.probe_bbmds);
    EXPECT_EQ(cfg.request_timeout_ms, 800);
    EXPECT_EQ(cfg.discovery_timeout_ms, 3000);
    EXPECT_EQ(cfg.synthesized_prefix, 16);
    EXPECT_EQ(cfg.disable_phases, std::vector<std::string>{"routers"});
    EXPECT_EQ(cfg.recording_file, "site.json");
    EXPECT_EQ(cfg.snapshot_dir, "/var/lib/bacnet");
    EXPECT_EQ(cfg.store_limit, 5);
    EXPECT_FALSE(cfg.use_prior);
    EXPECT_TRUE(cfg.pretty);
    EXPECT_EQ(cfg.diff_workers, 4);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ConfigFileTest, AbsentKeysKeepValues) {
    Config cfg;
    cfg.high_limit = 777;
    apply_config_json(R"({"lowLimit": 5, "someFutureKey": true})", cfg);
    EXPECT_EQ(cfg.low_limit, 5);
    EXPECT_EQ(cfg.high_limit, 777);
    EXPECT_EQ(cfg.local_name, "bacnet-scan");
}

TEST(ConfigFileTest, BadValueLeavesConfigUntouched) {
    Config cfg;
    EXPECT_THROW(apply_config_json(R"({"lowLimit": 5, "highLimit": "lots"})", cfg), std::runtime_error);
    EXPECT_EQ(cfg.low_limit, 0);
    EXPECT_THROW(apply_config_json(R"({"knownSubnets": "10.0.0.0/24"})", cfg), std::runtime_error);
    EXPECT_THROW(apply_config_json("[1,2]", cfg), std::runtime_error);
    EXPECT_THROW(apply_config_json("{\"lowLimit\": ", cfg), std::runtime_error);
}

TEST(ConfigFileTest, LoadFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "bacnet_scan_config_file_test.json";
    std::ofstream(path) << R"({"configuredBbmdList": ["10.0.0.2", "10.0.1.2"]})";
    Config cfg;
    load_config_file(path.string(), cfg);
    EXPECT_EQ(cfg.configured_bbmds.size(), 2u);
    std::filesystem::remove(path);
    EXPECT_THROW(load_config_file(path.string(), cfg), std::runtime_error);
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
