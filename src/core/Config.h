#pragma once
#include <string>
#include <vector>

namespace bacnet_scan {

struct Config {
    // Local BACnet application identity
    std::string local_name = "bacnet-scan";
    long long local_instance_id = 599;
    long long local_network = 0; // 0 = local network unnumbered
    std::string local_address = "0.0.0.0:47808"; // ip[/prefix][:port]
    long long vendor_identifier = 15;
    std::string foreign_registration; // BBMD address to register with; empty = none
    int time_to_live = 30; // foreign registration TTL, seconds

    std::vector<std::string> configured_bbmds; // BBMD allow-list (addresses)
    std::vector<std::string> known_subnets;    // "a.b.c.d/p"

    // Who-Is windowing
    long long low_limit = 0;
    long long high_limit = 4194303;
    long long full_step_size = 100;
    long long empty_step_size = 1000;

    bool probe_bbmds = true; // probe every IP device with a BDT read
    int request_timeout_ms = 5000;    // BVLL reads
    int discovery_timeout_ms = 10000; // Who-Is and router queries
    int synthesized_prefix = 24;

    std::vector<std::string> enable_phases; // if non-empty, only these
    std::vector<std::string> disable_phases;

    std::string recording_file;
    std::string snapshot_dir = "snapshots";
    int store_limit = 30; // 0 = keep everything
    bool use_prior = true;
    std::string output_file; // explicit N-Triples path; empty = snapshot store only
    std::string json_output;
    bool pretty = false;
    std::string diff_output_dir; // empty = directory of the first input
    int diff_workers = 2;
    std::string log_level = "info";
};

}
