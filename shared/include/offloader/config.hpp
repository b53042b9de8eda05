#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

constexpr const char *DEFAULT_CONFIG_FILE = "/etc/offloader/config.json";

struct Config {
    // network share
    std::string nas_ip = "100.109.23.38";
    std::string nas_ip_local = "192.168.88.20";
    bool use_tailscale = true;
    std::string share_name = "archive";
    std::string subfolder = "";
    std::string smb_username = "";
    std::string smb_password = "";
    std::string smb_version = "3.0";

    // transfer
    bool verify_checksums = false;
    int failure_threshold = 3;
    int copy_retries = 1;
    bool skip_hidden = true;
    std::uintmax_t min_file_size = 0;
    std::uintmax_t speed_test_size = 256 * 1024 * 1024;

    // notifications
    std::string discord_webhook = "";
    std::vector<int> discord_notify_milestones{25, 50, 75, 100};
    long webhook_timeout_ms = 10000;

    // appliance layout
    std::string usb_mount = "/mnt/offloader/usb";
    std::string nas_mount = "/mnt/offloader/nas";
    std::string history_file = "/etc/offloader/history.json";
    bool use_sudo = true;
    int mount_retries = 3;
    long mount_retry_delay_ms = 1500;

    // progress sampling
    long sample_interval_ms = 1000;
    double throughput_smoothing = 0.3;
};

// missing keys keep the values already present in config
void from_json(const nlohmann::json &j, Config &config);
void to_json(nlohmann::json &j, const Config &config);

Config load_config(const std::string &path);
void save_config(const std::string &path, const Config &config);

// merges the known keys of update into config, rejecting values of the wrong type
void update_config(Config &config, const nlohmann::json &update);

// configuration as shown to clients: no password
nlohmann::json public_config(const Config &config);

// share addresses in the order they are tried
std::string primary_address(const Config &config);
std::string secondary_address(const Config &config);
