#include "offloader/config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

void from_json(const nlohmann::json &j, Config &config) {
    config.nas_ip = j.value("nas_ip", config.nas_ip);
    config.nas_ip_local = j.value("nas_ip_local", config.nas_ip_local);
    config.use_tailscale = j.value("use_tailscale", config.use_tailscale);
    config.share_name = j.value("share_name", config.share_name);
    config.subfolder = j.value("subfolder", config.subfolder);
    config.smb_username = j.value("smb_username", config.smb_username);
    config.smb_password = j.value("smb_password", config.smb_password);
    config.smb_version = j.value("smb_version", config.smb_version);

    config.verify_checksums = j.value("verify_checksums", config.verify_checksums);
    config.failure_threshold = j.value("failure_threshold", config.failure_threshold);
    config.copy_retries = j.value("copy_retries", config.copy_retries);
    config.skip_hidden = j.value("skip_hidden", config.skip_hidden);
    config.min_file_size = j.value("min_file_size", config.min_file_size);
    config.speed_test_size = j.value("speed_test_size", config.speed_test_size);

    config.discord_webhook = j.value("discord_webhook", config.discord_webhook);
    config.discord_notify_milestones = j.value("discord_notify_milestones", config.discord_notify_milestones);
    config.webhook_timeout_ms = j.value("webhook_timeout_ms", config.webhook_timeout_ms);

    config.usb_mount = j.value("usb_mount", config.usb_mount);
    config.nas_mount = j.value("nas_mount", config.nas_mount);
    config.history_file = j.value("history_file", config.history_file);
    config.use_sudo = j.value("use_sudo", config.use_sudo);
    config.mount_retries = j.value("mount_retries", config.mount_retries);
    config.mount_retry_delay_ms = j.value("mount_retry_delay_ms", config.mount_retry_delay_ms);

    config.sample_interval_ms = j.value("sample_interval_ms", config.sample_interval_ms);
    config.throughput_smoothing = j.value("throughput_smoothing", config.throughput_smoothing);

    // sanitize
    if (config.failure_threshold < 1) {
        config.failure_threshold = 1;
    }
    if (config.copy_retries < 0) {
        config.copy_retries = 0;
    }
    if (config.speed_test_size == 0) {
        config.speed_test_size = Config{}.speed_test_size;
    }
    if (config.mount_retries < 1) {
        config.mount_retries = 1;
    }
    if (config.sample_interval_ms < 10) {
        config.sample_interval_ms = 10;
    }
    if (config.throughput_smoothing <= 0.0 || config.throughput_smoothing > 1.0) {
        config.throughput_smoothing = 0.3;
    }
    auto &milestones = config.discord_notify_milestones;
    milestones.erase(std::remove_if(milestones.begin(), milestones.end(), [](int m) { return m <= 0 || m > 100; }), milestones.end());
    std::sort(milestones.begin(), milestones.end());
    milestones.erase(std::unique(milestones.begin(), milestones.end()), milestones.end());
}

void to_json(nlohmann::json &j, const Config &config) {
    j = nlohmann::json{
        {"nas_ip", config.nas_ip},
        {"nas_ip_local", config.nas_ip_local},
        {"use_tailscale", config.use_tailscale},
        {"share_name", config.share_name},
        {"subfolder", config.subfolder},
        {"smb_username", config.smb_username},
        {"smb_password", config.smb_password},
        {"smb_version", config.smb_version},
        {"verify_checksums", config.verify_checksums},
        {"failure_threshold", config.failure_threshold},
        {"copy_retries", config.copy_retries},
        {"skip_hidden", config.skip_hidden},
        {"min_file_size", config.min_file_size},
        {"speed_test_size", config.speed_test_size},
        {"discord_webhook", config.discord_webhook},
        {"discord_notify_milestones", config.discord_notify_milestones},
        {"webhook_timeout_ms", config.webhook_timeout_ms},
        {"usb_mount", config.usb_mount},
        {"nas_mount", config.nas_mount},
        {"history_file", config.history_file},
        {"use_sudo", config.use_sudo},
        {"mount_retries", config.mount_retries},
        {"mount_retry_delay_ms", config.mount_retry_delay_ms},
        {"sample_interval_ms", config.sample_interval_ms},
        {"throughput_smoothing", config.throughput_smoothing}
    };
}

Config load_config(const std::string &path) {
    Config config;

    // no config file -> defaults
    std::ifstream file(path);
    if (!file.is_open()) {
        return config;
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j, config);
    } catch (const nlohmann::json::exception &e) {
        std::cerr << "[config] Ignoring unreadable config " << path << ": " << e.what() << std::endl;
        return Config{};
    }
    return config;
}

void save_config(const std::string &path, const Config &config) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("config: Could not open config file for writing (path: " + path + ")");
    }
    file << nlohmann::json(config).dump(2);
    if (!file) {
        throw std::runtime_error("config: Failed to write config file (path: " + path + ")");
    }
}

void update_config(Config &config, const nlohmann::json &update) {
    if (!update.is_object()) {
        throw std::runtime_error("invalid_config: Config update must be a JSON object");
    }
    Config updated = config;
    try {
        from_json(update, updated);
    } catch (const nlohmann::json::exception &e) {
        throw std::runtime_error("invalid_config: " + std::string(e.what()));
    }
    config = updated;
}

nlohmann::json public_config(const Config &config) {
    nlohmann::json j = config;
    j.erase("smb_password");
    j["config_has_password"] = !config.smb_password.empty();
    return j;
}

std::string primary_address(const Config &config) {
    return config.use_tailscale ? config.nas_ip : config.nas_ip_local;
}

std::string secondary_address(const Config &config) {
    std::string secondary = config.use_tailscale ? config.nas_ip_local : config.nas_ip;
    return secondary == primary_address(config) ? "" : secondary;
}
