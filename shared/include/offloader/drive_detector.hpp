#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DriveInfo {
    std::string device;
    std::string size;
    std::string model;
    std::string fstype;
    std::string mountpoint;
};

void to_json(nlohmann::json &j, const DriveInfo &drive);

// usb drives from `lsblk -J` output, partitions preferred over whole disks
std::vector<DriveInfo> parse_lsblk(const std::string &json_text);

// lsblk first, /dev/disk/by-id/usb-* as fallback
std::vector<DriveInfo> find_usb_drives();
