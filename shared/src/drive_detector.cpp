#include "offloader/drive_detector.hpp"
#include "offloader/process.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace {

std::string json_string(const nlohmann::json &j, const std::string &key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\n");
    return s.substr(start, end - start + 1);
}

std::vector<DriveInfo> drives_by_id() {
    namespace fs = std::filesystem;
    std::vector<DriveInfo> drives;

    fs::path by_id("/dev/disk/by-id");
    std::error_code ec;
    if (!fs::is_directory(by_id, ec)) {
        return drives;
    }

    std::vector<std::string> names;
    for (const auto &entry : fs::directory_iterator(by_id, ec)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());

    for (const auto &name : names) {
        if (!name.starts_with("usb-")) {
            continue;
        }

        // skip whole disk entries if a partition entry exists
        if (name.find("-part") == std::string::npos) {
            bool has_part = std::any_of(names.begin(), names.end(), [&name](const std::string &other) {
                return other.starts_with(name + "-part");
            });
            if (has_part) {
                continue;
            }
        }

        fs::path real = fs::canonical(by_id / name, ec);
        if (ec) {
            continue;
        }

        DriveInfo drive;
        drive.device = real.string();
        drive.size = "?";
        drive.model = "USB Drive";
        try {
            CommandResult r = run_command({"lsblk", "-n", "-o", "SIZE,FSTYPE", drive.device});
            std::istringstream iss(r.out);
            std::string size, fstype;
            if (iss >> size) {
                drive.size = size;
            }
            if (iss >> fstype) {
                drive.fstype = fstype;
            }
        } catch (const std::exception &e) {
            std::cerr << "[drives] lsblk failed for " << drive.device << ": " << e.what() << std::endl;
        }
        drives.push_back(drive);
    }
    return drives;
}

}

void to_json(nlohmann::json &j, const DriveInfo &drive) {
    j = nlohmann::json{
        {"device", drive.device},
        {"size", drive.size},
        {"model", drive.model},
        {"fstype", drive.fstype},
        {"mountpoint", drive.mountpoint.empty() ? nlohmann::json(nullptr) : nlohmann::json(drive.mountpoint)}
    };
}

std::vector<DriveInfo> parse_lsblk(const std::string &json_text) {
    std::vector<DriveInfo> drives;
    nlohmann::json data = nlohmann::json::parse(json_text, nullptr, false);
    if (data.is_discarded() || !data.contains("blockdevices") || !data["blockdevices"].is_array()) {
        return drives;
    }

    for (const auto &dev : data["blockdevices"]) {
        std::string tran = json_string(dev, "tran");
        std::transform(tran.begin(), tran.end(), tran.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (tran != "usb") {
            continue;
        }

        std::string model = trim(json_string(dev, "model"));
        if (model.empty()) {
            model = "USB Drive";
        }

        std::vector<nlohmann::json> targets;
        if (dev.contains("children") && dev["children"].is_array() && !dev["children"].empty()) {
            targets.assign(dev["children"].begin(), dev["children"].end());
        } else {
            targets.push_back(dev);
        }

        for (const auto &part : targets) {
            std::string type = json_string(part, "type");
            if (type != "part" && type != "disk") {
                continue;
            }
            DriveInfo drive;
            drive.device = "/dev/" + json_string(part, "name");
            drive.size = json_string(part, "size");
            if (drive.size.empty()) {
                drive.size = "?";
            }
            drive.model = model;
            drive.fstype = json_string(part, "fstype");
            drive.mountpoint = json_string(part, "mountpoint");
            drives.push_back(drive);
        }
    }
    return drives;
}

std::vector<DriveInfo> find_usb_drives() {
    std::vector<DriveInfo> drives;
    try {
        CommandResult r = run_command({"lsblk", "-J", "-o", "NAME,SIZE,TYPE,MOUNTPOINT,TRAN,MODEL,FSTYPE"});
        if (r.exit_code == 0 && !trim(r.out).empty()) {
            drives = parse_lsblk(r.out);
        }
    } catch (const std::exception &e) {
        std::cerr << "[drives] lsblk detection failed: " << e.what() << std::endl;
    }

    if (drives.empty()) {
        drives = drives_by_id();
    }
    return drives;
}
