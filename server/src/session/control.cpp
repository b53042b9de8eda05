#include "session.hpp"

#include <nlohmann/json.hpp>

// START <project> [--device <dev>] [--folder <dir>] [file ...], further lines are files
void Session::start(const std::string &msg) {
    std::vector<std::string> lines = split_lines(msg);
    std::vector<std::string> parts = split_cmd(lines.empty() ? msg : lines[0]);
    if (parts.size() < 2) {
        throw std::runtime_error("no_project: START command requires a project name");
    }

    StartOptions options;
    for (size_t i = 2; i < parts.size(); ++i) {
        if (parts[i] == "--device" && i + 1 < parts.size()) {
            options.device = parts[++i];
        } else if (parts[i] == "--folder" && i + 1 < parts.size()) {
            options.source_subfolder = parts[++i];
        } else {
            options.files.push_back(parts[i]);
        }
    }
    for (size_t i = 1; i < lines.size(); ++i) {
        if (!lines[i].empty()) {
            options.files.push_back(lines[i]);
        }
    }

    std::string id = this->service.start(parts[1], options);
    this->send("OK\n" + id);
}

void Session::cancel() {
    if (!this->service.cancel()) {
        throw std::runtime_error("no_active_job: There is no running job to cancel");
    }
    this->send("OK");
}

void Session::clear() {
    this->service.clear();
    this->send("OK");
}

void Session::status() {
    nlohmann::json j = this->service.current();
    this->send("OK\n" + j.dump());
}

void Session::history() {
    nlohmann::json j = this->service.history();
    this->send("OK\n" + j.dump());
}

void Session::last() {
    std::optional<JobRecord> record = this->service.lastRecord();
    if (!record) {
        throw std::runtime_error("no_record: No job has finished yet");
    }
    nlohmann::json j = *record;
    this->send("OK\n" + j.dump());
}

void Session::drives() {
    nlohmann::json j = this->service.detectDrives();
    this->send("OK\n" + j.dump());
}

// FILES [--device <dev>] [--folder <dir>]
void Session::files(const std::string &msg) {
    std::vector<std::string> parts = split_cmd(msg);
    StartOptions options;
    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i] == "--device" && i + 1 < parts.size()) {
            options.device = parts[++i];
        } else if (parts[i] == "--folder" && i + 1 < parts.size()) {
            options.source_subfolder = parts[++i];
        } else {
            throw std::runtime_error("invalid_argument: Unknown FILES option " + parts[i]);
        }
    }

    Manifest manifest = this->service.listFiles(options);
    nlohmann::json list = nlohmann::json::array();
    for (const auto &entry : manifest.getEntries()) {
        list.push_back({{"path", entry.relative_path}, {"size", entry.size}, {"size_human", human_size(static_cast<double>(entry.size))}});
    }
    nlohmann::json j = {
        {"count", manifest.size()},
        {"total_bytes", manifest.getTotalBytes()},
        {"files", list}
    };
    this->send("OK\n" + j.dump());
}

// runs on the server loop, other clients wait until the test file is written
void Session::speedTest() {
    nlohmann::json j = this->service.speedTest();
    this->send("OK\n" + j.dump());
}

void Session::config() {
    this->send("OK\n" + public_config(this->service.getConfig()).dump());
}

void Session::setConfig(const std::string &msg) {
    size_t pos = msg.find_first_of(" \n");
    if (pos == std::string::npos) {
        throw std::runtime_error("no_config: SETCONFIG command requires a json object");
    }

    nlohmann::json update;
    try {
        update = nlohmann::json::parse(msg.substr(pos + 1));
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error(std::string("invalid_json: ") + e.what());
    }
    this->service.updateConfig(update);
    this->send("OK\n" + public_config(this->service.getConfig()).dump());
}
