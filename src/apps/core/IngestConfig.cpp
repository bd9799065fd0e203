#include "apps/core/IngestConfig.hpp"

#include <iostream>

#include <opencv2/core.hpp>

namespace core {

namespace {

void readDouble(const cv::FileNode& n, double& v) {
    if (!n.empty() && n.isReal()) v = static_cast<double>(n);
    else if (!n.empty() && n.isInt()) v = static_cast<double>(static_cast<int>(n));
}

void readUInt(const cv::FileNode& n, uint32_t& v) {
    if (!n.empty() && n.isInt() && static_cast<int>(n) >= 0) v = static_cast<uint32_t>(static_cast<int>(n));
}

void readBool(const cv::FileNode& n, bool& v) {
    if (!n.empty() && n.isInt()) v = (static_cast<int>(n) != 0);
}

void readString(const cv::FileNode& n, std::string& v) {
    if (!n.empty() && n.isString()) v = static_cast<std::string>(n);
}

} // namespace

IngestConfig sanitise(const IngestConfig& in) {
    IngestConfig cfg = in;

    if (cfg.BATCH_MAX_LINES == 0) cfg.BATCH_MAX_LINES = 256;
    if (cfg.FORWARD.TIMEOUT_MS == 0 || cfg.FORWARD.TIMEOUT_MS > 10000) cfg.FORWARD.TIMEOUT_MS = 500;
    if (cfg.FORWARD.PORT == 0) cfg.FORWARD_ENABLED = false;

    // Calibration and solver settings are sanitised by their own modules
    return cfg;
}

const char* modeName(IngestMode mode) {
    switch (mode) {
        case IngestMode::RAW_INGEST: return "raw";
        case IngestMode::PROCESS: return "process";
        default: return "unknown";
    }
}

bool parseMode(const std::string& text, IngestMode& mode) {
    if (text == "raw") { mode = IngestMode::RAW_INGEST; return true; }
    if (text == "process") { mode = IngestMode::PROCESS; return true; }
    return false;
}

bool loadConfig(const std::string& path, IngestConfig& cfg) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            std::cerr << "[CONFIG] could not open " << path << "\n";
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[CONFIG] parse error in " << path << ": " << e.what() << "\n";
        return false;
    }

    readDouble(fs["calibration_offset"], cfg.CALIBRATION.OFFSET);
    readDouble(fs["sentinel_tolerance"], cfg.CALIBRATION.SENTINEL_TOLERANCE);
    readDouble(fs["singular_det_eps"], cfg.SOLVER.SINGULAR_DET_EPS);

    const cv::FileNode tags = fs["calibration_tags"];
    if (!tags.empty() && tags.isSeq()) {
        cfg.CALIBRATION.CALIBRATION_TAGS.clear();
        for (cv::FileNodeIterator it = tags.begin(); it != tags.end(); ++it) {
            const cv::FileNode t = *it;
            if (t.isString()) cfg.CALIBRATION.CALIBRATION_TAGS.push_back(static_cast<std::string>(t));
            else if (t.isInt()) cfg.CALIBRATION.CALIBRATION_TAGS.push_back(std::to_string(static_cast<int>(t)));
        }
    }

    std::string mode;
    readString(fs["mode"], mode);
    if (!mode.empty() && !parseMode(mode, cfg.MODE)) {
        std::cerr << "[CONFIG] unknown mode '" << mode << "', keeping " << modeName(cfg.MODE) << "\n";
    }

    readUInt(fs["batch_max_lines"], cfg.BATCH_MAX_LINES);
    readBool(fs["verbose"], cfg.VERBOSE);

    const cv::FileNode fwd = fs["forward"];
    if (!fwd.empty() && fwd.isMap()) {
        readBool(fwd["enabled"], cfg.FORWARD_ENABLED);
        readString(fwd["host"], cfg.FORWARD.HOST);
        uint32_t port = cfg.FORWARD.PORT;
        readUInt(fwd["port"], port);
        if (port <= 0xFFFFu) cfg.FORWARD.PORT = static_cast<uint16_t>(port);
        readUInt(fwd["timeout_ms"], cfg.FORWARD.TIMEOUT_MS);
    }

    fs.release();
    cfg = sanitise(cfg);

    std::cout << "[CONFIG] loaded " << path
              << " offset=" << cfg.CALIBRATION.OFFSET
              << " mode=" << modeName(cfg.MODE)
              << " forward=" << (cfg.FORWARD_ENABLED ? "on" : "off") << "\n";
    return true;
}

} // namespace core
