#include "config.hpp"
#include <stdio.h>
#include <iostream>

std::string Config::log_level_str_ = "info";
std::string Config::log_path_;
enum LOGGER_LEVEL Config::log_level_ = LOGGER_INFO_LEVEL;

DemuxConfig Config::demux_config_;

int Config::load(const std::string& conf_file) {
    FILE* fh_p = fopen(conf_file.c_str(), "r");
    if (!fh_p) {
        std::cout << "open file:" << conf_file << " error\r\n";
        return -1;
    }

    std::string content;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), fh_p)) > 0) {
        content.append(buffer, n);
    }
    bool read_error = ferror(fh_p) != 0;
    fclose(fh_p);

    if (read_error || content.empty()) {
        std::cout << "read file error:" << conf_file << "\r\n";
        return -2;
    }

    return init((const uint8_t*)content.data(), content.length());
}

void Config::reset() {
    log_level_str_ = "info";
    log_level_     = LOGGER_INFO_LEVEL;
    log_path_.clear();
    demux_config_  = DemuxConfig();
}

void Config::apply_log() {
    Logger::get_instance()->set_level(log_level_);
    Logger::get_instance()->set_filename(log_path_);
}

int Config::init_log(const json& json_object) {
    auto log_level_iter = json_object.find("level");
    if (log_level_iter == json_object.end()) {
        log_level_str_ = "info";
    } else {
        log_level_str_ = log_level_iter->get<std::string>();
    }

    auto log_path_iter = json_object.find("file");
    if (log_path_iter == json_object.end()) {
        log_path_ = "";
    } else {
        log_path_ = log_path_iter->get<std::string>();
    }

    if(log_level_str_ == "debug") {
        log_level_ = LOGGER_DEBUG_LEVEL;
    } else if (log_level_str_ == "info") {
        log_level_ = LOGGER_INFO_LEVEL;
    } else if (log_level_str_ == "warn") {
        log_level_ = LOGGER_WARN_LEVEL;
    } else if (log_level_str_ == "error") {
        log_level_ = LOGGER_ERROR_LEVEL;
    } else {
        std::cout << "unknown log level:" << log_level_str_ << ", use info\r\n";
        log_level_str_ = "info";
        log_level_ = LOGGER_INFO_LEVEL;
    }
    return 0;
}

int Config::get_uint32(const json& json_object, const char* key, bool allow_zero, uint32_t& value) {
    auto iter = json_object.find(key);
    if (iter == json_object.end()) {
        return 0;
    }

    int64_t number = iter->get<int64_t>();
    if ((number < 0) || (number > (int64_t)UINT32_MAX) || (!allow_zero && (number == 0))) {
        std::cout << key << " is out of range:" << number << "\r\n";
        return -1;
    }
    value = (uint32_t)number;
    return 1;
}

int Config::init_demux(const json& json_object) {
    uint32_t depth = 0;
    int ret = get_uint32(json_object, "amf_max_depth", false, depth);
    if (ret < 0) {
        return ret;
    }
    if (ret > 0) {
        if (depth > DEMUX_AMF_DEPTH_LIMIT) {
            std::cout << "amf_max_depth:" << depth << " is clamped to " << DEMUX_AMF_DEPTH_LIMIT << "\r\n";
            depth = DEMUX_AMF_DEPTH_LIMIT;
        }
        demux_config_.amf_max_depth = (int)depth;
    }

    ret = get_uint32(json_object, "amf_max_items", false, demux_config_.amf_max_items);
    if (ret < 0) {
        return ret;
    }

    auto check_iter = json_object.find("check_previous_tag_size");
    if (check_iter != json_object.end()) {
        demux_config_.check_previous_tag_size = check_iter->get<bool>();
    }

    ret = get_uint32(json_object, "max_tag_data_size", true, demux_config_.max_tag_data_size);
    if (ret < 0) {
        return ret;
    }
    return 0;
}

int Config::init(const uint8_t* data, size_t len) {
    int ret = 0;

    try {
        auto data_json = json::parse(data, data + len);

        auto log_iter = data_json.find("log");
        if (log_iter != data_json.end()) {
            ret = init_log(*log_iter);
            if (ret < 0) {
                std::cout << "init log config error" << "\r\n";
                return ret;
            }
        }

        auto demux_iter = data_json.find("demux");
        if (demux_iter != data_json.end()) {
            ret = init_demux(*demux_iter);
            if (ret < 0) {
                std::cout << "init demux config error" << "\r\n";
                return ret;
            }
        }
    } catch(const json::exception& e) {
        std::cerr << "config json error:" << e.what() << '\n';
        return -3;
    }
    return 0;
}
