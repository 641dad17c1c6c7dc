#ifndef FLV_DEMUX_CONFIG_H
#define FLV_DEMUX_CONFIG_H

#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <sstream>

using json = nlohmann::json;

#define DEMUX_DEF_AMF_MAX_DEPTH 64
#define DEMUX_AMF_DEPTH_LIMIT   1024 //larger configured depths are clamped
#define DEMUX_DEF_AMF_MAX_ITEMS (64*1024)
#define DEMUX_DEF_MAX_TAG_SIZE  0 //unlimited

class DemuxConfig
{
public:
    DemuxConfig() {};
    ~DemuxConfig() {};

public:
    std::string dump() const {
        std::stringstream ss;

        ss << "demux config:\r\n";
        ss << "  amf max depth: " << amf_max_depth << "\r\n";
        ss << "  amf max items: " << amf_max_items << "\r\n";
        ss << "  check previous tag size: " << check_previous_tag_size << "\r\n";
        ss << "  max tag data size: " << max_tag_data_size << "\r\n";

        return ss.str();
    }

public:
    int amf_max_depth = DEMUX_DEF_AMF_MAX_DEPTH;
    uint32_t amf_max_items = DEMUX_DEF_AMF_MAX_ITEMS;//amf values allowed in one script tag
    bool check_previous_tag_size = true;
    uint32_t max_tag_data_size = DEMUX_DEF_MAX_TAG_SIZE;
};

class Config
{
public:
    static int load(const std::string& conf_file);
    static int init(const uint8_t* data, size_t len);
    static void reset();

    static std::string dump() {
        std::stringstream ss;

        ss << "log file path:" << log_path_ << "\r\n";
        ss << "log file level:" << log_level_str_ << "\r\n";
        ss << demux_config_.dump();

        return ss.str();
    }

    //push the log settings to the Logger singleton
    static void apply_log();

public:
    static DemuxConfig demux_config() { return demux_config_; }

public:
    static std::string log_filename() { return log_path_; }
    static enum LOGGER_LEVEL log_level() { return log_level_; }

private:
    static int init_log(const json& json_object);
    static int init_demux(const json& json_object);
    static int get_uint32(const json& json_object, const char* key, bool allow_zero, uint32_t& value);

private:
    static std::string log_level_str_;//"debug", "info", "warn", "error"
    static enum LOGGER_LEVEL log_level_;
    static std::string log_path_;

private:
    static DemuxConfig demux_config_;
};

#endif
