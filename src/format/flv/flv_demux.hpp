#ifndef FLV_DEMUXER_HPP
#define FLV_DEMUXER_HPP
#include "data_buffer.hpp"
#include "config.hpp"
#include "format/av_format_interface.hpp"
#include "format/flv/flv_pub.hpp"
#include "format/flv/flv_tag.hpp"

#include <stdint.h>
#include <string>

typedef enum {
    FLV_STATE_AWAITING_HEADER = 0,
    FLV_STATE_SKIPPING,//bytes between the 9 bytes header and data offset
    FLV_STATE_AWAITING_TAG,
    FLV_STATE_AWAITING_PAYLOAD,
    FLV_STATE_DONE,
    FLV_STATE_FATAL
} FLV_DEMUX_STATE;

std::string flv_state_tostring(FLV_DEMUX_STATE state);

class flv_error
{
public:
    std::string dump() const;

public:
    int code_ = FLV_RET_OK;
    uint64_t offset_ = 0;//absolute byte offset in the stream
    std::string desc_;
};

/*
 * Incremental flv demuxer.
 *
 * Bytes are appended with input_data() in chunks of any size and tags are
 * pulled with read_tag(), which returns:
 *   FLV_RET_OK         a tag was decoded
 *   FLV_RET_NEED_MORE  append more bytes and call again, nothing was lost
 *   FLV_RET_DONE       input_end() was called and the stream ended on a tag boundary
 *   FLV_ERR_*          fatal, every later call returns the same code
 * Consumed bytes are dropped from the internal buffer at each step.
 */
class flv_demuxer
{
public:
    flv_demuxer(flv_tag_callback* cb = nullptr, const DemuxConfig& config = DemuxConfig());
    ~flv_demuxer();

public:
    int input_data(const uint8_t* data, size_t len);
    void input_end();
    int read_tag(FLV_TAG_PTR& tag_ptr);

    //push mode: append and hand every available tag to the callback
    int input_packet(const uint8_t* data, size_t len);
    int flush();

public:
    FLV_DEMUX_STATE state() const { return state_; }
    const flv_file_header& header() const { return header_; }
    bool header_ready() const { return header_ready_; }
    bool has_video() const { return header_.has_video_; }
    bool has_audio() const { return header_.has_audio_; }
    uint64_t consumed_bytes() const { return consumed_bytes_; }
    size_t buffered_bytes() const { return buffer_.data_len(); }
    const flv_error& last_error() const { return error_; }

private:
    int handle_header();
    int handle_skip();
    int handle_tag_header();
    int handle_payload(FLV_TAG_PTR& tag_ptr);
    int handle_end();
    int drain();

    void consume(size_t len);
    void check_previous_tag_size(uint32_t previous_tag_size);
    int set_fatal(int code, uint64_t offset, const std::string& desc);

private:
    flv_tag_callback* callback_ = nullptr;
    DemuxConfig config_;
    data_buffer buffer_;
    FLV_DEMUX_STATE state_ = FLV_STATE_AWAITING_HEADER;
    bool input_end_ = false;
    uint64_t consumed_bytes_ = 0;
    flv_error error_;

private:
    bool header_ready_ = false;
    flv_file_header header_;
    uint64_t skip_left_ = 0;

private:
    flv_tag_header tag_header_;
    uint64_t tag_offset_ = 0;
    uint32_t previous_tag_size_ = 0;
    uint32_t last_tag_size_ = 0;//header + data size of the last decoded tag
    bool first_tag_ = true;
};

#endif //FLV_DEMUXER_HPP
