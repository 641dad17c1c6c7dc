#include "flv_demux.hpp"
#include "logger.hpp"
#include "byte_stream.hpp"
#include "flv_pub.hpp"

#include <sstream>

std::string flv_state_tostring(FLV_DEMUX_STATE state) {
    switch (state) {
        case FLV_STATE_AWAITING_HEADER: return "awaiting header";
        case FLV_STATE_SKIPPING: return "skipping";
        case FLV_STATE_AWAITING_TAG: return "awaiting tag";
        case FLV_STATE_AWAITING_PAYLOAD: return "awaiting payload";
        case FLV_STATE_DONE: return "done";
        case FLV_STATE_FATAL: return "fatal";
        default: return "unknown";
    }
}

std::string flv_error::dump() const {
    std::stringstream ss;

    ss << "flv error:" << flv_error_tostring(code_) << "(" << code_ << ")"
       << ", offset:" << offset_ << ", " << desc_;
    return ss.str();
}

flv_demuxer::flv_demuxer(flv_tag_callback* cb, const DemuxConfig& config):callback_(cb)
    , config_(config)
{
}

flv_demuxer::~flv_demuxer()
{
}

int flv_demuxer::input_data(const uint8_t* data, size_t len) {
    if (state_ == FLV_STATE_FATAL) {
        return error_.code_;
    }
    if (input_end_) {
        log_errorf("flv input is closed, drop %zu bytes", len);
        return FLV_ERR_INPUT_CLOSED;
    }
    buffer_.append_data((const char*)data, len);
    return FLV_RET_OK;
}

void flv_demuxer::input_end() {
    input_end_ = true;
}

int flv_demuxer::read_tag(FLV_TAG_PTR& tag_ptr) {
    int ret = FLV_RET_OK;

    tag_ptr = nullptr;
    while (ret == FLV_RET_OK) {
        switch (state_) {
            case FLV_STATE_AWAITING_HEADER:
            {
                ret = handle_header();
                break;
            }
            case FLV_STATE_SKIPPING:
            {
                ret = handle_skip();
                break;
            }
            case FLV_STATE_AWAITING_TAG:
            {
                ret = handle_tag_header();
                break;
            }
            case FLV_STATE_AWAITING_PAYLOAD:
            {
                ret = handle_payload(tag_ptr);
                if (ret == FLV_RET_OK) {
                    return FLV_RET_OK;
                }
                break;
            }
            case FLV_STATE_DONE:
            {
                return FLV_RET_DONE;
            }
            default:
            {
                return error_.code_;
            }
        }
    }
    return ret;
}

int flv_demuxer::input_packet(const uint8_t* data, size_t len) {
    int ret = input_data(data, len);
    if (ret < 0) {
        return ret;
    }
    return drain();
}

int flv_demuxer::flush() {
    input_end();
    return drain();
}

int flv_demuxer::drain() {
    int ret = 0;

    do {
        FLV_TAG_PTR tag_ptr;

        ret = read_tag(tag_ptr);
        if ((ret == FLV_RET_OK) && callback_) {
            int cb_ret = callback_->output_tag(tag_ptr);
            if (cb_ret < 0) {
                return cb_ret;
            }
        }
    } while (ret == FLV_RET_OK);

    return ret;
}

int flv_demuxer::handle_header() {
    if (!buffer_.require(FLV_HEADER_LEN)) {
        const uint8_t* p = (const uint8_t*)buffer_.data();
        const char* signature = "FLV";

        //reject non flv input without waiting for the whole header
        for (size_t index = 0; index < buffer_.data_len() && index < 3; index++) {
            if (p[index] != (uint8_t)signature[index]) {
                return set_fatal(FLV_ERR_MALFORMED_HEADER, consumed_bytes_ + index, "flv signature error");
            }
        }
        if (input_end_) {
            return set_fatal(FLV_ERR_MALFORMED_HEADER, consumed_bytes_, "input ends inside the flv header");
        }
        return FLV_RET_NEED_MORE;
    }

    int ret = flv_header_decode((const uint8_t*)buffer_.data(), buffer_.data_len(), header_);
    if (ret < 0) {
        return set_fatal(ret, consumed_bytes_, "flv header decode error");
    }
    log_infof("%s", header_.dump().c_str());

    consume(FLV_HEADER_LEN);
    header_ready_ = true;
    skip_left_ = header_.data_offset_ - FLV_HEADER_LEN;
    state_ = (skip_left_ > 0) ? FLV_STATE_SKIPPING : FLV_STATE_AWAITING_TAG;
    return FLV_RET_OK;
}

int flv_demuxer::handle_skip() {
    size_t skip_len = buffer_.data_len();

    if ((uint64_t)skip_len > skip_left_) {
        skip_len = (size_t)skip_left_;
    }
    consume(skip_len);
    skip_left_ -= skip_len;

    if (skip_left_ == 0) {
        state_ = FLV_STATE_AWAITING_TAG;
        return FLV_RET_OK;
    }
    if (input_end_) {
        return set_fatal(FLV_ERR_MALFORMED_HEADER, consumed_bytes_, "input ends before the flv data offset");
    }
    return FLV_RET_NEED_MORE;
}

int flv_demuxer::handle_tag_header() {
    if (!buffer_.require(FLV_TAG_PRE_SIZE + FLV_TAG_HEADER_LEN)) {
        return handle_end();
    }
    const uint8_t* p = (const uint8_t*)buffer_.data();

    uint32_t previous_tag_size = read_4bytes(p);
    int ret = flv_tag_header_decode(p + FLV_TAG_PRE_SIZE, FLV_TAG_HEADER_LEN, tag_header_);
    if (ret < 0) {
        std::stringstream ss;
        ss << "tag type:" << (int)p[FLV_TAG_PRE_SIZE] << " is not audio, video or script";
        return set_fatal(ret, consumed_bytes_ + FLV_TAG_PRE_SIZE, ss.str());
    }
    check_previous_tag_size(previous_tag_size);

    if ((config_.max_tag_data_size > 0) && (tag_header_.data_size_ > config_.max_tag_data_size)) {
        std::stringstream ss;
        ss << "tag data size:" << tag_header_.data_size_ << " exceeds limit:" << config_.max_tag_data_size;
        return set_fatal(FLV_ERR_TAG_TOO_LARGE, consumed_bytes_ + FLV_TAG_PRE_SIZE, ss.str());
    }

    previous_tag_size_ = previous_tag_size;
    tag_offset_ = consumed_bytes_ + FLV_TAG_PRE_SIZE;
    consume(FLV_TAG_PRE_SIZE + FLV_TAG_HEADER_LEN);
    state_ = FLV_STATE_AWAITING_PAYLOAD;
    return FLV_RET_OK;
}

int flv_demuxer::handle_end() {
    if (!input_end_) {
        return FLV_RET_NEED_MORE;
    }

    size_t left = buffer_.data_len();
    if (left == FLV_TAG_PRE_SIZE) {
        check_previous_tag_size(read_4bytes((const uint8_t*)buffer_.data()));
        consume(FLV_TAG_PRE_SIZE);
        left = 0;
    }

    if (left == 0) {
        log_infof("flv stream ends, consumed bytes:%lu", (unsigned long)consumed_bytes_);
        state_ = FLV_STATE_DONE;
        return FLV_RET_DONE;
    }

    std::stringstream ss;
    ss << "input ends inside a tag header, left bytes:" << left;
    return set_fatal(FLV_ERR_TRUNCATED_PAYLOAD, consumed_bytes_, ss.str());
}

int flv_demuxer::handle_payload(FLV_TAG_PTR& tag_ptr) {
    uint32_t data_size = tag_header_.data_size_;

    if (!buffer_.require(data_size)) {
        if (input_end_) {
            std::stringstream ss;
            ss << "tag declares data size:" << data_size << " but input ends after "
               << buffer_.data_len() << " bytes";
            return set_fatal(FLV_ERR_TRUNCATED_PAYLOAD, tag_offset_, ss.str());
        }
        return FLV_RET_NEED_MORE;
    }

    const uint8_t* p = (const uint8_t*)buffer_.data();
    FLV_TAG_PTR output_tag_ptr = std::make_shared<flv_tag>();
    size_t err_pos = 0;
    int ret = FLV_RET_OK;

    output_tag_ptr->header_ = tag_header_;
    output_tag_ptr->previous_tag_size_ = previous_tag_size_;
    output_tag_ptr->offset_ = tag_offset_;

    if (tag_header_.tag_type_ == FLV_TAG_AUDIO) {
        output_tag_ptr->audio_ = std::make_shared<flv_audio_payload>();
        ret = flv_audio_payload_decode(p, data_size, *output_tag_ptr->audio_);
    } else if (tag_header_.tag_type_ == FLV_TAG_VIDEO) {
        output_tag_ptr->video_ = std::make_shared<flv_video_payload>();
        ret = flv_video_payload_decode(p, data_size, *output_tag_ptr->video_);
    } else {
        output_tag_ptr->script_ = std::make_shared<flv_script_payload>();
        ret = flv_script_payload_decode(p, data_size, *output_tag_ptr->script_,
                                        config_.amf_max_depth, config_.amf_max_items, err_pos);
    }

    if (ret < 0) {
        std::stringstream ss;
        ss << flv_tagtype_tostring(tag_header_.tag_type_) << " tag payload error, data size:" << data_size;
        return set_fatal(ret, tag_offset_ + FLV_TAG_HEADER_LEN + err_pos, ss.str());
    }

    //always advance by the declared size so the next tag starts in sync
    consume(data_size);
    last_tag_size_ = FLV_TAG_HEADER_LEN + data_size;
    first_tag_ = false;
    state_ = FLV_STATE_AWAITING_TAG;

    log_debugf("%s", output_tag_ptr->dump().c_str());
    if (output_tag_ptr->script_) {
        for (const auto& item : output_tag_ptr->script_->items_) {
            log_infof("script data name:%s", item.first.c_str());
            item.second->dump_amf(1);
        }
    }
    tag_ptr = output_tag_ptr;
    return FLV_RET_OK;
}

void flv_demuxer::consume(size_t len) {
    if (len == 0) {
        return;
    }
    buffer_.consume_data(len);
    consumed_bytes_ += len;
}

void flv_demuxer::check_previous_tag_size(uint32_t previous_tag_size) {
    if (!config_.check_previous_tag_size) {
        return;
    }
    uint32_t expected = first_tag_ ? 0 : last_tag_size_;
    if (previous_tag_size != expected) {
        log_warnf("previous tag size:%u does not match expected:%u at offset:%lu",
            previous_tag_size, expected, (unsigned long)consumed_bytes_);
    }
}

int flv_demuxer::set_fatal(int code, uint64_t offset, const std::string& desc) {
    error_.code_   = code;
    error_.offset_ = offset;
    error_.desc_   = desc;
    state_ = FLV_STATE_FATAL;
    buffer_.reset();

    log_errorf("%s", error_.dump().c_str());
    return code;
}
