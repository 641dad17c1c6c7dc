#include "flv_tag.hpp"
#include "byte_stream.hpp"
#include "logger.hpp"

#include <sstream>

static DATA_BUFFER_PTR make_payload_buffer(const uint8_t* data, size_t len) {
    DATA_BUFFER_PTR buffer_ptr = std::make_shared<data_buffer>(len);

    buffer_ptr->append_data((const char*)data, len);
    return buffer_ptr;
}

std::string flv_file_header::dump() const {
    std::stringstream ss;

    ss << "flv version:" << (int)version_ << ", flags:0x" << std::hex << (int)flags_ << std::dec
       << ", has audio:" << has_audio_ << ", has video:" << has_video_
       << ", data offset:" << data_offset_;
    return ss.str();
}

int flv_audio_payload::sample_rate_hz() const {
    switch (sound_rate_) {
        case FLV_SAMPLERATE_SPECIAL: return 5512;
        case FLV_SAMPLERATE_11025HZ: return 11025;
        case FLV_SAMPLERATE_22050HZ: return 22050;
        default: return 44100;
    }
}

AMF_VALUE_PTR flv_script_payload::find(const std::string& name) const {
    for (const auto& iter : items_) {
        if (iter.first == name) {
            return iter.second;
        }
    }
    return nullptr;
}

int64_t flv_tag::pts() const {
    if (video_ && video_->has_avc_header()) {
        return (int64_t)header_.timestamp_ + video_->composition_time_;
    }
    return header_.timestamp_;
}

std::string flv_tag::dump() const {
    std::stringstream ss;

    ss << "tag type:" << flv_tagtype_tostring(header_.tag_type_) << ", offset:" << offset_
       << ", data size:" << header_.data_size_ << ", dts:" << dts() << ", pts:" << pts();
    if (audio_) {
        ss << ", sound format:" << flv_soundformat_tostring(audio_->sound_format_)
           << ", rate:" << audio_->sample_rate_hz() << ", bits:" << audio_->sample_bits()
           << ", channels:" << audio_->channels() << ", is seqhdr:" << audio_->is_seq_hdr()
           << ", data len:" << audio_->data_ptr_->data_len();
    } else if (video_) {
        ss << ", frame type:" << flv_frametype_tostring(video_->frame_type_)
           << ", codec:" << flv_videocodec_tostring(video_->codec_id_)
           << ", is seqhdr:" << video_->is_seq_hdr()
           << ", data len:" << video_->data_ptr_->data_len();
    } else if (script_) {
        ss << ", items:" << script_->items_.size();
        for (const auto& iter : script_->items_) {
            ss << " " << iter.first;
        }
    }
    return ss.str();
}

int flv_header_decode(const uint8_t* data, size_t len, flv_file_header& header) {
    if (len < FLV_HEADER_LEN) {
        return FLV_RET_NEED_MORE;
    }

    if (!bytes_is_equal((const char*)data, "FLV", 3)) {
        log_info_data(data, FLV_HEADER_LEN, "flv signature error");
        return FLV_ERR_MALFORMED_HEADER;
    }

    header.version_     = data[3];
    header.flags_       = data[4];
    header.has_video_   = (data[4] & FLV_HEADER_FLAG_VIDEO) == FLV_HEADER_FLAG_VIDEO;
    header.has_audio_   = (data[4] & FLV_HEADER_FLAG_AUDIO) == FLV_HEADER_FLAG_AUDIO;
    header.data_offset_ = read_4bytes(data + 5);

    if (header.data_offset_ < FLV_HEADER_LEN) {
        log_errorf("flv data offset:%u is less than header length", header.data_offset_);
        return FLV_ERR_MALFORMED_HEADER;
    }
    return FLV_RET_OK;
}

int flv_tag_header_decode(const uint8_t* data, size_t len, flv_tag_header& header) {
    if (len < FLV_TAG_HEADER_LEN) {
        return FLV_RET_NEED_MORE;
    }
    const uint8_t* p = data;

    uint8_t tag_type = p[0];
    if ((tag_type != FLV_TAG_AUDIO) && (tag_type != FLV_TAG_VIDEO) && (tag_type != FLV_TAG_SCRIPT)) {
        log_errorf("does not suport tag type:0x%02x", tag_type);
        return FLV_ERR_UNKNOWN_TAG_TYPE;
    }
    p++;

    header.tag_type_  = tag_type;
    header.data_size_ = read_3bytes(p);
    p += 3;
    header.timestamp_ = read_3bytes(p);
    p += 3;
    header.timestamp_ |= ((uint32_t)p[0]) << 24;
    p++;
    header.stream_id_ = read_3bytes(p);

    if (header.stream_id_ != 0) {
        log_debugf("tag stream id is not zero:%u", header.stream_id_);
    }
    return FLV_RET_OK;
}

int flv_audio_payload_decode(const uint8_t* data, size_t len, flv_audio_payload& payload) {
    if (len < FLV_AUDIO_HEADER_LEN) {
        log_errorf("audio tag data size:%zu is too small", len);
        return FLV_ERR_TRUNCATED_PAYLOAD;
    }
    size_t header_len = FLV_AUDIO_HEADER_LEN;

    payload.sound_format_ = (data[0] >> FLV_AUDIO_CODECID_OFFSET) & 0x0f;
    payload.sound_rate_   = (data[0] >> FLV_AUDIO_SAMPLERATE_OFFSET) & 0x03;
    payload.sound_size_   = (data[0] >> FLV_AUDIO_SAMPLESSIZE_OFFSET) & 0x01;
    payload.sound_type_   = data[0] & FLV_AUDIO_SOUNDTYPE_MASK;

    if (payload.is_aac()) {
        if (len < FLV_AUDIO_AAC_HEADER_LEN) {
            log_errorf("aac tag data size:%zu has no packet type", len);
            return FLV_ERR_TRUNCATED_PAYLOAD;
        }
        payload.aac_packet_type_ = data[1];
        header_len = FLV_AUDIO_AAC_HEADER_LEN;
    }

    payload.data_ptr_ = make_payload_buffer(data + header_len, len - header_len);
    return FLV_RET_OK;
}

int flv_video_payload_decode(const uint8_t* data, size_t len, flv_video_payload& payload) {
    if (len < FLV_VIDEO_HEADER_LEN) {
        log_errorf("video tag data size:%zu is too small", len);
        return FLV_ERR_TRUNCATED_PAYLOAD;
    }
    size_t header_len = FLV_VIDEO_HEADER_LEN;

    payload.frame_type_ = (data[0] >> FLV_VIDEO_FRAMETYPE_OFFSET) & 0x0f;
    payload.codec_id_   = data[0] & FLV_VIDEO_CODECID_MASK;

    if (payload.has_avc_header()) {
        if (len < FLV_VIDEO_AVC_HEADER_LEN) {
            log_errorf("%s tag data size:%zu has no avc header",
                flv_videocodec_tostring(payload.codec_id_).c_str(), len);
            return FLV_ERR_TRUNCATED_PAYLOAD;
        }
        payload.avc_packet_type_  = data[1];
        payload.composition_time_ = read_3bytes_signed(data + 2);
        header_len = FLV_VIDEO_AVC_HEADER_LEN;
    }

    payload.data_ptr_ = make_payload_buffer(data + header_len, len - header_len);
    return FLV_RET_OK;
}

int flv_script_payload_decode(const uint8_t* data, size_t len, flv_script_payload& payload,
                              int max_depth, uint32_t max_items, size_t& err_pos) {
    byte_reader reader(data, len);
    uint8_t marker = 0;
    uint32_t items_left = max_items;

    while (reader.peek_1byte(marker) == BYTE_READER_OK) {
        if (marker != AMF_DATA_TYPE_STRING) {
            break;
        }
        reader.skip(1);

        std::string name;
        int ret = AMF_Decoder::decode_string(reader, name);
        if (ret == AMF_RET_OK) {
            AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
            ret = AMF_Decoder::decode(reader, *value_ptr, max_depth, items_left);
            if (ret == AMF_RET_OK) {
                payload.items_.push_back(std::make_pair(name, value_ptr));
                continue;
            }
        }

        err_pos = reader.pos();
        if (ret == AMF_RET_OVERRUN) {
            log_errorf("script data item:%s runs past the tag end, pos:%zu", name.c_str(), err_pos);
            return FLV_ERR_PAYLOAD_OVERRUN;
        }
        log_errorf("script data item:%s decode error, pos:%zu", name.c_str(), err_pos);
        return FLV_ERR_AMF_DECODE;
    }

    if (!reader.empty()) {
        log_debugf("script data keeps %zu trailing bytes", reader.left());
        payload.trailing_ptr_ = make_payload_buffer(reader.current(), reader.left());
    }
    err_pos = reader.pos();
    return FLV_RET_OK;
}
