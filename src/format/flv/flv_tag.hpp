#ifndef FLV_TAG_HPP
#define FLV_TAG_HPP
#include "flv_pub.hpp"
#include "data_buffer.hpp"
#include "format/amf/amf0.hpp"

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <memory>

class flv_file_header
{
public:
    std::string dump() const;

public:
    uint8_t version_      = 0;
    uint8_t flags_        = 0;
    bool has_audio_       = false;
    bool has_video_       = false;
    uint32_t data_offset_ = FLV_HEADER_LEN;
};

class flv_tag_header
{
public:
    uint8_t tag_type_    = 0;
    uint32_t data_size_  = 0;
    uint32_t timestamp_  = 0;//24 bits timestamp with the extended byte as bits 24-31
    uint32_t stream_id_  = 0;
};

class flv_audio_payload
{
public:
    bool is_aac() const { return sound_format_ == FLV_SOUND_AAC; }
    bool is_seq_hdr() const { return is_aac() && (aac_packet_type_ == FLV_AAC_SEQHDR); }
    int sample_rate_hz() const;
    int sample_bits() const { return (sound_size_ == FLV_SAMPLESSIZE_16BIT) ? 16 : 8; }
    int channels() const { return (sound_type_ == FLV_STEREO) ? 2 : 1; }

public:
    uint8_t sound_format_    = 0;
    uint8_t sound_rate_      = 0;
    uint8_t sound_size_      = 0;
    uint8_t sound_type_      = 0;
    uint8_t aac_packet_type_ = 0;//only for aac
    DATA_BUFFER_PTR data_ptr_;
};

class flv_video_payload
{
public:
    bool has_avc_header() const { return flv_video_has_avc_header(codec_id_); }
    bool is_key_frame() const { return frame_type_ == FLV_FRAME_KEY; }
    bool is_seq_hdr() const { return has_avc_header() && (avc_packet_type_ == FLV_VIDEO_AVC_SEQHDR); }

public:
    uint8_t frame_type_      = 0;
    uint8_t codec_id_        = 0;
    uint8_t avc_packet_type_ = 0;//only for avc/hevc
    int32_t composition_time_ = 0;//pts - dts in milliseconds, only for avc/hevc
    DATA_BUFFER_PTR data_ptr_;
};

/*
 * Script data: (name, value) pairs in stream order, normally a single
 * "onMetaData" pair. Bytes after the last complete pair are kept verbatim.
 */
class flv_script_payload
{
public:
    AMF_VALUE_PTR find(const std::string& name) const;

public:
    AMF_PROPERTIES items_;
    DATA_BUFFER_PTR trailing_ptr_;
};

typedef std::shared_ptr<flv_audio_payload> FLV_AUDIO_PAYLOAD_PTR;
typedef std::shared_ptr<flv_video_payload> FLV_VIDEO_PAYLOAD_PTR;
typedef std::shared_ptr<flv_script_payload> FLV_SCRIPT_PAYLOAD_PTR;

/*
 * One decoded tag. Exactly one of the payload pointers is set, matching header_.tag_type_.
 */
class flv_tag
{
public:
    bool is_audio() const { return header_.tag_type_ == FLV_TAG_AUDIO; }
    bool is_video() const { return header_.tag_type_ == FLV_TAG_VIDEO; }
    bool is_script() const { return header_.tag_type_ == FLV_TAG_SCRIPT; }

    int64_t dts() const { return header_.timestamp_; }
    int64_t pts() const;
    std::string dump() const;

public:
    flv_tag_header header_;
    uint32_t previous_tag_size_ = 0;
    uint64_t offset_ = 0;//byte offset of the tag header in the stream

    FLV_AUDIO_PAYLOAD_PTR audio_;
    FLV_VIDEO_PAYLOAD_PTR video_;
    FLV_SCRIPT_PAYLOAD_PTR script_;
};

typedef std::shared_ptr<flv_tag> FLV_TAG_PTR;

/* 9 bytes file header: FLV_RET_OK, FLV_RET_NEED_MORE or FLV_ERR_MALFORMED_HEADER */
int flv_header_decode(const uint8_t* data, size_t len, flv_file_header& header);

/* 11 bytes tag header: FLV_RET_OK, FLV_RET_NEED_MORE or FLV_ERR_UNKNOWN_TAG_TYPE */
int flv_tag_header_decode(const uint8_t* data, size_t len, flv_tag_header& header);

/*
 * Payload decoders take exactly data_size bytes.
 * Audio/video fail with FLV_ERR_TRUNCATED_PAYLOAD when the framing fields do not fit.
 * Script data fails with FLV_ERR_AMF_DECODE or FLV_ERR_PAYLOAD_OVERRUN, err_pos is set
 * to the offset inside the payload where decoding stopped. max_items bounds the number
 * of amf values of the whole payload.
 */
int flv_audio_payload_decode(const uint8_t* data, size_t len, flv_audio_payload& payload);
int flv_video_payload_decode(const uint8_t* data, size_t len, flv_video_payload& payload);
int flv_script_payload_decode(const uint8_t* data, size_t len, flv_script_payload& payload,
                              int max_depth, uint32_t max_items, size_t& err_pos);

#endif //FLV_TAG_HPP
