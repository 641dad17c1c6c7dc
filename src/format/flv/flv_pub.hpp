#ifndef FLV_PUB_HPP
#define FLV_PUB_HPP
#include <stdint.h>
#include <string>

#define FLV_HEADER_LEN     9
#define FLV_TAG_PRE_SIZE   4
#define FLV_TAG_HEADER_LEN 11

#define FLV_TAG_AUDIO  0x08
#define FLV_TAG_VIDEO  0x09
#define FLV_TAG_SCRIPT 0x12

#define FLV_HEADER_FLAG_VIDEO 0x01
#define FLV_HEADER_FLAG_AUDIO 0x04

/* return values of the demuxer, errors are negative */
#define FLV_RET_OK        0
#define FLV_RET_NEED_MORE 1
#define FLV_RET_DONE      2

#define FLV_ERR_MALFORMED_HEADER  -1
#define FLV_ERR_UNKNOWN_TAG_TYPE  -2
#define FLV_ERR_TRUNCATED_PAYLOAD -3
#define FLV_ERR_PAYLOAD_OVERRUN   -4
#define FLV_ERR_AMF_DECODE        -5
#define FLV_ERR_TAG_TOO_LARGE     -6
#define FLV_ERR_INPUT_CLOSED      -7

/* offsets for packed values */
#define FLV_AUDIO_SOUNDTYPE_MASK     0x01
#define FLV_AUDIO_SAMPLESSIZE_OFFSET 1
#define FLV_AUDIO_SAMPLERATE_OFFSET  2
#define FLV_AUDIO_CODECID_OFFSET     4

#define FLV_VIDEO_FRAMETYPE_OFFSET 4
#define FLV_VIDEO_CODECID_MASK     0x0f

/* minimal framing widths of the payloads */
#define FLV_AUDIO_HEADER_LEN     1
#define FLV_AUDIO_AAC_HEADER_LEN 2
#define FLV_VIDEO_HEADER_LEN     1
#define FLV_VIDEO_AVC_HEADER_LEN 5

typedef enum {
    FLV_SOUND_PCM_NE      = 0,
    FLV_SOUND_ADPCM       = 1,
    FLV_SOUND_MP3         = 2,
    FLV_SOUND_PCM_LE      = 3,
    FLV_SOUND_NELLY_16K   = 4,
    FLV_SOUND_NELLY_8K    = 5,
    FLV_SOUND_NELLY       = 6,
    FLV_SOUND_ALAW        = 7,
    FLV_SOUND_MULAW       = 8,
    FLV_SOUND_OPUS        = 9, //reserved by adobe, used for opus by extended streams
    FLV_SOUND_AAC         = 10,
    FLV_SOUND_SPEEX       = 11,
    FLV_SOUND_MP3_8K      = 14,
    FLV_SOUND_DEVICE      = 15
} FLV_SOUND_FORMAT;

enum {
    FLV_SAMPLERATE_SPECIAL = 0, /**< signifies 5512Hz and 8000Hz in the case of NELLYMOSER */
    FLV_SAMPLERATE_11025HZ = 1,
    FLV_SAMPLERATE_22050HZ = 2,
    FLV_SAMPLERATE_44100HZ = 3,
};

enum {
    FLV_SAMPLESSIZE_8BIT  = 0,
    FLV_SAMPLESSIZE_16BIT = 1,
};

enum {
    FLV_MONO   = 0,
    FLV_STEREO = 1,
};

enum {
    FLV_AAC_SEQHDR = 0,
    FLV_AAC_RAW    = 1,
};

typedef enum {
    FLV_FRAME_KEY             = 1,
    FLV_FRAME_INTER           = 2,
    FLV_FRAME_DISPOSABLE      = 3,
    FLV_FRAME_GENERATED_KEY   = 4,
    FLV_FRAME_COMMAND         = 5
} FLV_FRAME_TYPE;

typedef enum {
    FLV_VIDEO_JPEG_CODEC    = 1,
    FLV_VIDEO_H263_CODEC    = 2,
    FLV_VIDEO_SCREEN_CODEC  = 3,
    FLV_VIDEO_VP6_CODEC     = 4,
    FLV_VIDEO_VP6A_CODEC    = 5,
    FLV_VIDEO_SCREEN2_CODEC = 6,
    FLV_VIDEO_H264_CODEC    = 7,
    FLV_VIDEO_H265_CODEC    = 12
} FLV_VIDEO_CODEC;

enum {
    FLV_VIDEO_AVC_SEQHDR = 0,
    FLV_VIDEO_AVC_NALU   = 1,
    FLV_VIDEO_AVC_EOS    = 2,
};

inline std::string flv_tagtype_tostring(uint8_t tag_type) {
    switch (tag_type) {
        case FLV_TAG_AUDIO: return "audio";
        case FLV_TAG_VIDEO: return "video";
        case FLV_TAG_SCRIPT: return "script";
        default: return "unknown";
    }
}

inline std::string flv_soundformat_tostring(uint8_t format) {
    switch (format) {
        case FLV_SOUND_PCM_NE: return "pcm";
        case FLV_SOUND_ADPCM: return "adpcm";
        case FLV_SOUND_MP3: return "mp3";
        case FLV_SOUND_PCM_LE: return "pcm_le";
        case FLV_SOUND_NELLY_16K: return "nellymoser_16k";
        case FLV_SOUND_NELLY_8K: return "nellymoser_8k";
        case FLV_SOUND_NELLY: return "nellymoser";
        case FLV_SOUND_ALAW: return "alaw";
        case FLV_SOUND_MULAW: return "mulaw";
        case FLV_SOUND_OPUS: return "opus";
        case FLV_SOUND_AAC: return "aac";
        case FLV_SOUND_SPEEX: return "speex";
        case FLV_SOUND_MP3_8K: return "mp3_8k";
        case FLV_SOUND_DEVICE: return "device";
        default: return "unknown";
    }
}

inline std::string flv_videocodec_tostring(uint8_t codec_id) {
    switch (codec_id) {
        case FLV_VIDEO_JPEG_CODEC: return "jpeg";
        case FLV_VIDEO_H263_CODEC: return "h263";
        case FLV_VIDEO_SCREEN_CODEC: return "screen";
        case FLV_VIDEO_VP6_CODEC: return "vp6";
        case FLV_VIDEO_VP6A_CODEC: return "vp6a";
        case FLV_VIDEO_SCREEN2_CODEC: return "screen2";
        case FLV_VIDEO_H264_CODEC: return "h264";
        case FLV_VIDEO_H265_CODEC: return "h265";
        default: return "unknown";
    }
}

inline std::string flv_frametype_tostring(uint8_t frame_type) {
    switch (frame_type) {
        case FLV_FRAME_KEY: return "key";
        case FLV_FRAME_INTER: return "inter";
        case FLV_FRAME_DISPOSABLE: return "disposable";
        case FLV_FRAME_GENERATED_KEY: return "generated_key";
        case FLV_FRAME_COMMAND: return "command";
        default: return "unknown";
    }
}

inline std::string flv_error_tostring(int code) {
    switch (code) {
        case FLV_RET_OK: return "ok";
        case FLV_RET_NEED_MORE: return "need more input";
        case FLV_RET_DONE: return "done";
        case FLV_ERR_MALFORMED_HEADER: return "malformed header";
        case FLV_ERR_UNKNOWN_TAG_TYPE: return "unknown tag type";
        case FLV_ERR_TRUNCATED_PAYLOAD: return "truncated payload";
        case FLV_ERR_PAYLOAD_OVERRUN: return "payload overrun";
        case FLV_ERR_AMF_DECODE: return "amf decode error";
        case FLV_ERR_TAG_TOO_LARGE: return "tag too large";
        case FLV_ERR_INPUT_CLOSED: return "input closed";
        default: return "unknown error";
    }
}

inline bool flv_video_has_avc_header(uint8_t codec_id) {
    return (codec_id == FLV_VIDEO_H264_CODEC) || (codec_id == FLV_VIDEO_H265_CODEC);
}

#endif
