#include "flv_demux.hpp"
#include "logger.hpp"

#include <stddef.h>
#include <stdint.h>

static const uint8_t s_flv_header[FLV_HEADER_LEN] = {'F', 'L', 'V', 0x01, 0x05, 0x00, 0x00, 0x00, 0x09};

static void demux_all(const uint8_t* data, size_t size, bool with_header) {
    flv_demuxer demuxer;
    FLV_TAG_PTR tag_ptr;

    if (with_header) {
        demuxer.input_data(s_flv_header, sizeof(s_flv_header));
    }
    if (demuxer.input_data(data, size) < 0) {
        return;
    }
    demuxer.input_end();

    while (demuxer.read_tag(tag_ptr) == FLV_RET_OK) {
    }
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    Logger::get_instance()->set_level(LOGGER_ERROR_LEVEL);

    demux_all(data, size, true);
    demux_all(data, size, false);
    return 0;
}
