#include "flv_tag.hpp"
#include "logger.hpp"

#include <stddef.h>
#include <stdint.h>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    Logger::get_instance()->set_level(LOGGER_ERROR_LEVEL);

    flv_file_header header;
    flv_header_decode(data, size, header);
    return 0;
}
