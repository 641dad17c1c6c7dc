#include "byte_stream.hpp"

union av_intfloat64 {
    uint64_t i;
    double   f;
};

double av_int2double(uint64_t i)
{
    union av_intfloat64 v;
    v.i = i;
    return v.f;
}

uint64_t av_double2int(double f)
{
    union av_intfloat64 v;
    v.f = f;
    return v.i;
}

uint64_t read_8bytes(const uint8_t* data) {
    uint64_t value = 0;

    for (int i = 0; i < 8; i++) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint32_t read_4bytes(const uint8_t* data) {
    return ((uint32_t)data[0] << 24) | ((uint32_t)data[1] << 16)
         | ((uint32_t)data[2] << 8) | (uint32_t)data[3];
}

uint32_t read_3bytes(const uint8_t* data) {
    return ((uint32_t)data[0] << 16) | ((uint32_t)data[1] << 8) | (uint32_t)data[2];
}

uint16_t read_2bytes(const uint8_t* data) {
    return (uint16_t)(((uint16_t)data[0] << 8) | (uint16_t)data[1]);
}

int32_t read_3bytes_signed(const uint8_t* data) {
    uint32_t value = read_3bytes(data);

    if (value & 0x800000) {
        value |= 0xff000000;
    }
    return (int32_t)value;
}

int16_t read_2bytes_signed(const uint8_t* data) {
    return (int16_t)read_2bytes(data);
}

double read_double(const uint8_t* data) {
    return av_int2double(read_8bytes(data));
}

void write_8bytes(uint8_t* data, uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data[i] = (uint8_t)(value & 0xff);
        value >>= 8;
    }
}

void write_4bytes(uint8_t* data, uint32_t value) {
    data[0] = (uint8_t)(value >> 24);
    data[1] = (uint8_t)(value >> 16);
    data[2] = (uint8_t)(value >> 8);
    data[3] = (uint8_t)value;
}

void write_3bytes(uint8_t* data, uint32_t value) {
    data[0] = (uint8_t)(value >> 16);
    data[1] = (uint8_t)(value >> 8);
    data[2] = (uint8_t)value;
}

void write_2bytes(uint8_t* data, uint16_t value) {
    data[0] = (uint8_t)(value >> 8);
    data[1] = (uint8_t)value;
}

void write_double(uint8_t* data, double value) {
    write_8bytes(data, av_double2int(value));
}

bool bytes_is_equal(const char* p1, const char* p2, size_t len) {
    for (size_t index = 0; index < len; index++) {
        if (p1[index] != p2[index]) {
            return false;
        }
    }
    return true;
}

byte_reader::byte_reader(const uint8_t* data, size_t len):data_(data)
    , len_(len)
{
}

byte_reader::~byte_reader()
{
}

int byte_reader::read_1byte(uint8_t& value) {
    if (!require(1)) {
        return BYTE_READER_NEED_MORE;
    }
    value = data_[pos_];
    pos_++;
    return BYTE_READER_OK;
}

int byte_reader::read_2bytes(uint16_t& value) {
    if (!require(2)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_2bytes(data_ + pos_);
    pos_ += 2;
    return BYTE_READER_OK;
}

int byte_reader::read_2bytes_signed(int16_t& value) {
    if (!require(2)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_2bytes_signed(data_ + pos_);
    pos_ += 2;
    return BYTE_READER_OK;
}

int byte_reader::read_3bytes(uint32_t& value) {
    if (!require(3)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_3bytes(data_ + pos_);
    pos_ += 3;
    return BYTE_READER_OK;
}

int byte_reader::read_3bytes_signed(int32_t& value) {
    if (!require(3)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_3bytes_signed(data_ + pos_);
    pos_ += 3;
    return BYTE_READER_OK;
}

int byte_reader::read_4bytes(uint32_t& value) {
    if (!require(4)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_4bytes(data_ + pos_);
    pos_ += 4;
    return BYTE_READER_OK;
}

int byte_reader::read_8bytes(uint64_t& value) {
    if (!require(8)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_8bytes(data_ + pos_);
    pos_ += 8;
    return BYTE_READER_OK;
}

int byte_reader::read_double(double& value) {
    if (!require(8)) {
        return BYTE_READER_NEED_MORE;
    }
    value = ::read_double(data_ + pos_);
    pos_ += 8;
    return BYTE_READER_OK;
}

int byte_reader::read_string(size_t len, std::string& value) {
    if (!require(len)) {
        return BYTE_READER_NEED_MORE;
    }
    value.assign((const char*)data_ + pos_, len);
    pos_ += len;
    return BYTE_READER_OK;
}

int byte_reader::peek_1byte(uint8_t& value) const {
    if (!require(1)) {
        return BYTE_READER_NEED_MORE;
    }
    value = data_[pos_];
    return BYTE_READER_OK;
}

int byte_reader::skip(size_t len) {
    if (!require(len)) {
        return BYTE_READER_NEED_MORE;
    }
    pos_ += len;
    return BYTE_READER_OK;
}
