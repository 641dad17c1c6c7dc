#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP
#include <stdint.h>
#include <stddef.h>
#include <string>

#define BYTE_READER_OK        0
#define BYTE_READER_NEED_MORE 1

double av_int2double(uint64_t i);
/**
 * Reinterpret a double as a 64-bit integer.
 */
uint64_t av_double2int(double f);

uint64_t read_8bytes(const uint8_t* data);
uint32_t read_4bytes(const uint8_t* data);
uint32_t read_3bytes(const uint8_t* data);
uint16_t read_2bytes(const uint8_t* data);

//sign extended from 24 bits
int32_t read_3bytes_signed(const uint8_t* data);
int16_t read_2bytes_signed(const uint8_t* data);
double read_double(const uint8_t* data);

void write_8bytes(uint8_t* data, uint64_t value);
void write_4bytes(uint8_t* data, uint32_t value);
void write_3bytes(uint8_t* data, uint32_t value);
void write_2bytes(uint8_t* data, uint16_t value);
void write_double(uint8_t* data, double value);

bool bytes_is_equal(const char* p1, const char* p2, size_t len);

/*
 * Bounded big-endian cursor over a byte range.
 * Every read either consumes its full width and returns BYTE_READER_OK,
 * or leaves the cursor untouched and returns BYTE_READER_NEED_MORE.
 */
class byte_reader
{
public:
    byte_reader(const uint8_t* data, size_t len);
    ~byte_reader();

public:
    int read_1byte(uint8_t& value);
    int read_2bytes(uint16_t& value);
    int read_2bytes_signed(int16_t& value);
    int read_3bytes(uint32_t& value);
    int read_3bytes_signed(int32_t& value);
    int read_4bytes(uint32_t& value);
    int read_8bytes(uint64_t& value);
    int read_double(double& value);
    int read_string(size_t len, std::string& value);
    int peek_1byte(uint8_t& value) const;
    int skip(size_t len);

    bool require(size_t len) const { return len <= len_ - pos_; }
    size_t pos() const { return pos_; }
    size_t left() const { return len_ - pos_; }
    bool empty() const { return pos_ >= len_; }
    const uint8_t* current() const { return data_ + pos_; }

private:
    const uint8_t* data_ = nullptr;
    size_t len_ = 0;
    size_t pos_ = 0;
};

#endif //BYTE_STREAM_HPP
