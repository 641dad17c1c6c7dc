#include "data_buffer.hpp"
#include "logger.hpp"

data_buffer::data_buffer(size_t data_size) {
    buffer_size_ = (data_size > 0) ? data_size : 1;
    buffer_      = new char[buffer_size_];
    start_       = 0;
    data_len_    = 0;
}

data_buffer::data_buffer(const data_buffer& input) {
    buffer_size_ = input.buffer_size_;
    buffer_      = new char[buffer_size_];
    start_       = 0;
    data_len_    = input.data_len_;

    memcpy(buffer_, input.buffer_ + input.start_, data_len_);
}

data_buffer& data_buffer::operator=(const data_buffer& input) {
    if (this == &input) {
        return *this;
    }
    char* new_buffer = new char[input.buffer_size_];
    memcpy(new_buffer, input.buffer_ + input.start_, input.data_len_);

    delete[] buffer_;
    buffer_      = new_buffer;
    buffer_size_ = input.buffer_size_;
    start_       = 0;
    data_len_    = input.data_len_;
    return *this;
}

data_buffer::~data_buffer() {
    if (buffer_)
    {
        delete[] buffer_;
    }
}

int data_buffer::append_data(const char* input_data, size_t input_len) {
    if ((input_data == nullptr) || (input_len == 0)) {
        return (int)data_len_;
    }

    if (start_ + data_len_ + input_len > buffer_size_) {
        if (data_len_ + input_len > buffer_size_) {
            size_t new_len = data_len_ + input_len + EXTRA_LEN;
            char* new_buffer = new char[new_len];

            memcpy(new_buffer, buffer_ + start_, data_len_);
            delete[] buffer_;
            buffer_      = new_buffer;
            buffer_size_ = new_len;
            log_debugf("make new buffer size:%zu, input_len:%zu, data len:%zu",
                    new_len, input_len, data_len_);
        } else {
            memmove(buffer_, buffer_ + start_, data_len_);
        }
        start_ = 0;
    }

    memcpy(buffer_ + start_ + data_len_, input_data, input_len);
    data_len_ += input_len;

    return (int)data_len_;
}

char* data_buffer::consume_data(size_t consume_len) {
    if (consume_len > data_len_) {
        log_errorf("consume_len:%zu, data_len_:%zu", consume_len, data_len_);
        return nullptr;
    }

    start_    += consume_len;
    data_len_ -= consume_len;
    if (data_len_ == 0) {
        start_ = 0;
    }

    return buffer_ + start_;
}

void data_buffer::reset() {
    start_    = 0;
    data_len_ = 0;
}

char* data_buffer::data() {
    return buffer_ + start_;
}

const char* data_buffer::data() const {
    return buffer_ + start_;
}

size_t data_buffer::data_len() const {
    return data_len_;
}

size_t data_buffer::buffer_size() const {
    return buffer_size_;
}

bool data_buffer::require(size_t len) const {
    return len <= data_len_;
}
