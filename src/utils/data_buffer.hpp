#ifndef DATA_BUFFER_H
#define DATA_BUFFER_H
#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <string>
#include <memory>

#define EXTRA_LEN (10*1024)

/*
 * Growable byte buffer: data is appended at the end and consumed from the front.
 * Consumed bytes are reclaimed on the next append that needs the room.
 */
class data_buffer
{
public:
    data_buffer(size_t data_size = EXTRA_LEN);
    data_buffer(const data_buffer& input);
    data_buffer& operator=(const data_buffer& input);
    ~data_buffer();

public:
    int append_data(const char* input_data, size_t input_len);
    char* consume_data(size_t consume_len);
    void reset();

    char* data();
    const char* data() const;
    size_t data_len() const;
    size_t buffer_size() const;
    bool require(size_t len) const;

private:
    char* buffer_       = nullptr;
    size_t buffer_size_ = 0;
    size_t data_len_    = 0;
    size_t start_       = 0;
};

typedef std::shared_ptr<data_buffer> DATA_BUFFER_PTR;

#endif //DATA_BUFFER_H
