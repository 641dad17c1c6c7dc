#ifndef AFM0_HPP
#define AFM0_HPP
#include "byte_stream.hpp"
#include "data_buffer.hpp"

#include <stdint.h>
#include <vector>
#include <string>
#include <memory>
#include <utility>

#define AMF_RET_OK            0
#define AMF_RET_DECODE_ERROR -1
#define AMF_RET_OVERRUN      -2

#define AMF0_DEFAULT_MAX_DEPTH 64
#define AMF0_DEFAULT_MAX_ITEMS (64*1024) //values allowed in one decode budget

typedef enum {
    AMF_DATA_TYPE_UNKNOWN     = -1,
    AMF_DATA_TYPE_NUMBER      = 0x00,
    AMF_DATA_TYPE_BOOL        = 0x01,
    AMF_DATA_TYPE_STRING      = 0x02,
    AMF_DATA_TYPE_OBJECT      = 0x03,
    AMF_DATA_TYPE_MOVIECLIP   = 0x04,
    AMF_DATA_TYPE_NULL        = 0x05,
    AMF_DATA_TYPE_UNDEFINED   = 0x06,
    AMF_DATA_TYPE_REFERENCE   = 0x07,
    AMF_DATA_TYPE_MIXEDARRAY  = 0x08,
    AMF_DATA_TYPE_OBJECT_END  = 0x09,
    AMF_DATA_TYPE_ARRAY       = 0x0a,
    AMF_DATA_TYPE_DATE        = 0x0b,
    AMF_DATA_TYPE_LONG_STRING = 0x0c,
    AMF_DATA_TYPE_UNSUPPORTED = 0x0d,
} AMF_DATA_TYPE;

std::string amf_type_tostring(AMF_DATA_TYPE amf_type);

class AMF_VALUE;
typedef std::shared_ptr<AMF_VALUE> AMF_VALUE_PTR;
typedef std::vector<std::pair<std::string, AMF_VALUE_PTR>> AMF_PROPERTIES;

/*
 * One decoded AMF0 value. Objects and ecma arrays keep their properties
 * in stream order; references are kept as the raw index and never resolved.
 */
class AMF_VALUE
{
public:
    AMF_VALUE() {}
    ~AMF_VALUE() {}

public:
    static AMF_VALUE_PTR make_number(double number);
    static AMF_VALUE_PTR make_bool(bool enable);
    static AMF_VALUE_PTR make_string(const std::string& str);
    static AMF_VALUE_PTR make_long_string(const std::string& str);
    static AMF_VALUE_PTR make_null();
    static AMF_VALUE_PTR make_undefined();
    static AMF_VALUE_PTR make_reference(uint16_t index);
    static AMF_VALUE_PTR make_object();
    static AMF_VALUE_PTR make_ecma_array();
    static AMF_VALUE_PTR make_strict_array();
    static AMF_VALUE_PTR make_date(double millisec, int16_t timezone);

public:
    AMF_DATA_TYPE get_amf_type() const {
        return amf_type_;
    }

    void set_amf_type(AMF_DATA_TYPE type) {
        amf_type_ = type;
    }

    bool is_container() const {
        return (amf_type_ == AMF_DATA_TYPE_OBJECT) || (amf_type_ == AMF_DATA_TYPE_MIXEDARRAY);
    }

    //first property with the key, nullptr when absent or not an object/ecma array
    AMF_VALUE_PTR find(const std::string& key) const;
    void add_property(const std::string& key, AMF_VALUE_PTR value);
    void add_item(AMF_VALUE_PTR value);

    void dump_amf(int indent = 0) const;

public:
    AMF_DATA_TYPE amf_type_ = AMF_DATA_TYPE_UNKNOWN;

public:
    double number_   = 0.0;//number, or milliseconds of a date
    bool enable_     = false;
    std::string desc_str_;
    uint16_t reference_ = 0;
    int16_t timezone_   = 0;
    uint32_t declared_count_ = 0;//advisory count of an ecma array
    AMF_PROPERTIES amf_obj_;
    std::vector<AMF_VALUE_PTR> amf_array_;
};

class AMF_Encoder
{
public:
    static int encode(const AMF_VALUE& amf_item, data_buffer& buffer);
    static int encode_number(double num, data_buffer& buffer);
    static int encode_bool(bool flag, data_buffer& buffer);
    static int encode_string(const std::string& str, data_buffer& buffer, bool skip_marker = false);
    static int encode_onlytype(AMF_DATA_TYPE amf_type, data_buffer& buffer);
    static int encode_date(double millisec, int16_t timezone, data_buffer& buffer);

private:
    static int encode_properties(const AMF_PROPERTIES& amf_obj, data_buffer& buffer);
};

class AMF_Decoder
{
public:
    //decode one value with its type marker
    static int decode(byte_reader& reader, AMF_VALUE& amf_item, int max_depth = AMF0_DEFAULT_MAX_DEPTH);
    //items_left is shared across calls and decremented for every value, nested ones included
    static int decode(byte_reader& reader, AMF_VALUE& amf_item, int max_depth, uint32_t& items_left);
    //2 bytes length + data, without type marker
    static int decode_string(byte_reader& reader, std::string& str);

private:
    static int decode_value(byte_reader& reader, AMF_VALUE& amf_item, int depth, int max_depth,
                            uint32_t& items_left);
    static int decode_amf_object(byte_reader& reader, AMF_PROPERTIES& amf_obj, int depth, int max_depth,
                                 uint32_t& items_left);
    static int decode_amf_array(byte_reader& reader, std::vector<AMF_VALUE_PTR>& amf_array, int depth,
                                int max_depth, uint32_t& items_left);
};

#endif
