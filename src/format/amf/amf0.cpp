#include "amf0.hpp"
#include "logger.hpp"

std::string amf_type_tostring(AMF_DATA_TYPE amf_type) {
    switch (amf_type) {
        case AMF_DATA_TYPE_NUMBER: return "number";
        case AMF_DATA_TYPE_BOOL: return "bool";
        case AMF_DATA_TYPE_STRING: return "string";
        case AMF_DATA_TYPE_OBJECT: return "object";
        case AMF_DATA_TYPE_MOVIECLIP: return "movieclip";
        case AMF_DATA_TYPE_NULL: return "null";
        case AMF_DATA_TYPE_UNDEFINED: return "undefined";
        case AMF_DATA_TYPE_REFERENCE: return "reference";
        case AMF_DATA_TYPE_MIXEDARRAY: return "ecma array";
        case AMF_DATA_TYPE_OBJECT_END: return "object end";
        case AMF_DATA_TYPE_ARRAY: return "strict array";
        case AMF_DATA_TYPE_DATE: return "date";
        case AMF_DATA_TYPE_LONG_STRING: return "long string";
        case AMF_DATA_TYPE_UNSUPPORTED: return "unsupported";
        default: return "unknown";
    }
}

AMF_VALUE_PTR AMF_VALUE::make_number(double number) {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_NUMBER;
    value_ptr->number_   = number;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_bool(bool enable) {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_BOOL;
    value_ptr->enable_   = enable;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_string(const std::string& str) {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_STRING;
    value_ptr->desc_str_ = str;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_long_string(const std::string& str) {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_LONG_STRING;
    value_ptr->desc_str_ = str;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_null() {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_NULL;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_undefined() {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_UNDEFINED;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_reference(uint16_t index) {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_  = AMF_DATA_TYPE_REFERENCE;
    value_ptr->reference_ = index;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_object() {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_OBJECT;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_ecma_array() {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_MIXEDARRAY;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_strict_array() {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_ARRAY;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::make_date(double millisec, int16_t timezone) {
    AMF_VALUE_PTR value_ptr = std::make_shared<AMF_VALUE>();
    value_ptr->amf_type_ = AMF_DATA_TYPE_DATE;
    value_ptr->number_   = millisec;
    value_ptr->timezone_ = timezone;
    return value_ptr;
}

AMF_VALUE_PTR AMF_VALUE::find(const std::string& key) const {
    if (!is_container()) {
        return nullptr;
    }
    for (const auto& iter : amf_obj_) {
        if (iter.first == key) {
            return iter.second;
        }
    }
    return nullptr;
}

void AMF_VALUE::add_property(const std::string& key, AMF_VALUE_PTR value) {
    amf_obj_.push_back(std::make_pair(key, value));
    if (amf_type_ == AMF_DATA_TYPE_MIXEDARRAY) {
        declared_count_ = (uint32_t)amf_obj_.size();
    }
}

void AMF_VALUE::add_item(AMF_VALUE_PTR value) {
    amf_array_.push_back(value);
}

void AMF_VALUE::dump_amf(int indent) const {
    std::string prefix(indent * 2, ' ');

    switch (amf_type_)
    {
        case AMF_DATA_TYPE_NUMBER:
        {
            log_infof("%samf type: number, value:%f", prefix.c_str(), number_);
            break;
        }
        case AMF_DATA_TYPE_BOOL:
        {
            log_infof("%samf type: bool, value:%d", prefix.c_str(), enable_);
            break;
        }
        case AMF_DATA_TYPE_STRING:
        case AMF_DATA_TYPE_LONG_STRING:
        {
            log_infof("%samf type: %s, value:%s", prefix.c_str(),
                amf_type_tostring(amf_type_).c_str(), desc_str_.c_str());
            break;
        }
        case AMF_DATA_TYPE_OBJECT:
        case AMF_DATA_TYPE_MIXEDARRAY:
        {
            log_infof("%samf type: %s, count:%zu", prefix.c_str(),
                amf_type_tostring(amf_type_).c_str(), amf_obj_.size());
            for (const auto& iter : amf_obj_) {
                log_infof("%sobject key:%s", prefix.c_str(), iter.first.c_str());
                iter.second->dump_amf(indent + 1);
            }
            break;
        }
        case AMF_DATA_TYPE_NULL:
        case AMF_DATA_TYPE_UNDEFINED:
        {
            log_infof("%samf type: %s", prefix.c_str(), amf_type_tostring(amf_type_).c_str());
            break;
        }
        case AMF_DATA_TYPE_REFERENCE:
        {
            log_infof("%samf type: reference, index:%u", prefix.c_str(), reference_);
            break;
        }
        case AMF_DATA_TYPE_ARRAY:
        {
            log_infof("%samf type: strict array, count:%zu", prefix.c_str(), amf_array_.size());
            for (const auto& iter : amf_array_) {
                iter->dump_amf(indent + 1);
            }
            break;
        }
        case AMF_DATA_TYPE_DATE:
        {
            log_infof("%samf type: date, millisec:%f, timezone:%d", prefix.c_str(), number_, timezone_);
            break;
        }
        default:
            log_infof("%samf type: %s", prefix.c_str(), amf_type_tostring(amf_type_).c_str());
            break;
    }
}

int AMF_Encoder::encode_number(double num, data_buffer& buffer) {
    uint8_t data[1 + 8];

    data[0] = (uint8_t)AMF_DATA_TYPE_NUMBER;
    write_double(data + 1, num);

    buffer.append_data((char*)data, sizeof(data));
    return AMF_RET_OK;
}

int AMF_Encoder::encode_bool(bool flag, data_buffer& buffer) {
    uint8_t data[2];

    data[0] = AMF_DATA_TYPE_BOOL;
    data[1] = flag ? 0x01 : 0x00;

    buffer.append_data((char*)data, sizeof(data));
    return AMF_RET_OK;
}

int AMF_Encoder::encode_string(const std::string& str, data_buffer& buffer, bool skip_marker) {
    uint8_t header[1 + 4];
    size_t header_len = 0;

    if (str.length() > 0xffff) {
        if (skip_marker) {
            log_errorf("amf key is too long:%zu", str.length());
            return AMF_RET_DECODE_ERROR;
        }
        header[header_len++] = (uint8_t)AMF_DATA_TYPE_LONG_STRING;
        write_4bytes(header + header_len, (uint32_t)str.length());
        header_len += 4;
    } else {
        if (!skip_marker) {
            header[header_len++] = (uint8_t)AMF_DATA_TYPE_STRING;
        }
        write_2bytes(header + header_len, (uint16_t)str.length());
        header_len += 2;
    }

    buffer.append_data((char*)header, header_len);
    buffer.append_data(str.data(), str.length());
    return AMF_RET_OK;
}

int AMF_Encoder::encode_onlytype(AMF_DATA_TYPE amf_type, data_buffer& buffer) {
    uint8_t data = (uint8_t)amf_type;

    buffer.append_data((char*)&data, 1);
    return AMF_RET_OK;
}

int AMF_Encoder::encode_date(double millisec, int16_t timezone, data_buffer& buffer) {
    uint8_t data[1 + 8 + 2];

    data[0] = (uint8_t)AMF_DATA_TYPE_DATE;
    write_double(data + 1, millisec);
    write_2bytes(data + 9, (uint16_t)timezone);

    buffer.append_data((char*)data, sizeof(data));
    return AMF_RET_OK;
}

int AMF_Encoder::encode_properties(const AMF_PROPERTIES& amf_obj, data_buffer& buffer) {
    for (const auto& iter : amf_obj) {
        int ret = encode_string(iter.first, buffer, true);
        if (ret != AMF_RET_OK) {
            return ret;
        }
        ret = encode(*iter.second, buffer);
        if (ret != AMF_RET_OK) {
            return ret;
        }
    }
    uint8_t end[3] = {0x00, 0x00, (uint8_t)AMF_DATA_TYPE_OBJECT_END};
    buffer.append_data((char*)end, sizeof(end));
    return AMF_RET_OK;
}

int AMF_Encoder::encode(const AMF_VALUE& amf_item, data_buffer& buffer) {
    switch (amf_item.get_amf_type()) {
        case AMF_DATA_TYPE_NUMBER:
        {
            return encode_number(amf_item.number_, buffer);
        }
        case AMF_DATA_TYPE_BOOL:
        {
            return encode_bool(amf_item.enable_, buffer);
        }
        case AMF_DATA_TYPE_STRING:
        {
            return encode_string(amf_item.desc_str_, buffer);
        }
        case AMF_DATA_TYPE_LONG_STRING:
        {
            uint8_t data[1 + 4];
            data[0] = (uint8_t)AMF_DATA_TYPE_LONG_STRING;
            write_4bytes(data + 1, (uint32_t)amf_item.desc_str_.length());
            buffer.append_data((char*)data, sizeof(data));
            buffer.append_data(amf_item.desc_str_.data(), amf_item.desc_str_.length());
            return AMF_RET_OK;
        }
        case AMF_DATA_TYPE_OBJECT:
        {
            encode_onlytype(AMF_DATA_TYPE_OBJECT, buffer);
            return encode_properties(amf_item.amf_obj_, buffer);
        }
        case AMF_DATA_TYPE_NULL:
        case AMF_DATA_TYPE_UNDEFINED:
        {
            return encode_onlytype(amf_item.get_amf_type(), buffer);
        }
        case AMF_DATA_TYPE_REFERENCE:
        {
            uint8_t data[1 + 2];
            data[0] = (uint8_t)AMF_DATA_TYPE_REFERENCE;
            write_2bytes(data + 1, amf_item.reference_);
            buffer.append_data((char*)data, sizeof(data));
            return AMF_RET_OK;
        }
        case AMF_DATA_TYPE_MIXEDARRAY:
        {
            uint8_t data[1 + 4];
            data[0] = (uint8_t)AMF_DATA_TYPE_MIXEDARRAY;
            write_4bytes(data + 1, amf_item.declared_count_);
            buffer.append_data((char*)data, sizeof(data));
            return encode_properties(amf_item.amf_obj_, buffer);
        }
        case AMF_DATA_TYPE_ARRAY:
        {
            uint8_t data[1 + 4];
            data[0] = (uint8_t)AMF_DATA_TYPE_ARRAY;
            write_4bytes(data + 1, (uint32_t)amf_item.amf_array_.size());
            buffer.append_data((char*)data, sizeof(data));
            for (const auto& item : amf_item.amf_array_) {
                int ret = encode(*item, buffer);
                if (ret != AMF_RET_OK) {
                    return ret;
                }
            }
            return AMF_RET_OK;
        }
        case AMF_DATA_TYPE_DATE:
        {
            return encode_date(amf_item.number_, amf_item.timezone_, buffer);
        }
        default:
            log_errorf("not support amf type:%d", (int)amf_item.get_amf_type());
            return AMF_RET_DECODE_ERROR;
    }
}

int AMF_Decoder::decode(byte_reader& reader, AMF_VALUE& amf_item, int max_depth) {
    uint32_t items_left = AMF0_DEFAULT_MAX_ITEMS;

    return decode_value(reader, amf_item, 0, max_depth, items_left);
}

int AMF_Decoder::decode(byte_reader& reader, AMF_VALUE& amf_item, int max_depth, uint32_t& items_left) {
    return decode_value(reader, amf_item, 0, max_depth, items_left);
}

int AMF_Decoder::decode_string(byte_reader& reader, std::string& str) {
    uint16_t str_len = 0;

    if (reader.read_2bytes(str_len) != BYTE_READER_OK) {
        return AMF_RET_OVERRUN;
    }
    if (reader.read_string(str_len, str) != BYTE_READER_OK) {
        log_errorf("amf string length:%u exceeds left bytes:%zu", str_len, reader.left());
        return AMF_RET_OVERRUN;
    }
    return AMF_RET_OK;
}

int AMF_Decoder::decode_value(byte_reader& reader, AMF_VALUE& amf_item, int depth, int max_depth,
                              uint32_t& items_left) {
    uint8_t type = 0;

    if (depth > max_depth) {
        log_errorf("amf nesting depth exceeds %d at pos:%zu", max_depth, reader.pos());
        return AMF_RET_DECODE_ERROR;
    }
    if (items_left == 0) {
        log_errorf("amf value count exceeds the limit at pos:%zu", reader.pos());
        return AMF_RET_DECODE_ERROR;
    }
    items_left--;

    if (reader.read_1byte(type) != BYTE_READER_OK) {
        log_errorf("amf value marker is missing at pos:%zu", reader.pos());
        return AMF_RET_DECODE_ERROR;
    }

    AMF_DATA_TYPE amf_type = (AMF_DATA_TYPE)type;
    switch (amf_type) {
        case AMF_DATA_TYPE_NUMBER:
        {
            amf_item.set_amf_type(amf_type);
            if (reader.read_double(amf_item.number_) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            break;
        }
        case AMF_DATA_TYPE_BOOL:
        {
            uint8_t value = 0;

            amf_item.set_amf_type(amf_type);
            if (reader.read_1byte(value) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            amf_item.enable_ = (value != 0) ? true : false;
            break;
        }
        case AMF_DATA_TYPE_STRING:
        {
            amf_item.set_amf_type(amf_type);
            return decode_string(reader, amf_item.desc_str_);
        }
        case AMF_DATA_TYPE_OBJECT:
        {
            amf_item.set_amf_type(amf_type);
            return decode_amf_object(reader, amf_item.amf_obj_, depth, max_depth, items_left);
        }
        case AMF_DATA_TYPE_NULL:
        case AMF_DATA_TYPE_UNDEFINED:
        {
            amf_item.set_amf_type(amf_type);
            break;
        }
        case AMF_DATA_TYPE_REFERENCE:
        {
            amf_item.set_amf_type(amf_type);
            if (reader.read_2bytes(amf_item.reference_) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            break;
        }
        case AMF_DATA_TYPE_MIXEDARRAY:
        {
            amf_item.set_amf_type(amf_type);
            //the count is advisory, the end marker terminates the array
            if (reader.read_4bytes(amf_item.declared_count_) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            return decode_amf_object(reader, amf_item.amf_obj_, depth, max_depth, items_left);
        }
        case AMF_DATA_TYPE_ARRAY:
        {
            amf_item.set_amf_type(amf_type);
            return decode_amf_array(reader, amf_item.amf_array_, depth, max_depth, items_left);
        }
        case AMF_DATA_TYPE_DATE:
        {
            amf_item.set_amf_type(amf_type);
            if (reader.read_double(amf_item.number_) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            if (reader.read_2bytes_signed(amf_item.timezone_) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            break;
        }
        case AMF_DATA_TYPE_LONG_STRING:
        {
            uint32_t str_len = 0;

            amf_item.set_amf_type(amf_type);
            if (reader.read_4bytes(str_len) != BYTE_READER_OK) {
                return AMF_RET_OVERRUN;
            }
            if (reader.read_string(str_len, amf_item.desc_str_) != BYTE_READER_OK) {
                log_errorf("amf long string length:%u exceeds left bytes:%zu", str_len, reader.left());
                return AMF_RET_OVERRUN;
            }
            break;
        }
        default:
        {
            amf_item.set_amf_type(AMF_DATA_TYPE_UNKNOWN);
            log_errorf("unsupported amf type:0x%02x at pos:%zu", type, reader.pos() - 1);
            return AMF_RET_DECODE_ERROR;
        }
    }

    return AMF_RET_OK;
}

int AMF_Decoder::decode_amf_object(byte_reader& reader, AMF_PROPERTIES& amf_obj, int depth, int max_depth,
                                   uint32_t& items_left) {
    //amf object: <key: string type> : <value: amf object type>, ends with 0x00 0x00 0x09
    //a member cut off by the payload end means the end marker is missing
    while (true) {
        if (!reader.require(3)) {
            log_errorf("amf object end marker is missing at pos:%zu", reader.pos());
            return AMF_RET_DECODE_ERROR;
        }

        //an empty key followed by a value marker other than 0x09 is still a property
        if ((::read_2bytes(reader.current()) == 0)
            && (reader.current()[2] == AMF_DATA_TYPE_OBJECT_END)) {
            if (reader.skip(3) != BYTE_READER_OK) {
                return AMF_RET_DECODE_ERROR;
            }
            break;
        }

        std::string key;
        int ret = decode_string(reader, key);
        if (ret != AMF_RET_OK) {
            log_errorf("amf object key runs past the end at pos:%zu", reader.pos());
            return AMF_RET_DECODE_ERROR;
        }

        AMF_VALUE_PTR amf_item = std::make_shared<AMF_VALUE>();
        ret = decode_value(reader, *amf_item, depth + 1, max_depth, items_left);
        if (ret == AMF_RET_OVERRUN) {
            log_errorf("amf object member:%s runs past the end at pos:%zu", key.c_str(), reader.pos());
            return AMF_RET_DECODE_ERROR;
        }
        if (ret != AMF_RET_OK) {
            return ret;
        }
        amf_obj.push_back(std::make_pair(key, amf_item));
    }
    return AMF_RET_OK;
}

int AMF_Decoder::decode_amf_array(byte_reader& reader, std::vector<AMF_VALUE_PTR>& amf_array, int depth,
                                  int max_depth, uint32_t& items_left) {
    uint32_t array_len = 0;

    if (reader.read_4bytes(array_len) != BYTE_READER_OK) {
        return AMF_RET_OVERRUN;
    }

    //every value takes at least its marker byte
    if (array_len > reader.left()) {
        log_errorf("amf strict array count:%u exceeds left bytes:%zu", array_len, reader.left());
        return AMF_RET_DECODE_ERROR;
    }

    for (uint32_t index = 0; index < array_len; index++) {
        AMF_VALUE_PTR item = std::make_shared<AMF_VALUE>();
        int ret = decode_value(reader, *item, depth + 1, max_depth, items_left);
        if (ret == AMF_RET_OVERRUN) {
            log_errorf("amf strict array item:%u runs past the end at pos:%zu", index, reader.pos());
            return AMF_RET_DECODE_ERROR;
        }
        if (ret != AMF_RET_OK) {
            return ret;
        }
        amf_array.push_back(item);
    }
    return AMF_RET_OK;
}
