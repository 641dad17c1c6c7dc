#include "format/amf/amf0.hpp"
#include "flv_test_util.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

int decode_bytes(const BYTES& data, AMF_VALUE& value, int max_depth = AMF0_DEFAULT_MAX_DEPTH) {
    byte_reader reader(data.data(), data.size());
    return AMF_Decoder::decode(reader, value, max_depth);
}

AMF_VALUE_PTR round_trip(const AMF_VALUE& value) {
    data_buffer buffer;
    EXPECT_EQ(AMF_Encoder::encode(value, buffer), AMF_RET_OK);

    BYTES data = buffer_to_bytes(buffer);
    byte_reader reader(data.data(), data.size());
    AMF_VALUE_PTR decoded_ptr = std::make_shared<AMF_VALUE>();
    EXPECT_EQ(AMF_Decoder::decode(reader, *decoded_ptr), AMF_RET_OK);
    EXPECT_TRUE(reader.empty());
    return decoded_ptr;
}

BYTES nested_objects(int levels) {
    BYTES data = {AMF_DATA_TYPE_OBJECT};

    for (int index = 0; index < levels; index++) {
        append_bytes(data, {0x00, 0x01, 'a', AMF_DATA_TYPE_OBJECT});
    }
    for (int index = 0; index <= levels; index++) {
        append_bytes(data, {0x00, 0x00, AMF_DATA_TYPE_OBJECT_END});
    }
    return data;
}

}

TEST(Amf0DecoderTest, DecodesShortString)
{
    AMF_VALUE value;

    ASSERT_EQ(decode_bytes({0x02, 0x00, 0x03, 'f', 'o', 'o'}, value), AMF_RET_OK);
    EXPECT_EQ(value.get_amf_type(), AMF_DATA_TYPE_STRING);
    EXPECT_EQ(value.desc_str_, "foo");
}

TEST(Amf0DecoderTest, DecodesNumber)
{
    AMF_VALUE value;

    ASSERT_EQ(decode_bytes({0x00, 0x40, 0x09, 0x21, 0xfb, 0x54, 0x44, 0x2d, 0x18}, value), AMF_RET_OK);
    EXPECT_EQ(value.get_amf_type(), AMF_DATA_TYPE_NUMBER);
    EXPECT_DOUBLE_EQ(value.number_, 3.141592653589793);
}

TEST(Amf0DecoderTest, StringBytesAreKeptRaw)
{
    AMF_VALUE value;

    ASSERT_EQ(decode_bytes({0x02, 0x00, 0x02, 0xff, 0x00}, value), AMF_RET_OK);
    ASSERT_EQ(value.desc_str_.size(), 2u);
    EXPECT_EQ((uint8_t)value.desc_str_[0], 0xff);
    EXPECT_EQ((uint8_t)value.desc_str_[1], 0x00);
}

TEST(Amf0DecoderTest, ObjectKeepsPropertyOrder)
{
    AMF_VALUE value;
    BYTES data = {0x03,
                  0x00, 0x01, 'z', 0x01, 0x01,
                  0x00, 0x01, 'a', 0x05,
                  0x00, 0x00, 0x09};

    ASSERT_EQ(decode_bytes(data, value), AMF_RET_OK);
    ASSERT_EQ(value.amf_obj_.size(), 2u);
    EXPECT_EQ(value.amf_obj_[0].first, "z");
    EXPECT_TRUE(value.amf_obj_[0].second->enable_);
    EXPECT_EQ(value.amf_obj_[1].first, "a");
    EXPECT_EQ(value.amf_obj_[1].second->get_amf_type(), AMF_DATA_TYPE_NULL);
    EXPECT_EQ(value.find("a"), value.amf_obj_[1].second);
    EXPECT_EQ(value.find("missing"), nullptr);
}

TEST(Amf0DecoderTest, EmptyKeyWithValueIsAProperty)
{
    AMF_VALUE value;
    BYTES data = {0x03,
                  0x00, 0x00, 0x01, 0x00,
                  0x00, 0x00, 0x09};

    ASSERT_EQ(decode_bytes(data, value), AMF_RET_OK);
    ASSERT_EQ(value.amf_obj_.size(), 1u);
    EXPECT_EQ(value.amf_obj_[0].first, "");
    EXPECT_EQ(value.amf_obj_[0].second->get_amf_type(), AMF_DATA_TYPE_BOOL);
    EXPECT_FALSE(value.amf_obj_[0].second->enable_);
}

TEST(Amf0DecoderTest, ObjectWithoutEndMarkerFails)
{
    AMF_VALUE value;
    BYTES data = {0x03, 0x00, 0x01, 'a', 0x00, 0x3f, 0xf0, 0, 0, 0, 0, 0, 0};

    EXPECT_EQ(decode_bytes(data, value), AMF_RET_DECODE_ERROR);

    AMF_VALUE partial_end;
    EXPECT_EQ(decode_bytes({0x03, 0x00, 0x00}, partial_end), AMF_RET_DECODE_ERROR);
}

TEST(Amf0DecoderTest, EcmaArrayCountIsAdvisory)
{
    AMF_VALUE value;
    BYTES data = {0x08, 0x00, 0x00, 0x00, 0x64,
                  0x00, 0x01, 'w', 0x00, 0x40, 0x84, 0, 0, 0, 0, 0, 0,
                  0x00, 0x00, 0x09};

    ASSERT_EQ(decode_bytes(data, value), AMF_RET_OK);
    EXPECT_EQ(value.get_amf_type(), AMF_DATA_TYPE_MIXEDARRAY);
    EXPECT_EQ(value.declared_count_, 100u);
    ASSERT_EQ(value.amf_obj_.size(), 1u);
    EXPECT_DOUBLE_EQ(value.find("w")->number_, 640.0);
}

TEST(Amf0DecoderTest, StrictArrayReadsExactCount)
{
    AMF_VALUE value;
    BYTES data = {0x0a, 0x00, 0x00, 0x00, 0x02, 0x05, 0x06, 0x05};
    byte_reader reader(data.data(), data.size());

    ASSERT_EQ(AMF_Decoder::decode(reader, value), AMF_RET_OK);
    ASSERT_EQ(value.amf_array_.size(), 2u);
    EXPECT_EQ(value.amf_array_[0]->get_amf_type(), AMF_DATA_TYPE_NULL);
    EXPECT_EQ(value.amf_array_[1]->get_amf_type(), AMF_DATA_TYPE_UNDEFINED);
    EXPECT_EQ(reader.left(), 1u);

    AMF_VALUE short_array;
    EXPECT_EQ(decode_bytes({0x0a, 0x00, 0x00, 0x00, 0x02, 0x05}, short_array), AMF_RET_DECODE_ERROR);
}

TEST(Amf0DecoderTest, ReferenceDateAndLongString)
{
    AMF_VALUE reference;
    ASSERT_EQ(decode_bytes({0x07, 0x00, 0x05}, reference), AMF_RET_OK);
    EXPECT_EQ(reference.get_amf_type(), AMF_DATA_TYPE_REFERENCE);
    EXPECT_EQ(reference.reference_, 5);

    AMF_VALUE date;
    ASSERT_EQ(decode_bytes({0x0b, 0x40, 0x59, 0, 0, 0, 0, 0, 0, 0xff, 0xfe}, date), AMF_RET_OK);
    EXPECT_EQ(date.get_amf_type(), AMF_DATA_TYPE_DATE);
    EXPECT_DOUBLE_EQ(date.number_, 100.0);
    EXPECT_EQ(date.timezone_, -2);

    AMF_VALUE long_string;
    ASSERT_EQ(decode_bytes({0x0c, 0x00, 0x00, 0x00, 0x02, 'h', 'i'}, long_string), AMF_RET_OK);
    EXPECT_EQ(long_string.get_amf_type(), AMF_DATA_TYPE_LONG_STRING);
    EXPECT_EQ(long_string.desc_str_, "hi");
}

TEST(Amf0DecoderTest, UnsupportedMarkersFail)
{
    const uint8_t markers[] = {0x04, 0x09, 0x0d, 0x0e, 0x10, 0x11, 0xff};

    for (uint8_t marker : markers) {
        AMF_VALUE value;
        EXPECT_EQ(decode_bytes({marker, 0x00, 0x00}, value), AMF_RET_DECODE_ERROR) << (int)marker;
    }
}

TEST(Amf0DecoderTest, FieldsRunningPastTheInputOverrun)
{
    AMF_VALUE number;
    EXPECT_EQ(decode_bytes({0x00, 0x40, 0x09}, number), AMF_RET_OVERRUN);

    AMF_VALUE str;
    EXPECT_EQ(decode_bytes({0x02, 0x00, 0x05, 'a'}, str), AMF_RET_OVERRUN);

    AMF_VALUE long_string;
    EXPECT_EQ(decode_bytes({0x0c, 0x00, 0x01, 0x00, 0x00, 'a'}, long_string), AMF_RET_OVERRUN);
}

TEST(Amf0DecoderTest, ContainerCutInsideAMemberIsDecodeError)
{
    AMF_VALUE cut_in_key;
    EXPECT_EQ(decode_bytes({0x03, 0x00, 0x05, 'a'}, cut_in_key), AMF_RET_DECODE_ERROR);

    AMF_VALUE cut_in_value;
    EXPECT_EQ(decode_bytes({0x03, 0x00, 0x01, 'a', 0x00, 0x40}, cut_in_value), AMF_RET_DECODE_ERROR);

    AMF_VALUE cut_in_ecma;
    EXPECT_EQ(decode_bytes({0x08, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 'a', 0x02, 0x00, 0x09, 'x'}, cut_in_ecma),
              AMF_RET_DECODE_ERROR);

    AMF_VALUE cut_in_item;
    EXPECT_EQ(decode_bytes({0x0a, 0x00, 0x00, 0x00, 0x01, 0x00, 0x40}, cut_in_item), AMF_RET_DECODE_ERROR);
}

TEST(Amf0DecoderTest, StrictArrayCountBeyondTheInputFails)
{
    AMF_VALUE value;

    EXPECT_EQ(decode_bytes({0x0a, 0xff, 0xff, 0xff, 0xff, 0x05, 0x05}, value), AMF_RET_DECODE_ERROR);
    EXPECT_TRUE(value.amf_array_.empty());
}

TEST(Amf0DecoderTest, ValueBudgetIsShared)
{
    BYTES data = {0x0a, 0x00, 0x00, 0x00, 0x04, 0x05, 0x05, 0x05, 0x05};

    AMF_VALUE over_budget;
    byte_reader reader(data.data(), data.size());
    uint32_t items_left = 4;
    EXPECT_EQ(AMF_Decoder::decode(reader, over_budget, AMF0_DEFAULT_MAX_DEPTH, items_left), AMF_RET_DECODE_ERROR);

    AMF_VALUE within_budget;
    byte_reader second_reader(data.data(), data.size());
    items_left = 7;
    ASSERT_EQ(AMF_Decoder::decode(second_reader, within_budget, AMF0_DEFAULT_MAX_DEPTH, items_left), AMF_RET_OK);
    EXPECT_EQ(within_budget.amf_array_.size(), 4u);
    EXPECT_EQ(items_left, 2u);
}

TEST(Amf0DecoderTest, NestingDepthIsCapped)
{
    AMF_VALUE shallow;
    EXPECT_EQ(decode_bytes(nested_objects(10), shallow), AMF_RET_OK);

    AMF_VALUE deep;
    EXPECT_EQ(decode_bytes(nested_objects(70), deep, 64), AMF_RET_DECODE_ERROR);

    AMF_VALUE allowed;
    EXPECT_EQ(decode_bytes(nested_objects(70), allowed, 100), AMF_RET_OK);
}

TEST(Amf0EncoderTest, ScalarsRoundTrip)
{
    EXPECT_DOUBLE_EQ(round_trip(*AMF_VALUE::make_number(-12.25))->number_, -12.25);
    EXPECT_TRUE(round_trip(*AMF_VALUE::make_bool(true))->enable_);
    EXPECT_EQ(round_trip(*AMF_VALUE::make_string("onMetaData"))->desc_str_, "onMetaData");
    EXPECT_EQ(round_trip(*AMF_VALUE::make_null())->get_amf_type(), AMF_DATA_TYPE_NULL);
}

TEST(Amf0EncoderTest, DateReferenceAndLongStringRoundTrip)
{
    AMF_VALUE_PTR date_ptr = round_trip(*AMF_VALUE::make_date(1500000000000.0, -480));
    EXPECT_EQ(date_ptr->get_amf_type(), AMF_DATA_TYPE_DATE);
    EXPECT_DOUBLE_EQ(date_ptr->number_, 1500000000000.0);
    EXPECT_EQ(date_ptr->timezone_, -480);

    AMF_VALUE_PTR reference_ptr = round_trip(*AMF_VALUE::make_reference(3));
    EXPECT_EQ(reference_ptr->get_amf_type(), AMF_DATA_TYPE_REFERENCE);
    EXPECT_EQ(reference_ptr->reference_, 3);

    AMF_VALUE_PTR long_string_ptr = round_trip(*AMF_VALUE::make_long_string("short text"));
    EXPECT_EQ(long_string_ptr->get_amf_type(), AMF_DATA_TYPE_LONG_STRING);
    EXPECT_EQ(long_string_ptr->desc_str_, "short text");
}

TEST(Amf0EncoderTest, LongStringUsesFourBytesLength)
{
    data_buffer buffer;

    ASSERT_EQ(AMF_Encoder::encode(*AMF_VALUE::make_long_string("ab"), buffer), AMF_RET_OK);
    BYTES expected = {0x0c, 0x00, 0x00, 0x00, 0x02, 'a', 'b'};
    EXPECT_EQ(buffer_to_bytes(buffer), expected);
}

TEST(Amf0EncoderTest, ObjectAndStrictArrayRoundTrip)
{
    AMF_VALUE_PTR object_ptr = AMF_VALUE::make_object();
    object_ptr->add_property("a", AMF_VALUE::make_number(1.0));
    object_ptr->add_property("b", AMF_VALUE::make_bool(true));

    AMF_VALUE_PTR decoded_ptr = round_trip(*object_ptr);
    ASSERT_EQ(decoded_ptr->get_amf_type(), AMF_DATA_TYPE_OBJECT);
    ASSERT_EQ(decoded_ptr->amf_obj_.size(), 2u);
    EXPECT_EQ(decoded_ptr->amf_obj_[0].first, "a");
    EXPECT_DOUBLE_EQ(decoded_ptr->amf_obj_[0].second->number_, 1.0);
    EXPECT_EQ(decoded_ptr->amf_obj_[1].first, "b");
    EXPECT_TRUE(decoded_ptr->amf_obj_[1].second->enable_);

    AMF_VALUE_PTR array_ptr = AMF_VALUE::make_strict_array();
    array_ptr->add_item(AMF_VALUE::make_number(1.0));
    array_ptr->add_item(AMF_VALUE::make_number(2.0));

    decoded_ptr = round_trip(*array_ptr);
    ASSERT_EQ(decoded_ptr->get_amf_type(), AMF_DATA_TYPE_ARRAY);
    ASSERT_EQ(decoded_ptr->amf_array_.size(), 2u);
    EXPECT_DOUBLE_EQ(decoded_ptr->amf_array_[0]->number_, 1.0);
    EXPECT_DOUBLE_EQ(decoded_ptr->amf_array_[1]->number_, 2.0);
}

TEST(Amf0EncoderTest, EncodesObjectEndMarker)
{
    data_buffer buffer;
    AMF_VALUE_PTR object_ptr = AMF_VALUE::make_object();
    object_ptr->add_property("a", AMF_VALUE::make_null());

    ASSERT_EQ(AMF_Encoder::encode(*object_ptr, buffer), AMF_RET_OK);
    BYTES expected = {0x03, 0x00, 0x01, 'a', 0x05, 0x00, 0x00, 0x09};
    EXPECT_EQ(buffer_to_bytes(buffer), expected);
}
