#ifndef AV_FORMAT_INTERFACE_HPP
#define AV_FORMAT_INTERFACE_HPP
#include "format/flv/flv_tag.hpp"
#include <memory>

class flv_tag_callback
{
public:
    virtual ~flv_tag_callback() {}

    //a negative return stops the demuxer from delivering more tags in this call
    virtual int output_tag(FLV_TAG_PTR tag_ptr) = 0;
};

#endif
