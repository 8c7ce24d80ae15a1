#ifndef SMPP_TLV_TAG_H
#define SMPP_TLV_TAG_H
#include "smpp-tlv/smpp-tlv-types.hh"

#include <stdint.h>

namespace smpp {

class SmppTlvTag {
public:
    SmppTlvTag();
    SmppTlvTag(uint16_t tag);

    static SmppTlvTag fromRaw(uint16_t tag);
    static SmppTlvTag other(uint16_t tag);

    uint16_t getRaw() const;

    bool known() const;
    bool vendor() const;

    const SmppTlvTagInfo* getInfo() const;
    SmppTlvShape getShape() const;
    const char* getName() const;

    bool operator==(const SmppTlvTag &other) const;
    bool operator!=(const SmppTlvTag &other) const;

private:
    uint16_t _tag;
    const SmppTlvTagInfo *_info;
};

class SmppTlvTagText {
public:
    SmppTlvTagText(const SmppTlvTag &tag);

    char str[64];
};

}

#endif // SMPP_TLV_TAG_H
