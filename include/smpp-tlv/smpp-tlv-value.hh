#ifndef SMPP_TLV_VALUE_H
#define SMPP_TLV_VALUE_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-tag.hh"

namespace smpp {

class SmppTlvValue : public Serializable {
public:
    virtual ~SmppTlvValue() {};
    virtual SmppTlvTag getTag() const = 0;

    /** @brief shape this value encodes. must match getTag().getShape(). */
    virtual SmppTlvShape getShape() const = 0;
};

SmppTlvValue* createTlvValue(const SmppTlvTag &tag);

}

#endif // SMPP_TLV_VALUE_H
