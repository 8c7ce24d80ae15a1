#ifndef SMPP_INTEGER_TLV_H
#define SMPP_INTEGER_TLV_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-value.hh"

namespace smpp {

/**
 * @brief value of the fixed width (1, 2 or 4 bytes) integer parameters, e.g.
 * sar_msg_ref_num or qos_time_to_live.
 */
class SmppIntegerTlvValue : public SmppTlvValue {
public:
    SmppIntegerTlvValue(uint16_t tag, uint32_t value = 0);
    ~SmppIntegerTlvValue();
    SmppTlvTag getTag() const;
    SmppTlvShape getShape() const;

    size_t getWidth() const;
    uint32_t getValue() const;

    ssize_t setValue(uint32_t value);

private:
    SmppTlvTag _tag;
    uint32_t _value;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t tlv_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

}

#endif // SMPP_INTEGER_TLV_H
