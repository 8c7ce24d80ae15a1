#ifndef SMPP_OCTET_STRING_TLV_H
#define SMPP_OCTET_STRING_TLV_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-value.hh"

#include <vector>

namespace smpp {

/**
 * @brief value of the opaque byte parameters, e.g. message_payload or
 * callback_num.
 */
class SmppOctetStringTlvValue : public SmppTlvValue {
public:
    SmppOctetStringTlvValue(uint16_t tag);
    SmppOctetStringTlvValue(uint16_t tag, const std::vector<uint8_t> &value);
    SmppOctetStringTlvValue(uint16_t tag, size_t size, const uint8_t *src);
    ~SmppOctetStringTlvValue();
    SmppTlvTag getTag() const;
    SmppTlvShape getShape() const;

    const std::vector<uint8_t>& getBytes() const;

    ssize_t setBytes(const std::vector<uint8_t> &value);
    ssize_t setBytes(size_t size, const uint8_t *src);

private:
    SmppTlvTag _tag;
    std::vector<uint8_t> _value;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t tlv_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

}

#endif // SMPP_OCTET_STRING_TLV_H
