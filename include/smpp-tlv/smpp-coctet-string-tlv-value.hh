#ifndef SMPP_COCTET_STRING_TLV_H
#define SMPP_COCTET_STRING_TLV_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-value.hh"

#include <string>

namespace smpp {

/**
 * @brief value of the NUL terminated text parameters, e.g.
 * receipted_message_id.
 */
class SmppCOctetStringTlvValue : public SmppTlvValue {
public:
    SmppCOctetStringTlvValue(uint16_t tag);
    SmppCOctetStringTlvValue(uint16_t tag, const std::string &value);
    ~SmppCOctetStringTlvValue();
    SmppTlvTag getTag() const;
    SmppTlvShape getShape() const;

    const std::string& getString() const;

    ssize_t setString(const std::string &value);

private:
    SmppTlvTag _tag;
    std::string _value;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t tlv_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

}

#endif // SMPP_COCTET_STRING_TLV_H
