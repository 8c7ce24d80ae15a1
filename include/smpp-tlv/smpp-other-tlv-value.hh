#ifndef SMPP_OTHER_TLV_H
#define SMPP_OTHER_TLV_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-value.hh"

#include <vector>

namespace smpp {

/**
 * @brief uninterpreted bytes under an "other" tag. used for vendor-specific
 * parameters and for standard tags we don't know about.
 */
class SmppOtherTlvValue : public SmppTlvValue {
public:
    SmppOtherTlvValue(uint16_t tag);
    SmppOtherTlvValue(uint16_t tag, const std::vector<uint8_t> &value);
    ~SmppOtherTlvValue();
    SmppTlvTag getTag() const;
    SmppTlvShape getShape() const;

    const std::vector<uint8_t>& getBytes() const;
    ssize_t setBytes(const std::vector<uint8_t> &value);

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

#endif // SMPP_OTHER_TLV_H
