#ifndef SMPP_TLV_H
#define SMPP_TLV_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-tag.hh"
#include "smpp-tlv/smpp-tlv-value.hh"

#include <string>
#include <vector>

namespace smpp {

class SmppTlv : public Serializable {
public:
    SmppTlv();
    SmppTlv(const SmppTlvTag &tag);
    ~SmppTlv();

    SmppTlv(const SmppTlv &) = delete;
    SmppTlv& operator=(const SmppTlv &) = delete;

    static SmppTlv* newTyped(SmppTlvValue *value);

    static SmppTlv* newCustom(uint16_t tag, const std::vector<uint8_t> &value);
    static SmppTlv* newCustom(uint16_t tag, size_t size, const uint8_t *src);
    static SmppTlv* newCustomU16(uint16_t tag, uint16_t value);
    static SmppTlv* newCustomU32(uint16_t tag, uint32_t value);
    static SmppTlv* newCustomU64(uint16_t tag, uint64_t value);
    static SmppTlv* newCustomString(uint16_t tag, const std::string &value);

    SmppTlvTag getTag() const;
    uint16_t getValueLength() const;
    const SmppTlvValue* getValue() const;

    const std::vector<uint8_t>* extractRawBytes() const;
    ssize_t extractU16(uint16_t &dst) const;
    ssize_t extractU32(uint32_t &dst) const;
    ssize_t extractU64(uint64_t &dst) const;
    ssize_t extractString(std::string &dst) const;

private:
    SmppTlv(SmppTlvValue *value);

    SmppTlvTag _tag;
    uint16_t _valueLength;
    SmppTlvValue *_value;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t buf_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

}

#endif // SMPP_TLV_H
