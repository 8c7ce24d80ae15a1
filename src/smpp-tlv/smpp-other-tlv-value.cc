#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-other-tlv-value.hh"

namespace smpp {

SmppOtherTlvValue::SmppOtherTlvValue(uint16_t tag) : _tag(SmppTlvTag::other(tag)), _value() {

}

SmppOtherTlvValue::SmppOtherTlvValue(uint16_t tag, const std::vector<uint8_t> &value) : _tag(SmppTlvTag::other(tag)), _value() {
    this->setBytes(value);
}

SmppOtherTlvValue::~SmppOtherTlvValue() {

}

/**
 * @brief get tag of this value.
 * 
 * @return SmppTlvTag always an "other" tag, even if the number is a known
 * standard tag.
 */
SmppTlvTag SmppOtherTlvValue::getTag() const {
    return _tag;
}

SmppTlvShape SmppOtherTlvValue::getShape() const {
    return ShapeRaw;
}

const std::vector<uint8_t>& SmppOtherTlvValue::getBytes() const {
    return _value;
}

/**
 * @brief set the bytes.
 * 
 * @param value new value.
 * @return ssize_t new size, or -1 if longer than a tlv can carry.
 */
ssize_t SmppOtherTlvValue::setBytes(const std::vector<uint8_t> &value) {
    if (value.size() > UINT16_MAX) {
        log_error("value too long for a tlv (%zu bytes).\n", value.size());
        return -1;
    }

    _value = value;

    return _value.size();
}

/**
 * @brief take the value as-is.
 * 
 * @param from source buffer.
 * @param tlv_sz length from the tlv len field.
 * @return ssize_t bytes read, or -1 on error.
 */
ssize_t SmppOtherTlvValue::parse(const uint8_t *from, size_t tlv_sz) {
    const uint8_t *ptr = from;
    size_t buf_remaining = tlv_sz;

    GETOCTETS_S(ptr, buf_remaining, tlv_sz, _value, -1);

    return ptr - from;
}

ssize_t SmppOtherTlvValue::write(uint8_t *to, size_t buf_sz) const {
    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    PUTOCTETS_S(ptr, buf_remaining, _value, -1);

    return ptr - to;
}

size_t SmppOtherTlvValue::length() const {
    return _value.size();
}

}
