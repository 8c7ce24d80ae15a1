#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-octet-string-tlv-value.hh"

namespace smpp {

SmppOctetStringTlvValue::SmppOctetStringTlvValue(uint16_t tag) : _tag(tag), _value() {
    if (_tag.getShape() != ShapeOctetString) {
        log_error("tag 0x%.4x (%s) is not an octet string parameter.\n", tag, _tag.getName());
    }
}

SmppOctetStringTlvValue::SmppOctetStringTlvValue(uint16_t tag, const std::vector<uint8_t> &value) : SmppOctetStringTlvValue(tag) {
    this->setBytes(value);
}

SmppOctetStringTlvValue::SmppOctetStringTlvValue(uint16_t tag, size_t size, const uint8_t *src) : SmppOctetStringTlvValue(tag) {
    this->setBytes(size, src);
}

SmppOctetStringTlvValue::~SmppOctetStringTlvValue() {

}

SmppTlvTag SmppOctetStringTlvValue::getTag() const {
    return _tag;
}

SmppTlvShape SmppOctetStringTlvValue::getShape() const {
    return ShapeOctetString;
}

const std::vector<uint8_t>& SmppOctetStringTlvValue::getBytes() const {
    return _value;
}

/**
 * @brief set the bytes.
 * 
 * @param value new value.
 * @return ssize_t new size, or -1 if the size is not allowed for this tag.
 */
ssize_t SmppOctetStringTlvValue::setBytes(const std::vector<uint8_t> &value) {
    const SmppTlvTagInfo *info = _tag.getInfo();

    if (info != nullptr && (value.size() < info->minLength || value.size() > info->maxLength)) {
        log_error("bad size for %s: %zu bytes, must be %u - %u.\n", _tag.getName(), value.size(), info->minLength, info->maxLength);
        return -1;
    }

    if (value.size() > UINT16_MAX) {
        log_error("value too long for a tlv (%zu bytes).\n", value.size());
        return -1;
    }

    _value = value;

    return _value.size();
}

ssize_t SmppOctetStringTlvValue::setBytes(size_t size, const uint8_t *src) {
    return this->setBytes(std::vector<uint8_t>(src, src + size));
}

ssize_t SmppOctetStringTlvValue::parse(const uint8_t *from, size_t tlv_sz) {
    const SmppTlvTagInfo *info = _tag.getInfo();

    if (info != nullptr && (tlv_sz < info->minLength || tlv_sz > info->maxLength)) {
        log_fatal("bad length for %s. need len %u - %u, but got %zu.\n", _tag.getName(), info->minLength, info->maxLength, tlv_sz);
        return -1;
    }

    const uint8_t *ptr = from;
    size_t buf_remaining = tlv_sz;

    GETOCTETS_S(ptr, buf_remaining, tlv_sz, _value, -1);

    return ptr - from;
}

ssize_t SmppOctetStringTlvValue::write(uint8_t *to, size_t buf_sz) const {
    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    PUTOCTETS_S(ptr, buf_remaining, _value, -1);

    return ptr - to;
}

size_t SmppOctetStringTlvValue::length() const {
    return _value.size();
}

}
