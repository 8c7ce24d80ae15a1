#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-coctet-string-tlv-value.hh"

#include <string.h>

namespace smpp {

SmppCOctetStringTlvValue::SmppCOctetStringTlvValue(uint16_t tag) : _tag(tag), _value() {
    if (_tag.getShape() != ShapeCOctetString) {
        log_error("tag 0x%.4x (%s) is not a c-octet string parameter.\n", tag, _tag.getName());
    }
}

SmppCOctetStringTlvValue::SmppCOctetStringTlvValue(uint16_t tag, const std::string &value) : SmppCOctetStringTlvValue(tag) {
    this->setString(value);
}

SmppCOctetStringTlvValue::~SmppCOctetStringTlvValue() {

}

SmppTlvTag SmppCOctetStringTlvValue::getTag() const {
    return _tag;
}

SmppTlvShape SmppCOctetStringTlvValue::getShape() const {
    return ShapeCOctetString;
}

const std::string& SmppCOctetStringTlvValue::getString() const {
    return _value;
}

/**
 * @brief set the text.
 * 
 * @param value text, without the NUL.
 * @return ssize_t encoded size (incl. NUL), or -1 if the text is too long or
 * has a NUL in it.
 */
ssize_t SmppCOctetStringTlvValue::setString(const std::string &value) {
    if (value.find('\0') != std::string::npos) {
        log_error("text for %s has an embedded NUL.\n", _tag.getName());
        return -1;
    }

    const SmppTlvTagInfo *info = _tag.getInfo();

    if (info != nullptr && value.size() + 1 > info->maxLength) {
        log_error("text too long for %s: %zu bytes, max %u (incl. NUL).\n", _tag.getName(), value.size() + 1, info->maxLength);
        return -1;
    }

    if (value.size() + 1 > UINT16_MAX) {
        log_error("text too long for a tlv (%zu bytes).\n", value.size() + 1);
        return -1;
    }

    _value = value;

    return this->length();
}

ssize_t SmppCOctetStringTlvValue::parse(const uint8_t *from, size_t tlv_sz) {
    if (tlv_sz < 1) {
        log_fatal("tlv_sz (%zu) is not correct (%s must be >= 1 byte).\n", tlv_sz, _tag.getName());
        return -1;
    }

    const SmppTlvTagInfo *info = _tag.getInfo();

    if (info != nullptr && tlv_sz > info->maxLength) {
        log_fatal("tlv_sz (%zu) too long for %s (max %u).\n", tlv_sz, _tag.getName(), info->maxLength);
        return -1;
    }

    const uint8_t *ptr = from;
    size_t buf_remaining = tlv_sz;

    GETCSTR_S(ptr, buf_remaining, tlv_sz, _value, -1);

    if (buf_remaining != 0) {
        log_fatal("reached NUL but value not end (%zu over).\n", buf_remaining);
        return -1;
    }

    return ptr - from;
}

ssize_t SmppCOctetStringTlvValue::write(uint8_t *to, size_t buf_sz) const {
    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    PUTCSTR_S(ptr, buf_remaining, _value, -1);

    return ptr - to;
}

size_t SmppCOctetStringTlvValue::length() const {
    return _value.size() + 1;
}

}
