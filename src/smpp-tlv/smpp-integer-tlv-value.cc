#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-integer-tlv-value.hh"

#include <arpa/inet.h>

namespace smpp {

SmppIntegerTlvValue::SmppIntegerTlvValue(uint16_t tag, uint32_t value) : _tag(tag) {
    _value = 0;

    if (_tag.getShape() != ShapeInteger) {
        log_error("tag 0x%.4x (%s) is not an integer parameter.\n", tag, _tag.getName());
    }

    this->setValue(value);
}

SmppIntegerTlvValue::~SmppIntegerTlvValue() {

}

SmppTlvTag SmppIntegerTlvValue::getTag() const {
    return _tag;
}

SmppTlvShape SmppIntegerTlvValue::getShape() const {
    return ShapeInteger;
}

/**
 * @brief get the encoded size of the value.
 * 
 * @return size_t 1, 2 or 4. 0 if the tag is not an integer parameter.
 */
size_t SmppIntegerTlvValue::getWidth() const {
    if (_tag.getShape() != ShapeInteger) {
        return 0;
    }

    return _tag.getInfo()->maxLength;
}

uint32_t SmppIntegerTlvValue::getValue() const {
    return _value;
}

/**
 * @brief set the value.
 * 
 * @param value value in host byte order.
 * @return ssize_t width of the value, or -1 if value does not fit.
 */
ssize_t SmppIntegerTlvValue::setValue(uint32_t value) {
    size_t width = this->getWidth();

    if (width < sizeof(uint32_t) && (value >> (width * 8)) != 0) {
        log_error("value %u does not fit in %zu byte(s) (%s).\n", value, width, _tag.getName());
        return -1;
    }

    _value = value;

    return width;
}

ssize_t SmppIntegerTlvValue::parse(const uint8_t *from, size_t tlv_sz) {
    size_t width = this->getWidth();

    if (tlv_sz != width) {
        log_fatal("bad length. need len %zu, but got %zu (%s).\n", width, tlv_sz, _tag.getName());
        return -1;
    }

    const uint8_t *ptr = from;
    size_t buf_remaining = tlv_sz;

    switch (width) {
        case sizeof(uint8_t): {
            uint8_t val;
            GETVAL_S(ptr, buf_remaining, uint8_t, val, , -1);
            _value = val;
            break;
        }
        case sizeof(uint16_t): {
            uint16_t val;
            GETVAL_S(ptr, buf_remaining, uint16_t, val, ntohs, -1);
            _value = val;
            break;
        }
        case sizeof(uint32_t): {
            GETVAL_S(ptr, buf_remaining, uint32_t, _value, ntohl, -1);
            break;
        }
        default:
            log_fatal("unsupported integer width %zu (%s).\n", width, _tag.getName());
            return -1;
    }

    return ptr - from;
}

ssize_t SmppIntegerTlvValue::write(uint8_t *to, size_t buf_sz) const {
    size_t width = this->getWidth();

    if (buf_sz < width) {
        log_fatal("buf_sz (%zu) too small to fit (%s must be size %zu).\n", buf_sz, _tag.getName(), width);
        return -1;
    }

    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    switch (width) {
        case sizeof(uint8_t): {
            PUTVAL_S(ptr, buf_remaining, uint8_t, (uint8_t) _value, , -1);
            break;
        }
        case sizeof(uint16_t): {
            PUTVAL_S(ptr, buf_remaining, uint16_t, (uint16_t) _value, htons, -1);
            break;
        }
        case sizeof(uint32_t): {
            PUTVAL_S(ptr, buf_remaining, uint32_t, _value, htonl, -1);
            break;
        }
        default:
            log_fatal("unsupported integer width %zu (%s).\n", width, _tag.getName());
            return -1;
    }

    return ptr - to;
}

size_t SmppIntegerTlvValue::length() const {
    return this->getWidth();
}

}
