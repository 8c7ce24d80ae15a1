#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-tlv-types.hh"
#include "smpp-tlv/smpp-network-error-code-tlv-value.hh"

#include <arpa/inet.h>

namespace smpp {

SmppNetworkErrorCodeTlvValue::SmppNetworkErrorCodeTlvValue() {
    _networkType = 0;
    _errorCode = 0;
}

SmppNetworkErrorCodeTlvValue::~SmppNetworkErrorCodeTlvValue() {

}

SmppTlvTag SmppNetworkErrorCodeTlvValue::getTag() const {
    return SmppTlvTag(SMPP_TLVTAG_NETWORK_ERROR_CODE);
}

SmppTlvShape SmppNetworkErrorCodeTlvValue::getShape() const {
    return ShapeNetworkErrorCode;
}

uint8_t SmppNetworkErrorCodeTlvValue::getNetworkType() const {
    return _networkType;
}

uint16_t SmppNetworkErrorCodeTlvValue::getErrorCode() const {
    return _errorCode;
}

ssize_t SmppNetworkErrorCodeTlvValue::setNetworkType(uint8_t networkType) {
    _networkType = networkType;

    return sizeof(_networkType);
}

ssize_t SmppNetworkErrorCodeTlvValue::setErrorCode(uint16_t errorCode) {
    _errorCode = errorCode;

    return sizeof(_errorCode);
}

ssize_t SmppNetworkErrorCodeTlvValue::parse(const uint8_t *from, size_t tlv_sz) {
    if (tlv_sz != this->length()) {
        log_fatal("bad length. need len %zu, but got %zu.\n", this->length(), tlv_sz);
        return -1;
    }

    const uint8_t *ptr = from;
    size_t buf_remaining = tlv_sz;

    GETVAL_S(ptr, buf_remaining, uint8_t, _networkType, , -1);
    GETVAL_S(ptr, buf_remaining, uint16_t, _errorCode, ntohs, -1);

    if (_networkType < SMPP_NETWORK_TYPE_ANSI_136 || _networkType > SMPP_NETWORK_TYPE_RESERVED) {
        log_warn("unknown network type %u, keeping it anyway.\n", _networkType);
    }

    return ptr - from;
}

ssize_t SmppNetworkErrorCodeTlvValue::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < this->length()) {
        log_fatal("buf too small, can not write.\n");
        return -1;
    }

    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    PUTVAL_S(ptr, buf_remaining, uint8_t, _networkType, , -1);
    PUTVAL_S(ptr, buf_remaining, uint16_t, _errorCode, htons, -1);

    return ptr - to;
}

size_t SmppNetworkErrorCodeTlvValue::length() const {
    return sizeof(_networkType) + sizeof(_errorCode);
}

}
