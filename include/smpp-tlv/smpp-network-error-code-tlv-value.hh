#ifndef SMPP_NETWORK_ERROR_CODE_TLV_H
#define SMPP_NETWORK_ERROR_CODE_TLV_H
#include "core/serializable.hh"
#include "smpp-tlv/smpp-tlv-value.hh"

namespace smpp {

#define SMPP_NETWORK_TYPE_ANSI_136 0x01
#define SMPP_NETWORK_TYPE_IS_95 0x02
#define SMPP_NETWORK_TYPE_GSM 0x03
#define SMPP_NETWORK_TYPE_RESERVED 0x04

class SmppNetworkErrorCodeTlvValue : public SmppTlvValue {
public:
    SmppNetworkErrorCodeTlvValue();
    ~SmppNetworkErrorCodeTlvValue();
    SmppTlvTag getTag() const;
    SmppTlvShape getShape() const;

    uint8_t getNetworkType() const;
    uint16_t getErrorCode() const;

    ssize_t setNetworkType(uint8_t networkType);
    ssize_t setErrorCode(uint16_t errorCode);

private:
    uint8_t _networkType;
    uint16_t _errorCode;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t tlv_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

}

#endif // SMPP_NETWORK_ERROR_CODE_TLV_H
