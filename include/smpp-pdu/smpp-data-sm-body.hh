#ifndef SMPP_DATA_SM_BODY_H
#define SMPP_DATA_SM_BODY_H
#include "smpp-pdu/smpp-pdu-body.hh"
#include "smpp-tlv/smpp-tlv-container.hh"

#include <string>

namespace smpp {

/**
 * @brief data_sm body. no short_message field; message content goes in a
 * message_payload tlv.
 */
class SmppDataSmBody : public SmppPduBody, public SmppTlvContainer {
public:
    SmppDataSmBody();
    ~SmppDataSmBody();
    uint32_t getCommandId() const;

    const std::string& getServiceType() const;
    uint8_t getSourceAddrTon() const;
    uint8_t getSourceAddrNpi() const;
    const std::string& getSourceAddr() const;
    uint8_t getDestAddrTon() const;
    uint8_t getDestAddrNpi() const;
    const std::string& getDestinationAddr() const;
    uint8_t getEsmClass() const;
    uint8_t getRegisteredDelivery() const;
    uint8_t getDataCoding() const;

    ssize_t setServiceType(const std::string &serviceType);
    ssize_t setSourceAddrTon(uint8_t ton);
    ssize_t setSourceAddrNpi(uint8_t npi);
    ssize_t setSourceAddr(const std::string &addr);
    ssize_t setDestAddrTon(uint8_t ton);
    ssize_t setDestAddrNpi(uint8_t npi);
    ssize_t setDestinationAddr(const std::string &addr);
    ssize_t setEsmClass(uint8_t esmClass);
    ssize_t setRegisteredDelivery(uint8_t registeredDelivery);
    ssize_t setDataCoding(uint8_t dataCoding);

private:
    std::string _serviceType;
    uint8_t _sourceAddrTon;
    uint8_t _sourceAddrNpi;
    std::string _sourceAddr;
    uint8_t _destAddrTon;
    uint8_t _destAddrNpi;
    std::string _destinationAddr;
    uint8_t _esmClass;
    uint8_t _registeredDelivery;
    uint8_t _dataCoding;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t body_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

}

#endif // SMPP_DATA_SM_BODY_H
