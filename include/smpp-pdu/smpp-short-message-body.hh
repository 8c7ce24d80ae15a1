#ifndef SMPP_SHORT_MESSAGE_BODY_H
#define SMPP_SHORT_MESSAGE_BODY_H
#include "smpp-pdu/smpp-pdu-body.hh"
#include "smpp-tlv/smpp-tlv-container.hh"

#include <string>
#include <vector>

namespace smpp {

/**
 * @brief body layout shared by submit_sm and deliver_sm.
 * 
 * short_message and a message_payload tlv can not be used together: pushing
 * any tlv while a message_payload tlv is present empties short_message.
 * removing the tlv later does not bring it back.
 */
class SmppShortMessageBody : public SmppPduBody, public SmppTlvContainer {
public:
    SmppShortMessageBody();
    virtual ~SmppShortMessageBody();

    const std::string& getServiceType() const;
    uint8_t getSourceAddrTon() const;
    uint8_t getSourceAddrNpi() const;
    const std::string& getSourceAddr() const;
    uint8_t getDestAddrTon() const;
    uint8_t getDestAddrNpi() const;
    const std::string& getDestinationAddr() const;
    uint8_t getEsmClass() const;
    uint8_t getProtocolId() const;
    uint8_t getPriorityFlag() const;
    const std::string& getScheduleDeliveryTime() const;
    const std::string& getValidityPeriod() const;
    uint8_t getRegisteredDelivery() const;
    uint8_t getReplaceIfPresentFlag() const;
    uint8_t getDataCoding() const;
    uint8_t getSmDefaultMsgId() const;
    uint8_t getSmLength() const;
    const std::vector<uint8_t>& getShortMessage() const;

    ssize_t setServiceType(const std::string &serviceType);
    ssize_t setSourceAddrTon(uint8_t ton);
    ssize_t setSourceAddrNpi(uint8_t npi);
    ssize_t setSourceAddr(const std::string &addr);
    ssize_t setDestAddrTon(uint8_t ton);
    ssize_t setDestAddrNpi(uint8_t npi);
    ssize_t setDestinationAddr(const std::string &addr);
    ssize_t setEsmClass(uint8_t esmClass);
    ssize_t setProtocolId(uint8_t protocolId);
    ssize_t setPriorityFlag(uint8_t priorityFlag);
    ssize_t setScheduleDeliveryTime(const std::string &time);
    ssize_t setValidityPeriod(const std::string &time);
    ssize_t setRegisteredDelivery(uint8_t registeredDelivery);
    ssize_t setReplaceIfPresentFlag(uint8_t replaceIfPresentFlag);
    ssize_t setDataCoding(uint8_t dataCoding);
    ssize_t setSmDefaultMsgId(uint8_t smDefaultMsgId);
    ssize_t setShortMessage(const std::vector<uint8_t> &shortMessage);
    ssize_t setShortMessage(const std::string &shortMessage);

protected:
    void onTlvInsert(const SmppTlvTag &tag);

private:
    std::string _serviceType;
    uint8_t _sourceAddrTon;
    uint8_t _sourceAddrNpi;
    std::string _sourceAddr;
    uint8_t _destAddrTon;
    uint8_t _destAddrNpi;
    std::string _destinationAddr;
    uint8_t _esmClass;
    uint8_t _protocolId;
    uint8_t _priorityFlag;
    std::string _scheduleDeliveryTime;
    std::string _validityPeriod;
    uint8_t _registeredDelivery;
    uint8_t _replaceIfPresentFlag;
    uint8_t _dataCoding;
    uint8_t _smDefaultMsgId;
    std::vector<uint8_t> _shortMessage;

// ----------------------------------------------------------------------------

public:
    ssize_t parse(const uint8_t *from, size_t body_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
    size_t length() const;
};

class SmppSubmitSmBody : public SmppShortMessageBody {
public:
    uint32_t getCommandId() const;
};

class SmppDeliverSmBody : public SmppShortMessageBody {
public:
    uint32_t getCommandId() const;
};

}

#endif // SMPP_SHORT_MESSAGE_BODY_H
