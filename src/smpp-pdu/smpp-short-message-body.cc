#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-tlv-types.hh"
#include "smpp-pdu/smpp-short-message-body.hh"

namespace smpp {

SmppShortMessageBody::SmppShortMessageBody() : _serviceType(), _sourceAddr(), _destinationAddr(), _scheduleDeliveryTime(), _validityPeriod(), _shortMessage() {
    _sourceAddrTon = 0;
    _sourceAddrNpi = 0;
    _destAddrTon = 0;
    _destAddrNpi = 0;
    _esmClass = 0;
    _protocolId = 0;
    _priorityFlag = 0;
    _registeredDelivery = 0;
    _replaceIfPresentFlag = 0;
    _dataCoding = 0;
    _smDefaultMsgId = 0;
}

SmppShortMessageBody::~SmppShortMessageBody() {

}

const std::string& SmppShortMessageBody::getServiceType() const {
    return _serviceType;
}

uint8_t SmppShortMessageBody::getSourceAddrTon() const {
    return _sourceAddrTon;
}

uint8_t SmppShortMessageBody::getSourceAddrNpi() const {
    return _sourceAddrNpi;
}

const std::string& SmppShortMessageBody::getSourceAddr() const {
    return _sourceAddr;
}

uint8_t SmppShortMessageBody::getDestAddrTon() const {
    return _destAddrTon;
}

uint8_t SmppShortMessageBody::getDestAddrNpi() const {
    return _destAddrNpi;
}

const std::string& SmppShortMessageBody::getDestinationAddr() const {
    return _destinationAddr;
}

uint8_t SmppShortMessageBody::getEsmClass() const {
    return _esmClass;
}

uint8_t SmppShortMessageBody::getProtocolId() const {
    return _protocolId;
}

uint8_t SmppShortMessageBody::getPriorityFlag() const {
    return _priorityFlag;
}

const std::string& SmppShortMessageBody::getScheduleDeliveryTime() const {
    return _scheduleDeliveryTime;
}

const std::string& SmppShortMessageBody::getValidityPeriod() const {
    return _validityPeriod;
}

uint8_t SmppShortMessageBody::getRegisteredDelivery() const {
    return _registeredDelivery;
}

uint8_t SmppShortMessageBody::getReplaceIfPresentFlag() const {
    return _replaceIfPresentFlag;
}

uint8_t SmppShortMessageBody::getDataCoding() const {
    return _dataCoding;
}

uint8_t SmppShortMessageBody::getSmDefaultMsgId() const {
    return _smDefaultMsgId;
}

/**
 * @brief get sm_length field.
 * 
 * @return uint8_t size of short_message.
 */
uint8_t SmppShortMessageBody::getSmLength() const {
    return _shortMessage.size();
}

const std::vector<uint8_t>& SmppShortMessageBody::getShortMessage() const {
    return _shortMessage;
}

ssize_t SmppShortMessageBody::setServiceType(const std::string &serviceType) {
    ssize_t ret = checkCString("service_type", serviceType, SMPP_SERVICE_TYPE_MAX);

    if (ret < 0) {
        return -1;
    }

    _serviceType = serviceType;

    return ret;
}

ssize_t SmppShortMessageBody::setSourceAddrTon(uint8_t ton) {
    _sourceAddrTon = ton;

    return sizeof(_sourceAddrTon);
}

ssize_t SmppShortMessageBody::setSourceAddrNpi(uint8_t npi) {
    _sourceAddrNpi = npi;

    return sizeof(_sourceAddrNpi);
}

ssize_t SmppShortMessageBody::setSourceAddr(const std::string &addr) {
    ssize_t ret = checkCString("source_addr", addr, SMPP_SM_ADDR_MAX);

    if (ret < 0) {
        return -1;
    }

    _sourceAddr = addr;

    return ret;
}

ssize_t SmppShortMessageBody::setDestAddrTon(uint8_t ton) {
    _destAddrTon = ton;

    return sizeof(_destAddrTon);
}

ssize_t SmppShortMessageBody::setDestAddrNpi(uint8_t npi) {
    _destAddrNpi = npi;

    return sizeof(_destAddrNpi);
}

ssize_t SmppShortMessageBody::setDestinationAddr(const std::string &addr) {
    ssize_t ret = checkCString("destination_addr", addr, SMPP_SM_ADDR_MAX);

    if (ret < 0) {
        return -1;
    }

    _destinationAddr = addr;

    return ret;
}

ssize_t SmppShortMessageBody::setEsmClass(uint8_t esmClass) {
    _esmClass = esmClass;

    return sizeof(_esmClass);
}

ssize_t SmppShortMessageBody::setProtocolId(uint8_t protocolId) {
    _protocolId = protocolId;

    return sizeof(_protocolId);
}

ssize_t SmppShortMessageBody::setPriorityFlag(uint8_t priorityFlag) {
    _priorityFlag = priorityFlag;

    return sizeof(_priorityFlag);
}

/**
 * @brief set schedule_delivery_time.
 * 
 * @param time empty (immediate delivery) or a 16 character
 * "YYMMDDhhmmsstnnp" time.
 * @return ssize_t encoded size, or -1 on error.
 */
ssize_t SmppShortMessageBody::setScheduleDeliveryTime(const std::string &time) {
    if (!time.empty() && time.size() != SMPP_TIME_MAX - 1) {
        log_error("schedule_delivery_time must be empty or %d chars, got %zu.\n", SMPP_TIME_MAX - 1, time.size());
        return -1;
    }

    ssize_t ret = checkCString("schedule_delivery_time", time, SMPP_TIME_MAX);

    if (ret < 0) {
        return -1;
    }

    _scheduleDeliveryTime = time;

    return ret;
}

/**
 * @brief set validity_period.
 * 
 * @param time empty (smsc default) or a 16 character time.
 * @return ssize_t encoded size, or -1 on error.
 */
ssize_t SmppShortMessageBody::setValidityPeriod(const std::string &time) {
    if (!time.empty() && time.size() != SMPP_TIME_MAX - 1) {
        log_error("validity_period must be empty or %d chars, got %zu.\n", SMPP_TIME_MAX - 1, time.size());
        return -1;
    }

    ssize_t ret = checkCString("validity_period", time, SMPP_TIME_MAX);

    if (ret < 0) {
        return -1;
    }

    _validityPeriod = time;

    return ret;
}

ssize_t SmppShortMessageBody::setRegisteredDelivery(uint8_t registeredDelivery) {
    _registeredDelivery = registeredDelivery;

    return sizeof(_registeredDelivery);
}

ssize_t SmppShortMessageBody::setReplaceIfPresentFlag(uint8_t replaceIfPresentFlag) {
    _replaceIfPresentFlag = replaceIfPresentFlag;

    return sizeof(_replaceIfPresentFlag);
}

ssize_t SmppShortMessageBody::setDataCoding(uint8_t dataCoding) {
    _dataCoding = dataCoding;

    return sizeof(_dataCoding);
}

ssize_t SmppShortMessageBody::setSmDefaultMsgId(uint8_t smDefaultMsgId) {
    _smDefaultMsgId = smDefaultMsgId;

    return sizeof(_smDefaultMsgId);
}

/**
 * @brief set short_message. sm_length follows.
 * 
 * note: this does not touch a message_payload tlv already in the body. the
 * next pushTlvRaw() on this body empties short_message again.
 * 
 * @param shortMessage message, up to 255 bytes.
 * @return ssize_t size of the message, or -1 if too long.
 */
ssize_t SmppShortMessageBody::setShortMessage(const std::vector<uint8_t> &shortMessage) {
    if (shortMessage.size() > SMPP_SHORT_MESSAGE_MAX) {
        log_error("short_message too long: %zu bytes, max %d. use a message_payload tlv instead.\n", shortMessage.size(), SMPP_SHORT_MESSAGE_MAX);
        return -1;
    }

    if (this->hasTlv(SMPP_TLVTAG_MESSAGE_PAYLOAD)) {
        log_warn("short_message set while a message_payload tlv is present.\n");
    }

    _shortMessage = shortMessage;

    return _shortMessage.size();
}

ssize_t SmppShortMessageBody::setShortMessage(const std::string &shortMessage) {
    return this->setShortMessage(std::vector<uint8_t>(shortMessage.begin(), shortMessage.end()));
}

/**
 * @brief empty short_message after any insert, as long as the body carries a
 * message_payload tlv.
 * 
 * @param tag tag of the new tlv.
 */
void SmppShortMessageBody::onTlvInsert(const SmppTlvTag &tag) {
    if (!this->hasTlv(SMPP_TLVTAG_MESSAGE_PAYLOAD)) {
        return;
    }

    if (!_shortMessage.empty()) {
        log_debug("%s added with message_payload present, dropping %zu bytes of short_message.\n", SmppTlvTagText(tag).str, _shortMessage.size());
    }

    _shortMessage.clear();
}

/**
 * @brief parse a submit_sm/deliver_sm body.
 * 
 * @param from source buffer - must start after the pdu header.
 * @param body_sz command_length minus the header size.
 * @return ssize_t bytes read, or -1 on error.
 */
ssize_t SmppShortMessageBody::parse(const uint8_t *from, size_t body_sz) {
    const uint8_t *ptr = from;
    size_t buf_remaining = body_sz;

    GETCSTR_S(ptr, buf_remaining, SMPP_SERVICE_TYPE_MAX, _serviceType, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _sourceAddrTon, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _sourceAddrNpi, , -1);
    GETCSTR_S(ptr, buf_remaining, SMPP_SM_ADDR_MAX, _sourceAddr, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _destAddrTon, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _destAddrNpi, , -1);
    GETCSTR_S(ptr, buf_remaining, SMPP_SM_ADDR_MAX, _destinationAddr, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _esmClass, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _protocolId, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _priorityFlag, , -1);
    GETCSTR_S(ptr, buf_remaining, SMPP_TIME_MAX, _scheduleDeliveryTime, -1);
    GETCSTR_S(ptr, buf_remaining, SMPP_TIME_MAX, _validityPeriod, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _registeredDelivery, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _replaceIfPresentFlag, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _dataCoding, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _smDefaultMsgId, , -1);

    uint8_t sm_length;
    GETVAL_S(ptr, buf_remaining, uint8_t, sm_length, , -1);
    GETOCTETS_S(ptr, buf_remaining, sm_length, _shortMessage, -1);

    this->clearTlvs();

    ssize_t tlvs_len = this->parseTlvs(ptr, buf_remaining);

    if (tlvs_len < 0) {
        return -1;
    }

    ptr += tlvs_len;

    if (!_shortMessage.empty() && this->hasTlv(SMPP_TLVTAG_MESSAGE_PAYLOAD)) {
        log_warn("peer sent both short_message (%zu bytes) and message_payload.\n", _shortMessage.size());
    }

    return ptr - from;
}

/**
 * @brief write the body - not incl. pdu header.
 * 
 * @param to dst buffer.
 * @param buf_sz dst buffer size.
 * @return ssize_t bytes written, or -1 on error.
 */
ssize_t SmppShortMessageBody::write(uint8_t *to, size_t buf_sz) const {
    size_t len = this->length();

    if (len > buf_sz) {
        log_fatal("buf_sz (%zu) too small - can not fit body (size is %zu)\n", buf_sz, len);
        return -1;
    }

    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    PUTCSTR_S(ptr, buf_remaining, _serviceType, -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _sourceAddrTon, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _sourceAddrNpi, , -1);
    PUTCSTR_S(ptr, buf_remaining, _sourceAddr, -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _destAddrTon, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _destAddrNpi, , -1);
    PUTCSTR_S(ptr, buf_remaining, _destinationAddr, -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _esmClass, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _protocolId, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _priorityFlag, , -1);
    PUTCSTR_S(ptr, buf_remaining, _scheduleDeliveryTime, -1);
    PUTCSTR_S(ptr, buf_remaining, _validityPeriod, -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _registeredDelivery, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _replaceIfPresentFlag, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _dataCoding, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _smDefaultMsgId, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, this->getSmLength(), , -1);
    PUTOCTETS_S(ptr, buf_remaining, _shortMessage, -1);

    ssize_t tlvs_len = this->writeTlvs(ptr, buf_remaining);

    if (tlvs_len < 0) {
        return -1;
    }

    ptr += tlvs_len;

    return ptr - to;
}

size_t SmppShortMessageBody::length() const {
    size_t len = 0;

    len += _serviceType.size() + 1;
    len += sizeof(_sourceAddrTon) + sizeof(_sourceAddrNpi) + _sourceAddr.size() + 1;
    len += sizeof(_destAddrTon) + sizeof(_destAddrNpi) + _destinationAddr.size() + 1;
    len += sizeof(_esmClass) + sizeof(_protocolId) + sizeof(_priorityFlag);
    len += _scheduleDeliveryTime.size() + 1 + _validityPeriod.size() + 1;
    len += sizeof(_registeredDelivery) + sizeof(_replaceIfPresentFlag) + sizeof(_dataCoding) + sizeof(_smDefaultMsgId);
    len += sizeof(uint8_t) + _shortMessage.size();
    len += this->tlvsLength();

    return len;
}

uint32_t SmppSubmitSmBody::getCommandId() const {
    return SMPP_CMDID_SUBMIT_SM;
}

uint32_t SmppDeliverSmBody::getCommandId() const {
    return SMPP_CMDID_DELIVER_SM;
}

}
