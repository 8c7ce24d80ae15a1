#include "utils/log.hh"
#include "utils/value-ops.hh"
#include "smpp-pdu/smpp-data-sm-body.hh"

namespace smpp {

SmppDataSmBody::SmppDataSmBody() : _serviceType(), _sourceAddr(), _destinationAddr() {
    _sourceAddrTon = 0;
    _sourceAddrNpi = 0;
    _destAddrTon = 0;
    _destAddrNpi = 0;
    _esmClass = 0;
    _registeredDelivery = 0;
    _dataCoding = 0;
}

SmppDataSmBody::~SmppDataSmBody() {

}

uint32_t SmppDataSmBody::getCommandId() const {
    return SMPP_CMDID_DATA_SM;
}

const std::string& SmppDataSmBody::getServiceType() const {
    return _serviceType;
}

uint8_t SmppDataSmBody::getSourceAddrTon() const {
    return _sourceAddrTon;
}

uint8_t SmppDataSmBody::getSourceAddrNpi() const {
    return _sourceAddrNpi;
}

const std::string& SmppDataSmBody::getSourceAddr() const {
    return _sourceAddr;
}

uint8_t SmppDataSmBody::getDestAddrTon() const {
    return _destAddrTon;
}

uint8_t SmppDataSmBody::getDestAddrNpi() const {
    return _destAddrNpi;
}

const std::string& SmppDataSmBody::getDestinationAddr() const {
    return _destinationAddr;
}

uint8_t SmppDataSmBody::getEsmClass() const {
    return _esmClass;
}

uint8_t SmppDataSmBody::getRegisteredDelivery() const {
    return _registeredDelivery;
}

uint8_t SmppDataSmBody::getDataCoding() const {
    return _dataCoding;
}

ssize_t SmppDataSmBody::setServiceType(const std::string &serviceType) {
    ssize_t ret = checkCString("service_type", serviceType, SMPP_SERVICE_TYPE_MAX);

    if (ret < 0) {
        return -1;
    }

    _serviceType = serviceType;

    return ret;
}

ssize_t SmppDataSmBody::setSourceAddrTon(uint8_t ton) {
    _sourceAddrTon = ton;

    return sizeof(_sourceAddrTon);
}

ssize_t SmppDataSmBody::setSourceAddrNpi(uint8_t npi) {
    _sourceAddrNpi = npi;

    return sizeof(_sourceAddrNpi);
}

ssize_t SmppDataSmBody::setSourceAddr(const std::string &addr) {
    ssize_t ret = checkCString("source_addr", addr, SMPP_DATA_SM_ADDR_MAX);

    if (ret < 0) {
        return -1;
    }

    _sourceAddr = addr;

    return ret;
}

ssize_t SmppDataSmBody::setDestAddrTon(uint8_t ton) {
    _destAddrTon = ton;

    return sizeof(_destAddrTon);
}

ssize_t SmppDataSmBody::setDestAddrNpi(uint8_t npi) {
    _destAddrNpi = npi;

    return sizeof(_destAddrNpi);
}

ssize_t SmppDataSmBody::setDestinationAddr(const std::string &addr) {
    ssize_t ret = checkCString("destination_addr", addr, SMPP_DATA_SM_ADDR_MAX);

    if (ret < 0) {
        return -1;
    }

    _destinationAddr = addr;

    return ret;
}

ssize_t SmppDataSmBody::setEsmClass(uint8_t esmClass) {
    _esmClass = esmClass;

    return sizeof(_esmClass);
}

ssize_t SmppDataSmBody::setRegisteredDelivery(uint8_t registeredDelivery) {
    _registeredDelivery = registeredDelivery;

    return sizeof(_registeredDelivery);
}

ssize_t SmppDataSmBody::setDataCoding(uint8_t dataCoding) {
    _dataCoding = dataCoding;

    return sizeof(_dataCoding);
}

/**
 * @brief parse a data_sm body.
 * 
 * @param from source buffer - must start after the pdu header.
 * @param body_sz command_length minus the header size.
 * @return ssize_t bytes read, or -1 on error.
 */
ssize_t SmppDataSmBody::parse(const uint8_t *from, size_t body_sz) {
    const uint8_t *ptr = from;
    size_t buf_remaining = body_sz;

    GETCSTR_S(ptr, buf_remaining, SMPP_SERVICE_TYPE_MAX, _serviceType, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _sourceAddrTon, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _sourceAddrNpi, , -1);
    GETCSTR_S(ptr, buf_remaining, SMPP_DATA_SM_ADDR_MAX, _sourceAddr, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _destAddrTon, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _destAddrNpi, , -1);
    GETCSTR_S(ptr, buf_remaining, SMPP_DATA_SM_ADDR_MAX, _destinationAddr, -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _esmClass, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _registeredDelivery, , -1);
    GETVAL_S(ptr, buf_remaining, uint8_t, _dataCoding, , -1);

    this->clearTlvs();

    ssize_t tlvs_len = this->parseTlvs(ptr, buf_remaining);

    if (tlvs_len < 0) {
        return -1;
    }

    ptr += tlvs_len;

    return ptr - from;
}

ssize_t SmppDataSmBody::write(uint8_t *to, size_t buf_sz) const {
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
    PUTVAL_S(ptr, buf_remaining, uint8_t, _registeredDelivery, , -1);
    PUTVAL_S(ptr, buf_remaining, uint8_t, _dataCoding, , -1);

    ssize_t tlvs_len = this->writeTlvs(ptr, buf_remaining);

    if (tlvs_len < 0) {
        return -1;
    }

    ptr += tlvs_len;

    return ptr - to;
}

size_t SmppDataSmBody::length() const {
    size_t len = 0;

    len += _serviceType.size() + 1;
    len += sizeof(_sourceAddrTon) + sizeof(_sourceAddrNpi) + _sourceAddr.size() + 1;
    len += sizeof(_destAddrTon) + sizeof(_destAddrNpi) + _destinationAddr.size() + 1;
    len += sizeof(_esmClass) + sizeof(_registeredDelivery) + sizeof(_dataCoding);
    len += this->tlvsLength();

    return len;
}

}
