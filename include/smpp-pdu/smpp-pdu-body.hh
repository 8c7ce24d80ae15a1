#ifndef SMPP_PDU_BODY_H
#define SMPP_PDU_BODY_H
#include "core/serializable.hh"

#include <string>

#define SMPP_CMDID_SUBMIT_SM 0x00000004
#define SMPP_CMDID_DELIVER_SM 0x00000005
#define SMPP_CMDID_DATA_SM 0x00000103

// max sizes of the c-octet string fields, incl. NUL.
#define SMPP_SERVICE_TYPE_MAX 6
#define SMPP_SM_ADDR_MAX 21
#define SMPP_DATA_SM_ADDR_MAX 65
#define SMPP_TIME_MAX 17

#define SMPP_SHORT_MESSAGE_MAX 255

namespace smpp {

class SmppPduBody : public Serializable {
public:
    virtual ~SmppPduBody() {};
    virtual uint32_t getCommandId() const = 0;
};

ssize_t checkCString(const char *field, const std::string &value, size_t max_sz);

}

#endif // SMPP_PDU_BODY_H
