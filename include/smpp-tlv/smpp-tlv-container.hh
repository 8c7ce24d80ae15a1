#ifndef SMPP_TLV_CONTAINER_H
#define SMPP_TLV_CONTAINER_H
#include "smpp-tlv/smpp-tlv.hh"

#include <vector>

namespace smpp {

/**
 * @brief ordered list of tlvs carried by a pdu body.
 * 
 * pdu bodies that take optional parameters inherit this. bodies that need to
 * react to a new tlv (e.g. submit_sm clearing short_message when a
 * message_payload is added) override onTlvInsert().
 */
class SmppTlvContainer {
public:
    SmppTlvContainer();
    virtual ~SmppTlvContainer();

    SmppTlvContainer(const SmppTlvContainer &) = delete;
    SmppTlvContainer& operator=(const SmppTlvContainer &) = delete;

    void pushTlvRaw(SmppTlv *tlv);

    const SmppTlv* getTlv(const SmppTlvTag &tag) const;
    const std::vector<SmppTlv *>& getTlvs() const;
    std::vector<SmppTlv *>& getTlvsMut();

    SmppTlv* removeTlv(const SmppTlvTag &tag);

    bool hasTlv(const SmppTlvTag &tag) const;
    void clearTlvs();

    size_t tlvsLength() const;

protected:
    virtual void onTlvInsert(const SmppTlvTag &tag);

    ssize_t parseTlvs(const uint8_t *from, size_t tlvs_sz);
    ssize_t writeTlvs(uint8_t *to, size_t buf_sz) const;

private:
    std::vector<SmppTlv *> _tlvs;
};

}

#endif // SMPP_TLV_CONTAINER_H
