#include "utils/log.hh"
#include "smpp-tlv/smpp-tlv-container.hh"

namespace smpp {

SmppTlvContainer::SmppTlvContainer() : _tlvs() {

}

SmppTlvContainer::~SmppTlvContainer() {
    this->clearTlvs();
}

/**
 * @brief add a tlv to the end of the list.
 * 
 * note: the container handles freeing of the tlv objects. DO NOT free it
 * yourself after pushing. DO NOT pass local variable pointer.
 * 
 * note: any tag is accepted, including vendor-specific ones. onTlvInsert() is
 * called after the tlv is added.
 * 
 * @param tlv tlv.
 */
void SmppTlvContainer::pushTlvRaw(SmppTlv *tlv) {
    if (tlv == nullptr) {
        log_error("tried to push a null tlv.\n");
        return;
    }

    _tlvs.push_back(tlv);

    this->onTlvInsert(tlv->getTag());
}

/**
 * @brief find the first tlv with the given tag.
 * 
 * @param tag tag to look for.
 * @return const SmppTlv* tlv, or nullptr if not found.
 */
const SmppTlv* SmppTlvContainer::getTlv(const SmppTlvTag &tag) const {
    for (const SmppTlv *tlv : _tlvs) {
        if (tlv->getTag() == tag) {
            return tlv;
        }
    }

    return nullptr;
}

/**
 * @brief get the list of tlvs, in insertion order.
 * 
 * @return const std::vector<SmppTlv *>& list of tlvs.
 */
const std::vector<SmppTlv *>& SmppTlvContainer::getTlvs() const {
    return _tlvs;
}

/**
 * @brief get the list of tlvs for bulk changes.
 * 
 * note: onTlvInsert() is not called for tlvs added this way. the container
 * still frees whatever is in the list when cleared or destroyed.
 * 
 * @return std::vector<SmppTlv *>& list of tlvs.
 */
std::vector<SmppTlv *>& SmppTlvContainer::getTlvsMut() {
    return _tlvs;
}

/**
 * @brief take the first tlv with the given tag out of the list.
 * 
 * note: whatever onTlvInsert() did when the tlv was added is not undone.
 * 
 * @param tag tag to look for.
 * @return SmppTlv* removed tlv - you must free this yourself - or nullptr if
 * not found.
 */
SmppTlv* SmppTlvContainer::removeTlv(const SmppTlvTag &tag) {
    for (std::vector<SmppTlv *>::iterator it = _tlvs.begin(); it != _tlvs.end(); ++it) {
        if ((*it)->getTag() == tag) {
            SmppTlv *tlv = *it;
            _tlvs.erase(it);

            return tlv;
        }
    }

    return nullptr;
}

bool SmppTlvContainer::hasTlv(const SmppTlvTag &tag) const {
    return this->getTlv(tag) != nullptr;
}

/**
 * @brief remove and free all tlvs.
 */
void SmppTlvContainer::clearTlvs() {
    for (SmppTlv *tlv : _tlvs) {
        delete tlv;
    }

    _tlvs.clear();
}

/**
 * @brief get size of all tlvs on the wire.
 * 
 * @return size_t size.
 */
size_t SmppTlvContainer::tlvsLength() const {
    size_t len = 0;

    for (const SmppTlv *tlv : _tlvs) {
        len += tlv->length();
    }

    return len;
}

void SmppTlvContainer::onTlvInsert(__attribute__((unused)) const SmppTlvTag &tag) {

}

/**
 * @brief parse tlvs until the end of the buffer, and append them.
 * 
 * note: onTlvInsert() is not called; parsed tlvs are kept as they came on the
 * wire.
 * 
 * @param from source buffer - must start at the first tlv.
 * @param tlvs_sz size of the tlv part of the body.
 * @return ssize_t bytes read, or -1 on error.
 */
ssize_t SmppTlvContainer::parseTlvs(const uint8_t *from, size_t tlvs_sz) {
    const uint8_t *ptr = from;
    size_t buf_remaining = tlvs_sz;

    while (buf_remaining > 0) {
        SmppTlv *tlv = new SmppTlv();

        PARSE_S(ptr, buf_remaining, tlv, -1, true);

        _tlvs.push_back(tlv);
    }

    return ptr - from;
}

ssize_t SmppTlvContainer::writeTlvs(uint8_t *to, size_t buf_sz) const {
    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    for (const SmppTlv *tlv : _tlvs) {
        WRITE_S(ptr, buf_remaining, tlv, -1);
    }

    return ptr - to;
}

}
