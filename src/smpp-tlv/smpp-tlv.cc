#include "utils/log.hh"
#include "utils/utf8.hh"
#include "utils/value-ops.hh"
#include "smpp-tlv/smpp-tlv.hh"
#include "smpp-tlv/smpp-other-tlv-value.hh"

#include <arpa/inet.h>
#include <endian.h>

namespace smpp {

/**
 * @brief construct an empty tlv, to be filled by parse().
 */
SmppTlv::SmppTlv() : _tag() {
    _valueLength = 0;
    _value = nullptr;
}

/**
 * @brief construct a tlv from a value. tag and length are taken from the
 * value.
 * 
 * note: value must already be checked by newTyped() or newCustom().
 * 
 * @param value value - we will handle freeing this.
 */
SmppTlv::SmppTlv(SmppTlvValue *value) : _tag(value->getTag()) {
    _valueLength = value->length();
    _value = value;
}

/**
 * @brief construct a zero-length tlv (presence only).
 * 
 * @param tag tag of the tlv.
 */
SmppTlv::SmppTlv(const SmppTlvTag &tag) : _tag(tag) {
    _valueLength = 0;
    _value = nullptr;
}

SmppTlv::~SmppTlv() {
    if (_value != nullptr) {
        delete _value;
    }
}

/**
 * @brief create a tlv from a typed value. tag and length are taken from the
 * value.
 * 
 * the value is refused (and freed) if it is null, if its type does not encode
 * the shape its tag designates, or if it does not fit in the length field.
 * 
 * @param value value - we will handle freeing this.
 * @return SmppTlv* new tlv, or nullptr if the value is refused. you must free
 * this yourself, unless pushed into a container.
 */
SmppTlv* SmppTlv::newTyped(SmppTlvValue *value) {
    if (value == nullptr) {
        log_error("tried to create a tlv from a null value.\n");
        return nullptr;
    }

    SmppTlvTag tag = value->getTag();

    if (value->getShape() != tag.getShape()) {
        log_error("value type does not match the shape of %s.\n", SmppTlvTagText(tag).str);
        delete value;
        return nullptr;
    }

    if (value->length() > UINT16_MAX) {
        log_error("value of %s too long for a tlv (%zu bytes).\n", SmppTlvTagText(tag).str, value->length());
        delete value;
        return nullptr;
    }

    return new SmppTlv(value);
}

/**
 * @brief create a tlv with an "other" tag and arbitrary bytes.
 * 
 * the tag is not checked against the vendor range (0x1400 - 0x3fff); any
 * number goes, and is always kept as an "other" tag.
 * 
 * @param tag numeric tag in host byte order.
 * @param value value bytes.
 * @return SmppTlv* new tlv, or nullptr if value is longer than 65535 bytes.
 * you must free this yourself, unless pushed into a container.
 */
SmppTlv* SmppTlv::newCustom(uint16_t tag, const std::vector<uint8_t> &value) {
    if (value.size() > UINT16_MAX) {
        log_error("value too long for a tlv (%zu bytes).\n", value.size());
        return nullptr;
    }

    return new SmppTlv(new SmppOtherTlvValue(tag, value));
}

SmppTlv* SmppTlv::newCustom(uint16_t tag, size_t size, const uint8_t *src) {
    return newCustom(tag, std::vector<uint8_t>(src, src + size));
}

/**
 * @brief create a custom tlv holding a big-endian u16.
 */
SmppTlv* SmppTlv::newCustomU16(uint16_t tag, uint16_t value) {
    uint16_t be = htons(value);

    return newCustom(tag, sizeof(be), (const uint8_t *) &be);
}

/**
 * @brief create a custom tlv holding a big-endian u32.
 */
SmppTlv* SmppTlv::newCustomU32(uint16_t tag, uint32_t value) {
    uint32_t be = htonl(value);

    return newCustom(tag, sizeof(be), (const uint8_t *) &be);
}

/**
 * @brief create a custom tlv holding a big-endian u64.
 */
SmppTlv* SmppTlv::newCustomU64(uint16_t tag, uint64_t value) {
    uint64_t be = htobe64(value);

    return newCustom(tag, sizeof(be), (const uint8_t *) &be);
}

/**
 * @brief create a custom tlv holding a string, followed by a NUL.
 * 
 * @param tag numeric tag in host byte order.
 * @param value string (UTF-8).
 * @return SmppTlv* new tlv, or nullptr if too long.
 */
SmppTlv* SmppTlv::newCustomString(uint16_t tag, const std::string &value) {
    std::vector<uint8_t> bytes(value.begin(), value.end());
    bytes.push_back(0);

    return newCustom(tag, bytes);
}

SmppTlvTag SmppTlv::getTag() const {
    return _tag;
}

/**
 * @brief get length field of the tlv.
 * 
 * @return uint16_t length of the value (not incl. tag and length fields).
 */
uint16_t SmppTlv::getValueLength() const {
    return _valueLength;
}

/**
 * @brief get the value.
 * 
 * note: pointer is owned by the tlv.
 * 
 * @return const SmppTlvValue* value, or nullptr for a zero-length tlv.
 */
const SmppTlvValue* SmppTlv::getValue() const {
    return _value;
}

/**
 * @brief get the bytes of a custom/other tlv.
 * 
 * typed values (known tags) are not returned here.
 * 
 * @return const std::vector<uint8_t>* value bytes, or nullptr if the value is
 * not an "other" value.
 */
const std::vector<uint8_t>* SmppTlv::extractRawBytes() const {
    const SmppOtherTlvValue *other = dynamic_cast<const SmppOtherTlvValue *>(_value);

    if (other == nullptr) {
        return nullptr;
    }

    return &other->getBytes();
}

/**
 * @brief read the value of a custom tlv as a big-endian u16.
 * 
 * @param dst where to put the value.
 * @return ssize_t 2, or -1 if not a custom tlv or value is not exactly 2
 * bytes.
 */
ssize_t SmppTlv::extractU16(uint16_t &dst) const {
    const std::vector<uint8_t> *bytes = this->extractRawBytes();

    if (bytes == nullptr || bytes->size() != sizeof(uint16_t)) {
        return -1;
    }

    uint16_t be;
    ssize_t ret = smpp::getValue<uint16_t>(bytes->data(), bytes->size(), be);

    if (ret < 0) {
        return -1;
    }

    dst = ntohs(be);

    return ret;
}

ssize_t SmppTlv::extractU32(uint32_t &dst) const {
    const std::vector<uint8_t> *bytes = this->extractRawBytes();

    if (bytes == nullptr || bytes->size() != sizeof(uint32_t)) {
        return -1;
    }

    uint32_t be;
    ssize_t ret = smpp::getValue<uint32_t>(bytes->data(), bytes->size(), be);

    if (ret < 0) {
        return -1;
    }

    dst = ntohl(be);

    return ret;
}

ssize_t SmppTlv::extractU64(uint64_t &dst) const {
    const std::vector<uint8_t> *bytes = this->extractRawBytes();

    if (bytes == nullptr || bytes->size() != sizeof(uint64_t)) {
        return -1;
    }

    uint64_t be;
    ssize_t ret = smpp::getValue<uint64_t>(bytes->data(), bytes->size(), be);

    if (ret < 0) {
        return -1;
    }

    dst = be64toh(be);

    return ret;
}

/**
 * @brief read the value of a custom tlv as a string.
 * 
 * one trailing NUL is dropped if there is one.
 * 
 * @param dst where to put the string.
 * @return ssize_t length of the string, or -1 if not a custom tlv or not
 * valid UTF-8.
 */
ssize_t SmppTlv::extractString(std::string &dst) const {
    const std::vector<uint8_t> *bytes = this->extractRawBytes();

    if (bytes == nullptr) {
        return -1;
    }

    size_t sz = bytes->size();

    if (sz > 0 && (*bytes)[sz - 1] == 0) {
        --sz;
    }

    if (!validUtf8(bytes->data(), sz)) {
        log_debug("value of %s is not valid utf-8.\n", SmppTlvTagText(_tag).str);
        return -1;
    }

    dst.assign((const char *) bytes->data(), sz);

    return sz;
}

// ----------------------------------------------------------------------------

/**
 * @brief parse a tlv.
 * 
 * the value type is selected by the tag. zero-length tlvs get no value.
 * 
 * @param from source buffer.
 * @param buf_sz source buffer size.
 * @return ssize_t bytes read, or -1 on error.
 */
ssize_t SmppTlv::parse(const uint8_t *from, size_t buf_sz) {
    const uint8_t *ptr = from;
    size_t buf_remaining = buf_sz;

    uint16_t tag, tlv_len;

    GETVAL_S(ptr, buf_remaining, uint16_t, tag, ntohs, -1);
    GETVAL_S(ptr, buf_remaining, uint16_t, tlv_len, ntohs, -1);

    if (tlv_len > buf_remaining) {
        log_fatal("tlv_len (%u) greater then remaining buffer (%zu), packet truncated?\n", tlv_len, buf_remaining);
        return -1;
    }

    SmppTlvTag parsed_tag = SmppTlvTag::fromRaw(tag);
    SmppTlvValue *val = nullptr;

    if (tlv_len > 0) {
        val = createTlvValue(parsed_tag);

        if (val == nullptr) {
            return -1;
        }

        size_t val_remaining = tlv_len;

        PARSE_S(ptr, val_remaining, val, -1, true);

        if (val_remaining != 0) {
            log_fatal("value of %s parsed but not end (%zu over).\n", SmppTlvTagText(parsed_tag).str, val_remaining);
            delete val;
            return -1;
        }
    }

    if (_value != nullptr) {
        delete _value;
    }

    _tag = parsed_tag;
    _valueLength = tlv_len;
    _value = val;

    return ptr - from;
}

/**
 * @brief write tlv into buffer.
 * 
 * @param to dst buffer.
 * @param buf_sz dst buffer size.
 * @return ssize_t bytes written, or -1 on error.
 */
ssize_t SmppTlv::write(uint8_t *to, size_t buf_sz) const {
    size_t actual = _value == nullptr ? 0 : _value->length();

    if (actual != _valueLength) {
        log_fatal("length field (%u) does not match value length (%zu) for %s.\n", _valueLength, actual, SmppTlvTagText(_tag).str);
        return -1;
    }

    if (buf_sz < this->length()) {
        log_fatal("buf_sz (%zu) too small - can not fit tlv (size is %zu)\n", buf_sz, this->length());
        return -1;
    }

    uint8_t *ptr = to;
    size_t buf_remaining = buf_sz;

    PUTVAL_S(ptr, buf_remaining, uint16_t, _tag.getRaw(), htons, -1);
    PUTVAL_S(ptr, buf_remaining, uint16_t, _valueLength, htons, -1);

    if (_value != nullptr) {
        WRITE_S(ptr, buf_remaining, _value, -1);
    }

    return ptr - to;
}

/**
 * @brief get size of the whole tlv.
 * 
 * @return size_t tag + length + value size.
 */
size_t SmppTlv::length() const {
    return SMPP_TLV_HDR_SZ + _valueLength;
}

}
