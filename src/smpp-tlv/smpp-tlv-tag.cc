#include "smpp-tlv/smpp-tlv-tag.hh"

#include <stdio.h>

namespace smpp {

/**
 * @brief construct an "other" tag with number 0.
 */
SmppTlvTag::SmppTlvTag() {
    _tag = 0;
    _info = nullptr;
}

/**
 * @brief construct a tag from its number. same as fromRaw().
 * 
 * @param tag numeric tag in host byte order.
 */
SmppTlvTag::SmppTlvTag(uint16_t tag) {
    _tag = tag;
    _info = getTlvTagInfo(tag);
}

/**
 * @brief get the tag for a number: the known tag if the number is a
 * registered standard tag, otherwise an "other" tag.
 * 
 * @param tag numeric tag in host byte order.
 * @return SmppTlvTag tag.
 */
SmppTlvTag SmppTlvTag::fromRaw(uint16_t tag) {
    return SmppTlvTag(tag);
}

/**
 * @brief get an "other" tag for a number, even if the number is a registered
 * standard tag.
 * 
 * note: other(n) != fromRaw(n) when n is a known tag.
 * 
 * @param tag numeric tag in host byte order.
 * @return SmppTlvTag tag.
 */
SmppTlvTag SmppTlvTag::other(uint16_t tag) {
    SmppTlvTag t;
    t._tag = tag;

    return t;
}

uint16_t SmppTlvTag::getRaw() const {
    return _tag;
}

bool SmppTlvTag::known() const {
    return _info != nullptr;
}

/**
 * @brief test if the number is in the vendor-specific range (0x1400 - 0x3fff).
 * 
 * @return true if in vendor range.
 * @return false if not.
 */
bool SmppTlvTag::vendor() const {
    return _tag >= SMPP_TLVTAG_VENDOR_MIN && _tag <= SMPP_TLVTAG_VENDOR_MAX;
}

/**
 * @brief get registry entry of this tag.
 * 
 * @return const SmppTlvTagInfo* info, or nullptr for "other" tags.
 */
const SmppTlvTagInfo* SmppTlvTag::getInfo() const {
    return _info;
}

SmppTlvShape SmppTlvTag::getShape() const {
    if (_info == nullptr) {
        return ShapeRaw;
    }

    return _info->shape;
}

const char* SmppTlvTag::getName() const {
    if (_info == nullptr) {
        return "other";
    }

    return _info->name;
}

bool SmppTlvTag::operator==(const SmppTlvTag &other) const {
    return _tag == other._tag && known() == other.known();
}

bool SmppTlvTag::operator!=(const SmppTlvTag &other) const {
    return !(*this == other);
}

SmppTlvTagText::SmppTlvTagText(const SmppTlvTag &tag) {
    if (tag.known()) {
        snprintf(str, sizeof(str), "%s", tag.getName());
    } else {
        snprintf(str, sizeof(str), "other(0x%.4x)", tag.getRaw());
    }
}

}
