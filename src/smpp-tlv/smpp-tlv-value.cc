#include "utils/log.hh"
#include "smpp-tlv/smpp-tlv-value.hh"
#include "smpp-tlv/smpp-integer-tlv-value.hh"
#include "smpp-tlv/smpp-coctet-string-tlv-value.hh"
#include "smpp-tlv/smpp-octet-string-tlv-value.hh"
#include "smpp-tlv/smpp-network-error-code-tlv-value.hh"
#include "smpp-tlv/smpp-other-tlv-value.hh"

namespace smpp {

/**
 * @brief create an empty value object of the right type for a tag, ready for
 * parse().
 * 
 * @param tag tag of the tlv.
 * @return SmppTlvValue* value object. you must free this yourself after use.
 */
SmppTlvValue* createTlvValue(const SmppTlvTag &tag) {
    uint16_t raw = tag.getRaw();

    switch (tag.getShape()) {
        case ShapeInteger:
            return new SmppIntegerTlvValue(raw);
        case ShapeCOctetString:
            return new SmppCOctetStringTlvValue(raw);
        case ShapeOctetString:
            return new SmppOctetStringTlvValue(raw);
        case ShapeNetworkErrorCode:
            return new SmppNetworkErrorCodeTlvValue();
        case ShapeRaw:
            return new SmppOtherTlvValue(raw);
    }

    log_fatal("no value parser selected? tag is 0x%.4x\n", raw);
    return nullptr;
}

}
