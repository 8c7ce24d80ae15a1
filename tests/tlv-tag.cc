#include "check.hh"
#include "smpp-tlv/smpp-tlv-tag.hh"

#include <string.h>

int known_tags() {
    smpp::SmppTlvTag mp = smpp::SmppTlvTag::fromRaw(SMPP_TLVTAG_MESSAGE_PAYLOAD);

    CHECK(mp.known());
    CHECK(!mp.vendor());
    CHECK(mp.getRaw() == 0x0424);
    CHECK(mp.getShape() == smpp::ShapeOctetString);
    CHECK(strcmp(mp.getName(), "message_payload") == 0);

    smpp::SmppTlvTag ref = SMPP_TLVTAG_SAR_MSG_REF_NUM;

    CHECK(ref.known());
    CHECK(ref.getShape() == smpp::ShapeInteger);
    CHECK(ref.getInfo()->maxLength == 2);

    CHECK(smpp::SmppTlvTag(SMPP_TLVTAG_QOS_TIME_TO_LIVE).getInfo()->maxLength == 4);
    CHECK(smpp::SmppTlvTag(SMPP_TLVTAG_RECEIPTED_MESSAGE_ID).getShape() == smpp::ShapeCOctetString);
    CHECK(smpp::SmppTlvTag(SMPP_TLVTAG_NETWORK_ERROR_CODE).getShape() == smpp::ShapeNetworkErrorCode);

    return 0;
}

int other_tags() {
    smpp::SmppTlvTag vendor = smpp::SmppTlvTag::fromRaw(0x1400);

    CHECK(!vendor.known());
    CHECK(vendor.vendor());
    CHECK(vendor.getInfo() == nullptr);
    CHECK(vendor.getShape() == smpp::ShapeRaw);
    CHECK(strcmp(vendor.getName(), "other") == 0);

    // unregistered standard number.
    smpp::SmppTlvTag unknown = smpp::SmppTlvTag::fromRaw(0x4242);

    CHECK(!unknown.known());
    CHECK(!unknown.vendor());

    return 0;
}

int vendor_range() {
    CHECK(!smpp::SmppTlvTag(0x13FF).vendor());
    CHECK(smpp::SmppTlvTag(0x1400).vendor());
    CHECK(smpp::SmppTlvTag(0x2000).vendor());
    CHECK(smpp::SmppTlvTag(0x3FFF).vendor());
    CHECK(!smpp::SmppTlvTag(0x4000).vendor());

    return 0;
}

int equality() {
    CHECK(smpp::SmppTlvTag::fromRaw(0x1400) == smpp::SmppTlvTag::other(0x1400));
    CHECK(smpp::SmppTlvTag::fromRaw(0x1400) != smpp::SmppTlvTag::other(0x1401));

    // forced "other" is a different variant from the known tag.
    CHECK(smpp::SmppTlvTag::other(SMPP_TLVTAG_MESSAGE_PAYLOAD) != smpp::SmppTlvTag::fromRaw(SMPP_TLVTAG_MESSAGE_PAYLOAD));
    CHECK(!smpp::SmppTlvTag::other(SMPP_TLVTAG_MESSAGE_PAYLOAD).known());
    CHECK(smpp::SmppTlvTag::other(SMPP_TLVTAG_MESSAGE_PAYLOAD).getRaw() == SMPP_TLVTAG_MESSAGE_PAYLOAD);

    CHECK(smpp::SmppTlvTag(SMPP_TLVTAG_SOURCE_PORT) == smpp::SmppTlvTag::fromRaw(0x020A));

    return 0;
}

int text() {
    CHECK(strcmp(smpp::SmppTlvTagText(smpp::SmppTlvTag(SMPP_TLVTAG_CALLBACK_NUM)).str, "callback_num") == 0);
    CHECK(strcmp(smpp::SmppTlvTagText(smpp::SmppTlvTag::other(0x14ab)).str, "other(0x14ab)") == 0);
    CHECK(strcmp(smpp::SmppTlvTagText(smpp::SmppTlvTag::other(SMPP_TLVTAG_MESSAGE_PAYLOAD)).str, "other(0x0424)") == 0);

    return 0;
}

int main() {
    RUN(known_tags);
    RUN(other_tags);
    RUN(vendor_range);
    RUN(equality);
    RUN(text);

    return 0;
}
