#include "check.hh"
#include "smpp-tlv/smpp-tlv.hh"
#include "smpp-tlv/smpp-integer-tlv-value.hh"
#include "smpp-tlv/smpp-coctet-string-tlv-value.hh"
#include "smpp-tlv/smpp-octet-string-tlv-value.hh"
#include "smpp-tlv/smpp-network-error-code-tlv-value.hh"
#include "smpp-tlv/smpp-other-tlv-value.hh"

#include <string.h>
#include <string>
#include <vector>

int typed_value() {
    smpp::SmppIntegerTlvValue *ref = new smpp::SmppIntegerTlvValue(SMPP_TLVTAG_SAR_MSG_REF_NUM, 0x1234);
    smpp::SmppTlv *ref_tlv = smpp::SmppTlv::newTyped(ref);

    CHECK(ref_tlv != nullptr);
    CHECK(ref_tlv->getValue() == ref);
    CHECK(ref_tlv->getTag() == ref->getTag());
    CHECK(ref_tlv->getValueLength() == ref->length());
    CHECK(ref_tlv->getValueLength() == 2);
    CHECK(ref_tlv->length() == 6);

    delete ref_tlv;

    smpp::SmppCOctetStringTlvValue *id = new smpp::SmppCOctetStringTlvValue(SMPP_TLVTAG_RECEIPTED_MESSAGE_ID, "abc");
    smpp::SmppTlv *id_tlv = smpp::SmppTlv::newTyped(id);

    CHECK(id_tlv->getValue() == id);
    CHECK(id_tlv->getTag() == smpp::SmppTlvTag(SMPP_TLVTAG_RECEIPTED_MESSAGE_ID));
    CHECK(id_tlv->getValueLength() == 4);

    delete id_tlv;

    smpp::SmppOctetStringTlvValue *payload = new smpp::SmppOctetStringTlvValue(SMPP_TLVTAG_MESSAGE_PAYLOAD, std::vector<uint8_t>(300, 'x'));
    smpp::SmppTlv *payload_tlv = smpp::SmppTlv::newTyped(payload);

    CHECK(payload_tlv->getValue() == payload);
    CHECK(payload_tlv->getValueLength() == 300);

    delete payload_tlv;

    smpp::SmppNetworkErrorCodeTlvValue *nec = new smpp::SmppNetworkErrorCodeTlvValue();
    nec->setNetworkType(SMPP_NETWORK_TYPE_GSM);
    nec->setErrorCode(0x0022);
    smpp::SmppTlv *nec_tlv = smpp::SmppTlv::newTyped(nec);

    CHECK(nec_tlv->getTag() == smpp::SmppTlvTag(SMPP_TLVTAG_NETWORK_ERROR_CODE));
    CHECK(nec_tlv->getValueLength() == 3);

    delete nec_tlv;

    return 0;
}

int typed_value_refused() {
    CHECK(smpp::SmppTlv::newTyped(nullptr) == nullptr);

    // integer value under an octet string tag.
    CHECK(smpp::SmppTlv::newTyped(new smpp::SmppIntegerTlvValue(SMPP_TLVTAG_MESSAGE_PAYLOAD, 0)) == nullptr);

    // text value under an integer tag.
    CHECK(smpp::SmppTlv::newTyped(new smpp::SmppCOctetStringTlvValue(SMPP_TLVTAG_SAR_MSG_REF_NUM, "x")) == nullptr);

    // bytes under a text tag.
    CHECK(smpp::SmppTlv::newTyped(new smpp::SmppOctetStringTlvValue(SMPP_TLVTAG_RECEIPTED_MESSAGE_ID, std::vector<uint8_t>(2, 'a'))) == nullptr);

    // octet string under a vendor tag has no registry entry, so no shape to encode.
    CHECK(smpp::SmppTlv::newTyped(new smpp::SmppOctetStringTlvValue(0x1400, std::vector<uint8_t>(2, 'a'))) == nullptr);

    return 0;
}

int oversize_value_refused() {
    smpp::SmppOtherTlvValue big(0x1400);

    CHECK(big.setBytes(std::vector<uint8_t>(0x10000, 0)) == -1);
    CHECK(big.setBytes(std::vector<uint8_t>(0xffff, 0)) == 0xffff);

    // the constructor keeps the value empty when refusing.
    smpp::SmppOtherTlvValue *refused = new smpp::SmppOtherTlvValue(0x1400, std::vector<uint8_t>(0x10001, 0));

    CHECK(refused->length() == 0);

    smpp::SmppTlv *tlv = smpp::SmppTlv::newTyped(refused);

    CHECK(tlv != nullptr);
    CHECK(tlv->getValueLength() == tlv->getValue()->length());

    delete tlv;

    smpp::SmppTlv *max = smpp::SmppTlv::newTyped(new smpp::SmppOtherTlvValue(0x1400, std::vector<uint8_t>(0xffff, 0)));

    CHECK(max != nullptr);
    CHECK(max->getValueLength() == 0xffff);
    CHECK(max->length() == 0xffff + 4);

    delete max;

    smpp::SmppOctetStringTlvValue payload(SMPP_TLVTAG_MESSAGE_PAYLOAD);

    CHECK(payload.setBytes(std::vector<uint8_t>(0x10000, 0)) == -1);
    CHECK(payload.length() == 0);

    return 0;
}

int typed_value_limits() {
    smpp::SmppIntegerTlvValue seg(SMPP_TLVTAG_SAR_SEGMENT_SEQNUM);

    CHECK(seg.getWidth() == 1);
    CHECK(seg.setValue(255) == 1);
    CHECK(seg.setValue(256) == -1);
    CHECK(seg.getValue() == 255);

    smpp::SmppCOctetStringTlvValue id(SMPP_TLVTAG_RECEIPTED_MESSAGE_ID);

    CHECK(id.setString(std::string(64, 'a')) == 65);
    CHECK(id.setString(std::string(65, 'a')) == -1);
    CHECK(id.setString(std::string("a\0b", 3)) == -1);

    smpp::SmppOctetStringTlvValue cb(SMPP_TLVTAG_CALLBACK_NUM);

    CHECK(cb.setBytes(std::vector<uint8_t>(3, 1)) == -1);
    CHECK(cb.setBytes(std::vector<uint8_t>(4, 1)) == 4);
    CHECK(cb.setBytes(std::vector<uint8_t>(20, 1)) == -1);
    CHECK(cb.length() == 4);

    return 0;
}

int presence_only() {
    smpp::SmppTlv alert(smpp::SmppTlvTag(SMPP_TLVTAG_ALERT_ON_MESSAGE_DELIVERY));

    CHECK(alert.getValue() == nullptr);
    CHECK(alert.getValueLength() == 0);
    CHECK(alert.length() == 4);
    CHECK(alert.extractRawBytes() == nullptr);

    uint8_t buf[4];
    const uint8_t expected[] = { 0x13, 0x0c, 0x00, 0x00 };

    CHECK(alert.write(buf, sizeof(buf)) == 4);
    CHECK(memcmp(buf, expected, sizeof(expected)) == 0);

    return 0;
}

int custom_raw() {
    const uint8_t raw[] = { 1, 2, 3, 4 };
    smpp::SmppTlv *tlv = smpp::SmppTlv::newCustom(0x1400, sizeof(raw), raw);

    CHECK(tlv != nullptr);
    CHECK(tlv->getTag() == smpp::SmppTlvTag::other(0x1400));
    CHECK(tlv->getValueLength() == 4);
    CHECK(tlv->getValue() != nullptr);
    CHECK(tlv->getValue()->getTag() == tlv->getTag());

    const std::vector<uint8_t> *bytes = tlv->extractRawBytes();

    CHECK(bytes != nullptr);
    CHECK(bytes->size() == 4);
    CHECK(memcmp(bytes->data(), raw, sizeof(raw)) == 0);

    delete tlv;

    // no range check: a standard number is kept as an "other" tag.
    smpp::SmppTlv *forced = smpp::SmppTlv::newCustom(SMPP_TLVTAG_MESSAGE_PAYLOAD, std::vector<uint8_t>(2, 'z'));

    CHECK(forced->getTag() == smpp::SmppTlvTag::other(SMPP_TLVTAG_MESSAGE_PAYLOAD));
    CHECK(forced->getTag() != smpp::SmppTlvTag(SMPP_TLVTAG_MESSAGE_PAYLOAD));
    CHECK(forced->extractRawBytes() != nullptr);

    delete forced;

    smpp::SmppTlv *empty = smpp::SmppTlv::newCustom(0x1401, std::vector<uint8_t>());

    CHECK(empty->getValueLength() == 0);
    CHECK(empty->extractRawBytes() != nullptr);
    CHECK(empty->extractRawBytes()->empty());

    delete empty;

    CHECK(smpp::SmppTlv::newCustom(0x1402, std::vector<uint8_t>(0x10000, 0)) == nullptr);

    return 0;
}

int custom_scalars() {
    smpp::SmppTlv *t16 = smpp::SmppTlv::newCustomU16(0x1400, 0xbeef);
    smpp::SmppTlv *t32 = smpp::SmppTlv::newCustomU32(0x1401, 0xdeadbeef);
    smpp::SmppTlv *t64 = smpp::SmppTlv::newCustomU64(0x1402, 0x0123456789abcdefULL);

    CHECK(t16->getValueLength() == 2);
    CHECK(t32->getValueLength() == 4);
    CHECK(t64->getValueLength() == 8);

    const uint8_t be32[] = { 0xde, 0xad, 0xbe, 0xef };
    CHECK(memcmp(t32->extractRawBytes()->data(), be32, sizeof(be32)) == 0);

    const uint8_t be64[] = { 0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef };
    CHECK(memcmp(t64->extractRawBytes()->data(), be64, sizeof(be64)) == 0);

    uint16_t v16 = 0;
    uint32_t v32 = 0;
    uint64_t v64 = 0;

    CHECK(t16->extractU16(v16) == 2);
    CHECK(v16 == 0xbeef);
    CHECK(t32->extractU32(v32) == 4);
    CHECK(v32 == 0xdeadbeef);
    CHECK(t64->extractU64(v64) == 8);
    CHECK(v64 == 0x0123456789abcdefULL);

    // width must match exactly.
    CHECK(t16->extractU32(v32) == -1);
    CHECK(t16->extractU64(v64) == -1);
    CHECK(t32->extractU16(v16) == -1);
    CHECK(t32->extractU64(v64) == -1);
    CHECK(t64->extractU16(v16) == -1);
    CHECK(t64->extractU32(v32) == -1);

    delete t16;
    delete t32;
    delete t64;

    const uint8_t three[] = { 1, 2, 3 };
    smpp::SmppTlv *odd = smpp::SmppTlv::newCustom(0x1403, sizeof(three), three);

    CHECK(odd->extractU16(v16) == -1);
    CHECK(odd->extractU32(v32) == -1);
    CHECK(odd->extractU64(v64) == -1);

    delete odd;

    return 0;
}

int custom_strings() {
    smpp::SmppTlv *hello = smpp::SmppTlv::newCustomString(0x1500, "hello");

    CHECK(hello->getValueLength() == 6);
    CHECK(hello->extractRawBytes()->back() == 0);

    std::string s;

    CHECK(hello->extractString(s) == 5);
    CHECK(s == "hello");

    delete hello;

    smpp::SmppTlv *utf8 = smpp::SmppTlv::newCustomString(0x1501, "h\xc3\xa9llo \xe2\x82\xac");

    CHECK(utf8->extractString(s) == 10);
    CHECK(s == "h\xc3\xa9llo \xe2\x82\xac");

    delete utf8;

    smpp::SmppTlv *empty = smpp::SmppTlv::newCustomString(0x1502, "");

    CHECK(empty->getValueLength() == 1);
    CHECK(empty->extractString(s) == 0);
    CHECK(s.empty());

    delete empty;

    // no NUL at the end is fine.
    const uint8_t bare[] = { 'a', 'b' };
    smpp::SmppTlv *no_nul = smpp::SmppTlv::newCustom(0x1503, sizeof(bare), bare);

    CHECK(no_nul->extractString(s) == 2);
    CHECK(s == "ab");

    delete no_nul;

    // only one NUL is dropped.
    const uint8_t two_nul[] = { 'a', 0, 0 };
    smpp::SmppTlv *nuls = smpp::SmppTlv::newCustom(0x1504, sizeof(two_nul), two_nul);

    CHECK(nuls->extractString(s) == 2);
    CHECK(s == std::string("a\0", 2));

    delete nuls;

    const uint8_t bad[] = { 'a', 0xff, 0xfe, 0 };
    smpp::SmppTlv *invalid = smpp::SmppTlv::newCustom(0x1505, sizeof(bad), bad);

    s = "untouched";
    CHECK(invalid->extractString(s) == -1);
    CHECK(s == "untouched");

    delete invalid;

    const uint8_t cut[] = { 'a', 0xe2, 0x82 };
    smpp::SmppTlv *truncated = smpp::SmppTlv::newCustom(0x1506, sizeof(cut), cut);

    CHECK(truncated->extractString(s) == -1);

    delete truncated;

    return 0;
}

int typed_not_raw() {
    smpp::SmppTlv *port = smpp::SmppTlv::newTyped(new smpp::SmppIntegerTlvValue(SMPP_TLVTAG_SOURCE_PORT, 0x0102));

    uint16_t v16;
    std::string s;

    CHECK(port->extractRawBytes() == nullptr);
    CHECK(port->extractU16(v16) == -1);
    CHECK(port->extractString(s) == -1);

    delete port;

    smpp::SmppTlv *text = smpp::SmppTlv::newTyped(new smpp::SmppCOctetStringTlvValue(SMPP_TLVTAG_ADDITIONAL_STATUS_INFO_TEXT, "ok"));

    CHECK(text->extractString(s) == -1);

    delete text;

    return 0;
}

int write_custom() {
    smpp::SmppTlv *tlv = smpp::SmppTlv::newCustomU32(0x1400, 0xdeadbeef);

    uint8_t buf[16];
    const uint8_t expected[] = { 0x14, 0x00, 0x00, 0x04, 0xde, 0xad, 0xbe, 0xef };

    CHECK(tlv->write(buf, sizeof(buf)) == 8);
    CHECK(memcmp(buf, expected, sizeof(expected)) == 0);

    // too small.
    CHECK(tlv->write(buf, 7) == -1);

    delete tlv;

    smpp::SmppTlv *ttl_tlv = smpp::SmppTlv::newTyped(new smpp::SmppIntegerTlvValue(SMPP_TLVTAG_QOS_TIME_TO_LIVE, 0x00015180));
    const uint8_t ttl[] = { 0x00, 0x17, 0x00, 0x04, 0x00, 0x01, 0x51, 0x80 };

    CHECK(ttl_tlv->write(buf, sizeof(buf)) == 8);
    CHECK(memcmp(buf, ttl, sizeof(ttl)) == 0);

    delete ttl_tlv;

    smpp::SmppNetworkErrorCodeTlvValue *nec = new smpp::SmppNetworkErrorCodeTlvValue();
    nec->setNetworkType(SMPP_NETWORK_TYPE_GSM);
    nec->setErrorCode(0x0022);
    smpp::SmppTlv *nec_tlv = smpp::SmppTlv::newTyped(nec);
    const uint8_t nec_bytes[] = { 0x04, 0x23, 0x00, 0x03, 0x03, 0x00, 0x22 };

    CHECK(nec_tlv->write(buf, sizeof(buf)) == 7);
    CHECK(memcmp(buf, nec_bytes, sizeof(nec_bytes)) == 0);

    delete nec_tlv;

    return 0;
}

int parse_known() {
    const uint8_t ref[] = { 0x02, 0x0c, 0x00, 0x02, 0x12, 0x34 };
    smpp::SmppTlv tlv;

    CHECK(tlv.parse(ref, sizeof(ref)) == 6);
    CHECK(tlv.getTag() == smpp::SmppTlvTag(SMPP_TLVTAG_SAR_MSG_REF_NUM));
    CHECK(tlv.getValueLength() == 2);

    const smpp::SmppIntegerTlvValue *val = dynamic_cast<const smpp::SmppIntegerTlvValue *>(tlv.getValue());

    CHECK(val != nullptr);
    CHECK(val->getValue() == 0x1234);

    const uint8_t rid[] = { 0x00, 0x1e, 0x00, 0x04, 'x', 'y', 'z', 0x00 };
    smpp::SmppTlv id;

    CHECK(id.parse(rid, sizeof(rid)) == 8);

    const smpp::SmppCOctetStringTlvValue *str = dynamic_cast<const smpp::SmppCOctetStringTlvValue *>(id.getValue());

    CHECK(str != nullptr);
    CHECK(str->getString() == "xyz");

    const uint8_t nec[] = { 0x04, 0x23, 0x00, 0x03, 0x01, 0x01, 0x02 };
    smpp::SmppTlv nec_tlv;

    CHECK(nec_tlv.parse(nec, sizeof(nec)) == 7);

    const smpp::SmppNetworkErrorCodeTlvValue *nec_val = dynamic_cast<const smpp::SmppNetworkErrorCodeTlvValue *>(nec_tlv.getValue());

    CHECK(nec_val != nullptr);
    CHECK(nec_val->getNetworkType() == SMPP_NETWORK_TYPE_ANSI_136);
    CHECK(nec_val->getErrorCode() == 0x0102);

    return 0;
}

int parse_other() {
    const uint8_t vendor[] = { 0x20, 0x00, 0x00, 0x03, 'a', 'b', 'c', 0x99 };
    smpp::SmppTlv tlv;

    // trailing byte is not part of the tlv.
    CHECK(tlv.parse(vendor, sizeof(vendor)) == 7);
    CHECK(tlv.getTag() == smpp::SmppTlvTag::other(0x2000));
    CHECK(dynamic_cast<const smpp::SmppOtherTlvValue *>(tlv.getValue()) != nullptr);

    std::string s;

    CHECK(tlv.extractString(s) == 3);
    CHECK(s == "abc");

    // a forced custom tag comes back as the known tag after a round trip.
    smpp::SmppTlv *forced = smpp::SmppTlv::newCustom(SMPP_TLVTAG_MESSAGE_PAYLOAD, std::vector<uint8_t>(2, 'z'));
    uint8_t buf[8];

    CHECK(forced->write(buf, sizeof(buf)) == 6);

    smpp::SmppTlv reparsed;

    CHECK(reparsed.parse(buf, 6) == 6);
    CHECK(reparsed.getTag() == smpp::SmppTlvTag(SMPP_TLVTAG_MESSAGE_PAYLOAD));
    CHECK(reparsed.extractRawBytes() == nullptr);
    CHECK(dynamic_cast<const smpp::SmppOctetStringTlvValue *>(reparsed.getValue()) != nullptr);

    delete forced;

    return 0;
}

int parse_zero_length() {
    const uint8_t alert[] = { 0x13, 0x0c, 0x00, 0x00 };
    smpp::SmppTlv tlv;

    CHECK(tlv.parse(alert, sizeof(alert)) == 4);
    CHECK(tlv.getTag() == smpp::SmppTlvTag(SMPP_TLVTAG_ALERT_ON_MESSAGE_DELIVERY));
    CHECK(tlv.getValueLength() == 0);
    CHECK(tlv.getValue() == nullptr);

    return 0;
}

int parse_errors() {
    smpp::SmppTlv tlv;

    const uint8_t truncated[] = { 0x04, 0x24, 0x00, 0x05, 0x01, 0x02 };
    CHECK(tlv.parse(truncated, sizeof(truncated)) == -1);

    const uint8_t short_hdr[] = { 0x04, 0x24, 0x00 };
    CHECK(tlv.parse(short_hdr, sizeof(short_hdr)) == -1);

    const uint8_t bad_width[] = { 0x02, 0x0c, 0x00, 0x03, 0x01, 0x02, 0x03 };
    CHECK(tlv.parse(bad_width, sizeof(bad_width)) == -1);

    const uint8_t no_nul[] = { 0x00, 0x1e, 0x00, 0x02, 'a', 'b' };
    CHECK(tlv.parse(no_nul, sizeof(no_nul)) == -1);

    // a failed parse leaves the old content alone.
    const uint8_t ok[] = { 0x14, 0x00, 0x00, 0x01, 0x07 };
    CHECK(tlv.parse(ok, sizeof(ok)) == 5);
    CHECK(tlv.parse(truncated, sizeof(truncated)) == -1);
    CHECK(tlv.getTag() == smpp::SmppTlvTag::other(0x1400));
    CHECK(tlv.getValueLength() == 1);

    return 0;
}

int main() {
    RUN(typed_value);
    RUN(typed_value_refused);
    RUN(oversize_value_refused);
    RUN(typed_value_limits);
    RUN(presence_only);
    RUN(custom_raw);
    RUN(custom_scalars);
    RUN(custom_strings);
    RUN(typed_not_raw);
    RUN(write_custom);
    RUN(parse_known);
    RUN(parse_other);
    RUN(parse_zero_length);
    RUN(parse_errors);

    return 0;
}
