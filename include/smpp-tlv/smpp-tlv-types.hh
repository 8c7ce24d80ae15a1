#ifndef SMPP_TLV_TYPES_H
#define SMPP_TLV_TYPES_H
#include <stdint.h>
#include <unistd.h>

#define SMPP_TLVTAG_DEST_ADDR_SUBUNIT 0x0005
#define SMPP_TLVTAG_DEST_NETWORK_TYPE 0x0006
#define SMPP_TLVTAG_DEST_BEARER_TYPE 0x0007
#define SMPP_TLVTAG_DEST_TELEMATICS_ID 0x0008
#define SMPP_TLVTAG_SOURCE_ADDR_SUBUNIT 0x000D
#define SMPP_TLVTAG_SOURCE_NETWORK_TYPE 0x000E
#define SMPP_TLVTAG_SOURCE_BEARER_TYPE 0x000F
#define SMPP_TLVTAG_SOURCE_TELEMATICS_ID 0x0010
#define SMPP_TLVTAG_QOS_TIME_TO_LIVE 0x0017
#define SMPP_TLVTAG_PAYLOAD_TYPE 0x0019
#define SMPP_TLVTAG_ADDITIONAL_STATUS_INFO_TEXT 0x001D
#define SMPP_TLVTAG_RECEIPTED_MESSAGE_ID 0x001E
#define SMPP_TLVTAG_MS_MSG_WAIT_FACILITIES 0x0030
#define SMPP_TLVTAG_PRIVACY_INDICATOR 0x0201
#define SMPP_TLVTAG_SOURCE_SUBADDRESS 0x0202
#define SMPP_TLVTAG_DEST_SUBADDRESS 0x0203
#define SMPP_TLVTAG_USER_MESSAGE_REFERENCE 0x0204
#define SMPP_TLVTAG_USER_RESPONSE_CODE 0x0205
#define SMPP_TLVTAG_SOURCE_PORT 0x020A
#define SMPP_TLVTAG_DESTINATION_PORT 0x020B
#define SMPP_TLVTAG_SAR_MSG_REF_NUM 0x020C
#define SMPP_TLVTAG_LANGUAGE_INDICATOR 0x020D
#define SMPP_TLVTAG_SAR_TOTAL_SEGMENTS 0x020E
#define SMPP_TLVTAG_SAR_SEGMENT_SEQNUM 0x020F
#define SMPP_TLVTAG_SC_INTERFACE_VERSION 0x0210
#define SMPP_TLVTAG_CALLBACK_NUM_PRES_IND 0x0302
#define SMPP_TLVTAG_CALLBACK_NUM_ATAG 0x0303
#define SMPP_TLVTAG_NUMBER_OF_MESSAGES 0x0304
#define SMPP_TLVTAG_CALLBACK_NUM 0x0381
#define SMPP_TLVTAG_DPF_RESULT 0x0420
#define SMPP_TLVTAG_SET_DPF 0x0421
#define SMPP_TLVTAG_MS_AVAILABILITY_STATUS 0x0422
#define SMPP_TLVTAG_NETWORK_ERROR_CODE 0x0423
#define SMPP_TLVTAG_MESSAGE_PAYLOAD 0x0424
#define SMPP_TLVTAG_DELIVERY_FAILURE_REASON 0x0425
#define SMPP_TLVTAG_MORE_MESSAGES_TO_SEND 0x0426
#define SMPP_TLVTAG_MESSAGE_STATE 0x0427
#define SMPP_TLVTAG_CONGESTION_STATE 0x0428
#define SMPP_TLVTAG_USSD_SERVICE_OP 0x0501
#define SMPP_TLVTAG_BROADCAST_CHANNEL_INDICATOR 0x0600
#define SMPP_TLVTAG_BROADCAST_CONTENT_TYPE 0x0601
#define SMPP_TLVTAG_BROADCAST_CONTENT_TYPE_INFO 0x0602
#define SMPP_TLVTAG_BROADCAST_MESSAGE_CLASS 0x0603
#define SMPP_TLVTAG_BROADCAST_REP_NUM 0x0604
#define SMPP_TLVTAG_BROADCAST_FREQUENCY_INTERVAL 0x0605
#define SMPP_TLVTAG_BROADCAST_AREA_IDENTIFIER 0x0606
#define SMPP_TLVTAG_BROADCAST_ERROR_STATUS 0x0607
#define SMPP_TLVTAG_BROADCAST_AREA_SUCCESS 0x0608
#define SMPP_TLVTAG_BROADCAST_END_TIME 0x0609
#define SMPP_TLVTAG_BROADCAST_SERVICE_GROUP 0x060A
#define SMPP_TLVTAG_BILLING_IDENTIFICATION 0x060B
#define SMPP_TLVTAG_SOURCE_NETWORK_ID 0x060D
#define SMPP_TLVTAG_DEST_NETWORK_ID 0x060E
#define SMPP_TLVTAG_SOURCE_NODE_ID 0x060F
#define SMPP_TLVTAG_DEST_NODE_ID 0x0610
#define SMPP_TLVTAG_DEST_ADDR_NP_RESOLUTION 0x0611
#define SMPP_TLVTAG_DEST_ADDR_NP_INFORMATION 0x0612
#define SMPP_TLVTAG_DEST_ADDR_NP_COUNTRY 0x0613
#define SMPP_TLVTAG_DISPLAY_TIME 0x1201
#define SMPP_TLVTAG_SMS_SIGNAL 0x1203
#define SMPP_TLVTAG_MS_VALIDITY 0x1204
#define SMPP_TLVTAG_ALERT_ON_MESSAGE_DELIVERY 0x130C
#define SMPP_TLVTAG_ITS_REPLY_TYPE 0x1380
#define SMPP_TLVTAG_ITS_SESSION_INFO 0x1383

#define SMPP_TLVTAG_VENDOR_MIN 0x1400
#define SMPP_TLVTAG_VENDOR_MAX 0x3FFF

// tag (u16) + length (u16).
#define SMPP_TLV_HDR_SZ 4

namespace smpp {

enum SmppTlvShape {
    ShapeInteger, ShapeCOctetString, ShapeOctetString, ShapeNetworkErrorCode, ShapeRaw
};

struct SmppTlvTagInfo {
    uint16_t tag;
    const char *name;
    SmppTlvShape shape;

    // for ShapeInteger, min == max == width. for strings, max includes NUL.
    uint16_t minLength;
    uint16_t maxLength;
};

const SmppTlvTagInfo* getTlvTagInfo(uint16_t tag);

}

#endif // SMPP_TLV_TYPES_H
