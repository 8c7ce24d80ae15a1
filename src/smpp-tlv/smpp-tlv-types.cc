#include "smpp-tlv/smpp-tlv-types.hh"

namespace smpp {

const SmppTlvTagInfo TlvTagInfo[] = {
    { SMPP_TLVTAG_DEST_ADDR_SUBUNIT, "dest_addr_subunit", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_DEST_NETWORK_TYPE, "dest_network_type", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_DEST_BEARER_TYPE, "dest_bearer_type", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_DEST_TELEMATICS_ID, "dest_telematics_id", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_SOURCE_ADDR_SUBUNIT, "source_addr_subunit", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SOURCE_NETWORK_TYPE, "source_network_type", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SOURCE_BEARER_TYPE, "source_bearer_type", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SOURCE_TELEMATICS_ID, "source_telematics_id", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_QOS_TIME_TO_LIVE, "qos_time_to_live", ShapeInteger, 4, 4 },
    { SMPP_TLVTAG_PAYLOAD_TYPE, "payload_type", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_ADDITIONAL_STATUS_INFO_TEXT, "additional_status_info_text", ShapeCOctetString, 1, 256 },
    { SMPP_TLVTAG_RECEIPTED_MESSAGE_ID, "receipted_message_id", ShapeCOctetString, 1, 65 },
    { SMPP_TLVTAG_MS_MSG_WAIT_FACILITIES, "ms_msg_wait_facilities", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_PRIVACY_INDICATOR, "privacy_indicator", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SOURCE_SUBADDRESS, "source_subaddress", ShapeOctetString, 2, 23 },
    { SMPP_TLVTAG_DEST_SUBADDRESS, "dest_subaddress", ShapeOctetString, 2, 23 },
    { SMPP_TLVTAG_USER_MESSAGE_REFERENCE, "user_message_reference", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_USER_RESPONSE_CODE, "user_response_code", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SOURCE_PORT, "source_port", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_DESTINATION_PORT, "destination_port", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_SAR_MSG_REF_NUM, "sar_msg_ref_num", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_LANGUAGE_INDICATOR, "language_indicator", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SAR_TOTAL_SEGMENTS, "sar_total_segments", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SAR_SEGMENT_SEQNUM, "sar_segment_seqnum", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SC_INTERFACE_VERSION, "sc_interface_version", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_CALLBACK_NUM_PRES_IND, "callback_num_pres_ind", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_CALLBACK_NUM_ATAG, "callback_num_atag", ShapeOctetString, 0, 65 },
    { SMPP_TLVTAG_NUMBER_OF_MESSAGES, "number_of_messages", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_CALLBACK_NUM, "callback_num", ShapeOctetString, 4, 19 },
    { SMPP_TLVTAG_DPF_RESULT, "dpf_result", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SET_DPF, "set_dpf", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_MS_AVAILABILITY_STATUS, "ms_availability_status", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_NETWORK_ERROR_CODE, "network_error_code", ShapeNetworkErrorCode, 3, 3 },
    { SMPP_TLVTAG_MESSAGE_PAYLOAD, "message_payload", ShapeOctetString, 0, 0xFFFF },
    { SMPP_TLVTAG_DELIVERY_FAILURE_REASON, "delivery_failure_reason", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_MORE_MESSAGES_TO_SEND, "more_messages_to_send", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_MESSAGE_STATE, "message_state", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_CONGESTION_STATE, "congestion_state", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_USSD_SERVICE_OP, "ussd_service_op", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_BROADCAST_CHANNEL_INDICATOR, "broadcast_channel_indicator", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_BROADCAST_CONTENT_TYPE, "broadcast_content_type", ShapeOctetString, 3, 3 },
    { SMPP_TLVTAG_BROADCAST_CONTENT_TYPE_INFO, "broadcast_content_type_info", ShapeOctetString, 0, 255 },
    { SMPP_TLVTAG_BROADCAST_MESSAGE_CLASS, "broadcast_message_class", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_BROADCAST_REP_NUM, "broadcast_rep_num", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_BROADCAST_FREQUENCY_INTERVAL, "broadcast_frequency_interval", ShapeOctetString, 3, 3 },
    { SMPP_TLVTAG_BROADCAST_AREA_IDENTIFIER, "broadcast_area_identifier", ShapeOctetString, 0, 100 },
    { SMPP_TLVTAG_BROADCAST_ERROR_STATUS, "broadcast_error_status", ShapeInteger, 4, 4 },
    { SMPP_TLVTAG_BROADCAST_AREA_SUCCESS, "broadcast_area_success", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_BROADCAST_END_TIME, "broadcast_end_time", ShapeCOctetString, 1, 17 },
    { SMPP_TLVTAG_BROADCAST_SERVICE_GROUP, "broadcast_service_group", ShapeOctetString, 0, 255 },
    { SMPP_TLVTAG_BILLING_IDENTIFICATION, "billing_identification", ShapeOctetString, 0, 1024 },
    { SMPP_TLVTAG_SOURCE_NETWORK_ID, "source_network_id", ShapeCOctetString, 1, 65 },
    { SMPP_TLVTAG_DEST_NETWORK_ID, "dest_network_id", ShapeCOctetString, 1, 65 },
    { SMPP_TLVTAG_SOURCE_NODE_ID, "source_node_id", ShapeOctetString, 6, 6 },
    { SMPP_TLVTAG_DEST_NODE_ID, "dest_node_id", ShapeOctetString, 6, 6 },
    { SMPP_TLVTAG_DEST_ADDR_NP_RESOLUTION, "dest_addr_np_resolution", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_DEST_ADDR_NP_INFORMATION, "dest_addr_np_information", ShapeOctetString, 10, 10 },
    { SMPP_TLVTAG_DEST_ADDR_NP_COUNTRY, "dest_addr_np_country", ShapeOctetString, 1, 5 },
    { SMPP_TLVTAG_DISPLAY_TIME, "display_time", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_SMS_SIGNAL, "sms_signal", ShapeInteger, 2, 2 },
    { SMPP_TLVTAG_MS_VALIDITY, "ms_validity", ShapeOctetString, 1, 4 },
    { SMPP_TLVTAG_ALERT_ON_MESSAGE_DELIVERY, "alert_on_message_delivery", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_ITS_REPLY_TYPE, "its_reply_type", ShapeInteger, 1, 1 },
    { SMPP_TLVTAG_ITS_SESSION_INFO, "its_session_info", ShapeOctetString, 2, 2 }
};

/**
 * @brief look up a standard optional parameter.
 * 
 * @param tag numeric tag in host byte order.
 * @return const SmppTlvTagInfo* tag info, or nullptr if the tag is not a
 * known standard tag.
 */
const SmppTlvTagInfo* getTlvTagInfo(uint16_t tag) {
    for (const SmppTlvTagInfo &info : TlvTagInfo) {
        if (info.tag == tag) {
            return &info;
        }
    }

    return nullptr;
}

}
