#ifndef SMPP_VALUE_OP_H
#define SMPP_VALUE_OP_H
#include "utils/log.hh"

#include <stdint.h>
#include <unistd.h>
#include <string.h>
#include <string>
#include <vector>

namespace smpp {

/**
 * @brief read value from buffer.
 * 
 * read value from buffer pointer.
 * 
 * @tparam T type of value.
 * @param src buffer to read from.
 * @param src_sz size of the source buffer.
 * @param dst pointer to variable to write to.
 * @return ssize_t bytes read, or -1 on error.
 */
template <typename T> ssize_t getValue(const uint8_t *src, size_t src_sz, T &dst) {
    size_t sz = sizeof(T);
    
    if (sz > src_sz) {
        log_fatal("unexpected end of buffer when reading value: souce buffer size: %zu, variable size %zu\n", src_sz, sz);
        return -1;
    }

    memcpy(&dst, src, sz);
    return sz;
}

/**
 * @brief write value to buffer.
 * 
 * write the value to buffer pointer.
 * 
 * @tparam T type of value.
 * @param dst pointer to buffer.
 * @param dst_sz size of the buffer.
 * @param value value to write.
 * @return ssize_t bytes written, or -1 on error.
 */
template <typename T> ssize_t putValue(uint8_t *dst, size_t dst_sz, const T &value) {
    size_t sz = sizeof(T);

    if (sz > dst_sz) {
        log_fatal("unexpected end of buffer when writing value: dst buffer size: %zu, variable size %zu\n", dst_sz, sz);
        return -1;
    }

    memcpy(dst, &value, sz);
    return sz;
}

ssize_t getCString(const uint8_t *src, size_t src_sz, size_t max_sz, std::string &dst);
ssize_t putCString(uint8_t *dst, size_t dst_sz, const std::string &value);

ssize_t getOctets(const uint8_t *src, size_t src_sz, size_t count, std::vector<uint8_t> &dst);
ssize_t putOctets(uint8_t *dst, size_t dst_sz, const std::vector<uint8_t> &value);

#define GETVAL_S(buf_ptr, buf_sz_var, dst_var_type, dst_var, post_processing, err_ret) {\
    ssize_t tmp = smpp::getValue<dst_var_type>(buf_ptr, buf_sz_var, dst_var);\
    if (tmp < 0) { return err_ret; };\
    dst_var = post_processing(dst_var);\
    buf_sz_var -= tmp; buf_ptr += tmp;\
}

#define PUTVAL_S(buf_ptr, buf_sz_var, src_var_type, src_var, pre_processing, err_ret) {\
    ssize_t tmp = smpp::putValue<src_var_type>(buf_ptr, buf_sz_var, pre_processing(src_var));\
    if (tmp < 0) { return err_ret; };\
    buf_sz_var -= tmp; buf_ptr += tmp;\
}

#define GETCSTR_S(buf_ptr, buf_sz_var, max_sz, dst_var, err_ret) {\
    ssize_t tmp = getCString(buf_ptr, buf_sz_var, max_sz, dst_var);\
    if (tmp < 0) { return err_ret; };\
    buf_sz_var -= tmp; buf_ptr += tmp;\
}

#define PUTCSTR_S(buf_ptr, buf_sz_var, src_var, err_ret) {\
    ssize_t tmp = putCString(buf_ptr, buf_sz_var, src_var);\
    if (tmp < 0) { return err_ret; };\
    buf_sz_var -= tmp; buf_ptr += tmp;\
}

#define GETOCTETS_S(buf_ptr, buf_sz_var, count, dst_var, err_ret) {\
    ssize_t tmp = getOctets(buf_ptr, buf_sz_var, count, dst_var);\
    if (tmp < 0) { return err_ret; };\
    buf_sz_var -= tmp; buf_ptr += tmp;\
}

#define PUTOCTETS_S(buf_ptr, buf_sz_var, src_var, err_ret) {\
    ssize_t tmp = putOctets(buf_ptr, buf_sz_var, src_var);\
    if (tmp < 0) { return err_ret; };\
    buf_sz_var -= tmp; buf_ptr += tmp;\
}

}

#endif // SMPP_VALUE_OP_H
