#include "utils/value-ops.hh"

namespace smpp {

/**
 * @brief read a NUL terminated string.
 * 
 * @param src buffer to read from.
 * @param src_sz size of the source buffer.
 * @param max_sz max size of the string, including the NUL.
 * @param dst string to write to. the NUL is not included.
 * @return ssize_t bytes read (incl. NUL), or -1 on error.
 */
ssize_t getCString(const uint8_t *src, size_t src_sz, size_t max_sz, std::string &dst) {
    size_t limit = src_sz < max_sz ? src_sz : max_sz;

    const uint8_t *nul = (const uint8_t *) memchr(src, 0, limit);

    if (nul == nullptr) {
        log_fatal("no NUL found in the first %zu bytes (buffer size %zu, field max %zu).\n", limit, src_sz, max_sz);
        return -1;
    }

    dst.assign((const char *) src, nul - src);

    return nul - src + 1;
}

/**
 * @brief write a string followed by a NUL.
 * 
 * @param dst buffer to write to.
 * @param dst_sz size of the buffer.
 * @param value string to write.
 * @return ssize_t bytes written (incl. NUL), or -1 on error.
 */
ssize_t putCString(uint8_t *dst, size_t dst_sz, const std::string &value) {
    size_t sz = value.size() + 1;

    if (sz > dst_sz) {
        log_fatal("unexpected end of buffer when writing string: dst buffer size: %zu, string size %zu\n", dst_sz, sz);
        return -1;
    }

    memcpy(dst, value.c_str(), sz);

    return sz;
}

/**
 * @brief read a fixed number of bytes.
 * 
 * @param src buffer to read from.
 * @param src_sz size of the source buffer.
 * @param count number of bytes to read.
 * @param dst vector to write to. replaced, not appended.
 * @return ssize_t bytes read, or -1 on error.
 */
ssize_t getOctets(const uint8_t *src, size_t src_sz, size_t count, std::vector<uint8_t> &dst) {
    if (count > src_sz) {
        log_fatal("unexpected end of buffer when reading octets: souce buffer size: %zu, need %zu\n", src_sz, count);
        return -1;
    }

    dst.assign(src, src + count);

    return count;
}

/**
 * @brief write bytes as-is.
 * 
 * @param dst buffer to write to.
 * @param dst_sz size of the buffer.
 * @param value bytes to write.
 * @return ssize_t bytes written, or -1 on error.
 */
ssize_t putOctets(uint8_t *dst, size_t dst_sz, const std::vector<uint8_t> &value) {
    if (value.size() > dst_sz) {
        log_fatal("unexpected end of buffer when writing octets: dst buffer size: %zu, need %zu\n", dst_sz, value.size());
        return -1;
    }

    if (value.size() > 0) {
        memcpy(dst, value.data(), value.size());
    }

    return value.size();
}

}
