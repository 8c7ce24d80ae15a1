#include "utils/utf8.hh"

namespace smpp {

/**
 * @brief test if a buffer is well-formed UTF-8.
 * 
 * overlong forms, surrogates (U+D800 - U+DFFF) and code points above U+10FFFF
 * are rejected.
 * 
 * @param buf buffer.
 * @param buf_sz buffer size.
 * @return true if valid.
 * @return false if not.
 */
bool validUtf8(const uint8_t *buf, size_t buf_sz) {
    size_t i = 0;

    while (i < buf_sz) {
        uint8_t c = buf[i];
        size_t follow;
        uint32_t cp;
        uint32_t min;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xe0) == 0xc0) {
            follow = 1; cp = c & 0x1f; min = 0x80;
        } else if ((c & 0xf0) == 0xe0) {
            follow = 2; cp = c & 0x0f; min = 0x800;
        } else if ((c & 0xf8) == 0xf0) {
            follow = 3; cp = c & 0x07; min = 0x10000;
        } else {
            return false;
        }

        if (follow > buf_sz - i - 1) {
            return false;
        }

        for (size_t j = 1; j <= follow; ++j) {
            uint8_t cc = buf[i + j];

            if ((cc & 0xc0) != 0x80) {
                return false;
            }

            cp = (cp << 6) | (cc & 0x3f);
        }

        if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
            return false;
        }

        i += follow + 1;
    }

    return true;
}

}
