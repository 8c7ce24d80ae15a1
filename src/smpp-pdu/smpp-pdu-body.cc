#include "utils/log.hh"
#include "smpp-pdu/smpp-pdu-body.hh"

namespace smpp {

/**
 * @brief check a value for a c-octet string field.
 * 
 * @param field field name, for logging.
 * @param value value, without NUL.
 * @param max_sz max size of the field, incl. NUL.
 * @return ssize_t encoded size (incl. NUL), or -1 if too long or has an
 * embedded NUL.
 */
ssize_t checkCString(const char *field, const std::string &value, size_t max_sz) {
    if (value.find('\0') != std::string::npos) {
        log_error("%s has an embedded NUL.\n", field);
        return -1;
    }

    if (value.size() + 1 > max_sz) {
        log_error("%s too long: %zu bytes, max %zu (incl. NUL).\n", field, value.size() + 1, max_sz);
        return -1;
    }

    return value.size() + 1;
}

}
