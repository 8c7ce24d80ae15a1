#ifndef SMPP_UTF8_H
#define SMPP_UTF8_H
#include <stdint.h>
#include <unistd.h>

namespace smpp {

bool validUtf8(const uint8_t *buf, size_t buf_sz);

}

#endif // SMPP_UTF8_H
