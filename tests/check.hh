#ifndef SMPP_TEST_CHECK_H
#define SMPP_TEST_CHECK_H
#include <stdio.h>

#define CHECK(cond) {\
    if (!(cond)) {\
        printf("%s:%d: check failed: %s\n", __FILE__, __LINE__, #cond);\
        return 1;\
    }\
}

#define RUN(test_fn) {\
    if (test_fn() != 0) {\
        printf("FAIL %s\n", #test_fn);\
        return 1;\
    }\
    printf("ok   %s\n", #test_fn);\
}

#endif // SMPP_TEST_CHECK_H
