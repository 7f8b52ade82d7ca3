#include <gtest/gtest.h>

#include <logging/SpdlogInit.hpp>

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    HashCore_SpdlogInit();
    int ret = RUN_ALL_TESTS();
    HashCore_SpdlogDeInit();
    return ret;
}
