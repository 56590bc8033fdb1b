#include <gtest/gtest.h>
#include "test_utils.hpp"

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    dbridge::test::init_logging();
    return RUN_ALL_TESTS();
}
