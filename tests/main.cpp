#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "=== Monte Carlo Engine Test Suite ===" << std::endl;
    std::cout << "Running end-to-end generation tests..." << std::endl;

    return RUN_ALL_TESTS();
}
