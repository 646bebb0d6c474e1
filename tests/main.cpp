#include <iostream>
#include <exception>
// Only GTest::gtest is linked (not gtest_main), so the binary provides its own entry point.
#include <gtest/gtest.h>

int main(int argc, char** argv){
    try{
        ::testing::InitGoogleTest(&argc, argv);
        return RUN_ALL_TESTS();
    }catch(const std::exception& e){ std::cerr << "[imp_tests] exception: " << e.what() << "\n"; return 1; }
}
