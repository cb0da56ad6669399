#include <gtest/gtest.h>

#include <iostream>

#include "sage_core/db/database_manager.hpp"

namespace {

// Closes whatever pool the last fixture left open before static destruction starts
class DatabaseEnvironment : public ::testing::Environment {
 public:
  void TearDown() override {
    sage_core::DatabaseManager::get_instance().shutdown();
  }
};

}  // namespace

int main(int argc, char **argv) {
  std::cout << "Running Sage Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new DatabaseEnvironment);

  const int result = RUN_ALL_TESTS();
  if (result != 0) {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }
  return result;
}
