#include <gtest/gtest.h>
#include "core/errors/tool_errors.hpp"

using namespace mcptools::core::errors;

// A dummy function to simulate a tool failing
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return ToolError{ErrorCategory::Execution, "File not found", "file_not_found"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "file_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeToUnknown) {
    ToolError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Provider), "provider");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
}
