// tests/validation_test.cpp
// Unit tests for input validation and error kinds.

#include <gtest/gtest.h>
#include "validation.hpp"

using namespace atlantis;
using namespace atlantis::validation;

TEST(ValidationTest, PackageSizeAtLimit) {
    EXPECT_TRUE(check_package_size(0));
    EXPECT_TRUE(check_package_size(MAX_PACKAGE_SIZE));
}

TEST(ValidationTest, PackageSizeAboveLimit) {
    EXPECT_FALSE(check_package_size(MAX_PACKAGE_SIZE + 1));
}

TEST(ValidationTest, ValidPackageName) {
    EXPECT_NO_THROW(validate_package_name("com.example.app"));
}

TEST(ValidationTest, EmptyPackageName) {
    EXPECT_THROW(validate_package_name(""), AtlantisError);
}

TEST(ValidationTest, MaxLengthPackageName) {
    EXPECT_NO_THROW(validate_package_name(std::string(256, 'p')));
    EXPECT_THROW(validate_package_name(std::string(257, 'p')), AtlantisError);
}

TEST(ValidationTest, ErrorKindIsConfiguration) {
    try {
        validate_package_name("");
        FAIL() << "expected AtlantisError";
    } catch (const AtlantisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
        EXPECT_EQ(e.message(), "configuration error: packageName is required");
    }
}

TEST(ErrorTest, DiscoveryErrorKeepsCodeAndMessage) {
    auto error = AtlantisError::discovery(3, "socket unavailable");
    EXPECT_EQ(error.kind(), ErrorKind::Discovery);
    EXPECT_EQ(error.code(), 3);
    EXPECT_EQ(error.message(), "socket unavailable");
}

TEST(ErrorTest, ClosedError) {
    auto error = AtlantisError::closed();
    EXPECT_EQ(error.kind(), ErrorKind::Closed);
    EXPECT_STREQ(error.what(), "transporter is stopped");
}
