#include <issuehub-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace issuehub_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::validation_error),  "validation_error");
    EXPECT_EQ(to_string_view(ErrorKind::not_found),         "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::store_unavailable), "store_unavailable");
    EXPECT_EQ(to_string_view(ErrorKind::log_failure),       "log_failure");
    EXPECT_EQ(to_string_view(ErrorKind::superseded),        "superseded");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_mutation),  "invalid_mutation");
    EXPECT_EQ(to_string_view(ErrorKind::decoding_error),    "decoding_error");
    EXPECT_EQ(to_string_view(ErrorKind::config_error),      "config_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "Issue not found"};
    const auto e2 = Error{ErrorKind::not_found, "Issue not found"};
    const auto e3 = Error{ErrorKind::validation_error, "Issue not found"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::validation_error, "invalid status"};
    const auto e2 = Error{ErrorKind::validation_error, "author and text required"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_the_error) {
    try {
        throw Exception{ErrorKind::store_unavailable, "disk full"};
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::store_unavailable);
        EXPECT_EQ(e.error().message, "disk full");
        EXPECT_STREQ(e.what(), "disk full");
    }
}

TEST(Exception, is_a_runtime_error) {
    EXPECT_THROW(throw Exception(Error{ErrorKind::log_failure, "git"}), std::runtime_error);
}
