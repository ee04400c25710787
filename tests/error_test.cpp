#include <eventsource-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace eventsource_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::parse_error),         "parse_error");
    EXPECT_EQ(to_string_view(ErrorKind::unsupported_root),    "unsupported_root");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_path),        "invalid_path");
    EXPECT_EQ(to_string_view(ErrorKind::path_not_found),      "path_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::null_in_path),        "null_in_path");
    EXPECT_EQ(to_string_view(ErrorKind::type_mismatch),       "type_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::empty_array),         "empty_array");
    EXPECT_EQ(to_string_view(ErrorKind::unsupported_indexer), "unsupported_indexer");
    EXPECT_EQ(to_string_view(ErrorKind::not_supported),       "not_supported");
    EXPECT_EQ(to_string_view(ErrorKind::non_empty_replace),   "non_empty_replace");
    EXPECT_EQ(to_string_view(ErrorKind::not_implemented),     "not_implemented");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_action_type), "unknown_action_type");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_data_type),   "unknown_data_type");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_value),       "invalid_value");
    EXPECT_EQ(to_string_view(ErrorKind::serialize_error),     "serialize_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::parse_error, "bad json"};
    const auto e2 = Error{ErrorKind::parse_error, "bad json"};
    const auto e3 = Error{ErrorKind::unsupported_root, "bad json"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::path_not_found, "foo"};
    const auto e2 = Error{ErrorKind::path_not_found, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_error_and_message) {
    const auto ex = Exception{ErrorKind::empty_array, "array was empty"};

    EXPECT_EQ(ex.kind(), ErrorKind::empty_array);
    EXPECT_EQ(ex.error(), (Error{ErrorKind::empty_array, "array was empty"}));
    EXPECT_EQ(std::string{ex.what()}, "array was empty");
}

TEST(Exception, is_a_runtime_error) {
    try {
        throw Exception{ErrorKind::not_implemented, "addOnly not implemented"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "addOnly not implemented");
        return;
    }
    FAIL() << "exception not caught as std::runtime_error";
}
