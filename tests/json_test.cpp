#include <eventsource-cpp/json.hpp>
#include <eventsource-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace eventsource_cpp;

namespace {

auto round_trip(const std::string& text) -> std::string {
    return serialize(parse(text));
}

auto parse_error_kind(const std::string& text) -> ErrorKind {
    try {
        (void)parse(text);
    } catch (const Exception& e) {
        return e.kind();
    }
    ADD_FAILURE() << "parse succeeded for: " << text;
    return ErrorKind::serialize_error;
}

}  // namespace

// -- Parsing ------------------------------------------------------------------

TEST(Parse, classifies_every_kind) {
    const auto root = parse(R"({"s":"x","n":1.50,"b":true,"z":null,"o":{},"a":[]})");
    const auto& obj = root.holder();

    ASSERT_EQ(obj.size(), 6u);
    EXPECT_EQ(obj.find("s")->kind(), NodeKind::string);
    EXPECT_EQ(obj.find("n")->kind(), NodeKind::number);
    EXPECT_EQ(obj.find("n")->text(), "1.50");
    EXPECT_EQ(obj.find("b")->kind(), NodeKind::boolean);
    EXPECT_EQ(obj.find("b")->text(), "true");
    EXPECT_EQ(obj.find("z")->kind(), NodeKind::null);
    EXPECT_EQ(obj.find("o")->kind(), NodeKind::object);
    EXPECT_EQ(obj.find("a")->kind(), NodeKind::array);
}

TEST(Parse, array_root_sets_flag) {
    const auto root = parse(R"([{"id":0},{"id":1}])");
    EXPECT_TRUE(root.is_array());
    EXPECT_EQ(root.value().size(), 2u);
}

TEST(Parse, scalar_root_is_unsupported) {
    EXPECT_EQ(parse_error_kind("42"), ErrorKind::unsupported_root);
    EXPECT_EQ(parse_error_kind(R"("text")"), ErrorKind::unsupported_root);
    EXPECT_EQ(parse_error_kind("null"), ErrorKind::unsupported_root);
    EXPECT_EQ(parse_error_kind("true"), ErrorKind::unsupported_root);
}

TEST(Parse, malformed_input_is_a_parse_error) {
    EXPECT_EQ(parse_error_kind(""), ErrorKind::parse_error);
    EXPECT_EQ(parse_error_kind("{"), ErrorKind::parse_error);
    EXPECT_EQ(parse_error_kind(R"({"a":})"), ErrorKind::parse_error);
    EXPECT_EQ(parse_error_kind("[1,]"), ErrorKind::parse_error);
    EXPECT_EQ(parse_error_kind(R"({"a":1} trailing)"), ErrorKind::parse_error);
    EXPECT_EQ(parse_error_kind("{'a':1}"), ErrorKind::parse_error);
}

TEST(Parse, excessive_nesting_is_a_parse_error) {
    const auto deep = std::string(max_nesting_depth + 10, '[') + std::string(max_nesting_depth + 10, ']');
    EXPECT_EQ(parse_error_kind(deep), ErrorKind::parse_error);
}

TEST(Parse, nesting_at_the_limit_is_accepted) {
    const auto deep = std::string(max_nesting_depth, '[') + std::string(max_nesting_depth, ']');
    EXPECT_EQ(round_trip(deep), deep);
}

TEST(Parse, duplicate_key_keeps_last_value_at_first_position) {
    EXPECT_EQ(round_trip(R"({"a":1,"b":2,"a":3})"), R"({"a":3,"b":2})");
}

TEST(Parse, keys_differing_in_case_are_distinct) {
    EXPECT_EQ(round_trip(R"({"A":1,"a":2})"), R"({"A":1,"a":2})");
}

TEST(Parse, decodes_string_escapes) {
    const auto root = parse(R"({"s":"café \"q\" \\ \/"})");
    EXPECT_EQ(root.holder().find("s")->text(), "caf\xc3\xa9 \"q\" \\ /");
}

TEST(ParseValue, accepts_scalars) {
    EXPECT_EQ(parse_value("42").kind(), NodeKind::number);
    EXPECT_EQ(parse_value(R"("x")").text(), "x");
    EXPECT_TRUE(parse_value("null").is_null());
}

TEST(ParseValue, rejects_malformed_input) {
    try {
        (void)parse_value("{\"a\"");
        FAIL() << "expected parse_error";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::parse_error);
        EXPECT_FALSE(e.error().message.empty());
    }
}

// -- Number literals ----------------------------------------------------------

TEST(Numbers, literal_text_is_preserved) {
    const auto text = std::string{
        R"([0,-7,1.0,1.50,1e3,2E-2,-0.5,12345678901234567890,123456789012345678901234567890])"};
    EXPECT_EQ(round_trip(text), text);
}

TEST(Numbers, negative_zero_keeps_its_sign) {
    EXPECT_EQ(round_trip("[-0,0,-1]"), "[-0,0,-1]");
    const auto root = parse(R"({"z":-0})");
    EXPECT_EQ(root.holder().find("z")->text(), "-0");
}

TEST(Numbers, large_integer_keeps_every_digit) {
    const auto root = parse(R"({"big":123456789012345678901234567890})");
    EXPECT_EQ(root.holder().find("big")->text(), "123456789012345678901234567890");
}

// -- Serialization ------------------------------------------------------------

TEST(Serialize, compact_output_preserves_member_order) {
    const auto text = std::string{R"({"z":1,"a":{"y":"x","b":[true,false,null]},"m":[]})"};
    EXPECT_EQ(round_trip(text), text);
}

TEST(Serialize, whitespace_is_removed) {
    EXPECT_EQ(round_trip("{ \"a\" : [ 1 , 2 ] ,\n \"b\" : { } }"), R"({"a":[1,2],"b":{}})");
}

TEST(Serialize, empty_containers) {
    EXPECT_EQ(round_trip("{}"), "{}");
    EXPECT_EQ(round_trip("[]"), "[]");
    EXPECT_EQ(round_trip(R"({"o":{},"a":[]})"), R"({"o":{},"a":[]})");
}

TEST(Serialize, array_root_is_bare_array) {
    EXPECT_EQ(round_trip(R"([1,"two",{"three":3},[4]])"), R"([1,"two",{"three":3},[4]])");
}

TEST(Serialize, heterogeneous_nested_arrays) {
    const auto text = std::string{
        R"([[{"arrayObjectName":"array-object-0.0"}],[{"arrayObjectName":"array-object-1.0"}],["valueArray-0","valueArray-1"]])"};
    EXPECT_EQ(round_trip(text), text);
}

TEST(Serialize, escapes_quotes_backslashes_and_control_characters) {
    auto obj = ValueNode{NodeKind::object};
    obj.set_member("s", ValueNode{NodeKind::string, "a\"b\\c\nd\te\x01"});
    EXPECT_EQ(serialize(obj), R"({"s":"a\"b\\c\nd\te\u0001"})");
}

TEST(Serialize, escapes_property_names) {
    auto obj = ValueNode{NodeKind::object};
    obj.set_member("we\"ird", ValueNode{});
    EXPECT_EQ(serialize(obj), R"({"we\"ird":null})");
}

TEST(Serialize, utf8_is_passed_through) {
    EXPECT_EQ(round_trip("{\"s\":\"caf\xc3\xa9\"}"), "{\"s\":\"caf\xc3\xa9\"}");
}

TEST(Serialize, empty_number_literal_is_an_error) {
    auto obj = ValueNode{NodeKind::object};
    obj.set_member("n", ValueNode{NodeKind::number});
    try {
        (void)serialize(obj);
        FAIL() << "expected serialize_error";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::serialize_error);
    }
}

TEST(Serialize, reserialization_is_idempotent) {
    const auto inputs = std::vector<std::string>{
        R"({})",
        R"([])",
        R"( { "a" : 1.0 , "b" : [ { "c" : null } , "d\n" ] } )",
        R"([[[]],{"x":{"y":{"z":-1e-7}}},"A"])",
        R"({"A":1,"a":2,"A":3})",
    };
    for (const auto& input : inputs) {
        const auto once = round_trip(input);
        EXPECT_EQ(round_trip(once), once) << input;
    }
}

// -- JsonWriter ---------------------------------------------------------------

TEST(JsonWriter, tracks_separators) {
    auto w = JsonWriter{};
    w.begin_object();
    w.key("a");
    w.literal("1");
    w.key("b");
    w.begin_array();
    w.string("x");
    w.null();
    w.begin_object();
    w.end_object();
    w.end_array();
    w.end_object();
    EXPECT_EQ(w.str(), R"({"a":1,"b":["x",null,{}]})");
}

TEST(JsonWriter, take_moves_the_buffer_out) {
    auto w = JsonWriter{};
    w.begin_array();
    w.end_array();
    EXPECT_EQ(w.take(), "[]");
}
