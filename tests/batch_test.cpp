#include <eventsource-cpp/eventsource.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

using namespace eventsource_cpp;

namespace {

auto counter_document(int n) -> Document {
    auto doc = Document{.entity_id = "entity-" + std::to_string(n), .base_document = "{}"};
    for (int i = 0; i < n; ++i) {
        doc.events.push_back(DocumentEvent{.instructions = {
            {"count", ActionType::set_or_add, DataType::number, std::to_string(i + 1)},
            {"log[new]", ActionType::set_or_add, DataType::number, std::to_string(i)},
        }});
    }
    return doc;
}

auto failing_document() -> Document {
    auto doc = Document{.entity_id = "broken", .base_document = "{}"};
    doc.events.push_back(DocumentEvent{.instructions = {
        {"missing.path", ActionType::set_only, DataType::string, "x"},
    }});
    return doc;
}

}  // namespace

TEST(ReplayAll, empty_input) {
    EXPECT_TRUE(replay_all({}).empty());
}

TEST(ReplayAll, results_align_with_input) {
    auto documents = std::vector<Document>{};
    for (int n = 0; n < 64; ++n) {
        documents.push_back(counter_document(n % 5));
    }
    const auto results = replay_all(documents);
    ASSERT_EQ(results.size(), documents.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        ASSERT_TRUE(succeeded(results[i])) << i;
        EXPECT_EQ(std::get<std::string>(results[i]), replay(documents[i])) << i;
    }
}

TEST(ReplayAll, counter_document_state) {
    const auto documents = std::vector<Document>{counter_document(3)};
    const auto results = replay_all(documents);
    EXPECT_EQ(std::get<std::string>(results[0]), R"({"count":3,"log":[0,1,2]})");
}

TEST(ReplayAll, failure_is_isolated) {
    const auto documents = std::vector<Document>{
        counter_document(2),
        failing_document(),
        Document{.base_document = "not json"},
        counter_document(1),
    };
    const auto results = replay_all(documents);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(std::get<std::string>(results[0]), R"({"count":2,"log":[0,1]})");
    ASSERT_FALSE(succeeded(results[1]));
    EXPECT_EQ(std::get<Error>(results[1]).kind, ErrorKind::path_not_found);
    ASSERT_FALSE(succeeded(results[2]));
    EXPECT_EQ(std::get<Error>(results[2]).kind, ErrorKind::parse_error);
    EXPECT_EQ(std::get<std::string>(results[3]), R"({"count":1,"log":[0]})");
}

TEST(ReplayAll, applies_config_to_every_document) {
    auto doc = Document{.base_document = R"({"a":1})"};
    doc.events.push_back(DocumentEvent{.instructions = {{.path = "b", .action = ActionType::remove}}});
    const auto documents = std::vector<Document>(8, doc);

    for (const auto& result : replay_all(documents)) {
        EXPECT_FALSE(succeeded(result));
    }
    for (const auto& result : replay_all(documents, ReplayConfig{.remove_nonexistent_element_is_error = false})) {
        ASSERT_TRUE(succeeded(result));
        EXPECT_EQ(std::get<std::string>(result), R"({"a":1})");
    }
}

TEST(ReplayAll, repeated_batches_are_deterministic) {
    auto documents = std::vector<Document>{};
    for (int n = 0; n < 16; ++n) {
        documents.push_back(n % 4 == 0 ? failing_document() : counter_document(n));
    }
    const auto first = replay_all(documents);
    for (int round = 0; round < 5; ++round) {
        EXPECT_EQ(replay_all(documents), first);
    }
}
