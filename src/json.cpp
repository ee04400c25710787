#include <eventsource-cpp/json.hpp>
#include <eventsource-cpp/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eventsource_cpp {

namespace {

// SAX consumer that builds a ValueNode tree. Open containers live on an
// explicit stack and are moved into their parent when closed, so no
// pointer into a growing vector is ever held.
class TreeBuilder {
public:
    using json = nlohmann::json;

    auto null() -> bool { return add(ValueNode{}); }

    auto boolean(bool val) -> bool {
        return add(ValueNode{NodeKind::boolean, val ? "true" : "false"});
    }

    // Non-negative integers arrive through number_unsigned, so a zero here
    // was written as `-0`.
    auto number_integer(json::number_integer_t val) -> bool {
        return add(ValueNode{NodeKind::number, val == 0 ? std::string{"-0"} : std::to_string(val)});
    }

    auto number_unsigned(json::number_unsigned_t val) -> bool {
        return add(ValueNode{NodeKind::number, std::to_string(val)});
    }

    // The lexer hands over the literal as written; keep it verbatim.
    auto number_float(json::number_float_t, const json::string_t& literal) -> bool {
        return add(ValueNode{NodeKind::number, literal});
    }

    auto string(json::string_t& val) -> bool {
        return add(ValueNode{NodeKind::string, std::move(val)});
    }

    auto binary(json::binary_t&) -> bool {
        error_ = "binary values are not supported";
        return false;
    }

    auto start_object(std::size_t) -> bool { return open(NodeKind::object); }

    auto key(json::string_t& val) -> bool {
        frames_.back().key = std::move(val);
        return true;
    }

    auto end_object() -> bool { return close(); }

    auto start_array(std::size_t) -> bool { return open(NodeKind::array); }

    auto end_array() -> bool { return close(); }

    auto parse_error(std::size_t, const std::string&, const json::exception& ex) -> bool {
        error_ = ex.what();
        return false;
    }

    auto error() const -> const std::string& { return error_; }

    auto result() && -> ValueNode { return std::move(result_); }

private:
    struct Frame {
        ValueNode node;
        std::string key;
    };

    auto open(NodeKind kind) -> bool {
        if (frames_.size() >= max_nesting_depth) {
            error_ = "maximum nesting depth of " + std::to_string(max_nesting_depth) + " exceeded";
            return false;
        }
        frames_.push_back(Frame{ValueNode{kind}, {}});
        return true;
    }

    auto close() -> bool {
        auto node = std::move(frames_.back().node);
        frames_.pop_back();
        return add(std::move(node));
    }

    auto add(ValueNode node) -> bool {
        if (frames_.empty()) {
            result_ = std::move(node);
            return true;
        }
        auto& top = frames_.back();
        if (top.node.is_object()) {
            top.node.set_member(std::move(top.key), std::move(node));
            top.key.clear();
        } else {
            top.node.append(std::move(node));
        }
        return true;
    }

    std::vector<Frame> frames_;
    ValueNode result_;
    std::string error_;
};

void write_node(JsonWriter& w, const ValueNode& node) {
    switch (node.kind()) {
        case NodeKind::null:
            w.null();
            return;
        case NodeKind::string:
            w.string(node.text());
            return;
        case NodeKind::number:
        case NodeKind::boolean:
            if (node.text().empty()) {
                throw Exception{ErrorKind::serialize_error,
                    std::string{"empty literal for "} + std::string{to_string_view(node.kind())} + " value"};
            }
            w.literal(node.text());
            return;
        case NodeKind::object:
            w.begin_object();
            for (const auto& member : node.members()) {
                w.key(member.name);
                write_node(w, member.value);
            }
            w.end_object();
            return;
        case NodeKind::array:
            w.begin_array();
            for (const auto& element : node.elements()) {
                write_node(w, element);
            }
            w.end_array();
            return;
    }
    throw Exception{ErrorKind::serialize_error,
        "unexpected node kind " + std::to_string(static_cast<int>(node.kind()))};
}

}  // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

auto parse_value(std::string_view text) -> ValueNode {
    auto builder = TreeBuilder{};
    if (!nlohmann::json::sax_parse(text, &builder)) {
        throw Exception{ErrorKind::parse_error,
            builder.error().empty() ? std::string{"invalid JSON"} : builder.error()};
    }
    return std::move(builder).result();
}

auto parse(std::string_view text) -> RootContainer {
    return RootContainer::from_value(parse_value(text));
}

// =============================================================================
// Serialization
// =============================================================================

auto serialize(const ValueNode& node) -> std::string {
    auto w = JsonWriter{};
    write_node(w, node);
    return w.take();
}

auto serialize(const RootContainer& root) -> std::string {
    return serialize(root.value());
}

// -- JsonWriter ---------------------------------------------------------------

void JsonWriter::separate() {
    if (need_comma_) out_.push_back(',');
}

void JsonWriter::begin_object() {
    separate();
    out_.push_back('{');
    need_comma_ = false;
}

void JsonWriter::end_object() {
    out_.push_back('}');
    need_comma_ = true;
}

void JsonWriter::begin_array() {
    separate();
    out_.push_back('[');
    need_comma_ = false;
}

void JsonWriter::end_array() {
    out_.push_back(']');
    need_comma_ = true;
}

void JsonWriter::key(std::string_view name) {
    string(name);
    out_.push_back(':');
    need_comma_ = false;
}

void JsonWriter::string(std::string_view text) {
    separate();
    // Invalid UTF-8 in instruction payloads is replaced rather than rejected.
    out_ += nlohmann::json(std::string{text})
                .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    need_comma_ = true;
}

void JsonWriter::literal(std::string_view text) {
    separate();
    out_.append(text);
    need_comma_ = true;
}

void JsonWriter::null() {
    literal("null");
}

}  // namespace eventsource_cpp
