#include "core/json.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <unordered_set>

namespace pipeshield::json {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

Value convert(const glz::json_t& node, size_t depth) {
    if (depth > kMaxParseDepth) {
        throw JsonParseError(std::format("JSON nesting exceeds {} levels", kMaxParseDepth));
    }

    if (node.is_null()) return Value{};
    if (node.is_boolean()) return Value(node.get<bool>());
    if (node.is_string()) return Value(node.get<std::string>());

    if (node.is_number()) {
        const double d = node.get<double>();
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) <= kMaxExactInteger) {
            return Value(static_cast<int64_t>(d));
        }
        return Value(d);
    }

    if (node.is_array()) {
        Value::Array items;
        const auto& arr = node.get_array();
        items.reserve(arr.size());
        for (const auto& elem : arr) {
            items.push_back(convert(elem, depth + 1));
        }
        return Value::array(std::move(items));
    }

    if (node.is_object()) {
        Value::Object members;
        for (const auto& [key, elem] : node.get_object()) {
            members.emplace(key, convert(elem, depth + 1));
        }
        return Value::object(std::move(members));
    }

    return Value{};
}

class Writer {
public:
    explicit Writer(const WriteOptions& options) : options_(options) {}

    void write(const Value& value, size_t depth) {
        switch (value.kind()) {
            case Value::Kind::NULL_VALUE:
                out_ += "null";
                return;
            case Value::Kind::BOOL:
                out_ += value.as_bool() ? "true" : "false";
                return;
            case Value::Kind::INT:
                out_ += std::format("{}", value.as_int());
                return;
            case Value::Kind::DOUBLE: {
                const double d = value.as_double();
                if (std::isfinite(d)) {
                    out_ += std::format("{}", d);
                } else {
                    out_ += "null";
                }
                return;
            }
            case Value::Kind::STRING:
                write_string(value.as_string());
                return;
            case Value::Kind::ARRAY:
            case Value::Kind::OBJECT:
                write_container(value, depth);
                return;
        }
    }

    std::string take() { return std::move(out_); }

private:
    void write_string(std::string_view s) {
        out_ += '"';
        out_ += utils::escape_json(s);
        out_ += '"';
    }

    void newline(size_t depth) {
        if (!options_.pretty) return;
        out_ += '\n';
        out_.append(depth * 2, ' ');
    }

    void write_container(const Value& value, size_t depth) {
        if (depth >= options_.max_depth) {
            write_string(kTruncatedDepth);
            return;
        }
        const void* id = value.identity();
        if (!active_.insert(id).second) {
            write_string(kTruncatedCycle);
            return;
        }

        if (value.is_array()) {
            const auto& arr = value.as_array();
            out_ += '[';
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out_ += ',';
                newline(depth + 1);
                write(arr[i], depth + 1);
            }
            if (!arr.empty()) newline(depth);
            out_ += ']';
        } else {
            const auto& obj = value.as_object();
            out_ += '{';
            bool first = true;
            for (const auto& [key, member] : obj) {
                if (!first) out_ += ',';
                first = false;
                newline(depth + 1);
                write_string(key);
                out_ += options_.pretty ? ": " : ":";
                write(member, depth + 1);
            }
            if (!obj.empty()) newline(depth);
            out_ += '}';
        }

        active_.erase(id);
    }

    const WriteOptions& options_;
    std::string out_;
    std::unordered_set<const void*> active_;
};

} // anonymous namespace

Value parse(std::string_view text) {
    glz::json_t result;
    const std::string buffer(text);
    auto ec = glz::read_json(result, buffer);
    if (ec) {
        throw JsonParseError(std::format("JSON parse error: {}", glz::format_error(ec, buffer)));
    }
    return convert(result, 0);
}

Value from_glaze(const glz::json_t& node) {
    return convert(node, 0);
}

std::string write(const Value& value, const WriteOptions& options) {
    Writer writer(options);
    writer.write(value, 0);
    return writer.take();
}

} // namespace pipeshield::json
