#include "core/value.hpp"

#include <stdexcept>

namespace pipeshield {

Value Value::array(Array items) {
    Value v;
    v.data_ = std::make_shared<Array>(std::move(items));
    return v;
}

Value Value::object(Object members) {
    Value v;
    v.data_ = std::make_shared<Object>(std::move(members));
    return v;
}

Value Value::tagged(std::string text, std::string tag) {
    Value v(std::move(text));
    v.tag_ = std::move(tag);
    return v;
}

Value Value::share(std::shared_ptr<Array> items) {
    if (!items) throw std::invalid_argument("Value::share: null array handle");
    Value v;
    v.data_ = std::move(items);
    return v;
}

Value Value::share(std::shared_ptr<Object> members) {
    if (!members) throw std::invalid_argument("Value::share: null object handle");
    Value v;
    v.data_ = std::move(members);
    return v;
}

double Value::as_double() const {
    if (is_int()) return static_cast<double>(std::get<int64_t>(data_));
    return std::get<double>(data_);
}

std::shared_ptr<Value::Array> Value::array_handle() const {
    if (!is_array()) return nullptr;
    return std::get<std::shared_ptr<Array>>(data_);
}

std::shared_ptr<Value::Object> Value::object_handle() const {
    if (!is_object()) return nullptr;
    return std::get<std::shared_ptr<Object>>(data_);
}

const void* Value::identity() const {
    if (is_array()) return std::get<std::shared_ptr<Array>>(data_).get();
    if (is_object()) return std::get<std::shared_ptr<Object>>(data_).get();
    return nullptr;
}

size_t Value::size() const {
    if (is_array()) return as_array().size();
    if (is_object()) return as_object().size();
    return 0;
}

Value& Value::operator[](std::string_view key) {
    if (is_null()) {
        data_ = std::make_shared<Object>();
    }
    auto& obj = as_object();
    const auto it = obj.find(key);
    if (it != obj.end()) return it->second;
    return obj.emplace(std::string(key), Value{}).first->second;
}

void Value::push_back(Value item) {
    if (is_null()) {
        data_ = std::make_shared<Array>();
    }
    as_array().push_back(std::move(item));
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) return nullptr;
    const auto& obj = as_object();
    const auto it = obj.find(key);
    return it != obj.end() ? &it->second : nullptr;
}

bool operator==(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_int() && b.is_int()) return a.as_int() == b.as_int();
        return a.as_double() == b.as_double();
    }
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case Value::Kind::NULL_VALUE:
            return true;
        case Value::Kind::BOOL:
            return a.as_bool() == b.as_bool();
        case Value::Kind::STRING:
            return a.as_string() == b.as_string();
        case Value::Kind::ARRAY: {
            if (a.identity() == b.identity()) return true;
            const auto& lhs = a.as_array();
            const auto& rhs = b.as_array();
            if (lhs.size() != rhs.size()) return false;
            for (size_t i = 0; i < lhs.size(); ++i) {
                if (lhs[i] != rhs[i]) return false;
            }
            return true;
        }
        case Value::Kind::OBJECT: {
            if (a.identity() == b.identity()) return true;
            const auto& lhs = a.as_object();
            const auto& rhs = b.as_object();
            if (lhs.size() != rhs.size()) return false;
            auto li = lhs.begin();
            auto ri = rhs.begin();
            for (; li != lhs.end(); ++li, ++ri) {
                if (li->first != ri->first || li->second != ri->second) return false;
            }
            return true;
        }
        default:
            return false;
    }
}

const char* value_kind_to_string(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::NULL_VALUE: return "null";
        case Value::Kind::BOOL:       return "bool";
        case Value::Kind::INT:        return "int";
        case Value::Kind::DOUBLE:     return "double";
        case Value::Kind::STRING:     return "string";
        case Value::Kind::ARRAY:      return "array";
        case Value::Kind::OBJECT:     return "object";
        default:                      return "unknown";
    }
}

} // namespace pipeshield
