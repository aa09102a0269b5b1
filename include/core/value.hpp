#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace pipeshield {

/**
 * @brief Dynamic tree of mappings, sequences and scalars
 *
 * The shape handed over by the CI collaborator. Containers are held by
 * shared_ptr and have reference semantics: copying a Value aliases its
 * container, so the same sequence or mapping may appear at several places
 * in a tree, including inside itself. identity() exposes the container
 * address for cycle detection.
 *
 * Scalars may carry a semantic type tag declared by the producer
 * (e.g. "branch"), consulted by the pattern registry.
 */
class Value {
public:
    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    enum class Kind { NULL_VALUE, BOOL, INT, DOUBLE, STRING, ARRAY, OBJECT };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}
    template<typename T>
        requires (std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T v) : data_(static_cast<int64_t>(v)) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string_view v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}

    // ===== Factories =====

    [[nodiscard]] static Value array(Array items = {});
    [[nodiscard]] static Value object(Object members = {});
    [[nodiscard]] static Value tagged(std::string text, std::string tag);

    /// Wrap existing container handles (used to build shared or cyclic graphs)
    [[nodiscard]] static Value share(std::shared_ptr<Array> items);
    [[nodiscard]] static Value share(std::shared_ptr<Object> members);

    // ===== Type Checks =====

    [[nodiscard]] Kind kind() const { return static_cast<Kind>(data_.index()); }
    [[nodiscard]] bool is_null() const { return kind() == Kind::NULL_VALUE; }
    [[nodiscard]] bool is_bool() const { return kind() == Kind::BOOL; }
    [[nodiscard]] bool is_int() const { return kind() == Kind::INT; }
    [[nodiscard]] bool is_double() const { return kind() == Kind::DOUBLE; }
    [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const { return kind() == Kind::STRING; }
    [[nodiscard]] bool is_array() const { return kind() == Kind::ARRAY; }
    [[nodiscard]] bool is_object() const { return kind() == Kind::OBJECT; }
    [[nodiscard]] bool is_container() const { return is_array() || is_object(); }

    // ===== Accessors (throw std::bad_variant_access on kind mismatch) =====

    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(data_); }
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }

    [[nodiscard]] const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    [[nodiscard]] Array& as_array() { return *std::get<std::shared_ptr<Array>>(data_); }
    [[nodiscard]] const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }
    [[nodiscard]] Object& as_object() { return *std::get<std::shared_ptr<Object>>(data_); }

    [[nodiscard]] std::shared_ptr<Array> array_handle() const;
    [[nodiscard]] std::shared_ptr<Object> object_handle() const;

    /// Container address; nullptr for scalars
    [[nodiscard]] const void* identity() const;

    [[nodiscard]] const std::string& tag() const { return tag_; }
    void set_tag(std::string tag) { tag_ = std::move(tag); }

    /// Element count for containers, 0 for scalars
    [[nodiscard]] size_t size() const;

    // ===== Mutation helpers =====

    /// Object member access; a null Value becomes an empty object first
    Value& operator[](std::string_view key);
    void push_back(Value item);

    /// Object lookup; nullptr when absent or not an object
    [[nodiscard]] const Value* find(std::string_view key) const;

    /**
     * @brief Deep structural equality
     *
     * Integers and doubles compare numerically; tags are ignored.
     * Not defined for cyclic values.
     */
    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    using Storage = std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        std::shared_ptr<Array>,
        std::shared_ptr<Object>>;

    Storage data_{nullptr};
    std::string tag_;
};

[[nodiscard]] const char* value_kind_to_string(Value::Kind kind);

} // namespace pipeshield
