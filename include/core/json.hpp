#pragma once

#include "core/value.hpp"

#include <glaze/glaze.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pipeshield::json {

struct JsonParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Nesting beyond this depth is rejected on parse
inline constexpr size_t kMaxParseDepth = 512;

/**
 * @brief Parse JSON text into a Value tree (glaze DOM underneath)
 *
 * Numbers with an integral value that fits in 53 bits become INT,
 * everything else DOUBLE.
 * @throws JsonParseError on malformed input or excessive nesting
 */
[[nodiscard]] Value parse(std::string_view text);

/// Convert an already-parsed glaze DOM
[[nodiscard]] Value from_glaze(const glz::json_t& node);

struct WriteOptions {
    bool pretty = false;
    size_t max_depth = 256;
};

/**
 * @brief Serialize a Value tree to JSON text
 *
 * Output is canonical: object keys sorted, no insignificant whitespace
 * unless pretty. Cyclic edges are written as "TRUNCATED_CYCLE" and
 * containers nested beyond max_depth as "TRUNCATED_DEPTH", so the writer
 * always terminates.
 */
[[nodiscard]] std::string write(const Value& value, const WriteOptions& options = {});

} // namespace pipeshield::json
