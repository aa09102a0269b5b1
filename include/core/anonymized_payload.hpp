#pragma once

#include "core/value.hpp"

#include <string>

namespace pipeshield {

class RoundTrip;

/**
 * @brief Data cleared for transmission to the AI collaborator
 *
 * Only a RoundTrip can construct one, and only from the output of its
 * anonymization pass. Providers accept nothing else, so raw data cannot
 * reach them by accident.
 */
class AnonymizedPayload {
public:
    [[nodiscard]] const Value& data() const { return data_; }

    /// Canonical JSON rendering of data()
    [[nodiscard]] const std::string& json() const { return json_; }

    /// The caller's question, anonymized in the same context
    [[nodiscard]] const std::string& question() const { return question_; }

    [[nodiscard]] const std::string& operation() const { return operation_; }
    [[nodiscard]] const std::string& context_id() const { return context_id_; }

private:
    friend class RoundTrip;

    AnonymizedPayload(Value data, std::string json, std::string question,
                      std::string operation, std::string context_id)
        : data_(std::move(data)),
          json_(std::move(json)),
          question_(std::move(question)),
          operation_(std::move(operation)),
          context_id_(std::move(context_id)) {}

    Value data_;
    std::string json_;
    std::string question_;
    std::string operation_;
    std::string context_id_;
};

} // namespace pipeshield
