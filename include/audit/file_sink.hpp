#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace pipeshield {

/**
 * @brief Append-only JSONL file with size-based rotation
 *
 * When the file reaches max_file_size_bytes it is renamed to
 * <file>.1 (older ones shift to .2, .3, ...) and a fresh file is started.
 * Files beyond max_files are deleted. Records are never rewritten.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "pipeshield-audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace pipeshield
