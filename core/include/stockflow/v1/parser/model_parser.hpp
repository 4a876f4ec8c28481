#pragma once

#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/model.hpp"
#include "stockflow/v1/scenario_runner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stockflow::v1::parser {

struct ModelParserOptions {
    bool strict = true;  // Fail on unknown fields
};

/// Reads model and batch documents (YAML, or JSON which is valid YAML).
/// Problems are collected as "[CODE] message" strings in errors() and
/// warnings(); a load succeeded when errors() is empty afterwards.
class ModelParser {
public:
    explicit ModelParser(ModelParserOptions options = {});

    // Single model
    ModelConfig load(const std::filesystem::path& path);
    ModelConfig load_string(const std::string& content);

    // `base` model plus parameter `variations`; base case first
    std::vector<Scenario> load_batch(const std::filesystem::path& path);
    std::vector<Scenario> load_batch_string(const std::string& content);

    /// Like load() / load_string() but throws ConfigError on the first error
    ModelConfig load_or_throw(const std::filesystem::path& path);
    ModelConfig load_string_or_throw(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ModelParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    ErrorCode first_error_code_ = ErrorCode::None;

    void reset();
    [[nodiscard]] std::optional<std::string> read_file(const std::filesystem::path& path);
    void throw_if_failed() const;
};

}  // namespace stockflow::v1::parser
