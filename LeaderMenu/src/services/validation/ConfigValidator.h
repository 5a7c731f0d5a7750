#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/ConfigTree.h"

namespace lmenu::validation {

enum class ValidationErrorType {
    EmptyKey,
    NonSingleCharacterKey,
    DuplicateKey,
    MissingValue,
};

const char* toString(ValidationErrorType type) noexcept;
const char* describe(ValidationErrorType type) noexcept;

struct ValidationError {
    std::vector<int> path;   // child indices from the root
    ValidationErrorType type;

    bool operator==(const ValidationError&) const = default;
};

// "1/0/3"
std::string pathKey(const std::vector<int>& path);

class ConfigValidator {
public:
    // Pure and total: never throws, safe on arbitrarily deep trees.
    static std::vector<ValidationError> validate(const Group& root) noexcept;
};

// Validation results plus O(1) lookup by row path.
class ValidationIndex {
public:
    void assign(std::vector<ValidationError> errors);
    void clear() noexcept;

    [[nodiscard]] const std::vector<ValidationError>& errors() const noexcept { return errors_; }
    [[nodiscard]] const std::unordered_map<std::string, ValidationErrorType>& byPath() const noexcept { return byPath_; }
    [[nodiscard]] std::optional<ValidationErrorType> errorAt(const std::vector<int>& path) const;
    [[nodiscard]] bool empty() const noexcept { return errors_.empty(); }

private:
    std::vector<ValidationError> errors_;
    std::unordered_map<std::string, ValidationErrorType> byPath_;
};

} // namespace lmenu::validation
