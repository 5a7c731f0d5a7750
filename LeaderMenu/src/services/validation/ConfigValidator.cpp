#include "services/validation/ConfigValidator.h"

#include <map>
#include <new>

#include "services/keys/KeyMaps.h"

namespace lmenu::validation {

namespace {

struct PendingGroup {
    const Group* group;
    std::vector<int> path;
};

void validateChildren(const PendingGroup& pending, std::vector<ValidationError>& out, std::vector<PendingGroup>& stack) {
    std::map<std::string, std::vector<int>> seen;
    const auto& children = pending.group->children;
    for (std::size_t i = 0; i < children.size(); ++i) {
        const Node& child = children[i];
        std::vector<int> childPath = pending.path;
        childPath.push_back(static_cast<int>(i));

        const auto& key = child.key();
        if (!key || key->empty()) {
            out.push_back({childPath, ValidationErrorType::EmptyKey});
        } else if (keys::logicalLength(*key) != 1) {
            out.push_back({childPath, ValidationErrorType::NonSingleCharacterKey});
        } else {
            seen[keys::normalize(*key)].push_back(static_cast<int>(i));
        }

        if (const auto* action = child.action()) {
            if (action->value.empty()) {
                out.push_back({childPath, ValidationErrorType::MissingValue});
            }
        } else if (const auto* group = child.group()) {
            stack.push_back({group, std::move(childPath)});
        }
    }

    for (const auto& [key, indices] : seen) {
        if (indices.size() < 2) {
            continue;
        }
        for (int index : indices) {
            std::vector<int> dupPath = pending.path;
            dupPath.push_back(index);
            out.push_back({std::move(dupPath), ValidationErrorType::DuplicateKey});
        }
    }
}

} // namespace

const char* toString(ValidationErrorType type) noexcept {
    switch (type) {
    case ValidationErrorType::EmptyKey: return "empty_key";
    case ValidationErrorType::NonSingleCharacterKey: return "non_single_character_key";
    case ValidationErrorType::DuplicateKey: return "duplicate_key";
    case ValidationErrorType::MissingValue: return "missing_value";
    }
    return "unknown";
}

const char* describe(ValidationErrorType type) noexcept {
    switch (type) {
    case ValidationErrorType::EmptyKey: return "Key is empty";
    case ValidationErrorType::NonSingleCharacterKey: return "Key must be a single character";
    case ValidationErrorType::DuplicateKey: return "Key is used more than once in this group";
    case ValidationErrorType::MissingValue: return "Action has no value";
    }
    return "Unknown problem";
}

std::string pathKey(const std::vector<int>& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out.push_back('/');
        }
        out += std::to_string(path[i]);
    }
    return out;
}

std::vector<ValidationError> ConfigValidator::validate(const Group& root) noexcept {
    std::vector<ValidationError> errors;
    try {
        std::vector<PendingGroup> stack;
        stack.push_back({&root, {}});
        while (!stack.empty()) {
            PendingGroup pending = std::move(stack.back());
            stack.pop_back();
            validateChildren(pending, errors, stack);
        }
    } catch (const std::bad_alloc&) {
        // Partial results are still meaningful; the caller shows what was found.
    }
    return errors;
}

void ValidationIndex::assign(std::vector<ValidationError> errors) {
    errors_ = std::move(errors);
    byPath_.clear();
    for (const auto& error : errors_) {
        byPath_[pathKey(error.path)] = error.type;
    }
}

void ValidationIndex::clear() noexcept {
    errors_.clear();
    byPath_.clear();
}

std::optional<ValidationErrorType> ValidationIndex::errorAt(const std::vector<int>& path) const {
    auto it = byPath_.find(pathKey(path));
    if (it == byPath_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace lmenu::validation
