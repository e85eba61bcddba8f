#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace FT {

class FormContext;

namespace Inspector {

struct SnapshotOptions {
    std::size_t max_depth       = 8;
    std::size_t max_children    = 64;
    bool        include_widgets = true;
};

struct FieldSummary {
    std::string                name; // fully qualified, empty when nothing in the chain is named
    std::optional<std::string> partial_name;
    std::optional<std::string> field_type;
    std::uint32_t              flags              = 0;
    std::string                kind;
    std::size_t                widget_count       = 0;
    std::size_t                child_count        = 0;
    bool                       children_truncated = false;
    std::vector<FieldSummary>  children;
};

struct FieldTreeSnapshot {
    SnapshotOptions           options;
    std::vector<FieldSummary> fields;
    std::vector<std::string>  diagnostics;
};

// Walks the form's root fields. Failures below the root level are recorded
// as diagnostics instead of aborting the snapshot.
auto BuildFieldTreeSnapshot(FormContext const& form, SnapshotOptions const& options)
    -> Expected<FieldTreeSnapshot>;

auto SerializeFieldTreeSnapshot(FieldTreeSnapshot const& snapshot, int indent = 2) -> std::string;

auto ParseFieldTreeSnapshot(std::string const& payload) -> Expected<FieldTreeSnapshot>;

} // namespace Inspector
} // namespace FT
