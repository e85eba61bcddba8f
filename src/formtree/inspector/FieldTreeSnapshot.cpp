#include "inspector/FieldTreeSnapshot.hpp"

#include "form/FieldNode.hpp"
#include "form/FormContext.hpp"
#include "form/KidList.hpp"
#include "log/TaggedLogger.hpp"

#include <string_view>
#include <utility>

#include "nlohmann/json.hpp"

namespace FT::Inspector {
namespace {

class SnapshotBuilder {
public:
    SnapshotBuilder(FormContext const& form, SnapshotOptions const& options)
        : form_(form)
        , options_(options) {}

    auto build() -> Expected<FieldTreeSnapshot> {
        auto roots = form_.fields();
        if (!roots) {
            return std::unexpected(roots.error());
        }

        FieldTreeSnapshot snapshot;
        snapshot.options = options_;
        snapshot.fields.reserve(roots->size());
        for (auto const& root : *roots) {
            snapshot.fields.push_back(summarize(root, 0));
        }
        snapshot.diagnostics = std::move(diagnostics_);
        return snapshot;
    }

private:
    auto summarize(FieldNode const& field, std::size_t depth) -> FieldSummary {
        FieldSummary summary;
        summary.name         = field.fullyQualifiedName().value_or(std::string{});
        summary.partial_name = field.partialName();
        summary.field_type   = field.fieldType();
        summary.flags        = field.fieldFlags();
        summary.kind         = std::string{fieldKindToString(field.kind())};

        auto kids = field.kids();
        if (!kids) {
            diagnostics_.push_back(std::string{"kids unreadable for '"}.append(summary.name).append("': ")
                                       .append(describeError(kids.error())));
            return summary;
        }
        if (!*kids) {
            // Widget annotation merged into the field node itself.
            summary.widget_count = options_.include_widgets ? 1 : 0;
            return summary;
        }

        std::vector<FieldNode> childFields;
        for (auto const& entry : **kids) {
            if (auto const* child = std::get_if<FieldNode>(&entry)) {
                childFields.push_back(*child);
            } else if (options_.include_widgets) {
                ++summary.widget_count;
            }
        }

        summary.child_count = childFields.size();
        if (depth + 1 >= options_.max_depth) {
            summary.children_truncated = !childFields.empty();
            return summary;
        }
        for (auto const& child : childFields) {
            if (summary.children.size() >= options_.max_children) {
                summary.children_truncated = true;
                break;
            }
            summary.children.push_back(summarize(child, depth + 1));
        }
        return summary;
    }

    FormContext const&       form_;
    SnapshotOptions const&   options_;
    std::vector<std::string> diagnostics_;
};

[[nodiscard]] auto optional_json(std::optional<std::string> const& value) -> nlohmann::json {
    if (!value) {
        return nullptr;
    }
    return *value;
}

[[nodiscard]] auto malformed(char const* key, char const* expected) -> Error {
    return Error{Error::Code::MalformedInput, std::string{"'"}.append(key).append("' must be ").append(expected)};
}

// Readers below return the fallback for absent members and MalformedInput for
// members of the wrong JSON type, so nothing in parsing throws.
[[nodiscard]] auto optional_from_json(nlohmann::json const& json, char const* key)
    -> Expected<std::optional<std::string>> {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(malformed(key, "a string or null"));
    }
    return std::optional<std::string>{it->get<std::string>()};
}

[[nodiscard]] auto string_from_json(nlohmann::json const& json, char const* key) -> Expected<std::string> {
    auto it = json.find(key);
    if (it == json.end()) {
        return std::string{};
    }
    if (!it->is_string()) {
        return std::unexpected(malformed(key, "a string"));
    }
    return it->get<std::string>();
}

template <typename T>
[[nodiscard]] auto unsigned_from_json(nlohmann::json const& json, char const* key, T fallback) -> Expected<T> {
    auto it = json.find(key);
    if (it == json.end()) {
        return fallback;
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(malformed(key, "an unsigned integer"));
    }
    return it->get<T>();
}

[[nodiscard]] auto bool_from_json(nlohmann::json const& json, char const* key, bool fallback) -> Expected<bool> {
    auto it = json.find(key);
    if (it == json.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        return std::unexpected(malformed(key, "a boolean"));
    }
    return it->get<bool>();
}

[[nodiscard]] auto snapshot_options_json(SnapshotOptions const& options) -> nlohmann::json {
    return nlohmann::json{
        {"max_depth", options.max_depth},
        {"max_children", options.max_children},
        {"include_widgets", options.include_widgets},
    };
}

[[nodiscard]] auto to_json(FieldSummary const& field) -> nlohmann::json {
    nlohmann::json result{
        {"name", field.name},
        {"partial_name", optional_json(field.partial_name)},
        {"field_type", optional_json(field.field_type)},
        {"flags", field.flags},
        {"kind", field.kind},
        {"widget_count", field.widget_count},
        {"child_count", field.child_count},
        {"children_truncated", field.children_truncated},
    };

    if (!field.children.empty()) {
        nlohmann::json children_json = nlohmann::json::array();
        for (auto const& child : field.children) {
            children_json.push_back(to_json(child));
        }
        result["children"] = std::move(children_json);
    }
    return result;
}

[[nodiscard]] auto field_from_json(nlohmann::json const& json) -> Expected<FieldSummary> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "field summary must be an object"});
    }

    auto name         = string_from_json(json, "name");
    auto partial_name = optional_from_json(json, "partial_name");
    auto field_type   = optional_from_json(json, "field_type");
    auto flags        = unsigned_from_json(json, "flags", std::uint32_t{0});
    auto kind         = string_from_json(json, "kind");
    auto widget_count = unsigned_from_json(json, "widget_count", std::size_t{0});
    auto child_count  = unsigned_from_json(json, "child_count", std::size_t{0});
    auto truncated    = bool_from_json(json, "children_truncated", false);
    if (!name) return std::unexpected(name.error());
    if (!partial_name) return std::unexpected(partial_name.error());
    if (!field_type) return std::unexpected(field_type.error());
    if (!flags) return std::unexpected(flags.error());
    if (!kind) return std::unexpected(kind.error());
    if (!widget_count) return std::unexpected(widget_count.error());
    if (!child_count) return std::unexpected(child_count.error());
    if (!truncated) return std::unexpected(truncated.error());

    FieldSummary field;
    field.name               = std::move(*name);
    field.partial_name       = std::move(*partial_name);
    field.field_type         = std::move(*field_type);
    field.flags              = *flags;
    field.kind               = std::move(*kind);
    field.widget_count       = *widget_count;
    field.child_count        = *child_count;
    field.children_truncated = *truncated;

    if (auto it = json.find("children"); it != json.end()) {
        if (!it->is_array()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "field summary children must be an array"});
        }
        field.children.reserve(it->size());
        for (auto const& child : *it) {
            auto parsed = field_from_json(child);
            if (!parsed) {
                return parsed;
            }
            field.children.push_back(std::move(*parsed));
        }
    }
    return field;
}

[[nodiscard]] auto parse_snapshot_json(nlohmann::json const& json) -> Expected<FieldTreeSnapshot> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "field tree snapshot must be an object"});
    }

    auto options_it = json.find("options");
    if (options_it == json.end() || !options_it->is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "field tree snapshot missing options"});
    }

    SnapshotOptions const defaults;
    auto max_depth       = unsigned_from_json(*options_it, "max_depth", defaults.max_depth);
    auto max_children    = unsigned_from_json(*options_it, "max_children", defaults.max_children);
    auto include_widgets = bool_from_json(*options_it, "include_widgets", defaults.include_widgets);
    if (!max_depth) return std::unexpected(max_depth.error());
    if (!max_children) return std::unexpected(max_children.error());
    if (!include_widgets) return std::unexpected(include_widgets.error());

    FieldTreeSnapshot snapshot;
    snapshot.options.max_depth       = *max_depth;
    snapshot.options.max_children    = *max_children;
    snapshot.options.include_widgets = *include_widgets;

    auto fields_it = json.find("fields");
    if (fields_it == json.end() || !fields_it->is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "field tree snapshot missing fields"});
    }
    snapshot.fields.reserve(fields_it->size());
    for (auto const& entry : *fields_it) {
        auto parsed = field_from_json(entry);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        snapshot.fields.push_back(std::move(*parsed));
    }

    if (auto diag_it = json.find("diagnostics"); diag_it != json.end()) {
        if (!diag_it->is_array()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "field tree diagnostics must be an array"});
        }
        for (auto const& entry : *diag_it) {
            if (!entry.is_string()) {
                return std::unexpected(Error{Error::Code::MalformedInput, "field tree diagnostics entries must be strings"});
            }
            snapshot.diagnostics.push_back(entry.get<std::string>());
        }
    }
    return snapshot;
}

} // namespace

auto BuildFieldTreeSnapshot(FormContext const& form, SnapshotOptions const& options)
    -> Expected<FieldTreeSnapshot> {
    SnapshotBuilder builder(form, options);
    auto            snapshot = builder.build();
    if (snapshot && !snapshot->diagnostics.empty()) {
        ft_log("Field tree snapshot finished with " + std::to_string(snapshot->diagnostics.size()) + " diagnostics", "FormContext");
    }
    return snapshot;
}

auto SerializeFieldTreeSnapshot(FieldTreeSnapshot const& snapshot, int indent) -> std::string {
    nlohmann::json fields = nlohmann::json::array();
    for (auto const& field : snapshot.fields) {
        fields.push_back(to_json(field));
    }
    nlohmann::json json{
        {"options", snapshot_options_json(snapshot.options)},
        {"fields", std::move(fields)},
        {"diagnostics", snapshot.diagnostics},
    };
    return json.dump(indent);
}

auto ParseFieldTreeSnapshot(std::string const& payload) -> Expected<FieldTreeSnapshot> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid field tree snapshot JSON"});
    }
    return parse_snapshot_json(json);
}

} // namespace FT::Inspector
