#include "protocol/tool_params.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace mcptools::protocol {

using nlohmann::json;

namespace {

constexpr long long kMaxLineNumber = std::numeric_limits<long long>::max() / 2;

std::string describe(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return "null";
        case json::value_t::boolean:
            return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return "integer";
        case json::value_t::number_float:
            return "number";
        case json::value_t::string:
            return "string";
        case json::value_t::array:
            return "array";
        case json::value_t::object:
            return "object";
        default:
            return "value";
    }
}

bool matches_type(const std::string& type, const json& value) {
    if (type == "string") {
        return value.is_string();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        return value.is_number_float() &&
               std::floor(value.get<double>()) == value.get<double>();
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "array") {
        return value.is_array();
    }
    if (type == "object") {
        return value.is_object();
    }
    return true;
}

std::optional<std::string> validate_value(const json& schema, const json& value,
                                          const std::string& where) {
    if (!schema.is_object()) {
        return std::nullopt;
    }

    const auto type_it = schema.find("type");
    if (type_it != schema.end() && type_it->is_string()) {
        const auto type = type_it->get<std::string>();
        if (!matches_type(type, value)) {
            return where + " must be " + type + ", got " + describe(value);
        }
    }

    const auto enum_it = schema.find("enum");
    if (enum_it != schema.end() && enum_it->is_array()) {
        if (std::find(enum_it->begin(), enum_it->end(), value) == enum_it->end()) {
            return where + " must be one of " + enum_it->dump();
        }
    }

    if (value.is_array()) {
        const auto items_it = schema.find("items");
        if (items_it != schema.end()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                auto problem = validate_value(*items_it, value[i],
                                              where + "[" + std::to_string(i) + "]");
                if (problem) {
                    return problem;
                }
            }
        }
        return std::nullopt;
    }

    if (!value.is_object()) {
        return std::nullopt;
    }

    const json properties = schema.value("properties", json::object());
    const auto required_it = schema.find("required");
    if (required_it != schema.end() && required_it->is_array()) {
        for (const auto& name : *required_it) {
            if (name.is_string() && !value.contains(name.get<std::string>())) {
                return "missing required parameter '" + name.get<std::string>() + "'";
            }
        }
    }

    const auto extra_it = schema.find("additionalProperties");
    const bool allow_extra = extra_it == schema.end() || !extra_it->is_boolean() ||
                             extra_it->get<bool>();
    for (const auto& [key, item] : value.items()) {
        const auto property_it = properties.find(key);
        if (property_it == properties.end()) {
            if (!allow_extra) {
                return "unknown parameter '" + key + "'";
            }
            continue;
        }
        auto problem = validate_value(*property_it, item, "'" + key + "'");
        if (problem) {
            return problem;
        }
    }

    return std::nullopt;
}

std::optional<double> number_field(const json& arguments, const char* key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::optional<std::string> string_field(const json& arguments, const char* key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Truthy string: present and not empty.
std::optional<std::string> non_empty_string_field(const json& arguments, const char* key) {
    auto value = string_field(arguments, key);
    if (value.has_value() && value->empty()) {
        return std::nullopt;
    }
    return value;
}

long long clamp_number(const std::optional<double> value, const long long fallback,
                       const long long low, const long long high) {
    if (!value.has_value() || !std::isfinite(value.value())) {
        return fallback;
    }
    const double clamped = std::min(static_cast<double>(high),
                                    std::max(static_cast<double>(low), value.value()));
    return static_cast<long long>(std::floor(clamped));
}

}  // namespace

std::optional<std::string> validate_arguments(const json& schema, const json& arguments) {
    if (!arguments.is_object()) {
        return "arguments must be an object, got " + describe(arguments);
    }
    return validate_value(schema, arguments, "arguments");
}

NoParams decode_no_params(const json&) {
    return NoParams{};
}

SearchQueryParams decode_search_query(const json& arguments) {
    SearchQueryParams params;
    if (auto q = string_field(arguments, "q")) {
        params.query = *q;
    } else if (auto query = string_field(arguments, "query")) {
        params.query = *query;
    }

    auto count = number_field(arguments, "num");
    if (!count.has_value()) {
        count = number_field(arguments, "max_results");
    }
    params.num = static_cast<int>(clamp_number(count, 5, 1, 10));

    params.site = non_empty_string_field(arguments, "site");
    params.date_restrict = non_empty_string_field(arguments, "dateRestrict");
    if (auto engine = non_empty_string_field(arguments, "engine")) {
        std::string lowered = *engine;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        params.engine = lowered == "google" ? "google_cse" : lowered;
    }
    return params;
}

CodeSearchParams decode_code_search(const json& arguments) {
    CodeSearchParams params;
    params.query = string_field(arguments, "q").value_or("");
    if (arguments.contains("globs") && arguments["globs"].is_array()) {
        for (const auto& glob : arguments["globs"]) {
            if (glob.is_string() && !glob.get<std::string>().empty()) {
                params.globs.push_back(glob.get<std::string>());
            }
        }
    }
    params.max_results = static_cast<std::size_t>(
        clamp_number(number_field(arguments, "max_results"), 50, 1, 500));
    params.context =
        static_cast<int>(clamp_number(number_field(arguments, "context"), 1, 0, 10));
    return params;
}

CodeReadParams decode_code_read(const json& arguments) {
    CodeReadParams params;
    params.path = string_field(arguments, "path").value_or("");

    // Line numbers below 1 read from line 1; huge ones read to end of file.
    const auto start = number_field(arguments, "start");
    if (start.has_value() && start.value() != 0) {
        params.start = clamp_number(start, 1, 1, kMaxLineNumber);
    }
    const auto end = number_field(arguments, "end");
    if (end.has_value() && end.value() != 0) {
        params.end = clamp_number(end, 1, 1, kMaxLineNumber);
    }

    params.max_bytes = static_cast<std::size_t>(clamp_number(
        number_field(arguments, "max_bytes"), 64 * 1024, 1024, 2 * 1024 * 1024));
    return params;
}

BuildTargetParams decode_build_target(const json& arguments, const std::string& key) {
    BuildTargetParams params;
    params.target = string_field(arguments, key.c_str()).value_or("");
    const auto first = params.target.find_first_not_of(" \t\r\n");
    const auto last = params.target.find_last_not_of(" \t\r\n");
    params.target = first == std::string::npos
                        ? std::string()
                        : params.target.substr(first, last - first + 1);
    return params;
}

GitDiffParams decode_git_diff(const json& arguments) {
    GitDiffParams params;
    const auto it = arguments.find("staged");
    params.staged = it != arguments.end() && it->is_boolean() && it->get<bool>();
    return params;
}

TodoFileParams decode_todo_file(const json& arguments) {
    return TodoFileParams{string_field(arguments, "path").value_or("")};
}

TodoUpdateParams decode_todo_update(const json& arguments) {
    TodoUpdateParams params;
    params.path = string_field(arguments, "path").value_or("");
    params.header = string_field(arguments, "header");
    if (arguments.contains("updates") && arguments["updates"].is_array()) {
        for (const auto& update : arguments["updates"]) {
            TodoUpdate entry;
            entry.title = update.value("title", std::string());
            entry.done = update.value("done", false);
            params.updates.push_back(std::move(entry));
        }
    }
    return params;
}

TodoNextParams decode_todo_next(const json& arguments) {
    TodoNextParams params;
    params.path = string_field(arguments, "path").value_or("");
    params.limit = static_cast<std::size_t>(
        clamp_number(number_field(arguments, "limit"), 5, 1, 50));
    return params;
}

}  // namespace mcptools::protocol
