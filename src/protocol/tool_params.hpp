#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcptools::protocol {

    // One parameter record per tool. Records are produced only after the raw
    // arguments passed schema validation, so decoders apply defaults,
    // aliases and clamping but never fail.

    struct NoParams {};

    struct SearchQueryParams {
        std::string query;              // from `q`, alias `query`
        int num = 5;                    // from `num`, alias `max_results`; [1, 10]
        std::optional<std::string> site;
        std::optional<std::string> engine;
        std::optional<std::string> date_restrict;
    };

    struct CodeSearchParams {
        std::string query;
        std::vector<std::string> globs;
        std::size_t max_results = 50;   // [1, 500]
        int context = 1;                // [0, 10]
    };

    struct CodeReadParams {
        std::string path;
        std::optional<long long> start;
        std::optional<long long> end;
        std::size_t max_bytes = 64 * 1024;  // [1 KiB, 2 MiB]
    };

    // build.run target or test.run filter; appended to the dispatched command.
    struct BuildTargetParams {
        std::string target;
    };

    struct GitDiffParams {
        bool staged = false;
    };

    struct TodoFileParams {
        std::string path;
    };

    struct TodoUpdate {
        std::string title;
        bool done = false;
    };

    struct TodoUpdateParams {
        std::string path;
        std::vector<TodoUpdate> updates;
        std::optional<std::string> header;
    };

    struct TodoNextParams {
        std::string path;
        std::size_t limit = 5;          // [1, 50]
    };

    using ToolParams = std::variant<
        NoParams,
        SearchQueryParams,
        CodeSearchParams,
        CodeReadParams,
        BuildTargetParams,
        GitDiffParams,
        TodoFileParams,
        TodoUpdateParams,
        TodoNextParams
    >;

    // Checks arguments against the JSON-Schema subset used by tool descriptors
    // (type, properties, required, additionalProperties, items, enum).
    // Returns a description of the first violation, or nullopt.
    std::optional<std::string> validate_arguments(const nlohmann::json& schema,
                                                  const nlohmann::json& arguments);

    NoParams decode_no_params(const nlohmann::json& arguments);
    SearchQueryParams decode_search_query(const nlohmann::json& arguments);
    CodeSearchParams decode_code_search(const nlohmann::json& arguments);
    CodeReadParams decode_code_read(const nlohmann::json& arguments);
    BuildTargetParams decode_build_target(const nlohmann::json& arguments,
                                          const std::string& key);
    GitDiffParams decode_git_diff(const nlohmann::json& arguments);
    TodoFileParams decode_todo_file(const nlohmann::json& arguments);
    TodoUpdateParams decode_todo_update(const nlohmann::json& arguments);
    TodoNextParams decode_todo_next(const nlohmann::json& arguments);

} // namespace mcptools::protocol
