#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden
{
    enum class InputType
    {
        Command,
        Path,
        Content,
        Default
    };

    std::string to_string(InputType type);
    InputType input_type_from_string(std::string_view s);

    /** Maximum accepted input length for each input type. */
    std::size_t max_length(InputType type);

    struct Finding
    {
        std::string rule;    // stable identifier, e.g. "recursive_delete_root"
        std::string message; // human readable
        bool critical{false};
    };

    struct SanitizationResult
    {
        bool safe{true};
        std::vector<Finding> warnings;
        std::optional<std::string> blocked_reason;
    };

    /**
     * Pattern-based screening of text and shell-bound commands. Stateless
     * apart from its compiled rule tables, so one instance can be shared
     * across threads.
     *
     * Detection order: length, always-critical general rules (null byte,
     * ANSI escape, path traversal), command-critical rules, then the
     * shell-metacharacter category. The first blocking finding ends the scan.
     */
    class InputSanitizer
    {
    public:
        explicit InputSanitizer(bool strict_mode = false);

        SanitizationResult sanitize(std::string_view text, InputType type = InputType::Default) const;

        /**
         * Screen every string parameter of a tool call. The input type is
         * derived from the parameter name; the first block wins and is
         * prefixed with the parameter name.
         */
        SanitizationResult sanitize_tool_params(const std::string &tool, const nlohmann::json &params) const;

        bool strict_mode() const { return strict_mode_; }

    private:
        struct CommandRule
        {
            std::regex pattern;
            std::string rule;
        };

        bool strict_mode_;
        std::vector<CommandRule> command_rules_;
    };

} // namespace warden
