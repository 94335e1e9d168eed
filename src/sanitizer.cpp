#include "warden/sanitizer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace warden
{
    namespace
    {
        constexpr std::size_t kCommandMaxLength = 10'000;
        constexpr std::size_t kPathMaxLength = 4'096;
        constexpr std::size_t kContentMaxLength = 1'000'000;
        constexpr std::size_t kDefaultMaxLength = 50'000;

        constexpr std::array<std::string_view, 4> kSensitivePaths{
            "/etc/passwd", "/etc/shadow", "/dev/", "~root"};

        constexpr std::array<std::string_view, 4> kPathParams{
            "path", "file_path", "working_dir", "directory"};

        // Command rules in detection order. Every match is blocking.
        const std::array<std::pair<const char *, const char *>, 10> kCommandPatterns{{
            {R"(\brm\s+(?:-[a-z-]+\s+)*-[a-z]*r[a-z]*\s+(?:-[a-z-]+\s+)*(?:/|/\*|~|~/)(?:\s|;|&|\||$))", "recursive_delete_root"},
            {R"((?:^|[\s;&|(`])(?:sudo|doas|su|pkexec)(?=\s|$))", "privilege_escalation"},
            {R"(\bchmod\s+(?:-[a-z]+\s+)*(?:0?777|[ugo]*[oa][ugo]*\+[rx]*w))", "insecure_permissions"},
            {R"(\b(?:curl|wget)\b.*\|\s*(?:sudo\s+)?(?:ba|z|da|k)?sh\b)", "pipe_to_shell"},
            {R"(>\s*/dev/(?:sd|hd|vd|xvd|nvme|mmcblk|disk))", "direct_disk_write"},
            {R"(\bdd\b.*\bof=/dev/)", "dd_disk_write"},
            {R"(\bmkfs(?:\.\w+)?\b)", "filesystem_format"},
            {R"((\w+|:)\s*\(\)\s*\{[^}]*\1\s*\|\s*\1\s*&[^}]*\}\s*;\s*\1)", "fork_bomb"},
            {R"(:\(\)\s*\{.*\};\s*:)", "fork_bomb"},
            {R"(\b(?:shutdown|reboot|poweroff|halt|init\s+[06])\b)", "system_power"},
        }};

        std::string lowercase(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool has_command_substitution(std::string_view text)
        {
            auto open = text.find("$(");
            while (open != std::string_view::npos)
            {
                auto close = text.find(')', open + 2);
                if (close == std::string_view::npos)
                    return false;
                if (close > open + 2)
                    return true;
                open = text.find("$(", open + 2);
            }
            return false;
        }

        bool has_backtick_execution(std::string_view text)
        {
            auto open = text.find('`');
            while (open != std::string_view::npos)
            {
                auto close = text.find('`', open + 1);
                if (close == std::string_view::npos)
                    return false;
                if (close > open + 1)
                    return true;
                open = close;
            }
            return false;
        }

        Finding warning(std::string rule)
        {
            auto message = std::format("Detected potentially dangerous pattern: {}", rule);
            return Finding{std::move(rule), std::move(message), false};
        }

        SanitizationResult block(SanitizationResult result, Finding finding)
        {
            finding.critical = true;
            result.safe = false;
            result.blocked_reason = finding.message;
            result.warnings.push_back(std::move(finding));
            return result;
        }
    } // namespace

    std::string to_string(InputType type)
    {
        switch (type)
        {
        case InputType::Command:
            return "command";
        case InputType::Path:
            return "path";
        case InputType::Content:
            return "content";
        case InputType::Default:
            return "default";
        }
        return "default";
    }

    InputType input_type_from_string(std::string_view s)
    {
        if (s == "command")
            return InputType::Command;
        if (s == "path")
            return InputType::Path;
        if (s == "content")
            return InputType::Content;
        return InputType::Default;
    }

    std::size_t max_length(InputType type)
    {
        switch (type)
        {
        case InputType::Command:
            return kCommandMaxLength;
        case InputType::Path:
            return kPathMaxLength;
        case InputType::Content:
            return kContentMaxLength;
        case InputType::Default:
            return kDefaultMaxLength;
        }
        return kDefaultMaxLength;
    }

    InputSanitizer::InputSanitizer(bool strict_mode) : strict_mode_(strict_mode)
    {
        command_rules_.reserve(kCommandPatterns.size());
        for (const auto &[pattern, rule] : kCommandPatterns)
        {
            command_rules_.push_back({std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
                                      rule});
        }
    }

    SanitizationResult InputSanitizer::sanitize(std::string_view text, InputType type) const
    {
        SanitizationResult result;

        const auto limit = max_length(type);
        if (text.size() > limit)
        {
            return block(std::move(result),
                         {"length_exceeded",
                          std::format("Input length exceeded ({} > {})", text.size(), limit)});
        }

        // Always critical, regardless of input type or mode
        if (text.find('\0') != std::string_view::npos)
            return block(std::move(result), {"null_byte", "Input contains null bytes"});
        if (text.find("\x1b[") != std::string_view::npos)
            return block(std::move(result), {"ansi_escape", "Input contains ANSI escape sequences"});
        if (text.find("../") != std::string_view::npos || text.find("..\\") != std::string_view::npos)
            return block(std::move(result), {"path_traversal", "Input contains path traversal sequence (../)"});

        if (type == InputType::Command)
        {
            const std::string subject(text);
            for (const auto &cmd : command_rules_)
            {
                if (std::regex_search(subject, cmd.pattern))
                {
                    return block(std::move(result),
                                 {cmd.rule, std::format("Blocked dangerous command pattern: {}", cmd.rule)});
                }
            }
        }

        // General category, most specific first
        std::vector<Finding> general;
        if (has_command_substitution(text))
            general.push_back(warning("command_substitution"));
        if (has_backtick_execution(text))
            general.push_back(warning("backtick_execution"));
        if (text.find_first_of(";&|`$") != std::string_view::npos)
            general.push_back(warning("shell_metachar"));

        if (type == InputType::Path)
        {
            auto lowered = lowercase(text);
            for (auto sensitive : kSensitivePaths)
            {
                if (lowered.find(sensitive) != std::string::npos)
                {
                    general.push_back({"sensitive_path",
                                       std::format("Path references sensitive location: {}", sensitive),
                                       false});
                }
            }
        }

        for (auto &finding : general)
        {
            const bool shell_category = finding.rule != "sensitive_path";
            if (strict_mode_ || (type == InputType::Command && shell_category))
                return block(std::move(result), std::move(finding));
            result.warnings.push_back(std::move(finding));
        }
        return result;
    }

    SanitizationResult InputSanitizer::sanitize_tool_params(const std::string &tool, const nlohmann::json &params) const
    {
        SanitizationResult merged;

        auto type_for = [&](const std::string &key)
        {
            if (tool == "exec" && key == "command")
                return InputType::Command;
            if (std::find(kPathParams.begin(), kPathParams.end(), key) != kPathParams.end())
                return InputType::Path;
            if (key == "content")
                return InputType::Content;
            return InputType::Default;
        };

        if (params.is_string())
        {
            merged = sanitize(params.get_ref<const std::string &>());
        }
        else if (params.is_object())
        {
            for (auto it = params.begin(); it != params.end(); ++it)
            {
                if (!it.value().is_string())
                    continue;

                auto r = sanitize(it.value().get_ref<const std::string &>(), type_for(it.key()));
                for (auto &w : r.warnings)
                    merged.warnings.push_back(std::move(w));
                if (!r.safe)
                {
                    merged.safe = false;
                    merged.blocked_reason = std::format("Parameter '{}': {}", it.key(), *r.blocked_reason);
                    break;
                }
            }
        }

        if (!merged.warnings.empty())
        {
            std::string rules;
            for (const auto &w : merged.warnings)
            {
                if (!rules.empty())
                    rules += ", ";
                rules += w.rule;
            }
            spdlog::warn("Sanitization warnings for {}: [{}]", tool, rules);
        }
        return merged;
    }

} // namespace warden
