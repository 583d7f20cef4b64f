// SPDX-License-Identifier: Apache-2.0
#include "ToolCallParser.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace toolbridge
{

namespace
{

    struct TagPair
    {
        std::string_view open;
        std::string_view close;
    };

    constexpr auto ToolCallTags = std::array {
        TagPair { .open = "<tool_call>", .close = "</tool_call>" },
        TagPair { .open = "<function_call>", .close = "</function_call>" },
        TagPair { .open = "<tool>", .close = "</tool>" },
    };

    constexpr auto EnvelopeKeys = std::array<std::string_view, 3> { "tool_call", "function_call", "tool" };

    constexpr auto ArgumentKeys = std::array<std::string_view, 3> { "arguments", "args", "params" };

    // Identifiers that precede "({" in ordinary code rather than in tool calls.
    constexpr auto KeywordDenylist = std::array<std::string_view, 8> {
        "if", "while", "for", "function", "return", "var", "let", "const",
    };

    constexpr auto Fence = std::string_view { "```" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    auto isIdentifierStart(char c) -> bool
    {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    auto isIdentifierChar(char c) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    auto isPlausibleToolName(std::string_view name) -> bool
    {
        return !name.empty() && std::ranges::all_of(name, [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        });
    }

    auto skipWhitespace(std::string_view text, size_t pos) -> size_t
    {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        return pos;
    }

    /// Builds a tool call from a parsed object. A present but non-object argument map rejects the call.
    auto toolCallFromJson(const nlohmann::json& value) -> std::optional<ToolCall>
    {
        if (!value.is_object())
            return std::nullopt;

        auto const nameIt = value.find("name");
        if (nameIt == value.end() || !nameIt->is_string())
            return std::nullopt;

        auto call = ToolCall { .name = nameIt->get<std::string>(), .arguments = nlohmann::json::object() };
        if (call.name.empty())
            return std::nullopt;

        for (auto const key: ArgumentKeys)
        {
            auto const it = value.find(key);
            if (it == value.end() || it->is_null())
                continue;
            if (!it->is_object())
                return std::nullopt;
            call.arguments = *it;
            break;
        }

        return call;
    }

    auto stripCodeFence(std::string_view text) -> std::string_view
    {
        text = trim(text);
        if (!text.starts_with(Fence))
            return text;

        text.remove_prefix(Fence.size());
        if (text.starts_with("json"))
            text.remove_prefix(4);
        if (text.ends_with(Fence))
            text.remove_suffix(Fence.size());
        return trim(text);
    }

    auto parseTagDelimited(std::string_view text) -> ParsedResponse
    {
        auto parsed = ParsedResponse {};
        auto remaining = text;
        auto foundTag = false;

        while (!remaining.empty())
        {
            auto start = std::string_view::npos;
            auto const* tag = static_cast<const TagPair*>(nullptr);
            for (const auto& candidate: ToolCallTags)
            {
                auto const pos = remaining.find(candidate.open);
                if (pos < start)
                {
                    start = pos;
                    tag = &candidate;
                }
            }
            if (!tag)
                break;

            if (!foundTag)
                parsed.prefixText.append(remaining.substr(0, start));
            else
                parsed.suffixText.append(remaining.substr(0, start));
            foundTag = true;

            auto const bodyStart = start + tag->open.size();
            auto const end = remaining.find(tag->close, bodyStart);
            if (end == std::string_view::npos)
            {
                // Unclosed tag: the rest is plain text.
                parsed.suffixText.append(remaining.substr(start));
                remaining = {};
                break;
            }

            if (auto call = parseToolCallBody(remaining.substr(bodyStart, end - bodyStart)))
                parsed.toolCalls.push_back(std::move(*call));

            remaining.remove_prefix(end + tag->close.size());
        }

        if (!foundTag)
            return {};

        parsed.suffixText.append(remaining);
        parsed.format = ToolCallFormat::TagDelimited;
        return parsed;
    }

    /// Collects calls matched at [begin, end) ranges, keeping prefix before the first and suffix after the last.
    class MatchCollector
    {
      public:
        explicit MatchCollector(std::string_view text, ToolCallFormat format): _text(text), _format(format) {}

        void add(ToolCall call, size_t begin, size_t end)
        {
            if (_calls.empty())
                _prefixEnd = begin;
            _calls.push_back(std::move(call));
            _lastEnd = end;
        }

        [[nodiscard]] auto finish() && -> ParsedResponse
        {
            if (_calls.empty())
                return {};
            return ParsedResponse {
                .prefixText = std::string(_text.substr(0, _prefixEnd)),
                .toolCalls = std::move(_calls),
                .suffixText = std::string(_text.substr(_lastEnd)),
                .format = _format,
            };
        }

      private:
        std::string_view _text;
        ToolCallFormat _format;
        std::vector<ToolCall> _calls;
        size_t _prefixEnd = 0;
        size_t _lastEnd = 0;
    };

    auto parseFencedBlocks(std::string_view text) -> ParsedResponse
    {
        auto matches = MatchCollector { text, ToolCallFormat::FencedCodeBlock };

        auto pos = text.find(Fence);
        while (pos != std::string_view::npos)
        {
            auto contentStart = pos + Fence.size();
            if (text.substr(contentStart).starts_with("json"))
                contentStart += 4;

            auto const end = text.find(Fence, contentStart);
            if (end == std::string_view::npos)
                break;

            auto const content = trim(text.substr(contentStart, end - contentStart));
            auto const matchEnd = end + Fence.size();

            if (auto call = parseToolCallBody(content))
            {
                matches.add(std::move(*call), pos, matchEnd);
            }
            else if (auto const envelope = json::tryParse(content); envelope && envelope->is_object())
            {
                for (auto const key: EnvelopeKeys)
                {
                    auto const it = envelope->find(key);
                    if (it == envelope->end())
                        continue;
                    if (auto inner = toolCallFromJson(*it))
                        matches.add(std::move(*inner), pos, matchEnd);
                    break;
                }
            }

            pos = text.find(Fence, matchEnd);
        }

        return std::move(matches).finish();
    }

    auto parseFunctionSyntax(std::string_view text) -> ParsedResponse
    {
        auto matches = MatchCollector { text, ToolCallFormat::FunctionSyntax };

        auto i = size_t { 0 };
        while (i < text.size())
        {
            if (!isIdentifierStart(text[i]) || (i > 0 && isIdentifierChar(text[i - 1])))
            {
                ++i;
                continue;
            }

            auto const nameBegin = i;
            auto nameEnd = i;
            while (nameEnd < text.size() && isIdentifierChar(text[nameEnd]))
                ++nameEnd;
            auto const name = text.substr(nameBegin, nameEnd - nameBegin);
            i = nameEnd;

            auto pos = skipWhitespace(text, nameEnd);
            if (pos >= text.size() || text[pos] != '(')
                continue;
            pos = skipWhitespace(text, pos + 1);
            if (pos >= text.size() || text[pos] != '{')
                continue;

            auto const object = findBalancedObject(text, pos);
            if (!object)
                continue;
            pos = skipWhitespace(text, object->second);
            if (pos >= text.size() || text[pos] != ')')
                continue;

            if (std::ranges::find(KeywordDenylist, name) != KeywordDenylist.end())
                continue;

            auto arguments = json::tryParse(text.substr(object->first, object->second - object->first));
            if (!arguments || !arguments->is_object())
                continue;

            matches.add(ToolCall { .name = std::string(name), .arguments = std::move(*arguments) }, nameBegin, pos + 1);
            i = pos + 1;
        }

        return std::move(matches).finish();
    }

    auto parseBareJson(std::string_view text) -> ParsedResponse
    {
        auto matches = MatchCollector { text, ToolCallFormat::BareJson };

        auto pos = size_t { 0 };
        while (auto const object = findBalancedObject(text, pos))
        {
            auto const [begin, end] = *object;
            auto const candidate = text.substr(begin, end - begin);

            if (candidate.find("\"name\"") != std::string_view::npos)
            {
                if (auto const value = json::tryParse(candidate))
                {
                    auto call = toolCallFromJson(*value);
                    if (call && isPlausibleToolName(call->name))
                        matches.add(std::move(*call), begin, end);
                }
            }

            pos = end;
        }

        return std::move(matches).finish();
    }

} // namespace

auto toolCallFormatName(ToolCallFormat format) -> std::string_view
{
    switch (format)
    {
        case ToolCallFormat::TagDelimited: return "tag-delimited";
        case ToolCallFormat::FencedCodeBlock: return "fenced-code-block";
        case ToolCallFormat::FunctionSyntax: return "function-syntax";
        case ToolCallFormat::BareJson: return "bare-json";
    }
    return "unknown";
}

auto ParsedResponse::textOnly() const -> std::string
{
    auto result = std::string(trim(prefixText));
    auto const suffix = trim(suffixText);
    if (!suffix.empty())
    {
        if (!result.empty())
            result += ' ';
        result += suffix;
    }
    return result;
}

auto findBalancedObject(std::string_view text, size_t from) -> std::optional<std::pair<size_t, size_t>>
{
    auto begin = text.find('{', from);
    while (begin != std::string_view::npos)
    {
        auto depth = 0;
        auto inString = false;
        auto escaped = false;

        for (auto i = begin; i < text.size(); ++i)
        {
            auto const c = text[i];
            if (escaped)
                escaped = false;
            else if (c == '\\' && inString)
                escaped = true;
            else if (c == '"')
                inString = !inString;
            else if (!inString && c == '{')
                ++depth;
            else if (!inString && c == '}' && --depth == 0)
                return std::pair { begin, i + 1 };
        }

        // Unbalanced from here; an inner opening brace may still close.
        begin = text.find('{', begin + 1);
    }
    return std::nullopt;
}

auto parseToolCallBody(std::string_view body) -> std::optional<ToolCall>
{
    auto const cleaned = trim(body);

    if (auto const value = json::tryParse(cleaned))
    {
        if (auto call = toolCallFromJson(*value))
            return call;
    }

    auto const unfenced = stripCodeFence(cleaned);
    if (unfenced.size() != cleaned.size())
    {
        if (auto const value = json::tryParse(unfenced))
        {
            if (auto call = toolCallFromJson(*value))
                return call;
        }
    }

    if (auto const object = findBalancedObject(cleaned))
    {
        if (auto const value = json::tryParse(cleaned.substr(object->first, object->second - object->first)))
            return toolCallFromJson(*value);
    }

    return std::nullopt;
}

auto parseToolCalls(std::string_view text) -> ParsedResponse
{
    using Strategy = ParsedResponse (*)(std::string_view);
    constexpr auto Strategies = std::array<Strategy, 4> {
        parseTagDelimited,
        parseFencedBlocks,
        parseFunctionSyntax,
        parseBareJson,
    };

    for (auto const strategy: Strategies)
    {
        auto parsed = strategy(text);
        if (parsed.hasToolCalls())
            return parsed;
    }

    return ParsedResponse {
        .prefixText = std::string(text),
        .toolCalls = {},
        .suffixText = {},
        .format = std::nullopt,
    };
}

} // namespace toolbridge
