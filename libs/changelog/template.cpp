/**
 * @file template.cpp
 * @brief Jinja-subset template engine used for changelog rendering
 */

#include "semverpp/changelog.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <format>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semverpp::changelog {

namespace {

enum class TokenKind { kText, kOutput, kBlock };

struct Token
{
    TokenKind kind;
    std::string content;
    std::size_t line;
};

struct Expression
{
    bool negate = false;
    std::optional<std::string> literal;
    std::vector<std::string> path;
};

struct Node
{
    enum class Kind { kText, kOutput, kFor, kIf };

    Kind kind = Kind::kText;
    std::string text;
    Expression expr;
    std::vector<std::string> loop_vars;
    std::vector<Node> body;
    std::vector<Node> else_body;
};

using NodeList = std::vector<Node>;

[[nodiscard]] semverpp::Error template_error(std::size_t line, std::string_view message)
{
    return Error::make(std::string(error_code::kTemplateError),
                       std::format("Template error at line {}: {}", line, message));
}

[[nodiscard]] bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::string_view trim(std::string_view input)
{
    while (!input.empty() && is_space(input.front())) {
        input.remove_prefix(1);
    }
    while (!input.empty() && is_space(input.back())) {
        input.remove_suffix(1);
    }
    return input;
}

[[nodiscard]] bool is_identifier(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    return std::ranges::all_of(text, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

[[nodiscard]] std::vector<std::string> split_words(std::string_view text)
{
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && is_space(text[pos])) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < text.size() && !is_space(text[pos])) {
            ++pos;
        }
        if (pos > start) {
            words.emplace_back(text.substr(start, pos - start));
        }
    }
    return words;
}

// ============================================================================
// Lexer
// ============================================================================

[[nodiscard]] semverpp::Result<std::vector<Token>> tokenize(std::string_view source)
{
    std::vector<Token> tokens;
    std::size_t pos = 0;
    std::size_t line = 1;
    bool strip_next_text = false;

    while (pos <= source.size()) {
        std::size_t open = source.find('{', pos);
        while (open != std::string_view::npos) {
            if (open + 1 >= source.size()) {
                open = std::string_view::npos;
                break;
            }
            const char next = source[open + 1];
            if (next == '{' || next == '%' || next == '#') {
                break;
            }
            open = source.find('{', open + 1);
        }

        const std::size_t text_end = open == std::string_view::npos ? source.size() : open;
        std::string text(source.substr(pos, text_end - pos));
        if (strip_next_text) {
            text.erase(0, std::min(text.size(), text.find_first_not_of(" \t\r\n")));
            strip_next_text = false;
        }

        if (open == std::string_view::npos) {
            if (!text.empty()) {
                tokens.push_back(
                    Token{.kind = TokenKind::kText, .content = std::move(text), .line = line});
            }
            break;
        }

        const char opener = source[open + 1];
        const std::string_view closer = opener == '{' ? "}}" : (opener == '%' ? "%}" : "#}");
        std::size_t inner_start = open + 2;
        if (inner_start < source.size() && source[inner_start] == '-') {
            const auto last = text.find_last_not_of(" \t\r\n");
            text.erase(last == std::string::npos ? 0 : last + 1);
            ++inner_start;
        }
        if (!text.empty()) {
            tokens.push_back(Token{.kind = TokenKind::kText, .content = text, .line = line});
        }
        line += static_cast<std::size_t>(std::ranges::count(source.substr(pos, open - pos), '\n'));

        const std::size_t close = source.find(closer, inner_start);
        if (close == std::string_view::npos) {
            return std::unexpected(template_error(line, "unterminated tag"));
        }
        std::string_view inner = source.substr(inner_start, close - inner_start);
        if (!inner.empty() && inner.back() == '-') {
            inner.remove_suffix(1);
            strip_next_text = true;
        }
        const std::size_t tag_line = line;
        line += static_cast<std::size_t>(std::ranges::count(source.substr(open, close - open), '\n'));
        pos = close + 2;

        if (opener != '{' && !strip_next_text) {
            // trim_blocks: drop the first newline after a block or comment tag.
            if (source.substr(pos).starts_with("\r\n")) {
                pos += 2;
                ++line;
            } else if (source.substr(pos).starts_with('\n')) {
                pos += 1;
                ++line;
            }
        }

        if (opener == '#') {
            continue;
        }
        tokens.push_back(Token{.kind = opener == '{' ? TokenKind::kOutput : TokenKind::kBlock,
                               .content = std::string(trim(inner)),
                               .line = tag_line});
    }
    return tokens;
}

// ============================================================================
// Parser
// ============================================================================

[[nodiscard]] semverpp::Result<Expression> parse_expression(std::string_view text, std::size_t line)
{
    Expression expr;
    text = trim(text);
    if (text.starts_with("not ")) {
        expr.negate = true;
        text = trim(text.substr(4));
    }
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'')
        && text.find(text.front(), 1) == text.size() - 1) {
        expr.literal = std::string(text.substr(1, text.size() - 2));
        return expr;
    }
    for (auto part : text | std::views::split('.')) {
        std::string_view segment(part.begin(), part.end());
        if (!is_identifier(segment)) {
            return std::unexpected(
                template_error(line, std::format("invalid expression '{}'", text)));
        }
        expr.path.emplace_back(segment);
    }
    if (expr.path.empty()) {
        return std::unexpected(template_error(line, "empty expression"));
    }
    return expr;
}

class Parser
{
public:
    explicit Parser(const std::vector<Token>& tokens)
        : m_tokens(tokens)
    {}

    [[nodiscard]] semverpp::Result<NodeList> parse()
    {
        auto nodes = parse_until({});
        if (!nodes) {
            return std::unexpected(nodes.error());
        }
        if (m_index < m_tokens.size()) {
            const Token& token = m_tokens[m_index];
            return std::unexpected(
                template_error(token.line, std::format("unexpected '{}'", token.content)));
        }
        return nodes;
    }

private:
    const std::vector<Token>& m_tokens;
    std::size_t m_index = 0;

    [[nodiscard]] static std::string keyword(const Token& token)
    {
        auto words = split_words(token.content);
        return words.empty() ? std::string{} : words.front();
    }

    /// Parse nodes until a block tag whose keyword is in `stop` (left unconsumed).
    [[nodiscard]] semverpp::Result<NodeList> parse_until(std::initializer_list<std::string_view> stop)
    {
        NodeList nodes;
        while (m_index < m_tokens.size()) {
            const Token& token = m_tokens[m_index];
            if (token.kind == TokenKind::kText) {
                nodes.push_back(Node{.kind = Node::Kind::kText, .text = token.content});
                ++m_index;
                continue;
            }
            if (token.kind == TokenKind::kOutput) {
                auto expr = parse_expression(token.content, token.line);
                if (!expr) {
                    return std::unexpected(expr.error());
                }
                nodes.push_back(Node{.kind = Node::Kind::kOutput, .expr = std::move(*expr)});
                ++m_index;
                continue;
            }

            const std::string word = keyword(token);
            if (std::ranges::find(stop, std::string_view(word)) != stop.end()) {
                return nodes;
            }
            if (word != "for" && word != "if") {
                return std::unexpected(
                    template_error(token.line, std::format("unexpected tag '{}'", token.content)));
            }
            auto node = word == "for" ? parse_for() : parse_if();
            if (!node) {
                return std::unexpected(node.error());
            }
            nodes.push_back(std::move(*node));
        }
        return nodes;
    }

    [[nodiscard]] semverpp::Result<Node> parse_for()
    {
        const Token& token = m_tokens[m_index++];
        // "for a[, b] in expr"
        std::string_view header = trim(std::string_view(token.content).substr(3));
        const std::size_t in_pos = header.find(" in ");
        if (in_pos == std::string_view::npos) {
            return std::unexpected(template_error(token.line, "expected 'for <name> in <expr>'"));
        }

        Node node{.kind = Node::Kind::kFor};
        for (auto part : header.substr(0, in_pos) | std::views::split(',')) {
            std::string_view name = trim(std::string_view(part.begin(), part.end()));
            if (!is_identifier(name)) {
                return std::unexpected(
                    template_error(token.line, std::format("invalid loop variable '{}'", name)));
            }
            node.loop_vars.emplace_back(name);
        }
        if (node.loop_vars.empty() || node.loop_vars.size() > 2) {
            return std::unexpected(template_error(token.line, "expected one or two loop variables"));
        }
        auto expr = parse_expression(header.substr(in_pos + 4), token.line);
        if (!expr) {
            return std::unexpected(expr.error());
        }
        node.expr = std::move(*expr);

        auto body = parse_until({"endfor", "else"});
        if (!body) {
            return std::unexpected(body.error());
        }
        node.body = std::move(*body);
        if (m_index < m_tokens.size() && keyword(m_tokens[m_index]) == "else") {
            ++m_index;
            auto else_body = parse_until({"endfor"});
            if (!else_body) {
                return std::unexpected(else_body.error());
            }
            node.else_body = std::move(*else_body);
        }
        if (m_index >= m_tokens.size()) {
            return std::unexpected(template_error(token.line, "missing {% endfor %}"));
        }
        ++m_index;
        return node;
    }

    [[nodiscard]] semverpp::Result<Node> parse_if()
    {
        const Token& token = m_tokens[m_index++];
        const std::size_t skip = keyword(token).size();
        return parse_if_chain(std::string_view(token.content).substr(skip), token.line);
    }

    [[nodiscard]] semverpp::Result<Node> parse_if_chain(std::string_view condition, std::size_t line)
    {
        auto expr = parse_expression(condition, line);
        if (!expr) {
            return std::unexpected(expr.error());
        }
        Node node{.kind = Node::Kind::kIf, .expr = std::move(*expr)};

        auto body = parse_until({"elif", "else", "endif"});
        if (!body) {
            return std::unexpected(body.error());
        }
        node.body = std::move(*body);
        if (m_index >= m_tokens.size()) {
            return std::unexpected(template_error(line, "missing {% endif %}"));
        }

        const Token& branch = m_tokens[m_index++];
        const std::string word = keyword(branch);
        if (word == "elif") {
            auto nested = parse_if_chain(std::string_view(branch.content).substr(4), branch.line);
            if (!nested) {
                return std::unexpected(nested.error());
            }
            node.else_body.push_back(std::move(*nested));
            return node;
        }
        if (word == "else") {
            auto else_body = parse_until({"endif"});
            if (!else_body) {
                return std::unexpected(else_body.error());
            }
            node.else_body = std::move(*else_body);
            if (m_index >= m_tokens.size()) {
                return std::unexpected(template_error(line, "missing {% endif %}"));
            }
            ++m_index;
        }
        return node;
    }
};

// ============================================================================
// Renderer
// ============================================================================

class Renderer
{
public:
    explicit Renderer(const nlohmann::json& context)
        : m_context(context)
    {}

    [[nodiscard]] semverpp::VoidResult render(const NodeList& nodes, std::string& out)
    {
        for (const auto& node : nodes) {
            if (auto result = render_node(node, out); !result) {
                return result;
            }
        }
        return {};
    }

private:
    const nlohmann::json& m_context;
    std::vector<std::pair<std::string, nlohmann::json>> m_scopes;

    [[nodiscard]] nlohmann::json lookup(const Expression& expr) const
    {
        if (expr.literal) {
            return *expr.literal;
        }
        const nlohmann::json* current = nullptr;
        const std::string& head = expr.path.front();
        for (const auto& scope : m_scopes | std::views::reverse) {
            if (scope.first == head) {
                current = &scope.second;
                break;
            }
        }
        if (current == nullptr) {
            if (!m_context.is_object() || !m_context.contains(head)) {
                return nullptr;
            }
            current = &m_context.at(head);
        }
        for (const auto& segment : expr.path | std::views::drop(1)) {
            if (!current->is_object() || !current->contains(segment)) {
                return nullptr;
            }
            current = &current->at(segment);
        }
        return *current;
    }

    [[nodiscard]] static bool truthy(const nlohmann::json& value)
    {
        if (value.is_null()) {
            return false;
        }
        if (value.is_boolean()) {
            return value.get<bool>();
        }
        if (value.is_number()) {
            return value != 0;
        }
        if (value.is_string()) {
            return !value.get_ref<const std::string&>().empty();
        }
        return !value.empty();
    }

    static void append_value(const nlohmann::json& value, std::string& out)
    {
        if (value.is_null()) {
            return;
        }
        if (value.is_string()) {
            out += value.get_ref<const std::string&>();
            return;
        }
        out += value.dump();
    }

    [[nodiscard]] semverpp::VoidResult render_node(const Node& node, std::string& out)
    {
        switch (node.kind) {
            case Node::Kind::kText:
                out += node.text;
                return {};
            case Node::Kind::kOutput:
                append_value(lookup(node.expr), out);
                return {};
            case Node::Kind::kIf: {
                const bool condition = truthy(lookup(node.expr)) != node.expr.negate;
                return render(condition ? node.body : node.else_body, out);
            }
            case Node::Kind::kFor:
                return render_for(node, out);
        }
        return {};
    }

    [[nodiscard]] semverpp::VoidResult render_for(const Node& node, std::string& out)
    {
        const nlohmann::json iterable = lookup(node.expr);
        if (!iterable.is_null() && !iterable.is_array() && !iterable.is_object()) {
            return std::unexpected(Error::make(
                std::string(error_code::kTemplateError),
                std::format("Template error: cannot iterate over '{}'", iterable.dump())));
        }
        if (iterable.is_null() || iterable.empty()) {
            return render(node.else_body, out);
        }

        const std::size_t count = iterable.size();
        std::size_t index = 0;
        for (const auto& [key, value] : iterable.items()) {
            const std::size_t scope_mark = m_scopes.size();
            m_scopes.emplace_back("loop",
                                  nlohmann::json{
                                      {"index", index + 1},
                                      {"index0", index},
                                      {"first", index == 0},
                                      {"last", index + 1 == count},
            });
            if (node.loop_vars.size() == 2) {
                m_scopes.emplace_back(node.loop_vars[0],
                                      iterable.is_object() ? nlohmann::json(key)
                                                           : nlohmann::json(index));
                m_scopes.emplace_back(node.loop_vars[1], value);
            } else {
                m_scopes.emplace_back(node.loop_vars[0],
                                      iterable.is_object() ? nlohmann::json(key) : value);
            }
            auto result = render(node.body, out);
            m_scopes.resize(scope_mark);
            if (!result) {
                return result;
            }
            ++index;
        }
        return {};
    }
};

}  // namespace

semverpp::Result<std::string> render_template(std::string_view source, const nlohmann::json& context)
{
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    Parser parser(*tokens);
    auto nodes = parser.parse();
    if (!nodes) {
        return std::unexpected(nodes.error());
    }

    std::string out;
    Renderer renderer(context);
    if (auto result = renderer.render(*nodes, out); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

}  // namespace semverpp::changelog
