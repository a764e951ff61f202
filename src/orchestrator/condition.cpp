// EN: Condition language: lexer, recursive-descent parser and typed AST evaluation.
// FR: Langage de condition : lexer, parser descendant récursif et évaluation d'un AST typé.

#include "orchestrator/condition.hpp"

#include <cctype>
#include <mutex>
#include <regex>
#include <unordered_map>

namespace CDO {
namespace Orchestrator {

namespace {

const std::string kTrue = "true";
const std::string kFalse = "false";

const std::string& boolString(bool value) {
    return value ? kTrue : kFalse;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// ---------------------------------------------------------------------------
// EN: AST nodes
// FR: Nœuds de l'AST
// ---------------------------------------------------------------------------

class LiteralNode : public ConditionNode {
public:
    explicit LiteralNode(std::string value) : value_(std::move(value)) {}
    std::string evaluate(const VariableScope&) const override { return value_; }
    const std::string& value() const { return value_; }
    std::string describe() const override { return "'" + value_ + "'"; }

private:
    std::string value_;
};

class VariableNode : public ConditionNode {
public:
    explicit VariableNode(std::string name) : name_(std::move(name)) {}
    std::string evaluate(const VariableScope& scope) const override {
        return scope.lookup(name_).value_or("");
    }
    std::string describe() const override { return name_; }

private:
    std::string name_;
};

class NotNode : public ConditionNode {
public:
    explicit NotNode(std::shared_ptr<const ConditionNode> operand) : operand_(std::move(operand)) {}
    std::string evaluate(const VariableScope& scope) const override {
        return boolString(!isTruthy(operand_->evaluate(scope)));
    }
    std::string describe() const override { return "!(" + operand_->describe() + ")"; }

private:
    std::shared_ptr<const ConditionNode> operand_;
};

enum class LogicalOp { AND, OR };

class LogicalNode : public ConditionNode {
public:
    LogicalNode(LogicalOp op, std::shared_ptr<const ConditionNode> lhs, std::shared_ptr<const ConditionNode> rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    std::string evaluate(const VariableScope& scope) const override {
        const bool left = isTruthy(lhs_->evaluate(scope));
        if (op_ == LogicalOp::AND) {
            return boolString(left && isTruthy(rhs_->evaluate(scope)));
        }
        return boolString(left || isTruthy(rhs_->evaluate(scope)));
    }

    std::string describe() const override {
        return "(" + lhs_->describe() + (op_ == LogicalOp::AND ? " && " : " || ") + rhs_->describe() + ")";
    }

private:
    LogicalOp op_;
    std::shared_ptr<const ConditionNode> lhs_;
    std::shared_ptr<const ConditionNode> rhs_;
};

enum class CompareOp { EQUALS, NOT_EQUALS, MATCHES };

class CompareNode : public ConditionNode {
public:
    CompareNode(CompareOp op, std::shared_ptr<const ConditionNode> lhs, std::shared_ptr<const ConditionNode> rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    std::string evaluate(const VariableScope& scope) const override {
        const std::string left = lhs_->evaluate(scope);
        const std::string right = rhs_->evaluate(scope);
        switch (op_) {
            case CompareOp::EQUALS:     return boolString(left == right);
            case CompareOp::NOT_EQUALS: return boolString(left != right);
            case CompareOp::MATCHES:    return boolString(globMatch(right, left));
        }
        return kFalse;
    }

    std::string describe() const override {
        const char* symbol = op_ == CompareOp::EQUALS ? " == " : op_ == CompareOp::NOT_EQUALS ? " != " : " matches ";
        return lhs_->describe() + symbol + rhs_->describe();
    }

private:
    CompareOp op_;
    std::shared_ptr<const ConditionNode> lhs_;
    std::shared_ptr<const ConditionNode> rhs_;
};

enum class Function { STARTS_WITH, ENDS_WITH, CONTAINS, MATCHES };

class CallNode : public ConditionNode {
public:
    CallNode(Function function, std::string name, std::shared_ptr<const ConditionNode> first,
             std::shared_ptr<const ConditionNode> second)
        : function_(function), name_(std::move(name)), first_(std::move(first)), second_(std::move(second)) {}

    std::string evaluate(const VariableScope& scope) const override {
        const std::string a = first_->evaluate(scope);
        const std::string b = second_->evaluate(scope);
        switch (function_) {
            case Function::STARTS_WITH: return boolString(startsWith(a, b));
            case Function::ENDS_WITH:   return boolString(endsWith(a, b));
            case Function::CONTAINS:    return boolString(a.find(b) != std::string::npos);
            case Function::MATCHES:     return boolString(globMatch(b, a));
        }
        return kFalse;
    }

    std::string describe() const override {
        return name_ + "(" + first_->describe() + ", " + second_->describe() + ")";
    }

private:
    Function function_;
    std::string name_;
    std::shared_ptr<const ConditionNode> first_;
    std::shared_ptr<const ConditionNode> second_;
};

// ---------------------------------------------------------------------------
// EN: Lexer
// FR: Lexer
// ---------------------------------------------------------------------------

enum class TokenType { STRING, NUMBER, IDENT, LPAREN, RPAREN, COMMA, AND, OR, NOT, EQ, NE, END };

struct Token {
    TokenType type;
    std::string text;
};

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

bool endsValue(const std::vector<Token>& tokens) {
    if (tokens.empty()) {
        return false;
    }
    const TokenType last = tokens.back().type;
    return last == TokenType::IDENT || last == TokenType::STRING ||
           last == TokenType::NUMBER || last == TokenType::RPAREN;
}

std::vector<Token> tokenize(const std::string& source, const std::string& original) {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < source.size()) {
        const char c = source[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (c == '\'' || c == '"') {
            // EN: '' inside a single-quoted string is an escaped quote
            // FR: '' dans une chaîne entre apostrophes est une apostrophe échappée
            std::string value;
            size_t j = i + 1;
            bool closed = false;
            while (j < source.size()) {
                if (source[j] == c) {
                    if (c == '\'' && j + 1 < source.size() && source[j + 1] == '\'') {
                        value += '\'';
                        j += 2;
                        continue;
                    }
                    closed = true;
                    break;
                }
                value += source[j++];
            }
            if (!closed) {
                throw ConditionParseError(original, "unterminated string literal");
            }
            tokens.push_back({TokenType::STRING, value});
            i = j + 1;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t j = i;
            while (j < source.size() && (std::isdigit(static_cast<unsigned char>(source[j])) || source[j] == '.')) {
                ++j;
            }
            tokens.push_back({TokenType::NUMBER, source.substr(i, j - i)});
            i = j;
            continue;
        }

        if (isIdentStart(c)) {
            size_t j = i;
            while (j < source.size() && isIdentChar(source[j])) {
                ++j;
            }
            std::string word = source.substr(i, j - i);
            const bool infix_matches = word == "matches" && endsValue(tokens);
            tokens.push_back({TokenType::IDENT, word});
            i = j;

            // EN: "ref matches v*.*" accepts an unquoted pattern on the right-hand side
            // FR: "ref matches v*.*" accepte un motif sans guillemets à droite
            if (infix_matches) {
                while (i < source.size() && std::isspace(static_cast<unsigned char>(source[i]))) {
                    ++i;
                }
                if (i < source.size() && source[i] != '\'' && source[i] != '"' && source[i] != '(') {
                    size_t k = i;
                    while (k < source.size() && !std::isspace(static_cast<unsigned char>(source[k])) &&
                           source[k] != ')') {
                        ++k;
                    }
                    tokens.push_back({TokenType::STRING, source.substr(i, k - i)});
                    i = k;
                }
            }
            continue;
        }

        const std::string two = source.substr(i, 2);
        if (two == "&&") { tokens.push_back({TokenType::AND, two}); i += 2; continue; }
        if (two == "||") { tokens.push_back({TokenType::OR, two}); i += 2; continue; }
        if (two == "==") { tokens.push_back({TokenType::EQ, two}); i += 2; continue; }
        if (two == "!=") { tokens.push_back({TokenType::NE, two}); i += 2; continue; }

        switch (c) {
            case '(': tokens.push_back({TokenType::LPAREN, "("}); break;
            case ')': tokens.push_back({TokenType::RPAREN, ")"}); break;
            case ',': tokens.push_back({TokenType::COMMA, ","}); break;
            case '!': tokens.push_back({TokenType::NOT, "!"}); break;
            default:
                throw ConditionParseError(original, std::string("unexpected character '") + c + "'");
        }
        ++i;
    }

    tokens.push_back({TokenType::END, ""});
    return tokens;
}

// ---------------------------------------------------------------------------
// EN: Recursive-descent parser
// FR: Parser descendant récursif
// ---------------------------------------------------------------------------

class Parser {
public:
    Parser(std::vector<Token> tokens, std::string original)
        : tokens_(std::move(tokens)), original_(std::move(original)) {}

    std::shared_ptr<const ConditionNode> parse() {
        auto root = parseOr();
        if (peek().type != TokenType::END) {
            fail("unexpected token '" + peek().text + "'");
        }
        return root;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    bool accept(TokenType type) {
        if (peek().type == type) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(TokenType type, const std::string& what) {
        if (!accept(type)) {
            fail("expected " + what);
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ConditionParseError(original_, message);
    }

    std::shared_ptr<const ConditionNode> parseOr() {
        auto lhs = parseAnd();
        while (accept(TokenType::OR)) {
            lhs = std::make_shared<LogicalNode>(LogicalOp::OR, lhs, parseAnd());
        }
        return lhs;
    }

    std::shared_ptr<const ConditionNode> parseAnd() {
        auto lhs = parseUnary();
        while (accept(TokenType::AND)) {
            lhs = std::make_shared<LogicalNode>(LogicalOp::AND, lhs, parseUnary());
        }
        return lhs;
    }

    std::shared_ptr<const ConditionNode> parseUnary() {
        if (accept(TokenType::NOT)) {
            return std::make_shared<NotNode>(parseUnary());
        }
        return parseCompare();
    }

    std::shared_ptr<const ConditionNode> parseCompare() {
        auto lhs = parsePrimary();
        if (accept(TokenType::EQ)) {
            return std::make_shared<CompareNode>(CompareOp::EQUALS, lhs, parsePrimary());
        }
        if (accept(TokenType::NE)) {
            return std::make_shared<CompareNode>(CompareOp::NOT_EQUALS, lhs, parsePrimary());
        }
        if (peek().type == TokenType::IDENT && peek().text == "matches") {
            advance();
            auto pattern = parsePrimary();
            checkPattern(pattern);
            return std::make_shared<CompareNode>(CompareOp::MATCHES, lhs, pattern);
        }
        return lhs;
    }

    std::shared_ptr<const ConditionNode> parsePrimary() {
        const Token& token = peek();
        switch (token.type) {
            case TokenType::STRING:
            case TokenType::NUMBER:
                return std::make_shared<LiteralNode>(advance().text);

            case TokenType::LPAREN: {
                advance();
                auto inner = parseOr();
                expect(TokenType::RPAREN, "')'");
                return inner;
            }

            case TokenType::IDENT: {
                const std::string name = advance().text;
                if (name == "true" || name == "false") {
                    return std::make_shared<LiteralNode>(name);
                }
                if (accept(TokenType::LPAREN)) {
                    return parseCall(name);
                }
                return std::make_shared<VariableNode>(name);
            }

            case TokenType::END:
                fail("unexpected end of expression");

            default:
                fail("unexpected token '" + token.text + "'");
        }
    }

    std::shared_ptr<const ConditionNode> parseCall(const std::string& name) {
        static const std::unordered_map<std::string, Function> functions = {
            {"startsWith", Function::STARTS_WITH},
            {"endsWith", Function::ENDS_WITH},
            {"contains", Function::CONTAINS},
            {"matches", Function::MATCHES},
        };

        auto it = functions.find(name);
        if (it == functions.end()) {
            fail("unknown function '" + name + "'");
        }

        auto first = parseOr();
        expect(TokenType::COMMA, "',' in call to " + name);
        auto second = parseOr();
        expect(TokenType::RPAREN, "')' after arguments of " + name);
        if (it->second == Function::MATCHES) {
            checkPattern(second);
        }

        return std::make_shared<CallNode>(it->second, name, first, second);
    }

    // EN: Literal glob operands are compiled now so a bad pattern fails at parse time
    // FR: Les globs littéraux sont compilés ici pour qu'un motif invalide échoue au parsing
    void checkPattern(const std::shared_ptr<const ConditionNode>& node) const {
        const auto literal = std::dynamic_pointer_cast<const LiteralNode>(node);
        if (!literal) {
            return;
        }
        try {
            validateGlob(literal->value());
        } catch (const ConditionParseError&) {
            fail("invalid glob pattern '" + literal->value() + "'");
        }
    }

    std::vector<Token> tokens_;
    std::string original_;
    size_t pos_ = 0;
};

std::string stripExpressionMarkers(const std::string& expression) {
    std::string body = trim(expression);
    if (startsWith(body, "${{") && endsWith(body, "}}") && body.size() >= 5) {
        body = trim(body.substr(3, body.size() - 5));
    }
    return body;
}

std::string globToRegex(const std::string& pattern) {
    std::string regex;
    regex.reserve(pattern.size() * 2);

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        switch (c) {
            case '*':
                if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                    ++i;
                    if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
                        ++i;
                        regex += "(?:.*/)?";
                    } else {
                        regex += ".*";
                    }
                } else {
                    regex += "[^/]*";
                }
                break;
            case '?':
                regex += "[^/]";
                break;
            case '[': {
                const size_t close = pattern.find(']', i + 1);
                if (close == std::string::npos) {
                    regex += "\\[";
                    break;
                }
                std::string set = pattern.substr(i + 1, close - i - 1);
                if (!set.empty() && set[0] == '!') {
                    set[0] = '^';
                }
                regex += "[" + set + "]";
                i = close;
                break;
            }
            case '.': case '+': case '(': case ')': case '{': case '}':
            case '^': case '$': case '|': case '\\': case ']':
                regex += '\\';
                regex += c;
                break;
            default:
                regex += c;
        }
    }
    return regex;
}

} // namespace

// ---------------------------------------------------------------------------

const MatrixBindings& VariableScope::emptyBindings() {
    static const MatrixBindings empty;
    return empty;
}

std::optional<std::string> VariableScope::lookup(const std::string& name) const {
    auto it = variables_->find(name);
    if (it != variables_->end()) {
        return it->second;
    }

    std::string key = name;
    if (startsWith(key, "github.")) {
        key = key.substr(7);
        it = variables_->find(key);
        if (it != variables_->end()) {
            return it->second;
        }
    }

    if (startsWith(key, "matrix.")) {
        const std::string axis = key.substr(7);
        for (const auto& [axis_name, value] : *bindings_) {
            if (axis_name == axis) {
                return value;
            }
        }
    }

    return std::nullopt;
}

Condition Condition::parse(const std::string& expression) {
    const std::string body = stripExpressionMarkers(expression);
    if (body.empty()) {
        throw ConditionParseError(expression, "empty expression");
    }
    Parser parser(tokenize(body, expression), expression);
    return Condition(expression, parser.parse());
}

bool Condition::evaluate(const VariableScope& scope) const {
    return isTruthy(root_->evaluate(scope));
}

std::string Condition::describe() const {
    return root_->describe();
}

bool isTruthy(const std::string& value) {
    return !value.empty() && value != "false" && value != "0";
}

namespace {

std::regex compiledGlob(const std::string& pattern) {
    static std::mutex cache_mutex;
    static std::unordered_map<std::string, std::regex> cache;

    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = cache.find(pattern);
    if (it == cache.end()) {
        try {
            it = cache.emplace(pattern, std::regex(globToRegex(pattern))).first;
        } catch (const std::regex_error& e) {
            throw ConditionParseError(pattern, std::string("invalid glob pattern: ") + e.what());
        }
    }
    return it->second;
}

} // namespace

void validateGlob(const std::string& pattern) {
    (void)compiledGlob(pattern);
}

bool globMatch(const std::string& pattern, const std::string& text) {
    return std::regex_match(text, compiledGlob(pattern));
}

std::string substitute(const std::string& text, const VariableScope& scope) {
    std::string result;
    size_t pos = 0;

    while (pos < text.size()) {
        const size_t open = text.find("${{", pos);
        if (open == std::string::npos) {
            break;
        }
        const size_t close = text.find("}}", open + 3);
        if (close == std::string::npos) {
            break;
        }

        result.append(text, pos, open - pos);
        const std::string expression = text.substr(open + 3, close - open - 3);
        if (trim(expression).empty()) {
            throw ConditionParseError(text, "empty substitution");
        }
        Parser parser(tokenize(expression, text), text);
        result += parser.parse()->evaluate(scope);
        pos = close + 2;
    }

    result.append(text, pos, std::string::npos);
    return result;
}

} // namespace Orchestrator
} // namespace CDO
