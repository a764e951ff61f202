#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace CDO {
namespace Orchestrator {

// EN: Run-level variables (ref, ref_name, event, ...) and ordered matrix bindings
// FR: Variables de niveau run (ref, ref_name, event, ...) et bindings de matrice ordonnés
using VariableMap = std::map<std::string, std::string>;
using MatrixBindings = std::vector<std::pair<std::string, std::string>>;

// EN: Thrown when a condition or substitution expression cannot be parsed
// FR: Lancée quand une condition ou une expression de substitution ne peut être parsée
class ConditionParseError : public std::runtime_error {
public:
    ConditionParseError(const std::string& expression, const std::string& message)
        : std::runtime_error("Invalid condition '" + expression + "': " + message),
          expression_(expression) {}

    const std::string& expression() const { return expression_; }

private:
    std::string expression_;
};

// EN: Read-only view used to resolve names while evaluating a condition.
//     Lookup order: exact run variable, "github." alias, "matrix.<axis>" binding.
// FR: Vue en lecture seule pour résoudre les noms pendant l'évaluation.
//     Ordre : variable exacte, alias "github.", binding "matrix.<axe>".
class VariableScope {
public:
    VariableScope(const VariableMap& variables, const MatrixBindings& bindings)
        : variables_(&variables), bindings_(&bindings) {}

    explicit VariableScope(const VariableMap& variables)
        : variables_(&variables), bindings_(&emptyBindings()) {}

    std::optional<std::string> lookup(const std::string& name) const;

private:
    static const MatrixBindings& emptyBindings();

    const VariableMap* variables_;
    const MatrixBindings* bindings_;
};

// EN: Abstract node of the condition AST
// FR: Nœud abstrait de l'AST de condition
class ConditionNode {
public:
    virtual ~ConditionNode() = default;

    // EN: Every node evaluates to a string; boolean nodes yield "true" or "false"
    // FR: Chaque nœud s'évalue en chaîne; les nœuds booléens donnent "true" ou "false"
    virtual std::string evaluate(const VariableScope& scope) const = 0;
    virtual std::string describe() const = 0;
};

// EN: Parsed condition expression. Grammar:
//       expr    := or
//       or      := and ('||' and)*
//       and     := unary ('&&' unary)*
//       unary   := '!' unary | compare
//       compare := primary (('==' | '!=' | 'matches') primary)?
//       primary := 'string' | number | true | false | name | name '(' args ')' | '(' expr ')'
//     Functions: startsWith, endsWith, contains, matches. A surrounding ${{ }} is stripped.
// FR: Expression de condition parsée (voir la grammaire ci-dessus).
class Condition {
public:
    // EN: Parse an expression; throws ConditionParseError on invalid input
    // FR: Parse une expression; lance ConditionParseError si invalide
    static Condition parse(const std::string& expression);

    bool evaluate(const VariableScope& scope) const;

    const std::string& source() const { return source_; }
    std::string describe() const;

private:
    Condition(std::string source, std::shared_ptr<const ConditionNode> root)
        : source_(std::move(source)), root_(std::move(root)) {}

    std::string source_;
    std::shared_ptr<const ConditionNode> root_;
};

// EN: String truthiness: non-empty and neither "false" nor "0"
// FR: Valeur de vérité d'une chaîne : non vide et ni "false" ni "0"
bool isTruthy(const std::string& value);

// EN: Glob match. '*' stays within one path segment, '**' crosses '/', '?' matches one character.
//     Throws ConditionParseError when the pattern does not compile (e.g. "[9-0]").
// FR: Correspondance glob. '*' reste dans un segment, '**' traverse '/', '?' un caractère.
bool globMatch(const std::string& pattern, const std::string& text);

// EN: Compiles a glob without matching; throws ConditionParseError if it is invalid
// FR: Compile un glob sans l'appliquer; lance ConditionParseError s'il est invalide
void validateGlob(const std::string& pattern);

// EN: Replace every ${{ expr }} with the evaluated expression; undefined names become "".
// FR: Remplace chaque ${{ expr }} par l'expression évaluée; les noms inconnus deviennent "".
std::string substitute(const std::string& text, const VariableScope& scope);

} // namespace Orchestrator
} // namespace CDO
