// EN: Command line parsing for cdoctl. Options either map onto a configuration path
//     (section.key overrides) or are plain values read by the tool itself.
// FR: Analyse de la ligne de commande de cdoctl. Les options correspondent à un chemin de
//     configuration (surcharges section.clé) ou sont des valeurs lues par l'outil.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace CDO {
namespace CLI {

// EN: CLI option types
// FR: Types d'options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,
    STRING,
    STRING_LIST     // EN: Comma-separated list / FR: Liste séparée par des virgules
};

enum class CliOptionConstraint {
    NONE,
    POSITIVE,       // EN: Must be > 0 / FR: Doit être > 0
    NON_NEGATIVE,   // EN: Must be >= 0 / FR: Doit être >= 0
    ENUM_VALUES     // EN: Must be one of enum_values / FR: Doit être une des enum_values
};

enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,
    MISSING_VALUE,
    INVALID_VALUE,
    MISSING_REQUIRED
};

struct CliOptionDefinition {
    std::string long_name;                          // EN: --long-name / FR: --nom-long
    std::optional<char> short_name;                 // EN: -x / FR: -x
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string config_path;                        // EN: "section.key", empty when not a config override / FR: vide si ce n'est pas une surcharge
    std::optional<std::string> default_value;
    bool required = false;
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;
    bool repeatable = false;                        // EN: Values accumulate instead of failing / FR: Les valeurs s'accumulent
    std::string category = "General";
};

struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> positional;

    // EN: Raw values by long option name, in command line order
    // FR: Valeurs brutes par nom long d'option, dans l'ordre de la ligne de commande
    std::map<std::string, std::vector<std::string>> values;

    // EN: Typed overrides by configuration path
    // FR: Surcharges typées par chemin de configuration
    std::unordered_map<std::string, ConfigValue> overrides;

    std::string help_text;
    std::string version_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& name) const { return values.count(name) > 0; }

    // EN: Last value given for an option, or the fallback
    // FR: Dernière valeur donnée pour une option, ou la valeur de repli
    std::string value(const std::string& name, const std::string& fallback = "") const;
    std::vector<std::string> all(const std::string& name) const;
};

class ConfigOverrideParser {
public:
    explicit ConfigOverrideParser(std::string program_name = "cdoctl");
    ~ConfigOverrideParser();

    ConfigOverrideParser(const ConfigOverrideParser&) = delete;
    ConfigOverrideParser& operator=(const ConfigOverrideParser&) = delete;

    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);
    bool hasOption(const std::string& long_name) const;

    // EN: --log-level and --log-file, mapped on logging.level / logging.file
    // FR: --log-level et --log-file, associées à logging.level / logging.file
    void addLoggingOptions();

    CliParseResult parse(int argc, char* argv[]);
    CliParseResult parse(const std::vector<std::string>& arguments);

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    void setHelpHeader(const std::string& header);
    void setHelpFooter(const std::string& footer);
    void setVersionInfo(const std::string& version, const std::string& build_info = "");

private:
    class ConfigOverrideParserImpl;
    std::unique_ptr<ConfigOverrideParserImpl> impl_;
};

// EN: Writes every override into the manager; returns the number applied
// FR: Écrit chaque surcharge dans le gestionnaire; retourne le nombre appliqué
size_t applyOverrides(const CliParseResult& result, ConfigManager& manager);

namespace ConfigOverrideUtils {

    std::string cliOptionTypeToString(CliOptionType type);
    std::string cliParseStatusToString(CliParseStatus status);

    // EN: "section.key" -> (section, key); nullopt when there is no dot
    // FR: "section.clé" -> (section, clé); nullopt sans point
    std::optional<std::pair<std::string, std::string>> splitConfigPath(const std::string& path);

    ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);
    bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                          std::string& error_message);

    std::string formatOptionHelp(const CliOptionDefinition& option);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace CDO
