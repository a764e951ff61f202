// EN: CLI option parsing with typed configuration overrides.
// FR: Analyse des options CLI avec surcharges de configuration typées.

#include "infrastructure/cli/config_override.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "infrastructure/logging/logger.hpp"

namespace CDO {
namespace CLI {

namespace {

std::vector<std::string> splitList(const std::string& raw_value) {
    std::vector<std::string> values;
    std::stringstream ss(raw_value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            values.push_back(item);
        }
    }
    return values;
}

} // namespace

std::string CliParseResult::value(const std::string& name, const std::string& fallback) const {
    auto it = values.find(name);
    if (it == values.end() || it->second.empty()) {
        return fallback;
    }
    return it->second.back();
}

std::vector<std::string> CliParseResult::all(const std::string& name) const {
    auto it = values.find(name);
    return it == values.end() ? std::vector<std::string>{} : it->second;
}

// ---------------------------------------------------------------------------
// EN: Parser implementation
// FR: Implémentation de l'analyseur
// ---------------------------------------------------------------------------

class ConfigOverrideParser::ConfigOverrideParserImpl {
public:
    explicit ConfigOverrideParserImpl(std::string program_name) : program_name_(std::move(program_name)) {}

    void addOption(const CliOptionDefinition& option_def) {
        if (option_def.long_name.empty()) {
            throw std::invalid_argument("CLI option requires a long name");
        }
        std::lock_guard<std::mutex> lock(options_mutex_);
        if (options_by_long_name_.count(option_def.long_name)) {
            throw std::invalid_argument("Duplicate CLI option: --" + option_def.long_name);
        }
        option_definitions_.push_back(option_def);
        options_by_long_name_[option_def.long_name] = option_def;
        if (option_def.short_name) {
            options_by_short_name_[*option_def.short_name] = option_def;
        }
    }

    bool hasOption(const std::string& long_name) const {
        std::lock_guard<std::mutex> lock(options_mutex_);
        return options_by_long_name_.count(long_name) > 0;
    }

    CliParseResult parse(const std::vector<std::string>& arguments) {
        CliParseResult result;
        std::lock_guard<std::mutex> lock(options_mutex_);

        for (size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];
            if (arg.empty()) continue;

            if (arg == "--help" || arg == "-h") {
                result.status = CliParseStatus::HELP_REQUESTED;
                result.help_text = helpTextUnlocked();
                return result;
            }
            if (arg == "--version" || arg == "-V") {
                result.status = CliParseStatus::VERSION_REQUESTED;
                result.version_text = versionText();
                return result;
            }

            if (!ConfigOverrideUtils::isLongOption(arg) && !ConfigOverrideUtils::isShortOption(arg)) {
                result.positional.push_back(arg);
                continue;
            }

            // EN: --name=value form
            // FR: Forme --nom=valeur
            std::optional<std::string> inline_value;
            std::string option_arg = arg;
            auto equals = arg.find('=');
            if (ConfigOverrideUtils::isLongOption(arg) && equals != std::string::npos) {
                option_arg = arg.substr(0, equals);
                inline_value = arg.substr(equals + 1);
            }

            const CliOptionDefinition* definition = findDefinition(option_arg);
            if (!definition) {
                fail(result, CliParseStatus::INVALID_OPTION, "Unknown option: " + option_arg);
                continue;
            }

            std::string raw;
            if (definition->type == CliOptionType::BOOLEAN) {
                raw = inline_value.value_or("true");
            } else if (inline_value) {
                raw = *inline_value;
            } else if (i + 1 < arguments.size()) {
                raw = arguments[++i];
            } else {
                fail(result, CliParseStatus::MISSING_VALUE, "Option " + option_arg + " requires a value");
                continue;
            }

            std::string error;
            if (!ConfigOverrideUtils::validateCliValue(raw, *definition, error)) {
                fail(result, CliParseStatus::INVALID_VALUE, "Invalid value for option " + option_arg + ": " + error);
                continue;
            }

            auto& slot = result.values[definition->long_name];
            if (!slot.empty() && !definition->repeatable) {
                result.warnings.push_back("Option --" + definition->long_name + " given more than once, last value wins");
                slot.clear();
            }
            slot.push_back(raw);

            if (!definition->config_path.empty()) {
                result.overrides[definition->config_path] = ConfigOverrideUtils::parseCliValue(raw, definition->type);
            }
        }

        for (const auto& definition : option_definitions_) {
            if (result.values.count(definition.long_name)) {
                continue;
            }
            if (definition.required) {
                fail(result, CliParseStatus::MISSING_REQUIRED, "Missing required option --" + definition.long_name);
            } else if (definition.default_value) {
                result.values[definition.long_name].push_back(*definition.default_value);
            }
        }

        return result;
    }

    std::string helpTextLocked() const {
        std::lock_guard<std::mutex> lock(options_mutex_);
        return helpTextUnlocked();
    }

    std::string versionText() const {
        std::ostringstream version;
        version << program_name_ << " " << version_;
        if (!build_info_.empty()) {
            version << " (" << build_info_ << ")";
        }
        version << "\n";
        return version.str();
    }

    std::string program_name_;
    std::string help_header_;
    std::string help_footer_;
    std::string version_ = "1.0.0";
    std::string build_info_;

private:
    const CliOptionDefinition* findDefinition(const std::string& arg) const {
        std::string name = ConfigOverrideUtils::extractOptionName(arg);
        if (ConfigOverrideUtils::isLongOption(arg)) {
            auto it = options_by_long_name_.find(name);
            return it == options_by_long_name_.end() ? nullptr : &it->second;
        }
        if (arg.size() != 2) {
            return nullptr;
        }
        auto it = options_by_short_name_.find(name[0]);
        return it == options_by_short_name_.end() ? nullptr : &it->second;
    }

    static void fail(CliParseResult& result, CliParseStatus status, const std::string& message) {
        result.errors.push_back(message);
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
    }

    std::string helpTextUnlocked() const {
        std::ostringstream help;
        if (!help_header_.empty()) {
            help << help_header_ << "\n\n";
        }
        help << "Usage: " << program_name_ << " [OPTIONS]\n\n";

        std::map<std::string, std::vector<CliOptionDefinition>> by_category;
        for (const auto& opt : option_definitions_) {
            by_category[opt.category].push_back(opt);
        }
        for (const auto& [category, options] : by_category) {
            help << category << " Options:\n";
            for (const auto& opt : options) {
                help << ConfigOverrideUtils::formatOptionHelp(opt) << "\n";
            }
            help << "\n";
        }
        if (!help_footer_.empty()) {
            help << help_footer_ << "\n";
        }
        return help.str();
    }

    mutable std::mutex options_mutex_;
    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, CliOptionDefinition> options_by_long_name_;
    std::unordered_map<char, CliOptionDefinition> options_by_short_name_;
};

ConfigOverrideParser::ConfigOverrideParser(std::string program_name)
    : impl_(std::make_unique<ConfigOverrideParserImpl>(std::move(program_name))) {}

ConfigOverrideParser::~ConfigOverrideParser() = default;

void ConfigOverrideParser::addOption(const CliOptionDefinition& option_def) {
    impl_->addOption(option_def);
}

void ConfigOverrideParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& def : option_defs) {
        impl_->addOption(def);
    }
}

bool ConfigOverrideParser::hasOption(const std::string& long_name) const {
    return impl_->hasOption(long_name);
}

void ConfigOverrideParser::addLoggingOptions() {
    CliOptionDefinition level;
    level.long_name = "log-level";
    level.description = "Minimum log level";
    level.config_path = "logging.level";
    level.constraint = CliOptionConstraint::ENUM_VALUES;
    level.enum_values = {"debug", "info", "warn", "error"};
    level.category = "Logging";

    CliOptionDefinition file;
    file.long_name = "log-file";
    file.description = "Write NDJSON logs to this file instead of stderr";
    file.config_path = "logging.file";
    file.category = "Logging";

    addOptions({level, file});
}

CliParseResult ConfigOverrideParser::parse(int argc, char* argv[]) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult ConfigOverrideParser::parse(const std::vector<std::string>& arguments) {
    return impl_->parse(arguments);
}

std::string ConfigOverrideParser::generateHelpText() const {
    return impl_->helpTextLocked();
}

std::string ConfigOverrideParser::generateVersionText() const {
    return impl_->versionText();
}

void ConfigOverrideParser::setHelpHeader(const std::string& header) {
    impl_->help_header_ = header;
}

void ConfigOverrideParser::setHelpFooter(const std::string& footer) {
    impl_->help_footer_ = footer;
}

void ConfigOverrideParser::setVersionInfo(const std::string& version, const std::string& build_info) {
    impl_->version_ = version;
    impl_->build_info_ = build_info;
}

size_t applyOverrides(const CliParseResult& result, ConfigManager& manager) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        auto parts = ConfigOverrideUtils::splitConfigPath(path);
        if (!parts) {
            LOG_WARN("cli", "Ignoring override with invalid path: " + path);
            continue;
        }
        manager.set(parts->first, parts->second, value);
        ++applied;
    }
    if (applied > 0) {
        LOG_DEBUG("cli", "Applied " + std::to_string(applied) + " command line overrides");
    }
    return applied;
}

// ---------------------------------------------------------------------------
// EN: Utilities
// FR: Utilitaires
// ---------------------------------------------------------------------------

namespace ConfigOverrideUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: return "BOOLEAN";
        case CliOptionType::INTEGER: return "INTEGER";
        case CliOptionType::STRING: return "STRING";
        case CliOptionType::STRING_LIST: return "STRING_LIST";
    }
    return "UNKNOWN";
}

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::MISSING_REQUIRED: return "MISSING_REQUIRED";
    }
    return "UNKNOWN";
}

std::optional<std::pair<std::string, std::string>> splitConfigPath(const std::string& path) {
    auto dot = path.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= path.size()) {
        return std::nullopt;
    }
    return std::make_pair(path.substr(0, dot), path.substr(dot + 1));
}

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: {
            std::string lower = raw_value;
            std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
            return ConfigValue(lower == "true" || lower == "1" || lower == "yes" || lower == "on");
        }
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::STRING:
            return ConfigValue(raw_value);
        case CliOptionType::STRING_LIST:
            return ConfigValue(splitList(raw_value));
    }
    throw std::invalid_argument("Unknown CliOptionType");
}

bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                      std::string& error_message) {
    try {
        switch (definition.type) {
            case CliOptionType::BOOLEAN: {
                std::string lower = raw_value;
                std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
                if (lower != "true" && lower != "false" && lower != "1" && lower != "0" &&
                    lower != "yes" && lower != "no" && lower != "on" && lower != "off") {
                    error_message = "Boolean value must be true/false, 1/0, yes/no, or on/off";
                    return false;
                }
                break;
            }
            case CliOptionType::INTEGER: {
                size_t consumed = 0;
                int value = std::stoi(raw_value, &consumed);
                if (consumed != raw_value.size()) {
                    error_message = "Not an integer";
                    return false;
                }
                if (definition.constraint == CliOptionConstraint::POSITIVE && value <= 0) {
                    error_message = "Value must be positive";
                    return false;
                }
                if (definition.constraint == CliOptionConstraint::NON_NEGATIVE && value < 0) {
                    error_message = "Value must be non-negative";
                    return false;
                }
                break;
            }
            case CliOptionType::STRING: {
                if (definition.constraint == CliOptionConstraint::ENUM_VALUES &&
                    definition.enum_values.find(raw_value) == definition.enum_values.end()) {
                    error_message = "Value must be one of: ";
                    bool first = true;
                    for (const auto& valid_value : definition.enum_values) {
                        if (!first) error_message += ", ";
                        error_message += valid_value;
                        first = false;
                    }
                    return false;
                }
                break;
            }
            case CliOptionType::STRING_LIST: {
                if (splitList(raw_value).empty()) {
                    error_message = "String list cannot be empty";
                    return false;
                }
                break;
            }
        }
    } catch (const std::exception& e) {
        error_message = "Invalid format: " + std::string(e.what());
        return false;
    }
    return true;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream help;

    std::string option_names = "  ";
    if (option.short_name) {
        option_names += "-" + std::string(1, *option.short_name) + ", ";
    }
    option_names += "--" + option.long_name;
    if (option.type != CliOptionType::BOOLEAN) {
        option_names += " <" + cliOptionTypeToString(option.type) + ">";
    }

    const size_t name_width = 32;
    if (option_names.length() > name_width - 2) {
        help << option_names << "\n" << std::string(name_width, ' ') << option.description;
    } else {
        help << std::left << std::setw(static_cast<int>(name_width)) << option_names << option.description;
    }
    if (option.default_value && !option.default_value->empty()) {
        help << " (default: " << *option.default_value << ")";
    }
    if (option.repeatable) {
        help << " [repeatable]";
    }
    return help.str();
}

bool isShortOption(const std::string& arg) {
    return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' && std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.length() >= 3 && arg.compare(0, 2, "--") == 0 && std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        return arg.substr(2);
    }
    if (isShortOption(arg)) {
        return arg.substr(1, 1);
    }
    return arg;
}

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace CDO
