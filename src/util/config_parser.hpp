#ifndef PHISCRUB_UTIL_CONFIG_PARSER_HPP
#define PHISCRUB_UTIL_CONFIG_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <istream>
#include <mutex>
#include <sstream>
#include <string>

#include "config/deid_config.hpp"
#include "core/entity_types.hpp"
#include "errors.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" configuration file into DeidentifyConfig and
 *        EngineConfig.
 *
 * FORMAT:
 *   - One key=value per line, surrounding whitespace trimmed.
 *   - Blank lines and lines starting with '#' are skipped.
 *   - Enum values are case-insensitive (generic_pii == GENERIC_PII).
 *
 * Every value is validated here, so an unrecognized mode/policy/action
 * never reaches the pipeline.
 *
 * USAGE:
 *   @code
 *   using namespace phiscrub;
 *
 *   config::DeidentifyConfig request;
 *   config::EngineConfig engine;
 *   util::ConfigParser parser(request, engine);
 *   parser.loadFromFile("phiscrub.conf");  // throws InvalidConfigError
 *   @endcode
 */

namespace phiscrub {
namespace util {

/**
 * @class ConfigParser
 * @brief Parses a plain text key=value config and updates the referenced structs.
 */
class ConfigParser
{
public:
    ConfigParser(config::DeidentifyConfig &request, config::EngineConfig &engine)
        : request_(request), engine_(engine)
    {
    }

    /**
     * @brief Read the given file. A missing file keeps the defaults.
     * @throw InvalidConfigError if a line is malformed or a value is invalid.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Parse config lines from any stream.
     * @throw InvalidConfigError if a line is malformed or a value is invalid.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw InvalidConfigError("line " + std::to_string(lineNo) + " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    config::DeidentifyConfig &request_;
    config::EngineConfig &engine_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "mode") {
            request_.mode = core::parseMode(val);
        }
        else if (key == "policy") {
            request_.policy = core::parsePolicy(val);
        }
        else if (key == "default_action") {
            request_.defaultAction = core::parseAction(val);
        }
        else if (key == "reversible") {
            request_.reversible = parseBool(key, val);
        }
        else if (key == "locale") {
            if (val.empty()) {
                throw InvalidConfigError("locale must not be empty");
            }
            request_.locale = val;
        }
        else if (key == "pattern_budget_ms") {
            engine_.patternBudgetMs = parseUInt(key, val);
            if (engine_.patternBudgetMs == 0) {
                throw InvalidConfigError("pattern_budget_ms must be positive");
            }
        }
        else if (key == "call_budget_ms") {
            engine_.callBudgetMs = parseUInt(key, val);
        }
        else if (key == "ner_endpoint") {
            engine_.nerEndpoint = val;
        }
        else if (key == "ner_timeout_ms") {
            engine_.nerTimeoutMs = parseUInt(key, val);
            if (engine_.nerTimeoutMs == 0) {
                throw InvalidConfigError("ner_timeout_ms must be positive");
            }
        }
        else if (key == "action_selection") {
            engine_.actionSelection = parseActionSelection(val);
        }
        else if (key == "log_level") {
            engine_.logLevel = logger::parseLogLevel(val);
        }
        else if (key == "log_file") {
            engine_.logFile = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' ignored");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to " + val);
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    static std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    inline uint64_t parseUInt(const std::string &key, const std::string &val) const
    {
        if (val.empty() || !std::all_of(val.begin(), val.end(),
                                        [](unsigned char c) { return std::isdigit(c); })) {
            throw InvalidConfigError(key + " expects an unsigned integer, got '" + val + "'");
        }
        try {
            return std::stoull(val, nullptr, 10);
        }
        catch (const std::exception &ex) {
            throw InvalidConfigError(key + " out of range '" + val + "': " + ex.what());
        }
    }

    inline bool parseBool(const std::string &key, const std::string &val) const
    {
        const std::string v = lower(val);
        if (v == "true" || v == "1" || v == "yes") {
            return true;
        }
        if (v == "false" || v == "0" || v == "no") {
            return false;
        }
        throw InvalidConfigError(key + " expects true/false, got '" + val + "'");
    }

    inline config::ActionSelection parseActionSelection(const std::string &val) const
    {
        const std::string v = lower(val);
        if (v == "fixed_redact") {
            return config::ActionSelection::FIXED_REDACT;
        }
        if (v == "config_default") {
            return config::ActionSelection::CONFIG_DEFAULT;
        }
        throw InvalidConfigError("unrecognized action_selection '" + val + "'");
    }
};

} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_CONFIG_PARSER_HPP
