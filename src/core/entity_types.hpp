#ifndef PHISCRUB_CORE_ENTITY_TYPES_HPP
#define PHISCRUB_CORE_ENTITY_TYPES_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

#include "../util/errors.hpp"

/**
 * @file entity_types.hpp
 * @brief Closed enumerations shared by every pipeline stage, with their
 *        canonical names and the boundary parsers that validate them.
 *
 * Parsing is the only place where free-form strings turn into these types;
 * an unknown name raises InvalidConfigError before any detection runs.
 */

namespace phiscrub {
namespace core {

enum class EntityType {
    PERSON_NAME,
    DATE,
    PHONE,
    EMAIL,
    ADDRESS,
    SSN,
    MRN,
    PASSPORT,
    CREDIT_CARD,
    IP_ADDRESS,
    LOCATION,
    MEDICAL_RECORD,
    INSURANCE_ID,
    VEHICLE_ID,
    DEVICE_ID,
    BANK_ACCOUNT,
    ORGANIZATION,
    USERNAME,
    PASSWORD,
    API_KEY,
    GENERIC_PII
};

/// LOW < MEDIUM < HIGH.
enum class Severity {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

enum class Action {
    REDACT,
    MASK,
    HASH,
    TOKENIZE,
    KEEP
};

enum class Mode {
    SAFE_HARBOR,
    RISK_BASED
};

enum class Policy {
    HIPAA,
    GENERIC_PII,
    CUSTOM
};

/// Tie-break rank used by the overlap resolver.
inline int severityRank(Severity s)
{
    return static_cast<int>(s);
}

inline const char* toString(EntityType t)
{
    switch (t) {
    case EntityType::PERSON_NAME:    return "PERSON_NAME";
    case EntityType::DATE:           return "DATE";
    case EntityType::PHONE:          return "PHONE";
    case EntityType::EMAIL:          return "EMAIL";
    case EntityType::ADDRESS:        return "ADDRESS";
    case EntityType::SSN:            return "SSN";
    case EntityType::MRN:            return "MRN";
    case EntityType::PASSPORT:       return "PASSPORT";
    case EntityType::CREDIT_CARD:    return "CREDIT_CARD";
    case EntityType::IP_ADDRESS:     return "IP_ADDRESS";
    case EntityType::LOCATION:       return "LOCATION";
    case EntityType::MEDICAL_RECORD: return "MEDICAL_RECORD";
    case EntityType::INSURANCE_ID:   return "INSURANCE_ID";
    case EntityType::VEHICLE_ID:     return "VEHICLE_ID";
    case EntityType::DEVICE_ID:      return "DEVICE_ID";
    case EntityType::BANK_ACCOUNT:   return "BANK_ACCOUNT";
    case EntityType::ORGANIZATION:   return "ORGANIZATION";
    case EntityType::USERNAME:       return "USERNAME";
    case EntityType::PASSWORD:       return "PASSWORD";
    case EntityType::API_KEY:        return "API_KEY";
    case EntityType::GENERIC_PII:    return "GENERIC_PII";
    }
    return "UNKNOWN";
}

inline const char* toString(Severity s)
{
    switch (s) {
    case Severity::LOW:    return "LOW";
    case Severity::MEDIUM: return "MEDIUM";
    case Severity::HIGH:   return "HIGH";
    }
    return "UNKNOWN";
}

inline const char* toString(Action a)
{
    switch (a) {
    case Action::REDACT:   return "REDACT";
    case Action::MASK:     return "MASK";
    case Action::HASH:     return "HASH";
    case Action::TOKENIZE: return "TOKENIZE";
    case Action::KEEP:     return "KEEP";
    }
    return "UNKNOWN";
}

inline const char* toString(Mode m)
{
    switch (m) {
    case Mode::SAFE_HARBOR: return "SAFE_HARBOR";
    case Mode::RISK_BASED:  return "RISK_BASED";
    }
    return "UNKNOWN";
}

inline const char* toString(Policy p)
{
    switch (p) {
    case Policy::HIPAA:       return "HIPAA";
    case Policy::GENERIC_PII: return "GENERIC_PII";
    case Policy::CUSTOM:      return "CUSTOM";
    }
    return "UNKNOWN";
}

namespace detail {

inline std::string upperTrimmed(const std::string &in)
{
    auto first = std::find_if_not(in.begin(), in.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(in.rbegin(), in.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (first < last) {
        out.assign(first, last);
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

template <typename E, std::size_t N>
E parseByName(const std::string &value, const std::array<E, N> &all, const char *what)
{
    const std::string key = upperTrimmed(value);
    for (E e : all) {
        if (key == toString(e)) {
            return e;
        }
    }
    throw util::InvalidConfigError(std::string("unrecognized ") + what + " '" + value + "'");
}

} // namespace detail

inline const std::array<EntityType, 21> &allEntityTypes()
{
    static const std::array<EntityType, 21> all = {
        EntityType::PERSON_NAME, EntityType::DATE, EntityType::PHONE,
        EntityType::EMAIL, EntityType::ADDRESS, EntityType::SSN,
        EntityType::MRN, EntityType::PASSPORT, EntityType::CREDIT_CARD,
        EntityType::IP_ADDRESS, EntityType::LOCATION, EntityType::MEDICAL_RECORD,
        EntityType::INSURANCE_ID, EntityType::VEHICLE_ID, EntityType::DEVICE_ID,
        EntityType::BANK_ACCOUNT, EntityType::ORGANIZATION, EntityType::USERNAME,
        EntityType::PASSWORD, EntityType::API_KEY, EntityType::GENERIC_PII
    };
    return all;
}

inline EntityType parseEntityType(const std::string &value)
{
    return detail::parseByName(value, allEntityTypes(), "entity type");
}

inline Severity parseSeverity(const std::string &value)
{
    static const std::array<Severity, 3> all = {Severity::LOW, Severity::MEDIUM, Severity::HIGH};
    return detail::parseByName(value, all, "severity");
}

inline Action parseAction(const std::string &value)
{
    static const std::array<Action, 5> all = {
        Action::REDACT, Action::MASK, Action::HASH, Action::TOKENIZE, Action::KEEP
    };
    return detail::parseByName(value, all, "action");
}

inline Mode parseMode(const std::string &value)
{
    static const std::array<Mode, 2> all = {Mode::SAFE_HARBOR, Mode::RISK_BASED};
    return detail::parseByName(value, all, "mode");
}

inline Policy parsePolicy(const std::string &value)
{
    static const std::array<Policy, 3> all = {Policy::HIPAA, Policy::GENERIC_PII, Policy::CUSTOM};
    return detail::parseByName(value, all, "policy");
}

/**
 * @brief Highlight color (hex) of an entity type, for rendering layers.
 */
inline const char* entityColor(EntityType t)
{
    switch (t) {
    case EntityType::PERSON_NAME:    return "#FFE082";
    case EntityType::DATE:           return "#4DB6AC";
    case EntityType::PHONE:
    case EntityType::EMAIL:          return "#CE93D8";
    case EntityType::ADDRESS:
    case EntityType::LOCATION:       return "#81C784";
    case EntityType::SSN:
    case EntityType::MRN:
    case EntityType::PASSPORT:
    case EntityType::CREDIT_CARD:
    case EntityType::IP_ADDRESS:
    case EntityType::MEDICAL_RECORD:
    case EntityType::INSURANCE_ID:
    case EntityType::BANK_ACCOUNT:   return "#EF5350";
    case EntityType::VEHICLE_ID:     return "#FFB74D";
    case EntityType::DEVICE_ID:      return "#90CAF9";
    case EntityType::ORGANIZATION:   return "#F48FB1";
    case EntityType::USERNAME:       return "#B39DDB";
    case EntityType::PASSWORD:
    case EntityType::API_KEY:        return "#FF5722";
    case EntityType::GENERIC_PII:    return "#BDBDBD";
    }
    return "#BDBDBD";
}

/**
 * @brief The full EntityType -> color legend, in declaration order.
 */
inline std::array<std::pair<EntityType, std::string>, 21> entityLegend()
{
    std::array<std::pair<EntityType, std::string>, 21> legend;
    const auto &all = allEntityTypes();
    for (std::size_t i = 0; i < all.size(); ++i) {
        legend[i] = {all[i], entityColor(all[i])};
    }
    return legend;
}

} // namespace core
} // namespace phiscrub

#endif // PHISCRUB_CORE_ENTITY_TYPES_HPP
