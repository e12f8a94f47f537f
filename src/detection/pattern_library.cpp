#include "detection/pattern_library.hpp"

#include "util/errors.hpp"

namespace phiscrub {
namespace detection {

namespace {

using core::EntityType;
using core::Severity;

const bool kCaseSensitive = true;
const bool kIgnoreCase = false;

// A capitalized name token; a second capital without a space covers
// MacKenzie / McDonald style surnames.
const std::string kNameToken = "[A-Z][a-z]+(?:[A-Z][a-z]+)?";

// Area: any three digits but 000, 666 and 9xx. Group: not 00. Serial: not 0000.
const char* const kSsn =
    R"(\b(?:00[1-9]|0[1-9]\d|[1-578]\d{2}|6[0-57-9]\d|66[0-57-9]))"
    R"([-\s]?(?:0[1-9]|[1-9]\d))"
    R"([-\s]?(?:000[1-9]|00[1-9]\d|0[1-9]\d{2}|[1-9]\d{3})\b)";

const char* const kPhone =
    R"(\b(?:\+?1[-.\s]?)?(?:\(?\d{3}\)?[-.\s]?)?\d{3}[-.\s]?\d{4}\b)";

const char* const kEmail =
    R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)";

const char* const kIpAddress =
    R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3})"
    R"((?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)";

const char* const kCreditCard =
    R"(\b(?:4[0-9]{12}(?:[0-9]{3})?|)"
    R"(5[1-5][0-9]{14}|)"
    R"(3[47][0-9]{13}|)"
    R"(6(?:011|5[0-9]{2})[0-9]{12}|)"
    R"((?:2131|1800|35\d{3})\d{11})\b)";

const char* const kPassport = R"(\b[0-9]{9}\b)";

// MM/DD/[YY]YY or [YY]YY/MM/DD, '/' or '-' separated.
const char* const kDateNumeric =
    R"(\b(?:(?:0?[1-9]|1[0-2])[/-](?:0?[1-9]|[12][0-9]|3[01])[/-](?:19|20)?\d{2}|)"
    R"((?:19|20)?\d{2}[/-](?:0?[1-9]|1[0-2])[/-](?:0?[1-9]|[12][0-9]|3[01]))\b)";

const char* const kDateVerbal =
    R"(\b(?:January|February|March|April|May|June|July|August|September|October|)"
    R"(November|December)\s+\d{1,2},?\s+\d{4}\b)";

const char* const kMrn =
    R"(\b(?:MRN|mrn|Medical\s*Record\s*[#]?\s*)[:#]?\s*([A-Z0-9-]{5,15})\b)";

const char* const kInsuranceId =
    R"(\b(?:Policy|Policy\s*#|Member\s*ID|Insurance|Insurance\s*ID)[:#]?\s*)"
    R"(([A-Z0-9-]{6,12})\b)";

const char* const kVin = R"(\b[A-HJ-NPR-Z0-9]{17}\b)";

const char* const kDeviceId =
    R"(\b(?:Device|Device\s*ID)[:#]?\s*([A-Fa-f0-9-]{8,36})\b)";

const char* const kBankAccount =
    R"(\b(?:Account|Account\s*#|Account\s*Number|Bank|Bank\s*Account)[:#]?\s*)"
    R"(([0-9]{8,17})\b)";

const char* const kApiKey =
    R"(\b(?:api[_-]?key|apikey|token|auth[_-]?token|access[_-]?key)[=:]\s*)"
    R"(([A-Za-z0-9_-]{20,})\b)";

const char* const kPassword =
    R"(\b(?:password|passwd|pwd)[=:]\s*(\S{4,})\b)";

const char* const kAddress =
    R"(\b\d{1,5}\s+(?:[A-Za-z]+\s+){1,4}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|)"
    R"(Blvd|Drive|Dr|Lane|Ln|Court|Ct|Way|Place|Pl)\.?\b)";

std::string personTitle()
{
    return R"(\b(?:Dr\.?|Mr\.?|Mrs\.?|Ms\.?|Doctor)\s+)" + kNameToken
        + R"((?:\s+)" + kNameToken + R"()*\b)";
}

std::string personBasic()
{
    return R"(\b)" + kNameToken + R"(\s+)" + kNameToken + R"(\b)";
}

} // namespace

void PatternLibrary::add(const std::string &name,
                         core::EntityType type,
                         const std::string &expression,
                         bool caseSensitive,
                         double confidence,
                         core::Severity severity,
                         const std::string &provenance)
{
    re2::RE2::Options options;
    options.set_case_sensitive(caseSensitive);
    options.set_log_errors(false);
    auto matcher = std::make_shared<const re2::RE2>(expression, options);
    if (!matcher->ok()) {
        throw util::InvalidConfigError("pattern '" + name + "' does not compile: " + matcher->error());
    }

    PatternEntry entry;
    entry.name = name;
    entry.type = type;
    entry.matcher = std::move(matcher);
    entry.confidence = confidence;
    entry.severity = severity;
    entry.provenance = provenance;
    entries_.push_back(std::move(entry));
}

const PatternEntry* PatternLibrary::find(const std::string &name) const
{
    for (const auto &entry : entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

PatternLibrary PatternLibrary::builtin()
{
    const std::string regex = core::kProvenanceRegex;
    PatternLibrary lib;

    lib.add("ssn",          EntityType::SSN,          kSsn,         kIgnoreCase,    0.95, Severity::HIGH,   regex);
    lib.add("phone",        EntityType::PHONE,        kPhone,       kCaseSensitive, 0.85, Severity::MEDIUM, regex);
    lib.add("email",        EntityType::EMAIL,        kEmail,       kIgnoreCase,    0.90, Severity::MEDIUM, regex);
    lib.add("ip_address",   EntityType::IP_ADDRESS,   kIpAddress,   kCaseSensitive, 0.85, Severity::MEDIUM, regex);
    lib.add("credit_card",  EntityType::CREDIT_CARD,  kCreditCard,  kCaseSensitive, 0.90, Severity::HIGH,   regex);
    lib.add("passport",     EntityType::PASSPORT,     kPassport,    kCaseSensitive, 0.85, Severity::HIGH,   regex);
    lib.add("date",         EntityType::DATE,         kDateNumeric, kCaseSensitive, 0.80, Severity::LOW,    regex);
    lib.add("mrn",          EntityType::MRN,          kMrn,         kIgnoreCase,    0.85, Severity::HIGH,   regex);
    lib.add("insurance_id", EntityType::INSURANCE_ID, kInsuranceId, kIgnoreCase,    0.80, Severity::HIGH,   regex);
    lib.add("vehicle_id",   EntityType::VEHICLE_ID,   kVin,         kCaseSensitive, 0.85, Severity::MEDIUM, regex);
    lib.add("device_id",    EntityType::DEVICE_ID,    kDeviceId,    kIgnoreCase,    0.80, Severity::MEDIUM, regex);
    lib.add("bank_account", EntityType::BANK_ACCOUNT, kBankAccount, kIgnoreCase,    0.80, Severity::HIGH,   regex);
    lib.add("api_key",      EntityType::API_KEY,      kApiKey,      kIgnoreCase,    0.85, Severity::HIGH,   regex);
    lib.add("password",     EntityType::PASSWORD,     kPassword,    kIgnoreCase,    0.90, Severity::HIGH,   regex);
    lib.add("address",      EntityType::ADDRESS,      kAddress,     kIgnoreCase,    0.75, Severity::MEDIUM, regex);

    // Date family; the numeric form repeats the main table's "date" entry.
    lib.add("date_numeric", EntityType::DATE, kDateNumeric, kCaseSensitive, 0.80, Severity::LOW, regex);
    lib.add("date_verbal",  EntityType::DATE, kDateVerbal,  kIgnoreCase,    0.80, Severity::LOW, regex);

    // Person names.
    lib.add("person_title", EntityType::PERSON_NAME, personTitle(), kCaseSensitive,
            0.95, Severity::HIGH, core::kProvenanceRegexTitle);
    lib.add("person_basic", EntityType::PERSON_NAME, personBasic(), kCaseSensitive,
            0.70, Severity::HIGH, core::kProvenanceRegexBasic);

    return lib;
}

const PatternLibrary& PatternLibrary::defaultLibrary()
{
    static const PatternLibrary instance = builtin();
    return instance;
}

} // namespace detection
} // namespace phiscrub
