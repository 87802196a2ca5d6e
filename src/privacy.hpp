#pragma once
#include "config.hpp"
#include "memory.hpp"
#include <regex>
#include <string>
#include <vector>

namespace engram {

class SqliteStore; // forward declare

inline constexpr const char* kRedactedMarker = "[REDACTED]";
inline constexpr const char* kPrivateMarker = "[PRIVATE]";

struct StorageValidation {
    std::string content;                 // sanitized, length-capped
    std::vector<std::string> warnings;
    bool truncated = false;
};

// Redacts secrets and private blocks from free text.
// sanitize() is idempotent and never throws.
class Sanitizer {
public:
    explicit Sanitizer(const PrivacyConfig& config = PrivacyConfig{});

    std::string sanitize(const std::string& content) const;

    bool contains_sensitive_data(const std::string& content) const;

    StorageValidation validate_for_storage(const std::string& content) const;

    // Sanitized copy with session and file provenance removed.
    Memory anonymize(const Memory& memory) const;

private:
    struct Rule {
        std::string name;
        std::regex pattern;
        bool keep_prefix;   // group 1 is a key/label kept in the output
    };

    std::string apply_rules(const std::string& content) const;

    std::vector<Rule> rules_;
    uint32_t max_content_chars_;
};

// Replace every <private>...</private> block (case-insensitive) with the
// private marker. An unterminated block is stripped to end of input.
std::string strip_private_blocks(const std::string& content);

// Replace PEM private key blocks with the redaction marker. A block without
// an END line is redacted to end of input.
std::string strip_pem_blocks(const std::string& content);

// Collapse runs of redaction markers separated only by whitespace, and drop
// any value characters left directly after a marker.
std::string collapse_markers(const std::string& content);

struct MaintenanceReport {
    uint32_t expired = 0;   // removed by retention
    uint32_t trimmed = 0;   // removed by the max-count ceiling
};

// Retention and size ceiling enforcement over the record store.
class PrivacyManager {
public:
    PrivacyManager(SqliteStore& store, const PrivacyConfig& config,
                   uint32_t batch_size);

    // Remove records created more than `days` days ago.
    uint32_t delete_older_than(uint32_t days);

    // Remove lowest-importance, then oldest, records until count <= max.
    uint32_t trim_to_max(uint32_t max);

    // Retention first, then the ceiling, using configured limits.
    MaintenanceReport run_maintenance();

private:
    SqliteStore& store_;
    PrivacyConfig config_;
    uint32_t batch_size_;
};

} // namespace engram
