#include "privacy.hpp"
#include "memory/sqlite_store.hpp"
#include "util.hpp"
#include <cctype>
#include <iostream>

namespace engram {

namespace {

// Value must not already be a marker, which keeps sanitize() idempotent.
constexpr const char* kNotMarker = R"((?!\[REDACTED\]))";

// Keys may carry an identifier prefix (DB_PASSWORD, STRIPE_API_KEY).
constexpr const char* kKeyStart = R"((?:\b|_))";

// Quantifiers stay bounded: std::regex matches recursively per character.
// A longer value is cut at the bound and its tail absorbed by collapse_markers().
constexpr const char* kSep = R"(["']?\s{0,8}[:=]\s{0,8})";
constexpr const char* kRun = "{1,512}";

struct RuleSpec {
    const char* name;
    std::string pattern;
    bool keep_prefix;
    bool icase;
};

std::string key_value(const std::string& key, const std::string& value_class) {
    return "(" + std::string(kKeyStart) + key + kSep + ")" + kNotMarker + R"(["']?)" +
           value_class + kRun + R"(["']?)";
}

// Ordered: header/credential forms first so their values are consumed whole.
std::vector<RuleSpec> builtin_rules() {
    const std::string nm = kNotMarker;
    const std::string run = kRun;
    return {
        {"authorization",
         R"((\bauthorization["']?\s{0,8}:\s{0,8}))" + nm +
             R"(["']?(?:(?:bearer|basic|token|digest)\s{1,8})?[^"'\s])" + run + R"(["']?)",
         true, true},
        {"bearer", R"((\bbearer\s{1,8}))" + nm + R"([\w.~+/=-])" + run, true, true},
        {"api_key", key_value(R"(api[_-]?key)", R"([\w.-])"), true, true},
        {"password", key_value(R"((?:password|passwd|pwd))", R"([^"'\s])"), true, true},
        {"secret", key_value(R"((?:client_)?secret)", R"([\w./+=-])"), true, true},
        {"token", key_value(R"((?:access_|refresh_|auth_)?token)", R"([\w./+=-])"), true,
         true},
        {"aws_credential", R"((\baws_(?:access_key_id|secret_access_key))" + std::string(kSep) +
                               ")" + nm + R"(["']?[A-Za-z0-9/+=])" + run + R"(["']?)",
         true, true},
        {"database_env", key_value(R"((?:DATABASE_URL|REDIS_URL|MONGO_URI))", R"([^"'\s])"),
         true, true},
        {"ssh_key", R"(ssh-(?:rsa|ed25519|dss)\s{1,8}[A-Za-z0-9+/=]{16,1024})", false, true},
        {"aws_access_key", R"(\bAKIA[0-9A-Z]{16}\b)", false, false},
        {"provider_key", R"(\bsk-(?:ant-|proj-)?[A-Za-z0-9_-]{16,512})", false, true},
        {"github_token", R"(\bgh[pousr]_[A-Za-z0-9]{36,512})", false, true},
        {"connection_uri",
         R"(\b(?:mongodb(?:\+srv)?|mysql|postgres(?:ql)?|redis|amqp)://[^\s"'])" + run,
         false, true},
    };
}

bool is_secret_tail_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '.' || c == '~' || c == '+' || c == '/' ||
           c == '=' || c == '-';
}

// Remainder of a value longer than the rule bound, directly after a marker.
size_t skip_value_tail(const std::string& content, size_t pos) {
    if (pos >= content.size() || content[pos] == '.' || !is_secret_tail_char(content[pos])) {
        return pos;
    }
    while (pos < content.size() && is_secret_tail_char(content[pos])) ++pos;
    return pos;
}

} // namespace

std::string strip_private_blocks(const std::string& content) {
    static const std::string open_tag = "<private>";
    static const std::string close_tag = "</private>";

    std::string lower = to_lower(content);
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t start = lower.find(open_tag, pos);
        if (start == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        out.append(content, pos, start - pos);
        out += kPrivateMarker;
        size_t end = lower.find(close_tag, start + open_tag.size());
        if (end == std::string::npos) break;
        pos = end + close_tag.size();
    }
    return out;
}

std::string strip_pem_blocks(const std::string& content) {
    std::string lower = to_lower(content);
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t begin = lower.find("-----begin ", pos);
        if (begin == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        size_t header_end = lower.find("-----", begin + 11);
        if (header_end == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        std::string label = lower.substr(begin + 11, header_end - begin - 11);
        if (label.find("private key") == std::string::npos) {
            // Certificates and public keys pass through
            out.append(content, pos, header_end + 5 - pos);
            pos = header_end + 5;
            continue;
        }
        out.append(content, pos, begin - pos);
        out += kRedactedMarker;
        size_t end = lower.find("-----end ", header_end + 5);
        if (end == std::string::npos) return out;
        size_t end_close = lower.find("-----", end + 9);
        if (end_close == std::string::npos) return out;
        pos = end_close + 5;
    }
    return out;
}

std::string collapse_markers(const std::string& content) {
    static const std::string marker = kRedactedMarker;
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t at = content.find(marker, pos);
        if (at == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        out.append(content, pos, at - pos);
        out += marker;
        pos = at + marker.size();

        // Markers separated only by whitespace fold into one
        while (true) {
            pos = skip_value_tail(content, pos);
            size_t next = pos;
            while (next < content.size() &&
                   std::isspace(static_cast<unsigned char>(content[next]))) {
                ++next;
            }
            if (content.compare(next, marker.size(), marker) != 0) break;
            pos = next + marker.size();
        }
    }
    return out;
}

Sanitizer::Sanitizer(const PrivacyConfig& config)
    : max_content_chars_(config.max_content_chars) {
    for (const auto& spec : builtin_rules()) {
        auto flags = std::regex::ECMAScript;
        if (spec.icase) flags |= std::regex::icase;
        rules_.push_back({spec.name, std::regex(spec.pattern, flags), spec.keep_prefix});
    }
    for (const auto& pattern : config.extra_patterns) {
        try {
            rules_.push_back({"custom", std::regex(pattern, std::regex::ECMAScript |
                                                                std::regex::icase),
                              false});
        } catch (const std::regex_error& e) {
            std::cerr << "[privacy] Ignoring invalid pattern '" << pattern
                      << "': " << e.what() << "\n";
        }
    }
}

std::string Sanitizer::apply_rules(const std::string& content) const {
    std::string out = strip_pem_blocks(content);
    for (const auto& rule : rules_) {
        out = std::regex_replace(out, rule.pattern,
                                 rule.keep_prefix ? std::string("$1") + kRedactedMarker
                                                  : std::string(kRedactedMarker));
    }
    return collapse_markers(out);
}

std::string Sanitizer::sanitize(const std::string& content) const {
    if (content.empty()) return content;
    try {
        return apply_rules(strip_private_blocks(content));
    } catch (const std::regex_error& e) {
        std::cerr << "[privacy] Redaction failed (" << e.what()
                  << "), withholding content\n";
        return kRedactedMarker;
    }
}

bool Sanitizer::contains_sensitive_data(const std::string& content) const {
    if (content.empty()) return false;
    if (strip_pem_blocks(content) != content) return true;
    try {
        for (const auto& rule : rules_) {
            if (std::regex_search(content, rule.pattern)) return true;
        }
    } catch (const std::regex_error& e) {
        std::cerr << "[privacy] Pattern scan failed: " << e.what() << "\n";
        return true;
    }
    return false;
}

StorageValidation Sanitizer::validate_for_storage(const std::string& content) const {
    StorageValidation v;

    std::string bounded = content;
    if (content.size() > max_content_chars_) {
        bounded = truncate_utf8(content, max_content_chars_);
        v.truncated = true;
        v.warnings.push_back("Content truncated from " + std::to_string(content.size()) +
                             " to " + std::to_string(bounded.size()) + " bytes");
    }

    if (to_lower(bounded).find("<private>") != std::string::npos) {
        v.warnings.push_back("Private blocks removed");
    }
    if (contains_sensitive_data(bounded)) {
        v.warnings.push_back("Sensitive data detected and redacted");
    }

    v.content = truncate_utf8(sanitize(bounded), max_content_chars_);
    return v;
}

Memory Sanitizer::anonymize(const Memory& memory) const {
    Memory out = memory;
    out.title = sanitize(memory.title);
    out.content = sanitize(memory.content);
    for (auto& fact : out.facts) fact = sanitize(fact);
    out.session_id.reset();
    out.source_files.clear();
    return out;
}

// ── Maintenance ──────────────────────────────────────────────────

PrivacyManager::PrivacyManager(SqliteStore& store, const PrivacyConfig& config,
                               uint32_t batch_size)
    : store_(store), config_(config), batch_size_(batch_size == 0 ? 500 : batch_size) {}

uint32_t PrivacyManager::delete_older_than(uint32_t days) {
    uint64_t now = epoch_seconds();
    uint64_t span = static_cast<uint64_t>(days) * 86400;
    uint64_t cutoff = now > span ? now - span : 0;
    uint32_t removed = store_.delete_created_before(cutoff, batch_size_);
    if (removed > 0) {
        std::cerr << "[privacy] Retention removed " << removed
                  << " memories older than " << days << " days\n";
    }
    return removed;
}

uint32_t PrivacyManager::trim_to_max(uint32_t max) {
    uint32_t removed = store_.trim_to_max(max, batch_size_);
    if (removed > 0) {
        std::cerr << "[privacy] Trimmed " << removed << " memories to ceiling "
                  << max << "\n";
    }
    return removed;
}

MaintenanceReport PrivacyManager::run_maintenance() {
    MaintenanceReport report;
    report.expired = delete_older_than(config_.retention_days);
    report.trimmed = trim_to_max(config_.max_memories);
    return report;
}

} // namespace engram
