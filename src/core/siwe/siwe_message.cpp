#include "siweauth/core/siwe/siwe_message.hpp"
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/util/time.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace siweauth {

    namespace {

        constexpr std::string_view kUri        = "URI: ";
        constexpr std::string_view kVersion    = "Version: ";
        constexpr std::string_view kChainId    = "Chain ID: ";
        constexpr std::string_view kNonce      = "Nonce: ";
        constexpr std::string_view kIssuedAt   = "Issued At: ";
        constexpr std::string_view kExpiration = "Expiration Time: ";
        constexpr std::string_view kNotBefore  = "Not Before: ";
        constexpr std::string_view kRequestId  = "Request ID: ";
        constexpr std::string_view kResources  = "Resources:";

        [[noreturn]] void malformed(const std::string& field, const std::string& what) {
            throw AuthError(AuthErr::MalformedMessage,
                std::format("malformed SIWE message: {}", what), { { field, what } });
        }

        std::vector<std::string_view> splitLines(std::string_view text) {
            std::vector<std::string_view> lines;
            std::size_t start = 0;
            while (true) {
                auto nl = text.find('\n', start);
                if (nl == std::string_view::npos) {
                    lines.push_back(text.substr(start));
                    break;
                }
                lines.push_back(text.substr(start, nl - start));
                start = nl + 1;
            }
            return lines;
        }

        std::optional<std::uint64_t> parseChainId(std::string_view s) {
            if (s.empty() || s.size() > 19) return std::nullopt;
            std::uint64_t v = 0;
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
            return v;
        }

        bool hasWhitespace(std::string_view s) {
            return std::any_of(s.begin(), s.end(),
                [](unsigned char c) { return std::isspace(c) != 0; });
        }

        /// scheme ":" rest, scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
        bool looksLikeUri(std::string_view s) {
            auto colon = s.find(':');
            if (colon == std::string_view::npos || colon == 0 || colon + 1 >= s.size()) return false;
            if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
            for (std::size_t i = 1; i < colon; ++i) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
            }
            return !hasWhitespace(s);
        }

        /// Cursor over the message lines, consuming "Tag: value" lines in order.
        class LineReader {
        public:
            explicit LineReader(std::vector<std::string_view> lines) : lines_(std::move(lines)) {}

            bool done() const { return pos_ >= lines_.size(); }

            std::string_view next(const std::string& field) {
                if (done()) malformed(field, std::format("missing {}", field));
                return lines_[pos_++];
            }

            std::string tagged(std::string_view tag, const std::string& field) {
                auto line = next(field);
                if (!line.starts_with(tag))
                    malformed(field, std::format("expected '{}'", tag.substr(0, tag.size() - 1)));
                return std::string(line.substr(tag.size()));
            }

            std::optional<std::string> optionalTagged(std::string_view tag) {
                if (done() || !lines_[pos_].starts_with(tag)) return std::nullopt;
                return std::string(lines_[pos_++].substr(tag.size()));
            }

            bool peekIs(std::string_view exact) const {
                return !done() && lines_[pos_] == exact;
            }

            void skip() { ++pos_; }

        private:
            std::vector<std::string_view> lines_;
            std::size_t                   pos_{ 0 };
        };

        void readOptionalString(const nlohmann::json& j, const char* key,
                                std::optional<std::string>& out, std::vector<FieldError>& errs)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            if (!it->is_string()) {
                errs.push_back({ key, "must be a string" });
                return;
            }
            out = it->get<std::string>();
        }

        void readString(const nlohmann::json& j, const char* key,
                        std::string& out, std::vector<FieldError>& errs)
        {
            std::optional<std::string> v;
            readOptionalString(j, key, v, errs);
            if (v) out = std::move(*v);
        }

    }

    /*──────────────── Text form ───────────────*/
    SiweMessage SiweMessage::parse(std::string_view text)
    {
        if (text.ends_with('\n')) text.remove_suffix(1);
        LineReader in(splitLines(text));
        SiweMessage m;

        auto header = in.next("domain");
        if (!header.ends_with(kHeaderSuffix))
            malformed("domain", "invalid header line");
        std::string_view authority = header.substr(0, header.size() - kHeaderSuffix.size());
        if (auto sep = authority.find("://"); sep != std::string_view::npos) {
            m.scheme = std::string(authority.substr(0, sep));
            authority.remove_prefix(sep + 3);
        }
        m.domain = std::string(authority);

        m.address = std::string(in.next("address"));
        if (in.next("statement") != "")
            malformed("statement", "expected an empty line after the address");

        // address LF LF [ statement LF ] LF "URI: "
        if (in.peekIs("")) {
            in.skip();
        }
        else {
            m.statement = std::string(in.next("statement"));
            if (in.next("statement") != "")
                malformed("statement", "expected an empty line after the statement");
        }

        m.uri = in.tagged(kUri, "uri");
        m.version = in.tagged(kVersion, "version");
        auto chain = in.tagged(kChainId, "chainId");
        auto chainId = parseChainId(chain);
        if (!chainId) malformed("chainId", "invalid chain id");
        m.chainId = *chainId;
        m.nonce = in.tagged(kNonce, "nonce");
        m.issuedAt = in.tagged(kIssuedAt, "issuedAt");
        m.expirationTime = in.optionalTagged(kExpiration);
        m.notBefore = in.optionalTagged(kNotBefore);
        m.requestId = in.optionalTagged(kRequestId);

        if (in.peekIs(kResources)) {
            in.skip();
            while (!in.done()) {
                auto line = in.next("resources");
                if (!line.starts_with("- "))
                    malformed("resources", "resource lines must start with '- '");
                m.resources.emplace_back(line.substr(2));
            }
        }
        if (!in.done())
            malformed("message", "unexpected trailing content");
        return m;
    }

    std::string SiweMessage::toString() const
    {
        std::string out;
        if (scheme) out += *scheme + "://";
        out += domain;
        out += kHeaderSuffix;
        out += '\n';
        out += address + "\n\n";
        if (statement) out += *statement + '\n';
        out += '\n';
        out += std::format("{}{}\n", kUri, uri);
        out += std::format("{}{}\n", kVersion, version);
        out += std::format("{}{}\n", kChainId, chainId);
        out += std::format("{}{}\n", kNonce, nonce);
        out += std::format("{}{}", kIssuedAt, issuedAt);
        if (expirationTime) out += std::format("\n{}{}", kExpiration, *expirationTime);
        if (notBefore)      out += std::format("\n{}{}", kNotBefore, *notBefore);
        if (requestId)      out += std::format("\n{}{}", kRequestId, *requestId);
        if (!resources.empty()) {
            out += '\n';
            out += kResources;
            for (const auto& r : resources) out += "\n- " + r;
        }
        return out;
    }

    /*──────────────── JSON form ───────────────*/
    SiweMessage SiweMessage::fromJson(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw AuthError(AuthErr::MalformedMessage, "message must be a JSON object",
                { { "message", "must be an object" } });

        SiweMessage m;
        m.version.clear();
        std::vector<FieldError> errs;

        readOptionalString(j, "scheme", m.scheme, errs);
        readString(j, "domain", m.domain, errs);
        readString(j, "address", m.address, errs);
        readOptionalString(j, "statement", m.statement, errs);
        readString(j, "uri", m.uri, errs);
        readString(j, "version", m.version, errs);
        readString(j, "nonce", m.nonce, errs);
        readString(j, "issuedAt", m.issuedAt, errs);
        readOptionalString(j, "expirationTime", m.expirationTime, errs);
        readOptionalString(j, "notBefore", m.notBefore, errs);
        readOptionalString(j, "requestId", m.requestId, errs);

        if (auto it = j.find("chainId"); it != j.end() && !it->is_null()) {
            if (it->is_number_unsigned()) {
                m.chainId = it->get<std::uint64_t>();
            }
            else if (it->is_string()) {
                auto v = parseChainId(it->get_ref<const std::string&>());
                if (v) m.chainId = *v;
                else errs.push_back({ "chainId", "must be a positive integer" });
            }
            else {
                errs.push_back({ "chainId", "must be a positive integer" });
            }
        }

        if (auto it = j.find("resources"); it != j.end() && !it->is_null()) {
            if (!it->is_array()) {
                errs.push_back({ "resources", "must be an array of strings" });
            }
            else {
                for (const auto& r : *it) {
                    if (!r.is_string()) {
                        errs.push_back({ "resources", "must be an array of strings" });
                        break;
                    }
                    m.resources.push_back(r.get<std::string>());
                }
            }
        }

        if (!errs.empty())
            throw AuthError(AuthErr::MalformedMessage, "malformed SIWE message", std::move(errs));
        return m;
    }

    nlohmann::json SiweMessage::toJson() const
    {
        nlohmann::json j = {
            { "domain", domain },
            { "address", address },
            { "uri", uri },
            { "version", version },
            { "chainId", chainId },
            { "nonce", nonce },
            { "issuedAt", issuedAt },
        };
        if (scheme)         j["scheme"] = *scheme;
        if (statement)      j["statement"] = *statement;
        if (expirationTime) j["expirationTime"] = *expirationTime;
        if (notBefore)      j["notBefore"] = *notBefore;
        if (requestId)      j["requestId"] = *requestId;
        if (!resources.empty()) j["resources"] = resources;
        return j;
    }

    /*──────────────── Validation ───────────────*/
    std::vector<FieldError> SiweMessage::validate() const
    {
        std::vector<FieldError> errs;
        auto require = [&](const std::string& value, const char* field) {
            if (value.empty()) {
                errs.push_back({ field, "This field is required." });
                return false;
            }
            return true;
        };

        if (require(domain, "domain") && (hasWhitespace(domain) || domain.find('/') != std::string::npos))
            errs.push_back({ "domain", "must be a host name with optional port" });

        if (require(address, "address")) {
            if (!crypto::isHexAddress(address))
                errs.push_back({ "address", "must be 0x followed by 40 hex digits" });
            else if (!crypto::hasValidChecksum(address))
                errs.push_back({ "address", "invalid EIP-55 checksum" });
        }

        if (statement && statement->find('\n') != std::string::npos)
            errs.push_back({ "statement", "must not contain line breaks" });

        if (require(uri, "uri") && !looksLikeUri(uri))
            errs.push_back({ "uri", "must be an absolute URI" });

        if (require(version, "version") && version != "1")
            errs.push_back({ "version", "unsupported version" });

        if (chainId == 0)
            errs.push_back({ "chainId", "This field is required." });

        if (require(nonce, "nonce")) {
            bool alnum = std::all_of(nonce.begin(), nonce.end(),
                [](unsigned char c) { return std::isalnum(c) != 0; });
            if (!alnum || nonce.size() < kMinNonceLength)
                errs.push_back({ "nonce", std::format("must be at least {} alphanumeric characters", kMinNonceLength) });
        }

        if (require(issuedAt, "issuedAt") && !issuedAtMs())
            errs.push_back({ "issuedAt", "must be an RFC 3339 timestamp" });
        if (expirationTime && !expirationTimeMs())
            errs.push_back({ "expirationTime", "must be an RFC 3339 timestamp" });
        if (notBefore && !notBeforeMs())
            errs.push_back({ "notBefore", "must be an RFC 3339 timestamp" });

        if (requestId && hasWhitespace(*requestId))
            errs.push_back({ "requestId", "must not contain whitespace" });

        for (const auto& r : resources) {
            if (!looksLikeUri(r)) {
                errs.push_back({ "resources", "each resource must be an absolute URI" });
                break;
            }
        }
        return errs;
    }

    std::optional<std::int64_t> SiweMessage::issuedAtMs() const {
        return parseRfc3339(issuedAt);
    }

    std::optional<std::int64_t> SiweMessage::expirationTimeMs() const {
        return expirationTime ? parseRfc3339(*expirationTime) : std::nullopt;
    }

    std::optional<std::int64_t> SiweMessage::notBeforeMs() const {
        return notBefore ? parseRfc3339(*notBefore) : std::nullopt;
    }

}
