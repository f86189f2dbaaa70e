#include "siweauth/core/auth_api.hpp"
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/util/logger.hpp"
#include "siweauth/core/util/time.hpp"
#include <format>

namespace siweauth {

    namespace {

        std::string successMessage(const char* what) {
            return std::format("Successful {}.", what);
        }

        nlohmann::json fieldErrors(const std::vector<FieldError>& fields) {
            auto arr = nlohmann::json::array();
            for (const auto& f : fields) {
                nlohmann::json e = { { "message", f.message } };
                if (f.field == "message" || f.field == "signature")
                    e["field"] = f.field;
                else if (!f.field.empty())
                    e["field"] = "message." + f.field;
                arr.push_back(std::move(e));
            }
            return arr;
        }

        nlohmann::json walletJson(const WalletProfile& p) {
            const auto& w = p.wallet;
            nlohmann::json groups = nlohmann::json::array();
            for (const auto& g : p.groups)
                groups.push_back({ { "name", g } });
            return {
                { "ethereum_address", crypto::toChecksumAddress(w.address) },
                { "ens_name", w.ensName ? nlohmann::json(*w.ensName) : nlohmann::json(nullptr) },
                { "ens_avatar", w.ensAvatar ? nlohmann::json(*w.ensAvatar) : nlohmann::json(nullptr) },
                { "is_active", w.isActive },
                { "is_admin", w.isAdmin },
                { "groups", groups },
            };
        }

        ApiResponse missingSession() {
            return AuthApi::errorResponse({ AuthErr::SessionNotFound, "no session", {} });
        }

    }

    int AuthApi::statusFor(AuthErr code) noexcept
    {
        switch (code) {
            case AuthErr::MalformedMessage:
                return 400;
            case AuthErr::DomainMismatch:
            case AuthErr::InvalidNonce:
            case AuthErr::MessageExpired:
            case AuthErr::MessageNotYetValid:
            case AuthErr::SignatureMismatch:
            case AuthErr::SessionNotFound:
            case AuthErr::SessionExpired:
                return 401;
            case AuthErr::WalletDisabled:
                return 403;
            default:
                return 500;
        }
    }

    ApiResponse AuthApi::errorResponse(const ErrorObj& err)
    {
        ApiResponse r;
        r.status = statusFor(err.code);
        r.body = { { "success", false }, { "error", toString(err.code) } };
        switch (r.status) {
            case 400:
                r.body["message"] = kMessage400;
                r.body["errors"] = err.fields.empty()
                    ? nlohmann::json::array({ { { "message", err.msg } } })
                    : fieldErrors(err.fields);
                break;
            case 401:
                r.body["message"] = kMessage401;
                if (err.code == AuthErr::SessionExpired || err.code == AuthErr::SessionNotFound)
                    r.clearSession = true;
                break;
            case 403:
                r.body["message"] = kMessage403;
                break;
            default:
                r.body["message"] = kMessage500;
                r.body["errors"] = nlohmann::json::array({ { { "message", err.msg } } });
                break;
        }
        return r;
    }

    template<typename F>
    ApiResponse AuthApi::guarded(const char* op, F&& fn)
    {
        try {
            return fn();
        }
        catch (const AuthError& e) {
            if (statusFor(e.code()) == 500)
                LOG_ERROR(std::format("{}: {} ({})", op, e.what(), toString(e.code())));
            else
                LOG_DEBUG(std::format("{} rejected: {} ({})", op, e.what(), toString(e.code())));
            return errorResponse({ e.code(), e.what(), e.fields() });
        }
        catch (const std::exception& e) {
            LOG_ERROR(std::format("{}: unexpected error: {}", op, e.what()));
            return errorResponse({ AuthErr::Internal, e.what(), {} });
        }
    }

    ApiResponse AuthApi::nonce()
    {
        return guarded("nonce", [&] {
            ApiResponse r;
            r.body = { { "success", true }, { "nonce", auth_.requestNonce() } };
            return r;
        });
    }

    ApiResponse AuthApi::login(std::string_view rawBody)
    {
        return guarded("login", [&] {
            auto body = nlohmann::json::parse(rawBody, nullptr, false);
            if (body.is_discarded() || !body.is_object())
                throw AuthError(AuthErr::MalformedMessage, "request body must be a JSON object");

            std::vector<FieldError> missing;
            auto msg = body.find("message");
            if (msg == body.end() || !(msg->is_object() || msg->is_string()))
                missing.push_back({ "message", "field is required" });
            auto sig = body.find("signature");
            if (sig == body.end() || !sig->is_string())
                missing.push_back({ "signature", "field is required" });
            if (!missing.empty())
                throw AuthError(AuthErr::MalformedMessage, "missing fields", std::move(missing));

            const auto& signature = sig->get_ref<const std::string&>();
            auto result = msg->is_string()
                ? auth_.loginText(msg->get_ref<const std::string&>(), signature)
                : auth_.login(SiweMessage::fromJson(*msg), signature);

            ApiResponse r;
            r.body = {
                { "success", true },
                { "message", successMessage("login") },
                { "session_id", result.session.id },
                { "address", result.session.address },
                { "expires_at", formatRfc3339(static_cast<std::int64_t>(result.session.expiresMs)) },
            };
            r.setSession = result.session.id;
            return r;
        });
    }

    ApiResponse AuthApi::refresh(const std::optional<std::string>& sessionId)
    {
        if (!sessionId || sessionId->empty()) return missingSession();
        return guarded("refresh", [&] {
            auto s = auth_.refresh(*sessionId);
            ApiResponse r;
            r.body = {
                { "success", true },
                { "message", successMessage("session refresh") },
                { "session_id", s.id },
                { "expires_at", formatRfc3339(static_cast<std::int64_t>(s.expiresMs)) },
            };
            r.setSession = s.id;
            return r;
        });
    }

    ApiResponse AuthApi::verify(const std::optional<std::string>& sessionId)
    {
        if (!sessionId || sessionId->empty()) return missingSession();
        return guarded("verify", [&] {
            ApiResponse r;
            r.body = {
                { "success", true },
                { "message", successMessage("session verify") },
                { "address", auth_.verify(*sessionId) },
            };
            return r;
        });
    }

    ApiResponse AuthApi::logout(const std::optional<std::string>& sessionId)
    {
        return guarded("logout", [&] {
            if (sessionId && !sessionId->empty())
                auth_.logout(*sessionId);
            ApiResponse r;
            r.body = { { "success", true }, { "message", successMessage("logout") } };
            r.clearSession = true;
            return r;
        });
    }

    ApiResponse AuthApi::me(const std::optional<std::string>& sessionId)
    {
        if (!sessionId || sessionId->empty()) return missingSession();
        return guarded("me", [&] {
            ApiResponse r;
            r.body = { { "success", true }, { "wallet", walletJson(auth_.me(*sessionId)) } };
            return r;
        });
    }

}
