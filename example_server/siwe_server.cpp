// Example HTTP server exposing the SIWE authentication endpoints.
//
//   GET  /api/auth/nonce
//   POST /api/auth/login      {"message": {...}, "signature": "0x..."}
//   POST /api/auth/refresh
//   GET  /api/auth/verify
//   POST /api/auth/logout
//   GET  /api/auth/me
//
// Usage: siwe_server <config.json> [port]

#include "siweauth/siweauth.hpp"
#include "siweauth/core/util/hex.hpp"
#include "siweauth/core/util/thread_pool.hpp"
#include "utils/http_util.hpp"

#include <uwebsockets/App.h>
#include <openssl/rand.h>

#include <array>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace siweauth;
using namespace siweauth::example;

namespace {

    constexpr std::string_view kSessionCookie = "siwe_session";
    constexpr std::string_view kCsrfCookie = "csrftoken";
    constexpr std::string_view kCsrfHeader = "x-csrftoken";

    std::string csrfToken() {
        std::array<std::uint8_t, 16> buf{};
        if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
            throw std::runtime_error("RAND_bytes failed");
        return toHex(buf);
    }

    const char* statusLine(int status) {
        switch (status) {
            case 200: return "200 OK";
            case 400: return "400 Bad Request";
            case 401: return "401 Unauthorized";
            case 403: return "403 Forbidden";
            default:  return "500 Internal Server Error";
        }
    }

    template<typename Res>
    void send(Res* res, const ApiResponse& r, const std::optional<std::string>& newCsrf = std::nullopt) {
        res->writeStatus(statusLine(r.status));
        res->writeHeader("Content-Type", "application/json");
        if (r.setSession)
            res->writeHeader("Set-Cookie",
                std::format("{}={}; Path=/; HttpOnly; SameSite=Lax", kSessionCookie, *r.setSession));
        else if (r.clearSession)
            res->writeHeader("Set-Cookie", std::format("{}=; Path=/; Max-Age=0", kSessionCookie));
        if (newCsrf)
            res->writeHeader("Set-Cookie", std::format("{}={}; Path=/; SameSite=Lax", kCsrfCookie, *newCsrf));
        res->end(r.body.dump());
    }

    ApiResponse csrfRejected() {
        ApiResponse r;
        r.status = 403;
        r.body = { { "success", false }, { "message", AuthApi::kMessage403 }, { "error", "CsrfFailed" } };
        return r;
    }

}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json> [port]\n";
        return 2;
    }
    int port = 8080;
    if (argc > 2) {
        auto p = parsePort(argv[2]);
        if (!p) {
            std::cerr << "invalid port '" << argv[2] << "'\n";
            return 2;
        }
        port = *p;
    }

    std::unique_ptr<Authenticator> auth;
    try {
        auth = std::make_unique<Authenticator>(loadConfigFile(argv[1]), AuthDependencies::inMemory());
    }
    catch (const AuthError& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    }

    AuthApi api(*auth);
    ThreadPool workers;
    const bool csrfExempt = auth->config().csrfExempt;

    // POST handlers must carry the CSRF header matching the cookie unless exempt.
    auto csrfOk = [csrfExempt](uWS::HttpRequest* req) {
        if (csrfExempt) return true;
        return csrfMatches(cookieValue(req->getHeader("cookie"), kCsrfCookie), req->getHeader(kCsrfHeader));
    };
    auto session = [](uWS::HttpRequest* req) {
        return cookieValue(req->getHeader("cookie"), kSessionCookie);
    };

    uWS::App app{};

    app.get("/api/auth/nonce", [&api, csrfExempt](auto* res, auto* req) {
        std::optional<std::string> newCsrf;
        if (!csrfExempt && !cookieValue(req->getHeader("cookie"), kCsrfCookie))
            newCsrf = csrfToken();
        send(res, api.nonce(), newCsrf);
    });

    app.post("/api/auth/login", [&api, &workers, csrfOk](auto* res, auto* req) {
        if (!csrfOk(req)) {
            send(res, csrfRejected());
            return;
        }
        auto aborted = std::make_shared<bool>(false);
        auto body = std::make_shared<std::string>();
        auto* loop = uWS::Loop::get();

        res->onAborted([aborted] { *aborted = true; });
        res->onData([res, aborted, body, loop, &api, &workers](std::string_view chunk, bool last) {
            body->append(chunk);
            if (!last) return;
            // verification and chain reads block, keep them off the event loop
            workers.submit([res, aborted, body, loop, &api] {
                auto out = std::make_shared<ApiResponse>(api.login(*body));
                loop->defer([res, aborted, out] {
                    if (!*aborted) send(res, *out);
                });
            });
        });
    });

    app.post("/api/auth/refresh", [&api, csrfOk, session](auto* res, auto* req) {
        if (!csrfOk(req)) { send(res, csrfRejected()); return; }
        send(res, api.refresh(session(req)));
    });

    app.get("/api/auth/verify", [&api, session](auto* res, auto* req) {
        send(res, api.verify(session(req)));
    });

    app.post("/api/auth/logout", [&api, csrfOk, session](auto* res, auto* req) {
        if (!csrfOk(req)) { send(res, csrfRejected()); return; }
        send(res, api.logout(session(req)));
    });

    app.get("/api/auth/me", [&api, session](auto* res, auto* req) {
        send(res, api.me(session(req)));
    });

    app.listen(port, [port](auto* tok) {
        if (tok)
            LOG_INFO(std::format("siwe_server listening on {}", port));
        else
            LOG_ERROR(std::format("cannot bind port {}", port));
    });

    app.run();
    return 0;
}
