#pragma once

#include "oatpp/web/server/interceptor/RequestInterceptor.hpp"
#include "oatpp/web/protocol/http/Http.hpp"
#include "oatpp/web/protocol/http/outgoing/ResponseFactory.hpp"
#include <openssl/crypto.h>
#include <memory>
#include <string>
#include <vector>

/**
 * Bearer token check for the control API. An empty token disables the check;
 * the API then relies on being bound to the loopback address.
 */
class AuthInterceptor : public oatpp::web::server::interceptor::RequestInterceptor {
private:
  std::string m_token;
  std::vector<std::string> m_publicPaths;

  // Helper to extract the bearer token from the Authorization header
  std::string getBearerToken(const std::shared_ptr<IncomingRequest>& request) {
    auto header = request->getHeader("Authorization");
    if (!header) {
      return "";
    }

    std::string value = header->c_str();
    std::string prefix = "Bearer ";
    if (value.compare(0, prefix.length(), prefix) != 0) {
      return "";
    }
    return value.substr(prefix.length());
  }

  bool isPublicPath(const std::string& path) {
    for (const auto& publicPath : m_publicPaths) {
      if (path.find(publicPath) == 0) {
        return true;
      }
    }
    return false;
  }

  bool tokenMatches(const std::string& presented) const {
    if (presented.size() != m_token.size()) {
      return false;
    }
    return CRYPTO_memcmp(presented.data(), m_token.data(), m_token.size()) == 0;
  }

  std::shared_ptr<OutgoingResponse> unauthorized(const char* body) {
    auto response = oatpp::web::protocol::http::outgoing::ResponseFactory::createResponse(
      oatpp::web::protocol::http::Status::CODE_401,
      body
    );

    response->putHeader("Content-Type", "application/json");
    response->putHeader("WWW-Authenticate", "Bearer");
    response->putHeader("Access-Control-Allow-Origin", "*");
    response->putHeader("Connection", "close");
    return response;
  }

public:
  explicit AuthInterceptor(const std::string& token)
    : m_token(token) {
    // Paths that don't require authentication
    m_publicPaths = {
      "/swagger",
      "/api-docs",
      "/favicon.ico"
    };
  }

  std::shared_ptr<OutgoingResponse> intercept(const std::shared_ptr<IncomingRequest>& request) override {
    if (m_token.empty()) {
      return nullptr;
    }

    // Allow OPTIONS requests (CORS preflight)
    if (request->getStartingLine().method == "OPTIONS") {
      return nullptr;
    }

    auto path = request->getStartingLine().path.toString();
    if (isPublicPath(path->c_str())) {
      return nullptr;
    }

    std::string token = getBearerToken(request);
    if (token.empty()) {
      printf("[AUTH] No bearer token - access denied\n");
      fflush(stdout);
      return unauthorized(R"({"status":"error","reason":"Unauthorized","message":"Authentication required"})");
    }

    if (!tokenMatches(token)) {
      printf("[AUTH] Invalid bearer token - access denied\n");
      fflush(stdout);
      return unauthorized(R"({"status":"error","reason":"Unauthorized","message":"Invalid token"})");
    }

    return nullptr;
  }
};
