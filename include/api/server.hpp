#pragma once

#include "oatpp/web/server/HttpConnectionHandler.hpp"
#include "oatpp/web/server/HttpRouter.hpp"
#include "oatpp/network/tcp/server/ConnectionProvider.hpp"
#include "oatpp/network/Server.hpp"
#include "oatpp/parser/json/mapping/ObjectMapper.hpp"
#include "oatpp-swagger/Controller.hpp"
#include "oatpp-swagger/Resources.hpp"
#include "api/controllers/status_controller.hpp"
#include "api/controllers/command_controller.hpp"
#include "api/auth_interceptor.hpp"
#include "core/orchestrator.hpp"
#include <memory>
#include <thread>
#include <chrono>
#include <vector>
#include <atomic>
#include <string>

/**
 * Local control API: status, client list, event stream and operator
 * commands, with Swagger UI
 */
class ApiServer {
private:
  std::shared_ptr<oatpp::network::tcp::server::ConnectionProvider> m_connectionProvider;
  std::shared_ptr<oatpp::web::server::HttpConnectionHandler> m_connectionHandler;
  std::vector<std::thread> m_workerThreads;
  std::atomic<bool> m_running;
  std::shared_ptr<extender::core::ExtenderOrchestrator> m_orchestrator;
  std::string m_token;
  static constexpr size_t NUM_WORKER_THREADS = 2;

public:
  ApiServer(std::shared_ptr<extender::core::ExtenderOrchestrator> orchestrator,
            const std::string& token = "")
    : m_running(false), m_orchestrator(orchestrator), m_token(token) {}

  ~ApiServer() {
    stop();
  }

  void start(const std::string& host = "127.0.0.1", uint16_t port = 8089) {
    if (m_running.exchange(true)) {
      return;
    }

    auto objectMapper = oatpp::parser::json::mapping::ObjectMapper::createShared();
    auto router = oatpp::web::server::HttpRouter::createShared();

    auto authInterceptor = std::make_shared<AuthInterceptor>(m_token);

    auto statusController = StatusController::createShared(objectMapper, m_orchestrator);
    router->addController(statusController);

    auto commandController = CommandController::createShared(objectMapper, m_orchestrator);
    router->addController(commandController);

    // Swagger documentation info
    auto docInfo = oatpp::swagger::DocumentInfo::createShared();
    docInfo->header = oatpp::swagger::DocumentHeader::createShared();
    docInfo->header->title = "WiFi Extender API";
    docInfo->header->description = "Control and status API for the single-radio WiFi extender";
    docInfo->header->version = "1.0.0";

    #ifdef OATPP_SWAGGER_RES_PATH
    auto swaggerResources = oatpp::swagger::Resources::streamResources(OATPP_SWAGGER_RES_PATH);
    #else
    auto swaggerResources = oatpp::swagger::Resources::streamResources(nullptr);
    #endif

    auto apiEndpoints = statusController->getEndpoints();
    apiEndpoints.append(commandController->getEndpoints());

    auto swaggerController = oatpp::swagger::Controller::createShared(
      apiEndpoints,
      docInfo,
      swaggerResources
    );
    router->addController(swaggerController);

    m_connectionProvider = oatpp::network::tcp::server::ConnectionProvider::createShared(
      {host, port, oatpp::network::Address::IP_4}
    );

    m_connectionHandler = oatpp::web::server::HttpConnectionHandler::createShared(router);
    m_connectionHandler->addRequestInterceptor(authInterceptor);

    printf("[API] HTTP Server starting on http://%s:%d\n", host.c_str(), port);
    printf("[API] Swagger UI: http://%s:%d/swagger/ui\n", host.c_str(), port);
    if (m_token.empty()) {
      printf("[API] No API token configured, requests are not authenticated\n");
    }

    for (size_t i = 0; i < NUM_WORKER_THREADS; ++i) {
      m_workerThreads.emplace_back([this]() {
        while (m_running) {
          auto connection = m_connectionProvider->get();
          if (connection) {
            m_connectionHandler->handleConnection(connection, nullptr);
          } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
          }
        }
      });
    }

    printf("[API] HTTP Server started with %zu worker threads\n", NUM_WORKER_THREADS);
    fflush(stdout);
  }

  void stop() {
    if (m_running.exchange(false)) {
      if (m_connectionProvider) {
        m_connectionProvider->stop();
      }

      for (auto& thread : m_workerThreads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
      m_workerThreads.clear();

      printf("[API] HTTP Server stopped\n");
      fflush(stdout);
    }
  }

  bool isRunning() const {
    return m_running;
  }
};
