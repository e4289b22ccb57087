/**
 * @file main.cpp
 * @brief Main entry point for the Aegis gateway
 *
 * Initialization order (dependencies first):
 * 1. Service catalog (registry, discovery backend, route table)
 * 2. Realtime fan-out (health events are published into it)
 * 3. Resilience (circuit breakers, upstream transport, proxy)
 * 4. Rate limiter and token verifier
 * 5. Handlers and router
 * 6. HTTP server and health checker
 *
 * Shutdown sequence (reverse order):
 * 1. Stop accepting connections and drain in-flight requests
 * 2. Stop the health checker
 * 3. Close every WebSocket connection
 *
 * Configuration comes from AEGIS_* environment variables, see GatewayConfig.
 */

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>

#include "aegis/core/json.h"
#include "aegis/core/metrics.h"
#include "aegis/proxy/resilient_proxy.h"
#include "aegis/proxy/upstream.h"
#include "aegis/registry/discovery_backend.h"
#include "aegis/registry/health_checker.h"
#include "aegis/registry/service_registry.h"
#include "aegis/resilience/circuit_breaker.h"
#include "auth/token_verifier.h"
#include "gateway_server.h"
#include "handlers/admin_handler.h"
#include "handlers/events_handler.h"
#include "handlers/health_handler.h"
#include "handlers/metrics_handler.h"
#include "middleware/rate_limiter.h"
#include "realtime/fanout_gateway.h"
#include "request_context.h"
#include "route_table.h"
#include "router.h"

namespace aegis {

// ============================================================================
// Configuration
// ============================================================================

namespace {

kj::Maybe<kj::LogSeverity> parseLogLevel(kj::StringPtr level) {
  if (level == "debug"_kj) {
    return kj::LogSeverity::DBG;
  }
  if (level == "info"_kj) {
    return kj::LogSeverity::INFO;
  }
  if (level == "warn"_kj || level == "warning"_kj) {
    return kj::LogSeverity::WARNING;
  }
  if (level == "error"_kj) {
    return kj::LogSeverity::ERROR;
  }
  return kj::none;
}

} // namespace

/**
 * @brief Gateway configuration loaded from environment variables
 *
 * All settings can be overridden via environment variables.
 * Defaults are suitable for development only.
 */
struct GatewayConfig {
  // Server settings
  kj::String host = kj::str("0.0.0.0");
  uint16_t port = 8080;
  kj::String api_prefix = kj::str("/api/v1");
  kj::String services_file = kj::str("./services.json");
  kj::String log_level = kj::str("info");

  // Authentication
  kj::String jwt_secret;
  kj::String admin_token;

  // Health checking
  uint64_t health_interval_ms = 30000;
  uint64_t health_timeout_ms = 5000;
  uint64_t reconcile_interval_ms = 60000;
  uint32_t max_missed_checks = 10;

  // Circuit breaker
  uint32_t breaker_failure_threshold = 5;
  int64_t breaker_recovery_ms = 10000;
  double breaker_backoff_multiplier = 1.0;
  int64_t breaker_max_recovery_ms = 300000;

  // Proxy
  uint32_t retry_max = 2;
  int64_t retry_base_delay_ms = 1000;
  int64_t request_timeout_ms = 30000;

  // Rate limiting
  uint64_t rate_global_limit = 10000;
  uint64_t rate_service_limit = 2000;
  int64_t rate_window_ms = 60000;
  uint64_t rate_anonymous_limit = 100;

  // WebSocket fan-out
  kj::String ws_path = kj::str("/ws");
  size_t ws_max_connections = 10000;
  size_t ws_queue_capacity = 256;
  size_t ws_max_channels = 50;
  int64_t ws_idle_timeout_ms = 300000;

  /**
   * @brief Load configuration from environment variables
   *
   * Reads all AEGIS_* environment variables and applies them to config.
   * Uses defaults for any unset variables.
   */
  static GatewayConfig load_from_env() {
    GatewayConfig config;

    // Server settings
    if (const char* host_env = std::getenv("AEGIS_HOST")) {
      config.host = kj::heapString(host_env);
    }
    if (const char* port_env = std::getenv("AEGIS_PORT")) {
      config.port = static_cast<uint16_t>(std::stoi(port_env));
    }
    if (const char* prefix_env = std::getenv("AEGIS_API_PREFIX")) {
      config.api_prefix = kj::heapString(prefix_env);
    }
    if (const char* file_env = std::getenv("AEGIS_SERVICES_FILE")) {
      config.services_file = kj::heapString(file_env);
    }
    if (const char* level_env = std::getenv("AEGIS_LOG_LEVEL")) {
      config.log_level = kj::heapString(level_env);
    }

    // Authentication
    if (const char* secret_env = std::getenv("AEGIS_JWT_SECRET")) {
      config.jwt_secret = kj::heapString(secret_env);
    }
    if (const char* admin_env = std::getenv("AEGIS_ADMIN_TOKEN")) {
      config.admin_token = kj::heapString(admin_env);
    }

    // Health checking
    if (const char* interval_env = std::getenv("AEGIS_HEALTH_INTERVAL_MS")) {
      config.health_interval_ms = std::stoull(interval_env);
    }
    if (const char* timeout_env = std::getenv("AEGIS_HEALTH_TIMEOUT_MS")) {
      config.health_timeout_ms = std::stoull(timeout_env);
    }
    if (const char* reconcile_env = std::getenv("AEGIS_RECONCILE_INTERVAL_MS")) {
      config.reconcile_interval_ms = std::stoull(reconcile_env);
    }
    if (const char* missed_env = std::getenv("AEGIS_MAX_MISSED_CHECKS")) {
      config.max_missed_checks = static_cast<uint32_t>(std::stoul(missed_env));
    }

    // Circuit breaker
    if (const char* threshold_env = std::getenv("AEGIS_BREAKER_FAILURE_THRESHOLD")) {
      config.breaker_failure_threshold = static_cast<uint32_t>(std::stoul(threshold_env));
    }
    if (const char* recovery_env = std::getenv("AEGIS_BREAKER_RECOVERY_MS")) {
      config.breaker_recovery_ms = std::stoll(recovery_env);
    }
    if (const char* multiplier_env = std::getenv("AEGIS_BREAKER_BACKOFF_MULTIPLIER")) {
      config.breaker_backoff_multiplier = std::stod(multiplier_env);
    }
    if (const char* max_recovery_env = std::getenv("AEGIS_BREAKER_MAX_RECOVERY_MS")) {
      config.breaker_max_recovery_ms = std::stoll(max_recovery_env);
    }

    // Proxy
    if (const char* retry_env = std::getenv("AEGIS_RETRY_MAX")) {
      config.retry_max = static_cast<uint32_t>(std::stoul(retry_env));
    }
    if (const char* delay_env = std::getenv("AEGIS_RETRY_BASE_DELAY_MS")) {
      config.retry_base_delay_ms = std::stoll(delay_env);
    }
    if (const char* request_timeout_env = std::getenv("AEGIS_REQUEST_TIMEOUT_MS")) {
      config.request_timeout_ms = std::stoll(request_timeout_env);
    }

    // Rate limiting
    if (const char* global_env = std::getenv("AEGIS_RATE_GLOBAL_LIMIT")) {
      config.rate_global_limit = std::stoull(global_env);
    }
    if (const char* service_env = std::getenv("AEGIS_RATE_SERVICE_LIMIT")) {
      config.rate_service_limit = std::stoull(service_env);
    }
    if (const char* window_env = std::getenv("AEGIS_RATE_WINDOW_MS")) {
      config.rate_window_ms = std::stoll(window_env);
    }
    if (const char* anonymous_env = std::getenv("AEGIS_RATE_ANONYMOUS_LIMIT")) {
      config.rate_anonymous_limit = std::stoull(anonymous_env);
    }

    // WebSocket fan-out
    if (const char* ws_path_env = std::getenv("AEGIS_WS_PATH")) {
      config.ws_path = kj::heapString(ws_path_env);
    }
    if (const char* max_conn_env = std::getenv("AEGIS_WS_MAX_CONNECTIONS")) {
      config.ws_max_connections = std::stoull(max_conn_env);
    }
    if (const char* queue_env = std::getenv("AEGIS_WS_QUEUE_CAPACITY")) {
      config.ws_queue_capacity = std::stoull(queue_env);
    }
    if (const char* channels_env = std::getenv("AEGIS_WS_MAX_CHANNELS")) {
      config.ws_max_channels = std::stoull(channels_env);
    }
    if (const char* idle_env = std::getenv("AEGIS_WS_IDLE_TIMEOUT_MS")) {
      config.ws_idle_timeout_ms = std::stoll(idle_env);
    }

    return config;
  }

  /**
   * @brief Validate configuration and log warnings
   *
   * @throws kj::Exception if configuration is invalid and cannot continue
   */
  void validate() const {
    // Security warnings
    if (jwt_secret.size() > 0 && jwt_secret.size() < 32) {
      KJ_LOG(WARNING, "JWT secret should be at least 32 characters for security", "current_length",
             jwt_secret.size());
    }
    if (admin_token.size() == 0) {
      KJ_LOG(WARNING, "Admin token not set. Set AEGIS_ADMIN_TOKEN to enable admin endpoints.");
    }

    // Validation errors (cannot continue)
    if (port == 0) {
      KJ_FAIL_REQUIRE("Invalid port number: 0");
    }
    if (jwt_secret.size() == 0) {
      KJ_FAIL_REQUIRE("AEGIS_JWT_SECRET must be set");
    }
    if (parseLogLevel(log_level) == kj::none) {
      KJ_FAIL_REQUIRE("AEGIS_LOG_LEVEL must be debug, info, warn or error", log_level);
    }
    if (!api_prefix.startsWith("/")) {
      KJ_FAIL_REQUIRE("AEGIS_API_PREFIX must start with '/'", api_prefix);
    }
    if (!ws_path.startsWith("/")) {
      KJ_FAIL_REQUIRE("AEGIS_WS_PATH must start with '/'", ws_path);
    }
    if (breaker_failure_threshold == 0) {
      KJ_FAIL_REQUIRE("Breaker failure threshold must be > 0");
    }
    if (breaker_recovery_ms <= 0 || breaker_max_recovery_ms < breaker_recovery_ms) {
      KJ_FAIL_REQUIRE("Breaker recovery timeouts must be > 0 and max >= base",
                      breaker_recovery_ms, breaker_max_recovery_ms);
    }
    if (breaker_backoff_multiplier < 1.0) {
      KJ_FAIL_REQUIRE("Breaker backoff multiplier must be >= 1.0", breaker_backoff_multiplier);
    }
    if (rate_window_ms <= 0) {
      KJ_FAIL_REQUIRE("Rate limit window must be > 0");
    }
    if (request_timeout_ms <= 0 || health_timeout_ms == 0 || health_interval_ms == 0) {
      KJ_FAIL_REQUIRE("Timeouts and intervals must be > 0");
    }
    if (ws_queue_capacity == 0 || ws_max_connections == 0) {
      KJ_FAIL_REQUIRE("WebSocket queue capacity and connection limit must be > 0");
    }
  }

  void apply_log_level() const {
    KJ_IF_SOME(severity, parseLogLevel(log_level)) {
      kj::_::Debug::setLogLevel(severity);
    }
  }
};

// ============================================================================
// Signal Handling
// ============================================================================

namespace {
// Global flag for graceful shutdown
// Uses std::atomic for lock-free access from signal handler
std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_shutdown_signal{0};

/**
 * @brief Signal handler for SIGTERM and SIGINT
 *
 * This handler must be async-signal-safe (only uses atomic operations).
 */
void signal_handler(int signal) {
  g_shutdown_signal.store(signal, std::memory_order_release);
  g_shutdown_requested.store(true, std::memory_order_release);
}
} // namespace

// ============================================================================
// Component Lifecycle Manager
// ============================================================================

/**
 * @brief Owns all gateway components and their initialization order
 */
class GatewayLifecycle {
public:
  explicit GatewayLifecycle(const GatewayConfig& config, kj::AsyncIoContext& io)
      : config_(config), io_(io) {}

  ~GatewayLifecycle() {
    cleanup();
  }

  // Non-copyable, non-movable
  GatewayLifecycle(const GatewayLifecycle&) = delete;
  GatewayLifecycle& operator=(const GatewayLifecycle&) = delete;
  GatewayLifecycle(GatewayLifecycle&&) = delete;
  GatewayLifecycle& operator=(GatewayLifecycle&&) = delete;

  void initialize() {
    KJ_LOG(INFO, "Initializing gateway components in dependency order");

    header_table_ = kj::heap<kj::HttpHeaderTable>();

    KJ_LOG(INFO, "[1/6] Loading service catalog", config_.services_file);
    initializeCatalog();

    KJ_LOG(INFO, "[2/6] Initializing realtime fan-out");
    initializeFanout();

    KJ_LOG(INFO, "[3/6] Initializing circuit breakers and proxy");
    initializeProxy();

    KJ_LOG(INFO, "[4/6] Initializing rate limiter and token verifier");
    initializeAccessControl();

    KJ_LOG(INFO, "[5/6] Initializing handlers and router");
    initializeHandlers();
    initializeRouter();

    KJ_LOG(INFO, "[6/6] Starting health checker");
    initializeHealthChecker();

    KJ_LOG(INFO, "All components initialized successfully");
  }

  /**
   * @brief Run the HTTP server until a shutdown signal arrives
   */
  kj::Promise<void> run() {
    auto address = kj::str(config_.host, ":", config_.port);
    KJ_LOG(INFO, "Starting HTTP server", "address", address);

    auto& network = io_.provider->getNetwork();
    auto addr = co_await network.parseAddress(address);
    auto listener = addr->listen();

    GatewayServerConfig server_config;
    server_config.api_prefix = kj::str(config_.api_prefix);
    server_config.ws_path = kj::str(config_.ws_path);

    gateway_service_ = kj::heap<gateway::GatewayServer>(
        *header_table_, *router_, *route_table_, *proxy_, *rate_limiter_, *token_verifier_,
        *fanout_, io_.provider->getTimer(), kj::mv(server_config));
    http_server_ =
        kj::heap<kj::HttpServer>(io_.provider->getTimer(), *header_table_, *gateway_service_);

    KJ_LOG(INFO, "HTTP server listening", "address", address);

    auto listenPromise = http_server_->listenHttp(*listener)
                             .eagerlyEvaluate([](kj::Exception&& e) {
                               KJ_LOG(ERROR, "HTTP listener failed", e);
                             });

    co_await waitForShutdown();

    // Stop accepting new connections, then let in-flight requests finish
    listenPromise = nullptr;
    KJ_LOG(INFO, "HTTP server stopped accepting new connections");

    fanout_->close_all();
    co_await http_server_->drain();
    KJ_LOG(INFO, "In-flight requests drained");
  }

  kj::Promise<void> waitForShutdown() {
    while (!g_shutdown_requested.load(std::memory_order_acquire)) {
      co_await io_.provider->getTimer().afterDelay(100 * kj::MILLISECONDS);
    }
    KJ_LOG(INFO, "Shutdown signal received", "signal",
           g_shutdown_signal.load(std::memory_order_acquire));
  }

  void cleanup() {
    if (cleaned_up_.exchange(true)) {
      return;
    }

    KJ_LOG(INFO, "Starting graceful shutdown sequence");

    KJ_LOG(INFO, "[1/2] Stopping health checker and rate limit pruning");
    health_loop_ = kj::none;
    prune_loop_ = kj::none;

    KJ_LOG(INFO, "[2/2] Closing WebSocket connections");
    if (fanout_) {
      auto stats = fanout_->stats();
      fanout_->close_all();
      KJ_LOG(INFO, "WebSocket connections closed", "connections", stats.connections,
             "delivered", stats.delivered, "dropped", stats.dropped);
    }

    KJ_LOG(INFO, "Graceful shutdown complete");
  }

private:
  // ===========================================================================
  // Initialization Methods
  // ===========================================================================

  void initializeCatalog() {
    auto catalog = core::JsonDocument::parse_file(config_.services_file);
    auto root = catalog.root();

    discovery_ = registry::StaticDiscoveryBackend::from_catalog(root);
    route_table_ = gateway::RouteTable::from_catalog(root);

    registry::RegistryConfig registry_config;
    registry_config.max_missed_checks = config_.max_missed_checks;
    registry_ = kj::heap<registry::ServiceRegistry>(registry_config);
    registry_->reconcile(discovery_->list_all_services());

    KJ_LOG(INFO, "Service catalog loaded", "services", registry_->service_names().size(),
           "instances", discovery_->instance_count());
  }

  void initializeFanout() {
    gateway::realtime::FanoutConfig fanout_config;
    fanout_config.max_connections = config_.ws_max_connections;
    fanout_config.queue_capacity = config_.ws_queue_capacity;
    fanout_config.max_channels_per_connection = config_.ws_max_channels;
    fanout_config.idle_timeout_ms = config_.ws_idle_timeout_ms;
    fanout_ = kj::heap<gateway::realtime::FanoutGateway>(fanout_config);

    registry_->set_health_listener([this](const registry::HealthEvent& event) {
      gateway::realtime::publish_health_event(*fanout_, event);
    });
  }

  void initializeProxy() {
    resilience::BreakerConfig breaker_config;
    breaker_config.failure_threshold = config_.breaker_failure_threshold;
    breaker_config.recovery_timeout_ms = config_.breaker_recovery_ms;
    breaker_config.backoff_multiplier = config_.breaker_backoff_multiplier;
    breaker_config.max_recovery_timeout_ms = config_.breaker_max_recovery_ms;
    breakers_ = kj::heap<resilience::CircuitBreakerRegistry>(kj::mv(breaker_config));

    transport_ = kj::heap<proxy::HttpUpstreamTransport>(
        io_.provider->getTimer(), io_.provider->getNetwork(), *header_table_);

    proxy::ProxyConfig proxy_config;
    proxy_config.retry.max_retries = config_.retry_max;
    proxy_config.retry.base_delay_ms = config_.retry_base_delay_ms;
    proxy_config.api_prefix = kj::str(config_.api_prefix);
    proxy_config.default_timeout_ms = config_.request_timeout_ms;
    proxy_ = kj::heap<proxy::ResilientProxy>(*registry_, *breakers_, *transport_,
                                             io_.provider->getTimer(), kj::mv(proxy_config));

    KJ_LOG(INFO, "Proxy initialized", "failure_threshold", config_.breaker_failure_threshold,
           "recovery_ms", config_.breaker_recovery_ms, "retries", config_.retry_max);
  }

  void initializeAccessControl() {
    gateway::middleware::RateLimiterConfig rate_limit_config;
    rate_limit_config.global_limit = config_.rate_global_limit;
    rate_limit_config.service_limit = config_.rate_service_limit;
    rate_limit_config.window_ms = config_.rate_window_ms;
    rate_limit_config.anonymous_limit = config_.rate_anonymous_limit;
    rate_limiter_ = kj::heap<gateway::middleware::RateLimiter>(kj::mv(rate_limit_config));

    token_verifier_ = kj::heap<gateway::auth::TokenVerifier>(config_.jwt_secret);

    prune_loop_ = rate_limiter_->run_pruner(io_.provider->getTimer())
                      .eagerlyEvaluate([](kj::Exception&& e) {
                        KJ_LOG(ERROR, "Rate limit pruning stopped", e);
                      });

    KJ_LOG(INFO, "Access control initialized", "global_limit", config_.rate_global_limit,
           "service_limit", config_.rate_service_limit, "window_ms", config_.rate_window_ms);
  }

  void initializeHandlers() {
    health_handler_ = kj::heap<gateway::HealthHandler>(*registry_, *fanout_);
    metrics_handler_ = kj::heap<gateway::MetricsHandler>(core::global_metrics());

    if (config_.admin_token.size() > 0) {
      admin_handler_ = kj::heap<gateway::AdminHandler>(config_.admin_token, *registry_,
                                                       *breakers_, *rate_limiter_);
      events_handler_ = kj::heap<gateway::EventsHandler>(config_.admin_token, *fanout_);
    }
  }

  void initializeRouter() {
    router_ = kj::heap<gateway::Router>();
    registerRoutes();
    KJ_LOG(INFO, "Router initialized with", router_->route_count(), "routes");
  }

  void initializeHealthChecker() {
    probe_ = kj::heap<registry::HttpHealthProbe>(io_.provider->getTimer(),
                                                 io_.provider->getNetwork(), *header_table_);

    registry::HealthCheckerConfig checker_config;
    checker_config.interval_ms = config_.health_interval_ms;
    checker_config.timeout_ms = config_.health_timeout_ms;
    checker_config.reconcile_interval_ms = config_.reconcile_interval_ms;
    health_checker_ = kj::heap<registry::HealthChecker>(
        *registry_, *probe_, io_.provider->getTimer(), checker_config,
        kj::Maybe<registry::DiscoveryBackend&>(*discovery_));

    health_loop_ = health_checker_->run().eagerlyEvaluate([](kj::Exception&& e) {
      KJ_LOG(ERROR, "Health checker stopped", e);
    });
  }

  // ===========================================================================
  // Route Registration
  // ===========================================================================

  void registerRoutes() {
    router_->add_route(kj::HttpMethod::GET, "/health",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return health_handler_->handleHealth(ctx);
                       });

    router_->add_route(kj::HttpMethod::GET, "/metrics",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return metrics_handler_->handleMetrics(ctx);
                       });

    if (admin_handler_.get() == nullptr) {
      return;
    }

    router_->add_route(kj::HttpMethod::GET, "/admin/services",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return admin_handler_->handleListServices(ctx);
                       });

    router_->add_route(kj::HttpMethod::GET, "/admin/breakers",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return admin_handler_->handleListBreakers(ctx);
                       });

    router_->add_route(kj::HttpMethod::POST, "/admin/breakers/{key}/reset",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return admin_handler_->handleResetBreaker(ctx);
                       });

    router_->add_route(kj::HttpMethod::GET, "/admin/ratelimit/{scope}/{key}",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return admin_handler_->handleGetRateLimit(ctx);
                       });

    router_->add_route(kj::HttpMethod::DELETE, "/admin/ratelimit/{scope}/{key}",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return admin_handler_->handleResetRateLimit(ctx);
                       });

    router_->add_route(kj::HttpMethod::POST, "/internal/events",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return events_handler_->handlePublish(ctx);
                       });

    router_->add_route(kj::HttpMethod::POST, "/internal/notify",
                       [this](gateway::RequestContext& ctx) -> kj::Promise<void> {
                         return events_handler_->handleNotify(ctx);
                       });
  }

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  const GatewayConfig& config_;
  kj::AsyncIoContext& io_;
  std::atomic<bool> cleaned_up_{false};

  // HTTP infrastructure
  kj::Own<kj::HttpHeaderTable> header_table_;
  kj::Own<gateway::Router> router_;

  // Fan-out is declared before the registry so the health listener never outlives it
  kj::Own<gateway::realtime::FanoutGateway> fanout_;

  // Catalog
  kj::Own<registry::StaticDiscoveryBackend> discovery_;
  kj::Own<registry::ServiceRegistry> registry_;
  kj::Own<gateway::RouteTable> route_table_;

  // Resilience
  kj::Own<resilience::CircuitBreakerRegistry> breakers_;
  kj::Own<proxy::HttpUpstreamTransport> transport_;
  kj::Own<proxy::ResilientProxy> proxy_;

  // Access control
  kj::Own<gateway::middleware::RateLimiter> rate_limiter_;
  kj::Own<gateway::auth::TokenVerifier> token_verifier_;

  // Request handlers
  kj::Own<gateway::HealthHandler> health_handler_;
  kj::Own<gateway::MetricsHandler> metrics_handler_;
  kj::Own<gateway::AdminHandler> admin_handler_;
  kj::Own<gateway::EventsHandler> events_handler_;

  // Health checking
  kj::Own<registry::HttpHealthProbe> probe_;
  kj::Own<registry::HealthChecker> health_checker_;
  kj::Maybe<kj::Promise<void>> health_loop_;
  kj::Maybe<kj::Promise<void>> prune_loop_;

  // Server
  kj::Own<gateway::GatewayServer> gateway_service_;
  kj::Own<kj::HttpServer> http_server_;
};

} // namespace aegis

/**
 * @brief Main entry point for the Aegis gateway
 *
 * @return 0 on success, 1 on error
 */
int main(int argc, char** argv) {
  using namespace aegis;

  try {
    auto config = GatewayConfig::load_from_env();
    config.validate();
    config.apply_log_level();

    KJ_LOG(INFO, "========================================");
    KJ_LOG(INFO, "  Aegis Gateway Starting");
    KJ_LOG(INFO, "========================================");
    KJ_LOG(INFO, "Configuration:", "host", config.host, "port", config.port, "api_prefix",
           config.api_prefix, "services_file", config.services_file, "ws_path", config.ws_path,
           "admin_enabled", config.admin_token.size() > 0);

    // SIGTERM: Standard termination signal (e.g., from systemd, Docker, Kubernetes)
    // SIGINT: Interrupt signal (e.g., Ctrl+C from terminal)
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    KJ_LOG(INFO, "Signal handlers registered (SIGTERM, SIGINT)");

    auto io = kj::setupAsyncIo();

    auto lifecycle = kj::heap<GatewayLifecycle>(config, io);

    try {
      lifecycle->initialize();
    } catch (const kj::Exception& e) {
      KJ_LOG(ERROR, "Component initialization failed", e.getDescription());
      return 1;
    }

    KJ_LOG(INFO, "Press Ctrl+C to stop the server");

    auto runPromise = lifecycle->run();

    try {
      runPromise.wait(io.waitScope);
    } catch (const kj::Exception& e) {
      KJ_LOG(ERROR, "Server error", e.getDescription());
      return 1;
    }

    lifecycle->cleanup();
    KJ_LOG(INFO, "Gateway shutdown complete");
    return 0;

  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Fatal KJ exception", e.getDescription());
    return 1;
  } catch (const std::exception& e) {
    // std::stoi and friends on malformed environment values
    KJ_LOG(ERROR, "Fatal std::exception", e.what());
    return 1;
  }
}
