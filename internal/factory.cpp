#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/codec/message_codec.hpp"
#include "internal/correlation/correlation_tracker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/fsm/connection_state_machine.hpp"
#include "internal/grpc/requester_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/requester_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/timeout/timeout_manager.hpp"
#include "internal/transport/grpc_relay_sink.hpp"
#include "internal/transport/log_sink.hpp"
#include "internal/util/time.hpp"

namespace nsi::factory {

namespace {

constexpr std::chrono::milliseconds kDefaultSweepInterval{250};
constexpr std::chrono::milliseconds kRelayCallTimeout{5000};

std::shared_ptr<transport::MessageSink> BuildSink(const nsi::runtime::config::ProviderConfig& provider) {
  if (provider.relay_address().empty()) {
    NSI_LOG_WARN("No provider relay configured; outbound envelopes are only logged");
    return std::make_shared<transport::LogSink>();
  }
  return transport::GrpcRelaySink::Connect(provider.relay_address(), kRelayCallTimeout);
}

fsm::FaultPolicy BuildFaultPolicy(const nsi::runtime::config::FaultPolicyConfig& config) {
  fsm::FaultPolicy policy;
  for (const auto op : config.fatal_operations()) {
    const auto kind = codec::FromProto(static_cast<nsi::requester::v1::Operation>(op));
    if (kind == model::OperationKind::kUnspecified) {
      throw std::runtime_error("fault_policy.fatal_operations: unspecified operation");
    }
    policy.fatal_operations.insert(kind);
  }
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const nsi::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

core::EngineOptions BuildEngineOptions(const nsi::runtime::config::RuntimeConfig& config) {
  core::EngineOptions options;

  const auto& timeouts = config.timeouts();
  if (timeouts.has_default_operation()) {
    options.default_timeout = util::FromProto(timeouts.default_operation());
  }
  for (const auto& entry : timeouts.overrides()) {
    const auto kind = codec::FromProto(entry.operation());
    if (kind == model::OperationKind::kUnspecified) {
      throw std::runtime_error("timeouts.overrides: unspecified operation");
    }
    options.timeouts[kind] = util::FromProto(entry.timeout());
  }

  const auto& retry = config.query_retry();
  if (retry.max_attempts() > 0) options.query_retry.max_attempts = retry.max_attempts();
  if (retry.has_initial_backoff()) options.query_retry.initial_backoff = util::FromProto(retry.initial_backoff());
  if (retry.has_max_backoff()) options.query_retry.max_backoff = util::FromProto(retry.max_backoff());
  if (retry.multiplier() > 0.0) options.query_retry.multiplier = retry.multiplier();

  options.auto_commit    = config.engine().auto_commit();
  options.auto_provision = config.engine().auto_provision();
  return options;
}

std::chrono::milliseconds BuildSweepInterval(const nsi::runtime::config::RuntimeConfig& config) {
  if (!config.timeouts().has_sweep_interval()) {
    return kDefaultSweepInterval;
  }

  const auto interval = util::FromProto(config.timeouts().sweep_interval());
  if (interval.count() <= 0) {
    throw std::runtime_error("timeouts.sweep_interval must be positive");
  }
  return interval;
}

/*
    Build full application dependency graph
*/
Application Build(const nsi::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto sweep_interval = BuildSweepInterval(config);

  // ------------------------------------------------------------------
  // Persistence and transport
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  auto sink      = BuildSink(config.provider());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  codec::CodecOptions codec_options;
  codec_options.requester_nsa = config.provider().requester_nsa_id();
  codec_options.provider_nsa  = config.provider().provider_nsa_id();
  codec_options.reply_to      = config.provider().reply_to_url();

  const auto tombstones = config.engine().tombstone_capacity() > 0
                              ? static_cast<std::size_t>(config.engine().tombstone_capacity())
                              : correlation::CorrelationTracker::kDefaultTombstoneCapacity;

  auto tracker  = std::make_shared<correlation::CorrelationTracker>(tombstones);
  auto timeouts = std::make_shared<timeout::TimeoutManager>();

  app.engine = std::make_shared<core::ProtocolEngine>(app.repository, std::move(sink), codec::MessageCodec(codec_options),
                                                      fsm::ConnectionStateMachine(BuildFaultPolicy(config.fault_policy())),
                                                      tracker, timeouts, BuildEngineOptions(config));

  const auto recovered = app.engine->RecoverAfterRestart();
  if (recovered > 0) {
    NSI_LOG_WARN("Recovered connections with lost operations", {observability::IntField("count", static_cast<std::int64_t>(recovered))});
  }

  // ------------------------------------------------------------------
  // Timer sweep
  // ------------------------------------------------------------------
  auto sweep_worker = std::make_shared<timeout::SweepWorker>(app.engine, sweep_interval);
  sweep_worker->Start();

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(sweep_worker);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine = app.engine;

  auto requester_service = std::make_shared<service::RequesterService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::RequesterServer>(requester_service));

  return app;
}

} // namespace nsi::factory
