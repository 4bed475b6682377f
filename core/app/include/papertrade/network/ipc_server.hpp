#pragma once

#include "papertrade/concurrent/thread_safe_queue.hpp"
#include "papertrade/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace papertrade {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers command requests on a REP socket and
//         broadcasts engine events as JSON on a PUB socket.
//
// @details
// Two ZeroMQ sockets served from the same thread:
//
//   1. PUB socket (telemetry):
//      Job runs, trading signals, order updates, trades and account
//      snapshots, one JSON object per message with a "type" field. Events
//      reach the server through a bounded ThreadSafeQueue fed from the
//      EventBus, so publishing never blocks a job tick. When subscribers are
//      slow the oldest telemetry is dropped.
//
//   2. REP socket (commands):
//      Each request is a command line ("STATUS", "RUN price_feed", ...)
//      handed to the command handler, whose JSON reply is sent back. The
//      socket has a receive timeout so the loop alternates between command
//      polling and telemetry draining.
//
// Thread model:
//   start()/stop() are called from the owning thread. pushTelemetry() may
//   be called from any thread. The command handler runs on the IPC thread
//   and must only use thread-safe engine queries.
//
// Ownership:
//   Owned by PaperTradingEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557",
                     std::size_t telemetry_capacity = 4096);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Idempotent. Publishes whatever telemetry is still queued, then joins.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @brief  JSON text published for one event.
  //
  // @details
  // {"type": "job_run" | "signal" | "order_update" | "trade" |
  //  "account_snapshot", ...fields of the carried record...}
  // order_update additionally carries "previous_status".
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace papertrade
