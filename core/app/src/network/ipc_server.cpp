#include "papertrade/network/ipc_server.hpp"

#include "papertrade/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace papertrade {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint, std::size_t telemetry_capacity)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      telemetry_queue_(telemetry_capacity) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  if (telemetry_queue_.dropped() > 0) {
    std::cerr << "[IpcServer] WARNING: " << telemetry_queue_.dropped()
              << " telemetry event(s) dropped while subscribers lagged\n";
  }
  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Final drain before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*maybe_event);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
// A REP socket must answer every request before it can receive the next
// one, so a handler exception is turned into an error reply.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command \"" << cmd << "\" failed: " << e.what()
              << "\n";
    response = nlohmann::json{{"status", "error"}, {"message", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<JobRunEvent>(&event)) {
    j = e->run;
    j["type"] = "job_run";
  } else if (const auto* e = std::get_if<SignalEvent>(&event)) {
    j = e->signal;
    j["type"] = "signal";
  } else if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    j = e->order;
    j["type"] = "order_update";
    j["previous_status"] = domain::orderStatusToString(e->previous_status);
  } else if (const auto* e = std::get_if<TradeEvent>(&event)) {
    j = e->trade;
    j["type"] = "trade";
  } else if (const auto* e = std::get_if<AccountSnapshotEvent>(&event)) {
    j = e->snapshot;
    j["type"] = "account_snapshot";
  }
  return j.dump();
}

}  // namespace papertrade
