#include "tradeguard/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace tradeguard {

IpcServer::IpcServer(std::string command_endpoint,
                     std::string publish_endpoint,
                     CommandHandler command_handler,
                     EscalationSource escalations)
    : command_endpoint_(std::move(command_endpoint)),
      publish_endpoint_(std::move(publish_endpoint)),
      command_handler_(std::move(command_handler)),
      escalations_(std::move(escalations)),
      context_(1) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind, then spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto cmd = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::rep);
  auto pub = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::pub);
  cmd->set(zmq::sockopt::linger, 0);
  pub->set(zmq::sockopt::linger, 0);

  // On a bind failure both sockets close as the unique_ptrs unwind.
  cmd->bind(command_endpoint_);
  pub->bind(publish_endpoint_);

  cmd_socket_ = std::move(cmd);
  pub_socket_ = std::move(pub);
  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. CMD=" << command_endpoint_
            << " PUB=" << publish_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

std::string IpcServer::errorReply(const std::string& message) {
  nlohmann::json reply{{"status", "error"}, {"response", message}};
  return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    publishEscalations();
    serveCommand();
  }

  // Flush what escalated during the last pass.
  publishEscalations();
}

// -----------------------------------------------------------------------------
// publishEscalations(): drain the source onto the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::publishEscalations() {
  if (!escalations_) {
    return;
  }

  try {
    while (std::optional<std::string> message = escalations_()) {
      zmq::message_t frame(message->data(), message->size());
      if (!pub_socket_->send(frame, zmq::send_flags::dontwait)) {
        std::cerr << "[IpcServer] WARNING: PUB socket busy, escalation "
                     "dropped.\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: escalation source failed: " << e.what()
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// serveCommand(): poll the REP socket, answer one request
// -----------------------------------------------------------------------------
void IpcServer::serveCommand() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};
  try {
    zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if ((items[0].revents & ZMQ_POLLIN) == 0) {
    return;
  }

  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  const std::string reply = dispatch(request.to_string());
  cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none);
}

std::string IpcServer::dispatch(const std::string& request) {
  if (!command_handler_) {
    return errorReply("no command handler");
  }
  try {
    return command_handler_(request);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command failed: " << e.what() << "\n";
    return errorReply(e.what());
  }
}

}  // namespace tradeguard
