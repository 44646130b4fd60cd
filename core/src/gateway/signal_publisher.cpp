#include "sigcore/gateway/signal_publisher.hpp"
#include "sigcore/codec/signal_codec.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace sigcore {

SignalPublisher::SignalPublisher(zmq::context_t& context, std::string endpoint)
    : context_(context), endpoint_(std::move(endpoint)) {}

SignalPublisher::~SignalPublisher() { stop(); }

// -----------------------------------------------------------------------------
// start(): create and bind the PUB socket
// -----------------------------------------------------------------------------
void SignalPublisher::start() {
  if (socket_) {
    return;
  }

  auto socket =
      std::make_unique<zmq::socket_t>(context_, zmq::socket_type::pub);
  // Pending messages are dropped on close so context teardown never blocks.
  socket->set(zmq::sockopt::linger, 0);
  socket->bind(endpoint_);
  socket_ = std::move(socket);

  std::cout << "[SignalPublisher] started. PUB=" << endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): close the socket
// -----------------------------------------------------------------------------
void SignalPublisher::stop() {
  if (!socket_) {
    return;
  }

  socket_.reset();
  std::cout << "[SignalPublisher] stopped.\n";
}

// -----------------------------------------------------------------------------
// publish(): encode and send one message
// -----------------------------------------------------------------------------
void SignalPublisher::publish(const domain::TradingSignal& signal) {
  if (!socket_) {
    throw std::logic_error("SignalPublisher::publish() called before start()");
  }

  const std::string payload = SignalCodec::encodeString(signal);
  zmq::message_t msg(payload.data(), payload.size());
  if (!socket_->send(msg, zmq::send_flags::none)) {
    std::cerr << "[SignalPublisher] send would block, dropped signal "
              << signal.signalId() << "\n";
  }
}

}  // namespace sigcore
