#pragma once

#include "sigcore/domain/trading_signal.hpp"

#include <zmq.hpp>

#include <memory>
#include <string>

namespace sigcore {

// -----------------------------------------------------------------------------
// SignalPublisher: ZeroMQ PUB side of the signal transport
// -----------------------------------------------------------------------------
//
// @brief  Encodes TradingSignal values with SignalCodec and broadcasts the
//         JSON text on a PUB socket.
//
// @details
// Because a TradingSignal can only exist in a valid state, everything this
// class sends is guaranteed to pass the gateway's validation on the other
// side (assuming both ends run the same codec).
//
// PUB semantics apply: messages sent before a subscriber has finished
// connecting are dropped. Callers that need delivery guarantees must layer
// them on top.
//
// Thread model:
//   ZMQ sockets are not thread-safe. start(), stop() and publish() must all
//   be called from the same thread.
//
// Ownership:
//   Borrows the zmq::context_t. Owns the PUB socket once started.
// -----------------------------------------------------------------------------
class SignalPublisher {
 public:
  // No socket is opened until start().
  explicit SignalPublisher(zmq::context_t& context,
                           std::string endpoint = "tcp://127.0.0.1:5560");

  ~SignalPublisher();

  SignalPublisher(const SignalPublisher&) = delete;
  SignalPublisher& operator=(const SignalPublisher&) = delete;
  SignalPublisher(SignalPublisher&&) = delete;
  SignalPublisher& operator=(SignalPublisher&&) = delete;

  // Binds the PUB socket. Idempotent.
  void start();

  // Closes the PUB socket. Idempotent; safe if never started.
  void stop();

  bool running() const { return socket_ != nullptr; }

  // -------------------------------------------------------------------------
  // publish(signal)
  // -------------------------------------------------------------------------
  // @brief  Encodes and sends one signal.
  //
  // @throws std::logic_error if called before start().
  // @throws SignalError if the signal's text cannot be written as JSON.
  // -------------------------------------------------------------------------
  void publish(const domain::TradingSignal& signal);

 private:
  zmq::context_t& context_;
  std::string endpoint_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace sigcore
