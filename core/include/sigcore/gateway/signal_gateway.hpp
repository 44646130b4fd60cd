#pragma once

#include "sigcore/domain/trading_signal.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace sigcore {

// -----------------------------------------------------------------------------
// SignalGateway: ZeroMQ SUB bridge from signal producers to consumers
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON-encoded trading signals on a SUB socket, validates
//         each one through SignalCodec, and hands the valid ones to a sink.
//
// @details
// Producers (strategy processes, alerting bots) publish one interchange JSON
// object per message. For every message the gateway:
//   1. decodes it with SignalCodec::decodeString(), which enforces the full
//      set of field and cross-field rules;
//   2. on success, calls sink_(TradingSignal) and bumps acceptedCount();
//   3. on SignalError, logs the kind and payload to stderr, bumps
//      rejectedCount(), and drops the message.
//
// Only fully validated signals ever reach the sink, so an execution layer
// bound to it never sees a LIMIT order without a limit price.
//
// Shutdown safety (ZMQ_RCVTIMEO):
//   The SUB socket uses a receive timeout so that recv() returns
//   periodically and the stop flag is re-checked. Without it, run() would
//   block forever when producers go quiet.
//
// Thread model:
//   run() blocks the calling thread; give it a dedicated std::thread.
//   stop() may be called from any thread. handleMessage() is public so a
//   caller that already owns the transport can feed payloads directly; it
//   must not be called concurrently with run().
//
// Ownership:
//   - Borrows the zmq::context_t (must outlive the gateway).
//   - Owns the SUB socket (RAII).
//   - Holds a copy of the sink callback.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using SignalSink = std::function<void(domain::TradingSignal)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  context          Shared ZMQ context.
  // @param  sink             Invoked once per validated signal.
  // @param  endpoint         Publisher endpoint to connect to.
  // @param  recv_timeout_ms  How often run() re-checks the stop flag.
  //
  // Side-effects: Opens a SUB socket, subscribes to everything, connects.
  // -------------------------------------------------------------------------
  SignalGateway(zmq::context_t& context, SignalSink sink,
                const std::string& endpoint = "tcp://127.0.0.1:5560",
                int recv_timeout_ms = kDefaultRecvTimeoutMs);

  ~SignalGateway() = default;

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  // Blocking recv loop. Returns after stop().
  void run();

  // Requests run() to exit within one receive timeout.
  void stop();

  // -------------------------------------------------------------------------
  // handleMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one payload and dispatches it.
  //
  // @return true if the payload was a valid signal and reached the sink.
  //
  // @details
  // Never throws SignalError; rejections are logged and counted. Exceptions
  // thrown by the sink itself propagate to the caller.
  // -------------------------------------------------------------------------
  bool handleMessage(const std::string& payload);

  std::uint64_t acceptedCount() const { return accepted_.load(); }
  std::uint64_t rejectedCount() const { return rejected_.load(); }

 private:
  static constexpr int kDefaultRecvTimeoutMs = 100;

  SignalSink sink_;
  zmq::socket_t socket_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace sigcore
