#include "sigcore/gateway/signal_gateway.hpp"
#include "sigcore/codec/signal_codec.hpp"
#include "sigcore/domain/signal_error.hpp"

#include <cerrno>
#include <iostream>
#include <optional>
#include <utility>

namespace sigcore {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout, connected to the producer
// -----------------------------------------------------------------------------
SignalGateway::SignalGateway(zmq::context_t& context, SignalSink sink,
                             const std::string& endpoint,
                             int recv_timeout_ms)
    : sink_(std::move(sink)), socket_(context, zmq::socket_type::sub) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, recv_timeout_ms);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void SignalGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      // Timeout. Loop back and re-check the stop flag.
      continue;
    }

    handleMessage(msg.to_string());
  }
}

void SignalGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handleMessage(): decode, dispatch or reject
// -----------------------------------------------------------------------------
bool SignalGateway::handleMessage(const std::string& payload) {
  std::optional<domain::TradingSignal> signal;
  try {
    signal.emplace(SignalCodec::decodeString(payload));
  } catch (const SignalError& e) {
    rejected_.fetch_add(1);
    std::cerr << "[SignalGateway] Rejected signal (" << toString(e.kind())
              << "): " << e.what() << " payload: " << payload << "\n";
    return false;
  }

  accepted_.fetch_add(1);
  sink_(std::move(*signal));
  return true;
}

}  // namespace sigcore
