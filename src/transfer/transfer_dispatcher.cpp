#include "transfer/transfer_dispatcher.hpp"
#include "transfer/protocol_framer.hpp"
#include <boost/log/trivial.hpp>

namespace codedrop {
namespace transfer {

const char* dispatch_result_to_string(DispatchResult result) {
  switch (result) {
    case DispatchResult::CODE_MISMATCH: return "CODE_MISMATCH";
    case DispatchResult::FILE_SESSION: return "FILE_SESSION";
    case DispatchResult::TEXT_SESSION: return "TEXT_SESSION";
    case DispatchResult::UNKNOWN_TYPE: return "UNKNOWN_TYPE";
    case DispatchResult::READ_FAILED: return "READ_FAILED";
    default: return "UNKNOWN";
  }
}

TransferDispatcher::TransferDispatcher(CodeAuthority& code_authority, FileReceiver& file_receiver,
                                       TextReceiver& text_receiver, ErrorSink& error_sink)
  : code_authority_(code_authority)
  , file_receiver_(file_receiver)
  , text_receiver_(text_receiver)
  , error_sink_(error_sink) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer dispatcher: Initialized";
}

DispatchResult TransferDispatcher::dispatch(std::istream& input) {
  try {
    std::string code = ProtocolFramer::read_token(input);
    if (!code_authority_.matches(code)) {
      // Mismatches are noise, they are logged and never surfaced
      AuthError mismatch("Handshake code does not match the active code");
      BOOST_LOG_TRIVIAL(info) << "Transfer dispatcher: " << mismatch.what() << ". Disconnecting.";
      return DispatchResult::CODE_MISMATCH;
    }

    std::string type_token;
    TransferType type = ProtocolFramer::read_type(input, type_token);
    BOOST_LOG_TRIVIAL(debug) << "Transfer dispatcher: Handshake type " << ProtocolFramer::type_to_string(type);

    switch (type) {
      case TransferType::FILE: {
        ReceiveOutcome outcome = file_receiver_.receive(input);
        BOOST_LOG_TRIVIAL(info) << "Transfer dispatcher: File session ended: " << receive_outcome_to_string(outcome);
        return DispatchResult::FILE_SESSION;
      }

      case TransferType::TEXT:
        text_receiver_.receive(input);
        return DispatchResult::TEXT_SESSION;

      default: {
        BOOST_LOG_TRIVIAL(warning) << "Transfer dispatcher: Unrecognized type: " << type_token << ". Disconnecting.";
        error_sink_.report(ProtocolError("Unrecognized transfer type: " + type_token));
        return DispatchResult::UNKNOWN_TYPE;
      }
    }
  }
  catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer dispatcher: Handshake failed: " << e.what();
    error_sink_.report(e);
    return DispatchResult::READ_FAILED;
  }
}

} // namespace transfer
} // namespace codedrop
