#ifndef CODEDROP_TRANSFER_DISPATCHER_HPP
#define CODEDROP_TRANSFER_DISPATCHER_HPP

#include <iostream>
#include "transfer/code_authority.hpp"
#include "transfer/collaborators.hpp"
#include "transfer/file_receiver.hpp"
#include "transfer/text_receiver.hpp"

namespace codedrop {
namespace transfer {

enum class DispatchResult {
    CODE_MISMATCH,
    FILE_SESSION,
    TEXT_SESSION,
    UNKNOWN_TYPE,
    READ_FAILED
};

const char* dispatch_result_to_string(DispatchResult result);

class TransferDispatcher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferDispatcher(CodeAuthority& code_authority, FileReceiver& file_receiver,
                     TextReceiver& text_receiver, ErrorSink& error_sink);


  // ---- SESSION ROUTING ----
  // Authorizes the handshake on the stream and routes it to the matching receiver.
  // On a code mismatch nothing after the CODE token is read.
  DispatchResult dispatch(std::istream& input);

private:
  // ---- PARAMETERS ----
  CodeAuthority& code_authority_;
  FileReceiver& file_receiver_;
  TextReceiver& text_receiver_;
  ErrorSink& error_sink_;
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_DISPATCHER_HPP
