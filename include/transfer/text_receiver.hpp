#ifndef CODEDROP_TRANSFER_TEXT_RECEIVER_HPP
#define CODEDROP_TRANSFER_TEXT_RECEIVER_HPP

#include <iostream>
#include "transfer/code_authority.hpp"
#include "transfer/collaborators.hpp"

namespace codedrop {
namespace transfer {

class TextReceiver {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TextReceiver(CodeAuthority& code_authority, TextSink& text_sink, ErrorSink& error_sink,
               bool rotate_on_text = false);


  // ---- SESSION PROCESSING ----
  // Reads to end-of-stream and forwards the text. Returns false on a read failure.
  bool receive(std::istream& input);

private:
  // ---- PARAMETERS ----
  CodeAuthority& code_authority_;
  TextSink& text_sink_;
  ErrorSink& error_sink_;
  bool rotate_on_text_;
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_TEXT_RECEIVER_HPP
