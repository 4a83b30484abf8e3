#include "transfer/text_receiver.hpp"
#include "transfer/protocol_framer.hpp"
#include <boost/log/trivial.hpp>

namespace codedrop {
namespace transfer {

TextReceiver::TextReceiver(CodeAuthority& code_authority, TextSink& text_sink, ErrorSink& error_sink,
                           bool rotate_on_text)
  : code_authority_(code_authority)
  , text_sink_(text_sink)
  , error_sink_(error_sink)
  , rotate_on_text_(rotate_on_text) {
  BOOST_LOG_TRIVIAL(debug) << "Text receiver: Initialized, rotate on text: " << std::boolalpha << rotate_on_text_;
}

bool TextReceiver::receive(std::istream& input) {
  std::string text;
  try {
    text = ProtocolFramer::read_text(input);
  } catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Text receiver: Failed to read text: " << e.what();
    error_sink_.report(e);
    return false;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Text receiver: Failed to read text: " << e.what();
    error_sink_.report(IOError(e.what()));
    return false;
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Text receiver: Stream failure while reading text";
    error_sink_.report(IOError("Stream failure while reading text"));
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Text receiver: Received " << text.size() << " bytes of text";
  text_sink_.display(text);

  if (rotate_on_text_) {
    code_authority_.rotate();
  }
  return true;
}

} // namespace transfer
} // namespace codedrop
