#include "crypto/rnp_handle.hpp"
#include <boost/log/trivial.hpp>

namespace pgpcrypt::crypto::rnp {

FfiPtr make_ffi() {
  rnp_ffi_t ffi = nullptr;
  check<InitializationError>(rnp_ffi_create(&ffi, "GPG", "GPG"), "Failed to create keyring context");
  BOOST_LOG_TRIVIAL(trace) << "RNP: Keyring context created";
  return FfiPtr(ffi);
}

InputPtr input_from(const uint8_t* data, size_t length) {
  rnp_input_t input = nullptr;
  check<CryptoError>(rnp_input_from_memory(&input, data, length, true), "Failed to create memory input");
  return InputPtr(input);
}

OutputPtr memory_output() {
  rnp_output_t output = nullptr;
  check<CryptoError>(rnp_output_to_memory(&output, 0), "Failed to create memory output");
  return OutputPtr(output);
}

std::vector<uint8_t> output_contents(rnp_output_t output) {
  uint8_t* buffer = nullptr;
  size_t length = 0;
  rnp_result_t result = rnp_output_memory_get_buf(output, &buffer, &length, false);
  // Nothing written yet: the memory destination has no allocation to return
  if (result != RNP_SUCCESS && length == 0) {
    return {};
  }
  check<CryptoError>(result, "Failed to access output buffer");
  return std::vector<uint8_t>(buffer, buffer + length);
}

std::string take_string(char* value) {
  BufferPtr owned(value);
  return owned ? std::string(owned.get()) : std::string();
}

} // namespace pgpcrypt::crypto::rnp
