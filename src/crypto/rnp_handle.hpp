#ifndef PGPCRYPT_RNP_HANDLE_HPP
#define PGPCRYPT_RNP_HANDLE_HPP

#include <rnp/rnp.h>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include <cstdint>
#include "pgpcrypt/crypto/crypto_error.hpp"

namespace pgpcrypt::crypto::rnp {

//==============================================
// RAII WRAPPERS FOR LIBRNP HANDLES
//==============================================

template <typename Handle, rnp_result_t (*Destroy)(Handle)>
struct HandleDeleter {
  void operator()(Handle handle) const {
    if (handle) {
      Destroy(handle);
    }
  }
};

template <typename Handle, rnp_result_t (*Destroy)(Handle)>
using HandlePtr = std::unique_ptr<std::remove_pointer_t<Handle>, HandleDeleter<Handle, Destroy>>;

using FfiPtr = HandlePtr<rnp_ffi_t, rnp_ffi_destroy>;
using InputPtr = HandlePtr<rnp_input_t, rnp_input_destroy>;
using OutputPtr = HandlePtr<rnp_output_t, rnp_output_destroy>;
using KeyHandlePtr = HandlePtr<rnp_key_handle_t, rnp_key_handle_destroy>;
using EncryptOpPtr = HandlePtr<rnp_op_encrypt_t, rnp_op_encrypt_destroy>;
using IteratorPtr = HandlePtr<rnp_identifier_iterator_t, rnp_identifier_iterator_destroy>;

// Strings allocated by librnp must be released with rnp_buffer_destroy
struct BufferDeleter {
  void operator()(char* buffer) const { rnp_buffer_destroy(buffer); }
};
using BufferPtr = std::unique_ptr<char, BufferDeleter>;


//==============================================
// RESULT CHECKING
//==============================================

// Throws Error with the library's description appended when result is not RNP_SUCCESS
template <typename Error>
void check(rnp_result_t result, const std::string& context) {
  if (result != RNP_SUCCESS) {
    throw Error(context + ": " + rnp_result_to_string(result));
  }
}


//==============================================
// COMMON HELPERS
//==============================================

// Creates an empty in-memory keyring using the GnuPG key store format
FfiPtr make_ffi();

// Creates an input reading a copy of the given buffer
InputPtr input_from(const uint8_t* data, size_t length);

// Creates a growable memory output
OutputPtr memory_output();

// Copies everything written to a memory output so far
std::vector<uint8_t> output_contents(rnp_output_t output);

// Takes ownership of a string returned by librnp and copies it
std::string take_string(char* value);

} // namespace pgpcrypt::crypto::rnp

#endif // PGPCRYPT_RNP_HANDLE_HPP
