#include "crypto/credential_cipher.hpp"
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace dbridge::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContextDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

[[noreturn]] void fail(bool encrypting, const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Cipher: " << message;
  if (encrypting) {
    throw EncryptionError(message);
  }
  throw DecryptionError(message);
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CredentialCipher::CredentialCipher(SymmetricKey key) : key_(std::move(key)) {
  if (key_.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid key size: " << key_.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    wipe();
    throw InitializationError("Invalid key size");
  }
  BOOST_LOG_TRIVIAL(debug) << "Cipher: Credential cipher ready";
}

CredentialCipher::~CredentialCipher() {
  wipe();
}

CredentialCipher::CredentialCipher(CredentialCipher&& other) noexcept
  : key_(std::move(other.key_)) {
  other.key_.clear();
}

CredentialCipher& CredentialCipher::operator=(CredentialCipher&& other) noexcept {
  if (this != &other) {
    wipe();
    key_ = std::move(other.key_);
    other.key_.clear();
  }
  return *this;
}


//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::string CredentialCipher::encrypt(const std::string& plaintext) const {
  if (plaintext.empty()) {
    return plaintext;
  }
  check_usable();

  auto iv = generate_iv();
  std::vector<uint8_t> ciphertext = run_cipher(
      reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size(), iv.data(), true);

  std::vector<uint8_t> blob;
  blob.reserve(IV_SIZE + ciphertext.size());
  blob.insert(blob.end(), iv.begin(), iv.end());
  blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());

  BOOST_LOG_TRIVIAL(trace) << "Cipher: Encrypted value into " << blob.size() << " byte blob";
  return to_base64(blob);
}

std::string CredentialCipher::decrypt(const std::string& blob) const {
  if (blob.empty()) {
    return blob;
  }
  check_usable();

  std::vector<uint8_t> raw = from_base64(blob);
  if (raw.size() < IV_SIZE) {
    fail(false, "Blob shorter than IV (" + std::to_string(raw.size()) + " bytes)");
  }

  size_t cipher_length = raw.size() - IV_SIZE;
  if (cipher_length == 0 || cipher_length % BLOCK_SIZE != 0) {
    fail(false, "Ciphertext length " + std::to_string(cipher_length) +
                " is not a positive multiple of the block size");
  }

  std::vector<uint8_t> plain = run_cipher(raw.data() + IV_SIZE, cipher_length, raw.data(), false);
  std::string result(plain.begin(), plain.end());
  OPENSSL_cleanse(plain.data(), plain.size());
  return result;
}


//==============================================
// KEY LIFECYCLE
//==============================================

void CredentialCipher::wipe() {
  if (!key_.empty()) {
    OPENSSL_cleanse(key_.data(), key_.size());
    key_.clear();
  }
}

std::array<uint8_t, CredentialCipher::IV_SIZE> CredentialCipher::generate_iv() {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Failed to generate random IV";
    throw EncryptionError("Failed to generate random IV");
  }
  return iv;
}


//==============================================
// CIPHER SUPPORT
//==============================================

void CredentialCipher::check_usable() const {
  if (!is_usable()) {
    throw InitializationError("Cipher key has been wiped");
  }
}

std::vector<uint8_t> CredentialCipher::run_cipher(const uint8_t* input, size_t length,
                                                  const uint8_t* iv, bool encrypting) const {
  CipherContext ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    fail(encrypting, "Failed to create cipher context");
  }

  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), iv,
                        encrypting ? 1 : 0) != 1) {
    fail(encrypting, "Failed to initialize cipher context");
  }

  // PKCS7 padding is the EVP default
  std::vector<uint8_t> output(length + BLOCK_SIZE);
  int update_length = 0;
  if (EVP_CipherUpdate(ctx.get(), output.data(), &update_length,
                       input, static_cast<int>(length)) != 1) {
    fail(encrypting, "Failed to process data block");
  }

  int final_length = 0;
  if (EVP_CipherFinal_ex(ctx.get(), output.data() + update_length, &final_length) != 1) {
    OPENSSL_cleanse(output.data(), output.size());
    fail(encrypting, encrypting ? "Failed to finalize encryption"
                                : "Padding check failed while finalizing decryption");
  }

  output.resize(static_cast<size_t>(update_length + final_length));
  return output;
}


//==============================================
// BASE64 SUPPORT
//==============================================

std::string CredentialCipher::to_base64(const std::vector<uint8_t>& data) {
  std::string encoded(4 * ((data.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                data.data(), static_cast<int>(data.size()));
  if (written < 0) {
    fail(true, "Base64 encoding failed");
  }
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

std::vector<uint8_t> CredentialCipher::from_base64(const std::string& text) {
  if (text.size() % 4 != 0) {
    fail(false, "Malformed base64: length is not a multiple of 4");
  }

  size_t padding = 0;
  if (!text.empty() && text[text.size() - 1] == '=') ++padding;
  if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;

  std::vector<uint8_t> decoded(3 * text.size() / 4);
  int written = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    fail(false, "Malformed base64 input");
  }

  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

} // namespace dbridge::crypto
