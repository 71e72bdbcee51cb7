#include <ledgersync/crypto.hpp>
#include <ledgersync/error.hpp>

#include "util/random.hpp"

#include <memory>
#include <utility>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace ledgersync {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&::EVP_CIPHER_CTX_free)>;

auto new_cipher_ctx() -> CipherCtx {
    auto ctx = CipherCtx{::EVP_CIPHER_CTX_new(), &::EVP_CIPHER_CTX_free};
    if (!ctx) throw Error{ErrorKind::invalid_operation, "EVP_CIPHER_CTX_new failed"};
    return ctx;
}

auto as_uchar(const std::byte* p) -> const unsigned char* {
    return reinterpret_cast<const unsigned char*>(p);
}

auto as_uchar(std::byte* p) -> unsigned char* {
    return reinterpret_cast<unsigned char*>(p);
}

}  // anonymous namespace

auto make_salt() -> Bytes {
    return util::random_bytes(salt_size);
}

auto make_key_id() -> std::string {
    return util::make_uuid();
}

auto derive_key(std::string_view password, std::span<const std::byte> salt) -> Bytes {
    if (password.empty()) {
        throw KeyDerivationError{"replica is encrypted but no password was provided"};
    }
    if (salt.empty()) {
        throw KeyDerivationError{"key salt is empty"};
    }

    auto key = Bytes(master_key_size);
    if (::PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                            as_uchar(salt.data()), static_cast<int>(salt.size()),
                            pbkdf2_iterations, ::EVP_sha512(),
                            static_cast<int>(key.size()), as_uchar(key.data())) != 1) {
        throw KeyDerivationError{"PBKDF2 key derivation failed"};
    }
    return key;
}

auto encrypt(std::string_view key_id, std::span<const std::byte> master_key,
             std::span<const std::byte> plaintext) -> EncryptedPayload {
    if (master_key.size() != master_key_size) {
        throw Error{ErrorKind::invalid_operation, "master key must be 32 bytes"};
    }

    auto result = EncryptedPayload{};
    result.meta.key_id = std::string{key_id};
    result.meta.iv = util::random_bytes(iv_size);
    result.meta.auth_tag = Bytes(auth_tag_size);
    result.value = Bytes(plaintext.size());

    auto ctx = new_cipher_ctx();
    auto len = 0;
    auto ok = ::EVP_EncryptInit_ex(ctx.get(), ::EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && ::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                 static_cast<int>(iv_size), nullptr) == 1
        && ::EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, as_uchar(master_key.data()),
                                as_uchar(result.meta.iv.data())) == 1
        && ::EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                               reinterpret_cast<const unsigned char*>(key_id.data()),
                               static_cast<int>(key_id.size())) == 1
        && ::EVP_EncryptUpdate(ctx.get(), as_uchar(result.value.data()), &len,
                               as_uchar(plaintext.data()),
                               static_cast<int>(plaintext.size())) == 1
        && ::EVP_EncryptFinal_ex(ctx.get(), as_uchar(result.value.data()) + len, &len) == 1
        && ::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                 static_cast<int>(auth_tag_size),
                                 result.meta.auth_tag.data()) == 1;
    if (!ok) throw Error{ErrorKind::invalid_operation, "AES-256-GCM encryption failed"};
    return result;
}

auto decrypt(std::span<const std::byte> master_key, std::span<const std::byte> ciphertext,
             const EncryptionMeta& meta) -> Bytes {
    if (meta.algorithm != aead_algorithm) {
        throw DecryptionError{"unsupported encryption algorithm '" + meta.algorithm + "'"};
    }
    if (master_key.size() != master_key_size) {
        throw DecryptionError{"master key must be 32 bytes"};
    }
    if (meta.iv.size() != iv_size || meta.auth_tag.size() != auth_tag_size) {
        throw DecryptionError{"malformed encryption metadata"};
    }

    auto plain = Bytes(ciphertext.size());
    auto tag = meta.auth_tag;
    auto ctx = new_cipher_ctx();
    auto len = 0;
    auto ok = ::EVP_DecryptInit_ex(ctx.get(), ::EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && ::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                 static_cast<int>(iv_size), nullptr) == 1
        && ::EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, as_uchar(master_key.data()),
                                as_uchar(meta.iv.data())) == 1
        && ::EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                               reinterpret_cast<const unsigned char*>(meta.key_id.data()),
                               static_cast<int>(meta.key_id.size())) == 1
        && ::EVP_DecryptUpdate(ctx.get(), as_uchar(plain.data()), &len,
                               as_uchar(ciphertext.data()),
                               static_cast<int>(ciphertext.size())) == 1
        && ::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                 static_cast<int>(auth_tag_size), tag.data()) == 1
        && ::EVP_DecryptFinal_ex(ctx.get(), as_uchar(plain.data()) + len, &len) == 1;
    if (!ok) {
        ::OPENSSL_cleanse(plain.data(), plain.size());
        throw DecryptionError{"authentication failed for key '" + meta.key_id + "'"};
    }
    return plain;
}

// -- EncryptionContext --------------------------------------------------------

EncryptionContext::EncryptionContext(std::string key_id, Bytes salt, Bytes master_key)
    : key_id_{std::move(key_id)}, salt_{std::move(salt)}, master_key_{std::move(master_key)} {
    if (master_key_.size() != master_key_size) {
        wipe();
        throw KeyDerivationError{"master key must be 32 bytes"};
    }
}

auto EncryptionContext::derive(std::string key_id, Bytes salt, std::string_view password)
    -> EncryptionContext {
    auto key = derive_key(password, salt);
    return EncryptionContext{std::move(key_id), std::move(salt), std::move(key)};
}

EncryptionContext::~EncryptionContext() {
    wipe();
}

EncryptionContext::EncryptionContext(EncryptionContext&& other) noexcept
    : key_id_{std::move(other.key_id_)},
      salt_{std::move(other.salt_)},
      master_key_{std::move(other.master_key_)} {
    other.master_key_.clear();
}

auto EncryptionContext::operator=(EncryptionContext&& other) noexcept -> EncryptionContext& {
    if (this != &other) {
        wipe();
        key_id_ = std::move(other.key_id_);
        salt_ = std::move(other.salt_);
        master_key_ = std::move(other.master_key_);
        other.master_key_.clear();
    }
    return *this;
}

auto EncryptionContext::encrypt(std::span<const std::byte> plaintext) const -> EncryptedPayload {
    return ledgersync::encrypt(key_id_, master_key_, plaintext);
}

auto EncryptionContext::decrypt(std::span<const std::byte> ciphertext,
                                const EncryptionMeta& meta) const -> Bytes {
    if (meta.key_id != key_id_) {
        throw DecryptionError{"payload was encrypted with key '" + meta.key_id +
                              "', replica key is '" + key_id_ + "'"};
    }
    return ledgersync::decrypt(master_key_, ciphertext, meta);
}

void EncryptionContext::wipe() noexcept {
    if (!master_key_.empty()) {
        ::OPENSSL_cleanse(master_key_.data(), master_key_.size());
    }
}

}  // namespace ledgersync
