//
//  audio_decrypt.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio_decrypt.hpp"

#include <algorithm>
#include <climits>
#include <memory>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "logging.hpp"

namespace oggfetch {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

Status openssl_error(const char *what) {
    const unsigned long code = ERR_get_error();
    std::string msg = what;
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    return make_error(ErrorKind::Decrypt, msg);
}

}  // namespace

Status aes128_ctr_decrypt(const AudioKey &key, const std::vector<uint8_t> &in,
                          std::vector<uint8_t> &out) {
    out.clear();
    if (in.empty()) {
        return make_ok();
    }
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return openssl_error("cannot allocate cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_ctr(), nullptr, key.data(),
                           kAudioAesIv.data()) != 1) {
        return openssl_error("cannot initialise AES-128-CTR");
    }

    out.resize(in.size());
    size_t done = 0;
    // EVP_DecryptUpdate takes an int length; feed large buffers in pieces.
    constexpr size_t kChunk = 1 << 20;
    while (done < in.size()) {
        const size_t n = std::min(kChunk, in.size() - done);
        int written = 0;
        if (EVP_DecryptUpdate(ctx.get(), out.data() + done, &written, in.data() + done,
                              static_cast<int>(n)) != 1) {
            return openssl_error("AES-128-CTR update failed");
        }
        done += static_cast<size_t>(written);
    }
    int tail = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + done, &tail) != 1) {
        return openssl_error("AES-128-CTR final failed");
    }
    out.resize(done + static_cast<size_t>(tail));
    return make_ok();
}

Status AudioDecryptor::decrypt(const AudioKey &key, const std::vector<uint8_t> &encrypted,
                               std::vector<uint8_t> &out) {
    OF_LOG("crypto", "decrypting " << encrypted.size() << " bytes with key "
                                  << hex_prefix(key.data(), key.size(), 4)
                                  << " ...");
    return aes128_ctr_decrypt(key, encrypted, out);
}

}  // namespace oggfetch
