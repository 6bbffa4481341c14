//
//  audio_decrypt.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "catalog_types.hpp"
#include "providers.hpp"
#include "status.hpp"

namespace oggfetch {

/// Fixed initial counter block used for every audio file.
inline constexpr std::array<uint8_t, 16> kAudioAesIv = {0x72, 0xe0, 0x67, 0xfb, 0xdd, 0xcb,
                                                        0xcf, 0x77, 0xeb, 0xe8, 0xbc, 0x64,
                                                        0x3f, 0x63, 0x0d, 0x93};

/// Bytes preceding the Ogg payload in every decrypted audio file.
inline constexpr size_t kAudioPreambleSize = 0xa7;

// AES-128-CTR over the whole buffer, starting at kAudioAesIv (big-endian counter).
Status aes128_ctr_decrypt(const AudioKey &key, const std::vector<uint8_t> &in,
                          std::vector<uint8_t> &out);

class AudioDecryptor : public Decryptor {
   public:
    Status decrypt(const AudioKey &key, const std::vector<uint8_t> &encrypted,
                   std::vector<uint8_t> &out) override;
};

}  // namespace oggfetch
