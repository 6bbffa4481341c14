//
//  catalog_id.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "catalog_id.hpp"

#include <algorithm>

namespace {

constexpr char kBase62Alphabet[] =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

int base62_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 36;
    }
    return -1;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// 128-bit value as four 32-bit limbs, most significant first.
using Limbs = uint32_t[4];

void to_limbs(uint64_t high, uint64_t low, Limbs out) {
    out[0] = static_cast<uint32_t>(high >> 32);
    out[1] = static_cast<uint32_t>(high & 0xFFFFFFFF);
    out[2] = static_cast<uint32_t>(low >> 32);
    out[3] = static_cast<uint32_t>(low & 0xFFFFFFFF);
}

}  // namespace

namespace oggfetch {

std::optional<CatalogId> CatalogId::from_base62(std::string_view text) {
    if (text.size() != kBase62IdLength) {
        return std::nullopt;
    }
    Limbs limbs = {0, 0, 0, 0};
    for (char c : text) {
        const int digit = base62_digit(c);
        if (digit < 0) {
            return std::nullopt;
        }
        uint64_t carry = static_cast<uint64_t>(digit);
        for (int i = 3; i >= 0; --i) {
            const uint64_t v = static_cast<uint64_t>(limbs[i]) * 62 + carry;
            limbs[i] = static_cast<uint32_t>(v & 0xFFFFFFFF);
            carry = v >> 32;
        }
        if (carry != 0) {
            return std::nullopt;
        }
    }
    const uint64_t high = (static_cast<uint64_t>(limbs[0]) << 32) | limbs[1];
    const uint64_t low = (static_cast<uint64_t>(limbs[2]) << 32) | limbs[3];
    return CatalogId(high, low);
}

std::optional<CatalogId> CatalogId::from_hex(std::string_view text) {
    if (text.size() != 32) {
        return std::nullopt;
    }
    uint64_t parts[2] = {0, 0};
    for (size_t i = 0; i < text.size(); ++i) {
        const int digit = hex_digit(text[i]);
        if (digit < 0) {
            return std::nullopt;
        }
        uint64_t &part = parts[i / 16];
        part = (part << 4) | static_cast<uint64_t>(digit);
    }
    return CatalogId(parts[0], parts[1]);
}

std::string CatalogId::to_base62() const {
    Limbs limbs;
    to_limbs(high_, low_, limbs);
    std::string out;
    out.reserve(kBase62IdLength);
    for (size_t n = 0; n < kBase62IdLength; ++n) {
        uint64_t rem = 0;
        for (int i = 0; i < 4; ++i) {
            const uint64_t cur = (rem << 32) | limbs[i];
            limbs[i] = static_cast<uint32_t>(cur / 62);
            rem = cur % 62;
        }
        out.push_back(kBase62Alphabet[rem]);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string CatalogId::to_hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out(32, '0');
    for (int i = 0; i < 16; ++i) {
        out[15 - i] = digits[(high_ >> (4 * i)) & 0x0F];
        out[31 - i] = digits[(low_ >> (4 * i)) & 0x0F];
    }
    return out;
}

std::optional<FileId> FileId::from_hex(std::string_view text) {
    if (text.size() != kFileIdBytes * 2) {
        return std::nullopt;
    }
    std::array<uint8_t, kFileIdBytes> bytes{};
    for (size_t i = 0; i < kFileIdBytes; ++i) {
        const int hi = hex_digit(text[2 * i]);
        const int lo = hex_digit(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return FileId(bytes);
}

std::string FileId::to_hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(kFileIdBytes * 2);
    for (uint8_t b : bytes_) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

}  // namespace oggfetch
