#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cfi::util {

// Crockford Base32 (no I, L, O, U)
static inline constexpr char kBase32Crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

enum class Case { Upper, Lower };

std::string b32_crockford_encode(const uint8_t* data, size_t len, Case out_case = Case::Upper);

// `length` characters of Crockford Base32 drawn from libsodium's CSPRNG.
std::string random_b32(size_t length, Case out_case = Case::Lower);

}
