#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace cfi::crypto::hash {

// Raw 32-byte SHA-256 digest
std::vector<uint8_t> sha256(const std::string& data);

}
