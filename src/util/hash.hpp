#pragma once

#include <cstdint>
#include <string>

namespace yamlview {

// CRC-32C of a line. Lines with different checksums can not be equal; equal
// checksums still need a text comparison.
uint32_t
line_checksum(const std::string& line);

}  // namespace yamlview
