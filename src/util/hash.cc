#include "util/hash.hpp"

#include <crc32c/crc32c.h>

uint32_t
yamlview::line_checksum(const std::string& line) {
    return crc32c::Crc32c(line.data(), line.size());
}
