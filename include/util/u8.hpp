#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace sbs::util {

// Decodes arbitrary bytes as UTF-8, replacing every invalid sequence with U+FFFD.
std::string toLossyUtf8(std::string_view bytes);

inline std::string toLossyUtf8(const std::vector<uint8_t>& bytes) {
    return toLossyUtf8(std::string_view{reinterpret_cast<const char*>(bytes.data()), bytes.size()});
}

}
