#pragma once

#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::tools {

inline constexpr const char* kPrimaryEncoding = "UTF-8";

struct DecodedText {
    std::string text;      // always UTF-8
    std::string encoding;  // encoding the bytes were read as
};

bool is_valid_utf8(const std::string& bytes);

// Converts `bytes` from `encoding` to UTF-8; fails on any invalid sequence.
core::errors::Result<std::string> convert_to_utf8(const std::string& bytes,
                                                  const std::string& encoding);

// UTF-8 first, then each fallback in order.
core::errors::Result<DecodedText> decode_text(const std::string& bytes,
                                              const std::vector<std::string>& fallbacks);

}  // namespace toolbridge::tools
