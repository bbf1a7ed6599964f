#include "tools/text_decoding.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <iconv.h>

namespace toolbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
namespace codes = core::errors::codes;

namespace {

class IconvHandle {
public:
    IconvHandle(const std::string& to, const std::string& from)
        : handle_(iconv_open(to.c_str(), from.c_str())) {}

    ~IconvHandle() {
        if (valid()) {
            static_cast<void>(iconv_close(handle_));
        }
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return handle_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return handle_; }

private:
    iconv_t handle_;
};

}  // namespace

bool is_valid_utf8(const std::string& bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

core::errors::Result<std::string> convert_to_utf8(const std::string& bytes,
                                                  const std::string& encoding) {
    IconvHandle cd(kPrimaryEncoding, encoding);
    if (!cd.valid()) {
        return BridgeError{ErrorCategory::Execution, "Unsupported encoding: " + encoding,
                           codes::kDecodeFailure};
    }

    std::string input = bytes;
    std::string output;
    output.resize(bytes.size() * 4 + 16);

    char* in_ptr = input.data();
    std::size_t in_left = input.size();
    char* out_ptr = output.data();
    std::size_t out_left = output.size();

    while (in_left > 0) {
        const std::size_t rc = iconv(cd.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        if (rc != static_cast<std::size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            const std::size_t used = output.size() - out_left;
            output.resize(output.size() * 2);
            out_ptr = output.data() + used;
            out_left = output.size() - used;
            continue;
        }
        return BridgeError{ErrorCategory::Execution,
                           "Bytes are not valid " + encoding, codes::kDecodeFailure};
    }

    output.resize(output.size() - out_left);
    return output;
}

core::errors::Result<DecodedText> decode_text(const std::string& bytes,
                                              const std::vector<std::string>& fallbacks) {
    if (is_valid_utf8(bytes)) {
        return DecodedText{bytes, kPrimaryEncoding};
    }

    for (const auto& encoding : fallbacks) {
        auto converted = convert_to_utf8(bytes, encoding);
        if (core::errors::is_error(converted)) {
            continue;
        }
        return DecodedText{core::errors::get_value(converted), encoding};
    }

    std::string tried = kPrimaryEncoding;
    for (const auto& encoding : fallbacks) {
        tried += ", " + encoding;
    }
    return BridgeError{ErrorCategory::Execution,
                       "Unable to decode file content (tried " + tried + ")",
                       codes::kDecodeFailure};
}

}  // namespace toolbridge::tools
