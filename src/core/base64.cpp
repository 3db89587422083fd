#include <snap_mcp/core/base64.hpp>

#include <mbedtls/base64.h>

namespace snap_mcp {

std::string Base64Encode(const std::vector<uint8_t>& data) {
    size_t written = 0;
    mbedtls_base64_encode(nullptr, 0, &written, data.data(), data.size());

    // written includes the terminating NUL.
    std::string output(written, '\0');
    if (mbedtls_base64_encode(reinterpret_cast<unsigned char*>(output.data()), output.size(),
                              &written, data.data(), data.size()) != 0) {
        return {};
    }
    output.resize(written);
    return output;
}

Result<std::vector<uint8_t>, std::string> Base64Decode(std::string_view text) {
    using R = Result<std::vector<uint8_t>, std::string>;

    if (text.size() % 4 != 0) {
        return R::Err("length " + std::to_string(text.size()) + " is not a multiple of 4");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' || text[i] == '\n' || text[i] == ' ') {
            return R::Err("whitespace at offset " + std::to_string(i));
        }
    }

    const auto* src = reinterpret_cast<const unsigned char*>(text.data());
    size_t written = 0;
    int rc = mbedtls_base64_decode(nullptr, 0, &written, src, text.size());
    if (rc == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        return R::Err("invalid character or padding");
    }

    std::vector<uint8_t> output(written, 0x00);
    rc = mbedtls_base64_decode(output.data(), output.size(), &written, src, text.size());
    if (rc != 0) {
        return R::Err(rc == MBEDTLS_ERR_BASE64_INVALID_CHARACTER
                          ? "invalid character or padding"
                          : "decode failed (mbedtls error " + std::to_string(rc) + ")");
    }
    output.resize(written);
    return R::Ok(std::move(output));
}

} // namespace snap_mcp
