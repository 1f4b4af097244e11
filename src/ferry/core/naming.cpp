// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/naming.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/url.hpp>
#include <openssl/evp.h>
#include <array>
#include <memory>
#include <stdexcept>

namespace ferry::core {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

} // namespace

std::string url_hash(std::string_view url) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), url.data(), url.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += HEX[digest[i] >> 4];
        hex += HEX[digest[i] & 0x0F];
    }
    return hex;
}

std::string file_name_for(std::string_view url) {
    std::string base;
    if (auto parsed = Url::parse(url)) {
        base = parsed->basename();
    }

    // A decoded %2F must not escape the output folder
    for (char& c : base) {
        if (c == '/' || c == '\\' || c == '\0') c = '_';
    }
    if (base.empty() || base == "." || base == "..") {
        base = UNNAMED_FILE;
    }

    return url_hash(url) + "_" + base;
}

TransferPaths paths_for(std::string_view url, const std::filesystem::path& output_folder) {
    return paths_for_destination(output_folder / file_name_for(url));
}

TransferPaths paths_for_destination(const std::filesystem::path& destination) {
    TransferPaths paths;
    paths.final_path = destination;
    paths.temp_path = destination;
    paths.temp_path += TEMP_SUFFIX;
    paths.meta_path = paths.temp_path;
    paths.meta_path += META_SUFFIX;
    return paths;
}

} // namespace ferry::core
