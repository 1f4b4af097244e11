// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ferry::core {

// On-disk names for one URL
struct TransferPaths {
    std::filesystem::path final_path;  // <folder>/<md5(url)>_<basename>
    std::filesystem::path temp_path;   // final + ".temp"
    std::filesystem::path meta_path;   // temp + ".meta"
};

// Lower-case hex MD5 of the URL string
[[nodiscard]] std::string url_hash(std::string_view url);

// "<md5(url)>_<basename(url)>", basename falls back to "unnamed_file"
[[nodiscard]] std::string file_name_for(std::string_view url);

[[nodiscard]] TransferPaths paths_for(std::string_view url, const std::filesystem::path& output_folder);

// Temp and sidecar names for an explicit destination
[[nodiscard]] TransferPaths paths_for_destination(const std::filesystem::path& destination);

} // namespace ferry::core
