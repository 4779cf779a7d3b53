//
// Created by cv2 on 06.10.2026.
//

#pragma once
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace perch {

    struct Thumbnail {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> png; // PNG-encoded preview
    };

    // Decodes the image and scales it to fit inside max_edge x max_edge,
    // keeping the aspect ratio. Images already smaller are only re-encoded.
    // Returns nullopt for anything OpenCV cannot decode (RAW files included).
    std::optional<Thumbnail> make_thumbnail(const std::filesystem::path& path, int max_edge = 100);

} // namespace perch
