//
// Created by igor on 15/08/2025.
//

#include <pngme/crc.hh>
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace pngme {

    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.bytes().data(), 4);

        // zlib takes the length as uInt, feed larger payloads in slices
        const auto* p = static_cast<const Bytef*>(data);
        while (size > 0) {
            std::size_t n = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
            crc = crc32(crc, p, static_cast<uInt>(n));
            p += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(crc);
    }

} // namespace pngme
