/**
 * @file crc.hh
 * @brief CRC-32 as used by PNG chunk records
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngme/chunk_type.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @brief Compute the CRC-32 of a chunk record
     * @param type Chunk type, covered first
     * @param data Chunk data, covered after the type
     * @param size Number of data bytes
     * @return CRC-32 (IEEE 802.3 polynomial) over type ++ data
     */
    PNGME_EXPORT std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size);

} // namespace pngme
