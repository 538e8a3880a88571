/**
 * @file chunk.hh
 * @brief A single length-prefixed, typed, checksummed PNG chunk
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    class byte_reader;

    /**
     * @class chunk
     * @brief One PNG chunk record
     *
     * Wire layout: length (u32 BE) | type (4 bytes) | data | crc (u32 BE).
     * The chunk owns its data and is immutable once built. The length is
     * always the size of the data, and the crc always matches type ++ data:
     * a fresh chunk computes it, a decoded chunk verifies it.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and crc fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type (not required to be valid)
         * @param data Payload, moved into the chunk
         * @throws std::length_error if the payload does not fit a u32 length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk holding text
         * @param type Chunk type
         * @param text Payload bytes, stored as is
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode one chunk record from the start of a buffer
         * @param data Buffer holding the record
         * @param size Number of bytes available
         * @return The decoded chunk; bytes past the record are ignored
         * @throws truncated_input if the record does not fit in size bytes
         * @throws crc_mismatch if the stored CRC does not match
         */
        static chunk decode(const void* data, std::size_t size);

        /**
         * @brief Decode one chunk record from the start of a byte vector
         */
        static chunk decode(const std::vector<std::byte>& bytes);

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Number of bytes serialize() produces
        [[nodiscard]] std::size_t encoded_size() const { return m_data.size() + overhead; }

        /**
         * @brief Interpret the data as UTF-8 text
         * @throws not_text_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_text() const;

        /// True if the data is valid UTF-8
        [[nodiscard]] bool is_text() const;

        /// Encode as length ++ type ++ data ++ crc
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /// Append the encoded record to out
        void serialize_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

        // Payload as text, one U+FFFD per byte if it is not text
        friend std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        friend class png;

        chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        // Decode the record at the reader's position, advancing past it
        static chunk read(byte_reader& in);

        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngme
