/**
 * @file png.hh
 * @brief A PNG file as an ordered sequence of chunks
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <array>
#include <vector>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/decode_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief The fixed 8-byte signature followed by an ordered list of chunks
     *
     * The png owns its chunks. Order is kept exactly as decoded or
     * appended, so serialize() reproduces any decoded input byte for byte.
     * Nothing here touches the filesystem; loading and storing the bytes
     * is the caller's job.
     */
    class PNGME_EXPORT png {
    public:
        /// 89 50 4E 47 0D 0A 1A 0A
        static constexpr std::array<std::uint8_t, 8> signature{
            0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'
        };

        png() = default;

        /**
         * @brief Build from an explicit chunk list, kept in order
         */
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG byte stream
         * @param data Buffer holding the file
         * @param size Number of bytes in the buffer
         * @param options Limits and warning callback
         * @return The decoded png; nothing is returned on failure
         * @throws invalid_signature if the first 8 bytes are not the PNG signature
         * @throws truncated_input if a chunk runs past the end of the buffer
         * @throws crc_mismatch if a chunk's checksum is wrong
         * @throws decode_error for size limit and strict-mode violations
         */
        static png decode(const void* data, std::size_t size, const decode_options& options);

        static png decode(const void* data, std::size_t size) {
            return decode(data, size, decode_options{});
        }

        static png decode(const std::vector<std::byte>& bytes, const decode_options& options) {
            return decode(bytes.data(), bytes.size(), options);
        }

        static png decode(const std::vector<std::byte>& bytes) {
            return decode(bytes.data(), bytes.size(), decode_options{});
        }

        /**
         * @brief Add a chunk at the end; types may repeat
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @return The removed chunk
         * @throws chunk_not_found if no chunk has that type; the sequence is unchanged
         */
        chunk remove_first_chunk_by_type(const chunk_type& type);
        chunk remove_first_chunk_by_type(std::string_view type);

        /**
         * @brief First chunk of the given type
         * @return Pointer into the sequence, or nullptr. Invalidated by mutation.
         */
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        /// Number of bytes serialize() produces
        [[nodiscard]] std::size_t encoded_size() const;

        /// Signature followed by every chunk in order
        [[nodiscard]] std::vector<std::byte> serialize() const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngme
