//
// Created by igor on 12/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Cursor over a borrowed, bounded byte region.
    // Every read that cannot be satisfied throws truncated_input.
    class byte_reader {
        public:
            byte_reader(const void* data, std::size_t size);

            void read(void* dst, std::size_t size);
            std::vector<std::byte> read_exact(std::size_t size);
            std::uint32_t read_be32();
            chunk_type read_chunk_type();

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Pointer to the byte at the current position
            [[nodiscard]] const std::uint8_t* current() const { return m_data + m_position; }

        private:
            void require(std::size_t size, const char* what) const;

            const std::uint8_t* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
