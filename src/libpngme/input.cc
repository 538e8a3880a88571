//
// Created by igor on 12/08/2025.
//

#include <cstring>

#include <pngme/endian.hh>
#include "input.hh"

namespace pngme {

    byte_reader::byte_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::uint8_t*>(data)), m_size(size), m_position(0) {
        THROW_TRUNCATED_IF(!m_data && m_size > 0, "Null buffer of ", m_size, " bytes");
    }

    void byte_reader::require(std::size_t size, const char* what) const {
        THROW_TRUNCATED_IF(size > remaining(),
                           "Unexpected end of input reading ", what, " at offset ", m_position,
                           ": requested ", size, " bytes, ", remaining(), " available");
    }

    void byte_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return;
        }
        require(size, "data");
        std::memcpy(dst, current(), size);
        m_position += size;
    }

    std::vector<std::byte> byte_reader::read_exact(std::size_t size) {
        require(size, "data");
        std::vector<std::byte> buffer(size);
        read(buffer.data(), size);
        return buffer;
    }

    std::uint32_t byte_reader::read_be32() {
        require(4, "u32");
        std::uint32_t value = load_be32(current());
        m_position += 4;
        return value;
    }

    chunk_type byte_reader::read_chunk_type() {
        require(4, "chunk type");
        chunk_type result = chunk_type::from_bytes(current());
        m_position += 4;
        return result;
    }
}
