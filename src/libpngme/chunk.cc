//
// Created by igor on 14/08/2025.
//

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

#include <cstring>
#include <ostream>
#include <string>
#include <stdexcept>
#include <limits>

namespace pngme {

    namespace {
        // Strict UTF-8 check: no overlong forms, no surrogates, nothing above U+10FFFF
        bool is_utf8(const std::vector<std::byte>& data) {
            std::size_t i = 0;
            const std::size_t n = data.size();

            while (i < n) {
                auto c = static_cast<std::uint8_t>(data[i]);
                if (c < 0x80) {
                    i++;
                    continue;
                }

                std::size_t extra;
                std::uint32_t cp;
                std::uint32_t min_cp;
                if ((c & 0xE0) == 0xC0) {
                    extra = 1; cp = c & 0x1F; min_cp = 0x80;
                } else if ((c & 0xF0) == 0xE0) {
                    extra = 2; cp = c & 0x0F; min_cp = 0x800;
                } else if ((c & 0xF8) == 0xF0) {
                    extra = 3; cp = c & 0x07; min_cp = 0x10000;
                } else {
                    return false;
                }

                if (n - i <= extra) {
                    return false;
                }
                for (std::size_t k = 1; k <= extra; k++) {
                    auto cc = static_cast<std::uint8_t>(data[i + k]);
                    if ((cc & 0xC0) != 0x80) {
                        return false;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }

                if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    return false;
                }
                i += extra + 1;
            }
            return true;
        }

        std::vector<std::byte> text_bytes(std::string_view text) {
            const auto* p = reinterpret_cast<const std::byte*>(text.data());
            return {p, p + text.size()};
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw std::length_error("Chunk data of " + std::to_string(m_data.size()) +
                                    " bytes does not fit a 32-bit length");
        }
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, text_bytes(text)) {
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::decode(const void* data, std::size_t size) {
        byte_reader in(data, size);
        return read(in);
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes) {
        return decode(bytes.data(), bytes.size());
    }

    chunk chunk::read(byte_reader& in) {
        const std::size_t start = in.tell();

        THROW_TRUNCATED_IF(in.remaining() < overhead,
                           "Chunk at offset ", start, " needs at least ", overhead,
                           " bytes, only ", in.remaining(), " available");

        std::uint32_t length = in.read_be32();
        chunk_type type = in.read_chunk_type();

        // The crc field must fit behind the data as well
        THROW_TRUNCATED_IF(static_cast<std::uint64_t>(length) + 4 > in.remaining(),
                           "Chunk '", type, "' at offset ", start, " declares ", length,
                           " data bytes, only ",
                           (in.remaining() >= 4 ? in.remaining() - 4 : 0), " available");

        std::vector<std::byte> payload = in.read_exact(length);
        std::uint32_t stored = in.read_be32();
        std::uint32_t computed = chunk_crc(type, payload.data(), payload.size());

        if (stored != computed) {
            throw crc_mismatch(build_error_msg("Chunk '", type, "' at offset ", start,
                                               " has crc ", stored, ", expected ", computed),
                               stored, computed);
        }

        return chunk(type, std::move(payload), stored);
    }

    std::string chunk::data_as_text() const {
        if (!is_text()) {
            throw not_text_error(build_error_msg("Data of chunk '", m_type, "' (", m_data.size(),
                                                 " bytes) is not valid UTF-8"));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    bool chunk::is_text() const {
        return is_utf8(m_data);
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        serialize_to(out);
        return out;
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        const std::size_t start = out.size();
        out.resize(start + encoded_size());

        std::byte* p = out.data() + start;
        store_be32(p, length());
        m_type.to_bytes(p + 4);
        if (!m_data.empty()) {
            std::memcpy(p + 8, m_data.data(), m_data.size());
        }
        store_be32(p + 8 + m_data.size(), m_crc);
    }

    bool chunk::operator==(const chunk& o) const {
        return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        if (c.is_text()) {
            os.write(reinterpret_cast<const char*>(c.m_data.data()),
                     static_cast<std::streamsize>(c.m_data.size()));
        } else {
            for (std::size_t i = 0; i < c.m_data.size(); i++) {
                os << "\xEF\xBF\xBD";
            }
        }
        return os;
    }

} // namespace pngme
