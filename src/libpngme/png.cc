//
// Created by igor on 16/08/2025.
//

#include <pngme/png.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <string>

namespace pngme {

    namespace {
        void warn(const decode_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        // Type strings that are not 4 bytes long cannot name any chunk
        bool to_chunk_type(std::string_view sv, chunk_type& out) {
            if (sv.size() != 4) {
                return false;
            }
            out = chunk_type::from_bytes(sv.data());
            return true;
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::decode(const void* data, std::size_t size, const decode_options& options) {
        using namespace chunk_types;

        byte_reader in(data, size);

        std::array<std::uint8_t, 8> head{};
        if (size >= head.size()) {
            in.read(head.data(), head.size());
        }
        if (head != signature) {
            throw invalid_signature(build_error_msg("Input of ", size,
                                                    " bytes does not start with the PNG signature"));
        }

        std::vector<chunk> chunks;
        std::size_t iend_offset = 0;
        bool seen_iend = false;

        while (!in.at_end()) {
            const std::size_t offset = in.tell();

            // Size limit applies to complete records only, a short buffer is truncated_input
            if (in.remaining() >= chunk::overhead) {
                std::uint32_t declared = load_be32(in.current());
                bool complete = static_cast<std::uint64_t>(declared) + chunk::overhead <= in.remaining();
                THROW_DECODE_IF(complete && declared > options.max_chunk_size,
                                "Chunk at offset ", offset, " declares ", declared,
                                " data bytes, which exceeds maximum allowed size of ",
                                options.max_chunk_size, " bytes");
            }

            chunk c = chunk::read(in);
            const chunk_type& type = c.type();

            if (!type.is_valid()) {
                THROW_DECODE_IF(options.strict,
                                "Chunk at offset ", offset, " has invalid type '", type, "'");
                warn(options, offset, "invalid_type",
                     build_error_msg("Chunk type '", type, "' is not a valid PNG chunk type"));
            }

            if (chunks.empty() && type != IHDR) {
                warn(options, offset, "first_not_ihdr",
                     build_error_msg("First chunk is '", type, "', expected 'IHDR'"));
            }

            if (seen_iend) {
                warn(options, offset, "after_iend",
                     build_error_msg("Chunk '", type, "' follows 'IEND' at offset ", iend_offset));
            } else if (type == IEND) {
                seen_iend = true;
                iend_offset = offset;
            }

            chunks.push_back(std::move(c));
        }

        if (chunks.empty() || chunks.back().type() != IEND) {
            warn(options, in.tell(), "missing_iend", "Stream does not end with an 'IEND' chunk");
        }

        return png(std::move(chunks));
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_first_chunk_by_type(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("No chunk of type '", type, "' to remove");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    chunk png::remove_first_chunk_by_type(std::string_view type) {
        chunk_type t;
        if (!to_chunk_type(type, t)) {
            THROW_NOT_FOUND("No chunk of type '", type, "' to remove");
        }
        return remove_first_chunk_by_type(t);
    }

    const chunk* png::chunk_by_type(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        chunk_type t;
        if (!to_chunk_type(type, t)) {
            return nullptr;
        }
        return chunk_by_type(t);
    }

    std::size_t png::encoded_size() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }
        return total;
    }

    std::vector<std::byte> png::serialize() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());

        for (std::uint8_t b : signature) {
            out.push_back(static_cast<std::byte>(b));
        }
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

} // namespace pngme
