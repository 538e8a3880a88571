/**
 * @file chunk_type.hh
 * @brief Four-byte PNG chunk type code with property bits
 * @author Igor
 * @date 10/08/2025
 */

#pragma once

#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @struct chunk_type
     * @brief A PNG chunk type: four bytes, each expected to be an ASCII letter
     *
     * Bit 5 (the ASCII case bit) of every byte carries a property:
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * Any four bytes can be held; validity is a query, never a
     * precondition, so unusual types found in the wild survive a round trip.
     */
    struct PNGME_EXPORT chunk_type {
        std::array<std::uint8_t, 4> b{0, 0, 0, 0};

        constexpr chunk_type() = default;

        // Constructor from 4 individual chars
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from raw bytes, never fails
        constexpr explicit chunk_type(const std::array<std::uint8_t, 4>& bytes)
            : b(bytes) {}

        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * @brief Parse a chunk type from its textual form
         * @param sv Exactly four ASCII letters
         * @return The parsed chunk type (which may still be invalid, e.g. "Rust")
         * @throws format_error if the length is not 4 or a byte is not a letter
         */
        static chunk_type parse(std::string_view sv);

        // Raw bytes, as used for CRC computation and serialization
        [[nodiscard]] constexpr const std::array<std::uint8_t, 4>& bytes() const { return b; }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Property bits
        [[nodiscard]] constexpr bool is_critical() const { return (b[0] & case_bit) == 0; }
        [[nodiscard]] constexpr bool is_public() const { return (b[1] & case_bit) == 0; }
        // Reserved-bit query (is_reserved_bit_set): true when byte 2 is uppercase
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return (b[2] & case_bit) == 0; }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return (b[3] & case_bit) != 0; }

        // All bytes are ASCII letters
        [[nodiscard]] bool is_alphabetic() const {
            return std::all_of(b.begin(), b.end(), [](std::uint8_t c) {
                return is_letter(c);
            });
        }

        // Letters only, and the reserved bit (byte 2) uppercase
        [[nodiscard]] bool is_valid() const {
            return is_alphabetic() && is_reserved_bit_valid();
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }
        bool operator<=(const chunk_type& o) const { return b <= o.b; }
        bool operator>(const chunk_type& o) const { return b > o.b; }
        bool operator>=(const chunk_type& o) const { return b >= o.b; }

        static constexpr bool is_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // Stream output: the type as text, non-printable bytes escaped
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            for (std::uint8_t c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c);
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            return os;
        }

    private:
        static constexpr std::uint8_t case_bit = 0x20;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }

    // Registered chunk types the library refers to by name
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
        inline constexpr chunk_type zTXt('z', 'T', 'X', 't');
        inline constexpr chunk_type iTXt('i', 'T', 'X', 't');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
