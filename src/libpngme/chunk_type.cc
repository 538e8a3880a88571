//
// Created by igor on 10/08/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    chunk_type chunk_type::parse(std::string_view sv) {
        THROW_FORMAT_UNLESS(sv.size() == 4,
                            "Chunk type must be 4 bytes long, got ", sv.size(), " bytes");

        chunk_type result = from_bytes(sv.data());
        THROW_FORMAT_UNLESS(result.is_alphabetic(),
                            "Chunk type '", result, "' must consist of ASCII letters only");
        return result;
    }

} // namespace pngme
