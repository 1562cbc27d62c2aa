/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_CBOR_TYPES_HPP
#define SCRIPT_FORGE_CBOR_TYPES_HPP

#include <array>
#include <cstdint>
#include <sf/common/format.hpp>

namespace script_forge::cbor {
    enum class major_type: uint8_t {
        uint, nint, bytes, text, array, map, tag, simple
    };

    // values of the low five bits of an initial byte
    static constexpr uint8_t info_uint8 = 24;
    static constexpr uint8_t info_uint64 = 27;
    static constexpr uint8_t info_indefinite = 31;
    static constexpr uint8_t break_byte = 0xFF;

    // Plutus Data byte strings are split into chunks of at most this size
    static constexpr size_t max_bytes_chunk = 64;
    static constexpr size_t max_nesting = 1024;
}

namespace fmt {
    template<>
    struct formatter<script_forge::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const script_forge::cbor::major_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            static constexpr std::array<std::string_view, 8> names {
                "uint", "nint", "bytes", "text", "array", "map", "tag", "simple"
            };
            const auto idx = static_cast<size_t>(v);
            if (idx < names.size())
                return fmt::format_to(ctx.out(), "{}", names[idx]);
            return fmt::format_to(ctx.out(), "major_type({})", idx);
        }
    };
}

#endif // !SCRIPT_FORGE_CBOR_TYPES_HPP
