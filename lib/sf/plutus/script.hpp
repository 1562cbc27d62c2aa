/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_PLUTUS_SCRIPT_HPP
#define SCRIPT_FORGE_PLUTUS_SCRIPT_HPP

#include <array>
#include <optional>
#include <span>
#include <sf/common/bytes.hpp>

namespace script_forge::plutus {
    enum class output_encoding {
        single_cbor,
        double_cbor,
        pure
    };

    extern output_encoding output_encoding_from_name(std::string_view name);

    struct unsupported_version_error: error {
        unsupported_version_error();
    };

    struct language_version {
        std::array<uint8_t, 3> prefix;
        std::string_view language;
    };

    // Only the flat version prefixes of the Plutus languages accepted for normalization.
    static constexpr std::array<language_version, 2> supported_versions {{
        { { 1, 0, 0 }, "Plutus V1" },
        { { 1, 1, 0 }, "Plutus V3" }
    }};

    extern bool has_supported_version(buffer script);
    extern std::optional<std::string_view> supported_language(buffer script);

    /*
     * Removes the layers of CBOR byte-string wrapping until the flat bytes start with a supported version.
     * The number of removed layers is stored into depth.
     * Throws unsupported_version_error when no such bytes can be found.
     */
    extern uint8_vector unwrap(buffer script, size_t &depth);
    extern uint8_vector unwrap(buffer script);

    extern uint8_vector apply_encoding(buffer flat_bytes, output_encoding mode);
    extern uint8_vector normalize(buffer script, output_encoding mode);
    extern uint8_vector apply_args(std::span<const buffer> args, buffer script, output_encoding mode);
}

namespace fmt {
    template<>
    struct formatter<script_forge::plutus::output_encoding>: formatter<int> {
        template<typename FormatContext>
        auto format(const script_forge::plutus::output_encoding &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using script_forge::plutus::output_encoding;
            switch (v) {
                case output_encoding::single_cbor: return fmt::format_to(ctx.out(), "SingleCBOR");
                case output_encoding::double_cbor: return fmt::format_to(ctx.out(), "DoubleCBOR");
                case output_encoding::pure: return fmt::format_to(ctx.out(), "PurePlutusScriptBytes");
                default: throw script_forge::error("unsupported output encoding: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !SCRIPT_FORGE_PLUTUS_SCRIPT_HPP
