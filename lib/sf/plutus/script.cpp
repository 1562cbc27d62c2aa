/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cbor/decoder.hpp>
#include <sf/cbor/encoder.hpp>
#include <sf/logger.hpp>
#include <sf/plutus/flat.hpp>
#include <sf/plutus/flat-encoder.hpp>
#include <sf/plutus/script.hpp>

namespace script_forge::plutus {
    output_encoding output_encoding_from_name(const std::string_view name)
    {
        for (const auto enc: { output_encoding::single_cbor, output_encoding::double_cbor, output_encoding::pure }) {
            if (fmt::format("{}", enc) == name)
                return enc;
        }
        throw error("unsupported output encoding: '{}'", name);
    }

    unsupported_version_error::unsupported_version_error():
        error { std::string_view { "Unsupported Plutus version or invalid Plutus script bytes" } }
    {
    }

    std::optional<std::string_view> supported_language(const buffer script)
    {
        if (script.size() < 3)
            return {};
        for (const auto &[prefix, lang]: supported_versions) {
            if (buffer { prefix.data(), prefix.size() } == script.subbuf(0, 3))
                return lang;
        }
        return {};
    }

    bool has_supported_version(const buffer script)
    {
        return supported_language(script).has_value();
    }

    uint8_vector unwrap(const buffer script, size_t &depth)
    {
        uint8_vector bytes { script };
        depth = 0;
        while (bytes.size() >= 3) {
            if (has_supported_version(bytes))
                return bytes;
            uint8_vector payload {};
            try {
                cbor::decoder dec { bytes };
                const auto head = dec.read_head();
                if (head.type != cbor::major_type::bytes)
                    break;
                dec.read_bytes(head, payload);
            } catch (const error &ex) {
                logger::trace("stopped unwrapping at depth {}: {}", depth, ex.what());
                break;
            }
            bytes = std::move(payload);
            ++depth;
        }
        if (has_supported_version(bytes))
            return bytes;
        throw unsupported_version_error {};
    }

    uint8_vector unwrap(const buffer script)
    {
        size_t depth;
        return unwrap(script, depth);
    }

    static uint8_vector wrap_cbor_bytes(const buffer bytes)
    {
        cbor::encoder enc {};
        enc.bytes(bytes);
        return enc.take();
    }

    uint8_vector apply_encoding(const buffer flat_bytes, const output_encoding mode)
    {
        switch (mode) {
            case output_encoding::single_cbor: return wrap_cbor_bytes(flat_bytes);
            case output_encoding::double_cbor: return wrap_cbor_bytes(wrap_cbor_bytes(flat_bytes));
            case output_encoding::pure: return uint8_vector { flat_bytes };
            default: throw error("unsupported output encoding: {}", static_cast<int>(mode));
        }
    }

    uint8_vector normalize(const buffer script, const output_encoding mode)
    {
        return apply_encoding(unwrap(script), mode);
    }

    uint8_vector apply_args(const std::span<const buffer> args, const buffer script, const output_encoding mode)
    {
        arena alloc {};
        const auto prog = flat::decode(alloc, unwrap(script));
        auto body = prog.body;
        const auto data_type = alloc.make<constant_type>(type_tag::data);
        for (const auto &arg: args) {
            const auto arg_term = alloc.make<term>(alloc.make<constant>(data_type, data::from_cbor(alloc, arg)));
            body = alloc.make<term>(t_apply { body, arg_term });
        }
        logger::debug("applied {} arguments to a program version {}", args.size(), prog.ver);
        return apply_encoding(flat::encode(program { prog.ver, body }), mode);
    }
}
