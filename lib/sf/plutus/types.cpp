/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <utf8cpp/utf8.h>
#include <sf/cbor/decoder.hpp>
#include <sf/plutus/types.hpp>

namespace script_forge::plutus {
    static constexpr std::array<std::string_view, num_builtins> builtin_names {
        "addInteger", "subtractInteger", "multiplyInteger", "divideInteger", "quotientInteger",
        "remainderInteger", "modInteger", "equalsInteger", "lessThanInteger", "lessThanEqualsInteger",
        "appendByteString", "consByteString", "sliceByteString", "lengthOfByteString", "indexByteString",
        "equalsByteString", "lessThanByteString", "lessThanEqualsByteString", "sha2_256", "sha3_256",
        "blake2b_256", "verifyEd25519Signature", "appendString", "equalsString", "encodeUtf8",
        "decodeUtf8", "ifThenElse", "chooseUnit", "trace", "fstPair",
        "sndPair", "chooseList", "mkCons", "headList", "tailList",
        "nullList", "chooseData", "constrData", "mapData", "listData",
        "iData", "bData", "unConstrData", "unMapData", "unListData",
        "unIData", "unBData", "equalsData", "mkPairData", "mkNilData",
        "mkNilPairData", "serialiseData", "verifyEcdsaSecp256k1Signature", "verifySchnorrSecp256k1Signature", "bls12_381_G1_add",
        "bls12_381_G1_neg", "bls12_381_G1_scalarMul", "bls12_381_G1_equal", "bls12_381_G1_hashToGroup", "bls12_381_G1_compress",
        "bls12_381_G1_uncompress", "bls12_381_G2_add", "bls12_381_G2_neg", "bls12_381_G2_scalarMul", "bls12_381_G2_equal",
        "bls12_381_G2_hashToGroup", "bls12_381_G2_compress", "bls12_381_G2_uncompress", "bls12_381_millerLoop", "bls12_381_mulMlResult",
        "bls12_381_finalVerify", "keccak_256", "blake2b_224", "integerToByteString", "byteStringToInteger",
        "andByteString", "orByteString", "xorByteString", "complementByteString", "readBit",
        "writeBits", "replicateByte", "shiftByteString", "rotateByteString", "countSetBits",
        "findFirstSetBit", "ripemd_160", "expModInteger"
    };

    std::string_view builtin_name(const uint8_t tag)
    {
        if (tag >= builtin_names.size()) [[unlikely]]
            throw error("unknown builtin tag: {}", tag);
        return builtin_names[tag];
    }

    // Constructor ids 0-6 and 7-127 have compact tags, the rest use tag 102.
    static constexpr uint64_t constr_tag_small = 121;
    static constexpr uint64_t constr_tag_large = 1280;
    static constexpr uint64_t constr_tag_general = 102;
    static constexpr uint64_t constr_max_compact_id = 127;

    namespace {
        struct data_reader {
            arena &alloc;
            cbor::decoder dec;

            data_ref read(const size_t depth)
            {
                if (depth >= cbor::max_nesting) [[unlikely]]
                    throw error("Plutus data is nested deeper than {} levels at offset {}", cbor::max_nesting, dec.pos());
                const auto h = dec.read_head();
                switch (h.type) {
                    case cbor::major_type::uint:
                        return alloc.make<data>(cpp_int { h.arg });
                    case cbor::major_type::nint:
                        return alloc.make<data>(cpp_int { -1 - cpp_int { h.arg } });
                    case cbor::major_type::bytes: {
                        byte_string bytes { alloc.resource() };
                        dec.read_bytes(h, bytes);
                        return alloc.make<data>(std::move(bytes));
                    }
                    case cbor::major_type::array:
                        return alloc.make<data>(read_items(h, depth));
                    case cbor::major_type::map: {
                        data_map m { decltype(data_map::entries) { alloc.resource() } };
                        for (uint64_t i = 0; h.indefinite ? !dec.read_break() : i < h.arg; ++i) {
                            const auto k = read(depth + 1);
                            const auto v = read(depth + 1);
                            m.entries.emplace_back(k, v);
                        }
                        return alloc.make<data>(std::move(m));
                    }
                    case cbor::major_type::tag:
                        return read_tagged(h.arg, depth);
                    default:
                        throw error("CBOR type {} is not allowed in Plutus data at offset {}", h.type, dec.pos());
                }
            }
        private:
            data_list read_items(const cbor::head &h, const size_t depth)
            {
                if (h.type != cbor::major_type::array) [[unlikely]]
                    throw error("expected a CBOR array but got {} at offset {}", h.type, dec.pos());
                data_list items { alloc.resource() };
                for (uint64_t i = 0; h.indefinite ? !dec.read_break() : i < h.arg; ++i)
                    items.emplace_back(read(depth + 1));
                return items;
            }

            data_ref read_constr(const uint64_t id, const size_t depth)
            {
                return alloc.make<data>(data_constr { id, read_items(dec.read_head(), depth) });
            }

            data_ref read_tagged(const uint64_t tag, const size_t depth)
            {
                if (tag == 2 || tag == 3) {
                    uint8_vector bytes {};
                    dec.read_bytes(dec.read_head(), bytes);
                    const auto mag = big_int_from_bytes(bytes);
                    return alloc.make<data>(tag == 2 ? mag : cpp_int { -1 - mag });
                }
                if (tag >= constr_tag_small && tag < constr_tag_small + 7)
                    return read_constr(tag - constr_tag_small, depth);
                if (tag >= constr_tag_large && tag <= constr_tag_large + constr_max_compact_id - 7)
                    return read_constr(tag - constr_tag_large + 7, depth);
                if (tag == constr_tag_general) {
                    const auto h = dec.read_head();
                    if (h.type != cbor::major_type::array || (!h.indefinite && h.arg != 2)) [[unlikely]]
                        throw error("a general constructor must be a two-element array at offset {}", dec.pos());
                    const auto id = dec.read_uint();
                    const auto res = read_constr(id, depth);
                    if (h.indefinite && !dec.read_break()) [[unlikely]]
                        throw error("a general constructor must be a two-element array at offset {}", dec.pos());
                    return res;
                }
                throw error("CBOR tag {} is not allowed in Plutus data", tag);
            }
        };

        void write_data(cbor::encoder &enc, const data &d);

        void write_list(cbor::encoder &enc, const data_list &items)
        {
            if (items.empty()) {
                enc.array(0);
                return;
            }
            enc.begin(cbor::major_type::array);
            for (const auto &item: items)
                write_data(enc, *item);
            enc.end();
        }

        void write_data(cbor::encoder &enc, const data &d)
        {
            std::visit([&](const auto &v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, data_constr>) {
                    if (v.id < 7) {
                        enc.tag(constr_tag_small + v.id);
                    } else if (v.id <= constr_max_compact_id) {
                        enc.tag(constr_tag_large + v.id - 7);
                    } else {
                        enc.tag(constr_tag_general).array(2).uint(v.id);
                    }
                    write_list(enc, v.fields);
                } else if constexpr (std::is_same_v<T, data_map>) {
                    enc.map(v.entries.size());
                    for (const auto &[k, mv]: v.entries) {
                        write_data(enc, *k);
                        write_data(enc, *mv);
                    }
                } else if constexpr (std::is_same_v<T, data_list>) {
                    write_list(enc, v);
                } else if constexpr (std::is_same_v<T, cpp_int>) {
                    enc.integer(v);
                } else if constexpr (std::is_same_v<T, byte_string>) {
                    if (v.size() <= cbor::max_bytes_chunk) {
                        enc.bytes(buffer { v.data(), v.size() });
                    } else {
                        enc.begin(cbor::major_type::bytes);
                        for (size_t i = 0; i < v.size(); i += cbor::max_bytes_chunk)
                            enc.bytes(buffer { v.data() + i, std::min(cbor::max_bytes_chunk, v.size() - i) });
                        enc.end();
                    }
                }
            }, d);
        }

        template<typename It, typename F>
        std::string join(It begin, It end, const F &render)
        {
            std::string res {};
            for (auto it = begin; it != end; ++it) {
                if (it != begin)
                    res += ", ";
                res += render(*it);
            }
            return res;
        }
    }

    data_ref data::from_cbor(arena &alloc, const buffer bytes)
    {
        data_reader r { alloc, cbor::decoder { bytes } };
        return r.read(0);
    }

    void data::to_cbor(cbor::encoder &enc) const
    {
        write_data(enc, *this);
    }

    uint8_vector data::as_cbor() const
    {
        cbor::encoder enc {};
        to_cbor(enc);
        return enc.take();
    }

    std::string data::as_string() const
    {
        const auto render = [](const data_ref d) { return d->as_string(); };
        return std::visit([&](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, data_constr>) {
                return fmt::format("Constr {} [{}]", v.id, join(v.fields.begin(), v.fields.end(), render));
            } else if constexpr (std::is_same_v<T, data_map>) {
                return fmt::format("Map [{}]", join(v.entries.begin(), v.entries.end(), [](const auto &e) {
                    return fmt::format("({}, {})", e.first->as_string(), e.second->as_string());
                }));
            } else if constexpr (std::is_same_v<T, data_list>) {
                return fmt::format("List [{}]", join(v.begin(), v.end(), render));
            } else if constexpr (std::is_same_v<T, cpp_int>) {
                return fmt::format("I {}", v);
            } else {
                return fmt::format("B #{}", buffer_lowercase { buffer { v.data(), v.size() } });
            }
        }, *this);
    }

    std::string to_uplc(const constant_type &typ)
    {
        switch (typ.tag) {
            case type_tag::integer: return "integer";
            case type_tag::bytestring: return "bytestring";
            case type_tag::string: return "string";
            case type_tag::unit: return "unit";
            case type_tag::boolean: return "bool";
            case type_tag::data: return "data";
            case type_tag::list: return fmt::format("(list {})", *typ.first);
            case type_tag::pair: return fmt::format("(pair {} {})", *typ.first, *typ.second);
            default: throw error("unsupported constant type tag: {}", static_cast<int>(typ.tag));
        }
    }

    static std::string constant_value(const constant &c)
    {
        return std::visit([&](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "()";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, cpp_int>) {
                return v.str();
            } else if constexpr (std::is_same_v<T, byte_string>) {
                return fmt::format("#{}", buffer_lowercase { buffer { v.data(), v.size() } });
            } else if constexpr (std::is_same_v<T, std::pmr::string>) {
                return fmt::format("\"{}\"", escape_utf8_string(v));
            } else if constexpr (std::is_same_v<T, data_ref>) {
                return fmt::format("({})", v->as_string());
            } else if constexpr (std::is_same_v<T, constant_list>) {
                return fmt::format("[{}]", join(v.begin(), v.end(), [](const constant_ref e) { return constant_value(*e); }));
            } else {
                return fmt::format("({}, {})", constant_value(*v.first), constant_value(*v.second));
            }
        }, c.value);
    }

    std::string to_uplc(const constant &c)
    {
        return fmt::format("(con {} {})", *c.type, constant_value(c));
    }

    static std::string render_terms(const term_list &terms)
    {
        std::string res {};
        for (const auto &t: terms)
            res += fmt::format(" {}", *t);
        return res;
    }

    std::string to_uplc(const term &t)
    {
        return std::visit([&](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, t_var>) {
                return fmt::format("v{}", v.level);
            } else if constexpr (std::is_same_v<T, t_delay>) {
                return fmt::format("(delay {})", *v.body);
            } else if constexpr (std::is_same_v<T, t_lambda>) {
                return fmt::format("(lam v{} {})", v.level, *v.body);
            } else if constexpr (std::is_same_v<T, t_apply>) {
                return fmt::format("[{} {}]", *v.func, *v.arg);
            } else if constexpr (std::is_same_v<T, constant_ref>) {
                return to_uplc(*v);
            } else if constexpr (std::is_same_v<T, t_force>) {
                return fmt::format("(force {})", *v.body);
            } else if constexpr (std::is_same_v<T, t_error>) {
                return "(error)";
            } else if constexpr (std::is_same_v<T, t_builtin>) {
                return fmt::format("(builtin {})", builtin_name(v.tag));
            } else if constexpr (std::is_same_v<T, t_constr>) {
                return fmt::format("(constr {}{})", v.tag, render_terms(v.args));
            } else {
                return fmt::format("(case {}{})", *v.arg, render_terms(v.branches));
            }
        }, t);
    }

    std::string to_uplc(const program &p)
    {
        return fmt::format("(program {} {})", p.ver, *p.body);
    }

    std::string escape_utf8_string(const std::string_view s)
    {
        std::string res {};
        auto res_it = std::back_inserter(res);
        for (auto it = s.begin(), end = s.end(); it != end;) {
            const auto k = utf8::next(it, end);
            if (k == '"' || k == '\\') {
                res_it++ = '\\';
                res_it++ = static_cast<char>(k);
            } else if (k >= 127) {
                fmt::format_to(res_it, "\\{}", static_cast<int>(k));
            } else if (k >= 32) {
                res_it++ = static_cast<char>(k);
            } else {
                fmt::format_to(res_it, "\\x{:02X}", static_cast<int>(k));
            }
        }
        return res;
    }

    void validate_utf8_string(const buffer bytes)
    {
        const auto sv = bytes.string_view();
        if (const auto bad_it = utf8::find_invalid(sv.begin(), sv.end()); bad_it != sv.end()) [[unlikely]]
            throw error("invalid UTF-8 sequence at offset {} of a string constant", bad_it - sv.begin());
    }
}
