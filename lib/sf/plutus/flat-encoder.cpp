/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/plutus/flat-encoder.hpp>

namespace script_forge::plutus::flat {
    namespace {
        struct bit_writer {
            void bit(const bool b)
            {
                if (_bit == 0)
                    _out << uint8_t { 0 };
                if (b)
                    _out.back() |= static_cast<uint8_t>(0x80 >> _bit);
                _bit = (_bit + 1) % 8;
            }

            void bits(const size_t n, const uint64_t val)
            {
                for (size_t i = n; i > 0; --i)
                    bit((val >> (i - 1)) & 1);
            }

            void padding()
            {
                while (_bit != 7)
                    bit(false);
                bit(true);
            }

            // 7-bit groups from the least significant one, all but the last have the high bit set
            void uint(const cpp_int &val)
            {
                if (val < 0) [[unlikely]]
                    throw error("a negative value {} cannot be a flat natural number", val);
                uint8_vector groups {};
                boost::multiprecision::export_bits(val, std::back_inserter(groups), 7, false);
                if (groups.empty())
                    groups << uint8_t { 0 };
                for (size_t i = 0; i < groups.size(); ++i)
                    bits(8, (i + 1 < groups.size() ? 0x80 : 0x00) | groups[i]);
            }

            void bytes(const buffer buf)
            {
                padding();
                for (size_t pos = 0; pos < buf.size(); pos += 255) {
                    const auto chunk = buf.subbuf(pos, std::min(buf.size() - pos, size_t { 255 }));
                    _out << static_cast<uint8_t>(chunk.size()) << chunk;
                }
                _out << uint8_t { 0 };
            }

            uint8_vector take()
            {
                if (_bit != 0) [[unlikely]]
                    throw error("flat output does not end on a byte boundary");
                return std::move(_out);
            }
        private:
            uint8_vector _out {};
            size_t _bit = 0;
        };

        struct program_encoder {
            uint8_vector encode(const program &prog)
            {
                _out.uint(prog.ver.major);
                _out.uint(prog.ver.minor);
                _out.uint(prog.ver.patch);
                _term(*prog.body);
                _out.padding();
                return _out.take();
            }
        private:
            bit_writer _out {};
            uint64_t _num_vars = 0;

            void _tag(const term_tag tag)
            {
                _out.bits(4, static_cast<uint64_t>(tag));
            }

            void _terms(const term_list &terms)
            {
                for (const auto &t: terms) {
                    _out.bit(true);
                    _term(*t);
                }
                _out.bit(false);
            }

            // each tag is preceded by a 1 bit, the caller writes the one of the first tag
            void _type(const constant_type &typ)
            {
                switch (typ.tag) {
                    case type_tag::list:
                        _out.bits(4, static_cast<uint64_t>(type_tag::application));
                        _out.bit(true);
                        _out.bits(4, static_cast<uint64_t>(type_tag::list));
                        _out.bit(true);
                        _type(*typ.first);
                        break;
                    case type_tag::pair:
                        _out.bits(4, static_cast<uint64_t>(type_tag::application));
                        _out.bit(true);
                        _out.bits(4, static_cast<uint64_t>(type_tag::application));
                        _out.bit(true);
                        _out.bits(4, static_cast<uint64_t>(type_tag::pair));
                        _out.bit(true);
                        _type(*typ.first);
                        _out.bit(true);
                        _type(*typ.second);
                        break;
                    case type_tag::integer:
                    case type_tag::bytestring:
                    case type_tag::string:
                    case type_tag::unit:
                    case type_tag::boolean:
                    case type_tag::data:
                        _out.bits(4, static_cast<uint64_t>(typ.tag));
                        break;
                    default:
                        throw error("constants of type tag {} cannot be serialized in flat", static_cast<int>(typ.tag));
                }
            }

            void _value(const constant &c)
            {
                std::visit([&](const auto &v) {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        // unit has no payload
                    } else if constexpr (std::is_same_v<T, bool>) {
                        _out.bit(v);
                    } else if constexpr (std::is_same_v<T, cpp_int>) {
                        // zigzag: non-negative values become even, negative ones odd
                        if (v >= 0)
                            _out.uint(cpp_int { v << 1 });
                        else
                            _out.uint(cpp_int { ((-v - 1) << 1) | 1 });
                    } else if constexpr (std::is_same_v<T, byte_string>) {
                        _out.bytes(buffer { v.data(), v.size() });
                    } else if constexpr (std::is_same_v<T, std::pmr::string>) {
                        _out.bytes(buffer { std::string_view { v } });
                    } else if constexpr (std::is_same_v<T, data_ref>) {
                        _out.bytes(v->as_cbor());
                    } else if constexpr (std::is_same_v<T, constant_list>) {
                        for (const auto &item: v) {
                            _out.bit(true);
                            _value(*item);
                        }
                        _out.bit(false);
                    } else {
                        _value(*v.first);
                        _value(*v.second);
                    }
                }, c.value);
            }

            void _term(const term &t)
            {
                _tag(t.tag());
                std::visit([&](const auto &v) {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, t_var>) {
                        if (v.level >= _num_vars) [[unlikely]]
                            throw error("variable v{} is not bound by any of {} enclosing lambdas", v.level, _num_vars);
                        _out.uint(_num_vars - v.level);
                    } else if constexpr (std::is_same_v<T, t_delay> || std::is_same_v<T, t_force>) {
                        _term(*v.body);
                    } else if constexpr (std::is_same_v<T, t_lambda>) {
                        ++_num_vars;
                        _term(*v.body);
                        --_num_vars;
                    } else if constexpr (std::is_same_v<T, t_apply>) {
                        _term(*v.func);
                        _term(*v.arg);
                    } else if constexpr (std::is_same_v<T, constant_ref>) {
                        _out.bit(true);
                        _type(*v->type);
                        _out.bit(false);
                        _value(*v);
                    } else if constexpr (std::is_same_v<T, t_error>) {
                        // no payload
                    } else if constexpr (std::is_same_v<T, t_builtin>) {
                        _out.bits(7, v.tag);
                    } else if constexpr (std::is_same_v<T, t_constr>) {
                        _out.uint(v.tag);
                        _terms(v.args);
                    } else {
                        _term(*v.arg);
                        _terms(v.branches);
                    }
                }, t);
            }
        };
    }

    uint8_vector encode(const program &prog)
    {
        program_encoder enc {};
        return enc.encode(prog);
    }
}
