/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/logger.hpp>
#include <sf/plutus/flat.hpp>

namespace script_forge::plutus::flat {
    namespace {
        // bits are consumed from the most significant one
        struct bit_reader {
            explicit bit_reader(const buffer bytes): _bytes { bytes }
            {
            }

            bool bit()
            {
                if (_pos >= _bytes.size()) [[unlikely]]
                    throw error("flat data ends unexpectedly at byte {}", _pos);
                const bool res = (_bytes[_pos] >> (7 - _bit)) & 1;
                if (++_bit == 8) {
                    _bit = 0;
                    ++_pos;
                }
                return res;
            }

            template<size_t N>
            uint8_t bits()
            {
                static_assert(N > 0 && N <= 8);
                uint8_t val = 0;
                for (size_t i = 0; i < N; ++i)
                    val = static_cast<uint8_t>((val << 1) | bit());
                return val;
            }

            // zero bits followed by a one that end on a byte boundary
            void padding()
            {
                while (!bit()) {
                    if (_bit == 0) [[unlikely]]
                        throw error("invalid padding before byte {}", _pos);
                }
                if (_bit != 0) [[unlikely]]
                    throw error("padding does not end on a byte boundary at byte {}", _pos);
            }

            buffer take(const size_t sz)
            {
                if (_bit != 0) [[unlikely]]
                    throw error("an unaligned read of {} bytes at byte {}", sz, _pos);
                const auto res = _bytes.subbuf(_pos, std::min(sz, _bytes.size() - _pos));
                if (res.size() != sz) [[unlikely]]
                    throw error("flat data ends inside of a chunk of {} bytes at byte {}", sz, _pos);
                _pos += sz;
                return res;
            }

            size_t pos() const noexcept
            {
                return _pos;
            }

            bool done() const noexcept
            {
                return _pos == _bytes.size() && _bit == 0;
            }
        private:
            buffer _bytes;
            size_t _pos = 0;
            size_t _bit = 0;
        };

        struct program_decoder {
            program_decoder(arena &alloc, const buffer bytes): _alloc { alloc }, _in { bytes }
            {
            }

            program decode()
            {
                _ver = { _uint64("version major"), _uint64("version minor"), _uint64("version patch") };
                const auto body = _term(0);
                _in.padding();
                if (!_in.done()) [[unlikely]]
                    throw error("unexpected data after the end of a program at byte {}", _in.pos());
                return { _ver, body };
            }
        private:
            // the largest var-uint corresponds to a bignum of big_int_max_size bytes
            static constexpr size_t max_uint_groups = big_int_max_size * 8 / 7 + 1;

            arena &_alloc;
            bit_reader _in;
            version _ver {};
            uint64_t _num_vars = 0;

            cpp_int _uint()
            {
                uint8_vector groups {};
                for (;;) {
                    const auto b = _in.bits<8>();
                    groups << static_cast<uint8_t>(b & 0x7F);
                    if (!(b & 0x80))
                        break;
                    if (groups.size() >= max_uint_groups) [[unlikely]]
                        throw error("a variable-length integer at byte {} is longer than {} groups", _in.pos(), max_uint_groups);
                }
                cpp_int res {};
                boost::multiprecision::import_bits(res, groups.begin(), groups.end(), 7, false);
                return res;
            }

            uint64_t _uint64(const std::string_view what)
            {
                const auto val = _uint();
                if (val > std::numeric_limits<uint64_t>::max()) [[unlikely]]
                    throw error("{} does not fit into 64 bits: {}", what, val);
                return static_cast<uint64_t>(val);
            }

            cpp_int _integer()
            {
                const auto u = _uint();
                if (bit_test(u, 0))
                    return -(u >> 1) - 1;
                return u >> 1;
            }

            template<typename T>
            void _bytes(T &out)
            {
                _in.padding();
                while (const size_t sz = _in.bits<8>()) {
                    const auto chunk = _in.take(sz);
                    out.insert(out.end(), chunk.begin(), chunk.end());
                }
            }

            // each element is preceded by a 1 bit, a 0 bit ends the list
            template<typename F>
            void _list(const F &read_item)
            {
                while (_in.bit())
                    read_item();
            }

            constant_type_ref _type(std::vector<type_tag> &tags, size_t &idx, const size_t depth)
            {
                if (depth >= max_depth) [[unlikely]]
                    throw error("constant types are nested deeper than {} levels", max_depth);
                if (idx >= tags.size()) [[unlikely]]
                    throw error("an incomplete constant type at byte {}", _in.pos());
                switch (const auto tag = tags[idx++]; tag) {
                    case type_tag::integer:
                    case type_tag::bytestring:
                    case type_tag::string:
                    case type_tag::unit:
                    case type_tag::boolean:
                    case type_tag::data:
                        return _alloc.make<constant_type>(tag);
                    case type_tag::application: {
                        if (idx >= tags.size()) [[unlikely]]
                            throw error("an incomplete type application at byte {}", _in.pos());
                        if (tags[idx] == type_tag::list) {
                            ++idx;
                            return _alloc.make<constant_type>(type_tag::list, _type(tags, idx, depth + 1));
                        }
                        if (tags[idx] == type_tag::application && idx + 1 < tags.size() && tags[idx + 1] == type_tag::pair) {
                            idx += 2;
                            const auto fst = _type(tags, idx, depth + 1);
                            const auto snd = _type(tags, idx, depth + 1);
                            return _alloc.make<constant_type>(type_tag::pair, fst, snd);
                        }
                        throw error("unsupported type application at byte {}", _in.pos());
                    }
                    case type_tag::bls12_381_g1_element:
                    case type_tag::bls12_381_g2_element:
                    case type_tag::bls12_381_ml_result:
                        throw error("BLS12-381 constants cannot be serialized in flat but got type tag {}", static_cast<int>(tag));
                    default:
                        throw error("invalid constant type tag {} at byte {}", static_cast<int>(tag), _in.pos());
                }
            }

            constant::value_type _value(const constant_type &typ)
            {
                switch (typ.tag) {
                    case type_tag::integer:
                        return _integer();
                    case type_tag::bytestring: {
                        byte_string bytes { _alloc.resource() };
                        _bytes(bytes);
                        return std::move(bytes);
                    }
                    case type_tag::string: {
                        std::pmr::string s { _alloc.resource() };
                        _bytes(s);
                        validate_utf8_string(buffer { std::string_view { s } });
                        return std::move(s);
                    }
                    case type_tag::unit:
                        return std::monostate {};
                    case type_tag::boolean:
                        return _in.bit();
                    case type_tag::data: {
                        uint8_vector bytes {};
                        _bytes(bytes);
                        return data::from_cbor(_alloc, bytes);
                    }
                    case type_tag::list: {
                        constant_list items { _alloc.resource() };
                        _list([&] {
                            items.push_back(_alloc.make<constant>(typ.first, _value(*typ.first)));
                        });
                        return std::move(items);
                    }
                    case type_tag::pair: {
                        const auto fst = _alloc.make<constant>(typ.first, _value(*typ.first));
                        const auto snd = _alloc.make<constant>(typ.second, _value(*typ.second));
                        return constant_pair { fst, snd };
                    }
                    default:
                        throw error("unsupported constant type {}", static_cast<int>(typ.tag));
                }
            }

            constant_ref _constant()
            {
                std::vector<type_tag> tags {};
                _list([&] {
                    if (tags.size() >= max_depth) [[unlikely]]
                        throw error("a constant type with more than {} tags at byte {}", max_depth, _in.pos());
                    tags.push_back(static_cast<type_tag>(_in.bits<4>()));
                });
                size_t idx = 0;
                const auto typ = _type(tags, idx, 0);
                if (idx != tags.size()) [[unlikely]]
                    throw error("unused constant type tags at byte {}", _in.pos());
                return _alloc.make<constant>(typ, _value(*typ));
            }

            void _require_sums_of_products(const std::string_view what) const
            {
                if (_ver < sums_of_products_version) [[unlikely]]
                    throw error("{} terms require version {} or later but the program has version {}", what, sums_of_products_version, _ver);
            }

            term_ref _term(const size_t depth)
            {
                if (depth >= max_depth) [[unlikely]]
                    throw error("terms are nested deeper than {} levels at byte {}", max_depth, _in.pos());
                switch (const auto tag = static_cast<term_tag>(_in.bits<4>()); tag) {
                    case term_tag::variable: {
                        // De Bruijn indices count the enclosing lambdas starting from 1
                        const auto rel = _uint64("De Bruijn index");
                        if (rel == 0 || rel > _num_vars) [[unlikely]]
                            throw error("De Bruijn index {} is out of range with {} bound variables", rel, _num_vars);
                        return _alloc.make<term>(t_var { _num_vars - rel });
                    }
                    case term_tag::delay:
                        return _alloc.make<term>(t_delay { _term(depth + 1) });
                    case term_tag::lambda: {
                        const auto level = _num_vars++;
                        const auto body = _term(depth + 1);
                        --_num_vars;
                        return _alloc.make<term>(t_lambda { level, body });
                    }
                    case term_tag::apply: {
                        const auto func = _term(depth + 1);
                        const auto arg = _term(depth + 1);
                        return _alloc.make<term>(t_apply { func, arg });
                    }
                    case term_tag::constant:
                        return _alloc.make<term>(_constant());
                    case term_tag::force:
                        return _alloc.make<term>(t_force { _term(depth + 1) });
                    case term_tag::error:
                        return _alloc.make<term>(t_error {});
                    case term_tag::builtin: {
                        const auto b = _in.bits<7>();
                        if (b >= num_builtins) [[unlikely]]
                            throw error("unknown builtin tag {} at byte {}", b, _in.pos());
                        return _alloc.make<term>(t_builtin { b });
                    }
                    case term_tag::constr: {
                        _require_sums_of_products("constr");
                        const auto id = _uint64("constr tag");
                        term_list args { _alloc.resource() };
                        _list([&] { args.push_back(_term(depth + 1)); });
                        return _alloc.make<term>(t_constr { id, std::move(args) });
                    }
                    case term_tag::acase: {
                        _require_sums_of_products("case");
                        const auto arg = _term(depth + 1);
                        term_list branches { _alloc.resource() };
                        _list([&] { branches.push_back(_term(depth + 1)); });
                        return _alloc.make<term>(t_case { arg, std::move(branches) });
                    }
                    default:
                        throw error("invalid term tag {} at byte {}", static_cast<int>(tag), _in.pos());
                }
            }
        };
    }

    program decode(arena &alloc, const buffer bytes)
    {
        if (bytes.empty()) [[unlikely]]
            throw error("a flat program cannot be empty");
        if (bytes.size() > max_script_size) [[unlikely]]
            throw error("a flat program of {} bytes exceeds the limit of {} bytes", bytes.size(), max_script_size);
        program_decoder dec { alloc, bytes };
        auto prog = dec.decode();
        logger::trace("decoded a flat program version {} from {} bytes", prog.ver, bytes.size());
        return prog;
    }
}
