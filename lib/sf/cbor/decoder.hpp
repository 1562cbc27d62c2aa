/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_CBOR_DECODER_HPP
#define SCRIPT_FORGE_CBOR_DECODER_HPP

#include <sf/big-int.hpp>
#include <sf/cbor/types.hpp>

namespace script_forge::cbor {
    struct head {
        major_type type {};
        uint64_t arg = 0;
        bool indefinite = false;

        bool is_break() const noexcept
        {
            return type == major_type::simple && arg == info_indefinite;
        }
    };

    /*
     * A pull decoder that reads one item head at a time.
     * Nested items are walked by the caller, so the decoder itself never recurses.
     */
    struct decoder {
        explicit decoder(const buffer bytes): _bytes { bytes }
        {
        }

        bool done() const noexcept
        {
            return _pos >= _bytes.size();
        }

        size_t pos() const noexcept
        {
            return _pos;
        }

        head read_head()
        {
            const auto initial = _next();
            head h { static_cast<major_type>(initial >> 5) };
            const uint8_t info = initial & 0x1F;
            if (info < info_uint8) {
                h.arg = info;
            } else if (info <= info_uint64) {
                for (size_t i = 0, width = size_t { 1 } << (info - info_uint8); i < width; ++i)
                    h.arg = (h.arg << 8) | _next();
            } else if (info == info_indefinite) {
                switch (h.type) {
                    case major_type::bytes:
                    case major_type::text:
                    case major_type::array:
                    case major_type::map:
                        h.indefinite = true;
                        break;
                    case major_type::simple:
                        h.arg = info;
                        break;
                    default:
                        throw error("CBOR type {} cannot have an indefinite length at offset {}", h.type, _pos - 1);
                }
            } else {
                throw error("reserved CBOR additional info {} at offset {}", info, _pos - 1);
            }
            return h;
        }

        // consumes the break code if it is the next byte
        bool read_break()
        {
            if (!done() && _bytes[_pos] == break_byte) {
                ++_pos;
                return true;
            }
            return false;
        }

        // reads the payload of a byte string whose head has just been read; the chunks of an indefinite string are joined
        template<typename T>
        void read_bytes(const head &h, T &out)
        {
            if (h.type != major_type::bytes) [[unlikely]]
                throw error("expected a CBOR byte string but got {} at offset {}", h.type, _pos);
            if (!h.indefinite) {
                const auto chunk = _take(h.arg);
                out.insert(out.end(), chunk.begin(), chunk.end());
                return;
            }
            while (!read_break()) {
                const auto ch = read_head();
                if (ch.type != major_type::bytes || ch.indefinite) [[unlikely]]
                    throw error("an indefinite byte string may contain only definite byte strings but got {} at offset {}", ch.type, _pos);
                const auto chunk = _take(ch.arg);
                out.insert(out.end(), chunk.begin(), chunk.end());
            }
        }

        uint64_t read_uint()
        {
            const auto h = read_head();
            if (h.type != major_type::uint) [[unlikely]]
                throw error("expected a CBOR uint but got {} at offset {}", h.type, _pos);
            return h.arg;
        }
    private:
        buffer _bytes;
        size_t _pos = 0;

        uint8_t _next()
        {
            if (done()) [[unlikely]]
                throw error("CBOR data ends unexpectedly at offset {}", _pos);
            return _bytes[_pos++];
        }

        buffer _take(const uint64_t sz)
        {
            if (sz > _bytes.size() - _pos) [[unlikely]]
                throw error("a CBOR byte string of {} bytes at offset {} does not fit into the remaining {} bytes", sz, _pos, _bytes.size() - _pos);
            const auto res = _bytes.subbuf(_pos, sz);
            _pos += sz;
            return res;
        }
    };
}

#endif // !SCRIPT_FORGE_CBOR_DECODER_HPP
