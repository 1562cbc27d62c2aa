/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_CBOR_ENCODER_HPP
#define SCRIPT_FORGE_CBOR_ENCODER_HPP

#include <limits>
#include <sf/big-int.hpp>
#include <sf/cbor/types.hpp>

namespace script_forge::cbor {
    struct encoder {
        // the shortest head for the argument as required by the deterministic encoding
        encoder &head(const major_type typ, const uint64_t arg)
        {
            const auto mt = static_cast<uint8_t>(static_cast<uint8_t>(typ) << 5);
            if (arg < info_uint8) {
                _buf << static_cast<uint8_t>(mt | arg);
                return *this;
            }
            size_t width = 1;
            uint8_t info = info_uint8;
            while (width < 8 && (arg >> (width * 8)) != 0) {
                width <<= 1;
                ++info;
            }
            _buf << static_cast<uint8_t>(mt | info);
            for (size_t i = width; i > 0; --i)
                _buf << static_cast<uint8_t>(arg >> ((i - 1) * 8));
            return *this;
        }

        // opens an indefinite-length byte string, array or map that is closed with end()
        encoder &begin(const major_type typ)
        {
            switch (typ) {
                case major_type::bytes:
                case major_type::array:
                case major_type::map:
                    _buf << static_cast<uint8_t>((static_cast<uint8_t>(typ) << 5) | info_indefinite);
                    return *this;
                default:
                    throw error("CBOR type {} cannot have an indefinite length", typ);
            }
        }

        encoder &end()
        {
            _buf << break_byte;
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            return head(major_type::uint, val);
        }

        encoder &array(const size_t sz)
        {
            return head(major_type::array, sz);
        }

        encoder &map(const size_t sz)
        {
            return head(major_type::map, sz);
        }

        encoder &tag(const uint64_t id)
        {
            return head(major_type::tag, id);
        }

        encoder &bytes(const buffer buf)
        {
            head(major_type::bytes, buf.size());
            _buf << buf;
            return *this;
        }

        // integers outside of the 64-bit range become bignums with tags 2 and 3
        encoder &integer(const cpp_int &val)
        {
            const bool neg = val < 0;
            const cpp_int mag = neg ? cpp_int { -(val + 1) } : val;
            const auto typ = neg ? major_type::nint : major_type::uint;
            if (mag <= std::numeric_limits<uint64_t>::max())
                return head(typ, static_cast<uint64_t>(mag));
            tag(neg ? 3 : 2);
            return bytes(big_int_to_bytes(mag));
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }

        [[nodiscard]] uint8_vector take()
        {
            return std::move(_buf);
        }
    private:
        uint8_vector _buf {};
    };
}

#endif // !SCRIPT_FORGE_CBOR_ENCODER_HPP
