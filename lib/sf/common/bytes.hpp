/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_COMMON_BYTES_HPP
#define SCRIPT_FORGE_COMMON_BYTES_HPP

#include <algorithm>
#include <compare>
#include <span>
#include <vector>
#include <sf/common/error.hpp>
#include <sf/common/format.hpp>

namespace script_forge {
    struct buffer: std::span<const uint8_t> {
        buffer() =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        template <typename T>
        buffer(const std::span<T> items):
            buffer { reinterpret_cast<const uint8_t *>(items.data()), items.size_bytes() }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s): buffer { std::string_view { s } }
        {
        }

        std::string_view string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            return std::lexicographical_compare_three_way(begin(), end(), o.begin(), o.end());
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && std::equal(begin(), end(), o.begin());
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset > size() || sz > size() - offset) [[unlikely]]
                throw error("a sub-buffer at offset {} of size {} does not fit into {} bytes", offset, sz, size());
            return buffer { data() + offset, sz };
        }

        buffer subbuf(const size_t offset) const
        {
            if (offset > size()) [[unlikely]]
                throw error("offset {} is past the end of a buffer of {} bytes", offset, size());
            return subbuf(offset, size() - offset);
        }
    };

    inline uint8_t uint_from_hex(const char k)
    {
        if (k >= '0' && k <= '9')
            return k - '0';
        if (k >= 'a' && k <= 'f')
            return k - 'a' + 10;
        if (k >= 'A' && k <= 'F')
            return k - 'A' + 10;
        throw error("unexpected character in a hex string: '{}'", k);
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error("a hex string must have an even number of characters but got {}", hex.size());
            uint8_vector bytes(hex.size() / 2);
            for (size_t i = 0; i < bytes.size(); ++i)
                bytes[i] = (uint_from_hex(hex[i * 2]) << 4) | uint_from_hex(hex[i * 2 + 1]);
            return bytes;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const std::initializer_list<uint8_t> il):
            std::vector<uint8_t>(il)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t>(bytes.begin(), bytes.end())
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        buffer span() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return span().string_view();
        }

        uint8_vector &operator=(const buffer bytes)
        {
            assign(bytes.begin(), bytes.end());
            return *this;
        }

        bool operator==(const buffer &o) const noexcept
        {
            return span() == o;
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return span() == o.span();
        }
    };

    static_assert(std::is_convertible_v<uint8_vector, buffer>);

    // selects the lowercase hex rendering used in CLI output and UPLC bytestring literals
    struct buffer_lowercase: buffer {
        buffer_lowercase(const buffer b): buffer { b }
        {
        }
    };

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.push_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        v.insert(v.end(), buf.begin(), buf.end());
        return v;
    }
}

namespace fmt {
    template<>
    struct formatter<script_forge::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<script_forge::uint8_vector>: formatter<script_forge::buffer> {
    };

    template<>
    struct formatter<script_forge::buffer_lowercase>: formatter<int> {
        template<typename FormatContext>
        auto format(const script_forge::buffer_lowercase &bytes, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const uint8_t v: bytes)
                out_it = fmt::format_to(out_it, "{:02x}", v);
            return out_it;
        }
    };
}

#endif // !SCRIPT_FORGE_COMMON_BYTES_HPP
