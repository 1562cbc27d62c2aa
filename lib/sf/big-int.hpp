/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_BIG_INT_HPP
#define SCRIPT_FORGE_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <sf/common/bytes.hpp>

namespace script_forge {
    using boost::multiprecision::cpp_int;

    // the largest CBOR bignum payload accepted from untrusted input
    static constexpr size_t big_int_max_size = 8192;

    inline cpp_int big_int_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size) [[unlikely]]
            throw error("a bignum of {} bytes exceeds the limit of {} bytes", data.size(), big_int_max_size);
        cpp_int val {};
        if (!data.empty())
            boost::multiprecision::import_bits(val, data.begin(), data.end(), 8, true);
        return val;
    }

    // big-endian magnitude without leading zeros, the value must be non-negative
    inline uint8_vector big_int_to_bytes(const cpp_int &val)
    {
        uint8_vector res {};
        if (val > 0)
            boost::multiprecision::export_bits(val, std::back_inserter(res), 8, true);
        return res;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.str());
        }
    };
}

#endif // !SCRIPT_FORGE_BIG_INT_HPP
