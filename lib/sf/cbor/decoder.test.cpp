/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cbor/decoder.hpp>
#include <sf/common/test.hpp>

using namespace script_forge;
using namespace script_forge::cbor;

suite cbor_decoder_suite = [] {
    "cbor::decoder"_test = [] {
        "uint widths"_test = [] {
            for (const auto &[hex, exp]: std::initializer_list<std::pair<std::string_view, uint64_t>> {
                { "17", 0x17ULL },
                { "18FF", 0xFFULL },
                { "19FFFF", 0xFFFFULL },
                { "1AFFFFFFFF", 0xFFFFFFFFULL },
                { "1B000000FFFFFFFFFF", 0xFFFFFFFFFFULL }
            }) {
                const auto bytes = uint8_vector::from_hex(hex);
                decoder dec { bytes };
                test_same(std::string { hex }, exp, dec.read_uint());
                expect(dec.done());
            }
        };
        "heads"_test = [] {
            const auto bytes = uint8_vector::from_hex("3818D87A9F80FF");
            decoder dec { bytes };
            const auto nint = dec.read_head();
            test_same(major_type::nint, nint.type);
            test_same(uint64_t { 24 }, nint.arg);
            const auto tag = dec.read_head();
            test_same(major_type::tag, tag.type);
            test_same(uint64_t { 122 }, tag.arg);
            const auto arr = dec.read_head();
            test_same(major_type::array, arr.type);
            expect(arr.indefinite);
            expect(!dec.read_break());
            test_same(major_type::array, dec.read_head().type);
            expect(dec.read_break());
            expect(dec.done());
            expect(!dec.read_break());
        };
        "break head"_test = [] {
            const auto bytes = uint8_vector::from_hex("FF");
            decoder dec { bytes };
            expect(dec.read_head().is_break());
        };
        "bytes"_test = [] {
            const auto bytes = uint8_vector::from_hex("4300010201");
            decoder dec { bytes };
            uint8_vector payload {};
            dec.read_bytes(dec.read_head(), payload);
            test_same(uint8_vector::from_hex("000102"), payload);
            test_same(size_t { 4 }, dec.pos());
        };
        "bytes indefinite"_test = [] {
            const auto bytes = uint8_vector::from_hex("5F4200014102FF");
            decoder dec { bytes };
            const auto h = dec.read_head();
            expect(h.indefinite);
            uint8_vector payload {};
            dec.read_bytes(h, payload);
            test_same(uint8_vector::from_hex("000102"), payload);
            expect(dec.done());
        };
        "invalid"_test = [] {
            for (const auto hex: { "", "18", "1C", "3F", "DF", "4301", "5B00000000FFFFFFFF00", "5F4101", "5F6161FF", "5F5F4101FFFF", "820001" }) {
                const auto bytes = uint8_vector::from_hex(hex);
                expect(throws<error>([&] {
                    decoder dec { bytes };
                    uint8_vector payload {};
                    dec.read_bytes(dec.read_head(), payload);
                })) << hex;
            }
        };
        "deep nesting"_test = [] {
            // one array head per level; the heads are read iteratively whatever the depth
            uint8_vector bytes(100001);
            std::fill_n(bytes.begin(), 100000, 0x81);
            decoder dec { bytes };
            size_t depth = 0;
            while (dec.read_head().type == major_type::array)
                ++depth;
            test_same(size_t { 100000 }, depth);
            expect(dec.done());
        };
    };
};
