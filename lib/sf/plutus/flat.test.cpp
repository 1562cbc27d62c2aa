/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/cbor/decoder.hpp>
#include <sf/common/test.hpp>
#include <sf/plutus/flat.hpp>

using namespace script_forge;
using namespace script_forge::plutus;

namespace {
    uint8_vector cbor_payload(const std::string_view cbor_hex)
    {
        const auto cbor = uint8_vector::from_hex(cbor_hex);
        cbor::decoder dec { cbor };
        uint8_vector res {};
        dec.read_bytes(dec.read_head(), res);
        return res;
    }

    void test_decode(const std::string_view cbor_hex, const std::string_view exp_uplc)
    {
        arena alloc {};
        const auto prog = flat::decode(alloc, cbor_payload(cbor_hex));
        test_same(std::string { cbor_hex }, std::string { exp_uplc }, fmt::format("{}", prog));
    }
}

suite plutus_flat_suite = [] {
    using namespace std::string_literals;
    "plutus::flat"_test = [] {
        "sample scripts"_test = [] {
            // CBOR-wrapped sample programs
            for (const auto hex: {
                    "4D01000033222220051200120011",
                    "550100002225333573466644494400C0080045261601",
                    "58640100003222253335734646660020026EB0D5D09ABA2357446AE88D5D11ABA2357446AE88D5D118029ABA1300500223375E0026AE84DD60"
                    "029112999AB9A35746004294054CCD5CD18009ABA100214A226660060066AE8800800452616235573C6EA80041",
                    "5883010000322233335734646660020026EB0D5D09ABA2357446AE88D5D11ABA2357446AE88D5D118021ABA1300400223375E00298011E581C"
                    "FDB6C9683D3713A2C9DBCC835E6B547E71E1063DDC3E37C20590928300222333357346AE8C00892811999AB9A30023574200649448CCC014014"
                    "D5D1002001A4C93124C4C9311AAB9E3754003"
            }) {
                arena alloc {};
                expect(nothrow([&] { flat::decode(alloc, cbor_payload(hex)); })) << hex;
            }
        };
        "uplc rendering"_test = [] {
            test_decode("46010000222601", "(program 1.0.0 (lam v0 (lam v1 (lam v2 (error)))))");
            test_decode("450101008011", "(program 1.1.0 (constr 1))");
            test_decode("4a010100801a4001480081", "(program 1.1.0 (constr 1 (con integer 0) (con integer 1)))");
            test_decode("500101003766980106d87a9f0001ff0001", "(program 1.1.0 [(builtin serialiseData) (con data (Constr 1 [I 0, I 1]))])");
        };
        "version"_test = [] {
            arena alloc {};
            const auto prog = flat::decode(alloc, uint8_vector::from_hex("0101008011"));
            test_same(version { 1, 1, 0 }, prog.ver);
            test_same("(constr 1)"s, fmt::format("{}", *prog.body));
        };
        "constr requires version 1.1.0"_test = [] {
            arena alloc {};
            expect(throws<error>([&] { flat::decode(alloc, uint8_vector::from_hex("0100008011")); }));
        };
        "invalid"_test = [] {
            arena alloc {};
            for (const auto hex: {
                    // empty input
                    "",
                    // a version without a term
                    "010000",
                    // a variable that is not bound by any lambda
                    "0100000011",
                    // a BLS12-381 constant
                    "0100004C81",
                    // builtin tag 100
                    "0100007C81",
                    // no final padding
                    "0100002602",
                    // trailing bytes after the padding
                    "010000260100"
            }) {
                expect(throws<error>([&] { flat::decode(alloc, uint8_vector::from_hex(hex)); })) << hex;
            }
        };
        "deep nesting"_test = [] {
            arena alloc {};
            // 0x11 is a pair of delay tags
            uint8_vector deep(100003);
            deep[0] = 0x01;
            std::fill_n(deep.begin() + 3, 100000, 0x11);
            expect(throws<error>([&] { flat::decode(alloc, deep); }));
            uint8_vector shallow { 0x01, 0x00, 0x00 };
            for (size_t i = 0; i < 100; ++i)
                shallow << 0x11;
            shallow << 0x61;
            const auto prog = flat::decode(alloc, shallow);
            expect(std::holds_alternative<t_delay>(*prog.body));
        };
    };
};
