/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sf/common/test.hpp>
#include <sf/plutus/flat.hpp>
#include <sf/plutus/flat-encoder.hpp>

using namespace script_forge;
using namespace script_forge::plutus;

namespace {
    void test_reencode(const std::string_view hex)
    {
        arena alloc {};
        const auto bytes = uint8_vector::from_hex(hex);
        test_same(std::string { hex }, bytes, flat::encode(flat::decode(alloc, bytes)));
    }

    void test_roundtrip(const term_ref t)
    {
        const program prog { version { 1, 1, 0 }, t };
        const auto bytes = flat::encode(prog);
        arena alloc {};
        test_same(fmt::format("{}", prog), fmt::format("{}", flat::decode(alloc, bytes)));
    }
}

suite plutus_flat_encoder_suite = [] {
    using namespace std::string_literals;
    "plutus::flat::encode"_test = [] {
        "sample scripts"_test = [] {
            test_reencode("010000222601");
            test_reencode("01000033222220051200120011");
            test_reencode("0100002225333573466644494400C0080045261601");
            test_reencode("0100003222253335734646660020026EB0D5D09ABA2357446AE88D5D11ABA2357446AE88D5D118029ABA1300500223375E0026AE84DD60"
                "029112999AB9A35746004294054CCD5CD18009ABA100214A226660060066AE8800800452616235573C6EA80041");
            test_reencode("010000322233335734646660020026EB0D5D09ABA2357446AE88D5D11ABA2357446AE88D5D118021ABA1300400223375E00298011E581C"
                "FDB6C9683D3713A2C9DBCC835E6B547E71E1063DDC3E37C20590928300222333357346AE8C00892811999AB9A30023574200649448CCC014014"
                "D5D1002001A4C93124C4C9311AAB9E3754003");
            test_reencode("0101008011");
            test_reencode("010100801a4001480081");
            test_reencode("0101003766980106d87a9f0001ff0001");
        };
        "non-minimal version"_test = [] {
            // the major version uses two var-uint groups where one is enough
            arena alloc {};
            const auto prog = flat::decode(alloc, uint8_vector::from_hex("81000000222601"));
            test_same(version { 1, 0, 0 }, prog.ver);
            test_same(uint8_vector::from_hex("010000222601"), flat::encode(prog));
        };
        "constants"_test = [] {
            arena alloc {};
            const auto int_type = alloc.make<constant_type>(type_tag::integer);
            const auto con = [&](const constant_type_ref typ, constant::value_type val) {
                return alloc.make<term>(alloc.make<constant>(typ, std::move(val)));
            };
            test_roundtrip(con(int_type, cpp_int { -1234567 }));
            test_roundtrip(con(int_type, cpp_int { "123456789012345678901234567890" }));
            test_roundtrip(con(int_type, cpp_int { "-123456789012345678901234567890" }));
            test_roundtrip(con(alloc.make<constant_type>(type_tag::string), std::pmr::string { "h\xC3\xA9llo", alloc.resource() }));
            test_roundtrip(con(alloc.make<constant_type>(type_tag::unit), std::monostate {}));
            test_roundtrip(con(alloc.make<constant_type>(type_tag::boolean), true));
            byte_string long_bytes { alloc.resource() };
            for (size_t i = 0; i < 600; ++i)
                long_bytes.push_back(static_cast<uint8_t>(i * 7));
            test_roundtrip(con(alloc.make<constant_type>(type_tag::bytestring), std::move(long_bytes)));
            constant_list items { alloc.resource() };
            items.push_back(alloc.make<constant>(int_type, cpp_int { 1 }));
            items.push_back(alloc.make<constant>(int_type, cpp_int { 2 }));
            test_roundtrip(con(alloc.make<constant_type>(type_tag::list, int_type), std::move(items)));
            test_roundtrip(con(alloc.make<constant_type>(type_tag::list, int_type), constant_list { alloc.resource() }));
            const auto str_type = alloc.make<constant_type>(type_tag::string);
            test_roundtrip(con(alloc.make<constant_type>(type_tag::pair, int_type, str_type), constant_pair {
                alloc.make<constant>(int_type, cpp_int { 7 }), alloc.make<constant>(str_type, std::pmr::string { "seven", alloc.resource() }) }));
        };
        "terms"_test = [] {
            arena alloc {};
            const auto body = alloc.make<term>(t_apply { alloc.make<term>(t_var { 0 }), alloc.make<term>(t_var { 1 }) });
            const auto lam = alloc.make<term>(t_lambda { 0, alloc.make<term>(t_lambda { 1, body }) });
            test_roundtrip(lam);
            test_roundtrip(alloc.make<term>(t_force { alloc.make<term>(t_delay { alloc.make<term>(t_error {}) }) }));
            term_list branches { alloc.resource() };
            branches.push_back(lam);
            branches.push_back(lam);
            test_roundtrip(alloc.make<term>(t_case { alloc.make<term>(t_constr { 0, term_list { alloc.resource() } }), std::move(branches) }));
        };
        "unbound variable"_test = [] {
            arena alloc {};
            expect(throws<error>([&] { flat::encode(program { version { 1, 0, 0 }, alloc.make<term>(t_var { 0 }) }); }));
        };
        "padding"_test = [] {
            arena alloc {};
            // a term that ends exactly on a byte boundary gets a whole padding byte
            const auto lam = alloc.make<term>(t_lambda { 0, alloc.make<term>(t_error {}) });
            test_same(uint8_vector::from_hex("0100002601"), flat::encode(program { version { 1, 0, 0 }, lam }));
        };
    };
};
