/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_PLUTUS_TYPES_HPP
#define SCRIPT_FORGE_PLUTUS_TYPES_HPP

#include <memory_resource>
#include <type_traits>
#include <utility>
#include <variant>
#include <sf/big-int.hpp>
#include <sf/cbor/encoder.hpp>

namespace script_forge::plutus {
    struct version {
        uint64_t major = 1;
        uint64_t minor = 1;
        uint64_t patch = 0;

        auto operator<=>(const version &) const =default;
    };

    enum class term_tag: uint8_t {
        variable, delay, lambda, apply, constant, force, error, builtin, constr, acase
    };

    enum class type_tag: uint8_t {
        integer, bytestring, string, unit, boolean, list, pair, application, data,
        bls12_381_g1_element, bls12_381_g2_element, bls12_381_ml_result
    };

    // the builtins known up to and including expModInteger
    static constexpr uint8_t num_builtins = 88;
    extern std::string_view builtin_name(uint8_t tag);

    /*
     * Owns every node of a decoded program.
     * Nodes are placed into a monotonic buffer and released all at once together with the arena.
     */
    struct arena {
        arena() =default;
        arena(const arena &) =delete;
        arena &operator=(const arena &) =delete;

        ~arena()
        {
            for (auto it = _dtors.rbegin(); it != _dtors.rend(); ++it)
                it->second(it->first);
        }

        std::pmr::memory_resource *resource() noexcept
        {
            return &_mr;
        }

        template<typename T, typename... Args>
        const T *make(Args &&...args)
        {
            auto *ptr = static_cast<T *>(_mr.allocate(sizeof(T), alignof(T)));
            new (ptr) T { std::forward<Args>(args)... };
            if constexpr (!std::is_trivially_destructible_v<T>) {
                try {
                    _dtors.emplace_back(ptr, [](void *p) { static_cast<T *>(p)->~T(); });
                } catch (const std::exception &) {
                    ptr->~T();
                    throw;
                }
            }
            return ptr;
        }
    private:
        std::pmr::monotonic_buffer_resource _mr { 0x10000 };
        std::vector<std::pair<void *, void (*)(void *)>> _dtors {};
    };

    using byte_string = std::pmr::vector<uint8_t>;

    struct data;
    using data_ref = const data *;
    using data_list = std::pmr::vector<data_ref>;

    struct data_constr {
        uint64_t id;
        data_list fields;
    };

    struct data_map {
        std::pmr::vector<std::pair<data_ref, data_ref>> entries;
    };

    struct data: std::variant<data_constr, data_map, data_list, cpp_int, byte_string> {
        using variant::variant;

        // accepts any valid encoding including the non-canonical ones
        static data_ref from_cbor(arena &alloc, buffer bytes);

        // writes the canonical encoding
        void to_cbor(cbor::encoder &enc) const;
        uint8_vector as_cbor() const;
        std::string as_string() const;
    };

    struct constant_type;
    using constant_type_ref = const constant_type *;

    struct constant_type {
        type_tag tag;
        // the element type of a list or the components of a pair
        constant_type_ref first = nullptr;
        constant_type_ref second = nullptr;
    };

    struct constant;
    using constant_ref = const constant *;
    using constant_list = std::pmr::vector<constant_ref>;
    using constant_pair = std::pair<constant_ref, constant_ref>;

    struct constant {
        using value_type = std::variant<std::monostate, bool, cpp_int, byte_string, std::pmr::string, data_ref, constant_list, constant_pair>;

        constant_type_ref type;
        value_type value;
    };

    struct term;
    using term_ref = const term *;
    using term_list = std::pmr::vector<term_ref>;

    // variables and lambdas are identified by the number of enclosing lambdas, starting from zero
    struct t_var {
        uint64_t level;
    };

    struct t_delay {
        term_ref body;
    };

    struct t_lambda {
        uint64_t level;
        term_ref body;
    };

    struct t_apply {
        term_ref func;
        term_ref arg;
    };

    struct t_force {
        term_ref body;
    };

    struct t_error {
    };

    struct t_builtin {
        uint8_t tag;
    };

    struct t_constr {
        uint64_t tag;
        term_list args;
    };

    struct t_case {
        term_ref arg;
        term_list branches;
    };

    // the alternatives follow the order of term_tag
    struct term: std::variant<t_var, t_delay, t_lambda, t_apply, constant_ref, t_force, t_error, t_builtin, t_constr, t_case> {
        using variant::variant;

        term_tag tag() const noexcept
        {
            return static_cast<term_tag>(index());
        }
    };

    struct program {
        plutus::version ver;
        term_ref body;
    };

    extern std::string to_uplc(const constant_type &typ);
    extern std::string to_uplc(const constant &c);
    extern std::string to_uplc(const term &t);
    extern std::string to_uplc(const program &p);

    extern std::string escape_utf8_string(std::string_view s);
    extern void validate_utf8_string(buffer bytes);
}

namespace fmt {
    template<>
    struct formatter<script_forge::plutus::version>: formatter<int> {
        template<typename FormatContext>
        auto format(const script_forge::plutus::version &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}.{}.{}", v.major, v.minor, v.patch);
        }
    };

    template<>
    struct formatter<script_forge::plutus::data>: formatter<int> {
        template<typename FormatContext>
        auto format(const script_forge::plutus::data &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.as_string());
        }
    };

    template<typename T>
    struct uplc_formatter: formatter<int> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", script_forge::plutus::to_uplc(v));
        }
    };

    template<>
    struct formatter<script_forge::plutus::constant_type>: uplc_formatter<script_forge::plutus::constant_type> {
    };

    template<>
    struct formatter<script_forge::plutus::constant>: uplc_formatter<script_forge::plutus::constant> {
    };

    template<>
    struct formatter<script_forge::plutus::term>: uplc_formatter<script_forge::plutus::term> {
    };

    template<>
    struct formatter<script_forge::plutus::program>: uplc_formatter<script_forge::plutus::program> {
    };
}

#endif // !SCRIPT_FORGE_PLUTUS_TYPES_HPP
