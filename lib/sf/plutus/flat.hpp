/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_PLUTUS_FLAT_HPP
#define SCRIPT_FORGE_PLUTUS_FLAT_HPP

#include <sf/plutus/types.hpp>

namespace script_forge::plutus::flat {
    static constexpr size_t max_script_size = 1 << 20;
    // limits the nesting of terms and of constant types
    static constexpr size_t max_depth = 4096;
    // constr and case terms are available starting from this version
    static constexpr version sums_of_products_version { 1, 1, 0 };

    /*
     * Decodes a program in the flat format: three variable-length version components, a term and the final padding.
     * The nodes of the result are owned by alloc.
     */
    extern program decode(arena &alloc, buffer bytes);
}

#endif // !SCRIPT_FORGE_PLUTUS_FLAT_HPP
